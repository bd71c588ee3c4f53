// src/climate/climateController.cpp
#include "climateController.hpp"
#include "utils/logger.hpp"

namespace GrowClimate {

// --- Construtor ---

ClimateController::ClimateController(ActuatorGateway& gatewayRef,
                                     SettingsManager& settings,
                                     HistoryLog* historyLog,
                                     const Predictor* advisor,
                                     const ClimateControllerConfig& controllerConfig) :
    gateway(gatewayRef),
    settingsManager(settings),
    history(historyLog),
    predictor(advisor),
    config(controllerConfig),
    enabled(false),
    lastOutcome(CycleOutcome::Disabled),
    usedPrediction(false),
    hasActed(false),
    lastActionAt(0)
{}

// --- Modo ---

bool ClimateController::start() {
    enabled.store(true);
    Logger::info("ClimateController: Automatic control enabled.");
    if (!settingsManager.setClimateMode(true)) {
        Logger::warn("ClimateController: Could not persist mode=auto.");
        return false;
    }
    return true;
}

bool ClimateController::stop() {
    enabled.store(false);
    Logger::info("ClimateController: Automatic control disabled (timers kept).");
    if (!settingsManager.setClimateMode(false)) {
        Logger::warn("ClimateController: Could not persist mode=manual.");
        return false;
    }
    return true;
}

void ClimateController::restoreMode() {
    enabled.store(settingsManager.isClimateAuto());
    Logger::info("ClimateController: Restored mode %s.", enabled.load() ? "auto" : "manual");
}

bool ClimateController::adoptHardwareState(uint32_t now) {
    std::lock_guard<std::mutex> lock(cycleMutex);
    RelayStates relays;
    if (!gateway.getActuatorStates(relays)) {
        Logger::warn("ClimateController: Could not read relay states at startup.");
        return false;
    }
    guard.adoptHardwareState(relays.climate, now);
    lastLogged = guard.appliedStates();
    for (uint8_t i = 0; i < CLIMATE_ACTUATOR_COUNT; ++i) {
        const Actuator actuator = climateActuatorAt(i);
        if (relays.climate.get(actuator)) {
            Logger::info("ClimateController: Adopted %s already ON.", actuatorName(actuator));
        }
    }
    return true;
}

// --- Ciclo ---

ClimateSettings ClimateController::effectiveSettings(const CycleClock& clock) {
    baseSettings = settingsManager.loadClimateSettings(baseSettings);
    temperatureSchedule = settingsManager.loadTemperatureSchedule(temperatureSchedule);

    ClimateSettings effective = baseSettings;
    float scheduled = 0.0f;
    if (clock.wallClockValid && temperatureSchedule.targetAt(clock.localTime, scheduled)) {
        effective.targetTemperature = scheduled;
    }
    return effective;
}

CycleOutcome ClimateController::finishCycle(CycleOutcome outcome) {
    lastOutcome = outcome;
    return outcome;
}

void ClimateController::resyncFromBoard(const CycleClock& clock) {
    RelayStates relays;
    if (!gateway.getActuatorStates(relays)) {
        Logger::warn("ClimateController: Relay states unknown after a failed write, all relays will be rewritten.");
        return;
    }
    guard.adoptHardwareState(relays.climate, clock.monotonicSeconds);
    Logger::info("ClimateController: Relay states re-read from the board.");
    recordChanges("board state", ControlMode::Auto, clock);
}

CycleOutcome ClimateController::runCycle(const CycleClock& clock) {
    std::lock_guard<std::mutex> lock(cycleMutex);
    if (!enabled.load()) {
        return finishCycle(CycleOutcome::Disabled);
    }

    const uint32_t now = clock.monotonicSeconds;
    const ClimateSettings settings = effectiveSettings(clock);
    lastSettings = settings;

    // Depois de uma escrita parcial a placa é a referência
    if (guard.needsResync()) {
        resyncFromBoard(clock);
    }

    ClimateReading reading;
    if (!gateway.readClimate(reading)) {
        Logger::warn("ClimateController: Sensor read failed, cycle aborted.");
        return finishCycle(CycleOutcome::SensorFault);
    }
    lastReading = reading;
    if (!reading.isComplete()) {
        Logger::warn("ClimateController: Incomplete reading (T=%.1f, H=%.1f), cycle skipped.",
                     reading.temperature, reading.humidity);
        return finishCycle(CycleOutcome::MissingData);
    }

    const ActuatorStates current = guard.appliedStates();

    // Previsão é opcional: qualquer falha cai no controle reativo
    Prediction prediction;
    const Prediction* forecast = nullptr;
    if (settings.predictiveControlEnabled && predictor != nullptr &&
        predictor->predict(reading, current, prediction)) {
        forecast = &prediction;
    }
    usedPrediction = forecast != nullptr;

    const ActuatorStates desired = ClimateDecisionEngine::decide(reading, current, settings, forecast);
    DutyCyclePlan plan = guard.plan(desired, reading, settings, now);

    for (uint8_t i = 0; i < CLIMATE_ACTUATOR_COUNT; ++i) {
        const ActuatorStep& step = plan.steps[i];
        if (step.reason == StepReason::OnDeferred || step.reason == StepReason::OffDeferred) {
            Logger::debug("ClimateController: %s %s (%lus left).", actuatorName(climateActuatorAt(i)),
                          stepReasonName(step.reason), (unsigned long)step.waitSeconds);
        }
    }

    // Fora de sincronia o plano é escrito mesmo sem mudança aparente
    const bool rewrite = guard.needsResync();
    if (!plan.changed(current) && !rewrite) {
        return finishCycle(CycleOutcome::NoChange);
    }

    bool rateLimited = false;
    if (hasActed && now - lastActionAt < config.minActionIntervalSeconds) {
        // Desligamentos de segurança não esperam pelo intervalo mínimo
        plan = guard.safetyOnly(plan);
        rateLimited = true;
        if (!plan.changed(current) && !rewrite) {
            Logger::debug("ClimateController: Action deferred, last write %lus ago.",
                          (unsigned long)(now - lastActionAt));
            return finishCycle(CycleOutcome::RateLimited);
        }
    }

    if (!guard.commit(plan, gateway)) {
        Logger::error("ClimateController: Actuator write failed, will retry next cycle.");
        return finishCycle(CycleOutcome::GatewayWriteFailed);
    }

    hasActed = true;
    lastActionAt = now;
    logTransitions(plan, clock);
    if (rateLimited) {
        Logger::info("ClimateController: Safety shutoff applied inside the action interval.");
    }
    return finishCycle(CycleOutcome::Applied);
}

void ClimateController::logTransitions(const DutyCyclePlan& plan, const CycleClock& clock) {
    for (uint8_t i = 0; i < CLIMATE_ACTUATOR_COUNT; ++i) {
        const Actuator actuator = climateActuatorAt(i);
        const bool state = plan.applied.get(actuator);
        if (state != lastLogged.get(actuator)) {
            recordTransition(actuator, state, stepReasonName(plan.steps[i].reason), ControlMode::Auto, clock);
        }
    }
}

void ClimateController::recordChanges(const char* reason, ControlMode mode, const CycleClock& clock) {
    const ActuatorStates applied = guard.appliedStates();
    for (uint8_t i = 0; i < CLIMATE_ACTUATOR_COUNT; ++i) {
        const Actuator actuator = climateActuatorAt(i);
        if (applied.get(actuator) != lastLogged.get(actuator)) {
            recordTransition(actuator, applied.get(actuator), reason, mode, clock);
        }
    }
}

void ClimateController::recordTransition(Actuator actuator, bool state, const char* reason, ControlMode mode,
                                         const CycleClock& clock) {
    lastLogged.set(actuator, state);
    Logger::info("ClimateController: %s -> %s (%s, %s).", actuatorName(actuator), state ? "ON" : "OFF", reason,
                 controlModeName(mode));

    if (history == nullptr) {
        return;
    }
    ActuatorEvent event;
    event.timestamp = clock.wallClockValid ? clock.epochSeconds : 0;
    event.actuator = actuator;
    event.state = state;
    event.mode = mode;
    if (!history->logActuatorChange(event)) {
        Logger::warn("ClimateController: History write failed for %s.", actuatorName(actuator));
    }
}

bool ClimateController::setManualState(Actuator actuator, bool on, const CycleClock& clock) {
    if (static_cast<uint8_t>(actuator) >= CLIMATE_ACTUATOR_COUNT) {
        return false;
    }
    std::lock_guard<std::mutex> lock(cycleMutex);
    if (enabled.load()) {
        Logger::warn("ClimateController: %s is under automatic control, switch to manual first.",
                     actuatorName(actuator));
        return false;
    }

    ActuatorStates states = guard.appliedStates();
    states.set(actuator, on);
    if (!guard.writeManual(states, clock.monotonicSeconds, gateway)) {
        Logger::error("ClimateController: Manual %s=%s failed.", actuatorName(actuator), on ? "ON" : "OFF");
        return false;
    }
    recordChanges("operator", ControlMode::Manual, clock);
    return true;
}

ClimateStatus ClimateController::status() const {
    std::lock_guard<std::mutex> lock(cycleMutex);
    ClimateStatus snapshot;
    snapshot.enabled = enabled.load();
    snapshot.lastOutcome = lastOutcome;
    snapshot.applied = guard.appliedStates();
    snapshot.lastReading = lastReading;
    snapshot.settings = lastSettings;
    snapshot.usedPrediction = usedPrediction;
    snapshot.hasActed = hasActed;
    snapshot.lastActionAt = lastActionAt;
    return snapshot;
}

} // namespace GrowClimate
