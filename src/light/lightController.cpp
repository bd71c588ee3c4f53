// src/light/lightController.cpp
#include "lightController.hpp"
#include "utils/logger.hpp"

namespace GrowClimate {

LightController::LightController(ActuatorGateway& gatewayRef, SettingsManager& settings, HistoryLog* historyLog) :
    gateway(gatewayRef),
    settingsManager(settings),
    history(historyLog),
    enabled(false),
    resyncRequested(false),
    phase(LightPhase::Disabled),
    lastOutcome(CycleOutcome::Disabled),
    hasApplied(false),
    lightOn(false),
    lastChangeAt(0)
{}

bool LightController::start() {
    resyncRequested.store(true);
    enabled.store(true);
    Logger::info("LightController: Schedule control enabled.");
    if (!settingsManager.setLightMode(true)) {
        Logger::warn("LightController: Could not persist light_mode=schedule.");
        return false;
    }
    return true;
}

bool LightController::stop() {
    enabled.store(false);
    Logger::info("LightController: Schedule control disabled.");
    if (!settingsManager.setLightMode(false)) {
        Logger::warn("LightController: Could not persist light_mode=manual.");
        return false;
    }
    return true;
}

void LightController::restoreMode() {
    enabled.store(settingsManager.isLightScheduled());
    Logger::info("LightController: Restored light mode %s.", enabled.load() ? "schedule" : "manual");
}

bool LightController::updateSchedule(const LightSchedule& newSchedule) {
    if (!settingsManager.setLightSchedule(newSchedule)) {
        Logger::error("LightController: Schedule not persisted, keeping the current one.");
        return false;
    }
    return true;
}

CycleOutcome LightController::runCycle(const CycleClock& clock) {
    std::lock_guard<std::mutex> lock(cycleMutex);
    if (!enabled.load()) {
        lastOutcome = CycleOutcome::Disabled;
        return lastOutcome;
    }
    if (resyncRequested.exchange(false)) {
        hasApplied = false;
    }

    schedule = settingsManager.loadLightSchedule(schedule);
    if (!clock.wallClockValid) {
        Logger::warn("LightController: Wall clock not synchronized, light unchanged.");
        lastOutcome = CycleOutcome::MissingData;
        return lastOutcome;
    }

    phase = LightScheduleMachine::phaseAt(schedule, clock.localTime);
    const bool desired = phase == LightPhase::ScheduledOn;
    if (hasApplied && desired == lightOn) {
        lastOutcome = CycleOutcome::NoChange;
        return lastOutcome;
    }

    if (!gateway.setLight(desired)) {
        Logger::error("LightController: Failed to switch light %s.", desired ? "ON" : "OFF");
        lastOutcome = CycleOutcome::GatewayWriteFailed;
        return lastOutcome;
    }

    Logger::info("LightController: Light %s (%s, now %02u:%02u).", desired ? "ON" : "OFF", lightPhaseName(phase),
                 (unsigned)clock.localTime.hour, (unsigned)clock.localTime.minute);
    recordChange(desired, ControlMode::Schedule, clock);

    lastOutcome = CycleOutcome::Applied;
    return lastOutcome;
}

bool LightController::setManualState(bool on, const CycleClock& clock) {
    std::lock_guard<std::mutex> lock(cycleMutex);
    if (enabled.load()) {
        Logger::warn("LightController: Light follows the schedule, switch light_mode to manual first.");
        return false;
    }
    if (!gateway.setLight(on)) {
        Logger::error("LightController: Manual light %s failed.", on ? "ON" : "OFF");
        return false;
    }
    Logger::info("LightController: Light %s (manual).", on ? "ON" : "OFF");
    recordChange(on, ControlMode::Manual, clock);
    return true;
}

void LightController::recordChange(bool on, ControlMode mode, const CycleClock& clock) {
    hasApplied = true;
    lightOn = on;
    lastChangeAt = clock.monotonicSeconds;

    if (history == nullptr) {
        return;
    }
    ActuatorEvent event;
    event.timestamp = clock.wallClockValid ? clock.epochSeconds : 0;
    event.actuator = Actuator::Light;
    event.state = on;
    event.mode = mode;
    if (!history->logActuatorChange(event)) {
        Logger::warn("LightController: History write failed.");
    }
}

LightStatus LightController::status() const {
    std::lock_guard<std::mutex> lock(cycleMutex);
    LightStatus snapshot;
    snapshot.enabled = enabled.load();
    snapshot.lastOutcome = lastOutcome;
    snapshot.schedule = schedule;
    snapshot.phase = phase;
    snapshot.hasApplied = hasApplied;
    snapshot.lightOn = lightOn;
    snapshot.lastChangeAt = lastChangeAt;
    return snapshot;
}

} // namespace GrowClimate
