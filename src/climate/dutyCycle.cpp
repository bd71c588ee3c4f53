// src/climate/dutyCycle.cpp
#include "dutyCycle.hpp"
#include "gateway/actuatorGateway.hpp"
#include <algorithm>
#include <cmath>

namespace GrowClimate {

namespace {

// Faixas de distância ao alvo (% do alvo)
const float NEAR_TARGET_PERCENT = 5.0f;
const float MEDIUM_TARGET_PERCENT = 15.0f;

const float MIN_HEATER_PROGRESS_C = 0.1f;
const float MIN_HUMIDITY_PROGRESS_RH = 0.5f;
const float FAR_FROM_TARGET_UNITS = 2.0f;

uint32_t elapsedSince(uint32_t now, uint32_t then) {
    return now >= then ? now - then : 0;
}

void markOff(ActuatorTiming& timing, uint32_t now, uint32_t holdSeconds) {
    timing.on = false;
    timing.hasTurnedOff = true;
    timing.lastTurnedOffAt = now;
    timing.offHoldSeconds = holdSeconds;
    timing.onSample.valid = false;
}

void markOn(ActuatorTiming& timing, uint32_t now, const ClimateReading& reading) {
    timing.on = true;
    timing.hasTurnedOn = true;
    timing.lastTurnedOnAt = now;
    timing.onSample.valid = true;
    timing.onSample.temperature = reading.temperature;
    timing.onSample.humidity = reading.humidity;
    timing.onSample.takenAt = now;
}

bool isSafetyReason(StepReason reason) {
    return reason == StepReason::TargetReached || reason == StepReason::MaxRuntime;
}

} // namespace

const char* stepReasonName(StepReason reason) {
    switch (reason) {
        case StepReason::Unchanged:     return "unchanged";
        case StepReason::TurnedOn:      return "turned on";
        case StepReason::TurnedOff:     return "turned off";
        case StepReason::TargetReached: return "target reached";
        case StepReason::MaxRuntime:    return "max runtime";
        case StepReason::Ineffective:   return "ineffective";
        case StepReason::OnDeferred:    return "on deferred";
        case StepReason::OffDeferred:   return "off deferred";
        case StepReason::OnBlocked:     return "on blocked";
    }
    return "unknown";
}

bool DutyCyclePlan::hasSafetyShutoff() const {
    for (uint8_t i = 0; i < CLIMATE_ACTUATOR_COUNT; ++i) {
        if (isSafetyReason(steps[i].reason)) {
            return true;
        }
    }
    return false;
}

// --- Regras puras ---

CyclePolicy DutyCycleGuard::computePolicy(Actuator actuator, const ClimateReading& reading,
                                          const ClimateSettings& settings) {
    float value = reading.humidity;
    float target = settings.targetHumidity;
    float fallbackTarget = 60.0f;
    if (actuator == Actuator::Heater) {
        value = reading.temperature;
        target = settings.targetTemperature;
        fallbackTarget = 22.0f;
    }

    const float reference = std::fabs(target) < 0.1f ? fallbackTarget : std::fabs(target);
    float percentOff = std::fabs(target - value) / reference * 100.0f;
    if (std::isnan(percentOff)) {
        percentOff = 0.0f;
    }

    CyclePolicy policy;
    if (percentOff < NEAR_TARGET_PERCENT) {
        policy.minOnSeconds = 600;
        policy.minOffSeconds = 1200;
    } else if (percentOff < MEDIUM_TARGET_PERCENT) {
        policy.minOnSeconds = 1200;
        policy.minOffSeconds = 600;
    } else {
        // 30 a 60 minutos quando longe do alvo
        policy.minOnSeconds = static_cast<uint32_t>(std::min(3600.0f, 1800.0f + percentOff * 60.0f));
        policy.minOffSeconds = 300;
    }
    return policy;
}

bool DutyCycleGuard::targetReached(Actuator actuator, const ClimateReading& reading,
                                   const ClimateSettings& settings) {
    switch (actuator) {
        case Actuator::Heater:       return reading.temperature >= settings.targetTemperature;
        case Actuator::Humidifier:   return reading.humidity >= settings.targetHumidity;
        case Actuator::Dehumidifier: return reading.humidity <= settings.targetHumidity;
        default:                     return false;
    }
}

bool DutyCycleGuard::isEffective(Actuator actuator, const ActuatorTiming& timing, const ClimateReading& reading,
                                 const ClimateSettings& settings, uint32_t now) {
    if (!timing.onSample.valid) {
        return true;
    }
    if (elapsedSince(now, timing.lastTurnedOnAt) < EFFECTIVENESS_MIN_RUNTIME_S) {
        return true;
    }

    switch (actuator) {
        case Actuator::Heater: {
            const float progress = reading.temperature - timing.onSample.temperature;
            const float remaining = settings.targetTemperature - reading.temperature;
            if (progress <= 0.0f && remaining > 0.0f) return false;
            if (progress < MIN_HEATER_PROGRESS_C && remaining > FAR_FROM_TARGET_UNITS) return false;
            return true;
        }
        case Actuator::Humidifier: {
            const float progress = reading.humidity - timing.onSample.humidity;
            const float remaining = settings.targetHumidity - reading.humidity;
            if (progress <= 0.0f && remaining > 0.0f) return false;
            if (progress < MIN_HUMIDITY_PROGRESS_RH && remaining > FAR_FROM_TARGET_UNITS) return false;
            return true;
        }
        case Actuator::Dehumidifier: {
            const float progress = timing.onSample.humidity - reading.humidity;
            const float remaining = reading.humidity - settings.targetHumidity;
            if (progress <= 0.0f && remaining > 0.0f) return false;
            if (progress < MIN_HUMIDITY_PROGRESS_RH && remaining > FAR_FROM_TARGET_UNITS) return false;
            return true;
        }
        default:
            return true;
    }
}

uint32_t DutyCycleGuard::maxRuntimeCooldown(Actuator actuator) {
    return (actuator == Actuator::Heater || actuator == Actuator::Humidifier) ? MAX_RUNTIME_COOLDOWN_S : 0;
}

ActuatorStep DutyCycleGuard::evaluate(Actuator actuator, const ActuatorTiming& timing, bool desired,
                                      const ClimateReading& reading, const ClimateSettings& settings, uint32_t now) {
    ActuatorStep step;
    step.timing = timing;
    step.applied = timing.on;

    const CyclePolicy policy = computePolicy(actuator, reading, settings);
    const bool reached = targetReached(actuator, reading, settings);

    if (timing.on) {
        const uint32_t onFor = elapsedSince(now, timing.lastTurnedOnAt);

        // 1. Alvo atingido: desliga já, ignorando o tempo mínimo ligado
        if (reached) {
            markOff(step.timing, now, 0);
            step.applied = false;
            step.reason = StepReason::TargetReached;
            return step;
        }
        // 2. Limite de segurança de tempo contínuo
        if (onFor >= MAX_CONTINUOUS_RUNTIME_S) {
            markOff(step.timing, now, maxRuntimeCooldown(actuator));
            step.applied = false;
            step.reason = StepReason::MaxRuntime;
            return step;
        }
        // 4. Pedido de desligamento
        if (!desired) {
            if (onFor >= INEFFECTIVE_SHUTOFF_MIN_RUNTIME_S && !isEffective(actuator, timing, reading, settings, now)) {
                markOff(step.timing, now, INEFFECTIVE_OFF_HOLD_S);
                step.applied = false;
                step.reason = StepReason::Ineffective;
                return step;
            }
            if (onFor >= policy.minOnSeconds) {
                markOff(step.timing, now, 0);
                step.applied = false;
                step.reason = StepReason::TurnedOff;
                return step;
            }
            step.reason = StepReason::OffDeferred;
            step.waitSeconds = policy.minOnSeconds - onFor;
        }
        return step;
    }

    // 3. Pedido de ligamento
    if (desired) {
        if (reached) {
            step.reason = StepReason::OnBlocked;
            return step;
        }
        const uint32_t requiredOff = std::max(policy.minOffSeconds, timing.offHoldSeconds);
        if (timing.hasTurnedOff) {
            const uint32_t offFor = elapsedSince(now, timing.lastTurnedOffAt);
            if (offFor < requiredOff) {
                step.reason = StepReason::OnDeferred;
                step.waitSeconds = requiredOff - offFor;
                return step;
            }
        }
        markOn(step.timing, now, reading);
        step.applied = true;
        step.reason = StepReason::TurnedOn;
    }
    return step;
}

// --- Camada com estado ---

DutyCyclePlan DutyCycleGuard::plan(const ActuatorStates& desired, const ClimateReading& reading,
                                   const ClimateSettings& settings, uint32_t now) const {
    DutyCyclePlan result;
    result.now = now;
    for (uint8_t i = 0; i < CLIMATE_ACTUATOR_COUNT; ++i) {
        const Actuator actuator = climateActuatorAt(i);
        result.steps[i] = evaluate(actuator, timings[i], desired.get(actuator), reading, settings, now);
        result.applied.set(actuator, result.steps[i].applied);
    }
    return result;
}

DutyCyclePlan DutyCycleGuard::safetyOnly(const DutyCyclePlan& original) const {
    DutyCyclePlan reduced = original;
    for (uint8_t i = 0; i < CLIMATE_ACTUATOR_COUNT; ++i) {
        if (isSafetyReason(reduced.steps[i].reason)) {
            continue;
        }
        reduced.steps[i].timing = timings[i];
        reduced.steps[i].applied = timings[i].on;
        reduced.steps[i].reason = StepReason::Unchanged;
        reduced.steps[i].waitSeconds = 0;
        reduced.applied.set(climateActuatorAt(i), timings[i].on);
    }
    return reduced;
}

bool DutyCycleGuard::commit(const DutyCyclePlan& planned, ActuatorGateway& gateway) {
    if (outOfSync || planned.changed(appliedStates())) {
        if (!gateway.setActuators(planned.applied)) {
            // Alguns relés podem ter mudado: a próxima escrita vai completa
            outOfSync = true;
            return false;
        }
    }
    outOfSync = false;
    for (uint8_t i = 0; i < CLIMATE_ACTUATOR_COUNT; ++i) {
        timings[i] = planned.steps[i].timing;
    }
    return true;
}

bool DutyCycleGuard::apply(const ActuatorStates& desired, const ClimateReading& reading,
                           const ClimateSettings& settings, uint32_t now, ActuatorGateway& gateway,
                           ActuatorStates& appliedOut) {
    const bool written = commit(plan(desired, reading, settings, now), gateway);
    appliedOut = appliedStates();
    return written;
}

bool DutyCycleGuard::writeManual(const ActuatorStates& states, uint32_t now, ActuatorGateway& gateway) {
    if (!gateway.setActuators(states)) {
        outOfSync = true;
        return false;
    }
    adoptHardwareState(states, now);
    return true;
}

void DutyCycleGuard::adoptHardwareState(const ActuatorStates& states, uint32_t now) {
    for (uint8_t i = 0; i < CLIMATE_ACTUATOR_COUNT; ++i) {
        const bool hardwareOn = states.get(climateActuatorAt(i));
        if (hardwareOn && !timings[i].on) {
            timings[i].on = true;
            timings[i].hasTurnedOn = true;
            timings[i].lastTurnedOnAt = now;
            timings[i].onSample.valid = false; // Sem histórico: assume eficaz
        } else if (!hardwareOn && timings[i].on) {
            markOff(timings[i], now, 0);
        }
    }
    outOfSync = false;
}

ActuatorStates DutyCycleGuard::appliedStates() const {
    ActuatorStates states;
    for (uint8_t i = 0; i < CLIMATE_ACTUATOR_COUNT; ++i) {
        states.set(climateActuatorAt(i), timings[i].on);
    }
    return states;
}

const ActuatorTiming& DutyCycleGuard::timing(Actuator actuator) const {
    uint8_t index = static_cast<uint8_t>(actuator);
    if (index >= CLIMATE_ACTUATOR_COUNT) {
        index = 0;
    }
    return timings[index];
}

} // namespace GrowClimate
