// src/climate/climateTypes.cpp
#include "climateTypes.hpp"
#include <string.h>

namespace GrowClimate {

const char* actuatorName(Actuator actuator) {
    switch (actuator) {
        case Actuator::Heater:       return "heater";
        case Actuator::Humidifier:   return "humidifier";
        case Actuator::Dehumidifier: return "dehumidifier";
        case Actuator::Light:        return "light";
    }
    return "unknown";
}

bool parseActuatorName(const char* name, Actuator& out) {
    if (name == nullptr) {
        return false;
    }
    const Actuator all[] = {Actuator::Heater, Actuator::Humidifier, Actuator::Dehumidifier, Actuator::Light};
    for (size_t i = 0; i < sizeof(all) / sizeof(all[0]); ++i) {
        if (strcmp(name, actuatorName(all[i])) == 0) {
            out = all[i];
            return true;
        }
    }
    return false;
}

const char* controlModeName(ControlMode mode) {
    switch (mode) {
        case ControlMode::Auto:     return "auto";
        case ControlMode::Manual:   return "manual";
        case ControlMode::Schedule: return "schedule";
    }
    return "unknown";
}

const char* cycleOutcomeName(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::Disabled:           return "disabled";
        case CycleOutcome::Applied:            return "applied";
        case CycleOutcome::NoChange:           return "no change";
        case CycleOutcome::RateLimited:        return "rate limited";
        case CycleOutcome::SensorFault:        return "sensor fault";
        case CycleOutcome::MissingData:        return "missing data";
        case CycleOutcome::GatewayWriteFailed: return "gateway write failed";
    }
    return "unknown";
}

bool ActuatorStates::get(Actuator actuator) const {
    switch (actuator) {
        case Actuator::Heater:       return heater;
        case Actuator::Humidifier:   return humidifier;
        case Actuator::Dehumidifier: return dehumidifier;
        default:                     return false;
    }
}

void ActuatorStates::set(Actuator actuator, bool on) {
    switch (actuator) {
        case Actuator::Heater:       heater = on; break;
        case Actuator::Humidifier:   humidifier = on; break;
        case Actuator::Dehumidifier: dehumidifier = on; break;
        default: break; // Luz não faz parte do conjunto climático
    }
}

uint8_t ActuatorStates::toMask() const {
    return static_cast<uint8_t>((heater ? 0x01 : 0) | (humidifier ? 0x02 : 0) | (dehumidifier ? 0x04 : 0));
}

ActuatorStates ActuatorStates::fromMask(uint8_t mask) {
    return ActuatorStates((mask & 0x01) != 0, (mask & 0x02) != 0, (mask & 0x04) != 0);
}

} // namespace GrowClimate
