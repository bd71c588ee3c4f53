// src/light/lightSchedule.cpp
#include "lightSchedule.hpp"

namespace GrowClimate {

const char* lightPhaseName(LightPhase phase) {
    switch (phase) {
        case LightPhase::Disabled:     return "disabled";
        case LightPhase::ScheduledOn:  return "scheduled-on";
        case LightPhase::ScheduledOff: return "scheduled-off";
    }
    return "unknown";
}

bool LightScheduleMachine::isWithinWindow(const ClockTime& onTime, const ClockTime& offTime, const ClockTime& now) {
    const uint16_t nowMinutes = now.minutesOfDay();
    const uint16_t startMinutes = onTime.minutesOfDay();
    const uint16_t endMinutes = offTime.minutesOfDay();

    if (startMinutes < endMinutes) { // Horário diurno
        return nowMinutes >= startMinutes && nowMinutes < endMinutes;
    }
    // Atravessa meia-noite
    return nowMinutes >= startMinutes || nowMinutes < endMinutes;
}

LightPhase LightScheduleMachine::phaseAt(const LightSchedule& schedule, const ClockTime& now) {
    if (!schedule.enabled) {
        return LightPhase::Disabled;
    }
    return isWithinWindow(schedule.onTime, schedule.offTime, now) ? LightPhase::ScheduledOn
                                                                  : LightPhase::ScheduledOff;
}

} // namespace GrowClimate
