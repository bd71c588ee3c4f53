// src/light/lightSchedule.hpp
#ifndef LIGHT_SCHEDULE_HPP
#define LIGHT_SCHEDULE_HPP

#include "data/settingsTypes.hpp"
#include "utils/clockTime.hpp"
#include <stdint.h>

namespace GrowClimate {

enum class LightPhase : uint8_t { Disabled, ScheduledOn, ScheduledOff };

const char* lightPhaseName(LightPhase phase);

/**
 * @brief Daily light window, evaluated from the wall clock alone.
 */
class LightScheduleMachine {
public:
    /**
     * @brief Phase of the schedule at a time of day.
     * A disabled schedule is always Disabled (light off).
     */
    static LightPhase phaseAt(const LightSchedule& schedule, const ClockTime& now);

    static bool shouldBeOn(const LightSchedule& schedule, const ClockTime& now) {
        return phaseAt(schedule, now) == LightPhase::ScheduledOn;
    }

    /**
     * @brief on < off: on in [on, off). Otherwise the window crosses
     * midnight and is on when now >= on or now < off (on == off: all day).
     */
    static bool isWithinWindow(const ClockTime& onTime, const ClockTime& offTime, const ClockTime& now);
};

} // namespace GrowClimate

#endif // LIGHT_SCHEDULE_HPP
