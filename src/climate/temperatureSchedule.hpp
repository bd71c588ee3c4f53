// src/climate/temperatureSchedule.hpp
#ifndef TEMPERATURE_SCHEDULE_HPP
#define TEMPERATURE_SCHEDULE_HPP

#include "utils/clockTime.hpp"
#include <stdint.h>

namespace GrowClimate {

struct TemperaturePeriod {
    ClockTime start;
    float temperature = 22.0f;
};

/**
 * @brief Optional day profile that overrides target_temp by time of day.
 *
 * Each period starts at its own time and lasts until the next period starts;
 * the last period of the day carries over past midnight.
 */
struct TemperatureSchedule {
    static const uint8_t MAX_PERIODS = 4;

    bool enabled = false;
    uint8_t periodCount = 0;
    TemperaturePeriod periods[MAX_PERIODS];

    /**
     * @brief Appends a period.
     * @return false if the schedule is already full.
     */
    bool addPeriod(const ClockTime& start, float temperature);

    /**
     * @brief Resolves the target temperature active at a given time of day.
     * @param now Local time of day.
     * @param outTemperature Filled when a period applies.
     * @return false when the schedule is disabled or empty.
     */
    bool targetAt(const ClockTime& now, float& outTemperature) const;
};

} // namespace GrowClimate

#endif // TEMPERATURE_SCHEDULE_HPP
