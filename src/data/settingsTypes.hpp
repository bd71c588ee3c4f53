// src/data/settingsTypes.hpp
#ifndef SETTINGS_TYPES_HPP
#define SETTINGS_TYPES_HPP

#include "utils/clockTime.hpp"

namespace GrowClimate {

/**
 * @brief Setpoints read at the start of every climate cycle.
 * Temperatures are Celsius throughout the core; tolerances are never negative.
 */
struct ClimateSettings {
    float targetTemperature = 22.0f;
    float temperatureTolerance = 0.5f;
    float targetHumidity = 60.0f;
    float humidityTolerance = 5.0f;
    bool predictiveControlEnabled = true;
};

/**
 * @brief Daily light window. offTime <= onTime means the window crosses midnight.
 */
struct LightSchedule {
    bool enabled = false;
    ClockTime onTime = ClockTime(6, 0);
    ClockTime offTime = ClockTime(22, 0);
};

} // namespace GrowClimate

#endif // SETTINGS_TYPES_HPP
