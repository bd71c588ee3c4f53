// src/climate/temperatureSchedule.cpp
#include "temperatureSchedule.hpp"

namespace GrowClimate {

bool TemperatureSchedule::addPeriod(const ClockTime& start, float temperature) {
    if (periodCount >= MAX_PERIODS) {
        return false;
    }
    periods[periodCount].start = start;
    periods[periodCount].temperature = temperature;
    periodCount++;
    return true;
}

bool TemperatureSchedule::targetAt(const ClockTime& now, float& outTemperature) const {
    if (!enabled || periodCount == 0) {
        return false;
    }

    const uint16_t nowMinutes = now.minutesOfDay();
    int current = -1;  // último período que já começou hoje
    int latest = 0;    // período que começa mais tarde (vale após a meia-noite)
    for (uint8_t i = 0; i < periodCount; ++i) {
        const uint16_t start = periods[i].start.minutesOfDay();
        if (start <= nowMinutes && (current < 0 || start >= periods[current].start.minutesOfDay())) {
            current = i;
        }
        if (start >= periods[latest].start.minutesOfDay()) {
            latest = i;
        }
    }

    outTemperature = periods[current >= 0 ? current : latest].temperature;
    return true;
}

} // namespace GrowClimate
