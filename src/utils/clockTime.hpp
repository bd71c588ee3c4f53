// src/utils/clockTime.hpp
#ifndef CLOCK_TIME_HPP
#define CLOCK_TIME_HPP

#include <stddef.h>
#include <stdint.h>

namespace GrowClimate {

/**
 * @brief Wall-clock time of day with minute resolution (HH:MM).
 */
struct ClockTime {
    uint8_t hour = 0;
    uint8_t minute = 0;

    ClockTime() {}
    ClockTime(uint8_t h, uint8_t m) : hour(h), minute(m) {}

    uint16_t minutesOfDay() const { return static_cast<uint16_t>(hour * 60 + minute); }

    /**
     * @brief Parses a "HH:MM" string (00:00 to 23:59).
     * @param text Null-terminated string.
     * @param out Filled only when parsing succeeds.
     * @return true if the string is a valid time of day.
     */
    static bool parse(const char* text, ClockTime& out);

    /**
     * @brief Writes "HH:MM" into buffer (needs at least 6 bytes).
     */
    void format(char* buffer, size_t size) const;
};

inline bool operator==(const ClockTime& a, const ClockTime& b) {
    return a.hour == b.hour && a.minute == b.minute;
}

/**
 * @brief Time references handed to a control cycle by the task that runs it.
 *
 * monotonicSeconds drives every duty-cycle timer and never jumps with NTP
 * corrections. The wall-clock fields are only meaningful when
 * wallClockValid is set.
 */
struct CycleClock {
    uint32_t monotonicSeconds = 0;
    uint32_t epochSeconds = 0;
    bool wallClockValid = false;
    ClockTime localTime;
};

} // namespace GrowClimate

#endif // CLOCK_TIME_HPP
