// src/utils/clockTime.cpp
#include "clockTime.hpp"
#include <stdio.h> // Para sscanf, snprintf

namespace GrowClimate {

bool ClockTime::parse(const char* text, ClockTime& out) {
    if (text == nullptr) {
        return false;
    }
    int h = -1, m = -1;
    char trailing = '\0';
    int result = sscanf(text, "%d:%d%c", &h, &m, &trailing);
    if (result != 2 || h < 0 || h > 23 || m < 0 || m > 59) {
        return false;
    }
    out.hour = static_cast<uint8_t>(h);
    out.minute = static_cast<uint8_t>(m);
    return true;
}

void ClockTime::format(char* buffer, size_t size) const {
    snprintf(buffer, size, "%02u:%02u", (unsigned)hour, (unsigned)minute);
}

} // namespace GrowClimate
