// src/utils/timeService.cpp
#include "timeService.hpp"
#include "logger.hpp"
#include <Arduino.h>   // Para configTime, getLocalTime
#include <esp_timer.h> // Para esp_timer_get_time
#include <string.h>    // Para strlen

namespace GrowClimate {

// Antes disso o relógio ainda está em 1970
static const time_t MIN_VALID_EPOCH = 1609459200; // 2021-01-01

TimeService::TimeService() : serviceInitializedState(false) {}

bool TimeService::initialize(const TimeConfig& config) {
    if (serviceInitializedState) {
        Logger::warn("TimeService: Already initialized.");
        return true;
    }
    if (config.ntpServer == nullptr || strlen(config.ntpServer) == 0) {
        Logger::error("TimeService: Invalid NTP server in configuration.");
        return false;
    }

    Logger::info("TimeService: Configuring NTP with server %s, UTC offset %ld.", config.ntpServer,
                 config.utcOffsetInSeconds);
    configTime(config.utcOffsetInSeconds, 0, config.ntpServer);
    serviceInitializedState = true; // O SNTP continua tentando em segundo plano

    struct tm timeinfo;
    const int maxRetries = 10;
    for (int attempt = 0; attempt < maxRetries; ++attempt) {
        if (getLocalTime(&timeinfo, 1000)) {
            char timeBuffer[32];
            strftime(timeBuffer, sizeof(timeBuffer), "%Y-%m-%d %H:%M:%S", &timeinfo);
            Logger::info("TimeService: Synchronized, local time %s.", timeBuffer);
            return true;
        }
    }
    Logger::warn("TimeService: Initial NTP sync pending, schedules wait for it.");
    return true;
}

bool TimeService::getCurrentTime(struct tm& timeinfo) const {
    if (!serviceInitializedState) {
        return false;
    }
    return getLocalTime(&timeinfo, 10); // Espera no máximo 10ms
}

CycleClock TimeService::cycleClock() const {
    CycleClock clock;
    clock.monotonicSeconds = monotonicSeconds();

    struct tm timeinfo;
    if (getCurrentTime(timeinfo)) {
        const time_t epoch = time(nullptr);
        if (epoch >= MIN_VALID_EPOCH) {
            clock.epochSeconds = static_cast<uint32_t>(epoch);
            clock.localTime = ClockTime(static_cast<uint8_t>(timeinfo.tm_hour), static_cast<uint8_t>(timeinfo.tm_min));
            clock.wallClockValid = true;
        }
    }
    return clock;
}

uint32_t TimeService::monotonicSeconds() {
    return static_cast<uint32_t>(esp_timer_get_time() / 1000000LL);
}

bool TimeService::isInitialized() const {
    return serviceInitializedState;
}

} // namespace GrowClimate
