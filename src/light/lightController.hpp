// src/light/lightController.hpp
#ifndef LIGHT_CONTROLLER_HPP
#define LIGHT_CONTROLLER_HPP

#include "lightSchedule.hpp"
#include "climate/climateTypes.hpp"
#include "data/historyLog.hpp"
#include "data/settingsManager.hpp"
#include "gateway/actuatorGateway.hpp"
#include "utils/clockTime.hpp"
#include <atomic>
#include <mutex>
#include <stdint.h>

namespace GrowClimate {

struct LightStatus {
    bool enabled = false;
    CycleOutcome lastOutcome = CycleOutcome::Disabled;
    LightSchedule schedule;
    LightPhase phase = LightPhase::Disabled;
    bool hasApplied = false;   ///< false until the first successful write
    bool lightOn = false;
    uint32_t lastChangeAt = 0; ///< Monotonic seconds
};

/**
 * @brief Drives the grow light from the daily schedule.
 *
 * Writes through the gateway only when the scheduled state differs from the
 * one last applied, so repeated cycles with an unchanged schedule and time
 * are no-ops.
 */
class LightController {
public:
    LightController(ActuatorGateway& gateway, SettingsManager& settings, HistoryLog* history = nullptr);

    LightController(const LightController&) = delete;
    LightController& operator=(const LightController&) = delete;

    /** @brief Enables the schedule, persists light_mode=schedule and re-syncs the relay next cycle. */
    bool start();

    /** @brief Leaves the light to manual control and persists light_mode=manual. */
    bool stop();

    void restoreMode();
    bool isEnabled() const { return enabled.load(); }

    /**
     * @brief Persists a new schedule. The loop picks it up on its next cycle,
     * so the schedule never takes effect unless the write succeeded.
     */
    bool updateSchedule(const LightSchedule& schedule);

    CycleOutcome runCycle(const CycleClock& clock);

    /**
     * @brief Switches the light by operator request. Refused while the
     * schedule is in control.
     */
    bool setManualState(bool on, const CycleClock& clock);

    LightStatus status() const;

private:
    void recordChange(bool on, ControlMode mode, const CycleClock& clock);

    ActuatorGateway& gateway;
    SettingsManager& settingsManager;
    HistoryLog* history;

    std::atomic<bool> enabled;
    std::atomic<bool> resyncRequested;
    mutable std::mutex cycleMutex;

    LightSchedule schedule;
    LightPhase phase;
    CycleOutcome lastOutcome;
    bool hasApplied;
    bool lightOn;
    uint32_t lastChangeAt;
};

} // namespace GrowClimate

#endif // LIGHT_CONTROLLER_HPP
