// src/climate/climateController.hpp
#ifndef CLIMATE_CONTROLLER_HPP
#define CLIMATE_CONTROLLER_HPP

#include "climateTypes.hpp"
#include "decisionEngine.hpp"
#include "dutyCycle.hpp"
#include "temperatureSchedule.hpp"
#include "data/historyLog.hpp"
#include "data/settingsManager.hpp"
#include "gateway/actuatorGateway.hpp"
#include "prediction/predictor.hpp"
#include "utils/clockTime.hpp"
#include <atomic>
#include <mutex>
#include <stdint.h>

namespace GrowClimate {

struct ClimateControllerConfig {
    uint32_t minActionIntervalSeconds = 60; ///< Floor between two actuator writes
};

/**
 * @brief Snapshot of the climate loop for status reporting.
 */
struct ClimateStatus {
    bool enabled = false;
    CycleOutcome lastOutcome = CycleOutcome::Disabled;
    ActuatorStates applied;
    ClimateReading lastReading;
    ClimateSettings settings;          ///< Settings of the last cycle, schedule override included
    bool usedPrediction = false;
    bool hasActed = false;
    uint32_t lastActionAt = 0;         ///< Monotonic seconds
};

/**
 * @brief One climate control cycle: settings reload, reading, optional
 * forecast, decision, duty-cycle filtering, gateway write and history.
 *
 * runCycle() runs on the climate task. status() and setManualState() may be
 * called from the console; they wait for a cycle in progress to finish.
 * start()/stop() may be called from any task; they only flip the enabled
 * flag, so timers and cooldowns survive a manual/auto toggle.
 */
class ClimateController {
public:
    /**
     * @param gateway Actuator board access.
     * @param settings Settings Store view, reloaded every cycle.
     * @param history Optional history log (nullptr disables transition logging).
     * @param predictor Optional Predictive Advisor.
     */
    ClimateController(ActuatorGateway& gateway,
                      SettingsManager& settings,
                      HistoryLog* history = nullptr,
                      const Predictor* predictor = nullptr,
                      const ClimateControllerConfig& config = ClimateControllerConfig());

    ClimateController(const ClimateController&) = delete;
    ClimateController& operator=(const ClimateController&) = delete;

    /** @brief Enables automatic control and persists mode=auto. */
    bool start();

    /** @brief Disables automatic control and persists mode=manual. */
    bool stop();

    /** @brief Enables the loop iff the persisted mode is auto. */
    void restoreMode();

    bool isEnabled() const { return enabled.load(); }

    /**
     * @brief Reads the relay states from the board and starts timing the
     * relays already on.
     * @return false if the board could not be read.
     */
    bool adoptHardwareState(uint32_t now);

    /**
     * @brief Runs one cycle.
     * @param clock Monotonic time for the timers, wall clock for schedules.
     */
    CycleOutcome runCycle(const CycleClock& clock);

    /**
     * @brief Switches one climate relay by operator request. Refused while
     * automatic control is enabled. The duty-cycle timers adopt the new state.
     * @return false if refused or the board write failed.
     */
    bool setManualState(Actuator actuator, bool on, const CycleClock& clock);

    ClimateStatus status() const;

    const DutyCycleGuard& dutyCycle() const { return guard; }

private:
    CycleOutcome finishCycle(CycleOutcome outcome);
    ClimateSettings effectiveSettings(const CycleClock& clock);
    void resyncFromBoard(const CycleClock& clock);
    void logTransitions(const DutyCyclePlan& plan, const CycleClock& clock);
    void recordTransition(Actuator actuator, bool state, const char* reason, ControlMode mode,
                          const CycleClock& clock);
    void recordChanges(const char* reason, ControlMode mode, const CycleClock& clock);

    ActuatorGateway& gateway;
    SettingsManager& settingsManager;
    HistoryLog* history;
    const Predictor* predictor;
    ClimateControllerConfig config;

    std::atomic<bool> enabled;
    mutable std::mutex cycleMutex;
    DutyCycleGuard guard;

    // Últimos valores válidos lidos do Settings Store
    ClimateSettings baseSettings;
    TemperatureSchedule temperatureSchedule;

    ActuatorStates lastLogged;
    CycleOutcome lastOutcome;
    ClimateReading lastReading;
    ClimateSettings lastSettings;
    bool usedPrediction;
    bool hasActed;
    uint32_t lastActionAt;
};

} // namespace GrowClimate

#endif // CLIMATE_CONTROLLER_HPP
