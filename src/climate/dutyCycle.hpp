// src/climate/dutyCycle.hpp
#ifndef DUTY_CYCLE_HPP
#define DUTY_CYCLE_HPP

#include "climateTypes.hpp"
#include "data/settingsTypes.hpp"
#include <stdint.h>

namespace GrowClimate {

class ActuatorGateway;

// --- Safety limits (seconds) ---
static const uint32_t MAX_CONTINUOUS_RUNTIME_S = 3600;
static const uint32_t MAX_RUNTIME_COOLDOWN_S = 600;         ///< Heater and humidifier only
static const uint32_t EFFECTIVENESS_MIN_RUNTIME_S = 300;
static const uint32_t INEFFECTIVE_SHUTOFF_MIN_RUNTIME_S = 600;
static const uint32_t INEFFECTIVE_OFF_HOLD_S = 1800;

/**
 * @brief Minimum on/off durations for one actuator, recomputed every cycle.
 */
struct CyclePolicy {
    uint32_t minOnSeconds = 0;
    uint32_t minOffSeconds = 0;
};

/** Reading captured when an actuator was switched on. */
struct EffectivenessSample {
    bool valid = false;
    float temperature = NAN;
    float humidity = NAN;
    uint32_t takenAt = 0;
};

/**
 * @brief Per-actuator timing record. Owned by DutyCycleGuard only.
 */
struct ActuatorTiming {
    bool on = false;
    bool hasTurnedOn = false;
    uint32_t lastTurnedOnAt = 0;
    bool hasTurnedOff = false;
    uint32_t lastTurnedOffAt = 0;
    uint32_t offHoldSeconds = 0; ///< Extra minimum off time demanded by the last shutoff
    EffectivenessSample onSample;
};

enum class StepReason : uint8_t {
    Unchanged,
    TurnedOn,
    TurnedOff,
    TargetReached,  ///< Forced off, minimum on time bypassed
    MaxRuntime,     ///< Forced off, cooldown armed
    Ineffective,    ///< Early shutoff, long off hold armed
    OnDeferred,     ///< Turn-on request waiting for the off time to elapse
    OffDeferred,    ///< Turn-off request waiting for the minimum on time
    OnBlocked       ///< Turn-on request while the stop condition already holds
};

const char* stepReasonName(StepReason reason);

/** Outcome of evaluating one actuator for one cycle. */
struct ActuatorStep {
    bool applied = false;
    StepReason reason = StepReason::Unchanged;
    uint32_t waitSeconds = 0; ///< Remaining wait for deferred requests
    ActuatorTiming timing;    ///< Timing record to keep if the step is committed
};

/**
 * @brief Result of DutyCycleGuard::plan(), committed separately.
 */
struct DutyCyclePlan {
    uint32_t now = 0;
    ActuatorStep steps[CLIMATE_ACTUATOR_COUNT];
    ActuatorStates applied;

    bool changed(const ActuatorStates& current) const { return applied != current; }

    /** @brief true if any step is a safety-forced shutoff. */
    bool hasSafetyShutoff() const;
};

/**
 * @brief Duty-cycle safety layer.
 *
 * Filters desired actuator states through, in order of precedence:
 *  1. immediate shutoff once the actuator's target is reached,
 *  2. the maximum continuous runtime interlock (with cooldown),
 *  3. minimum off time (plus any cooldown/hold) before turning on,
 *  4. minimum on time before turning off, unless the actuator proved
 *     ineffective after running long enough.
 *
 * The static functions are pure; the instance only keeps the timing records
 * and advances them when a plan has been written to the board.
 */
class DutyCycleGuard {
public:
    DutyCycleGuard() : outOfSync(false) {}

    DutyCycleGuard(const DutyCycleGuard&) = delete;
    DutyCycleGuard& operator=(const DutyCycleGuard&) = delete;

    // --- Pure rules ---

    /**
     * @brief Adaptive on/off durations: the further from target, the longer
     * the allowed on time and the shorter the required off time.
     */
    static CyclePolicy computePolicy(Actuator actuator, const ClimateReading& reading, const ClimateSettings& settings);

    /** @brief Stop condition (heater: T >= target, humidifier: H >= target, dehumidifier: H <= target). */
    static bool targetReached(Actuator actuator, const ClimateReading& reading, const ClimateSettings& settings);

    /**
     * @brief Judges whether a running actuator is moving the reading toward target.
     * Defaults to effective without an on-sample or before 5 minutes of runtime.
     */
    static bool isEffective(Actuator actuator, const ActuatorTiming& timing, const ClimateReading& reading,
                            const ClimateSettings& settings, uint32_t now);

    /** @brief Cooldown required after a max-runtime trip, on top of the policy's minimum off time. */
    static uint32_t maxRuntimeCooldown(Actuator actuator);

    /**
     * @brief Applies the precedence rules to one actuator.
     */
    static ActuatorStep evaluate(Actuator actuator, const ActuatorTiming& timing, bool desired,
                                 const ClimateReading& reading, const ClimateSettings& settings, uint32_t now);

    // --- Stateful layer ---

    /**
     * @brief Evaluates all climate actuators against the current timing records.
     * Does not modify the guard.
     */
    DutyCyclePlan plan(const ActuatorStates& desired, const ClimateReading& reading,
                       const ClimateSettings& settings, uint32_t now) const;

    /**
     * @brief Reduces a plan to its safety-forced shutoffs; every other actuator
     * keeps its current state and timing.
     */
    DutyCyclePlan safetyOnly(const DutyCyclePlan& plan) const;

    /**
     * @brief Writes the plan's states through the gateway (only if they differ
     * from the applied ones, or after a failed write) and advances the timing
     * records on success.
     * @return false if the gateway write failed; nothing is advanced then and
     * the guard stays out of sync until a write succeeds or the board state
     * is adopted.
     */
    bool commit(const DutyCyclePlan& plan, ActuatorGateway& gateway);

    /**
     * @brief plan() followed by commit().
     * @param appliedOut States in force after the call.
     */
    bool apply(const ActuatorStates& desired, const ClimateReading& reading, const ClimateSettings& settings,
               uint32_t now, ActuatorGateway& gateway, ActuatorStates& appliedOut);

    /**
     * @brief Takes over the relay states reported by the board: relays found
     * on are timed from now, relays found off are marked off now.
     * Clears the out-of-sync flag.
     */
    void adoptHardwareState(const ActuatorStates& states, uint32_t now);

    /**
     * @brief Writes operator-chosen states, bypassing the duty-cycle rules, and
     * times them like adopted hardware state.
     * @return false if the gateway write failed (the guard is then out of sync).
     */
    bool writeManual(const ActuatorStates& states, uint32_t now, ActuatorGateway& gateway);

    /**
     * @brief true after a failed write. The board may hold any mix of the old
     * and the requested states, since relays are written one at a time.
     */
    bool needsResync() const { return outOfSync; }

    ActuatorStates appliedStates() const;
    const ActuatorTiming& timing(Actuator actuator) const;

private:
    ActuatorTiming timings[CLIMATE_ACTUATOR_COUNT];
    bool outOfSync;
};

} // namespace GrowClimate

#endif // DUTY_CYCLE_HPP
