// src/climate/decisionEngine.hpp
#ifndef DECISION_ENGINE_HPP
#define DECISION_ENGINE_HPP

#include "climateTypes.hpp"
#include "data/settingsTypes.hpp"
#include "prediction/predictor.hpp"

namespace GrowClimate {

/**
 * @brief Turns one reading into the actuator states the controller would like.
 *
 * Pure functions only: no timers, no persistence, no I/O. Duty-cycle limits
 * are applied afterwards by DutyCycleGuard.
 */
class ClimateDecisionEngine {
public:
    /**
     * @brief Computes the desired heater/humidifier/dehumidifier states.
     *
     * @param reading Current reading; both values must be present.
     * @param current States currently applied (used for heater hysteresis).
     * @param settings Setpoints of this cycle.
     * @param prediction Forecast for this cycle, or nullptr for reactive control.
     * @return Desired states. Humidifier and dehumidifier are never both on.
     */
    static ActuatorStates decide(const ClimateReading& reading,
                                 const ActuatorStates& current,
                                 const ClimateSettings& settings,
                                 const Prediction* prediction = nullptr);

    /**
     * @brief Heater decision.
     * Reactive: on below target - tolerance, off at or above target, otherwise
     * unchanged. Predictive: on when the forecast falls below the band, off
     * when the current reading is above it, otherwise "forecast below target".
     */
    static bool decideHeater(float temperature, bool heaterOn, const ClimateSettings& settings,
                             const Prediction* prediction);

    /**
     * @brief Humidifier/dehumidifier pair. Below the band humidify, above it
     * dehumidify, inside it both off (predictive mode breaks the tie with the
     * forecast's side of the target).
     */
    static void decideHumidity(float humidity, const ClimateSettings& settings,
                               const Prediction* prediction, bool& humidifierOn, bool& dehumidifierOn);
};

} // namespace GrowClimate

#endif // DECISION_ENGINE_HPP
