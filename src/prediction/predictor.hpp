// src/prediction/predictor.hpp
#ifndef PREDICTOR_HPP
#define PREDICTOR_HPP

#include "climate/climateTypes.hpp"
#include <stdint.h>

namespace GrowClimate {

/** Forecast horizon used by every predictor. */
static const uint32_t PREDICTION_HORIZON_SECONDS = 600;

/**
 * @brief Expected change of the readings over PREDICTION_HORIZON_SECONDS.
 * Ephemeral: recomputed every cycle and never persisted.
 */
struct Prediction {
    float temperatureDelta = 0.0f;
    float humidityDelta = 0.0f;

    Prediction() {}
    Prediction(float tempDelta, float humDelta) : temperatureDelta(tempDelta), humidityDelta(humDelta) {}
};

/**
 * @brief Predictive Advisor consumed by the climate controller.
 *
 * The controller only asks for forecasts; training, if any, happens on a
 * task of its own. An implementation returns false whenever it has nothing
 * trustworthy to say, and the controller then falls back to reactive control
 * for that cycle.
 */
class Predictor {
public:
    virtual ~Predictor() {}

    /**
     * @param current Reading of this cycle.
     * @param actuators Actuator states currently applied.
     * @param out Filled on success.
     * @return true if a prediction is available.
     */
    virtual bool predict(const ClimateReading& current, const ActuatorStates& actuators, Prediction& out) const = 0;
};

} // namespace GrowClimate

#endif // PREDICTOR_HPP
