// src/prediction/trendPredictor.hpp
#ifndef TREND_PREDICTOR_HPP
#define TREND_PREDICTOR_HPP

#include "predictor.hpp"
#include "data/historyLog.hpp"
#include <atomic>
#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <vector>

namespace GrowClimate {

/**
 * @brief Trained state of TrendPredictor. Immutable once published.
 */
struct TrendModel {
    static const uint8_t BUCKET_COUNT = 8; ///< One per heater/humidifier/dehumidifier combination

    Prediction buckets[BUCKET_COUNT];
    uint32_t bucketPairs[BUCKET_COUNT] = {0, 0, 0, 0, 0, 0, 0, 0};
    Prediction global;
    uint32_t pairCount = 0;
    uint32_t sampleCount = 0;
};

/**
 * @brief Predictive Advisor learned from the sensor sample history.
 *
 * For every relay combination it keeps the mean temperature and humidity
 * change observed over PREDICTION_HORIZON_SECONDS while that combination
 * was applied, with the mean over all samples as fallback for combinations
 * seen too rarely.
 *
 * train() runs on its own task; predict() runs on the climate loop. The
 * model is published with an atomic shared_ptr swap, so a prediction sees
 * either the old model or the new one.
 */
class TrendPredictor : public Predictor {
public:
    static const size_t MIN_TRAINING_SAMPLES = 100;
    static const uint32_t MIN_BUCKET_PAIRS = 5;
    static const uint32_t RETRAIN_INTERVAL_SECONDS = 900;

    TrendPredictor();

    TrendPredictor(const TrendPredictor&) = delete;
    TrendPredictor& operator=(const TrendPredictor&) = delete;

    bool predict(const ClimateReading& current, const ActuatorStates& actuators, Prediction& out) const override;

    /**
     * @brief Builds a new model from chronologically ordered samples and publishes it.
     * @param now Monotonic seconds, recorded as the time of this attempt.
     * @return false if there were not enough usable samples; the previous model stays.
     */
    bool train(const std::vector<SensorSample>& samples, uint32_t now);

    /** @brief true if never attempted or the retrain interval elapsed since the last attempt. */
    bool shouldRetrain(uint32_t now) const;

    bool hasModel() const;

    /** @brief Drops the model; predictions are unavailable until the next training. */
    void reset();

    /** @brief Number of samples behind the current model (0 without one). */
    uint32_t trainedSampleCount() const;

    /**
     * @brief Pure model construction used by train().
     * @return false when fewer than MIN_TRAINING_SAMPLES samples are usable
     * or no pair of samples spans the horizon.
     */
    static bool buildModel(const std::vector<SensorSample>& samples, TrendModel& out);

private:
    std::shared_ptr<const TrendModel> model;
    std::atomic<bool> attempted;
    std::atomic<uint32_t> lastAttemptAt;
};

} // namespace GrowClimate

#endif // TREND_PREDICTOR_HPP
