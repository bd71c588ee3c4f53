// src/prediction/trendPredictor.cpp
#include "trendPredictor.hpp"
#include "utils/logger.hpp"
#include <cmath>

namespace GrowClimate {

const size_t TrendPredictor::MIN_TRAINING_SAMPLES;
const uint32_t TrendPredictor::MIN_BUCKET_PAIRS;
const uint32_t TrendPredictor::RETRAIN_INTERVAL_SECONDS;

namespace {

// Pares de amostras válidos: entre 80% e 200% do horizonte
const uint32_t MIN_PAIR_SPAN_S = PREDICTION_HORIZON_SECONDS * 8 / 10;
const uint32_t MAX_PAIR_SPAN_S = PREDICTION_HORIZON_SECONDS * 2;

bool isUsable(const SensorSample& sample) {
    return sample.timestamp != 0 && !std::isnan(sample.temperature) && !std::isnan(sample.humidity);
}

} // namespace

TrendPredictor::TrendPredictor() : attempted(false), lastAttemptAt(0) {}

bool TrendPredictor::buildModel(const std::vector<SensorSample>& samples, TrendModel& out) {
    std::vector<SensorSample> usable;
    usable.reserve(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        if (isUsable(samples[i])) {
            usable.push_back(samples[i]);
        }
    }
    if (usable.size() < MIN_TRAINING_SAMPLES) {
        return false;
    }

    double tempSums[TrendModel::BUCKET_COUNT] = {0};
    double humSums[TrendModel::BUCKET_COUNT] = {0};
    double tempTotal = 0.0;
    double humTotal = 0.0;
    TrendModel built;
    built.sampleCount = static_cast<uint32_t>(usable.size());

    size_t later = 1;
    for (size_t i = 0; i < usable.size(); ++i) {
        if (later <= i) {
            later = i + 1;
        }
        // Primeira amostra pelo menos 80% do horizonte depois de i
        while (later < usable.size() && usable[later].timestamp < usable[i].timestamp + MIN_PAIR_SPAN_S) {
            ++later;
        }
        if (later >= usable.size()) {
            break;
        }
        const uint32_t span = usable[later].timestamp - usable[i].timestamp;
        if (span > MAX_PAIR_SPAN_S) {
            continue; // Lacuna no histórico
        }

        // Normaliza a variação para o horizonte de previsão
        const double scale = static_cast<double>(PREDICTION_HORIZON_SECONDS) / span;
        const double tempDelta = (usable[later].temperature - usable[i].temperature) * scale;
        const double humDelta = (usable[later].humidity - usable[i].humidity) * scale;
        const uint8_t bucket = usable[i].relayMask & (TrendModel::BUCKET_COUNT - 1);

        tempSums[bucket] += tempDelta;
        humSums[bucket] += humDelta;
        built.bucketPairs[bucket]++;
        tempTotal += tempDelta;
        humTotal += humDelta;
        built.pairCount++;
    }

    if (built.pairCount == 0) {
        return false;
    }

    for (uint8_t b = 0; b < TrendModel::BUCKET_COUNT; ++b) {
        if (built.bucketPairs[b] > 0) {
            built.buckets[b] = Prediction(static_cast<float>(tempSums[b] / built.bucketPairs[b]),
                                          static_cast<float>(humSums[b] / built.bucketPairs[b]));
        }
    }
    built.global = Prediction(static_cast<float>(tempTotal / built.pairCount),
                              static_cast<float>(humTotal / built.pairCount));
    out = built;
    return true;
}

bool TrendPredictor::train(const std::vector<SensorSample>& samples, uint32_t now) {
    lastAttemptAt.store(now);
    attempted.store(true);

    std::shared_ptr<TrendModel> built = std::make_shared<TrendModel>();
    if (!buildModel(samples, *built)) {
        Logger::info("TrendPredictor: Not enough history to train (%u samples, need %u).",
                     (unsigned)samples.size(), (unsigned)MIN_TRAINING_SAMPLES);
        return false;
    }

    std::atomic_store(&model, std::shared_ptr<const TrendModel>(built));
    Logger::info("TrendPredictor: Model trained on %u samples (%u pairs).", (unsigned)built->sampleCount,
                 (unsigned)built->pairCount);
    return true;
}

bool TrendPredictor::predict(const ClimateReading& current, const ActuatorStates& actuators, Prediction& out) const {
    std::shared_ptr<const TrendModel> snapshot = std::atomic_load(&model);
    if (!snapshot || !current.isComplete()) {
        return false;
    }
    const uint8_t bucket = actuators.toMask() & (TrendModel::BUCKET_COUNT - 1);
    out = snapshot->bucketPairs[bucket] >= MIN_BUCKET_PAIRS ? snapshot->buckets[bucket] : snapshot->global;
    return true;
}

bool TrendPredictor::shouldRetrain(uint32_t now) const {
    return !attempted.load() || now - lastAttemptAt.load() >= RETRAIN_INTERVAL_SECONDS;
}

bool TrendPredictor::hasModel() const {
    return static_cast<bool>(std::atomic_load(&model));
}

void TrendPredictor::reset() {
    std::atomic_store(&model, std::shared_ptr<const TrendModel>());
    Logger::info("TrendPredictor: Model reset.");
}

uint32_t TrendPredictor::trainedSampleCount() const {
    std::shared_ptr<const TrendModel> snapshot = std::atomic_load(&model);
    return snapshot ? snapshot->sampleCount : 0;
}

} // namespace GrowClimate
