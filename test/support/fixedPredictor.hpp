// test/support/fixedPredictor.hpp
#ifndef FIXED_PREDICTOR_HPP
#define FIXED_PREDICTOR_HPP

#include "prediction/predictor.hpp"

namespace GrowClimate {

// Preditor com resposta fixa; available=false simula modelo ausente
class FixedPredictor : public Predictor {
public:
    bool available = true;
    Prediction prediction;
    mutable int calls = 0;

    bool predict(const ClimateReading&, const ActuatorStates&, Prediction& out) const override {
        calls++;
        if (!available) {
            return false;
        }
        out = prediction;
        return true;
    }
};

} // namespace GrowClimate

#endif // FIXED_PREDICTOR_HPP
