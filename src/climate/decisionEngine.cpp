// src/climate/decisionEngine.cpp
#include "decisionEngine.hpp"

namespace GrowClimate {

ActuatorStates ClimateDecisionEngine::decide(const ClimateReading& reading,
                                             const ActuatorStates& current,
                                             const ClimateSettings& settings,
                                             const Prediction* prediction) {
    ActuatorStates desired;
    if (!reading.isComplete()) {
        return desired; // Sem leitura completa nada é ligado
    }

    desired.heater = decideHeater(reading.temperature, current.heater, settings, prediction);
    decideHumidity(reading.humidity, settings, prediction, desired.humidifier, desired.dehumidifier);
    return desired;
}

bool ClimateDecisionEngine::decideHeater(float temperature, bool heaterOn, const ClimateSettings& settings,
                                         const Prediction* prediction) {
    const float low = settings.targetTemperature - settings.temperatureTolerance;
    const float high = settings.targetTemperature + settings.temperatureTolerance;

    if (prediction != nullptr) {
        const float predicted = temperature + prediction->temperatureDelta;
        if (predicted < low) {
            return true;
        }
        // Acima da banda desliga pela leitura atual, não pela prevista
        if (temperature > high) {
            return false;
        }
        return predicted < settings.targetTemperature;
    }

    if (temperature < low) {
        return true;
    }
    if (temperature >= settings.targetTemperature) {
        return false;
    }
    return heaterOn; // Histerese entre low e target
}

void ClimateDecisionEngine::decideHumidity(float humidity, const ClimateSettings& settings,
                                           const Prediction* prediction, bool& humidifierOn, bool& dehumidifierOn) {
    const float low = settings.targetHumidity - settings.humidityTolerance;
    const float high = settings.targetHumidity + settings.humidityTolerance;
    const float value = prediction != nullptr ? humidity + prediction->humidityDelta : humidity;

    humidifierOn = false;
    dehumidifierOn = false;
    if (value < low) {
        humidifierOn = true;
    } else if (value > high) {
        dehumidifierOn = true;
    } else if (prediction != nullptr) {
        humidifierOn = value < settings.targetHumidity;
        dehumidifierOn = value > settings.targetHumidity;
    }
}

} // namespace GrowClimate
