// src/control/commandHandler.cpp
#include "commandHandler.hpp"
#include "utils/logger.hpp"
#include <cmath>
#include <string.h> // Para strcmp

namespace GrowClimate {

CommandHandler::CommandHandler(SettingsManager& settings,
                               ClimateController& climate,
                               LightController& light,
                               TrendPredictor* trendPredictor) :
    settingsManager(settings),
    climateController(climate),
    lightController(light),
    predictor(trendPredictor),
    trainingRequest(nullptr),
    trainingContext(nullptr),
    credentialsHandler(nullptr),
    clockSource(nullptr),
    clockContext(nullptr),
    restartRequest(nullptr),
    restartContext(nullptr)
{}

void CommandHandler::setTrainingRequest(TrainingRequestFn callback, void* context) {
    trainingRequest = callback;
    trainingContext = context;
}

void CommandHandler::setCredentialsHandler(CredentialsFn callback) {
    credentialsHandler = callback;
}

void CommandHandler::setClockSource(ClockFn callback, void* context) {
    clockSource = callback;
    clockContext = context;
}

void CommandHandler::setRestartRequest(TrainingRequestFn callback, void* context) {
    restartRequest = callback;
    restartContext = context;
}

bool CommandHandler::handleLine(const char* line, JsonDocument& reply) {
    reply.clear();

    JsonDocument request;
    DeserializationError error = deserializeJson(request, line);
    if (error) {
        Logger::warn("CommandHandler: Invalid JSON (%s).", error.c_str());
        reply["ok"] = false;
        reply["error"] = error.c_str();
        return false;
    }
    if (!request.is<JsonObject>()) {
        reply["ok"] = false;
        reply["error"] = "expected a JSON object";
        return false;
    }

    JsonObject results = reply["results"].to<JsonObject>();
    bool allOk = true;
    size_t handled = 0;

    for (JsonPairConst command : request.as<JsonObjectConst>()) {
        const char* key = command.key().c_str();
        JsonVariantConst value = command.value();
        bool ok = false;

        if (strcmp(key, "settings") == 0) {
            ok = settingsManager.updateFromJson(value);
        } else if (strcmp(key, "mode") == 0) {
            ok = handleMode(value);
        } else if (strcmp(key, "light_mode") == 0) {
            ok = handleLightMode(value);
        } else if (strcmp(key, "light_schedule") == 0) {
            ok = settingsManager.updateLightScheduleFromJson(value);
        } else if (strcmp(key, "temp_schedule") == 0) {
            ok = settingsManager.updateTemperatureScheduleFromJson(value);
        } else if (strcmp(key, "train") == 0) {
            ok = handleTrain(value);
        } else if (strcmp(key, "reset_model") == 0) {
            ok = handleResetModel(value);
        } else if (strcmp(key, "wifi") == 0) {
            ok = handleWiFi(value);
        } else if (strcmp(key, "relay") == 0) {
            ok = handleRelay(value);
        } else if (strcmp(key, "status") == 0) {
            ok = handleStatus(value, reply);
        } else if (strcmp(key, "restart") == 0) {
            ok = value.as<bool>() && restartRequest != nullptr;
            if (ok) {
                restartRequest(restartContext);
            }
        } else {
            Logger::warn("CommandHandler: Unknown command '%s'.", key);
            continue;
        }

        results[command.key()] = ok;
        allOk = allOk && ok;
        handled++;
    }

    if (handled == 0) {
        reply["ok"] = false;
        reply["error"] = "no known command";
        return false;
    }
    reply["ok"] = allOk;
    return allOk;
}

bool CommandHandler::handleMode(JsonVariantConst value) {
    const char* mode = value.as<const char*>();
    if (mode == nullptr) {
        return false;
    }
    if (strcmp(mode, "auto") == 0) {
        return climateController.start();
    }
    if (strcmp(mode, "manual") == 0) {
        return climateController.stop();
    }
    Logger::warn("CommandHandler: Unknown mode '%s'.", mode);
    return false;
}

bool CommandHandler::handleLightMode(JsonVariantConst value) {
    const char* mode = value.as<const char*>();
    if (mode == nullptr) {
        return false;
    }
    if (strcmp(mode, "schedule") == 0) {
        return lightController.start();
    }
    if (strcmp(mode, "manual") == 0) {
        return lightController.stop();
    }
    Logger::warn("CommandHandler: Unknown light mode '%s'.", mode);
    return false;
}

bool CommandHandler::handleTrain(JsonVariantConst value) {
    if (!value.as<bool>()) {
        return false;
    }
    if (trainingRequest == nullptr) {
        Logger::warn("CommandHandler: Training not available.");
        return false;
    }
    trainingRequest(trainingContext);
    return true;
}

bool CommandHandler::handleResetModel(JsonVariantConst value) {
    if (!value.as<bool>() || predictor == nullptr) {
        return false;
    }
    predictor->reset();
    return true;
}

bool CommandHandler::handleWiFi(JsonVariantConst value) {
    const char* ssid = value["ssid"];
    const char* password = value["password"];
    if (ssid == nullptr || strlen(ssid) == 0 || password == nullptr) {
        Logger::warn("CommandHandler: wifi needs ssid and password.");
        return false;
    }
    if (credentialsHandler == nullptr) {
        return false;
    }
    return credentialsHandler(ssid, password);
}

CycleClock CommandHandler::currentClock() const {
    if (clockSource == nullptr) {
        return CycleClock();
    }
    return clockSource(clockContext);
}

bool CommandHandler::handleRelay(JsonVariantConst value) {
    const char* name = value["name"];
    JsonVariantConst state = value["state"];
    Actuator actuator;
    if (!parseActuatorName(name, actuator) || !state.is<bool>()) {
        Logger::warn("CommandHandler: relay needs a known name and a boolean state.");
        return false;
    }
    if (actuator == Actuator::Light) {
        return lightController.setManualState(state.as<bool>(), currentClock());
    }
    return climateController.setManualState(actuator, state.as<bool>(), currentClock());
}

// Campos sem leitura ficam null
static void putReading(JsonObject target, const char* key, float value) {
    if (std::isnan(value)) {
        target[key] = nullptr;
    } else {
        target[key] = value;
    }
}

bool CommandHandler::handleStatus(JsonVariantConst value, JsonDocument& reply) {
    if (!value.as<bool>()) {
        return false;
    }
    JsonObject status = reply["status"].to<JsonObject>();

    const ClimateStatus climate = climateController.status();
    JsonObject climateJson = status["climate"].to<JsonObject>();
    climateJson["mode"] = climate.enabled ? "auto" : "manual";
    climateJson["last_outcome"] = cycleOutcomeName(climate.lastOutcome);
    JsonObject relays = climateJson["relays"].to<JsonObject>();
    for (uint8_t i = 0; i < CLIMATE_ACTUATOR_COUNT; ++i) {
        const Actuator actuator = climateActuatorAt(i);
        relays[actuatorName(actuator)] = climate.applied.get(actuator);
    }
    putReading(climateJson, "temperature", climate.lastReading.temperature);
    putReading(climateJson, "humidity", climate.lastReading.humidity);
    climateJson["target_temp"] = climate.settings.targetTemperature;
    climateJson["temp_tolerance"] = climate.settings.temperatureTolerance;
    climateJson["target_humidity"] = climate.settings.targetHumidity;
    climateJson["humidity_tolerance"] = climate.settings.humidityTolerance;
    climateJson["used_prediction"] = climate.usedPrediction;
    if (climate.hasActed) {
        climateJson["last_action_at"] = climate.lastActionAt;
    }

    const LightStatus light = lightController.status();
    JsonObject lightJson = status["light"].to<JsonObject>();
    lightJson["mode"] = light.enabled ? "schedule" : "manual";
    lightJson["last_outcome"] = cycleOutcomeName(light.lastOutcome);
    lightJson["phase"] = lightPhaseName(light.phase);
    if (light.hasApplied) {
        lightJson["on"] = light.lightOn;
    } else {
        lightJson["on"] = nullptr;
    }
    char onTime[6];
    char offTime[6];
    light.schedule.onTime.format(onTime, sizeof(onTime));
    light.schedule.offTime.format(offTime, sizeof(offTime));
    JsonObject schedule = lightJson["schedule"].to<JsonObject>();
    schedule["enabled"] = light.schedule.enabled;
    schedule["on_time"] = onTime;
    schedule["off_time"] = offTime;

    JsonObject model = status["model"].to<JsonObject>();
    model["available"] = predictor != nullptr;
    model["enabled"] = climate.settings.predictiveControlEnabled;
    if (predictor != nullptr) {
        model["trained"] = predictor->hasModel();
        model["samples"] = predictor->trainedSampleCount();
    }
    return true;
}

} // namespace GrowClimate
