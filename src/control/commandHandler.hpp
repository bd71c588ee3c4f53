// src/control/commandHandler.hpp
#ifndef COMMAND_HANDLER_HPP
#define COMMAND_HANDLER_HPP

#include <ArduinoJson.h>
#include "climate/climateController.hpp"
#include "data/settingsManager.hpp"
#include "light/lightController.hpp"
#include "prediction/trendPredictor.hpp"

namespace GrowClimate {

/**
 * @brief Maintenance console: applies one JSON command line.
 *
 * A line is a JSON object whose members are commands:
 *   {"settings": {...}}                 setpoint update
 *   {"mode": "auto" | "manual"}         climate loop on/off
 *   {"light_mode": "schedule" | "manual"}
 *   {"light_schedule": {"enabled", "on_time", "off_time"}}
 *   {"temp_schedule": {"enabled", "periods": [...]}}
 *   {"train": true}                     request a predictor retrain
 *   {"reset_model": true}               drop the trained model
 *   {"wifi": {"ssid", "password"}}      store network credentials
 *   {"restart": true}                   orderly shutdown and reboot
 *   {"relay": {"name", "state"}}        switch one relay (manual mode only)
 *   {"status": true}                    climate, light and model snapshot
 *
 * The reply is {"ok": bool, "results": {command: bool}, "error": "..."},
 * plus a "status" object when requested.
 */
class CommandHandler {
public:
    /** Called when a retrain (or restart) is requested; must not block. */
    typedef void (*TrainingRequestFn)(void* context);

    /** Stores WiFi credentials; they are used from the next connection on. */
    typedef bool (*CredentialsFn)(const char* ssid, const char* password);

    /** Time references for manual relay changes. */
    typedef CycleClock (*ClockFn)(void* context);

    CommandHandler(SettingsManager& settings,
                   ClimateController& climate,
                   LightController& light,
                   TrendPredictor* predictor = nullptr);

    CommandHandler(const CommandHandler&) = delete;
    CommandHandler& operator=(const CommandHandler&) = delete;

    void setTrainingRequest(TrainingRequestFn callback, void* context);
    void setCredentialsHandler(CredentialsFn callback);

    /** Without a clock source manual changes are timed at 0 with no wall clock. */
    void setClockSource(ClockFn callback, void* context);

    /** The callback only schedules the restart; it runs after the reply is sent. */
    void setRestartRequest(TrainingRequestFn callback, void* context);

    /**
     * @brief Parses and executes one line.
     * @return true if the line was valid JSON and every command in it succeeded.
     */
    bool handleLine(const char* line, JsonDocument& reply);

private:
    bool handleMode(JsonVariantConst value);
    bool handleLightMode(JsonVariantConst value);
    bool handleTrain(JsonVariantConst value);
    bool handleResetModel(JsonVariantConst value);
    bool handleWiFi(JsonVariantConst value);
    bool handleRelay(JsonVariantConst value);
    bool handleStatus(JsonVariantConst value, JsonDocument& reply);
    CycleClock currentClock() const;

    SettingsManager& settingsManager;
    ClimateController& climateController;
    LightController& lightController;
    TrendPredictor* predictor;

    TrainingRequestFn trainingRequest;
    void* trainingContext;
    CredentialsFn credentialsHandler;
    ClockFn clockSource;
    void* clockContext;
    TrainingRequestFn restartRequest;
    void* restartContext;
};

} // namespace GrowClimate

#endif // COMMAND_HANDLER_HPP
