// src/main.cpp
#include "config.hpp"
#include "climate/climateController.hpp"
#include "control/commandHandler.hpp"
#include "control/controlTaskManager.hpp"
#include "data/dataHistoryManager.hpp"
#include "data/nvsSettingsStore.hpp"
#include "data/settingsManager.hpp"
#include "gateway/serialActuatorGateway.hpp"
#include "light/lightController.hpp"
#include "network/wifi.hpp"
#include "prediction/trendPredictor.hpp"
#include "utils/logger.hpp"
#include "utils/serialLogOutput.hpp"
#include "utils/timeService.hpp"

#include <Arduino.h>
#include <ArduinoJson.h>
#include <LittleFS.h>
#include <WiFi.h>

// --- Instâncias Principais ---
AppConfig appConfig;

GrowClimate::SerialLogOutput serialLog(Serial);
GrowClimate::TimeService timeService;
GrowClimate::NvsSettingsStore settingsStore(appConfig.storage.settingsNamespace);
GrowClimate::SettingsManager settingsManager(settingsStore);
GrowClimate::DataHistoryManager dataHistoryMgr;
GrowClimate::TrendPredictor trendPredictor;

HardwareSerial gatewaySerial(GATEWAY_UART_NUM);
GrowClimate::SerialActuatorGateway gateway(gatewaySerial, appConfig.gateway);

GrowClimate::ClimateController* climateController = nullptr;
GrowClimate::LightController* lightController = nullptr;
GrowClimate::ControlTaskManager* taskManager = nullptr;
GrowClimate::CommandHandler* commandHandler = nullptr;

bool littleFsOk = false;
bool dataHistoryOk = false;
bool settingsOk = false;
bool wifiOk = false;
bool timeOk = false;
bool gatewayOk = false;
bool tasksOk = false;
volatile bool restartRequested = false;

static const size_t CONSOLE_LINE_MAX = 512;

static void requestRestart(void*) {
    restartRequested = true;
}

static GrowClimate::CycleClock consoleClock(void*) {
    return timeService.cycleClock();
}

// Para as tarefas antes de fechar o link com a placa
static void shutdownAndRestart() {
    GrowClimate::Logger::info("Restart requested, stopping control loops...");
    if (taskManager != nullptr && !taskManager->stopTasks()) {
        GrowClimate::Logger::error("Control tasks did not stop in time, restarting anyway.");
    }
    gateway.end();
    Serial.flush();
    ESP.restart();
}

void setup() {
    Serial.begin(BAUD);
    GrowClimate::Logger::init(serialLog, GrowClimate::LogLevel::INFO);
    GrowClimate::Logger::info("--- Booting grow-climate ---");
    GrowClimate::Logger::info("Board: %s (%s)", BOARD_NAME, DEVICE_NAME);
    GrowClimate::Logger::info("Firmware Version: %s %s", __DATE__, __TIME__);

    pinMode(STATUS_LED_PIN, OUTPUT);
    digitalWrite(STATUS_LED_PIN, LOW);

    GrowClimate::Logger::info("Initializing LittleFS...");
    littleFsOk = LittleFS.begin(true);
    if (!littleFsOk) {
        GrowClimate::Logger::error("LittleFS Mount Failed! History disabled.");
    } else {
        dataHistoryOk = dataHistoryMgr.initialize(appConfig.storage.historyNamespace);
        if (!dataHistoryOk) {
            GrowClimate::Logger::error("Data History Manager Initialization Failed!");
        } else {
            GrowClimate::Logger::info("History records: %u", (unsigned)dataHistoryMgr.getRecordCount());
        }
    }

    settingsOk = settingsStore.initialize() && settingsManager.initializeDefaults();
    if (!settingsOk) {
        GrowClimate::Logger::error("Settings store unavailable, running on built-in defaults.");
    }

    GrowClimate::Logger::info("Starting WiFi Task...");
    BaseType_t wifiTaskResult = xTaskCreate(GrowClimate::connectToWiFi, "WiFiTask", 4096,
                                            (void*)&appConfig.wifi, 2, NULL);
    if (wifiTaskResult != pdPASS) {
        GrowClimate::Logger::error("Failed to start WiFi Task! Code: %d", wifiTaskResult);
    } else {
        const uint32_t wifiWaitStart = millis();
        while (WiFi.status() != WL_CONNECTED && (millis() - wifiWaitStart < appConfig.wifi.connectTimeoutMs)) {
            vTaskDelay(pdMS_TO_TICKS(250));
        }
        wifiOk = WiFi.status() == WL_CONNECTED;
    }

    if (!wifiOk) {
        GrowClimate::Logger::warn("WiFi not connected yet; light schedule waits for NTP.");
    }
    timeOk = timeService.initialize(appConfig.time);
    if (!timeOk) {
        GrowClimate::Logger::error("Failed to configure Time Service!");
    }

    gatewayOk = gateway.begin();
    if (!gatewayOk) {
        GrowClimate::Logger::error("Actuator board not responding; loops will retry every cycle.");
    }

    GrowClimate::ClimateControllerConfig climateConfig;
    climateConfig.minActionIntervalSeconds = appConfig.tasks.minActionIntervalSeconds;
    GrowClimate::HistoryLog* history = dataHistoryOk ? &dataHistoryMgr : nullptr;

    climateController = new GrowClimate::ClimateController(gateway, settingsManager, history, &trendPredictor,
                                                           climateConfig);
    lightController = new GrowClimate::LightController(gateway, settingsManager, history);
    climateController->restoreMode();
    lightController->restoreMode();

    taskManager = new GrowClimate::ControlTaskManager(appConfig.tasks, gateway, *climateController, *lightController,
                                                      timeService, dataHistoryOk ? &dataHistoryMgr : nullptr,
                                                      &trendPredictor);
    commandHandler = new GrowClimate::CommandHandler(settingsManager, *climateController, *lightController,
                                                     &trendPredictor);
    commandHandler->setTrainingRequest(GrowClimate::ControlTaskManager::requestTrainingCallback, taskManager);
    commandHandler->setCredentialsHandler(GrowClimate::saveWiFiCredentials);
    commandHandler->setClockSource(consoleClock, nullptr);
    commandHandler->setRestartRequest(requestRestart, nullptr);

    tasksOk = taskManager->startTasks();
    if (!tasksOk) {
        GrowClimate::Logger::error("FATAL: Control tasks could not be started!");
    }

    GrowClimate::Logger::info("--- Setup Complete ---");
    GrowClimate::Logger::info("Status: FS:%d Hist:%d Settings:%d WiFi:%d Time:%d Board:%d Tasks:%d", littleFsOk,
                              dataHistoryOk, settingsOk, wifiOk, timeOk, gatewayOk, tasksOk);
    GrowClimate::Logger::info("Free Heap: %u bytes", ESP.getFreeHeap());
}

// Console de manutenção: uma linha JSON por comando
static void handleConsoleLine(const char* line) {
    JsonDocument reply;
    commandHandler->handleLine(line, reply);
    serializeJson(reply, Serial);
    Serial.println();
}

void loop() {
    static char lineBuffer[CONSOLE_LINE_MAX];
    static size_t lineLength = 0;
    static bool overflow = false;

    while (Serial.available() > 0) {
        const int c = Serial.read();
        if (c == '\r') {
            continue;
        }
        if (c == '\n') {
            if (overflow) {
                GrowClimate::Logger::warn("Console: Line longer than %u bytes ignored.", (unsigned)CONSOLE_LINE_MAX);
            } else if (lineLength > 0 && commandHandler != nullptr) {
                lineBuffer[lineLength] = '\0';
                handleConsoleLine(lineBuffer);
            }
            lineLength = 0;
            overflow = false;
            continue;
        }
        if (lineLength + 1 >= sizeof(lineBuffer)) {
            overflow = true;
            continue;
        }
        lineBuffer[lineLength++] = static_cast<char>(c);
    }

    if (restartRequested) {
        shutdownAndRestart();
    }

    if (climateController != nullptr) {
        digitalWrite(STATUS_LED_PIN, climateController->isEnabled() ? HIGH : LOW);
    }
    vTaskDelay(pdMS_TO_TICKS(50));
}
