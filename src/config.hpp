// src/config.hpp
#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <stdint.h>

// --- Inclusão Condicional das Configurações da Placa ---
#if defined(ARDUINO_ESP32_DEV)
    #include "boards/board_esp32_dev.hpp"
    #define BOARD_NAME "ESP32 DevKit V1"
#elif defined(ARDUINO_SEEED_XIAO_ESP32C3)
    #include "boards/board_xiao_c3.hpp"
    #define BOARD_NAME "Seeed XIAO ESP32-C3"
#else
    #error "Placa não suportada. Crie um arquivo 'src/boards/board_your_board_name.hpp' e inclua-o condicionalmente em config.hpp."
#endif

// Credenciais padrão, usadas quando não há nada salvo na NVS
#ifdef UNIT_TEST
    #define WIFI_SSID "Wokwi-GUEST"
    #define WIFI_PASSWORD ""
#else
    #define WIFI_SSID "Casa"
    #define WIFI_PASSWORD ""
#endif

#define BAUD 115200 // Console USB

struct WiFiConfig {
    const char* ssid = WIFI_SSID;
    const char* password = WIFI_PASSWORD;
    uint32_t connectTimeoutMs = 30000;
};

struct TimeConfig {
    long utcOffsetInSeconds = -10800; // Fuso horário (-3 GMT)
    const char* ntpServer = "pool.ntp.org";
};

/** Link serial com a placa de sensores/relés. */
struct GatewayConfig {
    int uartNum = GATEWAY_UART_NUM;
    int rxPin = GATEWAY_RX_PIN;
    int txPin = GATEWAY_TX_PIN;
    uint32_t baud = GATEWAY_BAUD;
    uint32_t timeoutMs = 2000; // Por chamada
};

struct TaskConfig {
    uint32_t climateIntervalMs = 10000;
    uint32_t lightIntervalMs = 30000;
    uint32_t samplingIntervalMs = 30000;
    uint32_t trainingCheckIntervalMs = 60000;
    uint32_t minActionIntervalSeconds = 60;
    uint32_t controlStackSize = 4096;
    uint32_t trainingStackSize = 8192; // Histórico inteiro em memória
    uint32_t controlPriority = 2;
    uint32_t trainingPriority = 1;
    uint32_t shutdownTimeoutMs = 15000;
};

struct StorageConfig {
    const char* settingsNamespace = "grow_settings";
    const char* historyNamespace = "grow_hist_v1";
};

struct AppConfig {
    WiFiConfig wifi;
    TimeConfig time;
    GatewayConfig gateway;
    TaskConfig tasks;
    StorageConfig storage;
};

extern AppConfig appConfig;

#endif // CONFIG_HPP
