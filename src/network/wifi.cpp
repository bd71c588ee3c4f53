// src/network/wifi.cpp
#include "wifi.hpp"
#include "utils/logger.hpp"

#include <Arduino.h>
#include <WiFi.h>
#include <Preferences.h>
#include <string.h>

namespace GrowClimate {

static const char* WIFI_NAMESPACE = "wifi";

bool saveWiFiCredentials(const char* ssid, const char* password) {
    Preferences preferences;
    if (!preferences.begin(WIFI_NAMESPACE, false)) {
        Logger::error("WiFi: Failed to open NVS namespace '%s'.", WIFI_NAMESPACE);
        return false;
    }
    // Rede aberta: senha vazia grava 0 bytes
    const bool ok = preferences.putString("ssid", ssid) > 0 &&
                    (preferences.putString("password", password) > 0 || strlen(password) == 0);
    preferences.end();
    if (!ok) {
        Logger::error("WiFi: Failed to save credentials.");
        return false;
    }
    Logger::info("WiFi: Credentials saved for SSID %s.", ssid);
    return true;
}

bool loadWiFiCredentials(char* ssid, size_t ssidSize, char* password, size_t passwordSize) {
    Preferences preferences;
    if (!preferences.begin(WIFI_NAMESPACE, true)) {
        return false; // Namespace ainda não existe
    }
    String storedSSID = preferences.getString("ssid", "");
    String storedPassword = preferences.getString("password", "");
    preferences.end();

    if (storedSSID.length() == 0 || storedSSID.length() >= ssidSize || storedPassword.length() >= passwordSize) {
        return false;
    }
    strncpy(ssid, storedSSID.c_str(), ssidSize);
    strncpy(password, storedPassword.c_str(), passwordSize);
    return true;
}

void connectToWiFi(void* parameter) {
    const WiFiConfig* wifiConfig = static_cast<const WiFiConfig*>(parameter);
    if (wifiConfig == nullptr) {
        Logger::error("WiFi: Task received NULL parameters!");
        vTaskDelete(NULL);
        return;
    }

    char ssid[33];
    char password[65];
    if (loadWiFiCredentials(ssid, sizeof(ssid), password, sizeof(password))) {
        Logger::info("WiFi: Using saved credentials (SSID %s).", ssid);
    } else {
        strncpy(ssid, wifiConfig->ssid, sizeof(ssid) - 1);
        ssid[sizeof(ssid) - 1] = '\0';
        strncpy(password, wifiConfig->password, sizeof(password) - 1);
        password[sizeof(password) - 1] = '\0';
        Logger::info("WiFi: No saved credentials, using build defaults (SSID %s).", ssid);
    }

    WiFi.mode(WIFI_STA);
    WiFi.setHostname(DEVICE_NAME);
    WiFi.begin(ssid, password);

    const uint32_t retryDelayMs = 500;
    const uint32_t maxRetries = wifiConfig->connectTimeoutMs / retryDelayMs;
    uint32_t attempt = 0;
    while (WiFi.status() != WL_CONNECTED && attempt < maxRetries) {
        vTaskDelay(pdMS_TO_TICKS(retryDelayMs));
        attempt++;
    }

    if (WiFi.status() == WL_CONNECTED) {
        Logger::info("WiFi: Connected, IP %s.", WiFi.localIP().toString().c_str());
    } else {
        // O controle climático não depende do WiFi; só a luz espera pelo NTP
        Logger::warn("WiFi: Connection failed, running without wall clock.");
    }
    vTaskDelete(NULL);
}

} // namespace GrowClimate
