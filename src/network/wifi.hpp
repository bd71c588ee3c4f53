// src/network/wifi.hpp
#ifndef WIFI_HPP
#define WIFI_HPP

#include "config.hpp"
#include <stddef.h>

namespace GrowClimate {

/**
 * @brief Tarefa FreeRTOS que conecta ao WiFi (usado apenas para o NTP).
 * Usa as credenciais salvas na NVS e, sem elas, as de WiFiConfig.
 * @param parameter Ponteiro para um WiFiConfig que vive além da tarefa.
 */
void connectToWiFi(void* parameter);

bool saveWiFiCredentials(const char* ssid, const char* password);
bool loadWiFiCredentials(char* ssid, size_t ssidSize, char* password, size_t passwordSize);

} // namespace GrowClimate

#endif // WIFI_HPP
