// src/gateway/serialActuatorGateway.cpp
#include "serialActuatorGateway.hpp"
#include "boardProtocol.hpp"
#include "utils/logger.hpp"

namespace GrowClimate {

SerialActuatorGateway::SerialActuatorGateway(HardwareSerial& port, const GatewayConfig& gatewayConfig) :
    serial(port),
    config(gatewayConfig),
    connected(false)
{}

TickType_t SerialActuatorGateway::lockTimeout() const {
    // O link é compartilhado: espera no máximo uma transação de outra tarefa
    return pdMS_TO_TICKS(config.timeoutMs + 500);
}

bool SerialActuatorGateway::begin() {
    if (!linkMutex) {
        Logger::error("SerialActuatorGateway: Failed to create link mutex!");
        return false;
    }
    Logger::info("SerialActuatorGateway: Opening UART%d (RX %d, TX %d, %lu baud).", config.uartNum, config.rxPin,
                 config.txPin, (unsigned long)config.baud);
    serial.begin(config.baud, SERIAL_8N1, config.rxPin, config.txPin);

    // A placa leva um tempo para subir depois do reset
    vTaskDelay(pdMS_TO_TICKS(2000));

    FreeRTOSLock lock(linkMutex, lockTimeout());
    if (!lock) {
        return false;
    }
    JsonDocument request;
    JsonDocument response;
    BoardProtocol::buildPing(request);
    connected = transact(request, response) && BoardProtocol::parsePing(response.as<JsonVariantConst>());
    if (!connected) {
        Logger::error("SerialActuatorGateway: Board did not answer ping.");
        return false;
    }
    const char* board = response["board"] | "unknown";
    Logger::info("SerialActuatorGateway: Connected to board '%s'.", board);
    return true;
}

void SerialActuatorGateway::end() {
    FreeRTOSLock lock(linkMutex, lockTimeout());
    serial.end();
    connected = false;
    Logger::info("SerialActuatorGateway: UART closed.");
}

bool SerialActuatorGateway::transact(const JsonDocument& request, JsonDocument& response) {
    // Descarta respostas atrasadas de requisições que expiraram
    while (serial.available() > 0) {
        serial.read();
    }

    serializeJson(request, serial);
    serial.write('\n');
    serial.flush();

    char line[MAX_LINE_LENGTH];
    size_t length = 0;
    const uint32_t start = millis();
    while (millis() - start < config.timeoutMs) {
        if (serial.available() <= 0) {
            vTaskDelay(pdMS_TO_TICKS(5));
            continue;
        }
        const int c = serial.read();
        if (c == '\r') {
            continue;
        }
        if (c == '\n') {
            if (length == 0) {
                continue;
            }
            line[length] = '\0';
            DeserializationError error = deserializeJson(response, line, length);
            if (error) {
                Logger::warn("SerialActuatorGateway: Invalid JSON from board (%s).", error.c_str());
                return false;
            }
            return true;
        }
        if (length + 1 >= sizeof(line)) {
            Logger::warn("SerialActuatorGateway: Response longer than %u bytes, dropped.", (unsigned)sizeof(line));
            return false;
        }
        line[length++] = static_cast<char>(c);
    }

    const char* command = request["command"] | "?";
    Logger::warn("SerialActuatorGateway: Timeout waiting for '%s' response.", command);
    return false;
}

bool SerialActuatorGateway::readClimate(ClimateReading& out) {
    FreeRTOSLock lock(linkMutex, lockTimeout());
    if (!lock) {
        Logger::warn("SerialActuatorGateway: Link busy, read_all skipped.");
        return false;
    }
    JsonDocument request;
    JsonDocument response;
    BoardProtocol::buildReadAll(request);
    return transact(request, response) && BoardProtocol::parseClimate(response.as<JsonVariantConst>(), out);
}

bool SerialActuatorGateway::setRelayLocked(Actuator relay, bool state) {
    JsonDocument request;
    JsonDocument response;
    BoardProtocol::buildSetRelay(request, relay, state);
    if (!transact(request, response) || !BoardProtocol::parseSetRelayAck(response.as<JsonVariantConst>())) {
        Logger::error("SerialActuatorGateway: set_relay %s=%s failed.", actuatorName(relay), state ? "ON" : "OFF");
        return false;
    }
    return true;
}

bool SerialActuatorGateway::setActuators(const ActuatorStates& states) {
    FreeRTOSLock lock(linkMutex, lockTimeout());
    if (!lock) {
        Logger::warn("SerialActuatorGateway: Link busy, set_relay skipped.");
        return false;
    }
    // Envia todos os relés mesmo se um falhar; o ciclo seguinte repete
    bool success = true;
    for (uint8_t i = 0; i < CLIMATE_ACTUATOR_COUNT; ++i) {
        const Actuator relay = climateActuatorAt(i);
        success = setRelayLocked(relay, states.get(relay)) && success;
    }
    return success;
}

bool SerialActuatorGateway::getActuatorStates(RelayStates& out) {
    FreeRTOSLock lock(linkMutex, lockTimeout());
    if (!lock) {
        Logger::warn("SerialActuatorGateway: Link busy, get_relays skipped.");
        return false;
    }
    JsonDocument request;
    JsonDocument response;
    BoardProtocol::buildGetRelays(request);
    return transact(request, response) && BoardProtocol::parseRelays(response.as<JsonVariantConst>(), out);
}

bool SerialActuatorGateway::setLight(bool on) {
    FreeRTOSLock lock(linkMutex, lockTimeout());
    if (!lock) {
        Logger::warn("SerialActuatorGateway: Link busy, light unchanged.");
        return false;
    }
    return setRelayLocked(Actuator::Light, on);
}

} // namespace GrowClimate
