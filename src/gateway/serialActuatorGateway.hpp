// src/gateway/serialActuatorGateway.hpp
#ifndef SERIAL_ACTUATOR_GATEWAY_HPP
#define SERIAL_ACTUATOR_GATEWAY_HPP

#include <Arduino.h>
#include <ArduinoJson.h>
#include "actuatorGateway.hpp"
#include "config.hpp"
#include "utils/freeRTOSMutex.hpp"

namespace GrowClimate {

/**
 * @brief ActuatorGateway sobre UART com a placa de sensores/relés.
 *
 * Cada chamada envia uma linha JSON e espera a resposta por até
 * GatewayConfig::timeoutMs. Um mutex serializa as tarefas (clima, luz e
 * amostragem) que compartilham o link.
 */
class SerialActuatorGateway : public ActuatorGateway {
public:
    SerialActuatorGateway(HardwareSerial& serial, const GatewayConfig& config);

    SerialActuatorGateway(const SerialActuatorGateway&) = delete;
    SerialActuatorGateway& operator=(const SerialActuatorGateway&) = delete;

    /**
     * @brief Abre a UART e confirma a placa com um ping.
     * @return false se a placa não respondeu.
     */
    bool begin();

    /** @brief Fecha a UART. Chamar só depois que as tarefas pararem. */
    void end();

    bool isConnected() const { return connected; }

    bool readClimate(ClimateReading& out) override;
    bool setActuators(const ActuatorStates& states) override;
    bool getActuatorStates(RelayStates& out) override;
    bool setLight(bool on) override;

private:
    /**
     * @brief Envia uma requisição e lê uma linha de resposta. Chamar com o mutex obtido.
     */
    bool transact(const JsonDocument& request, JsonDocument& response);
    bool setRelayLocked(Actuator relay, bool state);
    TickType_t lockTimeout() const;

    HardwareSerial& serial;
    const GatewayConfig& config;
    FreeRTOSMutex linkMutex;
    bool connected;

    static const size_t MAX_LINE_LENGTH = 256;
};

} // namespace GrowClimate

#endif // SERIAL_ACTUATOR_GATEWAY_HPP
