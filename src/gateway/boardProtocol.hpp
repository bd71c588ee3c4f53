// src/gateway/boardProtocol.hpp
#ifndef BOARD_PROTOCOL_HPP
#define BOARD_PROTOCOL_HPP

#include <ArduinoJson.h>
#include "actuatorGateway.hpp"

namespace GrowClimate {

/**
 * @brief Line-delimited JSON protocol of the sensor/actuator board.
 *
 * Requests: {"command": "read_all" | "get_relays" | "ping"} and
 * {"command": "set_relay", "relay": name, "state": bool}.
 * Relay names are the actuator names ("heater", "humidifier",
 * "dehumidifier", "light").
 */
namespace BoardProtocol {

void buildReadAll(JsonDocument& request);
void buildGetRelays(JsonDocument& request);
void buildPing(JsonDocument& request);
void buildSetRelay(JsonDocument& request, Actuator relay, bool state);

/**
 * @brief read_all answer. A null or non-numeric value becomes NAN.
 * @return false if the answer is an error object.
 */
bool parseClimate(JsonVariantConst response, ClimateReading& out);

/**
 * @brief get_relays (or read_all) answer: {"relays": {name: bool, ...}}.
 * @return false if any of the four relays is missing.
 */
bool parseRelays(JsonVariantConst response, RelayStates& out);

/** @brief set_relay answer: {"success": true}. */
bool parseSetRelayAck(JsonVariantConst response);

/** @brief ping answer: {"status": "ok"}. */
bool parsePing(JsonVariantConst response);

} // namespace BoardProtocol
} // namespace GrowClimate

#endif // BOARD_PROTOCOL_HPP
