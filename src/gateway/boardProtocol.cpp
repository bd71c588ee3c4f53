// src/gateway/boardProtocol.cpp
#include "boardProtocol.hpp"
#include <cmath>
#include <string.h>

namespace GrowClimate {
namespace BoardProtocol {

namespace {

bool isError(JsonVariantConst response) {
    return !response.is<JsonObjectConst>() || !response["error"].isNull();
}

float readValue(JsonVariantConst value) {
    return value.is<float>() ? value.as<float>() : NAN;
}

} // namespace

void buildReadAll(JsonDocument& request) {
    request.clear();
    request["command"] = "read_all";
}

void buildGetRelays(JsonDocument& request) {
    request.clear();
    request["command"] = "get_relays";
}

void buildPing(JsonDocument& request) {
    request.clear();
    request["command"] = "ping";
}

void buildSetRelay(JsonDocument& request, Actuator relay, bool state) {
    request.clear();
    request["command"] = "set_relay";
    request["relay"] = actuatorName(relay);
    request["state"] = state;
}

bool parseClimate(JsonVariantConst response, ClimateReading& out) {
    if (isError(response)) {
        return false;
    }
    out.temperature = readValue(response["temperature"]);
    out.humidity = readValue(response["humidity"]);
    return true;
}

bool parseRelays(JsonVariantConst response, RelayStates& out) {
    if (isError(response)) {
        return false;
    }
    JsonVariantConst relays = response["relays"];
    const Actuator all[4] = {Actuator::Heater, Actuator::Humidifier, Actuator::Dehumidifier, Actuator::Light};
    RelayStates parsed;
    for (int i = 0; i < 4; ++i) {
        JsonVariantConst state = relays[actuatorName(all[i])];
        if (!state.is<bool>()) {
            return false;
        }
        if (all[i] == Actuator::Light) {
            parsed.light = state.as<bool>();
        } else {
            parsed.climate.set(all[i], state.as<bool>());
        }
    }
    out = parsed;
    return true;
}

bool parseSetRelayAck(JsonVariantConst response) {
    return !isError(response) && response["success"].as<bool>();
}

bool parsePing(JsonVariantConst response) {
    const char* status = response["status"];
    return !isError(response) && status != nullptr && strcmp(status, "ok") == 0;
}

} // namespace BoardProtocol
} // namespace GrowClimate
