// src/gateway/actuatorGateway.hpp
#ifndef ACTUATOR_GATEWAY_HPP
#define ACTUATOR_GATEWAY_HPP

#include "climate/climateTypes.hpp"

namespace GrowClimate {

/**
 * @brief Relay states as reported by the actuator board.
 */
struct RelayStates {
    ActuatorStates climate;
    bool light = false;
};

/**
 * @brief Access to the sensor/actuator board.
 *
 * Every call is synchronous and bounded by the implementation's own timeout.
 * A false return means a transport or hardware fault; callers keep their
 * previous view of the actuators and retry on their next cycle.
 */
class ActuatorGateway {
public:
    virtual ~ActuatorGateway() {}

    /**
     * @brief Reads temperature and humidity.
     * @param out Missing values are reported as NAN (the call still succeeds).
     */
    virtual bool readClimate(ClimateReading& out) = 0;

    /** @brief Drives heater, humidifier and dehumidifier relays. */
    virtual bool setActuators(const ActuatorStates& states) = 0;

    /** @brief Reads back the relay states of all four relays. */
    virtual bool getActuatorStates(RelayStates& out) = 0;

    /** @brief Drives the grow light relay. */
    virtual bool setLight(bool on) = 0;
};

} // namespace GrowClimate

#endif // ACTUATOR_GATEWAY_HPP
