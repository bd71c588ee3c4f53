// src/climate/climateTypes.hpp
#ifndef CLIMATE_TYPES_HPP
#define CLIMATE_TYPES_HPP

#include <cmath>
#include <stdint.h>

namespace GrowClimate {

/**
 * @brief Relay-driven devices. The first three are the climate actuators
 * owned by the climate loop; Light belongs to the light schedule loop.
 */
enum class Actuator : uint8_t { Heater = 0, Humidifier = 1, Dehumidifier = 2, Light = 3 };

static const uint8_t CLIMATE_ACTUATOR_COUNT = 3;

/** Who caused an actuator transition (stored with every history record). */
enum class ControlMode : uint8_t { Auto = 0, Manual = 1, Schedule = 2 };

/**
 * @brief Result of one control cycle, kept for status reporting.
 */
enum class CycleOutcome : uint8_t {
    Disabled,           ///< Loop is in manual mode, nothing evaluated
    Applied,            ///< At least one actuator changed on the board
    NoChange,           ///< Evaluated, nothing to write
    RateLimited,        ///< Transitions held back by the minimum action interval
    SensorFault,        ///< Gateway read failed
    MissingData,        ///< Reading or wall clock incomplete, cycle skipped
    GatewayWriteFailed  ///< Board rejected the write; retried next cycle
};

const char* actuatorName(Actuator actuator);
const char* controlModeName(ControlMode mode);
const char* cycleOutcomeName(CycleOutcome outcome);

/** @brief Inverse of actuatorName(). */
bool parseActuatorName(const char* name, Actuator& out);

inline Actuator climateActuatorAt(uint8_t index) {
    return static_cast<Actuator>(index);
}

/**
 * @brief One temperature/humidity reading. Missing values are NAN.
 */
struct ClimateReading {
    float temperature = NAN; ///< Celsius
    float humidity = NAN;    ///< %RH

    ClimateReading() {}
    ClimateReading(float temp, float hum) : temperature(temp), humidity(hum) {}

    bool isComplete() const { return !std::isnan(temperature) && !std::isnan(humidity); }
};

/**
 * @brief On/off state of the three climate actuators.
 */
struct ActuatorStates {
    bool heater = false;
    bool humidifier = false;
    bool dehumidifier = false;

    ActuatorStates() {}
    ActuatorStates(bool heaterOn, bool humidifierOn, bool dehumidifierOn)
        : heater(heaterOn), humidifier(humidifierOn), dehumidifier(dehumidifierOn) {}

    bool get(Actuator actuator) const;
    void set(Actuator actuator, bool on);

    /** Bit 0 heater, bit 1 humidifier, bit 2 dehumidifier. */
    uint8_t toMask() const;
    static ActuatorStates fromMask(uint8_t mask);
};

inline bool operator==(const ActuatorStates& a, const ActuatorStates& b) {
    return a.heater == b.heater && a.humidifier == b.humidifier && a.dehumidifier == b.dehumidifier;
}

inline bool operator!=(const ActuatorStates& a, const ActuatorStates& b) {
    return !(a == b);
}

} // namespace GrowClimate

#endif // CLIMATE_TYPES_HPP
