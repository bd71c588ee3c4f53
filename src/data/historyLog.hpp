// src/data/historyLog.hpp
#ifndef HISTORY_LOG_HPP
#define HISTORY_LOG_HPP

#include "climate/climateTypes.hpp"
#include <stdint.h>

namespace GrowClimate {

/** One actuator transition. */
struct ActuatorEvent {
    uint32_t timestamp = 0; ///< Unix time, 0 if the wall clock was not synchronized
    Actuator actuator = Actuator::Heater;
    bool state = false;
    ControlMode mode = ControlMode::Auto;
};

/** One periodic sensor sample, with the relay states at that moment. */
struct SensorSample {
    uint32_t timestamp = 0;
    float temperature = NAN;
    float humidity = NAN;
    uint8_t relayMask = 0; ///< ActuatorStates::toMask()
};

/**
 * @brief Append-only history used for status reporting and predictor training.
 * Writes are best effort: a failure never undoes an actuator action.
 */
class HistoryLog {
public:
    virtual ~HistoryLog() {}
    virtual bool logActuatorChange(const ActuatorEvent& event) = 0;
    virtual bool logSensorSample(const SensorSample& sample) = 0;
};

} // namespace GrowClimate

#endif // HISTORY_LOG_HPP
