// src/utils/serialLogOutput.hpp
#ifndef SERIAL_LOG_OUTPUT_HPP
#define SERIAL_LOG_OUTPUT_HPP

#include <Arduino.h>
#include "logger.hpp"
#include "freeRTOSMutex.hpp"

namespace GrowClimate {

/**
 * @brief LogOutput que escreve em um Print (normalmente o Serial USB).
 * Linhas de tarefas diferentes nunca se misturam; se o mutex não for obtido
 * em 100 ms a linha é descartada.
 */
class SerialLogOutput : public LogOutput {
public:
    explicit SerialLogOutput(Print& out);

    SerialLogOutput(const SerialLogOutput&) = delete;
    SerialLogOutput& operator=(const SerialLogOutput&) = delete;

    void write(LogLevel level, const char* levelStr, const char* message) override;

private:
    Print& out;
    FreeRTOSMutex mutex;
    static const TickType_t WRITE_TIMEOUT;
};

} // namespace GrowClimate

#endif // SERIAL_LOG_OUTPUT_HPP
