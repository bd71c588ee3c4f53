// src/utils/serialLogOutput.cpp
#include "serialLogOutput.hpp"

namespace GrowClimate {

const TickType_t SerialLogOutput::WRITE_TIMEOUT = pdMS_TO_TICKS(100);

SerialLogOutput::SerialLogOutput(Print& output) : out(output) {}

void SerialLogOutput::write(LogLevel level, const char* levelStr, const char* message) {
    FreeRTOSLock lock(mutex, WRITE_TIMEOUT);
    if (!lock) {
        return; // Descarta: outra tarefa segurou o Serial tempo demais
    }
    out.print("[");
    out.print(levelStr);
    out.print("] ");
    out.println(message);
    if (level == LogLevel::ERROR) {
        out.flush();
    }
}

} // namespace GrowClimate
