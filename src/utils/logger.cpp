// src/utils/logger.cpp
#include "logger.hpp"
#include <stdio.h> // Para vsnprintf

namespace GrowClimate {

LogOutput* Logger::output = nullptr; // Sem saída até init()
LogLevel Logger::currentLevel = LogLevel::INFO;

void Logger::init(LogOutput& logOutput, LogLevel level) {
    output = &logOutput;
    currentLevel = level;
}

void Logger::detach() {
    output = nullptr;
}

void Logger::setLevel(LogLevel level) {
    currentLevel = level;
}

LogLevel Logger::getLevel() {
    return currentLevel;
}

void Logger::log(LogLevel level, const char* levelStr, const char* format, va_list args) {
    if (!output || currentLevel == LogLevel::NONE || level < currentLevel) {
        return;
    }

    // Buffer na pilha: cada tarefa formata a sua própria linha
    char buffer[256];
    vsnprintf(buffer, sizeof(buffer), format, args);
    output->write(level, levelStr, buffer);
}

void Logger::debug(const char* format, ...) {
    if (currentLevel > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, format);
    log(LogLevel::DEBUG, "DEBUG", format, args);
    va_end(args);
}

void Logger::info(const char* format, ...) {
    if (currentLevel > LogLevel::INFO) return;
    va_list args;
    va_start(args, format);
    log(LogLevel::INFO, "INFO", format, args);
    va_end(args);
}

void Logger::warn(const char* format, ...) {
    if (currentLevel > LogLevel::WARN) return;
    va_list args;
    va_start(args, format);
    log(LogLevel::WARN, "WARN", format, args);
    va_end(args);
}

void Logger::error(const char* format, ...) {
    va_list args;
    va_start(args, format);
    log(LogLevel::ERROR, "ERROR", format, args);
    va_end(args);
}

} // namespace GrowClimate
