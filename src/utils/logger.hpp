// src/utils/logger.hpp
#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <stdarg.h> // Para va_list, etc.

namespace GrowClimate {
enum class LogLevel { DEBUG, INFO, WARN, ERROR, NONE };

/**
 * @brief Destination for formatted log lines.
 *
 * The firmware installs a Serial-backed output (see serialLogOutput.hpp);
 * host builds may install a capturing output or none at all. Implementations
 * must serialize concurrent writers themselves.
 */
class LogOutput {
public:
    virtual ~LogOutput() {}
    virtual void write(LogLevel level, const char* levelStr, const char* message) = 0;
};

class Logger {
public:
    static void init(LogOutput& output, LogLevel level = LogLevel::INFO);
    static void detach();
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    static void debug(const char* format, ...);
    static void info(const char* format, ...);
    static void warn(const char* format, ...);
    static void error(const char* format, ...);

private:
    static LogOutput* output;
    static LogLevel currentLevel;

    static void log(LogLevel level, const char* levelStr, const char* format, va_list args);
};
} // namespace GrowClimate
#endif // LOGGER_HPP
