#ifndef SIGN_CORE_LOGGER_H
#define SIGN_CORE_LOGGER_H

#include <string>

namespace sign_core {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel level();

    // Mirrors every line into an append-only file in addition to stderr.
    static bool openFile(const std::string& path);

    static void log(LogLevel level, const std::string& component, const std::string& message);

    // Parses "debug", "info", "warn" or "error" in any case. Returns false on anything else.
    static bool parseLevel(const std::string& text, LogLevel& out);

private:
    static std::string timestamp();
    static const char* levelName(LogLevel level);
};

} // namespace sign_core

#define LOG_DEBUG(component, msg) \
    do { if (sign_core::Logger::level() <= sign_core::LogLevel::DEBUG) \
        sign_core::Logger::log(sign_core::LogLevel::DEBUG, component, msg); } while (0)
#define LOG_INFO(component, msg) sign_core::Logger::log(sign_core::LogLevel::INFO, component, msg)
#define LOG_WARN(component, msg) sign_core::Logger::log(sign_core::LogLevel::WARN, component, msg)
#define LOG_ERROR(component, msg) sign_core::Logger::log(sign_core::LogLevel::ERROR, component, msg)

#endif // SIGN_CORE_LOGGER_H
