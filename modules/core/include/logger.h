#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <functional>

// Log level enumeration for conditional logging
enum class LogLevel {
    DEBUG = 0,     // Every message (most verbose)
    INFO = 1,      // Important events
    WARNING = 2,   // Problems only
    ERROR = 3,     // Errors only
    NONE = 4,      // Disable all logging
};

// Tag every line with this process' session id (defaults to a random one)
void setSessionId(const std::string& session_id);
std::string getSessionId();

void nativeLog(const std::string& message);

// Mirror every emitted line to a callback (tests capture output this way)
void setLogCallback(std::function<void(const std::string&)> callback);

// Default: INFO (skips debug messages)
void set_log_level(LogLevel level);
LogLevel get_log_level();

// "debug" | "info" | "warn" | "warning" | "error" | "none"; unknown values map to INFO
LogLevel parse_log_level(const std::string& value);

// Async logging: messages are queued and written by a background thread.
// disable_async_logging() drains the queue before returning.
void enable_async_logging();
void disable_async_logging();
bool is_async_logging_enabled();

#define LOG_DEBUG(msg) if (get_log_level() <= LogLevel::DEBUG) nativeLog(msg)
#define LOG_INFO(msg)  if (get_log_level() <= LogLevel::INFO) nativeLog(msg)
#define LOG_WARN(msg)  if (get_log_level() <= LogLevel::WARNING) nativeLog(msg)
#define LOG_ERROR(msg) if (get_log_level() <= LogLevel::ERROR) nativeLog(msg)

#endif // LOGGER_H
