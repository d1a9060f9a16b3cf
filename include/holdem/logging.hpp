#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

namespace holdem {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error,
    Off
};

const char* to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(const std::string& name);

/// Process-wide threshold; lines below it are dropped. Starts at Info.
LogLevel log_level();
void set_log_level(LogLevel level);

/// Destination for log lines. Passing nullptr restores stdout.
void set_log_stream(std::ostream* out);

std::string now_iso8601();

/**
 * Write one JSON object per line:
 * {"level", "message", "domain", "timestamp", ...fields}
 */
void log_event(LogLevel level, const std::string& domain, const std::string& message,
               const nlohmann::json& fields = {});

inline void log_debug(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_event(LogLevel::Debug, domain, message, fields);
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_event(LogLevel::Info, domain, message, fields);
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_event(LogLevel::Warn, domain, message, fields);
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_event(LogLevel::Error, domain, message, fields);
}

} // namespace holdem
