#include "holdem/logging.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace holdem {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_write_mutex;
std::ostream* g_stream = nullptr;

} // anonymous namespace

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "off";
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    for (LogLevel level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                           LogLevel::Error, LogLevel::Off}) {
        if (name == to_string(level)) {
            return level;
        }
    }
    return std::nullopt;
}

LogLevel log_level() {
    return g_level.load();
}

void set_log_level(LogLevel level) {
    g_level.store(level);
}

void set_log_stream(std::ostream* out) {
    std::lock_guard<std::mutex> lock(g_write_mutex);
    g_stream = out;
}

std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

void log_event(LogLevel level, const std::string& domain, const std::string& message,
               const nlohmann::json& fields) {
    if (level == LogLevel::Off || level < g_level.load()) {
        return;
    }

    nlohmann::json log_entry = {
        {"level", to_string(level)},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    if (fields.is_object()) {
        for (auto& [key, value] : fields.items()) {
            log_entry[key] = value;
        }
    }

    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::ostream& out = g_stream ? *g_stream : std::cout;
    out << log_entry.dump() << std::endl;
}

} // namespace holdem
