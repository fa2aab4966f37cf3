#include "tlsmint/core/util/Logger.h"
#include <fmt/format.h>

namespace tlsmint::core::util {
Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::set_level(Level new_level) { current_level = new_level; }

void Logger::set_output(std::FILE* out) {
    std::lock_guard lock(guard);
    output = out ? out : stderr;
}

Logger::Level Logger::parse_level(std::string_view name) {
    if (name == "trace") return Level::trace;
    if (name == "debug") return Level::debug;
    if (name == "info") return Level::info;
    if (name == "warn") return Level::warn;
    if (name == "error") return Level::error;
    if (name == "critical") return Level::critical;
    return Level::info;
}

const char* Logger::label(Level level) const {
    switch (level) {
        case Level::trace: return "TRACE";
        case Level::debug: return "DEBUG";
        case Level::info: return "INFO";
        case Level::warn: return "WARN";
        case Level::error: return "ERROR";
        case Level::critical: return "CRIT";
    }
    return "?";
}

void Logger::log(Level level, std::string_view message) {
    if (static_cast<int>(level) < static_cast<int>(current_level)) return;
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    std::lock_guard lock(guard);
    fmt::print(output, "[{0}] {1} {2}\n", label(level), millis, message);
}

void log_debug(std::string_view message) { Logger::instance().log(Logger::Level::debug, message); }
void log_info(std::string_view message) { Logger::instance().log(Logger::Level::info, message); }
void log_warn(std::string_view message) { Logger::instance().log(Logger::Level::warn, message); }
void log_error(std::string_view message) { Logger::instance().log(Logger::Level::error, message); }
}
