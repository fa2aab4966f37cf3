#pragma once
#include <string>
#include <mutex>
#include <chrono>
#include <string_view>
#include <cstdio>

namespace tlsmint::core::util {
class Logger {
public:
    enum class Level { trace, debug, info, warn, error, critical };
    static Logger& instance();
    void set_level(Level new_level);
    Level level() const { return current_level; }
    // Destination for log lines; stderr unless redirected.
    void set_output(std::FILE* out);
    void log(Level level, std::string_view message);
    // Accepts "trace".."critical"; anything else maps to info.
    static Level parse_level(std::string_view name);
private:
    Logger() = default;
    std::mutex guard;
    Level current_level { Level::info };
    std::FILE* output { stderr };
    const char* label(Level level) const;
};
void log_debug(std::string_view message);
void log_info(std::string_view message);
void log_warn(std::string_view message);
void log_error(std::string_view message);
}
