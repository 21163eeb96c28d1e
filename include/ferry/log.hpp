#pragma once

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace ferry {

enum class LogLevel : std::uint8_t {
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

void set_log_level(LogLevel level);
LogLevel log_level();

/// Parse "debug", "info", "warn", "error" or "off".
std::optional<LogLevel> parse_log_level(std::string_view name);

/// Redirect log output to \a path (appending). Returns false if the file cannot be opened;
/// output then stays on stderr.
bool set_log_file(const std::string& path);

/// One log line. Collects the message and writes it whole on destruction, so lines coming
/// from different worker threads never interleave.
class LogLine {
public:
    LogLine(LogLevel level, std::string_view component);
    ~LogLine();

    LogLine(LogLine&& other) noexcept;
    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;
    LogLine& operator=(LogLine&&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (enabled_) out_ << value;
        return *this;
    }

private:
    bool enabled_;
    std::ostringstream out_;
};

inline LogLine log_debug(std::string_view component) { return LogLine(LogLevel::Debug, component); }
inline LogLine log_info(std::string_view component) { return LogLine(LogLevel::Info, component); }
inline LogLine log_warn(std::string_view component) { return LogLine(LogLevel::Warn, component); }
inline LogLine log_error(std::string_view component) { return LogLine(LogLevel::Error, component); }

}  // namespace ferry
