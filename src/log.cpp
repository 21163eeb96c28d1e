#include "ferry/log.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <utility>

namespace ferry {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_output_mutex;
std::ofstream g_file;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: break;
    }
    return "";
}

void write_timestamp(std::ostream& out) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    ::localtime_r(&secs, &tm);
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
}

}  // namespace

void set_log_level(LogLevel level) { g_level.store(level, std::memory_order_relaxed); }

LogLevel log_level() { return g_level.load(std::memory_order_relaxed); }

std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off") return LogLevel::Off;
    return std::nullopt;
}

bool set_log_file(const std::string& path) {
    std::lock_guard lock(g_output_mutex);
    if (g_file.is_open()) g_file.close();
    g_file.open(path, std::ios::out | std::ios::app);
    return g_file.is_open();
}

LogLine::LogLine(LogLevel level, std::string_view component)
    : enabled_(level != LogLevel::Off && level >= log_level()) {
    if (enabled_) {
        write_timestamp(out_);
        out_ << " [" << level_tag(level) << "] " << component << ": ";
    }
}

LogLine::LogLine(LogLine&& other) noexcept
    : enabled_(std::exchange(other.enabled_, false)), out_(std::move(other.out_)) {}

LogLine::~LogLine() {
    if (!enabled_) return;
    out_ << '\n';
    std::lock_guard lock(g_output_mutex);
    std::ostream& sink = g_file.is_open() ? static_cast<std::ostream&>(g_file) : std::cerr;
    sink << out_.str() << std::flush;
}

}  // namespace ferry
