#include "circuitry/log/logger.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace circuitry {

namespace {

constexpr std::string_view RESET  = "\033[0m";
constexpr std::string_view GRAY   = "\033[90m";
constexpr std::string_view CYAN   = "\033[36m";
constexpr std::string_view GREEN  = "\033[32m";
constexpr std::string_view YELLOW = "\033[33m";
constexpr std::string_view RED    = "\033[31m";
constexpr std::string_view BOLD   = "\033[1m";

[[nodiscard]] std::string_view level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return GRAY;
        case LogLevel::Debug: return CYAN;
        case LogLevel::Info:  return GREEN;
        case LogLevel::Warn:  return YELLOW;
        case LogLevel::Error: return RED;
        case LogLevel::Fatal: return RED;
        case LogLevel::Off:   return RESET;
    }
    return RESET;
}

[[nodiscard]] std::string format_clock_time(std::chrono::system_clock::time_point tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

[[nodiscard]] std::string_view basename_of(const char* path) noexcept {
    const std::string_view full(path);
    const auto slash = full.find_last_of('/');
    if (slash == std::string_view::npos) {
        return full;
    }
    return full.substr(slash + 1);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

void ConsoleLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }

    std::ostringstream line;
    const bool colored = colors_enabled_;

    if (colored) {
        line << GRAY;
    }
    line << format_clock_time(record.timestamp);
    if (colored) {
        line << RESET << ' ' << BOLD << level_color(record.level);
    } else {
        line << ' ';
    }
    line << std::setw(5) << std::left << to_string(record.level);
    if (colored) {
        line << RESET << ' ' << GRAY;
    } else {
        line << ' ';
    }
    line << basename_of(record.location.file_name()) << ':' << record.location.line();
    if (colored) {
        line << RESET;
    }
    line << ' ' << record.message << '\n';

    // One write per record so concurrent breakers do not interleave lines
    static std::mutex stderr_mutex;
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << line.str();
}

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& installed_logger() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& installed_logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(installed_logger_mutex());
    return *installed_logger();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(installed_logger_mutex());
    if (logger) {
        installed_logger() = std::move(logger);
    } else {
        installed_logger() = std::make_unique<NullLogger>();
    }
}

}  // namespace circuitry
