#include "vaultpp/log/logger.hpp"

#include <iostream>
#include <mutex>

namespace vaultpp {

namespace {

constexpr std::string_view kReset = "\033[0m";
constexpr std::string_view kGray  = "\033[90m";
constexpr std::string_view kBold  = "\033[1m";

std::string_view level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "\033[37m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Off:   return "";
    }
    return "";
}

std::string_view extract_filename(const char* path) noexcept {
    std::string_view sv(path);
    const auto last_slash = sv.find_last_of("/\\");
    const bool found_slash = (last_slash != std::string_view::npos);
    if (found_slash) {
        return sv.substr(last_slash + 1);
    }
    return sv;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    const auto ms = std::chrono::floor<std::chrono::milliseconds>(tp);
    return std::format("{:%Y-%m-%d %H:%M:%S}", ms);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

std::string ConsoleLogger::format(const LogRecord& record) const {
    const auto filename = extract_filename(record.location.file_name());
    if (colors_enabled_ == false) {
        return std::format("{} {:<5} {}:{} {}",
            format_timestamp(record.timestamp), to_string(record.level),
            filename, record.location.line(), record.message);
    }
    return std::format("{}{}{} {}{}{:<5}{} {}{}:{}{} {}",
        kGray, format_timestamp(record.timestamp), kReset,
        kBold, level_color(record.level), to_string(record.level), kReset,
        kGray, filename, record.location.line(), kReset,
        record.message);
}

void ConsoleLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }

    const std::string line = format(record);

    static std::mutex output_mutex;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << line << '\n';
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Singleton
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& logger_instance() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return *logger_instance();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    const bool is_valid = (logger != nullptr);
    if (is_valid) {
        logger_instance() = std::move(logger);
    } else {
        logger_instance() = std::make_unique<NullLogger>();
    }
}

}  // namespace vaultpp
