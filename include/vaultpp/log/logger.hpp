#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Off   = 5
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// LogRecord
// ─────────────────────────────────────────────────────────────────────────────
// One log event. The pipeline never puts secret values or bearer tokens into
// a record; only methods, URLs, status codes and error messages.

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────
// Backend-neutral sink. The library ships NullLogger (default) and
// SpdlogLogger; applications may install their own.

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(LogLevel level, std::string_view msg,
               std::source_location loc = std::source_location::current()) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, msg, loc);
    }
};

// Discards everything. Installed until the application calls set_logger().
class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────
// Plain stderr output with ANSI colors, for tools that do not want spdlog:
//
//   2026-01-01 12:00:00.123 WARN  pipeline.cpp:57 PUT https://... failed

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        const bool disabled = (min_level_ == LogLevel::Off) || (level == LogLevel::Off);
        if (disabled) {
            return false;
        }
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    void set_level(LogLevel level) noexcept { min_level_ = level; }

    [[nodiscard]] LogLevel level() const noexcept { return min_level_; }

    void set_colors_enabled(bool enabled) noexcept { colors_enabled_ = enabled; }

    /// The line log() would write, without the trailing newline.
    [[nodiscard]] std::string format(const LogRecord& record) const;

private:
    LogLevel min_level_;
    bool colors_enabled_{true};
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] ILogger& get_logger() noexcept;

// Replace the global logger. Passing nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// The format arguments are only evaluated when the level is enabled.
#define VAULTPP_LOG_AT(level, ...)                                                   \
    do {                                                                             \
        auto& vaultpp_logger_ = ::vaultpp::get_logger();                             \
        if (vaultpp_logger_.should_log(level)) {                                     \
            vaultpp_logger_.log(::vaultpp::LogRecord(level, std::format(__VA_ARGS__))); \
        }                                                                            \
    } while (false)

#define VAULTPP_LOG_TRACE(...) VAULTPP_LOG_AT(::vaultpp::LogLevel::Trace, __VA_ARGS__)
#define VAULTPP_LOG_DEBUG(...) VAULTPP_LOG_AT(::vaultpp::LogLevel::Debug, __VA_ARGS__)
#define VAULTPP_LOG_INFO(...)  VAULTPP_LOG_AT(::vaultpp::LogLevel::Info, __VA_ARGS__)
#define VAULTPP_LOG_WARN(...)  VAULTPP_LOG_AT(::vaultpp::LogLevel::Warn, __VA_ARGS__)
#define VAULTPP_LOG_ERROR(...) VAULTPP_LOG_AT(::vaultpp::LogLevel::Error, __VA_ARGS__)

}  // namespace vaultpp
