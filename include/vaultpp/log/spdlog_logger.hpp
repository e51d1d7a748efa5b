#pragma once

#include "vaultpp/log/logger.hpp"

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace vaultpp {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────
// ILogger backed by spdlog. Loggers created here are not registered in
// spdlog's global registry, so several clients can each own one.
//
// Usage:
//   vaultpp::set_logger(vaultpp::make_spdlog_console_logger(LogLevel::Debug));

class SpdlogLogger final : public ILogger {
public:
    /// Console (stderr, colored) sink.
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    /// Wrap an existing spdlog logger; its level becomes the minimum level.
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// Fan out to several sinks.
    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level = LogLevel::Info);

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    void set_level(LogLevel level) noexcept;

    [[nodiscard]] LogLevel level() const noexcept { return min_level_; }

    void set_pattern(const std::string& pattern);

    void flush();

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

/// Console logger whose sink runs on a background thread. All async loggers
/// share one spdlog thread pool, created on first use.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_async_console_logger(
    LogLevel min_level = LogLevel::Info,
    std::size_t queue_size = 8192,
    std::size_t thread_count = 1
);

}  // namespace vaultpp
