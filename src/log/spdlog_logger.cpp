#include "vaultpp/log/spdlog_logger.hpp"

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>
#include <stdexcept>

namespace vaultpp {

namespace {

constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [vaultpp] [%^%l%$] [%s:%#] %v";

// spdlog requires distinct names even for unregistered loggers that share sinks.
std::string unique_logger_name(const std::string& base_name) {
    static std::atomic<std::uint64_t> counter{0};
    return base_name + "_" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
}

}  // namespace

spdlog::level::level_enum SpdlogLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel SpdlogLogger::from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warn;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Error;
        case spdlog::level::off:      return LogLevel::Off;
        default:                      return LogLevel::Info;
    }
}

SpdlogLogger::SpdlogLogger(LogLevel min_level)
    : SpdlogLogger(
          std::vector<spdlog::sink_ptr>{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()},
          min_level
      )
{}

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
    , min_level_(LogLevel::Info)
{
    if (!logger_) {
        throw std::invalid_argument("SpdlogLogger: logger cannot be null");
    }
    min_level_ = from_spdlog_level(logger_->level());
}

SpdlogLogger::SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level)
    : logger_(std::make_shared<spdlog::logger>(
          unique_logger_name("vaultpp"),
          sinks.begin(),
          sinks.end()
      ))
    , min_level_(min_level)
{
    logger_->set_level(to_spdlog_level(min_level));
    logger_->set_pattern(kDefaultPattern);
}

void SpdlogLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }

    logger_->log(
        spdlog::source_loc{
            record.location.file_name(),
            static_cast<int>(record.location.line()),
            record.location.function_name()
        },
        to_spdlog_level(record.level),
        "{}",
        record.message
    );
}

bool SpdlogLogger::should_log(LogLevel level) const noexcept {
    const bool disabled = (min_level_ == LogLevel::Off) || (level == LogLevel::Off);
    if (disabled) {
        return false;
    }
    return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
}

void SpdlogLogger::set_level(LogLevel level) noexcept {
    min_level_ = level;
    logger_->set_level(to_spdlog_level(level));
}

void SpdlogLogger::set_pattern(const std::string& pattern) {
    logger_->set_pattern(pattern);
}

void SpdlogLogger::flush() {
    logger_->flush();
}

std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(LogLevel min_level) {
    return std::make_unique<SpdlogLogger>(min_level);
}

std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogLevel min_level
) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename));
    return std::make_unique<SpdlogLogger>(std::move(sinks), min_level);
}

namespace {

std::shared_ptr<spdlog::details::thread_pool> async_thread_pool(
    std::size_t queue_size,
    std::size_t thread_count
) {
    static std::once_flag init_flag;
    static std::shared_ptr<spdlog::details::thread_pool> pool;
    std::call_once(init_flag, [queue_size, thread_count]() {
        pool = std::make_shared<spdlog::details::thread_pool>(queue_size, thread_count);
    });
    return pool;
}

}  // namespace

std::unique_ptr<SpdlogLogger> make_spdlog_async_console_logger(
    LogLevel min_level,
    std::size_t queue_size,
    std::size_t thread_count
) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    // async_logger only keeps a weak_ptr to the pool
    auto logger = std::make_shared<spdlog::async_logger>(
        unique_logger_name("vaultpp_async"),
        std::move(sink),
        async_thread_pool(queue_size, thread_count),
        spdlog::async_overflow_policy::block
    );
    logger->set_level(SpdlogLogger::to_spdlog_level(min_level));
    logger->set_pattern(kDefaultPattern);
    return std::make_unique<SpdlogLogger>(std::move(logger));
}

}  // namespace vaultpp
