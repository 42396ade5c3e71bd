// ============================================================================
// SIGNGATE - Logger Implementation
// ============================================================================
// spdlog console + rotating file sinks, optionally behind the async pool
// ============================================================================

#include "signgate/utils/logger.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <mutex>
#include <vector>

namespace signgate::utils {

namespace {

constexpr const char* kLoggerName = "signgate";

std::mutex g_logger_mutex;

spdlog::level::level_enum to_spdlog(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace

LogLevel parse_log_level(std::string_view name) noexcept {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off") return LogLevel::Off;
    return LogLevel::Info;
}

void Logger::initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!config.log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file, config.max_file_size_mb * 1024 * 1024, config.max_files));
    }

    spdlog::drop(kLoggerName);

    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        spdlog::init_thread_pool(config.queue_size, 1);
        logger = std::make_shared<spdlog::async_logger>(
            kLoggerName, sinks.begin(), sinks.end(), spdlog::thread_pool(),
            spdlog::async_overflow_policy::overrun_oldest);
    } else {
        logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    }

    logger->set_pattern(config.pattern);
    logger->set_level(to_spdlog(config.level));
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    spdlog::flush_every(std::chrono::milliseconds(config.flush_interval_ms));

    std::atomic_store(&instance().logger_, std::move(logger));
}

void Logger::shutdown() {
    {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        auto logger = std::atomic_exchange(&instance().logger_, std::shared_ptr<spdlog::logger>{});
        if (logger) {
            logger->flush();
        }
    }
    spdlog::shutdown();
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) {
    sink()->set_level(to_spdlog(level));
}

void Logger::flush() {
    sink()->flush();
}

std::shared_ptr<spdlog::logger> Logger::sink() {
    if (auto logger = std::atomic_load(&logger_)) {
        return logger;
    }

    // First use before initialize(): fall back to a console logger once
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    auto logger = std::atomic_load(&logger_);
    if (!logger) {
        logger = spdlog::get(kLoggerName);
        if (!logger) {
            logger = spdlog::stdout_color_mt(kLoggerName);
        }
        std::atomic_store(&logger_, logger);
    }
    return logger;
}

void ScopedTimer::log_duration(int64_t microseconds) const {
    switch (level_) {
        case LogLevel::Trace: LOG_TRACE("{} took {} us", name_, microseconds); break;
        case LogLevel::Debug: LOG_DEBUG("{} took {} us", name_, microseconds); break;
        case LogLevel::Info:  LOG_INFO("{} took {} us", name_, microseconds); break;
        case LogLevel::Warn:  LOG_WARN("{} took {} us", name_, microseconds); break;
        default: break;
    }
}

std::string mask_identifier(std::string_view id) {
    if (id.empty()) {
        return "<unset>";
    }
    return std::string(id.substr(0, 4)) + "***";
}

}  // namespace signgate::utils
