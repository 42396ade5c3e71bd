#pragma once
// ============================================================================
// SIGNGATE - Logger
// ============================================================================
// Async logging wrapper with minimal latency on the request path
// Uses spdlog for high-performance logging
// ============================================================================

#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace signgate::utils {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/// Parse "trace", "debug", "info", "warn", "error", "critical", "off".
/// Unknown names fall back to Info.
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string log_file = "signgate.log";  // empty = console only
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

    // Performance settings
    bool async = true;              // Async logging off the request path
    size_t queue_size = 8192;       // Async queue size
    size_t flush_interval_ms = 100; // Auto-flush interval

    // File settings
    size_t max_file_size_mb = 100;
    size_t max_files = 10;
};

// ============================================================================
// Logger Interface
// ============================================================================

class Logger {
public:
    /// Initialize the global logger
    static void initialize(const LogConfig& config = LogConfig{});

    /// Shutdown the logger (flush and close)
    static void shutdown();

    /// Get the global logger instance
    static Logger& instance();

    /// Set log level
    void set_level(LogLevel level);

    /// Log methods
    template <typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        sink()->trace(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        sink()->debug(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        sink()->info(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        sink()->warn(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        sink()->error(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        sink()->critical(fmt, std::forward<Args>(args)...);
    }

    /// Flush all pending logs
    void flush();

private:
    Logger() = default;
    ~Logger() = default;

    /// Active spdlog logger; a console logger until initialize() is called.
    /// Logging threads never take the logger mutex once a logger is set.
    [[nodiscard]] std::shared_ptr<spdlog::logger> sink();

    std::shared_ptr<spdlog::logger> logger_;  // accessed through std::atomic_load/store
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define LOG_TRACE(...) ::signgate::utils::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::signgate::utils::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...) ::signgate::utils::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...) ::signgate::utils::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) ::signgate::utils::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::signgate::utils::Logger::instance().critical(__VA_ARGS__)

// ============================================================================
// Scoped Timer for Performance Measurement
// ============================================================================

class ScopedTimer {
public:
    explicit ScopedTimer(std::string_view name, LogLevel level = LogLevel::Debug)
        : name_(name), level_(level), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        const auto end = std::chrono::steady_clock::now();
        const auto duration =
            std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
        log_duration(duration);
    }

    // Non-copyable
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    void log_duration(int64_t microseconds) const;

    std::string name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_;
};

/// Mask an identifier for logs: first four characters, then "***"
[[nodiscard]] std::string mask_identifier(std::string_view id);

}  // namespace signgate::utils
