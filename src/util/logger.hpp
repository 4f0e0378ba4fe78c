/**
 * TOLLGATE - Resilient LLM Provider Client
 * Logger - Structured logging with spdlog
 *
 * Provides:
 * - Component-tagged logging with levels (TRACE..CRITICAL)
 * - One call-log line per completed provider call
 * - Console and rotating file sinks
 * - Request tracing via a thread-local request id
 */

#ifndef TOLLGATE_UTIL_LOGGER_HPP
#define TOLLGATE_UTIL_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace tollgate::util {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logging configuration
 */
struct LogConfig {
    LogLevel level{LogLevel::Info};
    std::string file_path;             // Empty for console only
    std::size_t max_file_size_mb{100}; // Max size before rotation
    std::size_t max_files{5};          // Number of rotated files to keep
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * Call log entry, one per completed ResilientClient call
 */
struct CallLogEntry {
    std::string request_id;
    std::string provider;
    std::string model;
    std::string outcome;           // "ok" or a failure kind
    std::string stage;             // Stage that produced a failure, "-" on success
    int http_status{0};
    std::chrono::milliseconds latency{0};
    bool cache_hit{false};
    std::uint32_t prompt_tokens{0};
    std::uint32_t completion_tokens{0};
    double estimated_cost{0.0};
};

/**
 * Logger class - centralized logging with component tagging
 *
 * Thread-safe singleton that manages process-wide logging. Logging is the one
 * ambient facility; all provider state is owned by the registry.
 */
class Logger {
public:
    /**
     * Apply a logging configuration. Later calls replace the sinks and level
     * of the running logger.
     */
    static void init(const LogConfig& config);

    /**
     * Get the logger instance (creates default if not initialized)
     */
    static Logger& instance();

    ~Logger();

    void set_level(LogLevel level);
    LogLevel get_level() const;

    /**
     * Parse log level from string (case-insensitive)
     * Valid values: trace, debug, info, warn, error, critical, off
     */
    static std::optional<LogLevel> parse_level(std::string_view level_str);

    static std::string_view level_to_string(LogLevel level);

    /**
     * Log one component-tagged line. Formatting is skipped below the
     * active level.
     */
    template<typename... Args>
    void log(LogLevel level, std::string_view component,
             spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (level < current_level_.load(std::memory_order_relaxed)) return;
        logger_->log(to_spdlog_level(level), "[{}] {}", component,
                     fmt::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * Log a completed call (dedicated call log format)
     */
    void call(const CallLogEntry& entry);

    /**
     * Flush all sinks
     */
    void flush();

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void configure(const LogConfig& config);

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    std::shared_ptr<spdlog::sinks::dist_sink_mt> sinks_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> call_logger_;
    std::atomic<LogLevel> current_level_{LogLevel::Info};
    mutable std::mutex mutex_;

    static std::unique_ptr<Logger> instance_;
    static std::once_flag init_flag_;
};

/**
 * Request context for request id propagation
 *
 * Thread-local storage for call-scoped context. The resilient client opens
 * one per call so every log line inside the call can be correlated.
 */
class RequestContext {
public:
    /**
     * Create a new request context (generates ID if not provided)
     */
    explicit RequestContext(std::string request_id = "");
    ~RequestContext();

    RequestContext(const RequestContext&) = delete;
    RequestContext& operator=(const RequestContext&) = delete;

    const std::string& id() const { return request_id_; }

    /**
     * Get the current thread's request ID (empty if no context)
     */
    static std::string current_id();

    /**
     * Generate a random 16-character hex request ID
     */
    static std::string generate_id();

private:
    std::string request_id_;
    std::string previous_id_;
};

#define TOLLGATE_LOG_AT(level, component, ...) \
    ::tollgate::util::Logger::instance().log(::tollgate::util::LogLevel::level, component, __VA_ARGS__)

#define TOLLGATE_LOG_TRACE(component, ...)    TOLLGATE_LOG_AT(Trace, component, __VA_ARGS__)
#define TOLLGATE_LOG_DEBUG(component, ...)    TOLLGATE_LOG_AT(Debug, component, __VA_ARGS__)
#define TOLLGATE_LOG_INFO(component, ...)     TOLLGATE_LOG_AT(Info, component, __VA_ARGS__)
#define TOLLGATE_LOG_WARN(component, ...)     TOLLGATE_LOG_AT(Warn, component, __VA_ARGS__)
#define TOLLGATE_LOG_ERROR(component, ...)    TOLLGATE_LOG_AT(Error, component, __VA_ARGS__)
#define TOLLGATE_LOG_CRITICAL(component, ...) TOLLGATE_LOG_AT(Critical, component, __VA_ARGS__)

// Component constants
namespace log_component {
    constexpr std::string_view Config = "config";
    constexpr std::string_view Pool = "pool";
    constexpr std::string_view Transport = "transport";
    constexpr std::string_view Limiter = "limiter";
    constexpr std::string_view Breaker = "breaker";
    constexpr std::string_view Cache = "cache";
    constexpr std::string_view Tokens = "tokens";
    constexpr std::string_view Client = "client";
}

} // namespace tollgate::util

#endif // TOLLGATE_UTIL_LOGGER_HPP
