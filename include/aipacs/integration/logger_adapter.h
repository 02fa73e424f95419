#ifndef AIPACS_INTEGRATION_LOGGER_ADAPTER_H
#define AIPACS_INTEGRATION_LOGGER_ADAPTER_H

/**
 * @file logger_adapter.h
 * @brief Integration Module - Logger system adapter
 *
 * Structured logging for pipeline components. Pipeline lines carry
 * key=value context (study=..., job=..., stage=...) so that a single
 * study can be followed through the log with grep.
 */

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#ifndef AIPACS_STANDALONE_BUILD
namespace kcenon::common::interfaces {
class ILogger;
}  // namespace kcenon::common::interfaces
#endif

namespace aipacs::integration {

/**
 * @brief Log levels
 */
enum class log_level {
    trace,
    debug,
    info,
    warning,
    error,
    critical
};

[[nodiscard]] constexpr const char* to_string(log_level level) noexcept {
    switch (level) {
        case log_level::trace:
            return "trace";
        case log_level::debug:
            return "debug";
        case log_level::info:
            return "info";
        case log_level::warning:
            return "warning";
        case log_level::error:
            return "error";
        case log_level::critical:
            return "critical";
        default:
            return "unknown";
    }
}

[[nodiscard]] std::optional<log_level> parse_log_level(std::string_view str);

/**
 * @brief Line layout of the built-in logger
 */
enum class log_format {
    /** "2024-01-01 12:00:00.000 [INFO] [name] message" */
    text,
    /** One JSON object per line with ts, level, logger and msg */
    json
};

[[nodiscard]] constexpr const char* to_string(log_format format) noexcept {
    return format == log_format::json ? "json" : "text";
}

/**
 * @brief Logger adapter interface
 */
class logger_adapter {
public:
    virtual ~logger_adapter() = default;

    /**
     * @brief Log a message at specified level
     */
    virtual void log(log_level level, std::string_view message) = 0;

    void trace(std::string_view message) { log(log_level::trace, message); }
    void debug(std::string_view message) { log(log_level::debug, message); }
    void info(std::string_view message) { log(log_level::info, message); }
    void warning(std::string_view message) { log(log_level::warning, message); }
    void error(std::string_view message) { log(log_level::error, message); }
    void critical(std::string_view message) {
        log(log_level::critical, message);
    }

    /**
     * @brief Set minimum log level
     */
    virtual void set_level(log_level level) = 0;

    [[nodiscard]] virtual log_level get_level() const noexcept = 0;

    /**
     * @brief Flush pending log entries
     */
    virtual void flush() = 0;
};

/**
 * @brief Get the process-wide logger
 *
 * Falls back to a console logger named "ai_pacs" until a default
 * logger is installed.
 */
[[nodiscard]] logger_adapter& get_logger();

/**
 * @brief Create a named console logger
 */
[[nodiscard]] std::unique_ptr<logger_adapter> create_logger(
    std::string_view name);

/**
 * @brief Create a logger with the given layout
 *
 * With a non-empty @p file every line is appended to that file instead of
 * the console.
 *
 * @throws std::runtime_error if the file cannot be opened
 */
[[nodiscard]] std::unique_ptr<logger_adapter> create_logger(
    std::string_view name, log_format format,
    const std::filesystem::path& file = {});

/**
 * @brief Set the minimum level of the process-wide logger
 */
void set_default_level(log_level level);

/**
 * @brief Replace the process-wide logger
 */
void install_default_logger(std::unique_ptr<logger_adapter> logger);

/**
 * @brief Drop the installed default logger
 */
void reset_default_logger();

#ifndef AIPACS_STANDALONE_BUILD

/**
 * @brief Wrap a common_system ILogger
 */
[[nodiscard]] std::unique_ptr<logger_adapter> create_logger(
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

/**
 * @brief Route the process-wide logger to a common_system ILogger
 */
void set_default_logger(
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

#endif  // AIPACS_STANDALONE_BUILD

}  // namespace aipacs::integration

#endif  // AIPACS_INTEGRATION_LOGGER_ADAPTER_H
