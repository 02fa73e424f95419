/**
 * @file logger_adapter.cpp
 * @brief Implementation of logger adapters for ai_pacs
 *
 * Provides two implementations:
 *   - ilogger_adapter: wraps common_system's ILogger
 *   - console_logger_adapter: standalone fallback
 */

#include "aipacs/integration/logger_adapter.h"

#ifndef AIPACS_STANDALONE_BUILD
#include <kcenon/common/interfaces/logger_interface.h>
#endif

#include <atomic>
#include <chrono>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace aipacs::integration {

namespace {

#ifndef AIPACS_STANDALONE_BUILD

namespace kci = kcenon::common::interfaces;

kci::log_level to_kcenon_level(log_level level) {
    switch (level) {
        case log_level::trace:
            return kci::log_level::trace;
        case log_level::debug:
            return kci::log_level::debug;
        case log_level::info:
            return kci::log_level::info;
        case log_level::warning:
            return kci::log_level::warning;
        case log_level::error:
            return kci::log_level::error;
        case log_level::critical:
            return kci::log_level::critical;
        default:
            return kci::log_level::info;
    }
}

log_level from_kcenon_level(kci::log_level level) {
    switch (level) {
        case kci::log_level::trace:
            return log_level::trace;
        case kci::log_level::debug:
            return log_level::debug;
        case kci::log_level::info:
            return log_level::info;
        case kci::log_level::warning:
            return log_level::warning;
        case kci::log_level::error:
            return log_level::error;
        case kci::log_level::critical:
        case kci::log_level::off:
            return log_level::critical;
        default:
            return log_level::info;
    }
}

#endif  // AIPACS_STANDALONE_BUILD

const char* level_tag(log_level level) {
    switch (level) {
        case log_level::trace:
            return "TRACE";
        case log_level::debug:
            return "DEBUG";
        case log_level::info:
            return "INFO";
        case log_level::warning:
            return "WARN";
        case log_level::error:
            return "ERROR";
        case log_level::critical:
            return "CRIT";
        default:
            return "UNKNOWN";
    }
}

std::string escape_json(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\r':
                out += "\\r";
                break;
            default:
                out += c;
        }
    }
    return out;
}

}  // namespace

std::optional<log_level> parse_log_level(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "trace") return log_level::trace;
    if (lower == "debug") return log_level::debug;
    if (lower == "info") return log_level::info;
    if (lower == "warn" || lower == "warning") return log_level::warning;
    if (lower == "error") return log_level::error;
    if (lower == "fatal" || lower == "critical") return log_level::critical;

    return std::nullopt;
}

#ifndef AIPACS_STANDALONE_BUILD

// =============================================================================
// ilogger_adapter
// =============================================================================

/**
 * @class ilogger_adapter
 * @brief Logger adapter that forwards to common_system's ILogger
 */
class ilogger_adapter : public logger_adapter {
public:
    explicit ilogger_adapter(std::shared_ptr<kci::ILogger> logger)
        : logger_(std::move(logger)) {
        if (logger_) {
            current_level_ = from_kcenon_level(logger_->get_level());
        }
    }

    void log(log_level level, std::string_view message) override {
        if (!logger_ || level < current_level_.load()) {
            return;
        }
        (void)logger_->log(to_kcenon_level(level), message);
    }

    void set_level(log_level level) override {
        current_level_ = level;
        if (logger_) {
            (void)logger_->set_level(to_kcenon_level(level));
        }
    }

    [[nodiscard]] log_level get_level() const noexcept override {
        return current_level_;
    }

    void flush() override {
        if (logger_) {
            (void)logger_->flush();
        }
    }

private:
    std::shared_ptr<kci::ILogger> logger_;
    std::atomic<log_level> current_level_{log_level::info};
};

#endif  // AIPACS_STANDALONE_BUILD

// =============================================================================
// console_logger_adapter
// =============================================================================

/**
 * @class console_logger_adapter
 * @brief Timestamped console output; error and above go to stderr
 *
 * When constructed with a file path, lines go to that file instead.
 */
class console_logger_adapter : public logger_adapter {
public:
    explicit console_logger_adapter(std::string_view name,
                                    log_format format = log_format::text,
                                    const std::filesystem::path& file = {})
        : name_(name), format_(format) {
        if (!file.empty()) {
            if (auto parent = file.parent_path(); !parent.empty()) {
                std::error_code ec;
                std::filesystem::create_directories(parent, ec);
            }
            file_.open(file, std::ios::app);
            if (!file_) {
                throw std::runtime_error("Cannot open log file: " + file.string());
            }
        }
    }

    void log(log_level level, std::string_view message) override {
        if (level < current_level_.load()) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;
        std::tm tm_val{};
        localtime_r(&time, &tm_val);

        std::ostringstream oss;
        if (format_ == log_format::json) {
            oss << "{\"ts\":\"" << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S")
                << '.' << std::setfill('0') << std::setw(3) << ms.count()
                << "\",\"level\":\"" << to_string(level) << "\",\"logger\":\""
                << escape_json(name_) << "\",\"msg\":\"" << escape_json(message)
                << "\"}\n";
        } else {
            oss << std::put_time(&tm_val, "%Y-%m-%d %H:%M:%S") << '.'
                << std::setfill('0') << std::setw(3) << ms.count() << " ["
                << level_tag(level) << "] ";
            if (!name_.empty()) {
                oss << "[" << name_ << "] ";
            }
            oss << message << '\n';
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) {
            file_ << oss.str();
            return;
        }
        auto& stream = (level >= log_level::error) ? std::cerr : std::cout;
        stream << oss.str();
    }

    void set_level(log_level level) override { current_level_ = level; }

    [[nodiscard]] log_level get_level() const noexcept override {
        return current_level_;
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) {
            file_.flush();
        }
        std::cout.flush();
        std::cerr.flush();
    }

private:
    std::string name_;
    log_format format_;
    std::ofstream file_;
    std::atomic<log_level> current_level_{log_level::info};
    std::mutex mutex_;
};

// =============================================================================
// Global Logger Instance
// =============================================================================

namespace {

std::unique_ptr<logger_adapter> g_default_logger;
std::mutex g_logger_mutex;

}  // namespace

logger_adapter& get_logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_default_logger) {
        g_default_logger = std::make_unique<console_logger_adapter>("ai_pacs");
    }
    return *g_default_logger;
}

std::unique_ptr<logger_adapter> create_logger(std::string_view name) {
    return std::make_unique<console_logger_adapter>(name);
}

std::unique_ptr<logger_adapter> create_logger(std::string_view name,
                                              log_format format,
                                              const std::filesystem::path& file) {
    return std::make_unique<console_logger_adapter>(name, format, file);
}

void set_default_level(log_level level) {
    get_logger().set_level(level);
}

void install_default_logger(std::unique_ptr<logger_adapter> logger) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_default_logger = std::move(logger);
}

void reset_default_logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_default_logger.reset();
}

#ifndef AIPACS_STANDALONE_BUILD

std::unique_ptr<logger_adapter> create_logger(
    std::shared_ptr<kci::ILogger> logger) {
    return std::make_unique<ilogger_adapter>(std::move(logger));
}

void set_default_logger(std::shared_ptr<kci::ILogger> logger) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_default_logger = std::make_unique<ilogger_adapter>(std::move(logger));
}

#endif  // AIPACS_STANDALONE_BUILD

}  // namespace aipacs::integration
