#ifndef AIPACS_CONFIG_PIPELINE_CONFIG_H
#define AIPACS_CONFIG_PIPELINE_CONFIG_H

/**
 * @file pipeline_config.h
 * @brief Root configuration of the AI PACS pipeline
 *
 * One section per component. Defaults describe a single-node deployment
 * that stores into ./data and delivers to a local archive.
 *
 * @example YAML Configuration
 * ```yaml
 * name: "AI_PACS"
 *
 * storage:
 *   database_path: "/var/lib/ai_pacs/pipeline.db"
 *   data_directory: "/var/lib/ai_pacs/instances"
 *
 * receiver:
 *   ae_title: "AI_PACS"
 *   port: 11112
 *   accepted_modalities:
 *     - "CT"
 *     - "MR"
 *
 * assembler:
 *   idle_timeout: 30s
 *
 * orchestrator:
 *   worker_count: 4
 *   overflow_policy: block
 *
 * retry:
 *   base_delay: 2s
 *   max_delay: 60s
 *   max_attempts: 5
 *
 * archive:
 *   host: "${ARCHIVE_HOST:-localhost}"
 *   port: 11111
 *   called_ae: "PACS_INTERNE"
 *
 * logging:
 *   level: info
 *   format: text
 * ```
 */

#include "aipacs/assembly/study_assembler.h"
#include "aipacs/integration/logger_adapter.h"
#include "aipacs/pipeline/retry_policy.h"
#include "aipacs/pipeline/work_queue.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace aipacs::analysis {
struct invoker_config;
}  // namespace aipacs::analysis

namespace aipacs::report {
struct builder_config;
}  // namespace aipacs::report

namespace aipacs::storage {
struct store_config;
}  // namespace aipacs::storage

namespace aipacs::transfer {
struct receiver_config;
}  // namespace aipacs::transfer

namespace aipacs::pipeline {
struct orchestrator_config;
}  // namespace aipacs::pipeline

namespace aipacs::config {

// =============================================================================
// Error Codes (-780 to -789)
// =============================================================================

/**
 * @brief Configuration error codes
 *
 * Allocated range: -780 to -789
 */
enum class config_error : int {
    /** Configuration file not found */
    file_not_found = -780,

    /** Failed to parse configuration file */
    parse_error = -781,

    /** Configuration validation failed */
    validation_error = -782,

    /** Referenced environment variable is not set */
    env_var_not_found = -783,

    /** File extension is not .yaml, .yml or .json */
    invalid_format = -784,

    /** Configuration content is empty */
    empty_config = -785,

    /** File could not be read or written */
    io_error = -786,

    /** A value could not be converted to the field's type */
    invalid_value = -787
};

[[nodiscard]] constexpr int to_error_code(config_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(config_error error) noexcept {
    switch (error) {
        case config_error::file_not_found:
            return "Configuration file not found";
        case config_error::parse_error:
            return "Failed to parse configuration file";
        case config_error::validation_error:
            return "Configuration validation failed";
        case config_error::env_var_not_found:
            return "Environment variable not found";
        case config_error::invalid_format:
            return "Invalid configuration file format";
        case config_error::empty_config:
            return "Configuration file is empty";
        case config_error::io_error:
            return "IO error reading configuration file";
        case config_error::invalid_value:
            return "Invalid value for configuration field";
        default:
            return "Unknown configuration error";
    }
}

/**
 * @brief Detailed validation error information
 */
struct validation_error_info {
    /** Path to the configuration field (e.g., "receiver.port") */
    std::string field_path;

    /** Error message describing the validation failure */
    std::string message;

    /** Actual value that failed validation (if applicable) */
    std::optional<std::string> actual_value;

    /** Expected value or constraint description */
    std::optional<std::string> expected;
};

// =============================================================================
// Sections
// =============================================================================

struct storage_section {
    std::filesystem::path database_path = "ai_pacs.db";

    /** Spool directory for received instance payloads */
    std::filesystem::path data_directory = "data/instances";

    bool enable_wal_mode = true;

    [[nodiscard]] bool is_valid() const noexcept {
        return !database_path.empty() && !data_directory.empty();
    }
};

/**
 * @brief Inbound DICOM Storage SCP settings
 */
struct receiver_section {
    std::string ae_title = "AI_PACS";
    uint16_t port = 11112;
    size_t max_associations = 20;

    /** Accepted modalities; empty accepts all */
    std::vector<std::string> accepted_modalities;

    /** Upper bound on one instance payload in bytes (0 = unlimited) */
    size_t max_payload_bytes = 0;

    [[nodiscard]] bool is_valid() const noexcept {
        if (ae_title.empty() || ae_title.size() > 16) return false;
        if (port == 0) return false;
        if (max_associations == 0) return false;
        return true;
    }
};

struct orchestrator_section {
    size_t worker_count = 2;
    size_t queue_capacity = 64;
    pipeline::overflow_policy overflow = pipeline::overflow_policy::reject;
    std::chrono::milliseconds scan_interval{1000};
    std::chrono::milliseconds lease_duration{300000};

    /** Lease owner prefix; generated when empty */
    std::string worker_id;

    /** Default length of the recent-failures list */
    size_t failure_history = 20;

    [[nodiscard]] bool is_valid() const noexcept {
        if (worker_count == 0 || queue_capacity == 0) return false;
        if (scan_interval.count() <= 0 || lease_duration.count() <= 0) return false;
        return true;
    }
};

struct analysis_section {
    std::chrono::milliseconds timeout{120000};
    double confidence_threshold = 0.8;
    std::string model_version = "1.0.0";

    /** Inference service endpoint used by the AI service engine */
    std::string service_url;

    /** Model requested from the inference service */
    std::string model_id;

    [[nodiscard]] bool is_valid() const noexcept {
        if (timeout.count() <= 0) return false;
        if (!(confidence_threshold >= 0.0 && confidence_threshold <= 1.0)) return false;
        return true;
    }
};

struct report_section {
    /** json, text, html or dicom_sr */
    std::string format = "dicom_sr";
    std::string template_version = "1.0";

    [[nodiscard]] bool is_valid() const noexcept {
        if (format != "json" && format != "text" && format != "html" &&
            format != "dicom_sr") {
            return false;
        }
        return !template_version.empty();
    }
};

/**
 * @brief Destination archive (Storage SCP) for generated reports
 */
struct archive_section {
    std::string host = "localhost";
    uint16_t port = 11111;
    std::string ae_title = "AI_PACS";
    std::string called_ae = "PACS_INTERNE";
    std::chrono::milliseconds timeout{30000};

    [[nodiscard]] bool is_valid() const noexcept {
        if (host.empty() || port == 0) return false;
        if (ae_title.empty() || ae_title.size() > 16) return false;
        if (called_ae.empty() || called_ae.size() > 16) return false;
        return timeout.count() > 0;
    }
};

struct logging_section {
    integration::log_level level = integration::log_level::info;
    integration::log_format format = integration::log_format::text;

    /** Log file path (empty = console only) */
    std::filesystem::path file;
};

// =============================================================================
// Complete Pipeline Configuration
// =============================================================================

struct pipeline_config {
    std::string name = "AI_PACS";

    storage_section storage;
    receiver_section receiver;
    assembly::assembler_config assembler;
    orchestrator_section orchestrator;
    pipeline::retry_config retry;
    analysis_section analysis;
    report_section report;
    archive_section archive;
    logging_section logging;

    /**
     * @brief Validate all sections
     * @return Empty vector if valid, otherwise list of errors
     */
    [[nodiscard]] std::vector<validation_error_info> validate() const;

    [[nodiscard]] bool is_valid() const { return validate().empty(); }

    // =========================================================================
    // Component configurations
    // =========================================================================

    [[nodiscard]] storage::store_config make_store_config() const;
    [[nodiscard]] transfer::receiver_config make_receiver_config() const;
    [[nodiscard]] pipeline::orchestrator_config make_orchestrator_config() const;
    [[nodiscard]] analysis::invoker_config make_invoker_config() const;
    [[nodiscard]] report::builder_config make_builder_config() const;
};

}  // namespace aipacs::config

#endif  // AIPACS_CONFIG_PIPELINE_CONFIG_H
