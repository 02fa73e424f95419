/**
 * @file pipeline_config.cpp
 * @brief Pipeline configuration validation and component mapping
 */

#include "aipacs/config/pipeline_config.h"

#include "aipacs/analysis/analysis_invoker.h"
#include "aipacs/pipeline/orchestrator.h"
#include "aipacs/report/report_builder.h"
#include "aipacs/storage/pipeline_store.h"
#include "aipacs/transfer/transfer_receiver.h"

#include <format>

namespace aipacs::config {

std::vector<validation_error_info> pipeline_config::validate() const {
    std::vector<validation_error_info> errors;

    if (name.empty()) {
        errors.push_back({.field_path = "name",
                          .message = "Server name cannot be empty",
                          .actual_value = std::nullopt,
                          .expected = "Non-empty string"});
    }

    // Storage
    if (storage.database_path.empty()) {
        errors.push_back({.field_path = "storage.database_path",
                          .message = "Database path cannot be empty",
                          .actual_value = std::nullopt,
                          .expected = "File path or :memory:"});
    }
    if (storage.data_directory.empty()) {
        errors.push_back({.field_path = "storage.data_directory",
                          .message = "Data directory cannot be empty",
                          .actual_value = std::nullopt,
                          .expected = "Directory path"});
    }

    // Receiver
    if (receiver.ae_title.empty() || receiver.ae_title.size() > 16) {
        errors.push_back({.field_path = "receiver.ae_title",
                          .message = "AE title must be 1-16 characters",
                          .actual_value = receiver.ae_title,
                          .expected = "1-16 characters"});
    }
    if (receiver.port == 0) {
        errors.push_back({.field_path = "receiver.port",
                          .message = "Receiver port must be > 0",
                          .actual_value = "0",
                          .expected = "1-65535"});
    }
    if (receiver.max_associations == 0) {
        errors.push_back({.field_path = "receiver.max_associations",
                          .message = "Maximum associations must be > 0",
                          .actual_value = "0",
                          .expected = "Positive integer"});
    }

    // Assembler
    if (assembler.idle_timeout.count() <= 0) {
        errors.push_back({.field_path = "assembler.idle_timeout",
                          .message = "Idle timeout must be positive",
                          .actual_value = std::format("{}ms", assembler.idle_timeout.count()),
                          .expected = "Duration > 0"});
    }
    if (assembler.timer_resolution.count() <= 0) {
        errors.push_back({.field_path = "assembler.timer_resolution",
                          .message = "Timer resolution must be positive",
                          .actual_value =
                              std::format("{}ms", assembler.timer_resolution.count()),
                          .expected = "Duration > 0"});
    }

    // Orchestrator
    if (orchestrator.worker_count == 0) {
        errors.push_back({.field_path = "orchestrator.worker_count",
                          .message = "Worker count must be > 0",
                          .actual_value = "0",
                          .expected = "Positive integer"});
    }
    if (orchestrator.queue_capacity == 0) {
        errors.push_back({.field_path = "orchestrator.queue_capacity",
                          .message = "Queue capacity must be > 0",
                          .actual_value = "0",
                          .expected = "Positive integer"});
    }
    if (orchestrator.scan_interval.count() <= 0) {
        errors.push_back({.field_path = "orchestrator.scan_interval",
                          .message = "Scan interval must be positive",
                          .actual_value = std::nullopt,
                          .expected = "Duration > 0"});
    }
    if (orchestrator.lease_duration.count() <= 0) {
        errors.push_back({.field_path = "orchestrator.lease_duration",
                          .message = "Lease duration must be positive",
                          .actual_value = std::nullopt,
                          .expected = "Duration > 0"});
    }

    // Retry
    if (!retry.is_valid()) {
        if (retry.base_delay.count() <= 0) {
            errors.push_back({.field_path = "retry.base_delay",
                              .message = "Base delay must be positive",
                              .actual_value = std::format("{}ms", retry.base_delay.count()),
                              .expected = "Duration > 0"});
        }
        if (retry.max_delay < retry.base_delay) {
            errors.push_back({.field_path = "retry.max_delay",
                              .message = "Maximum delay must not be below base delay",
                              .actual_value = std::format("{}ms", retry.max_delay.count()),
                              .expected = std::format(">= {}ms", retry.base_delay.count())});
        }
        if (retry.multiplier <= 1.0) {
            errors.push_back({.field_path = "retry.multiplier",
                              .message = "Multiplier must be > 1",
                              .actual_value = std::format("{}", retry.multiplier),
                              .expected = "> 1.0"});
        }
        if (retry.max_attempts <= 0) {
            errors.push_back({.field_path = "retry.max_attempts",
                              .message = "Maximum attempts must be > 0",
                              .actual_value = std::to_string(retry.max_attempts),
                              .expected = "Positive integer"});
        }
        if (retry.jitter_ratio < 0.0 || retry.jitter_ratio >= retry.multiplier - 1.0) {
            errors.push_back({.field_path = "retry.jitter_ratio",
                              .message = "Jitter ratio must be in [0, multiplier - 1)",
                              .actual_value = std::format("{}", retry.jitter_ratio),
                              .expected = "0.0 <= ratio < multiplier - 1"});
        }
    }

    // Analysis
    if (analysis.timeout.count() <= 0) {
        errors.push_back({.field_path = "analysis.timeout",
                          .message = "Analysis timeout must be positive",
                          .actual_value = std::nullopt,
                          .expected = "Duration > 0"});
    }
    if (!(analysis.confidence_threshold >= 0.0 && analysis.confidence_threshold <= 1.0)) {
        errors.push_back({.field_path = "analysis.confidence_threshold",
                          .message = "Confidence threshold must be in [0, 1]",
                          .actual_value = std::format("{}", analysis.confidence_threshold),
                          .expected = "0.0-1.0"});
    }

    // Report
    if (!report.is_valid()) {
        errors.push_back({.field_path = "report.format",
                          .message = "Unsupported report format",
                          .actual_value = report.format,
                          .expected = "json, text, html or dicom_sr"});
    }

    // Archive
    if (archive.host.empty()) {
        errors.push_back({.field_path = "archive.host",
                          .message = "Archive host cannot be empty",
                          .actual_value = std::nullopt,
                          .expected = "Hostname or IP address"});
    }
    if (archive.port == 0) {
        errors.push_back({.field_path = "archive.port",
                          .message = "Archive port must be > 0",
                          .actual_value = "0",
                          .expected = "1-65535"});
    }
    if (archive.called_ae.empty() || archive.called_ae.size() > 16) {
        errors.push_back({.field_path = "archive.called_ae",
                          .message = "Called AE title must be 1-16 characters",
                          .actual_value = archive.called_ae,
                          .expected = "1-16 characters"});
    }
    if (archive.ae_title.empty() || archive.ae_title.size() > 16) {
        errors.push_back({.field_path = "archive.ae_title",
                          .message = "Calling AE title must be 1-16 characters",
                          .actual_value = archive.ae_title,
                          .expected = "1-16 characters"});
    }
    if (archive.timeout.count() <= 0) {
        errors.push_back({.field_path = "archive.timeout",
                          .message = "Archive timeout must be positive",
                          .actual_value = std::nullopt,
                          .expected = "Duration > 0"});
    }

    return errors;
}

storage::store_config pipeline_config::make_store_config() const {
    storage::store_config config;
    config.database_path = storage.database_path;
    config.enable_wal_mode = storage.enable_wal_mode;
    return config;
}

transfer::receiver_config pipeline_config::make_receiver_config() const {
    transfer::receiver_config config;
    config.data_directory = storage.data_directory;
    config.accepted_modalities = receiver.accepted_modalities;
    config.max_payload_bytes = receiver.max_payload_bytes;
    return config;
}

pipeline::orchestrator_config pipeline_config::make_orchestrator_config() const {
    return pipeline::orchestrator_config_builder::create()
        .workers(orchestrator.worker_count)
        .queue_capacity(orchestrator.queue_capacity)
        .overflow(orchestrator.overflow)
        .scan_interval(orchestrator.scan_interval)
        .lease_duration(orchestrator.lease_duration)
        .worker_id(orchestrator.worker_id)
        .retry(retry)
        .report_format(report.format)
        .failure_history(orchestrator.failure_history)
        .build();
}

analysis::invoker_config pipeline_config::make_invoker_config() const {
    analysis::invoker_config config;
    config.timeout = analysis.timeout;
    config.confidence_threshold = analysis.confidence_threshold;
    config.model_version = analysis.model_version;
    return config;
}

report::builder_config pipeline_config::make_builder_config() const {
    report::builder_config config;
    config.default_format = report.format;
    config.template_version = report.template_version;
    return config;
}

}  // namespace aipacs::config
