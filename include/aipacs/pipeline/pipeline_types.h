#ifndef AIPACS_PIPELINE_PIPELINE_TYPES_H
#define AIPACS_PIPELINE_PIPELINE_TYPES_H

/**
 * @file pipeline_types.h
 * @brief Persisted entities of the study-processing pipeline
 *
 * Plain value types for instances, studies, jobs, findings and reports.
 * They carry no behavior; the persistence store is the only writer.
 */

#include "aipacs/pipeline/job_state.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace aipacs::pipeline {

/** Wall-clock time used for every persisted timestamp */
using time_point = std::chrono::system_clock::time_point;

// =============================================================================
// Instance
// =============================================================================

/**
 * @brief One received image object
 *
 * Immutable once stored.
 */
struct instance_record {
    std::string instance_uid;
    std::string series_uid;
    std::string study_uid;
    std::string sop_class_uid;
    std::string modality;

    /** On-disk location of the raw payload */
    std::filesystem::path payload_path;
    std::size_t payload_size = 0;

    time_point received_at{};
};

// =============================================================================
// Study
// =============================================================================

/**
 * @brief Patient and examination attributes captured from the first instance
 */
struct study_metadata {
    std::string patient_id;
    std::string patient_name;
    std::string accession_number;
    std::string modality;
};

/**
 * @brief A clinical examination
 */
struct study_record {
    std::string study_uid;
    study_metadata metadata;
    study_state state = study_state::collecting;

    /** Distinct instance identifiers, ordered by receipt */
    std::vector<std::string> instance_uids;

    time_point created_at{};
    time_point updated_at{};
    time_point last_instance_at{};
};

// =============================================================================
// Job
// =============================================================================

/**
 * @brief One analysis attempt for a study
 */
struct job_record {
    std::string job_id;
    std::string study_uid;
    job_state state = job_state::received;

    /** Failed attempts so far, shared by the analyzing and delivering stages */
    int attempt_count = 0;

    /** Instances the study held when the job was created */
    std::size_t instance_count = 0;

    std::string last_error;

    /** Stage at which last_error occurred */
    std::optional<job_state> error_stage;

    /** Worker currently holding the job (empty when unleased) */
    std::string lease_owner;
    std::optional<time_point> lease_expires_at;
    std::int64_t lease_generation = 0;

    /** Earliest time the job may be dispatched again */
    time_point next_attempt_at{};

    time_point created_at{};
    time_point updated_at{};
    std::optional<time_point> finished_at;
};

/**
 * @brief One entry in a job's transition history
 *
 * @c from_state equals @c to_state for lease recovery and retry entries
 * that resume a stage in place; it is empty for the creation entry.
 */
struct job_event {
    std::string job_id;
    std::optional<job_state> from_state;
    job_state to_state = job_state::received;
    int attempt = 0;
    std::string detail;
    time_point at{};
};

/**
 * @brief Lease held by a worker on an in-flight job
 *
 * Every stage write is conditioned on the generation; a worker whose lease
 * was taken over by recovery gets store_error::stale_state.
 */
struct lease_token {
    std::string job_id;
    std::string owner;
    std::int64_t generation = 0;
};

// =============================================================================
// Finding
// =============================================================================

/**
 * @brief Spatial location of a finding
 *
 * Two-dimensional modalities use z = 0 and depth = 1.
 */
struct spatial_location {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    double width = 1.0;
    double height = 1.0;
    double depth = 1.0;
};

/**
 * @brief One detected abnormality
 */
struct finding {
    std::string category;

    /** Confidence in [0.0, 1.0] */
    double confidence = 0.0;

    spatial_location location;
    severity level = severity::low;
    std::string description;

    /** Named numeric measurements (e.g. "diameter_mm") */
    std::map<std::string, double> measurements;
};

// =============================================================================
// Report
// =============================================================================

/**
 * @brief Artifact generated from a job's findings
 */
struct report_record {
    std::string report_id;
    std::string job_id;
    std::string study_uid;
    std::string format;
    std::string template_version;
    std::string content_type;

    /** Serialized artifact */
    std::string payload;

    std::size_t finding_count = 0;
    delivery_state delivery = delivery_state::pending;

    /** Raw archive response of the most recent delivery attempt */
    std::string archive_response;

    std::optional<time_point> sent_at;
    time_point created_at{};
};

// =============================================================================
// Observability
// =============================================================================

/**
 * @brief Summary of a job that ended in the failed state
 */
struct failure_summary {
    std::string job_id;
    std::string study_uid;
    std::optional<job_state> failed_stage;
    int attempt_count = 0;
    std::string reason;
    time_point failed_at{};
};

/** Job counts keyed by state; every state is present */
using job_state_counts = std::map<job_state, std::size_t>;

}  // namespace aipacs::pipeline

#endif  // AIPACS_PIPELINE_PIPELINE_TYPES_H
