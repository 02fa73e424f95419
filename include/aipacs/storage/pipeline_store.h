#ifndef AIPACS_STORAGE_PIPELINE_STORE_H
#define AIPACS_STORAGE_PIPELINE_STORE_H

/**
 * @file pipeline_store.h
 * @brief Durable record of studies, instances, jobs, findings and reports
 *
 * SQLite-backed persistence for the study-processing pipeline. Features:
 *   - Idempotent instance insertion
 *   - At most one non-terminal job per study, enforced by a partial unique
 *     index and a conditional insert
 *   - Every job transition is a single conditional write together with a
 *     history row, so a restart resumes from the exact persisted stage
 *   - Lease columns for worker ownership and stale-job recovery
 *   - Observability queries (status, counts by state, recent failures)
 *
 * All timestamps are stored as UTC text ("YYYY-MM-DD HH:MM:SS.mmm") so that
 * lexical and chronological order agree.
 */

#include "aipacs/pipeline/pipeline_types.h"

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aipacs::storage {

using pipeline::finding;
using pipeline::instance_record;
using pipeline::job_event;
using pipeline::job_record;
using pipeline::job_state;
using pipeline::lease_token;
using pipeline::report_record;
using pipeline::study_metadata;
using pipeline::study_record;
using pipeline::study_state;
using pipeline::time_point;

// =============================================================================
// Store Error Codes (-710 to -719)
// =============================================================================

/**
 * @brief Persistence store error codes
 *
 * Allocated range: -710 to -719
 */
enum class store_error : int {
    /** SQLite operation failed */
    database_error = -710,

    /** Requested record does not exist */
    not_found = -711,

    /** Study already has a non-terminal job */
    active_job_exists = -712,

    /** Requested state change is not a legal transition */
    invalid_transition = -713,

    /** Conditional write matched no row (state or lease changed) */
    stale_state = -714,

    /** Store has not been opened */
    not_open = -715,

    /** Transaction could not be committed */
    transaction_error = -716,

    /** Store is already open */
    already_open = -717,

    /** Argument failed validation */
    invalid_argument = -718,

    /** Report already exists for the job */
    duplicate_report = -719
};

[[nodiscard]] constexpr int to_error_code(store_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(store_error error) noexcept {
    switch (error) {
        case store_error::database_error:
            return "Database operation failed";
        case store_error::not_found:
            return "Record not found";
        case store_error::active_job_exists:
            return "Study already has an active job";
        case store_error::invalid_transition:
            return "Invalid state transition";
        case store_error::stale_state:
            return "Record state changed concurrently";
        case store_error::not_open:
            return "Store is not open";
        case store_error::transaction_error:
            return "Transaction failed";
        case store_error::already_open:
            return "Store is already open";
        case store_error::invalid_argument:
            return "Invalid argument";
        case store_error::duplicate_report:
            return "Report already exists for job";
        default:
            return "Unknown store error";
    }
}

// =============================================================================
// Configuration
// =============================================================================

/**
 * @brief Persistence store configuration
 */
struct store_config {
    /** SQLite database path (":memory:" is accepted) */
    std::filesystem::path database_path = "ai_pacs.db";

    /** Enable WAL journal mode */
    bool enable_wal_mode = true;

    /** SQLite busy timeout */
    std::chrono::milliseconds busy_timeout{5000};

    [[nodiscard]] bool is_valid() const noexcept {
        if (database_path.empty()) return false;
        if (busy_timeout.count() < 0) return false;
        return true;
    }
};

// =============================================================================
// Result Types
// =============================================================================

/**
 * @brief Outcome of inserting an instance
 */
enum class insert_outcome {
    /** New instance stored */
    inserted,
    /** Instance identifier already present; nothing written */
    duplicate
};

/**
 * @brief Outcome of moving a job to a terminal state
 */
struct finish_outcome {
    /** Study transitioned ready -> closed in the same transaction */
    bool study_closed = false;

    /** Study state after the write */
    study_state study = study_state::closed;
};

/**
 * @brief Job eligible for dispatch
 */
struct dispatch_candidate {
    std::string job_id;
    std::string study_uid;
    job_state state = job_state::received;

    /** True when an in-flight job's previous lease has expired */
    bool lease_expired = false;
};

// =============================================================================
// Pipeline Store
// =============================================================================

/**
 * @brief SQLite persistence for pipeline entities
 *
 * Thread-safe. All writes are serialized on one connection; reads share
 * the connection under a shared lock.
 *
 * @example
 * ```cpp
 * pipeline_store store(store_config{.database_path = "/var/lib/ai_pacs/db"});
 * if (auto r = store.open(); !r) {
 *     // handle error
 * }
 * auto job = store.create_job("1.2.3");
 * ```
 */
class pipeline_store {
public:
    explicit pipeline_store(const store_config& config = {});
    ~pipeline_store();

    pipeline_store(const pipeline_store&) = delete;
    pipeline_store& operator=(const pipeline_store&) = delete;
    pipeline_store(pipeline_store&&) noexcept;
    pipeline_store& operator=(pipeline_store&&) noexcept;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Open the database and create the schema
     */
    [[nodiscard]] std::expected<void, store_error> open();

    void close();

    [[nodiscard]] bool is_open() const noexcept;

    [[nodiscard]] const store_config& config() const noexcept;

    // =========================================================================
    // Instances
    // =========================================================================

    /**
     * @brief Store an instance idempotently
     *
     * Creates the owning study in @c collecting state with @p metadata if it
     * does not exist yet. A second insertion of the same instance identifier
     * writes nothing and returns insert_outcome::duplicate.
     */
    [[nodiscard]] std::expected<insert_outcome, store_error> insert_instance(
        const instance_record& instance, const study_metadata& metadata);

    [[nodiscard]] std::optional<instance_record> get_instance(
        std::string_view instance_uid) const;

    /**
     * @brief Instances of a study ordered by series then receipt time
     */
    [[nodiscard]] std::vector<instance_record> get_study_instances(
        std::string_view study_uid) const;

    // =========================================================================
    // Studies
    // =========================================================================

    /**
     * @brief Record a new instance arrival for a study
     *
     * Refreshes last_instance_at and moves a ready or closed study back to
     * collecting.
     *
     * @return State of the study before the write
     */
    [[nodiscard]] std::expected<study_state, store_error> touch_study(
        std::string_view study_uid, time_point received_at);

    /**
     * @brief Conditionally change a study's assembly state
     *
     * @return store_error::stale_state if the study is not in @p from
     */
    [[nodiscard]] std::expected<void, store_error> transition_study(
        std::string_view study_uid, study_state from, study_state to);

    [[nodiscard]] std::optional<study_record> get_study(
        std::string_view study_uid) const;

    [[nodiscard]] std::vector<study_record> get_studies_in_state(
        study_state state) const;

    /**
     * @brief Studies holding instances newer than their last_instance_at
     *
     * Non-empty only after a crash between instance storage and assembly.
     */
    [[nodiscard]] std::vector<std::string> get_studies_with_unassembled_instances()
        const;

    /**
     * @brief Ready studies that have no non-terminal job
     */
    [[nodiscard]] std::vector<std::string> get_ready_studies_without_job() const;

    // =========================================================================
    // Jobs
    // =========================================================================

    /**
     * @brief Create a job for a study in @c received state
     *
     * Atomic conditional insert: succeeds only if the study has no
     * non-terminal job. The study's instances at this moment become the
     * job's input set (see get_job_instances()).
     *
     * @return store_error::active_job_exists if one already exists
     */
    [[nodiscard]] std::expected<job_record, store_error> create_job(
        std::string_view study_uid);

    [[nodiscard]] std::optional<job_record> get_job(std::string_view job_id) const;

    [[nodiscard]] std::optional<job_record> get_active_job(
        std::string_view study_uid) const;

    [[nodiscard]] std::vector<job_record> get_jobs_for_study(
        std::string_view study_uid) const;

    [[nodiscard]] std::vector<job_event> get_job_history(
        std::string_view job_id) const;

    /**
     * @brief Instances the job was created with, in series/receipt order
     *
     * Instances stored after create_job() belong to the next job.
     */
    [[nodiscard]] std::vector<instance_record> get_job_instances(
        std::string_view job_id) const;

    /**
     * @brief Move a job from received to queued
     */
    [[nodiscard]] std::expected<void, store_error> admit_job(
        std::string_view job_id);

    /**
     * @brief Claim a job for a worker
     *
     * A queued job whose retry time has come moves to analyzing. An
     * in-flight job whose lease is free or expired keeps its state and is
     * re-leased. Either way the lease generation is incremented.
     *
     * @return The claimed job, or store_error::stale_state if it is not
     *         claimable (already claimed, not yet due, or terminal)
     */
    [[nodiscard]] std::expected<job_record, store_error> claim_job(
        std::string_view job_id, std::string_view owner,
        std::chrono::milliseconds lease_duration);

    /**
     * @brief Extend the current lease
     */
    [[nodiscard]] std::expected<void, store_error> renew_lease(
        const lease_token& lease, std::chrono::milliseconds lease_duration);

    /**
     * @brief Persist findings and move analyzing -> reporting atomically
     */
    [[nodiscard]] std::expected<void, store_error> complete_analysis(
        const lease_token& lease, const std::vector<finding>& findings,
        std::chrono::milliseconds lease_duration);

    [[nodiscard]] std::vector<finding> get_findings(std::string_view job_id) const;

    /**
     * @brief Persist a report and move reporting -> delivering atomically
     *
     * An empty report_id is derived from the job id (job-X -> rpt-X).
     */
    [[nodiscard]] std::expected<void, store_error> complete_report(
        const lease_token& lease, const report_record& report,
        std::chrono::milliseconds lease_duration);

    /**
     * @brief Record the archive's raw response for the job's report
     */
    [[nodiscard]] std::expected<void, store_error> record_delivery_response(
        std::string_view report_id, std::string_view response);

    /**
     * @brief Move delivering -> done, mark the report sent, close the study
     */
    [[nodiscard]] std::expected<finish_outcome, store_error> complete_job(
        const lease_token& lease, std::string_view archive_response);

    /**
     * @brief Release the lease and schedule another attempt
     *
     * @param from Current state (analyzing or delivering)
     * @param to   Target state (queued or delivering)
     */
    [[nodiscard]] std::expected<void, store_error> schedule_retry(
        const lease_token& lease, job_state from, job_state to,
        int attempt_count, std::string_view error, time_point next_attempt_at);

    /**
     * @brief Move an in-flight job to failed
     *
     * Marks a pending report failed and closes the study in the same
     * transaction.
     */
    [[nodiscard]] std::expected<finish_outcome, store_error> fail_job(
        const lease_token& lease, job_state from, int attempt_count,
        std::string_view error);

    /**
     * @brief Jobs that a dispatcher may hand to workers now
     *
     * Includes received jobs, due queued jobs and due in-flight jobs whose
     * lease is free or expired.
     */
    [[nodiscard]] std::vector<dispatch_candidate> get_dispatchable_jobs(
        time_point now, std::size_t limit) const;

    // =========================================================================
    // Reports
    // =========================================================================

    [[nodiscard]] std::optional<report_record> get_report_for_job(
        std::string_view job_id) const;

    // =========================================================================
    // Observability
    // =========================================================================

    [[nodiscard]] pipeline::job_state_counts count_jobs_by_state() const;

    /**
     * @brief Most recent failed jobs, newest first
     */
    [[nodiscard]] std::vector<pipeline::failure_summary> get_recent_failures(
        std::size_t limit) const;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

}  // namespace aipacs::storage

#endif  // AIPACS_STORAGE_PIPELINE_STORE_H
