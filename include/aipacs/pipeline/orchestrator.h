#ifndef AIPACS_PIPELINE_ORCHESTRATOR_H
#define AIPACS_PIPELINE_ORCHESTRATOR_H

/**
 * @file orchestrator.h
 * @brief Drives each study's job through the pipeline state machine
 *
 *   received -> queued -> analyzing -> reporting -> delivering -> done
 *                  ^          |            |            |  ^
 *                  +--retry---+            |            +--+ retry
 *                             +------------+------------+--> failed
 *
 * A dispatcher thread admits received jobs into a bounded work queue and
 * re-offers jobs whose retry time has come or whose lease expired. Workers
 * claim a job (a single conditional write on its lease generation) before
 * touching it, and renew the lease while an engine or archive call runs.
 * A worker whose stage write fails on a stale lease stops at once and
 * leaves the job to its new owner. Every stage result is persisted together
 * with the next state; after a crash a job resumes at the start of the
 * stage it was in.
 *
 * Only the orchestrator decides between retry and failure. Analysis and
 * delivery failures that are transient are retried with exponential
 * backoff; the attempt counter is shared by both stages. Reporting
 * failures are never retried.
 */

#include "aipacs/pipeline/pipeline_types.h"
#include "aipacs/pipeline/retry_policy.h"
#include "aipacs/pipeline/work_queue.h"

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aipacs::storage {
class pipeline_store;
}  // namespace aipacs::storage

namespace aipacs::analysis {
class analysis_invoker;
}  // namespace aipacs::analysis

namespace aipacs::report {
class report_builder;
}  // namespace aipacs::report

namespace aipacs::delivery {
class delivery_sender;
}  // namespace aipacs::delivery

namespace aipacs::pipeline {

// =============================================================================
// Orchestrator Error Codes (-770 to -779)
// =============================================================================

/**
 * @brief Orchestrator error codes
 *
 * Allocated range: -770 to -779
 */
enum class orchestrator_error : int {
    /** A second active job was requested for a study; request dropped */
    invariant_violation = -770,

    /** Orchestrator is not running */
    not_running = -771,

    /** Orchestrator is already running */
    already_running = -772,

    /** Study does not exist */
    study_not_found = -773,

    /** Study is not in ready state */
    study_not_ready = -774,

    /** Job does not exist */
    job_not_found = -775,

    /** Configuration is invalid */
    invalid_configuration = -776,

    /** Persistence store rejected a write */
    persistence_failed = -777,

    /** Job is terminal, not yet due, or leased by another worker */
    job_not_claimable = -778,

    /** Lease was taken over by another worker while a stage ran */
    lease_lost = -779
};

[[nodiscard]] constexpr int to_error_code(orchestrator_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(orchestrator_error error) noexcept {
    switch (error) {
        case orchestrator_error::invariant_violation:
            return "Study already has an active job";
        case orchestrator_error::not_running:
            return "Orchestrator is not running";
        case orchestrator_error::already_running:
            return "Orchestrator is already running";
        case orchestrator_error::study_not_found:
            return "Study not found";
        case orchestrator_error::study_not_ready:
            return "Study is not ready";
        case orchestrator_error::job_not_found:
            return "Job not found";
        case orchestrator_error::invalid_configuration:
            return "Invalid orchestrator configuration";
        case orchestrator_error::persistence_failed:
            return "Persistence failure";
        case orchestrator_error::job_not_claimable:
            return "Job cannot be claimed";
        case orchestrator_error::lease_lost:
            return "Job lease was taken over";
        default:
            return "Unknown orchestrator error";
    }
}

// =============================================================================
// Configuration
// =============================================================================

struct orchestrator_config {
    /** Concurrent jobs in analyzing/reporting/delivering */
    size_t worker_count = 2;

    /** Work queue capacity */
    size_t queue_capacity = 64;

    /** Behavior when the work queue is full */
    overflow_policy overflow = overflow_policy::reject;

    /** Dispatcher scan period for due retries and expired leases */
    std::chrono::milliseconds scan_interval{1000};

    /** Lease held by a worker on a claimed job */
    std::chrono::milliseconds lease_duration{300000};

    /** Lease owner prefix; generated when empty */
    std::string worker_id;

    retry_config retry;

    /** Report format tag */
    std::string report_format = "dicom_sr";

    /** Default length of the recent-failures list */
    size_t failure_history = 20;

    [[nodiscard]] bool is_valid() const noexcept {
        if (worker_count == 0) return false;
        if (queue_capacity == 0) return false;
        if (scan_interval.count() <= 0) return false;
        if (lease_duration.count() <= 0) return false;
        if (report_format.empty()) return false;
        return retry.is_valid();
    }
};

/**
 * @brief Fluent builder for orchestrator_config
 */
class orchestrator_config_builder {
public:
    [[nodiscard]] static orchestrator_config_builder create() { return {}; }

    orchestrator_config_builder& workers(size_t count) {
        config_.worker_count = count;
        return *this;
    }

    orchestrator_config_builder& queue_capacity(size_t capacity) {
        config_.queue_capacity = capacity;
        return *this;
    }

    orchestrator_config_builder& overflow(overflow_policy policy) {
        config_.overflow = policy;
        return *this;
    }

    orchestrator_config_builder& scan_interval(std::chrono::milliseconds interval) {
        config_.scan_interval = interval;
        return *this;
    }

    orchestrator_config_builder& lease_duration(std::chrono::milliseconds duration) {
        config_.lease_duration = duration;
        return *this;
    }

    orchestrator_config_builder& worker_id(std::string id) {
        config_.worker_id = std::move(id);
        return *this;
    }

    orchestrator_config_builder& retry(const retry_config& retry) {
        config_.retry = retry;
        return *this;
    }

    orchestrator_config_builder& report_format(std::string format) {
        config_.report_format = std::move(format);
        return *this;
    }

    orchestrator_config_builder& failure_history(size_t count) {
        config_.failure_history = count;
        return *this;
    }

    [[nodiscard]] orchestrator_config build() const { return config_; }

private:
    orchestrator_config config_;
};

// =============================================================================
// Status Types
// =============================================================================

struct job_status {
    job_record job;
    std::vector<job_event> history;
    std::size_t finding_count = 0;
    std::optional<report_record> report;
};

struct study_status {
    study_record study;
    std::optional<job_record> active_job;
    std::vector<job_record> jobs;
};

// =============================================================================
// Pipeline Orchestrator
// =============================================================================

class pipeline_orchestrator {
public:
    /** Called after a job reaches done or failed */
    using job_finished_callback = std::function<void(const job_record&)>;

    struct statistics {
        size_t jobs_created = 0;
        size_t invariant_violations = 0;
        size_t jobs_done = 0;
        size_t jobs_failed = 0;
        size_t retries_scheduled = 0;
        size_t leases_recovered = 0;
        size_t queue_rejections = 0;
        size_t stage_conflicts = 0;
    };

    pipeline_orchestrator(const orchestrator_config& config,
                          storage::pipeline_store& store,
                          analysis::analysis_invoker& invoker,
                          report::report_builder& builder,
                          delivery::delivery_sender& sender,
                          retry_policy::random_source rng = {});
    ~pipeline_orchestrator();

    pipeline_orchestrator(const pipeline_orchestrator&) = delete;
    pipeline_orchestrator& operator=(const pipeline_orchestrator&) = delete;

    /**
     * @brief Recover persisted work and start dispatcher and workers
     *
     * Ready studies without a job get one; jobs left in any non-terminal
     * state are picked up by the dispatcher.
     */
    [[nodiscard]] std::expected<void, orchestrator_error> start();

    /**
     * @brief Stop dispatching and join workers
     *
     * Jobs in flight finish their current stage; their state stays
     * persisted for the next start.
     */
    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    /**
     * @brief Create a job for a ready study
     *
     * @return orchestrator_error::invariant_violation (logged) if the study
     *         already has a non-terminal job
     */
    [[nodiscard]] std::expected<job_record, orchestrator_error> request_job(
        std::string_view study_uid);

    /**
     * @brief Study-ready hook for the assembler; failures are logged
     */
    void on_study_ready(const std::string& study_uid);

    /**
     * @brief Admit and claim a job, then run it on the calling thread
     *
     * Runs until the job is terminal or a retry is scheduled.
     *
     * @return State of the job when this call returns, or
     *         orchestrator_error::lease_lost if another worker took the job
     *         over; later stages are then left to the new owner
     */
    [[nodiscard]] std::expected<job_state, orchestrator_error> process_job(
        std::string_view job_id);

    /**
     * @brief Offer due jobs to the work queue once
     * @return Number of jobs pushed
     */
    size_t dispatch_due_jobs();

    // =========================================================================
    // Observability
    // =========================================================================

    [[nodiscard]] std::expected<job_status, orchestrator_error> get_job_status(
        std::string_view job_id) const;

    [[nodiscard]] std::expected<study_status, orchestrator_error> get_study_status(
        std::string_view study_uid) const;

    [[nodiscard]] job_state_counts job_counts() const;

    [[nodiscard]] std::vector<failure_summary> recent_failures(
        std::optional<size_t> limit = std::nullopt) const;

    [[nodiscard]] size_t queue_depth() const;

    [[nodiscard]] statistics get_statistics() const;

    void set_job_finished_callback(job_finished_callback callback);

    [[nodiscard]] const orchestrator_config& config() const noexcept;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

}  // namespace aipacs::pipeline

#endif  // AIPACS_PIPELINE_ORCHESTRATOR_H
