#ifndef AIPACS_PIPELINE_JOB_STATE_H
#define AIPACS_PIPELINE_JOB_STATE_H

/**
 * @file job_state.h
 * @brief Closed state enumerations for the study-processing pipeline
 *
 * Every persisted status field (job state, study assembly state, report
 * delivery state, finding severity) is one of the enumerations below.
 * Legal transitions are encoded in is_valid_transition(); the persistence
 * layer refuses any write that is not listed there.
 *
 * Job state machine:
 * @code
 *   received -> queued -> analyzing -> reporting -> delivering -> done
 *                 ^          |             |           |  ^
 *                 +-(retry)--+             |           +--+ (retry)
 *                            v             v           v
 *                          failed        failed      failed
 * @endcode
 */

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace aipacs::pipeline {

// =============================================================================
// Job State
// =============================================================================

/**
 * @brief State of an analysis job
 */
enum class job_state {
    /** Job row created, not yet admitted to the work queue */
    received,
    /** Admitted to the work queue, waiting for a worker */
    queued,
    /** Analysis engine invocation in progress */
    analyzing,
    /** Report generation in progress */
    reporting,
    /** Report transmission to the archive in progress */
    delivering,
    /** Terminal success */
    done,
    /** Terminal failure */
    failed
};

/** All job states in pipeline order */
inline constexpr std::array<job_state, 7> all_job_states = {
    job_state::received,  job_state::queued,     job_state::analyzing,
    job_state::reporting, job_state::delivering, job_state::done,
    job_state::failed};

/**
 * @brief Get string representation of job state
 */
[[nodiscard]] constexpr const char* to_string(job_state state) noexcept {
    switch (state) {
        case job_state::received:
            return "received";
        case job_state::queued:
            return "queued";
        case job_state::analyzing:
            return "analyzing";
        case job_state::reporting:
            return "reporting";
        case job_state::delivering:
            return "delivering";
        case job_state::done:
            return "done";
        case job_state::failed:
            return "failed";
    }
    return "unknown";
}

/**
 * @brief Parse job state from its string representation
 */
[[nodiscard]] constexpr std::optional<job_state> parse_job_state(
    std::string_view str) noexcept {
    for (auto state : all_job_states) {
        if (str == to_string(state)) {
            return state;
        }
    }
    return std::nullopt;
}

/**
 * @brief Check whether a job state is terminal (done or failed)
 */
[[nodiscard]] constexpr bool is_terminal(job_state state) noexcept {
    return state == job_state::done || state == job_state::failed;
}

/**
 * @brief Check whether a job state is held by a worker under a lease
 */
[[nodiscard]] constexpr bool is_in_flight(job_state state) noexcept {
    return state == job_state::analyzing || state == job_state::reporting ||
           state == job_state::delivering;
}

/**
 * @brief Check whether a job state transition is legal
 *
 * The switch is exhaustive over @p from; adding a state without extending
 * it is diagnosed by -Wswitch.
 */
[[nodiscard]] constexpr bool is_valid_transition(job_state from,
                                                 job_state to) noexcept {
    switch (from) {
        case job_state::received:
            return to == job_state::queued;
        case job_state::queued:
            return to == job_state::analyzing;
        case job_state::analyzing:
            return to == job_state::reporting || to == job_state::queued ||
                   to == job_state::failed;
        case job_state::reporting:
            return to == job_state::delivering || to == job_state::failed;
        case job_state::delivering:
            return to == job_state::done || to == job_state::delivering ||
                   to == job_state::failed;
        case job_state::done:
        case job_state::failed:
            return false;
    }
    return false;
}

// =============================================================================
// Study State
// =============================================================================

/**
 * @brief Assembly state of a study
 */
enum class study_state {
    /** Instances are still arriving; idle timer armed */
    collecting,
    /** Idle timeout elapsed; eligible for a job */
    ready,
    /** Job finished (done or failed) */
    closed
};

[[nodiscard]] constexpr const char* to_string(study_state state) noexcept {
    switch (state) {
        case study_state::collecting:
            return "collecting";
        case study_state::ready:
            return "ready";
        case study_state::closed:
            return "closed";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<study_state> parse_study_state(
    std::string_view str) noexcept {
    if (str == "collecting") return study_state::collecting;
    if (str == "ready") return study_state::ready;
    if (str == "closed") return study_state::closed;
    return std::nullopt;
}

/**
 * @brief Check whether a study state transition is legal
 *
 * A new instance moves a ready or closed study back to collecting.
 */
[[nodiscard]] constexpr bool is_valid_transition(study_state from,
                                                 study_state to) noexcept {
    switch (from) {
        case study_state::collecting:
            return to == study_state::ready || to == study_state::collecting;
        case study_state::ready:
            return to == study_state::closed || to == study_state::collecting;
        case study_state::closed:
            return to == study_state::collecting;
    }
    return false;
}

// =============================================================================
// Delivery State
// =============================================================================

/**
 * @brief Delivery state of a report
 */
enum class delivery_state { pending, sent, failed };

[[nodiscard]] constexpr const char* to_string(delivery_state state) noexcept {
    switch (state) {
        case delivery_state::pending:
            return "pending";
        case delivery_state::sent:
            return "sent";
        case delivery_state::failed:
            return "failed";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<delivery_state> parse_delivery_state(
    std::string_view str) noexcept {
    if (str == "pending") return delivery_state::pending;
    if (str == "sent") return delivery_state::sent;
    if (str == "failed") return delivery_state::failed;
    return std::nullopt;
}

[[nodiscard]] constexpr bool is_valid_transition(delivery_state from,
                                                 delivery_state to) noexcept {
    switch (from) {
        case delivery_state::pending:
            return to == delivery_state::sent || to == delivery_state::failed;
        case delivery_state::sent:
        case delivery_state::failed:
            return false;
    }
    return false;
}

// =============================================================================
// Finding Severity
// =============================================================================

/**
 * @brief Severity of a finding
 */
enum class severity { low, medium, high };

[[nodiscard]] constexpr const char* to_string(severity value) noexcept {
    switch (value) {
        case severity::low:
            return "low";
        case severity::medium:
            return "medium";
        case severity::high:
            return "high";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<severity> parse_severity(
    std::string_view str) noexcept {
    if (str == "low") return severity::low;
    if (str == "medium") return severity::medium;
    if (str == "high") return severity::high;
    return std::nullopt;
}

}  // namespace aipacs::pipeline

#endif  // AIPACS_PIPELINE_JOB_STATE_H
