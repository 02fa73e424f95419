#ifndef AIPACS_ASSEMBLY_STUDY_ASSEMBLER_H
#define AIPACS_ASSEMBLY_STUDY_ASSEMBLER_H

/**
 * @file study_assembler.h
 * @brief Groups instances into studies and detects study completion
 *
 * The inbound protocol never announces the last instance of a study, so a
 * study is considered complete after an idle period with no new instance.
 * Each instance-received event refreshes the study's last-instance time and
 * re-arms its idle deadline. When a deadline passes, the study moves
 * collecting -> ready and the ready callback fires.
 *
 * Deadlines are kept in memory on the steady clock; recover() rebuilds them
 * from persisted last-instance times after a restart.
 */

#include "aipacs/pipeline/pipeline_types.h"

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <string>

namespace aipacs::storage {
class pipeline_store;
}  // namespace aipacs::storage

namespace aipacs::assembly {

// =============================================================================
// Assembly Error Codes (-720 to -729)
// =============================================================================

/**
 * @brief Study assembler error codes
 *
 * Allocated range: -720 to -729
 */
enum class assembly_error : int {
    /** Assembler timer is already running */
    already_running = -720,

    /** Assembler timer is not running */
    not_running = -721,

    /** Configuration is invalid */
    invalid_configuration = -722,

    /** Study is not known to the store */
    study_not_found = -723,

    /** Study record could not be updated */
    persistence_failed = -724
};

[[nodiscard]] constexpr int to_error_code(assembly_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(assembly_error error) noexcept {
    switch (error) {
        case assembly_error::already_running:
            return "Study assembler is already running";
        case assembly_error::not_running:
            return "Study assembler is not running";
        case assembly_error::invalid_configuration:
            return "Invalid study assembler configuration";
        case assembly_error::study_not_found:
            return "Study not found";
        case assembly_error::persistence_failed:
            return "Failed to update study record";
        default:
            return "Unknown assembly error";
    }
}

// =============================================================================
// Configuration
// =============================================================================

struct assembler_config {
    /** Quiet period after the last instance before a study is ready */
    std::chrono::milliseconds idle_timeout{30000};

    /** Timer thread wake-up interval */
    std::chrono::milliseconds timer_resolution{100};

    [[nodiscard]] bool is_valid() const noexcept {
        return idle_timeout.count() > 0 && timer_resolution.count() > 0;
    }
};

// =============================================================================
// Study Assembler
// =============================================================================

class study_assembler {
public:
    using clock = std::chrono::steady_clock;

    /** Source of the current steady time; injectable for tests */
    using clock_source = std::function<clock::time_point()>;

    /** Called with the study UID after collecting -> ready */
    using study_ready_callback = std::function<void(const std::string&)>;

    struct statistics {
        size_t instances_seen = 0;
        size_t studies_ready = 0;
        size_t studies_reopened = 0;
        size_t persistence_failures = 0;
    };

    study_assembler(const assembler_config& config, storage::pipeline_store& store,
                    clock_source now = {});
    ~study_assembler();

    study_assembler(const study_assembler&) = delete;
    study_assembler& operator=(const study_assembler&) = delete;

    /**
     * @brief Start the background idle timer
     */
    [[nodiscard]] std::expected<void, assembly_error> start();

    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    /**
     * @brief Record a newly stored instance and re-arm the study's deadline
     *
     * A ready or closed study returns to collecting.
     */
    [[nodiscard]] std::expected<void, assembly_error> on_instance_received(
        const pipeline::instance_record& instance);

    /**
     * @brief Promote every study whose deadline is at or before @p now
     * @return Number of studies moved to ready
     */
    size_t process_due(clock::time_point now);

    /**
     * @brief Rebuild deadlines from persisted state
     *
     * Collecting studies get the remainder of their idle window; studies with
     * instances recorded after their last assembly update are touched first.
     *
     * @return Number of studies armed
     */
    size_t recover();

    /**
     * @brief Studies with an armed deadline
     */
    [[nodiscard]] size_t pending_count() const;

    void set_study_ready_callback(study_ready_callback callback);

    [[nodiscard]] statistics get_statistics() const;

    [[nodiscard]] const assembler_config& config() const noexcept;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

}  // namespace aipacs::assembly

#endif  // AIPACS_ASSEMBLY_STUDY_ASSEMBLER_H
