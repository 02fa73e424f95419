#ifndef AIPACS_PIPELINE_SERVER_H
#define AIPACS_PIPELINE_SERVER_H

/**
 * @file pipeline_server.h
 * @brief Top-level server wiring the study-processing pipeline
 *
 * Owns every pipeline component and connects them:
 *
 *   storage listener -> transfer receiver -> study assembler
 *        -> orchestrator -> analysis invoker / report builder / delivery sender
 *
 * Features:
 *   - Single entrypoint to start/stop the whole pipeline
 *   - Configuration via pipeline_config or YAML/JSON file
 *   - Recovery of persisted studies and jobs on start
 *   - Status endpoints and aggregated statistics
 *   - SIGINT/SIGTERM driven shutdown
 */

#include "aipacs/config/pipeline_config.h"
#include "aipacs/monitoring/status_server.h"

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <string_view>

namespace aipacs::analysis {
class analysis_engine;
}  // namespace aipacs::analysis

namespace aipacs::delivery {
class archive_client;
}  // namespace aipacs::delivery

namespace aipacs::storage {
class pipeline_store;
}  // namespace aipacs::storage

namespace aipacs::transfer {
class transfer_receiver;
}  // namespace aipacs::transfer

namespace aipacs::assembly {
class study_assembler;
}  // namespace aipacs::assembly

namespace aipacs::pipeline {
class pipeline_orchestrator;
}  // namespace aipacs::pipeline

namespace aipacs {

// =============================================================================
// Error Codes (-790 to -799)
// =============================================================================

/**
 * @brief Pipeline server error codes
 *
 * Allocated range: -790 to -799
 */
enum class server_error : int {
    /** Server is already running */
    already_running = -790,

    /** Server is not running */
    not_running = -791,

    /** Invalid server configuration */
    invalid_configuration = -792,

    /** Failed to load configuration file */
    config_load_failed = -793,

    /** Failed to open the persistence store */
    store_init_failed = -794,

    /** Failed to start the transfer receiver */
    receiver_init_failed = -795,

    /** Failed to start the study assembler */
    assembler_init_failed = -796,

    /** Failed to start the orchestrator */
    orchestrator_init_failed = -797,

    /** Failed to start the DICOM storage listener */
    listener_init_failed = -798,

    /** No analysis engine or archive client is available */
    missing_collaborator = -799
};

[[nodiscard]] constexpr int to_error_code(server_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(server_error error) noexcept {
    switch (error) {
        case server_error::already_running:
            return "Server is already running";
        case server_error::not_running:
            return "Server is not running";
        case server_error::invalid_configuration:
            return "Invalid server configuration";
        case server_error::config_load_failed:
            return "Failed to load configuration file";
        case server_error::store_init_failed:
            return "Failed to open persistence store";
        case server_error::receiver_init_failed:
            return "Failed to start transfer receiver";
        case server_error::assembler_init_failed:
            return "Failed to start study assembler";
        case server_error::orchestrator_init_failed:
            return "Failed to start orchestrator";
        case server_error::listener_init_failed:
            return "Failed to start DICOM storage listener";
        case server_error::missing_collaborator:
            return "Analysis engine or archive client unavailable";
        default:
            return "Unknown server error";
    }
}

// =============================================================================
// Statistics
// =============================================================================

/**
 * @brief Aggregated server statistics
 */
struct pipeline_statistics {
    // =========================================================================
    // Intake
    // =========================================================================

    size_t instances_received = 0;
    size_t instances_duplicate = 0;
    size_t instances_rejected = 0;
    size_t studies_ready = 0;
    size_t studies_reopened = 0;

    // =========================================================================
    // Jobs
    // =========================================================================

    size_t jobs_created = 0;
    size_t jobs_done = 0;
    size_t jobs_failed = 0;
    size_t retries_scheduled = 0;
    size_t leases_recovered = 0;
    size_t invariant_violations = 0;

    /** Jobs waiting in the work queue */
    size_t queue_depth = 0;

    // =========================================================================
    // Delivery
    // =========================================================================

    size_t deliveries_attempted = 0;
    size_t deliveries_accepted = 0;

    // =========================================================================
    // Timing
    // =========================================================================

    std::chrono::seconds uptime{0};
};

// =============================================================================
// Pipeline Server
// =============================================================================

/**
 * @brief AI PACS pipeline server
 *
 * @example Basic Usage
 * ```cpp
 * pipeline_server server("/etc/ai_pacs/config.yaml");
 *
 * auto result = server.start();
 * if (!result) {
 *     std::cerr << "Failed to start: " << to_string(result.error()) << std::endl;
 *     return 1;
 * }
 *
 * server.wait_for_shutdown();
 * server.stop();
 * ```
 *
 * @example Embedded With Custom Collaborators
 * ```cpp
 * pipeline_server server(config, my_engine, my_archive);
 * server.start();
 * auto request = ...;
 * server.receiver().store_instance(request);
 * ```
 */
class pipeline_server {
public:
    /**
     * @brief Construct with a configuration object
     *
     * When @p engine or @p archive is null, the pacs_system-backed
     * implementation is created on start() if available.
     *
     * @throws std::invalid_argument if config is invalid
     */
    explicit pipeline_server(const config::pipeline_config& config,
                             std::shared_ptr<analysis::analysis_engine> engine = nullptr,
                             std::shared_ptr<delivery::archive_client> archive = nullptr);

    /**
     * @brief Construct from a YAML or JSON configuration file
     *
     * @throws std::runtime_error if the file cannot be loaded or parsed
     */
    explicit pipeline_server(const std::filesystem::path& config_path);

    ~pipeline_server();

    pipeline_server(const pipeline_server&) = delete;
    pipeline_server& operator=(const pipeline_server&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Start all components
     *
     * Order: persistence store, transfer receiver, study assembler (with
     * recovery), orchestrator (with recovery), status server, DICOM
     * listener. A failure stops whatever already started.
     */
    [[nodiscard]] std::expected<void, server_error> start();

    /**
     * @brief Stop all components in reverse start order
     */
    void stop();

    /**
     * @brief Block until SIGINT/SIGTERM or stop()
     */
    void wait_for_shutdown();

    [[nodiscard]] bool is_running() const noexcept;

    /**
     * @brief Re-read the configuration file and apply the logging level
     *
     * Every other setting requires a restart.
     */
    [[nodiscard]] std::expected<void, server_error> reload_config(
        const std::filesystem::path& config_path);

    // =========================================================================
    // Monitoring
    // =========================================================================

    [[nodiscard]] pipeline_statistics get_statistics() const;

    /**
     * @brief Answer a status endpoint request
     *
     * Returns 503 while the server is stopped.
     */
    [[nodiscard]] monitoring::http_response handle_status_request(
        std::string_view target) const;

    // =========================================================================
    // Components
    // =========================================================================

    [[nodiscard]] storage::pipeline_store& store();
    [[nodiscard]] transfer::transfer_receiver& receiver();
    [[nodiscard]] assembly::study_assembler& assembler();

    /**
     * @brief Orchestrator of the current run; nullptr while stopped
     */
    [[nodiscard]] pipeline::pipeline_orchestrator* orchestrator();

    [[nodiscard]] const config::pipeline_config& config() const noexcept;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

}  // namespace aipacs

#endif  // AIPACS_PIPELINE_SERVER_H
