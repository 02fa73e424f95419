#ifndef AIPACS_DICOM_STORAGE_LISTENER_H
#define AIPACS_DICOM_STORAGE_LISTENER_H

/**
 * @file storage_listener.h
 * @brief DICOM Storage SCP front end of the transfer receiver
 *
 * Accepts C-STORE requests on the configured AE title and port, encodes
 * each dataset as a Part 10 payload and forwards it to
 * transfer::transfer_receiver. The receiver's answer is mapped back to a
 * C-STORE status:
 *
 *   stored / duplicate          -> 0x0000 Success
 *   boundary validation failure -> 0xA900 Data set does not match SOP class
 *   spool or persistence error  -> 0xA700 Out of resources
 *
 * Datasets claimed by the result sink (AI result objects for a pending
 * inference request) bypass the pipeline.
 *
 * Requires pacs_system.
 */

#include "aipacs/transfer/transfer_receiver.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace pacs::core {
class dicom_dataset;
}  // namespace pacs::core

namespace pacs::services {
enum class storage_status : uint16_t;
}  // namespace pacs::services

namespace aipacs::dicom {

// =============================================================================
// Listener Error Codes (-800 to -809)
// =============================================================================

/**
 * @brief Storage listener error codes
 *
 * Allocated range: -800 to -809
 */
enum class listener_error : int {
    /** Listener is already running */
    already_running = -800,

    /** Listener is not running */
    not_running = -801,

    /** Configuration is invalid */
    invalid_configuration = -802,

    /** DICOM server failed to bind or start */
    server_start_failed = -803
};

[[nodiscard]] constexpr int to_error_code(listener_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(listener_error error) noexcept {
    switch (error) {
        case listener_error::already_running:
            return "Storage listener is already running";
        case listener_error::not_running:
            return "Storage listener is not running";
        case listener_error::invalid_configuration:
            return "Invalid storage listener configuration";
        case listener_error::server_start_failed:
            return "Failed to start DICOM server";
        default:
            return "Unknown storage listener error";
    }
}

struct listener_config {
    std::string ae_title = "AI_PACS";
    uint16_t port = 11112;
    size_t max_associations = 20;
    std::chrono::seconds idle_timeout{300};

    /** Accepted SOP classes; empty accepts all standard storage classes */
    std::vector<std::string> accepted_sop_classes;

    [[nodiscard]] bool is_valid() const noexcept {
        if (ae_title.empty() || ae_title.size() > 16) return false;
        return port != 0 && max_associations != 0;
    }
};

/**
 * @brief Map a receiver result to a C-STORE status
 */
[[nodiscard]] pacs::services::storage_status to_storage_status(
    const std::expected<transfer::store_response, transfer::transfer_error>& result);

/**
 * @brief Build a store request from a received dataset
 */
[[nodiscard]] transfer::store_request make_store_request(
    const pacs::core::dicom_dataset& dataset, const std::string& sop_class_uid,
    const std::string& sop_instance_uid);

class storage_listener {
public:
    /** Returns true when the dataset was consumed outside the pipeline */
    using result_sink = std::function<bool(const pacs::core::dicom_dataset&)>;

    struct statistics {
        size_t associations = 0;
        size_t requests = 0;
        size_t accepted = 0;
        size_t rejected = 0;
        size_t failures = 0;
        size_t results_routed = 0;
    };

    storage_listener(const listener_config& config,
                     transfer::transfer_receiver& receiver);
    ~storage_listener();

    storage_listener(const storage_listener&) = delete;
    storage_listener& operator=(const storage_listener&) = delete;

    [[nodiscard]] std::expected<void, listener_error> start();

    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    /**
     * @brief Route datasets to @p sink before the pipeline sees them
     *
     * Set before start().
     */
    void set_result_sink(result_sink sink);

    [[nodiscard]] statistics get_statistics() const;

    [[nodiscard]] const listener_config& config() const noexcept;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

}  // namespace aipacs::dicom

#endif  // AIPACS_DICOM_STORAGE_LISTENER_H
