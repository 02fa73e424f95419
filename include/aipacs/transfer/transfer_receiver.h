#ifndef AIPACS_TRANSFER_TRANSFER_RECEIVER_H
#define AIPACS_TRANSFER_TRANSFER_RECEIVER_H

/**
 * @file transfer_receiver.h
 * @brief Inbound "store instance" primitive
 *
 * Validates identifying fields, spools the payload to disk and records the
 * instance idempotently. A repeated instance identifier is accepted without
 * being stored again and without a second instance-received notification.
 *
 * The receiver is transport-agnostic; the DICOM Storage SCP binding
 * (dicom/storage_listener.h) forwards each C-STORE here.
 */

#include "aipacs/pipeline/pipeline_types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace aipacs::storage {
class pipeline_store;
}  // namespace aipacs::storage

namespace aipacs::transfer {

// =============================================================================
// Transfer Error Codes (-700 to -709)
// =============================================================================

/**
 * @brief Transfer receiver error codes
 *
 * Allocated range: -700 to -709
 */
enum class transfer_error : int {
    /** Study, series or instance identifier is missing */
    missing_identifier = -700,

    /** Identifier is not a well-formed UID */
    invalid_identifier = -701,

    /** Instance carries no payload */
    empty_payload = -702,

    /** Modality is not accepted by this receiver */
    unsupported_modality = -703,

    /** Payload could not be written to the spool directory */
    payload_write_failed = -704,

    /** Instance record could not be persisted */
    persistence_failed = -705,

    /** Receiver is not running */
    not_running = -706,

    /** Receiver is already running */
    already_running = -707,

    /** Receiver configuration is invalid */
    invalid_configuration = -708,

    /** Payload exceeds the configured size limit */
    payload_too_large = -709
};

[[nodiscard]] constexpr int to_error_code(transfer_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(transfer_error error) noexcept {
    switch (error) {
        case transfer_error::missing_identifier:
            return "Required identifier is missing";
        case transfer_error::invalid_identifier:
            return "Identifier is not a valid UID";
        case transfer_error::empty_payload:
            return "Instance payload is empty";
        case transfer_error::unsupported_modality:
            return "Modality is not accepted";
        case transfer_error::payload_write_failed:
            return "Failed to write instance payload";
        case transfer_error::persistence_failed:
            return "Failed to persist instance";
        case transfer_error::not_running:
            return "Transfer receiver is not running";
        case transfer_error::already_running:
            return "Transfer receiver is already running";
        case transfer_error::invalid_configuration:
            return "Invalid transfer receiver configuration";
        case transfer_error::payload_too_large:
            return "Instance payload exceeds size limit";
        default:
            return "Unknown transfer error";
    }
}

/**
 * @brief Whether the error is a boundary validation failure
 *
 * Validation failures are rejected before anything is persisted.
 */
[[nodiscard]] constexpr bool is_validation_error(transfer_error error) noexcept {
    return error == transfer_error::missing_identifier ||
           error == transfer_error::invalid_identifier ||
           error == transfer_error::empty_payload ||
           error == transfer_error::payload_too_large ||
           error == transfer_error::unsupported_modality;
}

// =============================================================================
// Request / Response
// =============================================================================

/**
 * @brief One inbound instance with its identifying metadata
 */
struct store_request {
    std::string study_uid;
    std::string series_uid;
    std::string instance_uid;
    std::string sop_class_uid;
    std::string modality;

    std::string patient_id;
    std::string patient_name;
    std::string accession_number;

    /** Encoded instance bytes */
    std::vector<uint8_t> payload;
};

enum class store_outcome {
    /** Newly stored */
    stored,
    /** Instance identifier already known; accepted without storing */
    duplicate
};

[[nodiscard]] constexpr const char* to_string(store_outcome outcome) noexcept {
    switch (outcome) {
        case store_outcome::stored:
            return "stored";
        case store_outcome::duplicate:
            return "duplicate";
        default:
            return "unknown";
    }
}

struct store_response {
    store_outcome outcome = store_outcome::stored;
    pipeline::instance_record instance;
};

// =============================================================================
// Configuration
// =============================================================================

/**
 * @brief Transfer receiver configuration
 */
struct receiver_config {
    /** Spool directory; payloads go to <dir>/<study>/<series>/<instance>.dcm */
    std::filesystem::path data_directory = "data/instances";

    /** Accepted modalities; empty accepts all */
    std::vector<std::string> accepted_modalities;

    /** Upper bound on a single payload (0 = unlimited) */
    std::size_t max_payload_bytes = 0;

    [[nodiscard]] bool is_valid() const noexcept {
        return !data_directory.empty();
    }
};

/**
 * @brief Check a DICOM UID: 1-64 chars of digits and dots, no empty
 *        component, no leading zero in a multi-digit component
 */
[[nodiscard]] bool is_valid_uid(std::string_view uid) noexcept;

// =============================================================================
// Transfer Receiver
// =============================================================================

/**
 * @brief Validates, spools and records inbound instances
 *
 * Thread-safe. Concurrent stores of the same instance identifier are
 * serialized; exactly one of them reports store_outcome::stored.
 */
class transfer_receiver {
public:
    /** Called once per newly stored instance, outside internal locks */
    using instance_received_callback =
        std::function<void(const pipeline::instance_record&)>;

    struct statistics {
        size_t requests = 0;
        size_t stored = 0;
        size_t duplicates = 0;
        size_t rejected = 0;
        size_t failures = 0;
        size_t bytes_stored = 0;
    };

    transfer_receiver(const receiver_config& config, storage::pipeline_store& store);
    ~transfer_receiver();

    transfer_receiver(const transfer_receiver&) = delete;
    transfer_receiver& operator=(const transfer_receiver&) = delete;

    /**
     * @brief Prepare the spool directory and accept requests
     */
    [[nodiscard]] std::expected<void, transfer_error> start();

    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    /**
     * @brief Store one instance
     *
     * @return store_outcome::stored for a new instance,
     *         store_outcome::duplicate for a known instance identifier,
     *         or the rejection reason
     */
    [[nodiscard]] std::expected<store_response, transfer_error> store_instance(
        const store_request& request);

    /**
     * @brief Validate identifying fields without storing
     */
    [[nodiscard]] std::expected<void, transfer_error> validate(
        const store_request& request) const;

    void set_instance_received_callback(instance_received_callback callback);

    [[nodiscard]] statistics get_statistics() const;

    [[nodiscard]] const receiver_config& config() const noexcept;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

}  // namespace aipacs::transfer

#endif  // AIPACS_TRANSFER_TRANSFER_RECEIVER_H
