#ifndef AIPACS_DELIVERY_DELIVERY_SENDER_H
#define AIPACS_DELIVERY_DELIVERY_SENDER_H

/**
 * @file delivery_sender.h
 * @brief Sends reports to the archive and classifies the answer
 *
 * Status codes are read the way DICOM C-STORE statuses are:
 *   - 0x0000 and 0xBxxx (warning)         accepted
 *   - 0xA7xx (out of resources / busy)    retryable
 *   - 0xA9xx, 0xCxxx, anything else       permanent rejection
 * Transport failures and refused associations are retryable.
 *
 * The sender never retries by itself; the orchestrator owns that decision.
 */

#include "aipacs/delivery/archive_client.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>

namespace aipacs::delivery {

// =============================================================================
// Delivery Error Codes (-760 to -769)
// =============================================================================

/**
 * @brief Delivery error codes
 *
 * Allocated range: -760 to -769
 */
enum class delivery_error : int {
    /** Archive unreachable or connection lost */
    transport_error = -760,

    /** Archive reported it is busy or out of resources */
    archive_busy = -761,

    /** Archive refused the association */
    association_refused = -762,

    /** Archive rejected the report permanently */
    permanent_rejection = -763,

    /** Report has no payload to send */
    missing_payload = -764
};

[[nodiscard]] constexpr int to_error_code(delivery_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(delivery_error error) noexcept {
    switch (error) {
        case delivery_error::transport_error:
            return "Transport error";
        case delivery_error::archive_busy:
            return "Archive busy";
        case delivery_error::association_refused:
            return "Association refused";
        case delivery_error::permanent_rejection:
            return "Archive rejected report";
        case delivery_error::missing_payload:
            return "Report payload missing";
        default:
            return "Unknown delivery error";
    }
}

[[nodiscard]] constexpr bool is_retryable(delivery_error error) noexcept {
    return error == delivery_error::transport_error ||
           error == delivery_error::archive_busy ||
           error == delivery_error::association_refused;
}

/**
 * @brief Classification of an archive status code
 */
enum class status_class {
    success,
    retryable,
    permanent
};

[[nodiscard]] constexpr status_class classify_status(uint16_t status) noexcept {
    if (status == 0x0000 || (status & 0xF000) == 0xB000) {
        return status_class::success;
    }
    if ((status & 0xFF00) == 0xA700) {
        return status_class::retryable;
    }
    return status_class::permanent;
}

/**
 * @brief Audit text of a response, stored verbatim on the report
 */
[[nodiscard]] std::string describe_response(const archive_response& response);

struct delivery_receipt {
    uint16_t status_code = 0x0000;
    std::string response_text;

    /** describe_response() of the archive's answer */
    std::string audit_text;
    std::chrono::milliseconds duration{0};
};

struct delivery_failure {
    delivery_error code = delivery_error::transport_error;
    std::string message;

    /** describe_response() of the archive's answer, if one arrived */
    std::string audit_text;
};

// =============================================================================
// Delivery Sender
// =============================================================================

class delivery_sender {
public:
    struct statistics {
        size_t attempts = 0;
        size_t accepted = 0;
        size_t retryable_failures = 0;
        size_t permanent_failures = 0;
    };

    explicit delivery_sender(std::shared_ptr<archive_client> client);
    ~delivery_sender();

    delivery_sender(const delivery_sender&) = delete;
    delivery_sender& operator=(const delivery_sender&) = delete;

    /**
     * @brief Transmit one report
     */
    [[nodiscard]] std::expected<delivery_receipt, delivery_failure> send(
        const outbound_report& report);

    [[nodiscard]] statistics get_statistics() const;

    [[nodiscard]] std::string client_name() const;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

}  // namespace aipacs::delivery

#endif  // AIPACS_DELIVERY_DELIVERY_SENDER_H
