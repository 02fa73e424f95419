#ifndef AIPACS_DELIVERY_ARCHIVE_CLIENT_H
#define AIPACS_DELIVERY_ARCHIVE_CLIENT_H

/**
 * @file archive_client.h
 * @brief Outbound "store report" primitive
 *
 * Mirrors the inbound store primitive in the opposite direction: a report
 * payload tagged with its target study goes to the archive, which answers
 * with a status code and opaque response text.
 */

#include <cstdint>
#include <string>

namespace aipacs::delivery {

/**
 * @brief Outcome of the transport before any archive status exists
 */
enum class transport_status {
    ok,
    unreachable,
    association_refused,
    timed_out
};

[[nodiscard]] constexpr const char* to_string(transport_status status) noexcept {
    switch (status) {
        case transport_status::ok:
            return "ok";
        case transport_status::unreachable:
            return "unreachable";
        case transport_status::association_refused:
            return "association_refused";
        case transport_status::timed_out:
            return "timed_out";
        default:
            return "unknown";
    }
}

/**
 * @brief Report ready for transmission
 */
struct outbound_report {
    std::string report_id;
    std::string job_id;
    std::string study_uid;

    std::string patient_id;
    std::string patient_name;
    std::string accession_number;

    std::string format;
    std::string content_type;
    std::string payload;
};

/**
 * @brief Archive answer; status_code is meaningful only when transport is ok
 */
struct archive_response {
    transport_status transport = transport_status::ok;
    uint16_t status_code = 0x0000;
    std::string response_text;
};

/**
 * @brief Connection to the receiving archive
 */
class archive_client {
public:
    virtual ~archive_client() = default;

    [[nodiscard]] virtual archive_response store_report(
        const outbound_report& report) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

}  // namespace aipacs::delivery

#endif  // AIPACS_DELIVERY_ARCHIVE_CLIENT_H
