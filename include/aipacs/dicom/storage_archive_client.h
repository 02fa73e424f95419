#ifndef AIPACS_DICOM_STORAGE_ARCHIVE_CLIENT_H
#define AIPACS_DICOM_STORAGE_ARCHIVE_CLIENT_H

/**
 * @file storage_archive_client.h
 * @brief Archive client that delivers reports by DICOM C-STORE
 *
 * Each report travels as a Basic Text SR in a new series (SeriesNumber 9999,
 * Modality SR) of the source study. One association per report. The SR
 * instance and series UIDs are derived from the report id, so a redelivered
 * report replaces rather than duplicates the earlier copy.
 *
 * Requires pacs_system.
 */

#include "aipacs/delivery/archive_client.h"

#include <chrono>
#include <cstdint>
#include <string>

namespace pacs::core {
class dicom_dataset;
}  // namespace pacs::core

namespace aipacs::dicom {

struct archive_client_config {
    std::string host = "localhost";
    uint16_t port = 11111;

    /** Our AE title */
    std::string calling_ae = "AI_PACS";

    /** Archive AE title */
    std::string called_ae = "PACS_INTERNE";

    /** Association and DIMSE response timeout */
    std::chrono::milliseconds timeout{30000};
};

/** Series number of generated report series */
inline constexpr int REPORT_SERIES_NUMBER = 9999;

/**
 * @brief Build the Basic Text SR dataset carrying @p report
 */
[[nodiscard]] pacs::core::dicom_dataset make_report_dataset(
    const delivery::outbound_report& report);

/**
 * @brief Deterministic UID below the implementation root
 */
[[nodiscard]] std::string derive_uid(const std::string& seed);

class storage_archive_client : public delivery::archive_client {
public:
    explicit storage_archive_client(const archive_client_config& config);

    [[nodiscard]] delivery::archive_response store_report(
        const delivery::outbound_report& report) override;

    [[nodiscard]] std::string name() const override;

private:
    archive_client_config config_;
};

}  // namespace aipacs::dicom

#endif  // AIPACS_DICOM_STORAGE_ARCHIVE_CLIENT_H
