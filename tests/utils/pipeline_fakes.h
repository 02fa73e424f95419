/**
 * @file pipeline_fakes.h
 * @brief Mocks and sample data builders shared by pipeline tests
 */

#ifndef AIPACS_TEST_PIPELINE_FAKES_H
#define AIPACS_TEST_PIPELINE_FAKES_H

#include <gmock/gmock.h>

#include "aipacs/analysis/analysis_engine.h"
#include "aipacs/delivery/archive_client.h"
#include "aipacs/pipeline/pipeline_types.h"
#include "aipacs/report/report_builder.h"
#include "aipacs/transfer/transfer_receiver.h"

#include "utils/test_helpers.h"

#include <chrono>
#include <string>
#include <vector>

namespace aipacs::test {

// =============================================================================
// Mock Collaborators
// =============================================================================

class mock_analysis_engine : public analysis::analysis_engine {
public:
    MOCK_METHOD((std::expected<std::vector<analysis::raw_finding>,
                               analysis::engine_failure>),
                analyze,
                (const analysis::analysis_input& input,
                 std::chrono::milliseconds timeout),
                (override));
    MOCK_METHOD(std::string, name, (), (const, override));
};

class mock_archive_client : public delivery::archive_client {
public:
    MOCK_METHOD(delivery::archive_response, store_report,
                (const delivery::outbound_report& report), (override));
    MOCK_METHOD(std::string, name, (), (const, override));
};

/**
 * @brief Template that always fails to render
 */
class failing_template : public report::report_template {
public:
    explicit failing_template(std::string format) : format_(std::move(format)) {}

    std::string format() const override { return format_; }

    std::string content_type() const override { return "application/octet-stream"; }

    std::expected<std::string, report::report_failure> render(
        const report::report_context&) const override {
        return std::unexpected(report::report_failure{
            report::report_error::template_error, "renderer crashed"});
    }

private:
    std::string format_;
};

// =============================================================================
// Sample Builders
// =============================================================================

inline pipeline::instance_record make_instance(
    int n, std::string_view study_uid = samples::STUDY_UID,
    std::string_view modality = "CT") {
    pipeline::instance_record instance;
    instance.instance_uid = std::string(study_uid) + ".1." + std::to_string(n);
    instance.series_uid = std::string(study_uid) + ".1";
    instance.study_uid = std::string(study_uid);
    instance.sop_class_uid = std::string(samples::CT_IMAGE_STORAGE);
    instance.modality = std::string(modality);
    instance.payload_path = "/spool/" + instance.instance_uid + ".dcm";
    instance.payload_size = 1024;
    instance.received_at = std::chrono::system_clock::now();
    return instance;
}

inline pipeline::study_metadata make_metadata(std::string_view modality = "CT") {
    pipeline::study_metadata metadata;
    metadata.patient_id = std::string(samples::PATIENT_ID);
    metadata.patient_name = std::string(samples::PATIENT_NAME);
    metadata.accession_number = std::string(samples::ACCESSION);
    metadata.modality = std::string(modality);
    return metadata;
}

inline transfer::store_request make_store_request(
    int n, std::string_view study_uid = samples::STUDY_UID,
    std::string_view modality = "CT") {
    transfer::store_request request;
    request.study_uid = std::string(study_uid);
    request.series_uid = std::string(study_uid) + ".1";
    request.instance_uid = std::string(study_uid) + ".1." + std::to_string(n);
    request.sop_class_uid = std::string(samples::CT_IMAGE_STORAGE);
    request.modality = std::string(modality);
    request.patient_id = std::string(samples::PATIENT_ID);
    request.patient_name = std::string(samples::PATIENT_NAME);
    request.accession_number = std::string(samples::ACCESSION);
    request.payload = std::vector<uint8_t>(256, static_cast<uint8_t>(n));
    return request;
}

inline analysis::raw_finding make_raw_finding(std::string category,
                                              double confidence) {
    analysis::raw_finding raw;
    raw.category = std::move(category);
    raw.confidence = confidence;
    raw.x = 10.0;
    raw.y = 20.0;
    raw.width = 5.0;
    raw.height = 5.0;
    raw.description = "Detected " + raw.category;
    return raw;
}

inline pipeline::finding make_finding(std::string category, double confidence,
                                      pipeline::severity level = pipeline::severity::medium) {
    pipeline::finding item;
    item.category = std::move(category);
    item.confidence = confidence;
    item.location = {12.0, 34.0, 2.0, 8.0, 8.0, 3.0};
    item.level = level;
    item.description = "Detected " + item.category;
    item.measurements["diameter_mm"] = 7.5;
    return item;
}

inline delivery::archive_response accepted_response() {
    return {delivery::transport_status::ok, 0x0000, "stored"};
}

}  // namespace aipacs::test

#endif  // AIPACS_TEST_PIPELINE_FAKES_H
