/**
 * @file storage_archive_client.cpp
 * @brief Implementation of C-STORE report delivery
 */

#include "aipacs/dicom/storage_archive_client.h"
#include "aipacs/integration/logger_adapter.h"
#include "aipacs/report/report_builder.h"

#include <pacs/core/dicom_dataset.hpp>
#include <pacs/core/dicom_tag.hpp>
#include <pacs/core/dicom_tag_constants.hpp>
#include <pacs/core/result.hpp>
#include <pacs/encoding/transfer_syntax.hpp>
#include <pacs/encoding/vr_type.hpp>
#include <pacs/network/association.hpp>
#include <pacs/services/storage_scu.hpp>

#include <format>
#include <functional>

namespace aipacs::dicom {

namespace tags = pacs::core::tags;
using pacs::encoding::vr_type;

namespace {

constexpr const char* UID_ROOT = "1.2.826.0.1.3680043.2.1545.7";

// SR document attributes without named constants in pacs_system
constexpr pacs::core::dicom_tag VALUE_TYPE{0x0040, 0xA040};
constexpr pacs::core::dicom_tag COMPLETION_FLAG{0x0040, 0xA491};
constexpr pacs::core::dicom_tag VERIFICATION_FLAG{0x0040, 0xA493};
constexpr pacs::core::dicom_tag TEXT_VALUE{0x0040, 0xA160};

delivery::transport_status classify_connect_error(int code) {
    namespace codes = pacs::error_codes;
    if (code == codes::association_rejected || code == codes::no_acceptable_context ||
        code == codes::negotiation_failed) {
        return delivery::transport_status::association_refused;
    }
    if (code == codes::connection_timeout || code == codes::receive_timeout) {
        return delivery::transport_status::timed_out;
    }
    return delivery::transport_status::unreachable;
}

}  // namespace

std::string derive_uid(const std::string& seed) {
    return std::format("{}.1.{}", UID_ROOT, std::hash<std::string>{}(seed));
}

pacs::core::dicom_dataset make_report_dataset(const delivery::outbound_report& report) {
    pacs::core::dicom_dataset ds;

    ds.set_string(tags::sop_class_uid, vr_type::UI, report::BASIC_TEXT_SR_SOP_CLASS);
    ds.set_string(tags::sop_instance_uid, vr_type::UI, derive_uid(report.report_id));
    ds.set_string(tags::study_instance_uid, vr_type::UI, report.study_uid);
    ds.set_string(tags::series_instance_uid, vr_type::UI,
                  derive_uid(report.report_id + "/series"));
    ds.set_string(tags::modality, vr_type::CS, "SR");
    ds.set_string(tags::series_number, vr_type::IS, std::to_string(REPORT_SERIES_NUMBER));
    ds.set_string(tags::instance_number, vr_type::IS, "1");
    ds.set_string(tags::series_description, vr_type::LO, "AI Radiology Report");

    ds.set_string(tags::patient_id, vr_type::LO, report.patient_id);
    ds.set_string(tags::patient_name, vr_type::PN, report.patient_name);
    ds.set_string(tags::accession_number, vr_type::SH, report.accession_number);

    ds.set_string(VALUE_TYPE, vr_type::CS, "CONTAINER");
    ds.set_string(COMPLETION_FLAG, vr_type::CS, "COMPLETE");
    ds.set_string(VERIFICATION_FLAG, vr_type::CS, "UNVERIFIED");
    ds.set_string(TEXT_VALUE, vr_type::UT, report.payload);
    return ds;
}

// =============================================================================
// storage_archive_client
// =============================================================================

storage_archive_client::storage_archive_client(const archive_client_config& config)
    : config_(config) {}

delivery::archive_response storage_archive_client::store_report(
    const delivery::outbound_report& report) {
    delivery::archive_response response;

    pacs::network::association_config assoc_config;
    assoc_config.calling_ae_title = config_.calling_ae;
    assoc_config.called_ae_title = config_.called_ae;
    assoc_config.implementation_class_uid = UID_ROOT;
    assoc_config.implementation_version_name = "AI_PACS_100";
    assoc_config.proposed_contexts.push_back(
        {1, std::string(report::BASIC_TEXT_SR_SOP_CLASS),
         {std::string(pacs::encoding::transfer_syntax::explicit_vr_little_endian.uid()),
          std::string(pacs::encoding::transfer_syntax::implicit_vr_little_endian.uid())}});

    auto connected = pacs::network::association::connect(config_.host, config_.port,
                                                         assoc_config, config_.timeout);
    if (connected.is_err()) {
        response.transport = classify_connect_error(connected.error().code);
        response.response_text = connected.error().message;
        integration::get_logger().warning(std::format(
            "report={} association to {}:{} failed: {}", report.report_id,
            config_.host, config_.port, connected.error().message));
        return response;
    }

    auto& assoc = connected.value();

    pacs::services::storage_scu_config scu_config;
    scu_config.response_timeout = config_.timeout;
    pacs::services::storage_scu scu{scu_config};

    auto stored = scu.store(assoc, make_report_dataset(report));
    if (stored.is_err()) {
        response.transport = stored.error().code == pacs::error_codes::receive_timeout
                                 ? delivery::transport_status::timed_out
                                 : delivery::transport_status::unreachable;
        response.response_text = stored.error().message;
        assoc.abort();
        return response;
    }

    response.status_code = stored.value().status;
    response.response_text = stored.value().error_comment;

    auto released = assoc.release(config_.timeout);
    if (released.is_err()) {
        integration::get_logger().debug(std::format(
            "report={} association release failed: {}", report.report_id,
            released.error().message));
    }
    return response;
}

std::string storage_archive_client::name() const {
    return std::format("{}@{}:{}", config_.called_ae, config_.host, config_.port);
}

}  // namespace aipacs::dicom
