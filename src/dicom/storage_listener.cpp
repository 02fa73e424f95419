/**
 * @file storage_listener.cpp
 * @brief Implementation of the DICOM Storage SCP front end
 */

#include "aipacs/dicom/storage_listener.h"
#include "aipacs/integration/logger_adapter.h"

#include <pacs/core/dicom_dataset.hpp>
#include <pacs/core/dicom_file.hpp>
#include <pacs/core/dicom_tag_constants.hpp>
#include <pacs/encoding/transfer_syntax.hpp>
#include <pacs/network/dicom_server.hpp>
#include <pacs/network/server_config.hpp>
#include <pacs/services/storage_scp.hpp>
#include <pacs/services/storage_status.hpp>

#include <atomic>
#include <format>
#include <mutex>

namespace aipacs::dicom {

namespace tags = pacs::core::tags;
using pacs::services::storage_status;

namespace {

constexpr const char* IMPLEMENTATION_CLASS_UID = "1.2.826.0.1.3680043.2.1545.7";
constexpr const char* IMPLEMENTATION_VERSION_NAME = "AI_PACS_100";

}  // namespace

// =============================================================================
// Conversions
// =============================================================================

storage_status to_storage_status(
    const std::expected<transfer::store_response, transfer::transfer_error>& result) {
    if (result) {
        return storage_status::success;
    }
    if (transfer::is_validation_error(result.error())) {
        return storage_status::data_set_does_not_match_sop_class;
    }
    return storage_status::out_of_resources;
}

transfer::store_request make_store_request(const pacs::core::dicom_dataset& dataset,
                                           const std::string& sop_class_uid,
                                           const std::string& sop_instance_uid) {
    transfer::store_request request;
    request.study_uid = dataset.get_string(tags::study_instance_uid, "");
    request.series_uid = dataset.get_string(tags::series_instance_uid, "");
    request.instance_uid = sop_instance_uid.empty()
                               ? dataset.get_string(tags::sop_instance_uid, "")
                               : sop_instance_uid;
    request.sop_class_uid = sop_class_uid;
    request.modality = dataset.get_string(tags::modality, "");
    request.patient_id = dataset.get_string(tags::patient_id, "");
    request.patient_name = dataset.get_string(tags::patient_name, "");
    request.accession_number = dataset.get_string(tags::accession_number, "");

    auto file = pacs::core::dicom_file::create(
        dataset, pacs::encoding::transfer_syntax::explicit_vr_little_endian);
    request.payload = file.to_bytes();
    return request;
}

// =============================================================================
// Implementation
// =============================================================================

class storage_listener::impl {
public:
    impl(const listener_config& config, transfer::transfer_receiver& receiver)
        : config_(config), receiver_(receiver) {}

    ~impl() { stop(); }

    std::expected<void, listener_error> start() {
        if (running_) {
            return std::unexpected(listener_error::already_running);
        }
        if (!config_.is_valid()) {
            return std::unexpected(listener_error::invalid_configuration);
        }

        pacs::network::server_config server_cfg;
        server_cfg.ae_title = config_.ae_title;
        server_cfg.port = config_.port;
        server_cfg.max_associations = config_.max_associations;
        server_cfg.idle_timeout = config_.idle_timeout;
        server_cfg.implementation_class_uid = IMPLEMENTATION_CLASS_UID;
        server_cfg.implementation_version_name = IMPLEMENTATION_VERSION_NAME;

        server_ = std::make_unique<pacs::network::dicom_server>(server_cfg);

        pacs::services::storage_scp_config scp_config;
        scp_config.accepted_sop_classes = config_.accepted_sop_classes;
        // Idempotency is decided by the transfer receiver.
        scp_config.duplicate_policy = pacs::services::duplicate_policy::replace;

        auto scp = std::make_shared<pacs::services::storage_scp>(scp_config);
        scp->set_pre_store_handler([](const pacs::core::dicom_dataset& dataset) {
            return dataset.contains(tags::study_instance_uid) &&
                   dataset.contains(tags::series_instance_uid) &&
                   dataset.contains(tags::sop_instance_uid);
        });
        scp->set_handler([this](const pacs::core::dicom_dataset& dataset,
                                const std::string& calling_ae,
                                const std::string& sop_class_uid,
                                const std::string& sop_instance_uid) {
            return handle_store(dataset, calling_ae, sop_class_uid, sop_instance_uid);
        });
        server_->register_service(scp);

        server_->on_association_established(
            [this](const pacs::network::association& assoc) {
                count([](statistics& s) { ++s.associations; });
                integration::get_logger().debug(std::format(
                    "association established calling_ae={}", assoc.calling_ae()));
            });
        server_->on_error([](const std::string& error) {
            integration::get_logger().error(
                std::format("dicom server error: {}", error));
        });

        auto result = server_->start();
        if (result.is_err()) {
            integration::get_logger().error(std::format(
                "storage listener failed to start on port {}: {}", config_.port,
                result.error().message));
            server_.reset();
            return std::unexpected(listener_error::server_start_failed);
        }

        running_ = true;
        integration::get_logger().info(std::format(
            "storage listener started ae={} port={}", config_.ae_title, config_.port));
        return {};
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }
        if (server_) {
            server_->stop();
            server_.reset();
        }
        integration::get_logger().info("storage listener stopped");
    }

    storage_status handle_store(const pacs::core::dicom_dataset& dataset,
                                const std::string& calling_ae,
                                const std::string& sop_class_uid,
                                const std::string& sop_instance_uid) {
        count([](statistics& s) { ++s.requests; });

        if (sink_ && sink_(dataset)) {
            count([](statistics& s) { ++s.results_routed; });
            integration::get_logger().info(std::format(
                "ai result routed instance={} calling_ae={}", sop_instance_uid,
                calling_ae));
            return storage_status::success;
        }

        auto request = make_store_request(dataset, sop_class_uid, sop_instance_uid);
        auto result = receiver_.store_instance(request);
        auto status = to_storage_status(result);

        if (result) {
            count([](statistics& s) { ++s.accepted; });
        } else if (transfer::is_validation_error(result.error())) {
            count([](statistics& s) { ++s.rejected; });
            integration::get_logger().warning(std::format(
                "c-store rejected instance={} calling_ae={}: {}", sop_instance_uid,
                calling_ae, transfer::to_string(result.error())));
        } else {
            count([](statistics& s) { ++s.failures; });
            integration::get_logger().error(std::format(
                "c-store failed instance={} calling_ae={}: {}", sop_instance_uid,
                calling_ae, transfer::to_string(result.error())));
        }
        return status;
    }

    template <typename F>
    void count(F&& update) {
        std::lock_guard lock(stats_mutex_);
        update(stats_);
    }

    listener_config config_;
    transfer::transfer_receiver& receiver_;
    result_sink sink_;

    std::unique_ptr<pacs::network::dicom_server> server_;
    std::atomic<bool> running_{false};

    mutable std::mutex stats_mutex_;
    statistics stats_;
};

// =============================================================================
// Public Interface
// =============================================================================

storage_listener::storage_listener(const listener_config& config,
                                   transfer::transfer_receiver& receiver)
    : pimpl_(std::make_unique<impl>(config, receiver)) {}

storage_listener::~storage_listener() = default;

std::expected<void, listener_error> storage_listener::start() {
    return pimpl_->start();
}

void storage_listener::stop() {
    pimpl_->stop();
}

bool storage_listener::is_running() const noexcept {
    return pimpl_->running_;
}

void storage_listener::set_result_sink(result_sink sink) {
    pimpl_->sink_ = std::move(sink);
}

storage_listener::statistics storage_listener::get_statistics() const {
    std::lock_guard lock(pimpl_->stats_mutex_);
    return pimpl_->stats_;
}

const listener_config& storage_listener::config() const noexcept {
    return pimpl_->config_;
}

}  // namespace aipacs::dicom
