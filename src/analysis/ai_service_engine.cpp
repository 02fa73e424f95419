/**
 * @file ai_service_engine.cpp
 * @brief Implementation of the inference-service analysis engine
 */

#include "aipacs/analysis/ai_service_engine.h"
#include "aipacs/integration/logger_adapter.h"

#include <pacs/ai/ai_result_handler.hpp>
#include <pacs/ai/ai_service_connector.hpp>
#include <pacs/core/dicom_dataset.hpp>
#include <pacs/core/dicom_tag_constants.hpp>
#include <pacs/storage/file_storage.hpp>
#include <pacs/storage/index_database.hpp>

#include <format>
#include <mutex>
#include <set>

namespace aipacs::analysis {

namespace tags = pacs::core::tags;

namespace {

constexpr std::string_view SR_SOP_CLASS_PREFIX = "1.2.840.10008.5.1.4.1.1.88.";

raw_finding to_raw_finding(const pacs::ai::cad_finding& cad) {
    raw_finding raw;
    raw.category = cad.finding_type;
    raw.confidence = cad.confidence.value_or(0.0);
    raw.description = cad.location;
    if (cad.measurement) {
        raw.description += raw.description.empty() ? *cad.measurement
                                                   : " (" + *cad.measurement + ")";
    }
    return raw;
}

}  // namespace

// =============================================================================
// Implementation
// =============================================================================

class ai_service_engine::impl {
public:
    impl(const ai_service_engine_config& config,
         std::unique_ptr<pacs::ai::ai_result_handler> handler)
        : config_(config), handler_(std::move(handler)) {}

    /** Keeps a study registered as pending for the lifetime of one call */
    class pending_guard {
    public:
        pending_guard(impl& owner, std::string study_uid)
            : owner_(owner), study_uid_(std::move(study_uid)) {
            std::lock_guard lock(owner_.pending_mutex_);
            owner_.pending_.insert(study_uid_);
        }
        ~pending_guard() {
            std::lock_guard lock(owner_.pending_mutex_);
            owner_.pending_.erase(study_uid_);
        }
        pending_guard(const pending_guard&) = delete;
        pending_guard& operator=(const pending_guard&) = delete;

    private:
        impl& owner_;
        std::string study_uid_;
    };

    std::expected<std::vector<raw_finding>, engine_failure> analyze(
        const analysis_input& input, std::chrono::milliseconds timeout) {
        pending_guard guard(*this, input.study_uid);

        pacs::ai::inference_request request;
        request.study_instance_uid = input.study_uid;
        request.model_id = config_.model_id;
        request.parameters["modality"] = input.modality;
        request.parameters["instance_count"] = std::to_string(input.instance_uids.size());

        auto submitted = pacs::ai::ai_service_connector::request_inference(request);
        if (submitted.is_err()) {
            return std::unexpected(engine_failure{
                engine_error::unavailable,
                "inference request failed: " + submitted.error().message});
        }
        const auto& remote_job = submitted.value();
        integration::get_logger().debug(std::format(
            "study={} inference requested remote_job={}", input.study_uid, remote_job));

        auto finished =
            pacs::ai::ai_service_connector::wait_for_completion(remote_job, timeout);
        if (finished.is_err()) {
            return std::unexpected(engine_failure{
                engine_error::unavailable,
                "inference status unavailable: " + finished.error().message});
        }

        const auto& status = finished.value();
        switch (status.status) {
            case pacs::ai::inference_status_code::completed:
                break;
            case pacs::ai::inference_status_code::timeout:
                return std::unexpected(engine_failure{
                    engine_error::timeout, "inference timed out: " + status.message});
            case pacs::ai::inference_status_code::failed:
                return std::unexpected(engine_failure{
                    engine_error::unavailable,
                    "inference failed: " + status.error_message.value_or(status.message)});
            default:
                return std::unexpected(engine_failure{
                    engine_error::unavailable,
                    std::format("inference ended in state {}",
                                pacs::ai::to_string(status.status))});
        }

        std::vector<raw_finding> findings;
        std::lock_guard lock(handler_mutex_);
        for (const auto& result_uid : status.result_uids) {
            auto cad = handler_->get_cad_findings(result_uid);
            if (cad.is_err()) {
                return std::unexpected(engine_failure{
                    engine_error::unavailable,
                    std::format("result {} not received: {}", result_uid,
                                cad.error().message)});
            }
            for (const auto& item : cad.value()) {
                findings.push_back(to_raw_finding(item));
            }
        }
        return findings;
    }

    bool accept_result(const pacs::core::dicom_dataset& dataset) {
        auto sop_class = dataset.get_string(tags::sop_class_uid, "");
        if (!sop_class.starts_with(SR_SOP_CLASS_PREFIX)) {
            return false;
        }
        auto study_uid = dataset.get_string(tags::study_instance_uid, "");
        {
            std::lock_guard lock(pending_mutex_);
            if (!pending_.contains(study_uid)) {
                return false;
            }
        }

        std::lock_guard lock(handler_mutex_);
        auto stored = handler_->receive_structured_report(dataset);
        if (stored.is_err()) {
            integration::get_logger().error(std::format(
                "study={} ai result rejected: {}", study_uid, stored.error().message));
        }
        return true;
    }

    ai_service_engine_config config_;

    // ai_result_handler is not thread-safe
    std::mutex handler_mutex_;
    std::unique_ptr<pacs::ai::ai_result_handler> handler_;

    mutable std::mutex pending_mutex_;
    std::set<std::string, std::less<>> pending_;
};

// =============================================================================
// Public Interface
// =============================================================================

std::expected<std::shared_ptr<ai_service_engine>, engine_failure>
ai_service_engine::create(const ai_service_engine_config& config) {
    if (!config.is_valid()) {
        return std::unexpected(engine_failure{engine_error::rejected,
                                              "invalid ai service configuration"});
    }

    pacs::storage::file_storage_config storage_config;
    storage_config.root_path = config.results_directory;
    auto storage = std::make_shared<pacs::storage::file_storage>(storage_config);

    auto db = pacs::storage::index_database::open(config.results_database.string());
    if (db.is_err()) {
        return std::unexpected(engine_failure{
            engine_error::unavailable,
            "failed to open result index: " + db.error().message});
    }
    std::shared_ptr<pacs::storage::index_database> index = std::move(db.value());

    pacs::ai::ai_service_config service_config;
    service_config.base_url = config.service_url;
    service_config.connection_timeout = config.connection_timeout;
    service_config.polling_interval = config.polling_interval;
    // Retries are scheduled by the orchestrator.
    service_config.max_retries = 0;

    auto connected = pacs::ai::ai_service_connector::initialize(service_config);
    if (connected.is_err()) {
        return std::unexpected(engine_failure{
            engine_error::unavailable,
            "failed to initialize ai service connector: " + connected.error().message});
    }

    auto handler = pacs::ai::ai_result_handler::create(storage, index);
    return std::shared_ptr<ai_service_engine>(new ai_service_engine(
        std::make_unique<impl>(config, std::move(handler))));
}

ai_service_engine::ai_service_engine(std::unique_ptr<impl> pimpl)
    : pimpl_(std::move(pimpl)) {}

ai_service_engine::~ai_service_engine() {
    pacs::ai::ai_service_connector::shutdown();
}

std::expected<std::vector<raw_finding>, engine_failure> ai_service_engine::analyze(
    const analysis_input& input, std::chrono::milliseconds timeout) {
    return pimpl_->analyze(input, timeout);
}

std::string ai_service_engine::name() const {
    return std::format("ai_service:{}", pimpl_->config_.model_id);
}

bool ai_service_engine::accept_result(const pacs::core::dicom_dataset& dataset) {
    return pimpl_->accept_result(dataset);
}

size_t ai_service_engine::pending_requests() const {
    std::lock_guard lock(pimpl_->pending_mutex_);
    return pimpl_->pending_.size();
}

}  // namespace aipacs::analysis
