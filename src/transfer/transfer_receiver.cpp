/**
 * @file transfer_receiver.cpp
 * @brief Transfer receiver implementation
 */

#include "aipacs/transfer/transfer_receiver.h"

#include "aipacs/integration/logger_adapter.h"
#include "aipacs/storage/pipeline_store.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <format>
#include <fstream>
#include <mutex>
#include <random>

namespace aipacs::transfer {

namespace {

constexpr size_t kInstanceLockStripes = 64;

std::string temp_suffix() {
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dis;
    return std::format(".tmp-{:08x}", dis(gen));
}

}  // namespace

bool is_valid_uid(std::string_view uid) noexcept {
    if (uid.empty() || uid.size() > 64) {
        return false;
    }
    if (uid.front() == '.' || uid.back() == '.') {
        return false;
    }

    size_t component_start = 0;
    for (size_t i = 0; i <= uid.size(); ++i) {
        if (i == uid.size() || uid[i] == '.') {
            size_t length = i - component_start;
            if (length == 0) {
                return false;
            }
            if (length > 1 && uid[component_start] == '0') {
                return false;
            }
            component_start = i + 1;
            continue;
        }
        if (uid[i] < '0' || uid[i] > '9') {
            return false;
        }
    }
    return true;
}

// =============================================================================
// transfer_receiver::impl
// =============================================================================

class transfer_receiver::impl {
public:
    impl(const receiver_config& config, storage::pipeline_store& store)
        : config_(config), store_(store) {}

    std::expected<void, transfer_error> start() {
        if (running_) {
            return std::unexpected(transfer_error::already_running);
        }
        if (!config_.is_valid()) {
            return std::unexpected(transfer_error::invalid_configuration);
        }

        std::error_code ec;
        std::filesystem::create_directories(config_.data_directory, ec);
        if (ec) {
            integration::get_logger().error(
                std::format("Cannot create spool directory {}: {}",
                            config_.data_directory.string(), ec.message()));
            return std::unexpected(transfer_error::invalid_configuration);
        }

        running_ = true;
        integration::get_logger().info(std::format(
            "Transfer receiver started: spool={}", config_.data_directory.string()));
        return {};
    }

    void stop() {
        if (running_.exchange(false)) {
            integration::get_logger().info("Transfer receiver stopped");
        }
    }

    std::expected<void, transfer_error> validate(const store_request& request) const {
        if (request.study_uid.empty() || request.series_uid.empty() ||
            request.instance_uid.empty()) {
            return std::unexpected(transfer_error::missing_identifier);
        }
        if (!is_valid_uid(request.study_uid) || !is_valid_uid(request.series_uid) ||
            !is_valid_uid(request.instance_uid)) {
            return std::unexpected(transfer_error::invalid_identifier);
        }
        if (!request.sop_class_uid.empty() && !is_valid_uid(request.sop_class_uid)) {
            return std::unexpected(transfer_error::invalid_identifier);
        }
        if (request.payload.empty()) {
            return std::unexpected(transfer_error::empty_payload);
        }
        if (config_.max_payload_bytes > 0 &&
            request.payload.size() > config_.max_payload_bytes) {
            return std::unexpected(transfer_error::payload_too_large);
        }
        if (!config_.accepted_modalities.empty() &&
            std::find(config_.accepted_modalities.begin(),
                      config_.accepted_modalities.end(),
                      request.modality) == config_.accepted_modalities.end()) {
            return std::unexpected(transfer_error::unsupported_modality);
        }
        return {};
    }

    std::expected<store_response, transfer_error> store_instance(
        const store_request& request) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.requests++;
        }

        if (!running_) {
            return std::unexpected(transfer_error::not_running);
        }

        if (auto valid = validate(request); !valid) {
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.rejected++;
            }
            integration::get_logger().warning(std::format(
                "study={} instance={} rejected: {}", request.study_uid,
                request.instance_uid, to_string(valid.error())));
            return std::unexpected(valid.error());
        }

        store_response response;
        {
            std::lock_guard<std::mutex> stripe(stripe_for(request.instance_uid));

            if (auto existing = store_.get_instance(request.instance_uid)) {
                response.outcome = store_outcome::duplicate;
                response.instance = std::move(*existing);
            } else {
                auto stored = write_and_record(request);
                if (!stored) {
                    std::lock_guard<std::mutex> lock(stats_mutex_);
                    stats_.failures++;
                    return std::unexpected(stored.error());
                }
                response = std::move(*stored);
            }
        }

        if (response.outcome == store_outcome::duplicate) {
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.duplicates++;
            }
            integration::get_logger().debug(std::format(
                "study={} instance={} duplicate ignored", request.study_uid,
                request.instance_uid));
            return response;
        }

        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.stored++;
            stats_.bytes_stored += response.instance.payload_size;
        }
        integration::get_logger().info(std::format(
            "study={} series={} instance={} stored bytes={}", request.study_uid,
            request.series_uid, request.instance_uid,
            response.instance.payload_size));

        instance_received_callback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = callback_;
        }
        if (callback) {
            callback(response.instance);
        }
        return response;
    }

    std::expected<store_response, transfer_error> write_and_record(
        const store_request& request) {
        auto directory =
            config_.data_directory / request.study_uid / request.series_uid;
        auto final_path = directory / (request.instance_uid + ".dcm");
        auto temp_path = directory / (request.instance_uid + temp_suffix());

        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec) {
            integration::get_logger().error(std::format(
                "study={} instance={} spool directory failed: {}",
                request.study_uid, request.instance_uid, ec.message()));
            return std::unexpected(transfer_error::payload_write_failed);
        }

        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            out.write(reinterpret_cast<const char*>(request.payload.data()),
                      static_cast<std::streamsize>(request.payload.size()));
            out.flush();
            if (!out) {
                out.close();
                std::filesystem::remove(temp_path, ec);
                integration::get_logger().error(std::format(
                    "study={} instance={} payload write failed", request.study_uid,
                    request.instance_uid));
                return std::unexpected(transfer_error::payload_write_failed);
            }
        }

        std::filesystem::rename(temp_path, final_path, ec);
        if (ec) {
            std::filesystem::remove(temp_path, ec);
            return std::unexpected(transfer_error::payload_write_failed);
        }

        pipeline::instance_record record;
        record.instance_uid = request.instance_uid;
        record.series_uid = request.series_uid;
        record.study_uid = request.study_uid;
        record.sop_class_uid = request.sop_class_uid;
        record.modality = request.modality;
        record.payload_path = final_path;
        record.payload_size = request.payload.size();
        record.received_at = std::chrono::system_clock::now();

        pipeline::study_metadata metadata{
            .patient_id = request.patient_id,
            .patient_name = request.patient_name,
            .accession_number = request.accession_number,
            .modality = request.modality};

        auto inserted = store_.insert_instance(record, metadata);
        if (!inserted) {
            std::filesystem::remove(final_path, ec);
            integration::get_logger().error(std::format(
                "study={} instance={} persistence failed: {}", request.study_uid,
                request.instance_uid, storage::to_string(inserted.error())));
            return std::unexpected(transfer_error::persistence_failed);
        }

        store_response response;
        response.instance = std::move(record);
        response.outcome = *inserted == storage::insert_outcome::inserted
                               ? store_outcome::stored
                               : store_outcome::duplicate;
        return response;
    }

    std::mutex& stripe_for(const std::string& instance_uid) {
        return stripes_[std::hash<std::string>{}(instance_uid) % kInstanceLockStripes];
    }

    receiver_config config_;
    storage::pipeline_store& store_;
    std::atomic<bool> running_{false};

    std::array<std::mutex, kInstanceLockStripes> stripes_;

    std::mutex callback_mutex_;
    instance_received_callback callback_;

    mutable std::mutex stats_mutex_;
    statistics stats_;
};

// =============================================================================
// transfer_receiver public interface
// =============================================================================

transfer_receiver::transfer_receiver(const receiver_config& config,
                                     storage::pipeline_store& store)
    : pimpl_(std::make_unique<impl>(config, store)) {}

transfer_receiver::~transfer_receiver() = default;

std::expected<void, transfer_error> transfer_receiver::start() {
    return pimpl_->start();
}

void transfer_receiver::stop() { pimpl_->stop(); }

bool transfer_receiver::is_running() const noexcept { return pimpl_->running_; }

std::expected<store_response, transfer_error> transfer_receiver::store_instance(
    const store_request& request) {
    return pimpl_->store_instance(request);
}

std::expected<void, transfer_error> transfer_receiver::validate(
    const store_request& request) const {
    return pimpl_->validate(request);
}

void transfer_receiver::set_instance_received_callback(
    instance_received_callback callback) {
    std::lock_guard<std::mutex> lock(pimpl_->callback_mutex_);
    pimpl_->callback_ = std::move(callback);
}

transfer_receiver::statistics transfer_receiver::get_statistics() const {
    std::lock_guard<std::mutex> lock(pimpl_->stats_mutex_);
    return pimpl_->stats_;
}

const receiver_config& transfer_receiver::config() const noexcept {
    return pimpl_->config_;
}

}  // namespace aipacs::transfer
