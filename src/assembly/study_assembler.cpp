/**
 * @file study_assembler.cpp
 * @brief Idle-timeout study assembly
 */

#include "aipacs/assembly/study_assembler.h"

#include "aipacs/integration/logger_adapter.h"
#include "aipacs/storage/pipeline_store.h"

#include <array>
#include <atomic>
#include <condition_variable>
#include <format>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace aipacs::assembly {

namespace {

constexpr size_t kStudyLockStripes = 32;

}  // namespace

class study_assembler::impl {
public:
    impl(const assembler_config& config, storage::pipeline_store& store,
         clock_source now)
        : config_(config),
          store_(store),
          now_(now ? std::move(now) : clock_source{[] { return clock::now(); }}) {}

    ~impl() { stop(); }

    std::expected<void, assembly_error> start() {
        if (!config_.is_valid()) {
            return std::unexpected(assembly_error::invalid_configuration);
        }
        if (running_.exchange(true)) {
            return std::unexpected(assembly_error::already_running);
        }

        timer_thread_ = std::thread([this] { timer_loop(); });
        integration::get_logger().info(std::format(
            "Study assembler started: idle_timeout={}ms",
            config_.idle_timeout.count()));
        return {};
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }
        timer_cv_.notify_all();
        if (timer_thread_.joinable()) {
            timer_thread_.join();
        }
        integration::get_logger().info("Study assembler stopped");
    }

    void timer_loop() {
        while (running_) {
            {
                std::unique_lock<std::mutex> lock(timer_mutex_);
                timer_cv_.wait_for(lock, config_.timer_resolution,
                                   [this] { return !running_.load(); });
            }
            if (!running_) {
                break;
            }
            process_due(now_());
        }
    }

    std::expected<void, assembly_error> on_instance_received(
        const pipeline::instance_record& instance) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.instances_seen++;
        }

        std::lock_guard<std::mutex> study_lock(stripe_for(instance.study_uid));

        auto previous = store_.touch_study(instance.study_uid, instance.received_at);
        if (!previous) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.persistence_failures++;
            integration::get_logger().error(std::format(
                "study={} touch failed: {}", instance.study_uid,
                storage::to_string(previous.error())));
            return std::unexpected(previous.error() == storage::store_error::not_found
                                       ? assembly_error::study_not_found
                                       : assembly_error::persistence_failed);
        }

        if (*previous != pipeline::study_state::collecting) {
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.studies_reopened++;
            }
            integration::get_logger().info(std::format(
                "study={} reopened from {} by instance={}", instance.study_uid,
                pipeline::to_string(*previous), instance.instance_uid));
        }

        arm(instance.study_uid, now_() + config_.idle_timeout);
        return {};
    }

    void arm(const std::string& study_uid, clock::time_point deadline) {
        std::lock_guard<std::mutex> lock(deadlines_mutex_);
        deadlines_[study_uid] = deadline;
    }

    size_t process_due(clock::time_point now) {
        std::vector<std::string> due;
        {
            std::lock_guard<std::mutex> lock(deadlines_mutex_);
            for (const auto& [uid, deadline] : deadlines_) {
                if (deadline <= now) {
                    due.push_back(uid);
                }
            }
        }

        std::vector<std::string> ready;
        for (const auto& uid : due) {
            std::lock_guard<std::mutex> study_lock(stripe_for(uid));

            {
                // Re-check: an instance may have re-armed the deadline.
                std::lock_guard<std::mutex> lock(deadlines_mutex_);
                auto it = deadlines_.find(uid);
                if (it == deadlines_.end() || it->second > now) {
                    continue;
                }
                deadlines_.erase(it);
            }

            auto moved = store_.transition_study(uid, pipeline::study_state::collecting,
                                                 pipeline::study_state::ready);
            if (!moved) {
                if (moved.error() != storage::store_error::stale_state) {
                    std::lock_guard<std::mutex> lock(stats_mutex_);
                    stats_.persistence_failures++;
                    integration::get_logger().error(std::format(
                        "study={} ready transition failed: {}", uid,
                        storage::to_string(moved.error())));
                }
                continue;
            }
            ready.push_back(uid);
        }

        if (ready.empty()) {
            return 0;
        }

        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.studies_ready += ready.size();
        }

        study_ready_callback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = callback_;
        }
        for (const auto& uid : ready) {
            integration::get_logger().info(std::format("study={} ready", uid));
            if (callback) {
                callback(uid);
            }
        }
        return ready.size();
    }

    size_t recover() {
        auto wall_now = std::chrono::system_clock::now();
        auto steady_now = now_();

        for (const auto& uid : store_.get_studies_with_unassembled_instances()) {
            std::lock_guard<std::mutex> study_lock(stripe_for(uid));
            if (auto touched = store_.touch_study(uid, wall_now); !touched) {
                integration::get_logger().error(std::format(
                    "study={} recovery touch failed: {}", uid,
                    storage::to_string(touched.error())));
            }
        }

        size_t armed = 0;
        for (const auto& study :
             store_.get_studies_in_state(pipeline::study_state::collecting)) {
            auto quiet = std::chrono::duration_cast<std::chrono::milliseconds>(
                wall_now - study.last_instance_at);
            auto remaining = config_.idle_timeout - quiet;
            if (remaining.count() < 0) {
                remaining = std::chrono::milliseconds{0};
            }
            arm(study.study_uid, steady_now + remaining);
            ++armed;
        }

        if (armed > 0) {
            integration::get_logger().info(
                std::format("Study assembler recovered {} collecting studies", armed));
        }
        return armed;
    }

    std::mutex& stripe_for(const std::string& study_uid) {
        return stripes_[std::hash<std::string>{}(study_uid) % kStudyLockStripes];
    }

    assembler_config config_;
    storage::pipeline_store& store_;
    clock_source now_;

    std::atomic<bool> running_{false};
    std::thread timer_thread_;
    std::mutex timer_mutex_;
    std::condition_variable timer_cv_;

    std::array<std::mutex, kStudyLockStripes> stripes_;

    mutable std::mutex deadlines_mutex_;
    std::unordered_map<std::string, clock::time_point> deadlines_;

    std::mutex callback_mutex_;
    study_ready_callback callback_;

    mutable std::mutex stats_mutex_;
    statistics stats_;
};

// =============================================================================
// study_assembler public interface
// =============================================================================

study_assembler::study_assembler(const assembler_config& config,
                                 storage::pipeline_store& store, clock_source now)
    : pimpl_(std::make_unique<impl>(config, store, std::move(now))) {}

study_assembler::~study_assembler() = default;

std::expected<void, assembly_error> study_assembler::start() {
    return pimpl_->start();
}

void study_assembler::stop() { pimpl_->stop(); }

bool study_assembler::is_running() const noexcept { return pimpl_->running_; }

std::expected<void, assembly_error> study_assembler::on_instance_received(
    const pipeline::instance_record& instance) {
    return pimpl_->on_instance_received(instance);
}

size_t study_assembler::process_due(clock::time_point now) {
    return pimpl_->process_due(now);
}

size_t study_assembler::recover() { return pimpl_->recover(); }

size_t study_assembler::pending_count() const {
    std::lock_guard<std::mutex> lock(pimpl_->deadlines_mutex_);
    return pimpl_->deadlines_.size();
}

void study_assembler::set_study_ready_callback(study_ready_callback callback) {
    std::lock_guard<std::mutex> lock(pimpl_->callback_mutex_);
    pimpl_->callback_ = std::move(callback);
}

study_assembler::statistics study_assembler::get_statistics() const {
    std::lock_guard<std::mutex> lock(pimpl_->stats_mutex_);
    return pimpl_->stats_;
}

const assembler_config& study_assembler::config() const noexcept {
    return pimpl_->config_;
}

}  // namespace aipacs::assembly
