/**
 * @file orchestrator.cpp
 * @brief Pipeline orchestrator implementation
 */

#include "aipacs/pipeline/orchestrator.h"

#include "aipacs/analysis/analysis_invoker.h"
#include "aipacs/delivery/delivery_sender.h"
#include "aipacs/integration/logger_adapter.h"
#include "aipacs/report/report_builder.h"
#include "aipacs/storage/pipeline_store.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <mutex>
#include <random>
#include <thread>
#include <unordered_set>

namespace aipacs::pipeline {

namespace {

std::string generate_worker_id() {
    std::random_device rd;
    return std::format("orchestrator-{:08x}", rd());
}

/**
 * @brief Keeps a lease alive while an engine or archive call is in flight
 *
 * Renews every third of the lease duration. Stops renewing after the first
 * rejected renewal; lost() then reports that the lease has moved on.
 */
class lease_heartbeat {
public:
    lease_heartbeat(storage::pipeline_store& store, const lease_token& lease,
                    std::chrono::milliseconds lease_duration)
        : store_(store),
          lease_(lease),
          lease_duration_(lease_duration),
          interval_(std::max(lease_duration / 3, std::chrono::milliseconds{1})),
          thread_([this] { run(); }) {}

    ~lease_heartbeat() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_one();
        thread_.join();
    }

    lease_heartbeat(const lease_heartbeat&) = delete;
    lease_heartbeat& operator=(const lease_heartbeat&) = delete;

    [[nodiscard]] bool lost() const noexcept { return lost_.load(); }

private:
    void run() {
        while (true) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (cv_.wait_for(lock, interval_, [this] { return stopping_; })) {
                    return;
                }
            }
            if (auto renewed = store_.renew_lease(lease_, lease_duration_); !renewed) {
                lost_ = true;
                integration::get_logger().warning(std::format(
                    "job={} lease renewal by {} rejected: {}", lease_.job_id,
                    lease_.owner, storage::to_string(renewed.error())));
                return;
            }
        }
    }

    storage::pipeline_store& store_;
    lease_token lease_;
    std::chrono::milliseconds lease_duration_;
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::atomic<bool> lost_{false};
    std::thread thread_;
};

}  // namespace

class pipeline_orchestrator::impl {
public:
    using stage_result = std::expected<job_state, orchestrator_error>;

    impl(const orchestrator_config& config, storage::pipeline_store& store,
         analysis::analysis_invoker& invoker, report::report_builder& builder,
         delivery::delivery_sender& sender, retry_policy::random_source rng)
        : config_(config),
          store_(store),
          invoker_(invoker),
          builder_(builder),
          sender_(sender),
          retry_(config.retry, std::move(rng)),
          queue_(std::make_unique<bounded_work_queue<std::string>>(
              config.queue_capacity, config.overflow)) {
        if (config_.worker_id.empty()) {
            config_.worker_id = generate_worker_id();
        }
    }

    ~impl() { stop(); }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    std::expected<void, orchestrator_error> start() {
        if (!config_.is_valid()) {
            return std::unexpected(orchestrator_error::invalid_configuration);
        }
        if (running_.exchange(true)) {
            return std::unexpected(orchestrator_error::already_running);
        }

        if (queue_->is_closed()) {
            queue_ = std::make_unique<bounded_work_queue<std::string>>(
                config_.queue_capacity, config_.overflow);
        }

        recover();

        dispatcher_ = std::thread([this] { dispatcher_loop(); });
        for (size_t i = 0; i < config_.worker_count; ++i) {
            auto owner = std::format("{}#{}", config_.worker_id, i);
            workers_.emplace_back([this, owner] { worker_loop(owner); });
        }

        integration::get_logger().info(std::format(
            "Orchestrator started: worker_id={} workers={} queue={} policy={}",
            config_.worker_id, config_.worker_count, config_.queue_capacity,
            to_string(config_.overflow)));
        return {};
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }
        dispatch_cv_.notify_all();
        queue_->close();

        if (dispatcher_.joinable()) {
            dispatcher_.join();
        }
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
        {
            std::lock_guard<std::mutex> lock(offered_mutex_);
            offered_.clear();
        }
        integration::get_logger().info("Orchestrator stopped");
    }

    void recover() {
        for (const auto& uid : store_.get_ready_studies_without_job()) {
            integration::get_logger().info(
                std::format("study={} ready without job; requesting one", uid));
            on_study_ready(uid);
        }
    }

    // =========================================================================
    // Job creation
    // =========================================================================

    std::expected<job_record, orchestrator_error> request_job(std::string_view study_uid) {
        auto study = store_.get_study(study_uid);
        if (!study) {
            return std::unexpected(orchestrator_error::study_not_found);
        }
        if (study->state != study_state::ready) {
            return std::unexpected(orchestrator_error::study_not_ready);
        }

        auto created = store_.create_job(study_uid);
        if (!created) {
            if (created.error() == storage::store_error::active_job_exists) {
                count([](statistics& s) { s.invariant_violations++; });
                auto active = store_.get_active_job(study_uid);
                integration::get_logger().warning(std::format(
                    "study={} job={} invariant violation: second active job "
                    "requested; request dropped",
                    study_uid, active ? active->job_id : std::string("?")));
                return std::unexpected(orchestrator_error::invariant_violation);
            }
            integration::get_logger().error(std::format(
                "study={} job creation failed: {}", study_uid,
                storage::to_string(created.error())));
            return std::unexpected(orchestrator_error::persistence_failed);
        }

        count([](statistics& s) { s.jobs_created++; });
        integration::get_logger().info(std::format(
            "study={} job={} created instances={}", study_uid, created->job_id,
            created->instance_count));
        dispatch_cv_.notify_one();
        return *created;
    }

    void on_study_ready(const std::string& study_uid) {
        auto result = request_job(study_uid);
        if (!result && result.error() != orchestrator_error::invariant_violation) {
            integration::get_logger().warning(std::format(
                "study={} job request not honored: {}", study_uid,
                to_string(result.error())));
        }
    }

    // =========================================================================
    // Dispatch
    // =========================================================================

    void dispatcher_loop() {
        while (running_) {
            dispatch_due_jobs();

            std::unique_lock<std::mutex> lock(dispatch_mutex_);
            dispatch_cv_.wait_for(lock, config_.scan_interval,
                                  [this] { return !running_.load(); });
        }
    }

    size_t dispatch_due_jobs() {
        if (!running_) {
            return 0;
        }

        auto candidates = store_.get_dispatchable_jobs(
            std::chrono::system_clock::now(),
            config_.queue_capacity + config_.worker_count);

        size_t pushed = 0;
        for (const auto& candidate : candidates) {
            if (!running_) {
                break;
            }
            {
                std::lock_guard<std::mutex> lock(offered_mutex_);
                if (offered_.contains(candidate.job_id)) {
                    continue;
                }
            }

            if (config_.overflow == overflow_policy::reject && queue_->full()) {
                count([](statistics& s) { s.queue_rejections++; });
                integration::get_logger().debug(std::format(
                    "study={} job={} held in {}: work queue full",
                    candidate.study_uid, candidate.job_id,
                    to_string(candidate.state)));
                break;
            }

            if (candidate.state == job_state::received) {
                auto admitted = store_.admit_job(candidate.job_id);
                if (!admitted) {
                    continue;
                }
                integration::get_logger().debug(std::format(
                    "study={} job={} queued", candidate.study_uid, candidate.job_id));
            }

            if (candidate.lease_expired) {
                integration::get_logger().warning(std::format(
                    "study={} job={} lease expired in {}; re-offering",
                    candidate.study_uid, candidate.job_id,
                    to_string(candidate.state)));
            }

            {
                std::lock_guard<std::mutex> lock(offered_mutex_);
                offered_.insert(candidate.job_id);
            }
            auto offered = queue_->push(candidate.job_id);
            if (!offered) {
                std::lock_guard<std::mutex> lock(offered_mutex_);
                offered_.erase(candidate.job_id);
                if (offered.error() == queue_error::queue_full) {
                    count([](statistics& s) { s.queue_rejections++; });
                }
                break;
            }
            ++pushed;
        }
        return pushed;
    }

    void worker_loop(const std::string& owner) {
        while (running_ || queue_->size() > 0) {
            auto job_id = queue_->pop(std::chrono::milliseconds{100});
            if (!job_id) {
                if (queue_->is_closed()) {
                    break;
                }
                continue;
            }

            if (running_) {
                auto result = process_job_as(*job_id, owner);
                if (!result && result.error() != orchestrator_error::job_not_claimable &&
                    result.error() != orchestrator_error::lease_lost) {
                    integration::get_logger().error(std::format(
                        "job={} processing error: {}", *job_id, to_string(result.error())));
                }
            }

            {
                std::lock_guard<std::mutex> lock(offered_mutex_);
                offered_.erase(*job_id);
            }
            dispatch_cv_.notify_one();
        }
    }

    // =========================================================================
    // Stage execution
    // =========================================================================

    std::expected<job_state, orchestrator_error> process_job_as(std::string_view job_id,
                                                                const std::string& owner) {
        auto job = store_.get_job(job_id);
        if (!job) {
            return std::unexpected(orchestrator_error::job_not_found);
        }
        if (is_terminal(job->state)) {
            return std::unexpected(orchestrator_error::job_not_claimable);
        }
        if (job->state == job_state::received) {
            if (auto admitted = store_.admit_job(job_id);
                !admitted && admitted.error() != storage::store_error::stale_state) {
                return std::unexpected(orchestrator_error::persistence_failed);
            }
        }

        bool recovering = is_in_flight(job->state) && !job->lease_owner.empty();

        auto claimed = store_.claim_job(job_id, owner, config_.lease_duration);
        if (!claimed) {
            if (claimed.error() == storage::store_error::stale_state) {
                return std::unexpected(orchestrator_error::job_not_claimable);
            }
            return std::unexpected(orchestrator_error::persistence_failed);
        }

        if (recovering) {
            count([](statistics& s) { s.leases_recovered++; });
            integration::get_logger().warning(std::format(
                "study={} job={} lease recovered from {}; resuming {}",
                claimed->study_uid, claimed->job_id, job->lease_owner,
                to_string(claimed->state)));
        } else {
            integration::get_logger().info(std::format(
                "study={} job={} claimed by {} state={} attempt={}",
                claimed->study_uid, claimed->job_id, owner,
                to_string(claimed->state), claimed->attempt_count));
        }

        lease_token lease{claimed->job_id, owner, claimed->lease_generation};
        return run_stages(*claimed, lease);
    }

    stage_result run_stages(const job_record& job, const lease_token& lease) {
        job_state state = job.state;

        while (true) {
            switch (state) {
                case job_state::analyzing: {
                    auto next = run_analysis(job, lease);
                    if (!next || *next != job_state::reporting) return next;
                    state = *next;
                    break;
                }
                case job_state::reporting: {
                    auto next = run_reporting(job, lease);
                    if (!next || *next != job_state::delivering) return next;
                    state = *next;
                    break;
                }
                case job_state::delivering:
                    return run_delivery(job, lease);
                case job_state::received:
                case job_state::queued:
                case job_state::done:
                case job_state::failed:
                default:
                    integration::get_logger().error(std::format(
                        "study={} job={} invariant violation: claimed in state {}",
                        job.study_uid, job.job_id, to_string(state)));
                    return std::unexpected(orchestrator_error::job_not_claimable);
            }
        }
    }

    stage_result run_analysis(const job_record& job, const lease_token& lease) {
        auto study = store_.get_study(job.study_uid);
        if (!study) {
            return fail_stage(job, lease, job_state::analyzing, false,
                              "study record missing");
        }

        auto instances = store_.get_job_instances(job.job_id);
        auto input = analysis::analysis_invoker::make_input(
            job.study_uid, study->metadata.modality, instances);

        auto result = [&] {
            lease_heartbeat heartbeat(store_, lease, config_.lease_duration);
            return invoker_.invoke(input);
        }();
        if (!result) {
            return fail_stage(
                job, lease, job_state::analyzing,
                analysis::is_retryable(result.error().code),
                std::format("{}: {}", analysis::to_string(result.error().code),
                            result.error().message));
        }

        auto written =
            store_.complete_analysis(lease, result->findings, config_.lease_duration);
        if (!written) {
            return lost_lease(job, job_state::analyzing, written.error());
        }

        integration::get_logger().info(std::format(
            "study={} job={} analyzed findings={} overall_confidence={:.3f}",
            job.study_uid, job.job_id, result->findings.size(),
            result->overall_confidence));
        return job_state::reporting;
    }

    stage_result run_reporting(const job_record& job, const lease_token& lease) {
        auto study = store_.get_study(job.study_uid);
        if (!study) {
            return fail_stage(job, lease, job_state::reporting, false,
                              "study record missing");
        }

        report::report_context context;
        context.job_id = job.job_id;
        context.study_uid = job.study_uid;
        context.patient_id = study->metadata.patient_id;
        context.patient_name = study->metadata.patient_name;
        context.accession_number = study->metadata.accession_number;
        context.modality = study->metadata.modality;
        context.findings = store_.get_findings(job.job_id);
        context.model_version = invoker_.config().model_version;
        context.template_version = builder_.config().template_version;
        if (!context.findings.empty()) {
            double sum = 0.0;
            for (const auto& f : context.findings) {
                sum += f.confidence;
            }
            context.overall_confidence = sum / static_cast<double>(context.findings.size());
        }

        auto artifact = builder_.build(context, config_.report_format);
        if (!artifact) {
            return fail_stage(job, lease, job_state::reporting, false,
                              std::format("{}: {}",
                                          report::to_string(artifact.error().code),
                                          artifact.error().message));
        }

        report_record record;
        record.job_id = job.job_id;
        record.study_uid = job.study_uid;
        record.format = artifact->format;
        record.template_version = artifact->template_version;
        record.content_type = artifact->content_type;
        record.payload = std::move(artifact->payload);
        record.finding_count = artifact->finding_count;

        auto written = store_.complete_report(lease, record, config_.lease_duration);
        if (!written) {
            return lost_lease(job, job_state::reporting, written.error());
        }

        integration::get_logger().info(std::format(
            "study={} job={} report built format={} findings={}", job.study_uid,
            job.job_id, record.format, record.finding_count));
        return job_state::delivering;
    }

    stage_result run_delivery(const job_record& job, const lease_token& lease) {
        auto stored = store_.get_report_for_job(job.job_id);
        if (!stored) {
            return fail_stage(job, lease, job_state::delivering, false,
                              "report missing for delivery");
        }
        auto study = store_.get_study(job.study_uid);

        delivery::outbound_report outbound;
        outbound.report_id = stored->report_id;
        outbound.job_id = job.job_id;
        outbound.study_uid = job.study_uid;
        if (study) {
            outbound.patient_id = study->metadata.patient_id;
            outbound.patient_name = study->metadata.patient_name;
            outbound.accession_number = study->metadata.accession_number;
        }
        outbound.format = stored->format;
        outbound.content_type = stored->content_type;
        outbound.payload = stored->payload;

        auto receipt = [&] {
            lease_heartbeat heartbeat(store_, lease, config_.lease_duration);
            return sender_.send(outbound);
        }();
        if (!receipt) {
            if (!receipt.error().audit_text.empty()) {
                if (auto recorded = store_.record_delivery_response(
                        stored->report_id, receipt.error().audit_text);
                    !recorded) {
                    integration::get_logger().error(std::format(
                        "study={} job={} could not record archive response: {}",
                        job.study_uid, job.job_id, storage::to_string(recorded.error())));
                }
            }
            return fail_stage(job, lease, job_state::delivering,
                              delivery::is_retryable(receipt.error().code),
                              std::format("{}: {}",
                                          delivery::to_string(receipt.error().code),
                                          receipt.error().message));
        }

        auto finished = store_.complete_job(lease, receipt->audit_text);
        if (!finished) {
            return lost_lease(job, job_state::delivering, finished.error());
        }

        count([](statistics& s) { s.jobs_done++; });
        integration::get_logger().info(std::format(
            "study={} job={} done status=0x{:04X}", job.study_uid, job.job_id,
            receipt->status_code));
        after_terminal(job, *finished);
        return job_state::done;
    }

    /**
     * @brief Retry-or-fail decision for a failed stage
     */
    stage_result fail_stage(const job_record& job, const lease_token& lease,
                            job_state stage, bool retryable, const std::string& reason) {
        auto current = store_.get_job(job.job_id);
        int attempts = (current ? current->attempt_count : job.attempt_count) + 1;

        if (retryable && stage != job_state::reporting && retry_.should_retry(attempts)) {
            auto delay = retry_.delay_for(attempts);
            auto target = stage == job_state::analyzing ? job_state::queued
                                                        : job_state::delivering;
            auto scheduled = store_.schedule_retry(
                lease, stage, target, attempts, reason,
                std::chrono::system_clock::now() + delay);
            if (!scheduled) {
                return lost_lease(job, stage, scheduled.error());
            }
            count([](statistics& s) { s.retries_scheduled++; });
            integration::get_logger().warning(std::format(
                "study={} job={} {} failed (attempt {}/{}); retry in {}ms: {}",
                job.study_uid, job.job_id, to_string(stage), attempts,
                retry_.config().max_attempts, delay.count(), reason));
            return target;
        }

        auto failed = store_.fail_job(lease, stage, attempts, reason);
        if (!failed) {
            return lost_lease(job, stage, failed.error());
        }
        count([](statistics& s) { s.jobs_failed++; });
        integration::get_logger().error(std::format(
            "study={} job={} failed in {} after {} attempt(s): {}", job.study_uid,
            job.job_id, to_string(stage), attempts, reason));
        after_terminal(job, *failed);
        return job_state::failed;
    }

    stage_result lost_lease(const job_record& job, job_state stage,
                            storage::store_error error) {
        count([](statistics& s) { s.stage_conflicts++; });
        integration::get_logger().warning(std::format(
            "study={} job={} {} result discarded: {}; stopping", job.study_uid,
            job.job_id, to_string(stage), storage::to_string(error)));
        return std::unexpected(error == storage::store_error::stale_state
                                   ? orchestrator_error::lease_lost
                                   : orchestrator_error::persistence_failed);
    }

    void after_terminal(const job_record& job, const storage::finish_outcome& outcome) {
        if (!outcome.study_closed) {
            integration::get_logger().info(std::format(
                "study={} job={} finished; study left {} after late instances",
                job.study_uid, job.job_id, to_string(outcome.study)));
            if (outcome.study == study_state::ready) {
                on_study_ready(job.study_uid);
            }
        }

        job_finished_callback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = callback_;
        }
        if (callback) {
            if (auto finished = store_.get_job(job.job_id)) {
                callback(*finished);
            }
        }
    }

    // =========================================================================
    // Observability
    // =========================================================================

    std::expected<job_status, orchestrator_error> get_job_status(
        std::string_view job_id) const {
        auto job = store_.get_job(job_id);
        if (!job) {
            return std::unexpected(orchestrator_error::job_not_found);
        }
        job_status status;
        status.job = std::move(*job);
        status.history = store_.get_job_history(job_id);
        status.finding_count = store_.get_findings(job_id).size();
        status.report = store_.get_report_for_job(job_id);
        return status;
    }

    std::expected<study_status, orchestrator_error> get_study_status(
        std::string_view study_uid) const {
        auto study = store_.get_study(study_uid);
        if (!study) {
            return std::unexpected(orchestrator_error::study_not_found);
        }
        study_status status;
        status.study = std::move(*study);
        status.active_job = store_.get_active_job(study_uid);
        status.jobs = store_.get_jobs_for_study(study_uid);
        return status;
    }

    template <typename Fn>
    void count(Fn&& fn) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        fn(stats_);
    }

    orchestrator_config config_;
    storage::pipeline_store& store_;
    analysis::analysis_invoker& invoker_;
    report::report_builder& builder_;
    delivery::delivery_sender& sender_;
    retry_policy retry_;

    std::unique_ptr<bounded_work_queue<std::string>> queue_;
    std::atomic<bool> running_{false};

    std::thread dispatcher_;
    std::vector<std::thread> workers_;
    std::mutex dispatch_mutex_;
    std::condition_variable dispatch_cv_;

    std::mutex offered_mutex_;
    std::unordered_set<std::string> offered_;

    std::mutex callback_mutex_;
    job_finished_callback callback_;

    mutable std::mutex stats_mutex_;
    statistics stats_;
};

// =============================================================================
// pipeline_orchestrator public interface
// =============================================================================

pipeline_orchestrator::pipeline_orchestrator(const orchestrator_config& config,
                                             storage::pipeline_store& store,
                                             analysis::analysis_invoker& invoker,
                                             report::report_builder& builder,
                                             delivery::delivery_sender& sender,
                                             retry_policy::random_source rng)
    : pimpl_(std::make_unique<impl>(config, store, invoker, builder, sender,
                                    std::move(rng))) {}

pipeline_orchestrator::~pipeline_orchestrator() = default;

std::expected<void, orchestrator_error> pipeline_orchestrator::start() {
    return pimpl_->start();
}

void pipeline_orchestrator::stop() { pimpl_->stop(); }

bool pipeline_orchestrator::is_running() const noexcept { return pimpl_->running_; }

std::expected<job_record, orchestrator_error> pipeline_orchestrator::request_job(
    std::string_view study_uid) {
    return pimpl_->request_job(study_uid);
}

void pipeline_orchestrator::on_study_ready(const std::string& study_uid) {
    pimpl_->on_study_ready(study_uid);
}

std::expected<job_state, orchestrator_error> pipeline_orchestrator::process_job(
    std::string_view job_id) {
    return pimpl_->process_job_as(job_id, pimpl_->config_.worker_id + "#sync");
}

size_t pipeline_orchestrator::dispatch_due_jobs() { return pimpl_->dispatch_due_jobs(); }

std::expected<job_status, orchestrator_error> pipeline_orchestrator::get_job_status(
    std::string_view job_id) const {
    return pimpl_->get_job_status(job_id);
}

std::expected<study_status, orchestrator_error> pipeline_orchestrator::get_study_status(
    std::string_view study_uid) const {
    return pimpl_->get_study_status(study_uid);
}

job_state_counts pipeline_orchestrator::job_counts() const {
    return pimpl_->store_.count_jobs_by_state();
}

std::vector<failure_summary> pipeline_orchestrator::recent_failures(
    std::optional<size_t> limit) const {
    return pimpl_->store_.get_recent_failures(
        limit.value_or(pimpl_->config_.failure_history));
}

size_t pipeline_orchestrator::queue_depth() const { return pimpl_->queue_->size(); }

pipeline_orchestrator::statistics pipeline_orchestrator::get_statistics() const {
    std::lock_guard<std::mutex> lock(pimpl_->stats_mutex_);
    return pimpl_->stats_;
}

void pipeline_orchestrator::set_job_finished_callback(job_finished_callback callback) {
    std::lock_guard<std::mutex> lock(pimpl_->callback_mutex_);
    pimpl_->callback_ = std::move(callback);
}

const orchestrator_config& pipeline_orchestrator::config() const noexcept {
    return pimpl_->config_;
}

}  // namespace aipacs::pipeline
