/**
 * @file pipeline_server.cpp
 * @brief Implementation of the AI PACS pipeline server
 */

#include "aipacs/pipeline_server.h"

#include "aipacs/analysis/analysis_invoker.h"
#include "aipacs/assembly/study_assembler.h"
#include "aipacs/config/config_loader.h"
#include "aipacs/delivery/delivery_sender.h"
#include "aipacs/integration/logger_adapter.h"
#include "aipacs/pipeline/orchestrator.h"
#include "aipacs/report/report_builder.h"
#include "aipacs/storage/pipeline_store.h"
#include "aipacs/transfer/transfer_receiver.h"

#ifdef AIPACS_HAS_PACS_SYSTEM
#include "aipacs/analysis/ai_service_engine.h"
#include "aipacs/dicom/storage_archive_client.h"
#include "aipacs/dicom/storage_listener.h"
#endif

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <format>
#include <mutex>
#include <stdexcept>

namespace aipacs {

// =============================================================================
// Global Signal Handler State
// =============================================================================

namespace {

std::atomic<bool> g_shutdown_requested{false};
std::condition_variable g_shutdown_cv;
std::mutex g_shutdown_mutex;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested.store(true, std::memory_order_release);
        g_shutdown_cv.notify_all();
    }
}

void install_signal_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

std::string describe(const std::vector<config::validation_error_info>& errors) {
    std::string text;
    for (const auto& e : errors) {
        if (!text.empty()) text += "; ";
        text += e.field_path + ": " + e.message;
    }
    return text;
}

}  // namespace

// =============================================================================
// Implementation Class
// =============================================================================

class pipeline_server::impl {
public:
    impl(const config::pipeline_config& config,
         std::shared_ptr<analysis::analysis_engine> engine,
         std::shared_ptr<delivery::archive_client> archive)
        : config_(config), engine_(std::move(engine)), archive_(std::move(archive)) {
        validate_config();
        build_intake();
    }

    explicit impl(const std::filesystem::path& config_path) {
        auto load_result = config::config_loader::load(config_path);
        if (!load_result) {
            throw std::runtime_error("Failed to load configuration: " +
                                     load_result.error().to_string());
        }
        config_ = std::move(*load_result);
        validate_config();
        build_intake();
    }

    ~impl() {
        if (running_.load(std::memory_order_acquire)) {
            stop();
        }
    }

    std::expected<void, server_error> start() {
        if (running_.load(std::memory_order_acquire)) {
            return std::unexpected(server_error::already_running);
        }

        if (auto result = init_logging(); !result) {
            return result;
        }
        if (auto result = init_collaborators(); !result) {
            return result;
        }
        init_processing();

        if (auto result = start_components(); !result) {
            stop_components();
            cleanup();
            return result;
        }

        running_.store(true, std::memory_order_release);
        start_time_ = std::chrono::steady_clock::now();
        install_signal_handlers();

        integration::get_logger().info(std::format(
            "{} started workers={} idle_timeout={}ms", config_.name,
            config_.orchestrator.worker_count, config_.assembler.idle_timeout.count()));
        return {};
    }

    void stop() {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        stop_components();
        cleanup();
        g_shutdown_cv.notify_all();
        integration::get_logger().info(std::format("{} stopped", config_.name));
    }

    void wait_for_shutdown() {
        std::unique_lock<std::mutex> lock(g_shutdown_mutex);
        g_shutdown_cv.wait(lock, [this] {
            return g_shutdown_requested.load(std::memory_order_acquire) ||
                   !running_.load(std::memory_order_acquire);
        });
    }

    std::expected<void, server_error> reload_config(const std::filesystem::path& path) {
        auto load_result = config::config_loader::load(path);
        if (!load_result) {
            integration::get_logger().error(
                "configuration reload failed: " + load_result.error().to_string());
            return std::unexpected(server_error::config_load_failed);
        }
        config_.logging.level = load_result->logging.level;
        integration::get_logger().set_level(config_.logging.level);
        integration::get_logger().info(std::format(
            "configuration reloaded; log level {}", to_string(config_.logging.level)));
        return {};
    }

    pipeline_statistics get_statistics() const {
        pipeline_statistics stats;

        auto intake = receiver_->get_statistics();
        stats.instances_received = intake.stored;
        stats.instances_duplicate = intake.duplicates;
        stats.instances_rejected = intake.rejected;

        auto assembly = assembler_->get_statistics();
        stats.studies_ready = assembly.studies_ready;
        stats.studies_reopened = assembly.studies_reopened;

        if (orchestrator_) {
            auto jobs = orchestrator_->get_statistics();
            stats.jobs_created = jobs.jobs_created;
            stats.jobs_done = jobs.jobs_done;
            stats.jobs_failed = jobs.jobs_failed;
            stats.retries_scheduled = jobs.retries_scheduled;
            stats.leases_recovered = jobs.leases_recovered;
            stats.invariant_violations = jobs.invariant_violations;
            stats.queue_depth = orchestrator_->queue_depth();
        }
        if (sender_) {
            auto delivery = sender_->get_statistics();
            stats.deliveries_attempted = delivery.attempts;
            stats.deliveries_accepted = delivery.accepted;
        }
        if (running_.load(std::memory_order_acquire)) {
            stats.uptime = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::steady_clock::now() - start_time_);
        }
        return stats;
    }

    monitoring::http_response handle_status_request(std::string_view target) const {
        if (!status_ || !running_.load(std::memory_order_acquire)) {
            return monitoring::http_response::service_unavailable(
                R"({"status": "DOWN", "error": "Server is not running"})");
        }
        return status_->handle_request(target);
    }

    // =========================================================================
    // Construction
    // =========================================================================

    void validate_config() {
        auto errors = config_.validate();
        if (!errors.empty()) {
            throw std::invalid_argument("Invalid configuration: " + describe(errors));
        }
    }

    /** Components that exist for the server's whole lifetime */
    void build_intake() {
        store_ = std::make_unique<storage::pipeline_store>(config_.make_store_config());
        receiver_ = std::make_unique<transfer::transfer_receiver>(
            config_.make_receiver_config(), *store_);
        assembler_ = std::make_unique<assembly::study_assembler>(config_.assembler, *store_);

        receiver_->set_instance_received_callback(
            [this](const pipeline::instance_record& instance) {
                auto result = assembler_->on_instance_received(instance);
                if (!result) {
                    integration::get_logger().error(std::format(
                        "study={} instance={} assembly update failed: {}",
                        instance.study_uid, instance.instance_uid,
                        assembly::to_string(result.error())));
                }
            });
        assembler_->set_study_ready_callback([this](const std::string& study_uid) {
            if (orchestrator_) {
                orchestrator_->on_study_ready(study_uid);
            }
        });
    }

    // =========================================================================
    // Start
    // =========================================================================

    std::expected<void, server_error> init_logging() {
        try {
            auto logger = integration::create_logger(config_.name, config_.logging.format,
                                                     config_.logging.file);
            logger->set_level(config_.logging.level);
            integration::install_default_logger(std::move(logger));
        } catch (const std::runtime_error& e) {
            integration::get_logger().error(
                std::format("logging setup failed: {}", e.what()));
            return std::unexpected(server_error::invalid_configuration);
        }
        return {};
    }

    std::expected<void, server_error> init_collaborators() {
#ifdef AIPACS_HAS_PACS_SYSTEM
        if (!engine_) {
            analysis::ai_service_engine_config ai_config;
            ai_config.service_url = config_.analysis.service_url;
            ai_config.model_id = config_.analysis.model_id;
            auto data_root = config_.storage.data_directory.parent_path();
            ai_config.results_directory = data_root / "ai_results";
            ai_config.results_database =
                config_.storage.database_path.parent_path() / "ai_results.db";

            auto created = analysis::ai_service_engine::create(ai_config);
            if (!created) {
                integration::get_logger().error(std::format(
                    "analysis engine unavailable: {}", created.error().message));
                return std::unexpected(server_error::missing_collaborator);
            }
            ai_engine_ = *created;
            engine_ = ai_engine_;
        }
        if (!archive_) {
            dicom::archive_client_config archive_config;
            archive_config.host = config_.archive.host;
            archive_config.port = config_.archive.port;
            archive_config.calling_ae = config_.archive.ae_title;
            archive_config.called_ae = config_.archive.called_ae;
            archive_config.timeout = config_.archive.timeout;
            archive_ = std::make_shared<dicom::storage_archive_client>(archive_config);
        }
#endif
        if (!engine_ || !archive_) {
            integration::get_logger().error(std::format(
                "{} requires an analysis engine and an archive client", config_.name));
            return std::unexpected(server_error::missing_collaborator);
        }
        return {};
    }

    /** Components rebuilt on every start */
    void init_processing() {
        invoker_ = std::make_unique<analysis::analysis_invoker>(
            engine_, config_.make_invoker_config());
        builder_ = std::make_unique<report::report_builder>(config_.make_builder_config());
        sender_ = std::make_unique<delivery::delivery_sender>(archive_);
        orchestrator_ = std::make_unique<pipeline::pipeline_orchestrator>(
            config_.make_orchestrator_config(), *store_, *invoker_, *builder_, *sender_);

        status_ = std::make_unique<monitoring::status_server>(*orchestrator_);
        register_probes();

#ifdef AIPACS_HAS_PACS_SYSTEM
        dicom::listener_config listener_cfg;
        listener_cfg.ae_title = config_.receiver.ae_title;
        listener_cfg.port = config_.receiver.port;
        listener_cfg.max_associations = config_.receiver.max_associations;
        listener_ = std::make_unique<dicom::storage_listener>(listener_cfg, *receiver_);
        if (ai_engine_) {
            listener_->set_result_sink(
                [engine = ai_engine_](const pacs::core::dicom_dataset& ds) {
                    return engine->accept_result(ds);
                });
        }
#endif
    }

    void register_probes() {
        using monitoring::component_health;
        using monitoring::health_status;

        status_->register_probe([this] {
            return component_health{
                "store", store_->is_open() ? health_status::healthy : health_status::unhealthy,
                store_->config().database_path.string()};
        });
        status_->register_probe([this] {
            return component_health{"receiver",
                                    receiver_->is_running() ? health_status::healthy
                                                            : health_status::unhealthy,
                                    ""};
        });
        status_->register_probe([this] {
            return component_health{
                "assembler",
                assembler_->is_running() ? health_status::healthy : health_status::unhealthy,
                std::format("pending_studies={}", assembler_->pending_count())};
        });
        status_->register_probe([this] {
            if (!orchestrator_->is_running()) {
                return component_health{"orchestrator", health_status::unhealthy, ""};
            }
            auto depth = orchestrator_->queue_depth();
            auto status = depth >= orchestrator_->config().queue_capacity
                              ? health_status::degraded
                              : health_status::healthy;
            return component_health{"orchestrator", status,
                                    std::format("queue_depth={}", depth)};
        });
#ifdef AIPACS_HAS_PACS_SYSTEM
        status_->register_probe([this] {
            return component_health{
                "dicom_listener",
                listener_->is_running() ? health_status::healthy : health_status::unhealthy,
                std::format("port={}", config_.receiver.port)};
        });
#endif
    }

    std::expected<void, server_error> start_components() {
        if (auto r = store_->open(); !r) {
            integration::get_logger().error(
                std::format("store open failed: {}", storage::to_string(r.error())));
            return std::unexpected(server_error::store_init_failed);
        }

        if (auto r = receiver_->start(); !r) {
            integration::get_logger().error(
                std::format("receiver start failed: {}", transfer::to_string(r.error())));
            return std::unexpected(server_error::receiver_init_failed);
        }

        auto armed = assembler_->recover();
        if (auto r = assembler_->start(); !r) {
            integration::get_logger().error(
                std::format("assembler start failed: {}", assembly::to_string(r.error())));
            return std::unexpected(server_error::assembler_init_failed);
        }
        integration::get_logger().debug(std::format("{} studies still collecting", armed));

        if (auto r = orchestrator_->start(); !r) {
            integration::get_logger().error(std::format(
                "orchestrator start failed: {}", pipeline::to_string(r.error())));
            return std::unexpected(server_error::orchestrator_init_failed);
        }

        if (!status_->start()) {
            integration::get_logger().warning("status server failed to start");
        }

#ifdef AIPACS_HAS_PACS_SYSTEM
        if (auto r = listener_->start(); !r) {
            return std::unexpected(server_error::listener_init_failed);
        }
#else
        integration::get_logger().info(
            "DICOM listener not built; instances are accepted through the receiver API");
#endif
        return {};
    }

    // =========================================================================
    // Stop
    // =========================================================================

    void stop_components() {
#ifdef AIPACS_HAS_PACS_SYSTEM
        if (listener_) listener_->stop();
#endif
        if (status_) status_->stop();
        if (orchestrator_) orchestrator_->stop();
        assembler_->stop();
        receiver_->stop();
        store_->close();
    }

    void cleanup() {
#ifdef AIPACS_HAS_PACS_SYSTEM
        listener_.reset();
#endif
        status_.reset();
        orchestrator_.reset();
        sender_.reset();
        builder_.reset();
        invoker_.reset();
    }

    config::pipeline_config config_;
    std::shared_ptr<analysis::analysis_engine> engine_;
    std::shared_ptr<delivery::archive_client> archive_;

    std::unique_ptr<storage::pipeline_store> store_;
    std::unique_ptr<transfer::transfer_receiver> receiver_;
    std::unique_ptr<assembly::study_assembler> assembler_;

    std::unique_ptr<analysis::analysis_invoker> invoker_;
    std::unique_ptr<report::report_builder> builder_;
    std::unique_ptr<delivery::delivery_sender> sender_;
    std::unique_ptr<pipeline::pipeline_orchestrator> orchestrator_;
    std::unique_ptr<monitoring::status_server> status_;

#ifdef AIPACS_HAS_PACS_SYSTEM
    std::shared_ptr<analysis::ai_service_engine> ai_engine_;
    std::unique_ptr<dicom::storage_listener> listener_;
#endif

    std::atomic<bool> running_{false};
    std::chrono::steady_clock::time_point start_time_;
};

// =============================================================================
// Public Interface
// =============================================================================

pipeline_server::pipeline_server(const config::pipeline_config& config,
                                 std::shared_ptr<analysis::analysis_engine> engine,
                                 std::shared_ptr<delivery::archive_client> archive)
    : pimpl_(std::make_unique<impl>(config, std::move(engine), std::move(archive))) {}

pipeline_server::pipeline_server(const std::filesystem::path& config_path)
    : pimpl_(std::make_unique<impl>(config_path)) {}

pipeline_server::~pipeline_server() = default;

std::expected<void, server_error> pipeline_server::start() {
    return pimpl_->start();
}

void pipeline_server::stop() {
    pimpl_->stop();
}

void pipeline_server::wait_for_shutdown() {
    pimpl_->wait_for_shutdown();
}

bool pipeline_server::is_running() const noexcept {
    return pimpl_->running_.load(std::memory_order_acquire);
}

std::expected<void, server_error> pipeline_server::reload_config(
    const std::filesystem::path& config_path) {
    return pimpl_->reload_config(config_path);
}

pipeline_statistics pipeline_server::get_statistics() const {
    return pimpl_->get_statistics();
}

monitoring::http_response pipeline_server::handle_status_request(
    std::string_view target) const {
    return pimpl_->handle_status_request(target);
}

storage::pipeline_store& pipeline_server::store() {
    return *pimpl_->store_;
}

transfer::transfer_receiver& pipeline_server::receiver() {
    return *pimpl_->receiver_;
}

assembly::study_assembler& pipeline_server::assembler() {
    return *pimpl_->assembler_;
}

pipeline::pipeline_orchestrator* pipeline_server::orchestrator() {
    return pimpl_->orchestrator_.get();
}

const config::pipeline_config& pipeline_server::config() const noexcept {
    return pimpl_->config_;
}

}  // namespace aipacs
