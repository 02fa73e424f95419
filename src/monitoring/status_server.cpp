/**
 * @file status_server.cpp
 * @brief Status endpoint routing and JSON rendering
 */

#include "aipacs/monitoring/status_server.h"

#include "aipacs/pipeline/orchestrator.h"

#include <atomic>
#include <charconv>
#include <chrono>
#include <format>
#include <mutex>
#include <sstream>

namespace aipacs::monitoring {

namespace {

std::string escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += std::format("\\u{:04x}", static_cast<int>(c));
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string json_quoted(std::string_view text) {
    return "\"" + escape(text) + "\"";
}

std::string timestamp(pipeline::time_point tp) {
    return json_quoted(std::format("{:%Y-%m-%dT%H:%M:%S}Z",
                                   std::chrono::floor<std::chrono::milliseconds>(tp)));
}

std::string timestamp(const std::optional<pipeline::time_point>& tp) {
    return tp ? timestamp(*tp) : "null";
}

std::string state_or_null(const std::optional<pipeline::job_state>& state) {
    return state ? json_quoted(pipeline::to_string(*state)) : "null";
}

void write_job(std::ostringstream& os, const pipeline::job_record& job) {
    os << "{\"job_id\": " << json_quoted(job.job_id)
       << ", \"study_uid\": " << json_quoted(job.study_uid)
       << ", \"state\": " << json_quoted(pipeline::to_string(job.state))
       << ", \"attempt_count\": " << job.attempt_count
       << ", \"instance_count\": " << job.instance_count
       << ", \"last_error\": " << json_quoted(job.last_error)
       << ", \"error_stage\": " << state_or_null(job.error_stage)
       << ", \"lease_owner\": " << json_quoted(job.lease_owner)
       << ", \"lease_expires_at\": " << timestamp(job.lease_expires_at)
       << ", \"next_attempt_at\": " << timestamp(job.next_attempt_at)
       << ", \"created_at\": " << timestamp(job.created_at)
       << ", \"updated_at\": " << timestamp(job.updated_at)
       << ", \"finished_at\": " << timestamp(job.finished_at) << "}";
}

/**
 * @brief Extract "limit" from a query string
 */
std::optional<size_t> query_limit(std::string_view query, bool& malformed) {
    malformed = false;
    size_t pos = 0;
    while (pos < query.size()) {
        auto amp = query.find('&', pos);
        auto pair = query.substr(pos, amp == std::string_view::npos ? std::string_view::npos
                                                                     : amp - pos);
        if (pair.starts_with("limit=")) {
            auto value = pair.substr(6);
            size_t limit = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), limit);
            if (ec != std::errc{} || ptr != value.data() + value.size() || value.empty()) {
                malformed = true;
                return std::nullopt;
            }
            return limit;
        }
        if (amp == std::string_view::npos) break;
        pos = amp + 1;
    }
    return std::nullopt;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// JSON Serialization
// ═══════════════════════════════════════════════════════════════════════════

std::string to_json(const pipeline::job_status& status) {
    std::ostringstream os;
    os << "{\"job\": ";
    write_job(os, status.job);
    os << ", \"finding_count\": " << status.finding_count;

    os << ", \"report\": ";
    if (status.report) {
        const auto& r = *status.report;
        os << "{\"report_id\": " << json_quoted(r.report_id)
           << ", \"format\": " << json_quoted(r.format)
           << ", \"template_version\": " << json_quoted(r.template_version)
           << ", \"payload_size\": " << r.payload.size()
           << ", \"finding_count\": " << r.finding_count
           << ", \"delivery_state\": " << json_quoted(pipeline::to_string(r.delivery))
           << ", \"archive_response\": " << json_quoted(r.archive_response)
           << ", \"sent_at\": " << timestamp(r.sent_at) << "}";
    } else {
        os << "null";
    }

    os << ", \"history\": [";
    for (size_t i = 0; i < status.history.size(); ++i) {
        const auto& e = status.history[i];
        if (i > 0) os << ", ";
        os << "{\"from\": " << state_or_null(e.from_state)
           << ", \"to\": " << json_quoted(pipeline::to_string(e.to_state))
           << ", \"attempt\": " << e.attempt
           << ", \"detail\": " << json_quoted(e.detail)
           << ", \"at\": " << timestamp(e.at) << "}";
    }
    os << "]}";
    return os.str();
}

std::string to_json(const pipeline::study_status& status) {
    const auto& s = status.study;
    std::ostringstream os;
    os << "{\"study_uid\": " << json_quoted(s.study_uid)
       << ", \"state\": " << json_quoted(pipeline::to_string(s.state))
       << ", \"patient_id\": " << json_quoted(s.metadata.patient_id)
       << ", \"accession_number\": " << json_quoted(s.metadata.accession_number)
       << ", \"modality\": " << json_quoted(s.metadata.modality)
       << ", \"instance_count\": " << s.instance_uids.size()
       << ", \"last_instance_at\": " << timestamp(s.last_instance_at)
       << ", \"instances\": [";
    for (size_t i = 0; i < s.instance_uids.size(); ++i) {
        if (i > 0) os << ", ";
        os << json_quoted(s.instance_uids[i]);
    }
    os << "], \"active_job\": ";
    if (status.active_job) {
        os << json_quoted(status.active_job->job_id);
    } else {
        os << "null";
    }
    os << ", \"jobs\": [";
    for (size_t i = 0; i < status.jobs.size(); ++i) {
        if (i > 0) os << ", ";
        write_job(os, status.jobs[i]);
    }
    os << "]}";
    return os.str();
}

std::string to_json(const pipeline::job_state_counts& counts) {
    std::ostringstream os;
    os << "{";
    size_t total = 0;
    bool first = true;
    for (auto state : pipeline::all_job_states) {
        auto it = counts.find(state);
        size_t n = it == counts.end() ? 0 : it->second;
        total += n;
        if (!first) os << ", ";
        first = false;
        os << json_quoted(pipeline::to_string(state)) << ": " << n;
    }
    os << ", \"total\": " << total << "}";
    return os.str();
}

std::string to_json(const std::vector<pipeline::failure_summary>& failures) {
    std::ostringstream os;
    os << "{\"count\": " << failures.size() << ", \"failures\": [";
    for (size_t i = 0; i < failures.size(); ++i) {
        const auto& f = failures[i];
        if (i > 0) os << ", ";
        os << "{\"job_id\": " << json_quoted(f.job_id)
           << ", \"study_uid\": " << json_quoted(f.study_uid)
           << ", \"stage\": " << state_or_null(f.failed_stage)
           << ", \"attempts\": " << f.attempt_count
           << ", \"reason\": " << json_quoted(f.reason)
           << ", \"failed_at\": " << timestamp(f.failed_at) << "}";
    }
    os << "]}";
    return os.str();
}

std::string to_json(const std::vector<component_health>& components) {
    auto overall = health_status::healthy;
    for (const auto& c : components) {
        if (c.status == health_status::unhealthy) {
            overall = health_status::unhealthy;
        } else if (c.status == health_status::degraded &&
                   overall == health_status::healthy) {
            overall = health_status::degraded;
        }
    }

    std::ostringstream os;
    os << "{\"status\": " << json_quoted(to_string(overall)) << ", \"components\": {";
    for (size_t i = 0; i < components.size(); ++i) {
        const auto& c = components[i];
        if (i > 0) os << ", ";
        os << json_quoted(c.name) << ": {\"status\": " << json_quoted(to_string(c.status));
        if (!c.details.empty()) {
            os << ", \"details\": " << json_quoted(c.details);
        }
        os << "}";
    }
    os << "}}";
    return os.str();
}

// ═══════════════════════════════════════════════════════════════════════════
// Status Server Implementation
// ═══════════════════════════════════════════════════════════════════════════

class status_server::impl {
public:
    impl(pipeline::pipeline_orchestrator& orchestrator, const config& cfg)
        : orchestrator_(orchestrator), config_(cfg) {}

    void register_probe(health_probe probe) {
        std::lock_guard lock(probes_mutex_);
        probes_.push_back(std::move(probe));
    }

    bool start() { return !running_.exchange(true); }

    void stop() { running_ = false; }

    [[nodiscard]] http_response handle_request(std::string_view target) const {
        count([](statistics& s) { s.total_requests++; });

        auto path = target;
        std::string_view query;
        if (auto q = target.find('?'); q != std::string_view::npos) {
            path = target.substr(0, q);
            query = target.substr(q + 1);
        }
        if (path.size() > 1 && path.back() == '/') {
            path.remove_suffix(1);
        }

        http_response response;
        if (path == "/health") {
            count([](statistics& s) { s.health_requests++; });
            response = handle_health();
        } else if (path == "/jobs/counts") {
            count([](statistics& s) { s.job_requests++; });
            response = http_response::ok(to_json(orchestrator_.job_counts()));
        } else if (path.starts_with("/jobs/") && path.size() > 6) {
            count([](statistics& s) { s.job_requests++; });
            auto status = orchestrator_.get_job_status(path.substr(6));
            response = status ? http_response::ok(to_json(*status))
                              : http_response::not_found();
        } else if (path.starts_with("/studies/") && path.size() > 9) {
            count([](statistics& s) { s.study_requests++; });
            auto status = orchestrator_.get_study_status(path.substr(9));
            response = status ? http_response::ok(to_json(*status))
                              : http_response::not_found();
        } else if (path == "/failures") {
            count([](statistics& s) { s.failure_requests++; });
            response = handle_failures(query);
        } else {
            response = http_response::not_found();
        }

        if (response.status_code >= 400) {
            count([](statistics& s) { s.errors++; });
        }
        return response;
    }

    [[nodiscard]] statistics get_statistics() const {
        std::lock_guard lock(stats_mutex_);
        return stats_;
    }

    pipeline::pipeline_orchestrator& orchestrator_;
    config config_;
    std::atomic<bool> running_{false};

private:
    [[nodiscard]] http_response handle_health() const {
        std::vector<component_health> components;
        {
            std::lock_guard lock(probes_mutex_);
            components.reserve(probes_.size());
            for (const auto& probe : probes_) {
                components.push_back(probe());
            }
        }

        bool down = false;
        for (const auto& c : components) {
            down = down || c.status == health_status::unhealthy;
        }
        auto body = to_json(components);
        return down ? http_response::service_unavailable(std::move(body))
                    : http_response::ok(std::move(body));
    }

    [[nodiscard]] http_response handle_failures(std::string_view query) const {
        bool malformed = false;
        auto limit = query_limit(query, malformed);
        if (malformed) {
            return http_response::bad_request("limit must be a non-negative integer");
        }
        if (limit && *limit > config_.max_failure_limit) {
            limit = config_.max_failure_limit;
        }
        return http_response::ok(to_json(orchestrator_.recent_failures(limit)));
    }

    template <typename Fn>
    void count(Fn&& fn) const {
        std::lock_guard lock(stats_mutex_);
        fn(stats_);
    }

    mutable std::mutex probes_mutex_;
    std::vector<health_probe> probes_;

    mutable std::mutex stats_mutex_;
    mutable statistics stats_;
};

status_server::status_server(pipeline::pipeline_orchestrator& orchestrator)
    : pimpl_(std::make_unique<impl>(orchestrator, config{})) {}

status_server::status_server(pipeline::pipeline_orchestrator& orchestrator,
                             const config& cfg)
    : pimpl_(std::make_unique<impl>(orchestrator, cfg)) {}

status_server::~status_server() = default;

void status_server::register_probe(health_probe probe) {
    pimpl_->register_probe(std::move(probe));
}

bool status_server::start() { return pimpl_->start(); }

void status_server::stop() { pimpl_->stop(); }

bool status_server::is_running() const noexcept { return pimpl_->running_; }

uint16_t status_server::port() const noexcept { return pimpl_->config_.port; }

http_response status_server::handle_request(std::string_view target) const {
    return pimpl_->handle_request(target);
}

status_server::statistics status_server::get_statistics() const {
    return pimpl_->get_statistics();
}

}  // namespace aipacs::monitoring
