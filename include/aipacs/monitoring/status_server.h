#ifndef AIPACS_MONITORING_STATUS_SERVER_H
#define AIPACS_MONITORING_STATUS_SERVER_H

/**
 * @file status_server.h
 * @brief Read-only status endpoints for operators
 *
 * Endpoints (all GET, JSON bodies):
 *   /health              - Component health and overall status
 *   /jobs/counts         - Number of jobs in each state
 *   /jobs/<job_id>       - Job state, attempts, last error and history
 *   /studies/<study_uid> - Study state, instances and jobs
 *   /failures?limit=N    - Most recent failed jobs, newest first
 *
 * Requests are answered through handle_request(); the embedding HTTP
 * layer passes the request target and writes back the response.
 */

#include "aipacs/pipeline/pipeline_types.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace aipacs::pipeline {
class pipeline_orchestrator;
struct job_status;
struct study_status;
}  // namespace aipacs::pipeline

namespace aipacs::monitoring {

// ═══════════════════════════════════════════════════════════════════════════
// Health Types
// ═══════════════════════════════════════════════════════════════════════════

enum class health_status {
    /** Component is fully operational */
    healthy,

    /** Component is operational but with warnings or reduced capacity */
    degraded,

    /** Component is not operational */
    unhealthy
};

[[nodiscard]] constexpr const char* to_string(health_status status) noexcept {
    switch (status) {
        case health_status::healthy:
            return "UP";
        case health_status::degraded:
            return "DEGRADED";
        case health_status::unhealthy:
            return "DOWN";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Health of one pipeline component
 */
struct component_health {
    std::string name;
    health_status status = health_status::healthy;

    /** Free-form detail (e.g. "queue_depth=3") */
    std::string details;
};

/** Probe evaluated on every /health request */
using health_probe = std::function<component_health()>;

// ═══════════════════════════════════════════════════════════════════════════
// HTTP Response
// ═══════════════════════════════════════════════════════════════════════════

struct http_response {
    int status_code = 200;
    std::string content_type = "application/json";
    std::string body;

    [[nodiscard]] static http_response ok(std::string json_body) {
        return {200, "application/json", std::move(json_body)};
    }

    [[nodiscard]] static http_response service_unavailable(std::string json_body) {
        return {503, "application/json", std::move(json_body)};
    }

    [[nodiscard]] static http_response bad_request(std::string_view message) {
        return {400, "application/json",
                R"({"error": ")" + std::string(message) + R"("})"};
    }

    [[nodiscard]] static http_response not_found() {
        return {404, "application/json", R"({"error": "Not found"})"};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// JSON Serialization
// ═══════════════════════════════════════════════════════════════════════════

[[nodiscard]] std::string to_json(const pipeline::job_status& status);
[[nodiscard]] std::string to_json(const pipeline::study_status& status);
[[nodiscard]] std::string to_json(const pipeline::job_state_counts& counts);
[[nodiscard]] std::string to_json(const std::vector<pipeline::failure_summary>& failures);
[[nodiscard]] std::string to_json(const std::vector<component_health>& components);

// ═══════════════════════════════════════════════════════════════════════════
// Status Server
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Status endpoint router
 *
 * @example
 * ```cpp
 * status_server server(orchestrator);
 * server.register_probe([&] {
 *     return component_health{"receiver", receiver.is_running()
 *         ? health_status::healthy : health_status::unhealthy, ""};
 * });
 * auto response = server.handle_request("/jobs/counts");
 * ```
 */
class status_server {
public:
    struct config {
        /** HTTP port the embedding layer listens on */
        uint16_t port = 8081;

        /** Upper bound on /failures?limit= */
        size_t max_failure_limit = 500;
    };

    struct statistics {
        size_t total_requests = 0;
        size_t health_requests = 0;
        size_t job_requests = 0;
        size_t study_requests = 0;
        size_t failure_requests = 0;

        /** 4xx and 5xx responses */
        size_t errors = 0;
    };

    explicit status_server(pipeline::pipeline_orchestrator& orchestrator);
    status_server(pipeline::pipeline_orchestrator& orchestrator, const config& cfg);
    ~status_server();

    status_server(const status_server&) = delete;
    status_server& operator=(const status_server&) = delete;

    /**
     * @brief Add a component to the /health report
     */
    void register_probe(health_probe probe);

    [[nodiscard]] bool start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept;

    [[nodiscard]] uint16_t port() const noexcept;

    /**
     * @brief Route one request
     * @param target Request path with optional query ("/failures?limit=5")
     */
    [[nodiscard]] http_response handle_request(std::string_view target) const;

    [[nodiscard]] statistics get_statistics() const;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

}  // namespace aipacs::monitoring

#endif  // AIPACS_MONITORING_STATUS_SERVER_H
