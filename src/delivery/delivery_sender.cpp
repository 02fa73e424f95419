/**
 * @file delivery_sender.cpp
 * @brief Delivery sender implementation
 */

#include "aipacs/delivery/delivery_sender.h"

#include "aipacs/integration/logger_adapter.h"

#include <format>
#include <mutex>

namespace aipacs::delivery {

std::string describe_response(const archive_response& response) {
    if (response.transport != transport_status::ok) {
        return std::format("transport={} text={}", to_string(response.transport),
                           response.response_text);
    }
    return std::format("transport=ok status=0x{:04X} text={}", response.status_code,
                       response.response_text);
}

class delivery_sender::impl {
public:
    explicit impl(std::shared_ptr<archive_client> client) : client_(std::move(client)) {}

    std::expected<delivery_receipt, delivery_failure> send(const outbound_report& report) {
        count([](statistics& s) { s.attempts++; });

        if (report.payload.empty()) {
            count([](statistics& s) { s.permanent_failures++; });
            return std::unexpected(delivery_failure{
                delivery_error::missing_payload,
                std::format("report {} has no payload", report.report_id), ""});
        }
        if (!client_) {
            count([](statistics& s) { s.retryable_failures++; });
            return std::unexpected(delivery_failure{
                delivery_error::transport_error, "no archive client configured", ""});
        }

        auto started = std::chrono::steady_clock::now();
        archive_response response;
        try {
            response = client_->store_report(report);
        } catch (const std::exception& e) {
            response.transport = transport_status::unreachable;
            response.response_text = e.what();
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        auto audit = describe_response(response);
        integration::get_logger().info(std::format(
            "study={} job={} report={} archive response: {}", report.study_uid,
            report.job_id, report.report_id, audit));

        switch (response.transport) {
            case transport_status::ok:
                break;
            case transport_status::association_refused:
                count([](statistics& s) { s.retryable_failures++; });
                return std::unexpected(delivery_failure{
                    delivery_error::association_refused,
                    std::format("association refused by {}", client_->name()), audit});
            case transport_status::unreachable:
            case transport_status::timed_out:
            default:
                count([](statistics& s) { s.retryable_failures++; });
                return std::unexpected(delivery_failure{
                    delivery_error::transport_error,
                    std::format("{} {}", client_->name(), to_string(response.transport)),
                    audit});
        }

        switch (classify_status(response.status_code)) {
            case status_class::success:
                count([](statistics& s) { s.accepted++; });
                return delivery_receipt{response.status_code, response.response_text,
                                        audit, elapsed};
            case status_class::retryable:
                count([](statistics& s) { s.retryable_failures++; });
                return std::unexpected(delivery_failure{
                    delivery_error::archive_busy,
                    std::format("archive busy (0x{:04X})", response.status_code), audit});
            case status_class::permanent:
            default:
                count([](statistics& s) { s.permanent_failures++; });
                return std::unexpected(delivery_failure{
                    delivery_error::permanent_rejection,
                    std::format("archive rejected report (0x{:04X}): {}",
                                response.status_code, response.response_text),
                    audit});
        }
    }

    template <typename Fn>
    void count(Fn&& fn) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        fn(stats_);
    }

    std::shared_ptr<archive_client> client_;
    mutable std::mutex stats_mutex_;
    statistics stats_;
};

delivery_sender::delivery_sender(std::shared_ptr<archive_client> client)
    : pimpl_(std::make_unique<impl>(std::move(client))) {}

delivery_sender::~delivery_sender() = default;

std::expected<delivery_receipt, delivery_failure> delivery_sender::send(
    const outbound_report& report) {
    return pimpl_->send(report);
}

delivery_sender::statistics delivery_sender::get_statistics() const {
    std::lock_guard<std::mutex> lock(pimpl_->stats_mutex_);
    return pimpl_->stats_;
}

std::string delivery_sender::client_name() const {
    return pimpl_->client_ ? pimpl_->client_->name() : std::string{};
}

}  // namespace aipacs::delivery
