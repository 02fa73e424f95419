#ifndef AIPACS_ANALYSIS_AI_SERVICE_ENGINE_H
#define AIPACS_ANALYSIS_AI_SERVICE_ENGINE_H

/**
 * @file ai_service_engine.h
 * @brief Analysis engine backed by a remote AI inference service
 *
 * analyze() submits the study to the inference service and blocks until the
 * service reports completion. The service delivers its findings as
 * Structured Reports over DICOM; the storage listener hands those to
 * accept_result() while the study has an outstanding request. Findings are
 * then read back from the stored SRs.
 *
 * The inference connector is process-wide; create at most one engine.
 *
 * Requires pacs_system.
 */

#include "aipacs/analysis/analysis_engine.h"

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>

namespace pacs::core {
class dicom_dataset;
}  // namespace pacs::core

namespace aipacs::analysis {

struct ai_service_engine_config {
    /** Inference service base URL */
    std::string service_url;

    /** Model requested for every study */
    std::string model_id;

    std::chrono::milliseconds connection_timeout{30000};
    std::chrono::milliseconds polling_interval{2000};

    /** Storage for AI result objects */
    std::filesystem::path results_directory = "data/ai_results";
    std::filesystem::path results_database = "ai_results.db";

    [[nodiscard]] bool is_valid() const noexcept {
        return !service_url.empty() && !model_id.empty() &&
               !results_directory.empty() && !results_database.empty();
    }
};

class ai_service_engine : public analysis_engine {
public:
    /**
     * @brief Connect to the inference service and open the result store
     */
    [[nodiscard]] static std::expected<std::shared_ptr<ai_service_engine>, engine_failure>
    create(const ai_service_engine_config& config);

    ~ai_service_engine() override;

    ai_service_engine(const ai_service_engine&) = delete;
    ai_service_engine& operator=(const ai_service_engine&) = delete;

    [[nodiscard]] std::expected<std::vector<raw_finding>, engine_failure> analyze(
        const analysis_input& input, std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::string name() const override;

    /**
     * @brief Take an inbound dataset if it is a result for a pending study
     * @return true when the dataset was consumed
     */
    bool accept_result(const pacs::core::dicom_dataset& dataset);

    /**
     * @brief Studies with an outstanding inference request
     */
    [[nodiscard]] size_t pending_requests() const;

private:
    class impl;
    explicit ai_service_engine(std::unique_ptr<impl> pimpl);

    std::unique_ptr<impl> pimpl_;
};

}  // namespace aipacs::analysis

#endif  // AIPACS_ANALYSIS_AI_SERVICE_ENGINE_H
