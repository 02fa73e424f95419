#ifndef AIPACS_ANALYSIS_ANALYSIS_INVOKER_H
#define AIPACS_ANALYSIS_ANALYSIS_INVOKER_H

/**
 * @file analysis_invoker.h
 * @brief Adapts studies to the analysis engine and normalizes its output
 */

#include "aipacs/analysis/analysis_engine.h"
#include "aipacs/pipeline/pipeline_types.h"

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace aipacs::analysis {

/**
 * @brief Analysis invoker configuration
 */
struct invoker_config {
    /** Upper bound on one engine call */
    std::chrono::milliseconds timeout{120000};

    /** Findings at or below this confidence are dropped */
    double confidence_threshold = 0.8;

    /** Model version recorded in reports */
    std::string model_version = "1.0.0";

    [[nodiscard]] bool is_valid() const noexcept {
        if (timeout.count() <= 0) return false;
        if (confidence_threshold < 0.0 || confidence_threshold > 1.0) return false;
        return true;
    }
};

/**
 * @brief Normalized analysis outcome
 */
struct analysis_result {
    std::vector<pipeline::finding> findings;

    /** Mean confidence of kept findings, 0.0 when none */
    double overall_confidence = 0.0;

    /** Raw findings discarded by threshold or range checks */
    std::size_t dropped_count = 0;

    std::string engine_name;
    std::chrono::milliseconds duration{0};
};

// =============================================================================
// Normalization Helpers
// =============================================================================

/**
 * @brief Modalities whose images have no depth axis
 */
[[nodiscard]] bool is_two_dimensional(std::string_view modality) noexcept;

/**
 * @brief Category used when an engine omits one
 */
[[nodiscard]] std::string default_category(std::string_view modality);

/**
 * @brief Severity used when an engine omits one
 */
[[nodiscard]] pipeline::severity default_severity(std::string_view modality,
                                                  double confidence) noexcept;

/**
 * @brief Convert one raw finding; std::nullopt if it must be dropped
 */
[[nodiscard]] std::optional<pipeline::finding> normalize_finding(
    const raw_finding& raw, std::string_view modality, double threshold);

// =============================================================================
// Analysis Invoker
// =============================================================================

/**
 * @brief Runs the engine with a bounded timeout
 *
 * Thread-safe; concurrent workers may share one invoker.
 *
 * @example
 * ```cpp
 * analysis_invoker invoker(engine, invoker_config{.timeout = 30s});
 * auto result = invoker.invoke(input);
 * if (!result && is_retryable(result.error().code)) {
 *     // schedule retry
 * }
 * ```
 */
class analysis_invoker {
public:
    analysis_invoker(std::shared_ptr<analysis_engine> engine,
                     const invoker_config& config = {});
    ~analysis_invoker();

    analysis_invoker(const analysis_invoker&) = delete;
    analysis_invoker& operator=(const analysis_invoker&) = delete;

    /**
     * @brief Build engine input from a study's instances
     */
    [[nodiscard]] static analysis_input make_input(
        std::string_view study_uid, std::string_view modality,
        const std::vector<pipeline::instance_record>& instances);

    /**
     * @brief Invoke the engine and normalize its findings
     *
     * An empty instance list is rejected without calling the engine.
     */
    [[nodiscard]] std::expected<analysis_result, engine_failure> invoke(
        const analysis_input& input);

    [[nodiscard]] const invoker_config& config() const noexcept;

    [[nodiscard]] std::string engine_name() const;

private:
    std::shared_ptr<analysis_engine> engine_;
    invoker_config config_;
};

}  // namespace aipacs::analysis

#endif  // AIPACS_ANALYSIS_ANALYSIS_INVOKER_H
