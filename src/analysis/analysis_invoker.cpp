/**
 * @file analysis_invoker.cpp
 * @brief Analysis invoker and finding normalization
 */

#include "aipacs/analysis/analysis_invoker.h"

#include "aipacs/integration/logger_adapter.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <future>
#include <thread>

namespace aipacs::analysis {

namespace {

using engine_outcome = std::expected<std::vector<raw_finding>, engine_failure>;

constexpr std::array<std::string_view, 8> kTwoDimensionalModalities = {
    "CR", "DX", "MG", "US", "XA", "RF", "IO", "PX"};

double non_negative(std::optional<double> value, double fallback) {
    double v = value.value_or(fallback);
    if (!std::isfinite(v)) {
        return fallback;
    }
    return std::max(v, 0.0);
}

}  // namespace

// =============================================================================
// Normalization
// =============================================================================

bool is_two_dimensional(std::string_view modality) noexcept {
    return std::find(kTwoDimensionalModalities.begin(),
                     kTwoDimensionalModalities.end(),
                     modality) != kTwoDimensionalModalities.end();
}

std::string default_category(std::string_view modality) {
    if (modality == "CT") return "pulmonary_nodule";
    if (modality == "MR") return "brain_lesion";
    if (modality == "CR" || modality == "DX") return "pneumonia";
    if (modality == "MG") return "microcalcifications";
    return "abnormality";
}

pipeline::severity default_severity(std::string_view modality,
                                    double confidence) noexcept {
    using pipeline::severity;
    if (modality == "CT") {
        return confidence > 0.9 ? severity::medium : severity::low;
    }
    if (modality == "MR") {
        return confidence > 0.95 ? severity::high : severity::medium;
    }
    if (modality == "MG") {
        return confidence > 0.9 ? severity::high : severity::medium;
    }
    return severity::medium;
}

std::optional<pipeline::finding> normalize_finding(const raw_finding& raw,
                                                   std::string_view modality,
                                                   double threshold) {
    if (!std::isfinite(raw.confidence) || raw.confidence < 0.0 ||
        raw.confidence > 1.0) {
        return std::nullopt;
    }
    if (raw.confidence <= threshold) {
        return std::nullopt;
    }

    pipeline::finding result;
    result.category = raw.category.empty() ? default_category(modality) : raw.category;
    result.confidence = raw.confidence;

    result.location.x = non_negative(raw.x, 0.0);
    result.location.y = non_negative(raw.y, 0.0);
    result.location.width = non_negative(raw.width, 1.0);
    result.location.height = non_negative(raw.height, 1.0);
    if (is_two_dimensional(modality)) {
        result.location.z = 0.0;
        result.location.depth = 1.0;
    } else {
        result.location.z = non_negative(raw.z, 0.0);
        result.location.depth = non_negative(raw.depth, 1.0);
    }

    std::optional<pipeline::severity> parsed;
    if (raw.severity) {
        parsed = pipeline::parse_severity(*raw.severity);
    }
    result.level = parsed.value_or(default_severity(modality, raw.confidence));

    result.description =
        raw.description.empty()
            ? std::format("{} detected with {:.1f}% confidence", result.category,
                          raw.confidence * 100.0)
            : raw.description;
    result.measurements = raw.measurements;
    return result;
}

// =============================================================================
// analysis_invoker
// =============================================================================

analysis_invoker::analysis_invoker(std::shared_ptr<analysis_engine> engine,
                                   const invoker_config& config)
    : engine_(std::move(engine)), config_(config) {}

analysis_invoker::~analysis_invoker() = default;

analysis_input analysis_invoker::make_input(
    std::string_view study_uid, std::string_view modality,
    const std::vector<pipeline::instance_record>& instances) {
    analysis_input input;
    input.study_uid = study_uid;
    input.modality = modality;
    input.instance_paths.reserve(instances.size());
    input.instance_uids.reserve(instances.size());
    for (const auto& instance : instances) {
        input.instance_paths.push_back(instance.payload_path);
        input.instance_uids.push_back(instance.instance_uid);
        if (input.modality.empty()) {
            input.modality = instance.modality;
        }
    }
    return input;
}

std::expected<analysis_result, engine_failure> analysis_invoker::invoke(
    const analysis_input& input) {
    if (!engine_) {
        return std::unexpected(
            engine_failure{engine_error::unavailable, "no analysis engine configured"});
    }
    if (input.instance_paths.empty()) {
        return std::unexpected(engine_failure{
            engine_error::rejected,
            std::format("study {} has no instances to analyze", input.study_uid)});
    }

    auto started = std::chrono::steady_clock::now();

    // Detached; a result arriving after the timeout is discarded.
    auto promise = std::make_shared<std::promise<engine_outcome>>();
    auto future = promise->get_future();
    std::thread([engine = engine_, input, timeout = config_.timeout, promise] {
        try {
            promise->set_value(engine->analyze(input, timeout));
        } catch (const std::exception& e) {
            promise->set_value(std::unexpected(
                engine_failure{engine_error::unavailable, e.what()}));
        } catch (...) {
            promise->set_value(std::unexpected(engine_failure{
                engine_error::unavailable, "analysis engine raised unknown exception"}));
        }
    }).detach();

    if (future.wait_for(config_.timeout) != std::future_status::ready) {
        integration::get_logger().warning(std::format(
            "study={} engine={} timed out after {}ms", input.study_uid,
            engine_->name(), config_.timeout.count()));
        return std::unexpected(engine_failure{
            engine_error::timeout,
            std::format("no response within {}ms", config_.timeout.count())});
    }

    auto outcome = future.get();
    if (!outcome) {
        return std::unexpected(outcome.error());
    }

    analysis_result result;
    result.engine_name = engine_->name();
    double confidence_sum = 0.0;
    for (const auto& raw : *outcome) {
        auto normalized =
            normalize_finding(raw, input.modality, config_.confidence_threshold);
        if (!normalized) {
            result.dropped_count++;
            if (!std::isfinite(raw.confidence) || raw.confidence < 0.0 ||
                raw.confidence > 1.0) {
                integration::get_logger().warning(std::format(
                    "study={} dropped finding with out-of-range confidence {}",
                    input.study_uid, raw.confidence));
            }
            continue;
        }
        confidence_sum += normalized->confidence;
        result.findings.push_back(std::move(*normalized));
    }

    if (!result.findings.empty()) {
        result.overall_confidence =
            confidence_sum / static_cast<double>(result.findings.size());
    }
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    integration::get_logger().info(std::format(
        "study={} engine={} findings={} dropped={} duration={}ms", input.study_uid,
        result.engine_name, result.findings.size(), result.dropped_count,
        result.duration.count()));
    return result;
}

const invoker_config& analysis_invoker::config() const noexcept { return config_; }

std::string analysis_invoker::engine_name() const {
    return engine_ ? engine_->name() : std::string{};
}

}  // namespace aipacs::analysis
