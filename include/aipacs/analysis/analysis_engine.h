#ifndef AIPACS_ANALYSIS_ANALYSIS_ENGINE_H
#define AIPACS_ANALYSIS_ANALYSIS_ENGINE_H

/**
 * @file analysis_engine.h
 * @brief Contract of the external analysis engine
 *
 * The engine is an opaque scoring function: it takes an ordered list of
 * instance payload references with a modality tag and returns raw findings
 * or a typed error. Engines are free to leave optional fields unset; the
 * analysis invoker fills them from per-modality defaults.
 */

#include <chrono>
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aipacs::analysis {

// =============================================================================
// Engine Error Codes (-740 to -749)
// =============================================================================

/**
 * @brief Analysis engine error codes
 *
 * Allocated range: -740 to -749
 */
enum class engine_error : int {
    /** Engine could not be reached or crashed */
    unavailable = -740,

    /** Engine did not answer within the timeout */
    timeout = -741,

    /** Engine refused the input as malformed */
    rejected = -742
};

[[nodiscard]] constexpr int to_error_code(engine_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(engine_error error) noexcept {
    switch (error) {
        case engine_error::unavailable:
            return "Analysis engine unavailable";
        case engine_error::timeout:
            return "Analysis engine timed out";
        case engine_error::rejected:
            return "Analysis engine rejected input";
        default:
            return "Unknown analysis engine error";
    }
}

/**
 * @brief Transient engine failures are worth another attempt
 */
[[nodiscard]] constexpr bool is_retryable(engine_error error) noexcept {
    return error == engine_error::unavailable || error == engine_error::timeout;
}

/**
 * @brief Engine error with detail text
 */
struct engine_failure {
    engine_error code = engine_error::unavailable;
    std::string message;
};

// =============================================================================
// Engine Input / Output
// =============================================================================

/**
 * @brief Input for one study analysis
 */
struct analysis_input {
    std::string study_uid;
    std::string modality;

    /** Payload references in series/receipt order */
    std::vector<std::filesystem::path> instance_paths;

    /** Instance UIDs, parallel to instance_paths */
    std::vector<std::string> instance_uids;
};

/**
 * @brief Finding as returned by an engine, before normalization
 */
struct raw_finding {
    std::string category;
    double confidence = 0.0;

    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> z;
    std::optional<double> width;
    std::optional<double> height;
    std::optional<double> depth;

    /** "low", "medium" or "high"; anything else is ignored */
    std::optional<std::string> severity;

    std::string description;
    std::map<std::string, double> measurements;
};

// =============================================================================
// Engine Interface
// =============================================================================

/**
 * @brief External analysis engine
 *
 * Implementations should honor @p timeout themselves where possible; the
 * invoker enforces it regardless.
 */
class analysis_engine {
public:
    virtual ~analysis_engine() = default;

    [[nodiscard]] virtual std::expected<std::vector<raw_finding>, engine_failure>
    analyze(const analysis_input& input, std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

}  // namespace aipacs::analysis

#endif  // AIPACS_ANALYSIS_ANALYSIS_ENGINE_H
