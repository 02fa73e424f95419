#ifndef AIPACS_REPORT_REPORT_BUILDER_H
#define AIPACS_REPORT_REPORT_BUILDER_H

/**
 * @file report_builder.h
 * @brief Renders a job's findings into a report artifact
 *
 * Rendering is a pure function of the report context, the format tag and
 * the template version: identical inputs produce byte-identical payloads.
 * No wall-clock time is written into a payload.
 *
 * Built-in formats:
 *   - json      structured JSON document
 *   - text      plain text report
 *   - html      standalone HTML page
 *   - dicom_sr  sectioned text for a Basic Text SR (LOINC 18782-3)
 */

#include "aipacs/pipeline/pipeline_types.h"

#include <cstddef>
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace aipacs::report {

// =============================================================================
// Report Error Codes (-750 to -759)
// =============================================================================

/**
 * @brief Report builder error codes
 *
 * Allocated range: -750 to -759. None of them is retryable.
 */
enum class report_error : int {
    /** Template failed to render the context */
    template_error = -750,

    /** No template is registered for the requested format */
    unsupported_format = -751,

    /** Context is missing required fields */
    invalid_context = -752
};

[[nodiscard]] constexpr int to_error_code(report_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(report_error error) noexcept {
    switch (error) {
        case report_error::template_error:
            return "Report template error";
        case report_error::unsupported_format:
            return "Unsupported report format";
        case report_error::invalid_context:
            return "Invalid report context";
        default:
            return "Unknown report error";
    }
}

struct report_failure {
    report_error code = report_error::template_error;
    std::string message;
};

/** SOP Class UID of Basic Text SR */
inline constexpr std::string_view BASIC_TEXT_SR_SOP_CLASS =
    "1.2.840.10008.5.1.4.1.1.88.11";

/** LOINC code of the report document title */
inline constexpr std::string_view REPORT_TITLE_LOINC = "18782-3";

// =============================================================================
// Context / Artifact
// =============================================================================

/**
 * @brief Everything a template may render
 */
struct report_context {
    std::string job_id;
    std::string study_uid;
    std::string patient_id;
    std::string patient_name;
    std::string accession_number;
    std::string modality;

    std::vector<pipeline::finding> findings;
    double overall_confidence = 0.0;

    std::string model_version;
    std::string template_version;
};

/**
 * @brief Rendered report
 */
struct report_artifact {
    std::string format;
    std::string content_type;
    std::string template_version;
    std::string payload;
    std::size_t finding_count = 0;
};

// =============================================================================
// Template Interface
// =============================================================================

/**
 * @brief Renders one output format
 */
class report_template {
public:
    virtual ~report_template() = default;

    [[nodiscard]] virtual std::string format() const = 0;

    [[nodiscard]] virtual std::string content_type() const = 0;

    [[nodiscard]] virtual std::expected<std::string, report_failure> render(
        const report_context& context) const = 0;
};

[[nodiscard]] std::shared_ptr<report_template> make_json_template();
[[nodiscard]] std::shared_ptr<report_template> make_text_template();
[[nodiscard]] std::shared_ptr<report_template> make_html_template();
[[nodiscard]] std::shared_ptr<report_template> make_dicom_sr_template();

// =============================================================================
// Report Builder
// =============================================================================

struct builder_config {
    /** Format used when build() is called without one */
    std::string default_format = "dicom_sr";

    /** Template version stamped on every artifact */
    std::string template_version = "1.0";

    [[nodiscard]] bool is_valid() const noexcept {
        return !default_format.empty() && !template_version.empty();
    }
};

/**
 * @brief Format registry and rendering entry point
 *
 * The four built-in templates are registered on construction. Registration
 * is not synchronized with build(); register before sharing the builder.
 */
class report_builder {
public:
    explicit report_builder(const builder_config& config = {});

    /**
     * @brief Register or replace the template for its format tag
     */
    void register_template(std::shared_ptr<report_template> tmpl);

    [[nodiscard]] bool has_format(std::string_view format) const;

    [[nodiscard]] std::vector<std::string> formats() const;

    /**
     * @brief Render in the default format
     */
    [[nodiscard]] std::expected<report_artifact, report_failure> build(
        const report_context& context) const;

    [[nodiscard]] std::expected<report_artifact, report_failure> build(
        const report_context& context, std::string_view format) const;

    [[nodiscard]] const builder_config& config() const noexcept { return config_; }

private:
    builder_config config_;
    std::map<std::string, std::shared_ptr<report_template>, std::less<>> templates_;
};

}  // namespace aipacs::report

#endif  // AIPACS_REPORT_REPORT_BUILDER_H
