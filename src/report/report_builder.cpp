/**
 * @file report_builder.cpp
 * @brief Report builder implementation
 */

#include "aipacs/report/report_builder.h"

#include <format>

namespace aipacs::report {

report_builder::report_builder(const builder_config& config) : config_(config) {
    register_template(make_json_template());
    register_template(make_text_template());
    register_template(make_html_template());
    register_template(make_dicom_sr_template());
}

void report_builder::register_template(std::shared_ptr<report_template> tmpl) {
    if (!tmpl) {
        return;
    }
    auto format = tmpl->format();
    templates_[format] = std::move(tmpl);
}

bool report_builder::has_format(std::string_view format) const {
    return templates_.find(format) != templates_.end();
}

std::vector<std::string> report_builder::formats() const {
    std::vector<std::string> result;
    result.reserve(templates_.size());
    for (const auto& [format, tmpl] : templates_) {
        result.push_back(format);
    }
    return result;
}

std::expected<report_artifact, report_failure> report_builder::build(
    const report_context& context) const {
    return build(context, config_.default_format);
}

std::expected<report_artifact, report_failure> report_builder::build(
    const report_context& context, std::string_view format) const {
    auto it = templates_.find(format);
    if (it == templates_.end()) {
        return std::unexpected(report_failure{
            report_error::unsupported_format,
            std::format("no template registered for format '{}'", format)});
    }
    if (context.study_uid.empty()) {
        return std::unexpected(report_failure{report_error::invalid_context,
                                              "report context has no study UID"});
    }

    report_context stamped = context;
    if (stamped.template_version.empty()) {
        stamped.template_version = config_.template_version;
    }

    std::expected<std::string, report_failure> rendered;
    try {
        rendered = it->second->render(stamped);
    } catch (const std::exception& e) {
        return std::unexpected(report_failure{report_error::template_error, e.what()});
    }
    if (!rendered) {
        return std::unexpected(rendered.error());
    }

    report_artifact artifact;
    artifact.format = it->first;
    artifact.content_type = it->second->content_type();
    artifact.template_version = stamped.template_version;
    artifact.payload = std::move(*rendered);
    artifact.finding_count = stamped.findings.size();
    return artifact;
}

}  // namespace aipacs::report
