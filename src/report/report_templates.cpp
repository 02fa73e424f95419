/**
 * @file report_templates.cpp
 * @brief Built-in deterministic report templates
 */

#include "aipacs/report/report_builder.h"

#include <cmath>
#include <cstdio>
#include <format>
#include <sstream>

namespace aipacs::report {

namespace {

/**
 * @brief Escape a string for JSON
 */
std::string escape_json(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 10);

    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x",
                             static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }

    return result;
}

std::string escape_html(std::string_view str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&#39;"; break;
            default: result += c;
        }
    }
    return result;
}

size_t count_high(const report_context& context) {
    size_t high = 0;
    for (const auto& f : context.findings) {
        if (f.level == pipeline::severity::high) ++high;
    }
    return high;
}

std::string conclusion(const report_context& context) {
    if (context.findings.empty()) {
        return "No abnormality detected.";
    }
    auto high = count_high(context);
    if (high > 0) {
        return std::format(
            "Urgent radiologist review recommended: {} high severity finding(s).",
            high);
    }
    return "Findings require radiologist validation.";
}

std::string percent(double value) {
    return std::format("{:.1f}%", value * 100.0);
}

std::expected<void, report_failure> check_findings(const report_context& context) {
    for (size_t i = 0; i < context.findings.size(); ++i) {
        const auto& f = context.findings[i];
        if (!std::isfinite(f.confidence) || f.category.empty()) {
            return std::unexpected(report_failure{
                report_error::template_error,
                std::format("finding {} cannot be rendered", i + 1)});
        }
    }
    return {};
}

std::string location_text(const pipeline::spatial_location& loc) {
    return std::format("x={:.1f} y={:.1f} z={:.1f} size={:.1f}x{:.1f}x{:.1f}", loc.x,
                       loc.y, loc.z, loc.width, loc.height, loc.depth);
}

/**
 * @brief Plain-text body shared by the text and dicom_sr templates
 */
void write_text_sections(std::ostringstream& oss, const report_context& context,
                         std::string_view findings_heading,
                         std::string_view conclusion_heading) {
    oss << "SUMMARY\n";
    oss << "  Findings: " << context.findings.size() << '\n';
    oss << "  High severity: " << count_high(context) << '\n';
    oss << "  Overall confidence: " << percent(context.overall_confidence) << "\n\n";

    oss << findings_heading << '\n';
    if (context.findings.empty()) {
        oss << "  None.\n";
    }
    for (size_t i = 0; i < context.findings.size(); ++i) {
        const auto& f = context.findings[i];
        oss << std::format("  {}. {} [{}] confidence {}\n", i + 1, f.category,
                           pipeline::to_string(f.level), percent(f.confidence));
        oss << "     Location: " << location_text(f.location) << '\n';
        oss << "     " << f.description << '\n';
        for (const auto& [name, value] : f.measurements) {
            oss << std::format("     {}: {:.3f}\n", name, value);
        }
    }
    oss << '\n';

    oss << conclusion_heading << '\n';
    oss << "  " << conclusion(context) << '\n';
}

// =============================================================================
// json
// =============================================================================

class json_template : public report_template {
public:
    std::string format() const override { return "json"; }
    std::string content_type() const override { return "application/json"; }

    std::expected<std::string, report_failure> render(
        const report_context& context) const override {
        if (auto ok = check_findings(context); !ok) {
            return std::unexpected(ok.error());
        }

        std::ostringstream oss;
        oss << "{\"report\":{";
        oss << "\"title\":\"AI Analysis Report\",";
        oss << "\"templateVersion\":\"" << escape_json(context.template_version) << "\",";
        oss << "\"modelVersion\":\"" << escape_json(context.model_version) << "\",";
        oss << "\"jobId\":\"" << escape_json(context.job_id) << "\",";
        oss << "\"study\":{";
        oss << "\"studyInstanceUid\":\"" << escape_json(context.study_uid) << "\",";
        oss << "\"patientId\":\"" << escape_json(context.patient_id) << "\",";
        oss << "\"patientName\":\"" << escape_json(context.patient_name) << "\",";
        oss << "\"accessionNumber\":\"" << escape_json(context.accession_number) << "\",";
        oss << "\"modality\":\"" << escape_json(context.modality) << "\"},";
        oss << "\"summary\":{";
        oss << "\"findingCount\":" << context.findings.size() << ',';
        oss << "\"highSeverityCount\":" << count_high(context) << ',';
        oss << std::format("\"overallConfidence\":{:.4f}", context.overall_confidence);
        oss << "},\"findings\":[";
        for (size_t i = 0; i < context.findings.size(); ++i) {
            const auto& f = context.findings[i];
            if (i > 0) oss << ',';
            oss << '{';
            oss << "\"index\":" << (i + 1) << ',';
            oss << "\"category\":\"" << escape_json(f.category) << "\",";
            oss << std::format("\"confidence\":{:.4f},", f.confidence);
            oss << "\"severity\":\"" << pipeline::to_string(f.level) << "\",";
            oss << std::format(
                "\"location\":{{\"x\":{:.2f},\"y\":{:.2f},\"z\":{:.2f},"
                "\"width\":{:.2f},\"height\":{:.2f},\"depth\":{:.2f}}},",
                f.location.x, f.location.y, f.location.z, f.location.width,
                f.location.height, f.location.depth);
            oss << "\"description\":\"" << escape_json(f.description) << "\",";
            oss << "\"measurements\":{";
            bool first = true;
            for (const auto& [name, value] : f.measurements) {
                if (!first) oss << ',';
                first = false;
                oss << '"' << escape_json(name) << "\":" << std::format("{:.4f}", value);
            }
            oss << "}}";
        }
        oss << "],";
        oss << "\"conclusion\":\"" << escape_json(conclusion(context)) << "\"";
        oss << "}}";
        return oss.str();
    }
};

// =============================================================================
// text
// =============================================================================

class text_template : public report_template {
public:
    std::string format() const override { return "text"; }
    std::string content_type() const override { return "text/plain; charset=utf-8"; }

    std::expected<std::string, report_failure> render(
        const report_context& context) const override {
        if (auto ok = check_findings(context); !ok) {
            return std::unexpected(ok.error());
        }

        std::ostringstream oss;
        oss << "AI ANALYSIS REPORT\n";
        oss << "==================\n";
        oss << "Study UID: " << context.study_uid << '\n';
        oss << "Patient: " << context.patient_name << " (" << context.patient_id << ")\n";
        oss << "Accession: " << context.accession_number << '\n';
        oss << "Modality: " << context.modality << '\n';
        oss << "Model version: " << context.model_version << '\n';
        oss << "Template version: " << context.template_version << "\n\n";
        write_text_sections(oss, context, "FINDINGS", "CONCLUSION");
        return oss.str();
    }
};

// =============================================================================
// html
// =============================================================================

class html_template : public report_template {
public:
    std::string format() const override { return "html"; }
    std::string content_type() const override { return "text/html; charset=utf-8"; }

    std::expected<std::string, report_failure> render(
        const report_context& context) const override {
        if (auto ok = check_findings(context); !ok) {
            return std::unexpected(ok.error());
        }

        std::ostringstream oss;
        oss << "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n";
        oss << "<title>AI Analysis Report</title>\n</head>\n<body>\n";
        oss << "<h1>AI Analysis Report</h1>\n";
        oss << "<table class=\"study\">\n";
        oss << "<tr><th>Study UID</th><td>" << escape_html(context.study_uid)
            << "</td></tr>\n";
        oss << "<tr><th>Patient</th><td>" << escape_html(context.patient_name) << " ("
            << escape_html(context.patient_id) << ")</td></tr>\n";
        oss << "<tr><th>Accession</th><td>" << escape_html(context.accession_number)
            << "</td></tr>\n";
        oss << "<tr><th>Modality</th><td>" << escape_html(context.modality)
            << "</td></tr>\n";
        oss << "<tr><th>Model version</th><td>" << escape_html(context.model_version)
            << "</td></tr>\n";
        oss << "</table>\n";

        oss << "<h2>Summary</h2>\n<ul>\n";
        oss << "<li>Findings: " << context.findings.size() << "</li>\n";
        oss << "<li>High severity: " << count_high(context) << "</li>\n";
        oss << "<li>Overall confidence: " << percent(context.overall_confidence)
            << "</li>\n</ul>\n";

        oss << "<h2>Findings</h2>\n";
        if (context.findings.empty()) {
            oss << "<p>None.</p>\n";
        } else {
            oss << "<ol>\n";
            for (const auto& f : context.findings) {
                oss << "<li class=\"severity-" << pipeline::to_string(f.level) << "\">";
                oss << "<strong>" << escape_html(f.category) << "</strong> ["
                    << pipeline::to_string(f.level) << "] confidence "
                    << percent(f.confidence) << "<br>";
                oss << escape_html(location_text(f.location)) << "<br>";
                oss << escape_html(f.description);
                for (const auto& [name, value] : f.measurements) {
                    oss << "<br>" << escape_html(name) << ": "
                        << std::format("{:.3f}", value);
                }
                oss << "</li>\n";
            }
            oss << "</ol>\n";
        }

        oss << "<h2>Conclusion</h2>\n<p>" << escape_html(conclusion(context))
            << "</p>\n";
        oss << "<footer>Template " << escape_html(context.template_version)
            << "</footer>\n</body>\n</html>\n";
        return oss.str();
    }
};

// =============================================================================
// dicom_sr
// =============================================================================

class dicom_sr_template : public report_template {
public:
    std::string format() const override { return "dicom_sr"; }
    std::string content_type() const override { return "text/plain; charset=utf-8"; }

    std::expected<std::string, report_failure> render(
        const report_context& context) const override {
        if (auto ok = check_findings(context); !ok) {
            return std::unexpected(ok.error());
        }

        std::ostringstream oss;
        oss << "Radiology Report (LOINC " << REPORT_TITLE_LOINC << ")\n";
        oss << "SOP Class: " << BASIC_TEXT_SR_SOP_CLASS << '\n';
        oss << "Study Instance UID: " << context.study_uid << '\n';
        oss << "Accession Number: " << context.accession_number << '\n';
        oss << "Modality: " << context.modality << '\n';
        oss << "Algorithm Version: " << context.model_version << '\n';
        oss << "Template Version: " << context.template_version << "\n\n";
        write_text_sections(oss, context, "FINDINGS", "IMPRESSION");
        return oss.str();
    }
};

}  // namespace

std::shared_ptr<report_template> make_json_template() {
    return std::make_shared<json_template>();
}

std::shared_ptr<report_template> make_text_template() {
    return std::make_shared<text_template>();
}

std::shared_ptr<report_template> make_html_template() {
    return std::make_shared<html_template>();
}

std::shared_ptr<report_template> make_dicom_sr_template() {
    return std::make_shared<dicom_sr_template>();
}

}  // namespace aipacs::report
