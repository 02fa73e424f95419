/**
 * @file report_builder_test.cpp
 * @brief Unit tests for report templates and the format registry
 */

#include <gtest/gtest.h>

#include "aipacs/report/report_builder.h"

#include "utils/pipeline_fakes.h"
#include "utils/test_helpers.h"

#include <limits>
#include <stdexcept>

namespace aipacs::report {
namespace {

using namespace aipacs::test;
using ::testing::HasSubstr;
using ::testing::Not;

class throwing_template : public report_template {
public:
    std::string format() const override { return "throws"; }
    std::string content_type() const override { return "text/plain"; }
    std::expected<std::string, report_failure> render(
        const report_context&) const override {
        throw std::runtime_error("template exploded");
    }
};

class ReportBuilderTest : public ai_pacs_test {
protected:
    report_context context_with(std::vector<pipeline::finding> findings) {
        report_context ctx;
        ctx.job_id = "job-1";
        ctx.study_uid = std::string(samples::STUDY_UID);
        ctx.patient_id = std::string(samples::PATIENT_ID);
        ctx.patient_name = std::string(samples::PATIENT_NAME);
        ctx.accession_number = std::string(samples::ACCESSION);
        ctx.modality = "CT";
        ctx.model_version = "2.1.0";
        ctx.findings = std::move(findings);
        double sum = 0.0;
        for (const auto& f : ctx.findings) sum += f.confidence;
        ctx.overall_confidence = ctx.findings.empty() ? 0.0 : sum / ctx.findings.size();
        return ctx;
    }

    report_builder builder_;
};

TEST_F(ReportBuilderTest, BuiltInFormatsAreRegistered) {
    EXPECT_TRUE(builder_.has_format("json"));
    EXPECT_TRUE(builder_.has_format("text"));
    EXPECT_TRUE(builder_.has_format("html"));
    EXPECT_TRUE(builder_.has_format("dicom_sr"));
    EXPECT_FALSE(builder_.has_format("pdf"));
    EXPECT_EQ(builder_.formats().size(), 4u);
}

TEST_F(ReportBuilderTest, DefaultFormatIsStructuredReport) {
    auto artifact = builder_.build(context_with({make_finding("nodule", 0.9)}));
    ASSERT_EXPECTED_OK(artifact);
    EXPECT_EQ(artifact->format, "dicom_sr");
    EXPECT_EQ(artifact->template_version, "1.0");
    EXPECT_THAT(artifact->payload, HasSubstr(std::string(REPORT_TITLE_LOINC)));
    EXPECT_THAT(artifact->payload, HasSubstr("IMPRESSION"));
}

TEST_F(ReportBuilderTest, JsonCarriesEveryFinding) {
    auto ctx = context_with({make_finding("nodule", 0.93, pipeline::severity::high),
                             make_finding("opacity", 0.85)});
    auto artifact = builder_.build(ctx, "json");
    ASSERT_EXPECTED_OK(artifact);
    EXPECT_EQ(artifact->content_type, "application/json");
    EXPECT_EQ(artifact->finding_count, 2u);
    EXPECT_THAT(artifact->payload, HasSubstr("\"findingCount\":2"));
    EXPECT_THAT(artifact->payload, HasSubstr("\"highSeverityCount\":1"));
    EXPECT_THAT(artifact->payload, HasSubstr("\"category\":\"nodule\""));
    EXPECT_THAT(artifact->payload, HasSubstr("\"diameter_mm\":7.5000"));
    EXPECT_THAT(artifact->payload, HasSubstr("Urgent radiologist review"));
}

TEST_F(ReportBuilderTest, JsonEscapesText) {
    auto ctx = context_with({});
    ctx.patient_name = "O\"BRIEN\\PAT";
    auto artifact = builder_.build(ctx, "json");
    ASSERT_EXPECTED_OK(artifact);
    EXPECT_THAT(artifact->payload, HasSubstr("O\\\"BRIEN\\\\PAT"));
}

TEST_F(ReportBuilderTest, HtmlEscapesMarkup) {
    auto finding = make_finding("mass", 0.9);
    finding.description = "<script>alert(1)</script>";
    auto artifact = builder_.build(context_with({finding}), "html");
    ASSERT_EXPECTED_OK(artifact);
    EXPECT_THAT(artifact->payload, HasSubstr("&lt;script&gt;"));
    EXPECT_THAT(artifact->payload, Not(HasSubstr("<script>")));
}

TEST_F(ReportBuilderTest, EmptyFindingsStillProduceReport) {
    auto artifact = builder_.build(context_with({}), "text");
    ASSERT_EXPECTED_OK(artifact);
    EXPECT_EQ(artifact->finding_count, 0u);
    EXPECT_THAT(artifact->payload, HasSubstr("No abnormality detected."));
}

TEST_F(ReportBuilderTest, RenderingIsDeterministic) {
    auto ctx = context_with({make_finding("nodule", 0.9), make_finding("mass", 0.95)});
    for (const auto& format : builder_.formats()) {
        auto first = builder_.build(ctx, format);
        auto second = builder_.build(ctx, format);
        ASSERT_EXPECTED_OK(first);
        ASSERT_EXPECTED_OK(second);
        EXPECT_EQ(first->payload, second->payload) << format;
    }
}

TEST_F(ReportBuilderTest, UnknownFormatIsRejected) {
    auto result = builder_.build(context_with({}), "pdf");
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, report_error::unsupported_format);
}

TEST_F(ReportBuilderTest, MissingStudyIsRejected) {
    auto ctx = context_with({});
    ctx.study_uid.clear();
    auto result = builder_.build(ctx, "json");
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, report_error::invalid_context);
}

TEST_F(ReportBuilderTest, UnrenderableFindingFails) {
    auto bad = make_finding("nodule", std::numeric_limits<double>::infinity());
    auto result = builder_.build(context_with({bad}), "text");
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, report_error::template_error);
}

TEST_F(ReportBuilderTest, RegisteredTemplateReplacesBuiltIn) {
    builder_.register_template(std::make_shared<failing_template>("json"));
    auto result = builder_.build(context_with({}), "json");
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().message, "renderer crashed");
    EXPECT_EQ(builder_.formats().size(), 4u);
}

TEST_F(ReportBuilderTest, ThrowingTemplateBecomesTemplateError) {
    builder_.register_template(std::make_shared<throwing_template>());
    auto result = builder_.build(context_with({}), "throws");
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, report_error::template_error);
    EXPECT_EQ(result.error().message, "template exploded");
}

TEST_F(ReportBuilderTest, ContextVersionOverridesConfigured) {
    builder_config cfg;
    cfg.template_version = "3.2";
    report_builder builder(cfg);

    auto ctx = context_with({});
    EXPECT_EQ(builder.build(ctx, "text")->template_version, "3.2");
    ctx.template_version = "9.0";
    EXPECT_EQ(builder.build(ctx, "text")->template_version, "9.0");
}

}  // namespace
}  // namespace aipacs::report
