/**
 * @file analysis_invoker_test.cpp
 * @brief Unit tests for engine invocation and finding normalization
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "aipacs/analysis/analysis_invoker.h"

#include "utils/pipeline_fakes.h"
#include "utils/test_helpers.h"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <thread>

namespace aipacs::analysis {
namespace {

using namespace aipacs::test;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

/**
 * @brief Engine that answers after a fixed delay
 */
class slow_engine : public analysis_engine {
public:
    explicit slow_engine(std::chrono::milliseconds delay) : delay_(delay) {}

    std::expected<std::vector<raw_finding>, engine_failure> analyze(
        const analysis_input&, std::chrono::milliseconds) override {
        std::this_thread::sleep_for(delay_);
        return std::vector<raw_finding>{};
    }

    std::string name() const override { return "slow"; }

private:
    std::chrono::milliseconds delay_;
};

class AnalysisInvokerTest : public ai_pacs_test {
protected:
    void SetUp() override {
        engine_ = std::make_shared<NiceMock<mock_analysis_engine>>();
        ON_CALL(*engine_, name()).WillByDefault(Return("mock-engine"));
    }

    analysis_input ct_input(int count = 2) {
        std::vector<pipeline::instance_record> instances;
        for (int i = 1; i <= count; ++i) {
            instances.push_back(make_instance(i));
        }
        return analysis_invoker::make_input(samples::STUDY_UID, "CT", instances);
    }

    std::shared_ptr<NiceMock<mock_analysis_engine>> engine_;
};

// =============================================================================
// Normalization
// =============================================================================

TEST_F(AnalysisInvokerTest, TwoDimensionalModalities) {
    EXPECT_TRUE(is_two_dimensional("CR"));
    EXPECT_TRUE(is_two_dimensional("MG"));
    EXPECT_FALSE(is_two_dimensional("CT"));
    EXPECT_FALSE(is_two_dimensional("MR"));
}

TEST_F(AnalysisInvokerTest, PerModalityDefaults) {
    EXPECT_EQ(default_category("CT"), "pulmonary_nodule");
    EXPECT_EQ(default_category("MR"), "brain_lesion");
    EXPECT_EQ(default_category("DX"), "pneumonia");
    EXPECT_EQ(default_category("OT"), "abnormality");

    EXPECT_EQ(default_severity("CT", 0.95), pipeline::severity::medium);
    EXPECT_EQ(default_severity("CT", 0.85), pipeline::severity::low);
    EXPECT_EQ(default_severity("MR", 0.96), pipeline::severity::high);
    EXPECT_EQ(default_severity("MG", 0.91), pipeline::severity::high);
}

TEST_F(AnalysisInvokerTest, ThresholdIsExclusive) {
    raw_finding raw = make_raw_finding("nodule", 0.8);
    EXPECT_FALSE(normalize_finding(raw, "CT", 0.8).has_value());
    raw.confidence = 0.81;
    EXPECT_TRUE(normalize_finding(raw, "CT", 0.8).has_value());
}

TEST_F(AnalysisInvokerTest, OutOfRangeConfidenceIsDropped) {
    raw_finding raw = make_raw_finding("nodule", 1.2);
    EXPECT_FALSE(normalize_finding(raw, "CT", 0.0).has_value());
    raw.confidence = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(normalize_finding(raw, "CT", 0.0).has_value());
}

TEST_F(AnalysisInvokerTest, MissingFieldsAreFilled) {
    raw_finding raw;
    raw.confidence = 0.97;
    auto finding = normalize_finding(raw, "MR", 0.8);
    ASSERT_TRUE(finding.has_value());
    EXPECT_EQ(finding->category, "brain_lesion");
    EXPECT_EQ(finding->level, pipeline::severity::high);
    EXPECT_DOUBLE_EQ(finding->location.width, 1.0);
    EXPECT_DOUBLE_EQ(finding->location.depth, 1.0);
    EXPECT_THAT(finding->description, ContainsSubstring("97.0%"));
}

TEST_F(AnalysisInvokerTest, TwoDimensionalFindingsHaveUnitDepth) {
    raw_finding raw = make_raw_finding("mass", 0.9);
    raw.z = 14.0;
    raw.depth = 6.0;
    auto finding = normalize_finding(raw, "MG", 0.8);
    ASSERT_TRUE(finding.has_value());
    EXPECT_DOUBLE_EQ(finding->location.z, 0.0);
    EXPECT_DOUBLE_EQ(finding->location.depth, 1.0);
}

TEST_F(AnalysisInvokerTest, NegativeGeometryIsClamped) {
    raw_finding raw = make_raw_finding("nodule", 0.9);
    raw.x = -3.0;
    raw.width = -1.0;
    auto finding = normalize_finding(raw, "CT", 0.8);
    ASSERT_TRUE(finding.has_value());
    EXPECT_DOUBLE_EQ(finding->location.x, 0.0);
    EXPECT_DOUBLE_EQ(finding->location.width, 0.0);
}

TEST_F(AnalysisInvokerTest, EngineSeverityWinsWhenRecognized) {
    raw_finding raw = make_raw_finding("nodule", 0.85);
    raw.severity = "high";
    EXPECT_EQ(normalize_finding(raw, "CT", 0.8)->level, pipeline::severity::high);
    raw.severity = "urgent";
    EXPECT_EQ(normalize_finding(raw, "CT", 0.8)->level, pipeline::severity::low);
}

// =============================================================================
// Invocation
// =============================================================================

TEST_F(AnalysisInvokerTest, MakeInputPreservesOrder) {
    auto input = ct_input(3);
    EXPECT_EQ(input.study_uid, samples::STUDY_UID);
    EXPECT_EQ(input.modality, "CT");
    ASSERT_EQ(input.instance_uids.size(), 3u);
    EXPECT_EQ(input.instance_uids[0], make_instance(1).instance_uid);
    EXPECT_EQ(input.instance_paths[2], make_instance(3).payload_path);
}

TEST_F(AnalysisInvokerTest, FiltersAndAveragesFindings) {
    EXPECT_CALL(*engine_, analyze(_, _))
        .WillOnce(Return(std::vector<raw_finding>{make_raw_finding("nodule", 0.9),
                                                  make_raw_finding("opacity", 0.5),
                                                  make_raw_finding("mass", 0.95)}));

    analysis_invoker invoker(engine_);
    auto result = invoker.invoke(ct_input());
    ASSERT_EXPECTED_OK(result);
    ASSERT_EQ(result->findings.size(), 2u);
    EXPECT_EQ(result->findings[0].category, "nodule");
    EXPECT_EQ(result->findings[1].category, "mass");
    EXPECT_EQ(result->dropped_count, 1u);
    EXPECT_NEAR(result->overall_confidence, 0.925, 1e-9);
    EXPECT_EQ(result->engine_name, "mock-engine");
}

TEST_F(AnalysisInvokerTest, NoFindingsIsSuccess) {
    EXPECT_CALL(*engine_, analyze(_, _)).WillOnce(Return(std::vector<raw_finding>{}));

    analysis_invoker invoker(engine_);
    auto result = invoker.invoke(ct_input());
    ASSERT_EXPECTED_OK(result);
    EXPECT_TRUE(result->findings.empty());
    EXPECT_DOUBLE_EQ(result->overall_confidence, 0.0);
}

TEST_F(AnalysisInvokerTest, EngineErrorIsPropagated) {
    EXPECT_CALL(*engine_, analyze(_, _))
        .WillOnce(Return(std::unexpected(
            engine_failure{engine_error::unavailable, "connection refused"})));

    analysis_invoker invoker(engine_);
    auto result = invoker.invoke(ct_input());
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, engine_error::unavailable);
    EXPECT_EQ(result.error().message, "connection refused");
    EXPECT_TRUE(is_retryable(result.error().code));
}

TEST_F(AnalysisInvokerTest, EngineExceptionBecomesUnavailable) {
    EXPECT_CALL(*engine_, analyze(_, _))
        .WillOnce([](const analysis_input&, std::chrono::milliseconds)
                      -> std::expected<std::vector<raw_finding>, engine_failure> {
            throw std::runtime_error("segfault in model");
        });

    analysis_invoker invoker(engine_);
    auto result = invoker.invoke(ct_input());
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, engine_error::unavailable);
    EXPECT_EQ(result.error().message, "segfault in model");
}

TEST_F(AnalysisInvokerTest, EmptyStudyIsRejectedWithoutCallingEngine) {
    EXPECT_CALL(*engine_, analyze(_, _)).Times(0);

    analysis_invoker invoker(engine_);
    auto result = invoker.invoke(analysis_invoker::make_input(samples::STUDY_UID, "CT", {}));
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, engine_error::rejected);
    EXPECT_FALSE(is_retryable(result.error().code));
}

TEST_F(AnalysisInvokerTest, MissingEngineIsUnavailable) {
    analysis_invoker invoker(nullptr);
    auto result = invoker.invoke(ct_input());
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, engine_error::unavailable);
    EXPECT_TRUE(invoker.engine_name().empty());
}

TEST_F(AnalysisInvokerTest, SlowEngineTimesOut) {
    invoker_config cfg;
    cfg.timeout = 30ms;
    analysis_invoker invoker(std::make_shared<slow_engine>(300ms), cfg);

    scoped_timer timer;
    auto result = invoker.invoke(ct_input());
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, engine_error::timeout);
    EXPECT_LT(timer.elapsed_ms(), 250);
}

TEST_F(AnalysisInvokerTest, ConfigValidation) {
    invoker_config cfg;
    EXPECT_TRUE(cfg.is_valid());
    EXPECT_DOUBLE_EQ(cfg.confidence_threshold, 0.8);
    cfg.confidence_threshold = 1.5;
    EXPECT_FALSE(cfg.is_valid());
    cfg.confidence_threshold = 0.8;
    cfg.timeout = 0ms;
    EXPECT_FALSE(cfg.is_valid());
}

}  // namespace
}  // namespace aipacs::analysis
