/**
 * @file status_server_test.cpp
 * @brief Unit tests for status endpoint routing and JSON rendering
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "aipacs/analysis/analysis_invoker.h"
#include "aipacs/delivery/delivery_sender.h"
#include "aipacs/monitoring/status_server.h"
#include "aipacs/pipeline/orchestrator.h"
#include "aipacs/report/report_builder.h"
#include "aipacs/storage/pipeline_store.h"

#include "utils/pipeline_fakes.h"
#include "utils/test_helpers.h"

#include <format>

namespace aipacs::monitoring {
namespace {

using namespace aipacs::test;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::ContainsRegex;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Not;
using ::testing::Return;

constexpr std::string_view kFailedStudy = "1.2.840.113619.2.55.3.999";

class StatusServerTest : public scratch_dir_test {
protected:
    void SetUp() override {
        scratch_dir_test::SetUp();
        storage::store_config store_cfg;
        store_cfg.database_path = db_path_;
        store_ = std::make_unique<storage::pipeline_store>(store_cfg);
        ASSERT_EXPECTED_OK(store_->open());

        engine_ = std::make_shared<NiceMock<mock_analysis_engine>>();
        ON_CALL(*engine_, name()).WillByDefault(Return("mock-engine"));
        archive_ = std::make_shared<NiceMock<mock_archive_client>>();
        ON_CALL(*archive_, store_report(_)).WillByDefault(Return(accepted_response()));

        invoker_ = std::make_unique<analysis::analysis_invoker>(engine_);
        builder_ = std::make_unique<report::report_builder>();
        sender_ = std::make_unique<delivery::delivery_sender>(archive_);

        auto config = pipeline::orchestrator_config_builder::create()
                          .workers(1)
                          .worker_id("status-test")
                          .report_format("json")
                          .build();
        orchestrator_ = std::make_unique<pipeline::pipeline_orchestrator>(
            config, *store_, *invoker_, *builder_, *sender_, [] { return 0.0; });
        server_ = std::make_unique<status_server>(*orchestrator_);
    }

    void TearDown() override {
        server_.reset();
        orchestrator_.reset();
        sender_.reset();
        builder_.reset();
        invoker_.reset();
        store_.reset();
        scratch_dir_test::TearDown();
    }

    void seed_ready_study(std::string_view study_uid) {
        ASSERT_EXPECTED_OK(store_->insert_instance(make_instance(1, study_uid),
                                                   make_metadata()));
        ASSERT_EXPECTED_OK(store_->touch_study(study_uid, std::chrono::system_clock::now()));
        ASSERT_EXPECTED_OK(store_->transition_study(study_uid, pipeline::study_state::collecting,
                                                    pipeline::study_state::ready));
    }

    /** Run one study to done and another to failed */
    void run_two_jobs() {
        EXPECT_CALL(*engine_, analyze(_, _))
            .WillOnce(Return(std::vector<analysis::raw_finding>{
                make_raw_finding("nodule", 0.93)}))
            .WillOnce(Return(std::unexpected(analysis::engine_failure{
                analysis::engine_error::rejected, "unsupported transfer syntax"})));

        seed_ready_study(samples::STUDY_UID);
        auto done = orchestrator_->request_job(samples::STUDY_UID);
        ASSERT_TRUE(done.has_value());
        done_job_ = done->job_id;
        ASSERT_EQ(orchestrator_->process_job(done_job_), pipeline::job_state::done);

        seed_ready_study(kFailedStudy);
        auto failed = orchestrator_->request_job(kFailedStudy);
        ASSERT_TRUE(failed.has_value());
        failed_job_ = failed->job_id;
        ASSERT_EQ(orchestrator_->process_job(failed_job_), pipeline::job_state::failed);
    }

    std::unique_ptr<storage::pipeline_store> store_;
    std::shared_ptr<NiceMock<mock_analysis_engine>> engine_;
    std::shared_ptr<NiceMock<mock_archive_client>> archive_;
    std::unique_ptr<analysis::analysis_invoker> invoker_;
    std::unique_ptr<report::report_builder> builder_;
    std::unique_ptr<delivery::delivery_sender> sender_;
    std::unique_ptr<pipeline::pipeline_orchestrator> orchestrator_;
    std::unique_ptr<status_server> server_;
    std::string done_job_;
    std::string failed_job_;
};

// =============================================================================
// Health
// =============================================================================

TEST_F(StatusServerTest, HealthWithoutProbesIsUp) {
    auto response = server_->handle_request("/health");
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.content_type, "application/json");
    EXPECT_THAT(response.body, HasSubstr("\"status\": \"UP\""));
}

TEST_F(StatusServerTest, DegradedComponentKeepsServing) {
    server_->register_probe([] {
        return component_health{"receiver", health_status::healthy, ""};
    });
    server_->register_probe([] {
        return component_health{"queue", health_status::degraded, "queue_depth=64"};
    });

    auto response = server_->handle_request("/health");
    EXPECT_EQ(response.status_code, 200);
    EXPECT_THAT(response.body, HasSubstr("\"status\": \"DEGRADED\""));
    EXPECT_THAT(response.body, HasSubstr("\"receiver\": {\"status\": \"UP\"}"));
    EXPECT_THAT(response.body, HasSubstr("\"details\": \"queue_depth=64\""));
}

TEST_F(StatusServerTest, UnhealthyComponentReturns503) {
    server_->register_probe([] {
        return component_health{"archive", health_status::unhealthy, "unreachable"};
    });

    auto response = server_->handle_request("/health");
    EXPECT_EQ(response.status_code, 503);
    EXPECT_THAT(response.body, HasSubstr("\"status\": \"DOWN\""));
}

// =============================================================================
// Jobs and studies
// =============================================================================

TEST_F(StatusServerTest, JobCountsCoverEveryState) {
    run_two_jobs();

    auto response = server_->handle_request("/jobs/counts");
    EXPECT_EQ(response.status_code, 200);
    for (auto state : pipeline::all_job_states) {
        EXPECT_THAT(response.body, HasSubstr(std::format("\"{}\"", pipeline::to_string(state))));
    }
    EXPECT_THAT(response.body, HasSubstr("\"done\": 1"));
    EXPECT_THAT(response.body, HasSubstr("\"failed\": 1"));
    EXPECT_THAT(response.body, HasSubstr("\"total\": 2"));
}

TEST_F(StatusServerTest, JobDetailIncludesReportAndHistory) {
    run_two_jobs();

    auto response = server_->handle_request("/jobs/" + done_job_);
    EXPECT_EQ(response.status_code, 200);
    EXPECT_THAT(response.body, HasSubstr("\"state\": \"done\""));
    EXPECT_THAT(response.body, HasSubstr("\"finding_count\": 1"));
    EXPECT_THAT(response.body, HasSubstr("\"delivery_state\": \"sent\""));
    EXPECT_THAT(response.body, HasSubstr("\"from\": null"));
    EXPECT_THAT(response.body, HasSubstr("\"to\": \"delivering\""));
}

TEST_F(StatusServerTest, TimestampsAreUtcWithMilliseconds) {
    run_two_jobs();

    auto response = server_->handle_request("/jobs/" + done_job_);
    EXPECT_EQ(response.status_code, 200);
    constexpr const char* iso_utc =
        "\"[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:[0-9]{2}\\.[0-9]{3}Z\"";
    EXPECT_THAT(response.body, ContainsRegex(std::string("\"created_at\": ") + iso_utc));
    EXPECT_THAT(response.body, ContainsRegex(std::string("\"finished_at\": ") + iso_utc));
    EXPECT_THAT(response.body, HasSubstr("\"lease_expires_at\": null"));
}

TEST_F(StatusServerTest, FailedJobCarriesErrorStage) {
    run_two_jobs();

    auto response = server_->handle_request("/jobs/" + failed_job_);
    EXPECT_EQ(response.status_code, 200);
    EXPECT_THAT(response.body, HasSubstr("\"state\": \"failed\""));
    EXPECT_THAT(response.body, HasSubstr("\"error_stage\": \"analyzing\""));
    EXPECT_THAT(response.body, HasSubstr("unsupported transfer syntax"));
    EXPECT_THAT(response.body, HasSubstr("\"report\": null"));
}

TEST_F(StatusServerTest, StudyDetailListsInstancesAndJobs) {
    run_two_jobs();

    auto response = server_->handle_request(std::format("/studies/{}/", samples::STUDY_UID));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_THAT(response.body, HasSubstr("\"state\": \"closed\""));
    EXPECT_THAT(response.body, HasSubstr("\"instance_count\": 1"));
    EXPECT_THAT(response.body, HasSubstr("\"active_job\": null"));
    EXPECT_THAT(response.body, HasSubstr(done_job_));
    EXPECT_THAT(response.body, HasSubstr(std::string(samples::PATIENT_ID)));
}

TEST_F(StatusServerTest, UnknownJobAndStudyAreNotFound) {
    EXPECT_EQ(server_->handle_request("/jobs/job-missing").status_code, 404);
    EXPECT_EQ(server_->handle_request("/studies/9.9.9").status_code, 404);
    EXPECT_EQ(server_->handle_request("/metrics").status_code, 404);
    EXPECT_EQ(server_->get_statistics().errors, 3u);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(StatusServerTest, FailuresListNewestFirst) {
    run_two_jobs();

    auto response = server_->handle_request("/failures");
    EXPECT_EQ(response.status_code, 200);
    EXPECT_THAT(response.body, HasSubstr("\"count\": 1"));
    EXPECT_THAT(response.body, HasSubstr(failed_job_));
    EXPECT_THAT(response.body, HasSubstr("\"stage\": \"analyzing\""));
    EXPECT_THAT(response.body, Not(HasSubstr(done_job_)));
}

TEST_F(StatusServerTest, FailureLimitIsApplied) {
    run_two_jobs();

    auto none = server_->handle_request("/failures?limit=0");
    EXPECT_EQ(none.status_code, 200);
    EXPECT_THAT(none.body, HasSubstr("\"count\": 0"));

    auto malformed = server_->handle_request("/failures?limit=ten");
    EXPECT_EQ(malformed.status_code, 400);
    EXPECT_THAT(malformed.body, HasSubstr("limit"));
}

// =============================================================================
// Serialization and lifecycle
// =============================================================================

TEST_F(StatusServerTest, StringsAreEscaped) {
    pipeline::failure_summary failure;
    failure.job_id = "job-1";
    failure.study_uid = "1.2.3";
    failure.reason = "archive said \"no\"\n";
    auto json = to_json(std::vector<pipeline::failure_summary>{failure});
    EXPECT_THAT(json, HasSubstr(R"("reason": "archive said \"no\"\n")"));
    EXPECT_THAT(json, HasSubstr("\"stage\": null"));
}

TEST_F(StatusServerTest, StartStopAndStatistics) {
    EXPECT_FALSE(server_->is_running());
    EXPECT_TRUE(server_->start());
    EXPECT_FALSE(server_->start());
    EXPECT_TRUE(server_->is_running());
    EXPECT_EQ(server_->port(), 8081);
    server_->stop();
    EXPECT_FALSE(server_->is_running());

    (void)server_->handle_request("/health");
    (void)server_->handle_request("/jobs/counts");
    (void)server_->handle_request("/failures");
    auto stats = server_->get_statistics();
    EXPECT_EQ(stats.total_requests, 3u);
    EXPECT_EQ(stats.health_requests, 1u);
    EXPECT_EQ(stats.job_requests, 1u);
    EXPECT_EQ(stats.failure_requests, 1u);
    EXPECT_EQ(stats.errors, 0u);
}

}  // namespace
}  // namespace aipacs::monitoring
