/**
 * @file pipeline_store_test.cpp
 * @brief Unit tests for the SQLite pipeline store
 *
 * Covers idempotent instance storage, the one-active-job rule, lease
 * guarded transitions, retry scheduling, terminal writes and the
 * observability queries.
 */

#include <gtest/gtest.h>

#include "aipacs/storage/pipeline_store.h"

#include "utils/pipeline_fakes.h"
#include "utils/test_helpers.h"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace aipacs::storage {
namespace {

using namespace aipacs::test;
using namespace std::chrono_literals;

class PipelineStoreTest : public scratch_dir_test {
protected:
    void SetUp() override {
        scratch_dir_test::SetUp();
        store_ = std::make_unique<pipeline_store>(config());
        ASSERT_EXPECTED_OK(store_->open());
    }

    void TearDown() override {
        store_.reset();
        scratch_dir_test::TearDown();
    }

    store_config config() const {
        store_config cfg;
        cfg.database_path = db_path_;
        return cfg;
    }

    /** Insert @p count instances and mark the study ready */
    void seed_ready_study(int count, std::string_view study_uid = samples::STUDY_UID) {
        for (int i = 1; i <= count; ++i) {
            auto r = store_->insert_instance(make_instance(i, study_uid), make_metadata());
            ASSERT_EXPECTED_OK(r);
        }
        ASSERT_EXPECTED_OK(store_->touch_study(study_uid, std::chrono::system_clock::now()));
        ASSERT_EXPECTED_OK(store_->transition_study(study_uid, study_state::collecting,
                                                    study_state::ready));
    }

    /** Create, admit and claim a job; returns its lease */
    lease_token start_job(std::string_view study_uid = samples::STUDY_UID,
                          std::chrono::milliseconds lease = 60s) {
        auto job = store_->create_job(study_uid);
        EXPECT_TRUE(job.has_value());
        if (!job) return {};
        EXPECT_TRUE(store_->admit_job(job->job_id).has_value());
        auto claimed = store_->claim_job(job->job_id, "worker-1", lease);
        EXPECT_TRUE(claimed.has_value());
        if (!claimed) return {};
        return {claimed->job_id, claimed->lease_owner, claimed->lease_generation};
    }

    report_record sample_report() const {
        report_record report;
        report.format = "json";
        report.template_version = "1.0";
        report.content_type = "application/json";
        report.payload = std::string("{\"findings\":[]}\0tail", 20);
        report.finding_count = 2;
        return report;
    }

    std::unique_ptr<pipeline_store> store_;
};

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(PipelineStoreTest, OpenTwiceFails) {
    auto result = store_->open();
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), store_error::already_open);
}

TEST_F(PipelineStoreTest, OperationsOnClosedStoreFail) {
    store_->close();
    EXPECT_FALSE(store_->is_open());
    auto result = store_->create_job(samples::STUDY_UID);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), store_error::not_open);
    EXPECT_FALSE(store_->get_study(samples::STUDY_UID).has_value());
}

TEST_F(PipelineStoreTest, InvalidConfigIsRejected) {
    store_config cfg;
    cfg.database_path.clear();
    pipeline_store store(cfg);
    auto result = store.open();
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), store_error::invalid_argument);
}

TEST_F(PipelineStoreTest, ErrorCodesAreInRange) {
    EXPECT_EQ(to_error_code(store_error::database_error), -710);
    EXPECT_EQ(to_error_code(store_error::duplicate_report), -719);
    EXPECT_STREQ(to_string(store_error::active_job_exists),
                 "Study already has an active job");
}

// =============================================================================
// Instances and Studies
// =============================================================================

TEST_F(PipelineStoreTest, InsertInstanceIsIdempotent) {
    auto instance = make_instance(1);
    auto first = store_->insert_instance(instance, make_metadata());
    ASSERT_EXPECTED_OK(first);
    EXPECT_EQ(*first, insert_outcome::inserted);

    auto second = store_->insert_instance(instance, make_metadata());
    ASSERT_EXPECTED_OK(second);
    EXPECT_EQ(*second, insert_outcome::duplicate);

    EXPECT_EQ(store_->get_study_instances(samples::STUDY_UID).size(), 1u);
    EXPECT_TRUE(store_->get_instance(instance.instance_uid).has_value());
}

TEST_F(PipelineStoreTest, InsertInstanceRequiresIdentifiers) {
    auto instance = make_instance(1);
    instance.series_uid.clear();
    auto result = store_->insert_instance(instance, make_metadata());
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), store_error::invalid_argument);
}

TEST_F(PipelineStoreTest, FirstInstanceCreatesCollectingStudy) {
    auto instance = make_instance(1);
    ASSERT_EXPECTED_OK(store_->insert_instance(instance, make_metadata()));

    auto study = store_->get_study(samples::STUDY_UID);
    ASSERT_TRUE(study.has_value());
    EXPECT_EQ(study->state, study_state::collecting);
    EXPECT_EQ(study->metadata.patient_id, samples::PATIENT_ID);
    EXPECT_EQ(study->metadata.modality, "CT");
    ASSERT_EQ(study->instance_uids.size(), 1u);
    EXPECT_EQ(study->instance_uids[0], instance.instance_uid);

    auto stored = store_->get_instance(instance.instance_uid);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->payload_path, instance.payload_path);
    EXPECT_EQ(stored->payload_size, 1024u);
}

TEST_F(PipelineStoreTest, LaterMetadataDoesNotOverwriteFirst) {
    ASSERT_EXPECTED_OK(store_->insert_instance(make_instance(1), make_metadata()));
    auto other = make_metadata();
    other.patient_id = "SOMEONE-ELSE";
    ASSERT_EXPECTED_OK(store_->insert_instance(make_instance(2), other));

    auto study = store_->get_study(samples::STUDY_UID);
    ASSERT_TRUE(study.has_value());
    EXPECT_EQ(study->metadata.patient_id, samples::PATIENT_ID);
}

TEST_F(PipelineStoreTest, UntouchedInstancesAreReportedAsUnassembled) {
    ASSERT_EXPECTED_OK(store_->insert_instance(make_instance(1), make_metadata()));
    auto pending = store_->get_studies_with_unassembled_instances();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0], samples::STUDY_UID);

    ASSERT_EXPECTED_OK(store_->touch_study(samples::STUDY_UID,
                                           std::chrono::system_clock::now() + 1s));
    EXPECT_TRUE(store_->get_studies_with_unassembled_instances().empty());
}

TEST_F(PipelineStoreTest, TouchReopensReadyStudy) {
    seed_ready_study(2);
    auto previous = store_->touch_study(samples::STUDY_UID, std::chrono::system_clock::now());
    ASSERT_EXPECTED_OK(previous);
    EXPECT_EQ(*previous, study_state::ready);
    EXPECT_EQ(store_->get_study(samples::STUDY_UID)->state, study_state::collecting);
}

TEST_F(PipelineStoreTest, TouchUnknownStudyFails) {
    auto result = store_->touch_study("9.9.9", std::chrono::system_clock::now());
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), store_error::not_found);
}

TEST_F(PipelineStoreTest, StudyTransitionIsConditional) {
    ASSERT_EXPECTED_OK(store_->insert_instance(make_instance(1), make_metadata()));

    auto illegal = store_->transition_study(samples::STUDY_UID, study_state::collecting,
                                            study_state::closed);
    ASSERT_EXPECTED_ERROR(illegal);
    EXPECT_EQ(illegal.error(), store_error::invalid_transition);

    auto stale = store_->transition_study(samples::STUDY_UID, study_state::ready,
                                          study_state::closed);
    ASSERT_EXPECTED_ERROR(stale);
    EXPECT_EQ(stale.error(), store_error::stale_state);

    ASSERT_EXPECTED_OK(store_->transition_study(samples::STUDY_UID, study_state::collecting,
                                                study_state::ready));
    EXPECT_EQ(store_->get_studies_in_state(study_state::ready).size(), 1u);
}

// =============================================================================
// Jobs
// =============================================================================

TEST_F(PipelineStoreTest, CreateJobStartsReceived) {
    seed_ready_study(3);
    auto job = store_->create_job(samples::STUDY_UID);
    ASSERT_EXPECTED_OK(job);
    EXPECT_EQ(job->state, job_state::received);
    EXPECT_EQ(job->attempt_count, 0);
    EXPECT_EQ(job->instance_count, 3u);
    EXPECT_TRUE(job->lease_owner.empty());

    auto history = store_->get_job_history(job->job_id);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_FALSE(history[0].from_state.has_value());
    EXPECT_EQ(history[0].to_state, job_state::received);
}

TEST_F(PipelineStoreTest, JobInstancesAreFixedAtCreation) {
    seed_ready_study(2);
    auto job = store_->create_job(samples::STUDY_UID);
    ASSERT_EXPECTED_OK(job);

    ASSERT_EXPECTED_OK(store_->insert_instance(make_instance(3), make_metadata()));
    EXPECT_EQ(store_->get_study_instances(samples::STUDY_UID).size(), 3u);

    auto inputs = store_->get_job_instances(job->job_id);
    ASSERT_EQ(inputs.size(), 2u);
    EXPECT_EQ(inputs[0].instance_uid, make_instance(1).instance_uid);
    EXPECT_EQ(inputs[1].instance_uid, make_instance(2).instance_uid);
    EXPECT_TRUE(store_->get_job_instances("job-unknown").empty());
}

TEST_F(PipelineStoreTest, CreateJobForUnknownStudyFails) {
    auto result = store_->create_job("9.9.9");
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), store_error::not_found);
}

TEST_F(PipelineStoreTest, SecondActiveJobIsRejected) {
    seed_ready_study(1);
    ASSERT_EXPECTED_OK(store_->create_job(samples::STUDY_UID));

    auto second = store_->create_job(samples::STUDY_UID);
    ASSERT_EXPECTED_ERROR(second);
    EXPECT_EQ(second.error(), store_error::active_job_exists);
    EXPECT_EQ(store_->get_jobs_for_study(samples::STUDY_UID).size(), 1u);
}

TEST_F(PipelineStoreTest, ConcurrentCreateYieldsSingleJob) {
    seed_ready_study(1);

    std::atomic<int> created{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (store_->create_job(samples::STUDY_UID)) {
                ++created;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(created.load(), 1);
    EXPECT_EQ(store_->get_jobs_for_study(samples::STUDY_UID).size(), 1u);
}

TEST_F(PipelineStoreTest, AdmitMovesReceivedToQueuedOnce) {
    seed_ready_study(1);
    auto job = store_->create_job(samples::STUDY_UID);
    ASSERT_EXPECTED_OK(job);

    ASSERT_EXPECTED_OK(store_->admit_job(job->job_id));
    EXPECT_EQ(store_->get_job(job->job_id)->state, job_state::queued);

    auto again = store_->admit_job(job->job_id);
    ASSERT_EXPECTED_ERROR(again);
    EXPECT_EQ(again.error(), store_error::stale_state);
}

TEST_F(PipelineStoreTest, ClaimQueuedJobStartsAnalysis) {
    seed_ready_study(1);
    auto job = store_->create_job(samples::STUDY_UID);
    ASSERT_EXPECTED_OK(job);
    ASSERT_EXPECTED_OK(store_->admit_job(job->job_id));

    auto claimed = store_->claim_job(job->job_id, "worker-1", 60s);
    ASSERT_EXPECTED_OK(claimed);
    EXPECT_EQ(claimed->state, job_state::analyzing);
    EXPECT_EQ(claimed->lease_owner, "worker-1");
    EXPECT_EQ(claimed->lease_generation, job->lease_generation + 1);
    ASSERT_TRUE(claimed->lease_expires_at.has_value());

    auto second = store_->claim_job(job->job_id, "worker-2", 60s);
    ASSERT_EXPECTED_ERROR(second);
    EXPECT_EQ(second.error(), store_error::stale_state);
}

TEST_F(PipelineStoreTest, ClaimRequiresOwner) {
    seed_ready_study(1);
    auto job = store_->create_job(samples::STUDY_UID);
    ASSERT_EXPECTED_OK(job);
    auto result = store_->claim_job(job->job_id, "", 60s);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), store_error::invalid_argument);
}

TEST_F(PipelineStoreTest, ExpiredLeaseIsRecoveredInPlace) {
    seed_ready_study(1);
    auto lease = start_job(samples::STUDY_UID, 0ms);
    std::this_thread::sleep_for(5ms);

    auto recovered = store_->claim_job(lease.job_id, "worker-2", 60s);
    ASSERT_EXPECTED_OK(recovered);
    EXPECT_EQ(recovered->state, job_state::analyzing);
    EXPECT_EQ(recovered->lease_owner, "worker-2");
    EXPECT_GT(recovered->lease_generation, lease.generation);

    // The original holder is fenced off
    auto stale = store_->complete_analysis(lease, {}, 60s);
    ASSERT_EXPECTED_ERROR(stale);
    EXPECT_EQ(stale.error(), store_error::stale_state);

    auto history = store_->get_job_history(lease.job_id);
    ASSERT_FALSE(history.empty());
    EXPECT_THAT(history.back().detail, ContainsSubstring("expired"));
}

TEST_F(PipelineStoreTest, ExpiredLeaseAppearsAsDispatchable) {
    seed_ready_study(1);
    auto lease = start_job(samples::STUDY_UID, 0ms);
    std::this_thread::sleep_for(5ms);

    auto candidates = store_->get_dispatchable_jobs(std::chrono::system_clock::now(), 10);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].job_id, lease.job_id);
    EXPECT_EQ(candidates[0].state, job_state::analyzing);
    EXPECT_TRUE(candidates[0].lease_expired);
}

TEST_F(PipelineStoreTest, LeasedJobIsNotDispatchable) {
    seed_ready_study(1);
    start_job();
    EXPECT_TRUE(
        store_->get_dispatchable_jobs(std::chrono::system_clock::now(), 10).empty());
}

TEST_F(PipelineStoreTest, RenewLeaseRequiresCurrentGeneration) {
    seed_ready_study(1);
    auto lease = start_job();
    ASSERT_EXPECTED_OK(store_->renew_lease(lease, 120s));

    lease_token old = lease;
    old.generation -= 1;
    auto result = store_->renew_lease(old, 120s);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), store_error::stale_state);
}

// =============================================================================
// Stage Writes
// =============================================================================

TEST_F(PipelineStoreTest, FindingsPersistWithStageChange) {
    seed_ready_study(1);
    auto lease = start_job();

    std::vector<finding> findings = {make_finding("nodule", 0.93, pipeline::severity::high),
                                     make_finding("opacity", 0.85)};
    ASSERT_EXPECTED_OK(store_->complete_analysis(lease, findings, 60s));

    auto job = store_->get_job(lease.job_id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->state, job_state::reporting);

    auto stored = store_->get_findings(lease.job_id);
    ASSERT_EQ(stored.size(), 2u);
    EXPECT_EQ(stored[0].category, "nodule");
    EXPECT_EQ(stored[0].level, pipeline::severity::high);
    EXPECT_DOUBLE_EQ(stored[0].confidence, 0.93);
    EXPECT_DOUBLE_EQ(stored[0].location.depth, 3.0);
    EXPECT_DOUBLE_EQ(stored[0].measurements.at("diameter_mm"), 7.5);
    EXPECT_EQ(stored[1].category, "opacity");
}

TEST_F(PipelineStoreTest, ReportPayloadKeepsEmbeddedBytes) {
    seed_ready_study(1);
    auto lease = start_job();
    ASSERT_EXPECTED_OK(store_->complete_analysis(lease, {}, 60s));
    ASSERT_EXPECTED_OK(store_->complete_report(lease, sample_report(), 60s));

    EXPECT_EQ(store_->get_job(lease.job_id)->state, job_state::delivering);

    auto report = store_->get_report_for_job(lease.job_id);
    ASSERT_TRUE(report.has_value());
    ASSERT_TRUE(lease.job_id.starts_with("job-"));
    EXPECT_EQ(report->report_id, "rpt-" + lease.job_id.substr(4));
    EXPECT_EQ(report->study_uid, samples::STUDY_UID);
    EXPECT_EQ(report->payload.size(), 20u);
    EXPECT_EQ(report->payload, sample_report().payload);
    EXPECT_EQ(report->delivery, pipeline::delivery_state::pending);
    EXPECT_FALSE(report->sent_at.has_value());
}

TEST_F(PipelineStoreTest, StageWriteFromWrongStateIsStale) {
    seed_ready_study(1);
    auto lease = start_job();
    auto result = store_->complete_report(lease, sample_report(), 60s);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), store_error::stale_state);
}

TEST_F(PipelineStoreTest, CompleteJobMarksReportSentAndClosesStudy) {
    seed_ready_study(2);
    auto lease = start_job();
    ASSERT_EXPECTED_OK(store_->complete_analysis(lease, {make_finding("nodule", 0.9)}, 60s));
    ASSERT_EXPECTED_OK(store_->complete_report(lease, sample_report(), 60s));

    auto outcome = store_->complete_job(lease, "0000 stored");
    ASSERT_EXPECTED_OK(outcome);
    EXPECT_TRUE(outcome->study_closed);
    EXPECT_EQ(outcome->study, study_state::closed);

    auto job = store_->get_job(lease.job_id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->state, job_state::done);
    EXPECT_TRUE(job->lease_owner.empty());
    EXPECT_TRUE(job->finished_at.has_value());

    auto report = store_->get_report_for_job(lease.job_id);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->delivery, pipeline::delivery_state::sent);
    EXPECT_EQ(report->archive_response, "0000 stored");
    EXPECT_TRUE(report->sent_at.has_value());

    EXPECT_FALSE(store_->get_active_job(samples::STUDY_UID).has_value());
}

TEST_F(PipelineStoreTest, LateInstanceKeepsStudyOpenAfterCompletion) {
    seed_ready_study(1);
    auto lease = start_job();
    ASSERT_EXPECTED_OK(store_->complete_analysis(lease, {}, 60s));
    ASSERT_EXPECTED_OK(store_->complete_report(lease, sample_report(), 60s));

    // Arrives while the job is delivering, then the study settles again
    ASSERT_EXPECTED_OK(store_->insert_instance(make_instance(2), make_metadata()));
    ASSERT_EXPECTED_OK(store_->touch_study(samples::STUDY_UID, std::chrono::system_clock::now()));
    ASSERT_EXPECTED_OK(store_->transition_study(samples::STUDY_UID, study_state::collecting,
                                                study_state::ready));

    auto outcome = store_->complete_job(lease, "ok");
    ASSERT_EXPECTED_OK(outcome);
    EXPECT_FALSE(outcome->study_closed);
    EXPECT_EQ(outcome->study, study_state::ready);

    auto waiting = store_->get_ready_studies_without_job();
    ASSERT_EQ(waiting.size(), 1u);
    EXPECT_EQ(waiting[0], samples::STUDY_UID);
}

TEST_F(PipelineStoreTest, DeliveryResponseIsRecorded) {
    seed_ready_study(1);
    auto lease = start_job();
    ASSERT_EXPECTED_OK(store_->complete_analysis(lease, {}, 60s));
    ASSERT_EXPECTED_OK(store_->complete_report(lease, sample_report(), 60s));

    auto report = store_->get_report_for_job(lease.job_id);
    ASSERT_TRUE(report.has_value());
    ASSERT_EXPECTED_OK(store_->record_delivery_response(report->report_id, "A700 out of resources"));
    EXPECT_EQ(store_->get_report_for_job(lease.job_id)->archive_response,
              "A700 out of resources");

    auto missing = store_->record_delivery_response("rpt-missing", "x");
    ASSERT_EXPECTED_ERROR(missing);
    EXPECT_EQ(missing.error(), store_error::not_found);
}

// =============================================================================
// Retry and Failure
// =============================================================================

TEST_F(PipelineStoreTest, AnalysisRetryReturnsJobToQueue) {
    seed_ready_study(1);
    auto lease = start_job();
    auto next = std::chrono::system_clock::now() + 2s;

    ASSERT_EXPECTED_OK(store_->schedule_retry(lease, job_state::analyzing, job_state::queued,
                                              1, "engine unavailable", next));

    auto job = store_->get_job(lease.job_id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->state, job_state::queued);
    EXPECT_EQ(job->attempt_count, 1);
    EXPECT_EQ(job->last_error, "engine unavailable");
    EXPECT_EQ(job->error_stage, job_state::analyzing);
    EXPECT_TRUE(job->lease_owner.empty());

    // Not due yet
    auto early = store_->claim_job(lease.job_id, "worker-1", 60s);
    ASSERT_EXPECTED_ERROR(early);
    EXPECT_EQ(early.error(), store_error::stale_state);
    EXPECT_TRUE(
        store_->get_dispatchable_jobs(std::chrono::system_clock::now(), 10).empty());
    EXPECT_EQ(store_->get_dispatchable_jobs(next + 1s, 10).size(), 1u);
}

TEST_F(PipelineStoreTest, DeliveryRetryStaysInDelivering) {
    seed_ready_study(1);
    auto lease = start_job();
    ASSERT_EXPECTED_OK(store_->complete_analysis(lease, {}, 60s));
    ASSERT_EXPECTED_OK(store_->complete_report(lease, sample_report(), 60s));

    ASSERT_EXPECTED_OK(store_->schedule_retry(lease, job_state::delivering,
                                              job_state::delivering, 2, "unreachable",
                                              std::chrono::system_clock::now()));
    auto job = store_->get_job(lease.job_id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->state, job_state::delivering);
    EXPECT_EQ(job->attempt_count, 2);

    auto resumed = store_->claim_job(lease.job_id, "worker-2", 60s);
    ASSERT_EXPECTED_OK(resumed);
    EXPECT_EQ(resumed->state, job_state::delivering);
}

TEST_F(PipelineStoreTest, ReportingHasNoRetryEdge) {
    seed_ready_study(1);
    auto lease = start_job();
    ASSERT_EXPECTED_OK(store_->complete_analysis(lease, {}, 60s));

    auto result = store_->schedule_retry(lease, job_state::reporting, job_state::reporting, 1,
                                         "template", std::chrono::system_clock::now());
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), store_error::invalid_transition);
}

TEST_F(PipelineStoreTest, FailJobRecordsReasonAndClosesStudy) {
    seed_ready_study(1);
    auto lease = start_job();
    ASSERT_EXPECTED_OK(store_->complete_analysis(lease, {}, 60s));
    ASSERT_EXPECTED_OK(store_->complete_report(lease, sample_report(), 60s));

    auto outcome = store_->fail_job(lease, job_state::delivering, 5, "archive unreachable");
    ASSERT_EXPECTED_OK(outcome);
    EXPECT_TRUE(outcome->study_closed);

    auto job = store_->get_job(lease.job_id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->state, job_state::failed);
    EXPECT_EQ(job->attempt_count, 5);
    EXPECT_EQ(job->error_stage, job_state::delivering);

    EXPECT_EQ(store_->get_report_for_job(lease.job_id)->delivery,
              pipeline::delivery_state::failed);

    auto failures = store_->get_recent_failures(10);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].job_id, lease.job_id);
    EXPECT_EQ(failures[0].failed_stage, job_state::delivering);
    EXPECT_EQ(failures[0].reason, "archive unreachable");
    EXPECT_EQ(failures[0].attempt_count, 5);
}

TEST_F(PipelineStoreTest, FailJobRejectsNonInFlightSource) {
    seed_ready_study(1);
    auto lease = start_job();
    auto result = store_->fail_job(lease, job_state::queued, 1, "x");
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), store_error::invalid_transition);
}

TEST_F(PipelineStoreTest, TerminalJobAllowsNewJobForStudy) {
    seed_ready_study(1);
    auto lease = start_job();
    ASSERT_EXPECTED_OK(store_->fail_job(lease, job_state::analyzing, 1, "rejected"));

    ASSERT_EXPECTED_OK(store_->insert_instance(make_instance(2), make_metadata()));
    ASSERT_EXPECTED_OK(store_->touch_study(samples::STUDY_UID, std::chrono::system_clock::now()));
    ASSERT_EXPECTED_OK(store_->transition_study(samples::STUDY_UID, study_state::collecting,
                                                study_state::ready));

    auto rerun = store_->create_job(samples::STUDY_UID);
    ASSERT_EXPECTED_OK(rerun);
    EXPECT_EQ(rerun->instance_count, 2u);
    EXPECT_EQ(store_->get_jobs_for_study(samples::STUDY_UID).size(), 2u);
}

// =============================================================================
// Observability and Restart
// =============================================================================

TEST_F(PipelineStoreTest, CountsIncludeEveryState) {
    seed_ready_study(1, "1.2.3.1");
    seed_ready_study(1, "1.2.3.2");
    ASSERT_EXPECTED_OK(store_->create_job("1.2.3.1"));
    auto lease = start_job("1.2.3.2");
    ASSERT_EXPECTED_OK(store_->fail_job(lease, job_state::analyzing, 1, "rejected"));

    auto counts = store_->count_jobs_by_state();
    EXPECT_EQ(counts.size(), pipeline::all_job_states.size());
    EXPECT_EQ(counts[job_state::received], 1u);
    EXPECT_EQ(counts[job_state::failed], 1u);
    EXPECT_EQ(counts[job_state::done], 0u);
}

TEST_F(PipelineStoreTest, StateSurvivesReopen) {
    seed_ready_study(1);
    auto lease = start_job();
    ASSERT_EXPECTED_OK(store_->complete_analysis(lease, {make_finding("nodule", 0.9)}, 60s));
    store_->close();

    pipeline_store reopened(config());
    ASSERT_EXPECTED_OK(reopened.open());
    auto job = reopened.get_job(lease.job_id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->state, job_state::reporting);
    EXPECT_EQ(job->lease_owner, "worker-1");
    EXPECT_EQ(reopened.get_findings(lease.job_id).size(), 1u);
    EXPECT_EQ(reopened.get_job_history(lease.job_id).size(), 4u);
}

}  // namespace
}  // namespace aipacs::storage
