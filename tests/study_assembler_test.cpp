/**
 * @file study_assembler_test.cpp
 * @brief Unit tests for idle-timeout study assembly
 */

#include <gtest/gtest.h>

#include "aipacs/assembly/study_assembler.h"
#include "aipacs/storage/pipeline_store.h"

#include "utils/pipeline_fakes.h"
#include "utils/test_helpers.h"

#include <string>
#include <vector>

namespace aipacs::assembly {
namespace {

using namespace aipacs::test;
using namespace std::chrono_literals;
using pipeline::study_state;

class StudyAssemblerTest : public scratch_dir_test {
protected:
    void SetUp() override {
        scratch_dir_test::SetUp();
        storage::store_config store_cfg;
        store_cfg.database_path = db_path_;
        store_ = std::make_unique<storage::pipeline_store>(store_cfg);
        ASSERT_EXPECTED_OK(store_->open());

        now_ = study_assembler::clock::time_point{} + 1h;
        assembler_ = make_assembler();
        assembler_->set_study_ready_callback(
            [this](const std::string& uid) { ready_.push_back(uid); });
    }

    void TearDown() override {
        assembler_.reset();
        store_.reset();
        scratch_dir_test::TearDown();
    }

    std::unique_ptr<study_assembler> make_assembler() {
        assembler_config cfg;
        cfg.idle_timeout = 30s;
        return std::make_unique<study_assembler>(cfg, *store_, [this] { return now_; });
    }

    /** Persist an instance and notify the assembler, as the receiver does */
    void receive(int n, std::string_view study_uid = samples::STUDY_UID) {
        auto instance = make_instance(n, study_uid);
        ASSERT_EXPECTED_OK(store_->insert_instance(instance, make_metadata()));
        ASSERT_EXPECTED_OK(assembler_->on_instance_received(instance));
    }

    study_state state_of(std::string_view study_uid = samples::STUDY_UID) {
        auto study = store_->get_study(study_uid);
        return study ? study->state : study_state::collecting;
    }

    study_assembler::clock::time_point now_;
    std::unique_ptr<storage::pipeline_store> store_;
    std::unique_ptr<study_assembler> assembler_;
    std::vector<std::string> ready_;
};

TEST_F(StudyAssemblerTest, DefaultIdleTimeoutIsThirtySeconds) {
    assembler_config cfg;
    EXPECT_EQ(cfg.idle_timeout, 30000ms);
    EXPECT_TRUE(cfg.is_valid());
    cfg.idle_timeout = 0ms;
    EXPECT_FALSE(cfg.is_valid());
}

TEST_F(StudyAssemblerTest, StudyBecomesReadyAfterQuietPeriod) {
    receive(1);
    receive(2);
    EXPECT_EQ(assembler_->pending_count(), 1u);

    now_ += 29s;
    EXPECT_EQ(assembler_->process_due(now_), 0u);
    EXPECT_EQ(state_of(), study_state::collecting);

    now_ += 1s;
    EXPECT_EQ(assembler_->process_due(now_), 1u);
    EXPECT_EQ(state_of(), study_state::ready);
    ASSERT_EQ(ready_.size(), 1u);
    EXPECT_EQ(ready_[0], samples::STUDY_UID);
    EXPECT_EQ(assembler_->pending_count(), 0u);
}

TEST_F(StudyAssemblerTest, EachInstanceRearmsTheDeadline) {
    receive(1);
    now_ += 20s;
    receive(2);
    now_ += 20s;
    EXPECT_EQ(assembler_->process_due(now_), 0u);

    now_ += 10s;
    EXPECT_EQ(assembler_->process_due(now_), 1u);
}

TEST_F(StudyAssemblerTest, ReadyIsSignalledOnce) {
    receive(1);
    now_ += 31s;
    EXPECT_EQ(assembler_->process_due(now_), 1u);
    now_ += 31s;
    EXPECT_EQ(assembler_->process_due(now_), 0u);
    EXPECT_EQ(ready_.size(), 1u);
}

TEST_F(StudyAssemblerTest, StudiesAreTrackedIndependently) {
    receive(1, "1.2.3.1");
    now_ += 15s;
    receive(1, "1.2.3.2");
    now_ += 15s;

    EXPECT_EQ(assembler_->process_due(now_), 1u);
    EXPECT_EQ(state_of("1.2.3.1"), study_state::ready);
    EXPECT_EQ(state_of("1.2.3.2"), study_state::collecting);
}

TEST_F(StudyAssemblerTest, LateInstanceReopensReadyStudy) {
    receive(1);
    now_ += 30s;
    ASSERT_EQ(assembler_->process_due(now_), 1u);

    receive(2);
    EXPECT_EQ(state_of(), study_state::collecting);
    EXPECT_EQ(assembler_->get_statistics().studies_reopened, 1u);

    now_ += 30s;
    EXPECT_EQ(assembler_->process_due(now_), 1u);
    EXPECT_EQ(ready_.size(), 2u);
}

TEST_F(StudyAssemblerTest, UnknownStudyIsReported) {
    auto result = assembler_->on_instance_received(make_instance(1, "9.9.9"));
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error(), assembly_error::study_not_found);
}

TEST_F(StudyAssemblerTest, RecoverArmsRemainingWindow) {
    receive(1);
    assembler_ = make_assembler();
    assembler_->set_study_ready_callback(
        [this](const std::string& uid) { ready_.push_back(uid); });

    EXPECT_EQ(assembler_->recover(), 1u);
    EXPECT_EQ(assembler_->pending_count(), 1u);

    // The wall-clock quiet period is close to zero, so most of the window remains
    EXPECT_EQ(assembler_->process_due(now_ + 20s), 0u);
    EXPECT_EQ(assembler_->process_due(now_ + 30s), 1u);
}

TEST_F(StudyAssemblerTest, RecoverTouchesUnassembledInstances) {
    // Stored but never handed to the assembler
    ASSERT_EXPECTED_OK(store_->insert_instance(make_instance(1), make_metadata()));
    ASSERT_FALSE(store_->get_studies_with_unassembled_instances().empty());

    EXPECT_EQ(assembler_->recover(), 1u);
    EXPECT_TRUE(store_->get_studies_with_unassembled_instances().empty());
    EXPECT_EQ(assembler_->process_due(now_ + 30s), 1u);
}

TEST_F(StudyAssemblerTest, TimerThreadPromotesStudies) {
    assembler_config cfg;
    cfg.idle_timeout = 50ms;
    cfg.timer_resolution = 10ms;
    study_assembler live(cfg, *store_);

    std::atomic<int> ready{0};
    live.set_study_ready_callback([&](const std::string&) { ++ready; });
    ASSERT_EXPECTED_OK(live.start());

    auto instance = make_instance(1);
    ASSERT_EXPECTED_OK(store_->insert_instance(instance, make_metadata()));
    ASSERT_EXPECTED_OK(live.on_instance_received(instance));

    EXPECT_TRUE(wait_for([&] { return ready.load() == 1; }));
    live.stop();
    EXPECT_FALSE(live.is_running());
}

TEST_F(StudyAssemblerTest, StartTwiceFails) {
    ASSERT_EXPECTED_OK(assembler_->start());
    auto again = assembler_->start();
    ASSERT_EXPECTED_ERROR(again);
    EXPECT_EQ(again.error(), assembly_error::already_running);
    assembler_->stop();
}

}  // namespace
}  // namespace aipacs::assembly
