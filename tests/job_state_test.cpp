/**
 * @file job_state_test.cpp
 * @brief Unit tests for pipeline state enumerations and transitions
 */

#include <gtest/gtest.h>

#include "aipacs/pipeline/job_state.h"

#include "utils/test_helpers.h"

namespace aipacs::pipeline {
namespace {

using namespace aipacs::test;

class JobStateTest : public ai_pacs_test {};

TEST_F(JobStateTest, StringRoundTripCoversEveryState) {
    for (auto state : all_job_states) {
        auto parsed = parse_job_state(to_string(state));
        ASSERT_TRUE(parsed.has_value()) << to_string(state);
        EXPECT_EQ(*parsed, state);
    }
    EXPECT_FALSE(parse_job_state("running").has_value());
    EXPECT_FALSE(parse_job_state("").has_value());
}

TEST_F(JobStateTest, TerminalAndInFlightClassification) {
    EXPECT_TRUE(is_terminal(job_state::done));
    EXPECT_TRUE(is_terminal(job_state::failed));
    EXPECT_FALSE(is_terminal(job_state::delivering));

    EXPECT_TRUE(is_in_flight(job_state::analyzing));
    EXPECT_TRUE(is_in_flight(job_state::reporting));
    EXPECT_TRUE(is_in_flight(job_state::delivering));
    EXPECT_FALSE(is_in_flight(job_state::queued));
    EXPECT_FALSE(is_in_flight(job_state::received));
}

TEST_F(JobStateTest, ForwardPathIsLegal) {
    EXPECT_TRUE(is_valid_transition(job_state::received, job_state::queued));
    EXPECT_TRUE(is_valid_transition(job_state::queued, job_state::analyzing));
    EXPECT_TRUE(is_valid_transition(job_state::analyzing, job_state::reporting));
    EXPECT_TRUE(is_valid_transition(job_state::reporting, job_state::delivering));
    EXPECT_TRUE(is_valid_transition(job_state::delivering, job_state::done));
}

TEST_F(JobStateTest, RetryEdges) {
    EXPECT_TRUE(is_valid_transition(job_state::analyzing, job_state::queued));
    EXPECT_TRUE(is_valid_transition(job_state::delivering, job_state::delivering));
    // Reporting failures are terminal
    EXPECT_FALSE(is_valid_transition(job_state::reporting, job_state::queued));
    EXPECT_FALSE(is_valid_transition(job_state::reporting, job_state::reporting));
}

TEST_F(JobStateTest, SkippingStagesIsIllegal) {
    EXPECT_FALSE(is_valid_transition(job_state::received, job_state::analyzing));
    EXPECT_FALSE(is_valid_transition(job_state::queued, job_state::reporting));
    EXPECT_FALSE(is_valid_transition(job_state::analyzing, job_state::delivering));
    EXPECT_FALSE(is_valid_transition(job_state::analyzing, job_state::done));
    EXPECT_FALSE(is_valid_transition(job_state::queued, job_state::failed));
}

TEST_F(JobStateTest, TerminalStatesHaveNoExit) {
    for (auto to : all_job_states) {
        EXPECT_FALSE(is_valid_transition(job_state::done, to));
        EXPECT_FALSE(is_valid_transition(job_state::failed, to));
    }
}

TEST_F(JobStateTest, StudyStateTransitions) {
    EXPECT_TRUE(is_valid_transition(study_state::collecting, study_state::ready));
    EXPECT_TRUE(is_valid_transition(study_state::ready, study_state::closed));
    EXPECT_TRUE(is_valid_transition(study_state::ready, study_state::collecting));
    EXPECT_TRUE(is_valid_transition(study_state::closed, study_state::collecting));
    EXPECT_FALSE(is_valid_transition(study_state::collecting, study_state::closed));
    EXPECT_FALSE(is_valid_transition(study_state::closed, study_state::ready));
}

TEST_F(JobStateTest, DeliveryStateIsWriteOnce) {
    EXPECT_TRUE(is_valid_transition(delivery_state::pending, delivery_state::sent));
    EXPECT_TRUE(is_valid_transition(delivery_state::pending, delivery_state::failed));
    EXPECT_FALSE(is_valid_transition(delivery_state::sent, delivery_state::failed));
    EXPECT_FALSE(is_valid_transition(delivery_state::failed, delivery_state::sent));

    EXPECT_EQ(parse_delivery_state("sent"), delivery_state::sent);
    EXPECT_FALSE(parse_delivery_state("SENT").has_value());
}

TEST_F(JobStateTest, SeverityParsing) {
    EXPECT_EQ(parse_severity("low"), severity::low);
    EXPECT_EQ(parse_severity("medium"), severity::medium);
    EXPECT_EQ(parse_severity("high"), severity::high);
    EXPECT_FALSE(parse_severity("critical").has_value());
    EXPECT_STREQ(to_string(severity::high), "high");
}

}  // namespace
}  // namespace aipacs::pipeline
