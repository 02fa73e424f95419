/**
 * @file delivery_sender_test.cpp
 * @brief Unit tests for report delivery and archive status classification
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "aipacs/delivery/delivery_sender.h"

#include "utils/pipeline_fakes.h"
#include "utils/test_helpers.h"

#include <stdexcept>

namespace aipacs::delivery {
namespace {

using namespace aipacs::test;
using ::testing::_;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

class DeliverySenderTest : public ai_pacs_test {
protected:
    void SetUp() override {
        client_ = std::make_shared<NiceMock<mock_archive_client>>();
        ON_CALL(*client_, name()).WillByDefault(Return("archive"));
        sender_ = std::make_unique<delivery_sender>(client_);
    }

    outbound_report sample_report() const {
        outbound_report report;
        report.report_id = "rpt-1";
        report.job_id = "job-1";
        report.study_uid = std::string(samples::STUDY_UID);
        report.format = "dicom_sr";
        report.content_type = "text/plain";
        report.payload = "IMPRESSION: none";
        return report;
    }

    std::shared_ptr<NiceMock<mock_archive_client>> client_;
    std::unique_ptr<delivery_sender> sender_;
};

TEST_F(DeliverySenderTest, StatusClassification) {
    EXPECT_EQ(classify_status(0x0000), status_class::success);
    EXPECT_EQ(classify_status(0xB000), status_class::success);
    EXPECT_EQ(classify_status(0xB007), status_class::success);
    EXPECT_EQ(classify_status(0xA700), status_class::retryable);
    EXPECT_EQ(classify_status(0xA7FF), status_class::retryable);
    EXPECT_EQ(classify_status(0xA900), status_class::permanent);
    EXPECT_EQ(classify_status(0xC000), status_class::permanent);
}

TEST_F(DeliverySenderTest, AcceptedReportProducesReceipt) {
    EXPECT_CALL(*client_, store_report(Field(&outbound_report::report_id, "rpt-1")))
        .WillOnce(Return(accepted_response()));

    auto receipt = sender_->send(sample_report());
    ASSERT_EXPECTED_OK(receipt);
    EXPECT_EQ(receipt->status_code, 0x0000);
    EXPECT_EQ(receipt->response_text, "stored");
    EXPECT_EQ(receipt->audit_text, "transport=ok status=0x0000 text=stored");
    EXPECT_EQ(sender_->get_statistics().accepted, 1u);
}

TEST_F(DeliverySenderTest, WarningStatusCountsAsSuccess) {
    EXPECT_CALL(*client_, store_report(_))
        .WillOnce(Return(archive_response{transport_status::ok, 0xB000, "coerced"}));
    EXPECT_EXPECTED_OK(sender_->send(sample_report()));
}

TEST_F(DeliverySenderTest, OutOfResourcesIsRetryable) {
    EXPECT_CALL(*client_, store_report(_))
        .WillOnce(Return(archive_response{transport_status::ok, 0xA700, "full"}));

    auto result = sender_->send(sample_report());
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, delivery_error::archive_busy);
    EXPECT_TRUE(is_retryable(result.error().code));
    EXPECT_THAT(result.error().audit_text, HasSubstr("0xA700"));
    EXPECT_EQ(sender_->get_statistics().retryable_failures, 1u);
}

TEST_F(DeliverySenderTest, RejectionIsPermanent) {
    EXPECT_CALL(*client_, store_report(_))
        .WillOnce(Return(archive_response{transport_status::ok, 0xA900, "sop mismatch"}));

    auto result = sender_->send(sample_report());
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, delivery_error::permanent_rejection);
    EXPECT_FALSE(is_retryable(result.error().code));
    EXPECT_THAT(result.error().message, HasSubstr("sop mismatch"));
    EXPECT_EQ(sender_->get_statistics().permanent_failures, 1u);
}

TEST_F(DeliverySenderTest, TransportFailuresAreRetryable) {
    EXPECT_CALL(*client_, store_report(_))
        .WillOnce(Return(archive_response{transport_status::unreachable, 0, "no route"}))
        .WillOnce(Return(archive_response{transport_status::timed_out, 0, ""}))
        .WillOnce(Return(archive_response{transport_status::association_refused, 0, ""}));

    auto unreachable = sender_->send(sample_report());
    ASSERT_EXPECTED_ERROR(unreachable);
    EXPECT_EQ(unreachable.error().code, delivery_error::transport_error);
    EXPECT_EQ(unreachable.error().audit_text, "transport=unreachable text=no route");

    auto timed_out = sender_->send(sample_report());
    ASSERT_EXPECTED_ERROR(timed_out);
    EXPECT_EQ(timed_out.error().code, delivery_error::transport_error);

    auto refused = sender_->send(sample_report());
    ASSERT_EXPECTED_ERROR(refused);
    EXPECT_EQ(refused.error().code, delivery_error::association_refused);
    EXPECT_TRUE(is_retryable(refused.error().code));

    EXPECT_EQ(sender_->get_statistics().attempts, 3u);
}

TEST_F(DeliverySenderTest, ClientExceptionIsTransportError) {
    EXPECT_CALL(*client_, store_report(_))
        .WillOnce([](const outbound_report&) -> archive_response {
            throw std::runtime_error("socket closed");
        });

    auto result = sender_->send(sample_report());
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, delivery_error::transport_error);
    EXPECT_THAT(result.error().audit_text, HasSubstr("socket closed"));
}

TEST_F(DeliverySenderTest, EmptyPayloadIsNotSent) {
    EXPECT_CALL(*client_, store_report(_)).Times(0);
    auto report = sample_report();
    report.payload.clear();

    auto result = sender_->send(report);
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, delivery_error::missing_payload);
    EXPECT_FALSE(is_retryable(result.error().code));
}

TEST_F(DeliverySenderTest, MissingClientIsRetryable) {
    delivery_sender sender(nullptr);
    auto result = sender.send(sample_report());
    ASSERT_EXPECTED_ERROR(result);
    EXPECT_EQ(result.error().code, delivery_error::transport_error);
    EXPECT_TRUE(sender.client_name().empty());
}

}  // namespace
}  // namespace aipacs::delivery
