/**
 * @file test_helpers.h
 * @brief Common test utilities and helpers for AI PACS tests
 *
 * Scratch directories, sample UIDs, polling and std::expected assertions.
 */

#ifndef AIPACS_TEST_HELPERS_H
#define AIPACS_TEST_HELPERS_H

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace aipacs::test {

/**
 * @brief Unique scratch path under the system temp directory
 *
 * Combines a prefix, the wall clock and a process-wide counter so that
 * parallel fixtures never share files.
 */
inline std::filesystem::path unique_temp_path(std::string_view prefix) {
    static std::atomic<int> counter{0};
    return std::filesystem::temp_directory_path() /
           (std::string(prefix) + "_" + std::to_string(std::time(nullptr)) + "_" +
            std::to_string(counter++));
}

/**
 * @brief Remove a SQLite database and its WAL side files
 */
inline void remove_database(const std::filesystem::path& db_path) {
    std::error_code ec;
    std::filesystem::remove(db_path, ec);
    std::filesystem::remove(db_path.string() + "-wal", ec);
    std::filesystem::remove(db_path.string() + "-shm", ec);
}

// =============================================================================
// Sample Identifiers
// =============================================================================

namespace samples {

constexpr std::string_view STUDY_UID = "1.2.840.113619.2.55.3.604688119";
constexpr std::string_view SERIES_UID = "1.2.840.113619.2.55.3.604688119.1";
constexpr std::string_view CT_IMAGE_STORAGE = "1.2.840.10008.5.1.4.1.1.2";
constexpr std::string_view PATIENT_ID = "PID-0042";
constexpr std::string_view PATIENT_NAME = "DOE^JANE";
constexpr std::string_view ACCESSION = "ACC-2024-0001";

/**
 * @brief Instance UID number @p n of the sample series
 */
inline std::string instance_uid(int n) {
    return std::string(SERIES_UID) + "." + std::to_string(n);
}

}  // namespace samples

// =============================================================================
// Performance Testing Utilities
// =============================================================================

/**
 * @brief Simple timer for performance measurements
 */
class scoped_timer {
public:
    scoped_timer() : start_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] int64_t elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - start_)
            .count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// =============================================================================
// Test Fixture Base Class
// =============================================================================

/**
 * @brief Base fixture class for AI PACS tests
 */
class ai_pacs_test : public ::testing::Test {
protected:
    void SetUp() override {}

    void TearDown() override {}
};

/**
 * @brief Fixture owning a scratch directory and database path
 */
class scratch_dir_test : public ai_pacs_test {
protected:
    void SetUp() override {
        ai_pacs_test::SetUp();
        scratch_ = unique_temp_path("aipacs_test");
        std::filesystem::create_directories(scratch_);
        db_path_ = scratch_ / "pipeline.db";
    }

    void TearDown() override {
        remove_database(db_path_);
        std::error_code ec;
        std::filesystem::remove_all(scratch_, ec);
        ai_pacs_test::TearDown();
    }

    std::filesystem::path scratch_;
    std::filesystem::path db_path_;
};

// =============================================================================
// Custom Matchers
// =============================================================================

/**
 * @brief Matcher for checking if a string contains a substring
 */
MATCHER_P(ContainsSubstring, substring, "") {
    return arg.find(substring) != std::string::npos;
}

// =============================================================================
// Synchronization Utilities
// =============================================================================

/**
 * @brief Wait for a condition using yield-based polling with timeout
 *
 * @return true if condition met, false on timeout
 */
template <typename Predicate>
bool wait_for(Predicate pred,
              std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::yield();
    }
    return true;
}

// =============================================================================
// Helper Macros
// =============================================================================

/**
 * @brief Assert that an expected value has a value (for std::expected)
 */
#define ASSERT_EXPECTED_OK(expected) \
    ASSERT_TRUE((expected).has_value()) << "Expected value but got error"

#define EXPECT_EXPECTED_OK(expected) \
    EXPECT_TRUE((expected).has_value()) << "Expected value but got error"

/**
 * @brief Assert that an expected value has an error (for std::expected)
 */
#define ASSERT_EXPECTED_ERROR(expected) \
    ASSERT_FALSE((expected).has_value()) << "Expected error but got value"

}  // namespace aipacs::test

#endif  // AIPACS_TEST_HELPERS_H
