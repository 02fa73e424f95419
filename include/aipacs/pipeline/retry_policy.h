#ifndef AIPACS_PIPELINE_RETRY_POLICY_H
#define AIPACS_PIPELINE_RETRY_POLICY_H

/**
 * @file retry_policy.h
 * @brief Exponential backoff with additive jitter for retryable job stages
 *
 * The delay before retry n (n = number of failed attempts so far) is
 *
 *   min(base * multiplier^(n-1) * (1 + jitter), max_delay)
 *
 * with jitter drawn uniformly from [0, jitter_ratio). Because the jitter
 * is non-negative and bounded below multiplier - 1, successive delays are
 * strictly increasing until the cap is reached.
 */

#include <chrono>
#include <cstddef>
#include <functional>

namespace aipacs::pipeline {

/**
 * @brief Retry policy configuration
 */
struct retry_config {
    /** Delay before the first retry */
    std::chrono::milliseconds base_delay{2000};

    /** Upper bound on any single delay */
    std::chrono::milliseconds max_delay{60000};

    /** Growth factor between consecutive delays */
    double multiplier = 2.0;

    /** Total attempts (initial attempt included) before a job fails */
    int max_attempts = 5;

    /** Jitter as a fraction of the computed delay, in [0, multiplier - 1) */
    double jitter_ratio = 0.2;

    [[nodiscard]] bool is_valid() const noexcept {
        if (base_delay.count() <= 0) return false;
        if (max_delay < base_delay) return false;
        if (multiplier <= 1.0) return false;
        if (max_attempts <= 0) return false;
        if (jitter_ratio < 0.0 || jitter_ratio >= multiplier - 1.0) return false;
        return true;
    }
};

/**
 * @brief Computes retry decisions and backoff delays
 */
class retry_policy {
public:
    /** Source of uniformly distributed values in [0, 1) */
    using random_source = std::function<double()>;

    /**
     * @brief Construct with configuration and optional random source
     *
     * The default random source is a per-thread Mersenne Twister.
     */
    explicit retry_policy(retry_config config = {},
                          random_source rng = {});

    /**
     * @brief Check whether another attempt is allowed
     * @param failed_attempts Failures recorded so far, including the latest
     */
    [[nodiscard]] bool should_retry(int failed_attempts) const noexcept;

    /**
     * @brief Delay to wait after the given number of failures
     * @param failed_attempts Failures recorded so far (>= 1)
     */
    [[nodiscard]] std::chrono::milliseconds delay_for(int failed_attempts) const;

    [[nodiscard]] const retry_config& config() const noexcept { return config_; }

private:
    retry_config config_;
    random_source rng_;
};

}  // namespace aipacs::pipeline

#endif  // AIPACS_PIPELINE_RETRY_POLICY_H
