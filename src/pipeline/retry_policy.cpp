/**
 * @file retry_policy.cpp
 * @brief Backoff computation for job stage retries
 */

#include "aipacs/pipeline/retry_policy.h"

#include <algorithm>
#include <cmath>
#include <random>

namespace aipacs::pipeline {

namespace {

double default_random() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    thread_local std::uniform_real_distribution<double> dis(0.0, 1.0);
    return dis(gen);
}

}  // namespace

retry_policy::retry_policy(retry_config config, random_source rng)
    : config_(config), rng_(rng ? std::move(rng) : random_source{default_random}) {}

bool retry_policy::should_retry(int failed_attempts) const noexcept {
    return failed_attempts < config_.max_attempts;
}

std::chrono::milliseconds retry_policy::delay_for(int failed_attempts) const {
    if (failed_attempts <= 0) {
        return std::chrono::milliseconds{0};
    }

    double delay = static_cast<double>(config_.base_delay.count()) *
                   std::pow(config_.multiplier, failed_attempts - 1);

    double sample = std::clamp(rng_(), 0.0, std::nextafter(1.0, 0.0));
    delay *= 1.0 + sample * config_.jitter_ratio;

    auto cap = static_cast<double>(config_.max_delay.count());
    return std::chrono::milliseconds{
        static_cast<std::chrono::milliseconds::rep>(std::min(delay, cap))};
}

}  // namespace aipacs::pipeline
