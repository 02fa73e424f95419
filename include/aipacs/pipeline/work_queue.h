#ifndef AIPACS_PIPELINE_WORK_QUEUE_H
#define AIPACS_PIPELINE_WORK_QUEUE_H

/**
 * @file work_queue.h
 * @brief Bounded in-memory work queue with explicit backpressure
 *
 * Producers either get queue_error::queue_full immediately (reject policy)
 * or wait for space (block policy). Closing the queue wakes all waiters;
 * consumers drain remaining items and then receive std::nullopt.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <mutex>
#include <optional>

namespace aipacs::pipeline {

// =============================================================================
// Queue Error Codes (-730 to -739)
// =============================================================================

/**
 * @brief Work queue error codes
 *
 * Allocated range: -730 to -739
 */
enum class queue_error : int {
    /** Queue is at capacity and the policy is reject */
    queue_full = -730,

    /** Queue has been closed */
    queue_closed = -731,

    /** Timed out waiting for space */
    push_timeout = -732
};

[[nodiscard]] constexpr int to_error_code(queue_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(queue_error error) noexcept {
    switch (error) {
        case queue_error::queue_full:
            return "Work queue is full";
        case queue_error::queue_closed:
            return "Work queue is closed";
        case queue_error::push_timeout:
            return "Timed out waiting for work queue space";
        default:
            return "Unknown work queue error";
    }
}

/**
 * @brief Behavior of push() when the queue is full
 */
enum class overflow_policy {
    /** Fail immediately with queue_full */
    reject,
    /** Wait until space is available or the queue closes */
    block
};

[[nodiscard]] constexpr const char* to_string(overflow_policy policy) noexcept {
    switch (policy) {
        case overflow_policy::reject:
            return "reject";
        case overflow_policy::block:
            return "block";
        default:
            return "unknown";
    }
}

// =============================================================================
// Bounded Work Queue
// =============================================================================

/**
 * @brief Thread-safe FIFO with fixed capacity
 *
 * @tparam T Work item type
 */
template <typename T>
class bounded_work_queue {
public:
    explicit bounded_work_queue(std::size_t capacity,
                                overflow_policy policy = overflow_policy::reject)
        : capacity_(capacity == 0 ? 1 : capacity), policy_(policy) {}

    bounded_work_queue(const bounded_work_queue&) = delete;
    bounded_work_queue& operator=(const bounded_work_queue&) = delete;

    /**
     * @brief Add an item according to the overflow policy
     */
    [[nodiscard]] std::expected<void, queue_error> push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) {
            return std::unexpected(queue_error::queue_closed);
        }
        if (items_.size() >= capacity_) {
            if (policy_ == overflow_policy::reject) {
                return std::unexpected(queue_error::queue_full);
            }
            not_full_.wait(lock, [this] {
                return closed_ || items_.size() < capacity_;
            });
            if (closed_) {
                return std::unexpected(queue_error::queue_closed);
            }
        }
        items_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return {};
    }

    /**
     * @brief Add an item, waiting at most @p timeout for space
     *
     * Waits regardless of the configured policy.
     */
    [[nodiscard]] std::expected<void, queue_error> push_for(
        T item, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = not_full_.wait_for(lock, timeout, [this] {
            return closed_ || items_.size() < capacity_;
        });
        if (closed_) {
            return std::unexpected(queue_error::queue_closed);
        }
        if (!ready) {
            return std::unexpected(queue_error::push_timeout);
        }
        items_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return {};
    }

    /**
     * @brief Remove the oldest item, waiting at most @p timeout
     * @return The item, or std::nullopt on timeout or when closed and drained
     */
    [[nodiscard]] std::optional<T> pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout,
                                 [this] { return closed_ || !items_.empty(); })) {
            return std::nullopt;
        }
        return take(lock);
    }

    [[nodiscard]] std::optional<T> try_pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        return take(lock);
    }

    /**
     * @brief Close the queue and wake all waiting producers and consumers
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] bool full() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size() >= capacity_;
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    [[nodiscard]] overflow_policy policy() const noexcept { return policy_; }

private:
    std::optional<T> take(std::unique_lock<std::mutex>& lock) {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    const std::size_t capacity_;
    const overflow_policy policy_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_ = false;
};

}  // namespace aipacs::pipeline

#endif  // AIPACS_PIPELINE_WORK_QUEUE_H
