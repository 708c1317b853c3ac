#pragma once

/**
 * @file run_state.hpp
 * @brief Per-job coordination state shared by producer and consumers
 */

#include <atomic>
#include <cstdint>
#include <exception>
#include <mutex>

namespace pstream {

/**
 * @brief Transient state of one job
 *
 * Created when a job starts and destroyed when it ends. All flags and
 * counters are read across threads and are therefore atomic.
 */
class RunState {
public:
    explicit RunState(std::uint32_t partitions)
        : partitions_(partitions)
        , live_consumers_(partitions) {}

    RunState(const RunState&) = delete;
    RunState& operator=(const RunState&) = delete;

    /**
     * @brief Request a cooperative stop (idempotent)
     */
    void abort() noexcept {
        aborted_.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool aborted() const noexcept {
        return aborted_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::uint32_t partitions() const noexcept { return partitions_; }

    /**
     * @brief Consumers that have not yet finished their partition
     */
    [[nodiscard]] std::uint32_t live_consumers() const noexcept {
        return live_consumers_.load(std::memory_order_acquire);
    }

    void detach_consumer() noexcept {
        live_consumers_.fetch_sub(1, std::memory_order_acq_rel);
    }

    void record_enqueued() noexcept { enqueued_.fetch_add(1, std::memory_order_relaxed); }
    void record_delivered() noexcept { delivered_.fetch_add(1, std::memory_order_relaxed); }
    void record_blocked() noexcept { blocked_.fetch_add(1, std::memory_order_relaxed); }

    [[nodiscard]] std::uint64_t enqueued() const noexcept {
        return enqueued_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t delivered() const noexcept {
        return delivered_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t blocked() const noexcept {
        return blocked_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Keep the first failure raised by any partition
     */
    void record_failure(std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!failure_) {
            failure_ = std::move(error);
        }
    }

    [[nodiscard]] std::exception_ptr failure() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return failure_;
    }

private:
    const std::uint32_t partitions_;
    std::atomic<bool> aborted_{false};
    std::atomic<std::uint32_t> live_consumers_;

    std::atomic<std::uint64_t> enqueued_{0};
    std::atomic<std::uint64_t> delivered_{0};
    std::atomic<std::uint64_t> blocked_{0};

    mutable std::mutex mutex_;
    std::exception_ptr failure_;
};

} // namespace pstream
