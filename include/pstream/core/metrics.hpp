#pragma once

/**
 * @file metrics.hpp
 * @brief Engine metrics collection and reporting
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace pstream {

/**
 * @brief Counter metric (monotonically increasing)
 */
class Counter {
public:
    void increment(std::uint64_t value = 1) noexcept {
        value_.fetch_add(value, std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

    void reset() noexcept {
        value_.store(0, std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> value_{0};
};

/**
 * @brief Gauge metric (can go up and down)
 */
class Gauge {
public:
    void set(std::int64_t value) noexcept {
        value_.store(value, std::memory_order_relaxed);
    }

    void increment(std::int64_t delta = 1) noexcept {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }

    void decrement(std::int64_t delta = 1) noexcept {
        value_.fetch_sub(delta, std::memory_order_relaxed);
    }

    [[nodiscard]] std::int64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::int64_t> value_{0};
};

/**
 * @brief Histogram for duration measurements (seconds)
 */
class Histogram {
public:
    explicit Histogram(std::vector<double> buckets = default_buckets())
        : buckets_(std::move(buckets))
        , counts_(buckets_.size() + 1, 0) {}

    void observe(double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        sum_ += value;
        count_++;

        for (std::size_t i = 0; i < buckets_.size(); i++) {
            if (value <= buckets_[i]) {
                counts_[i]++;
                return;
            }
        }
        counts_.back()++;  // +Inf bucket
    }

    [[nodiscard]] double sum() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sum_;
    }

    [[nodiscard]] std::uint64_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    [[nodiscard]] double mean() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_ > 0 ? sum_ / static_cast<double>(count_) : 0.0;
    }

    /**
     * @brief Per-bucket counts, the last entry being the +Inf bucket
     */
    [[nodiscard]] std::vector<std::uint64_t> bucket_counts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return counts_;
    }

    static std::vector<double> default_buckets() {
        return {0.001, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0};
    }

private:
    mutable std::mutex mutex_;
    std::vector<double> buckets_;
    std::vector<std::uint64_t> counts_;
    double sum_{0.0};
    std::uint64_t count_{0};
};

/**
 * @brief Engine metrics snapshot
 */
struct EngineMetrics {
    std::uint64_t jobs_started{0};
    std::uint64_t jobs_completed{0};
    std::uint64_t jobs_failed{0};
    std::uint64_t jobs_aborted{0};
    std::uint64_t items_enqueued{0};
    std::uint64_t items_delivered{0};
    std::uint64_t items_dropped{0};
    std::uint64_t backpressure_events{0};
    std::int64_t active_jobs{0};
    double avg_job_ms{0.0};
};

/**
 * @brief Metrics collector and reporter
 */
class MetricsCollector {
public:
    MetricsCollector() : start_time_(std::chrono::steady_clock::now()) {}

    Counter& jobs_started() { return jobs_started_; }
    Counter& jobs_completed() { return jobs_completed_; }
    Counter& jobs_failed() { return jobs_failed_; }
    Counter& jobs_aborted() { return jobs_aborted_; }

    Counter& items_enqueued() { return items_enqueued_; }
    Counter& items_delivered() { return items_delivered_; }
    Counter& items_dropped() { return items_dropped_; }
    Counter& backpressure_events() { return backpressure_; }

    Gauge& active_jobs() { return active_jobs_; }

    Histogram& job_duration() { return job_duration_; }

    [[nodiscard]] EngineMetrics snapshot() const {
        EngineMetrics m;
        m.jobs_started = jobs_started_.value();
        m.jobs_completed = jobs_completed_.value();
        m.jobs_failed = jobs_failed_.value();
        m.jobs_aborted = jobs_aborted_.value();
        m.items_enqueued = items_enqueued_.value();
        m.items_delivered = items_delivered_.value();
        m.items_dropped = items_dropped_.value();
        m.backpressure_events = backpressure_.value();
        m.active_jobs = active_jobs_.value();
        m.avg_job_ms = job_duration_.mean() * 1000.0;
        return m;
    }

    /**
     * @brief Format metrics as string
     */
    [[nodiscard]] std::string format() const {
        auto m = snapshot();
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2);
        oss << "Jobs: " << m.jobs_completed << "/" << m.jobs_started
            << " (failed " << m.jobs_failed << ", aborted " << m.jobs_aborted << ")"
            << " | Items: " << m.items_delivered << "/" << m.items_enqueued
            << " | Dropped: " << m.items_dropped
            << " | Backpressure: " << m.backpressure_events
            << " | Avg job: " << m.avg_job_ms << " ms";
        return oss.str();
    }

    /**
     * @brief Print metrics to stdout
     */
    void print() const {
        std::cout << format() << std::endl;
    }

    [[nodiscard]] std::chrono::milliseconds uptime() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_
        );
    }

private:
    std::chrono::steady_clock::time_point start_time_;

    Counter jobs_started_;
    Counter jobs_completed_;
    Counter jobs_failed_;
    Counter jobs_aborted_;
    Counter items_enqueued_;
    Counter items_delivered_;
    Counter items_dropped_;
    Counter backpressure_;
    Gauge active_jobs_;
    Histogram job_duration_;
};

} // namespace pstream
