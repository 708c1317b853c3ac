/**
 * @file stream_proc.cpp
 * @brief Job lifecycle for ParallelStreamProc
 */

#include "pstream/core/stream_proc.hpp"

#include <string>

namespace pstream {

ParallelStreamProc::ParallelStreamProc(std::uint32_t num_threads)
    : ParallelStreamProc(WorkerPoolConfig{num_threads}) {}

ParallelStreamProc::ParallelStreamProc(WorkerPoolConfig config)
    : pool_(config) {}

void ParallelStreamProc::abort() noexcept {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_) {
        state_->abort();
    }
}

std::uint32_t ParallelStreamProc::resolve_workers(const BindConfig& config,
                                                  const JobOptions& options) const {
    std::uint32_t workers = pool_.num_workers();
    if (options.max_workers) {
        workers = *options.max_workers;
    } else if (config.max_workers) {
        workers = *config.max_workers;
    }

    if (workers > pool_.num_workers()) {
        throw ConfigError("only have " + std::to_string(pool_.num_workers()) +
                          " worker threads, but asked for " + std::to_string(workers));
    }
    if (workers < 1) {
        throw ConfigError("max_workers can not be less than 1");
    }
    return workers;
}

void ParallelStreamProc::begin_job(std::shared_ptr<RunState> state) {
    // busy_ and state_ change together so an abort() never sees one without the other.
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        bool expected = false;
        if (!busy_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            throw ConcurrencyError("can not run concurrent jobs on one engine");
        }
        state_ = std::move(state);
    }
    metrics_.jobs_started().increment();
    metrics_.active_jobs().increment();
}

void ParallelStreamProc::end_job() noexcept {
    metrics_.active_jobs().decrement();

    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.reset();
    busy_.store(false, std::memory_order_release);
}

void ParallelStreamProc::record_job(const JobReport& report, bool failed) {
    if (failed) {
        metrics_.jobs_failed().increment();
    } else if (report.aborted) {
        metrics_.jobs_aborted().increment();
    } else {
        metrics_.jobs_completed().increment();
    }

    metrics_.items_enqueued().increment(report.items_enqueued);
    metrics_.items_delivered().increment(report.items_delivered);
    metrics_.items_dropped().increment(report.items_dropped);
    metrics_.backpressure_events().increment(report.blocked_count);

    auto seconds = std::chrono::duration_cast<std::chrono::duration<double>>(report.elapsed);
    metrics_.job_duration().observe(seconds.count());
}

JobReport ParallelStreamProc::make_report(const RunState& state,
                                          std::uint32_t workers,
                                          Timestamp start) {
    JobReport report;
    report.workers = workers;
    report.items_enqueued = state.enqueued();
    report.items_delivered = state.delivered();
    report.items_dropped = report.items_enqueued - report.items_delivered;
    report.blocked_count = state.blocked();
    report.aborted = state.aborted();
    report.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start);
    return report;
}

} // namespace pstream
