#pragma once

/**
 * @file stream_proc.hpp
 * @brief Parallel stream processing over a persistent worker pool
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "pstream/core/errors.hpp"
#include "pstream/core/message.hpp"
#include "pstream/core/metrics.hpp"
#include "pstream/core/relay.hpp"
#include "pstream/core/run_state.hpp"
#include "pstream/core/worker_pool.hpp"

namespace pstream {

/**
 * @brief Settings captured when a stream processor is bound
 */
struct BindConfig {
    BlockedHandler on_blocked;
    std::optional<std::uint32_t> max_workers;  // unset = every worker slot
    std::size_t queue_capacity{100};
    std::chrono::milliseconds poll_interval{50};
};

/**
 * @brief Per-call overrides
 */
struct JobOptions {
    std::optional<std::uint32_t> max_workers;
};

/**
 * @brief What a finished (or aborted) job did
 *
 * items_dropped counts items the queue accepted but no processing
 * function ever received; it is non-zero only for aborted or failed jobs.
 */
struct JobReport {
    std::uint32_t workers{0};
    std::uint64_t items_enqueued{0};
    std::uint64_t items_delivered{0};
    std::uint64_t items_dropped{0};
    std::uint64_t blocked_count{0};
    bool aborted{false};
    std::chrono::nanoseconds elapsed{0};
};

template<typename T, typename... Args>
class BoundRunner;

/**
 * @brief Process a stream with a fixed set of persistent threads
 *
 * Behaves like calling proc(stream, args...) once, except that the stream
 * is split across the worker slots: each slot runs proc on its own
 * partition and every item is seen by exactly one slot.
 *
 * @code
 * ParallelStreamProc engine(4);
 * auto runner = engine.bind<Item, Output*>(
 *     [](Partition<Item>& items, Output* out) {
 *         for (auto& item : items) {
 *             out->write(item.index, process(item));
 *         }
 *     });
 * runner(source, &output);
 * @endcode
 *
 * Worker threads are reused between jobs, so per-thread state set up by one
 * job (see SlotLocal) is still there for the next. Several processors can
 * be bound to the same engine but only one job may run at a time; the
 * engine is meant to be driven from a single thread.
 */
class ParallelStreamProc {
public:
    explicit ParallelStreamProc(std::uint32_t num_threads);
    explicit ParallelStreamProc(WorkerPoolConfig config);

    ParallelStreamProc(const ParallelStreamProc&) = delete;
    ParallelStreamProc& operator=(const ParallelStreamProc&) = delete;

    /**
     * @brief Adapt a stream processor into a reusable callable
     *
     * proc is called as proc(Partition<T>&, Args...) on each worker.
     */
    template<typename T, typename... Args, typename Proc>
    BoundRunner<T, Args...> bind(Proc proc, BindConfig config = {});

    /**
     * @brief Run one job and block until every partition is done
     *
     * @throws ConfigError if the worker count, capacity or poll interval is invalid
     * @throws ConcurrencyError if another job is running on this engine, or
     *         if called from one of the engine's worker slots
     * @throws the first exception raised by proc (or by the source), after
     *         all partitions have settled
     */
    template<typename T, typename Source, typename Proc, typename... Args>
    JobReport run(Source&& source,
                  Proc& proc,
                  const BindConfig& config,
                  const JobOptions& options,
                  Args&&... args);

    /**
     * @brief Run func(args...) once on every worker slot
     * @return Results in slot order
     */
    template<typename Func, typename... Args>
    auto broadcast(Func&& func, Args&&... args) {
        return pool_.broadcast(std::forward<Func>(func), std::forward<Args>(args)...);
    }

    /**
     * @brief Ask the running job to stop; no-op when idle
     */
    void abort() noexcept;

    /**
     * @brief Whether a job is currently running
     */
    [[nodiscard]] bool busy() const noexcept {
        return busy_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::uint32_t num_workers() const noexcept { return pool_.num_workers(); }

    [[nodiscard]] WorkerPool& pool() noexcept { return pool_; }
    [[nodiscard]] const WorkerPool& pool() const noexcept { return pool_; }

    [[nodiscard]] MetricsCollector& metrics() noexcept { return metrics_; }
    [[nodiscard]] const MetricsCollector& metrics() const noexcept { return metrics_; }

private:
    // Holds the engine's single job slot for the duration of one run().
    class JobGuard {
    public:
        JobGuard(ParallelStreamProc& engine, std::shared_ptr<RunState> state)
            : engine_(engine) {
            engine_.begin_job(std::move(state));
        }

        ~JobGuard() {
            engine_.end_job();
        }

        JobGuard(const JobGuard&) = delete;
        JobGuard& operator=(const JobGuard&) = delete;

    private:
        ParallelStreamProc& engine_;
    };

    [[nodiscard]] std::uint32_t resolve_workers(const BindConfig& config,
                                                const JobOptions& options) const;
    void begin_job(std::shared_ptr<RunState> state);
    void end_job() noexcept;
    void record_job(const JobReport& report, bool failed);

    static JobReport make_report(const RunState& state, std::uint32_t workers, Timestamp start);

    WorkerPool pool_;
    MetricsCollector metrics_;

    std::atomic<bool> busy_{false};
    std::mutex state_mutex_;
    std::shared_ptr<RunState> state_;
};

/**
 * @brief Stream processor bound to an engine
 */
template<typename T, typename... Args>
class BoundRunner {
public:
    using Proc = std::function<void(Partition<T>&, Args...)>;

    BoundRunner(ParallelStreamProc& engine, Proc proc, BindConfig config)
        : engine_(&engine)
        , proc_(std::move(proc))
        , config_(std::move(config)) {}

    /**
     * @brief Process a source with the bound settings
     */
    template<typename Source>
    JobReport operator()(Source&& source, Args... args) {
        return run_with(JobOptions{}, std::forward<Source>(source), std::move(args)...);
    }

    /**
     * @brief Process a source, overriding the worker count for this call
     */
    template<typename Source>
    JobReport run_with(const JobOptions& options, Source&& source, Args... args) {
        return engine_->template run<T>(
            std::forward<Source>(source), proc_, config_, options, args...
        );
    }

    void abort() noexcept { engine_->abort(); }

    [[nodiscard]] const BindConfig& config() const noexcept { return config_; }

private:
    ParallelStreamProc* engine_;
    Proc proc_;
    BindConfig config_;
};

template<typename T, typename... Args, typename Proc>
BoundRunner<T, Args...> ParallelStreamProc::bind(Proc proc, BindConfig config) {
    return BoundRunner<T, Args...>(*this, std::move(proc), std::move(config));
}

template<typename T, typename Source, typename Proc, typename... Args>
JobReport ParallelStreamProc::run(Source&& source,
                                  Proc& proc,
                                  const BindConfig& config,
                                  const JobOptions& options,
                                  Args&&... args) {
    if (pool_.current_slot()) {
        // Its own partition would queue behind the calling task forever.
        throw ConcurrencyError("can not start a job from one of the engine's worker slots");
    }
    const std::uint32_t workers = resolve_workers(config, options);

    // Validates capacity and poll interval before the job is counted.
    BoundedRelay<T> relay(RelayConfig{workers, config.queue_capacity, config.poll_interval});

    JobGuard guard(*this, relay.state());
    RunState& state = *relay.state();
    const auto start = Clock::now();

    std::vector<std::future<void>> futures;
    futures.reserve(workers);

    std::exception_ptr pump_error;
    try {
        for (std::uint32_t i = 0; i < workers; i++) {
            auto& partition = relay.partition(i);
            futures.push_back(pool_.submit(i, [&partition, &state, &proc, &args...]() {
                try {
                    std::invoke(proc, partition, args...);
                } catch (...) {
                    partition.close();
                    state.record_failure(std::current_exception());
                    throw;
                }
                partition.close();
            }));
        }

        relay.run(source, config.on_blocked);
    } catch (...) {
        // Consumers hold references into the relay: stop them before unwinding.
        pump_error = std::current_exception();
        state.abort();
    }

    for (auto& f : futures) {
        f.wait();
    }

    JobReport report = make_report(state, workers, start);
    std::exception_ptr failure = pump_error ? pump_error : state.failure();
    record_job(report, failure != nullptr);

    if (failure) {
        std::rethrow_exception(failure);
    }
    return report;
}

} // namespace pstream
