#pragma once

/**
 * @file worker_pool.hpp
 * @brief Pool of persistent single-thread worker slots
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "pstream/core/errors.hpp"

namespace pstream {

class WorkerPool;

/**
 * @brief Worker slot statistics
 */
struct WorkerStats {
    std::uint64_t tasks_completed{0};
    std::uint64_t active_time_ns{0};
};

/**
 * @brief One persistent worker thread with its own FIFO task list
 *
 * The thread is started by the constructor and lives until the slot is
 * destroyed, so everything a task leaves in thread-local storage is still
 * there for the next task on the same slot.
 */
class WorkerSlot {
public:
    using Task = std::function<void()>;

    WorkerSlot(std::uint32_t index, const WorkerPool* owner);
    ~WorkerSlot();

    WorkerSlot(const WorkerSlot&) = delete;
    WorkerSlot& operator=(const WorkerSlot&) = delete;

    /**
     * @brief Queue a callable on this slot
     * @return Future holding the callable's result or exception
     */
    template<typename Func>
    auto submit(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>&>> {
        using Result = std::invoke_result_t<std::decay_t<Func>&>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Func>(func));
        auto future = task->get_future();
        enqueue([task]() { (*task)(); });
        return future;
    }

    /**
     * @brief Let queued tasks finish, then join the thread
     */
    void stop();

    [[nodiscard]] std::uint32_t index() const noexcept { return index_; }
    [[nodiscard]] std::thread::id thread_id() const noexcept { return thread_.get_id(); }
    [[nodiscard]] WorkerStats stats() const noexcept;

private:
    void enqueue(Task task);
    void run();

    std::uint32_t index_;
    const WorkerPool* owner_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool stopping_{false};

    std::atomic<std::uint64_t> tasks_completed_{0};
    std::atomic<std::uint64_t> active_time_ns_{0};

    std::thread thread_;
};

/**
 * @brief Configuration for worker pool
 */
struct WorkerPoolConfig {
    std::uint32_t num_workers{0};  // 0 = auto-detect
};

/**
 * @brief Fixed set of worker slots, created once and reused for every job
 */
class WorkerPool {
public:
    explicit WorkerPool(WorkerPoolConfig config = {});
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Run a callable on one slot
     */
    template<typename Func>
    auto submit(std::size_t slot, Func&& func) {
        return workers_.at(slot)->submit(std::forward<Func>(func));
    }

    /**
     * @brief Run func(args...) once on every slot and collect the results
     *
     * Blocks until all slots are done. Results are returned in slot order;
     * if any slot throws, the first failure in slot order is rethrown after
     * every slot has finished.
     */
    template<typename Func, typename... Args>
    auto broadcast(Func&& func, Args&&... args) {
        using Result = std::invoke_result_t<std::decay_t<Func>&, std::decay_t<Args>&...>;

        if (current_slot()) {
            throw ConcurrencyError("broadcast() called from one of the pool's own worker slots");
        }

        std::vector<std::future<Result>> futures;
        futures.reserve(workers_.size());
        for (auto& worker : workers_) {
            futures.push_back(worker->submit([&func, &args...]() -> Result {
                return std::invoke(func, args...);
            }));
        }
        for (auto& f : futures) {
            f.wait();
        }

        if constexpr (std::is_void_v<Result>) {
            for (auto& f : futures) {
                f.get();
            }
        } else {
            std::vector<Result> results;
            results.reserve(futures.size());
            for (auto& f : futures) {
                results.push_back(f.get());
            }
            return results;
        }
    }

    /**
     * @brief Slot index of the calling thread, if it is one of ours
     */
    [[nodiscard]] std::optional<std::uint32_t> current_slot() const noexcept;

    [[nodiscard]] std::uint32_t num_workers() const noexcept {
        return config_.num_workers;
    }

    [[nodiscard]] WorkerSlot& slot(std::size_t index) { return *workers_.at(index); }

    /**
     * @brief Get per-slot statistics
     */
    [[nodiscard]] std::vector<WorkerStats> stats() const;

private:
    WorkerPoolConfig config_;
    std::vector<std::unique_ptr<WorkerSlot>> workers_;
};

} // namespace pstream
