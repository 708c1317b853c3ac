/**
 * @file worker_pool.cpp
 * @brief Worker pool implementation
 */

#include "pstream/core/worker_pool.hpp"

#include <chrono>

namespace pstream {

namespace {

// Identity of the slot owning the current thread, set once per worker thread.
thread_local const WorkerPool* tls_owner = nullptr;
thread_local std::uint32_t tls_slot = 0;

} // namespace

WorkerSlot::WorkerSlot(std::uint32_t index, const WorkerPool* owner)
    : index_(index)
    , owner_(owner)
    , thread_(&WorkerSlot::run, this) {}

WorkerSlot::~WorkerSlot() {
    stop();
}

void WorkerSlot::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

WorkerStats WorkerSlot::stats() const noexcept {
    WorkerStats s;
    s.tasks_completed = tasks_completed_.load(std::memory_order_relaxed);
    s.active_time_ns = active_time_ns_.load(std::memory_order_relaxed);
    return s;
}

void WorkerSlot::enqueue(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw Error("worker slot is shutting down");
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void WorkerSlot::run() {
    tls_owner = owner_;
    tls_slot = index_;

    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;  // stopping and drained
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        auto start = std::chrono::steady_clock::now();

        // Tasks are packaged_tasks: any exception lands in their future.
        task();

        auto end = std::chrono::steady_clock::now();
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
        active_time_ns_.fetch_add(static_cast<std::uint64_t>(ns), std::memory_order_relaxed);
        tasks_completed_.fetch_add(1, std::memory_order_relaxed);
    }
}

WorkerPool::WorkerPool(WorkerPoolConfig config)
    : config_(config) {
    if (config_.num_workers == 0) {
        config_.num_workers = std::thread::hardware_concurrency();
        if (config_.num_workers == 0) {
            config_.num_workers = 4;  // Fallback
        }
    }

    workers_.reserve(config_.num_workers);
    for (std::uint32_t i = 0; i < config_.num_workers; i++) {
        workers_.push_back(std::make_unique<WorkerSlot>(i, this));
    }
}

WorkerPool::~WorkerPool() {
    for (auto& worker : workers_) {
        worker->stop();
    }
}

std::optional<std::uint32_t> WorkerPool::current_slot() const noexcept {
    if (tls_owner == this) {
        return tls_slot;
    }
    return std::nullopt;
}

std::vector<WorkerStats> WorkerPool::stats() const {
    std::vector<WorkerStats> result;
    result.reserve(workers_.size());
    for (const auto& worker : workers_) {
        result.push_back(worker->stats());
    }
    return result;
}

} // namespace pstream
