/**
 * @file throughput_benchmark.cpp
 * @brief Throughput benchmarks for PStream
 */

#include <benchmark/benchmark.h>
#include <atomic>
#include <chrono>

#include "pstream/pstream.hpp"

using namespace pstream;

static void BM_QueueTryPushPop(benchmark::State& state) {
    BoundedQueue<int> queue(4096);

    for (auto _ : state) {
        queue.try_push(42);
        auto result = queue.try_pop();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_QueueTryPushPop);

static void BM_QueueTimedPushPop(benchmark::State& state) {
    BoundedQueue<int> queue(4096);

    for (auto _ : state) {
        int item = 42;
        queue.push_for(item, std::chrono::milliseconds(1));
        auto result = queue.pop_for(std::chrono::milliseconds(1));
        queue.task_done();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_QueueTimedPushPop);

static void BM_SequenceGenerator(benchmark::State& state) {
    auto gen = sequence<std::int64_t>(0, static_cast<std::uint64_t>(state.max_iterations));

    for (auto _ : state) {
        auto value = gen();
        benchmark::DoNotOptimize(value);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SequenceGenerator);

static void BM_JobThroughput(benchmark::State& state) {
    const auto num_workers = static_cast<std::uint32_t>(state.range(0));
    constexpr int num_items = 10000;

    ParallelStreamProc engine(num_workers);
    std::atomic<long long> sum{0};

    BindConfig config;
    config.queue_capacity = 1024;
    auto runner = engine.bind<int>([&sum](Partition<int>& items) {
        long long local = 0;
        for (auto& item : items) {
            local += item;
        }
        sum.fetch_add(local, std::memory_order_relaxed);
    }, config);

    for (auto _ : state) {
        runner(sequence<int>(0, num_items));
    }

    benchmark::DoNotOptimize(sum.load());
    state.SetItemsProcessed(state.iterations() * num_items);
}
BENCHMARK(BM_JobThroughput)->Arg(1)->Arg(2)->Arg(4);

static void BM_QueueCapacity(benchmark::State& state) {
    const auto capacity = static_cast<std::size_t>(state.range(0));
    constexpr int num_items = 10000;

    ParallelStreamProc engine(2);
    BindConfig config;
    config.queue_capacity = capacity;
    auto runner = engine.bind<int>([](Partition<int>& items) {
        for (auto& item : items) {
            benchmark::DoNotOptimize(item);
        }
    }, config);

    for (auto _ : state) {
        runner(sequence<int>(0, num_items));
    }

    state.SetItemsProcessed(state.iterations() * num_items);
}
BENCHMARK(BM_QueueCapacity)->Arg(1)->Arg(16)->Arg(256)->Arg(4096);

BENCHMARK_MAIN();
