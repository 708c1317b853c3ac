/**
 * @file latency_benchmark.cpp
 * @brief Latency benchmarks for PStream
 */

#include <benchmark/benchmark.h>
#include <chrono>

#include "pstream/pstream.hpp"

using namespace pstream;

static void BM_EndToEndLatency(benchmark::State& state) {
    const auto num_workers = static_cast<std::uint32_t>(state.range(0));

    ParallelStreamProc engine(num_workers);
    auto runner = engine.bind<int>([](Partition<int>& items) {
        for (auto& item : items) {
            benchmark::DoNotOptimize(item);
        }
    });

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();
        runner(sequence<int>(0, 1000));
        auto end = std::chrono::high_resolution_clock::now();

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        state.SetIterationTime(duration.count() / 1e6);
    }

    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_EndToEndLatency)->Arg(1)->Arg(2)->Arg(4)->UseManualTime();

// Fixed cost of a job: empty source, every partition just sees end of stream.
static void BM_EmptyJobLatency(benchmark::State& state) {
    const auto num_workers = static_cast<std::uint32_t>(state.range(0));

    ParallelStreamProc engine(num_workers);
    auto runner = engine.bind<int>([](Partition<int>& items) {
        for (auto& item : items) {
            benchmark::DoNotOptimize(item);
        }
    });

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();
        runner(sequence<int>(0, 0));
        auto end = std::chrono::high_resolution_clock::now();

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        state.SetIterationTime(duration.count() / 1e6);
    }
}
BENCHMARK(BM_EmptyJobLatency)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->UseManualTime();

static void BM_BroadcastLatency(benchmark::State& state) {
    const auto num_workers = static_cast<std::uint32_t>(state.range(0));
    ParallelStreamProc engine(num_workers);

    for (auto _ : state) {
        auto results = engine.broadcast([](int x) { return x + 1; }, 41);
        benchmark::DoNotOptimize(results);
    }
}
BENCHMARK(BM_BroadcastLatency)->Arg(1)->Arg(2)->Arg(4)->Arg(8);

BENCHMARK_MAIN();
