/**
 * @file stream_proc_test.cpp
 * @brief Integration tests for ParallelStreamProc jobs
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <numeric>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "pstream/pstream.hpp"

using namespace pstream;
using namespace std::chrono_literals;

namespace {

class ItemFailure : public std::runtime_error {
public:
    explicit ItemFailure(int item)
        : std::runtime_error("failed on item " + std::to_string(item))
        , item_(item) {}

    [[nodiscard]] int item() const noexcept { return item_; }

private:
    int item_;
};

BindConfig fast_config() {
    BindConfig config;
    config.poll_interval = 5ms;
    return config;
}

} // namespace

class StreamProcTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(StreamProcTest, IndexedOutputIsComplete) {
    ParallelStreamProc engine(4);
    std::vector<int> out(100, -1);

    auto runner = engine.bind<int, std::vector<int>*>(
        [](Partition<int>& items, std::vector<int>* dst) {
            for (auto& item : items) {
                (*dst)[static_cast<std::size_t>(item)] = item;
            }
        },
        fast_config());

    auto report = runner(sequence<int>(0, 100), &out);

    std::vector<int> expected(100);
    std::iota(expected.begin(), expected.end(), 0);
    EXPECT_EQ(out, expected);

    EXPECT_EQ(report.workers, 4u);
    EXPECT_EQ(report.items_enqueued, 100u);
    EXPECT_EQ(report.items_delivered, 100u);
    EXPECT_EQ(report.items_dropped, 0u);
    EXPECT_FALSE(report.aborted);
    EXPECT_FALSE(engine.busy());
}

TEST_F(StreamProcTest, RepeatedJobsReuseEngine) {
    ParallelStreamProc engine(3);
    std::atomic<long long> sum{0};

    auto runner = engine.bind<int>([&](Partition<int>& items) {
        for (auto& item : items) {
            sum.fetch_add(item, std::memory_order_relaxed);
        }
    }, fast_config());

    for (int round = 0; round < 5; round++) {
        sum = 0;
        runner(sequence<int>(1, 1000));
        EXPECT_EQ(sum.load(), 500500);
    }
    EXPECT_EQ(engine.metrics().snapshot().jobs_completed, 5u);
}

TEST_F(StreamProcTest, EmptySourceRunsEveryPartitionToCompletion) {
    ParallelStreamProc engine(4);
    std::atomic<int> partitions_done{0};
    std::atomic<int> items_seen{0};

    auto runner = engine.bind<int>([&](Partition<int>& items) {
        for (auto& item : items) {
            (void)item;
            items_seen++;
        }
        partitions_done++;
    }, fast_config());

    auto report = runner(std::vector<int>{});

    EXPECT_EQ(partitions_done.load(), 4);
    EXPECT_EQ(items_seen.load(), 0);
    EXPECT_EQ(report.items_enqueued, 0u);
}

TEST_F(StreamProcTest, ExtraArgumentsReachEveryPartition) {
    ParallelStreamProc engine(2);
    std::mutex mutex;
    std::vector<std::string> tagged;

    auto runner = engine.bind<int, const std::string&, int>(
        [&](Partition<int>& items, const std::string& prefix, int scale) {
            for (auto& item : items) {
                std::lock_guard<std::mutex> lock(mutex);
                tagged.push_back(prefix + std::to_string(item * scale));
            }
        },
        fast_config());

    runner(std::vector<int>{1, 2, 3}, std::string("v"), 10);

    std::sort(tagged.begin(), tagged.end());
    EXPECT_EQ(tagged, (std::vector<std::string>{"v10", "v20", "v30"}));
}

TEST_F(StreamProcTest, ConcurrentJobRejected) {
    ParallelStreamProc engine(2);
    std::promise<void> release;
    auto released = release.get_future().share();

    auto blocking = engine.bind<int>([released](Partition<int>& items) {
        released.wait();
        for (auto& item : items) {
            (void)item;
        }
    }, fast_config());

    std::thread first([&]() {
        blocking(sequence<int>(0, 10));
    });

    while (!engine.busy()) {
        std::this_thread::sleep_for(1ms);
    }

    auto other = engine.bind<int>([](Partition<int>& items) {
        for (auto& item : items) {
            (void)item;
        }
    }, fast_config());

    EXPECT_THROW(other(sequence<int>(0, 10)), ConcurrencyError);
    EXPECT_THROW(blocking(sequence<int>(0, 10)), ConcurrencyError);

    release.set_value();
    first.join();

    auto report = other(sequence<int>(0, 10));
    EXPECT_EQ(report.items_delivered, 10u);
}

TEST_F(StreamProcTest, JobFromWorkerSlotRejected) {
    ParallelStreamProc engine(2);
    auto runner = engine.bind<int>([](Partition<int>& items) {
        for (auto& item : items) {
            (void)item;
        }
    }, fast_config());

    EXPECT_THROW(engine.broadcast([&]() {
        if (*engine.pool().current_slot() == 0) {
            runner(sequence<int>(0, 5));
        }
    }), ConcurrencyError);

    EXPECT_FALSE(engine.busy());
    EXPECT_EQ(engine.metrics().snapshot().jobs_started, 0u);

    auto report = runner(sequence<int>(0, 5));
    EXPECT_EQ(report.items_delivered, 5u);
}

TEST_F(StreamProcTest, AbortOnceBusyIsNeverLost) {
    ParallelStreamProc engine(2);

    auto runner = engine.bind<int>([](Partition<int>& items) {
        for (auto& item : items) {
            (void)item;
            std::this_thread::sleep_for(1ms);
        }
    }, fast_config());

    std::thread aborter([&]() {
        while (!engine.busy()) {
            std::this_thread::yield();
        }
        engine.abort();
    });

    auto report = runner(sequence<int>(0, 100000));
    aborter.join();

    EXPECT_TRUE(report.aborted);
    EXPECT_LT(report.items_delivered, 100000u);
}

TEST_F(StreamProcTest, WorkerCountValidation) {
    ParallelStreamProc engine(3);
    auto proc = [](Partition<int>& items) {
        for (auto& item : items) {
            (void)item;
        }
    };

    auto too_many = fast_config();
    too_many.max_workers = 4;
    EXPECT_THROW(engine.bind<int>(proc, too_many)(sequence<int>(0, 5)), ConfigError);

    auto too_few = fast_config();
    too_few.max_workers = 0;
    EXPECT_THROW(engine.bind<int>(proc, too_few)(sequence<int>(0, 5)), ConfigError);

    auto exact = fast_config();
    exact.max_workers = 3;
    auto report = engine.bind<int>(proc, exact)(sequence<int>(0, 5));
    EXPECT_EQ(report.workers, 3u);
    EXPECT_EQ(report.items_delivered, 5u);

    // Config errors leave the engine idle and usable
    EXPECT_FALSE(engine.busy());
    EXPECT_EQ(engine.metrics().snapshot().jobs_started, 1u);
}

TEST_F(StreamProcTest, PerCallWorkerOverride) {
    ParallelStreamProc engine(4);
    std::mutex mutex;
    std::set<std::uint32_t> slots_used;

    auto runner = engine.bind<int>([&](Partition<int>& items) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            slots_used.insert(*engine.pool().current_slot());
        }
        for (auto& item : items) {
            (void)item;
        }
    }, fast_config());

    auto report = runner.run_with(JobOptions{2}, sequence<int>(0, 20));
    EXPECT_EQ(report.workers, 2u);
    EXPECT_EQ(slots_used, (std::set<std::uint32_t>{0, 1}));

    EXPECT_THROW(runner.run_with(JobOptions{5}, sequence<int>(0, 20)), ConfigError);
    EXPECT_THROW(runner.run_with(JobOptions{0}, sequence<int>(0, 20)), ConfigError);
}

TEST_F(StreamProcTest, InvalidQueueSettingsRejected) {
    ParallelStreamProc engine(2);
    auto proc = [](Partition<int>& items) {
        for (auto& item : items) {
            (void)item;
        }
    };

    auto no_capacity = fast_config();
    no_capacity.queue_capacity = 0;
    EXPECT_THROW(engine.bind<int>(proc, no_capacity)(sequence<int>(0, 5)), ConfigError);
    EXPECT_FALSE(engine.busy());

    auto no_poll = fast_config();
    no_poll.poll_interval = std::chrono::milliseconds(0);
    EXPECT_THROW(engine.bind<int>(proc, no_poll)(sequence<int>(0, 5)), ConfigError);

    // Rejected before the job is counted
    auto rejected = engine.metrics().snapshot();
    EXPECT_EQ(rejected.jobs_started, 0u);
    EXPECT_EQ(rejected.active_jobs, 0);

    auto report = engine.bind<int>(proc, fast_config())(sequence<int>(0, 5));
    EXPECT_EQ(report.items_delivered, 5u);
}

TEST_F(StreamProcTest, BroadcastOncePerWorker) {
    ParallelStreamProc engine(4);
    std::atomic<int> calls{0};

    auto results = engine.broadcast([&](int offset) {
        calls++;
        return static_cast<int>(*engine.pool().current_slot()) + offset;
    }, 100);

    EXPECT_EQ(calls.load(), 4);
    EXPECT_EQ(results, (std::vector<int>{100, 101, 102, 103}));
}

TEST_F(StreamProcTest, AbortStopsJobAndEngineStaysUsable) {
    ParallelStreamProc engine(2);
    std::atomic<int> processed{0};

    auto config = fast_config();
    config.queue_capacity = 4;
    auto runner = engine.bind<int>([&](Partition<int>& items) {
        for (auto& item : items) {
            (void)item;
            if (++processed == 10) {
                engine.abort();
            }
            std::this_thread::sleep_for(1ms);
        }
    }, config);

    auto report = runner(sequence<int>(0, 10000));

    EXPECT_TRUE(report.aborted);
    EXPECT_LT(processed.load(), 10000);
    EXPECT_EQ(report.items_delivered, static_cast<std::uint64_t>(processed.load()));
    EXPECT_EQ(report.items_dropped, report.items_enqueued - report.items_delivered);
    EXPECT_EQ(engine.metrics().snapshot().jobs_aborted, 1u);

    processed = 0;
    auto quick = engine.bind<int>([&](Partition<int>& items) {
        for (auto& item : items) {
            (void)item;
            processed++;
        }
    }, fast_config());

    auto second = quick(sequence<int>(0, 50));
    EXPECT_FALSE(second.aborted);
    EXPECT_EQ(processed.load(), 50);
}

TEST_F(StreamProcTest, AbortFromAnotherThread) {
    ParallelStreamProc engine(2);
    std::atomic<int> processed{0};

    auto runner = engine.bind<int>([&](Partition<int>& items) {
        for (auto& item : items) {
            (void)item;
            processed++;
            std::this_thread::sleep_for(2ms);
        }
    }, fast_config());

    std::thread aborter([&]() {
        while (processed.load() < 5) {
            std::this_thread::sleep_for(1ms);
        }
        runner.abort();
        runner.abort();  // idempotent
    });

    auto report = runner(sequence<int>(0, 100000));
    aborter.join();

    EXPECT_TRUE(report.aborted);
    EXPECT_LT(report.items_delivered, 100000u);
}

TEST_F(StreamProcTest, AbortWhenIdleIsNoop) {
    ParallelStreamProc engine(1);
    engine.abort();

    auto report = engine.bind<int>([](Partition<int>& items) {
        for (auto& item : items) {
            (void)item;
        }
    }, fast_config())(sequence<int>(0, 3));

    EXPECT_FALSE(report.aborted);
    EXPECT_EQ(report.items_delivered, 3u);
}

TEST_F(StreamProcTest, BackpressureObserved) {
    ParallelStreamProc engine(2);
    std::atomic<int> blocked{0};

    auto config = fast_config();
    config.queue_capacity = 1;
    config.on_blocked = [&](RunState&) { blocked++; };

    auto runner = engine.bind<int>([](Partition<int>& items) {
        for (auto& item : items) {
            (void)item;
            std::this_thread::sleep_for(20ms);
        }
    }, config);

    auto report = runner(sequence<int>(0, 10));

    EXPECT_GE(blocked.load(), 1);
    EXPECT_EQ(report.blocked_count, static_cast<std::uint64_t>(blocked.load()));
    EXPECT_EQ(report.items_delivered, 10u);
    EXPECT_GE(engine.metrics().snapshot().backpressure_events, 1u);
}

TEST_F(StreamProcTest, PartitionFailureSurfacesAfterSiblingsFinish) {
    ParallelStreamProc engine(2);
    std::mutex mutex;
    std::set<int> processed;

    auto runner = engine.bind<int>([&](Partition<int>& items) {
        for (auto& item : items) {
            if (item == 5) {
                throw ItemFailure(item);
            }
            std::lock_guard<std::mutex> lock(mutex);
            processed.insert(item);
        }
    }, fast_config());

    try {
        runner(sequence<int>(0, 10));
        FAIL() << "expected the partition failure to propagate";
    } catch (const ItemFailure& e) {
        EXPECT_EQ(e.item(), 5);
    }

    EXPECT_EQ(processed, (std::set<int>{0, 1, 2, 3, 4, 6, 7, 8, 9}));
    EXPECT_FALSE(engine.busy());
    EXPECT_EQ(engine.metrics().snapshot().jobs_failed, 1u);

    // Engine is reusable after a failed job
    processed.clear();
    auto report = engine.bind<int>([&](Partition<int>& items) {
        for (auto& item : items) {
            std::lock_guard<std::mutex> lock(mutex);
            processed.insert(item);
        }
    }, fast_config())(sequence<int>(0, 10));
    EXPECT_EQ(processed.size(), 10u);
    EXPECT_EQ(report.items_dropped, 0u);
}

TEST_F(StreamProcTest, EveryPartitionFailingDoesNotHang) {
    ParallelStreamProc engine(3);

    auto runner = engine.bind<int>([](Partition<int>& items) {
        for (auto& item : items) {
            throw ItemFailure(item);
        }
    }, fast_config());

    EXPECT_THROW(runner(sequence<int>(0, 1000)), ItemFailure);
    EXPECT_FALSE(engine.busy());
}

TEST_F(StreamProcTest, SourceFailurePropagates) {
    ParallelStreamProc engine(2);
    int produced = 0;
    auto failing_source = [&produced]() -> std::optional<int> {
        if (produced == 20) {
            throw std::runtime_error("source broke");
        }
        return produced++;
    };

    auto runner = engine.bind<int>([](Partition<int>& items) {
        for (auto& item : items) {
            (void)item;
        }
    }, fast_config());

    EXPECT_THROW(runner(failing_source), std::runtime_error);
    EXPECT_FALSE(engine.busy());

    auto report = runner(sequence<int>(0, 5));
    EXPECT_EQ(report.items_delivered, 5u);
}

TEST_F(StreamProcTest, ProcessorReturningEarlyDoesNotHang) {
    ParallelStreamProc engine(2);
    std::atomic<int> taken{0};

    // Each partition only wants a single item.
    auto runner = engine.bind<int>([&](Partition<int>& items) {
        if (items.next()) {
            taken++;
        }
    }, fast_config());

    auto report = runner(sequence<int>(0, 100));

    EXPECT_LE(taken.load(), 2);
    EXPECT_EQ(report.items_delivered, static_cast<std::uint64_t>(taken.load()));
}

TEST_F(StreamProcTest, SlotLocalStateSurvivesAcrossJobs) {
    ParallelStreamProc engine(3);
    SlotLocal<std::vector<int>> scratch(engine.pool());
    std::atomic<int> created{0};

    auto runner = engine.bind<int>([&](Partition<int>& items) {
        auto& buffer = scratch.get_or_create([&]() {
            created++;
            return std::vector<int>{};
        });
        for (auto& item : items) {
            buffer.push_back(item);
        }
    }, fast_config());

    runner(sequence<int>(0, 30));
    runner(sequence<int>(30, 30));

    EXPECT_EQ(created.load(), 3);

    std::size_t total = 0;
    for (std::size_t i = 0; i < scratch.size(); i++) {
        ASSERT_NE(scratch.get(i), nullptr);
        total += scratch.get(i)->size();
    }
    EXPECT_EQ(total, 60u);
}

TEST_F(StreamProcTest, WarmupThroughBroadcastThenProcess) {
    ParallelStreamProc engine(2);
    SlotLocal<int> sessions(engine.pool());
    std::atomic<int> created{0};
    auto factory = [&]() { return ++created; };

    auto warmed = engine.broadcast([&]() { return sessions.get_or_create(factory); });
    EXPECT_EQ(warmed.size(), 2u);

    auto runner = engine.bind<int>([&](Partition<int>& items) {
        sessions.get_or_create(factory);
        for (auto& item : items) {
            (void)item;
        }
    }, fast_config());
    runner(sequence<int>(0, 10));

    EXPECT_EQ(created.load(), 2);
}

TEST_F(StreamProcTest, MetricsFormat) {
    ParallelStreamProc engine(2);
    auto runner = engine.bind<int>([](Partition<int>& items) {
        for (auto& item : items) {
            (void)item;
        }
    }, fast_config());
    runner(sequence<int>(0, 10));

    auto snapshot = engine.metrics().snapshot();
    EXPECT_EQ(snapshot.items_enqueued, 10u);
    EXPECT_EQ(snapshot.items_delivered, 10u);
    EXPECT_EQ(snapshot.active_jobs, 0);
    EXPECT_EQ(engine.metrics().job_duration().count(), 1u);

    auto buckets = engine.metrics().job_duration().bucket_counts();
    EXPECT_EQ(buckets.size(), Histogram::default_buckets().size() + 1);
    EXPECT_EQ(std::accumulate(buckets.begin(), buckets.end(), std::uint64_t{0}), 1u);
    EXPECT_GE(engine.metrics().uptime().count(), 0);
    EXPECT_NE(engine.metrics().format().find("Jobs: 1/1"), std::string::npos);
}
