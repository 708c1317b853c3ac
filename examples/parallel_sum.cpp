/**
 * @file parallel_sum.cpp
 * @brief Example: split a sequence across workers into an indexed buffer
 *
 * Usage: pstream_example [items] [workers] [capacity]
 */

#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "pstream/pstream.hpp"

std::atomic<bool> g_shutdown{false};

void signal_handler(int /*signal*/) {
    g_shutdown.store(true);
}

namespace {

std::uint64_t parse_arg(int argc, char** argv, int index, std::uint64_t fallback) {
    if (argc <= index) {
        return fallback;
    }
    return std::stoull(argv[index]);
}

} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::uint64_t items = 0;
    std::uint32_t workers = 0;
    std::size_t capacity = 0;
    try {
        items = parse_arg(argc, argv, 1, 100000);
        workers = static_cast<std::uint32_t>(parse_arg(argc, argv, 2, 0));
        capacity = static_cast<std::size_t>(parse_arg(argc, argv, 3, 100));
    } catch (const std::exception& e) {
        std::cerr << "usage: " << argv[0] << " [items] [workers] [capacity]: " << e.what() << std::endl;
        return 2;
    }

    std::cout << "=== PStream Example ===" << std::endl;
    std::cout << "Version: " << pstream::VERSION << std::endl;
    std::cout << std::endl;

    std::vector<double> inputs(items);
    std::iota(inputs.begin(), inputs.end(), 1.0);
    std::vector<double> outputs(items, 0.0);

    pstream::WorkerPoolConfig pool_config;
    pool_config.num_workers = workers;

    try {
        pstream::ParallelStreamProc engine(pool_config);
        std::cout << "Workers: " << engine.num_workers() << std::endl;

        pstream::BindConfig config;
        config.queue_capacity = capacity;
        config.on_blocked = [](pstream::RunState& state) {
            if (g_shutdown.load()) {
                state.abort();
            }
        };

        using Item = std::pair<std::size_t, double>;
        auto runner = engine.bind<Item, std::vector<double>*>(
            [&engine](pstream::Partition<Item>& partition, std::vector<double>* out) {
                for (auto& [index, value] : partition) {
                    if (g_shutdown.load()) {
                        engine.abort();
                        break;
                    }
                    (*out)[index] = std::sqrt(value);
                    std::this_thread::sleep_for(std::chrono::microseconds(10));  // simulated work
                }
            },
            config);

        std::cout << "Processing " << items << " items..." << std::endl;
        auto report = runner(pstream::enumerate(inputs), &outputs);

        double sum = std::accumulate(outputs.begin(), outputs.end(), 0.0);

        std::cout << "\n=== Job Report ===" << std::endl;
        std::cout << "Aborted: " << (report.aborted ? "yes" : "no") << std::endl;
        std::cout << "Workers used: " << report.workers << std::endl;
        std::cout << "Enqueued: " << report.items_enqueued << std::endl;
        std::cout << "Delivered: " << report.items_delivered << std::endl;
        std::cout << "Dropped: " << report.items_dropped << std::endl;
        std::cout << "Blocked pushes: " << report.blocked_count << std::endl;
        std::cout << "Elapsed: "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(report.elapsed).count()
                  << " ms" << std::endl;
        std::cout << "Sum of square roots: " << sum << std::endl;

        std::cout << "\n=== Metrics ===" << std::endl;
        engine.metrics().print();
        std::cout << "Uptime: " << engine.metrics().uptime().count() << " ms" << std::endl;
    } catch (const pstream::ConfigError& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Job failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
