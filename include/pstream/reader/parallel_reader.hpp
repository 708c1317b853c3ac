#pragma once

/**
 * @file parallel_reader.hpp
 * @brief Parallel processing of located resources with per-thread sessions
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pstream/core/errors.hpp"
#include "pstream/core/message.hpp"
#include "pstream/core/slot_local.hpp"
#include "pstream/core/stream_proc.hpp"

namespace pstream {

/**
 * @brief One unit of work: caller data plus where to find the resource
 */
template<typename UserData>
struct ReadRequest {
    UserData user_data;
    std::string locator;
};

/**
 * @brief Passed to the item callback alongside the request
 */
struct ItemContext {
    const std::string& locator;
    std::uint32_t slot;
    Timestamp t0;  // when the worker picked the item up
};

/**
 * @brief Reader configuration
 */
struct ReaderConfig {
    BindConfig bind;
};

/**
 * @brief Build requests whose user data is the locator's position
 *
 * The vector must outlive the returned generator.
 */
inline auto indexed_requests(const std::vector<std::string>& locators) {
    return [&locators, index = std::size_t{0}]() mutable
        -> std::optional<ReadRequest<std::size_t>> {
        if (index == locators.size()) {
            return std::nullopt;
        }
        ReadRequest<std::size_t> request{index, locators[index]};
        index++;
        return request;
    };
}

/**
 * @brief Process many (user data, locator) requests on persistent threads
 *
 * Roughly equivalent to the serial loop
 *
 * @code
 * Resource session = factory();
 * for (auto& [user_data, locator] : requests) {
 *     callback(session, ItemContext{locator, 0, now()}, user_data);
 * }
 * @endcode
 *
 * except that every worker slot owns its own Resource, created by the
 * factory the first time the slot needs one and kept for the reader's
 * lifetime. Creating a reader is expensive and the first item on each
 * thread pays the resource setup, so create one reader per application
 * and reuse it.
 *
 * The callback runs concurrently on several threads and must do its own
 * synchronization on shared state. The factory may also be called
 * concurrently.
 */
template<typename Resource>
class ParallelReader {
public:
    using Factory = std::function<Resource()>;

    ParallelReader(std::uint32_t num_threads, Factory factory, ReaderConfig config = {})
        : engine_(num_threads)
        , resources_(engine_.pool())
        , factory_(std::move(factory))
        , config_(std::move(config)) {}

    ParallelReader(const ParallelReader&) = delete;
    ParallelReader& operator=(const ParallelReader&) = delete;

    /**
     * @brief Create every slot's resource ahead of the first job
     * @return The resource of each slot, in slot order
     */
    std::vector<Resource*> warmup() {
        return warmup([](Resource&) {});
    }

    /**
     * @brief Same as warmup(), also running action(resource) on every slot
     *
     * Use the action to set up any other per-thread state.
     */
    template<typename Action>
    std::vector<Resource*> warmup(Action&& action) {
        return engine_.broadcast([this, &action]() -> Resource* {
            Resource& resource = slot_resource();
            action(resource);
            return &resource;
        });
    }

    /**
     * @brief Call callback(resource, context, user_data) for every request
     *
     * Blocks until all requests are processed or the job is aborted.
     */
    template<typename UserData, typename Source, typename Callback>
    JobReport process(Source&& source, Callback&& callback) {
        auto proc = [this, &callback](Partition<ReadRequest<UserData>>& requests) {
            Resource& resource = slot_resource();
            const std::uint32_t slot = engine_.pool().current_slot().value_or(0);

            for (auto& request : requests) {
                ItemContext context{request.locator, slot, Clock::now()};
                callback(resource, context, request.user_data);
            }
        };

        return engine_.template run<ReadRequest<UserData>>(
            std::forward<Source>(source), proc, config_.bind, JobOptions{}
        );
    }

    void abort() noexcept { engine_.abort(); }

    /**
     * @brief Drop every cached resource; they are recreated on next use
     */
    void reset_resources() {
        if (engine_.busy()) {
            throw ConcurrencyError("can not reset resources while a job is running");
        }
        resources_.reset();
    }

    /**
     * @brief Resource cached for a slot, or nullptr before first use
     */
    [[nodiscard]] Resource* resource(std::size_t slot) const { return resources_.get(slot); }

    [[nodiscard]] std::uint32_t num_threads() const noexcept { return engine_.num_workers(); }

    [[nodiscard]] ParallelStreamProc& engine() noexcept { return engine_; }

private:
    Resource& slot_resource() {
        return resources_.get_or_create(factory_);
    }

    ParallelStreamProc engine_;
    SlotLocal<Resource> resources_;
    Factory factory_;
    ReaderConfig config_;
};

} // namespace pstream
