#pragma once

/**
 * @file relay.hpp
 * @brief Fan-out of one sequential source into N consumable partitions
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "pstream/core/errors.hpp"
#include "pstream/core/message.hpp"
#include "pstream/core/queue.hpp"
#include "pstream/core/run_state.hpp"

namespace pstream {

/**
 * @brief Relay configuration
 */
struct RelayConfig {
    std::uint32_t partitions{1};
    std::size_t queue_capacity{100};
    std::chrono::milliseconds poll_interval{50};
};

/**
 * @brief Called by the producer every time a push times out on a full queue
 *
 * The handler may call RunState::abort() to stop the job.
 */
using BlockedHandler = std::function<void(RunState&)>;

/**
 * @brief Outcome of the producer loop
 */
struct RelayResult {
    std::uint64_t enqueued{0};
    bool completed{false};  // source exhausted and every consumer joined
};

namespace detail {

/**
 * @brief Feed every item of a source to fn until fn returns false
 *
 * A source is either a range or a generator callable returning
 * std::optional (an empty optional ends the stream).
 *
 * @return true if the source was exhausted
 */
template<typename Source, typename Fn>
bool for_each_item(Source& source, Fn&& fn) {
    if constexpr (std::is_invocable_v<Source&>) {
        while (auto item = source()) {
            if (!fn(std::move(*item))) {
                return false;
            }
        }
    } else {
        for (auto&& item : source) {
            if (!fn(item)) {
                return false;
            }
        }
    }
    return true;
}

} // namespace detail

/**
 * @brief One consumer's share of the relayed stream
 *
 * A lazy, single-pass sequence. Items can be pulled with next() or with a
 * range-for loop. An item counts as handled once the consumer asks for
 * the following one, so the producer's join waits for the loop body too.
 */
template<typename T>
class Partition {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = T*;
        using reference = T&;

        iterator() = default;

        explicit iterator(Partition* partition)
            : partition_(partition) {
            advance();
        }

        reference operator*() { return *current_; }
        pointer operator->() { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const noexcept {
            return partition_ == other.partition_;
        }

        bool operator!=(const iterator& other) const noexcept {
            return !(*this == other);
        }

    private:
        void advance() {
            current_ = partition_->next();
            if (!current_) {
                partition_ = nullptr;
            }
        }

        Partition* partition_{nullptr};
        std::optional<T> current_;
    };

    Partition(std::uint32_t index,
              BoundedQueue<Message<T>>& queue,
              RunState& state,
              std::chrono::milliseconds poll_interval)
        : index_(index)
        , queue_(queue)
        , state_(state)
        , poll_interval_(poll_interval) {}

    Partition(const Partition&) = delete;
    Partition& operator=(const Partition&) = delete;

    /**
     * @brief Pull the next item
     * @return Item, or nullopt once the end marker was seen or the job aborted
     */
    std::optional<T> next() {
        if (finished_) {
            return std::nullopt;
        }
        settle();

        while (!state_.aborted()) {
            auto msg = queue_.pop_for(poll_interval_);
            if (!msg) {
                continue;
            }
            if (is_end_of_stream(*msg)) {
                queue_.task_done();
                finish();
                return std::nullopt;
            }
            pending_ = true;
            delivered_++;
            state_.record_delivered();
            return std::get<0>(std::move(*msg));
        }

        finish();
        return std::nullopt;
    }

    /**
     * @brief Stop consuming; safe to call more than once
     *
     * A partition closed before its end marker detaches from the relay, so
     * the producer stops waiting on it.
     */
    void close() {
        if (finished_) {
            return;
        }
        settle();
        finish();
    }

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    [[nodiscard]] std::uint32_t index() const noexcept { return index_; }
    [[nodiscard]] std::uint64_t delivered() const noexcept { return delivered_; }
    [[nodiscard]] bool finished() const noexcept { return finished_; }

private:
    void settle() {
        if (pending_) {
            pending_ = false;
            queue_.task_done();
        }
    }

    void finish() {
        finished_ = true;
        state_.detach_consumer();
    }

    std::uint32_t index_;
    BoundedQueue<Message<T>>& queue_;
    RunState& state_;
    std::chrono::milliseconds poll_interval_;

    bool pending_{false};
    bool finished_{false};
    std::uint64_t delivered_{0};
};

/**
 * @brief Bounded relay from one producer to N partitions
 *
 * All partitions share a single bounded queue: whichever consumer is free
 * takes the next item. Order is preserved within a partition but the
 * assignment of items to partitions is not deterministic.
 */
template<typename T>
class BoundedRelay {
public:
    explicit BoundedRelay(RelayConfig config)
        : config_(validate(config))
        , queue_(config_.queue_capacity)
        , state_(std::make_shared<RunState>(config_.partitions)) {
        partitions_.reserve(config_.partitions);
        for (std::uint32_t i = 0; i < config_.partitions; i++) {
            partitions_.push_back(std::make_unique<Partition<T>>(
                i, queue_, *state_, config_.poll_interval
            ));
        }
    }

    BoundedRelay(const BoundedRelay&) = delete;
    BoundedRelay& operator=(const BoundedRelay&) = delete;

    /**
     * @brief Pump the source into the queue (call exactly once)
     *
     * Pushes every source item, then one end marker per partition, then
     * waits until the queue is joined. Returns early, without draining,
     * when the job is aborted or every consumer has detached.
     */
    template<typename Source>
    RelayResult run(Source&& source, const BlockedHandler& on_blocked = {}) {
        if (started_) {
            throw ConcurrencyError("relay producer can only run once");
        }
        started_ = true;

        RelayResult result;
        bool pumped = detail::for_each_item(source, [&](T item) {
            Message<T> msg{std::in_place_index<0>, std::move(item)};
            if (!offer(msg, on_blocked)) {
                return false;
            }
            state_->record_enqueued();
            return true;
        });

        if (pumped) {
            for (std::uint32_t i = 0; i < config_.partitions && pumped; i++) {
                Message<T> marker{EndOfStream{}};
                pumped = offer(marker, on_blocked);
            }
        }

        if (pumped) {
            while (!queue_.join_for(config_.poll_interval)) {
                if (should_stop()) {
                    // The last consumer may have settled right after the timeout.
                    pumped = queue_.unfinished() == 0;
                    break;
                }
            }
        }

        result.enqueued = state_->enqueued();
        result.completed = pumped;
        return result;
    }

    [[nodiscard]] Partition<T>& partition(std::size_t index) {
        return *partitions_.at(index);
    }

    [[nodiscard]] std::size_t partitions() const noexcept { return partitions_.size(); }

    [[nodiscard]] const std::shared_ptr<RunState>& state() const noexcept { return state_; }

    [[nodiscard]] const BoundedQueue<Message<T>>& queue() const noexcept { return queue_; }

    [[nodiscard]] const RelayConfig& config() const noexcept { return config_; }

private:
    static RelayConfig validate(RelayConfig config) {
        if (config.partitions == 0) {
            throw ConfigError("relay needs at least one partition");
        }
        if (config.queue_capacity == 0) {
            throw ConfigError("queue capacity must be at least 1");
        }
        if (config.poll_interval.count() <= 0) {
            throw ConfigError("poll interval must be positive");
        }
        return config;
    }

    [[nodiscard]] bool should_stop() const noexcept {
        return state_->aborted() || state_->live_consumers() == 0;
    }

    // Retry a timed push until it succeeds or the job should stop.
    bool offer(Message<T>& msg, const BlockedHandler& on_blocked) {
        while (!should_stop()) {
            if (queue_.push_for(msg, config_.poll_interval)) {
                return true;
            }
            state_->record_blocked();
            if (on_blocked) {
                on_blocked(*state_);
            }
        }
        return false;
    }

    RelayConfig config_;
    BoundedQueue<Message<T>> queue_;
    std::shared_ptr<RunState> state_;
    std::vector<std::unique_ptr<Partition<T>>> partitions_;
    bool started_{false};
};

} // namespace pstream
