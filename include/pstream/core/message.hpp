#pragma once

/**
 * @file message.hpp
 * @brief Messages carried by the relay queue
 */

#include <chrono>
#include <variant>

namespace pstream {

/**
 * @brief Clock used for all engine timing
 */
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;

/**
 * @brief End-of-stream marker
 *
 * Consumers recognise it by its type, never by comparing values, so a
 * work item can hold any value without being mistaken for the marker.
 */
struct EndOfStream {};

/**
 * @brief Work item or end-of-stream signal
 */
template<typename T>
using Message = std::variant<T, EndOfStream>;

template<typename T>
[[nodiscard]] inline bool is_end_of_stream(const Message<T>& msg) noexcept {
    return std::holds_alternative<EndOfStream>(msg);
}

} // namespace pstream
