#pragma once

/**
 * @file source.hpp
 * @brief Generator helpers for building job sources
 *
 * A job source is any range, or any callable returning std::optional<T>
 * where an empty optional ends the stream. These helpers build the latter.
 */

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

namespace pstream {

/**
 * @brief Arithmetic sequence start, start + step, ... of count items
 */
template<typename Int>
auto sequence(Int start, std::uint64_t count, Int step = 1) {
    return [current = start, step, remaining = count]() mutable -> std::optional<Int> {
        if (remaining == 0) {
            return std::nullopt;
        }
        remaining--;
        Int value = current;
        current += step;
        return value;
    };
}

/**
 * @brief Pair every element of a range with its position
 *
 * The range must outlive the generator. Carrying the index inside each
 * item lets processing functions write results into index-addressed
 * output buffers regardless of which partition they land in.
 */
template<typename Range>
auto enumerate(const Range& range) {
    using Value = std::decay_t<decltype(*std::begin(range))>;
    return [it = std::begin(range), last = std::end(range), index = std::size_t{0}]() mutable
        -> std::optional<std::pair<std::size_t, Value>> {
        if (it == last) {
            return std::nullopt;
        }
        std::pair<std::size_t, Value> item{index++, *it};
        ++it;
        return item;
    };
}

} // namespace pstream
