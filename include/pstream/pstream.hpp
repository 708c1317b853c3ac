#pragma once

/**
 * @file pstream.hpp
 * @brief Main header for PStream - persistent parallel stream processing
 *
 * Include this single header to access the full PStream API.
 */

#include "pstream/core/errors.hpp"
#include "pstream/core/message.hpp"
#include "pstream/core/queue.hpp"
#include "pstream/core/run_state.hpp"
#include "pstream/core/relay.hpp"
#include "pstream/core/source.hpp"
#include "pstream/core/worker_pool.hpp"
#include "pstream/core/slot_local.hpp"
#include "pstream/core/metrics.hpp"
#include "pstream/core/stream_proc.hpp"

#include "pstream/reader/parallel_reader.hpp"

namespace pstream {

/**
 * @brief Library version information
 */
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace pstream
