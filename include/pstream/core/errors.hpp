#pragma once

/**
 * @file errors.hpp
 * @brief Exception types thrown by the engine
 */

#include <stdexcept>
#include <string>

namespace pstream {

/**
 * @brief Base class for all engine errors
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Invalid worker count, partition count, capacity or poll interval
 *
 * Always thrown before any work is dispatched.
 */
class ConfigError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Usage that would overlap two jobs on one engine
 */
class ConcurrencyError : public Error {
public:
    using Error::Error;
};

} // namespace pstream
