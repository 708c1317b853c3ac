#pragma once

/**
 * @file slot_local.hpp
 * @brief Worker-slot-scoped storage
 */

#include <cstddef>
#include <memory>
#include <vector>

#include "pstream/core/errors.hpp"
#include "pstream/core/worker_pool.hpp"

namespace pstream {

/**
 * @brief One lazily created value per worker slot of a pool
 *
 * Use it to keep resources that are expensive to set up (sessions,
 * decoders, scratch buffers) alive across jobs. Each value is only ever
 * touched by its own slot's thread while a job runs, so access needs no
 * locking. The caller owns the storage and decides when to invalidate it;
 * reset() must not race with a running job.
 */
template<typename T>
class SlotLocal {
public:
    explicit SlotLocal(const WorkerPool& pool)
        : pool_(pool)
        , values_(pool.num_workers()) {}

    SlotLocal(const SlotLocal&) = delete;
    SlotLocal& operator=(const SlotLocal&) = delete;

    /**
     * @brief Value of the calling slot, created with factory() on first use
     * @throws Error if the caller is not one of the pool's worker threads
     */
    template<typename Factory>
    T& get_or_create(Factory&& factory) {
        auto slot = pool_.current_slot();
        if (!slot) {
            throw Error("SlotLocal accessed from outside the worker pool");
        }
        auto& value = values_[*slot];
        if (!value) {
            value = std::make_unique<T>(factory());
        }
        return *value;
    }

    /**
     * @brief Value stored for a slot, or nullptr if not created yet
     */
    [[nodiscard]] T* get(std::size_t slot) const {
        return values_.at(slot).get();
    }

    void reset(std::size_t slot) { values_.at(slot).reset(); }

    void reset() {
        for (auto& value : values_) {
            value.reset();
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

private:
    const WorkerPool& pool_;
    std::vector<std::unique_ptr<T>> values_;
};

} // namespace pstream
