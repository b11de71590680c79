#pragma once

#include "storage.backend.hh"

#include <cstdint>
#include <optional>

namespace h5stream {
/**
 * @brief Tracks how many slots the primary dataset of a container holds and
 * the highest slot written so far.
 * @details Growth happens before a write lands, so a write never targets a
 * slot past the end of the dataset. Capacity never shrinks except through
 * shrink_to_fit().
 */
class CapacityManager
{
  public:
    explicit CapacityManager(Container& container);

    /**
     * @brief Grow the dataset so that @p slot is addressable.
     * @details Grows to max(slot + 1, 2 * capacity) when @p slot is out of
     * range, then adopts whatever size the backend reports.
     * @return The capacity after the call.
     * @throw std::runtime_error if the backend fails to resize.
     */
    uint64_t ensure_capacity(uint64_t slot);

    /** @brief Record that @p slot has been written. */
    void record_write(uint64_t slot);

    /**
     * @brief Resize the dataset to exactly max_written_slot() + 1 slots.
     * @details Does nothing if no slot has been written.
     */
    void shrink_to_fit();

    [[nodiscard]] uint64_t capacity() const { return capacity_; }
    [[nodiscard]] bool has_writes() const
    {
        return max_written_slot_.has_value();
    }

    /// @brief -1 if nothing was written.
    [[nodiscard]] int64_t max_written_slot() const;

  private:
    Container& container_;
    uint64_t capacity_;
    std::optional<uint64_t> max_written_slot_;
};
} // namespace h5stream
