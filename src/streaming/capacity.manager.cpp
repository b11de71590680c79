#include "capacity.manager.hh"
#include "macros.hh"

#include <algorithm>

h5stream::CapacityManager::CapacityManager(Container& container)
  : container_(container)
  , capacity_(container.capacity())
{
}

uint64_t
h5stream::CapacityManager::ensure_capacity(uint64_t slot)
{
    if (slot < capacity_) {
        return capacity_;
    }

    const uint64_t requested = std::max(slot + 1, 2 * capacity_);
    const uint64_t actual = container_.resize(requested);
    EXPECT(actual > slot,
           "Backend resized to ",
           actual,
           " slots after a request for ",
           requested,
           "; slot ",
           slot,
           " is still out of range.");

    LOG_DEBUG("Grew dataset from ", capacity_, " to ", actual, " slots");

    // a backend may round up, but the capacity must never go down here
    capacity_ = std::max(capacity_, actual);
    return capacity_;
}

void
h5stream::CapacityManager::record_write(uint64_t slot)
{
    if (!max_written_slot_ || slot > *max_written_slot_) {
        max_written_slot_ = slot;
    }
}

void
h5stream::CapacityManager::shrink_to_fit()
{
    if (!max_written_slot_) {
        return;
    }

    const uint64_t target = *max_written_slot_ + 1;
    if (target == capacity_) {
        return;
    }

    capacity_ = container_.resize(target);
    EXPECT(capacity_ == target,
           "Expected the dataset to hold ",
           target,
           " slots after shrinking, but it holds ",
           capacity_);
}

int64_t
h5stream::CapacityManager::max_written_slot() const
{
    return max_written_slot_ ? static_cast<int64_t>(*max_written_slot_) : -1;
}
