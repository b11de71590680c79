#pragma once

#include <cstdint>

namespace h5stream {
struct Route
{
    uint64_t chunk_id;      // 0 when chunking is disabled, 1-based otherwise
    uint64_t relative_slot; // position of the frame inside its container
};

/**
 * @brief Map a global frame index to a container and a slot within it.
 * @param frame_index The global, 0-based frame index.
 * @param frames_per_container Container capacity in frames. 0 disables
 * chunking, in which case every frame goes to container 0 at its own index.
 * @return The container id and the slot relative to that container.
 * @throw std::invalid_argument if @p frame_index is negative.
 */
[[nodiscard]] Route
route(int64_t frame_index, uint64_t frames_per_container);

/**
 * @brief Get the global frame number (1-based) stored at slot 0 of a
 * container.
 */
[[nodiscard]] uint64_t
first_frame_number(uint64_t chunk_id, uint64_t frames_per_container);
} // namespace h5stream
