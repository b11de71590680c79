#include "chunk.router.hh"
#include "macros.hh"

h5stream::Route
h5stream::route(int64_t frame_index, uint64_t frames_per_container)
{
    EXPECT_ARGUMENT(frame_index >= 0, "Invalid frame index: ", frame_index);

    const auto index = static_cast<uint64_t>(frame_index);
    if (frames_per_container == 0) {
        return { 0, index };
    }

    const uint64_t chunk_id = index / frames_per_container + 1;
    return { chunk_id, index - (chunk_id - 1) * frames_per_container };
}

uint64_t
h5stream::first_frame_number(uint64_t chunk_id, uint64_t frames_per_container)
{
    if (frames_per_container == 0 || chunk_id == 0) {
        return 1;
    }

    return (chunk_id - 1) * frames_per_container + 1;
}
