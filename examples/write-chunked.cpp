/// @file
/// @brief Write a series of u16 frames with a simulated radial sine pattern
/// to HDF5 containers of 30 frames each, then report stream statistics.

#include "h5stream.h"

#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

/// Helper for passing size static strings as function args.
/// For a function: `f(char*,size_t)` use `f(SIZED("hello"))`.
/// Expands to `f("hello",6)`.
#define SIZED(str) str, sizeof(str)

#define EXPECT(e, ...)                                                         \
    do {                                                                       \
        if (!(e)) {                                                            \
            char buf[1 << 8] = { 0 };                                          \
            snprintf(buf, sizeof(buf) - 1, __VA_ARGS__);                       \
            fprintf(stderr, "ERROR %s(%d): %s\n", __FILE__, __LINE__, buf);    \
            throw std::runtime_error(buf);                                     \
        }                                                                      \
    } while (0)
#define CHECK(e) EXPECT(e, "Expression evaluated as false: %s", #e)
#define OK(e)                                                                  \
    do {                                                                       \
        const H5StreamStatusCode code_ = (e);                                  \
        EXPECT(code_ == H5StreamStatusCode_Success,                            \
               "%s failed: %s",                                                \
               #e,                                                             \
               H5Stream_get_status_message(code_));                            \
    } while (0)

const static uint32_t frame_width = 640;
const static uint32_t frame_height = 480;
const static uint64_t frames_per_container = 30;
const static int64_t frame_count = 100;

void
fill_radial_sine(std::vector<uint16_t>& frame, int64_t frame_index)
{
    const double cx = frame_width / 2.0;
    const double cy = frame_height / 2.0;
    const double phase = 0.2 * static_cast<double>(frame_index);

    for (uint32_t y = 0; y < frame_height; ++y) {
        for (uint32_t x = 0; x < frame_width; ++x) {
            const double r = std::hypot(x - cx, y - cy);
            const double v = 0.5 * (1.0 + std::sin(0.1 * r - phase));
            frame[y * frame_width + x] = static_cast<uint16_t>(v * 65535.0);
        }
    }
}

int
frame_written(const H5StreamFrame* frame, void* user_data)
{
    auto* count = static_cast<uint64_t*>(user_data);
    if (++*count % frames_per_container == 0) {
        printf("wrote frame %lld\n", static_cast<long long>(frame->frame_index));
    }
    return 0;
}

void
run()
{
    H5StreamSettings* settings = H5StreamSettings_create();
    CHECK(settings);

    OK(H5StreamSettings_set_dataset_name(settings, SIZED("entry/data/data")));
    OK(H5StreamSettings_set_output_path_template(
      settings, SIZED("radial_sine_{chunk_number:03d}.h5")));
    OK(H5StreamSettings_set_frames_per_container(settings,
                                                 frames_per_container));
    OK(H5StreamSettings_set_parameters(settings, SIZED(R"({
        "group_attributes": { "entry:NX_class": "NXentry" },
        "dataset_attributes": { "entry/data/data:units": "counts" }
    })")));

    H5Stream* stream = H5Stream_create(settings);
    H5StreamSettings_destroy(settings);
    CHECK(stream);

    uint64_t written = 0;
    OK(H5Stream_add_frame_callback(stream, frame_written, &written));
    OK(H5Stream_start(stream));

    std::vector<uint16_t> frame(frame_width * frame_height);
    for (int64_t i = 0; i < frame_count; ++i) {
        fill_radial_sine(frame, i);

        const H5StreamFrame f{
            .frame_index = i,
            .rows = frame_height,
            .cols = frame_width,
            .dtype = H5StreamDataType_uint16,
            .data = frame.data(),
            .bytes_of_data = frame.size() * sizeof(uint16_t),
        };
        OK(H5Stream_append(stream, &f));
    }

    OK(H5Stream_stop(stream));

    char stats[256];
    size_t bytes_of_stats = sizeof(stats);
    OK(H5Stream_get_statistics(stream, stats, &bytes_of_stats));
    printf("%s\n", stats);

    H5Stream_destroy(stream);
}

int
main()
{
    try {
        run();
    } catch (const std::exception& e) {
        fprintf(stderr, "Exception: %s\n", e.what());
        return 1;
    }
    return 0;
}
