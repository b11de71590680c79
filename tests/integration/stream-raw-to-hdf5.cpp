#include "h5stream.h"
#include "test.macros.hh"

#include <cstring> // strlen
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace {
const std::string test_path =
  (fs::temp_directory_path() / (TEST ".h5")).string();

const char* const dataset_name = "entry/data/data";

constexpr uint32_t rows = 48;
constexpr uint32_t cols = 64;
constexpr int64_t frame_indices[] = { 0, 5, 3, 9 };

uint16_t
pixel_value(int64_t frame_index, size_t px)
{
    return static_cast<uint16_t>(1 + frame_index * 100 + px % 97);
}

H5Stream*
setup()
{
    H5StreamSettings* settings = H5StreamSettings_create();
    CHECK(settings);

    CHECK_OK(H5StreamSettings_set_dataset_name(
      settings, dataset_name, strlen(dataset_name) + 1));
    CHECK_OK(H5StreamSettings_set_output_path_template(
      settings, test_path.c_str(), test_path.size() + 1));
    CHECK_OK(H5StreamSettings_set_parameters(settings, SIZED(R"({
        "group_attributes": {
            "entry:NX_class": "NXentry",
            "entry/instrument/detector:NX_class": "NXdetector"
        },
        "dataset_attributes": { "entry/data/data:units": "counts" },
        "extra_datasets": { "entry/instrument/detector/x_pixels": 64 }
    })")));

    H5Stream* stream = H5Stream_create(settings);
    H5StreamSettings_destroy(settings);
    CHECK(stream);

    return stream;
}

void
write_frames(H5Stream* stream)
{
    std::vector<uint16_t> frame(rows * cols);

    for (const auto frame_index : frame_indices) {
        for (size_t px = 0; px < frame.size(); ++px) {
            frame[px] = pixel_value(frame_index, px);
        }

        const H5StreamFrame f{
            .frame_index = frame_index,
            .rows = rows,
            .cols = cols,
            .dtype = H5StreamDataType_uint16,
            .data = frame.data(),
            .bytes_of_data = frame.size() * sizeof(uint16_t),
        };
        CHECK_OK(H5Stream_append(stream, &f));
    }
}

void
verify_file()
{
    CHECK(fs::is_regular_file(test_path));

    const hid_t file =
      H5Fopen(test_path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
    CHECK(file >= 0);

    // sized to the highest index written, not to the initial capacity
    const auto dims = read_dataset_dims(file, dataset_name);
    EXPECT_EQ(size_t, dims.size(), 3);
    EXPECT_EQ(hsize_t, dims[0], 10);
    EXPECT_EQ(hsize_t, dims[1], rows);
    EXPECT_EQ(hsize_t, dims[2], cols);

    const auto data =
      read_dataset<uint16_t>(file, dataset_name, H5T_NATIVE_UINT16);
    const size_t frame_size = rows * cols;
    for (int64_t slot = 0; slot < 10; ++slot) {
        const bool written = slot == 0 || slot == 3 || slot == 5 || slot == 9;
        for (size_t px = 0; px < frame_size; ++px) {
            const uint16_t expected = written ? pixel_value(slot, px) : 0;
            EXPECT_EQ(
              uint16_t, data[slot * frame_size + px], expected);
        }
    }

    EXPECT_EQ(uint64_t,
              read_uint64_attribute(file, dataset_name, "image_nr_low"),
              1);
    EXPECT_EQ(uint64_t,
              read_uint64_attribute(file, dataset_name, "image_nr_high"),
              10);

    EXPECT_STR_EQ(read_string_attribute(file, "entry", "NX_class"), "NXentry");
    EXPECT_STR_EQ(
      read_string_attribute(file, "entry/instrument/detector", "NX_class"),
      "NXdetector");
    EXPECT_STR_EQ(read_string_attribute(file, dataset_name, "units"),
                  "counts");

    const hid_t x_pixels =
      H5Dopen2(file, "entry/instrument/detector/x_pixels", H5P_DEFAULT);
    CHECK(x_pixels >= 0);
    int64_t value = 0;
    CHECK(H5Dread(
            x_pixels, H5T_NATIVE_INT64, H5S_ALL, H5S_ALL, H5P_DEFAULT, &value) >=
          0);
    EXPECT_EQ(int64_t, value, 64);
    CHECK(H5Dclose(x_pixels) >= 0);

    CHECK(H5Fclose(file) >= 0);
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        H5Stream* stream = setup();
        CHECK_OK(H5Stream_start(stream));
        write_frames(stream);
        CHECK_OK(H5Stream_stop(stream));

        char buffer[256];
        size_t bytes_of_buffer = sizeof(buffer);
        CHECK_OK(H5Stream_get_statistics(stream, buffer, &bytes_of_buffer));
        LOG_INFO("Statistics: ", buffer);

        H5Stream_destroy(stream);

        verify_file();
        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    // cleanup
    if (fs::exists(test_path)) {
        fs::remove(test_path);
    }
    return retval;
}
