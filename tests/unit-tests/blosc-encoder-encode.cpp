#include "blosc.encoder.hh"
#include "unit.test.macros.hh"

#include <blosc.h>

#include <cstring>
#include <vector>

namespace {
std::vector<std::byte>
make_frame(size_t n_pixels)
{
    std::vector<uint16_t> pixels(n_pixels);
    for (size_t i = 0; i < n_pixels; ++i) {
        pixels[i] = static_cast<uint16_t>((i * 7) % 251);
    }

    std::vector<std::byte> frame(n_pixels * sizeof(uint16_t));
    std::memcpy(frame.data(), pixels.data(), frame.size());
    return frame;
}

void
encoded_frames_decompress_to_the_input()
{
    for (const char* codec : { "lz4", "zstd", "blosclz" }) {
        h5stream::BloscEncoder encoder({ codec, 5, BLOSC_SHUFFLE });

        const auto frame = make_frame(64 * 48);
        const auto encoded = encoder.encode(frame, sizeof(uint16_t));
        CHECK(!encoded.empty());
        CHECK(encoded.size() < frame.size());

        size_t nbytes = 0, cbytes = 0, blocksize = 0;
        blosc_cbuffer_sizes(encoded.data(), &nbytes, &cbytes, &blocksize);
        EXPECT_EQ(size_t, nbytes, frame.size());
        EXPECT_EQ(size_t, cbytes, encoded.size());

        std::vector<std::byte> decoded(frame.size());
        const int rc = blosc_decompress_ctx(
          encoded.data(), decoded.data(), decoded.size(), 1);
        EXPECT_EQ(int, rc, static_cast<int>(frame.size()));
        CHECK(decoded == frame);
    }
}

void
filter_options_describe_the_encoding()
{
    h5stream::BloscEncoder encoder({ "zstd", 3, BLOSC_BITSHUFFLE });
    const auto options = encoder.hdf5_filter_options(2, 64 * 48 * 2);

    EXPECT_EQ(size_t, options.size(), 7);
    EXPECT_EQ(uint32_t, options[2], 2);
    EXPECT_EQ(uint32_t, options[3], 64 * 48 * 2);
    EXPECT_EQ(uint32_t, options[4], 3);
    EXPECT_EQ(uint32_t, options[5], BLOSC_BITSHUFFLE);
    EXPECT_EQ(uint32_t, options[6], BLOSC_ZSTD);
}

void
params_to_and_from_json()
{
    h5stream::BloscCompressionParams params("zstd", 7, 2);
    const nlohmann::json j = params;
    EXPECT_STR_EQ(j["codec"].get<std::string>(), "zstd");
    EXPECT_EQ(int, j["clevel"].get<int>(), 7);
    EXPECT_EQ(int, j["shuffle"].get<int>(), 2);

    const auto parsed = j.get<h5stream::BloscCompressionParams>();
    EXPECT_STR_EQ(parsed.codec_id, "zstd");
    EXPECT_EQ(int, parsed.clevel, 7);
    EXPECT_EQ(int, parsed.shuffle, 2);

    // missing fields take their defaults
    const auto defaults =
      nlohmann::json::object().get<h5stream::BloscCompressionParams>();
    EXPECT_STR_EQ(defaults.codec_id, "lz4");
    EXPECT_EQ(int, defaults.clevel, 1);
    EXPECT_EQ(int, defaults.shuffle, 1);

    EXPECT_THROW(std::invalid_argument,
                 nlohmann::json::parse(R"({"codec": "nope"})")
                   .get<h5stream::BloscCompressionParams>());
    EXPECT_THROW(std::invalid_argument,
                 nlohmann::json::parse(R"({"clevel": 10})")
                   .get<h5stream::BloscCompressionParams>());
    EXPECT_THROW(std::invalid_argument,
                 nlohmann::json::parse(R"({"shuffle": "yes"})")
                   .get<h5stream::BloscCompressionParams>());
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        encoded_frames_decompress_to_the_input();
        filter_options_describe_the_encoding();
        params_to_and_from_json();

        EXPECT_THROW(std::invalid_argument,
                     h5stream::BloscEncoder({ "nope", 1, 1 }));
        EXPECT_THROW(std::invalid_argument,
                     h5stream::BloscEncoder({ "lz4", 1, 3 }));

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
