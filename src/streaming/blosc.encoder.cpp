#include "blosc.encoder.hh"
#include "macros.hh"

#include <blosc.h>
#include <blosc_filter.h>

namespace {

int
compcode_of(const std::string& codec_id)
{
    const int code = blosc_compname_to_compcode(codec_id.c_str());
    EXPECT_ARGUMENT(code >= 0,
                    "Unsupported blosc codec '",
                    codec_id,
                    "'. Expected one of: ",
                    blosc_list_compressors());
    return code;
}

void
validate(const h5stream::BloscCompressionParams& params)
{
    EXPECT_ARGUMENT(params.clevel <= 9,
                    "Invalid level: ",
                    static_cast<int>(params.clevel),
                    ". Must be between 0 (no compression) and 9 (maximum "
                    "compression).");
    EXPECT_ARGUMENT(
      params.shuffle == BLOSC_NOSHUFFLE || params.shuffle == BLOSC_SHUFFLE ||
        params.shuffle == BLOSC_BITSHUFFLE,
      "Invalid shuffle: ",
      static_cast<int>(params.shuffle),
      ". Must be ",
      BLOSC_NOSHUFFLE,
      " (no shuffle), ",
      BLOSC_SHUFFLE,
      " (byte shuffle), or ",
      BLOSC_BITSHUFFLE,
      " (bit shuffle)");
}
} // namespace

h5stream::BloscCompressionParams::BloscCompressionParams(
  std::string_view codec_id,
  uint8_t clevel,
  uint8_t shuffle)
  : codec_id{ codec_id }
  , clevel{ clevel }
  , shuffle{ shuffle }
{
}

void
h5stream::to_json(nlohmann::json& j, const BloscCompressionParams& params)
{
    j = nlohmann::json{
        { "codec", params.codec_id },
        { "clevel", params.clevel },
        { "shuffle", params.shuffle },
    };
}

void
h5stream::from_json(const nlohmann::json& j, BloscCompressionParams& params)
{
    EXPECT_ARGUMENT(j.is_object(), "Expected an object, got ", j.dump());

    BloscCompressionParams parsed;
    try {
        parsed.codec_id = j.value("codec", parsed.codec_id);
        const auto clevel = j.value("clevel", int64_t{ parsed.clevel });
        const auto shuffle = j.value("shuffle", int64_t{ parsed.shuffle });
        EXPECT_ARGUMENT(clevel >= 0 && clevel <= 9, "Invalid level: ", clevel);
        EXPECT_ARGUMENT(
          shuffle >= 0 && shuffle <= 2, "Invalid shuffle: ", shuffle);
        parsed.clevel = static_cast<uint8_t>(clevel);
        parsed.shuffle = static_cast<uint8_t>(shuffle);
    } catch (const nlohmann::json::exception& exc) {
        throw std::invalid_argument(
          LOG_ERROR("Invalid blosc parameters: ", exc.what()));
    }

    compcode_of(parsed.codec_id);
    params = std::move(parsed);
}

h5stream::BloscEncoder::BloscEncoder(const BloscCompressionParams& params)
  : params_(params)
  , compcode_(compcode_of(params.codec_id))
{
    validate(params_);
}

std::vector<std::byte>
h5stream::BloscEncoder::encode(std::span<const std::byte> data,
                               size_t typesize) const
{
    const size_t bytes_of_data = data.size();
    const size_t out_size = bytes_of_data + BLOSC_MAX_OVERHEAD;
    std::vector<std::byte> out(out_size);

    const int nb = blosc_compress_ctx(params_.clevel,
                                      params_.shuffle,
                                      typesize,
                                      bytes_of_data,
                                      data.data(),
                                      out.data(),
                                      out_size,
                                      params_.codec_id.c_str(),
                                      0 /* blocksize - 0:automatic */,
                                      1);
    EXPECT(nb > 0, "Failed to compress frame: blosc returned ", nb);

    out.resize(nb);
    return out;
}

std::vector<uint32_t>
h5stream::BloscEncoder::hdf5_filter_options(size_t typesize,
                                            size_t bytes_of_chunk) const
{
    return {
        FILTER_BLOSC_VERSION,
        BLOSC_VERSION_FORMAT,
        static_cast<uint32_t>(typesize),
        static_cast<uint32_t>(bytes_of_chunk),
        params_.clevel,
        params_.shuffle,
        static_cast<uint32_t>(compcode_),
    };
}
