#pragma once

#include <nlohmann/json.hpp>

#include <cstddef> // size_t, std::byte
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace h5stream {
struct BloscCompressionParams
{
    std::string codec_id{ "lz4" };
    uint8_t clevel{ 1 };
    uint8_t shuffle{ 1 };

    BloscCompressionParams() = default;
    BloscCompressionParams(std::string_view codec_id,
                           uint8_t clevel,
                           uint8_t shuffle);
};

void
to_json(nlohmann::json& j, const BloscCompressionParams& params);

/// @throw std::invalid_argument on an unknown codec or out-of-range value.
void
from_json(const nlohmann::json& j, BloscCompressionParams& params);

/**
 * @brief Encodes frames upstream of the storage engine into blosc frames,
 * the on-disk form of the HDF5 blosc filter.
 */
class BloscEncoder
{
  public:
    explicit BloscEncoder(const BloscCompressionParams& params);

    /**
     * @brief Compress a frame.
     * @param data The raw frame.
     * @param typesize Bytes per sample, used by the shuffle stage.
     * @return A self-describing blosc frame.
     * @throw std::runtime_error if blosc fails.
     */
    [[nodiscard]] std::vector<std::byte> encode(std::span<const std::byte> data,
                                                size_t typesize) const;

    /**
     * @brief Get the cd_values the HDF5 blosc filter (FILTER_BLOSC) expects
     * for datasets written with this encoder.
     * @param typesize Bytes per sample.
     * @param bytes_of_chunk Unencoded size of one chunk (one frame).
     */
    [[nodiscard]] std::vector<uint32_t> hdf5_filter_options(
      size_t typesize,
      size_t bytes_of_chunk) const;

    [[nodiscard]] const BloscCompressionParams& params() const
    {
        return params_;
    }

  private:
    BloscCompressionParams params_;
    int compcode_;
};
} // namespace h5stream
