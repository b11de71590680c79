#pragma once

#include "storage.backend.hh"

#include <cstdint>
#include <memory>

namespace h5stream {
/**
 * @brief Stores containers as HDF5 files through the HDF5 C library.
 * @details Each container is one file holding a primary dataset of shape
 * (n, rows, cols), chunked one frame per chunk and unlimited along n. Frames
 * are written with H5Dwrite_chunk, so payloads must already be in the
 * on-disk form of the configured filter (or raw little-endian samples when
 * no filter is configured). Constructing a backend registers the blosc
 * filter with libhdf5.
 */
class Hdf5Backend : public StorageBackend
{
  public:
    static constexpr uint64_t default_initial_capacity = 1000;

    explicit Hdf5Backend(uint64_t initial_capacity = default_initial_capacity);

    [[nodiscard]] std::unique_ptr<Container> create_container(
      const ContainerSpec& spec) override;

  private:
    uint64_t initial_capacity_;
};
} // namespace h5stream
