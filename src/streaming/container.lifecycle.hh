#pragma once

#include "capacity.manager.hh"
#include "event.sink.hh"
#include "storage.backend.hh"
#include "stream.settings.hh"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace h5stream {
/**
 * @brief Owns the single open container, if any, and drives it from creation
 * to finalization.
 * @details The manager is either CLOSED (no container) or OPEN (exactly one
 * container and its capacity bookkeeping). Closing always leaves the manager
 * CLOSED, even when finalization fails, so a container is never finalized
 * twice.
 */
class ContainerLifecycle
{
  public:
    ContainerLifecycle(StorageBackend& backend, EventSink& events);

    /**
     * @brief Close the current container, if any, then create the container
     * for @p chunk_id.
     * @param chunk_id 0 when chunking is disabled, 1-based otherwise.
     * @param frames_per_container Chunk geometry, used to compute the frame
     * numbers recorded at close.
     * @param shape Shape of every frame in the container.
     * @param dtype Element type of every frame in the container.
     * @param settings Snapshot of the dataset name, path template,
     * compression and metadata to use for this container.
     */
    void open(uint64_t chunk_id,
              uint64_t frames_per_container,
              const FrameShape& shape,
              H5StreamDataType dtype,
              const StreamSettings& settings);

    /**
     * @brief Shrink the dataset to fit, write the frame range and the
     * configured metadata, then flush and release the container.
     * @details Does nothing when no container is open.
     */
    void close();

    [[nodiscard]] bool is_open() const { return open_.has_value(); }

    /// @brief The id of the open container. Throws if none is open.
    [[nodiscard]] uint64_t chunk_id() const;

    /// @brief The resolved path of the open container. Throws if none is open.
    [[nodiscard]] const std::string& path() const;

    /// @brief The open container. Throws if none is open.
    Container& container();

    /// @brief Capacity bookkeeping of the open container. Throws if none is
    /// open.
    CapacityManager& capacity();

    /// @brief The number of containers successfully finalized.
    [[nodiscard]] uint64_t containers_closed() const
    {
        return containers_closed_;
    }

  private:
    struct OpenContainer
    {
        OpenContainer(uint64_t chunk_id,
                      uint64_t frames_per_container,
                      std::string path,
                      StreamSettings settings,
                      std::unique_ptr<Container> container);

        uint64_t chunk_id;
        uint64_t frames_per_container;
        std::string path;
        StreamSettings settings;
        std::unique_ptr<Container> container;
        CapacityManager capacity;
    };

    StorageBackend& backend_;
    EventSink& events_;
    std::optional<OpenContainer> open_;
    uint64_t containers_closed_;

    void write_metadata_(OpenContainer& current,
                         uint64_t first_frame,
                         uint64_t last_frame);
};
} // namespace h5stream
