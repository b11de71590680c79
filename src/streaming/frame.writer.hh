#pragma once

#include "container.lifecycle.hh"
#include "event.sink.hh"
#include "frame.hook.hh"
#include "storage.backend.hh"
#include "stream.settings.hh"

#include <cstdint>
#include <memory>
#include <vector>

namespace h5stream {
/**
 * @brief Writes frames into a sequence of containers, one container per
 * frames_per_container consecutive frame indices.
 * @details A FrameWriter is single-owner and does no locking of its own.
 * The chunk geometry (frames_per_container) is fixed for the lifetime of the
 * writer. Everything else in the settings may be swapped through
 * update_settings() and takes effect at the next container.
 */
class FrameWriter
{
  public:
    FrameWriter(StorageBackend& backend,
                EventSink& events,
                const StreamSettings& settings,
                std::vector<std::shared_ptr<FrameHook>> hooks);

    /**
     * @brief Route a frame to its container, rolling over if needed, and write
     * its payload verbatim.
     * @throw std::invalid_argument if the frame index is negative.
     * @throw std::runtime_error if the backend fails. Exceptions from hooks
     * are propagated as-is.
     */
    void submit(const Frame& frame);

    /// @brief Finalize the open container, if any. Safe to call repeatedly.
    void stop();

    /// @brief Replace the settings used for containers opened from now on.
    void update_settings(const StreamSettings& settings);

    [[nodiscard]] uint64_t frames_per_container() const
    {
        return frames_per_container_;
    }
    [[nodiscard]] bool has_open_container() const
    {
        return lifecycle_.is_open();
    }

    /// @brief Id of the open container. Throws if none is open.
    [[nodiscard]] uint64_t current_chunk_id() const
    {
        return lifecycle_.chunk_id();
    }

    [[nodiscard]] uint64_t frames_written() const { return frames_written_; }
    [[nodiscard]] uint64_t bytes_written() const { return bytes_written_; }
    [[nodiscard]] uint64_t containers_written() const
    {
        return lifecycle_.containers_closed();
    }

  private:
    EventSink& events_;
    StreamSettings settings_;
    const uint64_t frames_per_container_;
    std::vector<std::shared_ptr<FrameHook>> hooks_;
    ContainerLifecycle lifecycle_;

    uint64_t frames_written_;
    uint64_t bytes_written_;
};
} // namespace h5stream
