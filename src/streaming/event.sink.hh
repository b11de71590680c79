#pragma once

#include <cstdint>
#include <string>

namespace h5stream {
/// @brief Receives lifecycle events from a FrameWriter.
class EventSink
{
  public:
    virtual ~EventSink() = default;

    virtual void container_opened(uint64_t chunk_id,
                                  const std::string& path) = 0;

    /**
     * @param first_frame 1-based global frame number of slot 0.
     * @param last_frame 1-based global frame number of the last written slot,
     * or first_frame - 1 if nothing was written.
     */
    virtual void container_closed(uint64_t chunk_id,
                                  const std::string& path,
                                  uint64_t first_frame,
                                  uint64_t last_frame) = 0;

    virtual void frame_written(int64_t frame_index,
                               uint64_t chunk_id,
                               uint64_t slot) = 0;
};

/// @brief Default sink. Writes every event to the log.
class LogEventSink : public EventSink
{
  public:
    void container_opened(uint64_t chunk_id, const std::string& path) override;
    void container_closed(uint64_t chunk_id,
                          const std::string& path,
                          uint64_t first_frame,
                          uint64_t last_frame) override;
    void frame_written(int64_t frame_index,
                       uint64_t chunk_id,
                       uint64_t slot) override;
};
} // namespace h5stream
