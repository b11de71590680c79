#include "event.sink.hh"
#include "logger.hh"

void
h5stream::LogEventSink::container_opened(uint64_t chunk_id,
                                         const std::string& path)
{
    LOG_INFO("Opened container ", chunk_id, " at ", path);
}

void
h5stream::LogEventSink::container_closed(uint64_t chunk_id,
                                         const std::string& path,
                                         uint64_t first_frame,
                                         uint64_t last_frame)
{
    if (last_frame < first_frame) {
        LOG_INFO("Closed empty container ", chunk_id, " at ", path);
        return;
    }

    LOG_INFO("Closed container ",
             chunk_id,
             " at ",
             path,
             " holding frames ",
             first_frame,
             " to ",
             last_frame);
}

void
h5stream::LogEventSink::frame_written(int64_t frame_index,
                                      uint64_t chunk_id,
                                      uint64_t slot)
{
    LOG_DEBUG(
      "Wrote frame ", frame_index, " to container ", chunk_id, ", slot ", slot);
}
