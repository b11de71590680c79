#include "frame.writer.hh"
#include "chunk.router.hh"
#include "macros.hh"

h5stream::FrameWriter::FrameWriter(
  StorageBackend& backend,
  EventSink& events,
  const StreamSettings& settings,
  std::vector<std::shared_ptr<FrameHook>> hooks)
  : events_(events)
  , settings_(settings)
  , frames_per_container_(settings.frames_per_container)
  , hooks_(std::move(hooks))
  , lifecycle_(backend, events)
  , frames_written_(0)
  , bytes_written_(0)
{
    for (const auto& hook : hooks_) {
        EXPECT_ARGUMENT(hook, "Null frame hook.");
    }
}

void
h5stream::FrameWriter::submit(const Frame& frame)
{
    const auto [chunk_id, slot] =
      route(frame.frame_index, frames_per_container_);

    if (!lifecycle_.is_open() || lifecycle_.chunk_id() != chunk_id) {
        lifecycle_.open(chunk_id,
                        frames_per_container_,
                        frame.shape,
                        frame.dtype,
                        settings_);
    }

    auto& capacity = lifecycle_.capacity();
    capacity.ensure_capacity(slot);
    lifecycle_.container().write_chunk(slot, frame.data);
    capacity.record_write(slot);

    ++frames_written_;
    bytes_written_ += frame.data.size();
    events_.frame_written(frame.frame_index, chunk_id, slot);

    for (const auto& hook : hooks_) {
        hook->on_frame_written(*this, frame);
    }
}

void
h5stream::FrameWriter::stop()
{
    lifecycle_.close();
}

void
h5stream::FrameWriter::update_settings(const StreamSettings& settings)
{
    if (settings.frames_per_container != frames_per_container_) {
        LOG_WARNING("frames_per_container changed from ",
                    frames_per_container_,
                    " to ",
                    settings.frames_per_container,
                    " while writing. The new value takes effect at the next "
                    "start.");
    }

    settings_ = settings;
}
