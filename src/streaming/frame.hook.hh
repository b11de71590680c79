#pragma once

#include "h5stream.common.hh"

namespace h5stream {
class FrameWriter;

/**
 * @brief Something to run after each frame lands in its container.
 * @details Hooks run synchronously on the writing thread, in registration
 * order. A hook that throws fails the submission and skips the hooks after
 * it; the frame itself stays written. A stream runs its hooks after
 * releasing its lock, so they may call back into the stream.
 */
class FrameHook
{
  public:
    virtual ~FrameHook() = default;

    virtual void on_frame_written(const FrameWriter& writer,
                                  const Frame& frame) = 0;
};
} // namespace h5stream
