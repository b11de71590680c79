#pragma once

#include "event.sink.hh"
#include "frame.hook.hh"
#include "frame.writer.hh"
#include "storage.backend.hh"
#include "stream.settings.hh"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory> // unique_ptr, shared_ptr
#include <mutex>
#include <vector>

struct H5Stream_s
{
  public:
    /// @brief Create an idle stream writing HDF5 containers.
    explicit H5Stream_s(const H5StreamSettings_s& settings);

    /// @brief Create an idle stream over the given backend and event sink.
    H5Stream_s(const H5StreamSettings_s& settings,
               std::unique_ptr<h5stream::StorageBackend> backend,
               std::unique_ptr<h5stream::EventSink> events);

    ~H5Stream_s();

    /**
     * @brief Validate the settings and arm a fresh writer.
     * @throw std::invalid_argument if the settings are invalid. Nothing is
     * written in that case.
     * @throw std::runtime_error if the stream is already running.
     */
    void start();

    /**
     * @brief Finalize the open container, if any, and return to idle.
     * @details Safe to call when idle. The stream is idle afterwards even if
     * finalization throws.
     */
    void stop();

    [[nodiscard]] bool is_running() const;

    /**
     * @brief Write a frame, then run the hooks.
     * @details Hooks run after the stream lock is released, so a hook may
     * call back into this stream.
     * @throw std::runtime_error if the stream is not running.
     * @throw std::invalid_argument if the frame index is negative.
     * @throw h5stream::StorageError if the backend fails.
     */
    void append(const h5stream::Frame& frame);

    /// @brief Register a hook for subsequent runs. Only allowed while idle.
    void add_hook(std::shared_ptr<h5stream::FrameHook> hook);

    /**
     * @brief Update parameters. While running, the update applies to the next
     * container opened, except frames_per_container, which applies at the
     * next start.
     * @throw std::invalid_argument if the update is rejected. The settings
     * are untouched in that case.
     */
    void set_parameters(const nlohmann::json& parameters);

    [[nodiscard]] nlohmann::json get_parameters() const;

    /// @brief Totals across all runs of this stream, and the running state.
    [[nodiscard]] nlohmann::json statistics() const;

  private:
    mutable std::mutex mutex_;

    H5StreamSettings_s settings_;
    std::unique_ptr<h5stream::StorageBackend> backend_;
    std::unique_ptr<h5stream::EventSink> events_;
    std::vector<std::shared_ptr<h5stream::FrameHook>> hooks_;
    // null when idle; shared with hooks still running after a stop
    std::shared_ptr<h5stream::FrameWriter> writer_;

    uint64_t frames_written_;
    uint64_t bytes_written_;
    uint64_t containers_written_;

    void validate_settings_() const;
    void stop_();
    void record_run_(const h5stream::FrameWriter& writer);
};
