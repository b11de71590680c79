#ifndef H_H5STREAM_V0
#define H_H5STREAM_V0

#include "h5stream.types.h"

#ifdef __cplusplus
extern "C"
{
#endif

    typedef struct H5StreamSettings_s H5StreamSettings;
    typedef struct H5Stream_s H5Stream;

    /**
     * @brief Get the version of the h5stream API.
     * @return Semver-formatted version of the h5stream API.
     */
    const char* H5Stream_get_api_version();

    /**
     * @brief Set the log level for the h5stream library.
     * @param level The log level.
     * @return H5StreamStatusCode_Success on success, or an error code on
     * failure.
     */
    H5StreamStatusCode H5Stream_set_log_level(H5StreamLogLevel level);

    /**
     * @brief Get the log level for the h5stream library.
     * @return The log level for the h5stream library.
     */
    H5StreamLogLevel H5Stream_get_log_level();

    /**
     * @brief Get the message for the given status code.
     * @param code The status code.
     * @return A human-readable status message.
     */
    const char* H5Stream_get_status_message(H5StreamStatusCode code);

    /***************************************************************************
     * Stream settings
     *
     * H5StreamSettings is an opaque data structure holding the configuration
     * of a stream. Required fields are the dataset name and the output path
     * template. Every setter returns a status code and leaves the settings
     * untouched on failure.
     **************************************************************************/

    /** @brief Return a pointer to a new, default-initialized settings struct. */
    H5StreamSettings* H5StreamSettings_create();

    /** @brief Destroy a settings struct. */
    void H5StreamSettings_destroy(H5StreamSettings* settings);

    /** @brief Make a copy of a settings struct. */
    H5StreamSettings* H5StreamSettings_copy(const H5StreamSettings* settings);

    /**
     * @brief Set the path of the primary dataset inside each container, e.g.
     * "entry/data/data".
     * @param[in, out] settings
     * @param[in] dataset_name The dataset path.
     * @param[in] bytes_of_dataset_name Length of @p dataset_name in bytes,
     * including the null terminator.
     */
    H5StreamStatusCode H5StreamSettings_set_dataset_name(
      H5StreamSettings* settings,
      const char* dataset_name,
      size_t bytes_of_dataset_name);

    /**
     * @brief Set the output path template.
     * @details When frames_per_container is nonzero, the substring
     * "{chunk_number}" (or "{chunk_number:0Nd}" for zero padding to N digits)
     * is replaced with the 1-based container number.
     */
    H5StreamStatusCode H5StreamSettings_set_output_path_template(
      H5StreamSettings* settings,
      const char* output_path_template,
      size_t bytes_of_output_path_template);

    /**
     * @brief Set the number of frames per container. 0 means a single,
     * unbounded container.
     */
    H5StreamStatusCode H5StreamSettings_set_frames_per_container(
      H5StreamSettings* settings,
      uint64_t frames_per_container);

    /**
     * @brief Set the HDF5 compression filter and its options (cd_values).
     * @param[in, out] settings
     * @param[in] filter_id HDF5 filter identifier, e.g. 32001 for blosc.
     * @param[in] options Filter options. May be NULL if @p option_count is 0.
     * @param[in] option_count Number of entries in @p options.
     */
    H5StreamStatusCode H5StreamSettings_set_compression(
      H5StreamSettings* settings,
      uint32_t filter_id,
      const uint32_t* options,
      size_t option_count);

    /**
     * @brief Update settings from a JSON object of parameter names to values.
     * @details Recognized names: dataset_name, output_path_template,
     * frames_per_container, compression_filter_id, compression_options,
     * group_attributes, dataset_attributes, extra_datasets. The update is
     * applied atomically.
     */
    H5StreamStatusCode H5StreamSettings_set_parameters(
      H5StreamSettings* settings,
      const char* parameters_json,
      size_t bytes_of_parameters_json);

    const char* H5StreamSettings_get_dataset_name(
      const H5StreamSettings* settings);
    const char* H5StreamSettings_get_output_path_template(
      const H5StreamSettings* settings);
    uint64_t H5StreamSettings_get_frames_per_container(
      const H5StreamSettings* settings);

    /***************************************************************************
     * Stream
     *
     * A stream is created idle from a copy of the settings. H5Stream_start
     * validates the configuration and arms the stream. Frames are then
     * submitted with H5Stream_append. H5Stream_stop finalizes the currently
     * open container; calling it when idle is a no-op. All functions are safe
     * to call from a control thread while another thread appends: calls are
     * serialized internally.
     **************************************************************************/

    /**
     * @brief Callback invoked after each frame is written.
     * @details Runs on the appending thread once the stream's internal lock
     * is released, so it may call H5Stream_* functions, including on the
     * stream that invoked it.
     * @return Zero on success. A nonzero value fails the append that triggered
     * the callback and skips callbacks registered after this one.
     */
    typedef int (*H5StreamFrameCallback)(const H5StreamFrame* frame,
                                         void* user_data);

    /**
     * @brief Create a stream.
     * @param[in] settings The settings to copy into the stream.
     * @return A pointer to the stream, or NULL on failure.
     */
    H5Stream* H5Stream_create(const H5StreamSettings* settings);

    /** @brief Stop (finalizing any open container) and destroy a stream. */
    void H5Stream_destroy(H5Stream* stream);

    H5StreamStatusCode H5Stream_start(H5Stream* stream);
    H5StreamStatusCode H5Stream_stop(H5Stream* stream);
    uint8_t H5Stream_is_running(const H5Stream* stream);

    /**
     * @brief Write a frame to the stream.
     * @return H5StreamStatusCode_InvalidIndex if the frame index is negative,
     * H5StreamStatusCode_IOError if the storage backend failed.
     */
    H5StreamStatusCode H5Stream_append(H5Stream* stream,
                                       const H5StreamFrame* frame);

    /**
     * @brief Register a callback to run after each written frame.
     * @details Callbacks may only be registered while the stream is stopped.
     */
    H5StreamStatusCode H5Stream_add_frame_callback(
      H5Stream* stream,
      H5StreamFrameCallback callback,
      void* user_data);

    /**
     * @brief Update stream parameters from a JSON object.
     * @details Values set while running apply to the next container opened.
     */
    H5StreamStatusCode H5Stream_set_parameters(H5Stream* stream,
                                               const char* parameters_json,
                                               size_t bytes_of_parameters_json);

    /**
     * @brief Get the stream parameters as a JSON object.
     * @param[in] stream
     * @param[out] buffer Buffer to receive the null-terminated JSON string.
     * @param[in, out] bytes_of_buffer Size of @p buffer. On return, the number
     * of bytes required, including the null terminator.
     * @return H5StreamStatusCode_Overflow if @p buffer is too small.
     */
    H5StreamStatusCode H5Stream_get_parameters(const H5Stream* stream,
                                               char* buffer,
                                               size_t* bytes_of_buffer);

    /**
     * @brief Get stream statistics (frames and bytes written, containers
     * finalized, running state) as a JSON object.
     * @see H5Stream_get_parameters for buffer semantics.
     */
    H5StreamStatusCode H5Stream_get_statistics(const H5Stream* stream,
                                               char* buffer,
                                               size_t* bytes_of_buffer);

#ifdef __cplusplus
}
#endif

#endif // H_H5STREAM_V0
