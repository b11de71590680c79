#include "h5stream.h"
#include "h5stream.hh"
#include "macros.hh"

#include <cstring> // memcpy, strnlen

namespace {
/// @brief Adapts a C callback to the hook interface.
class CallbackHook : public h5stream::FrameHook
{
  public:
    CallbackHook(H5StreamFrameCallback callback, void* user_data)
      : callback_(callback)
      , user_data_(user_data)
    {
    }

    void on_frame_written(const h5stream::FrameWriter&,
                          const h5stream::Frame& frame) override
    {
        const H5StreamFrame c_frame{
            .frame_index = frame.frame_index,
            .rows = frame.shape.rows,
            .cols = frame.shape.cols,
            .dtype = frame.dtype,
            .data = frame.data.data(),
            .bytes_of_data = frame.data.size(),
        };

        const int rc = callback_(&c_frame, user_data_);
        EXPECT(rc == 0,
               "Frame callback failed with code ",
               rc,
               " for frame ",
               frame.frame_index);
    }

  private:
    H5StreamFrameCallback callback_;
    void* user_data_;
};

H5StreamStatusCode
copy_json_to_buffer(const nlohmann::json& value,
                    char* buffer,
                    size_t* bytes_of_buffer)
{
    const std::string s = value.dump();
    const size_t required = s.size() + 1;

    if (buffer == nullptr || *bytes_of_buffer < required) {
        *bytes_of_buffer = required;
        return H5StreamStatusCode_Overflow;
    }

    memcpy(buffer, s.c_str(), required);
    *bytes_of_buffer = required;
    return H5StreamStatusCode_Success;
}
} // namespace

extern "C"
{
    const char* H5Stream_get_api_version()
    {
        return H5STREAM_API_VERSION;
    }

    H5StreamStatusCode H5Stream_set_log_level(H5StreamLogLevel level)
    {
        EXPECT_VALID_ARGUMENT(
          level < H5StreamLogLevelCount, "Invalid log level: ", level);

        try {
            Logger::set_log_level(level);
        } catch (const std::exception& e) {
            LOG_ERROR("Error setting log level: ", e.what());
            return H5StreamStatusCode_InternalError;
        }
        return H5StreamStatusCode_Success;
    }

    H5StreamLogLevel H5Stream_get_log_level()
    {
        return Logger::get_log_level();
    }

    const char* H5Stream_get_status_message(H5StreamStatusCode code)
    {
        switch (code) {
            case H5StreamStatusCode_Success:
                return "Success";
            case H5StreamStatusCode_InvalidArgument:
                return "Invalid argument";
            case H5StreamStatusCode_Overflow:
                return "Buffer overflow";
            case H5StreamStatusCode_InvalidIndex:
                return "Invalid index";
            case H5StreamStatusCode_NotYetImplemented:
                return "Not yet implemented";
            case H5StreamStatusCode_InternalError:
                return "Internal error";
            case H5StreamStatusCode_OutOfMemory:
                return "Out of memory";
            case H5StreamStatusCode_IOError:
                return "I/O error";
            case H5StreamStatusCode_CompressionError:
                return "Compression error";
            case H5StreamStatusCode_InvalidSettings:
                return "Invalid settings";
            default:
                return "Unknown error";
        }
    }

    H5Stream* H5Stream_create(const H5StreamSettings* settings)
    {
        if (!settings) {
            LOG_ERROR("Null pointer: settings");
            return nullptr;
        }

        H5Stream* stream = nullptr;

        try {
            stream = new H5Stream(*settings);
        } catch (const std::bad_alloc&) {
            LOG_ERROR("Failed to allocate memory for stream");
        } catch (const std::exception& e) {
            LOG_ERROR("Error creating stream: ", e.what());
        }

        return stream;
    }

    void H5Stream_destroy(H5Stream* stream)
    {
        // the destructor finalizes any open container
        delete stream;
    }

    H5StreamStatusCode H5Stream_start(H5Stream* stream)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");

        try {
            stream->start();
        } catch (const std::invalid_argument& e) {
            LOG_ERROR("Error starting stream: ", e.what());
            return H5StreamStatusCode_InvalidSettings;
        } catch (const std::exception& e) {
            LOG_ERROR("Error starting stream: ", e.what());
            return H5StreamStatusCode_InternalError;
        }

        return H5StreamStatusCode_Success;
    }

    H5StreamStatusCode H5Stream_stop(H5Stream* stream)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");

        try {
            stream->stop();
        } catch (const h5stream::StorageError& e) {
            LOG_ERROR("Error stopping stream: ", e.what());
            return H5StreamStatusCode_IOError;
        } catch (const std::exception& e) {
            LOG_ERROR("Error stopping stream: ", e.what());
            return H5StreamStatusCode_InternalError;
        }

        return H5StreamStatusCode_Success;
    }

    uint8_t H5Stream_is_running(const H5Stream* stream)
    {
        if (!stream) {
            LOG_WARNING("Null pointer: stream. Returning 0.");
            return 0;
        }

        return stream->is_running() ? 1 : 0;
    }

    H5StreamStatusCode H5Stream_append(H5Stream* stream,
                                       const H5StreamFrame* frame)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");
        EXPECT_VALID_ARGUMENT(frame, "Null pointer: frame");
        EXPECT_VALID_ARGUMENT(frame->data, "Null pointer: frame->data");
        EXPECT_VALID_ARGUMENT(frame->bytes_of_data > 0,
                              "Invalid frame size: ",
                              frame->bytes_of_data);
        EXPECT_VALID_ARGUMENT(frame->rows > 0 && frame->cols > 0,
                              "Invalid frame shape: ",
                              frame->rows,
                              "x",
                              frame->cols);
        EXPECT_VALID_ARGUMENT(frame->dtype < H5StreamDataTypeCount,
                              "Invalid data type: ",
                              frame->dtype);
        EXPECT_VALID_INDEX(frame->frame_index >= 0,
                           "Invalid frame index: ",
                           frame->frame_index);

        const h5stream::Frame f{
            .frame_index = frame->frame_index,
            .shape = { frame->rows, frame->cols },
            .dtype = frame->dtype,
            .data = { static_cast<const std::byte*>(frame->data),
                      frame->bytes_of_data },
        };

        try {
            stream->append(f);
        } catch (const h5stream::StorageError& e) {
            LOG_ERROR("Error appending frame: ", e.what());
            return H5StreamStatusCode_IOError;
        } catch (const std::invalid_argument& e) {
            LOG_ERROR("Error appending frame: ", e.what());
            return H5StreamStatusCode_InvalidArgument;
        } catch (const std::exception& e) {
            LOG_ERROR("Error appending frame: ", e.what());
            return H5StreamStatusCode_InternalError;
        }

        return H5StreamStatusCode_Success;
    }

    H5StreamStatusCode H5Stream_add_frame_callback(
      H5Stream* stream,
      H5StreamFrameCallback callback,
      void* user_data)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");
        EXPECT_VALID_ARGUMENT(callback, "Null pointer: callback");
        EXPECT_VALID_ARGUMENT(!stream->is_running(),
                              "Cannot add a callback to a running stream");

        try {
            stream->add_hook(
              std::make_shared<CallbackHook>(callback, user_data));
        } catch (const std::bad_alloc&) {
            LOG_ERROR("Failed to allocate memory for callback");
            return H5StreamStatusCode_OutOfMemory;
        } catch (const std::exception& e) {
            LOG_ERROR("Error adding callback: ", e.what());
            return H5StreamStatusCode_InternalError;
        }

        return H5StreamStatusCode_Success;
    }

    H5StreamStatusCode H5Stream_set_parameters(H5Stream* stream,
                                               const char* parameters_json,
                                               size_t bytes_of_parameters_json)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");
        EXPECT_VALID_ARGUMENT(parameters_json, "Null pointer: parameters_json");

        const size_t nbytes =
          strnlen(parameters_json, bytes_of_parameters_json);
        auto val = nlohmann::json::parse(parameters_json,
                                         parameters_json + nbytes,
                                         nullptr, // callback
                                         false,   // allow exceptions
                                         true     // ignore comments
        );
        EXPECT_VALID_ARGUMENT(
          !val.is_discarded(), "Invalid JSON: ", parameters_json);

        try {
            stream->set_parameters(val);
        } catch (const std::invalid_argument& e) {
            LOG_ERROR("Error setting parameters: ", e.what());
            return H5StreamStatusCode_InvalidArgument;
        } catch (const std::exception& e) {
            LOG_ERROR("Error setting parameters: ", e.what());
            return H5StreamStatusCode_InternalError;
        }

        return H5StreamStatusCode_Success;
    }

    H5StreamStatusCode H5Stream_get_parameters(const H5Stream* stream,
                                               char* buffer,
                                               size_t* bytes_of_buffer)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");
        EXPECT_VALID_ARGUMENT(bytes_of_buffer, "Null pointer: bytes_of_buffer");

        try {
            return copy_json_to_buffer(
              stream->get_parameters(), buffer, bytes_of_buffer);
        } catch (const std::exception& e) {
            LOG_ERROR("Error getting parameters: ", e.what());
            return H5StreamStatusCode_InternalError;
        }
    }

    H5StreamStatusCode H5Stream_get_statistics(const H5Stream* stream,
                                               char* buffer,
                                               size_t* bytes_of_buffer)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");
        EXPECT_VALID_ARGUMENT(bytes_of_buffer, "Null pointer: bytes_of_buffer");

        try {
            return copy_json_to_buffer(
              stream->statistics(), buffer, bytes_of_buffer);
        } catch (const std::exception& e) {
            LOG_ERROR("Error getting statistics: ", e.what());
            return H5StreamStatusCode_InternalError;
        }
    }
}
