#include "h5stream.hh"
#include "h5stream.common.hh"
#include "hdf5.backend.hh"
#include "macros.hh"

#include <filesystem>

namespace fs = std::filesystem;

namespace {
[[nodiscard]]
bool
validate_filesystem_path(std::string_view output_path)
{
    fs::path path(output_path);
    fs::path parent_path = path.parent_path();
    if (parent_path.empty()) {
        parent_path = ".";
    }

    // parent path must exist and be a directory
    if (!fs::exists(parent_path) || !fs::is_directory(parent_path)) {
        LOG_ERROR("Parent path '",
                  parent_path,
                  "' does not exist or is not a directory");
        return false;
    }

    // parent path must be writable
    const auto perms = fs::status(parent_path).permissions();
    const bool is_writable =
      (perms & (fs::perms::owner_write | fs::perms::group_write |
                fs::perms::others_write)) != fs::perms::none;

    if (!is_writable) {
        LOG_ERROR("Parent path '", parent_path, "' is not writable");
        return false;
    }

    return true;
}
} // namespace

/* H5Stream_s implementation */

H5Stream_s::H5Stream_s(const H5StreamSettings_s& settings)
  : H5Stream_s(settings,
               std::make_unique<h5stream::Hdf5Backend>(),
               std::make_unique<h5stream::LogEventSink>())
{
}

H5Stream_s::H5Stream_s(const H5StreamSettings_s& settings,
                       std::unique_ptr<h5stream::StorageBackend> backend,
                       std::unique_ptr<h5stream::EventSink> events)
  : settings_(settings)
  , backend_(std::move(backend))
  , events_(std::move(events))
  , frames_written_(0)
  , bytes_written_(0)
  , containers_written_(0)
{
    EXPECT_ARGUMENT(backend_, "Null storage backend");
    EXPECT_ARGUMENT(events_, "Null event sink");
}

H5Stream_s::~H5Stream_s()
{
    try {
        stop();
    } catch (const std::exception& e) {
        LOG_ERROR("Error finalizing stream: ", e.what());
    }
}

void
H5Stream_s::start()
{
    std::scoped_lock lock(mutex_);

    EXPECT(!writer_, "Stream is already running.");
    validate_settings_();

    // the stream runs the hooks itself, outside the lock
    writer_ = std::make_shared<h5stream::FrameWriter>(
      *backend_,
      *events_,
      settings_,
      std::vector<std::shared_ptr<h5stream::FrameHook>>{});

    LOG_INFO("Stream started, writing ",
             settings_.frames_per_container == 0
               ? std::string("all frames to one container")
               : std::to_string(settings_.frames_per_container) +
                   " frames per container");
}

void
H5Stream_s::stop()
{
    std::scoped_lock lock(mutex_);
    stop_();
}

bool
H5Stream_s::is_running() const
{
    std::scoped_lock lock(mutex_);
    return writer_ != nullptr;
}

void
H5Stream_s::append(const h5stream::Frame& frame)
{
    std::shared_ptr<const h5stream::FrameWriter> writer;
    std::vector<std::shared_ptr<h5stream::FrameHook>> hooks;
    {
        std::scoped_lock lock(mutex_);

        EXPECT(writer_, "Stream is not running.");
        writer_->submit(frame);

        writer = writer_;
        hooks = hooks_;
    }

    for (const auto& hook : hooks) {
        hook->on_frame_written(*writer, frame);
    }
}

void
H5Stream_s::add_hook(std::shared_ptr<h5stream::FrameHook> hook)
{
    std::scoped_lock lock(mutex_);

    EXPECT_ARGUMENT(hook, "Null frame hook");
    EXPECT(!writer_, "Cannot add a hook while the stream is running.");

    hooks_.push_back(std::move(hook));
}

void
H5Stream_s::set_parameters(const nlohmann::json& parameters)
{
    std::scoped_lock lock(mutex_);

    h5stream::apply_parameters(settings_, parameters);
    if (writer_) {
        writer_->update_settings(settings_);
    }
}

nlohmann::json
H5Stream_s::get_parameters() const
{
    std::scoped_lock lock(mutex_);
    return h5stream::settings_to_json(settings_);
}

nlohmann::json
H5Stream_s::statistics() const
{
    std::scoped_lock lock(mutex_);

    uint64_t frames = frames_written_;
    uint64_t bytes = bytes_written_;
    uint64_t containers = containers_written_;
    if (writer_) {
        frames += writer_->frames_written();
        bytes += writer_->bytes_written();
        containers += writer_->containers_written();
    }

    return {
        { "frames_written", frames },
        { "bytes_written", bytes },
        { "containers_written", containers },
        { "is_running", writer_ != nullptr },
    };
}

void
H5Stream_s::validate_settings_() const
{
    EXPECT_ARGUMENT(!h5stream::is_empty_string(settings_.dataset_name,
                                               "Dataset name is empty"),
                    "Invalid settings: dataset name is empty");

    EXPECT_ARGUMENT(!settings_.output_path_template.empty(),
                    "Invalid settings: output path template is empty");

    EXPECT_ARGUMENT(
      settings_.compression_options.empty() ||
        settings_.compression_filter_id.has_value(),
      "Invalid settings: compression options given without a filter id");

    // throws on a malformed template
    const uint64_t first_chunk = settings_.frames_per_container == 0 ? 0 : 1;
    const auto first_path =
      h5stream::format_output_path(settings_.output_path_template, first_chunk);

    EXPECT_ARGUMENT(validate_filesystem_path(first_path),
                    "Invalid settings: cannot write to '",
                    first_path,
                    "'");
}

void
H5Stream_s::stop_()
{
    if (!writer_) {
        return;
    }

    // idle from here on, whether or not finalization succeeds
    auto writer = std::move(writer_);
    try {
        writer->stop();
    } catch (const std::exception&) {
        record_run_(*writer);
        throw;
    }
    record_run_(*writer);

    LOG_INFO("Stream stopped after ", writer->frames_written(), " frames");
}

void
H5Stream_s::record_run_(const h5stream::FrameWriter& writer)
{
    frames_written_ += writer.frames_written();
    bytes_written_ += writer.bytes_written();
    containers_written_ += writer.containers_written();
}
