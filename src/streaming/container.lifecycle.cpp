#include "container.lifecycle.hh"
#include "chunk.router.hh"
#include "macros.hh"

h5stream::ContainerLifecycle::OpenContainer::OpenContainer(
  uint64_t chunk_id,
  uint64_t frames_per_container,
  std::string path,
  StreamSettings settings,
  std::unique_ptr<Container> container)
  : chunk_id(chunk_id)
  , frames_per_container(frames_per_container)
  , path(std::move(path))
  , settings(std::move(settings))
  , container(std::move(container))
  , capacity(*this->container)
{
}

h5stream::ContainerLifecycle::ContainerLifecycle(StorageBackend& backend,
                                                 EventSink& events)
  : backend_(backend)
  , events_(events)
  , containers_closed_(0)
{
}

void
h5stream::ContainerLifecycle::open(uint64_t chunk_id,
                                   uint64_t frames_per_container,
                                   const FrameShape& shape,
                                   H5StreamDataType dtype,
                                   const StreamSettings& settings)
{
    close();

    ContainerSpec spec{
        .path = format_output_path(settings.output_path_template, chunk_id),
        .dataset_name = settings.dataset_name,
        .frame_shape = shape,
        .dtype = dtype,
        .filter_id = settings.compression_filter_id,
        .filter_options = settings.compression_options,
    };

    auto container = backend_.create_container(spec);
    CHECK(container);

    open_.emplace(chunk_id,
                  frames_per_container,
                  spec.path,
                  settings,
                  std::move(container));

    events_.container_opened(chunk_id, open_->path);
}

void
h5stream::ContainerLifecycle::close()
{
    if (!open_) {
        return;
    }

    // leave the OPEN state before touching the backend: a failure below
    // releases the handle without finalizing it a second time
    OpenContainer current = std::move(*open_);
    open_.reset();

    current.capacity.shrink_to_fit();

    const uint64_t first_frame =
      first_frame_number(current.chunk_id, current.frames_per_container);
    // an empty container records the empty range [first, first - 1]
    const uint64_t last_frame =
      current.capacity.has_writes()
        ? first_frame +
            static_cast<uint64_t>(current.capacity.max_written_slot())
        : first_frame - 1;

    write_metadata_(current, first_frame, last_frame);
    finalize_container(std::move(current.container));

    ++containers_closed_;
    events_.container_closed(
      current.chunk_id, current.path, first_frame, last_frame);
}

uint64_t
h5stream::ContainerLifecycle::chunk_id() const
{
    EXPECT(open_, "No container is open.");
    return open_->chunk_id;
}

const std::string&
h5stream::ContainerLifecycle::path() const
{
    EXPECT(open_, "No container is open.");
    return open_->path;
}

h5stream::Container&
h5stream::ContainerLifecycle::container()
{
    EXPECT(open_, "No container is open.");
    return *open_->container;
}

h5stream::CapacityManager&
h5stream::ContainerLifecycle::capacity()
{
    EXPECT(open_, "No container is open.");
    return open_->capacity;
}

void
h5stream::ContainerLifecycle::write_metadata_(OpenContainer& current,
                                              uint64_t first_frame,
                                              uint64_t last_frame)
{
    const auto& settings = current.settings;
    auto& container = *current.container;

    container.set_dataset_attribute(
      settings.dataset_name, "image_nr_low", first_frame);
    container.set_dataset_attribute(
      settings.dataset_name, "image_nr_high", last_frame);

    for (const auto& [key, value] : settings.group_attributes.items()) {
        const auto [group, name] = split_attribute_key(key);
        container.set_group_attribute(group, name, value);
    }

    for (const auto& [path, value] : settings.extra_datasets.items()) {
        container.add_dataset(path, value);
    }

    for (const auto& [key, value] : settings.dataset_attributes.items()) {
        const auto [dataset, name] = split_attribute_key(key);
        container.set_dataset_attribute(dataset, name, value);
    }
}
