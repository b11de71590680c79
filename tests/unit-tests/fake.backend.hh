#pragma once

#include "event.sink.hh"
#include "storage.backend.hh"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

// outlives the container so tests can inspect it after finalization
struct FakeContainerState
{
    h5stream::ContainerSpec spec;
    uint64_t capacity{ 0 };
    std::vector<uint64_t> resizes;
    std::map<uint64_t, std::vector<std::byte>> chunks;
    std::map<std::string, nlohmann::json> attributes; // "<path>:<name>"
    std::map<std::string, nlohmann::json> datasets;
    std::vector<std::string> operations;
    int closes{ 0 };
    bool destroyed{ false };
    bool fail_on_close{ false };
};

class FakeContainer : public h5stream::Container
{
  public:
    explicit FakeContainer(std::shared_ptr<FakeContainerState> state)
      : state_(std::move(state))
    {
    }

    ~FakeContainer() override { state_->destroyed = true; }

    uint64_t capacity() const override { return state_->capacity; }

    uint64_t resize(uint64_t n_slots) override
    {
        state_->resizes.push_back(n_slots);
        state_->operations.push_back("resize " + std::to_string(n_slots));
        state_->capacity = n_slots;
        return n_slots;
    }

    void write_chunk(uint64_t slot, std::span<const std::byte> data) override
    {
        if (slot >= state_->capacity) {
            throw h5stream::StorageError("slot " + std::to_string(slot) +
                                         " out of range");
        }
        state_->chunks[slot].assign(data.begin(), data.end());
        state_->operations.push_back("write " + std::to_string(slot));
    }

    void set_group_attribute(const std::string& group_path,
                             const std::string& name,
                             const nlohmann::json& value) override
    {
        state_->attributes[group_path + ":" + name] = value;
        state_->operations.push_back("group attribute " + group_path + ":" +
                                     name);
    }

    void set_dataset_attribute(const std::string& dataset_path,
                               const std::string& name,
                               const nlohmann::json& value) override
    {
        state_->attributes[dataset_path + ":" + name] = value;
        state_->operations.push_back("dataset attribute " + dataset_path +
                                     ":" + name);
    }

    void add_dataset(const std::string& dataset_path,
                     const nlohmann::json& value) override
    {
        state_->datasets[dataset_path] = value;
        state_->operations.push_back("dataset " + dataset_path);
    }

  protected:
    void close_() override
    {
        ++state_->closes;
        state_->operations.push_back("close");
        if (state_->fail_on_close) {
            throw h5stream::StorageError("close failed");
        }
    }

  private:
    std::shared_ptr<FakeContainerState> state_;
};

class FakeBackend : public h5stream::StorageBackend
{
  public:
    explicit FakeBackend(uint64_t initial_capacity = 1000)
      : initial_capacity_(initial_capacity)
    {
    }

    std::unique_ptr<h5stream::Container> create_container(
      const h5stream::ContainerSpec& spec) override
    {
        auto state = std::make_shared<FakeContainerState>();
        state->spec = spec;
        state->capacity = initial_capacity_;
        state->fail_on_close = fail_on_close;
        containers.push_back(state);

        return std::make_unique<FakeContainer>(state);
    }

    std::vector<std::shared_ptr<FakeContainerState>> containers;
    bool fail_on_close{ false };

  private:
    uint64_t initial_capacity_;
};

class RecordingEventSink : public h5stream::EventSink
{
  public:
    void container_opened(uint64_t chunk_id, const std::string& path) override
    {
        events.push_back("opened " + std::to_string(chunk_id) + " " + path);
    }

    void container_closed(uint64_t chunk_id,
                          const std::string& path,
                          uint64_t first_frame,
                          uint64_t last_frame) override
    {
        events.push_back("closed " + std::to_string(chunk_id) + " " + path +
                         " " + std::to_string(first_frame) + "-" +
                         std::to_string(last_frame));
    }

    void frame_written(int64_t frame_index,
                       uint64_t chunk_id,
                       uint64_t slot) override
    {
        events.push_back("frame " + std::to_string(frame_index) + " " +
                         std::to_string(chunk_id) + " " +
                         std::to_string(slot));
    }

    std::vector<std::string> events;
};
