#pragma once

#include "h5stream.common.hh"

#include <nlohmann/json.hpp>

#include <cstddef> // std::byte
#include <cstdint>
#include <memory>   // std::unique_ptr
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace h5stream {
/// @brief Thrown by a backend when the underlying storage fails.
class StorageError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// @brief Everything a backend needs to create a container and its primary
/// dataset.
struct ContainerSpec
{
    std::string path;
    std::string dataset_name;
    FrameShape frame_shape;
    H5StreamDataType dtype;
    std::optional<uint32_t> filter_id;
    std::vector<uint32_t> filter_options;
};

/**
 * @brief An open container with one primary, frame-chunked dataset.
 * @details Slots are indices along the leading dimension of the primary
 * dataset. Every method throws StorageError on a backend failure.
 */
class Container
{
  public:
    virtual ~Container() = default;

    /** @brief The number of slots currently allocated. */
    [[nodiscard]] virtual uint64_t capacity() const = 0;

    /**
     * @brief Resize the primary dataset along its leading dimension.
     * @param n_slots The requested number of slots.
     * @return The number of slots the backend actually holds afterwards.
     */
    [[nodiscard]] virtual uint64_t resize(uint64_t n_slots) = 0;

    /**
     * @brief Write a pre-encoded chunk at the given slot, bypassing the
     * backend's filter pipeline.
     * @param slot Slot to write. Must be less than capacity().
     * @param data Payload in its on-disk encoded form.
     */
    virtual void write_chunk(uint64_t slot,
                             std::span<const std::byte> data) = 0;

    /**
     * @brief Set an attribute on a group, creating the group (and any missing
     * parents) if it doesn't exist.
     */
    virtual void set_group_attribute(const std::string& group_path,
                                     const std::string& name,
                                     const nlohmann::json& value) = 0;

    /** @brief Set an attribute on an existing dataset. */
    virtual void set_dataset_attribute(const std::string& dataset_path,
                                       const std::string& name,
                                       const nlohmann::json& value) = 0;

    /**
     * @brief Write an auxiliary dataset holding @p value, creating missing
     * parent groups and replacing any existing object at @p dataset_path.
     */
    virtual void add_dataset(const std::string& dataset_path,
                             const nlohmann::json& value) = 0;

  protected:
    /** @brief Flush and release the underlying resources. */
    virtual void close_() = 0;

    friend void finalize_container(std::unique_ptr<Container>&& container);
};

/**
 * @brief Flush and close a container, then destroy it.
 * @details The container is destroyed even if closing throws, so a failed
 * close is never retried.
 */
void
finalize_container(std::unique_ptr<Container>&& container);

class StorageBackend
{
  public:
    virtual ~StorageBackend() = default;

    /**
     * @brief Create a container, truncating any existing file at the same
     * path.
     */
    [[nodiscard]] virtual std::unique_ptr<Container> create_container(
      const ContainerSpec& spec) = 0;
};
} // namespace h5stream
