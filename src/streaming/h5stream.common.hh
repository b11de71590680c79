#pragma once

#include "h5stream.types.h"

#include <cstddef> // size_t, std::byte
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility> // std::pair

namespace h5stream {
struct FrameShape
{
    uint32_t rows;
    uint32_t cols;
};

/// @brief A frame as handed over by the transport. Does not own its payload.
struct Frame
{
    int64_t frame_index;
    FrameShape shape;
    H5StreamDataType dtype;
    std::span<const std::byte> data;
};

/**
 * @brief Trim whitespace from a string.
 * @param s The string to trim.
 * @return The string with leading and trailing whitespace removed.
 */
[[nodiscard]]
std::string
trim(std::string_view s);

/**
 * @brief Check if a string is empty, including whitespace.
 * @param s The string to check.
 * @param err_on_empty The message to log if the string is empty.
 * @return True if the string is empty, false otherwise.
 */
bool
is_empty_string(std::string_view s, std::string_view err_on_empty);

/**
 * @brief Get the number of bytes for a given data type.
 * @param data_type The data type.
 * @return The number of bytes for the data type.
 * @throw std::invalid_argument if the data type is not recognized.
 */
size_t
bytes_of_type(H5StreamDataType data_type);

/**
 * @brief Get the number of bytes of an unencoded frame.
 * @throw std::invalid_argument if the data type is not recognized.
 */
size_t
bytes_of_frame(const FrameShape& shape, H5StreamDataType data_type);

/// @brief Get a numpy-style name ("uint16", "float32", ...) for a data type.
const char*
data_type_to_string(H5StreamDataType data_type) noexcept;

/**
 * @brief Substitute a chunk number into an output path template.
 * @details Replaces every "{chunk_number}" with the decimal chunk number and
 * every "{chunk_number:0Nd}" with the chunk number zero-padded to N digits.
 * Other text, including other braces, is copied unchanged.
 * @throw std::invalid_argument if a "{chunk_number..." field is malformed.
 */
std::string
format_output_path(std::string_view path_template, uint64_t chunk_number);

/**
 * @brief Split an attribute key of the form "<object path>:<attribute name>".
 * @details The split happens at the last ':', so object paths may themselves
 * contain colons.
 * @throw std::invalid_argument if either part is empty.
 */
std::pair<std::string, std::string>
split_attribute_key(std::string_view key);
} // namespace h5stream
