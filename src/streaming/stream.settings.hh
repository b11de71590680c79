#pragma once

#include "h5stream.types.h"

#include <nlohmann/json.hpp>

#include <cstdint> // uint32_t, uint64_t
#include <optional>
#include <string>
#include <vector>

struct H5StreamSettings_s
{
  public:
    std::string dataset_name; /* Path of the primary dataset in each container,
                                 e.g. "entry/data/data" */
    std::string output_path_template; /* Container path, with an optional
                                         "{chunk_number}" field */
    uint64_t frames_per_container{ 0 }; /* 0 means a single container */

    std::optional<uint32_t> compression_filter_id; /* HDF5 filter id */
    std::vector<uint32_t> compression_options;     /* Filter cd_values */

    nlohmann::json group_attributes = nlohmann::json::object();
    nlohmann::json dataset_attributes = nlohmann::json::object();
    nlohmann::json extra_datasets = nlohmann::json::object();
};

namespace h5stream {
using StreamSettings = H5StreamSettings_s;

/**
 * @brief Serialize every settings field into a flat parameter map.
 * @details An unset compression filter is serialized as null.
 */
nlohmann::json
settings_to_json(const StreamSettings& settings);

/**
 * @brief Apply a (possibly partial) parameter map to @p settings.
 * @details Every name and value is checked before anything is assigned, so
 * a rejected update leaves @p settings untouched.
 * @throw std::invalid_argument on an unknown name or an ill-typed value.
 */
void
apply_parameters(StreamSettings& settings, const nlohmann::json& parameters);

/**
 * @brief Check that a value can be stored as an attribute or dataset: a
 * boolean, number or string, or a nonempty homogeneous array of numbers or
 * of strings.
 */
[[nodiscard]] bool
is_storable_value(const nlohmann::json& value);
} // namespace h5stream
