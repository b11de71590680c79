#include "stream.settings.hh"
#include "h5stream.h"
#include "h5stream.common.hh"
#include "macros.hh"

#include <algorithm>
#include <cstring> // strnlen
#include <limits>

#define SETTINGS_GET_STRING(settings, member)                                  \
    do {                                                                       \
        if (!settings) {                                                       \
            LOG_ERROR("Null pointer: ", #settings);                            \
            return nullptr;                                                    \
        }                                                                      \
        return settings->member.c_str();                                       \
    } while (0)

namespace {
const char* const known_parameters[] = {
    "dataset_name",       "output_path_template", "frames_per_container",
    "compression_filter_id", "compression_options", "group_attributes",
    "dataset_attributes", "extra_datasets",
};

uint64_t
as_unsigned(const nlohmann::json& value,
            const std::string& name,
            uint64_t max_value)
{
    EXPECT_ARGUMENT(value.is_number_integer(),
                    "Parameter '",
                    name,
                    "' must be a nonnegative integer, got ",
                    value.dump());

    if (value.is_number_unsigned()) {
        const auto v = value.get<uint64_t>();
        EXPECT_ARGUMENT(
          v <= max_value, "Parameter '", name, "' is out of range: ", v);
        return v;
    }

    const auto v = value.get<int64_t>();
    EXPECT_ARGUMENT(v >= 0 && static_cast<uint64_t>(v) <= max_value,
                    "Parameter '",
                    name,
                    "' is out of range: ",
                    v);
    return static_cast<uint64_t>(v);
}

std::string
as_string(const nlohmann::json& value, const std::string& name)
{
    EXPECT_ARGUMENT(value.is_string(),
                    "Parameter '",
                    name,
                    "' must be a string, got ",
                    value.dump());
    return value.get<std::string>();
}

void
check_value_map(const nlohmann::json& value,
                const std::string& name,
                bool keys_are_attributes)
{
    EXPECT_ARGUMENT(value.is_object(),
                    "Parameter '",
                    name,
                    "' must be an object, got ",
                    value.dump());

    for (const auto& [key, v] : value.items()) {
        if (keys_are_attributes) {
            // throws on a malformed key
            [[maybe_unused]] auto parts = h5stream::split_attribute_key(key);
        } else {
            EXPECT_ARGUMENT(!h5stream::trim(key).empty(),
                            "Parameter '",
                            name,
                            "' has an empty dataset path");
        }

        EXPECT_ARGUMENT(h5stream::is_storable_value(v),
                        "Parameter '",
                        name,
                        "' has a value that cannot be stored at '",
                        key,
                        "': ",
                        v.dump());
    }
}
} // namespace

bool
h5stream::is_storable_value(const nlohmann::json& value)
{
    if (value.is_boolean() || value.is_number() || value.is_string()) {
        return true;
    }

    if (!value.is_array() || value.empty()) {
        return false;
    }

    if (value.front().is_string()) {
        return std::all_of(value.begin(), value.end(), [](const auto& v) {
            return v.is_string();
        });
    }

    return std::all_of(value.begin(), value.end(), [](const auto& v) {
        return v.is_number();
    });
}

nlohmann::json
h5stream::settings_to_json(const StreamSettings& settings)
{
    nlohmann::json j;
    j["dataset_name"] = settings.dataset_name;
    j["output_path_template"] = settings.output_path_template;
    j["frames_per_container"] = settings.frames_per_container;
    if (settings.compression_filter_id) {
        j["compression_filter_id"] = *settings.compression_filter_id;
    } else {
        j["compression_filter_id"] = nullptr;
    }
    j["compression_options"] = settings.compression_options;
    j["group_attributes"] = settings.group_attributes;
    j["dataset_attributes"] = settings.dataset_attributes;
    j["extra_datasets"] = settings.extra_datasets;

    return j;
}

void
h5stream::apply_parameters(StreamSettings& settings,
                           const nlohmann::json& parameters)
{
    EXPECT_ARGUMENT(parameters.is_object(),
                    "Parameters must be a JSON object, got ",
                    parameters.dump());

    constexpr auto u32_max = std::numeric_limits<uint32_t>::max();
    constexpr auto u64_max = std::numeric_limits<uint64_t>::max();

    StreamSettings updated = settings;
    for (const auto& [name, value] : parameters.items()) {
        if (name == "dataset_name") {
            updated.dataset_name = as_string(value, name);
        } else if (name == "output_path_template") {
            updated.output_path_template = as_string(value, name);
        } else if (name == "frames_per_container") {
            updated.frames_per_container = as_unsigned(value, name, u64_max);
        } else if (name == "compression_filter_id") {
            if (value.is_null()) {
                updated.compression_filter_id.reset();
            } else {
                updated.compression_filter_id =
                  static_cast<uint32_t>(as_unsigned(value, name, u32_max));
            }
        } else if (name == "compression_options") {
            EXPECT_ARGUMENT(value.is_array(),
                            "Parameter '",
                            name,
                            "' must be an array, got ",
                            value.dump());

            std::vector<uint32_t> options;
            for (const auto& v : value) {
                options.push_back(
                  static_cast<uint32_t>(as_unsigned(v, name, u32_max)));
            }
            updated.compression_options = std::move(options);
        } else if (name == "group_attributes") {
            check_value_map(value, name, true);
            updated.group_attributes = value;
        } else if (name == "dataset_attributes") {
            check_value_map(value, name, true);
            updated.dataset_attributes = value;
        } else if (name == "extra_datasets") {
            check_value_map(value, name, false);
            updated.extra_datasets = value;
        } else {
            std::string known;
            for (const auto* p : known_parameters) {
                known += known.empty() ? p : std::string(", ") + p;
            }
            EXPECT_ARGUMENT(false,
                            "Unknown parameter '",
                            name,
                            "'. Known parameters: ",
                            known);
        }
    }

    settings = std::move(updated);
}

extern "C"
{
    /* Create and destroy */
    H5StreamSettings* H5StreamSettings_create()
    {
        try {
            return new H5StreamSettings();
        } catch (const std::bad_alloc&) {
            return nullptr;
        }
    }

    void H5StreamSettings_destroy(H5StreamSettings* settings)
    {
        delete settings;
    }

    H5StreamSettings* H5StreamSettings_copy(const H5StreamSettings* settings)
    {
        if (!settings) {
            LOG_ERROR("Null pointer: settings");
            return nullptr;
        }

        try {
            return new H5StreamSettings(*settings);
        } catch (const std::bad_alloc&) {
            LOG_ERROR("Failed to allocate memory for copy");
            return nullptr;
        }
    }

    /* Setters */
    H5StreamStatusCode H5StreamSettings_set_dataset_name(
      H5StreamSettings* settings,
      const char* dataset_name,
      size_t bytes_of_dataset_name)
    {
        EXPECT_VALID_ARGUMENT(settings, "Null pointer: settings");
        EXPECT_VALID_ARGUMENT(dataset_name, "Null pointer: dataset_name");

        bytes_of_dataset_name = strnlen(dataset_name, bytes_of_dataset_name);
        std::string name =
          h5stream::trim({ dataset_name, bytes_of_dataset_name });
        EXPECT_VALID_ARGUMENT(!name.empty(),
                              "Invalid dataset name. Must not be empty");

        settings->dataset_name = name;
        return H5StreamStatusCode_Success;
    }

    H5StreamStatusCode H5StreamSettings_set_output_path_template(
      H5StreamSettings* settings,
      const char* output_path_template,
      size_t bytes_of_output_path_template)
    {
        EXPECT_VALID_ARGUMENT(settings, "Null pointer: settings");
        EXPECT_VALID_ARGUMENT(output_path_template,
                              "Null pointer: output_path_template");

        bytes_of_output_path_template =
          strnlen(output_path_template, bytes_of_output_path_template);
        EXPECT_VALID_ARGUMENT(
          bytes_of_output_path_template > 0,
          "Invalid output path template. Must not be empty");

        settings->output_path_template.assign(output_path_template,
                                              bytes_of_output_path_template);
        return H5StreamStatusCode_Success;
    }

    H5StreamStatusCode H5StreamSettings_set_frames_per_container(
      H5StreamSettings* settings,
      uint64_t frames_per_container)
    {
        EXPECT_VALID_ARGUMENT(settings, "Null pointer: settings");

        settings->frames_per_container = frames_per_container;
        return H5StreamStatusCode_Success;
    }

    H5StreamStatusCode H5StreamSettings_set_compression(
      H5StreamSettings* settings,
      uint32_t filter_id,
      const uint32_t* options,
      size_t option_count)
    {
        EXPECT_VALID_ARGUMENT(settings, "Null pointer: settings");
        EXPECT_VALID_ARGUMENT(option_count == 0 || options,
                              "Null pointer: options");

        settings->compression_filter_id = filter_id;
        settings->compression_options.assign(options, options + option_count);
        return H5StreamStatusCode_Success;
    }

    H5StreamStatusCode H5StreamSettings_set_parameters(
      H5StreamSettings* settings,
      const char* parameters_json,
      size_t bytes_of_parameters_json)
    {
        EXPECT_VALID_ARGUMENT(settings, "Null pointer: settings");
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
            h5stream::apply_parameters(*settings, val);
        } catch (const std::invalid_argument& exc) {
            LOG_ERROR("Failed to set parameters: ", exc.what());
            return H5StreamStatusCode_InvalidArgument;
        }

        return H5StreamStatusCode_Success;
    }

    /* Getters */
    const char* H5StreamSettings_get_dataset_name(
      const H5StreamSettings* settings)
    {
        SETTINGS_GET_STRING(settings, dataset_name);
    }

    const char* H5StreamSettings_get_output_path_template(
      const H5StreamSettings* settings)
    {
        SETTINGS_GET_STRING(settings, output_path_template);
    }

    uint64_t H5StreamSettings_get_frames_per_container(
      const H5StreamSettings* settings)
    {
        if (!settings) {
            LOG_WARNING("Null pointer: settings. Returning 0.");
            return 0;
        }

        return settings->frames_per_container;
    }
}
