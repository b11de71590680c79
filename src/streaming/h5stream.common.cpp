#include "macros.hh"
#include "h5stream.common.hh"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {
constexpr std::string_view chunk_number_field = "{chunk_number";

// digits in the largest uint64_t
constexpr size_t max_zero_padding = 20;
} // namespace

std::string
h5stream::trim(std::string_view s)
{
    if (s.empty()) {
        return {};
    }

    // trim left
    std::string trimmed(s);
    trimmed.erase(trimmed.begin(),
                  std::find_if(trimmed.begin(), trimmed.end(), [](char c) {
                      return !std::isspace(c);
                  }));

    // trim right
    trimmed.erase(std::find_if(trimmed.rbegin(),
                               trimmed.rend(),
                               [](char c) { return !std::isspace(c); })
                    .base(),
                  trimmed.end());

    return trimmed;
}

bool
h5stream::is_empty_string(std::string_view s, std::string_view err_on_empty)
{
    auto trimmed = trim(s);
    if (trimmed.empty()) {
        LOG_ERROR(err_on_empty);
        return true;
    }
    return false;
}

size_t
h5stream::bytes_of_type(H5StreamDataType data_type)
{
    switch (data_type) {
        case H5StreamDataType_int8:
        case H5StreamDataType_uint8:
            return 1;
        case H5StreamDataType_int16:
        case H5StreamDataType_uint16:
            return 2;
        case H5StreamDataType_int32:
        case H5StreamDataType_uint32:
        case H5StreamDataType_float32:
            return 4;
        case H5StreamDataType_int64:
        case H5StreamDataType_uint64:
        case H5StreamDataType_float64:
            return 8;
        default:
            throw std::invalid_argument("Invalid data type: " +
                                        std::to_string(data_type));
    }
}

size_t
h5stream::bytes_of_frame(const FrameShape& shape, H5StreamDataType data_type)
{
    return bytes_of_type(data_type) * shape.rows * shape.cols;
}

const char*
h5stream::data_type_to_string(H5StreamDataType data_type) noexcept
{
    switch (data_type) {
        case H5StreamDataType_uint8:
            return "uint8";
        case H5StreamDataType_uint16:
            return "uint16";
        case H5StreamDataType_uint32:
            return "uint32";
        case H5StreamDataType_uint64:
            return "uint64";
        case H5StreamDataType_int8:
            return "int8";
        case H5StreamDataType_int16:
            return "int16";
        case H5StreamDataType_int32:
            return "int32";
        case H5StreamDataType_int64:
            return "int64";
        case H5StreamDataType_float32:
            return "float32";
        case H5StreamDataType_float64:
            return "float64";
        default:
            return "(unknown)";
    }
}

std::string
h5stream::format_output_path(std::string_view path_template,
                             uint64_t chunk_number)
{
    std::string path;
    size_t pos = 0;

    while (pos < path_template.size()) {
        const auto field_start = path_template.find(chunk_number_field, pos);
        if (field_start == std::string_view::npos) {
            path.append(path_template.substr(pos));
            break;
        }

        path.append(path_template.substr(pos, field_start - pos));

        const auto field_end = path_template.find('}', field_start);
        EXPECT_ARGUMENT(field_end != std::string_view::npos,
                        "Unterminated field in output path template: ",
                        path_template);

        const auto spec = path_template.substr(
          field_start + chunk_number_field.size(),
          field_end - field_start - chunk_number_field.size());

        std::string number = std::to_string(chunk_number);
        if (!spec.empty()) {
            // only ":0Nd" is supported
            EXPECT_ARGUMENT(spec.size() >= 4 && spec.front() == ':' &&
                              spec[1] == '0' && spec.back() == 'd',
                            "Invalid format specifier '",
                            spec,
                            "' in output path template: ",
                            path_template);

            const auto digits = spec.substr(2, spec.size() - 3);
            EXPECT_ARGUMENT(
              std::all_of(digits.begin(),
                          digits.end(),
                          [](char c) { return std::isdigit(c) != 0; }),
              "Invalid width '",
              digits,
              "' in output path template: ",
              path_template);

            const auto significant = digits.substr(
              std::min(digits.find_first_not_of('0'), digits.size()));
            EXPECT_ARGUMENT(significant.size() <= 2,
                            "Width '",
                            digits,
                            "' exceeds ",
                            max_zero_padding,
                            " in output path template: ",
                            path_template);

            const size_t width =
              significant.empty() ? 0 : std::stoul(std::string(significant));
            EXPECT_ARGUMENT(width <= max_zero_padding,
                            "Width ",
                            width,
                            " exceeds ",
                            max_zero_padding,
                            " in output path template: ",
                            path_template);

            if (number.size() < width) {
                number.insert(0, width - number.size(), '0');
            }
        }

        path.append(number);
        pos = field_end + 1;
    }

    return path;
}

std::pair<std::string, std::string>
h5stream::split_attribute_key(std::string_view key)
{
    const auto pos = key.rfind(':');
    EXPECT_ARGUMENT(pos != std::string_view::npos,
                    "Attribute key '",
                    key,
                    "' must have the form '<path>:<name>'");

    std::string path(key.substr(0, pos));
    std::string name(key.substr(pos + 1));
    EXPECT_ARGUMENT(!path.empty() && !name.empty(),
                    "Attribute key '",
                    key,
                    "' must have a nonempty path and name");

    return { path, name };
}
