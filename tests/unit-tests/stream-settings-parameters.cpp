#include "stream.settings.hh"
#include "unit.test.macros.hh"

#include <nlohmann/json.hpp>

namespace {
void
defaults_serialize_every_field()
{
    h5stream::StreamSettings settings;
    const auto j = h5stream::settings_to_json(settings);

    EXPECT_EQ(size_t, j.size(), 8);
    EXPECT_STR_EQ(j["dataset_name"].get<std::string>(), "");
    EXPECT_STR_EQ(j["output_path_template"].get<std::string>(), "");
    EXPECT_EQ(uint64_t, j["frames_per_container"].get<uint64_t>(), 0);
    CHECK(j["compression_filter_id"].is_null());
    CHECK(j["compression_options"].is_array());
    CHECK(j["compression_options"].empty());
    CHECK(j["group_attributes"].is_object());
    CHECK(j["dataset_attributes"].is_object());
    CHECK(j["extra_datasets"].is_object());
}

void
round_trip()
{
    const auto params = nlohmann::json::parse(R"({
        "dataset_name": "entry/data/data",
        "output_path_template": "/tmp/run_{chunk_number:04d}.h5",
        "frames_per_container": 1000,
        "compression_filter_id": 32001,
        "compression_options": [2, 2, 2, 8192, 5, 1, 1],
        "group_attributes": {"entry:NX_class": "NXentry", "/:version": 3},
        "dataset_attributes": {"entry/data/data:scale": [1.5, 2.5]},
        "extra_datasets": {"entry/instrument/detector/count_time": 0.001}
    })");

    h5stream::StreamSettings settings;
    h5stream::apply_parameters(settings, params);

    EXPECT_STR_EQ(settings.dataset_name, "entry/data/data");
    EXPECT_EQ(uint64_t, settings.frames_per_container, 1000);
    CHECK(settings.compression_filter_id.has_value());
    EXPECT_EQ(uint32_t, *settings.compression_filter_id, 32001);
    EXPECT_EQ(size_t, settings.compression_options.size(), 7);
    EXPECT_EQ(uint32_t, settings.compression_options[3], 8192);

    CHECK(h5stream::settings_to_json(settings) == params);

    // partial update keeps the other fields; null unsets the filter
    h5stream::apply_parameters(
      settings,
      nlohmann::json::parse(
        R"({"frames_per_container": 0, "compression_filter_id": null})"));
    EXPECT_EQ(uint64_t, settings.frames_per_container, 0);
    CHECK(!settings.compression_filter_id.has_value());
    EXPECT_STR_EQ(settings.dataset_name, "entry/data/data");
}

void
rejected_updates_change_nothing()
{
    h5stream::StreamSettings settings;
    settings.dataset_name = "data";
    settings.frames_per_container = 10;
    const auto before = h5stream::settings_to_json(settings);

    const char* bad_updates[] = {
        // unknown name, after a valid one
        R"({"dataset_name": "other", "no_such_parameter": 1})",
        // ill-typed values
        R"({"dataset_name": 5})",
        R"({"frames_per_container": -1})",
        R"({"frames_per_container": "10"})",
        R"({"frames_per_container": 1.5})",
        R"({"compression_filter_id": 4294967296})",
        R"({"compression_options": [1, "two"]})",
        R"({"compression_options": 3})",
        R"({"group_attributes": []})",
        // attribute keys need a path and a name
        R"({"group_attributes": {"no_colon": 1}})",
        R"({"dataset_attributes": {"data:": 1}})",
        R"({"dataset_attributes": {":units": "counts"}})",
        // values must be storable
        R"({"dataset_attributes": {"data:nested": {"a": 1}}})",
        R"({"extra_datasets": {"x": null}})",
        R"({"extra_datasets": {"x": [1, "a"]}})",
        R"({"extra_datasets": {"x": []}})",
        R"({"extra_datasets": {" ": 1}})",
        // not an object
        R"([1, 2, 3])",
    };

    for (const auto* update : bad_updates) {
        EXPECT_THROW(
          std::invalid_argument,
          h5stream::apply_parameters(settings, nlohmann::json::parse(update)));
        CHECK(h5stream::settings_to_json(settings) == before);
    }
}

void
storable_values()
{
    CHECK(h5stream::is_storable_value(true));
    CHECK(h5stream::is_storable_value(-3));
    CHECK(h5stream::is_storable_value(2.5));
    CHECK(h5stream::is_storable_value("text"));
    CHECK(h5stream::is_storable_value(nlohmann::json::parse("[1, 2.5, -3]")));
    CHECK(h5stream::is_storable_value(nlohmann::json::parse(R"(["a", "b"])")));

    CHECK(!h5stream::is_storable_value(nullptr));
    CHECK(!h5stream::is_storable_value(nlohmann::json::object()));
    CHECK(!h5stream::is_storable_value(nlohmann::json::array()));
    CHECK(!h5stream::is_storable_value(nlohmann::json::parse("[[1], [2]]")));
    CHECK(!h5stream::is_storable_value(nlohmann::json::parse("[true, false]")));
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        defaults_serialize_every_field();
        round_trip();
        rejected_updates_change_nothing();
        storable_values();
        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
