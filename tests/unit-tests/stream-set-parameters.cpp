#include "h5stream.hh"
#include "fake.backend.hh"
#include "unit.test.macros.hh"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

int
main()
{
    int retval = 1;

    try {
        H5StreamSettings_s settings;
        settings.dataset_name = "data";
        settings.output_path_template =
          (fs::temp_directory_path() / (TEST "_{chunk_number}.h5")).string();
        settings.frames_per_container = 2;

        auto backend = std::make_unique<FakeBackend>();
        auto* fake = backend.get();
        H5Stream_s stream(
          settings, std::move(backend), std::make_unique<RecordingEventSink>());

        auto params = stream.get_parameters();
        EXPECT_STR_EQ(params["dataset_name"].get<std::string>(), "data");
        EXPECT_EQ(uint64_t, params["frames_per_container"].get<uint64_t>(), 2);

        // rejected updates leave the parameters untouched
        EXPECT_THROW(std::invalid_argument,
                     stream.set_parameters(nlohmann::json::parse(
                       R"({"dataset_name": "other", "bogus": true})")));
        CHECK(stream.get_parameters() == params);

        stream.start();

        std::vector<std::byte> payload(4, std::byte{ 5 });
        const auto frame = [&payload](int64_t index) {
            return h5stream::Frame{ .frame_index = index,
                                    .shape = { 2, 2 },
                                    .dtype = H5StreamDataType_uint8,
                                    .data = payload };
        };

        stream.append(frame(0));

        // applies from the next container on; chunk geometry waits for the
        // next start
        stream.set_parameters(nlohmann::json::parse(R"({
            "dataset_attributes": {"data:units": "counts"},
            "frames_per_container": 3
        })"));
        EXPECT_EQ(uint64_t,
                  stream.get_parameters()["frames_per_container"].get<uint64_t>(),
                  3);

        stream.append(frame(1));
        stream.append(frame(2));
        stream.stop();

        EXPECT_EQ(size_t, fake->containers.size(), 2);
        const auto& first = *fake->containers[0];
        const auto& second = *fake->containers[1];

        CHECK(!first.attributes.contains("data:units"));
        EXPECT_EQ(uint64_t, first.attributes.at("data:image_nr_high"), 2);

        EXPECT_STR_EQ(second.attributes.at("data:units").get<std::string>(),
                      "counts");
        EXPECT_EQ(uint64_t, second.attributes.at("data:image_nr_low"), 3);
        EXPECT_EQ(uint64_t, second.attributes.at("data:image_nr_high"), 3);

        // hooks can only be added while idle
        class NoopHook : public h5stream::FrameHook
        {
          public:
            void on_frame_written(const h5stream::FrameWriter&,
                                  const h5stream::Frame&) override
            {
            }
        };
        stream.start();
        EXPECT_THROW(std::runtime_error,
                     stream.add_hook(std::make_shared<NoopHook>()));
        stream.stop();
        stream.add_hook(std::make_shared<NoopHook>());

        // the new geometry is in effect after a restart
        stream.start();
        stream.append(frame(3));
        stream.stop();

        EXPECT_EQ(size_t, fake->containers.size(), 3);
        EXPECT_STR_EQ(fake->containers[2]->spec.path,
                      (fs::temp_directory_path() / (TEST "_2.h5")).string());
        EXPECT_EQ(uint64_t,
                  fake->containers[2]->attributes.at("data:image_nr_low"),
                  4);

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
