#include "capacity.manager.hh"
#include "fake.backend.hh"
#include "unit.test.macros.hh"

namespace {
h5stream::ContainerSpec
make_spec()
{
    return {
        .path = "unused.h5",
        .dataset_name = "data",
        .frame_shape = { 4, 4 },
        .dtype = H5StreamDataType_uint16,
    };
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        // nothing written: nothing to shrink
        {
            FakeBackend backend(1000);
            auto container = backend.create_container(make_spec());
            h5stream::CapacityManager capacity(*container);

            capacity.shrink_to_fit();
            CHECK(backend.containers[0]->resizes.empty());
            EXPECT_EQ(uint64_t, capacity.capacity(), 1000);
        }

        // sparse writes shrink to the highest slot + 1
        {
            FakeBackend backend(1000);
            auto container = backend.create_container(make_spec());
            h5stream::CapacityManager capacity(*container);

            for (uint64_t slot : { 0, 5, 3, 9 }) {
                capacity.ensure_capacity(slot);
                capacity.record_write(slot);
            }

            capacity.shrink_to_fit();
            EXPECT_EQ(uint64_t, capacity.capacity(), 10);
            EXPECT_EQ(uint64_t, backend.containers[0]->capacity, 10);
        }

        // after growth
        {
            FakeBackend backend(2);
            auto container = backend.create_container(make_spec());
            h5stream::CapacityManager capacity(*container);

            for (uint64_t slot = 0; slot < 5; ++slot) {
                capacity.ensure_capacity(slot);
                capacity.record_write(slot);
            }
            EXPECT_EQ(uint64_t, capacity.capacity(), 8);

            capacity.shrink_to_fit();
            EXPECT_EQ(uint64_t, capacity.capacity(), 5);

            const auto& resizes = backend.containers[0]->resizes;
            EXPECT_EQ(size_t, resizes.size(), 3); // 4, 8, then 5
            EXPECT_EQ(uint64_t, resizes.back(), 5);
        }

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
