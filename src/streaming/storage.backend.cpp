#include "storage.backend.hh"
#include "macros.hh"

void
h5stream::finalize_container(std::unique_ptr<Container>&& container)
{
    if (container == nullptr) {
        LOG_INFO("Container is null. Nothing to finalize.");
        return;
    }

    // take ownership so the container is released on every path
    auto owned = std::move(container);
    owned->close_();
}
