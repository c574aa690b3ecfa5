#include "sink.hh"
#include "macros.hh"

bool
cf2zarr::finalize_sink(std::unique_ptr<cf2zarr::Sink>&& sink)
{
    if (sink == nullptr) {
        LOG_DEBUG("Sink is null. Nothing to finalize.");
        return true;
    }

    if (!sink->flush_()) {
        return false;
    }

    sink.reset();
    return true;
}
