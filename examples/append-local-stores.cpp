/// @file append-local-stores.cpp
/// @brief Example of appending a directory of daily Zarr stores to a rolling
/// 30-day store with the C API.
/// @details Usage: append-local-stores-example <input dir> <existing store>
/// <output store>. Pass "none" as the existing store on the first day.

#include "cf2zarr.h"

#include <cstdio>
#include <stdexcept>

#define EXPECT(e, ...)                                                         \
    do {                                                                       \
        if (!(e)) {                                                            \
            char buf[1 << 8] = { 0 };                                          \
            snprintf(buf, sizeof(buf) - 1, __VA_ARGS__);                       \
            fprintf(stderr, "ERROR %s\n", buf);                                \
            throw std::runtime_error(buf);                                     \
        }                                                                      \
    } while (0)
#define OK(e)                                                                  \
    do {                                                                       \
        const Cf2ZarrStatusCode s_ = (e);                                      \
        EXPECT(s_ == Cf2ZarrStatusCode_Success,                                \
               "%s failed: %s",                                                \
               #e,                                                             \
               Cf2Zarr_get_status_message(s_));                                \
    } while (0)

int
main(int argc, char** argv)
{
    if (argc != 4) {
        fprintf(stderr,
                "Usage: %s <input dir> <existing store> <output store>\n",
                argv[0]);
        return 1;
    }

    try {
        OK(Cf2Zarr_set_log_level(Cf2ZarrLogLevel_Info));

        // one time step per chunk, full extent along latitude and longitude
        const uint32_t chunks[] = { 1, 720, 1440 };

        Cf2ZarrCompressionSettings compression{
            .codec = Cf2ZarrCompressionCodec_BloscZstd,
            .level = 5,
            .shuffle = 1,
        };

        Cf2ZarrAppendSettings settings{};
        settings.input = argv[1];
        settings.existing = argv[2];
        settings.output = argv[3];
        settings.pattern = "*.zarr";
        settings.ordering_dimension = "time";
        settings.max_duration = "P30D";
        settings.chunk_shape = chunks;
        settings.chunk_shape_count = sizeof(chunks) / sizeof(chunks[0]);
        settings.compression_settings = &compression;
        settings.create_mode = Cf2ZarrCreateMode_Exclusive;

        OK(Cf2Zarr_append(&settings));
    } catch (const std::exception& e) {
        fprintf(stderr, "Caught exception: %s\n", e.what());
        return 1;
    }

    return 0;
}
