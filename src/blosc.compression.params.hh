#pragma once

#include "cf2zarr.types.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cf2zarr {
const char*
blosc_codec_to_string(Cf2ZarrCompressionCodec codec);

/**
 * @brief Map a Blosc codec name to its enum value.
 * @return The codec, or nullopt if @p name is not a Blosc codec.
 */
std::optional<Cf2ZarrCompressionCodec>
blosc_codec_from_string(std::string_view name);

struct BloscCompressionParams
{
    std::string codec_id{ "blosclz" };
    uint8_t clevel{ 9 };
    uint8_t shuffle{ 1 };

    BloscCompressionParams() = default;
    BloscCompressionParams(std::string_view codec_id,
                           uint8_t clevel,
                           uint8_t shuffle);

    /**
     * @brief Zarr v2 compressor metadata, e.g.
     * {"id": "blosc", "cname": "blosclz", "clevel": 9, "shuffle": 1,
     * "blocksize": 0}.
     */
    nlohmann::json to_json() const;

    /**
     * @brief Parse Zarr v2 compressor metadata.
     * @throw cf2zarr::StorageError if the compressor is not Blosc.
     */
    static BloscCompressionParams from_json(const nlohmann::json& meta);

    bool operator==(const BloscCompressionParams&) const = default;
};

/**
 * @brief Check that a set of compression parameters can be handed to Blosc.
 * @return True if valid, otherwise false. The first problem is logged.
 */
[[nodiscard]]
bool
validate_compression_params(const BloscCompressionParams& params);
} // namespace cf2zarr
