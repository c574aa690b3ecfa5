#include "blosc.compression.params.hh"
#include "macros.hh"

#include <blosc.h>

const char*
cf2zarr::blosc_codec_to_string(Cf2ZarrCompressionCodec codec)
{
    switch (codec) {
        case Cf2ZarrCompressionCodec_BloscLZ:
            return BLOSC_BLOSCLZ_COMPNAME;
        case Cf2ZarrCompressionCodec_BloscLZ4:
            return BLOSC_LZ4_COMPNAME;
        case Cf2ZarrCompressionCodec_BloscLZ4HC:
            return BLOSC_LZ4HC_COMPNAME;
        case Cf2ZarrCompressionCodec_BloscZlib:
            return BLOSC_ZLIB_COMPNAME;
        case Cf2ZarrCompressionCodec_BloscZstd:
            return BLOSC_ZSTD_COMPNAME;
        default:
            return "unrecognized codec";
    }
}

std::optional<Cf2ZarrCompressionCodec>
cf2zarr::blosc_codec_from_string(std::string_view name)
{
    for (int i = 0; i < Cf2ZarrCompressionCodecCount; ++i) {
        const auto codec = static_cast<Cf2ZarrCompressionCodec>(i);
        if (name == blosc_codec_to_string(codec)) {
            return codec;
        }
    }

    return std::nullopt;
}

cf2zarr::BloscCompressionParams::BloscCompressionParams(
  std::string_view codec_id,
  uint8_t clevel,
  uint8_t shuffle)
  : codec_id{ codec_id }
  , clevel{ clevel }
  , shuffle{ shuffle }
{
}

nlohmann::json
cf2zarr::BloscCompressionParams::to_json() const
{
    return nlohmann::json{ { "id", "blosc" },
                           { "cname", codec_id },
                           { "clevel", clevel },
                           { "shuffle", shuffle },
                           { "blocksize", 0 } };
}

cf2zarr::BloscCompressionParams
cf2zarr::BloscCompressionParams::from_json(const nlohmann::json& meta)
{
    EXPECT_T(meta.is_object() && meta.value("id", "") == "blosc",
             StorageError,
             "Unsupported compressor: ",
             meta.dump());

    return { meta.at("cname").get<std::string>(),
             static_cast<uint8_t>(meta.value("clevel", 5)),
             static_cast<uint8_t>(meta.value("shuffle", BLOSC_SHUFFLE)) };
}

bool
cf2zarr::validate_compression_params(const BloscCompressionParams& params)
{
    if (!blosc_codec_from_string(params.codec_id)) {
        LOG_ERROR("Invalid compression codec: ", params.codec_id);
        return false;
    }

    if (params.clevel > 9) {
        LOG_ERROR("Invalid compression level: ",
                  static_cast<int>(params.clevel),
                  ". Must be between 0 and 9");
        return false;
    }

    if (params.shuffle != BLOSC_NOSHUFFLE && params.shuffle != BLOSC_SHUFFLE &&
        params.shuffle != BLOSC_BITSHUFFLE) {
        LOG_ERROR("Invalid shuffle: ",
                  static_cast<int>(params.shuffle),
                  ". Must be ",
                  BLOSC_NOSHUFFLE,
                  " (no shuffle), ",
                  BLOSC_SHUFFLE,
                  " (byte shuffle), or ",
                  BLOSC_BITSHUFFLE,
                  " (bit shuffle)");
        return false;
    }

    return true;
}
