#include "store.encoder.hh"
#include "macros.hh"

cf2zarr::EncodedDataset
cf2zarr::encode(Dataset dataset, const BloscCompressionParams& params)
{
    EXPECT_T(validate_compression_params(params),
             InvalidSettingsError,
             "Invalid compression parameters");

    for (auto& var : dataset.data_variables()) {
        var.compressor = params;
    }
    for (auto& coord : dataset.coordinates()) {
        coord.compressor = params;
    }

    LOG_DEBUG("Compressing with Blosc ",
              params.codec_id,
              " (level ",
              static_cast<int>(params.clevel),
              ", shuffle ",
              static_cast<int>(params.shuffle),
              ")");

    return { std::move(dataset), false };
}
