#pragma once

#include "blosc.compression.params.hh"
#include "dataset.hh"

namespace cf2zarr {
/// A dataset ready for the store writer.
struct EncodedDataset
{
    Dataset dataset;

    /// When false, chunks holding nothing but fill values are not written.
    bool write_empty_chunks{ false };
};

/**
 * @brief Bind @p params as the compressor of every data variable and
 * coordinate.
 * @throw cf2zarr::InvalidSettingsError if @p params cannot be handed to Blosc.
 */
EncodedDataset
encode(Dataset dataset, const BloscCompressionParams& params);
} // namespace cf2zarr
