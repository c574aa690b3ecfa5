#pragma once

#include "dataset.hh"

#include <cstdint>
#include <string_view>
#include <vector>

namespace cf2zarr {
/// Chunk sizes: the ordering dimension first, then the trailing dimensions.
using ChunkShape = std::vector<uint32_t>;

inline const ChunkShape default_chunk_shape{ 5, 50, 50 };

/**
 * @brief Resolve the chunk sizes of one variable.
 * @details The first entry of @p shape applies to @p dimension and is used as
 * given. The remaining entries are right-aligned to the trailing dimensions
 * other than @p dimension and clipped to their lengths, with a minimum of 1.
 * Dimensions not covered get a single chunk spanning their full length.
 */
std::vector<uint32_t>
plan_variable(const Variable& variable,
              std::string_view dimension,
              const ChunkShape& shape);

/**
 * @brief Assign chunk sizes to every data variable and coordinate.
 * @details Metadata only; values are untouched.
 * @throw cf2zarr::InvalidSettingsError if @p shape is empty or holds a zero.
 */
Dataset
plan(Dataset dataset, std::string_view dimension, const ChunkShape& shape);
} // namespace cf2zarr
