#pragma once

#include "dataset.hh"

#include <filesystem>
#include <optional>
#include <string_view>

namespace cf2zarr {
/**
 * @brief Load a Zarr v2 group into memory.
 * @details Arrays named after their only dimension, and arrays listed in a
 * "coordinates" attribute, are loaded as coordinates; every other array is a
 * data variable. Variables are declared in name order. Missing chunks are
 * filled with the array's fill value.
 * @return The dataset, or nullopt if nothing exists at @p path.
 * @throw cf2zarr::StorageError if @p path exists but is not a readable
 * Zarr v2 group.
 * @throw cf2zarr::CompressionError if a chunk fails to decompress.
 */
std::optional<Dataset>
open_store(const std::filesystem::path& path);

/**
 * @brief Load every store in @p directory whose name matches @p pattern,
 * concatenate them along @p dimension and sort by its coordinate.
 * @details Stores are combined in path order, each converted to the ordering
 * units of the first.
 * @throw cf2zarr::NoMatchError if nothing matches.
 * @throw cf2zarr::AxisMismatchError if the stores cannot be combined.
 */
Dataset
open_multi_store(const std::filesystem::path& directory,
                 std::string_view pattern,
                 std::string_view dimension);
} // namespace cf2zarr
