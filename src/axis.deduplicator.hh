#pragma once

#include "dataset.hh"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace cf2zarr {
/**
 * @brief Find the positions to drop so that a sorted sequence of ordinals
 * becomes strictly increasing.
 * @details For each run of equal consecutive ordinals, every position but the
 * first is reported.
 * @param ordinals Ordinals in non-decreasing order.
 * @return Positions to drop, ascending.
 */
std::vector<size_t>
find_duplicate_indices(std::span<const int64_t> ordinals);

/**
 * @brief Drop repeated entries along @p dimension, keeping the first of each
 * run of equal ordinals.
 * @details Logs a warning naming the dropped positions when there are any.
 * @param dataset A dataset sorted along @p dimension.
 * @param dimension The ordering dimension.
 * @param dropped If non-null, receives the dropped positions.
 * @throw cf2zarr::NoOrderingCoordinateError if @p dimension has no integer
 * coordinate.
 */
Dataset
deduplicate(const Dataset& dataset,
            std::string_view dimension,
            std::vector<size_t>* dropped = nullptr);
} // namespace cf2zarr
