#pragma once

#include "dataset.hh"

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace cf2zarr {
/**
 * @brief Find the first position to keep so that the kept suffix spans at
 * most @p max_span ordinal ticks.
 * @details The result is the smallest index i with
 * ordinals.back() - ordinals[i] <= max_span. A non-positive span keeps only
 * the entries equal to the last ordinal, and never less than the last entry.
 * @param ordinals Ordinals in non-decreasing order.
 * @param max_span The longest span to keep, in ordinal ticks.
 * @return The first index to keep; 0 if nothing needs trimming or
 * @p ordinals is empty.
 */
size_t
trim_start_index(std::span<const int64_t> ordinals, int64_t max_span);

/**
 * @brief Drop the oldest entries along @p dimension so that the dataset spans
 * at most @p max_span ordinal ticks.
 * @details A no-op when @p max_span is empty. A non-empty dataset is never
 * emptied.
 * @param n_trimmed If non-null, receives the number of dropped entries.
 * @throw cf2zarr::NoOrderingCoordinateError if @p dimension has no integer
 * coordinate.
 */
Dataset
trim(const Dataset& dataset,
     std::string_view dimension,
     std::optional<int64_t> max_span,
     size_t* n_trimmed = nullptr);
} // namespace cf2zarr
