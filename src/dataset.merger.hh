#pragma once

#include "dataset.hh"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cf2zarr {
/**
 * @brief Choose the variables to carry when none are requested.
 * @details With an existing dataset, all of its data variables. Otherwise, or
 * when the existing dataset has no data variables, the first-declared data
 * variable of @p incoming.
 * @throw cf2zarr::SelectionError if nothing can be selected.
 */
std::vector<std::string>
default_variables(const Dataset& incoming,
                  const std::optional<Dataset>& existing);

/**
 * @brief Stable-sort a dataset by the coordinate of @p dimension.
 * @throw cf2zarr::NoOrderingCoordinateError if @p dimension has no integer
 * coordinate.
 */
Dataset
sort_by_ordering(const Dataset& dataset, std::string_view dimension);

/**
 * @brief Combine an existing dataset with a newly ingested one.
 * @details The requested variables (or default_variables() when @p variables
 * is empty) are selected from both datasets, concatenated existing first along
 * @p dimension, and stable-sorted by the ordering coordinate. The incoming
 * ordering coordinate is first converted to the units of the existing one.
 * Equal ordinals keep existing entries ahead of incoming ones. Neither input
 * is modified.
 * @throw cf2zarr::SelectionError if a requested variable is missing from
 * either dataset.
 * @throw cf2zarr::AxisMismatchError if the datasets disagree outside
 * @p dimension, or their ordering units cannot be reconciled.
 * @throw cf2zarr::NoOrderingCoordinateError if either dataset lacks an integer
 * coordinate for @p dimension.
 */
Dataset
merge(const std::optional<Dataset>& existing,
      const Dataset& incoming,
      const std::vector<std::string>& variables,
      std::string_view dimension);
} // namespace cf2zarr
