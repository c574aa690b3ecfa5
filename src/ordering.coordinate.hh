#pragma once

#include "dataset.hh"
#include "duration.hh"

#include <cstdint>
#include <string_view>
#include <vector>

namespace cf2zarr {
/**
 * @brief Find the coordinate labelling @p dimension.
 * @details The coordinate must be one-dimensional over @p dimension and hold
 * integer ordinals.
 * @throw cf2zarr::NoOrderingCoordinateError if there is no such coordinate,
 * more than one candidate, or the candidate is not of an integer type.
 */
const Variable&
find_ordering_coordinate(const Dataset& dataset, std::string_view dimension);

/**
 * @brief Read the values of an integer coordinate as signed 64-bit ordinals.
 * @throw cf2zarr::NoOrderingCoordinateError if @p coordinate is not 1-D, not
 * of an integer type, or holds an unsigned value above INT64_MAX.
 */
std::vector<int64_t>
ordinals(const Variable& coordinate);

/**
 * @brief The length of one ordinal step, taken from the coordinate's CF
 * "units" attribute.
 * @details A coordinate without units counts nanoseconds.
 * @throw cf2zarr::InvalidSettingsError if the units attribute is present but
 * is not a time unit.
 */
Duration
ordinal_tick(const Variable& coordinate);

/**
 * @brief Express the ordering coordinate of @p dataset in the units and data
 * type of @p reference.
 * @details Values are converted through the CF "<unit> since <epoch>" units
 * of both coordinates, and the result carries the units of @p reference. A
 * dataset whose coordinate already has the same units and data type is
 * returned unchanged.
 * @throw cf2zarr::AxisMismatchError if only one coordinate has units, the
 * units or calendars cannot be reconciled, or a value is not a whole number
 * of reference steps or does not fit the reference data type.
 */
Dataset
rebase_ordering(const Dataset& dataset,
                std::string_view dimension,
                const Variable& reference);
} // namespace cf2zarr
