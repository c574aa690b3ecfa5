#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace cf2zarr {
using Duration = std::chrono::nanoseconds;

/**
 * @brief Parse a duration string.
 * @details Accepts ISO 8601 durations ("P2D", "PT36H", "P1DT12H30M", "P1W",
 * "PT0.5S") and pandas-style durations ("2D", "2 days", "36h", "90min",
 * "1d 12h", "1 days 02:00:00", "-1h").
 * @param text The duration to parse.
 * @return The duration in nanoseconds.
 * @throw cf2zarr::InvalidSettingsError if @p text is not a duration.
 */
Duration
parse_duration(std::string_view text);

/**
 * @brief Format a duration as "N days HH:MM:SS[.fffffffff]".
 */
std::string
format_duration(Duration duration);

/**
 * @brief Get the length of one step of a CF time unit string.
 * @param units A CF units attribute, e.g. "days since 1970-01-01".
 * @return The length of one step, or nullopt if @p units is not a CF time
 * unit.
 */
std::optional<Duration>
cf_time_unit(std::string_view units);

/// A CF time units attribute, "<unit> since <epoch>".
struct CfTimeUnits
{
    Duration tick;
    std::chrono::sys_days epoch_day;
    Duration epoch_time; // time of day of the epoch, in UTC
};

/**
 * @brief Parse the unit and epoch of a CF time units attribute.
 * @details The epoch is "Y-M-D", optionally followed by a time of day
 * "H:M[:S[.f]]" separated by a space or 'T', and a zone ("Z", "UTC",
 * "+HH:MM", "-HHMM").
 * @return The parsed units, or nullopt if @p units has no epoch or does not
 * parse.
 */
std::optional<CfTimeUnits>
parse_cf_time_units(std::string_view units);

/**
 * @brief The duration from ordinal @p first to ordinal @p last, with steps
 * of length @p tick, saturated to the Duration range.
 * @throw std::runtime_error if @p last is before @p first.
 */
Duration
elapsed(int64_t first, int64_t last, Duration tick);

/**
 * @brief Convert a duration to a whole number of steps of length @p tick,
 * rounding towards negative infinity.
 */
int64_t
to_ticks(Duration duration, Duration tick);
} // namespace cf2zarr
