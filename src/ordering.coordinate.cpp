#include "ordering.coordinate.hh"
#include "macros.hh"
#include "zarr.common.hh"

#include <cstring>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>

namespace {
template<typename T>
std::vector<int64_t>
widen(const cf2zarr::Variable& coordinate)
{
    const size_t n = coordinate.number_of_elements();
    std::vector<int64_t> out(n);

    for (size_t i = 0; i < n; ++i) {
        T value;
        std::memcpy(&value, coordinate.data.data() + i * sizeof(T), sizeof(T));

        if constexpr (std::is_same_v<T, uint64_t>) {
            EXPECT_T(value <= static_cast<uint64_t>(
                                std::numeric_limits<int64_t>::max()),
                     cf2zarr::NoOrderingCoordinateError,
                     "Coordinate '",
                     coordinate.name,
                     "' holds ",
                     value,
                     ", which does not fit a signed 64-bit ordinal");
        }

        out[i] = static_cast<int64_t>(value);
    }

    return out;
}
template<typename T>
std::vector<uint8_t>
narrow(const std::vector<int64_t>& values, const std::string& name)
{
    std::vector<uint8_t> out(values.size() * sizeof(T));

    for (size_t i = 0; i < values.size(); ++i) {
        const auto v = values[i];
        bool fits;
        if constexpr (std::is_unsigned_v<T>) {
            fits = v >= 0 && static_cast<uint64_t>(v) <=
                               std::numeric_limits<T>::max();
        } else {
            fits = v >= std::numeric_limits<T>::min() &&
                   v <= std::numeric_limits<T>::max();
        }
        EXPECT_T(fits,
                 cf2zarr::AxisMismatchError,
                 "Coordinate '",
                 name,
                 "' value ",
                 v,
                 " does not fit the data type of the existing coordinate");

        const auto value = static_cast<T>(v);
        std::memcpy(out.data() + i * sizeof(T), &value, sizeof(T));
    }

    return out;
}

std::vector<uint8_t>
to_dtype(const std::vector<int64_t>& values,
         Cf2ZarrDataType dtype,
         const std::string& name)
{
    switch (dtype) {
        case Cf2ZarrDataType_uint8:
            return narrow<uint8_t>(values, name);
        case Cf2ZarrDataType_uint16:
            return narrow<uint16_t>(values, name);
        case Cf2ZarrDataType_uint32:
            return narrow<uint32_t>(values, name);
        case Cf2ZarrDataType_uint64:
            return narrow<uint64_t>(values, name);
        case Cf2ZarrDataType_int8:
            return narrow<int8_t>(values, name);
        case Cf2ZarrDataType_int16:
            return narrow<int16_t>(values, name);
        case Cf2ZarrDataType_int32:
            return narrow<int32_t>(values, name);
        case Cf2ZarrDataType_int64:
            return narrow<int64_t>(values, name);
        default:
            break;
    }

    const std::string err =
      LOG_ERROR("Coordinate '", name, "' is not of an integer type");
    throw cf2zarr::AxisMismatchError(err);
}

std::optional<std::string>
string_attribute(const cf2zarr::Variable& variable, const char* key)
{
    const auto& attrs = variable.attributes;
    if (!attrs.is_object() || !attrs.contains(key) || !attrs[key].is_string()) {
        return std::nullopt;
    }
    return attrs[key].get<std::string>();
}

// calendars in which a day is always 86400 seconds from any epoch
bool
is_standard_calendar(const std::optional<std::string>& calendar)
{
    if (!calendar.has_value()) {
        return true;
    }

    const auto c = cf2zarr::trim(*calendar);
    return c == "standard" || c == "gregorian" || c == "proleptic_gregorian";
}
} // namespace

const cf2zarr::Variable&
cf2zarr::find_ordering_coordinate(const Dataset& dataset,
                                  std::string_view dimension)
{
    const Variable* found = nullptr;
    size_t candidates = 0;

    for (const auto& coord : dataset.coordinates()) {
        if (coord.ndims() == 1 && coord.dimensions[0] == dimension) {
            found = &coord;
            ++candidates;
        }
    }

    EXPECT_T(candidates > 0,
             NoOrderingCoordinateError,
             "No coordinate found for ordering dimension '",
             dimension,
             "'");
    EXPECT_T(candidates == 1,
             NoOrderingCoordinateError,
             "Found ",
             candidates,
             " coordinates for ordering dimension '",
             dimension,
             "'; expected exactly one");
    EXPECT_T(is_integer_type(found->dtype),
             NoOrderingCoordinateError,
             "Coordinate '",
             found->name,
             "' of ordering dimension '",
             dimension,
             "' is not of an integer type");

    return *found;
}

std::vector<int64_t>
cf2zarr::ordinals(const Variable& coordinate)
{
    EXPECT_T(coordinate.ndims() == 1,
             NoOrderingCoordinateError,
             "Coordinate '",
             coordinate.name,
             "' is not one-dimensional");

    switch (coordinate.dtype) {
        case Cf2ZarrDataType_uint8:
            return widen<uint8_t>(coordinate);
        case Cf2ZarrDataType_uint16:
            return widen<uint16_t>(coordinate);
        case Cf2ZarrDataType_uint32:
            return widen<uint32_t>(coordinate);
        case Cf2ZarrDataType_uint64:
            return widen<uint64_t>(coordinate);
        case Cf2ZarrDataType_int8:
            return widen<int8_t>(coordinate);
        case Cf2ZarrDataType_int16:
            return widen<int16_t>(coordinate);
        case Cf2ZarrDataType_int32:
            return widen<int32_t>(coordinate);
        case Cf2ZarrDataType_int64:
            return widen<int64_t>(coordinate);
        default:
            break;
    }

    const std::string err = LOG_ERROR(
      "Coordinate '", coordinate.name, "' is not of an integer type");
    throw NoOrderingCoordinateError(err);
}

cf2zarr::Duration
cf2zarr::ordinal_tick(const Variable& coordinate)
{
    const auto& attrs = coordinate.attributes;
    if (!attrs.is_object() || !attrs.contains("units") ||
        !attrs["units"].is_string()) {
        return Duration(1);
    }

    const auto units = attrs["units"].get<std::string>();
    const auto tick = cf_time_unit(units);
    EXPECT_T(tick.has_value(),
             InvalidSettingsError,
             "Coordinate '",
             coordinate.name,
             "' has units '",
             units,
             "', which is not a time unit");

    return *tick;
}

cf2zarr::Dataset
cf2zarr::rebase_ordering(const Dataset& dataset,
                         std::string_view dimension,
                         const Variable& reference)
{
    const auto& coord = find_ordering_coordinate(dataset, dimension);

    const auto from_units = string_attribute(coord, "units");
    const auto to_units = string_attribute(reference, "units");
    const bool same_units = from_units == to_units;

    if (same_units && coord.dtype == reference.dtype) {
        return dataset;
    }

    EXPECT_T(from_units.has_value() == to_units.has_value(),
             AxisMismatchError,
             "Coordinate '",
             coord.name,
             "' has units '",
             from_units.value_or(to_units.value_or("")),
             "' in only one dataset");

    auto values = ordinals(coord);

    if (!same_units) {
        EXPECT_T(is_standard_calendar(string_attribute(coord, "calendar")) &&
                   is_standard_calendar(string_attribute(reference, "calendar")),
                 AxisMismatchError,
                 "Cannot convert coordinate '",
                 coord.name,
                 "' between units in a non-standard calendar");

        const auto from = parse_cf_time_units(*from_units);
        const auto to = parse_cf_time_units(*to_units);
        EXPECT_T(from.has_value() && to.has_value(),
                 AxisMismatchError,
                 "Cannot convert coordinate '",
                 coord.name,
                 "' from '",
                 *from_units,
                 "' to '",
                 *to_units,
                 "'");

        // nanoseconds from the reference epoch to this coordinate's epoch
        constexpr int64_t ns_per_day = 86'400'000'000'000;
        const auto days = (from->epoch_day - to->epoch_day).count();
        auto offset = checked_mul(days, ns_per_day);
        if (offset.has_value()) {
            offset =
              checked_add(*offset, (from->epoch_time - to->epoch_time).count());
        }
        EXPECT_T(offset.has_value(),
                 AxisMismatchError,
                 "Epochs of '",
                 *from_units,
                 "' and '",
                 *to_units,
                 "' are too far apart");

        const auto to_tick = to->tick.count();
        for (auto& v : values) {
            auto ns = checked_mul(v, from->tick.count());
            if (ns.has_value()) {
                ns = checked_add(*ns, *offset);
            }
            EXPECT_T(ns.has_value(),
                     AxisMismatchError,
                     "Coordinate '",
                     coord.name,
                     "' value ",
                     v,
                     " in '",
                     *from_units,
                     "' is out of range");
            EXPECT_T(*ns % to_tick == 0,
                     AxisMismatchError,
                     "Coordinate '",
                     coord.name,
                     "' value ",
                     v,
                     " in '",
                     *from_units,
                     "' is not a whole number of steps in '",
                     *to_units,
                     "'");
            v = *ns / to_tick;
        }

        LOG_DEBUG("Converted coordinate '",
                  coord.name,
                  "' from '",
                  *from_units,
                  "' to '",
                  *to_units,
                  "'");
    }

    Dataset out = dataset;
    for (auto& c : out.coordinates()) {
        if (c.name != coord.name) {
            continue;
        }

        c.data = to_dtype(values, reference.dtype, c.name);
        c.dtype = reference.dtype;
        if (to_units.has_value()) {
            c.attributes["units"] = *to_units;
        }
        break;
    }

    return out;
}
