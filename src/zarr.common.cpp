#include "macros.hh"
#include "zarr.common.hh"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace {
template<typename T>
void
store_element(std::vector<uint8_t>& out, T value)
{
    out.resize(sizeof(T));
    std::memcpy(out.data(), &value, sizeof(T));
}

double
float_fill_value(const nlohmann::json& fill_value)
{
    if (fill_value.is_string()) {
        const auto s = fill_value.get<std::string>();
        if (s == "NaN") {
            return std::numeric_limits<double>::quiet_NaN();
        }
        if (s == "Infinity") {
            return std::numeric_limits<double>::infinity();
        }
        if (s == "-Infinity") {
            return -std::numeric_limits<double>::infinity();
        }
        throw cf2zarr::StorageError("Invalid floating point fill value: " + s);
    }

    if (!fill_value.is_number()) {
        throw cf2zarr::StorageError("Invalid fill value: " + fill_value.dump());
    }
    return fill_value.get<double>();
}

template<typename T>
bool
all_equal_to(const uint8_t* data, size_t nbytes, T fill)
{
    const size_t n = nbytes / sizeof(T);
    for (size_t i = 0; i < n; ++i) {
        T value;
        std::memcpy(&value, data + i * sizeof(T), sizeof(T));
        if constexpr (std::is_floating_point_v<T>) {
            if (std::isnan(fill)) {
                if (!std::isnan(value)) {
                    return false;
                }
                continue;
            }
        }
        if (value != fill) {
            return false;
        }
    }

    return true;
}
} // namespace

std::string
cf2zarr::trim(std::string_view s)
{
    if (s.empty()) {
        return {};
    }

    // trim left
    std::string trimmed(s);
    trimmed.erase(trimmed.begin(),
                  std::find_if(trimmed.begin(), trimmed.end(), [](char c) {
                      return !std::isspace(static_cast<unsigned char>(c));
                  }));

    // trim right
    trimmed.erase(std::find_if(trimmed.rbegin(),
                               trimmed.rend(),
                               [](char c) {
                                   return !std::isspace(
                                     static_cast<unsigned char>(c));
                               })
                    .base(),
                  trimmed.end());

    return trimmed;
}

bool
cf2zarr::is_empty_string(std::string_view s, std::string_view err_on_empty)
{
    auto trimmed = trim(s);
    if (trimmed.empty()) {
        LOG_ERROR(err_on_empty);
        return true;
    }
    return false;
}

size_t
cf2zarr::bytes_of_type(Cf2ZarrDataType data_type)
{
    switch (data_type) {
        case Cf2ZarrDataType_int8:
        case Cf2ZarrDataType_uint8:
            return 1;
        case Cf2ZarrDataType_int16:
        case Cf2ZarrDataType_uint16:
            return 2;
        case Cf2ZarrDataType_int32:
        case Cf2ZarrDataType_uint32:
        case Cf2ZarrDataType_float32:
            return 4;
        case Cf2ZarrDataType_int64:
        case Cf2ZarrDataType_uint64:
        case Cf2ZarrDataType_float64:
            return 8;
        default:
            throw std::invalid_argument("Invalid data type: " +
                                        std::to_string(data_type));
    }
}

bool
cf2zarr::is_integer_type(Cf2ZarrDataType data_type)
{
    return data_type != Cf2ZarrDataType_float32 &&
           data_type != Cf2ZarrDataType_float64 &&
           data_type < Cf2ZarrDataTypeCount;
}

std::optional<int64_t>
cf2zarr::checked_add(int64_t a, int64_t b)
{
    constexpr auto max = std::numeric_limits<int64_t>::max();
    constexpr auto min = std::numeric_limits<int64_t>::min();

    if (b > 0 ? a > max - b : a < min - b) {
        return std::nullopt;
    }
    return a + b;
}

std::optional<int64_t>
cf2zarr::checked_mul(int64_t a, int64_t b)
{
    constexpr auto max = std::numeric_limits<int64_t>::max();
    constexpr auto min = std::numeric_limits<int64_t>::min();

    if (a == 0 || b == 0) {
        return 0;
    }
    if (a == -1) {
        return b == min ? std::nullopt : std::optional<int64_t>(-b);
    }
    if (b == -1) {
        return a == min ? std::nullopt : std::optional<int64_t>(-a);
    }

    bool overflows;
    if (a > 0) {
        overflows = b > 0 ? a > max / b : b < min / a;
    } else {
        overflows = b > 0 ? a < min / b : a < max / b;
    }

    if (overflows) {
        return std::nullopt;
    }
    return a * b;
}

uint64_t
cf2zarr::chunks_along_dimension(uint64_t array_size, uint64_t chunk_size)
{
    EXPECT(chunk_size > 0, "Invalid chunk size.");

    return (array_size + chunk_size - 1) / chunk_size;
}

std::string
cf2zarr::data_type_to_typestr(Cf2ZarrDataType data_type)
{
    switch (data_type) {
        case Cf2ZarrDataType_uint8:
            return "|u1";
        case Cf2ZarrDataType_uint16:
            return "<u2";
        case Cf2ZarrDataType_uint32:
            return "<u4";
        case Cf2ZarrDataType_uint64:
            return "<u8";
        case Cf2ZarrDataType_int8:
            return "|i1";
        case Cf2ZarrDataType_int16:
            return "<i2";
        case Cf2ZarrDataType_int32:
            return "<i4";
        case Cf2ZarrDataType_int64:
            return "<i8";
        case Cf2ZarrDataType_float32:
            return "<f4";
        case Cf2ZarrDataType_float64:
            return "<f8";
        default:
            throw StorageError("Unsupported data type: " +
                               std::to_string(data_type));
    }
}

Cf2ZarrDataType
cf2zarr::data_type_from_typestr(std::string_view typestr)
{
    EXPECT_T(typestr.size() == 3,
             StorageError,
             "Unsupported dtype '",
             typestr,
             "'");

    const char order = typestr[0];
    EXPECT_T(order == '<' || order == '|',
             StorageError,
             "Unsupported byte order in dtype '",
             typestr,
             "'");

    const auto kind_size = typestr.substr(1);
    if (kind_size == "u1") {
        return Cf2ZarrDataType_uint8;
    } else if (kind_size == "u2") {
        return Cf2ZarrDataType_uint16;
    } else if (kind_size == "u4") {
        return Cf2ZarrDataType_uint32;
    } else if (kind_size == "u8") {
        return Cf2ZarrDataType_uint64;
    } else if (kind_size == "i1") {
        return Cf2ZarrDataType_int8;
    } else if (kind_size == "i2") {
        return Cf2ZarrDataType_int16;
    } else if (kind_size == "i4") {
        return Cf2ZarrDataType_int32;
    } else if (kind_size == "i8") {
        return Cf2ZarrDataType_int64;
    } else if (kind_size == "f4") {
        return Cf2ZarrDataType_float32;
    } else if (kind_size == "f8") {
        return Cf2ZarrDataType_float64;
    }

    throw StorageError("Unsupported dtype '" + std::string(typestr) + "'");
}

std::vector<uint8_t>
cf2zarr::fill_value_bytes(const nlohmann::json& fill_value,
                          Cf2ZarrDataType data_type)
{
    std::vector<uint8_t> out(bytes_of_type(data_type), 0);
    if (fill_value.is_null()) {
        return out;
    }

    switch (data_type) {
        case Cf2ZarrDataType_float32:
            store_element(out, static_cast<float>(float_fill_value(fill_value)));
            break;
        case Cf2ZarrDataType_float64:
            store_element(out, float_fill_value(fill_value));
            break;
        case Cf2ZarrDataType_uint8:
            store_element(out, fill_value.get<uint8_t>());
            break;
        case Cf2ZarrDataType_uint16:
            store_element(out, fill_value.get<uint16_t>());
            break;
        case Cf2ZarrDataType_uint32:
            store_element(out, fill_value.get<uint32_t>());
            break;
        case Cf2ZarrDataType_uint64:
            store_element(out, fill_value.get<uint64_t>());
            break;
        case Cf2ZarrDataType_int8:
            store_element(out, fill_value.get<int8_t>());
            break;
        case Cf2ZarrDataType_int16:
            store_element(out, fill_value.get<int16_t>());
            break;
        case Cf2ZarrDataType_int32:
            store_element(out, fill_value.get<int32_t>());
            break;
        case Cf2ZarrDataType_int64:
            store_element(out, fill_value.get<int64_t>());
            break;
        default:
            throw StorageError("Unsupported data type: " +
                               std::to_string(data_type));
    }

    return out;
}

bool
cf2zarr::is_fill_only(const uint8_t* data,
                      size_t nbytes,
                      const nlohmann::json& fill_value,
                      Cf2ZarrDataType data_type)
{
    // without a fill value there is no "empty" chunk
    if (fill_value.is_null()) {
        return false;
    }

    switch (data_type) {
        case Cf2ZarrDataType_float32:
            return all_equal_to(
              data, nbytes, static_cast<float>(float_fill_value(fill_value)));
        case Cf2ZarrDataType_float64:
            return all_equal_to(data, nbytes, float_fill_value(fill_value));
        default: {
            const auto fill = fill_value_bytes(fill_value, data_type);
            const size_t typesize = fill.size();
            for (size_t i = 0; i + typesize <= nbytes; i += typesize) {
                if (std::memcmp(data + i, fill.data(), typesize) != 0) {
                    return false;
                }
            }
            return true;
        }
    }
}

std::vector<uint64_t>
cf2zarr::chunk_grid_shape(const std::vector<size_t>& shape,
                          const std::vector<uint32_t>& chunks)
{
    EXPECT(shape.size() == chunks.size(),
           "Chunk rank ",
           chunks.size(),
           " does not match array rank ",
           shape.size());

    std::vector<uint64_t> grid(shape.size());
    for (size_t i = 0; i < shape.size(); ++i) {
        grid[i] = chunks_along_dimension(shape[i], chunks[i]);
    }

    return grid;
}

std::string
cf2zarr::chunk_key(const std::vector<uint64_t>& chunk_index, char separator)
{
    if (chunk_index.empty()) {
        return "0";
    }

    std::string key;
    for (size_t i = 0; i < chunk_index.size(); ++i) {
        if (i > 0) {
            key += separator;
        }
        key += std::to_string(chunk_index[i]);
    }

    return key;
}

namespace {
/// Visit each contiguous run of elements that a chunk shares with the array.
template<typename F>
void
for_each_chunk_run(const std::vector<size_t>& shape,
                   const std::vector<uint32_t>& chunks,
                   const std::vector<uint64_t>& chunk_index,
                   size_t bytes_per_element,
                   F&& copy)
{
    const size_t ndims = shape.size();
    if (ndims == 0) {
        copy(0, 0, bytes_per_element);
        return;
    }

    std::vector<size_t> begin(ndims), extent(ndims);
    for (size_t d = 0; d < ndims; ++d) {
        begin[d] = chunk_index[d] * chunks[d];
        if (begin[d] >= shape[d]) {
            return;
        }
        extent[d] = std::min<size_t>(chunks[d], shape[d] - begin[d]);
    }

    std::vector<size_t> array_stride(ndims, 1), chunk_stride(ndims, 1);
    for (size_t d = ndims - 1; d > 0; --d) {
        array_stride[d - 1] = array_stride[d] * shape[d];
        chunk_stride[d - 1] = chunk_stride[d] * chunks[d];
    }

    const size_t run_bytes = extent[ndims - 1] * bytes_per_element;
    std::vector<size_t> pos(ndims, 0);
    while (true) {
        size_t array_offset = 0, chunk_offset = 0;
        for (size_t d = 0; d < ndims; ++d) {
            array_offset += (begin[d] + pos[d]) * array_stride[d];
            chunk_offset += pos[d] * chunk_stride[d];
        }
        copy(array_offset * bytes_per_element,
             chunk_offset * bytes_per_element,
             run_bytes);

        // odometer over every dimension but the last
        size_t d = ndims - 1;
        while (d > 0) {
            --d;
            if (++pos[d] < extent[d]) {
                break;
            }
            pos[d] = 0;
            if (d == 0) {
                return;
            }
        }
        if (ndims == 1) {
            return;
        }
    }
}
} // namespace

void
cf2zarr::gather_chunk(const uint8_t* array,
                      const std::vector<size_t>& shape,
                      const std::vector<uint32_t>& chunks,
                      const std::vector<uint64_t>& chunk_index,
                      size_t bytes_per_element,
                      uint8_t* chunk)
{
    for_each_chunk_run(
      shape,
      chunks,
      chunk_index,
      bytes_per_element,
      [array, chunk](size_t array_offset, size_t chunk_offset, size_t n) {
          std::memcpy(chunk + chunk_offset, array + array_offset, n);
      });
}

void
cf2zarr::scatter_chunk(const uint8_t* chunk,
                       const std::vector<size_t>& shape,
                       const std::vector<uint32_t>& chunks,
                       const std::vector<uint64_t>& chunk_index,
                       size_t bytes_per_element,
                       uint8_t* array)
{
    for_each_chunk_run(
      shape,
      chunks,
      chunk_index,
      bytes_per_element,
      [array, chunk](size_t array_offset, size_t chunk_offset, size_t n) {
          std::memcpy(array + array_offset, chunk + chunk_offset, n);
      });
}
