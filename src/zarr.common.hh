#pragma once

#include "cf2zarr.types.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cf2zarr {
/**
 * @brief Trim whitespace from a string.
 * @param s The string to trim.
 * @return The string with leading and trailing whitespace removed.
 */
[[nodiscard]]
std::string
trim(std::string_view s);

/**
 * @brief Check if a string is empty, including whitespace.
 * @param s The string to check.
 * @param err_on_empty The message to log if the string is empty.
 * @return True if the string is empty, false otherwise.
 */
bool
is_empty_string(std::string_view s, std::string_view err_on_empty);

/**
 * @brief Get the number of bytes for a given data type.
 * @param data_type The data type.
 * @return The number of bytes for the data type.
 * @throw std::invalid_argument if the data type is not recognized.
 */
size_t
bytes_of_type(Cf2ZarrDataType data_type);

/// True for the integer data types.
bool
is_integer_type(Cf2ZarrDataType data_type);

/// a + b, or nullopt if the sum overflows int64.
std::optional<int64_t>
checked_add(int64_t a, int64_t b);

/// a * b, or nullopt if the product overflows int64.
std::optional<int64_t>
checked_mul(int64_t a, int64_t b);

/**
 * @brief Get the number of chunks along a dimension.
 * @param array_size The length of the dimension.
 * @param chunk_size The chunk size along the dimension.
 * @return The number of, possibly ragged, chunks along the dimension.
 * @throw std::runtime_error if the chunk size is zero.
 */
uint64_t
chunks_along_dimension(uint64_t array_size, uint64_t chunk_size);

/**
 * @brief Get the Zarr v2 typestr, e.g. "<i8", for a data type.
 * @throw cf2zarr::StorageError if the data type is not recognized.
 */
std::string
data_type_to_typestr(Cf2ZarrDataType data_type);

/**
 * @brief Parse a Zarr v2 typestr into a data type.
 * @throw cf2zarr::StorageError if the typestr is unsupported, including
 * big-endian types.
 */
Cf2ZarrDataType
data_type_from_typestr(std::string_view typestr);

/**
 * @brief Encode a Zarr fill value as the bytes of a single element.
 * @param fill_value The fill value as stored in array metadata. Null encodes
 * as zeros.
 * @param data_type The data type of the element.
 * @return A buffer of bytes_of_type(data_type) bytes.
 */
std::vector<uint8_t>
fill_value_bytes(const nlohmann::json& fill_value, Cf2ZarrDataType data_type);

/**
 * @brief Check whether every element of a buffer equals the fill value.
 * @details NaN fill values match any NaN element.
 * @param data The buffer to inspect.
 * @param nbytes The number of bytes in @p data.
 * @param fill_value The fill value as stored in array metadata.
 * @param data_type The element type of @p data.
 * @return True if the buffer holds nothing but fill.
 */
bool
is_fill_only(const uint8_t* data,
             size_t nbytes,
             const nlohmann::json& fill_value,
             Cf2ZarrDataType data_type);
/**
 * @brief Get the number of chunks along each dimension of an array.
 * @throw std::runtime_error if the ranks differ or a chunk size is zero.
 */
std::vector<uint64_t>
chunk_grid_shape(const std::vector<size_t>& shape,
                 const std::vector<uint32_t>& chunks);

/**
 * @brief Get the store key of a chunk, e.g. "3.0.1". A 0-d array has the
 * single chunk "0".
 */
std::string
chunk_key(const std::vector<uint64_t>& chunk_index, char separator);

/**
 * @brief Copy the part of a dense, C-order array covered by one chunk into a
 * chunk buffer.
 * @details The chunk buffer holds a full chunk, C-order. Positions past the
 * edge of the array are left untouched.
 */
void
gather_chunk(const uint8_t* array,
             const std::vector<size_t>& shape,
             const std::vector<uint32_t>& chunks,
             const std::vector<uint64_t>& chunk_index,
             size_t bytes_per_element,
             uint8_t* chunk);

/// The inverse of gather_chunk: copy a chunk buffer into a dense array.
void
scatter_chunk(const uint8_t* chunk,
              const std::vector<size_t>& shape,
              const std::vector<uint32_t>& chunks,
              const std::vector<uint64_t>& chunk_index,
              size_t bytes_per_element,
              uint8_t* array);
} // namespace cf2zarr
