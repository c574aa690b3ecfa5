#pragma once

#include "blosc.compression.params.hh"
#include "cf2zarr.types.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cf2zarr {
/**
 * @brief A named, dense, row-major N-dimensional array.
 * @details Chunk geometry and compressor are storage hints. They are filled in
 * by the store reader for arrays loaded from a store, and by the chunk planner
 * and store encoder before writing.
 */
struct Variable
{
    Variable() = default;
    Variable(std::string_view name,
             std::vector<std::string>&& dimensions,
             std::vector<size_t>&& shape,
             Cf2ZarrDataType dtype,
             std::vector<uint8_t>&& data);

    std::string name;
    std::vector<std::string> dimensions;
    std::vector<size_t> shape;
    Cf2ZarrDataType dtype{ Cf2ZarrDataType_float64 };
    std::vector<uint8_t> data;

    nlohmann::json attributes = nlohmann::json::object();
    nlohmann::json fill_value; // null: no fill value

    std::vector<uint32_t> chunks; // empty: not chunked yet
    std::optional<BloscCompressionParams> compressor;

    size_t ndims() const { return dimensions.size(); }
    size_t bytes_per_element() const;
    size_t number_of_elements() const;

    /// The position of @p dimension in this variable's dimensions, if any.
    std::optional<size_t> axis_of(std::string_view dimension) const;
};

class Dataset
{
  public:
    Dataset() = default;

    /**
     * @brief Add a data variable.
     * @throw cf2zarr::AxisMismatchError if a dimension length disagrees with
     * the dataset, or if the variable is malformed.
     * @throw std::runtime_error if the name is already taken.
     */
    void add_data_variable(Variable&& variable);

    /**
     * @brief Add a coordinate variable.
     * @throw cf2zarr::AxisMismatchError under the same conditions as
     * add_data_variable.
     */
    void add_coordinate(Variable&& variable);

    const std::vector<Variable>& data_variables() const { return data_vars_; }
    std::vector<Variable>& data_variables() { return data_vars_; }

    const std::vector<Variable>& coordinates() const { return coords_; }
    std::vector<Variable>& coordinates() { return coords_; }

    /// Data variable names in declaration order.
    std::vector<std::string> data_variable_names() const;

    const Variable* find_data_variable(std::string_view name) const;
    const Variable* find_coordinate(std::string_view name) const;

    /// Dimension names and lengths, in order of first appearance.
    const std::vector<std::pair<std::string, size_t>>& dimensions() const
    {
        return dims_;
    }

    std::optional<size_t> dimension_size(std::string_view dimension) const;

    bool empty() const { return data_vars_.empty() && coords_.empty(); }

    nlohmann::json attributes = nlohmann::json::object();

  private:
    std::vector<Variable> data_vars_;
    std::vector<Variable> coords_;
    std::vector<std::pair<std::string, size_t>> dims_;

    void check_variable_(const Variable& variable);
};

/**
 * @brief Gather positions @p indices along @p dimension of a variable.
 * @details Variables that do not span @p dimension are returned unchanged.
 */
Variable
take(const Variable& variable,
     std::string_view dimension,
     const std::vector<size_t>& indices);

/**
 * @brief Gather positions @p indices along @p dimension of every variable and
 * coordinate in a dataset.
 */
Dataset
take(const Dataset& dataset,
     std::string_view dimension,
     const std::vector<size_t>& indices);

/**
 * @brief Restrict a dataset to the half-open range [@p begin, @p end) along
 * @p dimension.
 */
Dataset
slice(const Dataset& dataset,
      std::string_view dimension,
      size_t begin,
      size_t end);

/**
 * @brief Concatenate two variables along @p dimension, @p first then
 * @p second.
 * @throw cf2zarr::AxisMismatchError if the variables disagree on dimension
 * names, data type, or any length other than along @p dimension.
 */
Variable
concat(const Variable& first, const Variable& second, std::string_view dimension);

/**
 * @brief Concatenate two datasets along @p dimension.
 * @details Both datasets must hold the same data variables. Coordinates along
 * @p dimension are concatenated; other shared coordinates must hold the same
 * values in both.
 * @throw cf2zarr::SelectionError if the data variable sets differ.
 * @throw cf2zarr::AxisMismatchError if a shared variable or coordinate
 * disagrees outside @p dimension.
 */
Dataset
concat(const Dataset& first, const Dataset& second, std::string_view dimension);

/**
 * @brief Select data variables by name, along with the coordinates whose
 * dimensions they span.
 * @throw cf2zarr::SelectionError if a name is not a data variable of
 * @p dataset.
 */
Dataset
select_variables(const Dataset& dataset, const std::vector<std::string>& names);
} // namespace cf2zarr
