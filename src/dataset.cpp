#include "dataset.hh"
#include "macros.hh"
#include "zarr.common.hh"

#include <algorithm>
#include <cstring>
#include <functional>
#include <numeric>
#include <set>

namespace {
size_t
product(std::vector<size_t>::const_iterator begin,
        std::vector<size_t>::const_iterator end)
{
    return std::accumulate(begin, end, size_t{ 1 }, std::multiplies<>());
}

std::string
join(const std::vector<std::string>& names)
{
    std::string out;
    for (const auto& name : names) {
        out += (out.empty() ? "" : ", ") + name;
    }
    return "[" + out + "]";
}

/// Check that two variables agree everywhere except along @p dimension.
void
check_compatible(const cf2zarr::Variable& first,
                 const cf2zarr::Variable& second,
                 std::string_view dimension)
{
    using cf2zarr::AxisMismatchError;

    EXPECT_T(first.dimensions == second.dimensions,
             AxisMismatchError,
             "Variable '",
             first.name,
             "' has dimensions ",
             join(first.dimensions),
             " in one dataset and ",
             join(second.dimensions),
             " in the other");

    EXPECT_T(first.dtype == second.dtype,
             AxisMismatchError,
             "Variable '",
             first.name,
             "' has mismatched data types");

    for (size_t i = 0; i < first.ndims(); ++i) {
        if (first.dimensions[i] == dimension) {
            continue;
        }

        EXPECT_T(first.shape[i] == second.shape[i],
                 AxisMismatchError,
                 "Variable '",
                 first.name,
                 "' has length ",
                 first.shape[i],
                 " along '",
                 first.dimensions[i],
                 "' in one dataset and ",
                 second.shape[i],
                 " in the other");
    }
}
} // namespace

cf2zarr::Variable::Variable(std::string_view name,
                            std::vector<std::string>&& dimensions,
                            std::vector<size_t>&& shape,
                            Cf2ZarrDataType dtype,
                            std::vector<uint8_t>&& data)
  : name(name)
  , dimensions(std::move(dimensions))
  , shape(std::move(shape))
  , dtype(dtype)
  , data(std::move(data))
{
}

size_t
cf2zarr::Variable::bytes_per_element() const
{
    return bytes_of_type(dtype);
}

size_t
cf2zarr::Variable::number_of_elements() const
{
    return product(shape.begin(), shape.end());
}

std::optional<size_t>
cf2zarr::Variable::axis_of(std::string_view dimension) const
{
    const auto it = std::find(dimensions.begin(), dimensions.end(), dimension);
    if (it == dimensions.end()) {
        return std::nullopt;
    }

    return static_cast<size_t>(std::distance(dimensions.begin(), it));
}

/// Dataset
void
cf2zarr::Dataset::add_data_variable(Variable&& variable)
{
    check_variable_(variable);
    data_vars_.push_back(std::move(variable));
}

void
cf2zarr::Dataset::add_coordinate(Variable&& variable)
{
    check_variable_(variable);
    coords_.push_back(std::move(variable));
}

std::vector<std::string>
cf2zarr::Dataset::data_variable_names() const
{
    std::vector<std::string> names;
    names.reserve(data_vars_.size());
    for (const auto& var : data_vars_) {
        names.push_back(var.name);
    }

    return names;
}

const cf2zarr::Variable*
cf2zarr::Dataset::find_data_variable(std::string_view name) const
{
    const auto it = std::find_if(data_vars_.begin(),
                                 data_vars_.end(),
                                 [name](const auto& v) { return v.name == name; });
    return it == data_vars_.end() ? nullptr : &*it;
}

const cf2zarr::Variable*
cf2zarr::Dataset::find_coordinate(std::string_view name) const
{
    const auto it = std::find_if(coords_.begin(),
                                 coords_.end(),
                                 [name](const auto& v) { return v.name == name; });
    return it == coords_.end() ? nullptr : &*it;
}

std::optional<size_t>
cf2zarr::Dataset::dimension_size(std::string_view dimension) const
{
    for (const auto& [name, size] : dims_) {
        if (name == dimension) {
            return size;
        }
    }

    return std::nullopt;
}

void
cf2zarr::Dataset::check_variable_(const Variable& variable)
{
    EXPECT(!is_empty_string(variable.name, "Variable name is empty"),
           "Invalid variable name");
    EXPECT(!find_data_variable(variable.name) && !find_coordinate(variable.name),
           "Duplicate variable name '",
           variable.name,
           "'");

    EXPECT_T(variable.shape.size() == variable.ndims(),
             AxisMismatchError,
             "Variable '",
             variable.name,
             "' has ",
             variable.ndims(),
             " dimensions but a shape of rank ",
             variable.shape.size());

    const size_t expected_bytes =
      variable.number_of_elements() * variable.bytes_per_element();
    EXPECT(variable.data.size() == expected_bytes,
           "Variable '",
           variable.name,
           "' holds ",
           variable.data.size(),
           " bytes, expected ",
           expected_bytes);

    std::set<std::string> seen;
    std::vector<std::pair<std::string, size_t>> new_dims;
    for (size_t i = 0; i < variable.ndims(); ++i) {
        const auto& dim = variable.dimensions[i];
        EXPECT_T(seen.insert(dim).second,
                 AxisMismatchError,
                 "Variable '",
                 variable.name,
                 "' repeats dimension '",
                 dim,
                 "'");

        if (auto size = dimension_size(dim); size.has_value()) {
            EXPECT_T(*size == variable.shape[i],
                     AxisMismatchError,
                     "Variable '",
                     variable.name,
                     "' has length ",
                     variable.shape[i],
                     " along '",
                     dim,
                     "', but the dataset has length ",
                     *size);
        } else {
            new_dims.emplace_back(dim, variable.shape[i]);
        }
    }

    dims_.insert(dims_.end(), new_dims.begin(), new_dims.end());
}

/// Free functions
cf2zarr::Variable
cf2zarr::take(const Variable& variable,
              std::string_view dimension,
              const std::vector<size_t>& indices)
{
    const auto axis = variable.axis_of(dimension);
    if (!axis.has_value()) {
        return variable;
    }

    const auto& shape = variable.shape;
    const size_t n = shape[*axis];
    const size_t outer = product(shape.begin(), shape.begin() + *axis);
    const size_t inner_bytes =
      product(shape.begin() + *axis + 1, shape.end()) *
      variable.bytes_per_element();

    Variable out;
    out.name = variable.name;
    out.dimensions = variable.dimensions;
    out.shape = variable.shape;
    out.shape[*axis] = indices.size();
    out.dtype = variable.dtype;
    out.attributes = variable.attributes;
    out.fill_value = variable.fill_value;
    out.chunks = variable.chunks;
    out.compressor = variable.compressor;
    out.data.resize(outer * indices.size() * inner_bytes);

    const uint8_t* src = variable.data.data();
    uint8_t* dst = out.data.data();
    for (size_t o = 0; o < outer; ++o) {
        for (size_t j = 0; j < indices.size(); ++j) {
            const auto idx = indices[j];
            EXPECT(idx < n,
                   "Index ",
                   idx,
                   " out of range for dimension '",
                   dimension,
                   "' of length ",
                   n);

            if (inner_bytes > 0) {
                std::memcpy(dst + (o * indices.size() + j) * inner_bytes,
                            src + (o * n + idx) * inner_bytes,
                            inner_bytes);
            }
        }
    }

    return out;
}

cf2zarr::Dataset
cf2zarr::take(const Dataset& dataset,
              std::string_view dimension,
              const std::vector<size_t>& indices)
{
    Dataset out;
    out.attributes = dataset.attributes;

    for (const auto& coord : dataset.coordinates()) {
        out.add_coordinate(take(coord, dimension, indices));
    }
    for (const auto& var : dataset.data_variables()) {
        out.add_data_variable(take(var, dimension, indices));
    }

    return out;
}

cf2zarr::Dataset
cf2zarr::slice(const Dataset& dataset,
               std::string_view dimension,
               size_t begin,
               size_t end)
{
    const auto size = dataset.dimension_size(dimension);
    EXPECT(size.has_value(), "Unknown dimension '", dimension, "'");

    end = std::min(end, *size);
    begin = std::min(begin, end);

    std::vector<size_t> indices(end - begin);
    std::iota(indices.begin(), indices.end(), begin);

    return take(dataset, dimension, indices);
}

cf2zarr::Variable
cf2zarr::concat(const Variable& first,
                const Variable& second,
                std::string_view dimension)
{
    check_compatible(first, second, dimension);

    const auto axis = first.axis_of(dimension);
    if (!axis.has_value()) {
        if (first.data != second.data) {
            LOG_WARNING("Variable '",
                        first.name,
                        "' differs between datasets. Keeping the first.");
        }
        return first;
    }

    const auto& shape = first.shape;
    const size_t outer = product(shape.begin(), shape.begin() + *axis);
    const size_t inner_bytes = product(shape.begin() + *axis + 1, shape.end()) *
                               first.bytes_per_element();
    const size_t first_block = first.shape[*axis] * inner_bytes;
    const size_t second_block = second.shape[*axis] * inner_bytes;

    Variable out = first;
    out.shape[*axis] = first.shape[*axis] + second.shape[*axis];
    out.data.resize(outer * (first_block + second_block));

    uint8_t* dst = out.data.data();
    for (size_t o = 0; o < outer; ++o) {
        if (first_block > 0) {
            std::memcpy(dst, first.data.data() + o * first_block, first_block);
            dst += first_block;
        }
        if (second_block > 0) {
            std::memcpy(
              dst, second.data.data() + o * second_block, second_block);
            dst += second_block;
        }
    }

    return out;
}

cf2zarr::Dataset
cf2zarr::concat(const Dataset& first,
                const Dataset& second,
                std::string_view dimension)
{
    Dataset out;
    out.attributes = first.attributes;

    for (const auto& coord : first.coordinates()) {
        const auto* other = second.find_coordinate(coord.name);
        if (other) {
            if (!coord.axis_of(dimension).has_value()) {
                check_compatible(coord, *other, dimension);
                EXPECT_T(coord.data == other->data,
                         AxisMismatchError,
                         "Coordinate '",
                         coord.name,
                         "' has different values in the two datasets");
            }
            out.add_coordinate(concat(coord, *other, dimension));
        } else {
            EXPECT_T(!coord.axis_of(dimension).has_value(),
                     AxisMismatchError,
                     "Coordinate '",
                     coord.name,
                     "' is missing from one of the datasets");
            out.add_coordinate(Variable(coord));
        }
    }

    for (const auto& coord : second.coordinates()) {
        if (first.find_coordinate(coord.name)) {
            continue;
        }

        EXPECT_T(!coord.axis_of(dimension).has_value(),
                 AxisMismatchError,
                 "Coordinate '",
                 coord.name,
                 "' is missing from one of the datasets");
        out.add_coordinate(Variable(coord));
    }

    for (const auto& var : first.data_variables()) {
        const auto* other = second.find_data_variable(var.name);
        EXPECT_T(other != nullptr,
                 SelectionError,
                 "Variable '",
                 var.name,
                 "' is missing from one of the datasets");
        out.add_data_variable(concat(var, *other, dimension));
    }

    for (const auto& var : second.data_variables()) {
        EXPECT_T(first.find_data_variable(var.name) != nullptr,
                 SelectionError,
                 "Variable '",
                 var.name,
                 "' is missing from one of the datasets");
    }

    return out;
}

cf2zarr::Dataset
cf2zarr::select_variables(const Dataset& dataset,
                          const std::vector<std::string>& names)
{
    Dataset out;
    out.attributes = dataset.attributes;

    std::set<std::string> used_dims;
    std::vector<const Variable*> selected;
    for (const auto& name : names) {
        const auto* var = dataset.find_data_variable(name);
        EXPECT_T(var != nullptr,
                 SelectionError,
                 "Variable '",
                 name,
                 "' not found. Available variables: ",
                 join(dataset.data_variable_names()));

        used_dims.insert(var->dimensions.begin(), var->dimensions.end());
        selected.push_back(var);
    }

    for (const auto& coord : dataset.coordinates()) {
        const bool spans_selection =
          std::all_of(coord.dimensions.begin(),
                      coord.dimensions.end(),
                      [&used_dims](const auto& d) { return used_dims.contains(d); });
        if (spans_selection) {
            out.add_coordinate(Variable(coord));
        }
    }

    for (const auto* var : selected) {
        if (out.find_data_variable(var->name)) {
            continue; // requested twice
        }
        out.add_data_variable(Variable(*var));
    }

    return out;
}
