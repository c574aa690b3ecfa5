#include "chunk.planner.hh"
#include "macros.hh"

#include <algorithm>
#include <limits>
#include <sstream>

namespace {
uint32_t
full_extent(size_t length)
{
    return static_cast<uint32_t>(std::clamp<size_t>(
      length, 1, std::numeric_limits<uint32_t>::max()));
}

std::string
format_chunks(const std::vector<uint32_t>& chunks)
{
    std::ostringstream ss;
    ss << '(';
    for (size_t i = 0; i < chunks.size(); ++i) {
        ss << (i ? ", " : "") << chunks[i];
    }
    ss << ')';
    return ss.str();
}
} // namespace

std::vector<uint32_t>
cf2zarr::plan_variable(const Variable& variable,
                       std::string_view dimension,
                       const ChunkShape& shape)
{
    std::vector<uint32_t> chunks(variable.ndims());
    for (size_t i = 0; i < chunks.size(); ++i) {
        chunks[i] = full_extent(variable.shape[i]);
    }

    const auto axis = variable.axis_of(dimension);
    if (axis.has_value() && !shape.empty()) {
        chunks[*axis] = shape.front();
    }

    // right-align the remaining entries to the other dimensions
    size_t entry = shape.size();
    for (size_t i = variable.ndims(); i > 0 && entry > 1; --i) {
        const size_t d = i - 1;
        if (axis.has_value() && d == *axis) {
            continue;
        }

        --entry;
        chunks[d] = std::clamp<uint32_t>(
          shape[entry], 1, full_extent(variable.shape[d]));
    }

    return chunks;
}

cf2zarr::Dataset
cf2zarr::plan(Dataset dataset,
              std::string_view dimension,
              const ChunkShape& shape)
{
    EXPECT_T(!shape.empty(), InvalidSettingsError, "Chunk shape is empty");
    EXPECT_T(std::find(shape.begin(), shape.end(), 0u) == shape.end(),
             InvalidSettingsError,
             "Chunk sizes must be positive, got ",
             format_chunks(shape));

    for (auto& var : dataset.data_variables()) {
        var.chunks = plan_variable(var, dimension, shape);
        LOG_DEBUG("Chunks for '", var.name, "': ", format_chunks(var.chunks));
    }

    for (auto& coord : dataset.coordinates()) {
        if (coord.axis_of(dimension).has_value()) {
            coord.chunks = plan_variable(coord, dimension, shape);
        } else {
            coord.chunks.resize(coord.ndims());
            for (size_t i = 0; i < coord.ndims(); ++i) {
                coord.chunks[i] = full_extent(coord.shape[i]);
            }
        }
    }

    return dataset;
}
