#include "axis.deduplicator.hh"
#include "macros.hh"
#include "ordering.coordinate.hh"

#include <sstream>

namespace {
std::string
format_indices(const std::vector<size_t>& indices)
{
    std::ostringstream ss;
    ss << '[';
    for (size_t i = 0; i < indices.size(); ++i) {
        ss << (i ? ", " : "") << indices[i];
    }
    ss << ']';
    return ss.str();
}
} // namespace

std::vector<size_t>
cf2zarr::find_duplicate_indices(std::span<const int64_t> ordinals)
{
    std::vector<size_t> duplicates;
    for (size_t i = 1; i < ordinals.size(); ++i) {
        if (ordinals[i] == ordinals[i - 1]) {
            duplicates.push_back(i);
        }
    }

    return duplicates;
}

cf2zarr::Dataset
cf2zarr::deduplicate(const Dataset& dataset,
                     std::string_view dimension,
                     std::vector<size_t>* dropped)
{
    const auto keys = ordinals(find_ordering_coordinate(dataset, dimension));
    const auto duplicates = find_duplicate_indices(keys);

    if (dropped) {
        *dropped = duplicates;
    }

    if (duplicates.empty()) {
        return dataset;
    }

    LOG_WARNING("Dropping ",
                duplicates.size(),
                " ",
                dimension,
                " steps at indices: ",
                format_indices(duplicates));

    std::vector<size_t> keep;
    keep.reserve(keys.size() - duplicates.size());
    for (size_t i = 0, d = 0; i < keys.size(); ++i) {
        if (d < duplicates.size() && duplicates[d] == i) {
            ++d;
            continue;
        }
        keep.push_back(i);
    }

    return take(dataset, dimension, keep);
}
