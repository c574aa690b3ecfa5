#include "dataset.merger.hh"
#include "macros.hh"
#include "ordering.coordinate.hh"

#include <algorithm>
#include <numeric>

std::vector<std::string>
cf2zarr::default_variables(const Dataset& incoming,
                           const std::optional<Dataset>& existing)
{
    if (existing.has_value() && !existing->data_variables().empty()) {
        return existing->data_variable_names();
    }

    EXPECT_T(!incoming.data_variables().empty(),
             SelectionError,
             "No data variables to select from");

    return { incoming.data_variables().front().name };
}

cf2zarr::Dataset
cf2zarr::sort_by_ordering(const Dataset& dataset, std::string_view dimension)
{
    const auto keys = ordinals(find_ordering_coordinate(dataset, dimension));
    if (std::is_sorted(keys.begin(), keys.end())) {
        return dataset;
    }

    std::vector<size_t> order(keys.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&keys](size_t a, size_t b) {
        return keys[a] < keys[b];
    });

    return take(dataset, dimension, order);
}

cf2zarr::Dataset
cf2zarr::merge(const std::optional<Dataset>& existing,
               const Dataset& incoming,
               const std::vector<std::string>& variables,
               std::string_view dimension)
{
    const auto names =
      variables.empty() ? default_variables(incoming, existing) : variables;

    auto selected = select_variables(incoming, names);
    find_ordering_coordinate(selected, dimension);

    if (!existing.has_value()) {
        LOG_DEBUG("No existing dataset. Sorting ",
                  selected.dimension_size(dimension).value_or(0),
                  " incoming entries");
        return sort_by_ordering(selected, dimension);
    }

    const auto previous = select_variables(*existing, names);
    selected = rebase_ordering(
      selected, dimension, find_ordering_coordinate(previous, dimension));

    auto combined = concat(previous, selected, dimension);
    LOG_DEBUG("Concatenated ",
              previous.dimension_size(dimension).value_or(0),
              " existing and ",
              selected.dimension_size(dimension).value_or(0),
              " incoming entries along '",
              dimension,
              "'");

    return sort_by_ordering(combined, dimension);
}
