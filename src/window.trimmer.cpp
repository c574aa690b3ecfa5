#include "window.trimmer.hh"
#include "macros.hh"
#include "ordering.coordinate.hh"

#include <algorithm>
#include <limits>

namespace {
/// a - b, saturated to the int64 range.
int64_t
saturating_sub(int64_t a, int64_t b)
{
    constexpr auto max = std::numeric_limits<int64_t>::max();
    constexpr auto min = std::numeric_limits<int64_t>::min();

    if (b < 0 ? a > max + b : a < min + b) {
        return b < 0 ? max : min;
    }
    return a - b;
}
} // namespace

size_t
cf2zarr::trim_start_index(std::span<const int64_t> ordinals, int64_t max_span)
{
    if (ordinals.empty()) {
        return 0;
    }

    const int64_t last = ordinals.back();
    const int64_t first_kept = saturating_sub(last, std::max<int64_t>(max_span, 0));

    // ordinals are non-decreasing, so the kept suffix starts at the first
    // ordinal >= last - max_span
    const auto it =
      std::lower_bound(ordinals.begin(), ordinals.end(), first_kept);
    const auto idx = static_cast<size_t>(std::distance(ordinals.begin(), it));

    return std::min(idx, ordinals.size() - 1);
}

cf2zarr::Dataset
cf2zarr::trim(const Dataset& dataset,
              std::string_view dimension,
              std::optional<int64_t> max_span,
              size_t* n_trimmed)
{
    if (n_trimmed) {
        *n_trimmed = 0;
    }

    if (!max_span.has_value()) {
        return dataset;
    }

    const auto keys = ordinals(find_ordering_coordinate(dataset, dimension));
    if (keys.empty()) {
        return dataset;
    }

    if (*max_span <= 0) {
        LOG_WARNING("Maximum span along '",
                    dimension,
                    "' is ",
                    *max_span,
                    " ticks. Keeping only the latest entry");
    }

    const auto start = trim_start_index(keys, *max_span);
    if (n_trimmed) {
        *n_trimmed = start;
    }

    if (start == 0) {
        return dataset;
    }

    LOG_INFO("Trimming ", start, " entries along '", dimension, "'");
    return slice(dataset, dimension, start, keys.size());
}
