#include "pipeline.hh"
#include "axis.deduplicator.hh"
#include "dataset.merger.hh"
#include "macros.hh"
#include "ordering.coordinate.hh"
#include "s3.connection.hh"
#include "staging.hh"
#include "store.reader.hh"
#include "store.writer.hh"
#include "thread.pool.hh"
#include "window.trimmer.hh"

#include <memory>
#include <sstream>
#include <thread>

namespace {
std::string
join(const std::vector<std::string>& names)
{
    std::ostringstream ss;
    ss << '[';
    for (size_t i = 0; i < names.size(); ++i) {
        ss << (i ? ", " : "") << names[i];
    }
    ss << ']';
    return ss.str();
}

/// The span covered by the ordering coordinate.
cf2zarr::Duration
dataset_duration(const std::vector<int64_t>& keys, cf2zarr::Duration tick)
{
    if (keys.size() < 2) {
        return cf2zarr::Duration(0);
    }
    return cf2zarr::elapsed(keys.front(), keys.back(), tick);
}
} // namespace

cf2zarr::EncodedDataset
cf2zarr::run(const std::optional<Dataset>& existing,
             const Dataset& incoming,
             const std::vector<std::string>& variables,
             std::string_view dimension,
             std::optional<Duration> max_duration,
             const ChunkShape& chunk_shape,
             const BloscCompressionParams& codec,
             RunReport* report)
{
    RunReport local_report;
    auto& r = report ? *report : local_report;
    r = RunReport{};

    r.selected_variables =
      variables.empty() ? default_variables(incoming, existing) : variables;
    LOG_INFO("Selecting variables: ", join(r.selected_variables));

    auto merged = merge(existing, incoming, r.selected_variables, dimension);
    auto ds = deduplicate(merged, dimension, &r.dropped_duplicates);

    if (max_duration.has_value()) {
        const auto& coord = find_ordering_coordinate(ds, dimension);
        const auto tick = ordinal_tick(coord);
        const auto keys = ordinals(coord);

        LOG_INFO("Dataset duration: ",
                 format_duration(dataset_duration(keys, tick)));

        ds = trim(ds, dimension, to_ticks(*max_duration, tick), &r.n_trimmed);
        if (r.n_trimmed > 0) {
            const auto kept = ordinals(find_ordering_coordinate(ds, dimension));
            LOG_INFO("Dropped ",
                     r.n_trimmed,
                     " entries. New dataset duration: ",
                     format_duration(dataset_duration(kept, tick)));
        }
    }

    r.n_entries = ds.dimension_size(dimension).value_or(0);

    std::ostringstream chunks;
    for (size_t i = 0; i < chunk_shape.size(); ++i) {
        chunks << (i ? ", " : "") << chunk_shape[i];
    }
    LOG_INFO("Setting chunk config: (", chunks.str(), ")");

    return encode(plan(std::move(ds), dimension, chunk_shape), codec);
}

cf2zarr::RunReport
cf2zarr::append(const AppendSettings& settings)
{
    EXPECT_T(validate_settings(settings),
             InvalidSettingsError,
             "Invalid append settings");

    std::optional<Duration> max_duration;
    if (settings.max_duration.has_value()) {
        max_duration = parse_duration(*settings.max_duration);
    }

    std::unique_ptr<S3Connection> s3;
    if (settings.needs_s3()) {
        s3 = std::make_unique<S3Connection>(settings.s3->endpoint,
                                            settings.s3->access_key_id,
                                            settings.s3->secret_access_key);
    }

    auto thread_pool = std::make_shared<ThreadPool>(
      settings.thread_count ? settings.thread_count
                            : std::thread::hardware_concurrency(),
      [](const std::string& err) { LOG_ERROR(err); });

    StoreWriter writer(settings.output, settings.create_mode, thread_pool);
    writer.check_destination();

    // staging areas are removed when this goes out of scope
    RunContext context;

    std::optional<Dataset> existing;
    if (settings.has_existing()) {
        const auto path = is_s3_url(settings.existing)
                            ? stage_s3_store(settings.existing, *s3, context)
                            : local_path(settings.existing);
        existing = open_store(path);
        if (existing.has_value()) {
            LOG_INFO("Opened existing store ", settings.existing);
        } else {
            LOG_WARNING("No store at ", settings.existing, ". Starting a new one");
        }
    } else {
        LOG_INFO("No existing store. Starting a new one");
    }

    const auto input_dir = is_s3_url(settings.input)
                             ? stage_s3(settings.input, *s3, context)
                             : local_path(settings.input);
    const auto incoming = open_multi_store(
      input_dir, settings.pattern, settings.ordering_dimension);

    RunReport report;
    const auto encoded = run(existing,
                             incoming,
                             settings.variables,
                             settings.ordering_dimension,
                             max_duration,
                             settings.chunk_shape,
                             settings.compression,
                             &report);

    LOG_INFO("Writing to ", settings.output);
    writer.write(encoded);

    return report;
}
