#pragma once

#include "append.settings.hh"
#include "blosc.compression.params.hh"
#include "chunk.planner.hh"
#include "dataset.hh"
#include "duration.hh"
#include "store.encoder.hh"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cf2zarr {
/// What a run did to its inputs.
struct RunReport
{
    std::vector<std::string> selected_variables;
    std::vector<size_t> dropped_duplicates; /* positions after the merge */
    size_t n_trimmed{ 0 };
    size_t n_entries{ 0 }; /* entries along the ordering dimension */
};

/**
 * @brief Merge, deduplicate, trim, plan chunks and encode.
 * @param existing The stored dataset, if any.
 * @param incoming The newly ingested dataset.
 * @param variables Variables to keep. Empty selects default_variables().
 * @param dimension The ordering dimension.
 * @param max_duration The retention window. Empty keeps everything.
 * @param chunk_shape Chunk sizes, ordering dimension first.
 * @param codec The Blosc compressor for every stored array.
 * @param report If non-null, receives what the run did.
 * @return The dataset, ready for StoreWriter.
 */
EncodedDataset
run(const std::optional<Dataset>& existing,
    const Dataset& incoming,
    const std::vector<std::string>& variables,
    std::string_view dimension,
    std::optional<Duration> max_duration,
    const ChunkShape& chunk_shape,
    const BloscCompressionParams& codec,
    RunReport* report = nullptr);

/**
 * @brief Run one append end to end: stage, read, run(), write.
 * @throw cf2zarr::InvalidSettingsError if @p settings fail validation.
 * @throw cf2zarr::Error subclasses for every other failure.
 */
RunReport
append(const AppendSettings& settings);
} // namespace cf2zarr
