#include "store.writer.hh"
#include "file.sink.hh"
#include "macros.hh"
#include "staging.hh"
#include "zarr.common.hh"

#include <blosc.h>

#include <algorithm>
#include <atomic>
#include <functional>
#include <numeric>

namespace fs = std::filesystem;

namespace {
std::vector<uint32_t>
resolved_chunks(const cf2zarr::Variable& variable)
{
    if (variable.chunks.size() == variable.ndims()) {
        return variable.chunks;
    }

    std::vector<uint32_t> chunks(variable.ndims());
    for (size_t i = 0; i < chunks.size(); ++i) {
        chunks[i] = static_cast<uint32_t>(std::max<size_t>(variable.shape[i], 1));
    }
    return chunks;
}

bool
is_dimension_coordinate(const cf2zarr::Variable& coord)
{
    return coord.ndims() == 1 && coord.dimensions[0] == coord.name;
}

std::vector<uint8_t>
compress(const cf2zarr::BloscCompressionParams& params,
         const std::vector<uint8_t>& chunk,
         size_t bytes_per_element)
{
    const size_t bytes_of_chunk = chunk.size();
    const auto tmp_size = bytes_of_chunk + BLOSC_MAX_OVERHEAD;
    std::vector<uint8_t> tmp(tmp_size);

    const auto nb = blosc_compress_ctx(params.clevel,
                                       params.shuffle,
                                       bytes_per_element,
                                       bytes_of_chunk,
                                       chunk.data(),
                                       tmp.data(),
                                       tmp_size,
                                       params.codec_id.c_str(),
                                       0 /* blocksize - 0:automatic */,
                                       1);
    EXPECT_T(nb > 0,
             cf2zarr::CompressionError,
             "Blosc failed to compress ",
             bytes_of_chunk,
             " bytes with ",
             params.codec_id,
             " (",
             nb,
             ")");

    tmp.resize(static_cast<size_t>(nb));
    return tmp;
}
} // namespace

cf2zarr::StoreWriter::StoreWriter(const fs::path& destination,
                                  Cf2ZarrCreateMode mode,
                                  std::shared_ptr<ThreadPool> thread_pool)
  : destination_(destination)
  , mode_(mode)
  , thread_pool_(std::move(thread_pool))
{
    EXPECT_T(!destination_.empty(),
             InvalidSettingsError,
             "Destination must not be empty");
    EXPECT(thread_pool_, "Thread pool must not be null");
}

void
cf2zarr::StoreWriter::check_destination() const
{
    if (mode_ == Cf2ZarrCreateMode_Exclusive) {
        EXPECT_T(!fs::exists(destination_),
                 WriteConflictError,
                 "Destination ",
                 destination_.string(),
                 " already exists");
    }
}

void
cf2zarr::StoreWriter::write(const EncodedDataset& encoded)
{
    check_destination();

    const auto& dataset = encoded.dataset;
    const auto parent = fs::absolute(destination_).parent_path();

    std::error_code ec;
    fs::create_directories(parent, ec);
    EXPECT_T(!ec,
             IOError,
             "Failed to create ",
             parent.string(),
             ": ",
             ec.message());

    StagingArea area(parent);
    const auto& root = area.path();

    nlohmann::json consolidated = nlohmann::json::object();

    const nlohmann::json zgroup = { { "zarr_format", 2 } };
    write_json(root / ".zgroup", zgroup);
    write_json(root / ".zattrs", dataset.attributes);
    consolidated[".zgroup"] = zgroup;
    consolidated[".zattrs"] = dataset.attributes;

    size_t n_chunks = 0;
    auto write_array = [&](const Variable& variable, bool is_coordinate) {
        const auto array_dir = root / variable.name;
        const auto zarray = make_array_metadata(variable);
        const auto zattrs =
          make_array_attributes(variable, dataset, is_coordinate);

        write_json(array_dir / ".zarray", zarray);
        write_json(array_dir / ".zattrs", zattrs);
        consolidated[variable.name + "/.zarray"] = zarray;
        consolidated[variable.name + "/.zattrs"] = zattrs;

        n_chunks +=
          write_chunks_(array_dir, variable, encoded.write_empty_chunks);
    };

    for (const auto& coord : dataset.coordinates()) {
        write_array(coord, true);
    }
    for (const auto& var : dataset.data_variables()) {
        write_array(var, false);
    }

    write_json(root / ".zmetadata",
               { { "metadata", consolidated },
                 { "zarr_consolidated_format", 1 } });

    // the destination may have appeared while we were writing
    check_destination();
    if (mode_ == Cf2ZarrCreateMode_Overwrite && fs::exists(destination_)) {
        LOG_INFO("Replacing existing store at ", destination_.string());
        fs::remove_all(destination_, ec);
        EXPECT_T(!ec,
                 IOError,
                 "Failed to remove ",
                 destination_.string(),
                 ": ",
                 ec.message());
    }

    area.release_to(destination_);
    LOG_INFO("Wrote ",
             n_chunks,
             " chunks to ",
             destination_.string());
}

size_t
cf2zarr::StoreWriter::write_chunks_(const fs::path& array_dir,
                                    const Variable& variable,
                                    bool write_empty_chunks)
{
    const auto chunks = resolved_chunks(variable);
    const auto grid = chunk_grid_shape(variable.shape, chunks);
    const size_t n_chunks = std::accumulate(
      grid.begin(), grid.end(), size_t{ 1 }, std::multiplies<>());
    if (n_chunks == 0) {
        return 0;
    }

    const size_t bpe = variable.bytes_per_element();
    const size_t elements_per_chunk = std::accumulate(
      chunks.begin(), chunks.end(), size_t{ 1 }, std::multiplies<>());
    const auto fill = fill_value_bytes(variable.fill_value, variable.dtype);

    // chunk indices in C order, last dimension fastest
    std::vector<std::vector<uint64_t>> indices;
    indices.reserve(n_chunks);
    std::vector<uint64_t> index(grid.size(), 0);
    for (size_t c = 0; c < n_chunks; ++c) {
        indices.push_back(index);
        for (size_t d = grid.size(); d > 0; --d) {
            if (++index[d - 1] < grid[d - 1]) {
                break;
            }
            index[d - 1] = 0;
        }
    }

    std::atomic<size_t> n_written{ 0 };
    thread_pool_->run_batch(n_chunks, [&](size_t c) {
        const auto& chunk_index = indices[c];
        const auto key = chunk_key(chunk_index, '.');

        try {
            std::vector<uint8_t> chunk(elements_per_chunk * bpe);
            for (size_t i = 0; i < elements_per_chunk; ++i) {
                std::copy(fill.begin(), fill.end(), chunk.begin() + i * bpe);
            }
            gather_chunk(variable.data.data(),
                         variable.shape,
                         chunks,
                         chunk_index,
                         bpe,
                         chunk.data());

            if (!write_empty_chunks &&
                is_fill_only(
                  chunk.data(), chunk.size(), variable.fill_value, variable.dtype)) {
                return;
            }

            if (variable.compressor.has_value()) {
                chunk = compress(*variable.compressor, chunk, bpe);
            }

            write_file(array_dir / key, std::as_bytes(std::span(chunk)));
            ++n_written;
        } catch (const std::exception& exc) {
            LOG_ERROR("Failed to write chunk ",
                      key,
                      " of '",
                      variable.name,
                      "': ",
                      exc.what());
            throw;
        }
    });

    LOG_DEBUG("Wrote ",
              n_written.load(),
              " of ",
              n_chunks,
              " chunks for '",
              variable.name,
              "'");
    return n_written.load();
}

nlohmann::json
cf2zarr::make_array_metadata(const Variable& variable)
{
    return {
        { "zarr_format", 2 },
        { "shape", variable.shape },
        { "chunks", resolved_chunks(variable) },
        { "dtype", data_type_to_typestr(variable.dtype) },
        { "compressor",
          variable.compressor.has_value() ? variable.compressor->to_json()
                                          : nlohmann::json(nullptr) },
        { "fill_value", variable.fill_value },
        { "order", "C" },
        { "filters", nullptr },
        { "dimension_separator", "." },
    };
}

nlohmann::json
cf2zarr::make_array_attributes(const Variable& variable,
                               const Dataset& dataset,
                               bool is_coordinate)
{
    auto attrs = variable.attributes.is_object() ? variable.attributes
                                                 : nlohmann::json::object();
    attrs["_ARRAY_DIMENSIONS"] = variable.dimensions;

    if (is_coordinate) {
        return attrs;
    }

    std::string coordinates;
    for (const auto& coord : dataset.coordinates()) {
        if (is_dimension_coordinate(coord)) {
            continue;
        }

        const bool spanned = std::all_of(
          coord.dimensions.begin(),
          coord.dimensions.end(),
          [&variable](const auto& d) { return variable.axis_of(d).has_value(); });
        if (spanned) {
            coordinates += (coordinates.empty() ? "" : " ") + coord.name;
        }
    }

    if (!coordinates.empty()) {
        attrs["coordinates"] = coordinates;
    } else {
        attrs.erase("coordinates");
    }

    return attrs;
}

void
cf2zarr::write_file(const fs::path& path, std::span<const std::byte> data)
{
    auto sink = std::make_unique<FileSink>(path.string());
    EXPECT_T(sink->write(0, data), IOError, "Failed to write ", path.string());
    EXPECT_T(finalize_sink(std::move(sink)),
             IOError,
             "Failed to finalize ",
             path.string());
}

void
cf2zarr::write_json(const fs::path& path, const nlohmann::json& json)
{
    const std::string text = json.dump(4);
    write_file(path, std::as_bytes(std::span(text.data(), text.size())));
}
