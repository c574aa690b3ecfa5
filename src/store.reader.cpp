#include "store.reader.hh"
#include "dataset.merger.hh"
#include "macros.hh"
#include "ordering.coordinate.hh"
#include "zarr.common.hh"

#include <blosc.h>
#include <glob.h>

#include <algorithm>
#include <fstream>
#include <functional>
#include <iterator>
#include <numeric>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace {
std::vector<uint8_t>
read_file(const fs::path& path)
{
    std::ifstream file(path, std::ios::binary);
    EXPECT_T(file.is_open(),
             cf2zarr::IOError,
             "Failed to open ",
             path.string());

    return { std::istreambuf_iterator<char>(file),
             std::istreambuf_iterator<char>() };
}

nlohmann::json
read_json(const fs::path& path)
{
    const auto bytes = read_file(path);
    try {
        return nlohmann::json::parse(bytes.begin(), bytes.end());
    } catch (const nlohmann::json::parse_error& exc) {
        const std::string err =
          LOG_ERROR("Malformed JSON in ", path.string(), ": ", exc.what());
        throw cf2zarr::StorageError(err);
    }
}

/// Array and group metadata, from .zmetadata if present, else from disk.
nlohmann::json
load_metadata(const fs::path& root)
{
    if (fs::exists(root / ".zmetadata")) {
        const auto zmetadata = read_json(root / ".zmetadata");
        EXPECT_T(zmetadata.contains("metadata") &&
                   zmetadata["metadata"].is_object(),
                 cf2zarr::StorageError,
                 "Malformed consolidated metadata in ",
                 root.string());
        return zmetadata["metadata"];
    }

    LOG_DEBUG("No consolidated metadata in ", root.string(), ". Scanning");

    nlohmann::json metadata = nlohmann::json::object();
    for (const auto* key : { ".zgroup", ".zattrs" }) {
        if (fs::exists(root / key)) {
            metadata[key] = read_json(root / key);
        }
    }

    for (const auto& entry : fs::directory_iterator(root)) {
        if (!entry.is_directory() || !fs::exists(entry.path() / ".zarray")) {
            continue;
        }

        const auto name = entry.path().filename().string();
        metadata[name + "/.zarray"] = read_json(entry.path() / ".zarray");
        if (fs::exists(entry.path() / ".zattrs")) {
            metadata[name + "/.zattrs"] = read_json(entry.path() / ".zattrs");
        }
    }

    return metadata;
}

std::vector<std::string>
split_names(const std::string& text)
{
    std::istringstream ss(text);
    return { std::istream_iterator<std::string>(ss),
             std::istream_iterator<std::string>() };
}

void
decompress_into(const std::vector<uint8_t>& compressed,
                std::vector<uint8_t>& chunk,
                const fs::path& path)
{
    const auto nb = blosc_decompress_ctx(
      compressed.data(), chunk.data(), chunk.size(), 1);
    EXPECT_T(nb >= 0 && static_cast<size_t>(nb) == chunk.size(),
             cf2zarr::CompressionError,
             "Failed to decompress ",
             path.string(),
             " (",
             nb,
             ")");
}

cf2zarr::Variable
read_array(const fs::path& root,
           const std::string& name,
           const nlohmann::json& zarray,
           const nlohmann::json& zattrs)
{
    using cf2zarr::StorageError;

    EXPECT_T(zarray.value("zarr_format", 0) == 2,
             StorageError,
             "Array '",
             name,
             "' is not a Zarr v2 array");
    EXPECT_T(zarray.value("order", "C") == "C",
             StorageError,
             "Array '",
             name,
             "' is not in C order");
    EXPECT_T(!zarray.contains("filters") || zarray["filters"].is_null() ||
               zarray["filters"].empty(),
             StorageError,
             "Array '",
             name,
             "' uses filters, which are not supported");
    EXPECT_T(zattrs.contains("_ARRAY_DIMENSIONS"),
             StorageError,
             "Array '",
             name,
             "' has no _ARRAY_DIMENSIONS attribute");

    cf2zarr::Variable var;
    var.name = name;
    var.dimensions = zattrs["_ARRAY_DIMENSIONS"].get<std::vector<std::string>>();
    var.shape = zarray.at("shape").get<std::vector<size_t>>();
    var.chunks = zarray.at("chunks").get<std::vector<uint32_t>>();
    var.dtype = cf2zarr::data_type_from_typestr(
      zarray.at("dtype").get<std::string>());
    var.fill_value = zarray.value("fill_value", nlohmann::json(nullptr));

    EXPECT_T(var.dimensions.size() == var.shape.size() &&
               var.chunks.size() == var.shape.size(),
             StorageError,
             "Array '",
             name,
             "' has inconsistent rank");

    if (const auto& compressor = zarray.value("compressor", nlohmann::json());
        !compressor.is_null()) {
        var.compressor = cf2zarr::BloscCompressionParams::from_json(compressor);
    }

    var.attributes = zattrs;
    var.attributes.erase("_ARRAY_DIMENSIONS");
    var.attributes.erase("coordinates");

    const auto separator =
      zarray.value("dimension_separator", std::string(".")).at(0);

    const size_t bpe = var.bytes_per_element();
    const auto fill = cf2zarr::fill_value_bytes(var.fill_value, var.dtype);
    var.data.resize(var.number_of_elements() * bpe);
    for (size_t i = 0; i < var.number_of_elements(); ++i) {
        std::copy(fill.begin(), fill.end(), var.data.begin() + i * bpe);
    }

    const auto grid = cf2zarr::chunk_grid_shape(var.shape, var.chunks);
    const size_t n_chunks = std::accumulate(
      grid.begin(), grid.end(), size_t{ 1 }, std::multiplies<>());
    const size_t chunk_bytes =
      std::accumulate(
        var.chunks.begin(), var.chunks.end(), size_t{ 1 }, std::multiplies<>()) *
      bpe;

    std::vector<uint64_t> index(grid.size(), 0);
    std::vector<uint8_t> chunk(chunk_bytes);
    for (size_t c = 0; c < n_chunks; ++c) {
        const auto path = root / name / cf2zarr::chunk_key(index, separator);
        if (fs::exists(path)) {
            const auto bytes = read_file(path);
            if (var.compressor.has_value()) {
                decompress_into(bytes, chunk, path);
            } else {
                EXPECT_T(bytes.size() == chunk_bytes,
                         StorageError,
                         "Chunk ",
                         path.string(),
                         " holds ",
                         bytes.size(),
                         " bytes, expected ",
                         chunk_bytes);
                chunk = bytes;
            }

            cf2zarr::scatter_chunk(
              chunk.data(), var.shape, var.chunks, index, bpe, var.data.data());
        }

        for (size_t d = grid.size(); d > 0; --d) {
            if (++index[d - 1] < grid[d - 1]) {
                break;
            }
            index[d - 1] = 0;
        }
    }

    return var;
}
} // namespace

std::optional<cf2zarr::Dataset>
cf2zarr::open_store(const fs::path& path)
{
    if (!fs::exists(path)) {
        LOG_INFO("No store at ", path.string());
        return std::nullopt;
    }

    EXPECT_T(fs::is_directory(path),
             StorageError,
             path.string(),
             " is not a directory store");

    const auto metadata = load_metadata(path);
    EXPECT_T(metadata.contains(".zgroup"),
             StorageError,
             path.string(),
             " is not a Zarr group");

    Dataset dataset;
    if (metadata.contains(".zattrs") && metadata[".zattrs"].is_object()) {
        dataset.attributes = metadata[".zattrs"];
    }

    // collect array names and the names referenced as coordinates
    std::set<std::string> arrays;
    std::set<std::string> coordinate_names;
    if (dataset.attributes.contains("coordinates") &&
        dataset.attributes["coordinates"].is_string()) {
        for (auto& c :
             split_names(dataset.attributes["coordinates"].get<std::string>())) {
            coordinate_names.insert(std::move(c));
        }
        dataset.attributes.erase("coordinates");
    }

    for (const auto& [key, value] : metadata.items()) {
        const std::string suffix = "/.zarray";
        if (key.size() <= suffix.size() || !key.ends_with(suffix)) {
            continue;
        }

        const auto name = key.substr(0, key.size() - suffix.size());
        arrays.insert(name);

        const auto attrs_key = name + "/.zattrs";
        if (metadata.contains(attrs_key) &&
            metadata[attrs_key].contains("coordinates") &&
            metadata[attrs_key]["coordinates"].is_string()) {
            for (auto& c : split_names(
                   metadata[attrs_key]["coordinates"].get<std::string>())) {
                coordinate_names.insert(std::move(c));
            }
        }
    }

    std::vector<Variable> data_vars;
    for (const auto& name : arrays) {
        const auto attrs_key = name + "/.zattrs";
        const auto zattrs = metadata.contains(attrs_key)
                              ? metadata[attrs_key]
                              : nlohmann::json::object();

        auto var = read_array(path, name, metadata[name + "/.zarray"], zattrs);

        const bool is_index = var.ndims() == 1 && var.dimensions[0] == name;
        if (is_index || coordinate_names.contains(name)) {
            dataset.add_coordinate(std::move(var));
        } else {
            data_vars.push_back(std::move(var));
        }
    }

    for (auto& var : data_vars) {
        dataset.add_data_variable(std::move(var));
    }

    LOG_INFO("Opened store ",
             path.string(),
             " with ",
             dataset.data_variables().size(),
             " data variables and ",
             dataset.coordinates().size(),
             " coordinates");

    return dataset;
}

cf2zarr::Dataset
cf2zarr::open_multi_store(const fs::path& directory,
                          std::string_view pattern,
                          std::string_view dimension)
{
    const auto full_pattern = (directory / std::string(pattern)).string();

    glob_t matches{};
    const int rc = glob(full_pattern.c_str(), 0, nullptr, &matches);

    std::vector<std::string> paths;
    if (rc == 0) {
        paths.assign(matches.gl_pathv, matches.gl_pathv + matches.gl_pathc);
    }
    globfree(&matches);

    EXPECT_T(rc == 0 || rc == GLOB_NOMATCH,
             IOError,
             "Failed to expand ",
             full_pattern);
    EXPECT_T(!paths.empty(),
             NoMatchError,
             "No inputs match ",
             full_pattern);

    std::sort(paths.begin(), paths.end());

    std::optional<Dataset> combined;
    for (const auto& p : paths) {
        auto ds = open_store(p);
        EXPECT_T(ds.has_value(), StorageError, "Failed to open ", p);

        if (!combined.has_value()) {
            combined = std::move(ds);
        } else {
            const auto rebased = rebase_ordering(
              *ds, dimension, find_ordering_coordinate(*combined, dimension));
            combined = concat(*combined, rebased, dimension);
        }
    }

    LOG_INFO("Opened ", paths.size(), " input stores matching ", full_pattern);
    return sort_by_ordering(*combined, dimension);
}
