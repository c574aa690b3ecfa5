#pragma once

#include "blosc.compression.params.hh"
#include "cf2zarr.types.h"
#include "chunk.planner.hh"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cf2zarr {
struct S3Settings
{
    std::string endpoint;
    std::string access_key_id;
    std::string secret_access_key;
};

struct AppendSettings
{
    std::string input;    /* S3 URL prefix or local directory of inputs */
    std::string existing; /* Store to append to; empty or "none" for none */
    std::string output;   /* Local path of the store to write */

    std::string pattern{ "*.zarr" };
    std::string ordering_dimension{ "time" };
    std::vector<std::string> variables; /* empty: default selection */

    std::optional<std::string> max_duration;
    ChunkShape chunk_shape{ default_chunk_shape };
    BloscCompressionParams compression;

    Cf2ZarrCreateMode create_mode{ Cf2ZarrCreateMode_Exclusive };
    std::optional<S3Settings> s3;
    unsigned int thread_count{ 0 }; /* 0: one per hardware thread */

    /// True if there is an existing store to append to.
    bool has_existing() const;

    /// True if either locator needs an S3 connection.
    bool needs_s3() const;
};

/**
 * @brief Check every field of a set of settings.
 * @return True if the settings are usable, otherwise false. The first problem
 * is logged.
 */
[[nodiscard]]
bool
validate_settings(const AppendSettings& settings);

/**
 * @brief Parse a comma-separated chunk shape, e.g. "5,50,50".
 * @throw cf2zarr::InvalidSettingsError if an entry is not a non-negative
 * integer that fits in 32 bits.
 */
ChunkShape
parse_chunk_shape(std::string_view text);

/**
 * @brief Overlay the fields present in a JSON object onto @p base.
 * @details Recognized keys: "input", "existing", "output", "pattern",
 * "ordering_dimension", "variables", "max_duration", "chunks",
 * "compression" {"codec", "level", "shuffle"}, "overwrite", "threads", and
 * "s3" {"endpoint", "access_key_id", "secret_access_key"}.
 * @throw cf2zarr::InvalidSettingsError if a field has the wrong type or an
 * unknown key is present.
 */
AppendSettings
settings_from_json(const nlohmann::json& config, AppendSettings base = {});

/**
 * @brief Read settings from a JSON config file.
 * @throw cf2zarr::InvalidSettingsError if the file cannot be read or parsed.
 */
AppendSettings
load_settings_file(const std::filesystem::path& path);
} // namespace cf2zarr
