#include "append.settings.hh"
#include "duration.hh"
#include "macros.hh"
#include "staging.hh"
#include "zarr.common.hh"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <limits>
#include <set>

namespace {
bool
validate_s3_settings(const cf2zarr::S3Settings& settings)
{
    if (cf2zarr::is_empty_string(settings.endpoint, "S3 endpoint is empty")) {
        return false;
    }

    if (settings.access_key_id.empty() != settings.secret_access_key.empty()) {
        LOG_ERROR("S3 access key ID and secret access key must be given "
                  "together");
        return false;
    }

    return true;
}

bool
validate_chunk_shape(const cf2zarr::ChunkShape& shape)
{
    if (shape.empty()) {
        LOG_ERROR("Chunk shape is empty");
        return false;
    }

    for (size_t i = 0; i < shape.size(); ++i) {
        if (shape[i] == 0) {
            LOG_ERROR("Invalid chunk size at position ", i, ": must be positive");
            return false;
        }
    }

    return true;
}
} // namespace

bool
cf2zarr::AppendSettings::has_existing() const
{
    const auto trimmed = trim(existing);
    return !trimmed.empty() && trimmed != "none";
}

bool
cf2zarr::AppendSettings::needs_s3() const
{
    return is_s3_url(input) || (has_existing() && is_s3_url(existing));
}

bool
cf2zarr::validate_settings(const AppendSettings& settings)
{
    if (is_empty_string(settings.input, "Input location is empty")) {
        return false;
    }

    if (is_empty_string(settings.output, "Output path is empty")) {
        return false;
    }

    if (is_s3_url(settings.output)) {
        LOG_ERROR("Output must be a local path, got ", settings.output);
        return false;
    }

    if (is_empty_string(settings.pattern, "Input pattern is empty")) {
        return false;
    }

    if (is_empty_string(settings.ordering_dimension,
                        "Ordering dimension is empty")) {
        return false;
    }

    for (const auto& name : settings.variables) {
        if (is_empty_string(name, "Variable name is empty")) {
            return false;
        }
    }

    if (settings.max_duration.has_value()) {
        try {
            parse_duration(*settings.max_duration);
        } catch (const InvalidSettingsError&) {
            return false; // already logged
        }
    }

    if (!validate_chunk_shape(settings.chunk_shape)) {
        return false;
    }

    if (!validate_compression_params(settings.compression)) {
        return false;
    }

    if (settings.create_mode >= Cf2ZarrCreateModeCount) {
        LOG_ERROR("Invalid create mode: ", settings.create_mode);
        return false;
    }

    if (settings.needs_s3()) {
        if (!settings.s3.has_value()) {
            LOG_ERROR("S3 settings are required for S3 locations");
            return false;
        }
        if (!validate_s3_settings(*settings.s3)) {
            return false;
        }
    }

    return true;
}

cf2zarr::AppendSettings
cf2zarr::settings_from_json(const nlohmann::json& config, AppendSettings base)
{
    EXPECT_T(config.is_object(),
             InvalidSettingsError,
             "Configuration must be a JSON object");

    static const std::set<std::string> known_keys{
        "input",       "existing", "output",      "pattern",
        "ordering_dimension",      "variables",   "max_duration",
        "chunks",      "compression",             "overwrite",
        "threads",     "s3",
    };
    for (const auto& [key, value] : config.items()) {
        EXPECT_T(known_keys.contains(key),
                 InvalidSettingsError,
                 "Unknown configuration key '",
                 key,
                 "'");
    }

    try {
        auto& s = base;
        s.input = config.value("input", s.input);
        s.existing = config.value("existing", s.existing);
        s.output = config.value("output", s.output);
        s.pattern = config.value("pattern", s.pattern);
        s.ordering_dimension =
          config.value("ordering_dimension", s.ordering_dimension);

        if (config.contains("variables")) {
            s.variables = config["variables"].get<std::vector<std::string>>();
        }

        if (config.contains("max_duration")) {
            if (config["max_duration"].is_null()) {
                s.max_duration.reset();
            } else {
                s.max_duration = config["max_duration"].get<std::string>();
            }
        }

        if (config.contains("chunks")) {
            EXPECT_T(config["chunks"].is_array(),
                     InvalidSettingsError,
                     "Configuration key 'chunks' must be an array");
            ChunkShape chunks;
            for (const auto& size : config["chunks"]) {
                EXPECT_T(size.is_number_unsigned() &&
                           size.get<uint64_t>() <=
                             std::numeric_limits<uint32_t>::max(),
                         InvalidSettingsError,
                         "Invalid chunk size ",
                         size.dump(),
                         " in configuration");
                chunks.push_back(size.get<uint32_t>());
            }
            s.chunk_shape = chunks;
        }

        if (config.contains("compression")) {
            const auto& c = config["compression"];
            s.compression.codec_id = c.value("codec", s.compression.codec_id);
            s.compression.clevel =
              static_cast<uint8_t>(c.value("level", int{ s.compression.clevel }));
            s.compression.shuffle = static_cast<uint8_t>(
              c.value("shuffle", int{ s.compression.shuffle }));
        }

        if (config.contains("overwrite")) {
            s.create_mode = config["overwrite"].get<bool>()
                              ? Cf2ZarrCreateMode_Overwrite
                              : Cf2ZarrCreateMode_Exclusive;
        }

        s.thread_count = config.value("threads", s.thread_count);

        if (config.contains("s3")) {
            const auto& j = config["s3"];
            S3Settings s3 = s.s3.value_or(S3Settings{});
            s3.endpoint = j.value("endpoint", s3.endpoint);
            s3.access_key_id = j.value("access_key_id", s3.access_key_id);
            s3.secret_access_key =
              j.value("secret_access_key", s3.secret_access_key);
            s.s3 = s3;
        }
    } catch (const nlohmann::json::exception& exc) {
        const std::string err =
          LOG_ERROR("Invalid configuration: ", exc.what());
        throw InvalidSettingsError(err);
    }

    return base;
}

cf2zarr::ChunkShape
cf2zarr::parse_chunk_shape(std::string_view text)
{
    ChunkShape chunks;

    size_t begin = 0;
    while (begin <= text.size()) {
        auto end = text.find(',', begin);
        if (end == std::string_view::npos) {
            end = text.size();
        }

        const auto item = trim(text.substr(begin, end - begin));
        uint32_t size = 0;
        const auto* first = item.data();
        const auto* last = item.data() + item.size();
        const auto [ptr, ec] = std::from_chars(first, last, size);
        EXPECT_T(!item.empty() && ec == std::errc() && ptr == last,
                 InvalidSettingsError,
                 "Invalid chunk size '",
                 item,
                 "' in '",
                 text,
                 "'");

        chunks.push_back(size);
        begin = end + 1;
    }

    return chunks;
}

cf2zarr::AppendSettings
cf2zarr::load_settings_file(const std::filesystem::path& path)
{
    std::ifstream file(path);
    EXPECT_T(file.is_open(),
             InvalidSettingsError,
             "Failed to open configuration file ",
             path.string());

    nlohmann::json config;
    try {
        config = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& exc) {
        const std::string err = LOG_ERROR(
          "Malformed configuration file ", path.string(), ": ", exc.what());
        throw InvalidSettingsError(err);
    }

    return settings_from_json(config);
}
