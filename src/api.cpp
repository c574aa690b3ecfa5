#include "cf2zarr.h"
#include "append.settings.hh"
#include "macros.hh"
#include "pipeline.hh"

#include <cstdint> // uint32_t

namespace {
std::string
string_or(const char* s, const std::string& fallback)
{
    return s ? std::string(s) : fallback;
}

cf2zarr::AppendSettings
make_settings(const Cf2ZarrAppendSettings* settings)
{
    cf2zarr::AppendSettings s;
    s.input = string_or(settings->input, s.input);
    s.existing = string_or(settings->existing, s.existing);
    s.output = string_or(settings->output, s.output);
    s.pattern = string_or(settings->pattern, s.pattern);
    s.ordering_dimension =
      string_or(settings->ordering_dimension, s.ordering_dimension);

    for (size_t i = 0; settings->variables && i < settings->variable_count;
         ++i) {
        s.variables.emplace_back(string_or(settings->variables[i], ""));
    }

    if (settings->max_duration && *settings->max_duration != '\0') {
        s.max_duration = settings->max_duration;
    }

    if (settings->chunk_shape && settings->chunk_shape_count > 0) {
        s.chunk_shape.assign(settings->chunk_shape,
                             settings->chunk_shape + settings->chunk_shape_count);
    }

    if (const auto* c = settings->compression_settings; c) {
        if (c->codec >= Cf2ZarrCompressionCodecCount) {
            LOG_ERROR("Invalid compression codec: ", c->codec);
            s.compression.codec_id = "";
        } else {
            s.compression.codec_id = cf2zarr::blosc_codec_to_string(c->codec);
        }
        s.compression.clevel = c->level;
        s.compression.shuffle = c->shuffle;
    }

    if (const auto* s3 = settings->s3_settings; s3) {
        s.s3 = cf2zarr::S3Settings{ string_or(s3->endpoint, ""),
                                    string_or(s3->access_key_id, ""),
                                    string_or(s3->secret_access_key, "") };
    }

    s.create_mode = settings->create_mode;
    s.thread_count = settings->thread_count;

    return s;
}
} // namespace

extern "C"
{
    uint32_t Cf2Zarr_get_api_version()
    {
        return CF2ZARR_API_VERSION;
    }

    Cf2ZarrStatusCode Cf2Zarr_set_log_level(Cf2ZarrLogLevel level)
    {
        EXPECT_VALID_ARGUMENT(
          level < Cf2ZarrLogLevelCount, "Invalid log level: ", level);

        Logger::set_log_level(level);
        return Cf2ZarrStatusCode_Success;
    }

    Cf2ZarrLogLevel Cf2Zarr_get_log_level()
    {
        return Logger::get_log_level();
    }

    const char* Cf2Zarr_get_status_message(Cf2ZarrStatusCode status)
    {
        switch (status) {
            case Cf2ZarrStatusCode_Success:
                return "Success";
            case Cf2ZarrStatusCode_InvalidArgument:
                return "Invalid argument";
            case Cf2ZarrStatusCode_SelectionError:
                return "Requested variable not found";
            case Cf2ZarrStatusCode_AxisMismatch:
                return "Datasets disagree on dimensions";
            case Cf2ZarrStatusCode_NoOrderingCoordinate:
                return "No ordering coordinate";
            case Cf2ZarrStatusCode_NoMatch:
                return "No input matched the pattern";
            case Cf2ZarrStatusCode_WriteConflict:
                return "Destination already exists";
            case Cf2ZarrStatusCode_IOError:
                return "I/O error";
            case Cf2ZarrStatusCode_CompressionError:
                return "Compression error";
            case Cf2ZarrStatusCode_StorageFormatError:
                return "Malformed store";
            case Cf2ZarrStatusCode_StagingError:
                return "Staging error";
            case Cf2ZarrStatusCode_InvalidSettings:
                return "Invalid settings";
            case Cf2ZarrStatusCode_NotYetImplemented:
                return "Not yet implemented";
            case Cf2ZarrStatusCode_InternalError:
                return "Internal error";
            default:
                return "Unknown error";
        }
    }

    Cf2ZarrStatusCode Cf2Zarr_append(const Cf2ZarrAppendSettings* settings)
    {
        EXPECT_VALID_ARGUMENT(settings, "Null pointer: settings");

        try {
            cf2zarr::append(make_settings(settings));
        } catch (const cf2zarr::Error& e) {
            LOG_ERROR("Append failed: ", e.what());
            return e.status();
        } catch (const std::exception& e) {
            LOG_ERROR("Append failed: ", e.what());
            return Cf2ZarrStatusCode_InternalError;
        }

        return Cf2ZarrStatusCode_Success;
    }
}
