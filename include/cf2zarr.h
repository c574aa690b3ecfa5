#ifndef H_CF2ZARR_V0
#define H_CF2ZARR_V0

#include "cf2zarr.types.h"

#define CF2ZARR_API_VERSION 0

#ifdef __cplusplus
extern "C"
{
#endif

    /**
     * @brief The settings for a single append run.
     * @details An append run stages the input data, opens the existing store
     * (if any), merges the two along the ordering dimension, drops duplicate
     * samples, optionally trims to a maximum duration, and writes the result
     * as a new store at @p output.
     * @note @p input and @p existing may be S3 URLs ("s3://bucket/prefix") or
     * local paths. An empty @p existing, or "none", means there is no store to
     * append to.
     * @note @p max_duration is an ISO 8601 duration ("P30D") or a
     * pandas-style duration ("30 days", "36h"). NULL or empty means the
     * retention is unbounded.
     */
    typedef struct Cf2ZarrAppendSettings_s
    {
        const char* input;    /**< S3 URL prefix or local directory of inputs. */
        const char* existing; /**< Existing store to append to. */
        const char* output;   /**< Local path of the store to write. */
        const char* pattern;  /**< Glob pattern of input stores. */
        const char* ordering_dimension; /**< Name of the time dimension. */
        const char** variables;  /**< Variables to keep. May be NULL. */
        size_t variable_count;   /**< The number of entries in @p variables. */
        const char* max_duration; /**< Retention window. May be NULL. */
        const uint32_t* chunk_shape; /**< Chunk sizes, ordering dim first. */
        size_t chunk_shape_count;    /**< The number of entries in @p chunk_shape. */
        Cf2ZarrCompressionSettings* compression_settings; /**< Optional. */
        Cf2ZarrS3Settings* s3_settings; /**< Required for S3 locators. */
        Cf2ZarrCreateMode create_mode;  /**< Exclusive or overwrite. */
        unsigned int thread_count; /**< Writer threads. 0 selects a default. */
    } Cf2ZarrAppendSettings;

    /**
     * @brief Get the version of the cf2zarr API.
     * @return The version of the cf2zarr API.
     */
    uint32_t Cf2Zarr_get_api_version();

    /**
     * @brief Set the log level for the cf2zarr API.
     * @param level The log level.
     * @return Cf2ZarrStatusCode_Success on success, or an error code on
     * failure.
     */
    Cf2ZarrStatusCode Cf2Zarr_set_log_level(Cf2ZarrLogLevel level);

    /**
     * @brief Get the log level for the cf2zarr API.
     * @return The log level for the cf2zarr API.
     */
    Cf2ZarrLogLevel Cf2Zarr_get_log_level();

    /**
     * @brief Get the message for the given status code.
     * @param status The status code.
     * @return A human-readable status message.
     */
    const char* Cf2Zarr_get_status_message(Cf2ZarrStatusCode status);

    /**
     * @brief Run one append.
     * @details This function blocks until the output store has been written
     * or the run has failed. Staging areas are removed before it returns.
     * @param[in] settings The settings for the run.
     * @return Cf2ZarrStatusCode_Success on success, or an error code on
     * failure.
     */
    Cf2ZarrStatusCode Cf2Zarr_append(const Cf2ZarrAppendSettings* settings);

#ifdef __cplusplus
}
#endif

#endif // H_CF2ZARR_V0
