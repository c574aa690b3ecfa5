#pragma once

#include "cf2zarr.types.h"
#include "store.encoder.hh"
#include "thread.pool.hh"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace cf2zarr {
/**
 * @brief Writes an encoded dataset as a consolidated Zarr v2 group.
 * @details The store is assembled in a staging directory beside the
 * destination and moved into place once every chunk and metadata file has
 * been written. A failed write leaves the destination as it was.
 */
class StoreWriter
{
  public:
    StoreWriter(const std::filesystem::path& destination,
                Cf2ZarrCreateMode mode,
                std::shared_ptr<ThreadPool> thread_pool);

    /**
     * @brief Write @p encoded to the destination.
     * @throw cf2zarr::WriteConflictError if the destination exists and the
     * mode is exclusive.
     * @throw cf2zarr::IOError, cf2zarr::CompressionError on failure to write.
     */
    void write(const EncodedDataset& encoded);

    /**
     * @brief Fail early if the destination cannot be written in this mode.
     * @throw cf2zarr::WriteConflictError if the destination exists and the
     * mode is exclusive.
     */
    void check_destination() const;

  private:
    std::filesystem::path destination_;
    Cf2ZarrCreateMode mode_;
    std::shared_ptr<ThreadPool> thread_pool_;

    /// Write the chunks of one array. Returns the number of chunks written.
    size_t write_chunks_(const std::filesystem::path& array_dir,
                         const Variable& variable,
                         bool write_empty_chunks);
};

/// Zarr v2 array metadata (.zarray) for a variable.
nlohmann::json
make_array_metadata(const Variable& variable);

/**
 * @brief Array attributes (.zattrs) for a variable, with _ARRAY_DIMENSIONS and,
 * for data variables, the names of the non-dimension coordinates it carries.
 */
nlohmann::json
make_array_attributes(const Variable& variable,
                      const Dataset& dataset,
                      bool is_coordinate);

/**
 * @brief Write a buffer to a file through a FileSink.
 * @throw cf2zarr::IOError on failure.
 */
void
write_file(const std::filesystem::path& path, std::span<const std::byte> data);

/// Write pretty-printed JSON to a file.
void
write_json(const std::filesystem::path& path, const nlohmann::json& json);
} // namespace cf2zarr
