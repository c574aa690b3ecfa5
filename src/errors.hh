#pragma once

#include "cf2zarr.types.h"

#include <stdexcept>
#include <string>

namespace cf2zarr {
/**
 * @brief Base of every error that aborts an append run.
 * @details Each error carries the status code that the C API and the command
 * line tool report for it.
 */
class Error : public std::runtime_error
{
  public:
    Error(Cf2ZarrStatusCode status, const std::string& what)
      : std::runtime_error(what)
      , status_{ status }
    {
    }

    Cf2ZarrStatusCode status() const noexcept { return status_; }

  private:
    Cf2ZarrStatusCode status_;
};

#define CF2ZARR_DEFINE_ERROR(Name, Status)                                     \
    class Name : public Error                                                  \
    {                                                                          \
      public:                                                                  \
        explicit Name(const std::string& what)                                 \
          : Error(Status, what)                                                \
        {                                                                      \
        }                                                                      \
    }

/// A requested variable is absent from the input.
CF2ZARR_DEFINE_ERROR(SelectionError, Cf2ZarrStatusCode_SelectionError);

/// Existing and incoming datasets disagree on dimensions or shapes.
CF2ZARR_DEFINE_ERROR(AxisMismatchError, Cf2ZarrStatusCode_AxisMismatch);

/// The ordering dimension has no unambiguous integer coordinate.
CF2ZARR_DEFINE_ERROR(NoOrderingCoordinateError,
                     Cf2ZarrStatusCode_NoOrderingCoordinate);

/// No input matched the glob pattern.
CF2ZARR_DEFINE_ERROR(NoMatchError, Cf2ZarrStatusCode_NoMatch);

/// The destination exists and exclusive creation was requested.
CF2ZARR_DEFINE_ERROR(WriteConflictError, Cf2ZarrStatusCode_WriteConflict);

CF2ZARR_DEFINE_ERROR(InvalidSettingsError, Cf2ZarrStatusCode_InvalidSettings);
CF2ZARR_DEFINE_ERROR(StorageError, Cf2ZarrStatusCode_StorageFormatError);
CF2ZARR_DEFINE_ERROR(IOError, Cf2ZarrStatusCode_IOError);
CF2ZARR_DEFINE_ERROR(CompressionError, Cf2ZarrStatusCode_CompressionError);
CF2ZARR_DEFINE_ERROR(StagingError, Cf2ZarrStatusCode_StagingError);
CF2ZARR_DEFINE_ERROR(NotYetImplementedError,
                     Cf2ZarrStatusCode_NotYetImplemented);

#undef CF2ZARR_DEFINE_ERROR
} // namespace cf2zarr
