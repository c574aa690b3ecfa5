#pragma once

#include "sink.hh"

#include <fstream>
#include <string>
#include <string_view>

namespace cf2zarr {
class FileSink : public Sink
{
  public:
    /// Open @p filename for writing, creating missing parent directories.
    explicit FileSink(std::string_view filename);

    bool write(size_t offset, std::span<const std::byte> data) override;

  protected:
    bool flush_() override;

  private:
    std::string filename_;
    std::ofstream file_;
};
} // namespace cf2zarr
