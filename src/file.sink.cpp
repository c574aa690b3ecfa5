#include "file.sink.hh"
#include "macros.hh"

#include <filesystem>

namespace fs = std::filesystem;

cf2zarr::FileSink::FileSink(std::string_view filename)
  : filename_(filename)
{
    const auto parent = fs::path(filename_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        EXPECT_T(!ec,
                 IOError,
                 "Failed to create directory ",
                 parent.string(),
                 ": ",
                 ec.message());
    }

    file_.open(filename_, std::ios::binary | std::ios::trunc);
    EXPECT_T(file_.is_open(), IOError, "Failed to open file ", filename_);
}

bool
cf2zarr::FileSink::write(size_t offset, std::span<const std::byte> data)
{
    const auto bytes_of_buf = data.size();
    if (data.data() == nullptr || bytes_of_buf == 0) {
        return true;
    }

    file_.seekp(static_cast<std::streamoff>(offset));
    file_.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(bytes_of_buf));
    if (!file_) {
        LOG_ERROR("Failed to write ", bytes_of_buf, " bytes to ", filename_);
        return false;
    }

    return true;
}

bool
cf2zarr::FileSink::flush_()
{
    file_.flush();
    if (!file_) {
        LOG_ERROR("Failed to flush ", filename_);
        return false;
    }

    file_.close();
    return true;
}
