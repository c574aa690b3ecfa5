#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cf2zarr {
class S3Connection;

/**
 * @brief A temporary directory that is removed when the handle goes away,
 * unless it has been moved into place with release_to().
 */
class StagingArea
{
  public:
    /**
     * @brief Create a fresh, uniquely named directory.
     * @param parent The directory to create it in. Empty for the system
     * temporary directory.
     * @throw cf2zarr::StagingError if the directory cannot be created.
     */
    explicit StagingArea(const std::filesystem::path& parent = {});
    ~StagingArea() noexcept;

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

    /// False once the directory has been removed or released.
    bool is_owned() const noexcept { return owned_; }

    /**
     * @brief Rename the staging directory to @p destination. The directory is
     * no longer removed on destruction.
     * @throw cf2zarr::StagingError if the rename fails.
     */
    void release_to(const std::filesystem::path& destination);

    /// Remove the directory and everything in it. Failures are logged.
    void remove() noexcept;

  private:
    std::filesystem::path path_;
    bool owned_;
};

/**
 * @brief Owns the staging areas of one run and removes them, latest first,
 * when the run ends, whether it succeeded or failed.
 */
class RunContext
{
  public:
    RunContext() = default;
    ~RunContext() noexcept;

    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;

    /// Create a staging area that lives as long as this context.
    StagingArea& acquire(const std::filesystem::path& parent = {});

    size_t size() const noexcept { return areas_.size(); }

  private:
    std::vector<std::unique_ptr<StagingArea>> areas_;
};

struct S3Location
{
    std::string bucket;
    std::string prefix;
};

/// True if @p locator has the s3:// scheme.
bool
is_s3_url(std::string_view locator);

/**
 * @brief Split an "s3://bucket/prefix" URL.
 * @throw cf2zarr::StagingError if the scheme is not s3 or the bucket is
 * missing.
 */
S3Location
parse_s3_url(std::string_view url);

/**
 * @brief Strip a "file://" scheme from a local locator.
 */
std::filesystem::path
local_path(std::string_view locator);

/**
 * @brief Download every object under an S3 prefix into a new staging area.
 * @details Object keys lose the part of the prefix up to and including its
 * last '/', so "s3://b/in/day1/" stages "in/day1/a.zarr/.zarray" as
 * "a.zarr/.zarray" and "s3://b/in/day" stages it as "day1/a.zarr/.zarray".
 * @return The staging directory.
 * @throw cf2zarr::StagingError if the listing or a download fails.
 */
std::filesystem::path
stage_s3(std::string_view url, S3Connection& connection, RunContext& context);

/**
 * @brief Download a store from S3 into a new staging area.
 * @return The local path of the store, named after the last component of
 * @p url.
 */
std::filesystem::path
stage_s3_store(std::string_view url,
               S3Connection& connection,
               RunContext& context);
} // namespace cf2zarr
