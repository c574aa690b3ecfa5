#include "staging.hh"
#include "macros.hh"
#include "s3.connection.hh"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace fs = std::filesystem;

namespace {
constexpr std::string_view s3_scheme = "s3://";
constexpr std::string_view file_scheme = "file://";
} // namespace

cf2zarr::StagingArea::StagingArea(const fs::path& parent)
  : owned_(false)
{
    const auto base = parent.empty() ? fs::temp_directory_path() : parent;

    std::string tmpl = (base / "cf2zarr-XXXXXX").string();
    EXPECT_T(mkdtemp(tmpl.data()) != nullptr,
             StagingError,
             "Failed to create staging directory in ",
             base.string(),
             ": ",
             std::strerror(errno));

    path_ = tmpl;
    owned_ = true;
    LOG_INFO("Created staging directory: ", path_.string());
}

cf2zarr::StagingArea::~StagingArea() noexcept
{
    remove();
}

void
cf2zarr::StagingArea::release_to(const fs::path& destination)
{
    EXPECT_T(owned_,
             StagingError,
             "Staging directory ",
             path_.string(),
             " is no longer available");

    std::error_code ec;
    fs::rename(path_, destination, ec);
    EXPECT_T(!ec,
             StagingError,
             "Failed to move ",
             path_.string(),
             " to ",
             destination.string(),
             ": ",
             ec.message());

    owned_ = false;
}

void
cf2zarr::StagingArea::remove() noexcept
{
    if (!owned_) {
        return;
    }
    owned_ = false;

    LOG_INFO("Cleaning up staging directory: ", path_.string());

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        LOG_ERROR("Failed to remove staging directory ",
                  path_.string(),
                  ": ",
                  ec.message());
    }
}

cf2zarr::RunContext::~RunContext() noexcept
{
    while (!areas_.empty()) {
        areas_.back()->remove();
        areas_.pop_back();
    }
}

cf2zarr::StagingArea&
cf2zarr::RunContext::acquire(const fs::path& parent)
{
    areas_.push_back(std::make_unique<StagingArea>(parent));
    return *areas_.back();
}

bool
cf2zarr::is_s3_url(std::string_view locator)
{
    return locator.starts_with(s3_scheme);
}

cf2zarr::S3Location
cf2zarr::parse_s3_url(std::string_view url)
{
    const auto scheme_end = url.find("://");
    EXPECT_T(scheme_end != std::string_view::npos && is_s3_url(url),
             StagingError,
             "Expected s3 URL, got '",
             url,
             "'");

    const auto rest = url.substr(s3_scheme.size());
    const auto slash = rest.find('/');

    S3Location location;
    location.bucket = std::string(rest.substr(0, slash));
    if (slash != std::string_view::npos) {
        location.prefix = std::string(rest.substr(slash + 1));
    }

    EXPECT_T(!location.bucket.empty(),
             StagingError,
             "No bucket in s3 URL '",
             url,
             "'");

    return location;
}

fs::path
cf2zarr::local_path(std::string_view locator)
{
    if (locator.starts_with(file_scheme)) {
        locator.remove_prefix(file_scheme.size());
    }
    return fs::path(locator);
}

fs::path
cf2zarr::stage_s3(std::string_view url,
                  S3Connection& connection,
                  RunContext& context)
{
    const auto location = parse_s3_url(url);

    const auto strip = location.prefix.rfind('/');
    const std::string strip_prefix = strip == std::string::npos
                                       ? location.prefix
                                       : location.prefix.substr(0, strip + 1);

    std::vector<std::string> keys;
    EXPECT_T(connection.list_objects(location.bucket, location.prefix, keys),
             StagingError,
             "Failed to list ",
             url);

    auto& area = context.acquire();
    for (const auto& key : keys) {
        std::string relative = key.starts_with(strip_prefix)
                                 ? key.substr(strip_prefix.size())
                                 : key;
        while (relative.starts_with('/')) {
            relative.erase(0, 1);
        }
        if (relative.empty()) {
            continue;
        }

        const auto destination = area.path() / relative;
        std::error_code ec;
        fs::create_directories(destination.parent_path(), ec);
        EXPECT_T(!ec,
                 StagingError,
                 "Failed to create ",
                 destination.parent_path().string(),
                 ": ",
                 ec.message());

        LOG_INFO("Downloading s3://",
                 location.bucket,
                 "/",
                 key,
                 " to ",
                 destination.string());
        EXPECT_T(connection.download_object(
                   location.bucket, key, destination.string()),
                 StagingError,
                 "Failed to download s3://",
                 location.bucket,
                 "/",
                 key);
    }

    return area.path();
}

fs::path
cf2zarr::stage_s3_store(std::string_view url,
                        S3Connection& connection,
                        RunContext& context)
{
    std::string_view trimmed = url;
    while (trimmed.ends_with('/')) {
        trimmed.remove_suffix(1);
    }

    const auto staged = stage_s3(trimmed, connection, context);
    const auto name = fs::path(trimmed.substr(s3_scheme.size())).filename();
    return staged / name;
}
