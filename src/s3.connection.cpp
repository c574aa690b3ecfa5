#include "s3.connection.hh"
#include "macros.hh"

cf2zarr::S3Connection::S3Connection(const std::string& endpoint,
                                    const std::string& access_key_id,
                                    const std::string& secret_access_key)
{
    minio::s3::BaseUrl url(endpoint);
    url.https = endpoint.starts_with("https");

    provider_ = std::make_unique<minio::creds::StaticProvider>(
      access_key_id, secret_access_key);
    client_ = std::make_unique<minio::s3::Client>(url, provider_.get());

    CHECK(client_);
}

bool
cf2zarr::S3Connection::is_connection_valid()
{
    return static_cast<bool>(client_->ListBuckets());
}

bool
cf2zarr::S3Connection::bucket_exists(std::string_view bucket_name)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");

    minio::s3::BucketExistsArgs args;
    args.bucket = bucket_name;

    auto response = client_->BucketExists(args);
    return response.exist;
}

bool
cf2zarr::S3Connection::list_objects(std::string_view bucket_name,
                                    std::string_view prefix,
                                    std::vector<std::string>& object_names)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");

    LOG_DEBUG("Listing objects under ", prefix, " in bucket ", bucket_name);
    minio::s3::ListObjectsArgs args;
    args.bucket = bucket_name;
    args.prefix = prefix;
    args.recursive = true;

    object_names.clear();
    auto result = client_->ListObjects(args);
    for (; result; result++) {
        minio::s3::Item item = *result;
        if (!item) {
            LOG_ERROR("Failed to list objects under ",
                      prefix,
                      " in bucket ",
                      bucket_name,
                      ": ",
                      item.Error().String());
            return false;
        }

        if (!item.is_prefix) {
            object_names.push_back(item.name);
        }
    }

    return true;
}

bool
cf2zarr::S3Connection::download_object(std::string_view bucket_name,
                                       std::string_view object_name,
                                       const std::string& filename)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");
    EXPECT(!filename.empty(), "Filename must not be empty.");

    LOG_DEBUG("Downloading object ",
              object_name,
              " from bucket ",
              bucket_name,
              " to ",
              filename);
    minio::s3::DownloadObjectArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.filename = filename;
    args.overwrite = true;

    auto response = client_->DownloadObject(args);
    if (!response) {
        LOG_ERROR("Failed to download object ",
                  object_name,
                  " from bucket ",
                  bucket_name,
                  ": ",
                  response.Error().String());
        return false;
    }

    return true;
}
