#pragma once

#include <miniocpp/client.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cf2zarr {
class S3Connection
{
  public:
    S3Connection(const std::string& endpoint,
                 const std::string& access_key_id,
                 const std::string& secret_access_key);

    /**
     * @brief Test a connection by listing all buckets at this connection's
     * endpoint.
     * @returns True if the connection is valid, otherwise false.
     */
    bool is_connection_valid();

    /* Bucket operations */

    /**
     * @brief Check whether a bucket exists.
     * @param bucket_name The name of the bucket.
     * @returns True if the bucket exists, otherwise false.
     * @throws std::runtime_error if the bucket name is empty.
     */
    bool bucket_exists(std::string_view bucket_name);

    /* Object operations */

    /**
     * @brief List every object under a prefix, recursively.
     * @param bucket_name The name of the bucket.
     * @param prefix The key prefix. May be empty.
     * @param[out] object_names The keys of the listed objects.
     * @returns True if the listing completed, otherwise false.
     * @throws std::runtime_error if the bucket name is empty.
     */
    [[nodiscard]] bool list_objects(std::string_view bucket_name,
                                    std::string_view prefix,
                                    std::vector<std::string>& object_names);

    /**
     * @brief Download an object to a local file, replacing it if present.
     * @param bucket_name The name of the bucket containing the object.
     * @param object_name The name of the object.
     * @param filename The local file to write.
     * @returns True if the object was downloaded, otherwise false.
     * @throws std::runtime_error if any argument is empty.
     */
    [[nodiscard]] bool download_object(std::string_view bucket_name,
                                       std::string_view object_name,
                                       const std::string& filename);

  private:
    std::unique_ptr<minio::creds::StaticProvider> provider_;
    std::unique_ptr<minio::s3::Client> client_;
};
} // namespace cf2zarr
