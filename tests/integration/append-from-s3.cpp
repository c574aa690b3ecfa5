#include "cf2zarr.h"
#include "test.macros.hh"

#include <miniocpp/client.h>
#include <miniocpp/utils.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <list>
#include <map>
#include <vector>

namespace fs = std::filesystem;

namespace {
std::string s3_endpoint, s3_bucket_name, s3_access_key_id, s3_secret_access_key;

const std::string prefix = "cf2zarr-" TEST "/incoming/";
const fs::path output_path = fs::temp_directory_path() / TEST / "store.zarr";

bool
get_credentials()
{
    char* env = nullptr;
    if (!(env = std::getenv("ZARR_S3_ENDPOINT"))) {
        LOG_ERROR("ZARR_S3_ENDPOINT not set.");
        return false;
    }
    s3_endpoint = env;

    if (!(env = std::getenv("ZARR_S3_BUCKET_NAME"))) {
        LOG_ERROR("ZARR_S3_BUCKET_NAME not set.");
        return false;
    }
    s3_bucket_name = env;

    if (!(env = std::getenv("ZARR_S3_ACCESS_KEY_ID"))) {
        LOG_ERROR("ZARR_S3_ACCESS_KEY_ID not set.");
        return false;
    }
    s3_access_key_id = env;

    if (!(env = std::getenv("ZARR_S3_SECRET_ACCESS_KEY"))) {
        LOG_ERROR("ZARR_S3_SECRET_ACCESS_KEY not set.");
        return false;
    }
    s3_secret_access_key = env;

    return true;
}

std::string
to_string(const std::vector<int64_t>& values)
{
    return std::string(reinterpret_cast<const char*>(values.data()),
                       values.size() * sizeof(int64_t));
}

std::string
array_metadata(size_t length)
{
    return nlohmann::json{ { "zarr_format", 2 },
                           { "shape", std::vector<size_t>{ length } },
                           { "chunks", std::vector<size_t>{ length } },
                           { "dtype", "<i8" },
                           { "compressor", nullptr },
                           { "fill_value", nullptr },
                           { "order", "C" },
                           { "filters", nullptr } }
      .dump();
}

/// Object keys and contents of two uncompressed hourly input stores.
std::map<std::string, std::string>
input_objects()
{
    std::map<std::string, std::string> objects;
    const std::vector<std::pair<std::string, std::vector<int64_t>>> stores{
        { "b.zarr", { 3, 4 } },
        { "a.zarr", { 1, 2, 3 } },
    };

    for (const auto& [store, hours] : stores) {
        const auto root = prefix + store + "/";
        objects[root + ".zgroup"] = R"({"zarr_format": 2})";
        objects[root + ".zattrs"] = "{}";

        objects[root + "time/.zarray"] = array_metadata(hours.size());
        objects[root + "time/.zattrs"] =
          R"({"_ARRAY_DIMENSIONS": ["time"], "units": "hours since 2024-01-01"})";
        objects[root + "time/0"] = to_string(hours);

        std::vector<int64_t> counts;
        for (auto h : hours) {
            counts.push_back(100 + h);
        }
        objects[root + "count/.zarray"] = array_metadata(hours.size());
        objects[root + "count/.zattrs"] = R"({"_ARRAY_DIMENSIONS": ["time"]})";
        objects[root + "count/0"] = to_string(counts);
    }

    return objects;
}

bool
put_object(minio::s3::Client& client,
           const std::string& object_name,
           std::string& contents)
{
    minio::utils::CharBuffer buffer(contents.data(), contents.size());
    std::basic_istream stream(&buffer);

    minio::s3::PutObjectArgs args(stream, static_cast<long>(contents.size()), 0);
    args.bucket = s3_bucket_name;
    args.object = object_name;

    auto response = client.PutObject(args);
    if (!response) {
        LOG_ERROR("Failed to put object ",
                  object_name,
                  ": ",
                  response.Error().String());
        return false;
    }

    return true;
}

bool
remove_items(minio::s3::Client& client,
             const std::vector<std::string>& item_keys)
{
    std::list<minio::s3::DeleteObject> objects;
    for (const auto& key : item_keys) {
        minio::s3::DeleteObject object;
        object.name = key;
        objects.push_back(object);
    }

    minio::s3::RemoveObjectsArgs args;
    args.bucket = s3_bucket_name;

    auto it = objects.begin();
    args.func = [&objects = objects,
                 &i = it](minio::s3::DeleteObject& obj) -> bool {
        if (i == objects.end())
            return false;
        obj = *i;
        i++;
        return true;
    };

    minio::s3::RemoveObjectsResult result = client.RemoveObjects(args);
    for (; result; result++) {
        minio::s3::DeleteError err = *result;
        if (!err) {
            LOG_ERROR("Failed to delete object ", err.object_name, ": ",
                      err.message);
            return false;
        }
    }

    return true;
}
} // namespace

int
main()
{
    if (!get_credentials()) {
        LOG_WARNING("Failed to get credentials. Skipping test.");
        return 0;
    }

    int retval = 1;

    minio::s3::BaseUrl url(s3_endpoint);
    url.https = s3_endpoint.starts_with("https");

    minio::creds::StaticProvider provider(s3_access_key_id,
                                          s3_secret_access_key);
    minio::s3::Client client(url, &provider);

    auto objects = input_objects();
    std::vector<std::string> keys;

    try {
        for (auto& [key, contents] : objects) {
            CHECK(put_object(client, key, contents));
            keys.push_back(key);
        }

        const auto input = "s3://" + s3_bucket_name + "/" + prefix;
        const auto output = output_path.string();

        Cf2ZarrS3Settings s3_settings{
            .endpoint = s3_endpoint.c_str(),
            .access_key_id = s3_access_key_id.c_str(),
            .secret_access_key = s3_secret_access_key.c_str(),
        };

        Cf2ZarrAppendSettings settings{};
        settings.input = input.c_str();
        settings.existing = "none";
        settings.output = output.c_str();
        settings.s3_settings = &s3_settings;
        settings.create_mode = Cf2ZarrCreateMode_Overwrite;

        CHECK_OK(Cf2Zarr_append(&settings));

        std::ifstream file(output_path / ".zmetadata");
        CHECK(file.is_open());
        const auto metadata = nlohmann::json::parse(file)["metadata"];

        // hour 3 is in both stores
        CHECK(metadata["time/.zarray"]["shape"] ==
              nlohmann::json::array({ 4 }));
        CHECK(metadata["count/.zarray"]["shape"] ==
              nlohmann::json::array({ 4 }));
        CHECK(metadata.contains("count/.zattrs"));

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    if (!remove_items(client, keys)) {
        retval = 1;
    }

    std::error_code ec;
    fs::remove_all(output_path.parent_path(), ec);

    return retval;
}
