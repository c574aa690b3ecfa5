#include "append.settings.hh"
#include "unit.test.macros.hh"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {
cf2zarr::AppendSettings
local_settings()
{
    cf2zarr::AppendSettings settings;
    settings.input = "data/incoming";
    settings.output = "data/store.zarr";
    return settings;
}
} // namespace

int
main()
{
    int retval = 1;
    const fs::path config_path = fs::temp_directory_path() / TEST;

    try {
        auto settings = local_settings();
        CHECK(cf2zarr::validate_settings(settings));
        CHECK(!settings.has_existing());
        CHECK(!settings.needs_s3());

        settings.existing = "none";
        CHECK(!settings.has_existing());
        settings.existing = "data/store.zarr";
        CHECK(settings.has_existing());

        // bad fields
        settings = local_settings();
        settings.input = "  ";
        CHECK(!cf2zarr::validate_settings(settings));

        settings = local_settings();
        settings.output = "s3://bucket/store.zarr";
        CHECK(!cf2zarr::validate_settings(settings));

        settings = local_settings();
        settings.max_duration = "2 fortnights";
        CHECK(!cf2zarr::validate_settings(settings));
        settings.max_duration = "P2D";
        CHECK(cf2zarr::validate_settings(settings));

        settings = local_settings();
        settings.chunk_shape = { 5, 0, 50 };
        CHECK(!cf2zarr::validate_settings(settings));
        settings.chunk_shape.clear();
        CHECK(!cf2zarr::validate_settings(settings));

        settings = local_settings();
        settings.compression.codec_id = "snappy";
        CHECK(!cf2zarr::validate_settings(settings));

        settings = local_settings();
        settings.compression.clevel = 10;
        CHECK(!cf2zarr::validate_settings(settings));

        // S3 inputs need an endpoint
        settings = local_settings();
        settings.input = "s3://bucket/incoming/";
        CHECK(settings.needs_s3());
        CHECK(!cf2zarr::validate_settings(settings));
        settings.s3 = cf2zarr::S3Settings{ "http://localhost:9000", "key", "" };
        CHECK(!cf2zarr::validate_settings(settings));
        settings.s3->secret_access_key = "secret";
        CHECK(cf2zarr::validate_settings(settings));

        // JSON overlays
        const auto config = nlohmann::json::parse(R"({
            "input": "s3://bucket/incoming/",
            "existing": "s3://bucket/store.zarr",
            "variables": ["temp", "salt"],
            "max_duration": "36h",
            "chunks": [10, 20, 20],
            "compression": {"codec": "zstd", "level": 3, "shuffle": 2},
            "overwrite": true,
            "threads": 2,
            "s3": {"endpoint": "http://localhost:9000"}
        })");
        const auto loaded = cf2zarr::settings_from_json(config, local_settings());
        EXPECT_STR_EQ(loaded.input.c_str(), "s3://bucket/incoming/");
        EXPECT_STR_EQ(loaded.output.c_str(), "data/store.zarr");
        EXPECT_STR_EQ(loaded.pattern.c_str(), "*.zarr");
        CHECK(loaded.variables ==
              std::vector<std::string>({ "temp", "salt" }));
        CHECK(loaded.max_duration == std::optional<std::string>("36h"));
        CHECK(loaded.chunk_shape == cf2zarr::ChunkShape({ 10, 20, 20 }));
        EXPECT_STR_EQ(loaded.compression.codec_id.c_str(), "zstd");
        EXPECT_EQ(int, loaded.compression.clevel, 3);
        EXPECT_EQ(int, loaded.compression.shuffle, 2);
        EXPECT_EQ(int, loaded.create_mode, Cf2ZarrCreateMode_Overwrite);
        EXPECT_EQ(unsigned int, loaded.thread_count, 2);
        CHECK(loaded.s3.has_value());
        EXPECT_STR_EQ(loaded.s3->endpoint.c_str(), "http://localhost:9000");
        CHECK(cf2zarr::validate_settings(loaded));

        EXPECT_THROWS(cf2zarr::InvalidSettingsError,
                      cf2zarr::settings_from_json(
                        nlohmann::json::parse(R"({"max_span": "2D"})")));
        EXPECT_THROWS(cf2zarr::InvalidSettingsError,
                      cf2zarr::settings_from_json(
                        nlohmann::json::parse(R"({"chunks": "5,50,50"})")));
        EXPECT_THROWS(
          cf2zarr::InvalidSettingsError,
          cf2zarr::settings_from_json(nlohmann::json::parse("[1, 2]")));
        EXPECT_THROWS(cf2zarr::InvalidSettingsError,
                      cf2zarr::settings_from_json(
                        nlohmann::json::parse(R"({"chunks": [5, 5000000000]})")));
        EXPECT_THROWS(cf2zarr::InvalidSettingsError,
                      cf2zarr::settings_from_json(
                        nlohmann::json::parse(R"({"chunks": [5, -1]})")));

        // chunk shapes from the command line
        CHECK(cf2zarr::parse_chunk_shape("5,50,50") ==
              cf2zarr::ChunkShape({ 5, 50, 50 }));
        CHECK(cf2zarr::parse_chunk_shape(" 10 , 4294967295") ==
              cf2zarr::ChunkShape({ 10, 4294967295u }));
        EXPECT_THROWS(cf2zarr::InvalidSettingsError,
                      cf2zarr::parse_chunk_shape("5,4294967296"));
        EXPECT_THROWS(cf2zarr::InvalidSettingsError,
                      cf2zarr::parse_chunk_shape("99999999999999999999999"));
        EXPECT_THROWS(cf2zarr::InvalidSettingsError,
                      cf2zarr::parse_chunk_shape("5,-1"));
        EXPECT_THROWS(cf2zarr::InvalidSettingsError,
                      cf2zarr::parse_chunk_shape("5,,5"));
        EXPECT_THROWS(cf2zarr::InvalidSettingsError,
                      cf2zarr::parse_chunk_shape("5x5"));
        EXPECT_THROWS(cf2zarr::InvalidSettingsError,
                      cf2zarr::parse_chunk_shape(""));

        // config files
        {
            std::ofstream file(config_path);
            file << R"({"input": "in", "output": "out.zarr", "pattern": "*.nc.zarr"})";
        }
        const auto from_file = cf2zarr::load_settings_file(config_path);
        EXPECT_STR_EQ(from_file.pattern.c_str(), "*.nc.zarr");
        CHECK(cf2zarr::validate_settings(from_file));

        {
            std::ofstream file(config_path);
            file << "{ not json";
        }
        EXPECT_THROWS(cf2zarr::InvalidSettingsError,
                      cf2zarr::load_settings_file(config_path));
        EXPECT_THROWS(cf2zarr::InvalidSettingsError,
                      cf2zarr::load_settings_file(config_path / "missing"));

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    std::error_code ec;
    fs::remove(config_path, ec);

    return retval;
}
