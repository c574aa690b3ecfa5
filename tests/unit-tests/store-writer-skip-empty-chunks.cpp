#include "chunk.planner.hh"
#include "store.encoder.hh"
#include "store.writer.hh"
#include "unit.test.datasets.hh"
#include "unit.test.macros.hh"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <limits>

namespace fs = std::filesystem;
namespace test = cf2zarr::test;

namespace {
nlohmann::json
read_json(const fs::path& path)
{
    std::ifstream f(path);
    EXPECT(f.is_open(), "Failed to open ", path.string());
    return nlohmann::json::parse(f);
}
} // namespace

int
main()
{
    int retval = 1;
    const fs::path base_dir = fs::temp_directory_path() / TEST;
    const fs::path destination = base_dir / "out.zarr";

    try {
        const double nan = std::numeric_limits<double>::quiet_NaN();

        // time 4 x space 4, chunked 2 x 2: only the chunk (1, 1) holds data
        cf2zarr::Dataset ds;
        ds.add_coordinate(test::int64_coordinate("time", { 1, 2, 3, 4 }));
        auto temp = test::float64_variable(
          "temp",
          { "time", "x" },
          { 4, 4 },
          { nan, nan, nan, nan,  //
            nan, nan, nan, nan,  //
            nan, nan, 1.0, 2.0,  //
            nan, nan, 3.0, nan });
        temp.fill_value = "NaN";
        temp.attributes["units"] = "K";
        ds.add_data_variable(std::move(temp));

        auto planned = cf2zarr::plan(std::move(ds), "time", { 2, 2 });
        const auto encoded = cf2zarr::encode(
          std::move(planned), cf2zarr::BloscCompressionParams("lz4", 5, 1));

        auto pool = std::make_shared<cf2zarr::ThreadPool>(
          4, [](const std::string& err) { LOG_ERROR(err); });
        cf2zarr::StoreWriter writer(
          destination, Cf2ZarrCreateMode_Exclusive, pool);
        writer.write(encoded);

        CHECK(!fs::exists(destination / "temp" / "0.0"));
        CHECK(!fs::exists(destination / "temp" / "0.1"));
        CHECK(!fs::exists(destination / "temp" / "1.0"));
        CHECK(fs::exists(destination / "temp" / "1.1"));

        // the coordinate has no fill value, so its chunks are always written
        CHECK(fs::exists(destination / "time" / "0"));
        CHECK(fs::exists(destination / "time" / "1"));

        const auto zarray = read_json(destination / "temp" / ".zarray");
        EXPECT_EQ(int, zarray["zarr_format"].get<int>(), 2);
        CHECK(zarray["shape"] == nlohmann::json::array({ 4, 4 }));
        CHECK(zarray["chunks"] == nlohmann::json::array({ 2, 2 }));
        EXPECT_STR_EQ(zarray["dtype"].get<std::string>().c_str(), "<f8");
        EXPECT_STR_EQ(zarray["fill_value"].get<std::string>().c_str(), "NaN");
        EXPECT_STR_EQ(zarray["compressor"]["cname"].get<std::string>().c_str(),
                      "lz4");
        EXPECT_STR_EQ(zarray["dimension_separator"].get<std::string>().c_str(),
                      ".");

        const auto zattrs = read_json(destination / "temp" / ".zattrs");
        CHECK(zattrs["_ARRAY_DIMENSIONS"] ==
              nlohmann::json::array({ "time", "x" }));
        EXPECT_STR_EQ(zattrs["units"].get<std::string>().c_str(), "K");

        const auto zmetadata = read_json(destination / ".zmetadata");
        EXPECT_EQ(int, zmetadata["zarr_consolidated_format"].get<int>(), 1);
        CHECK(zmetadata["metadata"].contains(".zgroup"));
        CHECK(zmetadata["metadata"].contains("temp/.zarray"));
        CHECK(zmetadata["metadata"].contains("time/.zattrs"));

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    std::error_code ec;
    fs::remove_all(base_dir, ec);

    return retval;
}
