#include "chunk.planner.hh"
#include "store.encoder.hh"
#include "store.reader.hh"
#include "store.writer.hh"
#include "unit.test.datasets.hh"
#include "unit.test.macros.hh"

#include <filesystem>

namespace fs = std::filesystem;
namespace test = cf2zarr::test;

int
main()
{
    int retval = 1;
    const fs::path base_dir = fs::temp_directory_path() / TEST;
    const fs::path destination = base_dir / "store.zarr";

    try {
        CHECK(!cf2zarr::open_store(destination).has_value());

        // ragged chunks along both dimensions, with a non-dimension
        // coordinate and a 0-d variable
        std::vector<double> values(7 * 5);
        for (size_t i = 0; i < values.size(); ++i) {
            values[i] = static_cast<double>(i);
        }

        cf2zarr::Dataset ds;
        ds.attributes["title"] = "ragged";
        auto time = test::int64_coordinate("time", { 1, 2, 3, 4, 5, 6, 7 });
        time.attributes["units"] = "hours since 2000-01-01";
        ds.add_coordinate(std::move(time));
        ds.add_coordinate(test::float64_variable(
          "station_height", { "x" }, { 5 }, { 10, 20, 30, 40, 50 }));
        auto temp =
          test::float64_variable("temp", { "time", "x" }, { 7, 5 }, values);
        temp.fill_value = 0.0;
        ds.add_data_variable(std::move(temp));
        ds.add_data_variable(
          test::float64_variable("scale", {}, {}, { 0.25 }));

        auto pool = std::make_shared<cf2zarr::ThreadPool>(
          2, [](const std::string& err) { LOG_ERROR(err); });
        cf2zarr::StoreWriter writer(
          destination, Cf2ZarrCreateMode_Exclusive, pool);
        writer.write(cf2zarr::encode(cf2zarr::plan(ds, "time", { 3, 2 }),
                                     cf2zarr::BloscCompressionParams()));

        // the chunk holding the fill value 0.0 at (0, 0) still has data
        CHECK(fs::exists(destination / "temp" / "0.0"));
        CHECK(fs::exists(destination / "temp" / "2.2"));
        CHECK(fs::exists(destination / "scale" / "0"));

        const auto loaded = cf2zarr::open_store(destination);
        CHECK(loaded.has_value());

        EXPECT_STR_EQ(loaded->attributes["title"].get<std::string>().c_str(),
                      "ragged");
        EXPECT_EQ(size_t, loaded->data_variables().size(), 2);
        EXPECT_EQ(size_t, loaded->coordinates().size(), 2);

        // station_height is listed as a coordinate of temp
        CHECK(loaded->find_coordinate("station_height") != nullptr);
        CHECK(loaded->find_data_variable("station_height") == nullptr);

        const auto* loaded_temp = loaded->find_data_variable("temp");
        CHECK(loaded_temp != nullptr);
        CHECK(loaded_temp->shape == std::vector<size_t>({ 7, 5 }));
        CHECK(loaded_temp->chunks == std::vector<uint32_t>({ 3, 2 }));
        CHECK(test::values_of<double>(*loaded_temp) == values);
        CHECK(loaded_temp->compressor.has_value());
        CHECK(!loaded_temp->attributes.contains("_ARRAY_DIMENSIONS"));

        const auto* loaded_time = loaded->find_coordinate("time");
        EXPECT_STR_EQ(
          loaded_time->attributes["units"].get<std::string>().c_str(),
          "hours since 2000-01-01");
        CHECK(test::values_of<int64_t>(*loaded_time) ==
              std::vector<int64_t>({ 1, 2, 3, 4, 5, 6, 7 }));

        const auto* scale = loaded->find_data_variable("scale");
        CHECK(scale != nullptr);
        EXPECT_EQ(size_t, scale->ndims(), 0);
        EXPECT_EQ(double, test::values_of<double>(*scale)[0], 0.25);

        // a missing chunk reads as fill
        fs::remove(destination / "temp" / "2.2");
        const auto holes = cf2zarr::open_store(destination);
        const auto hole_values =
          test::values_of<double>(*holes->find_data_variable("temp"));
        EXPECT_EQ(double, hole_values[6 * 5 + 4], 0.0);
        EXPECT_EQ(double, hole_values[6 * 5 + 3], values[6 * 5 + 3]);

        // a directory that is not a group
        fs::create_directories(base_dir / "not-a-store");
        EXPECT_THROWS(cf2zarr::StorageError,
                      cf2zarr::open_store(base_dir / "not-a-store"));

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    std::error_code ec;
    fs::remove_all(base_dir, ec);

    return retval;
}
