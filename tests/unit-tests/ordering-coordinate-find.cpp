#include "ordering.coordinate.hh"
#include "unit.test.datasets.hh"
#include "unit.test.macros.hh"

using namespace std::chrono_literals;
namespace test = cf2zarr::test;

int
main()
{
    int retval = 1;

    try {
        auto ds = test::time_series({ 3, 1, 2 }, { "temp" }, { 0.3, 0.1, 0.2 });

        const auto& coord = cf2zarr::find_ordering_coordinate(ds, "time");
        EXPECT_STR_EQ(coord.name.c_str(), "time");

        const auto keys = cf2zarr::ordinals(coord);
        EXPECT_EQ(size_t, keys.size(), 3);
        EXPECT_EQ(int64_t, keys[0], 3);
        EXPECT_EQ(int64_t, keys[1], 1);
        EXPECT_EQ(int64_t, keys[2], 2);

        // no units: nanoseconds
        CHECK(cf2zarr::ordinal_tick(coord) == 1ns);

        // no coordinate for the dimension
        EXPECT_THROWS(cf2zarr::NoOrderingCoordinateError,
                      cf2zarr::find_ordering_coordinate(ds, "step"));

        // a floating point coordinate cannot order
        cf2zarr::Dataset float_time;
        float_time.add_coordinate(test::float64_variable(
          "time", { "time" }, { 2 }, { 0.5, 1.5 }));
        EXPECT_THROWS(cf2zarr::NoOrderingCoordinateError,
                      cf2zarr::find_ordering_coordinate(float_time, "time"));

        // two coordinates over the same dimension are ambiguous
        auto ambiguous = test::time_series({ 1, 2 }, { "temp" }, { 0.0, 1.0 });
        cf2zarr::Variable alias = test::int64_coordinate("time", { 1, 2 });
        alias.name = "time_alias";
        ambiguous.add_coordinate(std::move(alias));
        EXPECT_THROWS(cf2zarr::NoOrderingCoordinateError,
                      cf2zarr::find_ordering_coordinate(ambiguous, "time"));

        // CF units set the tick
        auto& time = ds.coordinates().front();
        time.attributes["units"] = "days since 1970-01-01";
        CHECK(cf2zarr::ordinal_tick(time) == 24h);

        time.attributes["units"] = "metres";
        EXPECT_THROWS(cf2zarr::InvalidSettingsError,
                      cf2zarr::ordinal_tick(time));

        // narrower integer types widen
        cf2zarr::Dataset small;
        small.add_coordinate(cf2zarr::Variable(
          "time",
          { "time" },
          { 3 },
          Cf2ZarrDataType_uint16,
          test::to_bytes(std::vector<uint16_t>{ 7, 8, 65535 })));
        const auto widened =
          cf2zarr::ordinals(cf2zarr::find_ordering_coordinate(small, "time"));
        EXPECT_EQ(int64_t, widened[2], 65535);

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
