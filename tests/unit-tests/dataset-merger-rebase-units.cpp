#include "axis.deduplicator.hh"
#include "dataset.merger.hh"
#include "ordering.coordinate.hh"
#include "unit.test.datasets.hh"
#include "unit.test.macros.hh"

namespace test = cf2zarr::test;

namespace {
cf2zarr::Dataset
daily(const std::vector<int64_t>& times,
      const std::vector<double>& values,
      const char* units)
{
    auto ds = test::time_series(times, { "temp" }, values);
    if (units) {
        ds.coordinates()[0].attributes["units"] = units;
    }
    return ds;
}

std::vector<int64_t>
keys_of(const cf2zarr::Dataset& ds)
{
    return cf2zarr::ordinals(cf2zarr::find_ordering_coordinate(ds, "time"));
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        const auto existing =
          daily({ 0, 1, 2 }, { 1.0, 2.0, 3.0 }, "days since 2024-01-01");

        // a later epoch: incoming day 0 is 2024-01-03, day 2 of the existing
        {
            const auto incoming =
              daily({ 0, 1 }, { 30.0, 40.0 }, "days since 2024-01-03");

            const auto merged = cf2zarr::merge(existing, incoming, {}, "time");
            const std::vector<int64_t> merged_keys{ 0, 1, 2, 2, 3 };
            CHECK(keys_of(merged) == merged_keys);

            const auto& coord = cf2zarr::find_ordering_coordinate(merged, "time");
            EXPECT_STR_EQ(coord.attributes["units"].get<std::string>().c_str(),
                          "days since 2024-01-01");

            std::vector<size_t> dropped;
            const auto deduped =
              cf2zarr::deduplicate(merged, "time", &dropped);
            EXPECT_EQ(size_t, dropped.size(), 1);

            const std::vector<int64_t> expected_keys{ 0, 1, 2, 3 };
            CHECK(keys_of(deduped) == expected_keys);

            const auto temp =
              test::values_of<double>(*deduped.find_data_variable("temp"));
            const std::vector<double> expected_temp{ 1.0, 2.0, 3.0, 40.0 };
            CHECK(temp == expected_temp);
        }

        // hours from a noon epoch with a zone suffix
        {
            const auto incoming = daily(
              { 12, 36 }, { 30.0, 40.0 }, "hours since 2024-01-02 12:00:00 UTC");
            const auto merged = cf2zarr::merge(existing, incoming, {}, "time");
            const std::vector<int64_t> expected{ 0, 1, 2, 2, 3 };
            CHECK(keys_of(merged) == expected);
        }

        // an earlier epoch gives earlier ordinals, sorted ahead
        {
            const auto incoming =
              daily({ 0 }, { -1.0 }, "days since 2023-12-31T00:00:00Z");
            const auto merged = cf2zarr::merge(existing, incoming, {}, "time");
            const std::vector<int64_t> expected{ -1, 0, 1, 2 };
            CHECK(keys_of(merged) == expected);

            const auto temp =
              test::values_of<double>(*merged.find_data_variable("temp"));
            EXPECT_EQ(double, temp[0], -1.0);
        }

        // 13 hours after 2024-01-02 12:00 is not a whole day
        EXPECT_THROWS(cf2zarr::AxisMismatchError,
                      cf2zarr::merge(existing,
                                     daily({ 13 },
                                           { 1.0 },
                                           "hours since 2024-01-02 12:00:00"),
                                     {},
                                     "time"));

        // units on only one side
        EXPECT_THROWS(
          cf2zarr::AxisMismatchError,
          cf2zarr::merge(existing, daily({ 3 }, { 4.0 }, nullptr), {}, "time"));
        EXPECT_THROWS(cf2zarr::AxisMismatchError,
                      cf2zarr::merge(daily({ 0 }, { 1.0 }, nullptr),
                                     daily({ 3 }, { 4.0 }, "days since 2024-01-01"),
                                     {},
                                     "time"));

        // an epoch that does not parse
        EXPECT_THROWS(cf2zarr::AxisMismatchError,
                      cf2zarr::merge(existing,
                                     daily({ 3 }, { 4.0 }, "days since launch"),
                                     {},
                                     "time"));

        // a non-standard calendar cannot be shifted by whole days
        {
            auto noleap = daily({ 0 }, { 4.0 }, "days since 2024-01-03");
            noleap.coordinates()[0].attributes["calendar"] = "noleap";
            EXPECT_THROWS(cf2zarr::AxisMismatchError,
                          cf2zarr::merge(existing, noleap, {}, "time"));
        }

        // the incoming values are written in the existing data type
        {
            auto narrow = existing;
            auto& coord = narrow.coordinates()[0];
            coord.dtype = Cf2ZarrDataType_int32;
            coord.data = test::to_bytes(std::vector<int32_t>{ 0, 1, 2 });

            const auto merged = cf2zarr::merge(
              narrow,
              daily({ 1 }, { 40.0 }, "days since 2024-01-03"),
              {},
              "time");
            const auto& merged_coord =
              cf2zarr::find_ordering_coordinate(merged, "time");
            CHECK(merged_coord.dtype == Cf2ZarrDataType_int32);
            const std::vector<int64_t> expected{ 0, 1, 2, 3 };
            CHECK(keys_of(merged) == expected);
        }

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
