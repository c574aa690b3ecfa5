#include "duration.hh"
#include "unit.test.macros.hh"

#include <limits>
#include <stdexcept>

using namespace std::chrono_literals;

namespace {
void
check_parse(std::string_view text, cf2zarr::Duration expected)
{
    const auto actual = cf2zarr::parse_duration(text);
    EXPECT(actual == expected,
           "Expected '",
           text,
           "' to parse as ",
           expected.count(),
           "ns, got ",
           actual.count(),
           "ns");
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        // ISO 8601
        check_parse("P2D", 48h);
        check_parse("PT36H", 36h);
        check_parse("P1DT12H30M", 24h + 12h + 30min);
        check_parse("P1W", 7 * 24h);
        check_parse("PT0.5S", 500ms);
        check_parse("-P1D", -24h);

        // pandas-style
        check_parse("2D", 48h);
        check_parse("2 days", 48h);
        check_parse("36h", 36h);
        check_parse("90min", 90min);
        check_parse("1d 12h", 36h);
        check_parse("1 days 02:00:00", 26h);
        check_parse("00:00:01.5", 1500ms);
        check_parse("-1h", -1h);
        check_parse("  10s  ", 10s);
        check_parse("250ms", 250ms);

        EXPECT_THROWS(cf2zarr::InvalidSettingsError,
                      cf2zarr::parse_duration(""));
        EXPECT_THROWS(cf2zarr::InvalidSettingsError,
                      cf2zarr::parse_duration("soon"));
        EXPECT_THROWS(cf2zarr::InvalidSettingsError,
                      cf2zarr::parse_duration("5 fortnights"));
        EXPECT_THROWS(cf2zarr::InvalidSettingsError,
                      cf2zarr::parse_duration("P1M")); // months vary
        EXPECT_THROWS(cf2zarr::InvalidSettingsError,
                      cf2zarr::parse_duration("P"));

        EXPECT_STR_EQ(cf2zarr::format_duration(26h + 30s).c_str(),
                      "1 days 02:00:30");
        EXPECT_STR_EQ(cf2zarr::format_duration(-48h).c_str(), "-2 days 00:00:00");
        EXPECT_STR_EQ(cf2zarr::format_duration(1500ms).c_str(),
                      "0 days 00:00:01.500000000");

        CHECK(cf2zarr::cf_time_unit("days since 1970-01-01") == 24h);
        CHECK(cf2zarr::cf_time_unit("Hours since 2000-01-01 00:00:00") == 1h);
        CHECK(cf2zarr::cf_time_unit("seconds") == 1s);
        CHECK(cf2zarr::cf_time_unit("nanoseconds since 1970-01-01") == 1ns);
        CHECK(!cf2zarr::cf_time_unit("kelvin").has_value());

        {
            using namespace std::chrono;

            const auto units =
              cf2zarr::parse_cf_time_units("hours since 2024-01-02 12:30:00");
            CHECK(units.has_value());
            CHECK(units->tick == 1h);
            CHECK(units->epoch_day == sys_days(2024y / January / 2));
            CHECK(units->epoch_time == 12h + 30min);

            // +01:00 is an hour ahead of UTC
            const auto zoned =
              cf2zarr::parse_cf_time_units("days since 2024-01-03T00:00:00+01:00");
            CHECK(zoned.has_value());
            CHECK(zoned->epoch_day == sys_days(2024y / January / 3));
            CHECK(zoned->epoch_time == -1h);

            const auto fractional =
              cf2zarr::parse_cf_time_units("seconds since 1970-1-1 0:0:0.25Z");
            CHECK(fractional.has_value());
            CHECK(fractional->epoch_time == 250ms);

            CHECK(cf2zarr::parse_cf_time_units("days since 2024-01-01 UTC"));
            CHECK(!cf2zarr::parse_cf_time_units("days"));
            CHECK(!cf2zarr::parse_cf_time_units("days since 2024-02-30"));
            CHECK(!cf2zarr::parse_cf_time_units("days since 2024-01-01 noon"));
            CHECK(!cf2zarr::parse_cf_time_units("kelvin since 2024-01-01"));
        }

        // elapsed saturates rather than wrapping
        constexpr auto min = std::numeric_limits<int64_t>::min();
        constexpr auto max = std::numeric_limits<int64_t>::max();
        CHECK(cf2zarr::elapsed(1, 3, 24h) == 48h);
        CHECK(cf2zarr::elapsed(5, 5, 1h) == 0h);
        CHECK(cf2zarr::elapsed(0, max / 2, 24h) == cf2zarr::Duration::max());
        CHECK(cf2zarr::elapsed(min, max, 1ns) == cf2zarr::Duration::max());
        CHECK(cf2zarr::elapsed(min, min + 1, 1ns) == 1ns);
        EXPECT_THROWS(std::runtime_error, cf2zarr::elapsed(3, 1, 1ns));

        EXPECT_EQ(int64_t, cf2zarr::to_ticks(48h, 24h), 2);
        EXPECT_EQ(int64_t, cf2zarr::to_ticks(36h, 24h), 1);
        EXPECT_EQ(int64_t, cf2zarr::to_ticks(-36h, 24h), -2);
        EXPECT_EQ(int64_t, cf2zarr::to_ticks(0h, 24h), 0);

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
