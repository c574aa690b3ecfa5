#include "ordering.coordinate.hh"
#include "pipeline.hh"
#include "unit.test.datasets.hh"
#include "unit.test.macros.hh"

using namespace std::chrono_literals;
namespace test = cf2zarr::test;

namespace {
std::vector<int64_t>
times_of(const cf2zarr::Dataset& ds)
{
    return cf2zarr::ordinals(cf2zarr::find_ordering_coordinate(ds, "time"));
}

cf2zarr::EncodedDataset
run(const std::optional<cf2zarr::Dataset>& existing,
    const cf2zarr::Dataset& incoming,
    std::optional<cf2zarr::Duration> max_duration = std::nullopt,
    cf2zarr::RunReport* report = nullptr)
{
    return cf2zarr::run(existing,
                        incoming,
                        {},
                        "time",
                        max_duration,
                        cf2zarr::default_chunk_shape,
                        cf2zarr::BloscCompressionParams(),
                        report);
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        // first run
        cf2zarr::RunReport report;
        const auto first =
          run(std::nullopt,
              test::time_series({ 3, 1, 2 }, { "temp" }, { 3.0, 1.0, 2.0 }),
              std::nullopt,
              &report);
        CHECK(times_of(first.dataset) == std::vector<int64_t>({ 1, 2, 3 }));
        EXPECT_EQ(size_t, report.selected_variables.size(), 1);
        EXPECT_STR_EQ(report.selected_variables[0].c_str(), "temp");
        CHECK(report.dropped_duplicates.empty());
        EXPECT_EQ(size_t, report.n_entries, 3);
        CHECK(first.dataset.data_variables()[0].chunks ==
              std::vector<uint32_t>({ 5 }));
        CHECK(first.dataset.data_variables()[0].compressor.has_value());
        CHECK(!first.write_empty_chunks);

        // append with overlap: existing "3" wins
        const auto second = run(
          first.dataset,
          test::time_series({ 3, 4, 5 }, { "temp" }, { 30.0, 4.0, 5.0 }),
          std::nullopt,
          &report);
        CHECK(times_of(second.dataset) ==
              std::vector<int64_t>({ 1, 2, 3, 4, 5 }));
        CHECK(report.dropped_duplicates == std::vector<size_t>({ 3 }));
        EXPECT_EQ(double,
                  test::values_of<double>(second.dataset.data_variables()[0])[2],
                  3.0);

        // replaying the same input changes nothing
        const auto replay = run(
          second.dataset,
          test::time_series({ 3, 4, 5 }, { "temp" }, { 30.0, 4.0, 5.0 }));
        CHECK(times_of(replay.dataset) == times_of(second.dataset));
        CHECK(replay.dataset.data_variables()[0].data ==
              second.dataset.data_variables()[0].data);

        // appending A then B equals appending A+B
        const auto a = test::time_series({ 6, 7 }, { "temp" }, { 6.0, 7.0 });
        const auto b = test::time_series({ 8, 9 }, { "temp" }, { 8.0, 9.0 });
        const auto ab = test::time_series(
          { 6, 7, 8, 9 }, { "temp" }, { 6.0, 7.0, 8.0, 9.0 });
        const auto stepwise = run(run(second.dataset, a).dataset, b);
        const auto at_once = run(second.dataset, ab);
        CHECK(times_of(stepwise.dataset) == times_of(at_once.dataset));
        CHECK(stepwise.dataset.data_variables()[0].data ==
              at_once.dataset.data_variables()[0].data);

        // trim to two days
        auto days = test::time_series(
          { 1, 2, 3, 4, 5 }, { "temp" }, { 1.0, 2.0, 3.0, 4.0, 5.0 });
        days.coordinates()[0].attributes["units"] = "days since 2024-01-01";
        const auto trimmed = run(std::nullopt, days, 48h, &report);
        CHECK(times_of(trimmed.dataset) == std::vector<int64_t>({ 3, 4, 5 }));
        EXPECT_EQ(size_t, report.n_trimmed, 2);
        EXPECT_EQ(size_t, report.n_entries, 3);

        // a short retention never empties the dataset
        const auto latest = run(std::nullopt, days, 1h, &report);
        CHECK(times_of(latest.dataset) == std::vector<int64_t>({ 5 }));

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
