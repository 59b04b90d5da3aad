#include <pivot/core/date_resolver.hpp>
#include <pivot/core/safe_math.hpp>
#include <pivot/core/time.hpp>
#include <pivot/query/filter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using pivot::date_from_ymd;
using pivot::DatePreset;
using pivot::DateRange;

namespace {

auto range(int y1, unsigned m1, unsigned d1, int y2, unsigned m2, unsigned d2) -> DateRange {
    return DateRange{.start = date_from_ymd(y1, m1, d1), .end = date_from_ymd(y2, m2, d2)};
}

}  // namespace

TEST_CASE("ISO dates parse and format", "[core][time]") {
    auto date = pivot::parse_date("2024-02-29");
    REQUIRE(date.has_value());
    REQUIRE(*date == date_from_ymd(2024, 2, 29));
    REQUIRE(pivot::format_date(*date) == "2024-02-29");
    REQUIRE(pivot::format_date(pivot::Date{0}) == "1970-01-01");

    REQUIRE_FALSE(pivot::parse_date("2023-02-29").has_value());
    REQUIRE_FALSE(pivot::parse_date("2024-13-01").has_value());
    REQUIRE_FALSE(pivot::parse_date("2024/01/01").has_value());
    REQUIRE_FALSE(pivot::parse_date("24-01-01").has_value());
    REQUIRE_FALSE(pivot::parse_date("").has_value());
}

TEST_CASE("Date range length is inclusive and at least one day", "[core][time]") {
    REQUIRE(range(2024, 3, 1, 2024, 3, 31).num_days() == 31);
    REQUIRE(range(2024, 3, 1, 2024, 3, 1).num_days() == 1);
    REQUIRE(range(2024, 3, 5, 2024, 3, 1).num_days() == 1);
    REQUIRE(range(2024, 3, 1, 2024, 3, 31).contains(date_from_ymd(2024, 3, 31)));
    REQUIRE_FALSE(range(2024, 3, 1, 2024, 3, 31).contains(date_from_ymd(2024, 4, 1)));
}

TEST_CASE("Relative presets resolve against today", "[core][presets]") {
    // Wednesday.
    auto today = date_from_ymd(2024, 3, 13);

    REQUIRE(pivot::resolve_preset(DatePreset::Today, today) == range(2024, 3, 13, 2024, 3, 13));
    REQUIRE(pivot::resolve_preset(DatePreset::Yesterday, today) ==
            range(2024, 3, 12, 2024, 3, 12));
    REQUIRE(pivot::resolve_preset(DatePreset::Last7Days, today) ==
            range(2024, 3, 7, 2024, 3, 13));
    REQUIRE(pivot::resolve_preset(DatePreset::Last30Days, today).num_days() == 30);
    REQUIRE(pivot::resolve_preset(DatePreset::ThisWeek, today) ==
            range(2024, 3, 11, 2024, 3, 13));
    REQUIRE(pivot::resolve_preset(DatePreset::LastWeek, today) ==
            range(2024, 3, 4, 2024, 3, 10));
    REQUIRE(pivot::resolve_preset(DatePreset::MonthToDate, today) ==
            range(2024, 3, 1, 2024, 3, 13));
    REQUIRE(pivot::resolve_preset(DatePreset::LastMonth, today) ==
            range(2024, 2, 1, 2024, 2, 29));
    REQUIRE(pivot::resolve_preset(DatePreset::ThisQuarter, today) ==
            range(2024, 1, 1, 2024, 3, 13));
    REQUIRE(pivot::resolve_preset(DatePreset::LastQuarter, today) ==
            range(2023, 10, 1, 2023, 12, 31));
    REQUIRE(pivot::resolve_preset(DatePreset::YearToDate, today) ==
            range(2024, 1, 1, 2024, 3, 13));
    REQUIRE(pivot::resolve_preset(DatePreset::LastYear, today) ==
            range(2023, 1, 1, 2023, 12, 31));

    SECTION("last week from a Monday") {
        auto monday = date_from_ymd(2024, 3, 11);
        REQUIRE(pivot::resolve_preset(DatePreset::LastWeek, monday) ==
                range(2024, 3, 4, 2024, 3, 10));
    }

    SECTION("last month wraps the year") {
        REQUIRE(pivot::resolve_preset(DatePreset::LastMonth, date_from_ymd(2024, 1, 15)) ==
                range(2023, 12, 1, 2023, 12, 31));
    }
}

TEST_CASE("Preset names round-trip", "[core][presets]") {
    auto preset = pivot::parse_date_preset("last_7_days");
    REQUIRE(preset.has_value());
    REQUIRE(*preset == DatePreset::Last7Days);
    REQUIRE(pivot::preset_name(DatePreset::QuarterToDate) == "quarter_to_date");
    REQUIRE_FALSE(pivot::parse_date_preset("last_8_days").has_value());
}

TEST_CASE("Filter dates: a preset overrides absolute bounds", "[query][filter]") {
    pivot::FilterSpec filters;
    filters.start_date = date_from_ymd(2024, 1, 1);
    filters.end_date = date_from_ymd(2024, 1, 31);

    auto bounds = filters.resolve_dates(date_from_ymd(2024, 3, 13));
    REQUIRE(bounds.complete());
    REQUIRE(bounds.range()->num_days() == 31);

    filters.relative_preset = DatePreset::Yesterday;
    bounds = filters.resolve_dates(date_from_ymd(2024, 3, 13));
    REQUIRE(*bounds.start == date_from_ymd(2024, 3, 12));
    REQUIRE(*bounds.end == date_from_ymd(2024, 3, 12));

    SECTION("open bounds stay open") {
        pivot::FilterSpec open;
        open.start_date = date_from_ymd(2024, 1, 1);
        auto resolved = open.resolve_dates(date_from_ymd(2024, 3, 13));
        REQUIRE_FALSE(resolved.complete());
        REQUIRE_FALSE(resolved.range().has_value());
        REQUIRE_FALSE(resolved.end.has_value());
    }
}

TEST_CASE("Filter dimensions ignore empty value lists", "[query][filter]") {
    pivot::FilterSpec filters;
    filters.dimension_filters["device"] = {"mobile"};
    filters.dimension_filters["country"] = {"DE", "FR"};
    filters.dimension_filters["query"] = {};

    auto dims = filters.filter_dimensions();
    REQUIRE(dims.size() == 2);
    REQUIRE(dims[0] == "country");
    REQUIRE(dims[1] == "device");

    SECTION("either date bound makes date a routing dimension") {
        REQUIRE(filters.route_dimensions(pivot::DateBounds{}) == dims);

        pivot::DateBounds from_march{.start = date_from_ymd(2024, 3, 1), .end = std::nullopt};
        REQUIRE(filters.route_dimensions(from_march) ==
                std::vector<std::string>{"country", "date", "device"});

        filters.dimension_filters["date"] = {"2024-03-02"};
        REQUIRE(filters.route_dimensions(from_march) ==
                std::vector<std::string>{"country", "date", "device"});
    }
}

TEST_CASE("Safe division never yields NaN or infinity", "[core][math]") {
    REQUIRE(pivot::safe_divide(10.0, 4.0) == 2.5);
    REQUIRE(pivot::safe_divide(10.0, 0.0) == 0.0);
    REQUIRE(pivot::safe_divide(0.0, 0.0) == 0.0);
    REQUIRE(pivot::safe_divide(std::numeric_limits<double>::max(), 1e-300) == 0.0);
    REQUIRE(pivot::finite_or_zero(std::nan("")) == 0.0);
    REQUIRE(pivot::round_to(33.33333, 2) == 33.33);
    REQUIRE(pivot::round_to(2.5, 0) == 3.0);
}

TEST_CASE("Trend periods contain the date", "[core][time]") {
    auto friday = date_from_ymd(2024, 3, 1);
    REQUIRE(pivot::period_of(friday, pivot::TimeGrain::Daily) ==
            range(2024, 3, 1, 2024, 3, 1));
    REQUIRE(pivot::period_of(friday, pivot::TimeGrain::Weekly) ==
            range(2024, 2, 26, 2024, 3, 3));
    REQUIRE(pivot::period_of(date_from_ymd(2024, 2, 10), pivot::TimeGrain::Monthly) ==
            range(2024, 2, 1, 2024, 2, 29));

    REQUIRE(pivot::parse_time_grain("weekly") == pivot::TimeGrain::Weekly);
    REQUIRE(pivot::grain_name(pivot::TimeGrain::Monthly) == "monthly");
    REQUIRE_FALSE(pivot::parse_time_grain("hourly").has_value());
}
