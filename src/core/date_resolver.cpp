#include <pivot/core/date_resolver.hpp>

#include <array>
#include <chrono>
#include <utility>

namespace pivot {

namespace {

constexpr std::array<std::pair<DatePreset, std::string_view>, 18> kPresetNames{{
    {DatePreset::Today, "today"},
    {DatePreset::Yesterday, "yesterday"},
    {DatePreset::Last7Days, "last_7_days"},
    {DatePreset::Last14Days, "last_14_days"},
    {DatePreset::Last30Days, "last_30_days"},
    {DatePreset::Last90Days, "last_90_days"},
    {DatePreset::ThisWeek, "this_week"},
    {DatePreset::LastWeek, "last_week"},
    {DatePreset::ThisMonth, "this_month"},
    {DatePreset::LastMonth, "last_month"},
    {DatePreset::ThisQuarter, "this_quarter"},
    {DatePreset::LastQuarter, "last_quarter"},
    {DatePreset::ThisYear, "this_year"},
    {DatePreset::LastYear, "last_year"},
    {DatePreset::YearToDate, "year_to_date"},
    {DatePreset::MonthToDate, "month_to_date"},
    {DatePreset::QuarterToDate, "quarter_to_date"},
    {DatePreset::WeekToDate, "week_to_date"},
}};

auto to_ymd(Date date) -> std::chrono::year_month_day {
    return std::chrono::year_month_day{std::chrono::sys_days{std::chrono::days{date.days}}};
}

auto from_ymd(std::chrono::year_month_day ymd) -> Date {
    return Date{static_cast<std::int32_t>(std::chrono::sys_days{ymd}.time_since_epoch().count())};
}

auto shift(Date date, std::int32_t days) -> Date {
    return Date{date.days + days};
}

// Days since the most recent Monday (0 on Mondays).
auto days_since_monday(Date date) -> std::int32_t {
    std::chrono::weekday wd{std::chrono::sys_days{std::chrono::days{date.days}}};
    return static_cast<std::int32_t>((wd.c_encoding() + 6) % 7);
}

auto month_start(std::chrono::year y, std::chrono::month m) -> Date {
    return from_ymd(y / m / std::chrono::day{1});
}

auto month_end(std::chrono::year y, std::chrono::month m) -> Date {
    return from_ymd(std::chrono::year_month_day{y / m / std::chrono::last});
}

auto quarter_of(std::chrono::month m) -> unsigned {
    return (static_cast<unsigned>(m) - 1) / 3 + 1;
}

auto quarter_range(std::chrono::year y, unsigned quarter) -> DateRange {
    std::chrono::month first{(quarter - 1) * 3 + 1};
    std::chrono::month last{quarter * 3};
    return DateRange{.start = month_start(y, first), .end = month_end(y, last)};
}

}  // namespace

auto parse_date_preset(std::string_view name) -> std::optional<DatePreset> {
    for (const auto& [preset, text] : kPresetNames) {
        if (text == name) {
            return preset;
        }
    }
    return std::nullopt;
}

auto preset_name(DatePreset preset) -> std::string_view {
    for (const auto& [value, text] : kPresetNames) {
        if (value == preset) {
            return text;
        }
    }
    return "unknown";
}

auto resolve_preset(DatePreset preset, Date today) -> DateRange {
    auto ymd = to_ymd(today);
    switch (preset) {
        case DatePreset::Today:
            return {today, today};
        case DatePreset::Yesterday:
            return {shift(today, -1), shift(today, -1)};
        case DatePreset::Last7Days:
            return {shift(today, -6), today};
        case DatePreset::Last14Days:
            return {shift(today, -13), today};
        case DatePreset::Last30Days:
            return {shift(today, -29), today};
        case DatePreset::Last90Days:
            return {shift(today, -89), today};
        case DatePreset::ThisWeek:
        case DatePreset::WeekToDate:
            return {shift(today, -days_since_monday(today)), today};
        case DatePreset::LastWeek: {
            Date last_monday = shift(today, -(days_since_monday(today) + 7));
            return {last_monday, shift(last_monday, 6)};
        }
        case DatePreset::ThisMonth:
        case DatePreset::MonthToDate:
            return {month_start(ymd.year(), ymd.month()), today};
        case DatePreset::LastMonth: {
            auto previous = std::chrono::year_month{ymd.year(), ymd.month()} - std::chrono::months{1};
            return {month_start(previous.year(), previous.month()),
                    month_end(previous.year(), previous.month())};
        }
        case DatePreset::ThisQuarter:
        case DatePreset::QuarterToDate:
            return {quarter_range(ymd.year(), quarter_of(ymd.month())).start, today};
        case DatePreset::LastQuarter: {
            unsigned quarter = quarter_of(ymd.month());
            if (quarter == 1) {
                return quarter_range(ymd.year() - std::chrono::years{1}, 4);
            }
            return quarter_range(ymd.year(), quarter - 1);
        }
        case DatePreset::ThisYear:
        case DatePreset::YearToDate:
            return {month_start(ymd.year(), std::chrono::January), today};
        case DatePreset::LastYear: {
            auto last = ymd.year() - std::chrono::years{1};
            return {month_start(last, std::chrono::January),
                    month_end(last, std::chrono::December)};
        }
    }
    return {today, today};
}

auto parse_time_grain(std::string_view name) -> std::optional<TimeGrain> {
    if (name == "daily") {
        return TimeGrain::Daily;
    }
    if (name == "weekly") {
        return TimeGrain::Weekly;
    }
    if (name == "monthly") {
        return TimeGrain::Monthly;
    }
    return std::nullopt;
}

auto grain_name(TimeGrain grain) -> std::string_view {
    switch (grain) {
        case TimeGrain::Daily:
            return "daily";
        case TimeGrain::Weekly:
            return "weekly";
        case TimeGrain::Monthly:
            return "monthly";
    }
    return "unknown";
}

auto period_of(Date date, TimeGrain grain) -> DateRange {
    switch (grain) {
        case TimeGrain::Daily:
            return {date, date};
        case TimeGrain::Weekly: {
            Date monday = shift(date, -days_since_monday(date));
            return {monday, shift(monday, 6)};
        }
        case TimeGrain::Monthly: {
            auto ymd = to_ymd(date);
            return {month_start(ymd.year(), ymd.month()), month_end(ymd.year(), ymd.month())};
        }
    }
    return {date, date};
}

}  // namespace pivot
