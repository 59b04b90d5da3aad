#pragma once

#include <pivot/core/time.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace pivot {

/// Relative date presets. Weeks start on Monday.
enum class DatePreset : std::uint8_t {
    Today,
    Yesterday,
    Last7Days,
    Last14Days,
    Last30Days,
    Last90Days,
    ThisWeek,
    LastWeek,
    ThisMonth,
    LastMonth,
    ThisQuarter,
    LastQuarter,
    ThisYear,
    LastYear,
    YearToDate,
    MonthToDate,
    QuarterToDate,
    WeekToDate,
};

/// Inclusive calendar range.
struct DateRange {
    Date start;
    Date end;

    /// Number of days in the range, never less than 1.
    [[nodiscard]] auto num_days() const noexcept -> std::int64_t {
        std::int64_t days = static_cast<std::int64_t>(end.days) - start.days + 1;
        return days < 1 ? 1 : days;
    }

    [[nodiscard]] auto contains(Date date) const noexcept -> bool {
        return start <= date && date <= end;
    }

    auto operator==(const DateRange&) const -> bool = default;
};

/// Parse a snake_case preset name such as `last_7_days`.
[[nodiscard]] auto parse_date_preset(std::string_view name) -> std::optional<DatePreset>;

[[nodiscard]] auto preset_name(DatePreset preset) -> std::string_view;

/// Resolve a preset relative to `today`.
[[nodiscard]] auto resolve_preset(DatePreset preset, Date today) -> DateRange;

/// Period length of a trend series.
enum class TimeGrain : std::uint8_t {
    Daily,
    Weekly,
    Monthly,
};

/// Accepts `daily`, `weekly` and `monthly`.
[[nodiscard]] auto parse_time_grain(std::string_view name) -> std::optional<TimeGrain>;
[[nodiscard]] auto grain_name(TimeGrain grain) -> std::string_view;

/// Day, Monday-to-Sunday week or calendar month containing `date`.
[[nodiscard]] auto period_of(Date date, TimeGrain grain) -> DateRange;

}  // namespace pivot
