#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace pivot {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Build a Date from a proleptic Gregorian year/month/day.
[[nodiscard]] auto date_from_ymd(int year, unsigned month, unsigned day) -> Date;

/// Parse an ISO `YYYY-MM-DD` date. Returns nullopt on malformed or invalid dates.
[[nodiscard]] auto parse_date(std::string_view text) -> std::optional<Date>;

/// Format as ISO `YYYY-MM-DD`.
[[nodiscard]] auto format_date(Date date) -> std::string;

/// Current UTC calendar date.
[[nodiscard]] auto today() -> Date;

}  // namespace pivot

namespace std {

template <>
struct hash<pivot::Date> {
    auto operator()(const pivot::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

}  // namespace std
