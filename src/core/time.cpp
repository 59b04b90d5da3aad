#include <pivot/core/time.hpp>

#include <fmt/format.h>

#include <charconv>
#include <chrono>

namespace pivot {

namespace {

auto parse_uint(std::string_view text) -> std::optional<unsigned> {
    unsigned value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, value);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto date_from_ymd(int year, unsigned month, unsigned day) -> Date {
    using namespace std::chrono;
    auto day_point = sys_days{std::chrono::year{year} / std::chrono::month{month} /
                              std::chrono::day{day}};
    return Date{static_cast<std::int32_t>(day_point.time_since_epoch().count())};
}

auto parse_date(std::string_view text) -> std::optional<Date> {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    auto year = parse_uint(text.substr(0, 4));
    auto month = parse_uint(text.substr(5, 2));
    auto day = parse_uint(text.substr(8, 2));
    if (!year.has_value() || !month.has_value() || !day.has_value()) {
        return std::nullopt;
    }
    std::chrono::year_month_day ymd{std::chrono::year{static_cast<int>(*year)},
                                    std::chrono::month{*month}, std::chrono::day{*day}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return Date{static_cast<std::int32_t>(std::chrono::sys_days{ymd}.time_since_epoch().count())};
}

auto format_date(Date date) -> std::string {
    using namespace std::chrono;
    sys_days day = sys_days{days{date.days}};
    year_month_day ymd{day};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

auto today() -> Date {
    using namespace std::chrono;
    auto now = floor<days>(system_clock::now());
    return Date{static_cast<std::int32_t>(now.time_since_epoch().count())};
}

}  // namespace pivot
