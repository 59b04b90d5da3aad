#pragma once

#include <pivot/core/date_resolver.hpp>
#include <pivot/core/time.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pivot {

/// Filter value standing for SQL NULL.
inline constexpr std::string_view kNullMarker = "__NULL__";

/// Dimension every date bound applies to.
inline constexpr const char* kDateDimension = "date";

/// Absolute date bounds after preset resolution; either side may be open.
struct DateBounds {
    std::optional<Date> start;
    std::optional<Date> end;

    [[nodiscard]] auto complete() const noexcept -> bool {
        return start.has_value() && end.has_value();
    }
    [[nodiscard]] auto range() const -> std::optional<DateRange> {
        if (!complete()) {
            return std::nullopt;
        }
        return DateRange{.start = *start, .end = *end};
    }
};

/// Typed request filter shared by routing and fetching.
struct FilterSpec {
    std::optional<Date> start_date;
    std::optional<Date> end_date;
    std::optional<DatePreset> relative_preset;
    /// dimension id -> accepted values; kNullMarker matches NULL.
    std::map<std::string, std::vector<std::string>> dimension_filters;

    /// Dimensions with at least one accepted value, sorted.
    [[nodiscard]] auto filter_dimensions() const -> std::vector<std::string>;

    /// Dimensions a source must store to apply these filters: the filtered
    /// dimensions plus `date` when either bound of `dates` is set.
    [[nodiscard]] auto route_dimensions(const DateBounds& dates) const -> std::vector<std::string>;

    /// A relative preset overrides the absolute dates.
    [[nodiscard]] auto resolve_dates(Date today) const -> DateBounds;
};

}  // namespace pivot
