#include <pivot/query/filter.hpp>

#include <algorithm>

namespace pivot {

auto FilterSpec::filter_dimensions() const -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& [dimension, values] : dimension_filters) {
        if (!values.empty()) {
            out.push_back(dimension);
        }
    }
    return out;
}

auto FilterSpec::route_dimensions(const DateBounds& dates) const -> std::vector<std::string> {
    auto out = filter_dimensions();
    if ((dates.start.has_value() || dates.end.has_value()) &&
        std::ranges::find(out, kDateDimension) == out.end()) {
        out.insert(std::ranges::lower_bound(out, std::string(kDateDimension)), kDateDimension);
    }
    return out;
}

auto FilterSpec::resolve_dates(Date today) const -> DateBounds {
    if (relative_preset.has_value()) {
        auto range = resolve_preset(*relative_preset, today);
        return DateBounds{.start = range.start, .end = range.end};
    }
    return DateBounds{.start = start_date, .end = end_date};
}

}  // namespace pivot
