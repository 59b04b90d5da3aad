#include <pivot/catalog/custom.hpp>

#include <algorithm>
#include <limits>

namespace pivot {

auto BucketRule::matches(double value) const -> bool {
    if (!min.has_value() && !max.has_value() && !equals.has_value()) {
        return false;
    }
    if (min.has_value() && value < *min) {
        return false;
    }
    if (max.has_value() && value > *max) {
        return false;
    }
    if (equals.has_value() && value != *equals) {
        return false;
    }
    return true;
}

auto Condition::holds(std::optional<double> cell) const -> bool {
    switch (op) {
        case ConditionOp::IsNull:
            return !cell.has_value();
        case ConditionOp::IsNotNull:
            return cell.has_value();
        default:
            break;
    }
    if (!value.has_value()) {
        return true;
    }
    if (op == ConditionOp::Between && !value_max.has_value()) {
        return true;
    }
    if (!cell.has_value()) {
        return false;
    }
    double v = *cell;
    switch (op) {
        case ConditionOp::Gt:
            return v > *value;
        case ConditionOp::Ge:
            return v >= *value;
        case ConditionOp::Lt:
            return v < *value;
        case ConditionOp::Le:
            return v <= *value;
        case ConditionOp::Eq:
            return v == *value;
        case ConditionOp::Ne:
            return v != *value;
        case ConditionOp::Between:
            return v >= *value && v <= *value_max;
        case ConditionOp::IsNull:
        case ConditionOp::IsNotNull:
            break;
    }
    return false;
}

auto ConditionRule::matches(std::optional<double> value) const -> bool {
    return std::ranges::all_of(conditions,
                               [&](const Condition& condition) { return condition.holds(value); });
}

auto CustomDimension::type() const -> CustomDimensionType {
    switch (rules.index()) {
        case 0:
            return CustomDimensionType::MetricBucket;
        case 1:
            return CustomDimensionType::DateRange;
        default:
            return CustomDimensionType::MetricCondition;
    }
}

auto CustomDimension::column_name() const -> std::string {
    return "custom_" + id;
}

auto ordered_buckets(const std::vector<BucketRule>& rules) -> std::vector<BucketRule> {
    std::vector<BucketRule> sorted = rules;
    std::ranges::stable_sort(sorted, [](const BucketRule& a, const BucketRule& b) {
        double lhs = a.min.value_or(-std::numeric_limits<double>::infinity());
        double rhs = b.min.value_or(-std::numeric_limits<double>::infinity());
        return lhs > rhs;
    });
    return sorted;
}

auto parse_condition_op(std::string_view text) -> std::optional<ConditionOp> {
    if (text == ">") {
        return ConditionOp::Gt;
    }
    if (text == ">=") {
        return ConditionOp::Ge;
    }
    if (text == "<") {
        return ConditionOp::Lt;
    }
    if (text == "<=") {
        return ConditionOp::Le;
    }
    if (text == "=" || text == "==") {
        return ConditionOp::Eq;
    }
    if (text == "!=" || text == "<>") {
        return ConditionOp::Ne;
    }
    if (text == "between") {
        return ConditionOp::Between;
    }
    if (text == "is_null") {
        return ConditionOp::IsNull;
    }
    if (text == "is_not_null") {
        return ConditionOp::IsNotNull;
    }
    return std::nullopt;
}

auto to_string(ConditionOp op) -> std::string_view {
    switch (op) {
        case ConditionOp::Gt:
            return ">";
        case ConditionOp::Ge:
            return ">=";
        case ConditionOp::Lt:
            return "<";
        case ConditionOp::Le:
            return "<=";
        case ConditionOp::Eq:
            return "=";
        case ConditionOp::Ne:
            return "!=";
        case ConditionOp::Between:
            return "between";
        case ConditionOp::IsNull:
            return "is_null";
        case ConditionOp::IsNotNull:
            return "is_not_null";
    }
    return "?";
}

auto parse_custom_dimension_type(std::string_view text) -> std::optional<CustomDimensionType> {
    if (text == "metric_bucket") {
        return CustomDimensionType::MetricBucket;
    }
    if (text == "date_range") {
        return CustomDimensionType::DateRange;
    }
    if (text == "metric_condition") {
        return CustomDimensionType::MetricCondition;
    }
    return std::nullopt;
}

auto to_string(CustomDimensionType type) -> std::string_view {
    switch (type) {
        case CustomDimensionType::MetricBucket:
            return "metric_bucket";
        case CustomDimensionType::DateRange:
            return "date_range";
        case CustomDimensionType::MetricCondition:
            return "metric_condition";
    }
    return "?";
}

auto parse_custom_aggregation(std::string_view text) -> std::optional<CustomAggregation> {
    if (text == "sum") {
        return CustomAggregation::Sum;
    }
    if (text == "avg") {
        return CustomAggregation::Avg;
    }
    if (text == "max") {
        return CustomAggregation::Max;
    }
    if (text == "min") {
        return CustomAggregation::Min;
    }
    if (text == "count") {
        return CustomAggregation::Count;
    }
    if (text == "avg_per_day") {
        return CustomAggregation::AvgPerDay;
    }
    return std::nullopt;
}

auto to_string(CustomAggregation aggregation) -> std::string_view {
    switch (aggregation) {
        case CustomAggregation::Sum:
            return "sum";
        case CustomAggregation::Avg:
            return "avg";
        case CustomAggregation::Max:
            return "max";
        case CustomAggregation::Min:
            return "min";
        case CustomAggregation::Count:
            return "count";
        case CustomAggregation::AvgPerDay:
            return "avg_per_day";
    }
    return "?";
}

}  // namespace pivot
