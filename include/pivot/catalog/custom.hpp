#pragma once

#include <pivot/core/time.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pivot {

/// Label assigned when no rule of a custom dimension matches.
inline constexpr std::string_view kOtherLabel = "Other";

/// `metric_bucket` rule. Every present bound must hold; a rule with no bound
/// never matches.
struct BucketRule {
    std::string label;
    std::optional<double> min;
    std::optional<double> max;
    std::optional<double> equals;

    [[nodiscard]] auto matches(double value) const -> bool;
};

/// `date_range` rule: start <= date <= end.
struct DateRangeRule {
    std::string label;
    Date start;
    Date end;

    [[nodiscard]] auto matches(Date date) const -> bool { return start <= date && date <= end; }
};

enum class ConditionOp : std::uint8_t {
    Gt,
    Ge,
    Lt,
    Le,
    Eq,
    Ne,
    Between,
    IsNull,
    IsNotNull,
};

struct Condition {
    ConditionOp op = ConditionOp::Gt;
    std::optional<double> value;
    std::optional<double> value_max;

    /// `cell` is nullopt for a null source value. A condition lacking the
    /// operand its operator needs is ignored (treated as satisfied).
    [[nodiscard]] auto holds(std::optional<double> cell) const -> bool;
};

/// `metric_condition` rule: conjunction of conditions.
struct ConditionRule {
    std::string label;
    std::vector<Condition> conditions;

    [[nodiscard]] auto matches(std::optional<double> value) const -> bool;
};

enum class CustomDimensionType : std::uint8_t {
    MetricBucket,
    DateRange,
    MetricCondition,
};

using CustomRules =
    std::variant<std::vector<BucketRule>, std::vector<DateRangeRule>, std::vector<ConditionRule>>;

/// User-authored bucketing applied after the fetch.
struct CustomDimension {
    std::string id;
    std::string name;
    std::string source_metric;  // empty for date_range
    CustomRules rules;

    [[nodiscard]] auto type() const -> CustomDimensionType;
    /// Output column, `custom_<id>`.
    [[nodiscard]] auto column_name() const -> std::string;
};

enum class CustomAggregation : std::uint8_t {
    Sum,
    Avg,
    Max,
    Min,
    Count,
    AvgPerDay,
};

/// Re-aggregation of `source_metric` across `exclude_dimensions`.
struct CustomMetric {
    std::string id;
    std::string name;
    std::string source_metric;
    CustomAggregation aggregation = CustomAggregation::Sum;
    std::vector<std::string> exclude_dimensions;
};

/// Bucket rules in evaluation order: `min` descending, missing `min` last,
/// otherwise declaration order.
[[nodiscard]] auto ordered_buckets(const std::vector<BucketRule>& rules) -> std::vector<BucketRule>;

[[nodiscard]] auto parse_condition_op(std::string_view text) -> std::optional<ConditionOp>;
[[nodiscard]] auto to_string(ConditionOp op) -> std::string_view;

[[nodiscard]] auto parse_custom_dimension_type(std::string_view text)
    -> std::optional<CustomDimensionType>;
[[nodiscard]] auto to_string(CustomDimensionType type) -> std::string_view;

[[nodiscard]] auto parse_custom_aggregation(std::string_view text)
    -> std::optional<CustomAggregation>;
[[nodiscard]] auto to_string(CustomAggregation aggregation) -> std::string_view;

}  // namespace pivot
