#pragma once

#include <pivot/catalog/custom.hpp>
#include <pivot/formula/ast.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pivot {

/// System reference resolvable in every formula: days in the resolved range.
inline constexpr std::string_view kDaysInRange = "days_in_range";

enum class DataType : std::uint8_t {
    String,
    Integer,
    Float,
    Boolean,
    Date,
};

struct DimensionDef {
    std::string id;
    std::string column_name;
    DataType data_type = DataType::String;
    bool filterable = true;
    bool groupable = true;
};

enum class MetricCategory : std::uint8_t {
    Volume,
    Conversion,
    Other,
};

/// How a volume metric is computed from the raw fact table.
enum class VolumeAggregation : std::uint8_t {
    Sum,
    Count,
    CountDistinct,
};

struct MetricDef {
    std::string id;
    std::string name;
    MetricCategory category = MetricCategory::Other;
    /// Formula over other metric ids, e.g. `{clicks} / {queries}`. Empty for volume metrics.
    std::string formula;
    std::vector<std::string> depends_on;
    VolumeAggregation aggregation = VolumeAggregation::Sum;
    /// Raw fact-table column (volume metrics only; defaults to `id`).
    std::string source_column;

    [[nodiscard]] auto is_volume() const noexcept -> bool {
        return category == MetricCategory::Volume;
    }
};

struct SchemaError {
    std::string message;
};

/// Immutable, validated snapshot of one table's metric and dimension
/// definitions. Derived formulas are compiled once here.
class SchemaCatalog {
   public:
    [[nodiscard]] static auto build(std::string table, std::vector<DimensionDef> dimensions,
                                    std::vector<MetricDef> metrics,
                                    std::vector<CustomDimension> custom_dimensions = {},
                                    std::vector<CustomMetric> custom_metrics = {})
        -> std::expected<SchemaCatalog, SchemaError>;

    [[nodiscard]] auto table() const noexcept -> const std::string& { return table_; }
    [[nodiscard]] auto dimensions() const noexcept -> const std::vector<DimensionDef>& {
        return dimensions_;
    }
    /// All metrics in catalog order.
    [[nodiscard]] auto metrics() const noexcept -> const std::vector<MetricDef>& {
        return metrics_;
    }
    [[nodiscard]] auto custom_dimensions() const noexcept -> const std::vector<CustomDimension>& {
        return custom_dimensions_;
    }
    [[nodiscard]] auto custom_metrics() const noexcept -> const std::vector<CustomMetric>& {
        return custom_metrics_;
    }

    [[nodiscard]] auto find_metric(std::string_view id) const -> const MetricDef*;
    [[nodiscard]] auto find_dimension(std::string_view id) const -> const DimensionDef*;
    [[nodiscard]] auto find_custom_dimension(std::string_view id) const -> const CustomDimension*;
    [[nodiscard]] auto find_custom_metric(std::string_view id) const -> const CustomMetric*;

    /// Compiled formula of a derived metric, nullptr for volume or unknown ids.
    [[nodiscard]] auto formula(std::string_view id) const -> const formula::Expr*;

    /// Volume leaves `id` ultimately depends on, in catalog order. A volume
    /// metric depends on itself; unknown ids yield an empty list.
    [[nodiscard]] auto volume_dependencies(std::string_view id) const -> std::vector<std::string>;

    /// Derived metric ids ordered so every metric follows its dependencies.
    [[nodiscard]] auto evaluation_order() const noexcept -> const std::vector<std::string>& {
        return evaluation_order_;
    }

    [[nodiscard]] auto volume_metrics() const -> std::vector<const MetricDef*>;
    [[nodiscard]] auto groupable_dimensions() const -> std::vector<std::string>;

    /// A volume metric backed by COUNT DISTINCT: re-summing it across an
    /// unplanned dimension over-counts.
    [[nodiscard]] auto is_distinct_like(std::string_view id) const -> bool;

   private:
    SchemaCatalog() = default;

    std::string table_;
    std::vector<DimensionDef> dimensions_;
    std::vector<MetricDef> metrics_;
    std::vector<CustomDimension> custom_dimensions_;
    std::vector<CustomMetric> custom_metrics_;
    std::unordered_map<std::string, std::size_t> metric_index_;
    std::unordered_map<std::string, std::size_t> dimension_index_;
    std::unordered_map<std::string, formula::ExprPtr> formulas_;
    std::unordered_map<std::string, std::vector<std::string>> volume_leaves_;
    std::vector<std::string> evaluation_order_;
};

/// Read-only Schema/Config Store view: table name -> catalog snapshot.
class SchemaRegistry {
   public:
    /// Register (or replace) the snapshot for its table.
    void add(SchemaCatalog catalog);
    [[nodiscard]] auto find(std::string_view table) const -> const SchemaCatalog*;
    [[nodiscard]] auto tables() const -> std::vector<std::string>;

   private:
    std::unordered_map<std::string, SchemaCatalog> catalogs_;
};

[[nodiscard]] auto parse_data_type(std::string_view text) -> std::optional<DataType>;
[[nodiscard]] auto to_string(DataType type) -> std::string_view;
[[nodiscard]] auto parse_metric_category(std::string_view text) -> MetricCategory;
[[nodiscard]] auto to_string(MetricCategory category) -> std::string_view;
[[nodiscard]] auto parse_volume_aggregation(std::string_view text)
    -> std::optional<VolumeAggregation>;
[[nodiscard]] auto to_string(VolumeAggregation aggregation) -> std::string_view;

}  // namespace pivot
