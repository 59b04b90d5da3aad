#pragma once

#include <pivot/catalog/rollup.hpp>
#include <pivot/catalog/schema.hpp>
#include <pivot/core/date_resolver.hpp>
#include <pivot/engine/row_builder.hpp>
#include <pivot/query/fetch_spec.hpp>
#include <pivot/query/filter.hpp>
#include <pivot/router/router.hpp>
#include <pivot/store/tabular_store.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pivot {

/// Rollup catalogs keyed by source table.
using RollupRegistry = std::unordered_map<std::string, RollupCatalog>;

enum class PivotErrorType : std::uint8_t {
    RollupRequired,
    SchemaMissing,
    UnknownCustomDimension,
    UnknownCustomMetric,
    InvalidRequest,
    StoreFailure,
};

[[nodiscard]] auto to_string(PivotErrorType type) -> std::string_view;

struct PivotError {
    PivotErrorType type = PivotErrorType::InvalidRequest;
    std::string message;
    /// Routing failures only.
    std::vector<std::string> required_dimensions;
    std::vector<RollupScore> available_rollups;
    std::vector<std::string> missing_metrics;

    [[nodiscard]] auto error_type() const -> std::string_view { return to_string(type); }
};

struct PivotConfig {
    RouterOptions router;
    std::function<Date()> clock = [] { return today(); };
    std::size_t default_limit = 50;
};

struct PivotRequest {
    std::string table;
    std::vector<std::string> dimensions;
    FilterSpec filters;
    std::optional<std::size_t> limit;
    std::size_t offset = 0;
    /// Group by this custom dimension instead of `dimensions`.
    std::optional<std::string> custom_dimension_id;
    std::vector<std::string> custom_metric_ids;
    /// Metrics to compute; every catalog metric when absent.
    std::optional<std::vector<std::string>> metrics;
    bool require_rollup = true;
    bool skip_count = false;
};

struct PivotResponse {
    std::vector<PivotRow> rows;
    std::optional<PivotRow> total;
    std::vector<std::string> available_dimensions;
    std::int64_t total_count = 0;
    /// Set when routing found no usable rollup; rows are then empty.
    std::optional<PivotError> error;
};

struct InflationComparison {
    std::string metric;
    double baseline = 0.0;
    double current = 0.0;
    double ratio = 0.0;
    bool inflated = false;
};

/// One period of a trend series.
struct TrendPoint {
    /// First day of the period.
    Date date;
    /// Days of the period inside the requested date bounds.
    std::int64_t num_days = 1;
    std::map<std::string, double> metrics;
};

/// Totals of a grouped result compared with the date-only baseline rollup.
struct InflationReport {
    bool has_baseline = false;
    std::vector<InflationComparison> comparisons;
    bool any_inflated = false;
};

/// Entry point for pivot queries: routes, fetches, post-processes and shapes
/// rows. Catalogs and the store are borrowed and must outlive the service;
/// rollup status is read at call time.
class PivotService {
   public:
    PivotService(const SchemaRegistry& schemas, const RollupRegistry& rollups, TabularStore& store,
                 PivotConfig config = {});

    [[nodiscard]] auto route(std::string_view table, const RouteQuery& query,
                             bool require_rollup) const -> std::expected<RouteDecision, PivotError>;

    /// Routing decision `get_pivot_data` would act on.
    [[nodiscard]] auto route_request(const PivotRequest& request) const
        -> std::expected<RouteDecision, PivotError>;

    /// Main grouped fetch `get_pivot_data` would issue, for inspection.
    [[nodiscard]] auto plan_fetch(const PivotRequest& request) const
        -> std::expected<GroupedFetchSpec, PivotError>;

    /// Routing failures come back inside the response; unknown tables,
    /// unknown custom ids, bad requests and store failures as errors.
    [[nodiscard]] auto get_pivot_data(const PivotRequest& request) const
        -> std::expected<PivotResponse, PivotError>;

    /// Rows of `child_dimension` under one parent row. `dimension = value` is
    /// added to the filters; an empty dimension or value adds nothing.
    [[nodiscard]] auto get_pivot_children(
        std::string_view table, const std::string& dimension, const std::string& value,
        const std::string& child_dimension, const FilterSpec& filters, std::size_t limit = 100,
        std::size_t offset = 0,
        const std::optional<std::vector<std::string>>& metrics = std::nullopt) const
        -> std::expected<PivotResponse, PivotError>;

    /// Metrics per day, week or month over the filtered range, oldest first.
    /// Derived metrics are recomputed per period with `{days_in_range}` bound
    /// to the period's day count.
    [[nodiscard]] auto get_trend_data(
        std::string_view table, const FilterSpec& filters, TimeGrain grain = TimeGrain::Daily,
        const std::optional<std::vector<std::string>>& metrics = std::nullopt,
        bool require_rollup = true) const -> std::expected<std::vector<TrendPoint>, PivotError>;

    /// Distinct non-null values of `dimension`, ordered by the first volume
    /// metric descending.
    [[nodiscard]] auto get_dimension_values(std::string_view table, const std::string& dimension,
                                            const FilterSpec& filters, std::size_t limit = 1000,
                                            const std::vector<std::string>& pivot_dimensions = {},
                                            bool require_rollup = false) const
        -> std::expected<std::vector<std::string>, PivotError>;

    /// Flag metrics whose `current_totals` exceed the baseline by more than
    /// `threshold`. Without a baseline rollup, or with dimension filters it
    /// cannot apply, the report has no baseline.
    [[nodiscard]] auto check_inflation(std::string_view table,
                                       const std::map<std::string, double>& current_totals,
                                       const FilterSpec& filters, double threshold = 0.01) const
        -> std::expected<InflationReport, PivotError>;

   private:
    struct Plan;

    [[nodiscard]] auto prepare(const PivotRequest& request) const -> std::expected<Plan, PivotError>;
    [[nodiscard]] auto schema_for(std::string_view table) const
        -> std::expected<const SchemaCatalog*, PivotError>;
    [[nodiscard]] auto rollups_for(std::string_view table) const -> const RollupCatalog&;

    const SchemaRegistry* schemas_;
    const RollupRegistry* rollups_;
    TabularStore* store_;
    PivotConfig config_;
    RollupCatalog no_rollups_;
};

}  // namespace pivot
