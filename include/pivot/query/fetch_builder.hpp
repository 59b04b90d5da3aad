#pragma once

#include <pivot/catalog/schema.hpp>
#include <pivot/query/fetch_spec.hpp>
#include <pivot/query/filter.hpp>
#include <pivot/router/router.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pivot {

/// Table a fetch reads: a routed rollup (columns named by id, volumes
/// pre-summed) or the raw fact table (physical column names).
struct FetchTarget {
    std::string table;
    bool rollup = false;
};

/// Translates pivot requests into GroupedFetchSpecs.
///
/// Rollup fetches SUM the stored volume columns; raw fetches apply each
/// metric's own aggregation (COUNT DISTINCT stays COUNT DISTINCT). Every
/// output column is aliased to its dimension or metric id.
class FetchBuilder {
   public:
    FetchBuilder(const SchemaCatalog& schema, std::string source_table);

    [[nodiscard]] auto target(const RouteDecision& decision) const -> FetchTarget;
    [[nodiscard]] auto source_target() const -> FetchTarget { return {source_table_, false}; }

    /// Physical column of a dimension on `target`.
    [[nodiscard]] auto column_for(const FetchTarget& target, const std::string& dimension) const
        -> std::string;

    /// Grouped fetch of `volume_metrics` by `dimensions`, ordered by the first
    /// volume metric descending.
    [[nodiscard]] auto pivot_fetch(const FetchTarget& target,
                                   const std::vector<std::string>& dimensions,
                                   const std::vector<std::string>& volume_metrics,
                                   const DateBounds& dates, const FilterSpec& filters,
                                   std::optional<std::size_t> limit, std::size_t offset) const
        -> GroupedFetchSpec;

    /// Number of distinct `dimensions` combinations matching the filters.
    [[nodiscard]] auto group_count_fetch(const FetchTarget& target,
                                         const std::vector<std::string>& dimensions,
                                         const DateBounds& dates, const FilterSpec& filters) const
        -> GroupedFetchSpec;

    /// MIN/MAX of the date column as `min_date` / `max_date`.
    [[nodiscard]] auto date_probe(const FetchTarget& target) const -> GroupedFetchSpec;

    /// Non-null values of `dimension` as column `value`, ordered by
    /// `sort_metric` descending when given, alphabetically otherwise.
    [[nodiscard]] auto dimension_values_fetch(const FetchTarget& target,
                                              const std::string& dimension,
                                              const DateBounds& dates, const FilterSpec& filters,
                                              const std::optional<std::string>& sort_metric,
                                              std::size_t limit) const -> GroupedFetchSpec;

    [[nodiscard]] auto where_clause(const FetchTarget& target, const DateBounds& dates,
                                    const FilterSpec& filters) const -> std::vector<Predicate>;

   private:
    [[nodiscard]] auto metric_select(const FetchTarget& target, const std::string& metric) const
        -> SelectItem;

    const SchemaCatalog* schema_;
    std::string source_table_;
};

}  // namespace pivot
