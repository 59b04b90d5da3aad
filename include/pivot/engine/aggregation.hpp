#pragma once

#include <pivot/catalog/schema.hpp>
#include <pivot/core/table.hpp>
#include <pivot/query/fetch_builder.hpp>
#include <pivot/store/tabular_store.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace pivot {

/// One grouped fetch plus the derived metrics computed on top of it.
struct AggregationRequest {
    FetchTarget target;
    std::vector<std::string> dimensions;
    /// Requested metric ids, volume or derived.
    std::vector<std::string> metrics;
    DateBounds dates;
    FilterSpec filters;
    std::optional<std::size_t> limit;
    std::size_t offset = 0;
    /// Value bound to `{days_in_range}`.
    std::int64_t num_days = 1;
};

/// Issues the single grouped fetch of a pivot query and evaluates derived
/// metrics over the fetched volume columns.
///
/// The store sums rollup volumes (or applies the raw aggregation), so no
/// per-date rows are ever aggregated here.
class AggregationEngine {
   public:
    AggregationEngine(const SchemaCatalog& schema, TabularStore& store, std::string source_table);

    [[nodiscard]] auto builder() const noexcept -> const FetchBuilder& { return builder_; }

    /// Volume leaves of `metrics`, in catalog order.
    [[nodiscard]] auto volume_metrics(const std::vector<std::string>& metrics) const
        -> std::vector<std::string>;

    [[nodiscard]] auto aggregate(const AggregationRequest& request) const
        -> std::expected<Table, StoreError>;

    /// (Re)compute every derived metric `metrics` needs, in dependency order,
    /// as double columns named by metric id. A formula failing on a row
    /// yields 0 for that row.
    void compute_derived(Table& table, const std::vector<std::string>& metrics,
                         std::int64_t num_days) const;
    /// As above with `{days_in_range}` bound per row.
    void compute_derived(Table& table, const std::vector<std::string>& metrics,
                         const std::vector<std::int64_t>& days_per_row) const;

    /// Derived metric ids `metrics` transitively needs, in evaluation order.
    [[nodiscard]] auto derived_closure(const std::vector<std::string>& metrics) const
        -> std::vector<std::string>;

   private:
    const SchemaCatalog* schema_;
    TabularStore* store_;
    FetchBuilder builder_;
};

}  // namespace pivot
