#include <pivot/engine/aggregation.hpp>
#include <pivot/formula/evaluator.hpp>

#include <spdlog/spdlog.h>

#include <unordered_set>

namespace pivot {

AggregationEngine::AggregationEngine(const SchemaCatalog& schema, TabularStore& store,
                                     std::string source_table)
    : schema_(&schema), store_(&store), builder_(schema, std::move(source_table)) {}

auto AggregationEngine::volume_metrics(const std::vector<std::string>& metrics) const
    -> std::vector<std::string> {
    std::unordered_set<std::string> needed;
    for (const auto& id : metrics) {
        for (auto& leaf : schema_->volume_dependencies(id)) {
            needed.insert(std::move(leaf));
        }
    }
    std::vector<std::string> out;
    for (const auto& metric : schema_->metrics()) {
        if (needed.contains(metric.id)) {
            out.push_back(metric.id);
        }
    }
    return out;
}

auto AggregationEngine::derived_closure(const std::vector<std::string>& metrics) const
    -> std::vector<std::string> {
    std::unordered_set<std::string> needed;
    std::vector<std::string> pending(metrics.begin(), metrics.end());
    while (!pending.empty()) {
        auto id = std::move(pending.back());
        pending.pop_back();
        const auto* metric = schema_->find_metric(id);
        if (metric == nullptr || metric->is_volume() || !needed.insert(id).second) {
            continue;
        }
        pending.insert(pending.end(), metric->depends_on.begin(), metric->depends_on.end());
    }
    std::vector<std::string> ordered;
    for (const auto& id : schema_->evaluation_order()) {
        if (needed.contains(id)) {
            ordered.push_back(id);
        }
    }
    return ordered;
}

auto AggregationEngine::aggregate(const AggregationRequest& request) const
    -> std::expected<Table, StoreError> {
    auto spec = builder_.pivot_fetch(request.target, request.dimensions,
                                     volume_metrics(request.metrics), request.dates,
                                     request.filters, request.limit, request.offset);
    spdlog::debug("aggregate: table={} rollup={} dims={} selects={}", spec.table,
                  request.target.rollup, request.dimensions.size(), spec.select.size());
    auto fetched = store_->execute(spec);
    if (!fetched.has_value()) {
        return std::unexpected(fetched.error());
    }
    compute_derived(*fetched, request.metrics, request.num_days);
    return std::move(*fetched);
}

void AggregationEngine::compute_derived(Table& table, const std::vector<std::string>& metrics,
                                        std::int64_t num_days) const {
    compute_derived(table, metrics, std::vector<std::int64_t>(table.rows(), num_days));
}

void AggregationEngine::compute_derived(Table& table, const std::vector<std::string>& metrics,
                                        const std::vector<std::int64_t>& days_per_row) const {
    std::size_t row = 0;
    formula::RefResolver resolve = [&](std::string_view ref) -> std::optional<double> {
        if (ref == kDaysInRange) {
            std::int64_t days = row < days_per_row.size() ? days_per_row[row] : 1;
            return static_cast<double>(days < 1 ? 1 : days);
        }
        const auto* entry = table.find_entry(std::string(ref));
        if (entry == nullptr) {
            return std::nullopt;
        }
        return numeric_at(*entry, row);
    };

    const std::size_t rows = table.rows();
    for (const auto& id : derived_closure(metrics)) {
        const auto* expr = schema_->formula(id);
        if (expr == nullptr) {
            continue;
        }
        Column<double> values;
        values.reserve(rows);
        for (row = 0; row < rows; ++row) {
            auto value = formula::evaluate(*expr, resolve);
            if (!value.has_value()) {
                spdlog::warn("metric '{}' row {}: {}", id, row, value.error().message);
                values.push_back(0.0);
                continue;
            }
            values.push_back(*value);
        }
        table.set_column(id, std::move(values));
    }
}

}  // namespace pivot
