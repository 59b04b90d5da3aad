#include <pivot/query/fetch_builder.hpp>

#include <algorithm>

namespace pivot {

namespace {

auto to_aggregate(VolumeAggregation aggregation) -> AggregateKind {
    switch (aggregation) {
        case VolumeAggregation::Sum:
            return AggregateKind::Sum;
        case VolumeAggregation::Count:
            return AggregateKind::Count;
        case VolumeAggregation::CountDistinct:
            return AggregateKind::CountDistinct;
    }
    return AggregateKind::Sum;
}

}  // namespace

FetchBuilder::FetchBuilder(const SchemaCatalog& schema, std::string source_table)
    : schema_(&schema), source_table_(std::move(source_table)) {}

auto FetchBuilder::target(const RouteDecision& decision) const -> FetchTarget {
    if (decision.use_rollup()) {
        return FetchTarget{.table = decision.table_path(), .rollup = true};
    }
    return source_target();
}

auto FetchBuilder::column_for(const FetchTarget& target, const std::string& dimension) const
    -> std::string {
    if (target.rollup) {
        return dimension;
    }
    if (const auto* def = schema_->find_dimension(dimension)) {
        return def->column_name;
    }
    return dimension;
}

auto FetchBuilder::metric_select(const FetchTarget& target, const std::string& metric) const
    -> SelectItem {
    const auto* def = schema_->find_metric(metric);
    if (target.rollup || def == nullptr) {
        return SelectItem{.column = metric, .aggregate = AggregateKind::Sum, .alias = metric};
    }
    return SelectItem{
        .column = def->source_column, .aggregate = to_aggregate(def->aggregation), .alias = metric};
}

auto FetchBuilder::where_clause(const FetchTarget& target, const DateBounds& dates,
                                const FilterSpec& filters) const -> std::vector<Predicate> {
    std::vector<Predicate> where;
    if (dates.start.has_value() || dates.end.has_value()) {
        where.emplace_back(DateBetween{
            .column = column_for(target, kDateDimension), .start = dates.start, .end = dates.end});
    }
    for (const auto& [dimension, values] : filters.dimension_filters) {
        if (values.empty()) {
            continue;
        }
        ValueIn predicate{.column = column_for(target, dimension), .values = {},
                          .include_null = false, .data_type = DataType::String};
        if (const auto* def = schema_->find_dimension(dimension)) {
            predicate.data_type = def->data_type;
        }
        for (const auto& value : values) {
            if (value == kNullMarker) {
                predicate.include_null = true;
            } else {
                predicate.values.push_back(value);
            }
        }
        where.emplace_back(std::move(predicate));
    }
    return where;
}

auto FetchBuilder::pivot_fetch(const FetchTarget& target,
                               const std::vector<std::string>& dimensions,
                               const std::vector<std::string>& volume_metrics,
                               const DateBounds& dates, const FilterSpec& filters,
                               std::optional<std::size_t> limit, std::size_t offset) const
    -> GroupedFetchSpec {
    GroupedFetchSpec spec;
    spec.table = target.table;
    for (const auto& dimension : dimensions) {
        auto column = column_for(target, dimension);
        spec.select.push_back(
            SelectItem{.column = column, .aggregate = AggregateKind::None, .alias = dimension});
        spec.group_by.push_back(std::move(column));
    }
    for (const auto& metric : volume_metrics) {
        spec.select.push_back(metric_select(target, metric));
    }
    spec.where = where_clause(target, dates, filters);

    auto first_volume = std::ranges::find_if(schema_->metrics(), [&](const MetricDef& metric) {
        return metric.is_volume() && std::ranges::find(volume_metrics, metric.id) !=
                                         volume_metrics.end();
    });
    if (first_volume != schema_->metrics().end()) {
        spec.order_by.push_back(OrderBy{.alias = first_volume->id, .descending = true});
    }
    spec.limit = limit;
    spec.offset = offset;
    return spec;
}

auto FetchBuilder::group_count_fetch(const FetchTarget& target,
                                     const std::vector<std::string>& dimensions,
                                     const DateBounds& dates, const FilterSpec& filters) const
    -> GroupedFetchSpec {
    GroupedFetchSpec spec;
    spec.table = target.table;
    for (const auto& dimension : dimensions) {
        auto column = column_for(target, dimension);
        spec.select.push_back(
            SelectItem{.column = column, .aggregate = AggregateKind::None, .alias = dimension});
        spec.group_by.push_back(std::move(column));
    }
    spec.where = where_clause(target, dates, filters);
    spec.count_groups = true;
    return spec;
}

auto FetchBuilder::date_probe(const FetchTarget& target) const -> GroupedFetchSpec {
    auto column = column_for(target, kDateDimension);
    GroupedFetchSpec spec;
    spec.table = target.table;
    spec.select.push_back(
        SelectItem{.column = column, .aggregate = AggregateKind::Min, .alias = "min_date"});
    spec.select.push_back(
        SelectItem{.column = column, .aggregate = AggregateKind::Max, .alias = "max_date"});
    return spec;
}

auto FetchBuilder::dimension_values_fetch(const FetchTarget& target, const std::string& dimension,
                                          const DateBounds& dates, const FilterSpec& filters,
                                          const std::optional<std::string>& sort_metric,
                                          std::size_t limit) const -> GroupedFetchSpec {
    auto column = column_for(target, dimension);
    GroupedFetchSpec spec;
    spec.table = target.table;
    spec.select.push_back(
        SelectItem{.column = column, .aggregate = AggregateKind::None, .alias = "value"});
    spec.group_by.push_back(column);
    spec.where = where_clause(target, dates, filters);
    spec.where.emplace_back(IsNotNull{.column = column});

    if (sort_metric.has_value()) {
        auto sort = metric_select(target, *sort_metric);
        sort.alias = "sort_metric";
        spec.select.push_back(std::move(sort));
        spec.order_by.push_back(OrderBy{.alias = "sort_metric", .descending = true});
    } else {
        spec.order_by.push_back(OrderBy{.alias = "value", .descending = false});
    }
    spec.limit = limit;
    return spec;
}

}  // namespace pivot
