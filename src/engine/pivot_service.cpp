#include <pivot/engine/aggregation.hpp>
#include <pivot/engine/pivot_service.hpp>
#include <pivot/engine/post_process.hpp>
#include <pivot/query/fetch_builder.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>

namespace pivot {

namespace {

auto store_failure(const StoreError& error) -> PivotError {
    return PivotError{.type = PivotErrorType::StoreFailure,
                      .message = fmt::format("store: {}", error.message),
                      .required_dimensions = {},
                      .available_rollups = {},
                      .missing_metrics = {}};
}

auto request_error(PivotErrorType type, std::string message) -> PivotError {
    return PivotError{.type = type,
                      .message = std::move(message),
                      .required_dimensions = {},
                      .available_rollups = {},
                      .missing_metrics = {}};
}

auto routing_error(const RouteDecision& decision, const QueryRouter& router,
                   const RouteQuery& query) -> PivotError {
    return PivotError{.type = PivotErrorType::RollupRequired,
                      .message = decision.reason(),
                      .required_dimensions = decision.required_dimensions(),
                      .available_rollups = router.diagnose(query),
                      .missing_metrics = decision.metrics_unavailable()};
}

void append_unique(std::vector<std::string>& values, const std::string& value) {
    if (!value.empty() && std::ranges::find(values, value) == values.end()) {
        values.push_back(value);
    }
}

auto date_in(const ColumnEntry& entry, std::size_t row) -> std::optional<Date> {
    if (is_null(entry, row)) {
        return std::nullopt;
    }
    if (const auto* dates = std::get_if<Column<Date>>(entry.column.get())) {
        return (*dates)[row];
    }
    if (const auto* strings = std::get_if<Column<std::string>>(entry.column.get())) {
        return parse_date((*strings)[row]);
    }
    return std::nullopt;
}

auto date_at(const Table& table, const std::string& column) -> std::optional<Date> {
    const auto* entry = table.find_entry(column);
    if (entry == nullptr || table.rows() == 0) {
        return std::nullopt;
    }
    return date_in(*entry, 0);
}

// Days of `period` inside the (possibly open) bounds.
auto clipped_days(const DateRange& period, const DateBounds& bounds) -> std::int64_t {
    Date start = std::max(period.start, bounds.start.value_or(period.start));
    Date end = std::min(period.end, bounds.end.value_or(period.end));
    return DateRange{.start = start, .end = end}.num_days();
}

auto slice_rows(const Table& table, std::size_t offset, std::size_t limit) -> Table {
    const std::size_t rows = table.rows();
    const std::size_t begin = std::min(offset, rows);
    const std::size_t end = begin + std::min(limit, rows - begin);
    Table out;
    for (const auto& entry : table.columns) {
        auto column = make_empty_like(*entry.column);
        std::optional<std::vector<bool>> validity;
        if (entry.validity.has_value()) {
            validity.emplace();
        }
        for (std::size_t row = begin; row < end; ++row) {
            append_value(column, *entry.column, row);
            if (validity.has_value()) {
                validity->push_back((*entry.validity)[row]);
            }
        }
        out.set_column(entry.name, std::move(column), std::move(validity));
    }
    return out;
}

}  // namespace

auto to_string(PivotErrorType type) -> std::string_view {
    switch (type) {
        case PivotErrorType::RollupRequired:
            return "rollup_required";
        case PivotErrorType::SchemaMissing:
            return "schema_missing";
        case PivotErrorType::UnknownCustomDimension:
            return "unknown_custom_dimension";
        case PivotErrorType::UnknownCustomMetric:
            return "unknown_custom_metric";
        case PivotErrorType::InvalidRequest:
            return "invalid_request";
        case PivotErrorType::StoreFailure:
            return "store_failure";
    }
    return "unknown";
}

struct PivotService::Plan {
    const SchemaCatalog* schema = nullptr;
    const RollupCatalog* rollups = nullptr;
    const CustomDimension* custom_dimension = nullptr;
    std::vector<const CustomMetric*> custom_metrics;
    /// Requested dimensions plus `date` for a date_range custom dimension.
    std::vector<std::string> fetch_dimensions;
    /// Requested metrics plus the sources of custom dimensions and metrics.
    std::vector<std::string> metrics;
    DateBounds dates;
    RouteQuery query;
    RouteDecision decision{RouteDecision::Fields{}};
    FetchTarget target;
};

PivotService::PivotService(const SchemaRegistry& schemas, const RollupRegistry& rollups,
                           TabularStore& store, PivotConfig config)
    : schemas_(&schemas), rollups_(&rollups), store_(&store), config_(std::move(config)) {}

auto PivotService::schema_for(std::string_view table) const
    -> std::expected<const SchemaCatalog*, PivotError> {
    const auto* schema = schemas_->find(table);
    if (schema == nullptr) {
        return std::unexpected(request_error(PivotErrorType::SchemaMissing,
                                             fmt::format("no schema for table '{}'", table)));
    }
    return schema;
}

auto PivotService::rollups_for(std::string_view table) const -> const RollupCatalog& {
    if (auto it = rollups_->find(std::string(table)); it != rollups_->end()) {
        return it->second;
    }
    return no_rollups_;
}

auto PivotService::route(std::string_view table, const RouteQuery& query,
                         bool require_rollup) const -> std::expected<RouteDecision, PivotError> {
    auto schema = schema_for(table);
    if (!schema.has_value()) {
        return std::unexpected(schema.error());
    }
    QueryRouter router(**schema, rollups_for(table), config_.router);
    return router.route(query, require_rollup);
}

auto PivotService::prepare(const PivotRequest& request) const -> std::expected<Plan, PivotError> {
    auto schema = schema_for(request.table);
    if (!schema.has_value()) {
        return std::unexpected(schema.error());
    }

    Plan plan;
    plan.schema = *schema;
    plan.rollups = &rollups_for(request.table);

    if (request.custom_dimension_id.has_value()) {
        plan.custom_dimension = plan.schema->find_custom_dimension(*request.custom_dimension_id);
        if (plan.custom_dimension == nullptr) {
            return std::unexpected(request_error(
                PivotErrorType::UnknownCustomDimension,
                fmt::format("unknown custom dimension '{}'", *request.custom_dimension_id)));
        }
    }
    for (const auto& id : request.custom_metric_ids) {
        const auto* custom = plan.schema->find_custom_metric(id);
        if (custom == nullptr) {
            return std::unexpected(request_error(PivotErrorType::UnknownCustomMetric,
                                                 fmt::format("unknown custom metric '{}'", id)));
        }
        plan.custom_metrics.push_back(custom);
    }

    for (const auto& dimension : request.dimensions) {
        if (plan.schema->find_dimension(dimension) == nullptr) {
            return std::unexpected(request_error(PivotErrorType::InvalidRequest,
                                                 fmt::format("unknown dimension '{}'", dimension)));
        }
        append_unique(plan.fetch_dimensions, dimension);
    }
    if (plan.custom_dimension != nullptr &&
        plan.custom_dimension->type() == CustomDimensionType::DateRange) {
        append_unique(plan.fetch_dimensions, kDateDimension);
    }

    if (request.metrics.has_value()) {
        for (const auto& id : *request.metrics) {
            if (plan.schema->find_metric(id) == nullptr) {
                return std::unexpected(request_error(PivotErrorType::InvalidRequest,
                                                     fmt::format("unknown metric '{}'", id)));
            }
            append_unique(plan.metrics, id);
        }
    } else {
        for (const auto& metric : plan.schema->metrics()) {
            plan.metrics.push_back(metric.id);
        }
    }
    if (plan.custom_dimension != nullptr) {
        append_unique(plan.metrics, plan.custom_dimension->source_metric);
    }
    for (const auto* custom : plan.custom_metrics) {
        append_unique(plan.metrics, custom->source_metric);
    }

    plan.dates = request.filters.resolve_dates(config_.clock());
    plan.query = RouteQuery{.dimensions = plan.fetch_dimensions,
                            .metrics = plan.metrics,
                            .filter_dimensions = request.filters.route_dimensions(plan.dates)};
    QueryRouter router(*plan.schema, *plan.rollups, config_.router);
    plan.decision = router.route(plan.query, request.require_rollup);
    plan.target = FetchBuilder(*plan.schema, plan.schema->table()).target(plan.decision);
    return plan;
}

auto PivotService::route_request(const PivotRequest& request) const
    -> std::expected<RouteDecision, PivotError> {
    auto prepared = prepare(request);
    if (!prepared.has_value()) {
        return std::unexpected(prepared.error());
    }
    return prepared->decision;
}

auto PivotService::plan_fetch(const PivotRequest& request) const
    -> std::expected<GroupedFetchSpec, PivotError> {
    auto prepared = prepare(request);
    if (!prepared.has_value()) {
        return std::unexpected(prepared.error());
    }
    const auto& plan = *prepared;
    if (request.require_rollup && !plan.decision.use_rollup()) {
        QueryRouter router(*plan.schema, *plan.rollups, config_.router);
        return std::unexpected(routing_error(plan.decision, router, plan.query));
    }
    bool regroup = plan.custom_dimension != nullptr;
    FetchBuilder builder(*plan.schema, plan.schema->table());
    AggregationEngine engine(*plan.schema, *store_, plan.schema->table());
    return builder.pivot_fetch(
        plan.target, plan.fetch_dimensions, engine.volume_metrics(plan.metrics), plan.dates,
        request.filters,
        regroup ? std::nullopt
                : std::optional<std::size_t>(request.limit.value_or(config_.default_limit)),
        regroup ? 0 : request.offset);
}

auto PivotService::get_pivot_data(const PivotRequest& request) const
    -> std::expected<PivotResponse, PivotError> {
    auto prepared = prepare(request);
    if (!prepared.has_value()) {
        return std::unexpected(prepared.error());
    }
    const auto& plan = *prepared;
    const auto& schema = *plan.schema;

    PivotResponse response;
    response.available_dimensions = schema.groupable_dimensions();

    if (request.require_rollup && !plan.decision.use_rollup()) {
        QueryRouter router(schema, *plan.rollups, config_.router);
        response.error = routing_error(plan.decision, router, plan.query);
        spdlog::warn("pivot {}: {}", request.table, plan.decision.reason());
        return response;
    }

    AggregationEngine engine(schema, *store_, schema.table());

    // Day count for avg_per_day and {days_in_range}; open bounds come from the data.
    bool needs_days = std::ranges::any_of(plan.custom_metrics, [](const CustomMetric* custom) {
        return custom->aggregation == CustomAggregation::AvgPerDay;
    });
    for (const auto& id : engine.derived_closure(plan.metrics)) {
        const auto refs = formula::references(*schema.formula(id));
        if (std::ranges::find(refs, std::string(kDaysInRange)) != refs.end()) {
            needs_days = true;
        }
    }
    DateBounds day_bounds = plan.dates;
    if (needs_days && !day_bounds.complete()) {
        auto probe = store_->execute(engine.builder().date_probe(plan.target));
        if (!probe.has_value()) {
            return std::unexpected(store_failure(probe.error()));
        }
        if (!day_bounds.start.has_value()) {
            day_bounds.start = date_at(*probe, "min_date");
        }
        if (!day_bounds.end.has_value()) {
            day_bounds.end = date_at(*probe, "max_date");
        }
    }
    std::int64_t num_days = 1;
    if (auto range = day_bounds.range()) {
        num_days = range->num_days();
    }

    const bool regroup = plan.custom_dimension != nullptr;
    const std::size_t limit = request.limit.value_or(config_.default_limit);
    AggregationRequest aggregation{
        .target = plan.target,
        .dimensions = plan.fetch_dimensions,
        .metrics = plan.metrics,
        .dates = plan.dates,
        .filters = request.filters,
        .limit = regroup ? std::nullopt : std::optional<std::size_t>(limit),
        .offset = regroup ? 0 : request.offset,
        .num_days = num_days,
    };
    auto table = engine.aggregate(aggregation);
    if (!table.has_value()) {
        return std::unexpected(store_failure(table.error()));
    }

    std::vector<std::string> current_dims = request.dimensions;
    std::size_t regrouped_rows = 0;
    if (regroup) {
        auto column =
            apply_custom_dimension(*table, *plan.custom_dimension, plan.fetch_dimensions, true);
        if (!column.has_value()) {
            return std::unexpected(
                request_error(PivotErrorType::InvalidRequest, column.error().message));
        }
        current_dims = {*column};
        engine.compute_derived(*table, plan.metrics, num_days);
        regrouped_rows = table->rows();
        *table = slice_rows(*table, request.offset, limit);
    }
    for (const auto* custom : plan.custom_metrics) {
        apply_custom_metric(*table, *custom, current_dims, num_days);
    }

    std::vector<std::string> metric_columns;
    for (const auto& metric : schema.metrics()) {
        if (table->contains(metric.id)) {
            metric_columns.push_back(metric.id);
        }
    }
    for (const auto* custom : plan.custom_metrics) {
        if (table->contains(custom->id)) {
            metric_columns.push_back(custom->id);
        }
    }
    RowBuilder builder(schema, std::move(metric_columns), num_days);
    response.rows = builder.build_rows(*table, current_dims);
    response.total = builder.build_total(*table);

    if (current_dims.empty()) {
        response.total_count = 1;
    } else if (request.skip_count) {
        response.total_count = static_cast<std::int64_t>(response.rows.size());
    } else if (regroup) {
        response.total_count = static_cast<std::int64_t>(regrouped_rows);
    } else {
        auto counted = store_->execute(engine.builder().group_count_fetch(
            plan.target, plan.fetch_dimensions, plan.dates, request.filters));
        if (!counted.has_value()) {
            return std::unexpected(store_failure(counted.error()));
        }
        const auto* entry = counted->find_entry(std::string(kGroupCountColumn));
        if (entry != nullptr && counted->rows() > 0) {
            response.total_count = static_cast<std::int64_t>(numeric_at(*entry, 0));
        }
    }

    spdlog::info("pivot {}: dims=[{}] rows={} total_count={} via {}", request.table,
                 fmt::join(current_dims, ", "), response.rows.size(), response.total_count,
                 plan.target.table);
    return response;
}

auto PivotService::get_pivot_children(std::string_view table, const std::string& dimension,
                                      const std::string& value, const std::string& child_dimension,
                                      const FilterSpec& filters, std::size_t limit,
                                      std::size_t offset,
                                      const std::optional<std::vector<std::string>>& metrics) const
    -> std::expected<PivotResponse, PivotError> {
    PivotRequest request;
    request.table = std::string(table);
    request.dimensions = {child_dimension};
    request.filters = filters;
    request.limit = limit;
    request.offset = offset;
    request.metrics = metrics;
    if (!dimension.empty() && !value.empty()) {
        auto schema = schema_for(table);
        if (!schema.has_value()) {
            return std::unexpected(schema.error());
        }
        if ((*schema)->find_dimension(dimension) == nullptr) {
            return std::unexpected(request_error(
                PivotErrorType::InvalidRequest, fmt::format("unknown dimension '{}'", dimension)));
        }
        request.filters.dimension_filters[dimension] = {value};
    }
    spdlog::debug("children {}: {}={} -> {}", table, dimension, value, child_dimension);
    return get_pivot_data(request);
}

auto PivotService::get_trend_data(std::string_view table, const FilterSpec& filters,
                                  TimeGrain grain,
                                  const std::optional<std::vector<std::string>>& metrics,
                                  bool require_rollup) const
    -> std::expected<std::vector<TrendPoint>, PivotError> {
    auto schema = schema_for(table);
    if (!schema.has_value()) {
        return std::unexpected(schema.error());
    }
    const auto& catalog = **schema;

    std::vector<std::string> requested;
    if (metrics.has_value()) {
        for (const auto& id : *metrics) {
            if (catalog.find_metric(id) == nullptr) {
                return std::unexpected(request_error(PivotErrorType::InvalidRequest,
                                                     fmt::format("unknown metric '{}'", id)));
            }
            append_unique(requested, id);
        }
    } else {
        for (const auto& metric : catalog.metrics()) {
            requested.push_back(metric.id);
        }
    }

    auto dates = filters.resolve_dates(config_.clock());
    RouteQuery query{.dimensions = {kDateDimension},
                     .metrics = requested,
                     .filter_dimensions = filters.route_dimensions(dates)};
    QueryRouter router(catalog, rollups_for(table), config_.router);
    auto decision = router.route(query, require_rollup);
    if (require_rollup && !decision.use_rollup()) {
        return std::unexpected(routing_error(decision, router, query));
    }

    AggregationEngine engine(catalog, *store_, catalog.table());
    auto target = engine.builder().target(decision);
    auto volumes = engine.volume_metrics(requested);
    auto fetched = store_->execute(engine.builder().pivot_fetch(
        target, {kDateDimension}, volumes, dates, filters, std::nullopt, 0));
    if (!fetched.has_value()) {
        return std::unexpected(store_failure(fetched.error()));
    }

    // Daily rows summed into periods, keyed by period start.
    std::vector<const ColumnEntry*> sources;
    for (const auto& id : volumes) {
        sources.push_back(fetched->find_entry(id));
    }
    std::map<Date, std::vector<double>> periods;
    if (const auto* day_entry = fetched->find_entry(kDateDimension)) {
        for (std::size_t row = 0; row < fetched->rows(); ++row) {
            auto day = date_in(*day_entry, row);
            if (!day.has_value()) {
                continue;
            }
            auto& sums = periods[period_of(*day, grain).start];
            sums.resize(volumes.size(), 0.0);
            for (std::size_t i = 0; i < sources.size(); ++i) {
                if (sources[i] != nullptr) {
                    sums[i] += numeric_at(*sources[i], row);
                }
            }
        }
    }

    Table series;
    Column<Date> starts;
    std::vector<Column<double>> sums(volumes.size());
    std::vector<std::int64_t> days;
    for (const auto& [start, values] : periods) {
        starts.push_back(start);
        for (std::size_t i = 0; i < values.size(); ++i) {
            sums[i].push_back(values[i]);
        }
        days.push_back(clipped_days(period_of(start, grain), dates));
    }
    series.add_column(kDateDimension, std::move(starts));
    for (std::size_t i = 0; i < volumes.size(); ++i) {
        series.add_column(volumes[i], std::move(sums[i]));
    }
    engine.compute_derived(series, requested, days);

    std::vector<TrendPoint> points;
    points.reserve(series.rows());
    const auto* start_entry = series.find_entry(kDateDimension);
    for (std::size_t row = 0; row < series.rows(); ++row) {
        TrendPoint point{.date = *date_in(*start_entry, row), .num_days = days[row], .metrics = {}};
        for (const auto& metric : catalog.metrics()) {
            if (const auto* entry = series.find_entry(metric.id)) {
                point.metrics[metric.id] = numeric_at(*entry, row);
            }
        }
        points.push_back(std::move(point));
    }
    spdlog::info("trend {}: {} points ({}) via {}", table, points.size(), grain_name(grain),
                 target.table);
    return points;
}

auto PivotService::get_dimension_values(std::string_view table, const std::string& dimension,
                                        const FilterSpec& filters, std::size_t limit,
                                        const std::vector<std::string>& pivot_dimensions,
                                        bool require_rollup) const
    -> std::expected<std::vector<std::string>, PivotError> {
    auto schema = schema_for(table);
    if (!schema.has_value()) {
        return std::unexpected(schema.error());
    }
    if ((*schema)->find_dimension(dimension) == nullptr) {
        return std::unexpected(request_error(PivotErrorType::InvalidRequest,
                                             fmt::format("unknown dimension '{}'", dimension)));
    }

    std::vector<std::string> dimensions{dimension};
    for (const auto& extra : pivot_dimensions) {
        append_unique(dimensions, extra);
    }
    for (const auto& extra : filters.filter_dimensions()) {
        append_unique(dimensions, extra);
    }
    std::ranges::sort(dimensions);

    auto dates = filters.resolve_dates(config_.clock());
    RouteQuery query{.dimensions = dimensions,
                     .metrics = {},
                     .filter_dimensions = filters.route_dimensions(dates)};
    QueryRouter router(**schema, rollups_for(table), config_.router);
    auto decision = router.route(query, require_rollup);
    if (require_rollup && !decision.use_rollup()) {
        return std::unexpected(routing_error(decision, router, query));
    }

    FetchBuilder builder(**schema, (*schema)->table());
    auto target = builder.target(decision);
    std::optional<std::string> sort_metric;
    if (target.rollup) {
        if (!decision.metrics_available().empty()) {
            sort_metric = decision.metrics_available().front();
        }
    } else if (auto volumes = (*schema)->volume_metrics(); !volumes.empty()) {
        sort_metric = volumes.front()->id;
    }

    auto fetched = store_->execute(
        builder.dimension_values_fetch(target, dimension, dates, filters, sort_metric, limit));
    if (!fetched.has_value()) {
        return std::unexpected(store_failure(fetched.error()));
    }

    std::vector<std::string> values;
    if (const auto* entry = fetched->find_entry("value")) {
        values.reserve(fetched->rows());
        for (std::size_t row = 0; row < fetched->rows(); ++row) {
            if (!is_null(*entry, row)) {
                values.push_back(format_scalar(scalar_at(*entry->column, row)));
            }
        }
    }
    spdlog::debug("dimension values {}.{}: {} values via {}", table, dimension, values.size(),
                  target.table);
    return values;
}

auto PivotService::check_inflation(std::string_view table,
                                   const std::map<std::string, double>& current_totals,
                                   const FilterSpec& filters, double threshold) const
    -> std::expected<InflationReport, PivotError> {
    auto schema = schema_for(table);
    if (!schema.has_value()) {
        return std::unexpected(schema.error());
    }

    InflationReport report;
    const auto* baseline = rollups_for(table).baseline();
    if (baseline == nullptr) {
        return report;
    }
    if (!filters.filter_dimensions().empty()) {
        spdlog::debug("inflation check skipped: baseline '{}' cannot apply dimension filters",
                      baseline->id());
        return report;
    }

    std::vector<std::string> metrics;
    for (const auto* metric : (*schema)->volume_metrics()) {
        if (current_totals.contains(metric->id) && baseline->stores_metric(metric->id)) {
            metrics.push_back(metric->id);
        }
    }
    report.has_baseline = true;
    if (metrics.empty()) {
        return report;
    }

    FetchBuilder builder(**schema, (*schema)->table());
    auto spec = builder.pivot_fetch(FetchTarget{.table = baseline->table_path(), .rollup = true},
                                    {}, metrics, filters.resolve_dates(config_.clock()), filters,
                                    std::nullopt, 0);
    auto fetched = store_->execute(spec);
    if (!fetched.has_value()) {
        return std::unexpected(store_failure(fetched.error()));
    }

    for (const auto& id : metrics) {
        const auto* entry = fetched->find_entry(id);
        double baseline_value =
            entry != nullptr && fetched->rows() > 0 ? numeric_at(*entry, 0) : 0.0;
        if (baseline_value <= 0.0) {
            continue;
        }
        double current = current_totals.at(id);
        double ratio = current / baseline_value;
        bool inflated = ratio > 1.0 + threshold;
        report.comparisons.push_back(InflationComparison{
            .metric = id, .baseline = baseline_value, .current = current, .ratio = ratio,
            .inflated = inflated});
        report.any_inflated = report.any_inflated || inflated;
        if (inflated) {
            spdlog::warn("metric '{}' inflated against baseline '{}': ratio {:.4f}", id,
                         baseline->id(), ratio);
        }
    }
    return report;
}

}  // namespace pivot
