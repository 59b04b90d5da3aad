#include <pivot/engine/pivot_service.hpp>
#include <pivot/query/sql.hpp>
#include <pivot/store/memory_store.hpp>

#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace pivot;
using pivot::testing::ready_rollup;

namespace {

auto day(unsigned d) -> Date { return date_from_ymd(2024, 3, d); }

// One row per (date, country, device); country is NULL on the fourth row.
auto event_rows() -> Table {
    Table table;
    table.add_column("date", Column<Date>{day(1), day(1), day(2), day(2), day(3)});
    table.add_column("country", Column<std::string>{"DE", "FR", "DE", "", "FR"},
                     {true, true, true, false, true});
    table.add_column("device",
                     Column<std::string>{"mobile", "desktop", "desktop", "mobile", "mobile"});
    table.add_column("queries", Column<std::int64_t>{120, 80, 60, 20, 40});
    table.add_column("clicks", Column<std::int64_t>{30, 10, 12, 2, 8});
    table.add_column("queries_pdp", Column<std::int64_t>{100, 60, 50, 10, 30});
    return table;
}

auto raw_events() -> Table {
    auto table = event_rows();
    table.add_column("user_id", Column<std::string>{"u1", "u2", "u1", "u3", "u2"});
    return table;
}

auto country_device_rollup() -> Table {
    auto table = event_rows();
    table.add_column("users", Column<std::int64_t>{1, 1, 1, 1, 1});
    return table;
}

auto by_country_rollup() -> Table {
    Table table;
    table.add_column("date", Column<Date>{day(1), day(1), day(2), day(2), day(3)});
    table.add_column("country", Column<std::string>{"DE", "FR", "DE", "", "FR"},
                     {true, true, true, false, true});
    table.add_column("queries", Column<std::int64_t>{120, 80, 60, 20, 40});
    table.add_column("clicks", Column<std::int64_t>{30, 10, 12, 2, 8});
    return table;
}

auto daily_rollup() -> Table {
    Table table;
    table.add_column("date", Column<Date>{day(1), day(2), day(3)});
    table.add_column("queries", Column<std::int64_t>{200, 80, 40});
    table.add_column("clicks", Column<std::int64_t>{40, 14, 8});
    table.add_column("queries_pdp", Column<std::int64_t>{160, 60, 30});
    table.add_column("users", Column<std::int64_t>{2, 2, 1});
    return table;
}

/// Search table with three ready rollups:
///   daily          [date]                   all volumes
///   by_country     [date, country]          queries, clicks
///   country_device [date, country, device]  all volumes
struct Warehouse {
    SchemaRegistry schemas;
    RollupRegistry rollups;
    MemoryStore store;

    Warehouse() {
        schemas.add(testing::search_schema());

        RollupCatalog catalog("search");
        REQUIRE(catalog.add(ready_rollup("daily", {"date"})).has_value());
        REQUIRE(catalog.add(ready_rollup("by_country", {"date", "country"},
                                         std::vector<std::string>{"queries", "clicks"}))
                    .has_value());
        REQUIRE(catalog.add(ready_rollup("country_device", {"date", "country", "device"}))
                    .has_value());
        rollups.emplace("search", std::move(catalog));

        store.add_table("search", raw_events());
        store.add_table("rollup_daily", daily_rollup());
        store.add_table("rollup_by_country", by_country_rollup());
        store.add_table("rollup_country_device", country_device_rollup());
    }

    auto service() -> PivotService {
        PivotConfig config;
        config.clock = [] { return day(3); };
        return PivotService(schemas, rollups, store, config);
    }
};

auto request(std::vector<std::string> dims, std::vector<std::string> metrics) -> PivotRequest {
    PivotRequest req;
    req.table = "search";
    req.dimensions = std::move(dims);
    req.metrics = std::move(metrics);
    return req;
}

}  // namespace

TEST_CASE("A query needing an unstored volume metric is refused", "[engine][service]") {
    Warehouse warehouse;
    auto service = warehouse.service();

    auto response = service.get_pivot_data(request({"country"}, {"queries", "ctr"}));
    REQUIRE(response.has_value());
    REQUIRE(response->rows.empty());
    REQUIRE_FALSE(response->total.has_value());
    REQUIRE(response->error.has_value());

    const auto& error = *response->error;
    REQUIRE(error.type == PivotErrorType::RollupRequired);
    REQUIRE(error.error_type() == "rollup_required");
    REQUIRE(error.missing_metrics == std::vector<std::string>{"queries_pdp"});
    REQUIRE(error.required_dimensions == std::vector<std::string>{"country"});
    REQUIRE(error.available_rollups.size() == 3);
    REQUIRE(warehouse.store.history().empty());
}

TEST_CASE("Grouped query re-aggregates a date rollup", "[engine][service]") {
    Warehouse warehouse;
    auto service = warehouse.service();

    auto decision = service.route_request(request({"country"}, {"queries", "clicks"}));
    REQUIRE(decision.has_value());
    REQUIRE(decision->rollup_id() == "by_country");
    REQUIRE(decision->needs_reaggregation());

    auto response = service.get_pivot_data(request({"country"}, {"queries", "clicks"}));
    REQUIRE(response.has_value());
    REQUIRE_FALSE(response->error.has_value());
    REQUIRE(response->rows.size() == 3);
    REQUIRE(response->total_count == 3);
    REQUIRE(response->available_dimensions ==
            std::vector<std::string>{"date", "country", "device"});

    REQUIRE(response->rows[0].dimension_value == "DE");
    REQUIRE(response->rows[0].metrics.at("queries") == 180.0);
    REQUIRE(response->rows[0].metrics.at("queries_pct") == 56.25);
    REQUIRE(response->rows[1].dimension_value == "FR");
    REQUIRE(response->rows[2].dimension_value == "__NULL__");

    double share = 0.0;
    for (const auto& row : response->rows) {
        share += row.percentage_of_total;
    }
    REQUIRE(share == Catch::Approx(100.0));

    REQUIRE(response->total.has_value());
    REQUIRE(response->total->metrics.at("queries") == 320.0);
    REQUIRE(response->total->percentage_of_total == 100.0);

    SECTION("the fetch and the group count hit the rollup table") {
        const auto& history = warehouse.store.history();
        REQUIRE(history.size() == 2);
        REQUIRE(history[0].table == "rollup_by_country");
        REQUIRE(history[0].limit == std::optional<std::size_t>(50));
        REQUIRE(history[1].count_groups);
    }

    SECTION("paging keeps the full group count") {
        auto page = request({"country"}, {"queries", "clicks"});
        page.limit = 1;
        page.offset = 1;
        auto paged = service.get_pivot_data(page);
        REQUIRE(paged.has_value());
        REQUIRE(paged->rows.size() == 1);
        REQUIRE(paged->rows[0].dimension_value == "FR");
        REQUIRE(paged->total_count == 3);
    }

    SECTION("skip_count reports the returned rows") {
        auto quick = request({"country"}, {"queries"});
        quick.limit = 2;
        quick.skip_count = true;
        auto result = service.get_pivot_data(quick);
        REQUIRE(result.has_value());
        REQUIRE(result->total_count == 2);
    }
}

TEST_CASE("Totals query uses the date-only rollup", "[engine][service]") {
    Warehouse warehouse;
    auto service = warehouse.service();

    auto response = service.get_pivot_data(request({}, {"queries", "ctr"}));
    REQUIRE(response.has_value());
    REQUIRE_FALSE(response->error.has_value());
    REQUIRE(response->rows.size() == 1);
    REQUIRE(response->rows[0].dimension_value == "All");
    REQUIRE_FALSE(response->rows[0].has_children);
    REQUIRE(response->rows[0].metrics.at("queries") == 320.0);
    REQUIRE(response->rows[0].metrics.at("ctr") == Catch::Approx(62.0 / 250.0));
    REQUIRE(response->total_count == 1);
    REQUIRE(warehouse.store.history().front().table == "rollup_daily");
}

TEST_CASE("Filtered dimensions must be stored by the rollup", "[engine][service]") {
    Warehouse warehouse;
    auto service = warehouse.service();

    auto req = request({"country"}, {"queries"});
    req.filters.dimension_filters["device"] = {"mobile"};
    auto response = service.get_pivot_data(req);
    REQUIRE(response.has_value());
    REQUIRE_FALSE(response->error.has_value());
    REQUIRE(warehouse.store.history().front().table == "rollup_country_device");

    REQUIRE(response->rows.size() == 3);
    REQUIRE(response->rows[0].dimension_value == "DE");
    REQUIRE(response->rows[0].metrics.at("queries") == 120.0);
    REQUIRE(response->rows[1].dimension_value == "FR");
    REQUIRE(response->rows[1].metrics.at("queries") == 40.0);
}

TEST_CASE("Custom dimension regroups and recomputes ratios", "[engine][service]") {
    Warehouse warehouse;
    auto service = warehouse.service();

    auto req = request({"country"}, {"queries", "clicks", "click_share"});
    req.custom_dimension_id = "volume_band";
    auto response = service.get_pivot_data(req);
    REQUIRE(response.has_value());
    REQUIRE_FALSE(response->error.has_value());

    // DE 180 and FR 120 are High; the NULL country's 20 matches no rule.
    REQUIRE(response->rows.size() == 2);
    REQUIRE(response->total_count == 2);
    REQUIRE(response->rows[0].dimension_value == "High");
    REQUIRE(response->rows[0].metrics.at("queries") == 300.0);
    REQUIRE(response->rows[0].metrics.at("click_share") == Catch::Approx(20.0));
    REQUIRE(response->rows[1].dimension_value == "Other");
    REQUIRE(response->rows[1].metrics.at("click_share") == Catch::Approx(10.0));

    SECTION("the fetch is unpaged so every group is labelled") {
        REQUIRE_FALSE(warehouse.store.history().front().limit.has_value());
    }

    SECTION("paging applies after regrouping") {
        auto paged = req;
        paged.limit = 1;
        paged.offset = 1;
        auto second = service.get_pivot_data(paged);
        REQUIRE(second.has_value());
        REQUIRE(second->rows.size() == 1);
        REQUIRE(second->rows[0].dimension_value == "Other");
        REQUIRE(second->total_count == 2);
    }
}

TEST_CASE("Date range custom dimension fetches the date", "[engine][service]") {
    Warehouse warehouse;
    auto service = warehouse.service();

    auto req = request({}, {"queries"});
    req.custom_dimension_id = "period";
    auto response = service.get_pivot_data(req);
    REQUIRE(response.has_value());
    REQUIRE_FALSE(response->error.has_value());
    REQUIRE(warehouse.store.history().front().table == "rollup_daily");

    // Labels sort: Early (03-01), Late (03-02), Other (03-03).
    REQUIRE(response->rows.size() == 3);
    REQUIRE(response->rows[0].dimension_value == "Early");
    REQUIRE(response->rows[0].metrics.at("queries") == 200.0);
    REQUIRE(response->rows[2].dimension_value == "Other");
    REQUIRE(response->rows[2].metrics.at("queries") == 40.0);
}

TEST_CASE("Custom metrics over the pivot result", "[engine][service]") {
    Warehouse warehouse;
    auto service = warehouse.service();

    SECTION("sum across an excluded dimension") {
        auto req = request({"country", "device"}, {"queries"});
        req.custom_metric_ids = {"country_queries"};
        auto response = service.get_pivot_data(req);
        REQUIRE(response.has_value());
        REQUIRE_FALSE(response->error.has_value());
        REQUIRE(response->rows.size() == 5);
        REQUIRE(response->rows[0].dimension_value == "DE - mobile");
        REQUIRE(response->rows[0].metrics.at("country_queries") == 180.0);
        REQUIRE(response->rows[1].dimension_value == "FR - desktop");
        REQUIRE(response->rows[1].metrics.at("country_queries") == 120.0);
        REQUIRE(response->rows[4].dimension_value == "__NULL__ - mobile");
        REQUIRE(response->rows[4].metrics.at("country_queries") == 20.0);
    }

    SECTION("avg_per_day probes the data when the range is open") {
        auto req = request({}, {"queries"});
        req.custom_metric_ids = {"daily_queries"};
        auto response = service.get_pivot_data(req);
        REQUIRE(response.has_value());
        REQUIRE(response->rows[0].metrics.at("daily_queries") == Catch::Approx(320.0 / 3.0));

        const auto& history = warehouse.store.history();
        REQUIRE(history.size() == 2);
        REQUIRE(history[0].select.size() == 2);
        REQUIRE(history[0].select[0].alias == "min_date");
    }

    SECTION("a preset fixes the day count without probing") {
        auto req = request({}, {"queries_per_day"});
        req.filters.relative_preset = DatePreset::Last7Days;
        auto response = service.get_pivot_data(req);
        REQUIRE(response.has_value());
        REQUIRE(response->rows[0].metrics.at("queries_per_day") == Catch::Approx(320.0 / 7.0));
        REQUIRE(warehouse.store.history().size() == 1);
    }
}

TEST_CASE("Raw fallback when rollups are optional", "[engine][service]") {
    Warehouse warehouse;
    auto service = warehouse.service();

    auto req = request({"device"}, {"users"});
    auto refused = service.get_pivot_data(req);
    REQUIRE(refused.has_value());
    REQUIRE(refused->error.has_value());
    REQUIRE(refused->error->required_dimensions == std::vector<std::string>{"device"});

    req.require_rollup = false;
    auto response = service.get_pivot_data(req);
    REQUIRE(response.has_value());
    REQUIRE_FALSE(response->error.has_value());
    REQUIRE(warehouse.store.history().front().table == "search");
    REQUIRE(response->rows.size() == 2);
    REQUIRE(response->rows[0].dimension_value == "mobile");
    REQUIRE(response->rows[0].metrics.at("users") == 3.0);
    REQUIRE(response->rows[1].metrics.at("users") == 2.0);
}

TEST_CASE("Planned fetch for inspection", "[engine][service]") {
    Warehouse warehouse;
    auto service = warehouse.service();

    auto req = request({"country"}, {"clicks"});
    req.filters.start_date = day(2);
    req.filters.end_date = day(3);
    auto spec = service.plan_fetch(req);
    REQUIRE(spec.has_value());
    REQUIRE(render_sql(*spec) ==
            "SELECT country, SUM(clicks) AS clicks\n"
            "FROM `rollup_by_country`\n"
            "WHERE date >= '2024-03-02' AND date <= '2024-03-03'\n"
            "GROUP BY country\n"
            "ORDER BY clicks DESC\n"
            "LIMIT 50");
    REQUIRE(warehouse.store.history().empty());

    auto refused = service.plan_fetch(request({"country"}, {"ctr"}));
    REQUIRE_FALSE(refused.has_value());
    REQUIRE(refused.error().type == PivotErrorType::RollupRequired);
}

TEST_CASE("Request validation errors", "[engine][service]") {
    Warehouse warehouse;
    auto service = warehouse.service();

    auto unknown_table = request({}, {"queries"});
    unknown_table.table = "orders";
    auto schema_missing = service.get_pivot_data(unknown_table);
    REQUIRE_FALSE(schema_missing.has_value());
    REQUIRE(schema_missing.error().type == PivotErrorType::SchemaMissing);
    REQUIRE(schema_missing.error().message == "no schema for table 'orders'");

    auto bad_custom = request({"country"}, {"queries"});
    bad_custom.custom_dimension_id = "nope";
    auto custom_dimension = service.get_pivot_data(bad_custom);
    REQUIRE_FALSE(custom_dimension.has_value());
    REQUIRE(custom_dimension.error().type == PivotErrorType::UnknownCustomDimension);
    REQUIRE(custom_dimension.error().message == "unknown custom dimension 'nope'");

    auto bad_metric = request({"country"}, {"queries"});
    bad_metric.custom_metric_ids = {"nope"};
    auto custom_metric = service.get_pivot_data(bad_metric);
    REQUIRE_FALSE(custom_metric.has_value());
    REQUIRE(custom_metric.error().type == PivotErrorType::UnknownCustomMetric);

    auto bad_dimension = service.get_pivot_data(request({"region"}, {"queries"}));
    REQUIRE_FALSE(bad_dimension.has_value());
    REQUIRE(bad_dimension.error().type == PivotErrorType::InvalidRequest);
    REQUIRE(bad_dimension.error().message == "unknown dimension 'region'");

    auto unknown_metric = service.get_pivot_data(request({"country"}, {"revenue"}));
    REQUIRE_FALSE(unknown_metric.has_value());
    REQUIRE(unknown_metric.error().message == "unknown metric 'revenue'");
}

TEST_CASE("Store failures surface as errors", "[engine][service]") {
    SchemaRegistry schemas;
    schemas.add(testing::search_schema());
    RollupRegistry rollups;
    MemoryStore empty_store;
    PivotService service(schemas, rollups, empty_store);

    auto req = request({"country"}, {"queries"});
    req.require_rollup = false;
    auto response = service.get_pivot_data(req);
    REQUIRE_FALSE(response.has_value());
    REQUIRE(response.error().type == PivotErrorType::StoreFailure);
    REQUIRE(response.error().message == "store: unknown table 'search'");
}

TEST_CASE("Dimension values are ordered by volume", "[engine][service]") {
    Warehouse warehouse;
    auto service = warehouse.service();

    auto values = service.get_dimension_values("search", "country", FilterSpec{});
    REQUIRE(values.has_value());
    REQUIRE(*values == std::vector<std::string>{"DE", "FR"});
    REQUIRE(warehouse.store.history().front().table == "rollup_by_country");

    SECTION("filters join the routed dimensions") {
        FilterSpec filters;
        filters.dimension_filters["device"] = {"desktop"};
        auto desktop = service.get_dimension_values("search", "country", filters);
        REQUIRE(desktop.has_value());
        REQUIRE(*desktop == std::vector<std::string>{"FR", "DE"});
        REQUIRE(warehouse.store.history().back().table == "rollup_country_device");
    }

    SECTION("limit caps the values") {
        auto one = service.get_dimension_values("search", "country", FilterSpec{}, 1);
        REQUIRE(one.has_value());
        REQUIRE(one->size() == 1);
    }

    SECTION("unknown dimension") {
        auto missing = service.get_dimension_values("search", "region", FilterSpec{});
        REQUIRE_FALSE(missing.has_value());
        REQUIRE(missing.error().message == "unknown dimension 'region'");
    }
}

TEST_CASE("Inflation check against the date-only baseline", "[engine][service]") {
    Warehouse warehouse;
    auto service = warehouse.service();

    std::map<std::string, double> totals{{"queries", 330.0}, {"clicks", 62.0}, {"ctr", 0.3}};
    auto report = service.check_inflation("search", totals, FilterSpec{});
    REQUIRE(report.has_value());
    REQUIRE(report->has_baseline);
    REQUIRE(report->any_inflated);
    REQUIRE(report->comparisons.size() == 2);
    REQUIRE(report->comparisons[0].metric == "queries");
    REQUIRE(report->comparisons[0].baseline == 320.0);
    REQUIRE(report->comparisons[0].ratio == Catch::Approx(330.0 / 320.0));
    REQUIRE(report->comparisons[0].inflated);
    REQUIRE_FALSE(report->comparisons[1].inflated);
    REQUIRE(warehouse.store.history().front().table == "rollup_daily");

    SECTION("within the threshold") {
        auto close = service.check_inflation("search", {{"queries", 321.0}}, FilterSpec{});
        REQUIRE(close.has_value());
        REQUIRE_FALSE(close->any_inflated);
    }

    SECTION("dimension filters disable the baseline") {
        FilterSpec filters;
        filters.dimension_filters["country"] = {"DE"};
        auto filtered = service.check_inflation("search", totals, filters);
        REQUIRE(filtered.has_value());
        REQUIRE_FALSE(filtered->has_baseline);
        REQUIRE(filtered->comparisons.empty());
    }

    SECTION("no baseline rollup") {
        RollupRegistry none;
        PivotService bare(warehouse.schemas, none, warehouse.store);
        auto missing = bare.check_inflation("search", totals, FilterSpec{});
        REQUIRE(missing.has_value());
        REQUIRE_FALSE(missing->has_baseline);
    }
}

TEST_CASE("Date bounds route to rollups that store the date", "[engine][service][router]") {
    SchemaRegistry schemas;
    schemas.add(testing::search_schema());
    RollupCatalog catalog("search");
    REQUIRE(catalog.add(ready_rollup("country_only", {"country"},
                                     std::vector<std::string>{"queries", "clicks"}))
                .has_value());
    REQUIRE(catalog.add(ready_rollup("by_country", {"date", "country"},
                                     std::vector<std::string>{"queries", "clicks"}))
                .has_value());
    RollupRegistry rollups;
    rollups.emplace("search", std::move(catalog));

    Table country_totals;
    country_totals.add_column("country", Column<std::string>{"DE", "FR", ""}, {true, true, false});
    country_totals.add_column("queries", Column<std::int64_t>{180, 120, 20});
    country_totals.add_column("clicks", Column<std::int64_t>{42, 18, 2});
    MemoryStore store;
    store.add_table("rollup_country_only", std::move(country_totals));
    store.add_table("rollup_by_country", by_country_rollup());
    PivotService service(schemas, rollups, store);

    auto all_time = request({"country"}, {"queries"});
    auto undated = service.route_request(all_time);
    REQUIRE(undated.has_value());
    REQUIRE(undated->rollup_id() == "country_only");

    auto bounded = all_time;
    bounded.filters.start_date = day(1);
    bounded.filters.end_date = day(2);
    auto dated = service.route_request(bounded);
    REQUIRE(dated.has_value());
    REQUIRE(dated->rollup_id() == "by_country");
    REQUIRE(dated->score() == 150);
    REQUIRE_FALSE(dated->needs_reaggregation());

    SECTION("an open bound is enough") {
        auto from = all_time;
        from.filters.start_date = day(2);
        auto decision = service.route_request(from);
        REQUIRE(decision.has_value());
        REQUIRE(decision->rollup_id() == "by_country");
    }

    SECTION("the bounded fetch runs against the dated rollup") {
        auto response = service.get_pivot_data(bounded);
        REQUIRE(response.has_value());
        REQUIRE_FALSE(response->error.has_value());
        REQUIRE(store.history().front().table == "rollup_by_country");
        REQUIRE(response->rows[0].dimension_value == "DE");
        REQUIRE(response->rows[0].metrics.at("queries") == 180.0);
        REQUIRE(response->rows[1].dimension_value == "FR");
        REQUIRE(response->rows[1].metrics.at("queries") == 80.0);
    }

    SECTION("without a dated rollup the bounded query is refused") {
        RollupCatalog undated_only("search");
        REQUIRE(undated_only.add(ready_rollup("country_only", {"country"},
                                              std::vector<std::string>{"queries", "clicks"}))
                    .has_value());
        RollupRegistry narrow;
        narrow.emplace("search", std::move(undated_only));
        PivotService strict(schemas, narrow, store);

        auto response = strict.get_pivot_data(bounded);
        REQUIRE(response.has_value());
        REQUIRE(response->error.has_value());
        REQUIRE(response->error->required_dimensions ==
                std::vector<std::string>{"country", "date"});
    }
}

TEST_CASE("Trend series per day, week and month", "[engine][service][trend]") {
    Warehouse warehouse;
    auto service = warehouse.service();

    SECTION("daily points recompute ratios per day") {
        auto points = service.get_trend_data("search", FilterSpec{}, TimeGrain::Daily,
                                             std::vector<std::string>{"queries", "ctr"});
        REQUIRE(points.has_value());
        REQUIRE(points->size() == 3);
        REQUIRE((*points)[0].date == day(1));
        REQUIRE((*points)[0].num_days == 1);
        REQUIRE((*points)[0].metrics.at("queries") == 200.0);
        REQUIRE((*points)[0].metrics.at("ctr") == Catch::Approx(0.25));
        REQUIRE((*points)[2].date == day(3));
        REQUIRE((*points)[2].metrics.at("ctr") == Catch::Approx(8.0 / 30.0));
        REQUIRE(warehouse.store.history().front().table == "rollup_daily");
    }

    SECTION("weeks start on Monday and count only days in range") {
        FilterSpec filters;
        filters.start_date = day(1);
        filters.end_date = day(3);
        auto points = service.get_trend_data("search", filters, TimeGrain::Weekly,
                                             std::vector<std::string>{"queries_per_day"});
        REQUIRE(points.has_value());
        REQUIRE(points->size() == 1);
        REQUIRE(points->front().date == date_from_ymd(2024, 2, 26));
        REQUIRE(points->front().num_days == 3);
        REQUIRE(points->front().metrics.at("queries") == 320.0);
        REQUIRE(points->front().metrics.at("queries_per_day") == Catch::Approx(320.0 / 3.0));
    }

    SECTION("an open range counts the whole month") {
        auto points = service.get_trend_data("search", FilterSpec{}, TimeGrain::Monthly,
                                             std::vector<std::string>{"queries_per_day"});
        REQUIRE(points.has_value());
        REQUIRE(points->size() == 1);
        REQUIRE(points->front().date == day(1));
        REQUIRE(points->front().num_days == 31);
    }

    SECTION("dimension filters pick a rollup storing the filtered dimension") {
        FilterSpec filters;
        filters.dimension_filters["country"] = {"DE"};
        auto points = service.get_trend_data("search", filters, TimeGrain::Daily,
                                             std::vector<std::string>{"queries"});
        REQUIRE(points.has_value());
        REQUIRE(points->size() == 2);
        REQUIRE((*points)[0].metrics.at("queries") == 120.0);
        REQUIRE((*points)[1].date == day(2));
        REQUIRE((*points)[1].metrics.at("queries") == 60.0);
        REQUIRE(warehouse.store.history().front().table == "rollup_by_country");
    }

    SECTION("routing failures and unknown metrics are errors") {
        FilterSpec filters;
        filters.dimension_filters["country"] = {"DE"};
        auto refused = service.get_trend_data("search", filters, TimeGrain::Daily,
                                              std::vector<std::string>{"ctr"});
        REQUIRE_FALSE(refused.has_value());
        REQUIRE(refused.error().type == PivotErrorType::RollupRequired);
        REQUIRE(refused.error().missing_metrics == std::vector<std::string>{"queries_pdp"});

        auto unknown = service.get_trend_data("search", FilterSpec{}, TimeGrain::Daily,
                                              std::vector<std::string>{"revenue"});
        REQUIRE_FALSE(unknown.has_value());
        REQUIRE(unknown.error().message == "unknown metric 'revenue'");
    }
}

TEST_CASE("Child rows drill into one parent value", "[engine][service][children]") {
    Warehouse warehouse;
    auto service = warehouse.service();
    const std::optional<std::vector<std::string>> queries{std::vector<std::string>{"queries"}};

    auto children = service.get_pivot_children("search", "country", "DE", "device", FilterSpec{},
                                               100, 0, queries);
    REQUIRE(children.has_value());
    REQUIRE_FALSE(children->error.has_value());
    REQUIRE(children->rows.size() == 2);
    REQUIRE(children->rows[0].dimension_value == "mobile");
    REQUIRE(children->rows[0].metrics.at("queries") == 120.0);
    REQUIRE(children->rows[1].dimension_value == "desktop");
    REQUIRE(children->rows[1].metrics.at("queries") == 60.0);
    REQUIRE(children->total_count == 2);
    REQUIRE(warehouse.store.history().front().table == "rollup_country_device");

    SECTION("the NULL parent row drills into NULL") {
        auto nulls = service.get_pivot_children("search", "country", "__NULL__", "device",
                                                FilterSpec{}, 100, 0, queries);
        REQUIRE(nulls.has_value());
        REQUIRE(nulls->rows.size() == 1);
        REQUIRE(nulls->rows[0].dimension_value == "mobile");
        REQUIRE(nulls->rows[0].metrics.at("queries") == 20.0);
    }

    SECTION("paging applies to the children") {
        auto second = service.get_pivot_children("search", "country", "DE", "device",
                                                 FilterSpec{}, 1, 1, queries);
        REQUIRE(second.has_value());
        REQUIRE(second->rows.size() == 1);
        REQUIRE(second->rows[0].dimension_value == "desktop");
        REQUIRE(second->total_count == 2);
    }

    SECTION("an empty parent value adds no filter") {
        auto unfiltered = service.get_pivot_children("search", "country", "", "device",
                                                     FilterSpec{}, 100, 0, queries);
        REQUIRE(unfiltered.has_value());
        REQUIRE(unfiltered->error.has_value());
        REQUIRE(unfiltered->error->required_dimensions == std::vector<std::string>{"device"});
    }

    SECTION("unknown parent dimension") {
        auto bad = service.get_pivot_children("search", "region", "EU", "device", FilterSpec{});
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().type == PivotErrorType::InvalidRequest);
        REQUIRE(bad.error().message == "unknown dimension 'region'");
    }
}
