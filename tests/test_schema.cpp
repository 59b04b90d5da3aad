#include <pivot/catalog/schema.hpp>

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstddef>
#include <expected>
#include <string>
#include <vector>

using namespace pivot;
using pivot::testing::derived;
using pivot::testing::dimension;
using pivot::testing::volume;

namespace {

auto build(std::vector<MetricDef> metrics) -> std::expected<SchemaCatalog, SchemaError> {
    return SchemaCatalog::build("t", {dimension("date", DataType::Date)}, std::move(metrics));
}

auto position(const std::vector<std::string>& order, const std::string& id) -> std::ptrdiff_t {
    return std::ranges::find(order, id) - order.begin();
}

}  // namespace

TEST_CASE("Schema compiles derived metrics and resolves volume leaves", "[catalog][schema]") {
    auto schema = testing::search_schema();

    REQUIRE(schema.table() == "search");
    REQUIRE(schema.find_metric("ctr") != nullptr);
    REQUIRE(schema.formula("ctr") != nullptr);
    REQUIRE(schema.formula("queries") == nullptr);
    REQUIRE(schema.find_metric("users")->source_column == "user_id");
    REQUIRE(schema.find_metric("queries")->source_column == "queries");

    auto leaves = schema.volume_dependencies("ctr");
    REQUIRE(leaves == std::vector<std::string>{"clicks", "queries_pdp"});
    REQUIRE(schema.volume_dependencies("queries") == std::vector<std::string>{"queries"});
    REQUIRE(schema.volume_dependencies("queries_per_day") == std::vector<std::string>{"queries"});
    REQUIRE(schema.volume_dependencies("nope").empty());

    SECTION("formula references replace declared dependencies") {
        REQUIRE(schema.find_metric("click_share")->depends_on ==
                std::vector<std::string>{"clicks", "queries"});
        REQUIRE(schema.find_metric("queries_per_day")->depends_on ==
                std::vector<std::string>{"queries"});
    }

    SECTION("only COUNT DISTINCT volumes are distinct-like") {
        REQUIRE(schema.is_distinct_like("users"));
        REQUIRE_FALSE(schema.is_distinct_like("queries"));
        REQUIRE_FALSE(schema.is_distinct_like("ctr"));
    }

    SECTION("volume metrics keep catalog order") {
        auto volumes = schema.volume_metrics();
        REQUIRE(volumes.size() == 4);
        REQUIRE(volumes.front()->id == "queries");
        REQUIRE(volumes.back()->id == "users");
    }
}

TEST_CASE("Evaluation order puts dependencies first", "[catalog][schema]") {
    auto schema = build({volume("clicks"), volume("queries"),
                         derived("ctr_pct", "{ctr} * 100"),
                         derived("ctr", "{clicks} / {queries}")});
    REQUIRE(schema.has_value());
    const auto& order = schema->evaluation_order();
    REQUIRE(order.size() == 2);
    REQUIRE(position(order, "ctr") < position(order, "ctr_pct"));
    REQUIRE(schema->volume_dependencies("ctr_pct") ==
            std::vector<std::string>{"clicks", "queries"});
}

TEST_CASE("Circular dependencies are rejected", "[catalog][schema]") {
    auto schema = build({volume("q"), derived("a", "{b} + {q}"), derived("b", "{a} * 2")});
    REQUIRE_FALSE(schema.has_value());
    REQUIRE(schema.error().message == "circular dependency: a -> b -> a");

    auto self = build({derived("a", "{a} + 1")});
    REQUIRE_FALSE(self.has_value());
    REQUIRE(self.error().message == "circular dependency: a -> a");
}

TEST_CASE("Schema validation errors", "[catalog][schema]") {
    SECTION("duplicate metric") {
        auto schema = build({volume("q"), volume("q")});
        REQUIRE_FALSE(schema.has_value());
        REQUIRE(schema.error().message == "duplicate metric 'q'");
    }

    SECTION("duplicate dimension") {
        auto schema = SchemaCatalog::build("t", {dimension("d"), dimension("d")}, {});
        REQUIRE_FALSE(schema.has_value());
        REQUIRE(schema.error().message == "duplicate dimension 'd'");
    }

    SECTION("unknown reference") {
        auto schema = build({volume("q"), derived("r", "{q} / {missing}")});
        REQUIRE_FALSE(schema.has_value());
        REQUIRE(schema.error().message == "metric 'r' references unknown metric 'missing'");
    }

    SECTION("invalid formula") {
        auto schema = build({volume("q"), derived("r", "{q} /")});
        REQUIRE_FALSE(schema.has_value());
        REQUIRE(schema.error().message.starts_with("metric 'r': invalid formula: column"));
    }

    SECTION("derived metric without formula") {
        auto schema = build({derived("r", "")});
        REQUIRE_FALSE(schema.has_value());
        REQUIRE(schema.error().message == "derived metric 'r' has no formula");
    }

    SECTION("volume metric with a formula") {
        auto metric = volume("q");
        metric.formula = "{x}";
        auto schema = build({metric});
        REQUIRE_FALSE(schema.has_value());
        REQUIRE(schema.error().message ==
                "volume metric 'q' must not have a formula or dependencies");
    }

    SECTION("custom metric colliding with a metric id") {
        auto schema = SchemaCatalog::build(
            "t", {}, {volume("q")}, {},
            {CustomMetric{.id = "q", .name = "q", .source_metric = "q",
                          .aggregation = CustomAggregation::Sum, .exclude_dimensions = {}}});
        REQUIRE_FALSE(schema.has_value());
        REQUIRE(schema.error().message == "custom metric 'q' collides with a metric id");
    }

    SECTION("custom dimension over an unknown metric") {
        auto schema = SchemaCatalog::build(
            "t", {}, {volume("q")},
            {CustomDimension{.id = "band", .name = "Band", .source_metric = "nope",
                             .rules = std::vector<BucketRule>{}}});
        REQUIRE_FALSE(schema.has_value());
        REQUIRE(schema.error().message == "custom dimension 'band' references unknown metric 'nope'");
    }
}

TEST_CASE("Schema registry replaces snapshots per table", "[catalog][schema]") {
    SchemaRegistry registry;
    registry.add(testing::search_schema());
    REQUIRE(registry.find("search") != nullptr);
    REQUIRE(registry.find("other") == nullptr);

    auto replacement = SchemaCatalog::build("search", {}, {volume("only")});
    REQUIRE(replacement.has_value());
    registry.add(std::move(*replacement));
    REQUIRE(registry.tables() == std::vector<std::string>{"search"});
    REQUIRE(registry.find("search")->metrics().size() == 1);
}

TEST_CASE("Enum names parse", "[catalog][schema]") {
    REQUIRE(parse_metric_category("volume") == MetricCategory::Volume);
    REQUIRE(parse_metric_category("whatever") == MetricCategory::Other);
    REQUIRE(parse_volume_aggregation("count_distinct") == VolumeAggregation::CountDistinct);
    REQUIRE_FALSE(parse_volume_aggregation("median").has_value());
    REQUIRE(parse_data_type("date") == DataType::Date);
}
