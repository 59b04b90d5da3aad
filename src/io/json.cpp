#include <pivot/io/json.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <optional>
#include <vector>

namespace pivot {

using json = nlohmann::json;

namespace {

auto optional_number(const json& j, const char* key) -> std::optional<double> {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<double>();
}

auto string_list(const json& j, const char* key) -> std::vector<std::string> {
    if (!j.contains(key) || j.at(key).is_null()) {
        return {};
    }
    return j.at(key).get<std::vector<std::string>>();
}

auto required_date(const json& j, const char* key) -> std::expected<Date, DefinitionError> {
    auto text = j.at(key).get<std::string>();
    auto date = parse_date(text);
    if (!date.has_value()) {
        return std::unexpected(DefinitionError{fmt::format("invalid date '{}' in {}", text, key)});
    }
    return *date;
}

auto parse_dimension(const json& j) -> std::expected<DimensionDef, DefinitionError> {
    DimensionDef dim;
    dim.id = j.at("id").get<std::string>();
    dim.column_name = j.value("column_name", std::string{});
    auto type_name = j.value("data_type", std::string("string"));
    auto type = parse_data_type(type_name);
    if (!type.has_value()) {
        return std::unexpected(DefinitionError{
            fmt::format("dimension '{}': unknown data type '{}'", dim.id, type_name)});
    }
    dim.data_type = *type;
    dim.filterable = j.value("filterable", true);
    dim.groupable = j.value("groupable", true);
    return dim;
}

auto parse_metric(const json& j) -> std::expected<MetricDef, DefinitionError> {
    MetricDef metric;
    metric.id = j.at("id").get<std::string>();
    metric.name = j.value("name", metric.id);
    metric.category = parse_metric_category(j.value("category", std::string("other")));
    metric.formula = j.value("formula", std::string{});
    metric.depends_on = string_list(j, "depends_on");
    auto aggregation_name = j.value("aggregation", std::string("sum"));
    auto aggregation = parse_volume_aggregation(aggregation_name);
    if (!aggregation.has_value()) {
        return std::unexpected(DefinitionError{fmt::format(
            "metric '{}': unknown aggregation '{}'", metric.id, aggregation_name)});
    }
    metric.aggregation = *aggregation;
    metric.source_column = j.value("source_column", std::string{});
    return metric;
}

auto parse_condition(const json& j) -> std::expected<Condition, DefinitionError> {
    auto op_name = j.at("operator").get<std::string>();
    auto op = parse_condition_op(op_name);
    if (!op.has_value()) {
        return std::unexpected(DefinitionError{fmt::format("unknown operator '{}'", op_name)});
    }
    return Condition{.op = *op,
                     .value = optional_number(j, "value"),
                     .value_max = optional_number(j, "value_max")};
}

auto parse_custom_dimension(const json& j) -> std::expected<CustomDimension, DefinitionError> {
    CustomDimension custom;
    custom.id = j.at("id").get<std::string>();
    custom.name = j.value("name", custom.id);
    custom.source_metric = j.value("source_metric", std::string{});
    auto type_name = j.at("type").get<std::string>();
    auto type = parse_custom_dimension_type(type_name);
    if (!type.has_value()) {
        return std::unexpected(DefinitionError{
            fmt::format("custom dimension '{}': unknown type '{}'", custom.id, type_name)});
    }
    const json empty = json::array();
    const json& values = j.contains("values") ? j.at("values") : empty;

    switch (*type) {
        case CustomDimensionType::MetricBucket: {
            std::vector<BucketRule> rules;
            for (const auto& value : values) {
                rules.push_back(BucketRule{.label = value.at("label").get<std::string>(),
                                           .min = optional_number(value, "min"),
                                           .max = optional_number(value, "max"),
                                           .equals = optional_number(value, "equals")});
            }
            custom.rules = std::move(rules);
            break;
        }
        case CustomDimensionType::DateRange: {
            std::vector<DateRangeRule> rules;
            for (const auto& value : values) {
                auto start = required_date(value, "start_date");
                if (!start.has_value()) {
                    return std::unexpected(start.error());
                }
                auto end = required_date(value, "end_date");
                if (!end.has_value()) {
                    return std::unexpected(end.error());
                }
                rules.push_back(DateRangeRule{
                    .label = value.at("label").get<std::string>(), .start = *start, .end = *end});
            }
            custom.rules = std::move(rules);
            break;
        }
        case CustomDimensionType::MetricCondition: {
            std::vector<ConditionRule> rules;
            for (const auto& value : values) {
                ConditionRule rule{.label = value.at("label").get<std::string>(), .conditions = {}};
                if (value.contains("conditions")) {
                    for (const auto& condition : value.at("conditions")) {
                        auto parsed = parse_condition(condition);
                        if (!parsed.has_value()) {
                            return std::unexpected(parsed.error());
                        }
                        rule.conditions.push_back(*parsed);
                    }
                }
                rules.push_back(std::move(rule));
            }
            custom.rules = std::move(rules);
            break;
        }
    }
    return custom;
}

auto parse_custom_metric(const json& j) -> std::expected<CustomMetric, DefinitionError> {
    CustomMetric custom;
    custom.id = j.at("id").get<std::string>();
    custom.name = j.value("name", custom.id);
    custom.source_metric = j.at("source_metric").get<std::string>();
    auto aggregation_name = j.value("aggregation_type", std::string("sum"));
    auto aggregation = parse_custom_aggregation(aggregation_name);
    if (!aggregation.has_value()) {
        return std::unexpected(DefinitionError{fmt::format(
            "custom metric '{}': unknown aggregation '{}'", custom.id, aggregation_name)});
    }
    custom.aggregation = *aggregation;
    custom.exclude_dimensions = string_list(j, "exclude_dimensions");
    return custom;
}

auto parse_rollup(const json& j) -> std::expected<Rollup, DefinitionError> {
    auto id = j.at("id").get<std::string>();
    auto status_name = j.value("status", std::string("pending"));
    auto status = parse_rollup_status(status_name);
    if (!status.has_value()) {
        return std::unexpected(
            DefinitionError{fmt::format("rollup '{}': unknown status '{}'", id, status_name)});
    }
    auto table_path = j.value("table_path", id);
    Rollup rollup(std::move(id), std::move(table_path), string_list(j, "dimensions"), *status);
    if (j.contains("metrics") && !j.at("metrics").is_null()) {
        rollup.set_metrics(string_list(j, "metrics"));
    }
    return rollup;
}

template <typename T, typename Parser>
auto parse_list(const json& table, const char* key, Parser parse)
    -> std::expected<std::vector<T>, DefinitionError> {
    std::vector<T> out;
    if (!table.contains(key)) {
        return out;
    }
    for (const auto& item : table.at(key)) {
        auto parsed = parse(item);
        if (!parsed.has_value()) {
            return std::unexpected(parsed.error());
        }
        out.push_back(std::move(*parsed));
    }
    return out;
}

auto load_table(const json& table, Definitions& out) -> std::expected<void, DefinitionError> {
    auto name = table.at("name").get<std::string>();
    auto dimensions = parse_list<DimensionDef>(table, "dimensions", parse_dimension);
    if (!dimensions.has_value()) {
        return std::unexpected(dimensions.error());
    }
    auto metrics = parse_list<MetricDef>(table, "metrics", parse_metric);
    if (!metrics.has_value()) {
        return std::unexpected(metrics.error());
    }
    auto custom_dimensions =
        parse_list<CustomDimension>(table, "custom_dimensions", parse_custom_dimension);
    if (!custom_dimensions.has_value()) {
        return std::unexpected(custom_dimensions.error());
    }
    auto custom_metrics = parse_list<CustomMetric>(table, "custom_metrics", parse_custom_metric);
    if (!custom_metrics.has_value()) {
        return std::unexpected(custom_metrics.error());
    }
    auto rollups = parse_list<Rollup>(table, "rollups", parse_rollup);
    if (!rollups.has_value()) {
        return std::unexpected(rollups.error());
    }

    auto catalog = SchemaCatalog::build(name, std::move(*dimensions), std::move(*metrics),
                                        std::move(*custom_dimensions), std::move(*custom_metrics));
    if (!catalog.has_value()) {
        return std::unexpected(
            DefinitionError{fmt::format("table '{}': {}", name, catalog.error().message)});
    }
    out.schemas.add(std::move(*catalog));

    RollupCatalog rollup_catalog(name);
    for (auto& rollup : *rollups) {
        if (auto added = rollup_catalog.add(std::move(rollup)); !added.has_value()) {
            return std::unexpected(
                DefinitionError{fmt::format("table '{}': {}", name, added.error())});
        }
    }
    out.rollups.insert_or_assign(name, std::move(rollup_catalog));
    return {};
}

}  // namespace

auto load_definitions(const json& document) -> std::expected<Definitions, DefinitionError> {
    Definitions out;
    try {
        if (!document.contains("tables") || !document.at("tables").is_array()) {
            return std::unexpected(DefinitionError{"definitions: missing 'tables' array"});
        }
        for (const auto& table : document.at("tables")) {
            if (auto loaded = load_table(table, out); !loaded.has_value()) {
                return std::unexpected(loaded.error());
            }
        }
    } catch (const json::exception& e) {
        return std::unexpected(DefinitionError{fmt::format("definitions: {}", e.what())});
    }
    spdlog::debug("loaded definitions for {} tables", out.schemas.tables().size());
    return out;
}

auto load_definitions_file(std::string_view path) -> std::expected<Definitions, DefinitionError> {
    std::ifstream input{std::string(path)};
    if (!input) {
        return std::unexpected(
            DefinitionError{fmt::format("failed to open definitions: {}", path)});
    }
    json document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(DefinitionError{fmt::format("{}: malformed JSON", path)});
    }
    return load_definitions(document);
}

void to_json(json& j, const RollupScore& score) {
    j = json{{"id", score.rollup_id},
             {"dimensions", score.dimensions},
             {"status", std::string(to_string(score.status))},
             {"score", score.score},
             {"canUse", score.can_use},
             {"needsReaggregation", score.needs_reaggregation},
             {"reason", score.reason},
             {"missingDimensions", score.missing_dimensions},
             {"missingMetrics", score.missing_metrics}};
}

void to_json(json& j, const RouteDecision& decision) {
    j = json{{"use_rollup", decision.use_rollup()},
             {"rollup_id", decision.rollup_id()},
             {"table_path", decision.table_path()},
             {"needs_reaggregation", decision.needs_reaggregation()},
             {"score", decision.score()},
             {"reason", decision.reason()},
             {"metrics_available", decision.metrics_available()},
             {"metrics_unavailable", decision.metrics_unavailable()}};
    if (!decision.required_dimensions().empty()) {
        j["required_dimensions"] = decision.required_dimensions();
    }
    if (!decision.candidates().empty()) {
        j["candidates"] = decision.candidates();
    }
}

void to_json(json& j, const PivotRow& row) {
    j = json{{"dimension_value", row.dimension_value},
             {"metrics", row.metrics},
             {"percentage_of_total", row.percentage_of_total},
             {"has_children", row.has_children},
             {"row_count", row.row_count}};
}

void to_json(json& j, const PivotError& error) {
    j = json{{"error", error.message}, {"errorType", std::string(error.error_type())}};
    if (error.type == PivotErrorType::RollupRequired) {
        j["requiredDimensions"] = error.required_dimensions;
        j["availableRollups"] = error.available_rollups;
        j["missingMetrics"] = error.missing_metrics;
    }
}

void to_json(json& j, const PivotResponse& response) {
    j = json{{"rows", response.rows},
             {"total", nullptr},
             {"available_dimensions", response.available_dimensions},
             {"total_count", response.total_count}};
    if (response.total.has_value()) {
        j["total"] = *response.total;
    }
    if (response.error.has_value()) {
        j.update(json(*response.error));
    }
}

void to_json(json& j, const InflationReport& report) {
    j = json{{"has_baseline", report.has_baseline}, {"any_inflated", report.any_inflated}};
    json comparisons = json::object();
    for (const auto& comparison : report.comparisons) {
        comparisons[comparison.metric] = json{{"baseline", comparison.baseline},
                                              {"current", comparison.current},
                                              {"ratio", comparison.ratio},
                                              {"is_inflated", comparison.inflated}};
    }
    j["comparisons"] = std::move(comparisons);
}

void to_json(json& j, const TrendPoint& point) {
    j = json{{"date", format_date(point.date)}, {"num_days", point.num_days}};
    for (const auto& [id, value] : point.metrics) {
        j[id] = value;
    }
}

}  // namespace pivot
