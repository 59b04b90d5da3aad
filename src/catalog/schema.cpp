#include <pivot/catalog/schema.hpp>
#include <pivot/formula/parser.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace pivot {

namespace {

enum class VisitState : std::uint8_t {
    Unvisited,
    InProgress,
    Done,
};

struct GraphWalk {
    const std::vector<MetricDef>& metrics;
    const std::unordered_map<std::string, std::size_t>& index;
    std::unordered_map<std::string, VisitState> state;
    std::vector<std::string> stack;
    std::vector<std::string> order;

    // Post-order DFS over derived metrics. Returns the cycle path on failure.
    auto visit(const std::string& id) -> std::optional<std::string> {
        auto& st = state[id];
        if (st == VisitState::Done) {
            return std::nullopt;
        }
        if (st == VisitState::InProgress) {
            auto begin = std::ranges::find(stack, id);
            std::string path;
            for (auto it = begin; it != stack.end(); ++it) {
                path += *it + " -> ";
            }
            return path + id;
        }
        st = VisitState::InProgress;
        stack.push_back(id);
        const auto& metric = metrics[index.at(id)];
        for (const auto& dep : metric.depends_on) {
            auto it = index.find(dep);
            if (it == index.end() || metrics[it->second].is_volume()) {
                continue;
            }
            if (auto cycle = visit(dep)) {
                return cycle;
            }
        }
        stack.pop_back();
        state[id] = VisitState::Done;
        order.push_back(id);
        return std::nullopt;
    }
};

}  // namespace

auto SchemaCatalog::build(std::string table, std::vector<DimensionDef> dimensions,
                          std::vector<MetricDef> metrics,
                          std::vector<CustomDimension> custom_dimensions,
                          std::vector<CustomMetric> custom_metrics)
    -> std::expected<SchemaCatalog, SchemaError> {
    SchemaCatalog catalog;
    catalog.table_ = std::move(table);

    for (std::size_t i = 0; i < dimensions.size(); ++i) {
        auto& dim = dimensions[i];
        if (dim.column_name.empty()) {
            dim.column_name = dim.id;
        }
        if (!catalog.dimension_index_.emplace(dim.id, i).second) {
            return std::unexpected(SchemaError{fmt::format("duplicate dimension '{}'", dim.id)});
        }
    }

    for (std::size_t i = 0; i < metrics.size(); ++i) {
        if (!catalog.metric_index_.emplace(metrics[i].id, i).second) {
            return std::unexpected(SchemaError{fmt::format("duplicate metric '{}'", metrics[i].id)});
        }
    }

    for (auto& metric : metrics) {
        if (metric.is_volume()) {
            if (!metric.formula.empty() || !metric.depends_on.empty()) {
                return std::unexpected(SchemaError{fmt::format(
                    "volume metric '{}' must not have a formula or dependencies", metric.id)});
            }
            if (metric.source_column.empty()) {
                metric.source_column = metric.id;
            }
            continue;
        }
        if (metric.formula.empty()) {
            return std::unexpected(
                SchemaError{fmt::format("derived metric '{}' has no formula", metric.id)});
        }
        auto compiled = formula::parse(metric.formula);
        if (!compiled.has_value()) {
            return std::unexpected(SchemaError{fmt::format(
                "metric '{}': invalid formula: {}", metric.id, compiled.error().format())});
        }
        auto refs = formula::references(**compiled);
        for (const auto& ref : refs) {
            if (ref == kDaysInRange) {
                continue;
            }
            if (!catalog.metric_index_.contains(ref)) {
                return std::unexpected(SchemaError{
                    fmt::format("metric '{}' references unknown metric '{}'", metric.id, ref)});
            }
        }
        std::erase(refs, std::string(kDaysInRange));
        if (!metric.depends_on.empty()) {
            auto declared = metric.depends_on;
            auto actual = refs;
            std::ranges::sort(declared);
            std::ranges::sort(actual);
            if (declared != actual) {
                spdlog::warn("metric '{}': declared dependencies differ from formula, using formula",
                             metric.id);
            }
        }
        metric.depends_on = std::move(refs);
        catalog.formulas_.emplace(metric.id, std::move(*compiled));
    }

    GraphWalk walk{.metrics = metrics, .index = catalog.metric_index_, .state = {}, .stack = {},
                   .order = {}};
    for (const auto& metric : metrics) {
        if (metric.is_volume()) {
            continue;
        }
        if (auto cycle = walk.visit(metric.id)) {
            return std::unexpected(SchemaError{fmt::format("circular dependency: {}", *cycle)});
        }
    }
    catalog.evaluation_order_ = std::move(walk.order);

    // Volume leaves, resolved in evaluation order so dependencies are ready.
    for (const auto& metric : metrics) {
        if (metric.is_volume()) {
            catalog.volume_leaves_[metric.id] = {metric.id};
        }
    }
    for (const auto& id : catalog.evaluation_order_) {
        std::unordered_set<std::string> leaves;
        for (const auto& dep : metrics[catalog.metric_index_.at(id)].depends_on) {
            for (const auto& leaf : catalog.volume_leaves_.at(dep)) {
                leaves.insert(leaf);
            }
        }
        std::vector<std::string> ordered;
        for (const auto& candidate : metrics) {
            if (leaves.contains(candidate.id)) {
                ordered.push_back(candidate.id);
            }
        }
        catalog.volume_leaves_[id] = std::move(ordered);
    }

    std::unordered_set<std::string> custom_ids;
    for (const auto& custom : custom_dimensions) {
        if (!custom_ids.insert(custom.id).second) {
            return std::unexpected(
                SchemaError{fmt::format("duplicate custom dimension '{}'", custom.id)});
        }
        if (custom.type() == CustomDimensionType::DateRange) {
            continue;
        }
        if (!catalog.metric_index_.contains(custom.source_metric)) {
            return std::unexpected(SchemaError{fmt::format(
                "custom dimension '{}' references unknown metric '{}'", custom.id,
                custom.source_metric)});
        }
    }

    custom_ids.clear();
    for (const auto& custom : custom_metrics) {
        if (!custom_ids.insert(custom.id).second) {
            return std::unexpected(
                SchemaError{fmt::format("duplicate custom metric '{}'", custom.id)});
        }
        if (catalog.metric_index_.contains(custom.id)) {
            return std::unexpected(SchemaError{
                fmt::format("custom metric '{}' collides with a metric id", custom.id)});
        }
        if (!catalog.metric_index_.contains(custom.source_metric)) {
            return std::unexpected(SchemaError{fmt::format(
                "custom metric '{}' references unknown metric '{}'", custom.id,
                custom.source_metric)});
        }
    }

    catalog.dimensions_ = std::move(dimensions);
    catalog.metrics_ = std::move(metrics);
    catalog.custom_dimensions_ = std::move(custom_dimensions);
    catalog.custom_metrics_ = std::move(custom_metrics);
    spdlog::debug("schema '{}': {} dimensions, {} metrics, {} derived", catalog.table_,
                  catalog.dimensions_.size(), catalog.metrics_.size(),
                  catalog.evaluation_order_.size());
    return catalog;
}

auto SchemaCatalog::find_metric(std::string_view id) const -> const MetricDef* {
    if (auto it = metric_index_.find(std::string(id)); it != metric_index_.end()) {
        return &metrics_[it->second];
    }
    return nullptr;
}

auto SchemaCatalog::find_dimension(std::string_view id) const -> const DimensionDef* {
    if (auto it = dimension_index_.find(std::string(id)); it != dimension_index_.end()) {
        return &dimensions_[it->second];
    }
    return nullptr;
}

auto SchemaCatalog::find_custom_dimension(std::string_view id) const -> const CustomDimension* {
    auto it = std::ranges::find(custom_dimensions_, id, &CustomDimension::id);
    return it == custom_dimensions_.end() ? nullptr : &*it;
}

auto SchemaCatalog::find_custom_metric(std::string_view id) const -> const CustomMetric* {
    auto it = std::ranges::find(custom_metrics_, id, &CustomMetric::id);
    return it == custom_metrics_.end() ? nullptr : &*it;
}

auto SchemaCatalog::formula(std::string_view id) const -> const formula::Expr* {
    if (auto it = formulas_.find(std::string(id)); it != formulas_.end()) {
        return it->second.get();
    }
    return nullptr;
}

auto SchemaCatalog::volume_dependencies(std::string_view id) const -> std::vector<std::string> {
    if (auto it = volume_leaves_.find(std::string(id)); it != volume_leaves_.end()) {
        return it->second;
    }
    return {};
}

auto SchemaCatalog::volume_metrics() const -> std::vector<const MetricDef*> {
    std::vector<const MetricDef*> out;
    for (const auto& metric : metrics_) {
        if (metric.is_volume()) {
            out.push_back(&metric);
        }
    }
    return out;
}

auto SchemaCatalog::groupable_dimensions() const -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& dim : dimensions_) {
        if (dim.groupable) {
            out.push_back(dim.id);
        }
    }
    return out;
}

auto SchemaCatalog::is_distinct_like(std::string_view id) const -> bool {
    const auto* metric = find_metric(id);
    return metric != nullptr && metric->is_volume() &&
           metric->aggregation == VolumeAggregation::CountDistinct;
}

void SchemaRegistry::add(SchemaCatalog catalog) {
    std::string key = catalog.table();
    catalogs_.insert_or_assign(std::move(key), std::move(catalog));
}

auto SchemaRegistry::find(std::string_view table) const -> const SchemaCatalog* {
    if (auto it = catalogs_.find(std::string(table)); it != catalogs_.end()) {
        return &it->second;
    }
    return nullptr;
}

auto SchemaRegistry::tables() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(catalogs_.size());
    for (const auto& [name, catalog] : catalogs_) {
        out.push_back(name);
    }
    std::ranges::sort(out);
    return out;
}

auto parse_data_type(std::string_view text) -> std::optional<DataType> {
    std::string lower;
    for (char ch : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (lower == "string") {
        return DataType::String;
    }
    if (lower == "integer" || lower == "int64") {
        return DataType::Integer;
    }
    if (lower == "float" || lower == "float64") {
        return DataType::Float;
    }
    if (lower == "boolean" || lower == "bool") {
        return DataType::Boolean;
    }
    if (lower == "date") {
        return DataType::Date;
    }
    return std::nullopt;
}

auto to_string(DataType type) -> std::string_view {
    switch (type) {
        case DataType::String:
            return "string";
        case DataType::Integer:
            return "integer";
        case DataType::Float:
            return "float";
        case DataType::Boolean:
            return "boolean";
        case DataType::Date:
            return "date";
    }
    return "?";
}

auto parse_metric_category(std::string_view text) -> MetricCategory {
    if (text == "volume") {
        return MetricCategory::Volume;
    }
    if (text == "conversion") {
        return MetricCategory::Conversion;
    }
    return MetricCategory::Other;
}

auto to_string(MetricCategory category) -> std::string_view {
    switch (category) {
        case MetricCategory::Volume:
            return "volume";
        case MetricCategory::Conversion:
            return "conversion";
        case MetricCategory::Other:
            return "other";
    }
    return "?";
}

auto parse_volume_aggregation(std::string_view text) -> std::optional<VolumeAggregation> {
    std::string lower;
    for (char ch : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (lower == "sum") {
        return VolumeAggregation::Sum;
    }
    if (lower == "count") {
        return VolumeAggregation::Count;
    }
    if (lower == "count_distinct" || lower == "approx_count_distinct") {
        return VolumeAggregation::CountDistinct;
    }
    return std::nullopt;
}

auto to_string(VolumeAggregation aggregation) -> std::string_view {
    switch (aggregation) {
        case VolumeAggregation::Sum:
            return "sum";
        case VolumeAggregation::Count:
            return "count";
        case VolumeAggregation::CountDistinct:
            return "count_distinct";
    }
    return "?";
}

}  // namespace pivot
