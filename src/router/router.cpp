#include <pivot/router/router.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <set>

namespace pivot {

namespace {

auto sorted_set(const std::vector<std::string>& values) -> std::set<std::string> {
    return {values.begin(), values.end()};
}

auto format_set(const std::vector<std::string>& values) -> std::string {
    return fmt::format("[{}]", fmt::join(values, ", "));
}

auto difference(const std::set<std::string>& lhs, const std::set<std::string>& rhs)
    -> std::vector<std::string> {
    std::vector<std::string> out;
    std::ranges::set_difference(lhs, rhs, std::back_inserter(out));
    return out;
}

}  // namespace

QueryRouter::QueryRouter(const SchemaCatalog& schema, const RollupCatalog& rollups,
                         RouterOptions options)
    : schema_(&schema), rollups_(&rollups), options_(options) {}

auto QueryRouter::distinct_metrics(const std::vector<std::string>& metrics) const
    -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& id : metrics) {
        const auto* metric = schema_->find_metric(id);
        if (metric == nullptr || !metric->is_volume()) {
            continue;
        }
        if (options_.conservative_distinct || schema_->is_distinct_like(id)) {
            out.push_back(id);
        }
    }
    return out;
}

auto QueryRouter::required_volume_metrics(const std::vector<std::string>& metrics) const
    -> std::vector<std::string> {
    std::set<std::string> needed;
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

auto QueryRouter::score(const Rollup& rollup, const RouteQuery& query) const -> RollupScore {
    RollupScore result{
        .rollup_id = rollup.id(),
        .dimensions = rollup.dimensions(),
        .status = rollup.status(),
        .score = kRejectedScore,
        .can_use = false,
        .needs_reaggregation = false,
        .reason = {},
        .missing_dimensions = {},
        .missing_metrics = {},
    };

    if (!rollup.is_ready()) {
        result.reason = fmt::format("Rollup status is '{}', not 'ready'", to_string(rollup.status()));
        return result;
    }

    auto rollup_dims = sorted_set(rollup.dimensions());
    auto query_dims = sorted_set(query.dimensions);
    auto filter_dims = sorted_set(query.filter_dimensions);

    auto missing_dims = difference(query_dims, rollup_dims);
    auto missing_filter_dims = difference(filter_dims, rollup_dims);
    for (const auto& metric : required_volume_metrics(query.metrics)) {
        if (!rollup.stores_metric(metric)) {
            result.missing_metrics.push_back(metric);
        }
    }
    result.missing_dimensions = missing_dims;
    for (const auto& dim : missing_filter_dims) {
        if (std::ranges::find(result.missing_dimensions, dim) == result.missing_dimensions.end()) {
            result.missing_dimensions.push_back(dim);
        }
    }

    if (!missing_dims.empty()) {
        result.reason = fmt::format("Missing dimensions: {}", format_set(missing_dims));
        return result;
    }
    if (!missing_filter_dims.empty()) {
        result.reason = fmt::format("Missing filter dimensions: {}", format_set(missing_filter_dims));
        return result;
    }
    if (!result.missing_metrics.empty()) {
        result.reason =
            fmt::format("Missing volume metrics: {}", format_set(result.missing_metrics));
        return result;
    }

    std::set<std::string> covered = query_dims;
    covered.insert(filter_dims.begin(), filter_dims.end());
    auto extra = difference(rollup_dims, covered);

    if (extra.empty()) {
        result.score = kExactMatchScore;
        result.can_use = true;
        result.reason = "OK";
        return result;
    }
    if (extra.size() == 1 && extra.front() == "date") {
        result.can_use = true;
        result.needs_reaggregation = true;
        if (!distinct_metrics(query.metrics).empty()) {
            result.score = kDistinctReaggregationScore;
            result.reason =
                "OK (re-aggregating COUNT DISTINCT across dates - may have slight inflation)";
        } else {
            result.score = kDateReaggregationScore;
            result.reason = "OK (re-aggregating across dates)";
        }
        return result;
    }
    result.reason =
        fmt::format("Rollup has extra dimensions: {}. Exact match required.", format_set(extra));
    return result;
}

auto QueryRouter::diagnose(const RouteQuery& query) const -> std::vector<RollupScore> {
    std::vector<RollupScore> scores;
    scores.reserve(rollups_->rollups().size());
    for (const auto& rollup : rollups_->rollups()) {
        scores.push_back(score(rollup, query));
    }
    std::ranges::stable_sort(scores, [](const RollupScore& a, const RollupScore& b) {
        return a.score > b.score;
    });
    return scores;
}

auto QueryRouter::route(const RouteQuery& query, bool require_rollup) const -> RouteDecision {
    RouteDecision::Fields fields;

    auto required = sorted_set(query.dimensions);
    required.insert(query.filter_dimensions.begin(), query.filter_dimensions.end());
    std::vector<std::string> required_dims(required.begin(), required.end());

    if (rollups_->rollups().empty()) {
        fields.reason = require_rollup ? "No rollups configured; query requires raw table"
                                       : "No rollups configured";
        if (require_rollup) {
            fields.required_dimensions = std::move(required_dims);
        }
        spdlog::info("route dims={}: {}", format_set(query.dimensions), fields.reason);
        return RouteDecision{std::move(fields)};
    }

    const Rollup* best = nullptr;
    RollupScore best_score;
    std::vector<RollupScore> scores;
    for (const auto& rollup : rollups_->rollups()) {
        auto scored = score(rollup, query);
        spdlog::debug("rollup '{}' dims={}: score={}, reason={}", rollup.id(),
                      format_set(rollup.dimensions()), scored.score, scored.reason);
        // Strictly greater keeps the first registered rollup on ties.
        if (scored.can_use && (best == nullptr || scored.score > best_score.score)) {
            best = &rollup;
            best_score = scored;
        }
        scores.push_back(std::move(scored));
    }

    if (best != nullptr) {
        fields.use_rollup = true;
        fields.rollup_id = best->id();
        fields.table_path = best->table_path();
        fields.needs_reaggregation = best_score.needs_reaggregation;
        fields.score = best_score.score;
        fields.reason = fmt::format("Using rollup '{}' (score: {})", best->id(), best_score.score);
        for (const auto* metric : schema_->volume_metrics()) {
            if (best->stores_metric(metric->id)) {
                fields.metrics_available.push_back(metric->id);
            }
        }
        spdlog::info("route dims={}: {}", format_set(query.dimensions), fields.reason);
        return RouteDecision{std::move(fields)};
    }

    std::vector<std::string> ready_dims;
    for (const auto* rollup : rollups_->ready()) {
        ready_dims.push_back(format_set(rollup->dimensions()));
    }
    auto query_dims = sorted_set(query.dimensions);
    std::string query_info =
        query_dims.empty()
            ? " No query dimensions (totals query)."
            : fmt::format(" Query dimensions: {}.",
                          format_set(std::vector<std::string>(query_dims.begin(), query_dims.end())));
    fields.reason = fmt::format(
        "No suitable rollup found.{} Required dimensions: {}. Available rollups: [{}].",
        query_info, format_set(required_dims), fmt::join(ready_dims, ", "));

    if (require_rollup) {
        fields.reason += fmt::format(" Create a rollup with dimensions {} to enable this query.",
                                     format_set(required_dims));
        std::set<std::string> unavailable;
        for (const auto& scored : scores) {
            if (scored.status == RollupStatus::Ready) {
                unavailable.insert(scored.missing_metrics.begin(), scored.missing_metrics.end());
            }
        }
        fields.metrics_unavailable.assign(unavailable.begin(), unavailable.end());
        fields.required_dimensions = std::move(required_dims);
        std::ranges::stable_sort(scores, [](const RollupScore& a, const RollupScore& b) {
            return a.score > b.score;
        });
        fields.candidates = std::move(scores);
    }
    spdlog::info("route dims={}: {}", format_set(query.dimensions), fields.reason);
    return RouteDecision{std::move(fields)};
}

}  // namespace pivot
