#pragma once

#include <pivot/catalog/rollup.hpp>
#include <pivot/catalog/schema.hpp>
#include <pivot/engine/pivot_service.hpp>
#include <pivot/router/router.hpp>

#include <nlohmann/json.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace pivot {

/// Schema and rollup snapshots read from a definitions document.
struct Definitions {
    SchemaRegistry schemas;
    RollupRegistry rollups;
};

struct DefinitionError {
    std::string message;
};

/// Parse a definitions document:
///
///     {"tables": [{"name": "...", "dimensions": [...], "metrics": [...],
///                  "custom_dimensions": [...], "custom_metrics": [...],
///                  "rollups": [...]}]}
///
/// Every table is validated through SchemaCatalog::build.
[[nodiscard]] auto load_definitions(const nlohmann::json& document)
    -> std::expected<Definitions, DefinitionError>;

[[nodiscard]] auto load_definitions_file(std::string_view path)
    -> std::expected<Definitions, DefinitionError>;

void to_json(nlohmann::json& j, const RollupScore& score);
void to_json(nlohmann::json& j, const RouteDecision& decision);
void to_json(nlohmann::json& j, const PivotRow& row);
/// Routing error payload: error, errorType, requiredDimensions, availableRollups.
void to_json(nlohmann::json& j, const PivotError& error);
/// Response object; a routing error is merged in at the top level.
void to_json(nlohmann::json& j, const PivotResponse& response);
void to_json(nlohmann::json& j, const InflationReport& report);
void to_json(nlohmann::json& j, const TrendPoint& point);

}  // namespace pivot
