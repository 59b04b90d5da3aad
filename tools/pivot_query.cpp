#include <pivot/io/json.hpp>
#include <pivot/pivot.hpp>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <expected>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

auto split(const std::string& text, char separator) -> std::vector<std::string> {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find(separator, start);
        if (end == std::string::npos) {
            end = text.size();
        }
        if (end > start) {
            parts.push_back(text.substr(start, end - start));
        }
        start = end + 1;
    }
    return parts;
}

auto parse_date_flag(const std::string& flag, const std::string& text)
    -> std::optional<pivot::Date> {
    auto date = pivot::parse_date(text);
    if (!date.has_value()) {
        std::cerr << "pivot_query: " << flag << ": invalid date '" << text << "'\n";
    }
    return date;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"pivot_query - route and run a pivot query over CSV-backed tables"};
    app.set_version_flag("--version", "pivot_query 0.1.0");

    std::string table;
    std::string definitions_path;
    std::vector<std::string> table_specs;
    std::string dims;
    std::string metrics;
    std::vector<std::string> filter_specs;
    std::string start;
    std::string end;
    std::string preset;
    std::string custom_dimension;
    std::vector<std::string> custom_metrics;
    std::size_t limit = 50;
    std::size_t offset = 0;
    bool allow_raw = false;
    bool skip_count = false;
    bool explain = false;
    std::string trend;
    std::string parent;
    bool verbose = false;

    app.add_option("table", table, "Source table to query")->required();
    app.add_option("--definitions", definitions_path,
                   "Definitions JSON file. Defaults to the PIVOT_DEFINITIONS environment variable.");
    app.add_option("--table", table_specs, "Register CSV data as name=path.csv (repeatable)");
    app.add_option("--dims", dims, "Comma-separated dimensions to group by");
    app.add_option("--metrics", metrics, "Comma-separated metrics (default: all)");
    app.add_option("--filter", filter_specs, "Dimension filter dim=v1,v2 (repeatable)");
    app.add_option("--start", start, "Start date (YYYY-MM-DD)");
    app.add_option("--end", end, "End date (YYYY-MM-DD)");
    app.add_option("--preset", preset, "Relative date preset, e.g. last_7_days");
    app.add_option("--custom-dimension", custom_dimension, "Group by a custom dimension id");
    app.add_option("--custom-metric", custom_metrics, "Apply a custom metric id (repeatable)");
    app.add_option("--limit", limit, "Max rows to return (default: 50)");
    app.add_option("--offset", offset, "Rows to skip");
    app.add_option("--trend", trend, "Print a daily, weekly or monthly series instead of rows");
    app.add_option("--parent", parent, "Drill into dim=value; --dims names the child dimension");
    app.add_flag("--allow-raw", allow_raw, "Fall back to the raw table when no rollup fits");
    app.add_flag("--skip-count", skip_count, "Skip the group count query");
    app.add_flag("--explain", explain, "Print the routing decision and SQL instead of running");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    // Results go to stdout; logs to stderr.
    spdlog::set_default_logger(spdlog::stderr_color_mt("pivot"));
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    if (definitions_path.empty()) {
        const char* env = std::getenv("PIVOT_DEFINITIONS");
        if (env != nullptr) {
            definitions_path = env;
        }
    }
    if (definitions_path.empty()) {
        std::cerr << "pivot_query: no definitions (use --definitions or PIVOT_DEFINITIONS)\n";
        return 1;
    }
    auto definitions = pivot::load_definitions_file(definitions_path);
    if (!definitions) {
        std::cerr << "pivot_query: " << definitions.error().message << "\n";
        return 1;
    }

    pivot::MemoryStore store;
    for (const auto& spec : table_specs) {
        auto eq = spec.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "pivot_query: --table expects name=path, got '" << spec << "'\n";
            return 1;
        }
        auto data = pivot::read_csv(spec.substr(eq + 1));
        if (!data) {
            std::cerr << "pivot_query: " << data.error() << "\n";
            return 1;
        }
        store.add_table(spec.substr(0, eq), std::move(*data));
    }

    pivot::PivotRequest request;
    request.table = table;
    request.dimensions = split(dims, ',');
    if (!metrics.empty()) {
        request.metrics = split(metrics, ',');
    }
    for (const auto& spec : filter_specs) {
        auto eq = spec.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "pivot_query: --filter expects dim=v1,v2, got '" << spec << "'\n";
            return 1;
        }
        auto& values = request.filters.dimension_filters[spec.substr(0, eq)];
        for (auto& value : split(spec.substr(eq + 1), ',')) {
            values.push_back(std::move(value));
        }
    }
    if (!start.empty()) {
        request.filters.start_date = parse_date_flag("--start", start);
        if (!request.filters.start_date) {
            return 1;
        }
    }
    if (!end.empty()) {
        request.filters.end_date = parse_date_flag("--end", end);
        if (!request.filters.end_date) {
            return 1;
        }
    }
    if (!preset.empty()) {
        request.filters.relative_preset = pivot::parse_date_preset(preset);
        if (!request.filters.relative_preset) {
            std::cerr << "pivot_query: unknown preset '" << preset << "'\n";
            return 1;
        }
    }
    if (!custom_dimension.empty()) {
        request.custom_dimension_id = custom_dimension;
    }
    request.custom_metric_ids = custom_metrics;
    request.limit = limit;
    request.offset = offset;
    request.require_rollup = !allow_raw;
    request.skip_count = skip_count;

    pivot::PivotService service(definitions->schemas, definitions->rollups, store);

    if (explain) {
        nlohmann::json out;
        auto fetch = service.plan_fetch(request);
        if (!fetch) {
            out = fetch.error();
            std::cout << out.dump(2) << "\n";
            return fetch.error().type == pivot::PivotErrorType::RollupRequired ? 2 : 1;
        }
        auto decision = service.route_request(request);
        if (decision) {
            out["route"] = *decision;
        }
        out["sql"] = pivot::render_sql(*fetch);
        out["fingerprint"] = pivot::fingerprint(*fetch);
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (!trend.empty()) {
        auto grain = pivot::parse_time_grain(trend);
        if (!grain) {
            std::cerr << "pivot_query: unknown trend granularity '" << trend << "'\n";
            return 1;
        }
        auto points = service.get_trend_data(table, request.filters, *grain, request.metrics,
                                             request.require_rollup);
        if (!points) {
            nlohmann::json out = points.error();
            std::cout << out.dump(2) << "\n";
            return points.error().type == pivot::PivotErrorType::RollupRequired ? 2 : 1;
        }
        nlohmann::json out = *points;
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    std::expected<pivot::PivotResponse, pivot::PivotError> response;
    if (!parent.empty()) {
        auto eq = parent.find('=');
        if (eq == std::string::npos || eq == 0 || request.dimensions.size() != 1) {
            std::cerr << "pivot_query: --parent expects dim=value and one --dims child dimension\n";
            return 1;
        }
        response = service.get_pivot_children(table, parent.substr(0, eq), parent.substr(eq + 1),
                                              request.dimensions.front(), request.filters, limit,
                                              offset, request.metrics);
    } else {
        response = service.get_pivot_data(request);
    }
    if (!response) {
        nlohmann::json out = response.error();
        std::cout << out.dump(2) << "\n";
        return 1;
    }
    nlohmann::json out = *response;
    std::cout << out.dump(2) << "\n";
    return response->error.has_value() ? 2 : 0;
}
