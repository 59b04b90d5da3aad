#include <pivot/core/safe_math.hpp>
#include <pivot/engine/row_builder.hpp>
#include <pivot/formula/evaluator.hpp>
#include <pivot/query/filter.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace pivot {

namespace {

auto column_sum(const ColumnEntry& entry) -> double {
    double sum = 0.0;
    const std::size_t rows = column_size(*entry.column);
    for (std::size_t row = 0; row < rows; ++row) {
        sum += numeric_at(entry, row);
    }
    return finite_or_zero(sum);
}

}  // namespace

RowBuilder::RowBuilder(const SchemaCatalog& schema, std::vector<std::string> metrics,
                       std::int64_t num_days)
    : schema_(&schema), metrics_(std::move(metrics)), num_days_(num_days < 1 ? 1 : num_days) {}

auto RowBuilder::totals(const Table& table) const -> std::map<std::string, double> {
    std::map<std::string, double> out;
    for (const auto& id : metrics_) {
        if (const auto* entry = table.find_entry(id)) {
            out[id] = column_sum(*entry);
        }
    }
    return out;
}

auto RowBuilder::build_rows(const Table& table, const std::vector<std::string>& dimensions) const
    -> std::vector<PivotRow> {
    auto grand_totals = totals(table);
    std::vector<const ColumnEntry*> entries;
    for (const auto& id : metrics_) {
        entries.push_back(table.find_entry(id));
    }

    std::vector<PivotRow> rows;
    rows.reserve(table.rows());
    for (std::size_t row = 0; row < table.rows(); ++row) {
        PivotRow out{.dimension_value = dimension_label(table, dimensions, row),
                     .metrics = {},
                     .percentage_of_total = 0.0,
                     .has_children = !dimensions.empty(),
                     .row_count = 1};
        bool primary_set = false;
        for (std::size_t i = 0; i < metrics_.size(); ++i) {
            if (entries[i] == nullptr) {
                continue;
            }
            const auto& id = metrics_[i];
            double value = finite_or_zero(numeric_at(*entries[i], row));
            double total = grand_totals.at(id);
            out.metrics[id] = value;
            out.metrics[id + "_pct"] =
                total > 0.0 ? round_to(safe_divide(value, total) * 100.0, 2) : 0.0;
            if (!primary_set && total > 0.0) {
                out.percentage_of_total = safe_divide(value, total) * 100.0;
                primary_set = true;
            }
        }
        rows.push_back(std::move(out));
    }
    return rows;
}

auto RowBuilder::build_total(const Table& table) const -> PivotRow {
    PivotRow total{.dimension_value = std::string(kTotalLabel),
                   .metrics = {},
                   .percentage_of_total = 100.0,
                   .has_children = false,
                   .row_count = static_cast<std::int64_t>(table.rows())};
    if (table.rows() == 0) {
        return total;
    }

    auto sums = totals(table);
    formula::RefResolver resolve = [&](std::string_view ref) -> std::optional<double> {
        if (ref == kDaysInRange) {
            return static_cast<double>(num_days_);
        }
        if (auto it = sums.find(std::string(ref)); it != sums.end()) {
            return it->second;
        }
        if (const auto* entry = table.find_entry(std::string(ref))) {
            return column_sum(*entry);
        }
        return std::nullopt;
    };
    for (const auto& id : schema_->evaluation_order()) {
        auto it = sums.find(id);
        if (it == sums.end()) {
            continue;
        }
        auto value = formula::evaluate(*schema_->formula(id), resolve);
        if (!value.has_value()) {
            spdlog::warn("metric '{}' total: {}", id, value.error().message);
        }
        it->second = value.value_or(0.0);
    }

    for (const auto& id : metrics_) {
        if (auto it = sums.find(id); it != sums.end()) {
            total.metrics[id] = it->second;
            total.metrics[id + "_pct"] = 100.0;
        }
    }
    return total;
}

auto dimension_label(const Table& table, const std::vector<std::string>& dimensions,
                     std::size_t row) -> std::string {
    std::vector<std::string> parts;
    for (const auto& dimension : dimensions) {
        const auto* entry = table.find_entry(dimension);
        if (entry == nullptr) {
            continue;
        }
        if (is_null(*entry, row)) {
            parts.emplace_back(kNullMarker);
        } else {
            parts.push_back(format_scalar(scalar_at(*entry->column, row)));
        }
    }
    if (parts.empty()) {
        return std::string(kAllLabel);
    }
    return fmt::format("{}", fmt::join(parts, kLabelSeparator));
}

}  // namespace pivot
