#include <pivot/core/row_key.hpp>
#include <pivot/core/safe_math.hpp>
#include <pivot/engine/post_process.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <optional>
#include <robin_hood.h>

namespace pivot {

namespace {

constexpr const char* kDateColumn = "date";

auto missing_source(const CustomDimension& def, const std::string& column) -> PostProcessError {
    return PostProcessError{fmt::format("custom dimension '{}': source column '{}' not found",
                                        def.id, column)};
}

template <typename Rule, typename Value>
auto first_match(const std::vector<Rule>& rules, const Value& value) -> std::string {
    auto it = std::ranges::find_if(rules, [&](const Rule& rule) { return rule.matches(value); });
    return it == rules.end() ? std::string(kOtherLabel) : it->label;
}

auto date_at(const ColumnEntry& entry, std::size_t row) -> std::optional<Date> {
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

auto aggregate_rows(const ColumnEntry& source, const std::vector<std::size_t>& rows,
                    CustomAggregation aggregation) -> double {
    double sum = 0.0;
    std::size_t count = 0;
    std::optional<double> lowest;
    std::optional<double> highest;
    for (auto row : rows) {
        if (is_null(source, row)) {
            continue;
        }
        double value = numeric_at(source, row);
        sum += value;
        ++count;
        lowest = lowest.has_value() ? std::min(*lowest, value) : value;
        highest = highest.has_value() ? std::max(*highest, value) : value;
    }
    switch (aggregation) {
        case CustomAggregation::Avg:
            return safe_divide(sum, static_cast<double>(count));
        case CustomAggregation::Max:
            return highest.value_or(0.0);
        case CustomAggregation::Min:
            return lowest.value_or(0.0);
        case CustomAggregation::Count:
            return static_cast<double>(count);
        case CustomAggregation::Sum:
        case CustomAggregation::AvgPerDay:
            break;
    }
    return finite_or_zero(sum);
}

}  // namespace

auto label_rows(const Table& table, const CustomDimension& def)
    -> std::expected<Column<std::string>, PostProcessError> {
    const std::size_t rows = table.rows();
    Column<std::string> labels;
    labels.reserve(rows);

    if (const auto* buckets = std::get_if<std::vector<BucketRule>>(&def.rules)) {
        const auto* source = table.find_entry(def.source_metric);
        if (source == nullptr) {
            return std::unexpected(missing_source(def, def.source_metric));
        }
        auto ordered = ordered_buckets(*buckets);
        for (std::size_t row = 0; row < rows; ++row) {
            if (is_null(*source, row)) {
                labels.push_back(std::string(kOtherLabel));
                continue;
            }
            labels.push_back(first_match(ordered, numeric_at(*source, row)));
        }
        return labels;
    }

    if (const auto* ranges = std::get_if<std::vector<DateRangeRule>>(&def.rules)) {
        const auto* source = table.find_entry(kDateColumn);
        if (source == nullptr) {
            return std::unexpected(missing_source(def, kDateColumn));
        }
        for (std::size_t row = 0; row < rows; ++row) {
            auto date = date_at(*source, row);
            labels.push_back(date.has_value() ? first_match(*ranges, *date)
                                              : std::string(kOtherLabel));
        }
        return labels;
    }

    const auto& conditions = std::get<std::vector<ConditionRule>>(def.rules);
    const auto* source = table.find_entry(def.source_metric);
    if (source == nullptr) {
        return std::unexpected(missing_source(def, def.source_metric));
    }
    for (std::size_t row = 0; row < rows; ++row) {
        std::optional<double> cell;
        if (!is_null(*source, row)) {
            cell = numeric_at(*source, row);
        }
        labels.push_back(first_match(conditions, cell));
    }
    return labels;
}

auto apply_custom_dimension(Table& table, const CustomDimension& def,
                            const std::vector<std::string>& existing_dims, bool group_by)
    -> std::expected<std::string, PostProcessError> {
    auto labels = label_rows(table, def);
    if (!labels.has_value()) {
        spdlog::warn("{}", labels.error().message);
        return std::unexpected(labels.error());
    }
    auto column = def.column_name();
    if (!group_by) {
        table.set_column(column, std::move(*labels));
        return column;
    }

    // Output rows in label order.
    std::map<std::string, std::size_t> slots;
    for (const auto& label : *labels) {
        slots.emplace(label, 0);
    }
    Column<std::string> grouped_labels;
    grouped_labels.reserve(slots.size());
    for (auto& [label, slot] : slots) {
        slot = grouped_labels.size();
        grouped_labels.push_back(label);
    }
    std::vector<std::size_t> slot_of_row;
    slot_of_row.reserve(labels->size());
    for (const auto& label : *labels) {
        slot_of_row.push_back(slots.at(label));
    }

    Table grouped;
    grouped.add_column(column, std::move(grouped_labels));
    for (const auto& entry : table.columns) {
        if (entry.name == column ||
            std::ranges::find(existing_dims, entry.name) != existing_dims.end()) {
            continue;
        }
        if (const auto* ints = std::get_if<Column<std::int64_t>>(entry.column.get())) {
            std::vector<std::int64_t> sums(slots.size(), 0);
            for (std::size_t row = 0; row < ints->size(); ++row) {
                if (!is_null(entry, row)) {
                    sums[slot_of_row[row]] += (*ints)[row];
                }
            }
            grouped.add_column(entry.name, Column<std::int64_t>{std::move(sums)});
        } else if (const auto* doubles = std::get_if<Column<double>>(entry.column.get())) {
            std::vector<double> sums(slots.size(), 0.0);
            for (std::size_t row = 0; row < doubles->size(); ++row) {
                if (!is_null(entry, row)) {
                    sums[slot_of_row[row]] += (*doubles)[row];
                }
            }
            grouped.add_column(entry.name, Column<double>{std::move(sums)});
        }
    }
    spdlog::debug("custom dimension '{}': {} rows regrouped into {}", def.id, table.rows(),
                  grouped.rows());
    table = std::move(grouped);
    return column;
}

void apply_custom_metric(Table& table, const CustomMetric& def,
                         const std::vector<std::string>& current_dims, std::int64_t num_days) {
    const auto* source = table.find_entry(def.source_metric);
    if (source == nullptr) {
        spdlog::warn("custom metric '{}': source metric '{}' not found", def.id,
                     def.source_metric);
        return;
    }
    const std::size_t rows = table.rows();

    if (def.aggregation == CustomAggregation::AvgPerDay) {
        auto days = static_cast<double>(num_days < 1 ? 1 : num_days);
        Column<double> values;
        values.reserve(rows);
        for (std::size_t row = 0; row < rows; ++row) {
            values.push_back(safe_divide(numeric_at(*source, row), days));
        }
        table.set_column(def.id, std::move(values));
        return;
    }

    std::vector<std::string> group_dims;
    for (const auto& dim : current_dims) {
        if (std::ranges::find(def.exclude_dimensions, dim) == def.exclude_dimensions.end()) {
            group_dims.push_back(dim);
        }
    }

    if (group_dims.size() == current_dims.size()) {
        ColumnValue copy = *source->column;
        auto validity = source->validity;
        table.set_column(def.id, std::move(copy), std::move(validity));
        return;
    }

    std::vector<const ColumnEntry*> keys;
    for (const auto& dim : group_dims) {
        const auto* entry = table.find_entry(dim);
        if (entry == nullptr) {
            spdlog::warn("custom metric '{}': dimension '{}' not found", def.id, dim);
            return;
        }
        keys.push_back(entry);
    }

    // Window groups in first-seen order.
    std::vector<std::vector<std::size_t>> groups;
    robin_hood::unordered_flat_map<RowKey, std::size_t, RowKeyHash, RowKeyEq> index;
    index.reserve(rows);
    for (std::size_t row = 0; row < rows; ++row) {
        auto [pos, inserted] = index.try_emplace(make_row_key(keys, row), groups.size());
        if (inserted) {
            groups.emplace_back();
        }
        groups[pos->second].push_back(row);
    }

    std::vector<double> values(rows, 0.0);
    for (const auto& members : groups) {
        double value = aggregate_rows(*source, members, def.aggregation);
        for (auto row : members) {
            values[row] = value;
        }
    }
    spdlog::debug("custom metric '{}': {} over {} groups", def.id, to_string(def.aggregation),
                  groups.size());
    table.set_column(def.id, Column<double>{std::move(values)});
}

}  // namespace pivot
