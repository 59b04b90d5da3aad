#include <pivot/core/row_key.hpp>
#include <pivot/store/memory_store.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>
#include <optional>
#include <robin_hood.h>
#include <type_traits>
#include <utility>

namespace pivot {

namespace {

auto text_at(const ColumnEntry& entry, std::size_t row) -> std::string {
    return format_scalar(scalar_at(*entry.column, row));
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

auto lookup(const Table& table, const std::string& table_name, const std::string& column)
    -> std::expected<const ColumnEntry*, StoreError> {
    const auto* entry = table.find_entry(column);
    if (entry == nullptr) {
        return std::unexpected(
            StoreError{fmt::format("unknown column '{}' in table '{}'", column, table_name)});
    }
    return entry;
}

auto row_matches(const Predicate& predicate, const ColumnEntry& entry, std::size_t row) -> bool {
    return std::visit(
        [&](const auto& p) -> bool {
            using P = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<P, DateBetween>) {
                auto date = date_at(entry, row);
                if (!date.has_value()) {
                    return false;
                }
                if (p.start.has_value() && *date < *p.start) {
                    return false;
                }
                return !(p.end.has_value() && *date > *p.end);
            } else if constexpr (std::is_same_v<P, ValueIn>) {
                if (is_null(entry, row)) {
                    return p.include_null;
                }
                auto text = text_at(entry, row);
                return std::ranges::find(p.values, text) != p.values.end();
            } else {
                return !is_null(entry, row);
            }
        },
        predicate);
}

auto predicate_column(const Predicate& predicate) -> const std::string& {
    return std::visit([](const auto& p) -> const std::string& { return p.column; }, predicate);
}

/// Output column being assembled for one select item.
struct OutputColumn {
    ColumnValue values;
    std::vector<bool> validity;
    bool has_null = false;

    void push_null() {
        std::visit(
            [](auto& out) {
                using ColType = std::decay_t<decltype(out)>;
                out.push_back(typename ColType::value_type{});
            },
            values);
        validity.push_back(false);
        has_null = true;
    }
};

auto aggregate_group(const SelectItem& item, const ColumnEntry* entry,
                     const std::vector<std::size_t>& rows, OutputColumn& out)
    -> std::expected<void, StoreError> {
    switch (item.aggregate) {
        case AggregateKind::None: {
            if (rows.empty() || is_null(*entry, rows.front())) {
                out.push_null();
            } else {
                append_value(out.values, *entry->column, rows.front());
                out.validity.push_back(true);
            }
            return {};
        }
        case AggregateKind::Count: {
            std::int64_t count = 0;
            for (auto row : rows) {
                if (entry == nullptr || !is_null(*entry, row)) {
                    ++count;
                }
            }
            std::get<Column<std::int64_t>>(out.values).push_back(count);
            out.validity.push_back(true);
            return {};
        }
        case AggregateKind::CountDistinct: {
            robin_hood::unordered_flat_set<RowKey, RowKeyHash, RowKeyEq> seen;
            std::vector<const ColumnEntry*> single{entry};
            for (auto row : rows) {
                if (!is_null(*entry, row)) {
                    seen.insert(make_row_key(single, row));
                }
            }
            std::get<Column<std::int64_t>>(out.values).push_back(
                static_cast<std::int64_t>(seen.size()));
            out.validity.push_back(true);
            return {};
        }
        case AggregateKind::Sum: {
            if (!is_numeric(*entry->column)) {
                return std::unexpected(
                    StoreError{fmt::format("cannot SUM non-numeric column '{}'", item.column)});
            }
            bool any = false;
            if (const auto* ints = std::get_if<Column<std::int64_t>>(entry->column.get())) {
                std::int64_t sum = 0;
                for (auto row : rows) {
                    if (!is_null(*entry, row)) {
                        sum += (*ints)[row];
                        any = true;
                    }
                }
                if (!any) {
                    out.push_null();
                    return {};
                }
                std::get<Column<std::int64_t>>(out.values).push_back(sum);
            } else {
                const auto& doubles = std::get<Column<double>>(*entry->column);
                double sum = 0.0;
                for (auto row : rows) {
                    if (!is_null(*entry, row)) {
                        sum += doubles[row];
                        any = true;
                    }
                }
                if (!any) {
                    out.push_null();
                    return {};
                }
                std::get<Column<double>>(out.values).push_back(sum);
            }
            out.validity.push_back(true);
            return {};
        }
        case AggregateKind::Min:
        case AggregateKind::Max: {
            std::optional<std::size_t> best;
            bool want_min = item.aggregate == AggregateKind::Min;
            for (auto row : rows) {
                if (is_null(*entry, row)) {
                    continue;
                }
                if (!best.has_value()) {
                    best = row;
                    continue;
                }
                auto candidate = scalar_at(*entry->column, row);
                auto current = scalar_at(*entry->column, *best);
                if (want_min ? candidate < current : candidate > current) {
                    best = row;
                }
            }
            if (!best.has_value()) {
                out.push_null();
            } else {
                append_value(out.values, *entry->column, *best);
                out.validity.push_back(true);
            }
            return {};
        }
    }
    return {};
}

auto output_like(const SelectItem& item, const ColumnEntry* entry) -> ColumnValue {
    switch (item.aggregate) {
        case AggregateKind::Count:
        case AggregateKind::CountDistinct:
            return Column<std::int64_t>{};
        default:
            return make_empty_like(*entry->column);
    }
}

}  // namespace

void MemoryStore::add_table(std::string name, Table table) {
    tables_.insert_or_assign(std::move(name), std::move(table));
}

auto MemoryStore::has_table(const std::string& name) const -> bool {
    return tables_.contains(name);
}

auto MemoryStore::execute(const GroupedFetchSpec& spec) -> std::expected<Table, StoreError> {
    history_.push_back(spec);

    auto it = tables_.find(spec.table);
    if (it == tables_.end()) {
        return std::unexpected(StoreError{fmt::format("unknown table '{}'", spec.table)});
    }
    const Table& input = it->second;
    const std::size_t rows = input.rows();

    // Filter.
    std::vector<std::size_t> selected;
    selected.reserve(rows);
    std::vector<const ColumnEntry*> predicate_columns;
    for (const auto& predicate : spec.where) {
        auto entry = lookup(input, spec.table, predicate_column(predicate));
        if (!entry.has_value()) {
            return std::unexpected(entry.error());
        }
        predicate_columns.push_back(*entry);
    }
    for (std::size_t row = 0; row < rows; ++row) {
        bool keep = true;
        for (std::size_t p = 0; p < spec.where.size() && keep; ++p) {
            keep = row_matches(spec.where[p], *predicate_columns[p], row);
        }
        if (keep) {
            selected.push_back(row);
        }
    }

    // Group, in first-seen order.
    std::vector<const ColumnEntry*> key_columns;
    for (const auto& column : spec.group_by) {
        auto entry = lookup(input, spec.table, column);
        if (!entry.has_value()) {
            return std::unexpected(entry.error());
        }
        key_columns.push_back(*entry);
    }
    std::vector<std::vector<std::size_t>> groups;
    if (key_columns.empty()) {
        groups.push_back(std::move(selected));
    } else {
        robin_hood::unordered_flat_map<RowKey, std::size_t, RowKeyHash, RowKeyEq> index;
        index.reserve(selected.size());
        for (auto row : selected) {
            auto [pos, inserted] =
                index.try_emplace(make_row_key(key_columns, row), groups.size());
            if (inserted) {
                groups.emplace_back();
            }
            groups[pos->second].push_back(row);
        }
    }

    if (spec.count_groups) {
        Table result;
        result.add_column(std::string(kGroupCountColumn),
                          Column<std::int64_t>{static_cast<std::int64_t>(groups.size())});
        spdlog::debug("memory store: counted {} groups in '{}'", groups.size(), spec.table);
        return result;
    }

    // Aggregate.
    std::vector<OutputColumn> outputs;
    std::vector<const ColumnEntry*> sources;
    for (const auto& item : spec.select) {
        const ColumnEntry* entry = nullptr;
        if (!(item.aggregate == AggregateKind::Count && item.column.empty())) {
            auto found = lookup(input, spec.table, item.column);
            if (!found.has_value()) {
                return std::unexpected(found.error());
            }
            entry = *found;
        }
        OutputColumn out;
        out.values = entry == nullptr ? ColumnValue{Column<std::int64_t>{}} : output_like(item, entry);
        outputs.push_back(std::move(out));
        sources.push_back(entry);
    }
    for (const auto& group : groups) {
        for (std::size_t i = 0; i < spec.select.size(); ++i) {
            auto status = aggregate_group(spec.select[i], sources[i], group, outputs[i]);
            if (!status.has_value()) {
                return std::unexpected(status.error());
            }
        }
    }

    // Order, then page.
    std::vector<std::size_t> order(groups.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    if (!spec.order_by.empty()) {
        std::vector<std::pair<std::size_t, bool>> keys;
        for (const auto& key : spec.order_by) {
            auto pos = std::ranges::find(spec.select, key.alias, &SelectItem::alias);
            if (pos == spec.select.end()) {
                return std::unexpected(
                    StoreError{fmt::format("ORDER BY references unknown alias '{}'", key.alias)});
            }
            keys.emplace_back(static_cast<std::size_t>(pos - spec.select.begin()), key.descending);
        }
        std::ranges::stable_sort(order, [&](std::size_t a, std::size_t b) {
            for (const auto& [col, descending] : keys) {
                const auto& out = outputs[col];
                bool a_null = !out.validity[a];
                bool b_null = !out.validity[b];
                if (a_null != b_null) {
                    return b_null;  // nulls last
                }
                if (a_null) {
                    continue;
                }
                auto lhs = scalar_at(out.values, a);
                auto rhs = scalar_at(out.values, b);
                if (lhs == rhs) {
                    continue;
                }
                return descending ? rhs < lhs : lhs < rhs;
            }
            return false;
        });
    }
    std::size_t begin = std::min(spec.offset, order.size());
    std::size_t end = order.size();
    if (spec.limit.has_value()) {
        end = std::min(end, begin + *spec.limit);
    }

    Table result;
    for (std::size_t i = 0; i < spec.select.size(); ++i) {
        const auto& out = outputs[i];
        ColumnValue column = make_empty_like(out.values);
        std::vector<bool> validity;
        bool has_null = false;
        for (std::size_t pos = begin; pos < end; ++pos) {
            append_value(column, out.values, order[pos]);
            validity.push_back(out.validity[order[pos]]);
            has_null = has_null || !out.validity[order[pos]];
        }
        if (has_null) {
            result.add_column(spec.select[i].alias, std::move(column), std::move(validity));
        } else {
            result.add_column(spec.select[i].alias, std::move(column));
        }
    }
    spdlog::debug("memory store: {} rows from '{}' ({} groups)", result.rows(), spec.table,
                  groups.size());
    return result;
}

}  // namespace pivot
