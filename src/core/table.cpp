#include <pivot/core/table.hpp>

#include <fmt/format.h>

#include <cmath>
#include <type_traits>

namespace pivot {

void Table::add_column(std::string name, ColumnValue column) {
    if (auto it = index.find(name); it != index.end()) {
        // Reseat the shared_ptr rather than mutating shared data (copy-on-write).
        columns[it->second].column = std::make_shared<ColumnValue>(std::move(column));
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(ColumnEntry{.name = std::move(name),
                                  .column = std::make_shared<ColumnValue>(std::move(column))});
    index[columns.back().name] = pos;
}

void Table::add_column(std::string name, ColumnValue column, std::vector<bool> validity) {
    set_column(std::move(name), std::move(column), std::move(validity));
}

void Table::set_column(std::string name, ColumnValue column,
                       std::optional<std::vector<bool>> validity) {
    if (auto it = index.find(name); it != index.end()) {
        auto& entry = columns[it->second];
        entry.column = std::make_shared<ColumnValue>(std::move(column));
        entry.validity = std::move(validity);
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(ColumnEntry{.name = std::move(name),
                                  .column = std::make_shared<ColumnValue>(std::move(column)),
                                  .validity = std::move(validity)});
    index[columns.back().name] = pos;
}

auto Table::find(const std::string& name) -> ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::find(const std::string& name) const -> const ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::find_entry(const std::string& name) const -> const ColumnEntry* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second];
    }
    return nullptr;
}

auto Table::contains(const std::string& name) const -> bool {
    return index.contains(name);
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return 0;
    }
    return column_size(*columns.front().column);
}

auto column_size(const ColumnValue& column) -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

auto is_numeric(const ColumnValue& column) -> bool {
    return std::holds_alternative<Column<std::int64_t>>(column) ||
           std::holds_alternative<Column<double>>(column);
}

auto numeric_at(const ColumnEntry& entry, std::size_t row) -> double {
    if (is_null(entry, row)) {
        return 0.0;
    }
    if (const auto* ints = std::get_if<Column<std::int64_t>>(entry.column.get())) {
        return static_cast<double>((*ints)[row]);
    }
    if (const auto* doubles = std::get_if<Column<double>>(entry.column.get())) {
        return (*doubles)[row];
    }
    return 0.0;
}

auto scalar_at(const ColumnValue& column, std::size_t row) -> ScalarValue {
    return std::visit([&](const auto& col) -> ScalarValue { return col[row]; }, column);
}

auto format_scalar(const ScalarValue& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, Date>) {
                return format_date(v);
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isfinite(v) && v == std::floor(v) && std::fabs(v) < 1e15) {
                    return fmt::format("{}", static_cast<std::int64_t>(v));
                }
                return fmt::format("{}", v);
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

auto make_empty_like(const ColumnValue& column) -> ColumnValue {
    return std::visit(
        [](const auto& col) -> ColumnValue {
            using ColType = std::decay_t<decltype(col)>;
            return ColType{};
        },
        column);
}

void append_value(ColumnValue& dest, const ColumnValue& source, std::size_t row) {
    std::visit(
        [&](auto& out) {
            using ColType = std::decay_t<decltype(out)>;
            out.push_back(std::get<ColType>(source)[row]);
        },
        dest);
}

}  // namespace pivot
