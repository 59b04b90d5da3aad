#pragma once

#include <pivot/core/column.hpp>
#include <pivot/core/time.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace pivot {

using ColumnValue =
    std::variant<Column<std::int64_t>, Column<double>, Column<std::string>, Column<Date>>;
using ScalarValue = std::variant<std::int64_t, double, std::string, Date>;

struct ColumnEntry {
    std::string name;
    std::shared_ptr<ColumnValue> column;
    // Validity bitmap: true = valid (not null), false = null.
    // nullopt means every row is valid.
    std::optional<std::vector<bool>> validity;
};

/// Returns true if row `row` of `entry` is null.
[[nodiscard]] inline auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    return entry.validity.has_value() && !(*entry.validity)[row];
}

/// Ordered collection of named, equally sized columns.
struct Table {
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;

    /// Append a column, or reseat an existing column of the same name.
    void add_column(std::string name, ColumnValue column);
    /// Add a column with an explicit validity bitmap (true = valid, false = null).
    void add_column(std::string name, ColumnValue column, std::vector<bool> validity);
    /// Replace-or-append that also resets the validity bitmap.
    void set_column(std::string name, ColumnValue column,
                    std::optional<std::vector<bool>> validity = std::nullopt);
    [[nodiscard]] auto find(const std::string& name) -> ColumnValue*;
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnValue*;
    [[nodiscard]] auto find_entry(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto contains(const std::string& name) const -> bool;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
};

using TableRegistry = std::unordered_map<std::string, Table>;

[[nodiscard]] auto column_size(const ColumnValue& column) -> std::size_t;

/// True for int64 and double columns.
[[nodiscard]] auto is_numeric(const ColumnValue& column) -> bool;

/// Numeric value of row `row`; non-numeric columns and nulls read as 0.
[[nodiscard]] auto numeric_at(const ColumnEntry& entry, std::size_t row) -> double;

[[nodiscard]] auto scalar_at(const ColumnValue& column, std::size_t row) -> ScalarValue;

/// Human-readable rendering: dates as ISO, whole doubles without a fraction.
[[nodiscard]] auto format_scalar(const ScalarValue& value) -> std::string;

/// Empty column of the same element type as `column`.
[[nodiscard]] auto make_empty_like(const ColumnValue& column) -> ColumnValue;

/// Append row `row` of `source` onto `dest`; both must hold the same type.
void append_value(ColumnValue& dest, const ColumnValue& source, std::size_t row);

}  // namespace pivot
