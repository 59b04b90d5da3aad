#pragma once

#include <pivot/core/table.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace pivot {

/// Load a comma-separated file with a header row. Column types are inferred
/// per column (int64, double, ISO date, otherwise string); empty cells are null.
[[nodiscard]] auto read_csv(std::string_view path) -> std::expected<Table, std::string>;

}  // namespace pivot
