#pragma once

#include <pivot/catalog/schema.hpp>
#include <pivot/core/table.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace pivot {

inline constexpr std::string_view kAllLabel = "All";
inline constexpr std::string_view kTotalLabel = "Total";
inline constexpr std::string_view kLabelSeparator = " - ";

struct PivotRow {
    std::string dimension_value;
    /// Metric values plus `<id>_pct` shares of the column total.
    std::map<std::string, double> metrics;
    double percentage_of_total = 0.0;
    bool has_children = false;
    std::int64_t row_count = 1;
};

/// Shapes a post-processed table into pivot rows.
///
/// Percentages are relative to the totals of the rows being shaped. The
/// primary share (`percentage_of_total`) follows the first listed metric
/// whose total is positive.
class RowBuilder {
   public:
    /// `metrics` lists the metric columns to emit, catalog metrics first.
    RowBuilder(const SchemaCatalog& schema, std::vector<std::string> metrics,
               std::int64_t num_days = 1);

    [[nodiscard]] auto metrics() const noexcept -> const std::vector<std::string>& {
        return metrics_;
    }

    /// Column sums of the listed metrics present in `table`.
    [[nodiscard]] auto totals(const Table& table) const -> std::map<std::string, double>;

    [[nodiscard]] auto build_rows(const Table& table,
                                  const std::vector<std::string>& dimensions) const
        -> std::vector<PivotRow>;

    /// Footer row: summed volumes, derived metrics re-evaluated over the sums,
    /// every share 100.
    [[nodiscard]] auto build_total(const Table& table) const -> PivotRow;

   private:
    const SchemaCatalog* schema_;
    std::vector<std::string> metrics_;
    std::int64_t num_days_;
};

/// `" - "`-joined dimension values of one row; null renders as `__NULL__`,
/// no dimensions as "All".
[[nodiscard]] auto dimension_label(const Table& table, const std::vector<std::string>& dimensions,
                                   std::size_t row) -> std::string;

}  // namespace pivot
