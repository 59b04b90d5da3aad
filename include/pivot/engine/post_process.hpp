#pragma once

#include <pivot/catalog/custom.hpp>
#include <pivot/core/table.hpp>

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace pivot {

struct PostProcessError {
    std::string message;
};

/// Label every row of `table` with the first matching rule of `def`
/// (bucket rules in `ordered_buckets` order); unmatched and null source
/// values get "Other". Fails when the source column is absent.
[[nodiscard]] auto label_rows(const Table& table, const CustomDimension& def)
    -> std::expected<Column<std::string>, PostProcessError>;

/// Add the `custom_<id>` label column and return its name.
///
/// With `group_by` set the table is collapsed to one row per label, ordered
/// by label: the result holds the label column followed by the SUM of every
/// numeric column that is neither the label nor one of `existing_dims`.
/// Derived metrics summed this way must be recomputed by the caller.
[[nodiscard]] auto apply_custom_dimension(Table& table, const CustomDimension& def,
                                          const std::vector<std::string>& existing_dims,
                                          bool group_by)
    -> std::expected<std::string, PostProcessError>;

/// Add column `def.id`.
///
/// avg_per_day divides the source by `num_days` (at least 1). Otherwise the
/// source is aggregated within each combination of `current_dims` minus the
/// excluded dimensions and the aggregate is written back onto every row of
/// that combination; with nothing excluded the source column is copied.
/// A missing source column is logged and leaves the table untouched.
void apply_custom_metric(Table& table, const CustomMetric& def,
                         const std::vector<std::string>& current_dims, std::int64_t num_days);

}  // namespace pivot
