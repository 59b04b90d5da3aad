#pragma once

#include <pivot/core/table.hpp>

#include <cstddef>
#include <vector>

namespace pivot {

/// Values of the key columns in one row; NULL is its own key value.
struct RowKey {
    std::vector<ScalarValue> values;
    std::vector<bool> nulls;
};

struct RowKeyHash {
    [[nodiscard]] auto operator()(const RowKey& key) const -> std::size_t;
};

struct RowKeyEq {
    [[nodiscard]] auto operator()(const RowKey& a, const RowKey& b) const -> bool {
        return a.nulls == b.nulls && a.values == b.values;
    }
};

[[nodiscard]] auto make_row_key(const std::vector<const ColumnEntry*>& columns, std::size_t row)
    -> RowKey;

}  // namespace pivot
