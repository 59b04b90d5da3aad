#pragma once

#include <pivot/core/table.hpp>
#include <pivot/query/fetch_spec.hpp>

#include <expected>
#include <string>

namespace pivot {

struct StoreError {
    std::string message;
};

/// Executes grouped aggregation requests against a warehouse.
class TabularStore {
   public:
    virtual ~TabularStore() = default;

    /// Output columns are named by the select aliases, in select order.
    [[nodiscard]] virtual auto execute(const GroupedFetchSpec& spec)
        -> std::expected<Table, StoreError> = 0;
};

}  // namespace pivot
