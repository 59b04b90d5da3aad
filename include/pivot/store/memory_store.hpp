#pragma once

#include <pivot/store/tabular_store.hpp>

#include <string>
#include <vector>

namespace pivot {

/// In-process TabularStore over named tables.
///
/// NULL group keys form their own group. SUM of an integer column stays
/// integral; SUM/MIN/MAX over no non-null value yield NULL.
class MemoryStore final : public TabularStore {
   public:
    void add_table(std::string name, Table table);
    [[nodiscard]] auto has_table(const std::string& name) const -> bool;

    [[nodiscard]] auto execute(const GroupedFetchSpec& spec)
        -> std::expected<Table, StoreError> override;

    /// Every spec passed to execute(), in order.
    [[nodiscard]] auto history() const noexcept -> const std::vector<GroupedFetchSpec>& {
        return history_;
    }
    void clear_history() { history_.clear(); }

   private:
    TableRegistry tables_;
    std::vector<GroupedFetchSpec> history_;
};

}  // namespace pivot
