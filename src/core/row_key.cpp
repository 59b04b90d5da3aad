#include <pivot/core/row_key.hpp>

#include <cstdint>
#include <functional>
#include <type_traits>
#include <variant>

namespace pivot {

auto RowKeyHash::operator()(const RowKey& key) const -> std::size_t {
    std::size_t seed = 0;
    auto hash_combine = [&](std::size_t value) {
        seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    };
    for (std::size_t i = 0; i < key.values.size(); ++i) {
        if (key.nulls[i]) {
            hash_combine(0x51ed270b27fa3a8dULL);
            continue;
        }
        std::size_t h = std::visit(
            [](const auto& v) { return std::hash<std::decay_t<decltype(v)>>{}(v); },
            key.values[i]);
        hash_combine(h);
    }
    return seed;
}

auto make_row_key(const std::vector<const ColumnEntry*>& columns, std::size_t row) -> RowKey {
    RowKey key;
    key.values.reserve(columns.size());
    key.nulls.reserve(columns.size());
    for (const auto* entry : columns) {
        bool null = is_null(*entry, row);
        key.nulls.push_back(null);
        key.values.push_back(null ? ScalarValue{std::int64_t{0}} : scalar_at(*entry->column, row));
    }
    return key;
}

}  // namespace pivot
