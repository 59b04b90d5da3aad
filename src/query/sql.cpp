#include <pivot/query/sql.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <type_traits>

namespace pivot {

namespace {

constexpr std::uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
constexpr std::uint64_t kFnvPrime = 0x100000001b3ULL;

auto quote(const std::string& value) -> std::string {
    std::string out = "'";
    for (char ch : value) {
        if (ch == '\'') {
            out += "''";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
}

auto is_unquoted(DataType type) -> bool {
    return type == DataType::Integer || type == DataType::Float || type == DataType::Boolean;
}

auto render_select(const SelectItem& item) -> std::string {
    std::string expr;
    switch (item.aggregate) {
        case AggregateKind::None:
            expr = item.column;
            break;
        case AggregateKind::Sum:
            expr = fmt::format("SUM({})", item.column);
            break;
        case AggregateKind::Count:
            expr = item.column.empty() ? "COUNT(*)" : fmt::format("COUNT({})", item.column);
            break;
        case AggregateKind::CountDistinct:
            expr = fmt::format("COUNT(DISTINCT {})", item.column);
            break;
        case AggregateKind::Min:
            expr = fmt::format("MIN({})", item.column);
            break;
        case AggregateKind::Max:
            expr = fmt::format("MAX({})", item.column);
            break;
    }
    if (item.alias.empty() || item.alias == expr) {
        return expr;
    }
    return fmt::format("{} AS {}", expr, item.alias);
}

auto render_predicate(const Predicate& predicate) -> std::vector<std::string> {
    return std::visit(
        [](const auto& p) -> std::vector<std::string> {
            using P = std::decay_t<decltype(p)>;
            std::vector<std::string> parts;
            if constexpr (std::is_same_v<P, DateBetween>) {
                if (p.start.has_value()) {
                    parts.push_back(fmt::format("{} >= '{}'", p.column, format_date(*p.start)));
                }
                if (p.end.has_value()) {
                    parts.push_back(fmt::format("{} <= '{}'", p.column, format_date(*p.end)));
                }
            } else if constexpr (std::is_same_v<P, ValueIn>) {
                std::vector<std::string> alternatives;
                if (!p.values.empty()) {
                    std::vector<std::string> literals;
                    for (const auto& value : p.values) {
                        literals.push_back(is_unquoted(p.data_type) ? value : quote(value));
                    }
                    if (literals.size() == 1) {
                        alternatives.push_back(fmt::format("{} = {}", p.column, literals.front()));
                    } else {
                        alternatives.push_back(
                            fmt::format("{} IN ({})", p.column, fmt::join(literals, ", ")));
                    }
                }
                if (p.include_null) {
                    alternatives.push_back(fmt::format("{} IS NULL", p.column));
                }
                if (alternatives.size() == 1) {
                    parts.push_back(alternatives.front());
                } else if (alternatives.size() > 1) {
                    parts.push_back(fmt::format("({})", fmt::join(alternatives, " OR ")));
                }
            } else {
                parts.push_back(fmt::format("{} IS NOT NULL", p.column));
            }
            return parts;
        },
        predicate);
}

auto render_where(const std::vector<Predicate>& where) -> std::string {
    std::vector<std::string> conditions;
    for (const auto& predicate : where) {
        for (auto& part : render_predicate(predicate)) {
            conditions.push_back(std::move(part));
        }
    }
    if (conditions.empty()) {
        return {};
    }
    return fmt::format("\nWHERE {}", fmt::join(conditions, " AND "));
}

}  // namespace

auto render_sql(const GroupedFetchSpec& spec) -> std::string {
    std::string where = render_where(spec.where);
    if (spec.count_groups) {
        std::string inner = spec.group_by.empty()
                                ? std::string("COUNT(*)")
                                : fmt::format("{}", fmt::join(spec.group_by, ", "));
        std::string group = spec.group_by.empty()
                                ? std::string()
                                : fmt::format("\nGROUP BY {}", fmt::join(spec.group_by, ", "));
        return fmt::format("SELECT COUNT(*) AS {}\nFROM (\nSELECT {}\nFROM `{}`{}{}\n)",
                           kGroupCountColumn, inner, spec.table, where, group);
    }

    std::vector<std::string> select;
    select.reserve(spec.select.size());
    for (const auto& item : spec.select) {
        select.push_back(render_select(item));
    }
    std::string sql = fmt::format("SELECT {}\nFROM `{}`{}", fmt::join(select, ", "), spec.table,
                                  where);
    if (!spec.group_by.empty()) {
        sql += fmt::format("\nGROUP BY {}", fmt::join(spec.group_by, ", "));
    }
    if (!spec.order_by.empty()) {
        std::vector<std::string> keys;
        for (const auto& key : spec.order_by) {
            keys.push_back(fmt::format("{} {}", key.alias, key.descending ? "DESC" : "ASC"));
        }
        sql += fmt::format("\nORDER BY {}", fmt::join(keys, ", "));
    }
    if (spec.limit.has_value()) {
        sql += fmt::format("\nLIMIT {}", *spec.limit);
    }
    if (spec.offset > 0) {
        sql += fmt::format("\nOFFSET {}", spec.offset);
    }
    return sql;
}

auto fingerprint(const GroupedFetchSpec& spec) -> std::uint64_t {
    std::uint64_t hash = kFnvOffset;
    for (unsigned char ch : render_sql(spec)) {
        hash ^= ch;
        hash *= kFnvPrime;
    }
    return hash;
}

}  // namespace pivot
