#include <pivot/formula/ast.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <type_traits>

namespace pivot::formula {

namespace {

void collect_references(const Expr& expr, std::vector<std::string>& out) {
    std::visit(
        [&](const auto& node) {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, RefExpr>) {
                if (std::ranges::find(out, node.id) == out.end()) {
                    out.push_back(node.id);
                }
            } else if constexpr (std::is_same_v<Node, BinaryExpr>) {
                collect_references(*node.left, out);
                collect_references(*node.right, out);
            }
        },
        expr.node);
}

auto op_symbol(BinaryOp op) -> char {
    switch (op) {
        case BinaryOp::Add:
            return '+';
        case BinaryOp::Sub:
            return '-';
        case BinaryOp::Mul:
            return '*';
        case BinaryOp::Div:
            return '/';
    }
    return '?';
}

}  // namespace

auto make_ref(std::string id) -> ExprPtr {
    return std::make_shared<const Expr>(Expr{RefExpr{std::move(id)}});
}

auto make_literal(double value) -> ExprPtr {
    return std::make_shared<const Expr>(Expr{LiteralExpr{value}});
}

auto make_binary(BinaryOp op, ExprPtr left, ExprPtr right) -> ExprPtr {
    return std::make_shared<const Expr>(
        Expr{BinaryExpr{.op = op, .left = std::move(left), .right = std::move(right)}});
}

auto references(const Expr& expr) -> std::vector<std::string> {
    std::vector<std::string> out;
    collect_references(expr, out);
    return out;
}

auto to_string(const Expr& expr) -> std::string {
    return std::visit(
        [](const auto& node) -> std::string {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, RefExpr>) {
                return fmt::format("{{{}}}", node.id);
            } else if constexpr (std::is_same_v<Node, LiteralExpr>) {
                return fmt::format("{}", node.value);
            } else {
                return fmt::format("({} {} {})", to_string(*node.left), op_symbol(node.op),
                                   to_string(*node.right));
            }
        },
        expr.node);
}

}  // namespace pivot::formula
