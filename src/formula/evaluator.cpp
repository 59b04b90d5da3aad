#include <pivot/core/safe_math.hpp>
#include <pivot/formula/evaluator.hpp>

#include <fmt/format.h>

#include <type_traits>

namespace pivot::formula {

auto evaluate(const Expr& expr, const RefResolver& resolve) -> std::expected<double, EvalError> {
    return std::visit(
        [&](const auto& node) -> std::expected<double, EvalError> {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, LiteralExpr>) {
                return node.value;
            } else if constexpr (std::is_same_v<Node, RefExpr>) {
                auto value = resolve(node.id);
                if (!value.has_value()) {
                    return std::unexpected(
                        EvalError{fmt::format("unresolved reference '{}'", node.id)});
                }
                return finite_or_zero(*value);
            } else {
                auto left = evaluate(*node.left, resolve);
                if (!left.has_value()) {
                    return left;
                }
                auto right = evaluate(*node.right, resolve);
                if (!right.has_value()) {
                    return right;
                }
                switch (node.op) {
                    case BinaryOp::Add:
                        return finite_or_zero(*left + *right);
                    case BinaryOp::Sub:
                        return finite_or_zero(*left - *right);
                    case BinaryOp::Mul:
                        return finite_or_zero(*left * *right);
                    case BinaryOp::Div:
                        return safe_divide(*left, *right);
                }
                return 0.0;
            }
        },
        expr.node);
}

}  // namespace pivot::formula
