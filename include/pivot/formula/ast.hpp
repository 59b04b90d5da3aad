#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace pivot::formula {

/// Reference to another metric (or a system value such as `days_in_range`).
struct RefExpr {
    std::string id;
};

struct LiteralExpr {
    double value = 0.0;
};

enum class BinaryOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
};

struct Expr;
// Compiled formulas are immutable and shared between catalog copies.
using ExprPtr = std::shared_ptr<const Expr>;

struct BinaryExpr {
    BinaryOp op = BinaryOp::Add;
    ExprPtr left;
    ExprPtr right;
};

struct Expr {
    std::variant<RefExpr, LiteralExpr, BinaryExpr> node;
};

[[nodiscard]] auto make_ref(std::string id) -> ExprPtr;
[[nodiscard]] auto make_literal(double value) -> ExprPtr;
[[nodiscard]] auto make_binary(BinaryOp op, ExprPtr left, ExprPtr right) -> ExprPtr;

/// Referenced ids in first-occurrence order, without duplicates.
[[nodiscard]] auto references(const Expr& expr) -> std::vector<std::string>;

/// Fully parenthesised rendering, e.g. `({clicks} / {queries})`.
[[nodiscard]] auto to_string(const Expr& expr) -> std::string;

}  // namespace pivot::formula
