#pragma once

#include <pivot/formula/ast.hpp>

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace pivot::formula {

struct EvalError {
    std::string message;
};

/// Looks up the value bound to a reference; nullopt means unresolvable.
using RefResolver = std::function<std::optional<double>(std::string_view)>;

/// Evaluate a compiled formula. Division is always safe (x / 0 == 0) and the
/// result is never NaN or infinite.
[[nodiscard]] auto evaluate(const Expr& expr, const RefResolver& resolve)
    -> std::expected<double, EvalError>;

}  // namespace pivot::formula
