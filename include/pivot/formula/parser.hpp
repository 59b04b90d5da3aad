#pragma once

#include <pivot/formula/ast.hpp>

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace pivot::formula {

/// Parse error with a 1-based column into the formula text.
struct ParseError {
    std::string message;
    std::size_t column = 0;

    [[nodiscard]] auto format() const -> std::string;
};

using ParseResult = std::expected<ExprPtr, ParseError>;

/// Compile a formula into an expression tree.
///
///   expr    := term (('+' | '-') term)*
///   term    := unary (('*' | '/') unary)*
///   unary   := '-' unary | primary
///   primary := NUMBER | '{' ident '}' | '(' expr ')'
///
/// Unary minus lowers to `0 - x`.
[[nodiscard]] auto parse(std::string_view source) -> ParseResult;

}  // namespace pivot::formula
