#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace pivot::formula {

/// Token types for metric formulas such as `{clicks} / {queries} * 100`.
enum class TokenKind : std::uint8_t {
    Number,
    Reference,  // {metric_id}; lexeme is the id without braces

    Plus,   // +
    Minus,  // -
    Star,   // *
    Slash,  // /

    LParen,  // (
    RParen,  // )

    Eof,
    Error,
};

/// A single token; `column` is 1-based.
struct Token {
    TokenKind kind = TokenKind::Error;
    std::string_view lexeme;
    std::size_t column = 0;
};

/// Tokenize a formula string. Always ends with an Eof token; an unrecognised
/// character or an unterminated reference yields an Error token.
[[nodiscard]] auto tokenize(std::string_view source) -> std::vector<Token>;

}  // namespace pivot::formula
