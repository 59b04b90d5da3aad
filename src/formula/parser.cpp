#include <pivot/formula/lexer.hpp>
#include <pivot/formula/parser.hpp>

#include <fmt/format.h>

#include <cstdlib>
#include <optional>
#include <vector>

namespace pivot::formula {

namespace {

class Parser {
   public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    auto parse_formula() -> ParseResult {
        if (check(TokenKind::Eof)) {
            return std::unexpected(make_error(peek(), "empty formula"));
        }
        auto expr = parse_expr();
        if (!expr.has_value()) {
            return std::unexpected(error_);
        }
        if (!is_at_end()) {
            return std::unexpected(
                make_error(peek(), fmt::format("unexpected {}", format_token(peek()))));
        }
        return *expr;
    }

   private:
    auto parse_expr() -> std::optional<ExprPtr> {
        auto left = parse_term();
        if (!left.has_value()) {
            return std::nullopt;
        }
        while (check(TokenKind::Plus) || check(TokenKind::Minus)) {
            BinaryOp op = advance().kind == TokenKind::Plus ? BinaryOp::Add : BinaryOp::Sub;
            auto right = parse_term();
            if (!right.has_value()) {
                return std::nullopt;
            }
            left = make_binary(op, std::move(*left), std::move(*right));
        }
        return left;
    }

    auto parse_term() -> std::optional<ExprPtr> {
        auto left = parse_unary();
        if (!left.has_value()) {
            return std::nullopt;
        }
        while (check(TokenKind::Star) || check(TokenKind::Slash)) {
            BinaryOp op = advance().kind == TokenKind::Star ? BinaryOp::Mul : BinaryOp::Div;
            auto right = parse_unary();
            if (!right.has_value()) {
                return std::nullopt;
            }
            left = make_binary(op, std::move(*left), std::move(*right));
        }
        return left;
    }

    auto parse_unary() -> std::optional<ExprPtr> {
        if (match(TokenKind::Minus)) {
            auto operand = parse_unary();
            if (!operand.has_value()) {
                return std::nullopt;
            }
            return make_binary(BinaryOp::Sub, make_literal(0.0), std::move(*operand));
        }
        return parse_primary();
    }

    auto parse_primary() -> std::optional<ExprPtr> {
        if (match(TokenKind::Number)) {
            std::string text(previous().lexeme);
            return make_literal(std::strtod(text.c_str(), nullptr));
        }
        if (match(TokenKind::Reference)) {
            return make_ref(std::string(previous().lexeme));
        }
        if (match(TokenKind::LParen)) {
            auto inner = parse_expr();
            if (!inner.has_value()) {
                return std::nullopt;
            }
            if (!consume(TokenKind::RParen, "expected ')'")) {
                return std::nullopt;
            }
            return inner;
        }
        if (peek().kind == TokenKind::Error) {
            error_ = make_error(peek(), fmt::format("invalid token {}", format_token(peek())));
        } else {
            error_ = make_error(peek(), fmt::format("expected operand, found {}",
                                                    format_token(peek())));
        }
        return std::nullopt;
    }

    auto consume(TokenKind kind, std::string_view message) -> bool {
        if (check(kind)) {
            advance();
            return true;
        }
        error_ = make_error(peek(), message);
        return false;
    }

    auto check(TokenKind kind) const -> bool {
        if (is_at_end()) {
            return kind == TokenKind::Eof;
        }
        return peek().kind == kind;
    }

    auto match(TokenKind kind) -> bool {
        if (!check(kind)) {
            return false;
        }
        advance();
        return true;
    }

    auto advance() -> const Token& {
        if (!is_at_end()) {
            current_ += 1;
        }
        return previous();
    }

    auto is_at_end() const -> bool { return peek().kind == TokenKind::Eof; }

    auto peek() const -> const Token& { return tokens_[current_]; }

    auto previous() const -> const Token& { return tokens_[current_ - 1]; }

    static auto make_error(const Token& token, std::string_view message) -> ParseError {
        return ParseError{
            .message = std::string(message),
            .column = token.column,
        };
    }

    static auto format_token(const Token& token) -> std::string {
        if (token.kind == TokenKind::Eof) {
            return "end of formula";
        }
        return fmt::format("'{}'", token.lexeme);
    }

    std::vector<Token> tokens_;
    std::size_t current_ = 0;
    ParseError error_{};
};

}  // namespace

auto ParseError::format() const -> std::string {
    return fmt::format("column {}: {}", column, message);
}

auto parse(std::string_view source) -> ParseResult {
    Parser parser(tokenize(source));
    return parser.parse_formula();
}

}  // namespace pivot::formula
