#include <pivot/formula/lexer.hpp>

#include <cctype>

namespace pivot::formula {

auto tokenize(std::string_view source) -> std::vector<Token> {
    std::vector<Token> tokens;

    const auto add_token = [&](TokenKind kind, std::size_t start, std::size_t length) {
        tokens.push_back(Token{
            .kind = kind,
            .lexeme = source.substr(start, length),
            .column = start + 1,
        });
    };

    const auto is_ident_cont = [](unsigned char ch) -> bool {
        return std::isalnum(ch) != 0 || ch == '_';
    };

    std::size_t i = 0;
    while (i < source.size()) {
        unsigned char ch = static_cast<unsigned char>(source[i]);
        if (std::isspace(ch) != 0) {
            ++i;
            continue;
        }
        switch (ch) {
            case '+':
                add_token(TokenKind::Plus, i, 1);
                ++i;
                continue;
            case '-':
                add_token(TokenKind::Minus, i, 1);
                ++i;
                continue;
            case '*':
                add_token(TokenKind::Star, i, 1);
                ++i;
                continue;
            case '/':
                add_token(TokenKind::Slash, i, 1);
                ++i;
                continue;
            case '(':
                add_token(TokenKind::LParen, i, 1);
                ++i;
                continue;
            case ')':
                add_token(TokenKind::RParen, i, 1);
                ++i;
                continue;
            default:
                break;
        }

        if (ch == '{') {
            std::size_t start = i + 1;
            std::size_t end = start;
            while (end < source.size() && is_ident_cont(static_cast<unsigned char>(source[end]))) {
                ++end;
            }
            if (end == start || end >= source.size() || source[end] != '}') {
                add_token(TokenKind::Error, i, end - i);
                break;
            }
            tokens.push_back(Token{
                .kind = TokenKind::Reference,
                .lexeme = source.substr(start, end - start),
                .column = i + 1,
            });
            i = end + 1;
            continue;
        }

        if (std::isdigit(ch) != 0 || ch == '.') {
            std::size_t start = i;
            bool seen_dot = false;
            while (i < source.size()) {
                char c = source[i];
                if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
                    ++i;
                } else if (c == '.' && !seen_dot) {
                    seen_dot = true;
                    ++i;
                } else {
                    break;
                }
            }
            if (i - start == 1 && source[start] == '.') {
                add_token(TokenKind::Error, start, 1);
                break;
            }
            add_token(TokenKind::Number, start, i - start);
            continue;
        }

        add_token(TokenKind::Error, i, 1);
        break;
    }

    tokens.push_back(Token{.kind = TokenKind::Eof, .lexeme = {}, .column = source.size() + 1});
    return tokens;
}

}  // namespace pivot::formula
