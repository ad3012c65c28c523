#include "tokenizer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace {

constexpr std::array<std::pair<std::string_view, TokenKind>, 4> keywords{{
    {"AND", TokenKind::And},
    {"OR", TokenKind::Or},
    {"NOT", TokenKind::Not},
    {"BETWEEN", TokenKind::Between},
}};

auto is_identifier_start(char c) -> bool {
    return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_' ||
           c == ':' || c == '#';
}

auto is_identifier_char(char c) -> bool {
    return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_' ||
           c == '.' || c == '[' || c == ']';
}

auto keyword_kind(std::string_view lexeme) -> TokenKind {
    std::string upper(lexeme);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](char c) {
        return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    });
    for (const auto &[word, kind] : keywords)
        if (upper == word) return kind;
    return TokenKind::Identifier;
}

} // namespace

Tokenizer::Tokenizer(std::string_view source) : source(source) {}

[[nodiscard]] auto Tokenizer::is_done() const -> bool {
    return current >= source.size();
}

auto Tokenizer::advance() -> char {
    if (is_done()) return '\0';
    char c = source[current++];
    column++;
    return c;
}

auto Tokenizer::peek_current() const -> char {
    return is_done() ? '\0' : source[current];
}

auto Tokenizer::match(char expected) -> bool {
    if (is_done() || source[current] != expected) return false;
    current++;
    column++;
    return true;
}

void Tokenizer::skip_whitespace() {
    while (!is_done()) {
        char c = peek_current();
        switch (c) {
        case ' ':
        case '\r':
        case '\t':
            advance();
            break;
        case '\n':
            advance();
            line++;
            column = 1;
            break;
        default:
            return;
        }
    }
}

auto Tokenizer::make_token(TokenKind kind) -> Token {
    return Token{
        .kind = kind,
        .lexeme = std::string(source.substr(start, current - start)),
        .line = line,
        .column = column - (current - start),
    };
}

auto Tokenizer::error_token(const std::string &msg) -> Token {
    return Token{
        .kind = TokenKind::Invalid,
        .lexeme = msg,
        .line = line,
        .column = column - (current - start),
    };
}

auto Tokenizer::scan_identifier() -> Token {
    while (is_identifier_char(peek_current()))
        advance();
    auto token = make_token(TokenKind::Identifier);
    token.kind = keyword_kind(token.lexeme);
    return token;
}

// Strings stay a single identifier token, quotes included.
auto Tokenizer::scan_string(char quote) -> Token {
    while (!is_done() && peek_current() != quote) {
        if (peek_current() == '\n') return error_token("unterminated string");
        advance();
    }
    if (!match(quote)) return error_token("unterminated string");
    return make_token(TokenKind::Identifier);
}

auto Tokenizer::next() -> Token {
    skip_whitespace();
    start = current;

    if (is_done()) return make_token(TokenKind::Eof);

    char c = advance();

    if (c == '-' && std::isdigit(static_cast<unsigned char>(peek_current())))
        return scan_identifier();
    if (is_identifier_start(c)) return scan_identifier();

    switch (c) {
    case '"':
    case '\'':
        return scan_string(c);
    case '=':
        return make_token(TokenKind::Eq);
    case '<':
        if (match('>')) return make_token(TokenKind::NotEq);
        if (match('=')) return make_token(TokenKind::Lte);
        return make_token(TokenKind::Lt);
    case '>':
        if (match('=')) return make_token(TokenKind::Gte);
        return make_token(TokenKind::Gt);
    case '(':
        return make_token(TokenKind::LParen);
    case ')':
        return make_token(TokenKind::RParen);
    case ',':
        return make_token(TokenKind::Comma);
    default:
        return error_token("unexpected character");
    }
}

auto tokenkind_to_string(TokenKind kind) -> std::string {
    switch (kind) {
    case TokenKind::Identifier:
        return "IDENT";
    case TokenKind::Eq:
        return "=";
    case TokenKind::NotEq:
        return "<>";
    case TokenKind::Lt:
        return "<";
    case TokenKind::Gt:
        return ">";
    case TokenKind::Lte:
        return "<=";
    case TokenKind::Gte:
        return ">=";
    case TokenKind::And:
        return "AND";
    case TokenKind::Or:
        return "OR";
    case TokenKind::Not:
        return "NOT";
    case TokenKind::Between:
        return "BETWEEN";
    case TokenKind::LParen:
        return "(";
    case TokenKind::RParen:
        return ")";
    case TokenKind::Comma:
        return ",";
    case TokenKind::Eof:
        return "EOF";
    case TokenKind::Invalid:
        return "ILLEGAL";
    }
    return "ILLEGAL";
}

auto Token::to_string() const -> std::string {
    std::string text =
        kind == TokenKind::Identifier || kind == TokenKind::Invalid
            ? lexeme
            : tokenkind_to_string(kind);
    return "'" + text + "' | (" + std::to_string(line) + "," +
           std::to_string(column) + ")";
}
