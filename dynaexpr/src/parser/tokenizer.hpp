#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

enum class TokenKind : uint8_t {
    Identifier,
    Eq,
    NotEq,
    Lt,
    Gt,
    Lte,
    Gte,
    And,
    Or,
    Not,
    Between,
    LParen,
    RParen,
    Comma,
    Eof,
    Invalid
};

// Display name used in diagnostics, e.g. "IDENT", "<>", "EOF".
auto tokenkind_to_string(TokenKind kind) -> std::string;

struct Token {
    TokenKind kind;
    std::string lexeme;
    size_t line;
    size_t column;
    [[nodiscard]] auto to_string() const -> std::string;
};

// Anything that can feed tokens to the parser. Once Eof has been returned,
// every further call must return Eof again.
class TokenSource {
  public:
    virtual ~TokenSource() = default;
    virtual auto next() -> Token = 0;
};

class Tokenizer : public TokenSource {
  public:
    explicit Tokenizer(std::string_view src);

    auto next() -> Token override;
    [[nodiscard]] auto is_done() const -> bool;

  private:
    std::string_view source;
    size_t start = 0;
    size_t current = 0;
    size_t line = 1;
    size_t column = 1;

    void skip_whitespace();
    auto advance() -> char;
    [[nodiscard]] auto peek_current() const -> char;
    auto match(char expected) -> bool;

    auto make_token(TokenKind kind) -> Token;
    auto error_token(const std::string &msg) -> Token;

    auto scan_identifier() -> Token;
    auto scan_string(char quote) -> Token;
};
