#pragma once

#include "tokenizer.hpp"

// Current token plus one token of lookahead over a TokenSource. The source
// is not pulled again once Eof has been seen.
class TokenCursor {
  public:
    explicit TokenCursor(TokenSource &source);

    void advance();

    [[nodiscard]] auto current() const -> const Token & { return current_; }
    [[nodiscard]] auto lookahead() const -> const Token & { return lookahead_; }
    [[nodiscard]] auto current_is(TokenKind kind) const -> bool;
    [[nodiscard]] auto lookahead_is(TokenKind kind) const -> bool;

  private:
    TokenSource &source;
    Token current_;
    Token lookahead_;

    auto pull() -> Token;
};
