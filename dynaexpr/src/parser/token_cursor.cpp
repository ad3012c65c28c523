#include "token_cursor.hpp"

#include <utility>

TokenCursor::TokenCursor(TokenSource &source)
    : source(source),
      current_{.kind = TokenKind::Eof, .lexeme = "", .line = 1, .column = 1},
      lookahead_{.kind = TokenKind::Eof, .lexeme = "", .line = 1, .column = 1} {
    current_ = pull();
    lookahead_ = current_.kind == TokenKind::Eof ? current_ : pull();
}

auto TokenCursor::pull() -> Token { return source.next(); }

void TokenCursor::advance() {
    current_ = std::move(lookahead_);
    lookahead_ = current_.kind == TokenKind::Eof ? current_ : pull();
}

auto TokenCursor::current_is(TokenKind kind) const -> bool {
    return current_.kind == kind;
}

auto TokenCursor::lookahead_is(TokenKind kind) const -> bool {
    return lookahead_.kind == kind;
}
