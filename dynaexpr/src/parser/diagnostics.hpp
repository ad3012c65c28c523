#pragma once

#include "tokenizer.hpp"

#include <cstddef>
#include <string>
#include <vector>

struct ParseError {
    std::string message;
};

// Ordered, append-only list of messages recorded during one parse.
class Diagnostics {
  public:
    auto missing_prefix(TokenKind kind) -> ParseError;
    auto unexpected_token(TokenKind expected, TokenKind actual) -> ParseError;
    auto too_deep(size_t limit) -> ParseError;

    [[nodiscard]] auto empty() const -> bool { return messages_.empty(); }
    [[nodiscard]] auto messages() const -> const std::vector<std::string> & {
        return messages_;
    }

  private:
    std::vector<std::string> messages_;

    auto record(std::string message) -> ParseError;
};
