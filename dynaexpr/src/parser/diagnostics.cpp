#include "diagnostics.hpp"

#include <string>
#include <utility>

auto Diagnostics::record(std::string message) -> ParseError {
    messages_.push_back(message);
    return ParseError{.message = std::move(message)};
}

auto Diagnostics::missing_prefix(TokenKind kind) -> ParseError {
    return record("no prefix parse function for " + tokenkind_to_string(kind) +
                  " found");
}

auto Diagnostics::unexpected_token(TokenKind expected, TokenKind actual)
    -> ParseError {
    return record("expected next token to be " + tokenkind_to_string(expected) +
                  ", got " + tokenkind_to_string(actual) + " instead");
}

auto Diagnostics::too_deep(size_t limit) -> ParseError {
    return record("expression exceeds maximum depth of " +
                  std::to_string(limit));
}
