#pragma once

#include "../ast/ast.hpp"
#include "diagnostics.hpp"
#include "precedence.hpp"
#include "token_cursor.hpp"
#include "tokenizer.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using ParseResult = std::expected<ExprPtr, ParseError>;

struct ParseOutput {
    DynamoExpression root;
    std::vector<std::string> errors;

    [[nodiscard]] auto ok() const -> bool { return errors.empty(); }
};

// Pratt parser over a single condition expression. Errors are collected
// rather than thrown; a failed branch leaves no node behind. One instance
// parses one input.
class Parser {
  public:
    explicit Parser(TokenSource &source);

    auto parse() -> DynamoExpression;
    [[nodiscard]] auto errors() const -> const std::vector<std::string> &;

    // Bound on nested operands plus chained operators, which keeps both the
    // recursion here and the depth of the resulting tree finite.
    static constexpr size_t max_depth = 1000;

  private:
    TokenCursor cursor;
    Diagnostics diagnostics;
    size_t depth = 0;
    size_t chained = 0;
    // Set once max_depth is exceeded; parsing then unwinds without
    // recording anything else.
    std::optional<ParseError> too_deep;

    auto parse_statement() -> ExpressionStatement;
    auto parse_expression(Precedence precedence) -> ParseResult;
    auto descend(size_t &counter) -> std::expected<void, ParseError>;

    auto parse_prefix(PrefixRule rule) -> ParseResult;
    auto parse_identifier() -> Identifier;
    auto parse_not() -> ParseResult;
    auto parse_group() -> ParseResult;

    auto parse_infix(InfixRule rule, ParseResult left) -> ParseResult;
    auto parse_binary(ParseResult left) -> ParseResult;
    auto parse_between(ParseResult left) -> ParseResult;
    auto parse_bound() -> std::expected<Identifier, ParseError>;
    auto parse_call(ParseResult callee) -> ParseResult;
    auto parse_call_arguments()
        -> std::expected<std::vector<ExprPtr>, ParseError>;

    auto expect_lookahead(TokenKind kind) -> std::expected<void, ParseError>;
};

auto parse_condition(TokenSource &source) -> ParseOutput;
auto parse_condition(std::string_view source) -> ParseOutput;
