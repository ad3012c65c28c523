#include "parser.hpp"

#include "../ast/ast.hpp"
#include "tokenizer.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <utility>
#include <vector>

Parser::Parser(TokenSource &source) : cursor(source) {}

auto Parser::errors() const -> const std::vector<std::string> & {
    return diagnostics.messages();
}

auto Parser::parse() -> DynamoExpression {
    DynamoExpression root;
    if (cursor.current_is(TokenKind::Eof)) return root;

    root.statement = parse_statement();

    // Only one statement per input; anything left over is rejected.
    if (diagnostics.empty()) {
        if (auto end = expect_lookahead(TokenKind::Eof); !end)
            root.statement->expression.reset();
    }

    return root;
}

auto Parser::parse_statement() -> ExpressionStatement {
    ExpressionStatement statement{
        .token = cursor.current(),
        .expression = nullptr,
    };
    auto expression = parse_expression(Precedence::Lowest);
    if (expression) statement.expression = std::move(*expression);
    return statement;
}

namespace {

// Restores the parser depth when a parse_expression call returns.
class DepthScope {
  public:
    explicit DepthScope(size_t &depth) : depth(depth), saved(depth) {}
    ~DepthScope() { depth = saved; }

    DepthScope(const DepthScope &) = delete;
    auto operator=(const DepthScope &) -> DepthScope & = delete;

  private:
    size_t &depth;
    size_t saved;
};

} // namespace

auto Parser::descend(size_t &counter) -> std::expected<void, ParseError> {
    if (too_deep) return std::unexpected(*too_deep);
    counter++;
    if (depth + chained > max_depth) {
        too_deep = diagnostics.too_deep(max_depth);
        return std::unexpected(*too_deep);
    }
    return {};
}

auto Parser::parse_expression(Precedence precedence) // NOLINT(misc-no-recursion)
    -> ParseResult {
    DepthScope scope(depth);
    if (auto level = descend(depth); !level)
        return std::unexpected(level.error());

    auto prefix = prefix_rule(cursor.current().kind);
    if (prefix == PrefixRule::None)
        return std::unexpected(
            diagnostics.missing_prefix(cursor.current().kind));

    auto left = parse_prefix(prefix);

    while (!too_deep && !cursor.lookahead_is(TokenKind::Eof) &&
           precedence < precedence_of(cursor.lookahead().kind)) {
        auto infix = infix_rule(cursor.lookahead().kind);
        if (infix == InfixRule::None) return left;

        // Operators applied in a loop deepen the tree without recursing, so
        // they are counted for the whole parse.
        if (auto level = descend(chained); !level)
            return std::unexpected(level.error());

        cursor.advance();
        left = parse_infix(infix, std::move(left));
    }

    return left;
}

auto Parser::parse_prefix(PrefixRule rule) -> ParseResult {
    switch (rule) {
    case PrefixRule::Identifier: {
        auto ident = parse_identifier();
        return Expr::make<Identifier>(std::move(ident.token),
                                      std::move(ident.name));
    }
    case PrefixRule::Not:
        return parse_not();
    case PrefixRule::Group:
        return parse_group();
    case PrefixRule::None:
        break;
    }
    // parse_expression reports kinds without a prefix routine.
    std::unreachable();
}

auto Parser::parse_identifier() -> Identifier {
    return Identifier{
        .token = cursor.current(),
        .name = cursor.current().lexeme,
    };
}

auto Parser::parse_not() -> ParseResult {
    auto token = cursor.current();
    cursor.advance();

    // NOT binds tighter than AND/OR but looser than comparisons.
    auto operand = parse_expression(Precedence::Not);
    if (!operand) return operand;

    auto op = token.lexeme;
    return Expr::make<PrefixExpression>(std::move(token), std::move(op),
                                        std::move(*operand));
}

// Parentheses only group; they produce no node of their own.
auto Parser::parse_group() -> ParseResult {
    cursor.advance();
    auto expression = parse_expression(Precedence::Lowest);

    if (auto closed = expect_lookahead(TokenKind::RParen); !closed)
        return std::unexpected(closed.error());

    return expression;
}

auto Parser::parse_infix(InfixRule rule, ParseResult left) -> ParseResult {
    switch (rule) {
    case InfixRule::Binary:
        return parse_binary(std::move(left));
    case InfixRule::Between:
        return parse_between(std::move(left));
    case InfixRule::Call:
        return parse_call(std::move(left));
    case InfixRule::None:
        break;
    }
    return left;
}

auto Parser::parse_binary(ParseResult left) -> ParseResult {
    auto token = cursor.current();
    auto precedence = precedence_of(token.kind);
    cursor.advance();

    // The right operand is parsed even when the left one failed so that its
    // errors are reported too.
    auto right = parse_expression(precedence);
    if (!left) return left;
    if (!right) return right;

    auto op = token.lexeme;
    return Expr::make<InfixExpression>(std::move(token), std::move(op),
                                       std::move(*left), std::move(*right));
}

auto Parser::parse_between(ParseResult left) -> ParseResult {
    auto token = cursor.current();
    cursor.advance();

    auto low = parse_bound();
    if (!low) return std::unexpected(low.error());

    if (auto found = expect_lookahead(TokenKind::And); !found)
        return std::unexpected(found.error());
    cursor.advance();

    auto high = parse_bound();
    if (!high) return std::unexpected(high.error());
    if (!left) return left;

    return Expr::make<BetweenExpression>(std::move(token), std::move(*left),
                                         std::move(*low), std::move(*high));
}

// BETWEEN bounds are plain identifiers, never full expressions.
auto Parser::parse_bound() -> std::expected<Identifier, ParseError> {
    if (!cursor.current_is(TokenKind::Identifier))
        return std::unexpected(diagnostics.unexpected_token(
            TokenKind::Identifier, cursor.current().kind));
    return parse_identifier();
}

auto Parser::parse_call(ParseResult callee) -> ParseResult {
    auto token = cursor.current();

    auto arguments = parse_call_arguments();
    if (!arguments) return std::unexpected(arguments.error());
    if (!callee) return callee;

    return Expr::make<CallExpression>(std::move(token), std::move(*callee),
                                      std::move(*arguments));
}

auto Parser::parse_call_arguments()
    -> std::expected<std::vector<ExprPtr>, ParseError> {
    std::vector<ExprPtr> arguments;

    if (cursor.lookahead_is(TokenKind::RParen)) {
        cursor.advance();
        return arguments;
    }

    std::optional<ParseError> failure;
    auto collect = [&](ParseResult argument) {
        if (argument)
            arguments.push_back(std::move(*argument));
        else if (!failure)
            failure = argument.error();
    };

    cursor.advance();
    collect(parse_expression(Precedence::Lowest));

    while (cursor.lookahead_is(TokenKind::Comma)) {
        cursor.advance();
        cursor.advance();
        collect(parse_expression(Precedence::Lowest));
    }

    if (auto closed = expect_lookahead(TokenKind::RParen); !closed)
        return std::unexpected(closed.error());
    if (failure) return std::unexpected(*failure);

    return arguments;
}

auto Parser::expect_lookahead(TokenKind kind)
    -> std::expected<void, ParseError> {
    if (too_deep) return std::unexpected(*too_deep);
    if (!cursor.lookahead_is(kind))
        return std::unexpected(
            diagnostics.unexpected_token(kind, cursor.lookahead().kind));

    cursor.advance();
    return {};
}

auto parse_condition(TokenSource &source) -> ParseOutput {
    Parser parser(source);
    auto root = parser.parse();
    return ParseOutput{
        .root = std::move(root),
        .errors = parser.errors(),
    };
}

auto parse_condition(std::string_view source) -> ParseOutput {
    Tokenizer tokenizer(source);
    return parse_condition(tokenizer);
}
