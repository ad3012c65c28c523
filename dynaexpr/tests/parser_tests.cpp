#include "ast/ast.hpp"
#include "parser/parser.hpp"
#include "parser/tokenizer.hpp"
#include "test_support.hpp"

#include <cassert>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

using dynaexpr_test::assert_errors;
using dynaexpr_test::assert_snapshot;

namespace {

auto root_expression(const ParseOutput &output) -> const Expr & {
    assert(output.root.statement.has_value());
    assert(output.root.statement->expression != nullptr);
    return *output.root.statement->expression;
}

auto identifier_name(const ExprPtr &expr) -> std::string {
    assert(expr != nullptr);
    const auto *ident = std::get_if<Identifier>(&expr->node);
    assert(ident != nullptr);
    return ident->name;
}

void test_parser_single_comparisons() {
    struct Case {
        const char *source;
        const char *op;
        const char *right;
    };
    const std::vector<Case> cases{
        {R"(attr = "x")", "=", R"("x")"}, {R"(attr <> "x")", "<>", R"("x")"},
        {"attr < 5", "<", "5"},           {"attr <= 5", "<=", "5"},
        {"attr > :v", ">", ":v"},         {"attr >= :v", ">=", ":v"},
    };

    for (const auto &test : cases) {
        auto output = parse_condition(test.source);
        assert(output.ok());
        const auto *infix =
            std::get_if<InfixExpression>(&root_expression(output).node);
        assert(infix != nullptr);
        assert(infix->op == test.op);
        assert(identifier_name(infix->left) == "attr");
        assert(identifier_name(infix->right) == test.right);
    }
}

void test_parser_not_binds_tighter_than_equality() {
    auto output = parse_condition(R"(NOT attr = "x")");
    assert(output.ok());
    const auto *prefix =
        std::get_if<PrefixExpression>(&root_expression(output).node);
    assert(prefix != nullptr);
    assert(prefix->op == "NOT");
    const auto *operand = std::get_if<InfixExpression>(&prefix->operand->node);
    assert(operand != nullptr);
    assert(operand->op == "=");

    assert_snapshot("NOT a = :x AND b = :y", "((NOT (a = :x)) AND (b = :y))");
    assert_snapshot("NOT NOT a", "(NOT (NOT a))");
}

void test_parser_and_or_precedence() {
    auto output = parse_condition(R"(a = "x" AND b = "y" OR c = "z")");
    assert(output.ok());
    const auto *outer =
        std::get_if<InfixExpression>(&root_expression(output).node);
    assert(outer != nullptr);
    assert(outer->op == "OR");
    const auto *left = std::get_if<InfixExpression>(&outer->left->node);
    assert(left != nullptr);
    assert(left->op == "AND");

    assert_snapshot("a = :x OR b = :y AND c = :z",
                    "((a = :x) OR ((b = :y) AND (c = :z)))");
    assert_snapshot("a AND b AND c", "((a AND b) AND c)");
}

void test_parser_between() {
    auto output = parse_condition("attr BETWEEN lo AND hi");
    assert(output.ok());
    const auto *between =
        std::get_if<BetweenExpression>(&root_expression(output).node);
    assert(between != nullptr);
    assert(identifier_name(between->subject) == "attr");
    assert(between->low.name == "lo");
    assert(between->high.name == "hi");

    assert_snapshot("a = b BETWEEN c AND d", "(a = (b BETWEEN c AND d))");
    assert_snapshot("a < b BETWEEN c AND d", "((a < b) BETWEEN c AND d)");
    assert_snapshot("x BETWEEN :lo AND :hi AND y = :z",
                    "((x BETWEEN :lo AND :hi) AND (y = :z))");
}

void test_parser_between_without_and() {
    auto output = parse_condition("attr BETWEEN lo hi");
    assert(output.errors == std::vector<std::string>{
                                "expected next token to be AND, got IDENT "
                                "instead"});
    assert(output.root.statement.has_value());
    assert(output.root.statement->expression == nullptr);
}

void test_parser_between_bounds_must_be_identifiers() {
    assert_errors("x BETWEEN (a) AND b",
                  {"expected next token to be IDENT, got ( instead"});
    assert_errors("x BETWEEN a AND NOT b",
                  {"expected next token to be IDENT, got NOT instead"});
}

void test_parser_call_expression() {
    auto output = parse_condition("size(attr) > 3");
    assert(output.ok());
    const auto *greater =
        std::get_if<InfixExpression>(&root_expression(output).node);
    assert(greater != nullptr);
    assert(greater->op == ">");
    assert(identifier_name(greater->right) == "3");
    const auto *call = std::get_if<CallExpression>(&greater->left->node);
    assert(call != nullptr);
    assert(identifier_name(call->callee) == "size");
    assert(call->arguments.size() == 1);
    assert(identifier_name(call->arguments[0]) == "attr");
}

void test_parser_call_arguments() {
    assert_snapshot("f()", "f()");
    assert_snapshot("begins_with(#name, :prefix)",
                    "begins_with(#name, :prefix)");
    assert_snapshot("contains(tags, :t) AND attribute_exists(id)",
                    "(contains(tags, :t) AND attribute_exists(id))");
    assert_snapshot("f(a = b, NOT c)", "f((a = b), (NOT c))");
    assert_snapshot("size(list_append(a, b)) >= :n",
                    "(size(list_append(a, b)) >= :n)");

    auto output = parse_condition("f()");
    const auto *call =
        std::get_if<CallExpression>(&root_expression(output).node);
    assert(call != nullptr);
    assert(call->arguments.empty());
}

void test_parser_call_errors() {
    assert_errors("size(attr", {"expected next token to be ), got EOF instead"});
    assert_errors("f(a b)", {"expected next token to be ), got IDENT instead"});
    // The failed argument leaves the cursor on ')', so the closing paren is
    // reported missing as well.
    assert_errors("f(a, )", {
                                "no prefix parse function for ) found",
                                "expected next token to be ), got EOF instead",
                            });
}

void test_parser_grouping_is_transparent() {
    auto grouped = parse_condition("(a = 1)");
    auto plain = parse_condition("a = 1");
    assert(grouped.ok() && plain.ok());
    assert(to_string(grouped.root) == to_string(plain.root));
    assert(std::holds_alternative<InfixExpression>(
        root_expression(grouped).node));

    assert_snapshot("a = :x AND (b = :y OR c = :z)",
                    "((a = :x) AND ((b = :y) OR (c = :z)))");
    assert_snapshot("NOT (a AND b)", "(NOT (a AND b))");
    assert_snapshot("((a))", "a");
}

void test_parser_unclosed_group() {
    auto output = parse_condition("(a = 1");
    assert(output.errors == std::vector<std::string>{
                                "expected next token to be ), got EOF "
                                "instead"});
    assert(output.root.statement->expression == nullptr);
}

void test_parser_missing_prefix() {
    auto output = parse_condition(",");
    assert(output.errors ==
           std::vector<std::string>{"no prefix parse function for , found"});
    assert(output.root.statement.has_value());
    assert(output.root.statement->expression == nullptr);

    assert_errors("NOT", {"no prefix parse function for EOF found"});
    assert_errors("a = ", {"no prefix parse function for EOF found"});
    assert_errors("= a", {"no prefix parse function for = found"});
    assert_errors("! b", {"no prefix parse function for ILLEGAL found"});
    assert_errors("a ! b",
                  {"expected next token to be EOF, got ILLEGAL instead"});
}

void test_parser_reports_independent_errors() {
    assert_errors("a = , AND b = ,", {
                                         "no prefix parse function for , found",
                                         "no prefix parse function for , found",
                                     });
    assert_errors("(, AND b BETWEEN c d", {
                                              "no prefix parse function for , "
                                              "found",
                                              "expected next token to be ), "
                                              "got AND instead",
                                              "expected next token to be AND, "
                                              "got IDENT instead",
                                          });
}

void test_parser_rejects_trailing_tokens() {
    auto output = parse_condition("a = b c");
    assert(output.errors ==
           std::vector<std::string>{
               "expected next token to be EOF, got IDENT instead"});
    assert(output.root.statement->expression == nullptr);

    assert_errors("a = b)", {"expected next token to be EOF, got ) instead"});
}

void test_parser_empty_input() {
    auto output = parse_condition("   ");
    assert(output.ok());
    assert(!output.root.statement.has_value());
    assert(to_string(output.root).empty());
}

void test_parser_keeps_source_tokens() {
    auto output = parse_condition("a =\n  :b");
    assert(output.ok());
    const auto &statement = *output.root.statement;
    assert(statement.token.lexeme == "a");
    const auto *infix = std::get_if<InfixExpression>(&statement.expression->node);
    assert(infix != nullptr);
    assert(infix->token.kind == TokenKind::Eq);
    const auto *right = std::get_if<Identifier>(&infix->right->node);
    assert(right != nullptr);
    assert(right->token.line == 2 && right->token.column == 3);
}

void test_parser_over_token_source() {
    using dynaexpr_test::token;
    dynaexpr_test::TokenList source({
        token(TokenKind::Not),
        token(TokenKind::Identifier, "a"),
        token(TokenKind::Lte),
        token(TokenKind::Identifier, "b"),
        token(TokenKind::Or),
        token(TokenKind::Identifier, "c"),
    });

    Parser parser(source);
    auto root = parser.parse();
    assert(parser.errors().empty());
    assert(to_string(root) == "((NOT (a <= b)) OR c)");
    // Six tokens plus the first Eof; nothing is pulled after that.
    assert(source.pulls() == 7);
}

void test_parser_limits_nesting_depth() {
    const std::vector<std::string> too_deep{
        "expression exceeds maximum depth of 1000"};

    const size_t parens = 100000;
    auto output = parse_condition(std::string(parens, '(') + "a" +
                                  std::string(parens, ')'));
    assert(output.errors == too_deep);
    assert(output.root.statement.has_value());
    assert(output.root.statement->expression == nullptr);

    std::string negations;
    for (int i = 0; i < 20000; i++)
        negations += "NOT ";
    assert(parse_condition(negations + "a").errors == too_deep);

    std::string chain = "a";
    for (int i = 0; i < 100000; i++)
        chain += " AND a";
    assert(parse_condition(chain).errors == too_deep);

    std::string calls;
    for (int i = 0; i < 20000; i++)
        calls += "f(";
    calls += "a" + std::string(20000, ')');
    assert(parse_condition(calls).errors == too_deep);
}

void test_parser_accepts_nesting_below_limit() {
    const size_t parens = 400;
    auto output = parse_condition(std::string(parens, '(') + "a = :b" +
                                  std::string(parens, ')'));
    assert(output.ok());
    assert(to_string(output.root) == "(a = :b)");

    std::string chain = "a = :v0";
    for (int i = 1; i < 300; i++)
        chain += " AND a = :v" + std::to_string(i);
    assert(parse_condition(chain).ok());
}

void test_parser_lowercase_keywords() {
    assert_snapshot("not a = :x and b between :lo and :hi",
                    "((not (a = :x)) and (b BETWEEN :lo AND :hi))");
}

} // namespace

auto main() -> int {
    test_parser_single_comparisons();
    test_parser_not_binds_tighter_than_equality();
    test_parser_and_or_precedence();
    test_parser_between();
    test_parser_between_without_and();
    test_parser_between_bounds_must_be_identifiers();
    test_parser_call_expression();
    test_parser_call_arguments();
    test_parser_call_errors();
    test_parser_grouping_is_transparent();
    test_parser_unclosed_group();
    test_parser_missing_prefix();
    test_parser_reports_independent_errors();
    test_parser_rejects_trailing_tokens();
    test_parser_empty_input();
    test_parser_keeps_source_tokens();
    test_parser_over_token_source();
    test_parser_limits_nesting_depth();
    test_parser_accepts_nesting_below_limit();
    test_parser_lowercase_keywords();
    return 0;
}
