#pragma once

#include "../parser/tokenizer.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

struct Expr;

using ExprPtr = std::unique_ptr<Expr>;

struct Identifier {
    Token token;
    std::string name;
};

struct PrefixExpression {
    Token token;
    std::string op;
    ExprPtr operand;
};

struct InfixExpression {
    Token token;
    std::string op;
    ExprPtr left;
    ExprPtr right;
};

// subject BETWEEN low AND high
struct BetweenExpression {
    Token token;
    ExprPtr subject;
    Identifier low;
    Identifier high;
};

struct CallExpression {
    Token token;
    ExprPtr callee;
    std::vector<ExprPtr> arguments;
};

struct Expr {

    using ExprNode = std::variant<BetweenExpression, CallExpression, Identifier,
                                  InfixExpression, PrefixExpression>;

    ExprNode node;

    template <typename T, typename... Args>
    static auto make(Args &&...args) -> std::unique_ptr<Expr> {
        return std::make_unique<Expr>(Expr{
            .node = T{std::forward<Args>(args)...},
        });
    }
};

// expression is null when parsing it failed.
struct ExpressionStatement {
    Token token;
    ExprPtr expression;
};

struct DynamoExpression {
    std::optional<ExpressionStatement> statement;
};

// Canonical parenthesised form: (a = :v), (NOT x), (s BETWEEN lo AND hi),
// f(a, b). A missing subtree renders as <nil>.
auto to_string(const Expr &expr) -> std::string;
auto to_string(const ExprPtr &expr) -> std::string;
auto to_string(const DynamoExpression &root) -> std::string;

class ASTPrinter {
    auto dispatch(const BetweenExpression &between, size_t indent)
        -> std::string;
    auto dispatch(const CallExpression &call, size_t indent) -> std::string;
    auto dispatch(const Identifier &ident, size_t indent) -> std::string;
    auto dispatch(const InfixExpression &infix, size_t indent) -> std::string;
    auto dispatch(const PrefixExpression &prefix, size_t indent)
        -> std::string;

    [[nodiscard]] auto indent_str(size_t indent) const -> std::string;

  public:
    auto print(const ExprPtr &expr, size_t indent = 0) -> std::string;
    auto print(const DynamoExpression &root) -> std::string;

    void operator()(const DynamoExpression &root);
};
