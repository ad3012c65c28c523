#include "ast.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>

auto to_string(const Expr &expr) -> std::string {
    return std::visit(
        [](const auto &node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Identifier>) {
                return node.name;
            } else if constexpr (std::is_same_v<T, PrefixExpression>) {
                return "(" + node.op + " " + to_string(node.operand) + ")";
            } else if constexpr (std::is_same_v<T, InfixExpression>) {
                return "(" + to_string(node.left) + " " + node.op + " " +
                       to_string(node.right) + ")";
            } else if constexpr (std::is_same_v<T, BetweenExpression>) {
                return "(" + to_string(node.subject) + " BETWEEN " +
                       node.low.name + " AND " + node.high.name + ")";
            } else {
                std::ostringstream out;
                out << to_string(node.callee) << '(';
                for (size_t i = 0; i < node.arguments.size(); i++) {
                    if (i > 0) out << ", ";
                    out << to_string(node.arguments[i]);
                }
                out << ')';
                return out.str();
            }
        },
        expr.node);
}

auto to_string(const ExprPtr &expr) -> std::string {
    if (!expr) return "<nil>";
    return to_string(*expr);
}

auto to_string(const DynamoExpression &root) -> std::string {
    if (!root.statement) return "";
    return to_string(root.statement->expression);
}

auto ASTPrinter::print(const ExprPtr &expr, size_t indent) // NOLINT
    -> std::string {
    if (!expr) return indent_str(indent) + "<nil>\n";
    return std::visit([&](auto &node) { return dispatch(node, indent); },
                      expr->node);
}

auto ASTPrinter::print(const DynamoExpression &root) -> std::string {
    if (!root.statement) return "";
    return print(root.statement->expression);
}

void ASTPrinter::operator()(const DynamoExpression &root) {
    std::cout << print(root);
}

auto ASTPrinter::dispatch(const BetweenExpression &between, size_t indent)
    -> std::string {
    std::ostringstream out;
    out << indent_str(indent) << "Between\n";
    out << print(between.subject, indent + 2);
    out << dispatch(between.low, indent + 2);
    out << dispatch(between.high, indent + 2);
    return out.str();
}

auto ASTPrinter::dispatch(const CallExpression &call, size_t indent)
    -> std::string {
    std::ostringstream out;
    out << indent_str(indent) << "Call\n";
    out << print(call.callee, indent + 2);
    for (const auto &argument : call.arguments)
        out << print(argument, indent + 2);
    return out.str();
}

auto ASTPrinter::dispatch(const Identifier &ident, size_t indent)
    -> std::string {
    return indent_str(indent) + "Identifier(" + ident.name + ")\n";
}

auto ASTPrinter::dispatch(const InfixExpression &infix, size_t indent)
    -> std::string {
    std::ostringstream out;
    out << indent_str(indent) << "Infix(" << infix.op << ")\n";
    out << print(infix.left, indent + 2);
    out << print(infix.right, indent + 2);
    return out.str();
}

auto ASTPrinter::dispatch(const PrefixExpression &prefix, size_t indent)
    -> std::string {
    std::ostringstream out;
    out << indent_str(indent) << "Prefix(" << prefix.op << ")\n";
    out << print(prefix.operand, indent + 2);
    return out.str();
}

auto ASTPrinter::indent_str(size_t indent) const -> std::string {
    return std::string(indent, ' ');
}
