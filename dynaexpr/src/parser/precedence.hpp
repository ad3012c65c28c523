#pragma once

#include "tokenizer.hpp"

#include <cstdint>

// Binding power of an operator; a higher value binds tighter.
enum class Precedence : uint8_t {
    Lowest = 1,
    Or,
    And,
    Not,
    Equality,   // = <>
    Between,    // BETWEEN
    Relational, // < <= > >=
    Call,       // callee(args)
};

// Kinds with no entry resolve to Precedence::Lowest.
auto precedence_of(TokenKind kind) -> Precedence;

// Routine that handles a token at the start of an expression.
enum class PrefixRule : uint8_t { None, Identifier, Not, Group };

// Routine that handles a token following an already parsed operand.
enum class InfixRule : uint8_t { None, Binary, Between, Call };

auto prefix_rule(TokenKind kind) -> PrefixRule;
auto infix_rule(TokenKind kind) -> InfixRule;
