#include "precedence.hpp"

auto precedence_of(TokenKind kind) -> Precedence {
    switch (kind) {
    case TokenKind::Or:
        return Precedence::Or;
    case TokenKind::And:
        return Precedence::And;
    case TokenKind::Eq:
    case TokenKind::NotEq:
        return Precedence::Equality;
    case TokenKind::Between:
        return Precedence::Between;
    case TokenKind::Lt:
    case TokenKind::Gt:
    case TokenKind::Lte:
    case TokenKind::Gte:
        return Precedence::Relational;
    case TokenKind::LParen:
        return Precedence::Call;
    default:
        return Precedence::Lowest;
    }
}

auto prefix_rule(TokenKind kind) -> PrefixRule {
    switch (kind) {
    case TokenKind::Identifier:
        return PrefixRule::Identifier;
    case TokenKind::Not:
        return PrefixRule::Not;
    case TokenKind::LParen:
        return PrefixRule::Group;
    default:
        return PrefixRule::None;
    }
}

auto infix_rule(TokenKind kind) -> InfixRule {
    switch (kind) {
    case TokenKind::Eq:
    case TokenKind::NotEq:
    case TokenKind::Lt:
    case TokenKind::Gt:
    case TokenKind::Lte:
    case TokenKind::Gte:
    case TokenKind::And:
    case TokenKind::Or:
        return InfixRule::Binary;
    case TokenKind::Between:
        return InfixRule::Between;
    case TokenKind::LParen:
        return InfixRule::Call;
    default:
        return InfixRule::None;
    }
}
