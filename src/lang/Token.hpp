#pragma once

#include <algorithm>
#include <array>
#include <cassert>
#include <cstdint>
#include <format>
#include <string_view>
#include <utility>

#include "Span.hpp"

namespace Interpreter
{

enum class [[nodiscard]] TokenKind : std::uint8_t
{
    // Single character token
    LeftParen = 0,
    RightParen,
    LeftBracket,
    RightBracket,
    LeftCurly,
    RightCurly,
    Comma,

    // Multi character token
    Keyword,
    Identifier,
    StringLiteral,
    Integer,
    Decimal,
    ColonColon,
    DotDot,

    Count,
};

[[nodiscard]] constexpr auto token_kind_name(TokenKind kind) -> std::string_view
{
    static_assert(
      std::to_underlying(TokenKind::Count) == 14,
      "[ERROR] Exhaustive handling of all enum variants for TokenKind is required"
    );

    switch (kind) {
        case TokenKind::LeftParen: {
            return "`(`";
        }
        case TokenKind::RightParen: {
            return "`)`";
        }
        case TokenKind::LeftBracket: {
            return "`[`";
        }
        case TokenKind::RightBracket: {
            return "`]`";
        }
        case TokenKind::LeftCurly: {
            return "`{`";
        }
        case TokenKind::RightCurly: {
            return "`}`";
        }
        case TokenKind::Comma: {
            return "`,`";
        }
        case TokenKind::Keyword: {
            return "keyword";
        }
        case TokenKind::Identifier: {
            return "identifier";
        }
        case TokenKind::StringLiteral: {
            return "string";
        }
        case TokenKind::Integer: {
            return "integer";
        }
        case TokenKind::Decimal: {
            return "decimal";
        }
        case TokenKind::ColonColon: {
            return "`::`";
        }
        case TokenKind::DotDot: {
            return "`..`";
        }
        default: {
            assert(false && "unreachable");
            return "unreachable";
        }
    }
}

struct [[nodiscard]] Token final
{
    [[nodiscard]] constexpr static auto is_keyword(const std::string_view lexeme) -> bool
    {
        constexpr static auto KEYWORDS = std::array { std::string_view { "for" } };
        return std::ranges::contains(KEYWORDS, lexeme);
    }

    [[nodiscard]] auto is_number() const -> bool { return kind == TokenKind::Integer || kind == TokenKind::Decimal; }

    std::string_view lexeme;
    TokenKind        kind;
    Span             span;
};

} // namespace Interpreter

template<>
struct std::formatter<Interpreter::TokenKind>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(Interpreter::TokenKind kind, auto& ctx) const
    {
        return std::format_to(ctx.out(), "{}", Interpreter::token_kind_name(kind));
    }
};

template<>
struct std::formatter<Interpreter::Token>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Interpreter::Token& token, auto& ctx) const
    {
        return std::format_to(
          ctx.out(), "{{ lexeme = \"{}\", kind = {}, span = {} }}", token.lexeme, token.kind, token.span
        );
    }
};
