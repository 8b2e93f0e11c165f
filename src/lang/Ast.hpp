#pragma once

#include <cstddef>
#include <utility>
#include <variant>
#include <vector>

#include "Span.hpp"
#include "Token.hpp"

namespace Interpreter
{

using ExpressionId  = std::size_t;
using StatementKind = std::variant<ExpressionId>;

struct [[nodiscard]] Call final
{
    Token                     identifier;
    std::vector<ExpressionId> arguments;
};

struct [[nodiscard]] StringLiteral final
{
    Token literal;
};

// Integer or decimal, told apart by the token kind.
struct [[nodiscard]] Number final
{
    Token number;
};

struct [[nodiscard]] List final
{
    std::vector<ExpressionId> elements;
};

struct [[nodiscard]] Tuple final
{
    std::vector<ExpressionId> elements;
};

struct [[nodiscard]] Variable final
{
    Token name;
};

// name :: value
struct [[nodiscard]] Constant final
{
    Token        name;
    ExpressionId value;
};

// start..end, end exclusive
struct [[nodiscard]] Range final
{
    Token start;
    Token end;
};

struct [[nodiscard]] For final
{
    ExpressionId              range;
    std::vector<ExpressionId> body;
};

using ExpressionKind = std::variant<Call, StringLiteral, Number, List, Tuple, Variable, Constant, Range, For>;

struct [[nodiscard]] Expression final
{
    ExpressionKind kind;
    Span           span;
    ExpressionId   id;
};

struct [[nodiscard]] Statement final
{
    StatementKind kind;
    Span          span;
};

struct [[nodiscard]] Ast final
{
    std::vector<Statement>  statements;
    std::vector<Expression> expressions;

    [[nodiscard]] auto expression_by_id(const ExpressionId id) const -> const Expression& { return expressions[id]; }

    template<typename Kind>
    auto emplace_expression(Kind&& kind, const Span span) -> const Expression&
    {
        const auto id = expressions.size();
        return expressions.emplace_back(ExpressionKind { std::forward<Kind>(kind) }, span, id);
    }
};

} // namespace Interpreter
