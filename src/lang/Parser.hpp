#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "Ast.hpp"
#include "Token.hpp"

namespace Interpreter
{

class [[nodiscard]] Parser final
{
  public:
    // `source` is only used to point error messages at a line and column.
    [[nodiscard]] static auto parse(const std::string_view source, const std::vector<Token>& tokens)
      -> std::optional<Ast>;

  private:
    Parser(const std::string_view source, const std::vector<Token>& tokens);

    [[nodiscard]] auto expression_statement() -> std::optional<Statement>;

    [[nodiscard]] auto expression() -> std::optional<Expression>;
    [[nodiscard]] auto primary_expression() -> std::optional<Expression>;
    [[nodiscard]] auto string_literal() -> std::optional<Expression>;
    [[nodiscard]] auto number_or_range() -> std::optional<Expression>;
    [[nodiscard]] auto list() -> std::optional<Expression>;
    [[nodiscard]] auto tuple() -> std::optional<Expression>;
    [[nodiscard]] auto call_expression() -> std::optional<Expression>;
    [[nodiscard]] auto constant_definition() -> std::optional<Expression>;
    [[nodiscard]] auto for_loop() -> std::optional<Expression>;
    [[nodiscard]] auto range() -> std::optional<Expression>;

    struct [[nodiscard]] Delimited final
    {
        std::vector<ExpressionId> elements;
        Span                      closing;
    };

    // Comma separated expressions up to and including `closing`.
    [[nodiscard]] auto delimited(TokenKind closing) -> std::optional<Delimited>;

    [[nodiscard]] auto identifier() -> std::optional<Token>;
    [[nodiscard]] auto consume_then_match(TokenKind expected) -> std::optional<Token>;

    [[nodiscard]] auto has_more() const -> bool;
    [[nodiscard]] auto peek(const std::size_t offset = 0) const -> std::optional<Token>;
    [[nodiscard]] auto next() -> std::optional<Token>;

    template<typename... Args>
    auto report_error(const Span span, std::format_string<Args...> message, Args&&... args) const -> std::nullopt_t;
    auto report_end_of_input(std::string_view expected) const -> std::nullopt_t;

    std::string_view   source;
    std::vector<Token> tokens;
    std::size_t        cursor = 0;

    Ast ast = {};
};

} // namespace Interpreter
