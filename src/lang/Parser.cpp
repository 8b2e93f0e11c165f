#include "Parser.hpp"

#include <print>

#include "Util.hpp"

namespace Interpreter
{

auto Parser::parse(const std::string_view source, const std::vector<Token>& tokens) -> std::optional<Ast>
{
    Parser parser(source, tokens);

    while (parser.has_more()) {
        const auto statement = TRY(parser.expression_statement());
        parser.ast.statements.push_back(statement);
    }

    return parser.ast;
}

Parser::Parser(const std::string_view source, const std::vector<Token>& tokens)
  : source { source },
    tokens { tokens }
{}

template<typename... Args>
auto Parser::report_error(const Span span, std::format_string<Args...> message, Args&&... args) const
  -> std::nullopt_t
{
    std::println(
      stderr, "[ERROR] (parser) {}: {}", span.location(source), std::format(message, std::forward<Args>(args)...)
    );
    return std::nullopt;
}

auto Parser::report_end_of_input(std::string_view expected) const -> std::nullopt_t
{
    std::println(stderr, "[ERROR] (parser) expected {} but reached the end of the script", expected);
    return std::nullopt;
}

auto Parser::expression_statement() -> std::optional<Statement>
{
    const auto expr = TRY(expression());
    return Statement { .kind = expr.id, .span = expr.span };
}

auto Parser::expression() -> std::optional<Expression>
{
    const auto current_token = peek();
    if (!current_token) { return report_end_of_input("expression"); }

    if (current_token->kind == TokenKind::Keyword && current_token->lexeme == "for") { return for_loop(); }

    return primary_expression();
}

auto Parser::primary_expression() -> std::optional<Expression>
{
    const auto maybe_token = peek();
    if (!maybe_token) { return report_end_of_input("primary expression"); }

    const auto token = *maybe_token;
    switch (token.kind) {
        case TokenKind::Identifier: {
            const auto following = peek(1);
            if (following && following->kind == TokenKind::LeftParen) { return call_expression(); }
            if (following && following->kind == TokenKind::ColonColon) { return constant_definition(); }

            (void)TRY(consume_then_match(TokenKind::Identifier));
            return ast.emplace_expression(Variable { .name = token }, token.span);
        }
        case TokenKind::StringLiteral: {
            return string_literal();
        }
        case TokenKind::Integer:
        case TokenKind::Decimal: {
            return number_or_range();
        }
        case TokenKind::LeftBracket: {
            return list();
        }
        case TokenKind::LeftParen: {
            return tuple();
        }
        default: {
            return report_error(token.span, "unexpected {} `{}`", token.kind, token.lexeme);
        }
    }
}

auto Parser::string_literal() -> std::optional<Expression>
{
    const auto token = TRY(consume_then_match(TokenKind::StringLiteral));
    return ast.emplace_expression(StringLiteral { .literal = token }, token.span);
}

auto Parser::number_or_range() -> std::optional<Expression>
{
    const auto following = peek(1);
    if (following && following->kind == TokenKind::DotDot) { return range(); }

    const auto token = TRY(next());
    return ast.emplace_expression(Number { .number = token }, token.span);
}

auto Parser::delimited(TokenKind closing) -> std::optional<Delimited>
{
    Delimited result;
    while (true) {
        const auto token = peek();
        if (!token) { return report_end_of_input(std::format("{}", closing)); }

        if (token->kind == closing) {
            result.closing = TRY(next()).span;
            return result;
        }

        const auto expr = TRY(expression());
        result.elements.push_back(expr.id);

        const auto separator = peek();
        if (!separator) { return report_end_of_input(std::format("`,` or {}", closing)); }
        if (separator->kind == TokenKind::Comma) {
            (void)TRY(next());
        } else if (separator->kind != closing) {
            return report_error(separator->span, "expected `,` or {} but got `{}`", closing, separator->lexeme);
        }
    }
}

auto Parser::list() -> std::optional<Expression>
{
    const auto left_bracket = TRY(consume_then_match(TokenKind::LeftBracket));
    auto       elements     = TRY(delimited(TokenKind::RightBracket));

    return ast.emplace_expression(
      List { .elements = std::move(elements.elements) }, Span::join(left_bracket.span, elements.closing)
    );
}

auto Parser::tuple() -> std::optional<Expression>
{
    const auto left_paren = TRY(consume_then_match(TokenKind::LeftParen));
    auto       elements   = TRY(delimited(TokenKind::RightParen));

    return ast.emplace_expression(
      Tuple { .elements = std::move(elements.elements) }, Span::join(left_paren.span, elements.closing)
    );
}

auto Parser::call_expression() -> std::optional<Expression>
{
    const auto callee = TRY(identifier());
    (void)TRY(consume_then_match(TokenKind::LeftParen));
    auto arguments = TRY(delimited(TokenKind::RightParen));

    return ast.emplace_expression(
      Call { .identifier = callee, .arguments = std::move(arguments.elements) },
      Span::join(callee.span, arguments.closing)
    );
}

auto Parser::constant_definition() -> std::optional<Expression>
{
    const auto name = TRY(identifier());
    (void)TRY(consume_then_match(TokenKind::ColonColon));
    const auto value = TRY(primary_expression());

    return ast.emplace_expression(Constant { .name = name, .value = value.id }, Span::join(name.span, value.span));
}

auto Parser::for_loop() -> std::optional<Expression>
{
    const auto for_token        = TRY(consume_then_match(TokenKind::Keyword));
    const auto range_expression = TRY(range());
    (void)TRY(consume_then_match(TokenKind::LeftCurly));

    std::vector<ExpressionId> body;
    while (true) {
        const auto token = peek();
        if (!token) { return report_end_of_input("`}`"); }
        if (token->kind == TokenKind::RightCurly) { break; }

        const auto expr = TRY(expression());
        body.push_back(expr.id);
    }

    const auto right_curly = TRY(consume_then_match(TokenKind::RightCurly));
    return ast.emplace_expression(
      For { .range = range_expression.id, .body = std::move(body) }, Span::join(for_token.span, right_curly.span)
    );
}

auto Parser::range() -> std::optional<Expression>
{
    const auto start_range = TRY(consume_then_match(TokenKind::Integer));
    (void)TRY(consume_then_match(TokenKind::DotDot));
    const auto end_range = TRY(consume_then_match(TokenKind::Integer));

    return ast.emplace_expression(
      Range { .start = start_range, .end = end_range }, Span::join(start_range.span, end_range.span)
    );
}

auto Parser::identifier() -> std::optional<Token> { return consume_then_match(TokenKind::Identifier); }

auto Parser::consume_then_match(TokenKind expected) -> std::optional<Token>
{
    const auto maybe_token = next();
    if (!maybe_token) { return report_end_of_input(std::format("{}", expected)); }

    const auto token = *maybe_token;
    if (token.kind != expected) {
        return report_error(token.span, "expected {} but got {} `{}`", expected, token.kind, token.lexeme);
    }

    return token;
}

auto Parser::has_more() const -> bool { return cursor < tokens.size(); }

auto Parser::peek(const std::size_t offset) const -> std::optional<Token>
{
    if (cursor + offset < tokens.size()) { return tokens[cursor + offset]; }

    return std::nullopt;
}

auto Parser::next() -> std::optional<Token>
{
    if (has_more()) { return tokens[cursor++]; }

    return std::nullopt;
}

} // namespace Interpreter
