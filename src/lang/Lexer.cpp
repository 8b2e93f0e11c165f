#include "Lexer.hpp"

#include <cctype>
#include <print>

#include "Util.hpp"

[[nodiscard]] static auto is_digit(const char c) -> bool { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

[[nodiscard]] static auto is_identifier_start(const char c) -> bool
{
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

[[nodiscard]] static auto is_identifier_part(const char c) -> bool
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

[[nodiscard]] static auto token_kind_try_from_character(const char character) -> std::optional<Interpreter::TokenKind>
{
    static_assert(
      std::to_underlying(Interpreter::TokenKind::Count) == 14,
      "[ERROR] Exhaustive handling of all enum variants for TokenKind is required"
    );

    switch (character) {
        case '(':
            return Interpreter::TokenKind::LeftParen;
        case ')':
            return Interpreter::TokenKind::RightParen;
        case '[':
            return Interpreter::TokenKind::LeftBracket;
        case ']':
            return Interpreter::TokenKind::RightBracket;
        case ',':
            return Interpreter::TokenKind::Comma;
        case '{':
            return Interpreter::TokenKind::LeftCurly;
        case '}':
            return Interpreter::TokenKind::RightCurly;
        default: {
            return std::nullopt;
        }
    }
}

namespace Interpreter
{

auto Lexer::lex(const std::string_view source) -> std::optional<std::vector<Token>>
{
    std::vector<Token> result = {};
    Lexer              lexer(source);

    lexer.skip_whitespace_and_comments();
    while (lexer.has_more()) {
        result.push_back(TRY(lexer.next_token()));
        lexer.skip_whitespace_and_comments();
    }

    return result;
}

Lexer::Lexer(const std::string_view source)
  : source { source }
{}

template<typename... Args>
auto Lexer::report_error(const std::size_t offset, std::format_string<Args...> message, Args&&... args) const
  -> std::nullopt_t
{
    const auto location = Span { .start = offset, .end = offset }.location(source);
    std::println(stderr, "[ERROR] (lexer) {}: {}", location, std::format(message, std::forward<Args>(args)...));
    return std::nullopt;
}

auto Lexer::single_character_token(const char character) -> std::optional<Token>
{
    const auto kind = token_kind_try_from_character(character);
    if (!kind) { return report_error(cursor, "unexpected character `{}`", character); }

    const auto token =
      Token { .lexeme = source.substr(cursor, 1), .kind = *kind, .span = Span { .start = cursor, .end = cursor + 1 } };

    advance();
    return token;
}

auto Lexer::keyword_or_identifier() -> std::optional<Token>
{
    const auto start_idx = cursor;
    while (const auto peeked = peek()) {
        if (!is_identifier_part(*peeked)) { break; }
        advance();
    }

    const auto lexeme = source.substr(start_idx, cursor - start_idx);
    return Token {
        .lexeme = lexeme,
        .kind   = Token::is_keyword(lexeme) ? TokenKind::Keyword : TokenKind::Identifier,
        .span   = Span { .start = start_idx, .end = cursor },
    };
}

auto Lexer::string_literal() -> std::optional<Token>
{
    const auto quote_idx = cursor;
    advance();

    const auto start_idx = cursor;
    while (true) {
        const auto peeked = peek();
        if (!peeked || *peeked == '\n') { return report_error(quote_idx, "unterminated string literal"); }
        if (*peeked == '"') { break; }
        advance();
    }

    const auto end_idx = cursor;
    advance();

    return Token {
        .lexeme = source.substr(start_idx, end_idx - start_idx),
        .kind   = TokenKind::StringLiteral,
        .span   = Span { .start = quote_idx, .end = cursor },
    };
}

// `1..5` is a range, `0.5` a decimal: the dot only belongs to the number when a digit follows it.
auto Lexer::number() -> std::optional<Token>
{
    const auto start_idx = cursor;
    if (peek() == '-') { advance(); }

    while (const auto peeked = peek()) {
        if (!is_digit(*peeked)) { break; }
        advance();
    }

    auto kind = TokenKind::Integer;
    if (const auto dot = peek(), digit = peek(1); dot == '.' && digit && is_digit(*digit)) {
        kind = TokenKind::Decimal;
        advance();
        while (const auto peeked = peek()) {
            if (!is_digit(*peeked)) { break; }
            advance();
        }
    }

    if (const auto peeked = peek(); peeked && is_identifier_start(*peeked)) {
        return report_error(cursor, "unexpected character `{}` in number", *peeked);
    }

    return Token {
        .lexeme = source.substr(start_idx, cursor - start_idx),
        .kind   = kind,
        .span   = Span { .start = start_idx, .end = cursor },
    };
}

auto Lexer::colon() -> std::optional<Token>
{
    const auto start_idx = cursor;
    advance();

    if (peek() != ':') { return report_error(start_idx, "expected `::`"); }

    advance();
    return Token {
        .lexeme = source.substr(start_idx, 2),
        .kind   = TokenKind::ColonColon,
        .span   = Span { .start = start_idx, .end = cursor },
    };
}

auto Lexer::dotdot() -> std::optional<Token>
{
    const auto start_idx = cursor;
    advance();

    if (peek() != '.') { return report_error(start_idx, "expected `..`"); }

    advance();
    return Token {
        .lexeme = source.substr(start_idx, 2),
        .kind   = TokenKind::DotDot,
        .span   = Span { .start = start_idx, .end = cursor },
    };
}

auto Lexer::has_more() const -> bool { return cursor < source.size(); }

auto Lexer::next_token() -> std::optional<Token>
{
    const auto next_character = TRY(peek());

    if (is_digit(next_character)) { return number(); }
    if (next_character == '-' && peek(1).transform(is_digit).value_or(false)) { return number(); }
    if (is_identifier_start(next_character)) { return keyword_or_identifier(); }

    switch (next_character) {
        case ':': {
            return colon();
        }
        case '.': {
            return dotdot();
        }
        case '"': {
            return string_literal();
        }
        default: {
            return single_character_token(next_character);
        }
    }
}

auto Lexer::peek(const std::size_t offset) const -> std::optional<char>
{
    if (cursor + offset >= source.size()) { return std::nullopt; }

    return source[cursor + offset];
}

void Lexer::advance(const std::size_t amount) { cursor += amount; }

void Lexer::skip_whitespace_and_comments()
{
    while (const auto peeked = peek()) {
        if (*peeked == '#') {
            while (const auto commented = peek()) {
                if (*commented == '\n') { break; }
                advance();
            }
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(*peeked)) == 0) { break; }
        advance();
    }
}

} // namespace Interpreter
