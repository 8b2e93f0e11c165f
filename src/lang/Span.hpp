#pragma once

#include <cstddef>
#include <format>
#include <string_view>

namespace Interpreter
{

struct [[nodiscard]] SourceLocation final
{
    std::size_t line   = 1;
    std::size_t column = 1;
};

// Byte offsets into the script, `end` exclusive.
struct [[nodiscard]] Span final
{
    [[nodiscard]] auto static join(const Span& lhs, const Span& rhs) -> Span
    {
        return Span { .start = lhs.start, .end = rhs.end };
    }

    [[nodiscard]] auto location(const std::string_view source) const -> SourceLocation
    {
        SourceLocation result;
        for (std::size_t idx = 0; idx < start && idx < source.size(); ++idx) {
            if (source[idx] == '\n') {
                ++result.line;
                result.column = 1;
            } else {
                ++result.column;
            }
        }

        return result;
    }

    std::size_t start = 0;
    std::size_t end   = 0;
};

} // namespace Interpreter

template<>
struct std::formatter<Interpreter::SourceLocation>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Interpreter::SourceLocation& location, auto& ctx) const
    {
        return std::format_to(ctx.out(), "{}:{}", location.line, location.column);
    }
};

template<>
struct std::formatter<Interpreter::Span>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Interpreter::Span& span, auto& ctx) const
    {
        return std::format_to(ctx.out(), "{{ start = {}, end = {} }}", span.start, span.end);
    }
};
