#pragma once

#include <cassert>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <utility>

#include "Os.hpp"

namespace Os
{

enum class ErrorKind : std::uint8_t
{
    InvalidInput = 0,
    DuplicateId,
    Configuration,
    Deadlock,
    EmptyInput,
    Count,
};

struct [[nodiscard]] Error final
{
    ErrorKind           kind;
    std::string         message;
    std::optional<Pid>  pid  = std::nullopt;
    std::optional<Time> time = std::nullopt;
};

[[nodiscard]] inline auto make_error(
  ErrorKind           kind,
  std::string         message,
  std::optional<Pid>  pid  = std::nullopt,
  std::optional<Time> time = std::nullopt
) -> Error
{
    return Error { .kind = kind, .message = std::move(message), .pid = std::move(pid), .time = time };
}

} // namespace Os

template<>
struct std::formatter<Os::ErrorKind>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(Os::ErrorKind kind, auto& ctx) const
    {
        constexpr static auto visitor = [](Os::ErrorKind value) constexpr -> std::string_view {
            static_assert(
              std::to_underlying(Os::ErrorKind::Count) == 5,
              "[ERROR] Exhaustive handling of all enum variants for ErrorKind is required"
            );

            switch (value) {
                case Os::ErrorKind::InvalidInput: {
                    return "InvalidInputError";
                }
                case Os::ErrorKind::DuplicateId: {
                    return "DuplicateIdError";
                }
                case Os::ErrorKind::Configuration: {
                    return "ConfigurationError";
                }
                case Os::ErrorKind::Deadlock: {
                    return "DeadlockError";
                }
                case Os::ErrorKind::EmptyInput: {
                    return "EmptyInputError";
                }
                default: {
                    assert(false && "unreachable");
                    return "unreachable";
                }
            }
        };

        return std::format_to(ctx.out(), "{}", visitor(kind));
    }
};

template<>
struct std::formatter<Os::Error>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Os::Error& error, auto& ctx) const
    {
        std::format_to(ctx.out(), "{}: {}", error.kind, error.message);
        if (error.pid) { std::format_to(ctx.out(), " (process {})", *error.pid); }
        if (error.time) { std::format_to(ctx.out(), " (at t={})", *error.time); }
        return ctx.out();
    }
};
