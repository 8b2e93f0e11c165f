#pragma once

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <print>
#include <random>
#include <ranges>
#include <string>
#include <string_view>

#if __clang__ || __GNUC__
#define TRY(failable)                     \
    ({                                    \
        auto result = (failable);         \
        if (!result) return std::nullopt; \
        *result;                          \
    })

#define TRY_EXPECTED(failable)                                 \
    ({                                                         \
        auto result = (failable);                              \
        if (!result) return std::unexpected(result.error());   \
        *std::move(result);                                    \
    })
#else
#error "Unsupported compiler: TRY macro only supported for GCC and Clang"
#endif

namespace Util
{

[[nodiscard]] constexpr static auto trim(std::string_view sv) -> std::string_view
{
    const auto not_space = [](char c) { return !std::isspace(static_cast<unsigned char>(c)); };
    sv.remove_prefix(std::ranges::distance(sv.begin(), std::ranges::find_if(sv, not_space)));
    sv.remove_suffix(std::ranges::distance(sv.rbegin(), std::ranges::find_if(sv | std::views::reverse, not_space)));

    return sv;
}

[[nodiscard]] constexpr static auto parse_number(std::string_view str) -> std::optional<std::size_t>
{
    std::size_t value = 0;
    auto [ptr, ec]    = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        std::println(stderr, "[ERROR] Failed to parse number from string: {}", str);
        return std::nullopt;
    }

    return value;
};

[[nodiscard]] constexpr static auto parse_integer(std::string_view str) -> std::optional<std::int64_t>
{
    std::int64_t value   = 0;
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc {} || ptr != str.data() + str.size()) { return std::nullopt; }

    return value;
}

[[nodiscard]] constexpr static auto parse_double(std::string_view str) -> std::optional<double>
{
    double number        = 0.0;
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), number);
    if (ec != std::errc {} || ptr != str.data() + str.size()) { return std::nullopt; }

    return number;
}

[[nodiscard]] constexpr static auto to_lower(std::string_view input) -> std::string
{
    std::string result;
    std::ranges::transform(input, std::back_inserter(result), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return result;
}

// Orders strings with embedded numbers the way people read them: "P2" < "P10".
[[nodiscard]] constexpr static auto natural_less(std::string_view lhs, std::string_view rhs) -> bool
{
    const auto is_digit = [](char c) { return c >= '0' && c <= '9'; };

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < lhs.size() && j < rhs.size()) {
        if (is_digit(lhs[i]) && is_digit(rhs[j])) {
            auto lhs_end = i;
            auto rhs_end = j;
            while (lhs_end < lhs.size() && is_digit(lhs[lhs_end])) { ++lhs_end; }
            while (rhs_end < rhs.size() && is_digit(rhs[rhs_end])) { ++rhs_end; }

            auto lhs_digits = lhs.substr(i, lhs_end - i);
            auto rhs_digits = rhs.substr(j, rhs_end - j);
            while (lhs_digits.size() > 1 && lhs_digits.front() == '0') { lhs_digits.remove_prefix(1); }
            while (rhs_digits.size() > 1 && rhs_digits.front() == '0') { rhs_digits.remove_prefix(1); }

            if (lhs_digits.size() != rhs_digits.size()) { return lhs_digits.size() < rhs_digits.size(); }
            if (lhs_digits != rhs_digits) { return lhs_digits < rhs_digits; }

            i = lhs_end;
            j = rhs_end;
            continue;
        }

        if (lhs[i] != rhs[j]) { return lhs[i] < rhs[j]; }
        ++i;
        ++j;
    }

    if ((lhs.size() - i) != (rhs.size() - j)) { return (lhs.size() - i) < (rhs.size() - j); }
    return lhs < rhs;
}

template<typename... Lambdas>
struct [[nodiscard]] Visitor : public Lambdas...
{
    using Lambdas::operator()...;
};

template<typename... Lambdas>
[[nodiscard]] constexpr static auto make_visitor(Lambdas... lambdas) -> Visitor<Lambdas...>
{
    return Visitor { lambdas... };
}

[[nodiscard]] auto read_entire_file(const std::filesystem::path& file_path) -> std::optional<std::string>;
[[nodiscard]] auto write_to_file(const std::filesystem::path& file_path, const std::string& content) -> bool;

[[nodiscard]] auto random_natural(std::mt19937& gen, const std::size_t min, const std::size_t max) -> std::size_t;

[[nodiscard]] constexpr static auto wordify(std::string str) -> std::string
{
    std::ranges::replace(str, '_', ' ');
    return str;
}

[[nodiscard]] constexpr static auto capitalize(std::string str) -> std::string
{
    for (auto word : str | std::views::split(' ')) {
        if (!word.empty()) {
            auto first = word.begin();
            *first     = static_cast<char>(std::toupper(static_cast<unsigned char>(*first)));
        }
    }

    return str;
}

} // namespace Util
