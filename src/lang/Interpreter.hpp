#pragma once

#include <cstdint>
#include <format>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Ast.hpp"
#include "Util.hpp"
#include "simulations/Workload.hpp"

namespace Interpreter
{

struct [[nodiscard]] Value final
{
    using ValueType = std::variant<std::monostate, std::string_view, std::int64_t, double, std::vector<Value>>;

    Value()
      : value { std::monostate {} }
    {}

    explicit Value(const std::string_view string)
      : value { string }
    {}

    explicit Value(const std::int64_t integer)
      : value { integer }
    {}

    explicit Value(const double decimal)
      : value { decimal }
    {}

    explicit Value(std::vector<Value> values)
      : value { std::move(values) }
    {}

    [[nodiscard]] auto is_string() const -> bool { return std::holds_alternative<std::string_view>(value); }
    [[nodiscard]] auto as_string() const -> std::string_view { return std::get<std::string_view>(value); }

    [[nodiscard]] auto is_integer() const -> bool { return std::holds_alternative<std::int64_t>(value); }
    [[nodiscard]] auto as_integer() const -> std::int64_t { return std::get<std::int64_t>(value); }

    // Integers are accepted wherever a decimal is expected.
    [[nodiscard]] auto is_decimal() const -> bool
    {
        return std::holds_alternative<double>(value) || std::holds_alternative<std::int64_t>(value);
    }

    [[nodiscard]] auto as_decimal() const -> double
    {
        if (is_integer()) { return static_cast<double>(as_integer()); }
        return std::get<double>(value);
    }

    [[nodiscard]] auto is_value_list() const -> bool { return std::holds_alternative<std::vector<Value>>(value); }
    [[nodiscard]] auto as_value_list() const -> const std::vector<Value>& { return std::get<std::vector<Value>>(value); }

    [[nodiscard]] auto is_monostate() const -> bool { return std::holds_alternative<std::monostate>(value); }

    [[nodiscard]] auto type_name() const -> std::string_view
    {
        const auto visitor = Util::make_visitor(
          [](const std::monostate&) { return std::string_view { "unit" }; },
          [](const std::string_view&) { return std::string_view { "string" }; },
          [](const std::int64_t&) { return std::string_view { "int" }; },
          [](const double&) { return std::string_view { "decimal" }; },
          [](const std::vector<Value>&) { return std::string_view { "list" }; }
        );
        return std::visit(visitor, value);
    }

  private:
    ValueType value;
};

// Evaluates a workload script into `workload`. Values already present in `workload` are the starting point,
// a seed set before evaluation takes precedence over `seed :: n` in the script.
class [[nodiscard]] Interpreter final
{
  public:
    [[nodiscard]] static auto eval(const std::string_view source, Simulations::Workload& workload) -> bool;

  private:
    Interpreter(const std::string_view source, Simulations::Workload& workload, Ast ast);

    [[nodiscard]] auto evaluate_ast() -> std::optional<Value>;
    [[nodiscard]] auto evaluate_statement(const Statement& statement) -> std::optional<Value>;
    [[nodiscard]] auto evaluate_expression(const Expression& expression) -> std::optional<Value>;
    [[nodiscard]] auto evaluate_elements(const std::vector<ExpressionId>& elements) -> std::optional<Value>;
    [[nodiscard]] auto evaluate_for_expression(const For& four) -> std::optional<Value>;
    [[nodiscard]] auto evaluate_constant(const Constant& constant, const Span span) -> std::optional<Value>;
    [[nodiscard]] auto evaluate_range(const Range& range) const -> std::optional<std::pair<std::int64_t, std::int64_t>>;

    [[nodiscard]] auto builtin_handler(const Call& call, const Span span) -> std::optional<Value>;
    [[nodiscard]] auto spawn_process_builtin(const std::vector<Value>& arguments, const Span span)
      -> std::optional<Value>;
    [[nodiscard]] auto spawn_random_process_builtin(const std::vector<Value>& arguments, const Span span)
      -> std::optional<Value>;
    [[nodiscard]] auto depends_builtin(const std::vector<Value>& arguments, const Span span) -> std::optional<Value>;

    [[nodiscard]] auto expect_string(const Value& value, std::string_view what, const Span span) const
      -> std::optional<std::string_view>;
    [[nodiscard]] auto expect_integer(const Value& value, std::string_view what, const Span span) const
      -> std::optional<std::int64_t>;
    [[nodiscard]] auto expect_natural(const Value& value, std::string_view what, const Span span) const
      -> std::optional<std::size_t>;
    [[nodiscard]] auto expect_decimal(const Value& value, std::string_view what, const Span span) const
      -> std::optional<double>;
    [[nodiscard]] auto expect_string_list(const Value& value, std::string_view what, const Span span) const
      -> std::optional<std::vector<Os::Pid>>;

    template<typename... Args>
    auto report_error(const Span span, std::format_string<Args...> message, Args&&... args) const -> std::nullopt_t;

    template<typename... Args>
    static auto report_note(std::format_string<Args...> message, Args&&... args) -> std::nullopt_t;

    std::string_view       source;
    Simulations::Workload& workload;
    Ast                    ast;
    std::mt19937           generator;
    bool                   seed_from_caller = false;
};

// Renders `workload` as a script that evaluates back to the same processes and configuration.
// Fails for process ids a string literal cannot hold.
[[nodiscard]] auto dump_workload(const Simulations::Workload& workload) -> std::optional<std::string>;

} // namespace Interpreter
