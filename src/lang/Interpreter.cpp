#include "Interpreter.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <print>
#include <ranges>
#include <sstream>

#include "Lexer.hpp"
#include "Parser.hpp"

namespace Interpreter
{

constexpr static auto BUILTINS = std::array {
    std::string_view { "spawn_process" },
    std::string_view { "spawn_random_process" },
    std::string_view { "depends" },
};

constexpr static auto CONSTANTS = std::array {
    std::string_view { "policy" },           std::string_view { "quantum" },
    std::string_view { "priority_order" },   std::string_view { "waiting_weight" },
    std::string_view { "burst_weight" },     std::string_view { "priority_weight" },
    std::string_view { "starvation_threshold" }, std::string_view { "levels" },
    std::string_view { "max_arrival_time" }, std::string_view { "max_burst_time" },
    std::string_view { "max_priority" },     std::string_view { "seed" },
};

[[nodiscard]] static auto join(const auto& names) -> std::string
{
    std::string result;
    for (const auto& name : names) {
        if (!result.empty()) { result += ", "; }
        result += name;
    }
    return result;
}

auto Interpreter::eval(const std::string_view source, Simulations::Workload& workload) -> bool
{
    const auto tokens = Lexer::lex(source);
    if (!tokens) { return false; }

#ifdef DEBUG
    std::println("- Tokens -");
    for (const auto& [idx, token] : std::views::zip(std::views::iota(0), *tokens)) {
        std::println("#{}: {}", idx, token);
    }
#endif

    auto ast = Parser::parse(source, *tokens);
    if (!ast) { return false; }

    Interpreter interpreter(source, workload, *std::move(ast));
    return interpreter.evaluate_ast().has_value();
}

Interpreter::Interpreter(const std::string_view source, Simulations::Workload& workload, Ast ast)
  : source { source },
    workload { workload },
    ast { std::move(ast) },
    generator { workload.seed.value_or(std::random_device {}()) },
    seed_from_caller { workload.seed.has_value() }
{}

template<typename... Args>
auto Interpreter::report_error(const Span span, std::format_string<Args...> message, Args&&... args) const
  -> std::nullopt_t
{
    std::println(
      stderr,
      "[ERROR] (interpreter) {}: {}",
      span.location(source),
      std::format(message, std::forward<Args>(args)...)
    );
    return std::nullopt;
}

template<typename... Args>
auto Interpreter::report_note(std::format_string<Args...> message, Args&&... args) -> std::nullopt_t
{
    std::println(stderr, "[NOTE] (interpreter) {}", std::format(message, std::forward<Args>(args)...));
    return std::nullopt;
}

auto Interpreter::evaluate_ast() -> std::optional<Value>
{
    for (const auto& statement : ast.statements) { (void)TRY(evaluate_statement(statement)); }

    return Value();
}

auto Interpreter::evaluate_statement(const Statement& statement) -> std::optional<Value>
{
    const auto expression_visitor = [this](const ExpressionId id) -> std::optional<Value> {
        return evaluate_expression(ast.expression_by_id(id));
    };

    return std::visit(Util::make_visitor(expression_visitor), statement.kind);
}

auto Interpreter::evaluate_elements(const std::vector<ExpressionId>& elements) -> std::optional<Value>
{
    std::vector<Value> result;
    result.reserve(elements.size());
    for (const auto id : elements) { result.push_back(TRY(evaluate_expression(ast.expression_by_id(id)))); }

    return Value(std::move(result));
}

auto Interpreter::evaluate_expression(const Expression& expression) -> std::optional<Value>
{
    static_assert(
      std::variant_size_v<ExpressionKind> == 9,
      "[ERROR] Exhaustive handling of all variants for ExpressionKind is required"
    );

    const auto span = expression.span;

    const auto call_expression_visitor = [&](const Call& call) -> std::optional<Value> {
        return builtin_handler(call, span);
    };

    const auto string_literal_visitor = [](const StringLiteral& string_literal) -> std::optional<Value> {
        return Value(string_literal.literal.lexeme);
    };

    const auto number_visitor = [&](const Number& number) -> std::optional<Value> {
        const auto lexeme = number.number.lexeme;
        if (number.number.kind == TokenKind::Decimal) {
            const auto decimal = Util::parse_double(lexeme);
            if (!decimal) { return report_error(span, "invalid decimal `{}`", lexeme); }
            return Value(*decimal);
        }

        const auto integer = Util::parse_integer(lexeme);
        if (!integer) { return report_error(span, "integer `{}` is out of range", lexeme); }
        return Value(*integer);
    };

    const auto list_visitor  = [&](const List& list) { return evaluate_elements(list.elements); };
    const auto tuple_visitor = [&](const Tuple& tuple) { return evaluate_elements(tuple.elements); };

    const auto variable_visitor = [](const Variable& variable) -> std::optional<Value> {
        return Value(variable.name.lexeme);
    };

    const auto constant_visitor = [&](const Constant& constant) { return evaluate_constant(constant, span); };

    const auto range_visitor = [&](const Range& range) -> std::optional<Value> {
        const auto [start, end] = TRY(evaluate_range(range));

        std::vector<Value> result;
        for (auto i = start; i < end; ++i) { result.emplace_back(i); }
        return Value(std::move(result));
    };

    const auto for_visitor = [&](const For& four) { return evaluate_for_expression(four); };

    const auto visitor = Util::make_visitor(
      call_expression_visitor,
      string_literal_visitor,
      number_visitor,
      list_visitor,
      tuple_visitor,
      variable_visitor,
      constant_visitor,
      range_visitor,
      for_visitor
    );

    return std::visit(visitor, expression.kind);
}

auto Interpreter::evaluate_range(const Range& range) const -> std::optional<std::pair<std::int64_t, std::int64_t>>
{
    const auto start = Util::parse_integer(range.start.lexeme);
    const auto end   = Util::parse_integer(range.end.lexeme);
    if (!start || !end) {
        return report_error(Span::join(range.start.span, range.end.span), "range bounds are out of range");
    }

    return std::pair { *start, *end };
}

auto Interpreter::evaluate_for_expression(const For& four) -> std::optional<Value>
{
    const auto  range_expression = ast.expression_by_id(four.range);
    const auto* range            = std::get_if<Range>(&range_expression.kind);
    if (range == nullptr) { return report_error(range_expression.span, "expected a range after `for`"); }

    const auto [start, end] = TRY(evaluate_range(*range));
    for (auto i = start; i < end; ++i) {
        for (const auto id : four.body) { (void)TRY(evaluate_expression(ast.expression_by_id(id))); }
    }

    return Value();
}

auto Interpreter::evaluate_constant(const Constant& constant, const Span span) -> std::optional<Value>
{
    const auto name  = constant.name.lexeme;
    const auto value = TRY(evaluate_expression(ast.expression_by_id(constant.value)));

    auto& config = workload.config;
    if (name == "policy") {
        const auto policy_name = TRY(expect_string(value, "policy", span));
        const auto kind        = Simulations::policy_kind_try_from_str(policy_name);
        if (!kind) {
            std::vector<std::string_view> names;
            for (const auto policy : Simulations::ALL_POLICIES) {
                names.push_back(Simulations::policy_kind_short_name(policy));
            }
            return report_note("available policies are: {}", join(names));
        }
        workload.policy = *kind;
    } else if (name == "quantum") {
        config.quantum = TRY(expect_integer(value, "quantum", span));
    } else if (name == "priority_order") {
        const auto order = TRY(expect_string(value, "priority_order", span));
        if (order == "lower") {
            config.priority_order = Simulations::PriorityOrder::LowerIsBetter;
        } else if (order == "higher") {
            config.priority_order = Simulations::PriorityOrder::HigherIsBetter;
        } else {
            report_error(span, "invalid priority order `{}`", order);
            return report_note("expected `lower` or `higher`");
        }
    } else if (name == "waiting_weight") {
        config.waiting_weight = TRY(expect_decimal(value, "waiting_weight", span));
    } else if (name == "burst_weight") {
        config.burst_weight = TRY(expect_decimal(value, "burst_weight", span));
    } else if (name == "priority_weight") {
        config.priority_weight = TRY(expect_decimal(value, "priority_weight", span));
    } else if (name == "starvation_threshold") {
        config.starvation_threshold = TRY(expect_integer(value, "starvation_threshold", span));
    } else if (name == "levels") {
        config.levels = TRY(expect_natural(value, "levels", span));
    } else if (name == "max_arrival_time") {
        workload.limits.max_arrival_time = TRY(expect_natural(value, "max_arrival_time", span));
    } else if (name == "max_burst_time") {
        workload.limits.max_burst_time = TRY(expect_natural(value, "max_burst_time", span));
        if (workload.limits.max_burst_time == 0) { return report_error(span, "max_burst_time must be at least 1"); }
    } else if (name == "max_priority") {
        workload.limits.max_priority = TRY(expect_natural(value, "max_priority", span));
    } else if (name == "seed") {
        const auto seed = TRY(expect_natural(value, "seed", span));
        if (seed > std::numeric_limits<std::uint32_t>::max()) {
            return report_error(span, "seed must fit in 32 bits, got {}", seed);
        }

        if (seed_from_caller) {
            report_note("seed {} from the script is overridden by seed {}", seed, *workload.seed);
        } else {
            workload.seed = static_cast<std::uint32_t>(seed);
            generator.seed(*workload.seed);
        }
    } else {
        report_error(span, "invalid constant for current simulation: {}", name);
        return report_note("available constants are: {}", join(CONSTANTS));
    }

    return Value();
}

auto Interpreter::builtin_handler(const Call& call, const Span span) -> std::optional<Value>
{
    const auto name = call.identifier.lexeme;
    if (!std::ranges::contains(BUILTINS, name)) {
        report_error(span, "call to unknown function `{}`", name);
        return report_note("available builtins are: {}", join(BUILTINS));
    }

    const auto arguments = TRY(evaluate_elements(call.arguments));

    if (name == "spawn_process") { return spawn_process_builtin(arguments.as_value_list(), span); }
    if (name == "spawn_random_process") { return spawn_random_process_builtin(arguments.as_value_list(), span); }
    if (name == "depends") { return depends_builtin(arguments.as_value_list(), span); }

    assert(false && "unreachable");
    return std::nullopt;
}

auto Interpreter::spawn_process_builtin(const std::vector<Value>& arguments, const Span span) -> std::optional<Value>
{
    constexpr static auto NAME = "spawn_process";
    if (arguments.size() != 4 && arguments.size() != 5) {
        report_error(span, "builtin `{}` expects 4 or 5 arguments, {} were provided", NAME, arguments.size());
        return report_note("spawn_process(id: string, arrival: int, burst: int, priority: int [, deps: List<string>])");
    }

    const auto pid      = TRY(expect_string(arguments[0], "argument #0 (id)", span));
    const auto arrival  = TRY(expect_integer(arguments[1], "argument #1 (arrival)", span));
    const auto burst    = TRY(expect_integer(arguments[2], "argument #2 (burst)", span));
    const auto priority = TRY(expect_integer(arguments[3], "argument #3 (priority)", span));

    auto process = Os::Process {
        .pid          = Os::Pid { pid },
        .arrival      = arrival,
        .burst        = burst,
        .priority     = priority,
        .dependencies = {},
    };

    if (arguments.size() == 5) {
        process.dependencies = TRY(expect_string_list(arguments[4], "argument #4 (deps)", span));
    }

    if (const auto added = workload.registry.add(std::move(process)); !added) {
        return report_error(span, "{}", added.error());
    }

    return Value();
}

auto Interpreter::spawn_random_process_builtin(const std::vector<Value>& arguments, const Span span)
  -> std::optional<Value>
{
    if (!arguments.empty()) {
        return report_error(
          span, "builtin `spawn_random_process` expects no arguments, {} were provided", arguments.size()
        );
    }

    std::size_t n = 1;
    while (workload.registry.contains(std::format("P{}", n))) { ++n; }

    const auto& limits  = workload.limits;
    auto        process = Os::Process {
               .pid      = std::format("P{}", n),
               .arrival  = static_cast<Os::Time>(Util::random_natural(generator, 0, limits.max_arrival_time)),
               .burst    = static_cast<Os::Time>(Util::random_natural(generator, 1, limits.max_burst_time)),
               .priority = static_cast<std::int64_t>(Util::random_natural(generator, 0, limits.max_priority)),
               .dependencies = {},
    };

    if (const auto added = workload.registry.add(std::move(process)); !added) {
        return report_error(span, "{}", added.error());
    }

    return Value();
}

auto Interpreter::depends_builtin(const std::vector<Value>& arguments, const Span span) -> std::optional<Value>
{
    if (arguments.size() != 2) {
        report_error(span, "builtin `depends` expects 2 arguments, {} were provided", arguments.size());
        return report_note("depends(id: string, deps: List<string>)");
    }

    const auto pid          = Os::Pid { TRY(expect_string(arguments[0], "argument #0 (id)", span)) };
    const auto dependencies = TRY(expect_string_list(arguments[1], "argument #1 (deps)", span));

    if (const auto added = workload.registry.add_dependencies(pid, dependencies); !added) {
        return report_error(span, "{}", added.error());
    }

    return Value();
}

auto Interpreter::expect_string(const Value& value, std::string_view what, const Span span) const
  -> std::optional<std::string_view>
{
    if (!value.is_string()) {
        return report_error(span, "mismatched type for {}: expected `string`, got `{}`", what, value.type_name());
    }

    return value.as_string();
}

auto Interpreter::expect_integer(const Value& value, std::string_view what, const Span span) const
  -> std::optional<std::int64_t>
{
    if (!value.is_integer()) {
        return report_error(span, "mismatched type for {}: expected `int`, got `{}`", what, value.type_name());
    }

    return value.as_integer();
}

auto Interpreter::expect_natural(const Value& value, std::string_view what, const Span span) const
  -> std::optional<std::size_t>
{
    const auto integer = TRY(expect_integer(value, what, span));
    if (integer < 0) { return report_error(span, "{} must not be negative, got {}", what, integer); }

    return static_cast<std::size_t>(integer);
}

auto Interpreter::expect_decimal(const Value& value, std::string_view what, const Span span) const
  -> std::optional<double>
{
    if (!value.is_decimal()) {
        return report_error(span, "mismatched type for {}: expected `decimal`, got `{}`", what, value.type_name());
    }

    return value.as_decimal();
}

auto Interpreter::expect_string_list(const Value& value, std::string_view what, const Span span) const
  -> std::optional<std::vector<Os::Pid>>
{
    if (!value.is_value_list()) {
        return report_error(
          span, "mismatched type for {}: expected `List<string>`, got `{}`", what, value.type_name()
        );
    }

    std::vector<Os::Pid> result;
    for (const auto& element : value.as_value_list()) {
        result.emplace_back(TRY(expect_string(element, what, span)));
    }

    return result;
}

[[nodiscard]] static auto format_decimal(const double value) -> std::string
{
    auto result = std::format("{}", value);
    if (result.find_first_of("eEn") != std::string::npos) { result = std::format("{:.12f}", value); }
    if (result.find('.') == std::string::npos) { result += ".0"; }

    return result;
}

[[nodiscard]] static auto is_representable(const Os::Pid& pid) -> bool
{
    return std::ranges::none_of(pid, [](const char c) { return c == '"' || c == '\n'; });
}

[[nodiscard]] static auto quoted_list(const std::vector<Os::Pid>& pids) -> std::string
{
    std::string result = "[";
    for (const auto& [idx, pid] : std::views::zip(std::views::iota(0UZ), pids)) {
        if (idx != 0) { result += ", "; }
        result += std::format("\"{}\"", pid);
    }
    return result + "]";
}

auto dump_workload(const Simulations::Workload& workload) -> std::optional<std::string>
{
    const auto& config = workload.config;
    const auto& limits = workload.limits;

    std::stringstream ss;
    ss << "# workload\n";
    ss << std::format("policy :: {}\n", Simulations::policy_kind_short_name(workload.policy));
    ss << std::format("quantum :: {}\n", config.quantum);
    ss << std::format(
      "priority_order :: {}\n",
      config.priority_order == Simulations::PriorityOrder::LowerIsBetter ? "lower" : "higher"
    );
    ss << std::format("waiting_weight :: {}\n", format_decimal(config.waiting_weight));
    ss << std::format("burst_weight :: {}\n", format_decimal(config.burst_weight));
    ss << std::format("priority_weight :: {}\n", format_decimal(config.priority_weight));
    ss << std::format("starvation_threshold :: {}\n", config.starvation_threshold);
    ss << std::format("levels :: {}\n", config.levels);
    ss << std::format("max_arrival_time :: {}\n", limits.max_arrival_time);
    ss << std::format("max_burst_time :: {}\n", limits.max_burst_time);
    ss << std::format("max_priority :: {}\n", limits.max_priority);
    if (workload.seed) { ss << std::format("seed :: {}\n", *workload.seed); }

    ss << '\n';
    for (const auto& entry : workload.registry.all()) {
        const auto& process = entry.process;
        const auto representable =
          is_representable(process.pid) && std::ranges::all_of(process.dependencies, is_representable);
        if (!representable) {
            std::println(stderr, "[ERROR] (writer) process id `{}` cannot be written as a string literal", process.pid);
            return std::nullopt;
        }

        ss << std::format(
          "spawn_process(\"{}\", {}, {}, {}", process.pid, process.arrival, process.burst, process.priority
        );
        if (!process.dependencies.empty()) { ss << ", " << quoted_list(process.dependencies); }
        ss << ")\n";
    }

    return ss.str();
}

} // namespace Interpreter
