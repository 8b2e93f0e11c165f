#include "Policy.hpp"

#include <algorithm>
#include <limits>
#include <print>
#include <ranges>

#include "Readiness.hpp"
#include "Util.hpp"

namespace Simulations
{

constexpr static auto MAX_LEVELS = 16UZ;

auto policy_kind_try_from_str(std::string_view str) -> std::optional<PolicyKind>
{
    static_assert(
      std::to_underlying(PolicyKind::Count) == 8,
      "[ERROR] Exhaustive handling of all enum variants for PolicyKind is required"
    );

    const auto lowered = Util::to_lower(Util::trim(str));
    if (lowered == "fcfs" || lowered == "first_come_first_served") { return PolicyKind::FirstComeFirstServed; }
    if (lowered == "sjf" || lowered == "sjf_np" || lowered == "shortest_job_first") {
        return PolicyKind::ShortestJobFirst;
    }
    if (lowered == "srtf" || lowered == "sjf_p" || lowered == "shortest_remaining_time_first") {
        return PolicyKind::ShortestRemainingTimeFirst;
    }
    if (lowered == "rr" || lowered == "round_robin") { return PolicyKind::RoundRobin; }
    if (lowered == "priority" || lowered == "pr_np" || lowered == "priority_non_preemptive") {
        return PolicyKind::PriorityNonPreemptive;
    }
    if (lowered == "priority_preemptive" || lowered == "pr_p") { return PolicyKind::PriorityPreemptive; }
    if (lowered == "mlfq" || lowered == "multilevel_feedback_queue") { return PolicyKind::MultilevelFeedbackQueue; }
    if (lowered == "intelligent") { return PolicyKind::Intelligent; }

    std::println(stderr, "[ERROR] Unknown schedule policy: {}", str);
    return std::nullopt;
}

auto policy_kind_name(PolicyKind kind) -> std::string_view
{
    static_assert(
      std::to_underlying(PolicyKind::Count) == 8,
      "[ERROR] Exhaustive handling of all enum variants for PolicyKind is required"
    );

    switch (kind) {
        case PolicyKind::FirstComeFirstServed: {
            return "First Come First Served";
        }
        case PolicyKind::ShortestJobFirst: {
            return "Shortest Job First";
        }
        case PolicyKind::ShortestRemainingTimeFirst: {
            return "Shortest Remaining Time First";
        }
        case PolicyKind::RoundRobin: {
            return "Round Robin";
        }
        case PolicyKind::PriorityNonPreemptive: {
            return "Priority";
        }
        case PolicyKind::PriorityPreemptive: {
            return "Priority (Preemptive)";
        }
        case PolicyKind::MultilevelFeedbackQueue: {
            return "Multilevel Feedback Queue";
        }
        case PolicyKind::Intelligent: {
            return "Intelligent";
        }
        default: {
            assert(false && "unreachable");
            return "unreachable";
        }
    }
}

auto policy_kind_short_name(PolicyKind kind) -> std::string_view
{
    switch (kind) {
        case PolicyKind::FirstComeFirstServed: {
            return "fcfs";
        }
        case PolicyKind::ShortestJobFirst: {
            return "sjf";
        }
        case PolicyKind::ShortestRemainingTimeFirst: {
            return "srtf";
        }
        case PolicyKind::RoundRobin: {
            return "rr";
        }
        case PolicyKind::PriorityNonPreemptive: {
            return "priority";
        }
        case PolicyKind::PriorityPreemptive: {
            return "priority_preemptive";
        }
        case PolicyKind::MultilevelFeedbackQueue: {
            return "mlfq";
        }
        case PolicyKind::Intelligent: {
            return "intelligent";
        }
        default: {
            assert(false && "unreachable");
            return "unreachable";
        }
    }
}

auto validate(const PolicyConfig& config, PolicyKind kind) -> std::expected<void, Os::Error>
{
    const auto configuration_error = [](std::string message) {
        return std::unexpected(Os::make_error(Os::ErrorKind::Configuration, std::move(message)));
    };

    const auto uses_quantum = kind == PolicyKind::RoundRobin || kind == PolicyKind::MultilevelFeedbackQueue
                              || kind == PolicyKind::Intelligent;
    if (uses_quantum && config.quantum <= 0) {
        return configuration_error(std::format("quantum must be a positive integer, got {}", config.quantum));
    }

    if (kind == PolicyKind::Intelligent) {
        if (config.waiting_weight < 0 || config.burst_weight < 0 || config.priority_weight < 0) {
            return configuration_error("intelligent policy weights must not be negative");
        }

        if (config.waiting_weight + config.burst_weight + config.priority_weight <= 0) {
            return configuration_error("at least one intelligent policy weight must be positive");
        }

        if (config.starvation_threshold <= 0) {
            return configuration_error(
              std::format("starvation threshold must be a positive integer, got {}", config.starvation_threshold)
            );
        }
    }

    if (kind == PolicyKind::MultilevelFeedbackQueue && (config.levels == 0 || config.levels > MAX_LEVELS)) {
        return configuration_error(std::format("levels must be between 1 and {}, got {}", MAX_LEVELS, config.levels));
    }

    // The lowest level runs for quantum << (levels - 1), which has to stay representable.
    if (kind == PolicyKind::MultilevelFeedbackQueue) {
        const auto max_quantum = std::numeric_limits<Os::Time>::max() >> (config.levels - 1);
        if (config.quantum > max_quantum) {
            return configuration_error(
              std::format("quantum must be at most {} with {} levels, got {}", max_quantum, config.levels, config.quantum)
            );
        }
    }

    return {};
}

// Smallest key wins, ties go to the smallest pid.
template<typename Key>
[[nodiscard]] static auto pick_best(const DecisionContext& ctx, Key&& key) -> std::size_t
{
    assert(!ctx.ready.empty() && "ready set must not be empty");

    const auto less = pid_less(ctx.registry);
    auto       best = ctx.ready.front();
    for (const auto candidate : ctx.ready | std::views::drop(1)) {
        const auto candidate_key = key(candidate);
        const auto best_key      = key(best);
        if (candidate_key < best_key || (candidate_key == best_key && less(candidate, best))) { best = candidate; }
    }

    return best;
}

// The running process keeps the CPU unless a ready process has a strictly better key.
template<typename Key>
[[nodiscard]] static auto pick_preemptive(const DecisionContext& ctx, Key&& key) -> std::size_t
{
    const auto best = pick_best(ctx, key);
    if (ctx.running && std::ranges::contains(ctx.ready, *ctx.running) && !(key(best) < key(*ctx.running))) {
        return *ctx.running;
    }

    return best;
}

[[nodiscard]] static auto priority_key(const DecisionContext& ctx, const std::size_t idx) -> std::int64_t
{
    const auto priority = ctx.registry.process(idx).priority;
    return ctx.config.priority_order == PriorityOrder::LowerIsBetter ? priority : -priority;
}

[[nodiscard]] static auto run_to_completion(const DecisionContext& ctx, const std::size_t idx) -> Decision
{
    return Decision::run(idx, ctx.registry.state(idx).remaining);
}

auto FirstComeFirstServed::decide(const DecisionContext& ctx) const -> Decision
{
    if (ctx.ready.empty()) { return Decision::idle(); }

    const auto chosen = pick_best(ctx, [&](const auto idx) { return ctx.registry.process(idx).arrival; });
    return run_to_completion(ctx, chosen);
}

auto ShortestJobFirst::decide(const DecisionContext& ctx) const -> Decision
{
    if (ctx.ready.empty()) { return Decision::idle(); }

    const auto chosen = pick_best(ctx, [&](const auto idx) { return ctx.registry.process(idx).burst; });
    return run_to_completion(ctx, chosen);
}

auto ShortestRemainingTimeFirst::decide(const DecisionContext& ctx) const -> Decision
{
    if (ctx.ready.empty()) { return Decision::idle(); }

    const auto chosen = pick_preemptive(ctx, [&](const auto idx) { return ctx.registry.state(idx).remaining; });
    return run_to_completion(ctx, chosen);
}

auto RoundRobin::decide(const DecisionContext& ctx) const -> Decision
{
    if (ctx.ready.empty()) { return Decision::idle(); }

    const auto head = ctx.ready.front();
    return Decision::run(head, std::min(ctx.config.quantum, ctx.registry.state(head).remaining));
}

auto PriorityNonPreemptive::decide(const DecisionContext& ctx) const -> Decision
{
    if (ctx.ready.empty()) { return Decision::idle(); }

    const auto chosen = pick_best(ctx, [&](const auto idx) { return priority_key(ctx, idx); });
    return run_to_completion(ctx, chosen);
}

auto PriorityPreemptive::decide(const DecisionContext& ctx) const -> Decision
{
    if (ctx.ready.empty()) { return Decision::idle(); }

    const auto chosen = pick_preemptive(ctx, [&](const auto idx) { return priority_key(ctx, idx); });
    return run_to_completion(ctx, chosen);
}

auto MultilevelFeedbackQueue::level_quantum(const PolicyConfig& config, const std::size_t level) -> Os::Time
{
    return config.quantum << level;
}

auto MultilevelFeedbackQueue::decide(const DecisionContext& ctx) const -> Decision
{
    if (ctx.ready.empty()) { return Decision::idle(); }

    // Queue order is FIFO, so the first process on the highest level is that level's head.
    const auto head = std::ranges::min(ctx.ready, {}, [&](const auto idx) { return ctx.state.level[idx]; });
    const auto quantum = level_quantum(ctx.config, ctx.state.level[head]);
    return Decision::run(head, std::min(quantum, ctx.registry.state(head).remaining));
}

void MultilevelFeedbackQueue::on_slice_end(
  EngineState&           state,
  const DecisionContext& ctx,
  const std::size_t      process,
  const Os::Time         ran
) const
{
    auto& level = state.level[process];
    if (ctx.registry.state(process).remaining > 0 && ran >= level_quantum(ctx.config, level)) {
        level = std::min(level + 1, ctx.config.levels - 1);
    }
}

auto Intelligent::waiting_time(const DecisionContext& ctx, const std::size_t process) -> Os::Time
{
    const auto since = ready_since(ctx.registry, process).value_or(ctx.time);
    const auto start = std::max(since, ctx.registry.state(process).last_ran_at.value_or(since));
    return std::max(ctx.time - start, Os::Time { 0 });
}

auto Intelligent::score(const DecisionContext& ctx, const std::size_t process) -> double
{
    const auto waited = waiting_time(ctx, process);
    if (waited >= ctx.config.starvation_threshold) { return STARVATION_BOOST + static_cast<double>(waited); }

    Os::Time     max_waiting   = 0;
    Os::Time     max_remaining = 1;
    std::int64_t min_priority  = ctx.registry.process(process).priority;
    std::int64_t max_priority  = min_priority;
    for (const auto idx : ctx.ready) {
        max_waiting   = std::max(max_waiting, waiting_time(ctx, idx));
        max_remaining = std::max(max_remaining, ctx.registry.state(idx).remaining);
        min_priority  = std::min(min_priority, ctx.registry.process(idx).priority);
        max_priority  = std::max(max_priority, ctx.registry.process(idx).priority);
    }

    const auto normalized_waiting =
      max_waiting > 0 ? static_cast<double>(waited) / static_cast<double>(max_waiting) : 0.0;
    const auto normalized_remaining =
      static_cast<double>(ctx.registry.state(process).remaining) / static_cast<double>(max_remaining);

    auto priority_goodness = 0.0;
    if (max_priority != min_priority) {
        const auto priority = ctx.registry.process(process).priority;
        const auto span     = static_cast<double>(max_priority - min_priority);
        priority_goodness   = ctx.config.priority_order == PriorityOrder::LowerIsBetter
                                ? static_cast<double>(max_priority - priority) / span
                                : static_cast<double>(priority - min_priority) / span;
    }

    return (ctx.config.waiting_weight * normalized_waiting) + (ctx.config.burst_weight * (1.0 - normalized_remaining))
           + (ctx.config.priority_weight * priority_goodness);
}

auto Intelligent::decide(const DecisionContext& ctx) const -> Decision
{
    if (ctx.ready.empty()) { return Decision::idle(); }

    // Negated so the highest score becomes the smallest key.
    const auto chosen = pick_best(ctx, [&](const auto idx) { return -score(ctx, idx); });
    return Decision::run(chosen, std::min(ctx.config.quantum, ctx.registry.state(chosen).remaining));
}

[[nodiscard]] static auto policy_from_kind(PolicyKind kind) -> PolicyVariant
{
    static_assert(
      std::variant_size_v<PolicyVariant> == std::to_underlying(PolicyKind::Count),
      "Every PolicyKind requires a PolicyVariant alternative"
    );

    switch (kind) {
        case PolicyKind::FirstComeFirstServed: {
            return FirstComeFirstServed {};
        }
        case PolicyKind::ShortestJobFirst: {
            return ShortestJobFirst {};
        }
        case PolicyKind::ShortestRemainingTimeFirst: {
            return ShortestRemainingTimeFirst {};
        }
        case PolicyKind::RoundRobin: {
            return RoundRobin {};
        }
        case PolicyKind::PriorityNonPreemptive: {
            return PriorityNonPreemptive {};
        }
        case PolicyKind::PriorityPreemptive: {
            return PriorityPreemptive {};
        }
        case PolicyKind::MultilevelFeedbackQueue: {
            return MultilevelFeedbackQueue {};
        }
        case PolicyKind::Intelligent: {
            return Intelligent {};
        }
        default: {
            assert(false && "unreachable");
            return FirstComeFirstServed {};
        }
    }
}

NamedPolicy::NamedPolicy(PolicyKind kind)
  : policy_kind { kind },
    policy { policy_from_kind(kind) }
{}

auto NamedPolicy::preemptive() const -> bool
{
    return std::visit([](const auto& alternative) { return std::decay_t<decltype(alternative)>::PREEMPTIVE; }, policy);
}

auto NamedPolicy::time_sliced() const -> bool
{
    return std::visit(
      [](const auto& alternative) { return std::decay_t<decltype(alternative)>::TIME_SLICED; }, policy
    );
}

auto NamedPolicy::decide(const DecisionContext& ctx) const -> Decision
{
    return std::visit([&](const auto& alternative) { return alternative.decide(ctx); }, policy);
}

void NamedPolicy::on_slice_end(
  EngineState&           state,
  const DecisionContext& ctx,
  const std::size_t      process,
  const Os::Time         ran
) const
{
    std::visit(
      [&](const auto& alternative) {
          if constexpr (requires { alternative.on_slice_end(state, ctx, process, ran); }) {
              alternative.on_slice_end(state, ctx, process, ran);
          }
      },
      policy
    );
}

} // namespace Simulations
