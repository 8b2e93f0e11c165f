#pragma once

#include <array>
#include <cassert>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "os/Error.hpp"
#include "os/Registry.hpp"

namespace Simulations
{

enum class PolicyKind : std::uint8_t
{
    FirstComeFirstServed = 0,
    ShortestJobFirst,
    ShortestRemainingTimeFirst,
    RoundRobin,
    PriorityNonPreemptive,
    PriorityPreemptive,
    MultilevelFeedbackQueue,
    Intelligent,
    Count,
};

constexpr static auto ALL_POLICIES = std::array {
    PolicyKind::FirstComeFirstServed,  PolicyKind::ShortestJobFirst,   PolicyKind::ShortestRemainingTimeFirst,
    PolicyKind::RoundRobin,            PolicyKind::PriorityNonPreemptive, PolicyKind::PriorityPreemptive,
    PolicyKind::MultilevelFeedbackQueue, PolicyKind::Intelligent,
};

[[nodiscard]] auto policy_kind_try_from_str(std::string_view str) -> std::optional<PolicyKind>;
[[nodiscard]] auto policy_kind_name(PolicyKind kind) -> std::string_view;
[[nodiscard]] auto policy_kind_short_name(PolicyKind kind) -> std::string_view;

enum class PriorityOrder : std::uint8_t
{
    LowerIsBetter = 0,
    HigherIsBetter,
};

struct [[nodiscard]] PolicyConfig final
{
    Os::Time      quantum        = 2;
    PriorityOrder priority_order = PriorityOrder::LowerIsBetter;

    double   waiting_weight       = 0.4;
    double   burst_weight         = 0.4;
    double   priority_weight      = 0.2;
    Os::Time starvation_threshold = 10;

    std::size_t levels = 3;
};

[[nodiscard]] auto validate(const PolicyConfig& config, PolicyKind kind) -> std::expected<void, Os::Error>;

// Engine bookkeeping shared by the queue based policies, owned by the simulation loop.
struct [[nodiscard]] EngineState final
{
    // Ready processes in the order they became ready.
    std::vector<std::size_t> queue;
    // MLFQ level of every process, indexed like the registry.
    std::vector<std::size_t> level;
};

struct [[nodiscard]] DecisionContext final
{
    Os::Time                     time;
    std::span<const std::size_t> ready;
    const Os::Registry&          registry;
    std::optional<std::size_t>   running;
    const PolicyConfig&          config;
    const EngineState&           state;
};

struct [[nodiscard]] Decision final
{
    [[nodiscard]] static auto run(const std::size_t process, const Os::Time duration) -> Decision
    {
        return Decision { .process = process, .duration = duration };
    }

    [[nodiscard]] static auto idle() -> Decision { return Decision {}; }

    [[nodiscard]] auto is_idle() const -> bool { return !process.has_value(); }

    std::optional<std::size_t> process  = std::nullopt;
    Os::Time                   duration = 0;
};

struct [[nodiscard]] FirstComeFirstServed
{
    constexpr static auto KIND        = PolicyKind::FirstComeFirstServed;
    constexpr static auto PREEMPTIVE  = false;
    constexpr static auto TIME_SLICED = false;

    [[nodiscard]] auto decide(const DecisionContext& ctx) const -> Decision;
};

struct [[nodiscard]] ShortestJobFirst
{
    constexpr static auto KIND        = PolicyKind::ShortestJobFirst;
    constexpr static auto PREEMPTIVE  = false;
    constexpr static auto TIME_SLICED = false;

    [[nodiscard]] auto decide(const DecisionContext& ctx) const -> Decision;
};

struct [[nodiscard]] ShortestRemainingTimeFirst
{
    constexpr static auto KIND        = PolicyKind::ShortestRemainingTimeFirst;
    constexpr static auto PREEMPTIVE  = true;
    constexpr static auto TIME_SLICED = false;

    [[nodiscard]] auto decide(const DecisionContext& ctx) const -> Decision;
};

struct [[nodiscard]] RoundRobin
{
    constexpr static auto KIND        = PolicyKind::RoundRobin;
    constexpr static auto PREEMPTIVE  = false;
    constexpr static auto TIME_SLICED = true;

    [[nodiscard]] auto decide(const DecisionContext& ctx) const -> Decision;
};

// Priority direction comes from PolicyConfig::priority_order.
struct [[nodiscard]] PriorityNonPreemptive
{
    constexpr static auto KIND        = PolicyKind::PriorityNonPreemptive;
    constexpr static auto PREEMPTIVE  = false;
    constexpr static auto TIME_SLICED = false;

    [[nodiscard]] auto decide(const DecisionContext& ctx) const -> Decision;
};

struct [[nodiscard]] PriorityPreemptive
{
    constexpr static auto KIND        = PolicyKind::PriorityPreemptive;
    constexpr static auto PREEMPTIVE  = true;
    constexpr static auto TIME_SLICED = false;

    [[nodiscard]] auto decide(const DecisionContext& ctx) const -> Decision;
};

struct [[nodiscard]] MultilevelFeedbackQueue
{
    constexpr static auto KIND        = PolicyKind::MultilevelFeedbackQueue;
    constexpr static auto PREEMPTIVE  = false;
    constexpr static auto TIME_SLICED = true;

    [[nodiscard]] auto decide(const DecisionContext& ctx) const -> Decision;

    // Demotes a process that used its whole slice without finishing.
    void on_slice_end(EngineState& state, const DecisionContext& ctx, std::size_t process, Os::Time ran) const;

    [[nodiscard]] static auto level_quantum(const PolicyConfig& config, std::size_t level) -> Os::Time;
};

// Scores every ready process on normalized waiting time, remaining burst and priority.
// Processes that waited at least `starvation_threshold` outrank everything else, longest wait first.
struct [[nodiscard]] Intelligent
{
    constexpr static auto KIND        = PolicyKind::Intelligent;
    constexpr static auto PREEMPTIVE  = true;
    constexpr static auto TIME_SLICED = true;

    constexpr static auto STARVATION_BOOST = 1.0e6;

    [[nodiscard]] auto decide(const DecisionContext& ctx) const -> Decision;

    [[nodiscard]] static auto waiting_time(const DecisionContext& ctx, std::size_t process) -> Os::Time;
    [[nodiscard]] static auto score(const DecisionContext& ctx, std::size_t process) -> double;
};

using PolicyVariant = std::variant<
  FirstComeFirstServed,
  ShortestJobFirst,
  ShortestRemainingTimeFirst,
  RoundRobin,
  PriorityNonPreemptive,
  PriorityPreemptive,
  MultilevelFeedbackQueue,
  Intelligent>;

class [[nodiscard]] NamedPolicy final
{
  public:
    explicit NamedPolicy(PolicyKind kind);

    [[nodiscard]] auto kind() const -> PolicyKind { return policy_kind; }
    [[nodiscard]] auto name() const -> std::string_view { return policy_kind_name(policy_kind); }
    [[nodiscard]] auto preemptive() const -> bool;
    [[nodiscard]] auto time_sliced() const -> bool;

    [[nodiscard]] auto decide(const DecisionContext& ctx) const -> Decision;
    void on_slice_end(EngineState& state, const DecisionContext& ctx, std::size_t process, Os::Time ran) const;

  private:
    PolicyKind    policy_kind;
    PolicyVariant policy;
};

} // namespace Simulations

template<>
struct std::formatter<Simulations::PolicyKind>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(Simulations::PolicyKind kind, auto& ctx) const
    {
        return std::format_to(ctx.out(), "{}", Simulations::policy_kind_name(kind));
    }
};
