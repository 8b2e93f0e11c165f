#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

#include "Gantt.hpp"
#include "Metrics.hpp"
#include "Policy.hpp"
#include "os/Error.hpp"
#include "os/Registry.hpp"

namespace Simulations
{

enum class SimulationState : std::uint8_t
{
    NotStarted = 0,
    Running,
    Idle,
    Finished,
    Count,
};

[[nodiscard]] auto simulation_state_name(SimulationState state) -> std::string_view;

// Event-driven single CPU simulation over a registry it borrows for the whole run.
// Every step either dispatches one process or idles the CPU up to the next arrival, so a caller may stop
// between steps and still hold a consistent timeline covering [0, timer()].
class [[nodiscard]] Scheduler final
{
  public:
    // Validates the configuration and the dependency graph, then resets the run state of every process.
    [[nodiscard]] static auto create(Os::Registry& registry, PolicyKind kind, const PolicyConfig& config)
      -> std::expected<Scheduler, Os::Error>;

    ~Scheduler() = default;

    Scheduler(const Scheduler&)            = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    Scheduler(Scheduler&&) noexcept            = default;
    Scheduler& operator=(Scheduler&&) noexcept = default;

    [[nodiscard]] auto step() -> std::expected<void, Os::Error>;
    [[nodiscard]] auto run() -> std::expected<void, Os::Error>;

    [[nodiscard]] auto complete() const -> bool { return simulation_state == SimulationState::Finished; }
    [[nodiscard]] auto state() const -> SimulationState { return simulation_state; }
    [[nodiscard]] auto timer() const -> Os::Time { return time; }
    [[nodiscard]] auto segments() const -> const GanttChart& { return gantt; }
    [[nodiscard]] auto policy() const -> const NamedPolicy& { return named_policy; }

  private:
    Scheduler(Os::Registry& registry, PolicyKind kind, const PolicyConfig& config);

    void admit_ready();
    void record(std::optional<Os::Pid> pid, Os::Time start, Os::Time end);

    [[nodiscard]] auto context() const -> DecisionContext;

    Os::Registry* registry;
    NamedPolicy   named_policy;
    PolicyConfig  config;
    EngineState   engine;

    GanttChart                 gantt;
    Os::Time                   time    = 0;
    std::optional<std::size_t> running = std::nullopt;
    std::vector<bool>          admitted;

    SimulationState simulation_state = SimulationState::NotStarted;
};

struct [[nodiscard]] SimulationResult final
{
    PolicyKind    policy;
    GanttChart    segments;
    MetricsRecord metrics;
};

// Runs `kind` to completion on `registry`. The registry keeps the final run state for inspection.
[[nodiscard]] auto simulate(Os::Registry& registry, PolicyKind kind, const PolicyConfig& config = {})
  -> std::expected<SimulationResult, Os::Error>;

} // namespace Simulations

template<>
struct std::formatter<Simulations::SimulationState>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(Simulations::SimulationState state, auto& ctx) const
    {
        return std::format_to(ctx.out(), "{}", Simulations::simulation_state_name(state));
    }
};
