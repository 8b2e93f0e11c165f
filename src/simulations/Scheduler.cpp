#include "Scheduler.hpp"

#include <algorithm>
#include <cassert>
#include <tuple>

#include "Readiness.hpp"
#include "Util.hpp"

namespace Simulations
{

auto simulation_state_name(SimulationState state) -> std::string_view
{
    static_assert(
      std::to_underlying(SimulationState::Count) == 4,
      "[ERROR] Exhaustive handling of all enum variants for SimulationState is required"
    );

    switch (state) {
        case SimulationState::NotStarted: {
            return "Not started";
        }
        case SimulationState::Running: {
            return "Running";
        }
        case SimulationState::Idle: {
            return "Idle";
        }
        case SimulationState::Finished: {
            return "Finished";
        }
        default: {
            assert(false && "unreachable");
            return "unreachable";
        }
    }
}

Scheduler::Scheduler(Os::Registry& registry, PolicyKind kind, const PolicyConfig& config)
  : registry { &registry },
    named_policy { kind },
    config { config },
    engine { .queue = {}, .level = std::vector<std::size_t>(registry.size(), 0) },
    admitted(registry.size(), false)
{}

auto Scheduler::create(Os::Registry& registry, PolicyKind kind, const PolicyConfig& config)
  -> std::expected<Scheduler, Os::Error>
{
    TRY_EXPECTED(validate(config, kind));

    if (registry.empty()) {
        return std::unexpected(Os::make_error(Os::ErrorKind::EmptyInput, "cannot simulate an empty process registry"));
    }

    TRY_EXPECTED(validate_dependencies(registry));

    registry.reset_run_state();
    return Scheduler { registry, kind, config };
}

auto Scheduler::context() const -> DecisionContext
{
    return DecisionContext {
        .time     = time,
        .ready    = engine.queue,
        .registry = *registry,
        .running  = running,
        .config   = config,
        .state    = engine,
    };
}

// Same instant arrivals join the queue by (ready time, arrival, pid).
void Scheduler::admit_ready()
{
    std::vector<std::size_t> newly_ready;
    for (std::size_t idx = 0; idx < registry->size(); ++idx) {
        if (!admitted[idx] && is_ready(*registry, idx, time)) { newly_ready.push_back(idx); }
    }

    const auto less = pid_less(*registry);
    std::ranges::sort(newly_ready, [&](const auto lhs, const auto rhs) {
        const auto lhs_key = std::tuple { ready_since(*registry, lhs), registry->process(lhs).arrival };
        const auto rhs_key = std::tuple { ready_since(*registry, rhs), registry->process(rhs).arrival };
        if (lhs_key != rhs_key) { return lhs_key < rhs_key; }
        return less(lhs, rhs);
    });

    for (const auto idx : newly_ready) {
        admitted[idx] = true;
        engine.queue.push_back(idx);
    }
}

void Scheduler::record(std::optional<Os::Pid> pid, const Os::Time start, const Os::Time end)
{
    const auto mergeable = pid.has_value() ? !named_policy.time_sliced() : true;
    if (mergeable && !gantt.empty() && gantt.back().pid == pid && gantt.back().end == start) {
        gantt.back().end = end;
        return;
    }

    gantt.push_back(GanttSegment { .pid = std::move(pid), .start = start, .end = end });
}

auto Scheduler::step() -> std::expected<void, Os::Error>
{
    if (registry->size() != admitted.size()) {
        return std::unexpected(Os::make_error(
          Os::ErrorKind::Configuration, "process registry changed after the simulation was created", std::nullopt, time
        ));
    }

    if (complete()) { return {}; }

    admit_ready();

    const auto decision = named_policy.decide(context());
    if (decision.is_idle()) {
        const auto next = next_arrival(*registry, time);
        if (!next) {
            std::optional<Os::Pid> blocked = std::nullopt;
            for (std::size_t idx = 0; idx < registry->size(); ++idx) {
                if (registry->state(idx).finished()) { continue; }
                if (!blocked || Util::natural_less(registry->process(idx).pid, *blocked)) {
                    blocked = registry->process(idx).pid;
                }
            }

            return std::unexpected(Os::make_error(
              Os::ErrorKind::Deadlock, "unfinished processes can never become ready", std::move(blocked), time
            ));
        }

        record(std::nullopt, time, *next);
        time             = *next;
        running          = std::nullopt;
        simulation_state = SimulationState::Idle;
        return {};
    }

    const auto idx      = *decision.process;
    auto       duration = decision.duration;
    assert(duration > 0 && "policies must dispatch for a positive duration");

    if (named_policy.preemptive()) {
        if (const auto arrival = next_arrival(*registry, time); arrival && *arrival < time + duration) {
            duration = *arrival - time;
        }
    }

    const auto start = time;
    const auto end   = time + duration;

    auto& state = registry->state(idx);
    if (!state.start_time) { state.start_time = start; }
    state.remaining   -= duration;
    state.last_ran_at  = end;
    if (state.remaining == 0) { state.finish_time = end; }

    record(registry->process(idx).pid, start, end);
    time = end;

    std::erase(engine.queue, idx);
    admit_ready();
    if (!state.finished()) { engine.queue.push_back(idx); }

    named_policy.on_slice_end(engine, context(), idx, duration);

    running          = state.finished() ? std::nullopt : std::optional { idx };
    simulation_state = registry->all_finished() ? SimulationState::Finished : SimulationState::Running;
    return {};
}

auto Scheduler::run() -> std::expected<void, Os::Error>
{
    while (!complete()) { TRY_EXPECTED(step()); }

    return {};
}

auto simulate(Os::Registry& registry, PolicyKind kind, const PolicyConfig& config)
  -> std::expected<SimulationResult, Os::Error>
{
    auto scheduler = Scheduler::create(registry, kind, config);
    if (!scheduler) { return std::unexpected(scheduler.error()); }

    TRY_EXPECTED(scheduler->run());

    auto metrics = compute_metrics(registry, scheduler->segments());
    if (!metrics) { return std::unexpected(metrics.error()); }

    return SimulationResult {
        .policy   = kind,
        .segments = scheduler->segments(),
        .metrics  = *std::move(metrics),
    };
}

} // namespace Simulations
