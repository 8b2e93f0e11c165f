#include <gtest/gtest.h>

#include <algorithm>
#include <format>
#include <map>

#include "Fixtures.hpp"
#include "simulations/Readiness.hpp"
#include "simulations/Scheduler.hpp"

using Fixtures::process;
using Fixtures::timeline;
using Simulations::PolicyKind;

using Timeline = std::vector<std::string>;

[[nodiscard]] static auto run(Os::Registry& registry, PolicyKind kind, const Simulations::PolicyConfig& config = {})
  -> Simulations::SimulationResult
{
    auto result = Simulations::simulate(registry, kind, config);
    EXPECT_TRUE(result.has_value()) << (result ? "" : result.error().message);
    return result.value_or(Simulations::SimulationResult { .policy = kind, .segments = {}, .metrics = {} });
}

TEST(Scheduler, FirstComeFirstServed)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 5), process("P2", 1, 3), process("P3", 2, 1) });

    const auto result = run(registry, PolicyKind::FirstComeFirstServed);
    EXPECT_EQ(timeline(result.segments), (Timeline { "P1:0-5", "P2:5-8", "P3:8-9" }));
    EXPECT_NEAR(result.metrics.average_waiting_time, 10.0 / 3.0, 1e-9);
}

TEST(Scheduler, ShortestJobFirstDoesNotPreempt)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 6), process("P2", 1, 4), process("P3", 2, 2) });

    const auto result = run(registry, PolicyKind::ShortestJobFirst);
    EXPECT_EQ(timeline(result.segments), (Timeline { "P1:0-6", "P3:6-8", "P2:8-12" }));
}

TEST(Scheduler, ShortestRemainingTimeFirstPreemptsOnArrival)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 5), process("P2", 1, 3), process("P3", 2, 1) });

    const auto result = run(registry, PolicyKind::ShortestRemainingTimeFirst);
    EXPECT_EQ(timeline(result.segments), (Timeline { "P1:0-1", "P2:1-2", "P3:2-3", "P2:3-5", "P1:5-9" }));
    EXPECT_NEAR(result.metrics.average_waiting_time, 5.0 / 3.0, 1e-9);
}

TEST(Scheduler, RoundRobinRequeuesBehindArrivals)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 5), process("P2", 1, 3) });

    const auto result = run(registry, PolicyKind::RoundRobin, { .quantum = 2 });
    EXPECT_EQ(timeline(result.segments), (Timeline { "P1:0-2", "P2:2-4", "P1:4-6", "P2:6-7", "P1:7-8" }));
}

TEST(Scheduler, RoundRobinKeepsSlicesSeparate)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 5) });

    const auto result = run(registry, PolicyKind::RoundRobin, { .quantum = 2 });
    EXPECT_EQ(timeline(result.segments), (Timeline { "P1:0-2", "P1:2-4", "P1:4-5" }));
}

TEST(Scheduler, PriorityNonPreemptive)
{
    auto registry =
      Fixtures::registry_of({ process("P1", 0, 4, 3), process("P2", 1, 2, 1), process("P3", 2, 1, 2) });

    const auto result = run(registry, PolicyKind::PriorityNonPreemptive);
    EXPECT_EQ(timeline(result.segments), (Timeline { "P1:0-4", "P2:4-6", "P3:6-7" }));
}

TEST(Scheduler, PriorityPreemptiveMergesContinuedRuns)
{
    auto registry =
      Fixtures::registry_of({ process("P1", 0, 4, 3), process("P2", 1, 2, 1), process("P3", 2, 1, 2) });

    const auto result = run(registry, PolicyKind::PriorityPreemptive);
    EXPECT_EQ(timeline(result.segments), (Timeline { "P1:0-1", "P2:1-3", "P3:3-4", "P1:4-7" }));
}

TEST(Scheduler, MultilevelFeedbackQueueDemotesFullSlices)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 7) });

    const auto result = run(registry, PolicyKind::MultilevelFeedbackQueue, { .quantum = 2, .levels = 3 });
    EXPECT_EQ(timeline(result.segments), (Timeline { "P1:0-2", "P1:2-6", "P1:6-7" }));
}

TEST(Scheduler, MultilevelFeedbackQueueFavoursHigherLevels)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 5), process("P2", 0, 2) });

    const auto result = run(registry, PolicyKind::MultilevelFeedbackQueue, { .quantum = 2 });
    EXPECT_EQ(timeline(result.segments), (Timeline { "P1:0-2", "P2:2-4", "P1:4-7" }));
}

TEST(Scheduler, IdlesUntilNextArrival)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 2), process("P2", 5, 1) });

    const auto result = run(registry, PolicyKind::FirstComeFirstServed);
    EXPECT_EQ(timeline(result.segments), (Timeline { "P1:0-2", "idle:2-5", "P2:5-6" }));
}

TEST(Scheduler, IdlesBeforeFirstArrival)
{
    auto registry = Fixtures::registry_of({ process("P1", 3, 2) });

    const auto result = run(registry, PolicyKind::ShortestRemainingTimeFirst);
    EXPECT_EQ(timeline(result.segments), (Timeline { "idle:0-3", "P1:3-5" }));
}

TEST(Scheduler, SameArrivalUsesNaturalPidOrder)
{
    auto registry = Fixtures::registry_of({ process("P10", 0, 1), process("P2", 0, 1), process("P1", 0, 1) });

    const auto result = run(registry, PolicyKind::FirstComeFirstServed);
    EXPECT_EQ(timeline(result.segments), (Timeline { "P1:0-1", "P2:1-2", "P10:2-3" }));
}

TEST(Scheduler, DependencyWaitsForPrerequisite)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 3), process("P2", 0, 1, 0, { "P1" }) });

    const auto result = run(registry, PolicyKind::ShortestJobFirst);
    EXPECT_EQ(timeline(result.segments), (Timeline { "P1:0-3", "P2:3-4" }));
}

TEST(Scheduler, RejectsEmptyRegistry)
{
    Os::Registry registry;

    const auto result = Simulations::simulate(registry, PolicyKind::FirstComeFirstServed);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, Os::ErrorKind::EmptyInput);
}

TEST(Scheduler, RejectsInvalidConfiguration)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 1) });

    const auto result = Simulations::simulate(registry, PolicyKind::RoundRobin, { .quantum = 0 });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, Os::ErrorKind::Configuration);
}

TEST(Scheduler, RejectsDependencyCycle)
{
    auto registry =
      Fixtures::registry_of({ process("P1", 0, 1, 0, { "P2" }), process("P2", 0, 1, 0, { "P1" }), process("P3", 0, 1) });

    const auto result = Simulations::simulate(registry, PolicyKind::FirstComeFirstServed);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, Os::ErrorKind::Configuration);
}

TEST(Scheduler, StepLeavesConsistentPrefix)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 5), process("P2", 1, 3), process("P3", 2, 1) });

    auto scheduler = Simulations::Scheduler::create(registry, PolicyKind::FirstComeFirstServed, {});
    ASSERT_TRUE(scheduler.has_value());
    EXPECT_EQ(scheduler->state(), Simulations::SimulationState::NotStarted);

    ASSERT_TRUE(scheduler->step().has_value());
    EXPECT_EQ(scheduler->state(), Simulations::SimulationState::Running);
    EXPECT_FALSE(scheduler->complete());
    EXPECT_EQ(scheduler->timer(), 5);
    EXPECT_EQ(timeline(scheduler->segments()), (Timeline { "P1:0-5" }));
    EXPECT_TRUE(registry.state(0).finished());
    EXPECT_FALSE(registry.state(1).start_time.has_value());

    ASSERT_TRUE(scheduler->run().has_value());
    EXPECT_TRUE(scheduler->complete());
    EXPECT_EQ(scheduler->timer(), 9);

    ASSERT_TRUE(scheduler->step().has_value());
    EXPECT_EQ(scheduler->timer(), 9);
}

TEST(Scheduler, IdleStepReportsIdleState)
{
    auto registry = Fixtures::registry_of({ process("P1", 4, 1) });

    auto scheduler = Simulations::Scheduler::create(registry, PolicyKind::RoundRobin, {});
    ASSERT_TRUE(scheduler.has_value());

    ASSERT_TRUE(scheduler->step().has_value());
    EXPECT_EQ(scheduler->state(), Simulations::SimulationState::Idle);
    EXPECT_EQ(scheduler->timer(), 4);
}

TEST(Scheduler, DependencyAddedAfterCreateDeadlocks)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 1), process("P2", 0, 1, 0, { "P1" }) });

    auto scheduler = Simulations::Scheduler::create(registry, PolicyKind::FirstComeFirstServed, {});
    ASSERT_TRUE(scheduler.has_value());
    ASSERT_TRUE(registry.add_dependencies("P1", { "P2" }).has_value());

    const auto stepped = scheduler->step();
    ASSERT_FALSE(stepped.has_value());
    EXPECT_EQ(stepped.error().kind, Os::ErrorKind::Deadlock);
    EXPECT_EQ(stepped.error().pid, "P1");
    EXPECT_EQ(stepped.error().time, 0);
    EXPECT_TRUE(scheduler->segments().empty());
}

TEST(Scheduler, ProcessAddedAfterCreateIsRejected)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 2) });

    auto scheduler = Simulations::Scheduler::create(registry, PolicyKind::RoundRobin, {});
    ASSERT_TRUE(scheduler.has_value());
    ASSERT_TRUE(registry.add(process("P2", 0, 1)).has_value());

    const auto stepped = scheduler->step();
    ASSERT_FALSE(stepped.has_value());
    EXPECT_EQ(stepped.error().kind, Os::ErrorKind::Configuration);
    EXPECT_TRUE(scheduler->segments().empty());
}

TEST(Scheduler, RerunningGivesTheSameResult)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 5), process("P2", 1, 3), process("P3", 2, 1) });

    const auto first  = run(registry, PolicyKind::RoundRobin);
    const auto second = run(registry, PolicyKind::RoundRobin);
    EXPECT_EQ(first.segments, second.segments);
    EXPECT_EQ(first.metrics, second.metrics);
}

// A workload with an idle gap, priorities, same-instant arrivals and a dependency chain.
class EveryPolicy : public ::testing::TestWithParam<PolicyKind>
{
  protected:
    void SetUp() override
    {
        registry = Fixtures::registry_of({
          process("P1", 0, 7, 3),
          process("P2", 0, 2, 1),
          process("P3", 2, 4, 0, { "P2" }),
          process("P4", 3, 1, 2),
          process("P5", 3, 5, 4, { "P3", "P4" }),
          process("P6", 30, 3, 0),
          process("P7", 31, 6, 1),
        });
    }

    Os::Registry registry;
};

TEST_P(EveryPolicy, TimelinePartitionsTheRun)
{
    const auto result = run(registry, GetParam());
    ASSERT_FALSE(result.segments.empty());

    EXPECT_EQ(result.segments.front().start, 0);
    for (std::size_t idx = 0; idx < result.segments.size(); ++idx) {
        EXPECT_GT(result.segments[idx].duration(), 0) << std::format("{}", result.segments[idx]);
        if (idx > 0) { EXPECT_EQ(result.segments[idx - 1].end, result.segments[idx].start); }
    }
    EXPECT_EQ(result.segments.back().end, result.metrics.makespan);
}

TEST_P(EveryPolicy, EveryProcessRunsExactlyItsBurst)
{
    const auto result = run(registry, GetParam());

    std::map<Os::Pid, Os::Time> ran;
    for (const auto& segment : result.segments) {
        if (!segment.is_idle()) { ran[*segment.pid] += segment.duration(); }
    }

    for (const auto& [process, state] : registry.all()) {
        EXPECT_EQ(ran[process.pid], process.burst) << process.pid;
        EXPECT_TRUE(state.finished()) << process.pid;
        EXPECT_EQ(state.remaining, 0) << process.pid;
    }
    EXPECT_EQ(result.metrics.processes.size(), registry.size());
}

TEST_P(EveryPolicy, NothingRunsBeforeArrivalOrDependencies)
{
    const auto result = run(registry, GetParam());

    for (const auto& segment : result.segments) {
        if (segment.is_idle()) { continue; }

        const auto idx = registry.find(*segment.pid);
        ASSERT_TRUE(idx.has_value());

        const auto& process = registry.process(*idx);
        EXPECT_GE(segment.start, process.arrival) << std::format("{}", segment);
        for (const auto& dependency : process.dependencies) {
            const auto dependency_idx = registry.find(dependency);
            ASSERT_TRUE(dependency_idx.has_value());
            EXPECT_GE(segment.start, *registry.state(*dependency_idx).finish_time) << std::format("{}", segment);
        }
    }
}

TEST_P(EveryPolicy, IdleOnlyWhenNothingIsReady)
{
    const auto result = run(registry, GetParam());

    for (const auto& segment : result.segments) {
        if (!segment.is_idle()) { continue; }

        for (std::size_t idx = 0; idx < registry.size(); ++idx) {
            const auto finished_before = *registry.state(idx).finish_time <= segment.start;
            const auto ready_after     = *Simulations::ready_since(registry, idx) >= segment.end;
            EXPECT_TRUE(finished_before || ready_after)
              << registry.process(idx).pid << " during " << std::format("{}", segment);
        }
    }
}

class SlicingPolicy : public EveryPolicy
{};

TEST_P(SlicingPolicy, SlicesRespectTheQuantum)
{
    const auto config = Simulations::PolicyConfig { .quantum = 2, .levels = 3 };
    const auto result = run(registry, GetParam(), config);

    const auto bound = GetParam() == PolicyKind::MultilevelFeedbackQueue
                       ? Simulations::MultilevelFeedbackQueue::level_quantum(config, config.levels - 1)
                       : config.quantum;

    for (const auto& segment : result.segments) {
        if (!segment.is_idle()) { EXPECT_LE(segment.duration(), bound) << std::format("{}", segment); }
    }
}

TEST(Scheduler, IntelligentRunsStarvingProcess)
{
    auto registry = Fixtures::registry_of({
      process("long", 0, 6, 9),
      process("S1", 0, 1, 0),
      process("S2", 1, 1, 0),
      process("S3", 2, 1, 0),
      process("S4", 3, 1, 0),
      process("S5", 4, 1, 0),
      process("S6", 5, 1, 0),
    });

    const auto config = Simulations::PolicyConfig { .quantum = 1, .starvation_threshold = 3 };
    const auto result = run(registry, PolicyKind::Intelligent, config);

    const auto idx = registry.find("long");
    ASSERT_TRUE(idx.has_value());
    EXPECT_EQ(registry.state(*idx).start_time, 3);
    EXPECT_EQ(timeline(result.segments).front(), "S1:0-1");
}

INSTANTIATE_TEST_SUITE_P(
  Scheduler,
  EveryPolicy,
  ::testing::ValuesIn(Simulations::ALL_POLICIES),
  [](const ::testing::TestParamInfo<PolicyKind>& info) {
      return std::string { Simulations::policy_kind_short_name(info.param) };
  }
);

INSTANTIATE_TEST_SUITE_P(
  Scheduler,
  SlicingPolicy,
  ::testing::Values(PolicyKind::RoundRobin, PolicyKind::MultilevelFeedbackQueue, PolicyKind::Intelligent),
  [](const ::testing::TestParamInfo<PolicyKind>& info) {
      return std::string { Simulations::policy_kind_short_name(info.param) };
  }
);
