#include <gtest/gtest.h>

#include "Fixtures.hpp"
#include "simulations/Metrics.hpp"
#include "simulations/Scheduler.hpp"

using Fixtures::process;
using Simulations::PolicyKind;

TEST(Metrics, PerProcessFigures)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 5, 2), process("P2", 1, 3, 1), process("P3", 2, 1, 3) });

    const auto result = Simulations::simulate(registry, PolicyKind::FirstComeFirstServed);
    ASSERT_TRUE(result.has_value());

    const auto& processes = result->metrics.processes;
    ASSERT_EQ(processes.size(), 3U);

    const auto expected = std::vector<Simulations::ProcessMetrics> {
        {
          .pid        = "P1",
          .arrival    = 0,
          .burst      = 5,
          .priority   = 2,
          .start      = 0,
          .finish     = 5,
          .waiting    = 0,
          .turnaround = 5,
          .response   = 0,
        },
        {
          .pid        = "P2",
          .arrival    = 1,
          .burst      = 3,
          .priority   = 1,
          .start      = 5,
          .finish     = 8,
          .waiting    = 4,
          .turnaround = 7,
          .response   = 4,
        },
        {
          .pid        = "P3",
          .arrival    = 2,
          .burst      = 1,
          .priority   = 3,
          .start      = 8,
          .finish     = 9,
          .waiting    = 6,
          .turnaround = 7,
          .response   = 6,
        },
    };
    EXPECT_EQ(processes, expected);
}

TEST(Metrics, Aggregates)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 5), process("P2", 1, 3), process("P3", 2, 1) });

    const auto result = Simulations::simulate(registry, PolicyKind::FirstComeFirstServed);
    ASSERT_TRUE(result.has_value());

    const auto& metrics = result->metrics;
    EXPECT_NEAR(metrics.average_waiting_time, 10.0 / 3.0, 1e-9);
    EXPECT_NEAR(metrics.average_turnaround_time, 19.0 / 3.0, 1e-9);
    EXPECT_NEAR(metrics.average_response_time, 10.0 / 3.0, 1e-9);
    EXPECT_EQ(metrics.max_waiting_time, 6);
    EXPECT_EQ(metrics.max_turnaround_time, 7);
    EXPECT_EQ(metrics.makespan, 9);
    EXPECT_EQ(metrics.busy_time, 9);
    EXPECT_EQ(metrics.elapsed_time, 9);
    EXPECT_DOUBLE_EQ(metrics.cpu_utilization, 1.0);
    EXPECT_NEAR(metrics.throughput, 3.0 / 9.0, 1e-9);
}

TEST(Metrics, IdleTimeLowersUtilization)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 2), process("P2", 5, 1) });

    const auto result = Simulations::simulate(registry, PolicyKind::FirstComeFirstServed);
    ASSERT_TRUE(result.has_value());

    const auto& metrics = result->metrics;
    EXPECT_EQ(metrics.busy_time, 3);
    EXPECT_EQ(metrics.makespan, 6);
    EXPECT_DOUBLE_EQ(metrics.cpu_utilization, 0.5);
    EXPECT_NEAR(metrics.throughput, 2.0 / 6.0, 1e-9);
}

TEST(Metrics, ElapsedTimeStartsAtFirstArrival)
{
    auto registry = Fixtures::registry_of({ process("P1", 4, 2), process("P2", 4, 2) });

    const auto result = Simulations::simulate(registry, PolicyKind::FirstComeFirstServed);
    ASSERT_TRUE(result.has_value());

    const auto& metrics = result->metrics;
    EXPECT_EQ(metrics.makespan, 8);
    EXPECT_EQ(metrics.elapsed_time, 4);
    EXPECT_DOUBLE_EQ(metrics.cpu_utilization, 1.0);
}

TEST(Metrics, SingleProcessHasNoElapsedTime)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 5) });

    const auto result = Simulations::simulate(registry, PolicyKind::FirstComeFirstServed);
    ASSERT_TRUE(result.has_value());

    const auto& metrics = result->metrics;
    ASSERT_EQ(metrics.processes.size(), 1U);
    EXPECT_EQ(metrics.processes.front().turnaround, 5);
    EXPECT_EQ(metrics.makespan, 5);
    EXPECT_EQ(metrics.busy_time, 5);
    EXPECT_EQ(metrics.elapsed_time, 0);
    EXPECT_DOUBLE_EQ(metrics.cpu_utilization, 0.0);
    EXPECT_DOUBLE_EQ(metrics.throughput, 0.0);
}

TEST(Metrics, ResponseDiffersFromWaitingUnderPreemption)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 5), process("P2", 1, 3), process("P3", 2, 1) });

    const auto result = Simulations::simulate(registry, PolicyKind::ShortestRemainingTimeFirst);
    ASSERT_TRUE(result.has_value());

    const auto& p1 = result->metrics.processes.front();
    EXPECT_EQ(p1.pid, "P1");
    EXPECT_EQ(p1.response, 0);
    EXPECT_EQ(p1.waiting, 4);
}

TEST(Metrics, OnlyFinishedProcessesAreCounted)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 2), process("P2", 0, 3) });
    registry.state(0).remaining   = 0;
    registry.state(0).start_time  = 0;
    registry.state(0).finish_time = 2;

    const auto segments = Simulations::GanttChart { { .pid = "P1", .start = 0, .end = 2 } };
    const auto metrics  = Simulations::compute_metrics(registry, segments);
    ASSERT_TRUE(metrics.has_value());

    ASSERT_EQ(metrics->processes.size(), 1U);
    EXPECT_EQ(metrics->processes.front().pid, "P1");
    EXPECT_DOUBLE_EQ(metrics->average_waiting_time, 0.0);
}

TEST(Metrics, EmptyRegistryIsAnError)
{
    const Os::Registry registry;

    const auto metrics = Simulations::compute_metrics(registry, {});
    ASSERT_FALSE(metrics.has_value());
    EXPECT_EQ(metrics.error().kind, Os::ErrorKind::EmptyInput);
}
