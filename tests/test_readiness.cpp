#include <gtest/gtest.h>

#include "Fixtures.hpp"
#include "simulations/Readiness.hpp"

using Fixtures::process;

[[nodiscard]] static auto pids(const Os::Registry& registry, const std::vector<std::size_t>& indices)
  -> std::vector<Os::Pid>
{
    std::vector<Os::Pid> result;
    for (const auto idx : indices) { result.push_back(registry.process(idx).pid); }
    return result;
}

TEST(Readiness, ReadySetFiltersByArrival)
{
    const auto registry = Fixtures::registry_of({ process("P1", 0, 3), process("P2", 4, 1), process("P3", 2, 2) });

    EXPECT_EQ(pids(registry, Simulations::ready_set(0, registry)), (std::vector<Os::Pid> { "P1" }));
    EXPECT_EQ(pids(registry, Simulations::ready_set(2, registry)), (std::vector<Os::Pid> { "P1", "P3" }));
    EXPECT_EQ(pids(registry, Simulations::ready_set(4, registry)), (std::vector<Os::Pid> { "P1", "P2", "P3" }));
}

TEST(Readiness, ReadySetUsesNaturalPidOrder)
{
    const auto registry = Fixtures::registry_of({ process("P10", 0, 1), process("P2", 0, 1), process("P1", 0, 1) });

    EXPECT_EQ(pids(registry, Simulations::ready_set(0, registry)), (std::vector<Os::Pid> { "P1", "P2", "P10" }));
}

TEST(Readiness, FinishedProcessesAreNotReady)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 3), process("P2", 0, 1) });

    registry.state(0).remaining   = 0;
    registry.state(0).finish_time = 3;

    EXPECT_EQ(pids(registry, Simulations::ready_set(3, registry)), (std::vector<Os::Pid> { "P2" }));
}

TEST(Readiness, DependenciesGateReadiness)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 3), process("P2", 0, 1, 0, { "P1" }) });

    EXPECT_FALSE(Simulations::is_ready(registry, 1, 0));
    EXPECT_FALSE(Simulations::ready_since(registry, 1).has_value());

    registry.state(0).remaining   = 0;
    registry.state(0).finish_time = 3;

    EXPECT_EQ(Simulations::ready_since(registry, 1), 3);
    EXPECT_FALSE(Simulations::is_ready(registry, 1, 2));
    EXPECT_TRUE(Simulations::is_ready(registry, 1, 3));
}

TEST(Readiness, ReadySinceIsArrivalWithoutDependencies)
{
    const auto registry = Fixtures::registry_of({ process("P1", 7, 3) });

    EXPECT_EQ(Simulations::ready_since(registry, 0), 7);
}

TEST(Readiness, NextArrivalIsStrictlyAfter)
{
    const auto registry = Fixtures::registry_of({ process("P1", 0, 3), process("P2", 4, 1), process("P3", 9, 2) });

    EXPECT_EQ(Simulations::next_arrival(registry, 0), 4);
    EXPECT_EQ(Simulations::next_arrival(registry, 4), 9);
    EXPECT_FALSE(Simulations::next_arrival(registry, 9).has_value());
}

TEST(Readiness, AcceptsDependencyDag)
{
    const auto registry = Fixtures::registry_of({
      process("A", 0, 1),
      process("B", 0, 1, 0, { "A" }),
      process("C", 0, 1, 0, { "A" }),
      process("D", 0, 1, 0, { "B", "C" }),
    });

    EXPECT_TRUE(Simulations::validate_dependencies(registry).has_value());
}

TEST(Readiness, RejectsUnknownDependency)
{
    const auto registry = Fixtures::registry_of({ process("P1", 0, 1, 0, { "ghost" }) });

    const auto validated = Simulations::validate_dependencies(registry);
    ASSERT_FALSE(validated.has_value());
    EXPECT_EQ(validated.error().kind, Os::ErrorKind::Configuration);
    EXPECT_EQ(validated.error().pid, "P1");
    EXPECT_NE(validated.error().message.find("ghost"), std::string::npos);
}

TEST(Readiness, RejectsCycle)
{
    const auto registry = Fixtures::registry_of({ process("P1", 0, 1, 0, { "P2" }), process("P2", 0, 1, 0, { "P1" }) });

    const auto validated = Simulations::validate_dependencies(registry);
    ASSERT_FALSE(validated.has_value());
    EXPECT_EQ(validated.error().kind, Os::ErrorKind::Configuration);
    EXPECT_EQ(validated.error().message, "dependency cycle: P1 -> P2 -> P1");
}

TEST(Readiness, RejectsSelfDependency)
{
    const auto registry = Fixtures::registry_of({ process("P1", 0, 1, 0, { "P1" }) });

    const auto validated = Simulations::validate_dependencies(registry);
    ASSERT_FALSE(validated.has_value());
    EXPECT_EQ(validated.error().kind, Os::ErrorKind::Configuration);
    EXPECT_EQ(validated.error().message, "dependency cycle: P1 -> P1");
}
