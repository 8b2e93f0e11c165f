#include <gtest/gtest.h>

#include "Fixtures.hpp"
#include "os/Registry.hpp"

using Fixtures::process;

TEST(Registry, AddKeepsRegistrationOrder)
{
    Os::Registry registry;
    ASSERT_TRUE(registry.add(process("P2", 3, 4)).has_value());
    ASSERT_TRUE(registry.add(process("P1", 0, 1)).has_value());

    ASSERT_EQ(registry.size(), 2U);
    EXPECT_EQ(registry.process(0).pid, "P2");
    EXPECT_EQ(registry.process(1).pid, "P1");
    EXPECT_EQ(registry.state(0).remaining, 4);
    EXPECT_FALSE(registry.state(0).finished());
}

TEST(Registry, RejectsEmptyId)
{
    Os::Registry registry;
    const auto   added = registry.add(process("", 0, 1));

    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().kind, Os::ErrorKind::InvalidInput);
    EXPECT_TRUE(registry.empty());
}

TEST(Registry, RejectsNegativeArrival)
{
    Os::Registry registry;
    const auto   added = registry.add(process("P1", -1, 3));

    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().kind, Os::ErrorKind::InvalidInput);
    EXPECT_EQ(added.error().pid, "P1");
}

TEST(Registry, RejectsNonPositiveBurst)
{
    Os::Registry registry;

    const auto zero = registry.add(process("P1", 0, 0));
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().kind, Os::ErrorKind::InvalidInput);

    const auto negative = registry.add(process("P2", 0, -3));
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().kind, Os::ErrorKind::InvalidInput);

    EXPECT_TRUE(registry.empty());
}

TEST(Registry, RejectsDuplicateId)
{
    Os::Registry registry;
    ASSERT_TRUE(registry.add(process("P1", 0, 2)).has_value());

    const auto duplicate = registry.add(process("P1", 4, 7));
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error().kind, Os::ErrorKind::DuplicateId);
    EXPECT_EQ(duplicate.error().pid, "P1");

    ASSERT_EQ(registry.size(), 1U);
    EXPECT_EQ(registry.process(0).burst, 2);
}

TEST(Registry, DeduplicatesDependencies)
{
    Os::Registry registry;
    ASSERT_TRUE(registry.add(process("P3", 0, 1, 0, { "P2", "P1", "P2" })).has_value());

    EXPECT_EQ(registry.process(0).dependencies, (std::vector<Os::Pid> { "P1", "P2" }));
}

TEST(Registry, RemoveIsIdempotent)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 1), process("P2", 0, 1) });

    registry.remove("P1");
    registry.remove("P1");
    registry.remove("does-not-exist");

    ASSERT_EQ(registry.size(), 1U);
    EXPECT_FALSE(registry.contains("P1"));
    EXPECT_TRUE(registry.contains("P2"));
    EXPECT_EQ(registry.find("P2"), 0U);
}

TEST(Registry, AddDependenciesMergesWithExisting)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 1), process("P2", 0, 1), process("P3", 0, 1, 0, { "P1" }) });

    ASSERT_TRUE(registry.add_dependencies("P3", { "P2", "P1" }).has_value());
    EXPECT_EQ(registry.process(2).dependencies, (std::vector<Os::Pid> { "P1", "P2" }));
}

TEST(Registry, AddDependenciesToUnknownProcessFails)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 1) });

    const auto added = registry.add_dependencies("P9", { "P1" });
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().kind, Os::ErrorKind::InvalidInput);
    EXPECT_EQ(added.error().pid, "P9");
}

TEST(Registry, ResetRunStateRestoresBurst)
{
    auto registry = Fixtures::registry_of({ process("P1", 0, 5) });

    auto& state       = registry.state(0);
    state.remaining   = 0;
    state.start_time  = 1;
    state.finish_time = 6;
    state.last_ran_at = 6;
    EXPECT_TRUE(registry.all_finished());

    registry.reset_run_state();

    EXPECT_EQ(registry.state(0).remaining, 5);
    EXPECT_FALSE(registry.state(0).start_time.has_value());
    EXPECT_FALSE(registry.state(0).finished());
    EXPECT_FALSE(registry.state(0).last_ran_at.has_value());
    EXPECT_FALSE(registry.all_finished());
}
