#include <gtest/gtest.h>

#include "Fixtures.hpp"
#include "simulations/Export.hpp"
#include "simulations/Scheduler.hpp"

using Fixtures::process;
using Simulations::PolicyKind;

class Export : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        registry = Fixtures::registry_of({ process("P1", 0, 5, 2), process("P2", 1, 3, 1), process("P3", 2, 1, 3) });

        auto simulated = Simulations::simulate(registry, PolicyKind::FirstComeFirstServed);
        ASSERT_TRUE(simulated.has_value());
        result = *std::move(simulated);
    }

    Os::Registry                                 registry;
    std::optional<Simulations::SimulationResult> result;
};

TEST_F(Export, ProcessTableAsCsv)
{
    const auto expected = std::string {
        "pid,arrival,burst,priority,start,finish,waiting,turnaround,response\n"
        "P1,0,5,2,0,5,0,5,0\n"
        "P2,1,3,1,5,8,4,7,4\n"
        "P3,2,1,3,8,9,6,7,6\n"
        "\n"
        "metric,value\n"
        "average_waiting_time,3.33\n"
        "average_turnaround_time,6.33\n"
        "cpu_utilization,1.0000\n"
        "throughput,0.3333\n"
        "makespan,9\n"
    };
    EXPECT_EQ(Simulations::to_csv(*result), expected);
}

TEST_F(Export, GanttAsCsv)
{
    EXPECT_EQ(Simulations::gantt_to_csv(result->segments), "process,start,end\nP1,0,5\nP2,5,8\nP3,8,9\n");
}

TEST(GanttCsv, IdleAndQuotedIds)
{
    const auto segments = Simulations::GanttChart {
        { .pid = "a,b", .start = 0, .end = 2 },
        { .pid = std::nullopt, .start = 2, .end = 4 },
        { .pid = "say \"hi\"", .start = 4, .end = 5 },
    };

    EXPECT_EQ(
      Simulations::gantt_to_csv(segments), "process,start,end\n\"a,b\",0,2\nidle,2,4\n\"say \"\"hi\"\"\",4,5\n"
    );
}

TEST_F(Export, MetricsAsMet)
{
    const auto expected = std::string {
        "schedule_policy = First Come First Served\n"
        "separator\n"
        "avg_waiting_time = 3.33\n"
        "max_waiting_time = 6\n"
        "avg_turnaround_time = 6.33\n"
        "max_turnaround_time = 7\n"
        "avg_response_time = 3.33\n"
        "cpu_utilization = 100.00\n"
        "throughput = 0.3333\n"
        "makespan = 9\n"
    };
    EXPECT_EQ(Simulations::to_met(*result), expected);
}

TEST_F(Export, MetParsesBack)
{
    const auto entries = Simulations::parse_met(Simulations::to_met(*result));
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 9U);

    EXPECT_EQ(entries->front(), (std::pair<std::string, std::string> { "schedule_policy", "First Come First Served" }));
    EXPECT_EQ(entries->at(1), (std::pair<std::string, std::string> { "avg_waiting_time", "3.33" }));
    EXPECT_EQ(entries->back(), (std::pair<std::string, std::string> { "makespan", "9" }));
}

TEST(Met, SkipsBlankLinesAndTrims)
{
    const auto entries = Simulations::parse_met("\n  a =  1 \n\nseparator\nb=two words\n");
    ASSERT_TRUE(entries.has_value());

    const auto expected = Simulations::MetEntries { { "a", "1" }, { "b", "two words" } };
    EXPECT_EQ(*entries, expected);
}

TEST(Met, RejectsLineWithoutEquals)
{
    EXPECT_FALSE(Simulations::parse_met("a = 1\njust text\n").has_value());
}

TEST(Met, RejectsMissingKey)
{
    EXPECT_FALSE(Simulations::parse_met(" = 4\n").has_value());
}
