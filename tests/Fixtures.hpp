#pragma once

#include <cstdint>
#include <format>
#include <initializer_list>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "os/Registry.hpp"
#include "simulations/Gantt.hpp"

namespace Fixtures
{

[[nodiscard]] inline auto process(
  Os::Pid              pid,
  Os::Time             arrival,
  Os::Time             burst,
  std::int64_t         priority     = 0,
  std::vector<Os::Pid> dependencies = {}
) -> Os::Process
{
    return Os::Process {
        .pid          = std::move(pid),
        .arrival      = arrival,
        .burst        = burst,
        .priority     = priority,
        .dependencies = std::move(dependencies),
    };
}

[[nodiscard]] inline auto registry_of(std::initializer_list<Os::Process> processes) -> Os::Registry
{
    Os::Registry registry;
    for (const auto& p : processes) {
        const auto added = registry.add(p);
        EXPECT_TRUE(added.has_value()) << "could not add " << p.pid;
    }
    return registry;
}

// "P1:0-5" per segment, idle segments as "idle:5-7".
[[nodiscard]] inline auto timeline(const Simulations::GanttChart& chart) -> std::vector<std::string>
{
    std::vector<std::string> result;
    result.reserve(chart.size());
    for (const auto& segment : chart) { result.push_back(std::format("{}", segment)); }
    return result;
}

} // namespace Fixtures
