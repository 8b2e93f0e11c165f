#pragma once

#include <format>
#include <optional>
#include <vector>

#include "os/Os.hpp"

namespace Simulations
{

struct [[nodiscard]] GanttSegment final
{
    // Empty for an idle CPU.
    std::optional<Os::Pid> pid   = std::nullopt;
    Os::Time               start = 0;
    Os::Time               end   = 0;

    [[nodiscard]] auto is_idle() const -> bool { return !pid.has_value(); }
    [[nodiscard]] auto duration() const -> Os::Time { return end - start; }

    [[nodiscard]] auto operator==(const GanttSegment&) const -> bool = default;
};

using GanttChart = std::vector<GanttSegment>;

} // namespace Simulations

template<>
struct std::formatter<Simulations::GanttSegment>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Simulations::GanttSegment& segment, auto& ctx) const
    {
        return std::format_to(
          ctx.out(), "{}:{}-{}", segment.pid.value_or(std::string { "idle" }), segment.start, segment.end
        );
    }
};
