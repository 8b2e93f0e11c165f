#pragma once

#include <cassert>
#include <cstdint>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <utility>
#include <vector>

namespace Os
{

using Pid  = std::string;
using Time = std::int64_t;

struct [[nodiscard]] Process final
{
    Pid              pid;
    Time             arrival  = 0;
    Time             burst    = 0;
    std::int64_t     priority = 0;
    std::vector<Pid> dependencies;
};

// Mutable bookkeeping of one process, owned by the simulation for the duration of a run.
struct [[nodiscard]] RunState final
{
    Time                remaining   = 0;
    std::optional<Time> start_time  = std::nullopt;
    std::optional<Time> finish_time = std::nullopt;
    std::optional<Time> last_ran_at = std::nullopt;

    [[nodiscard]] auto finished() const -> bool { return finish_time.has_value(); }
};

[[nodiscard]] inline auto join_pids(const std::vector<Pid>& pids) -> std::string
{
    std::string result = "[";
    for (std::size_t i = 0; i < pids.size(); ++i) {
        result += pids[i];
        if (i + 1 != pids.size()) { result += ", "; }
    }
    return result + "]";
}

} // namespace Os

template<>
struct std::formatter<Os::Process>
{
    constexpr auto parse(auto& ctx)
    {
        auto       it  = ctx.begin();
        const auto end = ctx.end();

        if (it != end && *it == 's') {
            line_mode = LineMode::SingleLine;
            ++it;
        } else if (it != end && *it == 'm') {
            line_mode = LineMode::Multiline;
            ++it;
        }

        if (it != end && *it != '}') { throw std::format_error("invalid format"); }

        return it;
    }

    auto format(const Os::Process& process, auto& ctx) const
    {
        switch (line_mode) {
            case LineMode::Multiline: {
                return std::format_to(
                  ctx.out(),
                  "Process {{\n        pid: {},\n        arrival: {},\n        burst: {},\n        priority: {},\n"
                  "        dependencies: {}\n    }}",
                  process.pid,
                  process.arrival,
                  process.burst,
                  process.priority,
                  Os::join_pids(process.dependencies)
                );
            }
            case LineMode::SingleLine: {
                return std::format_to(
                  ctx.out(),
                  "Process {{ pid: {}, arrival: {}, burst: {}, priority: {}, dependencies: {} }}",
                  process.pid,
                  process.arrival,
                  process.burst,
                  process.priority,
                  Os::join_pids(process.dependencies)
                );
            }
        }

        assert(false && "unreachable");
        return ctx.out();
    }

  private:
    enum class LineMode : std::uint8_t
    {
        SingleLine = 0,
        Multiline,
    };

    LineMode line_mode = LineMode::SingleLine;
};
