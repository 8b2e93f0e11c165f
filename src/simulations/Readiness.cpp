#include "Readiness.hpp"

#include <algorithm>
#include <cstdint>
#include <format>

namespace Simulations
{

enum class VisitMark : std::uint8_t
{
    Unvisited = 0,
    InProgress,
    Done,
};

[[nodiscard]] static auto find_cycle(
  const std::vector<std::vector<std::size_t>>& edges,
  const std::size_t                             idx,
  std::vector<VisitMark>&                       marks,
  std::vector<std::size_t>&                     path
) -> std::optional<std::vector<std::size_t>>
{
    marks[idx] = VisitMark::InProgress;
    path.push_back(idx);

    for (const auto dependency : edges[idx]) {
        if (marks[dependency] == VisitMark::InProgress) {
            const auto cycle_start = std::ranges::find(path, dependency);
            std::vector<std::size_t> cycle(cycle_start, path.end());
            cycle.push_back(dependency);
            return cycle;
        }

        if (marks[dependency] == VisitMark::Unvisited) {
            if (auto cycle = find_cycle(edges, dependency, marks, path); cycle) { return cycle; }
        }
    }

    path.pop_back();
    marks[idx] = VisitMark::Done;
    return std::nullopt;
}

auto validate_dependencies(const Os::Registry& registry) -> std::expected<void, Os::Error>
{
    std::vector<std::vector<std::size_t>> edges(registry.size());
    for (std::size_t idx = 0; idx < registry.size(); ++idx) {
        const auto& process = registry.process(idx);
        for (const auto& dependency : process.dependencies) {
            const auto dependency_idx = registry.find(dependency);
            if (!dependency_idx) {
                return std::unexpected(Os::make_error(
                  Os::ErrorKind::Configuration,
                  std::format("dependency on unknown process {}", dependency),
                  process.pid
                ));
            }

            edges[idx].push_back(*dependency_idx);
        }
    }

    std::vector<VisitMark>   marks(registry.size(), VisitMark::Unvisited);
    std::vector<std::size_t> path;
    for (std::size_t idx = 0; idx < registry.size(); ++idx) {
        if (marks[idx] != VisitMark::Unvisited) { continue; }

        if (const auto cycle = find_cycle(edges, idx, marks, path); cycle) {
            std::string description;
            for (const auto member : *cycle) {
                if (!description.empty()) { description += " -> "; }
                description += registry.process(member).pid;
            }

            return std::unexpected(Os::make_error(
              Os::ErrorKind::Configuration,
              std::format("dependency cycle: {}", description),
              registry.process(cycle->front()).pid
            ));
        }
    }

    return {};
}

auto ready_since(const Os::Registry& registry, const std::size_t idx) -> std::optional<Os::Time>
{
    const auto& process = registry.process(idx);

    auto since = process.arrival;
    for (const auto& dependency : process.dependencies) {
        const auto dependency_idx = registry.find(dependency);
        if (!dependency_idx) { return std::nullopt; }

        const auto& finish_time = registry.state(*dependency_idx).finish_time;
        if (!finish_time) { return std::nullopt; }

        since = std::max(since, *finish_time);
    }

    return since;
}

auto is_ready(const Os::Registry& registry, const std::size_t idx, const Os::Time time) -> bool
{
    if (registry.state(idx).remaining <= 0) { return false; }

    const auto since = ready_since(registry, idx);
    return since.has_value() && *since <= time;
}

auto ready_set(const Os::Time time, const Os::Registry& registry) -> std::vector<std::size_t>
{
    std::vector<std::size_t> result;
    for (std::size_t idx = 0; idx < registry.size(); ++idx) {
        if (is_ready(registry, idx, time)) { result.push_back(idx); }
    }

    std::ranges::sort(result, pid_less(registry));
    return result;
}

auto next_arrival(const Os::Registry& registry, const Os::Time time) -> std::optional<Os::Time>
{
    std::optional<Os::Time> result = std::nullopt;
    for (const auto& [process, state] : registry.all()) {
        if (state.finished() || process.arrival <= time) { continue; }
        if (!result || process.arrival < *result) { result = process.arrival; }
    }

    return result;
}

} // namespace Simulations
