#include "Registry.hpp"

#include <algorithm>

namespace Os
{

auto Registry::add(Process process) -> std::expected<void, Error>
{
    if (process.pid.empty()) {
        return std::unexpected(make_error(ErrorKind::InvalidInput, "process id must not be empty"));
    }

    if (process.arrival < 0) {
        return std::unexpected(make_error(
          ErrorKind::InvalidInput,
          std::format("arrival time must be >= 0, got {}", process.arrival),
          process.pid
        ));
    }

    if (process.burst <= 0) {
        return std::unexpected(make_error(
          ErrorKind::InvalidInput, std::format("burst time must be > 0, got {}", process.burst), process.pid
        ));
    }

    if (contains(process.pid)) {
        return std::unexpected(make_error(ErrorKind::DuplicateId, "process id is already registered", process.pid));
    }

    std::ranges::sort(process.dependencies);
    const auto [first, last] = std::ranges::unique(process.dependencies);
    process.dependencies.erase(first, last);

    const auto remaining = process.burst;
    entries.push_back(Entry { .process = std::move(process), .state = RunState { .remaining = remaining } });
    return {};
}

void Registry::remove(const Pid& pid)
{
    std::erase_if(entries, [&](const auto& entry) { return entry.process.pid == pid; });
}

auto Registry::add_dependencies(const Pid& pid, const std::vector<Pid>& dependencies) -> std::expected<void, Error>
{
    const auto idx = find(pid);
    if (!idx) {
        return std::unexpected(make_error(ErrorKind::InvalidInput, "cannot add dependencies to unknown process", pid));
    }

    auto& deps = entries[*idx].process.dependencies;
    deps.insert(deps.end(), dependencies.begin(), dependencies.end());
    std::ranges::sort(deps);
    const auto [first, last] = std::ranges::unique(deps);
    deps.erase(first, last);

    return {};
}

void Registry::reset_run_state()
{
    for (auto& [process, state] : entries) { state = RunState { .remaining = process.burst }; }
}

auto Registry::find(const Pid& pid) const -> std::optional<std::size_t>
{
    const auto it = std::ranges::find_if(entries, [&](const auto& entry) { return entry.process.pid == pid; });
    if (it == entries.end()) { return std::nullopt; }

    return static_cast<std::size_t>(std::distance(entries.begin(), it));
}

auto Registry::all_finished() const -> bool
{
    return std::ranges::all_of(entries, [](const auto& entry) { return entry.state.finished(); });
}

} // namespace Os
