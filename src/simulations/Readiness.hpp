#pragma once

#include <expected>
#include <optional>
#include <vector>

#include "os/Error.hpp"
#include "os/Registry.hpp"
#include "Util.hpp"

namespace Simulations
{

// Rejects dependencies on unknown processes and dependency cycles (self-dependencies included).
[[nodiscard]] auto validate_dependencies(const Os::Registry& registry) -> std::expected<void, Os::Error>;

[[nodiscard]] auto is_ready(const Os::Registry& registry, const std::size_t idx, const Os::Time time) -> bool;

// Indices of the processes that may be dispatched at `time`, ordered by ascending pid.
[[nodiscard]] auto ready_set(const Os::Time time, const Os::Registry& registry) -> std::vector<std::size_t>;

// Instant at which the process became eligible: its arrival or the last finish among its dependencies.
// Empty while a dependency is still unfinished.
[[nodiscard]] auto ready_since(const Os::Registry& registry, const std::size_t idx) -> std::optional<Os::Time>;

// Earliest arrival strictly after `time` among unfinished processes.
[[nodiscard]] auto next_arrival(const Os::Registry& registry, const Os::Time time) -> std::optional<Os::Time>;

[[nodiscard]] inline auto pid_less(const Os::Registry& registry)
{
    return [&registry](const std::size_t lhs, const std::size_t rhs) {
        return Util::natural_less(registry.process(lhs).pid, registry.process(rhs).pid);
    };
}

} // namespace Simulations
