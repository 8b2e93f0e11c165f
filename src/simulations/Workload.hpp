#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "Policy.hpp"
#include "os/Registry.hpp"

namespace Simulations
{

// Upper bounds for randomly generated processes.
struct [[nodiscard]] GeneratorLimits final
{
    std::size_t max_arrival_time = 10;
    std::size_t max_burst_time   = 10;
    std::size_t max_priority     = 5;

    [[nodiscard]] auto operator==(const GeneratorLimits&) const -> bool = default;
};

// Everything a script describes: the processes, the policy to run and its configuration.
struct [[nodiscard]] Workload final
{
    Os::Registry                 registry;
    PolicyKind                   policy = PolicyKind::FirstComeFirstServed;
    PolicyConfig                 config;
    GeneratorLimits              limits;
    std::optional<std::uint32_t> seed = std::nullopt;
};

} // namespace Simulations
