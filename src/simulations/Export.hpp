#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "Gantt.hpp"
#include "Scheduler.hpp"

namespace Simulations
{

// Per-process rows followed by a blank line and `metric,value` aggregate rows.
[[nodiscard]] auto to_csv(const SimulationResult& result) -> std::string;
[[nodiscard]] auto gantt_to_csv(std::span<const GanttSegment> segments) -> std::string;

// `key = value` lines; everything after the `separator` line is numeric and comparable across runs.
[[nodiscard]] auto to_met(const SimulationResult& result) -> std::string;

using MetEntries = std::vector<std::pair<std::string, std::string>>;

// Entries in file order, the `separator` line skipped.
[[nodiscard]] auto parse_met(std::string_view content) -> std::optional<MetEntries>;

} // namespace Simulations
