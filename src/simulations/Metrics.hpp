#pragma once

#include <expected>
#include <span>
#include <vector>

#include "Gantt.hpp"
#include "os/Error.hpp"
#include "os/Registry.hpp"

namespace Simulations
{

struct [[nodiscard]] ProcessMetrics final
{
    Os::Pid      pid;
    Os::Time     arrival  = 0;
    Os::Time     burst    = 0;
    std::int64_t priority = 0;

    Os::Time start      = 0;
    Os::Time finish     = 0;
    Os::Time waiting    = 0;
    Os::Time turnaround = 0;
    Os::Time response   = 0;

    [[nodiscard]] auto operator==(const ProcessMetrics&) const -> bool = default;
};

struct [[nodiscard]] MetricsRecord final
{
    // Finished processes only, in ascending pid order.
    std::vector<ProcessMetrics> processes;

    double average_waiting_time    = 0.0;
    double average_turnaround_time = 0.0;
    double average_response_time   = 0.0;
    double cpu_utilization         = 0.0;
    double throughput              = 0.0;

    Os::Time max_waiting_time    = 0;
    Os::Time max_turnaround_time = 0;
    Os::Time makespan            = 0;
    Os::Time busy_time           = 0;
    Os::Time elapsed_time        = 0;

    [[nodiscard]] auto operator==(const MetricsRecord&) const -> bool = default;
};

// Reads the registry and the timeline without modifying either.
[[nodiscard]] auto compute_metrics(const Os::Registry& registry, std::span<const GanttSegment> segments)
  -> std::expected<MetricsRecord, Os::Error>;

} // namespace Simulations
