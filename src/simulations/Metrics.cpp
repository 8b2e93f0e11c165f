#include "Metrics.hpp"

#include <algorithm>
#include <limits>

#include "Util.hpp"

namespace Simulations
{

auto compute_metrics(const Os::Registry& registry, std::span<const GanttSegment> segments)
  -> std::expected<MetricsRecord, Os::Error>
{
    if (registry.empty()) {
        return std::unexpected(Os::make_error(Os::ErrorKind::EmptyInput, "cannot compute metrics without processes"));
    }

    MetricsRecord record;

    auto earliest_arrival = std::numeric_limits<Os::Time>::max();
    for (const auto& [process, state] : registry.all()) {
        earliest_arrival = std::min(earliest_arrival, process.arrival);

        if (!state.finished() || !state.start_time) { continue; }

        const auto turnaround = *state.finish_time - process.arrival;
        record.processes.push_back(ProcessMetrics {
          .pid        = process.pid,
          .arrival    = process.arrival,
          .burst      = process.burst,
          .priority   = process.priority,
          .start      = *state.start_time,
          .finish     = *state.finish_time,
          .waiting    = turnaround - process.burst,
          .turnaround = turnaround,
          .response   = *state.start_time - process.arrival,
        });
    }

    std::ranges::sort(record.processes, [](const auto& lhs, const auto& rhs) {
        return Util::natural_less(lhs.pid, rhs.pid);
    });

    for (const auto& segment : segments) {
        record.makespan = std::max(record.makespan, segment.end);
        if (!segment.is_idle()) { record.busy_time += segment.duration(); }
    }

    if (!record.processes.empty()) {
        Os::Time total_waiting    = 0;
        Os::Time total_turnaround = 0;
        Os::Time total_response   = 0;
        for (const auto& process : record.processes) {
            total_waiting    += process.waiting;
            total_turnaround += process.turnaround;
            total_response   += process.response;

            record.max_waiting_time    = std::max(record.max_waiting_time, process.waiting);
            record.max_turnaround_time = std::max(record.max_turnaround_time, process.turnaround);
        }

        const auto count               = static_cast<double>(record.processes.size());
        record.average_waiting_time    = static_cast<double>(total_waiting) / count;
        record.average_turnaround_time = static_cast<double>(total_turnaround) / count;
        record.average_response_time   = static_cast<double>(total_response) / count;
    }

    // A lone process has no span between arrivals to measure against.
    if (registry.size() > 1) { record.elapsed_time = std::max(record.makespan - earliest_arrival, Os::Time { 0 }); }
    if (record.elapsed_time > 0) {
        const auto elapsed     = static_cast<double>(record.elapsed_time);
        record.cpu_utilization = static_cast<double>(record.busy_time) / elapsed;
        record.throughput      = static_cast<double>(record.processes.size()) / elapsed;
    }

    return record;
}

} // namespace Simulations
