#include "Export.hpp"

#include <format>
#include <print>
#include <ranges>
#include <sstream>

#include "Util.hpp"

namespace Simulations
{

constexpr static auto MET_SEPARATOR = std::string_view { "separator" };

[[nodiscard]] static auto csv_field(std::string_view field) -> std::string
{
    if (field.find_first_of(",\"\n") == std::string_view::npos) { return std::string { field }; }

    std::string quoted = "\"";
    for (const auto c : field) {
        if (c == '"') { quoted += '"'; }
        quoted += c;
    }
    return quoted + "\"";
}

auto to_csv(const SimulationResult& result) -> std::string
{
    const auto& metrics = result.metrics;

    std::stringstream ss;
    ss << "pid,arrival,burst,priority,start,finish,waiting,turnaround,response\n";
    for (const auto& process : metrics.processes) {
        ss << std::format(
          "{},{},{},{},{},{},{},{},{}\n",
          csv_field(process.pid),
          process.arrival,
          process.burst,
          process.priority,
          process.start,
          process.finish,
          process.waiting,
          process.turnaround,
          process.response
        );
    }

    ss << "\nmetric,value\n";
    ss << std::format("average_waiting_time,{:.2f}\n", metrics.average_waiting_time);
    ss << std::format("average_turnaround_time,{:.2f}\n", metrics.average_turnaround_time);
    ss << std::format("cpu_utilization,{:.4f}\n", metrics.cpu_utilization);
    ss << std::format("throughput,{:.4f}\n", metrics.throughput);
    ss << std::format("makespan,{}\n", metrics.makespan);

    return ss.str();
}

auto gantt_to_csv(std::span<const GanttSegment> segments) -> std::string
{
    std::stringstream ss;
    ss << "process,start,end\n";
    for (const auto& segment : segments) {
        ss << std::format(
          "{},{},{}\n", segment.is_idle() ? std::string { "idle" } : csv_field(*segment.pid), segment.start, segment.end
        );
    }

    return ss.str();
}

auto to_met(const SimulationResult& result) -> std::string
{
    const auto& metrics = result.metrics;

    std::stringstream ss;
    ss << std::format("schedule_policy = {}\n", result.policy);
    ss << std::format("{}\n", MET_SEPARATOR);

    ss << std::format("avg_waiting_time = {:.2f}\n", metrics.average_waiting_time);
    ss << std::format("max_waiting_time = {}\n", metrics.max_waiting_time);
    ss << std::format("avg_turnaround_time = {:.2f}\n", metrics.average_turnaround_time);
    ss << std::format("max_turnaround_time = {}\n", metrics.max_turnaround_time);
    ss << std::format("avg_response_time = {:.2f}\n", metrics.average_response_time);
    ss << std::format("cpu_utilization = {:.2f}\n", metrics.cpu_utilization * 100.0);
    ss << std::format("throughput = {:.4f}\n", metrics.throughput);
    ss << std::format("makespan = {}\n", metrics.makespan);

    return ss.str();
}

auto parse_met(std::string_view content) -> std::optional<MetEntries>
{
    MetEntries entries;

    std::size_t line_number = 0;
    for (const auto& line_range : content | std::views::split('\n')) {
        ++line_number;

        const auto line = Util::trim(std::string_view { line_range });
        if (line.empty() || line == MET_SEPARATOR) { continue; }

        const auto equals = line.find('=');
        if (equals == std::string_view::npos) {
            std::println(stderr, "[ERROR] (met) line {}: expected `key = value`, got `{}`", line_number, line);
            return std::nullopt;
        }

        const auto key   = Util::trim(line.substr(0, equals));
        const auto value = Util::trim(line.substr(equals + 1));
        if (key.empty()) {
            std::println(stderr, "[ERROR] (met) line {}: missing key", line_number);
            return std::nullopt;
        }

        entries.emplace_back(std::string { key }, std::string { value });
    }

    return entries;
}

} // namespace Simulations
