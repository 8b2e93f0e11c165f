#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>

#include "lang/Interpreter.hpp"
#include "simulations/Export.hpp"
#include "simulations/Scheduler.hpp"
#include "simulations/Workload.hpp"
#include "Util.hpp"

struct [[nodiscard]] Options final
{
    std::filesystem::path                  script;
    std::optional<Simulations::PolicyKind> policy  = std::nullopt;
    std::optional<Os::Time>                quantum = std::nullopt;
    std::optional<std::uint32_t>           seed    = std::nullopt;

    std::optional<std::filesystem::path> csv   = std::nullopt;
    std::optional<std::filesystem::path> gantt = std::nullopt;
    std::optional<std::filesystem::path> met   = std::nullopt;
    std::optional<std::filesystem::path> save  = std::nullopt;

    bool all = false;
};

static void usage(const char* executable)
{
    std::println("usage: {} <file.sl> [options]", executable);
    std::println("    --policy <name>    override the policy selected by the script");
    std::println("    --quantum <n>      override the quantum selected by the script");
    std::println("    --seed <n>         seed for spawn_random_process()");
    std::println("    --csv <path>       write per-process metrics as CSV");
    std::println("    --gantt <path>     write the Gantt chart as CSV");
    std::println("    --met <path>       write a result file for the comparator");
    std::println("    --save <path>      write the evaluated workload back out as a script");
    std::println("    --all              run every policy and print a comparison");
}

[[nodiscard]] static auto parse_options(std::span<const char*> args) -> std::optional<Options>
{
    Options options;
    bool    has_script = false;

    for (std::size_t idx = 1; idx < args.size(); ++idx) {
        const std::string_view arg = args[idx];

        const auto value = [&] -> std::optional<std::string_view> {
            if (idx + 1 >= args.size()) {
                std::println(stderr, "[ERROR] missing value for {}", arg);
                return std::nullopt;
            }
            return std::string_view { args[++idx] };
        };

        if (arg == "--policy") {
            options.policy = TRY(Simulations::policy_kind_try_from_str(TRY(value())));
        } else if (arg == "--quantum") {
            const auto raw     = TRY(value());
            const auto quantum = Util::parse_integer(raw);
            if (!quantum) {
                std::println(stderr, "[ERROR] invalid quantum: {}", raw);
                return std::nullopt;
            }
            options.quantum = *quantum;
        } else if (arg == "--seed") {
            const auto seed = TRY(Util::parse_number(TRY(value())));
            if (seed > std::numeric_limits<std::uint32_t>::max()) {
                std::println(stderr, "[ERROR] seed must fit in 32 bits, got {}", seed);
                return std::nullopt;
            }
            options.seed = static_cast<std::uint32_t>(seed);
        } else if (arg == "--csv") {
            options.csv = TRY(value());
        } else if (arg == "--gantt") {
            options.gantt = TRY(value());
        } else if (arg == "--met") {
            options.met = TRY(value());
        } else if (arg == "--save") {
            options.save = TRY(value());
        } else if (arg == "--all") {
            options.all = true;
        } else if (arg.starts_with("--")) {
            std::println(stderr, "[ERROR] unknown option {}", arg);
            return std::nullopt;
        } else if (!has_script) {
            options.script = arg;
            has_script     = true;
        } else {
            std::println(stderr, "[ERROR] unexpected argument {}", arg);
            return std::nullopt;
        }
    }

    if (!has_script) {
        std::println(stderr, "[ERROR] expected file path to simulation script");
        return std::nullopt;
    }

    return options;
}

static void print_result(const Simulations::SimulationResult& result)
{
    const auto& metrics = result.metrics;

    std::println("Policy: {}", result.policy);
    std::print("Gantt:");
    for (const auto& segment : result.segments) { std::print(" {}", segment); }
    std::println("");
    std::println("");

    std::println(
      "{:>8} {:>8} {:>6} {:>9} {:>6} {:>7} {:>8} {:>11} {:>9}",
      "pid",
      "arrival",
      "burst",
      "priority",
      "start",
      "finish",
      "waiting",
      "turnaround",
      "response"
    );
    for (const auto& process : metrics.processes) {
        std::println(
          "{:>8} {:>8} {:>6} {:>9} {:>6} {:>7} {:>8} {:>11} {:>9}",
          process.pid,
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

    std::println("");
    std::println("Average waiting time:    {:.2f}", metrics.average_waiting_time);
    std::println("Average turnaround time: {:.2f}", metrics.average_turnaround_time);
    std::println("Average response time:   {:.2f}", metrics.average_response_time);
    std::println("CPU utilization:         {:.2f}%", metrics.cpu_utilization * 100.0);
    std::println("Throughput:              {:.4f} processes/unit", metrics.throughput);
    std::println("Makespan:                {}", metrics.makespan);
}

[[nodiscard]] static auto write_outputs(const Options& options, const Simulations::SimulationResult& result) -> bool
{
    bool ok = true;

    const auto write = [&](const std::optional<std::filesystem::path>& path, const std::string& content) {
        if (!path) { return; }
        if (!Util::write_to_file(*path, content)) {
            ok = false;
            return;
        }
        std::println(stderr, "[INFO] wrote {}", path->string());
    };

    write(options.csv, Simulations::to_csv(result));
    write(options.gantt, Simulations::gantt_to_csv(result.segments));
    write(options.met, Simulations::to_met(result));

    return ok;
}

[[nodiscard]] static auto compare_all(Simulations::Workload& workload) -> int
{
    std::println(
      "{:<30} {:>12} {:>15} {:>12} {:>11} {:>9}",
      "policy",
      "avg waiting",
      "avg turnaround",
      "utilization",
      "throughput",
      "makespan"
    );

    auto exit_code = 0;
    for (const auto kind : Simulations::ALL_POLICIES) {
        const auto result = Simulations::simulate(workload.registry, kind, workload.config);
        if (!result) {
            std::println(stderr, "[ERROR] {}: {}", Simulations::policy_kind_name(kind), result.error());
            exit_code = 1;
            continue;
        }

        const auto& metrics = result->metrics;
        std::println(
          "{:<30} {:>12.2f} {:>15.2f} {:>11.2f}% {:>11.4f} {:>9}",
          Simulations::policy_kind_name(kind),
          metrics.average_waiting_time,
          metrics.average_turnaround_time,
          metrics.cpu_utilization * 100.0,
          metrics.throughput,
          metrics.makespan
        );
    }

    return exit_code;
}

auto main(int argc, const char** argv) -> int
{
    const std::span args(argv, static_cast<std::size_t>(argc));

    const auto options = parse_options(args);
    if (!options) {
        usage(args[0]);
        return 1;
    }

    const auto script_content = Util::read_entire_file(options->script);
    if (!script_content) { return 1; }

    Simulations::Workload workload;
    workload.seed = options->seed;
    if (!Interpreter::Interpreter::eval(*script_content, workload)) {
        std::println(stderr, "[ERROR] Could not correctly evaluate script {}", options->script.string());
        return 1;
    }

    if (options->policy) { workload.policy = *options->policy; }
    if (options->quantum) { workload.config.quantum = *options->quantum; }

    if (options->save) {
        const auto script = Interpreter::dump_workload(workload);
        if (!script || !Util::write_to_file(*options->save, *script)) { return 1; }
        std::println(stderr, "[INFO] wrote {}", options->save->string());
    }

    if (options->all) { return compare_all(workload); }

    const auto result = Simulations::simulate(workload.registry, workload.policy, workload.config);
    if (!result) {
        std::println(stderr, "[ERROR] {}", result.error());
        return 1;
    }

    print_result(*result);
    return write_outputs(*options, *result) ? 0 : 1;
}
