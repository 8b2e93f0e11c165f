#include <print>
#include <span>

#include "Application.hpp"
#include "lang/Interpreter.hpp"
#include "simulations/Workload.hpp"
#include "Util.hpp"

auto main(int argc, const char** argv) -> int
{
    const std::span args(argv, static_cast<std::size_t>(argc));
    if (args.size() < 2) {
        std::println(stderr, "[ERROR] expected file path to simulation script");
        std::println("usage: {} <file.sl>", args[0]);
        return 1;
    }

    const auto* const script_path          = args[1];
    const auto        maybe_script_content = Util::read_entire_file(script_path);
    if (!maybe_script_content) { return 1; }

    Simulations::Workload workload;
    if (!Interpreter::Interpreter::eval(*maybe_script_content, workload)) {
        std::println(stderr, "[ERROR] Could not correctly evaluate script {}", script_path);
        return 1;
    }

    auto app = Application::create(std::move(workload));
    if (!app) { return 1; }
    app->render();
}
