#include "Application.hpp"

#include <algorithm>
#include <array>
#include <ranges>
#include <span>

#include "simulations/Export.hpp"
#include "Util.hpp"

// What the replayed prefix of the timeline says about one process.
struct [[nodiscard]] PlaybackState final
{
    Os::Time                remaining;
    std::optional<Os::Time> start_time  = std::nullopt;
    std::optional<Os::Time> finish_time = std::nullopt;
};

[[nodiscard]] static auto playback_state(
  const Os::Process&                               process,
  const std::span<const Simulations::GanttSegment> replayed
) -> PlaybackState
{
    PlaybackState state { .remaining = process.burst };
    for (const auto& segment : replayed) {
        if (segment.pid != process.pid) { continue; }

        if (!state.start_time) { state.start_time = segment.start; }
        state.remaining -= segment.duration();
        if (state.remaining == 0) { state.finish_time = segment.end; }
    }

    return state;
}

[[nodiscard]] static auto format_optional_time(const std::optional<Os::Time> time) -> std::string
{
    return time.has_value() ? std::format("{}", *time) : std::string { "-" };
}

static void toast_error(const std::string& message)
{
    Gui::toast(message, Gui::ToastPosition::BottomRight, std::chrono::seconds(3), Gui::ToastLevel::Error);
}

auto Application::create(Simulations::Workload workload) -> std::unique_ptr<Application>
{
    const auto window = Gui::init_window("schedsim: scheduler", WINDOW_WIDTH, WINDOW_HEIGHT);
    if (!window) { return nullptr; }
    ImPlot::CreateContext();

    Gui::load_default_fonts();
    Gui::black_and_red_style();

    auto app = std::unique_ptr<Application>(new Application { *window, std::move(workload) });
    app->run();
    return app;
}

void Application::render()
{
    while (!quit) {
        if (glfwWindowShouldClose(window) == 1) { quit = true; }

        glfwPollEvents();
        if (glfwGetWindowAttrib(window, GLFW_ICONIFIED) != 0) { continue; }

        Gui::new_frame();

        const auto& io = ImGui::GetIO();
        if (!show_save_popup) {
            if (ImGui::IsKeyPressed(ImGuiKey_Enter, false) && !playback_complete()) { playing = !playing; }
            if (ImGui::IsKeyPressed(ImGuiKey_Space, false)) { step_playback(); }
            if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_R, false)) { restart_playback(); }
        }

        if (playing) {
            since_last_step += io.DeltaTime;
            if (since_last_step >= STEP_INTERVAL) {
                since_last_step = 0.0F;
                step_playback();
            }
        }

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(io.DisplaySize);
        Gui::window(
          "schedsim: scheduler",
          Gui::WindowFlags::NoDecoration | Gui::WindowFlags::NoResize | Gui::WindowFlags::NoMove,
          [this] {
              draw_save_buttons();

              ImGui::SameLine();

              draw_policy_picker();

              ImGui::SameLine();

              draw_quantum_input();

              ImGui::SameLine();

              Gui::button("Run", [this] { run(); });

              ImGui::SameLine();

              draw_control_buttons();

              const std::array<Gui::IndexGridCallback, 4> drawables = {
                  [&](const auto& size) { draw_gantt_chart(size); },
                  [&](const auto& size) { draw_processes(size); },
                  [&](const auto& size) { draw_graphs(size); },
                  [&](const auto& size) { draw_statistics(size); },
              };

              const auto available_space = ImGui::GetContentRegionAvail();
              Gui::grid(2UL, 2UL, drawables.size(), available_space, [&](const auto& child_size, const auto& idx) {
                  drawables[idx](child_size);
              });
          }
        );

        Gui::draw_call(window, BACKGROUND_COLOR);
    }
}

void Application::run()
{
    result = std::nullopt;
    restart_playback();

    auto simulated = Simulations::simulate(workload.registry, workload.policy, workload.config);
    if (!simulated) {
        std::println(stderr, "[ERROR] {}", simulated.error());
        toast_error(std::format("{}", simulated.error()));
        return;
    }

    result = *std::move(simulated);
}

void Application::restart_playback()
{
    shown           = 0;
    playing         = false;
    since_last_step = 0.0F;
}

void Application::step_playback()
{
    if (playback_complete()) {
        playing = false;
        return;
    }

    ++shown;
    if (playback_complete()) { playing = false; }
}

auto Application::playback_complete() const -> bool { return !result || shown >= result->segments.size(); }

auto Application::playback_time() const -> Os::Time
{
    if (!result || shown == 0) { return 0; }
    return result->segments[shown - 1].end;
}

void Application::draw_save_buttons()
{
    if (show_save_popup) {
        const auto label     = save_format == SaveFormat::Met ? "Save results to" : "Export CSV to";
        const auto file_path = Gui::input_text_popup(label, show_save_popup);
        if (file_path.has_value() && result.has_value()) {
            if (file_path->empty()) {
                toast_error("Failed to save simulation: empty path");
            } else {
                const auto content =
                  save_format == SaveFormat::Met ? Simulations::to_met(*result) : Simulations::to_csv(*result);

                if (Util::write_to_file(*file_path, content)) {
                    Gui::toast(
                      std::format("Saved simulation result to {}", *file_path),
                      Gui::ToastPosition::BottomRight,
                      std::chrono::seconds(2),
                      Gui::ToastLevel::Info
                    );
                } else {
                    toast_error(std::format("Failed to write {}", *file_path));
                }
            }
        }
    }

    const auto open_popup = [this](const SaveFormat format) {
        save_format     = format;
        show_save_popup = true;
    };

    if (result && ImGui::GetIO().KeyCtrl) {
        if (ImGui::IsKeyPressed(ImGuiKey_S, false)) {
            open_popup(SaveFormat::Met);
        } else if (ImGui::IsKeyPressed(ImGuiKey_E, false)) {
            open_popup(SaveFormat::Csv);
        }
    }

    Gui::enabled_if(result.has_value(), [&] {
        Gui::image_button(save_texture, BUTTON_SIZE, "[Ctrl+S]ave Results", [&] { open_popup(SaveFormat::Met); });

        ImGui::SameLine();

        Gui::button("[Ctrl+E]xport CSV", [&] { open_popup(SaveFormat::Csv); });
    });
}

void Application::draw_policy_picker()
{
    ImGui::SetNextItemWidth(260.0F);
    Gui::combo(
      "##PolicyPicker",
      std::span<const Simulations::PolicyKind>(Simulations::ALL_POLICIES),
      workload.policy,
      [&](const Simulations::PolicyKind selected) {
          workload.policy = selected;
          run();
      }
    );
}

void Application::draw_quantum_input()
{
    int quantum = static_cast<int>(workload.config.quantum);

    ImGui::SetNextItemWidth(120.0F);
    if (ImGui::InputInt("Quantum", &quantum) && quantum != workload.config.quantum) {
        workload.config.quantum = quantum;
        run();
    }
}

void Application::draw_control_buttons()
{
    constexpr static auto BUTTONS_COUNT = 3;
    Gui::center_content_horizontally(BUTTON_SIZE.x * BUTTONS_COUNT);

    Gui::enabled_if(result.has_value(), [&] {
        Gui::image_button(restart_texture, BUTTON_SIZE, "[Ctrl+R]estart", [this] { restart_playback(); });
    });

    ImGui::SameLine();

    Gui::enabled_if(!playback_complete(), [&] {
        Gui::image_button(play_texture, BUTTON_SIZE, playing ? "[Enter] Pause" : "[Enter] Play", [this] {
            playing = !playing;
        });

        ImGui::SameLine();

        Gui::image_button(next_texture, BUTTON_SIZE, "[Space] Next", [this] { step_playback(); });
    });
}

void Application::draw_gantt_chart(const ImVec2& child_size) const
{
    Gui::title("Gantt chart", child_size, [&](const auto& remaining_size) {
        if (!result) { return; }

        const auto& registry = workload.registry;

        std::vector<std::string> lanes;
        lanes.reserve(registry.size());
        for (const auto& entry : registry.all()) { lanes.push_back(entry.process.pid); }

        std::vector<Gui::Plotting::GanttBar> bars;
        for (const auto& segment : result->segments | std::views::take(shown)) {
            if (segment.is_idle()) { continue; }

            const auto row = registry.find(*segment.pid);
            if (!row) { continue; }

            bars.push_back(Gui::Plotting::GanttBar {
              .row    = *row,
              .start  = static_cast<double>(segment.start),
              .end    = static_cast<double>(segment.end),
              .colour = static_cast<int>(*row),
            });
        }

        const auto plot_opts = Gui::Plotting::PlotOpts {
            .x_axis_flags = Gui::Plotting::AxisFlags::None,
            .y_axis_flags = Gui::Plotting::AxisFlags::None,
            .x_min        = 0.0,
            .x_max        = static_cast<double>(std::max<Os::Time>(result->metrics.makespan, 1)),
            .y_min        = -0.5,
            .y_max        = static_cast<double>(lanes.size()) - 0.5,
            .x_label      = "time",
            .scrollable   = false,
        };

        Gui::Plotting::plot("##GanttPlot", remaining_size, plot_opts, [&] { Gui::Plotting::gantt(lanes, bars); });
    });
}

void Application::draw_processes(const ImVec2& child_size) const
{
    constexpr static auto HEADERS = std::array {
        "Pid", "Arrival", "Burst", "Priority", "Remaining", "Start", "Finish", "Status", "Depends on",
    };
    constexpr static auto TABLE_FLAGS =
      Gui::TableFlags::Borders | Gui::TableFlags::RowBackground | Gui::TableFlags::ScrollY;

    Gui::title("Processes", child_size, [&](const auto& remaining_size) {
        if (!result) { return; }

        const auto replayed = std::span(result->segments).first(shown);
        const auto now      = playback_time();
        const auto current  = replayed.empty() ? std::nullopt : replayed.back().pid;

        Gui::child("##ProcessesTable", remaining_size, Gui::ChildFlags::None, Gui::WindowFlags::None, [&] {
            Gui::draw_table("ProcessesTable", HEADERS, TABLE_FLAGS, [&] {
                for (const auto& entry : workload.registry.all()) {
                    const auto& process = entry.process;
                    const auto  state   = playback_state(process, replayed);

                    const auto status = [&] -> std::string_view {
                        if (state.finish_time) { return "Finished"; }
                        if (current == process.pid) { return "Running"; }
                        if (process.arrival > now) { return "Not arrived"; }
                        return "Waiting";
                    };

                    Gui::draw_table_row(
                      [&] { Gui::text("{}", process.pid); },
                      [&] { Gui::text("{}", process.arrival); },
                      [&] { Gui::text("{}", process.burst); },
                      [&] { Gui::text("{}", process.priority); },
                      [&] { Gui::text("{}", state.remaining); },
                      [&] { Gui::text("{}", format_optional_time(state.start_time)); },
                      [&] { Gui::text("{}", format_optional_time(state.finish_time)); },
                      [&] { Gui::text("{}", status()); },
                      [&] { Gui::text("{}", Os::join_pids(process.dependencies)); }
                    );
                }
            });
        });
    });
}

void Application::draw_graphs(const ImVec2& child_size) const
{
    const auto now = playback_time();

    std::vector<std::string> labels;
    std::vector<double>      waiting;
    std::vector<double>      turnaround;
    if (result) {
        for (const auto& process : result->metrics.processes) {
            if (shown == 0 || process.finish > now) { continue; }

            labels.push_back(process.pid);
            waiting.push_back(static_cast<double>(process.waiting));
            turnaround.push_back(static_cast<double>(process.turnaround));
        }
    }

    if (labels.empty()) {
        Gui::title("Waiting and turnaround time", child_size, [](const auto&) {
            Gui::text("No process has finished yet");
        });
        return;
    }

    const auto draw_bars = [&](const std::string& title, const std::vector<double>& values, const ImVec2& size) {
        const auto plot_opts = Gui::Plotting::PlotOpts {
            .x_axis_flags = Gui::Plotting::AxisFlags::None,
            .y_axis_flags = Gui::Plotting::AxisFlags::None,
            .x_min        = -0.5,
            .x_max        = static_cast<double>(labels.size()) - 0.5,
            .y_min        = 0.0,
            .y_max        = std::max(std::ranges::max(values), 1.0) * 1.1,
            .scrollable   = false,
        };

        Gui::title(title, size, [&](const auto& remaining_size) {
            Gui::Plotting::plot(std::format("##{}", title), remaining_size, plot_opts, [&] {
                Gui::Plotting::bars(labels, values);
            });
        });
    };

    const std::array<Gui::IndexGridCallback, 2> callbacks = {
        [&](const auto& size) { draw_bars("Waiting time", waiting, size); },
        [&](const auto& size) { draw_bars("Turnaround time", turnaround, size); },
    };

    Gui::grid(1UL, 2UL, callbacks.size(), child_size, [&](const auto& elem_size, const auto& idx) {
        callbacks[idx](elem_size);
    });
}

void Application::draw_statistics(const ImVec2& child_size) const
{
    constexpr static auto TABLE_FLAGS = Gui::TableFlags::Borders | Gui::TableFlags::RowBackground;
    constexpr static auto HEADERS     = std::array { "Key", "Value" };

    const auto draw_key_value = [](const std::string_view key, const auto& value) {
        Gui::draw_table_row(
          [&] { Gui::text("{}", key); },
          [&] {
              using Type = std::decay_t<decltype(value)>;
              if constexpr (std::is_same_v<Type, double>) {
                  Gui::text("{:.2f}", value);
              } else {
                  Gui::text("{}", value);
              }
          }
        );
    };

    Gui::title("Stats", child_size, [&](const auto&) {
        Gui::draw_table("InfoTable", HEADERS, TABLE_FLAGS, [&] {
            draw_key_value("Scheduler Policy", workload.policy);
            draw_key_value("Quantum", workload.config.quantum);
            draw_key_value("Processes", workload.registry.size());

            if (!result) { return; }
            draw_key_value("Timer", playback_time());
            draw_key_value("Segments", std::format("{} / {}", shown, result->segments.size()));
        });

        ImGui::Separator();

        if (!result) { return; }
        if (!playback_complete()) {
            Gui::text("Aggregate metrics are shown once playback finishes");
            return;
        }

        const auto& metrics = result->metrics;
        Gui::draw_table("MetricsTable", HEADERS, TABLE_FLAGS, [&] {
            draw_key_value("Avg. waiting time", metrics.average_waiting_time);
            draw_key_value("Max. waiting time", metrics.max_waiting_time);
            draw_key_value("Avg. turnaround time", metrics.average_turnaround_time);
            draw_key_value("Max. turnaround time", metrics.max_turnaround_time);
            draw_key_value("Avg. response time", metrics.average_response_time);
            draw_key_value("CPU utilization %", metrics.cpu_utilization * 100.0);
            draw_key_value("Throughput", metrics.throughput);
            draw_key_value("Makespan", metrics.makespan);
        });
    });
}

Application::Application(GLFWwindow* window, Simulations::Workload workload)
  : window { window },
    workload { std::move(workload) },
    restart_texture { Gui::Texture::load_from_file("resources/restart.png") },
    play_texture { Gui::Texture::load_from_file("resources/play.png") },
    next_texture { Gui::Texture::load_from_file("resources/next.png") },
    save_texture { Gui::Texture::load_from_file("resources/save.png") }
{}

Application::~Application()
{
    ImPlot::DestroyContext();
    Gui::shutdown(window);
}
