#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include <imgui.h>

#include "gui/Gui.hpp"
#include "simulations/Scheduler.hpp"
#include "simulations/Workload.hpp"

class [[nodiscard]] Application final
{
  public:
    [[nodiscard]] static auto create(Simulations::Workload workload) -> std::unique_ptr<Application>;

    void render();

    void draw_save_buttons();
    void draw_control_buttons();
    void draw_policy_picker();
    void draw_quantum_input();

    void draw_gantt_chart(const ImVec2& child_size) const;
    void draw_processes(const ImVec2& child_size) const;
    void draw_graphs(const ImVec2& child_size) const;
    void draw_statistics(const ImVec2& child_size) const;

    ~Application();
    Application(const Application&)            = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&)                 = delete;
    Application& operator=(Application&&)      = delete;

  private:
    Application(GLFWwindow* window, Simulations::Workload workload);

    // Computes the whole run up front, playback only replays its segments.
    void run();
    void restart_playback();
    void step_playback();

    [[nodiscard]] auto playback_complete() const -> bool;
    [[nodiscard]] auto playback_time() const -> Os::Time;

  private:
    constexpr static auto WINDOW_WIDTH     = 1920;
    constexpr static auto WINDOW_HEIGHT    = 1080;
    constexpr static auto BACKGROUND_COLOR = Gui::hex_colour_to_imvec4(0x181818);
    constexpr static auto BUTTON_SIZE      = ImVec2(16, 16);
    constexpr static auto STEP_INTERVAL    = 0.25F;

    enum class SaveFormat : std::uint8_t
    {
        Met = 0,
        Csv,
    };

  private:
    GLFWwindow* window = nullptr;
    bool        quit   = false;

    Simulations::Workload                          workload;
    std::optional<Simulations::SimulationResult> result = std::nullopt;

    // Number of segments replayed so far.
    std::size_t shown           = 0;
    bool        playing         = false;
    float       since_last_step = 0.0F;

    bool       show_save_popup = false;
    SaveFormat save_format     = SaveFormat::Met;

    Gui::Texture restart_texture;
    Gui::Texture play_texture;
    Gui::Texture next_texture;
    Gui::Texture save_texture;
};
