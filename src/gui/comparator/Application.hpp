#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <GLFW/glfw3.h>
#include <imgui.h>

#include "gui/Gui.hpp"

// One bar chart per metric, one bar per compared run.
class [[nodiscard]] Application final
{
  public:
    using MetricSeries = std::pair<std::string, std::vector<double>>;

    [[nodiscard]] static auto create(std::vector<std::string> labels, std::vector<MetricSeries> series)
      -> std::unique_ptr<Application>;

    void render();

    void draw_header() const;
    void draw_bar_charts() const;

    ~Application();
    Application(const Application&)            = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&)                 = delete;
    Application& operator=(Application&&)      = delete;

  private:
    Application(GLFWwindow* window, std::vector<std::string> labels, std::vector<MetricSeries> series);

  private:
    constexpr static auto WINDOW_WIDTH     = 1920;
    constexpr static auto WINDOW_HEIGHT    = 1080;
    constexpr static auto BACKGROUND_COLOR = Gui::hex_colour_to_imvec4(0x181818);

  private:
    GLFWwindow* window = nullptr;
    bool        quit   = false;

    std::vector<std::string>  labels;
    std::vector<MetricSeries> series;
};
