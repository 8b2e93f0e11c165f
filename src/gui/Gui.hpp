#pragma once

#include <cassert>
#include <chrono>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <filesystem>
#include <format>
#include <functional>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>
#include <GL/gl.h>
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_internal.h>
#include <implot.h>

namespace Gui
{

constexpr static auto GLSL_VERSION = "#version 330";

inline ImFont* regular_font = nullptr;
inline ImFont* bold_font    = nullptr;

[[nodiscard]] constexpr auto hex_colour_to_imvec4(const std::uint32_t hex, const float alpha = 1.0F) -> ImVec4
{
    return {
        static_cast<float>((hex >> 16U) & 0xFFU) / 255.0F,
        static_cast<float>((hex >> 8U) & 0xFFU) / 255.0F,
        static_cast<float>(hex & 0xFFU) / 255.0F,
        alpha,
    };
}

enum class ChildFlags : std::uint8_t
{
    None   = 0,
    Border = 1 << 0,
};

[[nodiscard]] constexpr static auto operator|(ChildFlags lhs, ChildFlags rhs) -> ChildFlags
{
    return static_cast<ChildFlags>(std::to_underlying(lhs) | std::to_underlying(rhs));
}

enum class WindowFlags : std::uint16_t
{
    None                    = 0,
    NoTitleBar              = 1 << 0,
    NoResize                = 1 << 1,
    NoMove                  = 1 << 2,
    NoScrollbar             = 1 << 3,
    NoCollapse              = 1 << 5,
    NoSavedSettings         = 1 << 8,
    AlwaysVerticalScrollbar = 1 << 14,
    NoDecoration            = NoTitleBar | NoResize | NoScrollbar | NoCollapse,
};

[[nodiscard]] constexpr static auto operator|(WindowFlags lhs, WindowFlags rhs) -> WindowFlags
{
    return static_cast<WindowFlags>(std::to_underlying(lhs) | std::to_underlying(rhs));
}

[[nodiscard]] auto init_window(const std::string& title, const int width, const int height)
  -> std::optional<GLFWwindow*>;
void shutdown(GLFWwindow* window);
void new_frame();
void draw_call(GLFWwindow* window, const ImVec4& clear_color);

void load_default_fonts(const float regular_size = 16.0F, const float bold_size = 18.0F);
void black_and_red_style();

template<typename... Args>
void text(std::format_string<Args...> fmt, Args&&... args)
{
    ImGui::TextUnformatted(std::format(fmt, std::forward<Args>(args)...).c_str());
}

template<std::invocable<ImVec2> Callback>
void title(const std::string& title, const ImVec2& child_size, Callback&& callback)
{
    constexpr static auto title_height = 24.0F;
    const auto            title_size   = ImVec2(child_size.x, title_height);

    ImGui::PushStyleColor(ImGuiCol_ChildBg, ImGui::GetStyleColorVec4(ImGuiCol_TitleBgActive));
    ImGui::BeginChild(std::format("{}_title", title).c_str(), title_size, 0);

    ImGui::SetCursorPosX(8.0F);
    ImGui::SetCursorPosY((title_height - ImGui::GetTextLineHeight()) * 0.5F);
    if (bold_font != nullptr) { ImGui::PushFont(bold_font); }
    ImGui::TextUnformatted(title.c_str());
    if (bold_font != nullptr) { ImGui::PopFont(); }

    ImGui::EndChild();
    ImGui::PopStyleColor();

    const auto spacing = ImGui::GetStyle().ItemSpacing.y;
    std::invoke(std::forward<Callback>(callback), ImVec2(child_size.x, child_size.y - title_height - spacing));
}

class [[nodiscard]] Texture final
{
  public:
    static auto load_from_file(const std::filesystem::path& path) -> Texture;

    [[nodiscard]] auto loaded() const -> bool { return texture_id.has_value(); }

    // ImTextureID is a pointer or a 64 bit integer depending on the ImGui version.
    template<typename TextureId = ImTextureID>
    [[nodiscard]] auto as_imgui_texture() const -> TextureId
    {
        if constexpr (std::is_pointer_v<TextureId>) {
            return reinterpret_cast<TextureId>(static_cast<std::uintptr_t>(texture_id.value()));
        } else {
            return static_cast<TextureId>(texture_id.value());
        }
    }

    ~Texture();
    Texture(const Texture&)            = delete;
    Texture& operator=(const Texture&) = delete;
    Texture(Texture&& other) noexcept;
    Texture& operator=(Texture&& other) noexcept;

  private:
    explicit Texture(const std::optional<GLuint> texture_id_)
      : texture_id { texture_id_ }
    {}

    std::optional<GLuint> texture_id;
};

template<typename... Args>
void tooltip(const std::format_string<Args...>& fmt, Args&&... args)
{
    ImGui::BeginTooltip();
    Gui::text(fmt, std::forward<Args>(args)...);
    ImGui::EndTooltip();
}

template<std::invocable Callback>
void button(const std::string& label, Callback&& callback)
{
    if (ImGui::Button(label.c_str(), ImVec2(0, 0))) { std::invoke(std::forward<Callback>(callback)); }
}

template<std::invocable Callback>
void image_button(const Texture& texture, const ImVec2& size, const std::string& fallback, Callback&& callback)
{
    if (!texture.loaded()) {
        if (ImGui::Button(fallback.c_str())) { std::invoke(std::forward<Callback>(callback)); }
        return;
    }

    if (ImGui::ImageButton(fallback.c_str(), texture.as_imgui_texture(), size)) {
        std::invoke(std::forward<Callback>(callback));
    }

    constexpr static auto HOVER_THRESHOLD = 0.5F;
    if (ImGui::IsItemHovered() && ImGui::GetCurrentContext()->HoveredIdTimer >= HOVER_THRESHOLD) {
        Gui::tooltip("{}", fallback);
    }
}

void center_content_horizontally(const float content_width);

template<std::invocable Callback>
void child(
  const std::string& title,
  const ImVec2&      size,
  ChildFlags         child_flags,
  WindowFlags        window_flags,
  Callback&&         callback
)
{
    if (ImGui::BeginChild(title.c_str(), size, std::to_underlying(child_flags), std::to_underlying(window_flags))) {
        std::invoke(std::forward<Callback>(callback));
    }

    ImGui::EndChild();
}

template<std::invocable Callback>
void window(const std::string& title, WindowFlags window_flags, Callback&& callback)
{
    ImGui::Begin(title.c_str(), nullptr, std::to_underlying(window_flags));
    std::invoke(std::forward<Callback>(callback));
    ImGui::End();
}

enum class TableFlags : std::uint32_t
{
    RowBackground          = 1 << 6,
    BordersInnerHorizontal = 1 << 7,
    BordersOuterHorizontal = 1 << 8,
    BordersInnerVertical   = 1 << 9,
    BordersOuterVertical   = 1 << 10,
    BordersInner           = BordersInnerVertical | BordersInnerHorizontal,
    BordersOuter           = BordersOuterVertical | BordersOuterHorizontal,
    Borders                = BordersInner | BordersOuter,
    ScrollY                = 1 << 25,
};

[[nodiscard]] constexpr static auto operator|(TableFlags lhs, TableFlags rhs) -> TableFlags
{
    return static_cast<TableFlags>(std::to_underlying(lhs) | std::to_underlying(rhs));
}

template<std::invocable Callback>
void draw_table(
  const std::string&                 name,
  const std::span<const char* const> headers,
  TableFlags                         flags,
  Callback&&                         callback
)
{
    if (ImGui::BeginTable(
          name.c_str(), static_cast<int>(headers.size()), static_cast<int>(std::to_underlying(flags))
        )) {
        ImGui::TableSetupScrollFreeze(0, 1);
        for (const auto& header : headers) { ImGui::TableSetupColumn(header); }
        ImGui::TableHeadersRow();
        std::invoke(std::forward<Callback>(callback));
        ImGui::EndTable();
    }
}

template<typename... Callbacks>
void draw_table_row(Callbacks&&... callbacks)
{
    ImGui::TableNextRow();

    int column = 0;
    ((ImGui::TableSetColumnIndex(column++), std::invoke(std::forward<Callbacks>(callbacks))), ...);
}

[[nodiscard]] auto grid_layout_calc_size(const std::size_t rows, const std::size_t cols, const ImVec2& available_space)
  -> ImVec2;

using IndexGridCallback = std::function<void(const ImVec2&)>;

// Lays `count` cells out row by row, each cell inside its own child window.
template<std::invocable<ImVec2, std::size_t> Callback>
void grid(
  const std::size_t rows,
  const std::size_t cols,
  const std::size_t count,
  const ImVec2&     available_space,
  Callback&&        callback
)
{
    const auto cell_size = grid_layout_calc_size(rows, cols, available_space);

    for (std::size_t idx = 0; idx < count; ++idx) {
        if (idx % cols != 0) { ImGui::SameLine(); }

        child(std::format("##GridCell{}", idx), cell_size, ChildFlags::None, WindowFlags::NoScrollbar, [&] {
            std::invoke(callback, cell_size, idx);
        });
    }
}

template<std::invocable<ImVec2, std::size_t> Callback>
void grid(const std::size_t count, const ImVec2& available_space, Callback&& callback)
{
    if (count == 0) { return; }

    const auto cols = static_cast<std::size_t>(std::ceil(std::sqrt(static_cast<double>(count))));
    const auto rows = (count + cols - 1) / cols;
    grid(rows, cols, count, available_space, std::forward<Callback>(callback));
}

// Items are displayed through their std::formatter.
template<typename T, std::invocable<T> Callback>
void combo(const std::string& label, const std::span<const T> items, const T& current, Callback&& callback)
{
    const auto preview = std::format("{}", current);
    if (ImGui::BeginCombo(label.c_str(), preview.c_str())) {
        for (const auto& item : items) {
            const bool selected = item == current;
            if (ImGui::Selectable(std::format("{}", item).c_str(), selected) && !selected) {
                std::invoke(std::forward<Callback>(callback), item);
            }
            if (selected) { ImGui::SetItemDefaultFocus(); }
        }
        ImGui::EndCombo();
    }
}

namespace impl
{
template<std::invocable Callback>
void disabled_impl(const bool control, Callback&& callback)
{
    ImGui::BeginDisabled(control);
    std::invoke(std::forward<Callback>(callback));
    ImGui::EndDisabled();
}
} // namespace impl

template<std::invocable Callback>
void enabled_if(const bool control, Callback&& callback)
{
    impl::disabled_impl(!control, std::forward<Callback>(callback));
}

// Modal popup asking for one line of text. Returns the text once entered, `condition` is cleared on close.
[[nodiscard]] auto input_text_popup(const std::string& label, bool& condition) -> std::optional<std::string>;

enum class ToastLevel : std::uint8_t
{
    Info = 0,
    Warning,
    Error,
};

enum class ToastPosition : std::uint8_t
{
    TopLeft = 0,
    TopRight,
    BottomLeft,
    BottomRight,
};

struct [[nodiscard]] Toast final
{
    std::string                  message;
    std::chrono::duration<float> duration;
    ToastLevel                   level;
    ToastPosition                position;
};

class [[nodiscard]] ToastManager final
{
  public:
    static void add(const Toast& toast) { toasts.push_back(toast); }
    static void render();

  private:
    [[nodiscard]] static auto toast_level_to_color(ToastLevel level) -> ImVec4;
    [[nodiscard]] static auto toast_position_to_vector(ToastPosition position, const ImVec2& toast_size) -> ImVec2;

    inline static std::vector<Toast> toasts;
};

void toast(
  const std::string&                 message,
  ToastPosition                      position,
  const std::chrono::duration<float> duration,
  ToastLevel                         level
);

namespace Plotting
{

enum class AxisFlags : std::uint16_t
{
    None         = 0,
    NoTickMarks  = 1 << 2,
    NoTickLabels = 1 << 3,
    AutoFit      = 1 << 11,
};

[[nodiscard]] constexpr static auto operator|(AxisFlags lhs, AxisFlags rhs) -> AxisFlags
{
    return static_cast<AxisFlags>(std::to_underlying(lhs) | std::to_underlying(rhs));
}

struct [[nodiscard]] PlotOpts final
{
    AxisFlags x_axis_flags = AxisFlags::None;
    AxisFlags y_axis_flags = AxisFlags::None;

    std::optional<double> x_min = std::nullopt;
    std::optional<double> x_max = std::nullopt;
    std::optional<double> y_min = std::nullopt;
    std::optional<double> y_max = std::nullopt;

    std::optional<std::string> x_label = std::nullopt;
    std::optional<std::string> y_label = std::nullopt;

    bool scrollable  = true;
    bool maximizable = true;
};

template<std::invocable Callback>
void plot(const std::string& title, const ImVec2& size, const PlotOpts& opts, Callback&& callback)
{
    static std::unordered_map<std::string, bool> maximized_map;

    const bool was_maximized = opts.maximizable && maximized_map[title];
    const auto plot_size     = was_maximized ? ImGui::GetIO().DisplaySize : size;

    if (was_maximized) {
        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(ImGui::GetIO().DisplaySize);
        ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, 0.0F);
        ImGui::PushStyleVar(ImGuiStyleVar_WindowBorderSize, 0.0F);

        ImGui::Begin(
          "MaximizedPlotWindow",
          nullptr,
          ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoSavedSettings
            | ImGuiWindowFlags_NoCollapse
        );

        ImGui::PopStyleVar(2);
    }

    if (ImPlot::BeginPlot(title.c_str(), plot_size)) {
        ImPlot::SetupAxes(
          opts.x_label.has_value() ? opts.x_label->c_str() : nullptr,
          opts.y_label.has_value() ? opts.y_label->c_str() : nullptr,
          std::to_underlying(opts.x_axis_flags),
          std::to_underlying(opts.y_axis_flags)
        );

        const auto default_range = ImPlotRange(0, 1);
        const auto condition     = opts.scrollable ? ImGuiCond_Once : ImGuiCond_Always;

        ImPlot::SetupAxisLimits(
          ImAxis_X1, opts.x_min.value_or(default_range.Min), opts.x_max.value_or(default_range.Max), condition
        );
        ImPlot::SetupAxisLimits(
          ImAxis_Y1, opts.y_min.value_or(default_range.Min), opts.y_max.value_or(default_range.Max), condition
        );

        std::invoke(std::forward<Callback>(callback));

        if (opts.maximizable && ImPlot::IsPlotHovered() && ImGui::IsMouseDoubleClicked(ImGuiMouseButton_Left)) {
            maximized_map[title] = !maximized_map[title];
        }

        ImPlot::EndPlot();
    }

    if (was_maximized) { ImGui::End(); }
}

void bars(const std::span<const std::string> labels, const std::span<const double> values);

struct [[nodiscard]] GanttBar final
{
    std::size_t row;
    double      start;
    double      end;
    int         colour;
};

// One horizontal lane per label, bars drawn from the current colormap. Must be called inside plot().
void gantt(const std::span<const std::string> lanes, const std::span<const GanttBar> bars);

} // namespace Plotting

} // namespace Gui
