#include "Gui.hpp"

#include <array>
#include <ranges>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

static void glfw_error_callback(int error, const char* description)
{
    std::println(stderr, "[ERROR] (GLFW) error {}: {}", error, description);
}

namespace Gui
{

auto init_window(const std::string& title, const int width, const int height) -> std::optional<GLFWwindow*>
{
    glfwSetErrorCallback(glfw_error_callback);

    if (glfwInit() == 0) {
        std::println(stderr, "[ERROR] (GLFW) Failed to initialize");
        return std::nullopt;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    GLFWwindow* window = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
    if (window == nullptr) {
        std::println(stderr, "[ERROR] (GLFW) failed to create window");
        glfwTerminate();
        return std::nullopt;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init(GLSL_VERSION);

    return window;
}

void shutdown(GLFWwindow* window)
{
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    glfwDestroyWindow(window);
    glfwTerminate();
}

void new_frame()
{
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
}

void load_default_fonts(const float regular_size, const float bold_size)
{
    constexpr static auto REGULAR_FONT_PATH = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";
    constexpr static auto BOLD_FONT_PATH    = "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf";

    // ImGui asserts on a missing font file, fall back to the builtin font instead.
    if (!std::filesystem::exists(REGULAR_FONT_PATH) || !std::filesystem::exists(BOLD_FONT_PATH)) {
        std::println(stderr, "[NOTE] (gui) DejaVu fonts not found, using the default font");
        return;
    }

    auto& io = ImGui::GetIO();
    io.Fonts->Clear();

    regular_font   = io.Fonts->AddFontFromFileTTF(REGULAR_FONT_PATH, regular_size);
    io.FontDefault = regular_font;

    bold_font = io.Fonts->AddFontFromFileTTF(BOLD_FONT_PATH, bold_size);
}

void black_and_red_style()
{
    constexpr static auto BLACK       = hex_colour_to_imvec4(0x181818);
    constexpr static auto DARK_GREY   = hex_colour_to_imvec4(0x252525);
    constexpr static auto GREY        = hex_colour_to_imvec4(0x383838);
    constexpr static auto LIGHT_GREY  = hex_colour_to_imvec4(0x4A4A4A);
    constexpr static auto RED         = hex_colour_to_imvec4(0xB3261E);
    constexpr static auto BRIGHT_RED  = hex_colour_to_imvec4(0xD9382E);
    constexpr static auto DARK_RED    = hex_colour_to_imvec4(0x7A1A14);
    constexpr static auto TEXT        = hex_colour_to_imvec4(0xE6E6E6);
    constexpr static auto DIMMED_TEXT = hex_colour_to_imvec4(0x808080);

    auto& style            = ImGui::GetStyle();
    style.WindowRounding   = 0.0F;
    style.ChildRounding    = 2.0F;
    style.FrameRounding    = 2.0F;
    style.GrabRounding     = 2.0F;
    style.PopupRounding    = 2.0F;
    style.WindowBorderSize = 0.0F;
    style.FramePadding     = ImVec2(8.0F, 4.0F);
    style.ItemSpacing      = ImVec2(8.0F, 6.0F);

    auto& colors                          = style.Colors;
    colors[ImGuiCol_Text]                 = TEXT;
    colors[ImGuiCol_TextDisabled]         = DIMMED_TEXT;
    colors[ImGuiCol_WindowBg]             = BLACK;
    colors[ImGuiCol_ChildBg]              = BLACK;
    colors[ImGuiCol_PopupBg]              = DARK_GREY;
    colors[ImGuiCol_Border]               = GREY;
    colors[ImGuiCol_FrameBg]              = DARK_GREY;
    colors[ImGuiCol_FrameBgHovered]       = GREY;
    colors[ImGuiCol_FrameBgActive]        = LIGHT_GREY;
    colors[ImGuiCol_TitleBg]              = DARK_RED;
    colors[ImGuiCol_TitleBgActive]        = RED;
    colors[ImGuiCol_TitleBgCollapsed]     = DARK_RED;
    colors[ImGuiCol_ScrollbarBg]          = BLACK;
    colors[ImGuiCol_ScrollbarGrab]        = GREY;
    colors[ImGuiCol_ScrollbarGrabHovered] = LIGHT_GREY;
    colors[ImGuiCol_ScrollbarGrabActive]  = RED;
    colors[ImGuiCol_CheckMark]            = BRIGHT_RED;
    colors[ImGuiCol_SliderGrab]           = RED;
    colors[ImGuiCol_SliderGrabActive]     = BRIGHT_RED;
    colors[ImGuiCol_Button]               = DARK_GREY;
    colors[ImGuiCol_ButtonHovered]        = DARK_RED;
    colors[ImGuiCol_ButtonActive]         = RED;
    colors[ImGuiCol_Header]               = DARK_RED;
    colors[ImGuiCol_HeaderHovered]        = RED;
    colors[ImGuiCol_HeaderActive]         = BRIGHT_RED;
    colors[ImGuiCol_Separator]            = GREY;
    colors[ImGuiCol_TableHeaderBg]        = DARK_GREY;
    colors[ImGuiCol_TableBorderStrong]    = GREY;
    colors[ImGuiCol_TableBorderLight]     = DARK_GREY;
    colors[ImGuiCol_TableRowBg]           = BLACK;
    colors[ImGuiCol_TableRowBgAlt]        = DARK_GREY;

    auto& plot_colors                 = ImPlot::GetStyle().Colors;
    plot_colors[ImPlotCol_FrameBg]    = BLACK;
    plot_colors[ImPlotCol_PlotBg]     = DARK_GREY;
    plot_colors[ImPlotCol_PlotBorder] = GREY;
    ImPlot::GetStyle().Colormap       = ImPlotColormap_Deep;
}

auto Texture::load_from_file(const std::filesystem::path& path) -> Texture
{
    int           width    = -1;
    int           height   = -1;
    int           channels = -1;
    std::uint8_t* bytes    = stbi_load(path.string().c_str(), &width, &height, &channels, 4);
    if (bytes == nullptr) {
        std::println(stderr, "[NOTE] (stb) could not load {}, falling back to a text button", path.string());
        return Texture(std::nullopt);
    }

    GLuint texture_id = 0;
    glGenTextures(1, &texture_id);
    glBindTexture(GL_TEXTURE_2D, texture_id);

    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, width, height, 0, GL_RGBA, GL_UNSIGNED_BYTE, bytes);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);

    stbi_image_free(bytes);

    return Texture(texture_id);
}

Texture::~Texture()
{
    if (texture_id.has_value()) { glDeleteTextures(1, &texture_id.value()); }
}

Texture::Texture(Texture&& other) noexcept
  : texture_id { std::exchange(other.texture_id, std::nullopt) }
{}

Texture& Texture::operator=(Texture&& other) noexcept
{
    if (this != &other) {
        if (texture_id.has_value()) { glDeleteTextures(1, &texture_id.value()); }
        texture_id = std::exchange(other.texture_id, std::nullopt);
    }
    return *this;
}

void center_content_horizontally(const float content_width)
{
    const auto spacing         = ImGui::GetStyle().ItemSpacing.x;
    const auto total_width     = content_width + spacing;
    const auto available_width = ImGui::GetContentRegionAvail().x;
    ImGui::SetCursorPosX((available_width - total_width) * 0.5F);
}

auto grid_layout_calc_size(const std::size_t rows, const std::size_t cols, const ImVec2& available_space) -> ImVec2
{
    const auto spacing = ImGui::GetStyle().ItemSpacing;

    return {
        (available_space.x - (spacing.x * static_cast<float>(cols))) / static_cast<float>(cols),
        (available_space.y - (spacing.y * static_cast<float>(rows))) / static_cast<float>(rows),
    };
}

auto input_text_popup(const std::string& label, bool& condition) -> std::optional<std::string>
{
    auto center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5F, 0.5F));
    ImGui::SetNextWindowSize(ImVec2(300, 120), ImGuiCond_Appearing);

    static std::array<char, 256> buffer {};
    ImGui::OpenPopup("##InputPopup");
    if (ImGui::BeginPopupModal("##InputPopup", &condition, ImGuiWindowFlags_AlwaysAutoResize)) {
        if (ImGui::IsWindowAppearing()) { ImGui::SetKeyboardFocusHere(); }

        if (ImGui::IsKeyPressed(ImGuiKey_Escape)) {
            condition = false;
            buffer.fill('\0');
            ImGui::CloseCurrentPopup();
            ImGui::EndPopup();
            return std::nullopt;
        }

        if (bold_font != nullptr) { ImGui::PushFont(bold_font); }
        Gui::text("{}", label);
        ImGui::SameLine();
        if (bold_font != nullptr) { ImGui::PopFont(); }

        if (ImGui::InputText("##InputText", buffer.data(), buffer.size(), ImGuiInputTextFlags_EnterReturnsTrue)) {
            std::string result { buffer.data() };
            buffer.fill('\0');
            condition = false;

            ImGui::CloseCurrentPopup();
            ImGui::EndPopup();
            return result;
        }

        ImGui::EndPopup();
    }

    return std::nullopt;
}

void ToastManager::render()
{
    const auto delta_time = std::chrono::duration<float>(ImGui::GetIO().DeltaTime);
    const auto spacing    = ImGui::GetStyle().ItemSpacing;

    float y_offset = 0.0F;
    for (auto it = toasts.begin(); it != toasts.end();) {
        auto& toast = *it;

        toast.duration -= delta_time;
        if (toast.duration <= std::chrono::seconds(0)) {
            it = toasts.erase(it);
            continue;
        }

        const auto toast_size = ImVec2(ImGui::CalcTextSize(toast.message.c_str()).x + (spacing.x * 2), 30);
        auto       position   = toast_position_to_vector(toast.position, toast_size);

        if (toast.position == ToastPosition::BottomLeft || toast.position == ToastPosition::BottomRight) {
            position.y -= y_offset;
        } else {
            position.y += y_offset;
        }

        constexpr static auto window_flags = WindowFlags::NoDecoration | WindowFlags::NoSavedSettings;

        ImGui::SetNextWindowPos(position);
        ImGui::SetNextWindowSize(toast_size);
        Gui::window(std::format("##Toast{}", std::distance(toasts.begin(), it)), window_flags, [&] {
            ImGui::PushStyleColor(ImGuiCol_Text, toast_level_to_color(toast.level));
            Gui::text("{}", toast.message);
            ImGui::PopStyleColor();
        });

        y_offset += toast_size.y + spacing.y;
        ++it;
    }
}

auto ToastManager::toast_level_to_color(ToastLevel level) -> ImVec4
{
    switch (level) {
        case ToastLevel::Info: {
            return { 0.2F, 0.6F, 1.0F, 1.0F };
        }
        case ToastLevel::Warning: {
            return { 1.0F, 0.6F, 0.0F, 1.0F };
        }
        case ToastLevel::Error: {
            return { 1.0F, 0.2F, 0.2F, 1.0F };
        }
    }

    assert(false && "unreachable");
    return { 1.0F, 0.2F, 0.2F, 1.0F };
}

auto ToastManager::toast_position_to_vector(ToastPosition position, const ImVec2& toast_size) -> ImVec2
{
    const auto spacing       = ImGui::GetStyle().ItemSpacing;
    const auto work_position = ImGui::GetMainViewport()->WorkPos;
    const auto work_size     = ImGui::GetMainViewport()->WorkSize;

    switch (position) {
        case ToastPosition::TopLeft: {
            return { work_position.x + spacing.x, work_position.y + spacing.y };
        }
        case ToastPosition::TopRight: {
            return { work_position.x + work_size.x - toast_size.x - spacing.x, work_position.y + spacing.y };
        }
        case ToastPosition::BottomLeft: {
            return { work_position.x + spacing.x, work_position.y + work_size.y - toast_size.y - spacing.y };
        }
        case ToastPosition::BottomRight: {
            return {
                work_position.x + work_size.x - toast_size.x - spacing.x,
                work_position.y + work_size.y - toast_size.y - spacing.y,
            };
        }
    }

    assert(false && "unreachable");
    return { 0, 0 };
}

void toast(
  const std::string&                 message,
  ToastPosition                      position,
  const std::chrono::duration<float> duration,
  ToastLevel                         level
)
{
    ToastManager::add(Toast {
      .message  = message,
      .duration = duration,
      .level    = level,
      .position = position,
    });
}

namespace Plotting
{

void bars(const std::span<const std::string> labels, const std::span<const double> values)
{
    constexpr static auto BAR_WIDTH = 0.5F;

    std::vector<const char*> labels_cstr;
    labels_cstr.reserve(labels.size());
    for (const auto& label : labels) { labels_cstr.push_back(label.c_str()); }

    std::vector<double> positions {};
    positions.reserve(labels.size());
    for (std::size_t pos = 0; pos < labels.size(); ++pos) { positions.push_back(static_cast<double>(pos)); }

    ImPlot::SetupAxisTicks(ImAxis_X1, positions.data(), static_cast<int>(positions.size()), labels_cstr.data());

    const auto point = std::views::zip(positions, values);
    for (const auto& [idx, coords] : std::views::zip(std::views::iota(0UL), point)) {
        const auto& [x, y] = coords;
        ImPlot::PushStyleColor(
          ImPlotCol_Fill, ImPlot::GetColormapColor(static_cast<int>(idx) % ImPlot::GetColormapSize())
        );
        ImPlot::PlotBars(labels_cstr[idx], &x, &y, 1, BAR_WIDTH);
        ImPlot::PopStyleColor();
    }

    if (!ImPlot::IsPlotHovered()) { return; }

    const auto mouse_position = ImPlot::GetPlotMousePos();
    for (const auto& [position, value] : std::views::zip(positions, values)) {
        const auto half_width = BAR_WIDTH / 2.0;
        const auto x_range    = ImPlotRange(position - half_width, position + half_width);
        const auto y_range    = ImPlotRange(0, value);

        if (x_range.Contains(mouse_position.x) && y_range.Contains(mouse_position.y)) {
            Gui::tooltip("{:.2f}", value);
        }
    }
}

void gantt(const std::span<const std::string> lanes, const std::span<const GanttBar> bars)
{
    constexpr static auto LANE_HEIGHT = 0.6;

    std::vector<const char*> lanes_cstr;
    lanes_cstr.reserve(lanes.size());
    for (const auto& lane : lanes) { lanes_cstr.push_back(lane.c_str()); }

    std::vector<double> positions {};
    positions.reserve(lanes.size());
    for (std::size_t pos = 0; pos < lanes.size(); ++pos) { positions.push_back(static_cast<double>(pos)); }

    ImPlot::SetupAxisTicks(ImAxis_Y1, positions.data(), static_cast<int>(positions.size()), lanes_cstr.data());

    auto* draw_list = ImPlot::GetPlotDrawList();
    ImPlot::PushPlotClipRect();

    const auto mouse_position = ImPlot::GetPlotMousePos();
    const bool hovered        = ImPlot::IsPlotHovered();

    for (const auto& bar : bars) {
        const auto lane = static_cast<double>(bar.row);
        const auto min  = ImPlot::PlotToPixels(bar.start, lane - (LANE_HEIGHT / 2.0));
        const auto max  = ImPlot::PlotToPixels(bar.end, lane + (LANE_HEIGHT / 2.0));

        const auto colour = ImPlot::GetColormapColor(bar.colour % ImPlot::GetColormapSize());
        draw_list->AddRectFilled(min, max, ImGui::GetColorU32(colour));
        draw_list->AddRect(min, max, ImGui::GetColorU32(ImGuiCol_Border));

        const auto x_range = ImPlotRange(bar.start, bar.end);
        const auto y_range = ImPlotRange(lane - (LANE_HEIGHT / 2.0), lane + (LANE_HEIGHT / 2.0));
        if (hovered && x_range.Contains(mouse_position.x) && y_range.Contains(mouse_position.y)) {
            Gui::tooltip("{}: {} - {}", lanes[bar.row], bar.start, bar.end);
        }
    }

    ImPlot::PopPlotClipRect();
}

} // namespace Plotting

void draw_call(GLFWwindow* window, const ImVec4& clear_color)
{
    ToastManager::render();
    ImGui::Render();
    int display_w = 0;
    int display_h = 0;
    glfwGetFramebufferSize(window, &display_w, &display_h);
    glViewport(0, 0, display_w, display_h);
    glClearColor(
      clear_color.x * clear_color.w, clear_color.y * clear_color.w, clear_color.z * clear_color.w, clear_color.w
    );
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    glfwSwapBuffers(window);
}

} // namespace Gui
