#include "imgui_app.hpp"
#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"
#include <GLFW/glfw3.h>
#include <spdlog/spdlog.h>
#include <cassert>
#include <stdexcept>

namespace cml {

namespace {

constexpr const char* kAppName = "Claude Monitor Lite";
constexpr const char* kMenuTooltip = "Click to show in menu bar";

ImVec4 tier_color(const UsageTier tier) {
    switch (tier) {
        case UsageTier::Low: return {0.35f, 0.80f, 0.40f, 1.0f};
        case UsageTier::Mid: return {0.95f, 0.80f, 0.25f, 1.0f};
        case UsageTier::High: return {0.95f, 0.35f, 0.30f, 1.0f};
        case UsageTier::Neutral: break;
    }
    return {0.75f, 0.75f, 0.75f, 1.0f};
}

} // namespace

ImGuiApp::ImGuiApp(IndicatorState* indicator, RefreshScheduler* scheduler)
    : indicator_(indicator)
    , scheduler_(scheduler) {

    assert(indicator_ && "IndicatorState must not be null");
    assert(scheduler_ && "RefreshScheduler must not be null");

    // Wake the UI whenever the scheduler changes what is shown
    indicator_->set_on_changed([this]() {
        wake_event_loop();
    });

    scheduler_->set_on_quit([this]() {
        quit_requested_ = true;
        wake_event_loop();
    });
}

ImGuiApp::~ImGuiApp() {
    indicator_->set_on_changed(nullptr);
}

void ImGuiApp::run() {
    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }

    // GL 3.3 + GLSL 330
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);

    // Set Wayland app_id for desktop integration
    glfwWindowHintString(GLFW_WAYLAND_APP_ID, "claude-monitor-lite");

    window_ = glfwCreateWindow(560, 260, kAppName, nullptr, nullptr);
    if (!window_) {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window");
    }

    glfwMakeContextCurrent(window_);
    glfwSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    io.FontGlobalScale = 1.3f;
    ImGui::GetStyle().ScaleAllSizes(1.3f);

    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 0.0f;
    style.FrameRounding = 2.0f;

    ImGui_ImplGlfw_InitForOpenGL(window_, true);
    ImGui_ImplOpenGL3_Init("#version 330");

    scheduler_->start();

    while (!glfwWindowShouldClose(window_) && !quit_requested_) {
        // Countdowns are recomputed by the scheduler; a slow timeout is enough
        glfwWaitEventsTimeout(1.0);

        view_model_ = indicator_->snapshot();
        sync_window_title();

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        render();

        ImGui::Render();
        int display_w, display_h;
        glfwGetFramebufferSize(window_, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window_);
    }

    // Closing the window counts as Quit
    if (!quit_requested_) {
        spdlog::info("[ui] window closed");
        scheduler_->request_quit();
    }
    scheduler_->join();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    {
        std::lock_guard lock(window_mutex_);
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
    glfwTerminate();
}

void ImGuiApp::wake_event_loop() {
    std::lock_guard lock(window_mutex_);
    if (!window_) return;
    glfwPostEmptyEvent();
}

void ImGuiApp::sync_window_title() {
    if (view_model_.title == window_title_) return;
    window_title_ = view_model_.title;
    glfwSetWindowTitle(window_, window_title_.c_str());
}

void ImGuiApp::render() {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    constexpr ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                       ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus;
    if (ImGui::Begin("##indicator", nullptr, flags)) {
        render_indicator_header();
        ImGui::Separator();
        render_usage_menu();
        ImGui::Separator();
        render_actions();
    }
    ImGui::End();
}

void ImGuiApp::render_indicator_header() {
    ImGui::PushStyleColor(ImGuiCol_Text, tier_color(view_model_.tier));
    ImGui::TextUnformatted(view_model_.title.c_str());
    ImGui::PopStyleColor();

    if (view_model_.session_expired) {
        ImGui::SameLine();
        ImGui::TextDisabled("(run 'claude-monitor-lite logout' then restart)");
    }
}

void ImGuiApp::render_usage_menu() {
    for (const auto w : kAllWindows) {
        const auto& line = view_model_.line(w);
        ImGui::PushID(static_cast<int>(window_index(w)));
        if (ImGui::MenuItem(line.c_str(), nullptr, view_model_.is_selected(w)) && !view_model_.is_selected(w)) {
            scheduler_->select_mode(w);
        }
        if (ImGui::IsItemHovered()) {
            ImGui::SetTooltip("%s", kMenuTooltip);
        }
        ImGui::PopID();
    }
}

void ImGuiApp::render_actions() {
    if (ImGui::MenuItem("Refresh Now")) {
        scheduler_->request_refresh();
    }
    if (ImGui::IsItemHovered()) {
        ImGui::SetTooltip("Refresh usage data");
    }

    if (ImGui::MenuItem("Quit")) {
        scheduler_->request_quit();
    }
    if (ImGui::IsItemHovered()) {
        ImGui::SetTooltip("Quit the application");
    }
}

} // namespace cml
