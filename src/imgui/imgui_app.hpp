#pragma once

#include "../indicator_state.hpp"
#include "../scheduler.hpp"
#include "../viewmodels/indicator_view_model.hpp"
#include <atomic>
#include <mutex>
#include <string>

struct GLFWwindow;

namespace cml {

// Small always-available window standing in for the tray indicator: the
// compact title, one selectable line per usage window, Refresh Now and Quit.
class ImGuiApp {
public:
    // Non-owning: both pointers must be non-null and outlive the ImGuiApp.
    // The scheduler is started by run() and joined before run() returns.
    ImGuiApp(IndicatorState* indicator, RefreshScheduler* scheduler);
    ~ImGuiApp();

    ImGuiApp(const ImGuiApp&) = delete;
    ImGuiApp& operator=(const ImGuiApp&) = delete;

    void run();

private:
    void render();
    void render_indicator_header();
    void render_usage_menu();
    void render_actions();
    void sync_window_title();

    IndicatorState* indicator_ = nullptr;
    RefreshScheduler* scheduler_ = nullptr;

    // Copy of the indicator taken once per frame
    IndicatorViewModel view_model_;
    std::string window_title_;

    GLFWwindow* window_ = nullptr;
    std::atomic<bool> quit_requested_{false};

    // Every change posts its own wakeup; guards window_ against teardown
    void wake_event_loop();
    std::mutex window_mutex_;
};

} // namespace cml
