#pragma once

#include "../indicator_state.hpp"
#include "../scheduler.hpp"
#include "../viewmodels/indicator_view_model.hpp"
#include <atomic>
#include <string>
#include <ncurses.h>

namespace cml {

// Terminal rendition of the indicator and its menu for `watch`
class TuiApp {
public:
    // Non-owning: both pointers must be non-null and outlive the TuiApp.
    // The scheduler is started by run() and joined before run() returns.
    TuiApp(IndicatorState* indicator, RefreshScheduler* scheduler);
    ~TuiApp();

    TuiApp(const TuiApp&) = delete;
    TuiApp& operator=(const TuiApp&) = delete;

    void run();

private:
    // Rendering
    void render();
    void render_usage_panel();
    void render_status_bar();
    void draw_box_title(WINDOW* win, const std::string& title);

    // Input handling
    void handle_input(int ch);
    void move_cursor(int delta);

    // Window management
    void create_windows();
    void resize_windows();
    void cleanup_windows();

    IndicatorState* indicator_ = nullptr;
    RefreshScheduler* scheduler_ = nullptr;

    IndicatorViewModel view_model_;

    WINDOW* usage_win_ = nullptr;
    WINDOW* status_win_ = nullptr;

    // Menu row under the cursor, 0..2 for the usage windows
    int cursor_ = 0;
    std::atomic<bool> running_{false};

    static constexpr int kUsagePanelHeight = 7;
    static constexpr int kStatusBarHeight = 1;
};

} // namespace cml
