#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>
#include <cassert>
#include <chrono>
#include <clocale>
#include <csignal>
#include <thread>

namespace cml {

// Signal handler for terminal resize
static std::atomic<bool> g_resize_requested{false};

static void handle_resize([[maybe_unused]] int sig) {
    g_resize_requested.store(true);
}

TuiApp::TuiApp(IndicatorState* indicator, RefreshScheduler* scheduler)
    : indicator_(indicator)
    , scheduler_(scheduler)
{
    assert(indicator_ != nullptr);
    assert(scheduler_ != nullptr);

    scheduler_->set_on_quit([this]() {
        running_ = false;
    });
}

TuiApp::~TuiApp() {
    cleanup_windows();
}

void TuiApp::run() {
    // Emoji in the indicator need a UTF-8 locale
    setlocale(LC_ALL, "");

    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);  // Hide cursor
    nodelay(stdscr, TRUE);  // Non-blocking input

    init_colors();

    printf("\033]0;Claude Monitor Lite\007");
    fflush(stdout);

    signal(SIGWINCH, handle_resize);

    create_windows();

    running_ = true;
    scheduler_->start();
    view_model_ = indicator_->snapshot();
    cursor_ = static_cast<int>(window_index(view_model_.selected));

    while (running_) {
        if (g_resize_requested.exchange(false)) {
            endwin();
            refresh();
            resize_windows();
        }

        if (const int ch = getch(); ch != ERR) {
            handle_input(ch);
        }

        view_model_ = indicator_->snapshot();
        render();

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    // Leaving via q already queued Quit; make sure the loop is gone
    scheduler_->request_quit();
    scheduler_->join();

    cleanup_windows();
    endwin();

    printf("\033]0;\007");
    fflush(stdout);
}

void TuiApp::create_windows() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    const int usage_height = std::min(kUsagePanelHeight, std::max(3, max_y - kStatusBarHeight));
    usage_win_ = newwin(usage_height, max_x, 0, 0);
    status_win_ = newwin(kStatusBarHeight, max_x, std::max(0, max_y - kStatusBarHeight), 0);
}

void TuiApp::resize_windows() {
    cleanup_windows();
    create_windows();
}

void TuiApp::cleanup_windows() {
    if (usage_win_) {
        delwin(usage_win_);
        usage_win_ = nullptr;
    }
    if (status_win_) {
        delwin(status_win_);
        status_win_ = nullptr;
    }
}

void TuiApp::render() {
    werase(usage_win_);
    werase(status_win_);

    render_usage_panel();
    render_status_bar();

    wnoutrefresh(usage_win_);
    wnoutrefresh(status_win_);
    doupdate();
}

void TuiApp::draw_box_title(WINDOW* win, const std::string& title) {
    wattron(win, COLOR_PAIR(COLOR_PAIR_BORDER));
    box(win, 0, 0);
    wattroff(win, COLOR_PAIR(COLOR_PAIR_BORDER));
    if (!title.empty()) {
        wattron(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
        mvwprintw(win, 0, 2, " %s ", title.c_str());
        wattroff(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    }
}

void TuiApp::render_usage_panel() {
    draw_box_title(usage_win_, "Claude Monitor Lite");

    const int tier_attr = COLOR_PAIR(get_tier_color(view_model_.tier)) | A_BOLD;
    wattron(usage_win_, tier_attr);
    mvwprintw(usage_win_, 1, 2, "%s", view_model_.title.c_str());
    wattroff(usage_win_, tier_attr);

    int row = 2;
    for (const auto w : kAllWindows) {
        const int index = static_cast<int>(window_index(w));
        const bool under_cursor = index == cursor_;
        const char* mark = view_model_.is_selected(w) ? "[x]" : "[ ]";

        if (under_cursor) wattron(usage_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
        mvwprintw(usage_win_, row, 2, "%d %s %s", index + 1, mark, view_model_.line(w).c_str());
        if (under_cursor) wattroff(usage_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
        ++row;
    }

    if (view_model_.session_expired) {
        wattron(usage_win_, COLOR_PAIR(COLOR_PAIR_ERROR));
        mvwprintw(usage_win_, row, 2, "Run 'claude-monitor-lite logout' then restart.");
        wattroff(usage_win_, COLOR_PAIR(COLOR_PAIR_ERROR));
    }
}

void TuiApp::render_status_bar() {
    wbkgd(status_win_, COLOR_PAIR(COLOR_PAIR_STATUS));
    mvwprintw(status_win_, 0, 1, "%s", "q:Quit  r:Refresh  1-3/Enter:Show in indicator  Up/Down:Move");
}

void TuiApp::move_cursor(const int delta) {
    const int count = static_cast<int>(kAllWindows.size());
    cursor_ = (cursor_ + delta + count) % count;
}

void TuiApp::handle_input(const int ch) {
    switch (ch) {
        case 'q':
        case 'Q':
            scheduler_->request_quit();
            running_ = false;
            break;
        case 'r':
        case 'R':
            scheduler_->request_refresh();
            break;
        case '1':
        case '2':
        case '3':
            cursor_ = ch - '1';
            scheduler_->select_mode(kAllWindows[static_cast<size_t>(cursor_)]);
            break;
        case KEY_UP:
        case 'k':
            move_cursor(-1);
            break;
        case KEY_DOWN:
        case 'j':
            move_cursor(1);
            break;
        case '\n':
        case KEY_ENTER:
            scheduler_->select_mode(kAllWindows[static_cast<size_t>(cursor_)]);
            break;
        default:
            break;
    }
}

} // namespace cml
