#pragma once

#include "app_context.hpp"
#include "interfaces/i_usage_client.hpp"
#include "usage_snapshot.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <variant>
#include <vector>

namespace cml {

struct TimerTick {};
struct ManualRefresh {};
struct Quit {};
struct SelectMode {
    DisplayMode mode = DisplayMode::CurrentSession;
};
// Posted by a fetch task when its request finishes
struct FetchCompleted {
    FetchResult result;
};

using SchedulerEvent = std::variant<TimerTick, ManualRefresh, Quit, SelectMode, FetchCompleted>;

enum class SchedulerState {
    SettingUp,  // no successful fetch yet
    Serving,
    Stopped
};

struct SchedulerOptions {
    std::chrono::milliseconds refresh_interval{std::chrono::seconds(30)};
};

// Single dispatch loop over the timer, menu actions, quit requests and fetch
// completions. Events are handled one at a time in arrival order; fetches and
// config writes run on worker tasks so the loop never waits on I/O.
class RefreshScheduler {
public:
    // ctx must outlive the scheduler
    explicit RefreshScheduler(AppContext& ctx, SchedulerOptions options = {});
    ~RefreshScheduler();

    RefreshScheduler(const RefreshScheduler&) = delete;
    RefreshScheduler& operator=(const RefreshScheduler&) = delete;

    // Run the loop on a background thread
    void start();
    // Run the loop on the calling thread until Quit
    void run();
    // Wait for a loop started with start()
    void join();

    // Thread-safe. Dropped once the loop has stopped.
    void post(SchedulerEvent event);

    void request_refresh() { post(ManualRefresh{}); }
    void request_quit() { post(Quit{}); }
    void select_mode(DisplayMode mode) { post(SelectMode{mode}); }

    [[nodiscard]] DisplayMode display_mode() const { return mode_.load(); }
    [[nodiscard]] SchedulerState state() const { return state_.load(); }

    // Invoked on the loop thread after the Quit cleanup
    void set_on_quit(std::function<void()> callback);

private:
    struct QueuedEvent {
        SchedulerEvent event;
        std::chrono::steady_clock::time_point enqueued_at;
    };

    // Returns false when the loop must exit
    bool dispatch(SchedulerEvent& event);

    void handle_select_mode(DisplayMode mode);
    void handle_fetch_completed(const FetchResult& result);
    void handle_quit();

    void apply_snapshot(const UsageSnapshot& snapshot);
    void show_fetch_error(const FetchError& error);

    void launch_fetch();
    void persist_display_mode(DisplayMode mode);
    void launch_task(std::function<void()> task);
    void wait_for_tasks();

    AppContext& ctx_;
    SchedulerOptions options_;

    std::atomic<DisplayMode> mode_{DisplayMode::CurrentSession};
    std::atomic<SchedulerState> state_{SchedulerState::SettingUp};
    std::atomic<bool> stopping_{false};

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<QueuedEvent> queue_;

    std::mutex tasks_mutex_;
    std::vector<std::future<void>> tasks_;

    std::function<void()> on_quit_;
    std::thread loop_thread_;
};

} // namespace cml
