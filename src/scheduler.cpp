#include "scheduler.hpp"
#include "usage_format.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cassert>
#include <exception>
#include <optional>

namespace cml {

namespace {

constexpr const char* kErrorTitle = "⚪ Error";
constexpr const char* kErrorLine = "Error loading data";
constexpr const char* kSessionExpiredLine = "Session expired - please login again";

} // namespace

RefreshScheduler::RefreshScheduler(AppContext& ctx, SchedulerOptions options)
    : ctx_(ctx)
    , options_(options)
{
    assert(ctx_.usage_client && "usage_client must not be null");
    assert(ctx_.config_store && "config_store must not be null");
    assert(ctx_.indicator && "indicator must not be null");

    mode_ = ctx_.config_store->load_display_mode();
}

RefreshScheduler::~RefreshScheduler() {
    if (loop_thread_.joinable()) {
        request_quit();
        loop_thread_.join();
    }
    wait_for_tasks();
}

void RefreshScheduler::start() {
    if (loop_thread_.joinable()) return;
    loop_thread_ = std::thread(&RefreshScheduler::run, this);
}

void RefreshScheduler::join() {
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
}

void RefreshScheduler::set_on_quit(std::function<void()> callback) {
    on_quit_ = std::move(callback);
}

void RefreshScheduler::post(SchedulerEvent event) {
    {
        std::lock_guard lock(queue_mutex_);
        if (stopping_) return;
        queue_.push_back({std::move(event), std::chrono::steady_clock::now()});
    }
    queue_cv_.notify_one();
}

void RefreshScheduler::run() {
    if (state_ == SchedulerState::Stopped) return;

    const auto interval = options_.refresh_interval;
    spdlog::info("[scheduler] started, refresh every {}s, showing {}",
                 std::chrono::duration_cast<std::chrono::seconds>(interval).count(),
                 display_mode_key(mode_.load()));

    // Placeholder (or last known data) until the first fetch lands
    const auto cached = ctx_.cache.get();
    const auto initial = render_indicator(cached.get(), mode_.load(), std::chrono::system_clock::now());
    ctx_.indicator->set_selected(initial.selected);
    ctx_.indicator->set_title(initial.title, initial.tier);
    for (const auto w : kAllWindows) {
        ctx_.indicator->set_line(w, initial.line(w));
    }

    launch_fetch();
    auto next_tick = std::chrono::steady_clock::now() + interval;

    while (true) {
        std::optional<SchedulerEvent> event;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait_until(lock, next_tick, [this] { return !queue_.empty(); });

            const auto now = std::chrono::steady_clock::now();
            const bool tick_due = now >= next_tick;

            // A tick that fell due before the oldest queued event arrived goes first
            if (tick_due && (queue_.empty() || queue_.front().enqueued_at >= next_tick)) {
                event = TimerTick{};
                next_tick += interval;
                if (next_tick <= now) {
                    next_tick = now + interval;
                }
            } else if (!queue_.empty()) {
                event = std::move(queue_.front().event);
                queue_.pop_front();
            }
        }

        if (event && !dispatch(*event)) {
            break;
        }
    }

    spdlog::info("[scheduler] stopped");
}

bool RefreshScheduler::dispatch(SchedulerEvent& event) {
    if (std::holds_alternative<TimerTick>(event)) {
        spdlog::debug("[scheduler] timer tick");
        launch_fetch();
    } else if (std::holds_alternative<ManualRefresh>(event)) {
        spdlog::info("[scheduler] manual refresh");
        launch_fetch();
    } else if (const auto* select = std::get_if<SelectMode>(&event)) {
        handle_select_mode(select->mode);
    } else if (const auto* completed = std::get_if<FetchCompleted>(&event)) {
        handle_fetch_completed(completed->result);
    } else if (std::holds_alternative<Quit>(event)) {
        handle_quit();
        return false;
    }
    return true;
}

void RefreshScheduler::handle_select_mode(const DisplayMode mode) {
    spdlog::info("[scheduler] display mode -> {}", display_mode_key(mode));

    mode_ = mode;
    ctx_.indicator->set_selected(mode);

    if (const auto snapshot = ctx_.cache.get()) {
        const auto vm = render_indicator(snapshot.get(), mode, std::chrono::system_clock::now());
        ctx_.indicator->set_title(vm.title, vm.tier);
    }

    persist_display_mode(mode);
}

void RefreshScheduler::handle_fetch_completed(const FetchResult& result) {
    if (result.ok()) {
        apply_snapshot(*result.snapshot);
        if (state_ == SchedulerState::SettingUp) {
            spdlog::info("[scheduler] first usage data received");
        }
        state_ = SchedulerState::Serving;
        return;
    }

    if (result.error) {
        show_fetch_error(*result.error);
    } else {
        show_fetch_error(FetchError{FetchErrorKind::Other, "empty response"});
    }
}

void RefreshScheduler::handle_quit() {
    spdlog::info("[scheduler] quit requested");
    {
        std::lock_guard lock(queue_mutex_);
        stopping_ = true;
        queue_.clear();
    }
    state_ = SchedulerState::Stopped;

    if (ctx_.instance) {
        if (const auto result = ctx_.instance->release(); !result.success) {
            spdlog::warn("[scheduler] failed to remove liveness marker: {}", result.error_message);
        }
    }

    if (on_quit_) {
        on_quit_();
    }
}

void RefreshScheduler::apply_snapshot(const UsageSnapshot& snapshot) {
    const auto vm = render_indicator(&snapshot, mode_.load(), std::chrono::system_clock::now());

    ctx_.indicator->set_session_expired(false);
    ctx_.indicator->set_title(vm.title, vm.tier);
    for (const auto w : kAllWindows) {
        ctx_.indicator->set_line(w, vm.line(w));
    }
    ctx_.indicator->set_selected(vm.selected);

    spdlog::debug("[scheduler] indicator updated: {}", vm.title);
}

void RefreshScheduler::show_fetch_error(const FetchError& error) {
    ctx_.indicator->set_title(kErrorTitle, UsageTier::Neutral);

    if (error.is_auth_failure()) {
        spdlog::warn("[scheduler] session expired: {}", error.message);
        ctx_.indicator->set_line(UsageWindow::CurrentSession, kSessionExpiredLine);
        ctx_.indicator->set_session_expired(true);
    } else {
        spdlog::error("[scheduler] failed to fetch usage: {}", error.message);
        ctx_.indicator->set_line(UsageWindow::CurrentSession, kErrorLine);
    }
}

void RefreshScheduler::launch_fetch() {
    launch_task([this] {
        FetchResult result;
        try {
            result = ctx_.usage_client->fetch_usage();
        } catch (const std::exception& e) {
            result = FetchResult::failure(FetchErrorKind::Other, e.what());
        }

        // Results landing after Quit go unobserved
        if (stopping_) return;

        if (result.ok()) {
            ctx_.cache.set(result.snapshot);
        }
        post(FetchCompleted{std::move(result)});
    });
}

void RefreshScheduler::persist_display_mode(const DisplayMode mode) {
    launch_task([this, mode] {
        OpResult result;
        try {
            result = ctx_.config_store->save_display_mode(mode);
        } catch (const std::exception& e) {
            result = OpResult::fail(e.what());
        }
        if (!result.success) {
            spdlog::warn("[scheduler] failed to save display mode: {}", result.error_message);
        }
    });
}

void RefreshScheduler::launch_task(std::function<void()> task) {
    std::lock_guard lock(tasks_mutex_);
    std::erase_if(tasks_, [](const std::future<void>& f) {
        return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    });
    tasks_.push_back(std::async(std::launch::async, std::move(task)));
}

void RefreshScheduler::wait_for_tasks() {
    std::vector<std::future<void>> pending;
    {
        std::lock_guard lock(tasks_mutex_);
        pending.swap(tasks_);
    }
    for (auto& task : pending) {
        task.wait();
    }
}

} // namespace cml
