#include "app_context.hpp"
#include "app_paths.hpp"
#include "auth.hpp"
#include "commands.hpp"
#include "config_store.hpp"
#include "detacher.hpp"
#include "imgui/imgui_app.hpp"
#include "indicator_state.hpp"
#include "logging.hpp"
#include "platform_factory.hpp"
#include "scheduler.hpp"
#include "signal_watcher.hpp"
#include "single_instance.hpp"
#include "tui/tui_app.hpp"
#include "usage_client.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <csignal>
#include <iostream>
#include <memory>
#include <string_view>
#include <unistd.h>

namespace {

// curl_global_init/cleanup bracket, set up before any thread exists
class CurlGlobal {
public:
    CurlGlobal() : ok_(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) {}
    ~CurlGlobal() {
        if (ok_) curl_global_cleanup();
    }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    [[nodiscard]] bool ok() const { return ok_; }

private:
    bool ok_ = false;
};

// Background worker: claim the marker, then serve the indicator until Quit
int run_daemon(const cml::AppPaths& paths, cml::SingleInstance& instance, cml::IConfigStore& store) {
    if (!cml::init_worker_logging(paths.log_file)) {
        return 1;
    }
    spdlog::info("[daemon] starting, PID {}", getpid());

    if (const auto claimed = instance.claim(); !claimed.success) {
        spdlog::error("[daemon] failed to create PID file: {}", claimed.error_message);
        return 1;
    }

    const auto session = store.load_session();
    if (!session) {
        spdlog::error("[daemon] not authenticated; run 'claude-monitor-lite' to login first");
        if (const auto released = instance.release(); !released.success) {
            spdlog::warn("[daemon] failed to remove PID file: {}", released.error_message);
        }
        return 1;
    }

    cml::ClaudeUsageClient client(*session);
    cml::IndicatorState indicator;

    cml::AppContext ctx;
    ctx.usage_client = &client;
    ctx.config_store = &store;
    ctx.indicator = &indicator;
    ctx.instance = &instance;

    cml::RefreshScheduler scheduler(ctx);

    cml::SignalWatcher watcher;
    const bool watching = watcher.start([&scheduler](int) {
        scheduler.request_quit();
    });
    if (!watching) {
        // Termination signals are blocked; without the watcher `stop` could not end us
        spdlog::error("[daemon] cannot watch for termination signals, exiting");
        if (const auto released = instance.release(); !released.success) {
            spdlog::warn("[daemon] failed to remove PID file: {}", released.error_message);
        }
        return 1;
    }

    try {
        // ImGuiApp does not own these resources - they're managed here
        cml::ImGuiApp app(&indicator, &scheduler);
        app.run();
    } catch (const std::exception& e) {
        spdlog::error("[daemon] {}", e.what());
        if (const auto released = instance.release(); !released.success) {
            spdlog::warn("[daemon] failed to remove PID file: {}", released.error_message);
        }
        return 1;
    }

    watcher.stop();
    spdlog::info("[daemon] exiting");
    return 0;
}

// Foreground terminal view; does not touch the liveness marker
int run_watch(const cml::AppPaths& paths, cml::IConfigStore& store) {
    if (!cml::init_worker_logging(paths.log_file)) {
        std::cerr << "Failed to set up signal handling." << std::endl;
        return 1;
    }

    const auto session = store.load_session();
    if (!session) {
        std::cerr << "Not authenticated. Run 'claude-monitor-lite' to login first." << std::endl;
        return 1;
    }

    cml::ClaudeUsageClient client(*session);
    cml::IndicatorState indicator;

    cml::AppContext ctx;
    ctx.usage_client = &client;
    ctx.config_store = &store;
    ctx.indicator = &indicator;

    cml::RefreshScheduler scheduler(ctx);

    cml::SignalWatcher watcher;
    if (!watcher.start([&scheduler](int) { scheduler.request_quit(); })) {
        std::cerr << "Failed to watch for termination signals." << std::endl;
        return 1;
    }

    try {
        cml::TuiApp app(&indicator, &scheduler);
        app.run();
    } catch (const std::exception& e) {
        // Make sure we restore terminal state before printing error
        endwin();
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    watcher.stop();
    return 0;
}

// No arguments: login if needed, then show status or start in the background
int run_default(cml::SingleInstance& instance, cml::IConfigStore& store) {
    auto session = store.load_session();
    if (!session) {
        std::cout << "⚠️  Not authenticated\n\n";
        session = cml::run_login_flow(store, std::cin, std::cout, std::cerr);
        if (!session) {
            return 1;
        }
    }

    if (instance.is_active()) {
        cml::ClaudeUsageClient client(*session);
        return cml::run_status(instance, store, client, std::cout, std::cerr);
    }

    {
        cml::ClaudeUsageClient client(*session);
        cml::print_usage_report(client, std::cout);
    }

    std::cout << "⚙️  Starting Claude Monitor Lite...\n\n";
    std::cout.flush();

    // Exits this process; the worker re-enters main with the flag set
    cml::ensure_detached();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    // Browser launcher and worker children are never waited for
    signal(SIGCHLD, SIG_IGN);

    const std::string_view command = argc > 1 ? argv[1] : "";

    if (command == "help" || command == "--help" || command == "-h") {
        cml::print_usage(std::cout);
        return 0;
    }
    if (!command.empty() && command != "stop" && command != "logout" && command != "watch") {
        std::cerr << "Unknown command: " << command << std::endl;
        cml::print_usage(std::cout);
        return 1;
    }

    const auto paths = cml::resolve_app_paths();
    if (!paths) {
        std::cerr << "Failed to get home directory" << std::endl;
        return 1;
    }

    const CurlGlobal curl;
    if (!curl.ok()) {
        std::cerr << "Failed to initialize libcurl" << std::endl;
        return 1;
    }

    try {
        // Platform-specific primitives (owned here in main)
        auto process_control = cml::make_process_control();
        cml::SingleInstance instance(paths->pid_file, process_control.get());
        cml::JsonConfigStore store(paths->config_file);

        if (command.empty() && cml::is_detached_worker()) {
            return run_daemon(*paths, instance, store);
        }
        if (command == "watch") {
            return run_watch(*paths, store);
        }

        cml::init_console_logging();

        if (command == "stop") {
            return cml::run_stop(instance, *process_control, std::cout, std::cerr);
        }
        if (command == "logout") {
            return cml::run_logout(instance, *process_control, store, std::cout, std::cerr);
        }
        return run_default(instance, store);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
