#include "minitest.hpp"
#include "fakes.hpp"
#include "indicator_state.hpp"
#include "logging.hpp"
#include "scheduler.hpp"
#include "signal_watcher.hpp"
#include "single_instance.hpp"
#include <csignal>
#include <exception>
#include <filesystem>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace cml;
using namespace cml::testing;
using mini::eventually;

namespace {

// Child exit codes
constexpr int kWorkerClean = 0;
constexpr int kLoggingFailed = 10;
constexpr int kClaimFailed = 11;
constexpr int kWatcherFailed = 12;
constexpr int kMarkerLeft = 13;
constexpr int kThrew = 14;

// Same setup order as the background worker: logging (which blocks the
// termination signals first), claim, scheduler, watcher wired to Quit
int run_worker(const std::filesystem::path& dir) {
  try {
    if (!init_worker_logging(dir / "worker.log")) return kLoggingFailed;

    FakeProcessControl pc;
    SingleInstance instance(dir / "app.pid", &pc);
    if (!instance.claim().success) return kClaimFailed;

    FakeUsageClient client;
    client.push(FetchResult::failure(FetchErrorKind::Other, "offline"));
    FakeConfigStore store;
    IndicatorState indicator;

    AppContext ctx;
    ctx.usage_client = &client;
    ctx.config_store = &store;
    ctx.indicator = &indicator;
    ctx.instance = &instance;

    SchedulerOptions options;
    options.refresh_interval = std::chrono::hours(1);
    RefreshScheduler scheduler(ctx, options);

    SignalWatcher watcher;
    if (!watcher.start([&scheduler](int) { scheduler.request_quit(); })) return kWatcherFailed;

    scheduler.run();
    watcher.stop();
    return std::filesystem::exists(instance.marker_path()) ? kMarkerLeft : kWorkerClean;
  } catch (const std::exception&) {
    return kThrew;
  }
}

// Reap the child, killing it if it does not exit on its own
bool reap(pid_t child, int& status) {
  const bool exited = eventually([&] { return waitpid(child, &status, WNOHANG) == child; });
  if (!exited) {
    kill(child, SIGKILL);
    waitpid(child, &status, 0);
  }
  return exited;
}

void expect_clean_shutdown_on(int signo) {
  TempDir dir;
  const auto marker = dir.file("app.pid");

  const pid_t child = fork();
  if (child < 0) throw mini::AssertionError("fork failed");
  if (child == 0) {
    _exit(run_worker(dir.path()));
  }

  int status = 0;
  const bool claimed = eventually([&] { return std::filesystem::exists(marker); });
  if (!claimed) {
    kill(child, SIGKILL);
    waitpid(child, &status, 0);
  }
  ASSERT_TRUE(claimed);
  ASSERT_EQ(kill(child, signo), 0);

  ASSERT_TRUE(reap(child, status));
  ASSERT_FALSE(WIFSIGNALED(status));
  ASSERT_TRUE(WIFEXITED(status));
  ASSERT_EQ(WEXITSTATUS(status), kWorkerClean);
  ASSERT_FALSE(std::filesystem::exists(marker));
}

} // namespace

TEST(worker_sigterm_runs_quit_cleanup) {
  expect_clean_shutdown_on(SIGTERM);
}

TEST(worker_sigint_runs_quit_cleanup) {
  expect_clean_shutdown_on(SIGINT);
}

TEST(watcher_start_reports_signalfd_failure) {
  const pid_t child = fork();
  if (child < 0) throw mini::AssertionError("fork failed");
  if (child == 0) {
    // No descriptor left for the signalfd
    rlimit limit{};
    if (getrlimit(RLIMIT_NOFILE, &limit) != 0) _exit(2);
    limit.rlim_cur = 0;
    if (setrlimit(RLIMIT_NOFILE, &limit) != 0) _exit(2);

    SignalWatcher watcher;
    _exit(watcher.start([](int) {}) ? 1 : 0);
  }

  int status = 0;
  ASSERT_TRUE(reap(child, status));
  ASSERT_TRUE(WIFEXITED(status));
  ASSERT_EQ(WEXITSTATUS(status), 0);
}
