#pragma once
#include "interfaces/i_config_store.hpp"
#include "interfaces/i_process_control.hpp"
#include "interfaces/i_usage_client.hpp"
#include "usage_snapshot.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace cml::testing {

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
  TempDir() {
    std::string tmpl = (std::filesystem::temp_directory_path() / "cml-test-XXXXXX").string();
    if (mkdtemp(tmpl.data()) == nullptr) throw std::runtime_error("mkdtemp failed");
    path_ = tmpl;
  }
  ~TempDir() { std::error_code ec; std::filesystem::remove_all(path_, ec); }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }
  [[nodiscard]] std::filesystem::path file(const std::string& name) const { return path_ / name; }

private:
  std::filesystem::path path_;
};

class FakeProcessControl : public IProcessControl {
public:
  bool is_alive(int pid) override {
    std::lock_guard lock(mutex_);
    ++probes;
    return alive.contains(pid);
  }
  SignalResult terminate(int pid) override {
    std::lock_guard lock(mutex_);
    terminated.push_back(pid);
    if (fail_terminate) return {false, "Permission denied."};
    alive.erase(pid);
    return {true, {}};
  }
  int current_pid() const override { return own_pid; }

  std::set<int> alive;
  std::vector<int> terminated;
  int probes = 0;
  int own_pid = 4242;
  bool fail_terminate = false;

private:
  std::mutex mutex_;
};

class FakeConfigStore : public IConfigStore {
public:
  DisplayMode load_display_mode() override {
    std::lock_guard lock(mutex_);
    return mode;
  }
  OpResult save_display_mode(DisplayMode m) override {
    std::lock_guard lock(mutex_);
    mode = m;
    saved_modes.push_back(m);
    return fail_saves ? OpResult::fail("disk full") : OpResult::ok();
  }
  std::optional<AuthSession> load_session() override {
    std::lock_guard lock(mutex_);
    return session;
  }
  OpResult save_session(const AuthSession& s) override {
    std::lock_guard lock(mutex_);
    session = s;
    return OpResult::ok();
  }
  OpResult clear() override {
    std::lock_guard lock(mutex_);
    session.reset();
    ++clears;
    return OpResult::ok();
  }

  [[nodiscard]] size_t saved_count() {
    std::lock_guard lock(mutex_);
    return saved_modes.size();
  }

  DisplayMode mode = DisplayMode::CurrentSession;
  std::vector<DisplayMode> saved_modes;
  std::optional<AuthSession> session;
  int clears = 0;
  bool fail_saves = false;

private:
  std::mutex mutex_;
};

// Replays queued results (the last one repeats); can be held closed to keep
// fetches in flight
class FakeUsageClient : public IUsageClient {
public:
  FetchResult fetch_usage() override {
    std::unique_lock lock(mutex_);
    ++calls;
    cv_.wait(lock, [this] { return gate_open_; });
    if (throw_next) {
      throw_next = false;
      throw std::runtime_error("connection reset");
    }
    if (results_.empty()) return FetchResult::failure(FetchErrorKind::Other, "no scripted result");
    FetchResult r = results_.front();
    if (results_.size() > 1) results_.pop_front();
    return r;
  }

  void push(FetchResult r) {
    std::lock_guard lock(mutex_);
    results_.push_back(std::move(r));
  }
  void close_gate() {
    std::lock_guard lock(mutex_);
    gate_open_ = false;
  }
  void open_gate() {
    { std::lock_guard lock(mutex_); gate_open_ = true; }
    cv_.notify_all();
  }
  [[nodiscard]] int call_count() {
    std::lock_guard lock(mutex_);
    return calls;
  }

  bool throw_next = false;

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<FetchResult> results_;
  bool gate_open_ = true;
  int calls = 0;
};

inline UsageLimit limit_at(double utilization, std::optional<std::chrono::system_clock::duration> reset_in = std::nullopt) {
  UsageLimit l;
  l.utilization = utilization;
  if (reset_in) l.resets_at = std::chrono::system_clock::now() + *reset_in;
  return l;
}

} // namespace cml::testing
