#include "minitest.hpp"
#include "auth.hpp"
#include "detacher.hpp"
#include <algorithm>
#include <cstdlib>

using namespace cml;

TEST(child_environment_sets_flag_once) {
  char path[] = "PATH=/usr/bin";
  char stale[] = "CLAUDE_MONITOR_DAEMON=0";
  char home[] = "HOME=/home/user";
  char* env[] = {path, stale, home, nullptr};

  const auto result = build_child_environment(env);
  ASSERT_EQ(result.size(), static_cast<size_t>(3));
  ASSERT_EQ(std::count(result.begin(), result.end(), std::string("CLAUDE_MONITOR_DAEMON=1")), 1);
  ASSERT_EQ(std::count(result.begin(), result.end(), std::string("CLAUDE_MONITOR_DAEMON=0")), 0);
  ASSERT_EQ(std::count(result.begin(), result.end(), std::string("PATH=/usr/bin")), 1);
  ASSERT_EQ(std::count(result.begin(), result.end(), std::string("HOME=/home/user")), 1);
}

TEST(child_environment_keeps_similar_names) {
  char similar[] = "CLAUDE_MONITOR_DAEMON_EXTRA=1";
  char* env[] = {similar, nullptr};

  const auto result = build_child_environment(env);
  ASSERT_EQ(result.size(), static_cast<size_t>(2));
  ASSERT_EQ(result.front(), std::string("CLAUDE_MONITOR_DAEMON_EXTRA=1"));
  ASSERT_EQ(result.back(), std::string("CLAUDE_MONITOR_DAEMON=1"));
}

TEST(child_environment_from_empty) {
  const auto result = build_child_environment(nullptr);
  ASSERT_EQ(result.size(), static_cast<size_t>(1));
}

TEST(worker_flag_detection) {
  unsetenv(kDaemonEnvVar);
  ASSERT_FALSE(is_detached_worker());
  setenv(kDaemonEnvVar, "0", 1);
  ASSERT_FALSE(is_detached_worker());
  setenv(kDaemonEnvVar, "1", 1);
  ASSERT_TRUE(is_detached_worker());
  unsetenv(kDaemonEnvVar);
}

TEST(session_key_cleanup) {
  ASSERT_EQ(clean_session_key("  sk-ant-abc \n"), std::string("sk-ant-abc"));
  ASSERT_EQ(clean_session_key("\"sk-ant-abc\""), std::string("sk-ant-abc"));
  ASSERT_EQ(clean_session_key("'sk-ant-abc'"), std::string("sk-ant-abc"));
  ASSERT_EQ(clean_session_key("   "), std::string());
}
