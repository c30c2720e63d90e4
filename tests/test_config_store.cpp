#include "minitest.hpp"
#include "config_store.hpp"
#include "fakes.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

using namespace cml;
using cml::testing::TempDir;
using json = nlohmann::json;

namespace {

json read_json(const std::filesystem::path& p) {
  std::ifstream in(p);
  return json::parse(in);
}

} // namespace

TEST(config_missing_file_gives_defaults) {
  TempDir dir;
  JsonConfigStore store(dir.file("config.json"));
  ASSERT_EQ(store.load_display_mode(), DisplayMode::CurrentSession);
  ASSERT_FALSE(store.load_session().has_value());
}

TEST(config_display_mode_round_trip) {
  TempDir dir;
  JsonConfigStore store(dir.file("config.json"));
  ASSERT_TRUE(store.save_display_mode(DisplayMode::WeeklyOpus).success);
  ASSERT_EQ(store.load_display_mode(), DisplayMode::WeeklyOpus);
  ASSERT_EQ(read_json(store.path())["menuBarIndicator"], json("weeklyOpus"));
}

TEST(config_mode_save_preserves_session) {
  TempDir dir;
  JsonConfigStore store(dir.file("config.json"));
  ASSERT_TRUE(store.save_session({"sk-ant-123", "org-1", "2025-01-01T00:00:00Z"}).success);
  ASSERT_TRUE(store.save_display_mode(DisplayMode::WeeklyAll).success);

  const auto session = store.load_session();
  ASSERT_TRUE(session.has_value());
  ASSERT_EQ(session->session_key, std::string("sk-ant-123"));
  ASSERT_EQ(session->organization_id, std::string("org-1"));
  ASSERT_EQ(session->saved_at, std::string("2025-01-01T00:00:00Z"));
  ASSERT_EQ(store.load_display_mode(), DisplayMode::WeeklyAll);
}

TEST(config_session_save_preserves_mode) {
  TempDir dir;
  JsonConfigStore store(dir.file("config.json"));
  ASSERT_TRUE(store.save_display_mode(DisplayMode::WeeklyOpus).success);
  ASSERT_TRUE(store.save_session({"sk-ant-456", "", ""}).success);

  ASSERT_EQ(store.load_display_mode(), DisplayMode::WeeklyOpus);
  const auto doc = read_json(store.path());
  ASSERT_FALSE(doc.contains("organizationId"));
  ASSERT_TRUE(doc["savedAt"].is_string());
  ASSERT_FALSE(doc["savedAt"].get<std::string>().empty());
}

TEST(config_corrupt_file_loads_defaults) {
  TempDir dir;
  const auto path = dir.file("config.json");
  std::ofstream(path) << "{ this is not json";

  JsonConfigStore store(path);
  ASSERT_EQ(store.load_display_mode(), DisplayMode::CurrentSession);
  ASSERT_FALSE(store.load_session().has_value());

  ASSERT_TRUE(store.save_display_mode(DisplayMode::WeeklyAll).success);
  ASSERT_EQ(store.load_display_mode(), DisplayMode::WeeklyAll);
}

TEST(config_unknown_mode_falls_back) {
  TempDir dir;
  const auto path = dir.file("config.json");
  std::ofstream(path) << R"({"menuBarIndicator": "monthly", "sessionKey": "abc"})";

  JsonConfigStore store(path);
  ASSERT_EQ(store.load_display_mode(), DisplayMode::CurrentSession);
  ASSERT_EQ(store.load_session()->session_key, std::string("abc"));
}

TEST(config_file_is_private) {
  TempDir dir;
  JsonConfigStore store(dir.file("config.json"));
  ASSERT_TRUE(store.save_session({"secret", "", ""}).success);

  namespace fs = std::filesystem;
  const auto mode = fs::status(store.path()).permissions();
  ASSERT_TRUE((mode & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none);
  ASSERT_TRUE((mode & fs::perms::owner_read) != fs::perms::none);
}

TEST(config_clear_removes_file) {
  TempDir dir;
  JsonConfigStore store(dir.file("config.json"));
  ASSERT_TRUE(store.save_session({"secret", "org", ""}).success);
  ASSERT_TRUE(store.clear().success);
  ASSERT_FALSE(std::filesystem::exists(store.path()));
  ASSERT_TRUE(store.clear().success);
}
