#include "minitest.hpp"
#include "indicator_state.hpp"

using namespace cml;

TEST(indicator_change_callback_fires_per_change) {
  IndicatorState state;
  int notified = 0;
  state.set_on_changed([&] { ++notified; });

  // Back-to-back changes each notify; frontends wake once per change
  state.set_title("🟢 10%", UsageTier::Low);
  state.set_title("🟢 11%", UsageTier::Low);
  state.set_line(UsageWindow::WeeklyAll, "Weekly (All): 11%");
  ASSERT_EQ(notified, 3);

  const auto vm = state.snapshot();
  ASSERT_EQ(vm.title, std::string("🟢 11%"));
  ASSERT_EQ(vm.line(UsageWindow::WeeklyAll), std::string("Weekly (All): 11%"));
}

TEST(indicator_unchanged_values_do_not_notify) {
  IndicatorState state;
  int notified = 0;
  state.set_on_changed([&] { ++notified; });

  state.set_selected(DisplayMode::CurrentSession);
  state.set_session_expired(false);
  state.set_title("⚪ Loading...", UsageTier::Neutral);
  ASSERT_EQ(notified, 0);

  state.set_session_expired(true);
  state.set_session_expired(true);
  ASSERT_EQ(notified, 1);
  ASSERT_TRUE(state.snapshot().session_expired);
}

TEST(indicator_cleared_callback_is_not_called) {
  IndicatorState state;
  int notified = 0;
  state.set_on_changed([&] { ++notified; });
  state.set_on_changed(nullptr);

  state.set_selected(DisplayMode::WeeklyOpus);
  ASSERT_EQ(notified, 0);
  ASSERT_EQ(state.snapshot().selected, DisplayMode::WeeklyOpus);
}
