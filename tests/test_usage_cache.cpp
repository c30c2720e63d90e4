#include "minitest.hpp"
#include "usage_cache.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace cml;

namespace {

// Every window carries the same value so a torn read would show a mismatch
std::shared_ptr<const UsageSnapshot> uniform_snapshot(double value) {
  auto snap = std::make_shared<UsageSnapshot>();
  for (const auto w : kAllWindows) {
    snap->limit(w) = UsageLimit{value, std::nullopt};
  }
  return snap;
}

} // namespace

TEST(cache_empty_before_first_set) {
  UsageCache cache;
  ASSERT_TRUE(cache.empty());
  ASSERT_TRUE(cache.get() == nullptr);
}

TEST(cache_set_then_get_returns_latest) {
  UsageCache cache;
  const auto first = uniform_snapshot(1.0);
  const auto second = uniform_snapshot(2.0);
  cache.set(first);
  ASSERT_TRUE(cache.get() == first);
  cache.set(second);
  ASSERT_TRUE(cache.get() == second);
  ASSERT_FALSE(cache.empty());
}

TEST(cache_ignores_null_snapshot) {
  UsageCache cache;
  const auto snap = uniform_snapshot(3.0);
  cache.set(snap);
  cache.set(std::shared_ptr<const UsageSnapshot>{});
  ASSERT_TRUE(cache.get() == snap);
}

TEST(cache_readers_never_see_torn_or_older_values) {
  UsageCache cache;
  cache.set(uniform_snapshot(0.0));

  constexpr int kWrites = 5000;
  std::atomic<bool> done{false};
  std::atomic<int> failures{0};

  std::thread writer([&] {
    for (int i = 1; i <= kWrites; ++i) {
      cache.set(uniform_snapshot(static_cast<double>(i)));
    }
    done = true;
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&] {
      double last_seen = -1.0;
      while (!done) {
        const auto snap = cache.get();
        const double v = snap->limit(UsageWindow::CurrentSession)->utilization;
        for (const auto w : kAllWindows) {
          if (snap->limit(w)->utilization != v) ++failures;
        }
        // Single writer: values only move forward
        if (v < last_seen) ++failures;
        last_seen = v;
      }
    });
  }

  writer.join();
  for (auto& t : readers) t.join();

  ASSERT_EQ(failures.load(), 0);
  ASSERT_EQ(cache.get()->limit(UsageWindow::WeeklyOpus)->utilization, static_cast<double>(kWrites));
}
