#include "minitest.hpp"
#include "app/MetricCache.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using hostscope::app::MetricCache;
using namespace std::chrono_literals;

namespace {

// Manually advanced steady clock.
struct FakeClock {
  std::chrono::steady_clock::time_point t{std::chrono::steady_clock::time_point{} + 1h};
  MetricCache<int>::NowFn fn() { return [this] { return t; }; }
};

} // namespace

TEST(metric_cache_hit_within_ttl_does_not_refetch) {
  FakeClock clk;
  int calls = 0;
  MetricCache<int> c("t", 1s, [&](int& out) { out = ++calls; return true; }, clk.fn());
  auto a = c.get();
  ASSERT_TRUE(a != nullptr);
  ASSERT_EQ(*a, 1);
  clk.t += 999ms;
  auto b = c.get();
  ASSERT_EQ(calls, 1);
  ASSERT_TRUE(a.get() == b.get());
}

TEST(metric_cache_miss_after_ttl_refetches) {
  FakeClock clk;
  int calls = 0;
  MetricCache<int> c("t", 1s, [&](int& out) { out = ++calls; return true; }, clk.fn());
  (void)c.get();
  clk.t += 1s; // elapsed == ttl is stale
  auto b = c.get();
  ASSERT_EQ(calls, 2);
  ASSERT_EQ(*b, 2);
  clk.t += 5s;
  ASSERT_EQ(*c.get(), 3);
}

TEST(metric_cache_no_ttl_fetches_once) {
  FakeClock clk;
  int calls = 0;
  MetricCache<int> c("t", std::nullopt, [&](int& out) { out = ++calls; return true; }, clk.fn());
  (void)c.get();
  clk.t += 24h;
  (void)c.get();
  (void)c.get();
  ASSERT_EQ(calls, 1);
}

TEST(metric_cache_no_ttl_retries_until_first_success) {
  FakeClock clk;
  int calls = 0;
  MetricCache<int> c("t", std::nullopt, [&](int& out) { ++calls; out = 7; return calls >= 3; }, clk.fn());
  ASSERT_TRUE(c.get() == nullptr);
  ASSERT_TRUE(c.get() == nullptr);
  auto v = c.get();
  ASSERT_TRUE(v != nullptr);
  ASSERT_EQ(*v, 7);
  (void)c.get();
  ASSERT_EQ(calls, 3);
  ASSERT_EQ(c.failure_count(), 2u);
}

TEST(metric_cache_failure_returns_previous_value) {
  FakeClock clk;
  bool fail = false;
  int calls = 0;
  MetricCache<int> c("t", 1s, [&](int& out) { ++calls; if (fail) return false; out = calls; return true; }, clk.fn());
  auto first = c.get();
  auto stamp = c.last_fetch();
  fail = true;
  clk.t += 2s;
  auto second = c.get();
  ASSERT_TRUE(second.get() == first.get());
  ASSERT_EQ(*second, 1);
  // a failure leaves the timestamp alone, so the next call tries again
  ASSERT_TRUE(c.last_fetch() == stamp);
  (void)c.get();
  ASSERT_EQ(calls, 3);
  fail = false;
  ASSERT_EQ(*c.get(), 4);
}

TEST(metric_cache_exception_is_a_failed_fetch) {
  FakeClock clk;
  MetricCache<int> c("t", 1s, [&](int&) -> bool { throw std::runtime_error("provider exploded"); }, clk.fn());
  ASSERT_TRUE(c.get() == nullptr);
  ASSERT_EQ(c.fetch_count(), 1u);
  ASSERT_EQ(c.failure_count(), 1u);
}

TEST(metric_cache_unchanged_keeps_instance_but_advances_timestamp) {
  FakeClock clk;
  int raw = 10;
  int calls = 0;
  MetricCache<int> c("t", 1s, [&](int& out) { ++calls; out = raw; return true; }, clk.fn(),
                     [](const int& a, const int& b) { return a == b; });
  auto a = c.get();
  clk.t += 1s;
  auto b = c.get();
  ASSERT_EQ(calls, 2);
  ASSERT_TRUE(a.get() == b.get());
  ASSERT_TRUE(*c.last_fetch() == clk.t);
  // fresh again after the unchanged refresh
  clk.t += 500ms;
  (void)c.get();
  ASSERT_EQ(calls, 2);
  raw = 11;
  clk.t += 1s;
  auto d = c.get();
  ASSERT_TRUE(d.get() != a.get());
  ASSERT_EQ(*d, 11);
}

TEST(metric_cache_invalidate_forces_fetch) {
  FakeClock clk;
  int calls = 0;
  MetricCache<int> c("t", 1h, [&](int& out) { out = ++calls; return true; }, clk.fn());
  (void)c.get();
  c.invalidate();
  ASSERT_EQ(*c.peek(), 1);
  ASSERT_EQ(*c.get(), 2);
  ASSERT_EQ(*c.get(), 2);
}

TEST(metric_cache_zero_ttl_always_fetches) {
  FakeClock clk;
  int calls = 0;
  MetricCache<int> c("t", std::chrono::steady_clock::duration::zero(), [&](int& out) { out = ++calls; return true; }, clk.fn());
  (void)c.get(); (void)c.get(); (void)c.get();
  ASSERT_EQ(calls, 3);
}

TEST(metric_cache_concurrent_cold_miss_fetches_once) {
  std::mutex mu;
  std::condition_variable cv;
  bool release = false;
  std::atomic<int> calls{0};
  MetricCache<int> c("t", 1h, [&](int& out) {
    calls.fetch_add(1);
    std::unique_lock<std::mutex> lk(mu);
    cv.wait(lk, [&] { return release; });
    out = 42;
    return true;
  });

  std::vector<std::thread> threads;
  std::vector<int> results(8, 0);
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      auto v = c.get();
      results[i] = v ? *v : -1;
    });
  }
  std::this_thread::sleep_for(50ms);
  {
    std::lock_guard<std::mutex> lk(mu);
    release = true;
  }
  cv.notify_all();
  for (auto& t : threads) t.join();
  ASSERT_EQ(calls.load(), 1);
  for (int r : results) ASSERT_EQ(r, 42);
}

TEST(metric_cache_readers_see_last_value_during_refresh) {
  FakeClock clk;
  std::mutex mu;
  std::condition_variable cv;
  bool entered = false, release = false;
  int calls = 0;
  MetricCache<int> c("t", 1s, [&](int& out) {
    ++calls;
    if (calls == 2) {
      std::unique_lock<std::mutex> lk(mu);
      entered = true;
      cv.notify_all();
      cv.wait(lk, [&] { return release; });
    }
    out = calls * 100;
    return true;
  }, clk.fn());
  ASSERT_EQ(*c.get(), 100);
  clk.t += 2s;

  std::thread slow([&] { (void)c.get(); });
  {
    std::unique_lock<std::mutex> lk(mu);
    cv.wait(lk, [&] { return entered; });
  }
  // refresh in flight: stale value, no second fetch
  auto during = c.get();
  ASSERT_EQ(*during, 100);
  {
    std::lock_guard<std::mutex> lk(mu);
    release = true;
  }
  cv.notify_all();
  slow.join();
  ASSERT_EQ(*c.get(), 200);
  ASSERT_EQ(calls, 2);
}
