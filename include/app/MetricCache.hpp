#pragma once
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include "util/Log.hpp"

namespace hostscope::app {

// Fetch-if-stale slot for one metric family.
//
// A value younger than the TTL is served without calling the fetch function.
// A missing TTL means "fetch once": after the first successful fetch the value
// never expires. A failed fetch (false, or a std::exception) is logged and the
// previous value, or nullptr, is returned; its timestamp is not touched.
//
// Concurrency: one fetch at a time per slot. While a fetch is in flight other
// callers get the last complete value; with no value yet they wait for the
// fetch and share its result. Values are published as immutable shared_ptrs,
// so a reader never sees a half-written record.
template <typename T>
class MetricCache {
public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;
  using FetchFn = std::function<bool(T&)>;
  // true when `next` carries no change a consumer would care about
  using UnchangedFn = std::function<bool(const T& prev, const T& next)>;

  MetricCache(std::string name, std::optional<Clock::duration> ttl, FetchFn fetch,
              NowFn now = [] { return Clock::now(); }, UnchangedFn unchanged = {})
    : name_(std::move(name)), ttl_(ttl), fetch_(std::move(fetch)),
      now_(std::move(now)), unchanged_(std::move(unchanged)) {}

  MetricCache(const MetricCache&) = delete;
  MetricCache& operator=(const MetricCache&) = delete;

  std::shared_ptr<const T> get() {
    uint64_t seen = 0;
    {
      std::lock_guard<std::mutex> lk(slot_mu_);
      if (fresh_locked()) return value_;
      seen = attempts_;
    }
    std::unique_lock<std::mutex> fl(fetch_mu_, std::try_to_lock);
    if (!fl.owns_lock()) {
      {
        std::lock_guard<std::mutex> lk(slot_mu_);
        if (value_) return value_;
      }
      fl.lock();
    }
    {
      // someone else fetched between our check and taking fetch_mu_
      std::lock_guard<std::mutex> lk(slot_mu_);
      if (attempts_ != seen || fresh_locked()) return value_;
    }
    return fetch_and_store();
  }

  // Current value without any freshness check or I/O.
  [[nodiscard]] std::shared_ptr<const T> peek() const {
    std::lock_guard<std::mutex> lk(slot_mu_);
    return value_;
  }

  // The members below are for diagnostics and tests; HostSampler only
  // uses get() and peek().

  // Time of the last successful fetch.
  [[nodiscard]] std::optional<Clock::time_point> last_fetch() const {
    std::lock_guard<std::mutex> lk(slot_mu_);
    if (!value_) return std::nullopt;
    return fetched_at_;
  }

  // Fetch function invocations, successful or not.
  [[nodiscard]] uint64_t fetch_count() const {
    std::lock_guard<std::mutex> lk(slot_mu_);
    return attempts_;
  }

  [[nodiscard]] uint64_t failure_count() const {
    std::lock_guard<std::mutex> lk(slot_mu_);
    return failures_;
  }

  // Force the next get() to fetch. The current value stays available as the
  // fallback.
  void invalidate() {
    std::lock_guard<std::mutex> lk(slot_mu_);
    stale_ = true;
  }

  [[nodiscard]] const std::string& name() const { return name_; }

private:
  bool fresh_locked() const {
    if (!value_ || stale_) return false;
    if (!ttl_) return true;
    return now_() - fetched_at_ < *ttl_;
  }

  // Called with fetch_mu_ held.
  std::shared_ptr<const T> fetch_and_store() {
    auto next = std::make_shared<T>();
    bool ok = false;
    try {
      ok = fetch_(*next);
    } catch (const std::exception& e) {
      hostscope::util::log_error("%s: fetch threw: %s", name_.c_str(), e.what());
      ok = false;
    }
    auto t = now_();

    std::lock_guard<std::mutex> lk(slot_mu_);
    ++attempts_;
    if (!ok) {
      ++failures_;
      hostscope::util::log_error("%s: fetch failed, serving %s", name_.c_str(),
                          value_ ? "previous value" : "nothing");
      return value_;
    }
    fetched_at_ = t;
    stale_ = false;
    if (value_ && unchanged_ && unchanged_(*value_, *next)) return value_;
    value_ = std::move(next);
    return value_;
  }

  const std::string name_;
  const std::optional<Clock::duration> ttl_;
  FetchFn fetch_;
  NowFn now_;
  UnchangedFn unchanged_;

  mutable std::mutex slot_mu_;   // guards everything below
  std::mutex fetch_mu_;          // held for the duration of a fetch
  std::shared_ptr<const T> value_{};
  Clock::time_point fetched_at_{};
  uint64_t attempts_{0};
  uint64_t failures_{0};
  bool stale_{false};
};

} // namespace hostscope::app
