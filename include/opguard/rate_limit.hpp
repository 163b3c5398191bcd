#pragma once

#include "opguard/event_loop.hpp"
#include "opguard/operation.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace opguard {

struct RateLimitOptions {
  std::size_t limit{10};
  Duration window{1000};
  // Defaults to "scope:name" of the wrapped operation.
  KeyFn key;
  StateScope scope{StateScope::Definition};
};

// Sliding window of admitted call timestamps per key.
class RateWindow {
public:
  RateWindow(std::size_t limit, Duration window);

  // Admits and records the call, or returns how long until the oldest
  // timestamp leaves the window. A rejected call records nothing.
  std::optional<Duration> try_acquire(const std::string &key, TimePoint now);

  std::size_t in_window(const std::string &key, TimePoint now) const;
  void reset(const std::string &key);
  // Keys with at least one timestamp still held.
  std::size_t tracked_keys() const;

  std::size_t limit() const { return limit_; }
  Duration window() const { return window_; }

private:
  static void prune(std::deque<TimePoint> &stamps, TimePoint cutoff);

  const std::size_t limit_;
  const Duration window_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::deque<TimePoint>> stamps_;
};

class RateLimitDecorator final : public IDecorator {
public:
  RateLimitDecorator(EventLoop &loop, RateLimitOptions opts);

  std::string name() const override { return "rate_limited"; }
  OperationPtr attach(OperationPtr next) override;

  // Shared window for StateScope::Definition, nullptr for Instance.
  std::shared_ptr<RateWindow> state() const { return state_; }

private:
  EventLoop &loop_;
  RateLimitOptions opts_;
  std::shared_ptr<RateWindow> state_;
};

std::shared_ptr<RateLimitDecorator> rate_limited(EventLoop &loop,
                                                 RateLimitOptions opts);

} // namespace opguard
