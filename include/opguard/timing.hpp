#pragma once

#include "opguard/event_loop.hpp"
#include "opguard/operation.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace opguard {

// Per-key trailing-edge collapsing. Confined to the loop's thread.
class DebounceState : public std::enable_shared_from_this<DebounceState> {
public:
  DebounceState(EventLoop &loop, Duration delay);

  // Replaces any scheduled invocation for the key. The returned value
  // settles with the outcome of whichever call finally runs.
  Pending schedule(const std::string &key, OperationPtr op, Args args);

  std::size_t scheduled() const { return slots_.size(); }
  bool is_scheduled(const std::string &key) const {
    return slots_.contains(key);
  }

private:
  struct Slot {
    TimerId timer{0};
    OperationPtr op;
    Args args;
    std::vector<Deferred> waiters;
  };

  void fire(const std::string &key);

  EventLoop &loop_;
  Duration delay_;
  std::unordered_map<std::string, Slot> slots_;
};

class DebounceDecorator final : public IDecorator {
public:
  DebounceDecorator(std::string name, EventLoop &loop, Duration delay,
                    KeyFn key);

  std::string name() const override { return name_; }
  OperationPtr attach(OperationPtr next) override;

  const std::shared_ptr<DebounceState> &state() const { return state_; }

private:
  std::string name_;
  KeyFn key_;
  std::shared_ptr<DebounceState> state_;
};

// Leading-edge gating: the first call in each interval runs.
class ThrottleState {
public:
  ThrottleState(EventLoop &loop, Duration interval);

  // True when the key is outside its interval; the call is then recorded.
  bool admit(const std::string &key, TimePoint now);
  void remember(const std::string &key, Result result);
  // Last recorded result, or an already-resolved null value.
  Result last_result(const std::string &key) const;

private:
  struct Entry {
    std::optional<TimePoint> last_call;
    std::optional<Result> last_result;
  };

  EventLoop &loop_;
  Duration interval_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, Entry> entries_;
};

class ThrottleDecorator final : public IDecorator {
public:
  ThrottleDecorator(EventLoop &loop, Duration interval, KeyFn key,
                    bool replay_last);

  std::string name() const override {
    return replay_last_ ? "throttle_async" : "throttle_sync";
  }
  OperationPtr attach(OperationPtr next) override;

  const std::shared_ptr<ThrottleState> &state() const { return state_; }

private:
  EventLoop &loop_;
  KeyFn key_;
  bool replay_last_;
  std::shared_ptr<ThrottleState> state_;
};

// Keys default to "scope.name" of the wrapped operation.
std::shared_ptr<DebounceDecorator> debounce_sync(EventLoop &loop, Duration delay,
                                                 KeyFn key = {});
std::shared_ptr<DebounceDecorator> debounce_async(EventLoop &loop,
                                                  Duration delay,
                                                  KeyFn key = {});

// Calls inside the interval return null.
std::shared_ptr<ThrottleDecorator> throttle_sync(EventLoop &loop,
                                                 Duration interval,
                                                 KeyFn key = {});
// Calls inside the interval get the last executed call's result.
std::shared_ptr<ThrottleDecorator> throttle_async(EventLoop &loop,
                                                  Duration interval,
                                                  KeyFn key = {});

} // namespace opguard
