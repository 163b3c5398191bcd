#pragma once

#include "opguard/types.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <queue>
#include <unordered_map>
#include <vector>

namespace opguard {

class Pending;
class Result;

class IClock {
public:
  virtual ~IClock() = default;
  virtual TimePoint now() const = 0;
  virtual void sleep_until(TimePoint deadline) = 0;
};

class SystemClock final : public IClock {
public:
  TimePoint now() const override;
  void sleep_until(TimePoint deadline) override;
};

// Virtual time. sleep_until jumps forward instead of blocking.
class ManualClock final : public IClock {
public:
  explicit ManualClock(TimePoint start = TimePoint{}) : now_(start) {}
  TimePoint now() const override { return now_; }
  void sleep_until(TimePoint deadline) override;
  void advance(Duration d) { now_ += d; }

private:
  TimePoint now_;
};

using TaskFn = std::function<void()>;
using TimerId = std::uint64_t;

struct LoopStats {
  std::uint64_t tasks_run{0};
  std::uint64_t timers_fired{0};
  std::uint64_t timers_cancelled{0};
  std::size_t timers_pending{0};
};

// Single-threaded cooperative scheduler. Not thread safe: a loop and the
// wrappers bound to it must stay on one thread.
class EventLoop {
public:
  explicit EventLoop(std::shared_ptr<IClock> clock =
                         std::make_shared<SystemClock>());
  EventLoop(const EventLoop &) = delete;
  EventLoop &operator=(const EventLoop &) = delete;

  TimePoint now() const { return clock_->now(); }
  IClock &clock() { return *clock_; }
  std::shared_ptr<IClock> shared_clock() const { return clock_; }

  void post(TaskFn fn);
  TimerId call_later(Duration delay, TaskFn fn);
  bool cancel(TimerId id);

  std::size_t run_ready();
  std::size_t run_for(Duration d);
  std::size_t run_until_idle();
  bool run_until_settled(const Pending &pending);
  Value await(const Result &result);

  bool idle() const { return tasks_.empty() && timers_.empty(); }
  LoopStats stats() const;

private:
  struct TimerNode {
    TimePoint deadline;
    std::uint64_t seq;
    TimerId id;
    bool operator>(const TimerNode &other) const {
      if (deadline == other.deadline)
        return seq > other.seq;
      return deadline > other.deadline;
    }
  };

  std::size_t drain_tasks();
  bool fire_next_due(TimePoint now);
  void drop_cancelled_top();

  std::shared_ptr<IClock> clock_;
  std::deque<TaskFn> tasks_;
  std::unordered_map<TimerId, TaskFn> timers_;
  std::priority_queue<TimerNode, std::vector<TimerNode>,
                      std::greater<TimerNode>>
      timer_heap_;
  TimerId next_timer_id_{1};
  std::uint64_t seq_{0};
  LoopStats stats_;
};

} // namespace opguard
