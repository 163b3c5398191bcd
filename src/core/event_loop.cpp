#include "opguard/event_loop.hpp"

#include "opguard/pending.hpp"

#include <stdexcept>
#include <thread>

namespace opguard {

TimePoint SystemClock::now() const { return Clock::now(); }

void SystemClock::sleep_until(TimePoint deadline) {
  std::this_thread::sleep_until(deadline);
}

void ManualClock::sleep_until(TimePoint deadline) {
  if (deadline > now_)
    now_ = deadline;
}

EventLoop::EventLoop(std::shared_ptr<IClock> clock) : clock_(std::move(clock)) {
  if (!clock_)
    clock_ = std::make_shared<SystemClock>();
}

void EventLoop::post(TaskFn fn) { tasks_.push_back(std::move(fn)); }

TimerId EventLoop::call_later(Duration delay, TaskFn fn) {
  if (delay.count() < 0)
    delay = Duration{0};
  const TimerId id = next_timer_id_++;
  timers_.emplace(id, std::move(fn));
  timer_heap_.push({clock_->now() + delay, ++seq_, id});
  return id;
}

bool EventLoop::cancel(TimerId id) {
  if (timers_.erase(id) == 0)
    return false;
  ++stats_.timers_cancelled;
  return true;
}

std::size_t EventLoop::drain_tasks() {
  std::size_t ran = 0;
  while (!tasks_.empty()) {
    auto fn = std::move(tasks_.front());
    tasks_.pop_front();
    fn();
    ++ran;
    ++stats_.tasks_run;
  }
  return ran;
}

void EventLoop::drop_cancelled_top() {
  while (!timer_heap_.empty() && !timers_.contains(timer_heap_.top().id))
    timer_heap_.pop();
}

bool EventLoop::fire_next_due(TimePoint now) {
  drop_cancelled_top();
  if (timer_heap_.empty() || timer_heap_.top().deadline > now)
    return false;
  const auto id = timer_heap_.top().id;
  timer_heap_.pop();
  auto it = timers_.find(id);
  auto fn = std::move(it->second);
  timers_.erase(it);
  ++stats_.timers_fired;
  fn();
  return true;
}

std::size_t EventLoop::run_ready() {
  std::size_t ran = drain_tasks();
  while (fire_next_due(clock_->now())) {
    ++ran;
    ran += drain_tasks();
  }
  return ran;
}

std::size_t EventLoop::run_for(Duration d) {
  const auto target = clock_->now() + d;
  std::size_t ran = run_ready();
  for (;;) {
    drop_cancelled_top();
    if (timer_heap_.empty() || timer_heap_.top().deadline > target)
      break;
    clock_->sleep_until(timer_heap_.top().deadline);
    ran += run_ready();
  }
  clock_->sleep_until(target);
  ran += run_ready();
  return ran;
}

std::size_t EventLoop::run_until_idle() {
  std::size_t ran = run_ready();
  for (;;) {
    drop_cancelled_top();
    if (timer_heap_.empty())
      break;
    clock_->sleep_until(timer_heap_.top().deadline);
    ran += run_ready();
  }
  return ran;
}

bool EventLoop::run_until_settled(const Pending &pending) {
  run_ready();
  while (!pending.settled()) {
    drop_cancelled_top();
    if (timer_heap_.empty()) {
      if (tasks_.empty())
        break;
      run_ready();
      continue;
    }
    clock_->sleep_until(timer_heap_.top().deadline);
    run_ready();
  }
  // Let continuations queued by the settlement run before returning.
  run_ready();
  return pending.settled();
}

Value EventLoop::await(const Result &result) {
  if (!result.is_pending())
    return result.value();
  const Pending &p = result.pending();
  if (!run_until_settled(p))
    throw std::logic_error("event loop went idle before the value settled");
  return p.outcome().get();
}

LoopStats EventLoop::stats() const {
  LoopStats s = stats_;
  s.timers_pending = timers_.size();
  return s;
}

} // namespace opguard
