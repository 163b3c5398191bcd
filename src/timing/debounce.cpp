#include "opguard/timing.hpp"

namespace opguard {
namespace {

class DebouncedOperation final : public WrappedOperation {
public:
  DebouncedOperation(OperationPtr next, std::shared_ptr<DebounceState> state,
                     KeyFn key)
      : WrappedOperation(std::move(next)), state_(std::move(state)),
        key_(std::move(key)) {}

  Result invoke(const Args &args) override {
    const std::string k = key_ ? key_(args) : id().qualified();
    return state_->schedule(k, next_, args);
  }

private:
  std::shared_ptr<DebounceState> state_;
  KeyFn key_;
};

} // namespace

DebounceState::DebounceState(EventLoop &loop, Duration delay)
    : loop_(loop), delay_(delay < Duration::zero() ? Duration::zero() : delay) {}

Pending DebounceState::schedule(const std::string &key, OperationPtr op,
                                Args args) {
  auto &slot = slots_[key];
  if (slot.timer != 0)
    loop_.cancel(slot.timer);
  slot.op = std::move(op);
  slot.args = std::move(args);
  slot.waiters.emplace_back(loop_);
  Pending p = slot.waiters.back().pending();

  std::weak_ptr<DebounceState> weak = weak_from_this();
  slot.timer = loop_.call_later(delay_, [weak, key] {
    if (auto self = weak.lock())
      self->fire(key);
  });
  return p;
}

void DebounceState::fire(const std::string &key) {
  auto it = slots_.find(key);
  if (it == slots_.end())
    return;
  Slot slot = std::move(it->second);
  slots_.erase(it);

  Result r;
  try {
    r = slot.op->invoke(slot.args);
  } catch (...) {
    auto error = std::current_exception();
    for (auto &w : slot.waiters)
      w.reject(error);
    return;
  }
  for (auto &w : slot.waiters)
    w.adopt(r);
}

DebounceDecorator::DebounceDecorator(std::string name, EventLoop &loop,
                                     Duration delay, KeyFn key)
    : name_(std::move(name)), key_(std::move(key)),
      state_(std::make_shared<DebounceState>(loop, delay)) {}

OperationPtr DebounceDecorator::attach(OperationPtr next) {
  return std::make_shared<DebouncedOperation>(std::move(next), state_, key_);
}

std::shared_ptr<DebounceDecorator> debounce_sync(EventLoop &loop, Duration delay,
                                                 KeyFn key) {
  return std::make_shared<DebounceDecorator>("debounce_sync", loop, delay,
                                             std::move(key));
}

std::shared_ptr<DebounceDecorator> debounce_async(EventLoop &loop,
                                                  Duration delay, KeyFn key) {
  return std::make_shared<DebounceDecorator>("debounce_async", loop, delay,
                                             std::move(key));
}

} // namespace opguard
