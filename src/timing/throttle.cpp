#include "opguard/timing.hpp"

namespace opguard {
namespace {

class ThrottledOperation final : public WrappedOperation {
public:
  ThrottledOperation(OperationPtr next, EventLoop &loop,
                     std::shared_ptr<ThrottleState> state, KeyFn key,
                     bool replay_last)
      : WrappedOperation(std::move(next)), loop_(loop),
        state_(std::move(state)), key_(std::move(key)),
        replay_last_(replay_last) {}

  Result invoke(const Args &args) override {
    const std::string k = key_ ? key_(args) : id().qualified();
    if (!state_->admit(k, loop_.now())) {
      if (replay_last_)
        return state_->last_result(k);
      return Value{};
    }
    Result r = next_->invoke(args);
    if (replay_last_)
      state_->remember(k, r);
    return r;
  }

private:
  EventLoop &loop_;
  std::shared_ptr<ThrottleState> state_;
  KeyFn key_;
  bool replay_last_;
};

} // namespace

ThrottleState::ThrottleState(EventLoop &loop, Duration interval)
    : loop_(loop), interval_(interval) {}

bool ThrottleState::admit(const std::string &key, TimePoint now) {
  std::lock_guard<std::mutex> lock(mu_);
  auto &e = entries_[key];
  if (e.last_call.has_value() && now - *e.last_call < interval_)
    return false;
  e.last_call = now;
  return true;
}

void ThrottleState::remember(const std::string &key, Result result) {
  std::lock_guard<std::mutex> lock(mu_);
  entries_[key].last_result = std::move(result);
}

Result ThrottleState::last_result(const std::string &key) const {
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.last_result.has_value())
      return *it->second.last_result;
  }
  return Pending::resolved(loop_, Value{});
}

ThrottleDecorator::ThrottleDecorator(EventLoop &loop, Duration interval,
                                     KeyFn key, bool replay_last)
    : loop_(loop), key_(std::move(key)), replay_last_(replay_last),
      state_(std::make_shared<ThrottleState>(loop, interval)) {}

OperationPtr ThrottleDecorator::attach(OperationPtr next) {
  return std::make_shared<ThrottledOperation>(std::move(next), loop_, state_,
                                              key_, replay_last_);
}

std::shared_ptr<ThrottleDecorator> throttle_sync(EventLoop &loop,
                                                 Duration interval, KeyFn key) {
  return std::make_shared<ThrottleDecorator>(loop, interval, std::move(key),
                                             false);
}

std::shared_ptr<ThrottleDecorator> throttle_async(EventLoop &loop,
                                                  Duration interval,
                                                  KeyFn key) {
  return std::make_shared<ThrottleDecorator>(loop, interval, std::move(key),
                                             true);
}

} // namespace opguard
