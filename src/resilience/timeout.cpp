#include "opguard/errors.hpp"
#include "opguard/resilience.hpp"

namespace opguard {
namespace {

class TimeoutOperation final : public WrappedOperation {
public:
  TimeoutOperation(OperationPtr next, EventLoop &loop, Duration ms)
      : WrappedOperation(std::move(next)), loop_(loop), ms_(ms) {}

  Result invoke(const Args &args) override {
    Result r = next_->invoke(args);
    // A synchronous result already finished; there is nothing to race.
    if (!r.is_pending() || r.pending().settled())
      return r;

    Deferred race(loop_);
    const std::string name = id().name;
    const Duration ms = ms_;
    const TimerId timer = loop_.call_later(ms_, [race, name, ms]() mutable {
      race.reject(std::make_exception_ptr(TimeoutError(name, ms)));
    });
    EventLoop *loop = &loop_;
    r.pending().on_settle([race, loop, timer](const Outcome &o) mutable {
      if (race.settle(o))
        loop->cancel(timer);
    });
    return race.pending();
  }

private:
  EventLoop &loop_;
  Duration ms_;
};

} // namespace

DecoratorPtr timeout(EventLoop &loop, Duration ms) {
  return make_decorator("timeout", [&loop, ms](OperationPtr next) -> OperationPtr {
    return std::make_shared<TimeoutOperation>(std::move(next), loop, ms);
  });
}

} // namespace opguard
