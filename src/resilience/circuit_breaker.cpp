#include "opguard/circuit_breaker.hpp"

#include "opguard/errors.hpp"

#include <algorithm>

namespace opguard {
namespace {

class CircuitBreakerOperation final : public WrappedOperation {
public:
  CircuitBreakerOperation(OperationPtr next, EventLoop &loop,
                          std::shared_ptr<BreakerState> state)
      : WrappedOperation(std::move(next)), loop_(loop), state_(std::move(state)) {}

  Result invoke(const Args &args) override {
    if (!state_->try_acquire(loop_.now()))
      throw CircuitOpenError();

    Result r;
    try {
      r = next_->invoke(args);
    } catch (...) {
      state_->record_failure(loop_.now());
      throw;
    }
    if (!r.is_pending()) {
      state_->record_success();
      return r;
    }

    Deferred out(loop_);
    auto state = state_;
    EventLoop *loop = &loop_;
    r.pending().on_settle([out, state, loop](const Outcome &o) mutable {
      if (o.ok())
        state->record_success();
      else
        state->record_failure(loop->now());
      out.settle(o);
    });
    return out.pending();
  }

private:
  EventLoop &loop_;
  std::shared_ptr<BreakerState> state_;
};

} // namespace

std::string to_string(CircuitState state) {
  switch (state) {
  case CircuitState::Closed:
    return "closed";
  case CircuitState::Open:
    return "open";
  case CircuitState::HalfOpen:
    return "half-open";
  }
  return "unknown";
}

BreakerState::BreakerState(std::size_t failure_threshold,
                           Duration reset_timeout,
                           StateChangeCallback on_state_change)
    : failure_threshold_(std::max<std::size_t>(1, failure_threshold)),
      reset_timeout_(reset_timeout),
      on_state_change_(std::move(on_state_change)) {}

bool BreakerState::try_acquire(TimePoint now) {
  std::optional<CircuitState> changed;
  bool admitted = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    switch (state_) {
    case CircuitState::Closed:
      admitted = true;
      break;
    case CircuitState::Open:
      if (last_failure_time_.has_value() &&
          now - *last_failure_time_ >= reset_timeout_) {
        changed = transition_locked(CircuitState::HalfOpen);
        trial_in_flight_ = true;
        admitted = true;
      }
      break;
    case CircuitState::HalfOpen:
      if (!trial_in_flight_) {
        trial_in_flight_ = true;
        admitted = true;
      }
      break;
    }
  }
  notify(changed);
  return admitted;
}

void BreakerState::record_success() {
  std::optional<CircuitState> changed;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ == CircuitState::HalfOpen) {
      changed = transition_locked(CircuitState::Closed);
      failures_ = 0;
      trial_in_flight_ = false;
    }
  }
  notify(changed);
}

void BreakerState::record_failure(TimePoint now) {
  std::optional<CircuitState> changed;
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++failures_;
    last_failure_time_ = now;
    if (state_ == CircuitState::HalfOpen) {
      changed = transition_locked(CircuitState::Open);
      trial_in_flight_ = false;
    } else if (state_ == CircuitState::Closed &&
               failures_ >= failure_threshold_) {
      changed = transition_locked(CircuitState::Open);
    }
  }
  notify(changed);
}

CircuitState BreakerState::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

std::size_t BreakerState::failures() const {
  std::lock_guard<std::mutex> lock(mu_);
  return failures_;
}

BreakerSnapshot BreakerState::snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return {state_, failures_, last_failure_time_, trial_in_flight_};
}

std::optional<CircuitState> BreakerState::transition_locked(CircuitState next) {
  if (state_ == next)
    return std::nullopt;
  state_ = next;
  return next;
}

void BreakerState::notify(std::optional<CircuitState> changed) const {
  if (changed.has_value() && on_state_change_)
    on_state_change_(*changed);
}

CircuitBreakerDecorator::CircuitBreakerDecorator(EventLoop &loop,
                                                 CircuitBreakerOptions opts)
    : loop_(loop), opts_(std::move(opts)) {
  if (opts_.scope == StateScope::Definition)
    state_ = make_state();
}

OperationPtr CircuitBreakerDecorator::attach(OperationPtr next) {
  auto state = state_ ? state_ : make_state();
  return std::make_shared<CircuitBreakerOperation>(std::move(next), loop_,
                                                   std::move(state));
}

std::shared_ptr<BreakerState> CircuitBreakerDecorator::make_state() const {
  return std::make_shared<BreakerState>(opts_.failure_threshold,
                                        opts_.reset_timeout,
                                        opts_.on_state_change);
}

std::shared_ptr<CircuitBreakerDecorator>
circuit_breaker(EventLoop &loop, CircuitBreakerOptions opts) {
  return std::make_shared<CircuitBreakerDecorator>(loop, std::move(opts));
}

} // namespace opguard
