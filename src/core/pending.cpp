#include "opguard/pending.hpp"

#include <stdexcept>

namespace opguard {

Value Outcome::get() const {
  if (error)
    std::rethrow_exception(error);
  return value.value_or(Value{});
}

Pending Pending::resolved(EventLoop &loop, Value v) {
  Deferred d(loop);
  d.resolve(std::move(v));
  return d.pending();
}

Pending Pending::rejected(EventLoop &loop, std::exception_ptr e) {
  Deferred d(loop);
  d.reject(e);
  return d.pending();
}

const Outcome &Pending::outcome() const {
  if (!state_->outcome.has_value())
    throw std::logic_error("pending value is not settled");
  return *state_->outcome;
}

void Pending::on_settle(Callback cb) const {
  if (state_->outcome.has_value()) {
    auto state = state_;
    state_->loop->post([state, cb = std::move(cb)] { cb(*state->outcome); });
    return;
  }
  state_->waiters.push_back(std::move(cb));
}

Pending Pending::then(std::function<Result(const Value &)> fn) const {
  Deferred next(*state_->loop);
  on_settle([next, fn = std::move(fn)](const Outcome &o) mutable {
    if (!o.ok()) {
      next.reject(o.error);
      return;
    }
    try {
      next.adopt(fn(o.value.value_or(Value{})));
    } catch (...) {
      next.reject(std::current_exception());
    }
  });
  return next.pending();
}

Pending Pending::recover(std::function<Result(std::exception_ptr)> fn) const {
  Deferred next(*state_->loop);
  on_settle([next, fn = std::move(fn)](const Outcome &o) mutable {
    if (o.ok()) {
      next.settle(o);
      return;
    }
    try {
      next.adopt(fn(o.error));
    } catch (...) {
      next.reject(std::current_exception());
    }
  });
  return next.pending();
}

Deferred::Deferred(EventLoop &loop) : state_(std::make_shared<Pending::State>()) {
  state_->loop = &loop;
}

bool Deferred::settle(Outcome outcome) {
  if (state_->outcome.has_value())
    return false;
  state_->outcome = std::move(outcome);
  auto waiters = std::move(state_->waiters);
  state_->waiters.clear();
  auto state = state_;
  for (auto &cb : waiters)
    state_->loop->post([state, cb = std::move(cb)] { cb(*state->outcome); });
  return true;
}

void Deferred::adopt(const Result &result) {
  if (!result.is_pending()) {
    resolve(result.value());
    return;
  }
  auto self = *this;
  result.pending().on_settle([self](const Outcome &o) mutable { self.settle(o); });
}

Pending Result::to_pending(EventLoop &loop) const {
  if (is_pending())
    return pending();
  return Pending::resolved(loop, value());
}

} // namespace opguard
