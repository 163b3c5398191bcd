#pragma once

#include "opguard/event_loop.hpp"
#include "opguard/types.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace opguard {

struct Outcome {
  std::optional<Value> value;
  std::exception_ptr error;

  static Outcome success(Value v) { return {std::move(v), nullptr}; }
  static Outcome failure(std::exception_ptr e) { return {std::nullopt, e}; }

  bool ok() const { return !error; }
  Value get() const;
};

class Result;

// Shared handle to a single-assignment asynchronous value.
class Pending {
public:
  using Callback = std::function<void(const Outcome &)>;

  static Pending resolved(EventLoop &loop, Value v);
  static Pending rejected(EventLoop &loop, std::exception_ptr e);

  bool settled() const { return state_->outcome.has_value(); }
  const Outcome &outcome() const;
  EventLoop &loop() const { return *state_->loop; }

  void on_settle(Callback cb) const;
  Pending then(std::function<Result(const Value &)> fn) const;
  Pending recover(std::function<Result(std::exception_ptr)> fn) const;

private:
  friend class Deferred;

  struct State {
    EventLoop *loop{nullptr};
    std::optional<Outcome> outcome;
    std::vector<Callback> waiters;
  };

  explicit Pending(std::shared_ptr<State> state) : state_(std::move(state)) {}

  std::shared_ptr<State> state_;
};

class Deferred {
public:
  explicit Deferred(EventLoop &loop);

  Pending pending() const { return Pending(state_); }

  bool resolve(Value v) { return settle(Outcome::success(std::move(v))); }
  bool reject(std::exception_ptr e) { return settle(Outcome::failure(e)); }
  bool settle(Outcome outcome);

  // Settles from a result, following it if it is still pending.
  void adopt(const Result &result);

private:
  std::shared_ptr<Pending::State> state_;
};

// What an operation hands back: an immediate value or a pending one.
// Synchronous failure is a thrown exception, not a Result.
class Result {
public:
  Result() : v_(Value{}) {}
  Result(Value v) : v_(std::move(v)) {}
  Result(Pending p) : v_(std::move(p)) {}

  bool is_pending() const { return std::holds_alternative<Pending>(v_); }
  const Value &value() const { return std::get<Value>(v_); }
  const Pending &pending() const { return std::get<Pending>(v_); }

  Pending to_pending(EventLoop &loop) const;

private:
  std::variant<Value, Pending> v_;
};

} // namespace opguard
