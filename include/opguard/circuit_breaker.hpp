#pragma once

#include "opguard/event_loop.hpp"
#include "opguard/operation.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace opguard {

enum class CircuitState { Closed, Open, HalfOpen };

std::string to_string(CircuitState state);

using StateChangeCallback = std::function<void(CircuitState)>;

struct CircuitBreakerOptions {
  std::size_t failure_threshold{5};
  Duration reset_timeout{30000};
  StateChangeCallback on_state_change;
  StateScope scope{StateScope::Definition};
};

struct BreakerSnapshot {
  CircuitState state{CircuitState::Closed};
  std::size_t failures{0};
  std::optional<TimePoint> last_failure_time;
  bool trial_in_flight{false};
};

// Closed -> Open after failure_threshold failures; Open -> HalfOpen once
// reset_timeout has passed since the last failure; HalfOpen admits one
// trial call whose outcome closes or reopens the circuit. The callback
// fires once per actual transition, outside the lock.
class BreakerState {
public:
  BreakerState(std::size_t failure_threshold, Duration reset_timeout,
               StateChangeCallback on_state_change = {});

  bool try_acquire(TimePoint now);
  void record_success();
  void record_failure(TimePoint now);

  CircuitState state() const;
  std::size_t failures() const;
  BreakerSnapshot snapshot() const;

private:
  void notify(std::optional<CircuitState> changed) const;
  std::optional<CircuitState> transition_locked(CircuitState next);

  const std::size_t failure_threshold_;
  const Duration reset_timeout_;
  StateChangeCallback on_state_change_;
  mutable std::mutex mu_;
  CircuitState state_{CircuitState::Closed};
  std::size_t failures_{0};
  std::optional<TimePoint> last_failure_time_;
  bool trial_in_flight_{false};
};

class CircuitBreakerDecorator final : public IDecorator {
public:
  CircuitBreakerDecorator(EventLoop &loop, CircuitBreakerOptions opts);

  std::string name() const override { return "circuit_breaker"; }
  OperationPtr attach(OperationPtr next) override;

  // Shared state for StateScope::Definition, nullptr for Instance.
  std::shared_ptr<BreakerState> state() const { return state_; }

private:
  std::shared_ptr<BreakerState> make_state() const;

  EventLoop &loop_;
  CircuitBreakerOptions opts_;
  std::shared_ptr<BreakerState> state_;
};

std::shared_ptr<CircuitBreakerDecorator>
circuit_breaker(EventLoop &loop, CircuitBreakerOptions opts);

} // namespace opguard
