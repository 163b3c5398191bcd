#include "opguard/circuit_breaker.hpp"
#include "opguard/errors.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace opguard;

namespace {
struct Switchable {
  bool fail{true};
  int calls{0};
};

OperationPtr switchable(Switchable &s, std::string name = "send") {
  return make_operation({"Mailer", std::move(name)}, [&s](const Args &) -> Result {
    ++s.calls;
    if (s.fail)
      throw std::runtime_error("smtp unavailable");
    return Value{std::string("sent")};
  });
}

CircuitBreakerOptions options(std::vector<CircuitState> &log,
                              std::size_t threshold = 3) {
  CircuitBreakerOptions o;
  o.failure_threshold = threshold;
  o.reset_timeout = Duration(1000);
  o.on_state_change = [&log](CircuitState s) { log.push_back(s); };
  return o;
}
} // namespace

TEST_CASE("Circuit opens after the failure threshold and rejects fast",
          "[breaker]") {
  auto clock = std::make_shared<ManualClock>();
  EventLoop loop(clock);
  Switchable svc;
  std::vector<CircuitState> log;
  auto breaker = circuit_breaker(loop, options(log));
  auto op = decorate(switchable(svc), {breaker});

  for (int i = 0; i < 3; ++i)
    CHECK_THROWS_AS(op->invoke({}), std::runtime_error);
  CHECK(breaker->state()->state() == CircuitState::Open);

  try {
    op->invoke({});
    FAIL("expected an open circuit");
  } catch (const CircuitOpenError &e) {
    CHECK(e.kind() == ErrorKind::CircuitOpen);
    CHECK(std::string(e.what()) == "Circuit breaker is open");
  }
  CHECK(svc.calls == 3);
  CHECK((log == std::vector<CircuitState>{CircuitState::Open}));
}

TEST_CASE("A success below the threshold does not clear earlier failures",
          "[breaker]") {
  auto clock = std::make_shared<ManualClock>();
  EventLoop loop(clock);
  Switchable svc;
  std::vector<CircuitState> log;
  auto breaker = circuit_breaker(loop, options(log, 3));
  auto op = decorate(switchable(svc), {breaker});

  CHECK_THROWS_AS(op->invoke({}), std::runtime_error);
  CHECK_THROWS_AS(op->invoke({}), std::runtime_error);
  svc.fail = false;
  CHECK(std::get<std::string>(op->invoke({}).value()) == "sent");
  CHECK(breaker->state()->state() == CircuitState::Closed);
  CHECK(breaker->state()->failures() == std::size_t{2});

  svc.fail = true;
  CHECK_THROWS_AS(op->invoke({}), std::runtime_error);
  CHECK(breaker->state()->state() == CircuitState::Open);
  CHECK((log == std::vector<CircuitState>{CircuitState::Open}));
  CHECK_THROWS_AS(op->invoke({}), CircuitOpenError);
  CHECK(svc.calls == 4);
}

TEST_CASE("A successful trial after the reset timeout closes the circuit",
          "[breaker]") {
  auto clock = std::make_shared<ManualClock>();
  EventLoop loop(clock);
  Switchable svc;
  std::vector<CircuitState> log;
  auto breaker = circuit_breaker(loop, options(log, 2));
  auto op = decorate(switchable(svc), {breaker});

  CHECK_THROWS(op->invoke({}));
  CHECK_THROWS(op->invoke({}));
  clock->advance(Duration(999));
  CHECK_THROWS_AS(op->invoke({}), CircuitOpenError);

  clock->advance(Duration(1));
  svc.fail = false;
  CHECK(std::get<std::string>(loop.await(op->invoke({}))) == "sent");

  const auto snap = breaker->state()->snapshot();
  CHECK(snap.state == CircuitState::Closed);
  CHECK(snap.failures == 0);
  CHECK((log == std::vector<CircuitState>{CircuitState::Open,
                                          CircuitState::HalfOpen,
                                          CircuitState::Closed}));
}

TEST_CASE("A failed trial reopens the circuit for another full timeout",
          "[breaker]") {
  auto clock = std::make_shared<ManualClock>();
  EventLoop loop(clock);
  Switchable svc;
  std::vector<CircuitState> log;
  auto breaker = circuit_breaker(loop, options(log, 1));
  auto op = decorate(switchable(svc), {breaker});

  CHECK_THROWS_AS(op->invoke({}), std::runtime_error);
  clock->advance(Duration(1000));
  CHECK_THROWS_AS(op->invoke({}), std::runtime_error);
  CHECK(breaker->state()->state() == CircuitState::Open);
  CHECK(breaker->state()->snapshot().last_failure_time ==
        TimePoint{} + Duration(1000));

  clock->advance(Duration(500));
  CHECK_THROWS_AS(op->invoke({}), CircuitOpenError);
  CHECK(svc.calls == 2);
  CHECK((log == std::vector<CircuitState>{CircuitState::Open,
                                          CircuitState::HalfOpen,
                                          CircuitState::Open}));
}

TEST_CASE("Half-open admits a single trial call at a time",
          "[breaker][async]") {
  auto clock = std::make_shared<ManualClock>();
  EventLoop loop(clock);
  int calls = 0;
  bool fail = true;
  auto remote = make_operation({"Mailer", "send"}, [&](const Args &) -> Result {
    ++calls;
    Deferred d(loop);
    const bool f = fail;
    loop.call_later(Duration(50), [d, f]() mutable {
      if (f)
        d.reject(std::make_exception_ptr(std::runtime_error("timeout")));
      else
        d.resolve(Value{std::string("sent")});
    });
    return d.pending();
  });
  auto breaker = circuit_breaker(loop, {1, Duration(100), {}, StateScope::Definition});
  auto op = decorate(remote, {breaker});

  CHECK_THROWS_AS(loop.await(op->invoke({})), std::runtime_error);
  REQUIRE(breaker->state()->state() == CircuitState::Open);

  clock->advance(Duration(100));
  fail = false;
  Result trial = op->invoke({});
  REQUIRE(trial.is_pending());
  CHECK(breaker->state()->state() == CircuitState::HalfOpen);
  CHECK_THROWS_AS(op->invoke({}), CircuitOpenError);

  CHECK(std::get<std::string>(loop.await(trial)) == "sent");
  CHECK(breaker->state()->state() == CircuitState::Closed);
  CHECK(calls == 2);
}

TEST_CASE("Definition scope shares one breaker across attachments",
          "[breaker][scope]") {
  auto clock = std::make_shared<ManualClock>();
  EventLoop loop(clock);
  Switchable a;
  Switchable b;
  b.fail = false;

  auto shared = circuit_breaker(loop, {2, Duration(1000), {}, StateScope::Definition});
  auto a_op = decorate(switchable(a), {shared});
  auto b_op = decorate(switchable(b), {shared});
  CHECK_THROWS(a_op->invoke({}));
  CHECK_THROWS(a_op->invoke({}));
  CHECK_THROWS_AS(b_op->invoke({}), CircuitOpenError);
  CHECK(b.calls == 0);

  Switchable c;
  Switchable d;
  d.fail = false;
  auto isolated = circuit_breaker(loop, {2, Duration(1000), {}, StateScope::Instance});
  CHECK(isolated->state() == nullptr);
  auto c_op = decorate(switchable(c), {isolated});
  auto d_op = decorate(switchable(d), {isolated});
  CHECK_THROWS(c_op->invoke({}));
  CHECK_THROWS(c_op->invoke({}));
  CHECK_THROWS_AS(c_op->invoke({}), CircuitOpenError);
  CHECK(std::get<std::string>(loop.await(d_op->invoke({}))) == "sent");
}

TEST_CASE("Breaker state machine guards its threshold", "[breaker][state]") {
  BreakerState state(0, Duration(10));
  const TimePoint t0{};
  CHECK(state.try_acquire(t0));
  state.record_failure(t0);
  CHECK(state.state() == CircuitState::Open);
  CHECK_FALSE(state.try_acquire(t0 + Duration(9)));
  CHECK(state.try_acquire(t0 + Duration(10)));
  CHECK_FALSE(state.try_acquire(t0 + Duration(10)));
  state.record_success();
  CHECK(state.state() == CircuitState::Closed);
  CHECK(to_string(CircuitState::HalfOpen) == "half-open");
}
