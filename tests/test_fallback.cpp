#include "opguard/resilience.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

using namespace opguard;

TEST_CASE("A succeeding operation never touches its fallback", "[fallback]") {
  auto clock = std::make_shared<ManualClock>();
  EventLoop loop(clock);
  int backups = 0;
  auto backup = make_operation({"Prices", "cached"}, [&backups](const Args &) -> Result {
    ++backups;
    return Value{std::string("stale")};
  });
  auto live = make_operation({"Prices", "live"}, [](const Args &) -> Result {
    return Value{std::string("fresh")};
  });
  auto op = decorate(live, {fallback(backup)});

  Result r = op->invoke({});
  REQUIRE_FALSE(r.is_pending());
  CHECK(std::get<std::string>(r.value()) == "fresh");
  CHECK(backups == 0);
}

TEST_CASE("A synchronous failure is replaced by the fallback result",
          "[fallback]") {
  auto clock = std::make_shared<ManualClock>();
  EventLoop loop(clock);
  int backups = 0;
  Args seen;
  auto backup = make_operation({"Prices", "cached"}, [&](const Args &args) -> Result {
    ++backups;
    seen = args;
    return Value{std::string("stale")};
  });
  auto live = make_operation({"Prices", "live"}, [](const Args &) -> Result {
    throw std::runtime_error("feed down");
  });
  auto op = decorate(live, {fallback(backup)});

  const Args args{Value{std::string("EURUSD")}};
  CHECK(std::get<std::string>(loop.await(op->invoke(args))) == "stale");
  CHECK(backups == 1);
  REQUIRE(seen.size() == 1);
  CHECK(std::get<std::string>(seen[0]) == "EURUSD");
}

TEST_CASE("An asynchronous rejection is replaced exactly once",
          "[fallback][async]") {
  auto clock = std::make_shared<ManualClock>();
  EventLoop loop(clock);
  int backups = 0;
  auto backup = make_operation({"Prices", "cached"}, [&backups](const Args &) -> Result {
    ++backups;
    return Value{std::string("stale")};
  });
  auto live = make_operation({"Prices", "live"}, [&loop](const Args &) -> Result {
    Deferred d(loop);
    loop.call_later(Duration(5), [d]() mutable {
      d.reject(std::make_exception_ptr(std::runtime_error("feed down")));
    });
    return d.pending();
  });
  auto op = decorate(live, {fallback(backup)});

  Result r = op->invoke({});
  REQUIRE(r.is_pending());
  CHECK(std::get<std::string>(loop.await(r)) == "stale");
  loop.run_until_idle();
  CHECK(backups == 1);
}

TEST_CASE("A failing fallback surfaces its own failure", "[fallback][errors]") {
  auto clock = std::make_shared<ManualClock>();
  EventLoop loop(clock);
  auto backup = make_operation({"Prices", "cached"}, [](const Args &) -> Result {
    throw std::out_of_range("no cached price");
  });
  auto live = make_operation({"Prices", "live"}, [](const Args &) -> Result {
    throw std::runtime_error("feed down");
  });
  auto op = decorate(live, {fallback(backup)});
  CHECK_THROWS_AS(op->invoke({}), std::out_of_range);
  CHECK_THROWS_AS(fallback(nullptr), std::invalid_argument);
}
