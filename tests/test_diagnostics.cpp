#include "opguard/diagnostics.hpp"
#include "opguard/errors.hpp"

#include <catch2/catch.hpp>

#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace opguard;

namespace {
struct Capture {
  std::vector<std::string> lines;
  LogSink sink() {
    return [this](const std::string &line) { lines.push_back(line); };
  }
};

OperationPtr adder() {
  return make_operation({"Calc", "add"}, [](const Args &args) -> Result {
    return Value{std::get<std::int64_t>(args.at(0)) + std::get<std::int64_t>(args.at(1))};
  });
}

OperationPtr divider() {
  return make_operation({"Calc", "div"}, [](const Args &args) -> Result {
    const auto d = std::get<std::int64_t>(args.at(1));
    if (d == 0)
      throw std::domain_error("division by zero");
    return Value{std::get<std::int64_t>(args.at(0)) / d};
  });
}

Args operands(std::int64_t a, std::int64_t b) { return {Value{a}, Value{b}}; }
} // namespace

TEST_CASE("timed logs the duration of successful and failed calls",
          "[diagnostics][timed]") {
  Capture cap;
  auto ok = decorate(adder(), {timed(cap.sink())});
  auto bad = decorate(divider(), {timed(cap.sink())});

  CHECK(std::get<std::int64_t>(ok->invoke(operands(2, 3)).value()) == 5);
  CHECK_THROWS_AS(bad->invoke(operands(1, 0)), std::domain_error);

  REQUIRE(cap.lines.size() == 2);
  CHECK(std::regex_match(cap.lines[0], std::regex(R"(Calc\.add took [0-9]+\.[0-9]{2}ms)")));
  CHECK(std::regex_match(cap.lines[1],
                         std::regex(R"(Calc\.div failed after [0-9]+\.[0-9]{2}ms)")));
}

TEST_CASE("timed reports asynchronous calls once they settle",
          "[diagnostics][timed][async]") {
  auto clock = std::make_shared<ManualClock>();
  EventLoop loop(clock);
  Capture cap;
  auto remote = make_operation({"Api", "get"}, [&loop](const Args &) -> Result {
    Deferred d(loop);
    loop.call_later(Duration(5), [d]() mutable { d.resolve(Value{true}); });
    return d.pending();
  });
  auto op = decorate(remote, {timed(cap.sink())});

  Result r = op->invoke({});
  CHECK(cap.lines.empty());
  loop.await(r);
  REQUIRE(cap.lines.size() == 1);
  CHECK(cap.lines[0].rfind("Api.get took ", 0) == 0);
}

TEST_CASE("measure logs duration and optionally memory",
          "[diagnostics][measure]") {
  Capture cap;
  auto plain = decorate(adder(), {measure({false, cap.sink()})});
  auto with_memory = decorate(adder(), {measure({true, cap.sink()})});

  plain->invoke(operands(1, 1));
  with_memory->invoke(operands(1, 1));

  REQUIRE(cap.lines.size() == 2);
  CHECK(std::regex_match(cap.lines[0],
                         std::regex(R"(Calc\.add metrics: duration=[0-9]+\.[0-9]{2})")));
  CHECK(std::regex_match(
      cap.lines[1],
      std::regex(R"(Calc\.add metrics: duration=[0-9]+\.[0-9]{2} memory=-?[0-9]+)")));
  CHECK(resident_bytes() >= 0);
}

TEST_CASE("deprecate warns on every call and still runs it",
          "[diagnostics][deprecate]") {
  Capture cap;
  auto op = decorate(adder(), {deprecate({}, cap.sink())});
  auto custom = decorate(adder(), {deprecate("use Calc.sum instead", cap.sink())});

  CHECK(std::get<std::int64_t>(op->invoke(operands(1, 2)).value()) == 3);
  op->invoke(operands(1, 2));
  custom->invoke(operands(1, 2));

  REQUIRE(cap.lines.size() == 3);
  CHECK(cap.lines[0] == "Deprecation warning: add is deprecated");
  CHECK(cap.lines[1] == cap.lines[0]);
  CHECK(cap.lines[2] == "Deprecation warning: use Calc.sum instead");
  CHECK(op->id().name == "add");
}

TEST_CASE("guard_sync rejects arguments that fail the predicate",
          "[diagnostics][guard]") {
  int calls = 0;
  auto counted = make_operation({"Calc", "sqrt"}, [&calls](const Args &) -> Result {
    ++calls;
    return Value{2.0};
  });
  auto op = decorate(counted, {guard_sync([](const Args &args) {
                       return std::get<double>(args.at(0)) >= 0.0;
                     })});

  CHECK(std::get<double>(op->invoke({Value{4.0}}).value()) == 2.0);
  try {
    op->invoke({Value{-1.0}});
    FAIL("expected a guard failure");
  } catch (const GuardError &e) {
    CHECK(e.kind() == ErrorKind::GuardRejected);
    CHECK(std::string(e.what()) == "Guard failed for sqrt");
  }
  CHECK(calls == 1);
}

TEST_CASE("guard_async waits for the predicate before running",
          "[diagnostics][guard][async]") {
  auto clock = std::make_shared<ManualClock>();
  EventLoop loop(clock);
  int calls = 0;
  auto counted = make_operation({"Acl", "read"}, [&calls](const Args &) -> Result {
    ++calls;
    return Value{std::string("secret")};
  });
  auto op = decorate(counted, {guard_async([&loop](const Args &args) -> Result {
                       const bool allowed = std::get<std::string>(args.at(0)) == "admin";
                       Deferred d(loop);
                       loop.call_later(Duration(15), [d, allowed]() mutable {
                         d.resolve(Value{allowed});
                       });
                       return d.pending();
                     })});

  Result denied = op->invoke({Value{std::string("guest")}});
  REQUIRE(denied.is_pending());
  CHECK_THROWS_AS(loop.await(denied), GuardError);
  CHECK(calls == 0);

  CHECK(std::get<std::string>(loop.await(op->invoke({Value{std::string("admin")}}))) ==
        "secret");
  CHECK(calls == 1);
}
