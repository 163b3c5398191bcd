#include "opguard/diagnostics.hpp"

#include "opguard/errors.hpp"

#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace opguard {
namespace {

using WallClock = std::chrono::steady_clock;

std::string elapsed_ms(WallClock::time_point start) {
  const std::chrono::duration<double, std::milli> d = WallClock::now() - start;
  std::ostringstream os;
  os << std::fixed << std::setprecision(2) << d.count();
  return os.str();
}

bool truthy(const Value &v) {
  if (const auto *b = std::get_if<bool>(&v))
    return *b;
  if (const auto *i = std::get_if<std::int64_t>(&v))
    return *i != 0;
  if (const auto *d = std::get_if<double>(&v))
    return *d != 0.0;
  if (const auto *s = std::get_if<std::string>(&v))
    return !s->empty();
  return false;
}

class TimedOperation final : public WrappedOperation {
public:
  TimedOperation(OperationPtr next, LogSink logger)
      : WrappedOperation(std::move(next)), logger_(std::move(logger)) {}

  Result invoke(const Args &args) override {
    const auto start = WallClock::now();
    const std::string label = id().qualified();
    Result r;
    try {
      r = next_->invoke(args);
    } catch (...) {
      logger_(label + " failed after " + elapsed_ms(start) + "ms");
      throw;
    }
    if (!r.is_pending()) {
      logger_(label + " took " + elapsed_ms(start) + "ms");
      return r;
    }
    auto logger = logger_;
    r.pending().on_settle([logger, label, start](const Outcome &o) {
      logger(label + (o.ok() ? " took " : " failed after ") + elapsed_ms(start) +
             "ms");
    });
    return r;
  }

private:
  LogSink logger_;
};

class MeasuredOperation final : public WrappedOperation {
public:
  MeasuredOperation(OperationPtr next, MeasureOptions opts)
      : WrappedOperation(std::move(next)), opts_(std::move(opts)) {}

  Result invoke(const Args &args) override {
    const auto start = WallClock::now();
    const std::int64_t start_rss = opts_.memory ? resident_bytes() : 0;
    const std::string label = id().qualified();
    Result r;
    try {
      r = next_->invoke(args);
    } catch (...) {
      opts_.logger(label + " failed after " + elapsed_ms(start) + "ms");
      throw;
    }
    auto report = [opts = opts_, label, start, start_rss] {
      std::string line = label + " metrics: duration=" + elapsed_ms(start);
      if (opts.memory)
        line += " memory=" + std::to_string(resident_bytes() - start_rss);
      opts.logger(line);
    };
    if (!r.is_pending()) {
      report();
      return r;
    }
    r.pending().on_settle([report](const Outcome &) { report(); });
    return r;
  }

private:
  MeasureOptions opts_;
};

class GuardedOperation final : public WrappedOperation {
public:
  GuardedOperation(OperationPtr next, AsyncGuardPredicate pred)
      : WrappedOperation(std::move(next)), pred_(std::move(pred)) {}

  Result invoke(const Args &args) override {
    Result verdict = pred_(args);
    if (!verdict.is_pending()) {
      if (!truthy(verdict.value()))
        throw GuardError(id().name);
      return next_->invoke(args);
    }
    auto next = next_;
    return verdict.pending().then([next, args](const Value &v) -> Result {
      if (!truthy(v))
        throw GuardError(next->id().name);
      return next->invoke(args);
    });
  }

private:
  AsyncGuardPredicate pred_;
};

} // namespace

std::int64_t resident_bytes() {
  std::ifstream in("/proc/self/statm");
  if (!in)
    return 0;
  std::int64_t size_pages = 0;
  std::int64_t resident_pages = 0;
  if (!(in >> size_pages >> resident_pages))
    return 0;
  const long page = ::sysconf(_SC_PAGESIZE);
  return page > 0 ? resident_pages * page : 0;
}

DecoratorPtr timed(LogSink logger) {
  if (!logger)
    logger = stdout_sink();
  return make_decorator("timed", [logger](OperationPtr next) -> OperationPtr {
    return std::make_shared<TimedOperation>(std::move(next), logger);
  });
}

DecoratorPtr measure(MeasureOptions opts) {
  if (!opts.logger)
    opts.logger = stdout_sink();
  return make_decorator("measure", [opts](OperationPtr next) -> OperationPtr {
    return std::make_shared<MeasuredOperation>(std::move(next), opts);
  });
}

DecoratorPtr deprecate(std::string message, LogSink logger) {
  if (!logger)
    logger = stderr_sink();
  return make_decorator("deprecate", [message, logger](OperationPtr next) -> OperationPtr {
    const std::string line =
        "Deprecation warning: " +
        (message.empty() ? next->id().name + " is deprecated" : message);
    return make_operation(next->id(), [next, logger, line](const Args &args) {
      logger(line);
      return next->invoke(args);
    });
  });
}

DecoratorPtr guard_sync(GuardPredicate pred) {
  if (!pred)
    throw std::invalid_argument("guard_sync requires a predicate");
  return guard_async([pred](const Args &args) -> Result { return Value{pred(args)}; });
}

DecoratorPtr guard_async(AsyncGuardPredicate pred) {
  if (!pred)
    throw std::invalid_argument("guard_async requires a predicate");
  return make_decorator("guard", [pred](OperationPtr next) -> OperationPtr {
    return std::make_shared<GuardedOperation>(std::move(next), pred);
  });
}

} // namespace opguard
