#pragma once

#include "opguard/log.hpp"
#include "opguard/operation.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace opguard {

// Logs "<scope>.<name> took <ms>ms" or "<scope>.<name> failed after <ms>ms".
DecoratorPtr timed(LogSink logger = stdout_sink());

struct MeasureOptions {
  bool memory{false};
  LogSink logger;
};

// Logs "<scope>.<name> metrics: duration=<ms>" once the call settles,
// with " memory=<bytes>" appended when requested.
DecoratorPtr measure(MeasureOptions opts = {});

// An empty message logs "<name> is deprecated".
DecoratorPtr deprecate(std::string message = {}, LogSink logger = stderr_sink());

using GuardPredicate = std::function<bool(const Args &)>;
// Must yield a bool, immediately or once pending.
using AsyncGuardPredicate = std::function<Result(const Args &)>;

// Throws GuardError when the predicate rejects the arguments.
DecoratorPtr guard_sync(GuardPredicate pred);
// Rejects with GuardError when the predicate settles false.
DecoratorPtr guard_async(AsyncGuardPredicate pred);

// Resident set size in bytes, or 0 where /proc is unavailable.
std::int64_t resident_bytes();

} // namespace opguard
