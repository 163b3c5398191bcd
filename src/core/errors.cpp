#include "opguard/errors.hpp"

namespace opguard {
namespace {
std::string retry_after_message(const std::string &name, Duration retry_after) {
  const auto ms = retry_after.count() < 0 ? 0 : retry_after.count();
  const auto secs = (ms + 999) / 1000;
  return "Rate limit exceeded for " + name + ". Try again in " +
         std::to_string(secs) + " seconds.";
}
} // namespace

std::string to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Timeout:
    return "timeout";
  case ErrorKind::CircuitOpen:
    return "circuit_open";
  case ErrorKind::RateLimited:
    return "rate_limited";
  case ErrorKind::GuardRejected:
    return "guard_rejected";
  }
  return "unknown";
}

TimeoutError::TimeoutError(const std::string &name, Duration deadline)
    : WrapperError(ErrorKind::Timeout, name + " timed out after " +
                                           std::to_string(deadline.count()) +
                                           "ms"),
      deadline_(deadline) {}

CircuitOpenError::CircuitOpenError()
    : WrapperError(ErrorKind::CircuitOpen, "Circuit breaker is open") {}

RateLimitError::RateLimitError(const std::string &name, Duration retry_after)
    : WrapperError(ErrorKind::RateLimited,
                   retry_after_message(name, retry_after)),
      retry_after_(retry_after) {}

GuardError::GuardError(const std::string &name)
    : WrapperError(ErrorKind::GuardRejected, "Guard failed for " + name) {}

std::string describe(std::exception_ptr e) {
  if (!e)
    return "";
  try {
    std::rethrow_exception(e);
  } catch (const std::exception &ex) {
    return ex.what();
  } catch (const std::string &s) {
    return s;
  } catch (const char *s) {
    return s;
  } catch (...) {
    return "unknown error";
  }
}

} // namespace opguard
