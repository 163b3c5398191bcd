#pragma once

#include "opguard/types.hpp"

#include <exception>
#include <stdexcept>
#include <string>

namespace opguard {

enum class ErrorKind { Timeout, CircuitOpen, RateLimited, GuardRejected };

std::string to_string(ErrorKind kind);

// Base of every failure a wrapper synthesizes itself. Failures raised by
// the wrapped operation are never converted to this type.
class WrapperError : public std::runtime_error {
public:
  WrapperError(ErrorKind kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}
  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

class TimeoutError : public WrapperError {
public:
  TimeoutError(const std::string &name, Duration deadline);
  Duration deadline() const noexcept { return deadline_; }

private:
  Duration deadline_;
};

class CircuitOpenError : public WrapperError {
public:
  CircuitOpenError();
};

class RateLimitError : public WrapperError {
public:
  RateLimitError(const std::string &name, Duration retry_after);
  Duration retry_after() const noexcept { return retry_after_; }

private:
  Duration retry_after_;
};

class GuardError : public WrapperError {
public:
  explicit GuardError(const std::string &name);
};

// Message of a captured failure, for hooks and log lines.
std::string describe(std::exception_ptr e);

} // namespace opguard
