#pragma once

#include "opguard/operation.hpp"

#include <exception>
#include <functional>
#include <optional>
#include <string>

namespace opguard {

// Built fresh for each invocation.
struct CallContext {
  std::string operation_name;
  std::string scope_name;
  Args args;
  std::optional<Value> result;
  std::exception_ptr error;
};

// A hook may return a pending value; the wrapped result is held back
// until it settles. The hook's own value is discarded.
using EffectHook = std::function<Result(const CallContext &)>;

DecoratorPtr effect_before(EffectHook hook);
DecoratorPtr effect_after(EffectHook hook);
// Runs on failure; the original failure is rethrown unchanged afterwards.
DecoratorPtr effect_error(EffectHook hook);

} // namespace opguard
