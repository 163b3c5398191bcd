#include "opguard/lifecycle.hpp"

#include <stdexcept>

namespace opguard {
namespace {

CallContext make_context(const OperationId &id, const Args &args) {
  CallContext ctx;
  ctx.operation_name = id.name;
  ctx.scope_name = id.scope;
  ctx.args = args;
  return ctx;
}

// Releases `result` once the hook's pending value settles.
Result hold_until(const Result &hook_result, Result result) {
  if (!hook_result.is_pending())
    return result;
  return hook_result.pending().then(
      [result](const Value &) -> Result { return result; });
}

Result rethrow_after(const Result &hook_result, std::exception_ptr error) {
  if (!hook_result.is_pending())
    std::rethrow_exception(error);
  return hook_result.pending().then(
      [error](const Value &) -> Result { std::rethrow_exception(error); });
}

class EffectOperation : public WrappedOperation {
public:
  EffectOperation(OperationPtr next, EffectHook hook)
      : WrappedOperation(std::move(next)), hook_(std::move(hook)) {}

protected:
  EffectHook hook_;
};

class BeforeOperation final : public EffectOperation {
public:
  using EffectOperation::EffectOperation;

  Result invoke(const Args &args) override {
    Result before = hook_(make_context(id(), args));
    return hold_until(before, next_->invoke(args));
  }
};

class AfterOperation final : public EffectOperation {
public:
  using EffectOperation::EffectOperation;

  Result invoke(const Args &args) override {
    Result r = next_->invoke(args);
    CallContext ctx = make_context(id(), args);
    if (!r.is_pending()) {
      ctx.result = r.value();
      return hold_until(hook_(ctx), r);
    }
    auto hook = hook_;
    return r.pending().then([hook, ctx](const Value &v) mutable -> Result {
      ctx.result = v;
      return hold_until(hook(ctx), v);
    });
  }
};

class ErrorOperation final : public EffectOperation {
public:
  using EffectOperation::EffectOperation;

  Result invoke(const Args &args) override {
    Result r;
    try {
      r = next_->invoke(args);
    } catch (...) {
      auto error = std::current_exception();
      CallContext ctx = make_context(id(), args);
      ctx.error = error;
      return rethrow_after(hook_(ctx), error);
    }
    if (!r.is_pending())
      return r;
    auto hook = hook_;
    CallContext ctx = make_context(id(), args);
    return r.pending().recover(
        [hook, ctx](std::exception_ptr error) mutable -> Result {
          ctx.error = error;
          return rethrow_after(hook(ctx), error);
        });
  }
};

template <typename Op> DecoratorPtr make_effect(std::string name, EffectHook hook) {
  if (!hook)
    throw std::invalid_argument(name + " requires a hook");
  return make_decorator(std::move(name), [hook](OperationPtr next) -> OperationPtr {
    return std::make_shared<Op>(std::move(next), hook);
  });
}

} // namespace

DecoratorPtr effect_before(EffectHook hook) {
  return make_effect<BeforeOperation>("effect_before", std::move(hook));
}

DecoratorPtr effect_after(EffectHook hook) {
  return make_effect<AfterOperation>("effect_after", std::move(hook));
}

DecoratorPtr effect_error(EffectHook hook) {
  return make_effect<ErrorOperation>("effect_error", std::move(hook));
}

} // namespace opguard
