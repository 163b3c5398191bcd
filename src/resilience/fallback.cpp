#include "opguard/resilience.hpp"

#include <stdexcept>

namespace opguard {
namespace {

class FallbackOperation final : public WrappedOperation {
public:
  FallbackOperation(OperationPtr next, OperationPtr substitute)
      : WrappedOperation(std::move(next)), substitute_(std::move(substitute)) {}

  Result invoke(const Args &args) override {
    Result r;
    try {
      r = next_->invoke(args);
    } catch (...) {
      return substitute_->invoke(args);
    }
    if (!r.is_pending())
      return r;
    auto substitute = substitute_;
    Args saved = args;
    return r.pending().recover([substitute, saved](std::exception_ptr) {
      return substitute->invoke(saved);
    });
  }

private:
  OperationPtr substitute_;
};

} // namespace

DecoratorPtr fallback(OperationPtr substitute) {
  if (!substitute)
    throw std::invalid_argument("fallback needs a substitute operation");
  return make_decorator("fallback", [substitute](OperationPtr next) -> OperationPtr {
    return std::make_shared<FallbackOperation>(std::move(next), substitute);
  });
}

} // namespace opguard
