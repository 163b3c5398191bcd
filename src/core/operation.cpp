#include "opguard/operation.hpp"

#include <stdexcept>

namespace opguard {
namespace {

class FunctionOperation final : public IOperation {
public:
  FunctionOperation(OperationId id, OperationFn fn)
      : id_(std::move(id)), fn_(std::move(fn)) {}
  const OperationId &id() const override { return id_; }
  Result invoke(const Args &args) override { return fn_(args); }

private:
  OperationId id_;
  OperationFn fn_;
};

class FunctionDecorator final : public IDecorator {
public:
  FunctionDecorator(std::string name, AttachFn attach)
      : name_(std::move(name)), attach_(std::move(attach)) {}
  std::string name() const override { return name_; }
  OperationPtr attach(OperationPtr next) override {
    return attach_(std::move(next));
  }

private:
  std::string name_;
  AttachFn attach_;
};

} // namespace

OperationPtr make_operation(OperationId id, OperationFn fn) {
  if (!fn)
    throw std::invalid_argument("operation function is empty");
  return std::make_shared<FunctionOperation>(std::move(id), std::move(fn));
}

DecoratorPtr make_decorator(std::string name, AttachFn attach) {
  if (!attach)
    throw std::invalid_argument("decorator attach function is empty");
  return std::make_shared<FunctionDecorator>(std::move(name), std::move(attach));
}

OperationPtr decorate(OperationPtr base,
                      const std::vector<DecoratorPtr> &decorators) {
  OperationPtr op = std::move(base);
  for (const auto &d : decorators) {
    if (d)
      op = d->attach(std::move(op));
  }
  return op;
}

WrappedOperation::WrappedOperation(OperationPtr next) : next_(std::move(next)) {
  if (!next_)
    throw std::invalid_argument("cannot wrap a null operation");
}

} // namespace opguard
