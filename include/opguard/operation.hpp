#pragma once

#include "opguard/pending.hpp"
#include "opguard/types.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace opguard {

struct OperationId {
  std::string scope{"default"};
  std::string name;

  std::string qualified() const { return scope + "." + name; }
  std::string key() const { return scope + ":" + name; }
};

class IOperation {
public:
  virtual ~IOperation() = default;
  virtual const OperationId &id() const = 0;
  virtual Result invoke(const Args &args) = 0;
};

using OperationPtr = std::shared_ptr<IOperation>;
using OperationFn = std::function<Result(const Args &)>;

// Derives a state key from the call arguments.
using KeyFn = std::function<std::string(const Args &)>;

OperationPtr make_operation(OperationId id, OperationFn fn);

// One wrapper definition. State that must outlive a single call lives in
// the decorator and is shared by everything attached through it.
class IDecorator {
public:
  virtual ~IDecorator() = default;
  virtual std::string name() const = 0;
  virtual OperationPtr attach(OperationPtr next) = 0;
};

using DecoratorPtr = std::shared_ptr<IDecorator>;
using AttachFn = std::function<OperationPtr(OperationPtr)>;

// For wrappers that keep no per-definition state.
DecoratorPtr make_decorator(std::string name, AttachFn attach);

// Applies decorators innermost first.
OperationPtr decorate(OperationPtr base,
                      const std::vector<DecoratorPtr> &decorators);

// Base for wrappers: forwards identity to the wrapped operation.
class WrappedOperation : public IOperation {
public:
  explicit WrappedOperation(OperationPtr next);
  const OperationId &id() const override { return next_->id(); }

protected:
  OperationPtr next_;
};

enum class StateScope { Definition, Instance };

} // namespace opguard
