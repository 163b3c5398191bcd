#include "opguard/resilience.hpp"

#include <memory>

namespace opguard {
namespace {

// One top-level call: attempts run strictly one after another.
class RetrySequence : public std::enable_shared_from_this<RetrySequence> {
public:
  RetrySequence(EventLoop &loop, OperationPtr op, Args args,
                std::shared_ptr<const RetryOptions> opts)
      : loop_(loop), op_(std::move(op)), args_(std::move(args)),
        opts_(std::move(opts)), done_(loop) {}

  Pending pending() const { return done_.pending(); }

  void attempt() {
    ++attempts_;
    Result r;
    try {
      r = op_->invoke(args_);
    } catch (...) {
      fail(std::current_exception());
      return;
    }
    watch(r);
  }

  void watch(const Result &r) {
    if (!r.is_pending()) {
      done_.resolve(r.value());
      return;
    }
    auto self = shared_from_this();
    r.pending().on_settle([self](const Outcome &o) {
      if (o.ok())
        self->done_.settle(o);
      else
        self->fail(o.error);
    });
  }

  void fail(std::exception_ptr error) {
    if (attempts_ > opts_->max_retries) {
      done_.reject(error);
      return;
    }
    if (opts_->on_retry) {
      try {
        opts_->on_retry(error, attempts_);
      } catch (...) {
        done_.reject(std::current_exception());
        return;
      }
    }
    auto self = shared_from_this();
    loop_.call_later(backoff_delay(*opts_, attempts_), [self] { self->attempt(); });
  }

  void set_attempts(std::size_t n) { attempts_ = n; }

private:
  EventLoop &loop_;
  OperationPtr op_;
  Args args_;
  std::shared_ptr<const RetryOptions> opts_;
  Deferred done_;
  std::size_t attempts_{0};
};

class RetryOperation final : public WrappedOperation {
public:
  RetryOperation(OperationPtr next, EventLoop &loop,
                 std::shared_ptr<const RetryOptions> opts)
      : WrappedOperation(std::move(next)), loop_(loop), opts_(std::move(opts)) {}

  Result invoke(const Args &args) override {
    // The first attempt runs inline so a synchronous success stays
    // synchronous.
    Result first;
    std::exception_ptr error;
    try {
      first = next_->invoke(args);
    } catch (...) {
      error = std::current_exception();
    }
    if (!error && !first.is_pending())
      return first;

    auto seq = std::make_shared<RetrySequence>(loop_, next_, args, opts_);
    seq->set_attempts(1);
    if (error)
      seq->fail(error);
    else
      seq->watch(first);
    return seq->pending();
  }

private:
  EventLoop &loop_;
  std::shared_ptr<const RetryOptions> opts_;
};

} // namespace

Duration backoff_delay(const RetryOptions &opts, std::size_t attempt) {
  const Duration cap = std::chrono::hours(24);
  if (opts.backoff >= cap)
    return cap;
  if (opts.strategy == BackoffStrategy::Normal || attempt <= 1)
    return opts.backoff;
  const auto shift = attempt - 1;
  if (shift >= 32)
    return cap;
  const auto factor = static_cast<Duration::rep>(1) << shift;
  if (opts.backoff.count() > cap.count() / factor)
    return cap;
  return opts.backoff * factor;
}

DecoratorPtr retry(EventLoop &loop, RetryOptions opts) {
  auto shared = std::make_shared<const RetryOptions>(std::move(opts));
  return make_decorator("retry", [&loop, shared](OperationPtr next) -> OperationPtr {
    return std::make_shared<RetryOperation>(std::move(next), loop, shared);
  });
}

} // namespace opguard
