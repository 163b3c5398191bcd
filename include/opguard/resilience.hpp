#pragma once

#include "opguard/event_loop.hpp"
#include "opguard/operation.hpp"

#include <cstddef>
#include <exception>
#include <functional>

namespace opguard {

enum class BackoffStrategy { Normal, Exponential };

using RetryCallback =
    std::function<void(std::exception_ptr error, std::size_t attempt)>;

struct RetryOptions {
  std::size_t max_retries{0};
  BackoffStrategy strategy{BackoffStrategy::Normal};
  Duration backoff{1000};
  RetryCallback on_retry;
};

// Wait after the given failed attempt (1-based).
Duration backoff_delay(const RetryOptions &opts, std::size_t attempt);

// Re-invokes a failing operation up to max_retries more times. The last
// underlying failure surfaces unchanged once the budget is spent.
DecoratorPtr retry(EventLoop &loop, RetryOptions opts);

// Races the operation against a timer. A lost race does not stop the
// operation: it keeps running and its eventual outcome is discarded.
DecoratorPtr timeout(EventLoop &loop, Duration ms);

// On failure, invokes the substitute with the same arguments instead.
DecoratorPtr fallback(OperationPtr substitute);

} // namespace opguard
