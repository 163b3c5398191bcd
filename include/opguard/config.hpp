#pragma once

#include "opguard/event_loop.hpp"
#include "opguard/operation.hpp"
#include "opguard/resilience.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace opguard {

// One wrapper stack. An absent field leaves its wrapper disabled.
struct StackConfig {
  bool cache_enabled{false};
  std::optional<Duration> cache_expiry;
  std::size_t cache_max_entries{0};
  std::string cache_policy{"lru"};

  std::optional<std::size_t> retry_max_retries;
  BackoffStrategy retry_strategy{BackoffStrategy::Normal};
  Duration retry_backoff{1000};

  std::optional<Duration> timeout;

  std::optional<std::size_t> breaker_failure_threshold;
  Duration breaker_reset_timeout{30000};

  std::optional<std::size_t> rate_limit;
  Duration rate_window{1000};

  std::string version{"default"};
};

bool parse_stack_config(const std::string &text, StackConfig &cfg,
                        std::string *err = nullptr);
bool load_stack_config(const std::string &path, StackConfig &cfg,
                       std::string *err = nullptr);

// Innermost first: timeout, retry, circuit breaker, rate limiter, cache.
std::vector<DecoratorPtr> decorators_from_config(EventLoop &loop,
                                                 const StackConfig &cfg);

std::string describe_config(const StackConfig &cfg);

} // namespace opguard
