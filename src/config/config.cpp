#include "opguard/config.hpp"

#include "opguard/cache.hpp"
#include "opguard/circuit_breaker.hpp"
#include "opguard/policy.hpp"
#include "opguard/rate_limit.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace opguard {
namespace {
// Sets bad when the digits do not fit in 64 bits.
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out, bool &bad) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  try {
    out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  } catch (const std::out_of_range &) {
    bad = true;
    return false;
  }
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}

std::uint64_t clamp_u(std::uint64_t v, std::uint64_t lo, std::uint64_t hi) {
  return std::clamp(v, lo, hi);
}

Duration ms(std::uint64_t v) {
  return Duration(static_cast<Duration::rep>(v));
}

constexpr std::uint64_t kDayMs = 24ULL * 60 * 60 * 1000;
} // namespace

bool parse_stack_config(const std::string &text, StackConfig &cfg,
                        std::string *err) {
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  StackConfig c = cfg;
  std::uint64_t u;
  std::string s;
  bool bad_number = false;

  if (extract_u64(text, "cache_expiry_ms", u, bad_number)) {
    c.cache_enabled = true;
    c.cache_expiry = ms(clamp_u(u, 0, 365 * kDayMs));
  }
  if (extract_u64(text, "cache_max_entries", u, bad_number)) {
    c.cache_enabled = true;
    c.cache_max_entries = static_cast<std::size_t>(clamp_u(u, 0, 1ULL << 24));
  }
  if (extract_string(text, "cache_policy", s)) {
    if (!make_policy_by_name(s)) {
      if (err)
        *err = "unknown cache policy";
      return false;
    }
    c.cache_enabled = true;
    c.cache_policy = s;
  }

  if (extract_u64(text, "retry_max_retries", u, bad_number))
    c.retry_max_retries = static_cast<std::size_t>(clamp_u(u, 0, 100));
  if (extract_string(text, "retry_strategy", s)) {
    if (s == "normal")
      c.retry_strategy = BackoffStrategy::Normal;
    else if (s == "exponential")
      c.retry_strategy = BackoffStrategy::Exponential;
    else {
      if (err)
        *err = "unknown retry strategy";
      return false;
    }
  }
  if (extract_u64(text, "retry_backoff_ms", u, bad_number))
    c.retry_backoff = ms(clamp_u(u, 0, kDayMs));

  if (extract_u64(text, "timeout_ms", u, bad_number))
    c.timeout = ms(clamp_u(u, 1, kDayMs));

  if (extract_u64(text, "breaker_failure_threshold", u, bad_number))
    c.breaker_failure_threshold =
        static_cast<std::size_t>(clamp_u(u, 1, 1000000));
  if (extract_u64(text, "breaker_reset_timeout_ms", u, bad_number))
    c.breaker_reset_timeout = ms(clamp_u(u, 0, kDayMs));

  if (extract_u64(text, "rate_limit", u, bad_number))
    c.rate_limit = static_cast<std::size_t>(clamp_u(u, 1, 1000000));
  if (extract_u64(text, "rate_window_ms", u, bad_number))
    c.rate_window = ms(clamp_u(u, 1, kDayMs));

  if (extract_string(text, "version", s))
    c.version = s;

  if (bad_number) {
    if (err)
      *err = "invalid number";
    return false;
  }
  cfg = std::move(c);
  return true;
}

bool load_stack_config(const std::string &path, StackConfig &cfg,
                       std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_stack_config(ss.str(), cfg, err);
}

std::vector<DecoratorPtr> decorators_from_config(EventLoop &loop,
                                                 const StackConfig &cfg) {
  std::vector<DecoratorPtr> out;
  if (cfg.timeout)
    out.push_back(timeout(loop, *cfg.timeout));
  if (cfg.retry_max_retries) {
    RetryOptions r;
    r.max_retries = *cfg.retry_max_retries;
    r.strategy = cfg.retry_strategy;
    r.backoff = cfg.retry_backoff;
    out.push_back(retry(loop, std::move(r)));
  }
  if (cfg.breaker_failure_threshold) {
    CircuitBreakerOptions b;
    b.failure_threshold = *cfg.breaker_failure_threshold;
    b.reset_timeout = cfg.breaker_reset_timeout;
    out.push_back(circuit_breaker(loop, std::move(b)));
  }
  if (cfg.rate_limit) {
    RateLimitOptions rl;
    rl.limit = *cfg.rate_limit;
    rl.window = cfg.rate_window;
    out.push_back(rate_limited(loop, std::move(rl)));
  }
  if (cfg.cache_enabled) {
    CacheStoreConfig sc;
    sc.max_entries = cfg.cache_max_entries;
    sc.policy = cfg.cache_policy;
    CacheOptions co;
    co.expiry = cfg.cache_expiry;
    co.store = std::make_shared<CacheStore>(loop.shared_clock(), sc);
    out.push_back(cached(loop, std::move(co)));
  }
  return out;
}

std::string describe_config(const StackConfig &cfg) {
  std::ostringstream os;
  os << "version:" << cfg.version << "\n";
  os << "cache:" << (cfg.cache_enabled ? "on" : "off") << "\n";
  if (cfg.cache_enabled) {
    os << "cache_expiry_ms:"
       << (cfg.cache_expiry ? std::to_string(cfg.cache_expiry->count()) : "none")
       << "\n";
    os << "cache_max_entries:" << cfg.cache_max_entries << "\n";
    os << "cache_policy:" << cfg.cache_policy << "\n";
  }
  if (cfg.retry_max_retries) {
    os << "retry_max_retries:" << *cfg.retry_max_retries << "\n";
    os << "retry_strategy:"
       << (cfg.retry_strategy == BackoffStrategy::Exponential ? "exponential"
                                                              : "normal")
       << "\n";
    os << "retry_backoff_ms:" << cfg.retry_backoff.count() << "\n";
  }
  if (cfg.timeout)
    os << "timeout_ms:" << cfg.timeout->count() << "\n";
  if (cfg.breaker_failure_threshold) {
    os << "breaker_failure_threshold:" << *cfg.breaker_failure_threshold
       << "\n";
    os << "breaker_reset_timeout_ms:" << cfg.breaker_reset_timeout.count()
       << "\n";
  }
  if (cfg.rate_limit) {
    os << "rate_limit:" << *cfg.rate_limit << "\n";
    os << "rate_window_ms:" << cfg.rate_window.count() << "\n";
  }
  return os.str();
}

} // namespace opguard
