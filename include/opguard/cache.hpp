#pragma once

#include "opguard/event_loop.hpp"
#include "opguard/operation.hpp"
#include "opguard/policy.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace opguard {

struct CacheStoreConfig {
  std::size_t max_entries{0};
  std::size_t ttl_cleanup_per_tick{128};
  std::string policy{"lru"};
};

struct CacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t expirations{0};
  std::uint64_t evictions{0};
  std::uint64_t invalidations{0};
};

class CacheStore {
public:
  explicit CacheStore(std::shared_ptr<IClock> clock, CacheStoreConfig cfg = {});

  std::optional<Value> get(const std::string &key);
  void put(const std::string &key, Value value, std::optional<Duration> ttl);
  bool erase(const std::string &key);
  std::size_t erase_many(const std::vector<std::string> &keys);
  bool contains(const std::string &key) const;
  void clear();

  // Removes at most ttl_cleanup_per_tick expired entries. put() runs the
  // same bounded sweep before every write.
  std::size_t tick();

  std::size_t size() const;
  CacheStats stats() const;
  std::string info() const;
  std::string policy_name() const;

private:
  struct ExpiryNode {
    TimePoint deadline;
    std::string key;
    std::uint64_t generation;
    bool operator>(const ExpiryNode &other) const {
      return deadline > other.deadline;
    }
  };

  bool expired_locked(const CacheEntry &e, TimePoint now) const;
  void erase_locked(const std::string &key);
  void evict_until_fit_locked();
  std::size_t tick_locked(TimePoint now);

  std::shared_ptr<IClock> clock_;
  CacheStoreConfig cfg_;
  std::unique_ptr<IEvictionPolicy> policy_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, CacheEntry> entries_;
  std::unordered_map<std::string, std::uint64_t> expiry_generation_;
  std::priority_queue<ExpiryNode, std::vector<ExpiryNode>,
                      std::greater<ExpiryNode>>
      expiry_heap_;
  CacheStats stats_;
};

using CacheKeyFn = KeyFn;

struct CacheOptions {
  // Unset or non-positive means entries never expire.
  std::optional<Duration> expiry;
  CacheKeyFn key;
  std::shared_ptr<CacheStore> store;
};

class CachedDecorator final : public IDecorator {
public:
  CachedDecorator(EventLoop &loop, CacheOptions opts);

  std::string name() const override { return "cached"; }
  OperationPtr attach(OperationPtr next) override;

  // Drops every key produced through this decorator, leaving other
  // decorators' entries in a shared store untouched.
  std::size_t invalidate();
  std::vector<std::string> keys() const;
  const std::shared_ptr<CacheStore> &store() const { return opts_.store; }

  struct KeyLedger {
    mutable std::mutex mu;
    std::unordered_set<std::string> keys;
  };

private:
  CacheOptions opts_;
  std::shared_ptr<KeyLedger> ledger_;
};

std::shared_ptr<CachedDecorator> cached(EventLoop &loop, CacheOptions opts = {});

// Permanent per-definition memoization; no expiry, no invalidation.
DecoratorPtr memoize(EventLoop &loop);

} // namespace opguard
