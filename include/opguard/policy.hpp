#pragma once

#include "opguard/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace opguard {

class IEvictionPolicy {
public:
  virtual ~IEvictionPolicy() = default;
  virtual std::string name() const = 0;
  virtual void on_insert(const std::string& key, const CacheEntry& entry) = 0;
  virtual void on_access(const std::string& key, const CacheEntry& entry) = 0;
  virtual void on_erase(const std::string& key) = 0;
  virtual std::optional<std::string> pick_victim(
      const std::unordered_map<std::string, CacheEntry>& entries) = 0;
};

// "lru" or "lfu"; anything else is rejected with nullptr.
std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string& mode);

} // namespace opguard
