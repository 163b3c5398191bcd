#include "opguard/policy.hpp"

#include <algorithm>
#include <list>

namespace opguard {
namespace {

// Recency list: front is the least recently touched key.
class LruPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "lru"; }
  void on_insert(const std::string& key, const CacheEntry&) override { touch(key); }
  void on_access(const std::string& key, const CacheEntry&) override { touch(key); }
  void on_erase(const std::string& key) override {
    auto it = index_.find(key);
    if (it == index_.end()) return;
    order_.erase(it->second);
    index_.erase(it);
  }
  std::optional<std::string> pick_victim(
      const std::unordered_map<std::string, CacheEntry>& entries) override {
    for (const auto& key : order_) {
      if (entries.contains(key)) return key;
    }
    return std::nullopt;
  }

private:
  void touch(const std::string& key) {
    auto it = index_.find(key);
    if (it != index_.end()) order_.erase(it->second);
    order_.push_back(key);
    index_[key] = std::prev(order_.end());
  }

  std::list<std::string> order_;
  std::unordered_map<std::string, std::list<std::string>::iterator> index_;
};

// Fewest hits first, oldest access breaking ties.
class LfuPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "lfu"; }
  void on_insert(const std::string&, const CacheEntry&) override {}
  void on_access(const std::string&, const CacheEntry&) override {}
  void on_erase(const std::string&) override {}
  std::optional<std::string> pick_victim(
      const std::unordered_map<std::string, CacheEntry>& entries) override {
    if (entries.empty()) return std::nullopt;
    auto it = std::min_element(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
      if (a.second.hit_count != b.second.hit_count) return a.second.hit_count < b.second.hit_count;
      if (a.second.last_access != b.second.last_access) return a.second.last_access < b.second.last_access;
      return a.first < b.first;
    });
    return it->first;
  }
};

} // namespace

std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string& mode) {
  if (mode == "lru") return std::make_unique<LruPolicy>();
  if (mode == "lfu") return std::make_unique<LfuPolicy>();
  return nullptr;
}

} // namespace opguard
