#include "opguard/cache.hpp"

#include <sstream>
#include <stdexcept>

namespace opguard {

CacheStore::CacheStore(std::shared_ptr<IClock> clock, CacheStoreConfig cfg)
    : clock_(std::move(clock)), cfg_(std::move(cfg)),
      policy_(make_policy_by_name(cfg_.policy)) {
  if (!clock_)
    throw std::invalid_argument("cache store needs a clock");
  if (!policy_)
    throw std::invalid_argument("unknown eviction policy: " + cfg_.policy);
}

std::optional<Value> CacheStore::get(const std::string &key) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    ++stats_.misses;
    return std::nullopt;
  }
  const auto now = clock_->now();
  if (expired_locked(it->second, now)) {
    erase_locked(key);
    ++stats_.expirations;
    ++stats_.misses;
    return std::nullopt;
  }
  auto &e = it->second;
  e.last_access = now;
  ++e.hit_count;
  ++stats_.hits;
  policy_->on_access(key, e);
  return e.value;
}

void CacheStore::put(const std::string &key, Value value,
                     std::optional<Duration> ttl) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = clock_->now();
  tick_locked(now);
  if (entries_.contains(key))
    erase_locked(key);

  CacheEntry e;
  e.value = std::move(value);
  e.created_at = now;
  e.last_access = now;
  if (ttl.has_value() && ttl->count() > 0)
    e.expiry = now + *ttl;

  auto &stored = entries_[key] = std::move(e);
  policy_->on_insert(key, stored);
  if (stored.expiry.has_value()) {
    const auto gen = ++expiry_generation_[key];
    expiry_heap_.push({*stored.expiry, key, gen});
  }
  evict_until_fit_locked();
}

bool CacheStore::erase(const std::string &key) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!entries_.contains(key))
    return false;
  erase_locked(key);
  ++stats_.invalidations;
  return true;
}

std::size_t CacheStore::erase_many(const std::vector<std::string> &keys) {
  std::lock_guard<std::mutex> lock(mu_);
  std::size_t removed = 0;
  for (const auto &k : keys) {
    if (!entries_.contains(k))
      continue;
    erase_locked(k);
    ++removed;
  }
  stats_.invalidations += removed;
  return removed;
}

bool CacheStore::contains(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  return it != entries_.end() && !expired_locked(it->second, clock_->now());
}

void CacheStore::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto &[k, e] : entries_)
    policy_->on_erase(k);
  stats_.invalidations += entries_.size();
  entries_.clear();
  expiry_generation_.clear();
  expiry_heap_ = {};
}

std::size_t CacheStore::tick() {
  std::lock_guard<std::mutex> lock(mu_);
  return tick_locked(clock_->now());
}

std::size_t CacheStore::tick_locked(TimePoint now) {
  std::size_t cleaned = 0;
  while (!expiry_heap_.empty() && cleaned < cfg_.ttl_cleanup_per_tick) {
    const auto &node = expiry_heap_.top();
    if (node.deadline > now)
      break;
    const auto key = node.key;
    const auto gen = node.generation;
    expiry_heap_.pop();
    auto gen_it = expiry_generation_.find(key);
    if (gen_it == expiry_generation_.end() || gen_it->second != gen)
      continue;
    auto it = entries_.find(key);
    if (it != entries_.end() && expired_locked(it->second, now)) {
      erase_locked(key);
      ++stats_.expirations;
      ++cleaned;
    }
  }
  return cleaned;
}

std::size_t CacheStore::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

CacheStats CacheStore::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

std::string CacheStore::policy_name() const { return policy_->name(); }

std::string CacheStore::info() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream os;
  os << "policy_mode:" << policy_->name() << "\n";
  os << "keys:" << entries_.size() << "\n";
  os << "max_entries:" << cfg_.max_entries << "\n";
  os << "hits:" << stats_.hits << "\n";
  os << "misses:" << stats_.misses << "\n";
  os << "expirations:" << stats_.expirations << "\n";
  os << "evictions:" << stats_.evictions << "\n";
  os << "invalidations:" << stats_.invalidations << "\n";
  return os.str();
}

bool CacheStore::expired_locked(const CacheEntry &e, TimePoint now) const {
  return e.expiry.has_value() && *e.expiry <= now;
}

void CacheStore::erase_locked(const std::string &key) {
  policy_->on_erase(key);
  entries_.erase(key);
  expiry_generation_.erase(key);
}

void CacheStore::evict_until_fit_locked() {
  if (cfg_.max_entries == 0)
    return;
  std::size_t safety = entries_.size() + 1;
  while (entries_.size() > cfg_.max_entries && safety-- > 0) {
    auto victim = policy_->pick_victim(entries_);
    if (!victim.has_value())
      break;
    erase_locked(*victim);
    ++stats_.evictions;
  }
}

} // namespace opguard
