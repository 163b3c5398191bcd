#include "opguard/cache.hpp"

namespace opguard {
namespace {

enum class DefaultKey { Scoped, NameOnly };

class CachedOperation final : public WrappedOperation {
public:
  CachedOperation(OperationPtr next, std::shared_ptr<CacheStore> store,
                  std::optional<Duration> expiry, CacheKeyFn key,
                  DefaultKey default_key,
                  std::shared_ptr<CachedDecorator::KeyLedger> ledger)
      : WrappedOperation(std::move(next)), store_(std::move(store)),
        expiry_(expiry), key_(std::move(key)), default_key_(default_key),
        ledger_(std::move(ledger)) {}

  Result invoke(const Args &args) override {
    const std::string cache_key = key_for(args);
    if (ledger_) {
      std::lock_guard<std::mutex> lock(ledger_->mu);
      ledger_->keys.insert(cache_key);
    }
    if (auto hit = store_->get(cache_key))
      return *hit;

    Result result = next_->invoke(args);
    if (!result.is_pending()) {
      store_->put(cache_key, result.value(), expiry_);
      return result;
    }
    auto store = store_;
    auto expiry = expiry_;
    return result.pending().then(
        [store, cache_key, expiry](const Value &v) -> Result {
          store->put(cache_key, v, expiry);
          return v;
        });
  }

private:
  std::string key_for(const Args &args) const {
    if (key_)
      return key_(args);
    if (default_key_ == DefaultKey::NameOnly)
      return id().name + ":" + serialize_args(args);
    return id().key() + ":" + serialize_args(args);
  }

  std::shared_ptr<CacheStore> store_;
  std::optional<Duration> expiry_;
  CacheKeyFn key_;
  DefaultKey default_key_;
  std::shared_ptr<CachedDecorator::KeyLedger> ledger_;
};

class MemoizeDecorator final : public IDecorator {
public:
  explicit MemoizeDecorator(EventLoop &loop)
      : store_(std::make_shared<CacheStore>(loop.shared_clock())) {}
  std::string name() const override { return "memoize"; }
  OperationPtr attach(OperationPtr next) override {
    return std::make_shared<CachedOperation>(std::move(next), store_,
                                             std::nullopt, CacheKeyFn{},
                                             DefaultKey::NameOnly, nullptr);
  }

private:
  std::shared_ptr<CacheStore> store_;
};

} // namespace

CachedDecorator::CachedDecorator(EventLoop &loop, CacheOptions opts)
    : opts_(std::move(opts)), ledger_(std::make_shared<KeyLedger>()) {
  if (!opts_.store)
    opts_.store = std::make_shared<CacheStore>(loop.shared_clock());
}

OperationPtr CachedDecorator::attach(OperationPtr next) {
  return std::make_shared<CachedOperation>(std::move(next), opts_.store,
                                           opts_.expiry, opts_.key,
                                           DefaultKey::Scoped, ledger_);
}

std::size_t CachedDecorator::invalidate() {
  std::vector<std::string> keys;
  {
    std::lock_guard<std::mutex> lock(ledger_->mu);
    keys.assign(ledger_->keys.begin(), ledger_->keys.end());
    ledger_->keys.clear();
  }
  return opts_.store->erase_many(keys);
}

std::vector<std::string> CachedDecorator::keys() const {
  std::lock_guard<std::mutex> lock(ledger_->mu);
  return {ledger_->keys.begin(), ledger_->keys.end()};
}

std::shared_ptr<CachedDecorator> cached(EventLoop &loop, CacheOptions opts) {
  return std::make_shared<CachedDecorator>(loop, std::move(opts));
}

DecoratorPtr memoize(EventLoop &loop) {
  return std::make_shared<MemoizeDecorator>(loop);
}

} // namespace opguard
