#include "opguard/rate_limit.hpp"

#include "opguard/errors.hpp"

namespace opguard {
namespace {

class RateLimitedOperation final : public WrappedOperation {
public:
  RateLimitedOperation(OperationPtr next, EventLoop &loop,
                       std::shared_ptr<RateWindow> window, KeyFn key)
      : WrappedOperation(std::move(next)), loop_(loop),
        window_(std::move(window)), key_(std::move(key)) {}

  Result invoke(const Args &args) override {
    const std::string k = key_ ? key_(args) : id().key();
    if (auto wait = window_->try_acquire(k, loop_.now()))
      throw RateLimitError(id().name, *wait);
    return next_->invoke(args);
  }

private:
  EventLoop &loop_;
  std::shared_ptr<RateWindow> window_;
  KeyFn key_;
};

} // namespace

RateWindow::RateWindow(std::size_t limit, Duration window)
    : limit_(limit), window_(window) {}

void RateWindow::prune(std::deque<TimePoint> &stamps, TimePoint cutoff) {
  while (!stamps.empty() && stamps.front() <= cutoff)
    stamps.pop_front();
}

std::optional<Duration> RateWindow::try_acquire(const std::string &key,
                                                TimePoint now) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = stamps_.find(key);
  if (it != stamps_.end()) {
    prune(it->second, now - window_);
    if (it->second.empty()) {
      stamps_.erase(it);
      it = stamps_.end();
    }
  }
  const std::size_t used = it == stamps_.end() ? 0 : it->second.size();
  if (used >= limit_) {
    if (used == 0)
      return window_;
    return std::chrono::ceil<Duration>(it->second.front() + window_ - now);
  }
  if (it == stamps_.end())
    it = stamps_.emplace(key, std::deque<TimePoint>{}).first;
  it->second.push_back(now);
  return std::nullopt;
}

std::size_t RateWindow::in_window(const std::string &key, TimePoint now) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = stamps_.find(key);
  if (it == stamps_.end())
    return 0;
  std::size_t n = 0;
  for (const auto &t : it->second) {
    if (t > now - window_)
      ++n;
  }
  return n;
}

std::size_t RateWindow::tracked_keys() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stamps_.size();
}

void RateWindow::reset(const std::string &key) {
  std::lock_guard<std::mutex> lock(mu_);
  stamps_.erase(key);
}

RateLimitDecorator::RateLimitDecorator(EventLoop &loop, RateLimitOptions opts)
    : loop_(loop), opts_(std::move(opts)) {
  if (opts_.scope == StateScope::Definition)
    state_ = std::make_shared<RateWindow>(opts_.limit, opts_.window);
}

OperationPtr RateLimitDecorator::attach(OperationPtr next) {
  auto window = state_ ? state_
                       : std::make_shared<RateWindow>(opts_.limit, opts_.window);
  return std::make_shared<RateLimitedOperation>(std::move(next), loop_,
                                                std::move(window), opts_.key);
}

std::shared_ptr<RateLimitDecorator> rate_limited(EventLoop &loop,
                                                 RateLimitOptions opts) {
  return std::make_shared<RateLimitDecorator>(loop, std::move(opts));
}

} // namespace opguard
