#include "opguard/cache.hpp"
#include "opguard/circuit_breaker.hpp"
#include "opguard/rate_limit.hpp"
#include "opguard/resilience.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>

using namespace opguard;

int main(int argc, char **argv) {
  int ops = 100000;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--ops" && i + 1 < argc)
      ops = std::max(1, std::stoi(argv[++i]));
  }

  EventLoop loop;
  const std::vector<std::string> stacks = {"bare", "cached_lru", "cached_lfu",
                                           "breaker", "rate_limited", "full"};

  for (const auto &sname : stacks) {
    auto base = make_operation({"bench", "square"}, [](const Args &args) -> Result {
      const auto n = std::get<std::int64_t>(args.at(0));
      return Value{n * n};
    });

    std::vector<DecoratorPtr> ds;
    auto add_cache = [&](const std::string &policy) {
      CacheOptions co;
      co.expiry = Duration(60000);
      co.store = std::make_shared<CacheStore>(
          loop.shared_clock(), CacheStoreConfig{256, 128, policy});
      ds.push_back(cached(loop, std::move(co)));
    };
    if (sname == "cached_lru")
      add_cache("lru");
    else if (sname == "cached_lfu")
      add_cache("lfu");
    else if (sname == "breaker")
      ds.push_back(circuit_breaker(loop, {}));
    else if (sname == "rate_limited")
      ds.push_back(rate_limited(loop, {static_cast<std::size_t>(ops) + 1,
                                       Duration(60000), {}, StateScope::Definition}));
    else if (sname == "full") {
      ds.push_back(timeout(loop, Duration(1000)));
      ds.push_back(retry(loop, {2, BackoffStrategy::Exponential, Duration(1), {}}));
      ds.push_back(circuit_breaker(loop, {}));
      add_cache("lru");
    }
    auto op = decorate(base, ds);

    std::mt19937_64 rng(42);
    std::uniform_int_distribution<int> u(0, 999);
    std::vector<double> lat;
    lat.reserve(static_cast<std::size_t>(ops));
    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < ops; ++i) {
      auto t0 = std::chrono::steady_clock::now();
      Value v = loop.await(op->invoke({Value{std::int64_t{u(rng)}}}));
      (void)v;
      auto t1 = std::chrono::steady_clock::now();
      lat.push_back(std::chrono::duration<double, std::micro>(t1 - t0).count());
    }
    auto end = std::chrono::steady_clock::now();
    std::sort(lat.begin(), lat.end());
    auto pct = [&](double p) {
      return lat[static_cast<std::size_t>(p * (lat.size() - 1))];
    };
    double seconds = std::chrono::duration<double>(end - start).count();
    std::cout << "stack=" << sname << " ops/s=" << std::fixed
              << std::setprecision(2) << (ops / seconds)
              << " p50_us=" << pct(0.50) << " p95_us=" << pct(0.95)
              << " p99_us=" << pct(0.99) << "\n";
  }
  return 0;
}
