#include "opguard/config.hpp"
#include "opguard/diagnostics.hpp"
#include "opguard/errors.hpp"
#include "opguard/lifecycle.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

using namespace opguard;

int main(int argc, char **argv) {
  std::string config_path = "config/stack.json";
  int calls = 8;
  int fail_every = 3;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc)
      config_path = argv[++i];
    else if (a == "--calls" && i + 1 < argc)
      calls = std::stoi(argv[++i]);
    else if (a == "--fail-every" && i + 1 < argc)
      fail_every = std::max(1, std::stoi(argv[++i]));
  }

  StackConfig cfg;
  std::string err;
  if (!load_stack_config(config_path, cfg, &err))
    std::cerr << "config " << config_path << ": " << err
              << ", using defaults\n";
  std::cout << describe_config(cfg);

  EventLoop loop;
  int attempts = 0;
  auto flaky = make_operation({"demo", "fetch"}, [&](const Args &args) -> Result {
    const int n = ++attempts;
    Deferred d(loop);
    loop.call_later(Duration(10), [d, n, fail_every, args]() mutable {
      if (n % fail_every == 0)
        d.reject(std::make_exception_ptr(
            std::runtime_error("upstream failure on attempt " + std::to_string(n))));
      else
        d.resolve(Value{"payload:" + to_string(args.at(0))});
    });
    return d.pending();
  });

  auto ds = decorators_from_config(loop, cfg);
  ds.push_back(effect_error([](const CallContext &ctx) -> Result {
    std::cerr << ctx.scope_name << "." << ctx.operation_name
              << " error: " << describe(ctx.error) << "\n";
    return Value{};
  }));
  ds.push_back(timed());
  auto op = decorate(flaky, ds);

  for (int i = 0; i < calls; ++i) {
    const Args args{Value{std::int64_t{i % 3}}};
    try {
      Value v = loop.await(op->invoke(args));
      std::cout << "call " << i << " -> " << to_string(v) << "\n";
    } catch (const WrapperError &e) {
      std::cout << "call " << i << " -> " << to_string(e.kind()) << ": "
                << e.what() << "\n";
    } catch (const std::exception &e) {
      std::cout << "call " << i << " -> error: " << e.what() << "\n";
    }
  }
  loop.run_until_idle();
  std::cout << "underlying attempts:" << attempts << "\n";
  return 0;
}
