#include "opguard/log.hpp"

#include <iostream>

namespace opguard {

LogSink stdout_sink() {
  return [](const std::string &line) { std::cout << line << "\n"; };
}

LogSink stderr_sink() {
  return [](const std::string &line) { std::cerr << line << "\n"; };
}

} // namespace opguard
