#pragma once

#include <functional>
#include <string>

namespace opguard {

// Receives one line, without a trailing newline.
using LogSink = std::function<void(const std::string &)>;

LogSink stdout_sink();
LogSink stderr_sink();

} // namespace opguard
