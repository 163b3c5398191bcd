#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace opguard {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string>;
using Args = std::vector<Value>;

inline bool is_null(const Value &v) {
  return std::holds_alternative<std::monostate>(v);
}

struct CacheEntry {
  Value value;
  TimePoint created_at{};
  TimePoint last_access{};
  std::uint64_t hit_count{0};
  std::optional<TimePoint> expiry;
};

// Stable JSON-like rendering, used for default cache keys.
std::string serialize(const Value &v);
std::string serialize_args(const Args &args);

// Unquoted rendering for diagnostics.
std::string to_string(const Value &v);

} // namespace opguard
