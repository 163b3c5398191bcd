#include "opguard/types.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace opguard {
namespace {
std::string quote(const std::string &s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (unsigned char c : s) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
        out += buf;
      } else {
        out.push_back(static_cast<char>(c));
      }
    }
  }
  out.push_back('"');
  return out;
}

std::string number(double d) {
  if (!std::isfinite(d))
    return "null";
  if (d == std::floor(d) && std::fabs(d) < 1e15) {
    std::ostringstream os;
    os << static_cast<long long>(d);
    return os.str();
  }
  std::ostringstream os;
  os.precision(17);
  os << d;
  return os.str();
}
} // namespace

std::string serialize(const Value &v) {
  if (std::holds_alternative<std::monostate>(v))
    return "null";
  if (const auto *b = std::get_if<bool>(&v))
    return *b ? "true" : "false";
  if (const auto *i = std::get_if<std::int64_t>(&v))
    return std::to_string(*i);
  if (const auto *d = std::get_if<double>(&v))
    return number(*d);
  return quote(std::get<std::string>(v));
}

std::string serialize_args(const Args &args) {
  std::string out = "[";
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i)
      out += ",";
    out += serialize(args[i]);
  }
  out += "]";
  return out;
}

std::string to_string(const Value &v) {
  if (const auto *s = std::get_if<std::string>(&v))
    return *s;
  return serialize(v);
}

} // namespace opguard
