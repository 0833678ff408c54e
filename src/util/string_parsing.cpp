// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace deadlock {
namespace util {

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  try {
    // Reject empty or whitespace-leading strings
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    long long value = std::stoll(str, &pos);

    // Check entire string was consumed
    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int64_t>(value);
  } catch (const std::exception&) {
    // std::invalid_argument or std::out_of_range
    return std::nullopt;
  }
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = SafeParseInt64(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<std::chrono::milliseconds> SafeParseSeconds(const std::string& str,
                                                          double max_seconds) {
  try {
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    double value = std::stod(str, &pos);

    if (pos != str.size()) {
      return std::nullopt;
    }

    if (!std::isfinite(value) || value < 0.0 || value > max_seconds) {
      return std::nullopt;
    }

    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(value * 1000.0)));
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<bool> SafeParseBool(const std::string& str) {
  std::string lower(str);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  return std::nullopt;
}

std::string EscapeBytes(const std::vector<uint8_t>& data) {
  static constexpr char HEX[] = "0123456789abcdef";

  std::string out;
  out.reserve(data.size());
  for (uint8_t b : data) {
    switch (b) {
    case '\\':
      out += "\\\\";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (b >= 0x20 && b < 0x7f) {
        out += static_cast<char>(b);
      } else {
        out += "\\x";
        out += HEX[b >> 4];
        out += HEX[b & 0x0f];
      }
    }
  }
  return out;
}

} // namespace util
} // namespace deadlock
