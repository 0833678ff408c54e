// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line and config-file values with validation
 - Rendering of untrusted peer bytes for log and event output

 Key functions:
 - SafeParseInt64: integers with bounds checking
 - SafeParsePort: port number (1-65535)
 - SafeParseSeconds: non-negative fractional seconds ("0.25", "60")
 - SafeParseBool: INI-style booleans (true/false, yes/no, on/off, 1/0)
 - EscapeBytes: printable rendering of raw peer input

 Security:
 - All parsers validate the entire input is consumed (no trailing garbage)
 - Returns std::nullopt on any parsing error (no exceptions thrown)
*/

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace deadlock {
namespace util {

/**
 * Parse int64_t string with bounds checking
 *
 * Examples:
 *   SafeParseInt64("42", 0, 100) -> 42
 *   SafeParseInt64("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt64("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("2222") -> 2222
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Parse a duration given in (possibly fractional) seconds
 *
 * Rejects negative values, NaN/inf and values above max_seconds.
 * The result is rounded to the nearest millisecond.
 *
 * Examples:
 *   SafeParseSeconds("0.1") -> 100ms
 *   SafeParseSeconds("-1") -> std::nullopt
 */
std::optional<std::chrono::milliseconds> SafeParseSeconds(const std::string& str,
                                                          double max_seconds = 86400.0 * 365);

/**
 * Parse an INI-style boolean (case-insensitive)
 */
std::optional<bool> SafeParseBool(const std::string& str);

/**
 * Render raw bytes as a printable string
 *
 * Printable ASCII is kept as-is (backslash doubled), \r \n \t are escaped,
 * everything else becomes \xNN. Output never contains control characters,
 * so attacker input cannot forge log lines.
 */
std::string EscapeBytes(const std::vector<uint8_t>& data);

} // namespace util
} // namespace deadlock
