// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings before they become ledger keys
 - Format endpoints for log output

 The tarpit listens dual-stack, so IPv4 peers arrive as IPv4-mapped IPv6
 addresses (::ffff:1.2.3.4). Normalizing them keeps one offense record per
 attacker regardless of which socket family accepted it.
*/

#include <cstdint>
#include <optional>
#include <string>

namespace deadlock {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:db8::1" -> "2001:db8::1"
 *   "invalid" -> std::nullopt
 *   "" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

/**
 * Format "IP:port", bracketing IPv6 ("[2001:db8::1]:22")
 */
std::string FormatEndpoint(const std::string& ip, uint16_t port);

} // namespace util
} // namespace deadlock
