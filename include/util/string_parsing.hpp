// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Validate command-line values (intervals, ports, URLs, component lists)
   before they reach the config structs
 - Return std::nullopt on any malformed input; never throw

 All numeric parsers require the entire string to be consumed.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace offsync {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse int64_t string with bounds checking
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * Parse port number string (1-65535)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Parse a boolean flag value: 1/0, true/false, yes/no, on/off (case-insensitive)
 */
std::optional<bool> SafeParseBool(const std::string& str);

/**
 * Split a comma-separated list, dropping empty items
 *
 * Example: SplitList("sync,,queue") -> {"sync", "queue"}
 */
std::vector<std::string> SplitList(const std::string& str);

/**
 * Components of an http:// server URL
 */
struct HttpEndpoint {
  std::string host;
  uint16_t port{80};
  std::string base_path;  // Without trailing slash, may be empty
};

/**
 * Parse "http://host[:port][/base]"
 *
 * Only plain http is accepted. Returns std::nullopt for other schemes, a
 * missing host or an invalid port.
 *
 * Example:
 *   ParseHttpUrl("http://localhost:8000/v1/") -> {"localhost", 8000, "/v1"}
 */
std::optional<HttpEndpoint> ParseHttpUrl(const std::string& url);

} // namespace util
} // namespace offsync
