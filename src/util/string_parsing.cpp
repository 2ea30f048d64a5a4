// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace offsync {
namespace util {

namespace {

template <typename T>
std::optional<T> ParseBounded(const std::string& str, T min, T max) {
  // Reject empty or whitespace-leading strings, and an explicit '+'
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0])) || str[0] == '+') {
    return std::nullopt;
  }

  T value{};
  const char* first = str.data();
  const char* last = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(first, last, value);

  // Overflow, no digits, or trailing characters
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }

  if (value < min || value > max) {
    return std::nullopt;
  }

  return value;
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  return ParseBounded<int>(str, min, max);
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  return ParseBounded<int64_t>(str, min, max);
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = ParseBounded<int>(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<bool> SafeParseBool(const std::string& str) {
  const std::string v = ToLower(str);
  if (v == "1" || v == "true" || v == "yes" || v == "on") {
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "off") {
    return false;
  }
  return std::nullopt;
}

std::vector<std::string> SplitList(const std::string& str) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= str.size()) {
    size_t comma = str.find(',', start);
    if (comma == std::string::npos) {
      comma = str.size();
    }
    if (comma > start) {
      out.push_back(str.substr(start, comma - start));
    }
    start = comma + 1;
  }
  return out;
}

std::optional<HttpEndpoint> ParseHttpUrl(const std::string& url) {
  static const std::string kScheme = "http://";
  if (url.size() <= kScheme.size() || ToLower(url.substr(0, kScheme.size())) != kScheme) {
    return std::nullopt;
  }

  std::string rest = url.substr(kScheme.size());
  HttpEndpoint endpoint;

  size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    endpoint.base_path = rest.substr(slash);
    while (!endpoint.base_path.empty() && endpoint.base_path.back() == '/') {
      endpoint.base_path.pop_back();
    }
  }

  size_t colon = authority.rfind(':');
  if (colon != std::string::npos) {
    auto port = SafeParsePort(authority.substr(colon + 1));
    if (!port) {
      return std::nullopt;
    }
    endpoint.port = *port;
    authority = authority.substr(0, colon);
  }

  if (authority.empty()) {
    return std::nullopt;
  }
  endpoint.host = authority;
  return endpoint;
}

} // namespace util
} // namespace offsync
