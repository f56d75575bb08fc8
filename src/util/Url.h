#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Just enough of RFC 3986 for ws:// and wss:// endpoints.
struct Url {
  std::string scheme;
  std::string host;
  std::optional<uint16_t> port;
  std::string path = "/";

  static std::optional<Url> parse(const std::string &text);

  uint16_t portOrDefault() const;
  // host[:port] as used in the HTTP Host header
  std::string authority() const;
  std::string toString() const;
};
