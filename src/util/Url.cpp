#include "Url.h"
#include <algorithm>
#include <cctype>

std::optional<Url> Url::parse(const std::string &text) {
  auto sep = text.find("://");
  if (sep == std::string::npos || sep == 0)
    return std::nullopt;

  Url url;
  url.scheme = text.substr(0, sep);
  std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  auto rest = text.substr(sep + 3);
  auto slash = rest.find_first_of("/?#");
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    url.path = rest.substr(slash);
    if (url.path[0] != '/')
      url.path = "/" + url.path;
  }

  // Credentials are never used for the signaling socket
  auto at = authority.rfind('@');
  if (at != std::string::npos)
    authority = authority.substr(at + 1);

  std::string portStr;
  if (!authority.empty() && authority[0] == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos)
      return std::nullopt;
    url.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':')
        return std::nullopt;
      portStr = authority.substr(close + 2);
    }
  } else {
    auto colon = authority.rfind(':');
    url.host = authority.substr(0, colon);
    if (colon != std::string::npos)
      portStr = authority.substr(colon + 1);
  }

  if (url.host.empty())
    return std::nullopt;
  std::transform(url.host.begin(), url.host.end(), url.host.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (!portStr.empty()) {
    if (portStr.size() > 5 ||
        !std::all_of(portStr.begin(), portStr.end(),
                 [](unsigned char c) { return std::isdigit(c) != 0; })) {
      return std::nullopt;
    }
    int port = std::stoi(portStr);
    if (port <= 0 || port > 65535)
      return std::nullopt;
    url.port = static_cast<uint16_t>(port);
  }

  return url;
}

uint16_t Url::portOrDefault() const {
  if (port)
    return *port;
  if (scheme == "wss" || scheme == "https")
    return 443;
  return 80;
}

std::string Url::authority() const {
  // IPv6 literals keep their brackets
  std::string hostPart = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  if (port)
    return hostPart + ":" + std::to_string(*port);
  return hostPart;
}

std::string Url::toString() const {
  return scheme + "://" + authority() + path;
}
