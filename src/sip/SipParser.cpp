#include "SipParser.h"
#include "SipMessage.h"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>

// Simple trim helper
static std::string trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t\r\n");
  auto end = s.find_last_not_of(" \t\r\n");
  if (start == std::string::npos)
    return "";
  return s.substr(start, end - start + 1);
}

std::optional<SipMessage> SipParser::parse(std::string_view raw) {
  SipMessage msg;
  std::string rawStr(raw);
  std::istringstream stream(rawStr);
  std::string line;

  // Tolerate CRLF keep-alives in front of the start line
  do {
    if (!std::getline(stream, line))
      return std::nullopt;
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
  } while (line.empty());

  if (line.rfind("SIP/2.0 ", 0) == 0) {
    // Response: SIP/2.0 200 OK
    msg.isRequest = false;
    msg.version = "SIP/2.0";
    auto firstSpace = line.find(' ');
    auto secondSpace = line.find(' ', firstSpace + 1);
    std::string code = line.substr(firstSpace + 1, secondSpace == std::string::npos
                                                       ? std::string::npos
                                                       : secondSpace - firstSpace - 1);
    if (code.size() != 3 ||
        !std::all_of(code.begin(), code.end(),
                 [](unsigned char c) { return std::isdigit(c) != 0; })) {
      return std::nullopt;
    }
    msg.statusCode = std::stoi(code);
    if (msg.statusCode < 100 || msg.statusCode > 699)
      return std::nullopt;
    msg.statusPhrase =
        secondSpace == std::string::npos ? "" : line.substr(secondSpace + 1);
  } else {
    // Request: INVITE sip:user@host SIP/2.0
    msg.isRequest = true;
    auto firstSpace = line.find(' ');
    auto lastSpace = line.rfind(' ');
    if (firstSpace == std::string::npos || firstSpace == lastSpace)
      return std::nullopt;

    std::string method = line.substr(0, firstSpace);
    std::transform(method.begin(), method.end(), method.begin(),
                 [](unsigned char c) { return std::toupper(c); });
    msg.methodStr = method;
    msg.method = SipMessage::parseMethod(method);
    msg.uri = trim(line.substr(firstSpace + 1, lastSpace - firstSpace - 1));
    msg.version = line.substr(lastSpace + 1);
    if (msg.uri.empty() || msg.version.rfind("SIP/", 0) != 0)
      return std::nullopt;
  }

  // Headers
  long contentLength = -1;
  bool headersTerminated = false;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty()) {
      headersTerminated = true;
      break; // End of headers
    }

    // Folded header lines continue the previous header
    if (line[0] == ' ' || line[0] == '\t') {
      if (msg.headers.empty())
        return std::nullopt;
      msg.headers.back().value += " " + trim(line);
      continue;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0)
      return std::nullopt;

    std::string name = trim(line.substr(0, colon));
    std::string value = trim(line.substr(colon + 1));
    msg.addHeader(name, value);
  }

  if (auto length = msg.getHeader("Content-Length")) {
    try {
      contentLength = std::stol(*length);
    } catch (const std::exception &) {
      return std::nullopt;
    }
    if (contentLength < 0)
      return std::nullopt;
  }

  // Body. A frame carries exactly one message, so without Content-Length
  // the remainder of the frame is the body.
  if (headersTerminated) {
    std::string rest((std::istreambuf_iterator<char>(stream)),
                     std::istreambuf_iterator<char>());
    if (contentLength >= 0) {
      if (static_cast<size_t>(contentLength) > rest.size())
        return std::nullopt;
      rest.resize(static_cast<size_t>(contentLength));
    }
    msg.body = std::move(rest);
  }

  return msg;
}
