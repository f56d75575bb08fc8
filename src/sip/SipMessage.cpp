#include "SipMessage.h"
#include "SipConstants.h"
#include "SipError.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t\r\n");
  auto end = s.find_last_not_of(" \t\r\n");
  if (start == std::string::npos)
    return "";
  return s.substr(start, end - start + 1);
}

// Header parameters start after the closing '>' of a name-addr, or after
// the first ';' for bare values such as Via.
std::optional<std::string> headerParam(const std::string &value,
                                       const std::string &param) {
  size_t start = 0;
  auto close = value.find('>');
  if (close != std::string::npos)
    start = close + 1;

  auto pos = value.find(';', start);
  while (pos != std::string::npos) {
    auto next = value.find(';', pos + 1);
    std::string item = trim(value.substr(
        pos + 1, next == std::string::npos ? std::string::npos : next - pos - 1));
    auto eq = item.find('=');
    std::string key = toLower(trim(item.substr(0, eq)));
    if (key == param) {
      if (eq == std::string::npos)
        return std::string();
      return trim(item.substr(eq + 1));
    }
    pos = next;
  }
  return std::nullopt;
}

} // namespace

SipMessage SipMessage::request(SipMethod method, const std::string &uri) {
  SipMessage msg;
  msg.isRequest = true;
  msg.method = method;
  msg.methodStr = methodName(method);
  msg.uri = uri;
  return msg;
}

SipMessage SipMessage::response(int code) {
  SipMessage msg;
  msg.isRequest = false;
  msg.statusCode = code;
  msg.statusPhrase = reasonPhrase(code);
  return msg;
}

void SipMessage::addHeader(const std::string &name, const std::string &value) {
  headers.push_back({canonicalHeaderName(name), value});
}

std::optional<std::string>
SipMessage::getHeader(const std::string &name) const {
  std::string lowerName = toLower(canonicalHeaderName(name));
  for (const auto &header : headers) {
    if (toLower(header.name) == lowerName)
      return header.value;
  }
  return std::nullopt;
}

std::vector<std::string> SipMessage::getHeaders(const std::string &name) const {
  std::string lowerName = toLower(canonicalHeaderName(name));
  std::vector<std::string> values;
  for (const auto &header : headers) {
    if (toLower(header.name) == lowerName)
      values.push_back(header.value);
  }
  return values;
}

bool SipMessage::hasHeader(const std::string &name) const {
  return getHeader(name).has_value();
}

const std::string &SipMessage::requireHeader(const std::string &name) const {
  std::string lowerName = toLower(canonicalHeaderName(name));
  for (const auto &header : headers) {
    if (toLower(header.name) == lowerName)
      return header.value;
  }
  throw SipError(SipErrorKind::MISSING_HEADER,
                 "Missing '" + canonicalHeaderName(name) + "' header");
}

std::string SipMessage::toString() const {
  std::ostringstream oss;
  if (isRequest) {
    oss << methodStr << " " << uri << " " << version << "\r\n";
  } else {
    oss << version << " " << statusCode << " " << statusPhrase << "\r\n";
  }

  for (const auto &header : headers) {
    // Content-Length always reflects the body we actually send.
    if (toLower(header.name) == "content-length")
      continue;
    oss << header.name << ": " << header.value << "\r\n";
  }
  oss << SipConstants::HDR_CONTENT_LENGTH << ": " << body.size() << "\r\n";

  oss << "\r\n";
  oss << body;
  return oss.str();
}

std::optional<std::string> SipMessage::getCallId() const {
  auto callId = getHeader(SipConstants::HDR_CALL_ID);
  if (!callId)
    return std::nullopt;
  return trim(*callId);
}

std::optional<std::string> SipMessage::getBranch() const {
  auto via = getHeader(SipConstants::HDR_VIA);
  if (!via)
    return std::nullopt;

  // Topmost value only when several are folded into one header line.
  std::string top = via->substr(0, via->find(','));
  auto branch = headerParam(top, "branch");
  if (!branch || branch->empty())
    return std::nullopt;
  return branch;
}

std::optional<CSeqValue> SipMessage::getCSeq() const {
  auto cseq = getHeader(SipConstants::HDR_CSEQ);
  if (!cseq)
    return std::nullopt;

  std::istringstream iss(*cseq);
  long long seq = -1;
  std::string methodToken;
  if (!(iss >> seq >> methodToken) || seq < 0 || seq > 0xFFFFFFFFLL)
    return std::nullopt;

  CSeqValue value;
  value.seq = static_cast<uint32_t>(seq);
  value.method = methodToken;
  return value;
}

std::string SipMessage::getFromTag() const {
  auto from = getHeader(SipConstants::HDR_FROM);
  if (!from)
    return "";
  return headerParam(*from, "tag").value_or("");
}

std::string SipMessage::getFromDisplayName() const {
  auto from = getHeader(SipConstants::HDR_FROM);
  if (!from)
    return "";

  auto angle = from->find('<');
  if (angle == std::string::npos)
    return "";

  std::string name = trim(from->substr(0, angle));
  if (name.size() >= 2 && name.front() == '"' && name.back() == '"')
    name = name.substr(1, name.size() - 2);
  return name;
}

SipMethod SipMessage::parseMethod(const std::string &name) {
  if (name == "INVITE")
    return SipMethod::INVITE;
  if (name == "ACK")
    return SipMethod::ACK;
  if (name == "BYE")
    return SipMethod::BYE;
  if (name == "CANCEL")
    return SipMethod::CANCEL;
  if (name == "OPTIONS")
    return SipMethod::OPTIONS;
  if (name == "REGISTER")
    return SipMethod::REGISTER;
  return SipMethod::UNKNOWN;
}

std::string SipMessage::methodName(SipMethod method) {
  switch (method) {
  case SipMethod::INVITE:
    return "INVITE";
  case SipMethod::ACK:
    return "ACK";
  case SipMethod::BYE:
    return "BYE";
  case SipMethod::CANCEL:
    return "CANCEL";
  case SipMethod::OPTIONS:
    return "OPTIONS";
  case SipMethod::REGISTER:
    return "REGISTER";
  case SipMethod::UNKNOWN:
    break;
  }
  return "UNKNOWN";
}

std::string SipMessage::reasonPhrase(int code) {
  switch (code) {
  case 100: return "Trying";
  case 180: return "Ringing";
  case 181: return "Call Is Being Forwarded";
  case 182: return "Queued";
  case 183: return "Session Progress";
  case 200: return "OK";
  case 202: return "Accepted";
  case 400: return "Bad Request";
  case 401: return "Unauthorized";
  case 403: return "Forbidden";
  case 404: return "Not Found";
  case 405: return "Method Not Allowed";
  case 407: return "Proxy Authentication Required";
  case 408: return "Request Timeout";
  case 423: return "Interval Too Brief";
  case 480: return "Temporarily Unavailable";
  case 481: return "Call/Transaction Does Not Exist";
  case 486: return "Busy Here";
  case 487: return "Request Terminated";
  case 488: return "Not Acceptable Here";
  case 500: return "Server Internal Error";
  case 501: return "Not Implemented";
  case 503: return "Service Unavailable";
  case 603: return "Decline";
  default:
    break;
  }

  if (code >= 100 && code < 200) return "Provisional";
  if (code >= 200 && code < 300) return "Success";
  if (code >= 300 && code < 400) return "Redirection";
  if (code >= 400 && code < 500) return "Request Failure";
  if (code >= 500 && code < 600) return "Server Failure";
  return "Global Failure";
}

std::string SipMessage::canonicalHeaderName(const std::string &name) {
  std::string lower = toLower(trim(name));

  if (lower == "i" || lower == "call-id") return SipConstants::HDR_CALL_ID;
  if (lower == "v" || lower == "via") return SipConstants::HDR_VIA;
  if (lower == "f" || lower == "from") return SipConstants::HDR_FROM;
  if (lower == "t" || lower == "to") return SipConstants::HDR_TO;
  if (lower == "m" || lower == "contact") return SipConstants::HDR_CONTACT;
  if (lower == "l" || lower == "content-length") return SipConstants::HDR_CONTENT_LENGTH;
  if (lower == "c" || lower == "content-type") return SipConstants::HDR_CONTENT_TYPE;
  if (lower == "k" || lower == "supported") return "Supported";
  if (lower == "cseq") return SipConstants::HDR_CSEQ;
  if (lower == "user-agent") return SipConstants::HDR_USER_AGENT;
  if (lower == "www-authenticate") return SipConstants::HDR_WWW_AUTHENTICATE;
  if (lower == "authorization") return SipConstants::HDR_AUTHORIZATION;
  return trim(name);
}
