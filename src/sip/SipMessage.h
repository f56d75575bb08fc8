#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class SipMethod { INVITE, ACK, BYE, CANCEL, OPTIONS, REGISTER, UNKNOWN };

struct SipHeader {
  std::string name;
  std::string value;
};

struct CSeqValue {
  uint32_t seq = 0;
  std::string method;
};

class SipMessage {
public:
  bool isRequest = false;

  // Request Line
  SipMethod method = SipMethod::UNKNOWN;
  std::string methodStr;
  std::string uri;
  std::string version = "SIP/2.0";

  // Status Line (if response)
  int statusCode = 0;
  std::string statusPhrase;

  // Headers, in wire order. Names keep their canonical spelling.
  std::vector<SipHeader> headers;

  // Body
  std::string body;

  static SipMessage request(SipMethod method, const std::string &uri);
  static SipMessage response(int code);

  // Helpers
  void addHeader(const std::string &name, const std::string &value);
  std::optional<std::string> getHeader(const std::string &name) const;
  std::vector<std::string> getHeaders(const std::string &name) const;
  bool hasHeader(const std::string &name) const;
  // Throws SipError(MISSING_HEADER) when absent.
  const std::string &requireHeader(const std::string &name) const;
  std::string toString() const;

  bool isProvisional() const { return !isRequest && statusCode >= 100 && statusCode < 200; }
  bool isSuccess() const { return !isRequest && statusCode >= 200 && statusCode < 300; }

  // Common Header Parsing helpers
  std::optional<std::string> getCallId() const;
  std::optional<std::string> getBranch() const;
  std::optional<CSeqValue> getCSeq() const;
  std::string getFromTag() const;
  std::string getFromDisplayName() const;

  static SipMethod parseMethod(const std::string &name);
  static std::string methodName(SipMethod method);
  static std::string reasonPhrase(int code);
  // Expands compact forms ("i", "v", ...) and fixes the case of known names.
  static std::string canonicalHeaderName(const std::string &name);
};
