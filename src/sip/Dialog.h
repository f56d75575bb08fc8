#pragma once

#include "ClientTransaction.h"
#include "SipMessage.h"
#include <atomic>
#include <cstdint>
#include <string>

class Connection;
class Dialog;

class RequestBuilder {
public:
  RequestBuilder &header(const std::string &name, const std::string &value);

  // Finalizes the request and sends it through the dialog's connection.
  ClientTransaction send(const std::string &body = "");

  const SipMessage &message() const { return request_; }

private:
  friend class Dialog;
  RequestBuilder(const Dialog &dialog, SipMethod method);

  const Dialog &dialog_;
  SipMessage request_;
};

// Call-ID plus a CSeq counter shared by every request built from it. This
// client only talks to its registrar, so To and From are both our own
// identity.
class Dialog {
public:
  Dialog(Connection &connection, std::string callId, uint32_t initialSeq);

  Dialog(const Dialog &) = delete;
  Dialog &operator=(const Dialog &) = delete;

  RequestBuilder request(SipMethod method) const;

  const std::string &callId() const { return callId_; }
  const std::string &localTag() const { return localTag_; }
  Connection &connection() const { return connection_; }

private:
  friend class RequestBuilder;

  Connection &connection_;
  std::string callId_;
  std::string localTag_;
  mutable std::atomic<uint32_t> seq_;
};
