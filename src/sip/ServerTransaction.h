#pragma once

#include "../util/Channel.h"
#include "SipMessage.h"
#include <memory>
#include <string>

class ServerTransaction;

class ResponseBuilder {
public:
  ResponseBuilder &header(const std::string &name, const std::string &value);

  // Finalizes the response and queues it on the connection. Throws
  // SipError(TRANSPORT_CLOSED) once the connection has gone away.
  void send(const std::string &body = "");

  const SipMessage &message() const { return response_; }

private:
  friend class ServerTransaction;
  ResponseBuilder(const ServerTransaction &tx, int statusCode);

  const ServerTransaction &tx_;
  SipMessage response_;
};

// A request received from the peer. Responses go back through the
// connection that delivered it; nothing is kept once they are handed off.
class ServerTransaction {
public:
  using ResponseChannel = Channel<SipMessage>;

  ServerTransaction(SipMessage request, std::shared_ptr<ResponseChannel> responses);

  const SipMessage &request() const { return request_; }

  // Seeds a response with the request's Via, From, To, CSeq and Call-ID
  // plus our User-Agent. Throws SipError(MISSING_HEADER) if the request
  // lacks one of them.
  ResponseBuilder respond(int statusCode) const;

private:
  friend class ResponseBuilder;

  SipMessage request_;
  std::shared_ptr<ResponseChannel> responses_;
};
