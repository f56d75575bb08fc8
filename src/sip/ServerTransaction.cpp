#include "ServerTransaction.h"
#include "../app/Logger.h"
#include "SipConstants.h"
#include "SipError.h"
#include <algorithm>
#include <cctype>

namespace {

bool isCorrelationHeader(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return lower == "via" || lower == "from" || lower == "to" ||
         lower == "cseq" || lower == "call-id";
}

} // namespace

ServerTransaction::ServerTransaction(SipMessage request,
                                     std::shared_ptr<ResponseChannel> responses)
    : request_(std::move(request)), responses_(std::move(responses)) {}

ResponseBuilder ServerTransaction::respond(int statusCode) const {
  return ResponseBuilder(*this, statusCode);
}

ResponseBuilder::ResponseBuilder(const ServerTransaction &tx, int statusCode)
    : tx_(tx), response_(SipMessage::response(statusCode)) {
  const SipMessage &req = tx.request_;

  // The peer matches on these; refuse to answer without them.
  for (const auto &name :
       {SipConstants::HDR_VIA, SipConstants::HDR_FROM, SipConstants::HDR_TO,
        SipConstants::HDR_CSEQ, SipConstants::HDR_CALL_ID}) {
    req.requireHeader(name);
  }

  // Copy critical headers, keeping request order
  for (const auto &header : req.headers) {
    if (isCorrelationHeader(header.name))
      response_.headers.push_back(header);
  }

  response_.addHeader(SipConstants::HDR_USER_AGENT, SipConstants::USER_AGENT);
}

ResponseBuilder &ResponseBuilder::header(const std::string &name,
                                         const std::string &value) {
  response_.addHeader(name, value);
  return *this;
}

void ResponseBuilder::send(const std::string &body) {
  response_.body = body;

  LOG_DEBUG("Queueing response " << response_.statusCode << " "
                                 << response_.statusPhrase << " to "
                                 << tx_.request_.methodStr);

  if (!tx_.responses_ || !tx_.responses_->send(response_)) {
    throw SipError(SipErrorKind::TRANSPORT_CLOSED, "Client closed connection");
  }
}
