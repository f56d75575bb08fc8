#include "Dialog.h"
#include "../app/Logger.h"
#include "../util/Random.h"
#include "Connection.h"
#include "SipConstants.h"

Dialog::Dialog(Connection &connection, std::string callId, uint32_t initialSeq)
    : connection_(connection), callId_(std::move(callId)),
      localTag_(Random::alphanumeric(8)), seq_(initialSeq) {}

RequestBuilder Dialog::request(SipMethod method) const {
  return RequestBuilder(*this, method);
}

RequestBuilder::RequestBuilder(const Dialog &dialog, SipMethod method)
    : dialog_(dialog),
      request_(SipMessage::request(method, "sip:" + dialog.connection().url().host)) {
  const Connection &connection = dialog.connection();
  uint32_t seq = dialog.seq_.fetch_add(1);

  request_.addHeader(SipConstants::HDR_VIA,
                     SipConstants::VIA_TRANSPORT_WSS + " " + connection.sendBy() +
                         ";branch=" + SipConstants::BRANCH_MAGIC_COOKIE +
                         Random::alphanumeric(SipConstants::RANDOM_TOKEN_LENGTH));
  request_.addHeader(SipConstants::HDR_TO, "<" + connection.user() + ">");
  request_.addHeader(SipConstants::HDR_FROM,
                     "<" + connection.user() + ">;tag=" + dialog.localTag());
  request_.addHeader(SipConstants::HDR_CSEQ,
                     std::to_string(seq) + " " + request_.methodStr);
  request_.addHeader(SipConstants::HDR_CALL_ID, dialog.callId());
  request_.addHeader(SipConstants::HDR_USER_AGENT, SipConstants::USER_AGENT);
}

RequestBuilder &RequestBuilder::header(const std::string &name,
                                       const std::string &value) {
  request_.addHeader(name, value);
  return *this;
}

ClientTransaction RequestBuilder::send(const std::string &body) {
  request_.body = body;
  LOG_DEBUG("Sending request " << request_.methodStr << " " << request_.uri);
  return dialog_.connection().send(request_);
}
