#include "Connection.h"
#include "../app/Logger.h"
#include "../util/Random.h"
#include "DigestAuth.h"
#include "SipError.h"

namespace {

std::string statusLine(const SipMessage &response) {
  return std::to_string(response.statusCode) + " " + response.statusPhrase;
}

} // namespace

Connection::Connection(Passkey, std::unique_ptr<SipTransport> transport, const Url &url,
                       const std::string &username,
                       const ConnectionOptions &options,
                       std::shared_ptr<InboundQueue> inbound)
    : url_(url), user_("sip:" + username + "@" + url.host),
      sendBy_(Random::alphanumeric(SipConstants::RANDOM_TOKEN_LENGTH) + ".invalid"),
      options_(options),
      transactions_(std::make_shared<TransactionRegistry>()) {
  Multiplexer::Options muxOptions;
  muxOptions.pollInterval = options.pollInterval;
  muxOptions.outboundQueueDepth = options.outboundQueueDepth;

  multiplexer_ = std::make_unique<Multiplexer>(std::move(transport), transactions_,
                                               std::move(inbound), muxOptions);
  requests_ = multiplexer_->requests();
}

Connection::~Connection() { close(); }

Connection::Handle Connection::connect(const std::string &url,
                                       const std::string &username,
                                       const ConnectionOptions &options) {
  auto parsed = Url::parse(url);
  if (!parsed) {
    throw SipError(SipErrorKind::INVALID_URL, "Invalid URL: " + url);
  }

  auto transport = WebSocketTransport::connect(*parsed, options.tls);
  return open(std::move(transport), *parsed, username, options);
}

Connection::Handle Connection::open(std::unique_ptr<SipTransport> transport,
                                    const Url &url, const std::string &username,
                                    const ConnectionOptions &options) {
  // One slot: the multiplexer stalls until the application takes the
  // previous request
  auto inbound = std::make_shared<InboundQueue>(1);

  auto connection = std::make_unique<Connection>(
      Passkey(), std::move(transport), url, username, options, inbound);
  connection->multiplexer_->start();

  LOG_INFO("SIP connection up as " << connection->user_ << " (sent-by "
                                   << connection->sendBy_ << ")");
  return {std::move(connection), std::move(inbound)};
}

void Connection::close() {
  if (multiplexer_) {
    multiplexer_->stop();
  }
}

ClientTransaction Connection::send(SipMessage request) {
  auto responses = std::make_shared<ClientTransaction::ResponseChannel>(
      options_.transactionQueueDepth);
  ClientTransaction tx(std::move(request), responses, transactions_);

  transactions_->addTransaction(tx.key(), responses);

  if (!requests_->send(tx.request())) {
    // The multiplexer is gone; receive() reports TRANSACTION_CLOSED
    LOG_WARN("Connection closed, dropping " << tx.request().methodStr
                                            << " request");
    responses->close();
  }
  return tx;
}

Dialog Connection::dialog() {
  return Dialog(*this, Random::alphanumeric(SipConstants::RANDOM_TOKEN_LENGTH),
                Random::u16());
}

void Connection::registerUser(const std::string &username,
                              const std::string &password) {
  Dialog dialog = this->dialog();

  LOG_INFO("Registering " << user_);
  SipMessage response = dialog.request(SipMethod::REGISTER).send().receive();

  if (response.isSuccess()) {
    LOG_INFO("Registered " << user_ << " without a challenge");
    return;
  }
  if (response.statusCode != SipConstants::UNAUTHORIZED) {
    throw SipError(SipErrorKind::REGISTRATION_REJECTED,
                   "Failed to register: " + statusLine(response),
                   response.statusCode);
  }

  auto headers = response.getHeaders(SipConstants::HDR_WWW_AUTHENTICATE);
  if (headers.empty()) {
    throw SipError(SipErrorKind::MISSING_CHALLENGE,
                   "No 'WWW-Authenticate' header received");
  }

  std::optional<DigestChallenge> challenge;
  for (const auto &header : headers) {
    challenge = DigestChallenge::parse(header);
    if (challenge)
      break;
  }
  if (!challenge) {
    throw SipError(SipErrorKind::UNSUPPORTED_CHALLENGE,
                   "Unsupported challenge: " + headers.front());
  }

  std::string authorization = DigestAuth::authorization(
      *challenge, DigestCredentials{username, password}, "REGISTER", "");
  std::string contactUser = Random::alphanumeric(SipConstants::RANDOM_TOKEN_LENGTH);
  std::string contact = "<sip:" + contactUser + "@" + sendBy_ +
                        ";transport=ws>;expires=" +
                        std::to_string(options_.registerExpires);

  response = dialog.request(SipMethod::REGISTER)
                 .header(SipConstants::HDR_CONTACT, contact)
                 .header(SipConstants::HDR_AUTHORIZATION, authorization)
                 .send()
                 .receive();

  if (!response.isSuccess()) {
    throw SipError(SipErrorKind::REGISTRATION_REJECTED,
                   "Failed to register: " + statusLine(response),
                   response.statusCode);
  }

  LOG_INFO("Registered " << user_ << " as " << contactUser << "@" << sendBy_);
}
