#pragma once

#include "../transport/WebSocketTransport.h"
#include "../util/Url.h"
#include "ClientTransaction.h"
#include "Dialog.h"
#include "Multiplexer.h"
#include "SipConstants.h"
#include "TransactionRegistry.h"
#include <chrono>
#include <memory>
#include <string>
#include <utility>

struct ConnectionOptions {
  std::chrono::milliseconds pollInterval{50};
  size_t outboundQueueDepth = 8;
  size_t transactionQueueDepth = 8;
  unsigned registerExpires = SipConstants::DEFAULT_REGISTER_EXPIRES;
  TlsOptions tls;
};

// A SIP user agent on one WebSocket. Client transactions go out through
// send(); requests from the server arrive as ServerTransactions on the
// inbound queue returned alongside the connection.
class Connection {
  // Restricts construction to connect() and open()
  struct Passkey {
    explicit Passkey() = default;
  };

public:
  using Handle = std::pair<std::unique_ptr<Connection>, std::shared_ptr<InboundQueue>>;

  // Dials a wss:// URL. Throws SipError(INVALID_URL / TRANSPORT_FAILURE).
  static Handle connect(const std::string &url, const std::string &username,
                        const ConnectionOptions &options = {});

  // Runs a connection over an already established transport.
  static Handle open(std::unique_ptr<SipTransport> transport, const Url &url,
                     const std::string &username,
                     const ConnectionOptions &options = {});

  Connection(Passkey, std::unique_ptr<SipTransport> transport, const Url &url,
             const std::string &username, const ConnectionOptions &options,
             std::shared_ptr<InboundQueue> inbound);
  ~Connection();

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  // Registers the transaction, then queues the request. The key is in the
  // registry before the request can reach the wire.
  ClientTransaction send(SipMessage request);

  // New dialog with a random Call-ID and starting CSeq.
  Dialog dialog();

  // REGISTER, answering one digest challenge if the registrar sends it.
  // Throws SipError(MISSING_CHALLENGE / UNSUPPORTED_CHALLENGE /
  // REGISTRATION_REJECTED / TRANSACTION_CLOSED).
  void registerUser(const std::string &username, const std::string &password);

  void close();

  bool isConnected() const { return multiplexer_->isRunning(); }

  const Url &url() const { return url_; }
  // sip:<username>@<host>
  const std::string &user() const { return user_; }
  // Via sent-by, a random host under .invalid
  const std::string &sendBy() const { return sendBy_; }

private:
  Url url_;
  std::string user_;
  std::string sendBy_;
  ConnectionOptions options_;
  std::shared_ptr<TransactionRegistry> transactions_;
  std::unique_ptr<Multiplexer> multiplexer_;
  std::shared_ptr<Channel<SipMessage>> requests_;
};
