#pragma once

#include "../transport/SipTransport.h"
#include "../util/Channel.h"
#include "ServerTransaction.h"
#include "SipMessage.h"
#include "TransactionRegistry.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using InboundQueue = Channel<ServerTransaction>;

// The one thread that owns the transport. Everybody else reaches the wire
// through its channels: requests() for client transactions, responses()
// for answers to server transactions.
class Multiplexer {
public:
  struct Options {
    std::chrono::milliseconds pollInterval{50};
    size_t outboundQueueDepth = 8;
  };

  Multiplexer(std::unique_ptr<SipTransport> transport,
              std::shared_ptr<TransactionRegistry> registry,
              std::shared_ptr<InboundQueue> inbound, const Options &options);
  ~Multiplexer();

  void start();
  // Stops the loop, tears down all channels and closes the transport.
  void stop();

  bool isRunning() const { return running_; }

  std::shared_ptr<Channel<SipMessage>> requests() const { return requests_; }
  std::shared_ptr<Channel<SipMessage>> responses() const { return responses_; }

private:
  void loop();
  // Returns false when the loop must end
  bool handleFrame(const Frame &frame);
  bool handleMessage(SipMessage msg);
  void writeMessage(const SipMessage &msg, const char *kind);
  void shutdown();

  std::shared_ptr<SipTransport> transport_;
  std::shared_ptr<TransactionRegistry> registry_;
  std::shared_ptr<InboundQueue> inbound_;
  std::shared_ptr<Channel<SipMessage>> requests_;
  std::shared_ptr<Channel<SipMessage>> responses_;
  std::chrono::milliseconds pollInterval_;

  std::atomic<bool> running_{false};
  std::thread thread_;
};
