#include "Multiplexer.h"
#include "../app/Logger.h"
#include "SipError.h"
#include "SipParser.h"

Multiplexer::Multiplexer(std::unique_ptr<SipTransport> transport,
                         std::shared_ptr<TransactionRegistry> registry,
                         std::shared_ptr<InboundQueue> inbound,
                         const Options &options)
    : transport_(std::move(transport)), registry_(std::move(registry)),
      inbound_(std::move(inbound)),
      requests_(std::make_shared<Channel<SipMessage>>(options.outboundQueueDepth)),
      responses_(std::make_shared<Channel<SipMessage>>(options.outboundQueueDepth)),
      pollInterval_(options.pollInterval) {
  // Queued messages must not wait out a full poll interval. The hook can
  // fire from a caller's thread after we are gone, hence the weak_ptr.
  std::weak_ptr<SipTransport> weakTransport = transport_;
  auto wake = [weakTransport] {
    if (auto transport = weakTransport.lock())
      transport->interrupt();
  };
  requests_->setSendHook(wake);
  responses_->setSendHook(wake);
}

Multiplexer::~Multiplexer() { stop(); }

void Multiplexer::start() {
  running_ = true;
  thread_ = std::thread(&Multiplexer::loop, this);
}

void Multiplexer::stop() {
  running_ = false;
  // Unblocks a loop stuck handing a message to a consumer that is not
  // reading: the inbound queue or a pending client transaction
  inbound_->close();
  registry_->closeAll();
  transport_->interrupt();

  if (thread_.joinable()) {
    thread_.join();
  }
}

void Multiplexer::loop() {
  LOG_DEBUG("Multiplexer started");

  try {
    while (running_) {
      auto frame = transport_->read(pollInterval_);
      if (frame && !handleFrame(*frame))
        break;

      while (auto request = requests_->tryReceive()) {
        writeMessage(*request, "request");
      }

      while (auto response = responses_->tryReceive()) {
        writeMessage(*response, "response");
      }
    }
  } catch (const SipError &e) {
    LOG_ERROR("Connection terminated: " << e.what());
  }

  shutdown();
  LOG_DEBUG("Multiplexer stopped");
}

bool Multiplexer::handleFrame(const Frame &frame) {
  switch (frame.type) {
  case Frame::Type::TEXT: {
    LOG_DEBUG("Got message from WS:\n" << frame.payload);

    auto msg = SipParser::parse(frame.payload);
    if (!msg) {
      LOG_WARN("Failed to parse SIP message, skipping frame ("
               << frame.payload.size() << " bytes)");
      return true;
    }
    return handleMessage(std::move(*msg));
  }

  case Frame::Type::PING:
    transport_->write(Frame::pong(frame.payload));
    return true;

  case Frame::Type::CLOSE:
    LOG_INFO("Connection closed by server");
    return false;

  case Frame::Type::PONG:
  case Frame::Type::BINARY:
    LOG_DEBUG("Ignoring non-text frame (" << frame.payload.size() << " bytes)");
    return true;
  }

  return true;
}

bool Multiplexer::handleMessage(SipMessage msg) {
  if (msg.isRequest) {
    // A new request starts a new server transaction
    LOG_DEBUG("Incoming " << msg.methodStr << " request");
    ServerTransaction tx(std::move(msg), responses_);
    if (!inbound_->send(std::move(tx))) {
      LOG_INFO("Inbound transaction queue closed");
      return false;
    }
    return true;
  }

  registry_->route(msg);
  return true;
}

void Multiplexer::writeMessage(const SipMessage &msg, const char *kind) {
  std::string raw = msg.toString();
  LOG_DEBUG("Outgoing msg(" << kind << "):\n" << raw);
  transport_->write(Frame::text(std::move(raw)));
}

void Multiplexer::shutdown() {
  running_ = false;

  inbound_->close();
  requests_->close();
  responses_->close();
  registry_->closeAll();

  transport_->close();
}
