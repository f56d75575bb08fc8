#pragma once

#include "../util/Url.h"
#include "SipTransport.h"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <deque>
#include <memory>
#include <string>

struct TlsOptions {
  bool verifyPeer = true;
  std::string caFile;
};

// SIP over secure WebSocket (RFC 7118). Drives its own io_context from
// whichever thread calls read()/write(), which is the multiplexer.
// Pings are answered by Beast itself and only show up in the log.
class WebSocketTransport : public SipTransport {
  struct Passkey {
    explicit Passkey() = default;
  };

public:
  // TCP connect, TLS handshake (with SNI) and WebSocket upgrade offering the
  // "sip" subprotocol. Throws SipError(INVALID_URL / TRANSPORT_FAILURE).
  static std::unique_ptr<WebSocketTransport> connect(const Url &url,
                                                     const TlsOptions &tls);

  WebSocketTransport(Passkey, const TlsOptions &tls);
  ~WebSocketTransport() override;

  std::optional<Frame> read(std::chrono::milliseconds timeout) override;
  void write(const Frame &frame) override;
  void interrupt() override;
  void close() override;

private:
  void handshake(const Url &url);
  void startRead();
  void runUntil(const bool &done);

  boost::asio::io_context ioc_;
  boost::asio::ssl::context ssl_;
  boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>> ws_;
  TlsOptions tls_;

  boost::beast::flat_buffer buffer_;
  bool readPending_ = false;
  bool closed_ = false;
  std::deque<Frame> inbox_;
  boost::system::error_code readError_;
  std::atomic<bool> interrupted_{false};
};
