#include "WebSocketTransport.h"
#include "../app/Logger.h"
#include "../sip/SipConstants.h"
#include "../sip/SipError.h"
#include <algorithm>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

WebSocketTransport::WebSocketTransport(Passkey, const TlsOptions &tls)
    : ssl_(ssl::context::tls_client), ws_(ioc_, ssl_), tls_(tls) {
  ssl_.set_default_verify_paths();
  if (!tls_.caFile.empty()) {
    ssl_.load_verify_file(tls_.caFile);
  }
  ssl_.set_verify_mode(tls_.verifyPeer ? ssl::verify_peer : ssl::verify_none);
}

WebSocketTransport::~WebSocketTransport() {
  close();
  // Let aborted operations complete while our members are still alive
  ioc_.restart();
  ioc_.poll();
}

std::unique_ptr<WebSocketTransport>
WebSocketTransport::connect(const Url &url, const TlsOptions &tls) {
  if (url.scheme != "wss") {
    throw SipError(SipErrorKind::INVALID_URL,
                   "Only wss:// endpoints are supported: " + url.toString());
  }

  std::unique_ptr<WebSocketTransport> transport;
  try {
    transport = std::make_unique<WebSocketTransport>(Passkey(), tls);
  } catch (const boost::system::system_error &e) {
    throw SipError(SipErrorKind::TRANSPORT_FAILURE,
                   "Failed to set up TLS context: " + e.code().message());
  }
  transport->handshake(url);
  return transport;
}

void WebSocketTransport::handshake(const Url &url) {
  LOG_INFO("Connecting to: " << url.toString());

  try {
    tcp::resolver resolver(ioc_);
    auto const results =
        resolver.resolve(url.host, std::to_string(url.portOrDefault()));

    beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
    beast::get_lowest_layer(ws_).connect(results);

    if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(),
                                  url.host.c_str())) {
      throw beast::system_error(
          beast::error_code(static_cast<int>(::ERR_get_error()),
                            net::error::get_ssl_category()),
          "SSL_set_tlsext_host_name");
    }
    if (tls_.verifyPeer) {
      ws_.next_layer().set_verify_callback(ssl::host_name_verification(url.host));
    }
    ws_.next_layer().handshake(ssl::stream_base::client);

    // The websocket stream has its own timeouts from here on
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::client));

    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::request_type &req) {
          req.set(http::field::sec_websocket_protocol,
                  SipConstants::WS_SUBPROTOCOL);
          req.set(http::field::user_agent, SipConstants::USER_AGENT);
        }));

    websocket::response_type res;
    ws_.handshake(res, url.authority(), url.path);

    if (res[http::field::sec_websocket_protocol] != SipConstants::WS_SUBPROTOCOL) {
      LOG_WARN("Server did not confirm the '" << SipConstants::WS_SUBPROTOCOL
                                              << "' subprotocol");
    }
  } catch (const beast::system_error &e) {
    throw SipError(SipErrorKind::TRANSPORT_FAILURE,
                   "WebSocket connect to " + url.toString() +
                       " failed: " + e.code().message());
  }

  ws_.control_callback(
      [](websocket::frame_type kind, beast::string_view payload) {
        if (kind == websocket::frame_type::ping) {
          LOG_DEBUG("Ping from server (" << payload.size() << " bytes), pong sent");
        } else if (kind == websocket::frame_type::close) {
          LOG_DEBUG("Close frame from server");
        }
      });

  LOG_INFO("WebSocket connected to " << url.toString());
}

void WebSocketTransport::startRead() {
  readPending_ = true;
  ws_.async_read(buffer_, [this](beast::error_code ec, std::size_t) {
    readPending_ = false;

    if (ec == websocket::error::closed || ec == net::error::eof ||
        ec == net::ssl::error::stream_truncated) {
      closed_ = true;
      inbox_.push_back(Frame::close());
      return;
    }
    if (ec) {
      if (ec != net::error::operation_aborted)
        readError_ = ec;
      return;
    }

    Frame frame;
    frame.type = ws_.got_text() ? Frame::Type::TEXT : Frame::Type::BINARY;
    frame.payload = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    inbox_.push_back(std::move(frame));
  });
}

std::optional<Frame> WebSocketTransport::read(std::chrono::milliseconds timeout) {
  if (inbox_.empty() && !closed_) {
    if (!readPending_)
      startRead();

    auto deadline = std::chrono::steady_clock::now() + timeout;
    ioc_.restart();
    while (inbox_.empty() && !readError_ && !interrupted_.exchange(false)) {
      if (ioc_.run_one_until(deadline) == 0)
        break;
    }
  }

  if (readError_) {
    auto ec = readError_;
    readError_ = {};
    throw SipError(SipErrorKind::TRANSPORT_FAILURE,
                   "WebSocket read failed: " + ec.message());
  }

  if (inbox_.empty())
    return std::nullopt;

  Frame frame = std::move(inbox_.front());
  inbox_.pop_front();
  return frame;
}

void WebSocketTransport::runUntil(const bool &done) {
  ioc_.restart();
  while (!done) {
    if (ioc_.run_one() == 0)
      break;
  }
}

void WebSocketTransport::write(const Frame &frame) {
  bool done = false;
  beast::error_code result;
  auto onWritten = [&done, &result](beast::error_code ec, std::size_t) {
    result = ec;
    done = true;
  };
  auto onControl = [&done, &result](beast::error_code ec) {
    result = ec;
    done = true;
  };

  switch (frame.type) {
  case Frame::Type::TEXT:
  case Frame::Type::BINARY:
    ws_.text(frame.type == Frame::Type::TEXT);
    ws_.async_write(net::buffer(frame.payload), onWritten);
    break;
  case Frame::Type::PING:
  case Frame::Type::PONG: {
    websocket::ping_data data;
    data.assign(frame.payload.data(),
                std::min(frame.payload.size(), data.max_size()));
    if (frame.type == Frame::Type::PING)
      ws_.async_ping(data, onControl);
    else
      ws_.async_pong(data, onControl);
    break;
  }
  case Frame::Type::CLOSE:
    ws_.async_close(websocket::close_code::normal, onControl);
    break;
  }

  runUntil(done);

  if (!done) {
    throw SipError(SipErrorKind::TRANSPORT_FAILURE,
                   "WebSocket write did not complete");
  }
  if (result) {
    throw SipError(SipErrorKind::TRANSPORT_FAILURE,
                   "WebSocket write failed: " + result.message());
  }
}

void WebSocketTransport::interrupt() {
  interrupted_ = true;
  net::post(ioc_, [] {});
}

void WebSocketTransport::close() {
  if (ws_.is_open()) {
    try {
      write(Frame::close());
    } catch (const SipError &e) {
      LOG_DEBUG("Close handshake failed: " << e.what());
    }
  }

  beast::error_code ec;
  beast::get_lowest_layer(ws_).socket().close(ec);
  closed_ = true;
}
