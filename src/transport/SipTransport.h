#pragma once

#include <chrono>
#include <optional>
#include <string>

struct Frame {
  enum class Type { TEXT, BINARY, PING, PONG, CLOSE };

  Type type = Type::TEXT;
  std::string payload;

  static Frame text(std::string payload) { return {Type::TEXT, std::move(payload)}; }
  static Frame pong(std::string payload) { return {Type::PONG, std::move(payload)}; }
  static Frame close() { return {Type::CLOSE, {}}; }
};

// Message-oriented duplex link carrying one SIP message per text frame.
// read() and write() are only ever called from the multiplexer thread;
// interrupt() may be called from any thread.
class SipTransport {
public:
  virtual ~SipTransport() = default;

  // Waits up to timeout for the next frame. Returns std::nullopt on timeout
  // or interrupt. End of stream is reported as a CLOSE frame. Throws
  // SipError(TRANSPORT_FAILURE) on I/O errors.
  virtual std::optional<Frame> read(std::chrono::milliseconds timeout) = 0;

  // Throws SipError(TRANSPORT_FAILURE) on I/O errors.
  virtual void write(const Frame &frame) = 0;

  // Wakes a read() that is currently waiting.
  virtual void interrupt() = 0;

  // Best-effort close; never throws.
  virtual void close() = 0;
};
