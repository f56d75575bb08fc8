#pragma once

#include <stdexcept>
#include <string>

enum class SipErrorKind {
  TRANSPORT_FAILURE,
  TRANSPORT_CLOSED,
  TRANSACTION_CLOSED,
  MALFORMED_MESSAGE,
  MISSING_HEADER,
  MISSING_CHALLENGE,
  UNSUPPORTED_CHALLENGE,
  REGISTRATION_REJECTED,
  INVALID_URL
};

class SipError : public std::runtime_error {
public:
  SipError(SipErrorKind kind, const std::string &what, int statusCode = 0)
      : std::runtime_error(what), kind_(kind), statusCode_(statusCode) {}

  SipErrorKind kind() const { return kind_; }

  // Status code of the rejecting response, 0 when not applicable.
  int statusCode() const { return statusCode_; }

private:
  SipErrorKind kind_;
  int statusCode_;
};
