#pragma once

#include <optional>
#include <string>

// Parameters of a "WWW-Authenticate: Digest ..." challenge (RFC 2617).
struct DigestChallenge {
  std::string realm;
  std::string nonce;
  std::optional<std::string> opaque;
  std::optional<std::string> algorithm;
  std::optional<std::string> qop;
  bool stale = false;

  // nullopt unless the scheme is Digest and realm and nonce are present
  static std::optional<DigestChallenge> parse(const std::string &header);
};

struct DigestCredentials {
  std::string username;
  std::string password;
};

class DigestAuth {
public:
  // Hex digest of input under MD5, SHA-256 or SHA-512-256. Throws
  // SipError(UNSUPPORTED_CHALLENGE) for anything else.
  static std::string hash(const std::string &algorithm, const std::string &input);

  // H(H(user:realm:password):nonce:H(method:uri))
  static std::string computeResponse(const DigestChallenge &challenge,
                                     const DigestCredentials &credentials,
                                     const std::string &method,
                                     const std::string &uri);

  // Value for the Authorization header answering challenge.
  static std::string authorization(const DigestChallenge &challenge,
                                   const DigestCredentials &credentials,
                                   const std::string &method,
                                   const std::string &uri);
};
