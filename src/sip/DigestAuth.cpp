#include "DigestAuth.h"
#include "SipError.h"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <map>
#include <memory>
#include <openssl/evp.h>
#include <sstream>

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string toUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

const EVP_MD *digestFor(const std::string &algorithm) {
  std::string name = toUpper(algorithm);
  if (name.empty() || name == "MD5")
    return EVP_md5();
  if (name == "SHA-256")
    return EVP_sha256();
  if (name == "SHA-512-256")
    return EVP_sha512_256();
  return nullptr;
}

// key=value and key="quoted value" pairs separated by commas
std::map<std::string, std::string> parseParams(const std::string &text) {
  std::map<std::string, std::string> params;
  size_t pos = 0;

  while (pos < text.size()) {
    while (pos < text.size() && (std::isspace(static_cast<unsigned char>(text[pos])) || text[pos] == ','))
      ++pos;
    if (pos >= text.size())
      break;

    size_t eq = text.find('=', pos);
    if (eq == std::string::npos)
      break;
    std::string name = text.substr(pos, eq - pos);
    name.erase(name.find_last_not_of(" \t") + 1);
    pos = eq + 1;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
      ++pos;

    std::string value;
    if (pos < text.size() && text[pos] == '"') {
      ++pos;
      while (pos < text.size() && text[pos] != '"') {
        if (text[pos] == '\\' && pos + 1 < text.size())
          ++pos;
        value += text[pos++];
      }
      ++pos; // closing quote
    } else {
      size_t end = text.find(',', pos);
      if (end == std::string::npos)
        end = text.size();
      value = text.substr(pos, end - pos);
      value.erase(value.find_last_not_of(" \t") + 1);
      pos = end;
    }

    params[toLower(name)] = value;
  }

  return params;
}

} // namespace

std::optional<DigestChallenge> DigestChallenge::parse(const std::string &header) {
  size_t start = header.find_first_not_of(" \t");
  if (start == std::string::npos)
    return std::nullopt;

  size_t schemeEnd = header.find_first_of(" \t", start);
  if (schemeEnd == std::string::npos)
    return std::nullopt;
  if (toLower(header.substr(start, schemeEnd - start)) != "digest")
    return std::nullopt;

  auto params = parseParams(header.substr(schemeEnd));

  auto realm = params.find("realm");
  auto nonce = params.find("nonce");
  if (realm == params.end() || nonce == params.end())
    return std::nullopt;

  DigestChallenge challenge;
  challenge.realm = realm->second;
  challenge.nonce = nonce->second;
  if (auto it = params.find("opaque"); it != params.end())
    challenge.opaque = it->second;
  if (auto it = params.find("algorithm"); it != params.end())
    challenge.algorithm = it->second;
  if (auto it = params.find("qop"); it != params.end())
    challenge.qop = it->second;
  if (auto it = params.find("stale"); it != params.end())
    challenge.stale = toLower(it->second) == "true";
  return challenge;
}

std::string DigestAuth::hash(const std::string &algorithm, const std::string &input) {
  const EVP_MD *md = digestFor(algorithm);
  if (!md) {
    throw SipError(SipErrorKind::UNSUPPORTED_CHALLENGE,
                   "Unsupported digest algorithm: " + algorithm);
  }

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                              EVP_MD_CTX_free);
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digestLen = 0;

  if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
    throw SipError(SipErrorKind::UNSUPPORTED_CHALLENGE,
                   "Digest computation failed for " + algorithm);
  }

  std::ostringstream ss;
  for (unsigned int i = 0; i < digestLen; ++i) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
  }
  return ss.str();
}

std::string DigestAuth::computeResponse(const DigestChallenge &challenge,
                                        const DigestCredentials &credentials,
                                        const std::string &method,
                                        const std::string &uri) {
  std::string algorithm = challenge.algorithm.value_or("MD5");

  std::string ha1 = hash(algorithm, credentials.username + ":" + challenge.realm +
                                        ":" + credentials.password);
  std::string ha2 = hash(algorithm, method + ":" + uri);
  return hash(algorithm, ha1 + ":" + challenge.nonce + ":" + ha2);
}

std::string DigestAuth::authorization(const DigestChallenge &challenge,
                                      const DigestCredentials &credentials,
                                      const std::string &method,
                                      const std::string &uri) {
  std::string response = computeResponse(challenge, credentials, method, uri);

  std::ostringstream ss;
  ss << "Digest username=\"" << credentials.username << "\", realm=\""
     << challenge.realm << "\", nonce=\"" << challenge.nonce << "\", uri=\""
     << uri << "\", response=\"" << response << "\"";
  if (challenge.algorithm)
    ss << ", algorithm=" << *challenge.algorithm;
  if (challenge.opaque)
    ss << ", opaque=\"" << *challenge.opaque << "\"";
  return ss.str();
}
