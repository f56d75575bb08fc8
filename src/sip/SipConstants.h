#pragma once

#include <string>

#ifndef SIPSOCKET_VERSION
#define SIPSOCKET_VERSION "0.0.0"
#endif

namespace SipConstants {
    // Response Codes
    constexpr int TRYING = 100;
    constexpr int RINGING = 180;
    constexpr int SESSION_PROGRESS = 183;
    constexpr int OK = 200;
    constexpr int ACCEPTED = 202;
    constexpr int BAD_REQUEST = 400;
    constexpr int UNAUTHORIZED = 401;
    constexpr int FORBIDDEN = 403;
    constexpr int NOT_FOUND = 404;
    constexpr int PROXY_AUTHENTICATION_REQUIRED = 407;
    constexpr int REQUEST_TIMEOUT = 408;
    constexpr int INTERVAL_TOO_BRIEF = 423;
    constexpr int BUSY_HERE = 486;
    constexpr int REQUEST_TERMINATED = 487;
    constexpr int INTERNAL_SERVER_ERROR = 500;
    constexpr int NOT_IMPLEMENTED = 501;
    constexpr int SERVICE_UNAVAILABLE = 503;
    constexpr int DECLINE = 603;

    // Headers
    const std::string HDR_CALL_ID = "Call-ID";
    const std::string HDR_CSEQ = "CSeq";
    const std::string HDR_FROM = "From";
    const std::string HDR_TO = "To";
    const std::string HDR_VIA = "Via";
    const std::string HDR_CONTACT = "Contact";
    const std::string HDR_CONTENT_TYPE = "Content-Type";
    const std::string HDR_CONTENT_LENGTH = "Content-Length";
    const std::string HDR_USER_AGENT = "User-Agent";
    const std::string HDR_WWW_AUTHENTICATE = "WWW-Authenticate";
    const std::string HDR_AUTHORIZATION = "Authorization";

    // Via
    const std::string VIA_TRANSPORT_WSS = "SIP/2.0/WSS";
    const std::string BRANCH_MAGIC_COOKIE = "z9hG4bK";

    // WebSocket
    const std::string WS_SUBPROTOCOL = "sip";
    const std::string WS_PATH = "/sipsockets/";

    // Identity
    const std::string CLIENT_NAME = "sipsocket";
    const std::string USER_AGENT = CLIENT_NAME + "/" + SIPSOCKET_VERSION;

    // Defaults
    constexpr unsigned DEFAULT_REGISTER_EXPIRES = 6000;
    constexpr size_t RANDOM_TOKEN_LENGTH = 16;
}
