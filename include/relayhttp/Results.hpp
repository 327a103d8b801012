#ifndef RELAY_HTTP_RESULTS_HPP
#define RELAY_HTTP_RESULTS_HPP

#include <string>

namespace relayhttp {

  typedef enum {

    // SOCKET

    HOSTNAME_RESOLUTION_FAILED = -500,
    OPEN_TCP_SOCKET_FAILED = -499,

    FAILED_TO_INIT_TLS = -498,
    FAILED_TO_LOAD_CERTIFICATES = -495,
    TLS_HANDSHAKE_FAILED = -494,
    INVALID_CERTIFICATE = -493,

    SOCKET_NOT_CONNECTED = -480,
    SOCKET_SEND_FAILED = -479,
    SOCKET_RECEIVE_FAILED = -478,
    CONNECTION_CLOSED = -477,
    RECEIVE_TIMEOUT = -476,
    CONNECT_TIMEOUT = -475,
    TLS_HANDSHAKE_TIMEOUT = -474,

    // HTTP

    TRANSPORT_IN_USE = -300,
    TRANSPORT_NOT_CONNECTED = -299,
    STREAM_REQUIRES_CHUNKED = -298,

    INVALID_URL = -250,
    UNSUPPORTED_PROTOCOL = -249,
    CONFLICTING_BODY_OPTIONS = -248,
    CONFLICTING_QUERY_OPTIONS = -247,

    REQUEST_TIMEOUT = -200,
    PARSE_STATUS_LINE_FAILED = -195,
    PARSE_HEADERS_FAILED = -194,
    PARSE_CHUNKED_RES_FAILED = -191,
    DECOMPRESS_RES_FAILED = -192,
    UNSUPPORTED_ENCODING = -190,
    MISSING_AUTH_CHALLENGE = -189,
    INVALID_JSON = -188,

    // GENERIC
    UNKNOWN_ERROR = 0,
    SUCCESS = 1,

  } HttpResult;


  inline std::string getErrorMessage(relayhttp::HttpResult code) {
    switch (code) {

      // SOCKET

      case HttpResult::HOSTNAME_RESOLUTION_FAILED:
        return "HOSTNAME_RESOLUTION_FAILED";
      case HttpResult::OPEN_TCP_SOCKET_FAILED:
        return "OPEN_TCP_SOCKET_FAILED";

      case HttpResult::FAILED_TO_INIT_TLS:
        return "FAILED_TO_INIT_TLS";
      case HttpResult::FAILED_TO_LOAD_CERTIFICATES:
        return "FAILED_TO_LOAD_CERTIFICATES";
      case HttpResult::TLS_HANDSHAKE_FAILED:
        return "TLS_HANDSHAKE_FAILED";
      case HttpResult::INVALID_CERTIFICATE:
        return "INVALID_CERTIFICATE";

      case HttpResult::SOCKET_NOT_CONNECTED:
        return "SOCKET_NOT_CONNECTED";
      case HttpResult::SOCKET_SEND_FAILED:
        return "SOCKET_SEND_FAILED";
      case HttpResult::SOCKET_RECEIVE_FAILED:
        return "SOCKET_RECEIVE_FAILED";
      case HttpResult::CONNECTION_CLOSED:
        return "CONNECTION_CLOSED";
      case HttpResult::RECEIVE_TIMEOUT:
        return "RECEIVE_TIMEOUT";
      case HttpResult::CONNECT_TIMEOUT:
        return "CONNECT_TIMEOUT";
      case HttpResult::TLS_HANDSHAKE_TIMEOUT:
        return "TLS_HANDSHAKE_TIMEOUT";

      // HTTP

      case HttpResult::TRANSPORT_IN_USE:
        return "TRANSPORT_IN_USE";
      case HttpResult::TRANSPORT_NOT_CONNECTED:
        return "TRANSPORT_NOT_CONNECTED";
      case HttpResult::STREAM_REQUIRES_CHUNKED:
        return "STREAM_REQUIRES_CHUNKED";

      case HttpResult::INVALID_URL:
        return "INVALID_URL";
      case HttpResult::UNSUPPORTED_PROTOCOL:
        return "UNSUPPORTED_PROTOCOL";
      case HttpResult::CONFLICTING_BODY_OPTIONS:
        return "CONFLICTING_BODY_OPTIONS";
      case HttpResult::CONFLICTING_QUERY_OPTIONS:
        return "CONFLICTING_QUERY_OPTIONS";

      case HttpResult::REQUEST_TIMEOUT:
        return "REQUEST_TIMEOUT";
      case HttpResult::PARSE_STATUS_LINE_FAILED:
        return "PARSE_STATUS_LINE_FAILED";
      case HttpResult::PARSE_HEADERS_FAILED:
        return "PARSE_HEADERS_FAILED";
      case HttpResult::PARSE_CHUNKED_RES_FAILED:
        return "PARSE_CHUNKED_RES_FAILED";
      case HttpResult::DECOMPRESS_RES_FAILED:
        return "DECOMPRESS_RES_FAILED";
      case HttpResult::UNSUPPORTED_ENCODING:
        return "UNSUPPORTED_ENCODING";
      case HttpResult::MISSING_AUTH_CHALLENGE:
        return "MISSING_AUTH_CHALLENGE";
      case HttpResult::INVALID_JSON:
        return "INVALID_JSON";

      // GENERIC

      case HttpResult::UNKNOWN_ERROR:
        return "UNKNOWN_ERROR";
      case HttpResult::SUCCESS:
        return "SUCCESS";
      default:
        return "INVALID ERROR (" + std::to_string(code) + ")";

    }
  }

  inline std::string getErrorMessage(int code) {
    return relayhttp::getErrorMessage(static_cast<relayhttp::HttpResult>(code));
  }

} // namespace relayhttp

#endif // RELAY_HTTP_RESULTS_HPP
