#ifndef RELAY_HTTP_ERRORS_HPP
#define RELAY_HTTP_ERRORS_HPP

#include "relayhttp/Results.hpp"

#include <stdexcept>
#include <string>

namespace relayhttp {

  // Base of every error raised above the socket layer. The HttpResult code
  // tells the precise reason, the subclass tells the kind.
  class HttpError : public std::runtime_error {
    public:
      HttpError(HttpResult code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

      HttpResult code() const noexcept { return code_; }

    private:
      HttpResult code_;
  };

  // A transport was asked to serve a second in-flight request. Never retried.
  class UsageError : public HttpError {
    public:
      using HttpError::HttpError;
  };

  // DNS resolution, socket or TLS establishment failed, or the peer went away.
  class ConnectionError : public HttpError {
    public:
      using HttpError::HttpError;
  };

  class TimeoutError : public HttpError {
    public:
      using HttpError::HttpError;
  };

  // Response bytes could not be framed, parsed or decoded.
  class InvalidResponseData : public HttpError {
    public:
      using HttpError::HttpError;
  };

  // Raised while building a request. Never retried.
  class ConfigurationError : public HttpError {
    public:
      using HttpError::HttpError;
  };

} // namespace relayhttp

#endif // RELAY_HTTP_ERRORS_HPP
