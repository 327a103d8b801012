#ifndef RELAY_HTTP_REQUEST_HPP
#define RELAY_HTTP_REQUEST_HPP

#include "relayhttp/Auth.hpp"
#include "relayhttp/Headers.hpp"
#include "relayhttp/TlsOptions.hpp"
#include "relayhttp/Uri.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace relayhttp {

  // One HTTP request. The wire form is built once by serialize() and kept
  // until any field changes; non-const access to the headers counts as a
  // change.
  class Request {
    public:
      Request() = default;
      Request(const std::string& method, const std::string& url);
      Request(const std::string& method, Uri uri);

      const std::string& method() const { return method_; }
      void setMethod(const std::string& method);

      const Uri& uri() const { return uri_; }
      void setUri(Uri uri);
      void setUrl(const std::string& url);

      Headers& headers();
      const Headers& headers() const { return headers_; }
      void setHeaders(Headers headers);

      const std::string& body() const { return body_; }
      void setBody(std::string body);

      // 0 falls back to the client default.
      int64_t timeout() const { return timeout_; }
      void setTimeout(int64_t timeout);

      const std::optional<Credentials>& credentials() const { return credentials_; }
      void setCredentials(std::optional<Credentials> credentials);

      const TlsOptions& tls() const { return tls_; }
      void setTls(TlsOptions tls);

      bool stream() const { return stream_; }
      void setStream(bool stream);

      const std::string& serialize() const;

    private:
      std::string method_ = "GET";
      Uri uri_;
      Headers headers_;
      std::string body_;
      int64_t timeout_ = 0;
      std::optional<Credentials> credentials_;
      TlsOptions tls_;
      bool stream_ = false;

      mutable std::string serialized_;
      mutable bool serialized_valid_ = false;
  };

} // namespace relayhttp

#endif // RELAY_HTTP_REQUEST_HPP
