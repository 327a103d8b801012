#include "relayhttp/Request.hpp"
#include <string>
#include <utility>

namespace relayhttp {

  Request::Request(const std::string& method, const std::string& url)
    : method_(method), uri_(Uri::parse(url)) {}

  Request::Request(const std::string& method, Uri uri)
    : method_(method), uri_(std::move(uri)) {}

  void Request::setMethod(const std::string& method) {
    method_ = method;
    serialized_valid_ = false;
  }

  void Request::setUri(Uri uri) {
    uri_ = std::move(uri);
    serialized_valid_ = false;
  }

  void Request::setUrl(const std::string& url) {
    this->setUri(Uri::parse(url));
  }

  Headers& Request::headers() {
    serialized_valid_ = false;
    return headers_;
  }

  void Request::setHeaders(Headers headers) {
    headers_ = std::move(headers);
    serialized_valid_ = false;
  }

  void Request::setBody(std::string body) {
    body_ = std::move(body);
    serialized_valid_ = false;
  }

  void Request::setTimeout(int64_t timeout) {
    timeout_ = timeout;
  }

  void Request::setCredentials(std::optional<Credentials> credentials) {
    credentials_ = std::move(credentials);
  }

  void Request::setTls(TlsOptions tls) {
    tls_ = std::move(tls);
  }

  void Request::setStream(bool stream) {
    stream_ = stream;
  }

  const std::string& Request::serialize() const {
    if (serialized_valid_) return serialized_;

    Headers headers = headers_;
    headers.remove("host");
    if (!body_.empty()) {
      headers.set("content-length", std::to_string(body_.size()));
    }

    serialized_ = method_ + " " + uri_.pathAndQuery() + " HTTP/1.1\r\n";
    std::string host = uri_.domain();
    if (uri_.port && *uri_.port != (uri_.isSecure() ? 443 : 80)) {
      host += ":" + std::to_string(*uri_.port);
    }

    serialized_ += "host:  " + host + "\r\n";
    serialized_ += headers.dump();
    serialized_ += "\r\n";
    serialized_ += body_;

    serialized_valid_ = true;
    return serialized_;
  }

} // namespace relayhttp
