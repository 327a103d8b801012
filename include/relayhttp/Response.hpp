#ifndef RELAY_HTTP_RESPONSE_HPP
#define RELAY_HTTP_RESPONSE_HPP

#include "relayhttp/Headers.hpp"

#include <boost/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace relayhttp {

  class Request;
  class BodyStream;

  namespace codes {

    inline bool isInformational(int status) { return status >= 100 && status < 200; }
    inline bool isSuccess(int status) { return status >= 200 && status < 300; }
    inline bool isRedirect(int status) { return status >= 300 && status < 400; }
    inline bool isClientError(int status) { return status >= 400 && status < 500; }
    inline bool isServerError(int status) { return status >= 500 && status < 600; }

  } // namespace codes

  struct Response {
    std::string version;
    uint16_t status = 0;
    std::string statusText;
    Headers headers;

    // Materialized body. Empty for streamed responses, read `stream` instead.
    std::string body;
    std::shared_ptr<BodyStream> stream;

    // The request as it was sent for this response.
    std::shared_ptr<const Request> request;

    // URIs reached through redirects, in visiting order.
    std::vector<std::string> redirects;

    // Builds a response from the status line and header block
    // (`HTTP/1.1 200 OK\r\nkey: value\r\n...`). Throws InvalidResponseData.
    static Response parse(const std::string& head, std::string body = "");

    bool ok() const { return codes::isSuccess(status); }

    // Throws InvalidResponseData when the body is not JSON.
    boost::json::value json() const;

    // Drains `stream` into `body`. No-op for materialized responses.
    const std::string& read();
  };

} // namespace relayhttp

#endif // RELAY_HTTP_RESPONSE_HPP
