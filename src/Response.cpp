#include "relayhttp/Response.hpp"
#include "relayhttp/Buffer.hpp"
#include "relayhttp/Errors.hpp"
#include "relayhttp/Logs.hpp"
#include "relayhttp/Transport.hpp"

#include <boost/json.hpp>

#include <cctype>
#include <string>

namespace relayhttp {

  Response Response::parse(const std::string& head, std::string body) {
    Response response;

    size_t line_end = head.find("\r\n");
    std::string status_line = head.substr(0, line_end);

    size_t first_space = status_line.find(' ');
    if (status_line.compare(0, 5, "HTTP/") != 0 || first_space == std::string::npos) {
      relayhttp_error("[Response] Invalid status line: " << status_line);
      throw InvalidResponseData(HttpResult::PARSE_STATUS_LINE_FAILED, "Invalid status line: " + status_line);
    }

    response.version = status_line.substr(0, first_space);
    std::string code = status_line.substr(first_space + 1, 3);
    if (code.size() != 3 ||
        !std::isdigit(static_cast<unsigned char>(code[0])) ||
        !std::isdigit(static_cast<unsigned char>(code[1])) ||
        !std::isdigit(static_cast<unsigned char>(code[2]))) {
      relayhttp_error("[Response] Invalid status code in: " << status_line);
      throw InvalidResponseData(HttpResult::PARSE_STATUS_LINE_FAILED, "Invalid status code: " + status_line);
    }
    response.status = static_cast<uint16_t>(std::stoi(code));

    size_t reason_start = first_space + 4;
    if (reason_start < status_line.size()) {
      response.statusText = Buffer::trim(status_line.substr(reason_start));
    }

    if (line_end != std::string::npos) {
      response.headers = Headers::parse(head.substr(line_end + 2));
    }

    response.body = std::move(body);
    return response;
  }

  boost::json::value Response::json() const {
    boost::system::error_code ec;
    boost::json::value value = boost::json::parse(body, ec);
    if (ec) {
      throw InvalidResponseData(HttpResult::INVALID_JSON, "Response body is not JSON: " + ec.message());
    }
    return value;
  }

  const std::string& Response::read() {
    if (stream) {
      body += stream->readAll();
      stream.reset();
    }
    return body;
  }

} // namespace relayhttp
