#ifndef RELAY_HTTP_URI_HPP
#define RELAY_HTTP_URI_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace relayhttp {

  using Query = std::vector<std::pair<std::string, std::string>>;

  class Uri {
    public:
      // Throws ConfigurationError(INVALID_URL) on malformed input.
      static Uri parse(const std::string& url);

      std::string scheme;
      std::string userinfo;
      std::string ip;                 // literal address, brackets removed
      std::vector<std::string> host;  // hostname labels when ip is empty
      std::optional<uint16_t> port;
      std::string path = "/";
      Query query;
      std::string fragment;

      std::string domain() const;
      uint16_t effectivePort() const;
      bool isSecure() const;
      bool isIpLiteral() const;

      std::string pathAndQuery() const;
      std::string toString() const;

      // Resolves a reference such as a Location header value against this URI.
      Uri resolve(const std::string& reference) const;
  };

  namespace utils {

    std::string urlEncode(const std::string& decoded, const std::string& safe = "-_.~");
    std::string urlDecode(const std::string& encoded);
    std::string encodeQuery(const Query& query);
    Query parseQuery(const std::string& raw);

  } // namespace utils

} // namespace relayhttp

#endif // RELAY_HTTP_URI_HPP
