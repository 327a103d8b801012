#ifndef RELAY_HTTP_HEADER_VALUES_HPP
#define RELAY_HTTP_HEADER_VALUES_HPP

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace relayhttp {

  // Encodings listed by transfer-encoding or content-encoding, in the order
  // they have to be removed (last applied first). `chunked` and `identity`
  // are dropped.
  struct ContentCodings {
    std::vector<std::string> codings;

    static ContentCodings parse(const std::string& raw);
  };

  struct AuthChallenge {
    std::string scheme; // lowercased
    std::map<std::string, std::string> params; // lowercased keys
  };

  struct WwwAuthenticate {
    std::vector<AuthChallenge> challenges;

    static WwwAuthenticate parse(const std::string& raw);
    static WwwAuthenticate parse(const std::vector<std::string>& values);
  };

  struct SetCookie {
    std::string name;
    std::string value;
    std::optional<std::string> domain;
    std::optional<std::string> path;
    std::optional<std::string> expires;
    std::optional<long long> max_age;
    bool secure = false;
    bool http_only = false;

    // Empty when the value has no `name=value` pair.
    static std::optional<SetCookie> parse(const std::string& raw);
  };

  struct ContentType {
    std::string media_type; // lowercased
    std::string charset;

    static ContentType parse(const std::string& raw);
  };

  using HeaderValue = std::variant<std::string, ContentCodings, WwwAuthenticate, SetCookie, ContentType>;

  // Structured value for recognized header names, the raw string otherwise
  // (also for a set-cookie value that does not parse).
  HeaderValue parseHeaderValue(const std::string& name, const std::string& raw);

  // Value sent in accept-encoding, matching what Decompress can undo.
  std::string acceptEncoding();

} // namespace relayhttp

#endif // RELAY_HTTP_HEADER_VALUES_HPP
