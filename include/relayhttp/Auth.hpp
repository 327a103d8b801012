#ifndef RELAY_HTTP_AUTH_HPP
#define RELAY_HTTP_AUTH_HPP

#include "relayhttp/HeaderValues.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace relayhttp {

  struct Credentials {
    std::string username;
    std::string password;
  };

  namespace auth {

    std::string basicAuthorization(const Credentials& credentials);

    // Authorization value answering a Digest challenge. `cnonce` is generated
    // when empty. Returns nothing for an unsupported algorithm or qop.
    std::optional<std::string> digestAuthorization(
      const AuthChallenge& challenge,
      const Credentials& credentials,
      const std::string& method,
      const std::string& uri,
      uint32_t nonce_count = 1,
      std::string cnonce = ""
    );

    // Authorization value for one challenge of any supported scheme.
    std::optional<std::string> authorizationFor(
      const AuthChallenge& challenge,
      const Credentials& credentials,
      const std::string& method,
      const std::string& uri
    );

  } // namespace auth

} // namespace relayhttp

#endif // RELAY_HTTP_AUTH_HPP
