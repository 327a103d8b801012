#include "relayhttp/Auth.hpp"
#include "relayhttp/Buffer.hpp"
#include "relayhttp/Logs.hpp"
#include "relayhttp/Random.hpp"

#include <base64.hpp>
#include <mbedtls/md.h>

#include <cctype>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace relayhttp {

  namespace {

    std::optional<std::string> hexDigest(mbedtls_md_type_t type, const std::string& input) {
      const mbedtls_md_info_t* info = mbedtls_md_info_from_type(type);
      if (info == nullptr) {
        relayhttp_error("[Auth] Digest algorithm not available in mbedTLS");
        return std::nullopt;
      }

      unsigned char output[MBEDTLS_MD_MAX_SIZE];
      int ret = mbedtls_md(info, reinterpret_cast<const unsigned char*>(input.data()), input.size(), output);
      if (ret != 0) {
        relayhttp_error("[Auth] mbedtls_md failed: " << ret);
        return std::nullopt;
      }

      static const char* const hex = "0123456789abcdef";
      std::string out;
      unsigned char size = mbedtls_md_get_size(info);
      out.reserve(size * 2);
      for (unsigned char i = 0; i < size; ++i) {
        out += hex[output[i] >> 4];
        out += hex[output[i] & 0x0F];
      }
      return out;
    }

    std::string param(const AuthChallenge& challenge, const std::string& key) {
      auto it = challenge.params.find(key);
      return it == challenge.params.end() ? "" : it->second;
    }

    bool offersAuthQop(const std::string& qop_options) {
      size_t start = 0;
      while (start <= qop_options.size()) {
        size_t end = qop_options.find(',', start);
        if (end == std::string::npos) end = qop_options.size();
        if (Buffer::toLower(Buffer::trim(qop_options.substr(start, end - start))) == "auth") return true;
        start = end + 1;
      }
      return false;
    }

    std::string quoted(const std::string& value) {
      std::string out = "\"";
      for (char c : value) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
      }
      return out + "\"";
    }

  } // namespace

  namespace auth {

    std::string basicAuthorization(const Credentials& credentials) {
      return "Basic " + base64::to_base64(credentials.username + ":" + credentials.password);
    }

    std::optional<std::string> digestAuthorization(
      const AuthChallenge& challenge,
      const Credentials& credentials,
      const std::string& method,
      const std::string& uri,
      uint32_t nonce_count,
      std::string cnonce
    ) {
      std::string algorithm = param(challenge, "algorithm");
      std::string upper;
      for (char c : algorithm) upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

      mbedtls_md_type_t type;
      bool session = false;
      if (upper.empty() || upper == "MD5") {
        type = MBEDTLS_MD_MD5;
      } else if (upper == "MD5-SESS") {
        type = MBEDTLS_MD_MD5;
        session = true;
      } else if (upper == "SHA-256") {
        type = MBEDTLS_MD_SHA256;
      } else if (upper == "SHA-256-SESS") {
        type = MBEDTLS_MD_SHA256;
        session = true;
      } else {
        relayhttp_log("[Auth] Unsupported digest algorithm: " << algorithm);
        return std::nullopt;
      }

      std::string realm = param(challenge, "realm");
      std::string nonce = param(challenge, "nonce");
      std::string opaque = param(challenge, "opaque");
      std::string qop_options = param(challenge, "qop");

      std::string qop;
      if (!qop_options.empty()) {
        if (!offersAuthQop(qop_options)) {
          relayhttp_log("[Auth] Unsupported digest qop: " << qop_options);
          return std::nullopt;
        }
        qop = "auth";
      }

      if (cnonce.empty()) cnonce = random::generateRandomString(16);

      char nc[9];
      std::snprintf(nc, sizeof(nc), "%08x", nonce_count);

      std::optional<std::string> ha1 = hexDigest(type, credentials.username + ":" + realm + ":" + credentials.password);
      if (!ha1) return std::nullopt;
      if (session) {
        ha1 = hexDigest(type, *ha1 + ":" + nonce + ":" + cnonce);
        if (!ha1) return std::nullopt;
      }

      std::optional<std::string> ha2 = hexDigest(type, method + ":" + uri);
      if (!ha2) return std::nullopt;

      std::optional<std::string> response = qop.empty()
        ? hexDigest(type, *ha1 + ":" + nonce + ":" + *ha2)
        : hexDigest(type, *ha1 + ":" + nonce + ":" + nc + ":" + cnonce + ":" + qop + ":" + *ha2);
      if (!response) return std::nullopt;

      std::string header = "Digest username=" + quoted(credentials.username) +
        ", realm=" + quoted(realm) +
        ", nonce=" + quoted(nonce) +
        ", uri=" + quoted(uri) +
        ", response=" + quoted(*response);

      if (!algorithm.empty()) header += ", algorithm=" + algorithm;
      if (!opaque.empty()) header += ", opaque=" + quoted(opaque);
      if (!qop.empty()) {
        header += ", qop=" + qop + ", nc=" + std::string(nc) + ", cnonce=" + quoted(cnonce);
      }

      return header;
    }

    std::optional<std::string> authorizationFor(
      const AuthChallenge& challenge,
      const Credentials& credentials,
      const std::string& method,
      const std::string& uri
    ) {
      if (challenge.scheme == "basic") return basicAuthorization(credentials);
      if (challenge.scheme == "digest") return digestAuthorization(challenge, credentials, method, uri);

      relayhttp_log("[Auth] Unsupported authentication scheme: " << challenge.scheme);
      return std::nullopt;
    }

  } // namespace auth

} // namespace relayhttp
