#ifndef RELAY_HTTP_COOKIES_HPP
#define RELAY_HTTP_COOKIES_HPP

#include "relayhttp/HeaderValues.hpp"
#include "relayhttp/Uri.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace relayhttp {

  using Clock = std::chrono::system_clock;

  struct Cookie {
    std::string name;
    std::string value;
    std::string domain;
    std::string path;
    std::optional<Clock::time_point> expiry;
    bool host_only = true;
    bool secure = false;
    bool http_only = false;
    Clock::time_point creation;
    uint64_t sequence = 0;

    bool expired(Clock::time_point now) const {
      return expiry && *expiry <= now;
    }
  };

  namespace cookies {

    // RFC 6265 section 5.1.3.
    bool domainMatches(const std::string& host, const std::string& domain);
    // RFC 6265 section 5.1.4.
    std::string defaultPath(const std::string& uri_path);
    bool pathMatches(const std::string& request_path, const std::string& cookie_path);
    // RFC 6265 section 5.1.1.
    std::optional<Clock::time_point> parseCookieDate(const std::string& value);

  } // namespace cookies

  class CookieJar {
    public:
      void store(const SetCookie& set_cookie, const Uri& uri, Clock::time_point now = Clock::now());
      void store(const std::string& set_cookie_value, const Uri& uri, Clock::time_point now = Clock::now());

      // Value for the cookie request header, empty when nothing matches.
      std::string header(const Uri& uri, Clock::time_point now = Clock::now()) const;

      std::vector<Cookie> cookies() const;
      void removeExpired(Clock::time_point now = Clock::now());
      void clear();
      size_t size() const;

    private:
      mutable std::mutex mutex_;
      std::vector<Cookie> cookies_;
      uint64_t sequence_ = 0;
  };

} // namespace relayhttp

#endif // RELAY_HTTP_COOKIES_HPP
