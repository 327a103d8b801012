#include "relayhttp/Cookies.hpp"
#include "relayhttp/Buffer.hpp"
#include "relayhttp/Logs.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#ifdef _WIN32
  #include <winsock2.h>
  #include <ws2tcpip.h>
#else
  #include <arpa/inet.h>
#endif

namespace relayhttp {

  namespace {

    bool isIpAddress(const std::string& host) {
      struct in_addr v4;
      struct in6_addr v6;
      std::string bare = host;
      if (bare.size() > 2 && bare.front() == '[' && bare.back() == ']') {
        bare = bare.substr(1, bare.size() - 2);
      }
      return inet_pton(AF_INET, bare.c_str(), &v4) == 1 || inet_pton(AF_INET6, bare.c_str(), &v6) == 1;
    }

    bool isDateDelimiter(unsigned char c) {
      return c == 0x09 || (c >= 0x20 && c <= 0x2F) || (c >= 0x3B && c <= 0x40) ||
             (c >= 0x5B && c <= 0x60) || (c >= 0x7B && c <= 0x7E);
    }

    // Leading run of 1..max digits, the rest of the token is ignored.
    bool leadingDigits(const std::string& token, size_t min, size_t max, int& value, size_t& consumed) {
      consumed = 0;
      value = 0;
      while (consumed < token.size() && std::isdigit(static_cast<unsigned char>(token[consumed]))) {
        value = value * 10 + (token[consumed] - '0');
        consumed++;
      }
      return consumed >= min && consumed <= max;
    }

    bool parseTime(const std::string& token, int& hour, int& minute, int& second) {
      int parts[3];
      size_t pos = 0;
      for (int i = 0; i < 3; ++i) {
        size_t consumed = 0;
        if (!leadingDigits(token.substr(pos), 1, 2, parts[i], consumed)) return false;
        pos += consumed;
        if (i < 2) {
          if (pos >= token.size() || token[pos] != ':') return false;
          pos++;
        }
      }
      hour = parts[0];
      minute = parts[1];
      second = parts[2];
      return true;
    }

    int parseMonth(const std::string& token) {
      static const char* const months[] = {"jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};
      if (token.size() < 3) return 0;
      std::string prefix = Buffer::toLower(token.substr(0, 3));
      for (int i = 0; i < 12; ++i) {
        if (prefix == months[i]) return i + 1;
      }
      return 0;
    }

    // Days since 1970-01-01 of a proleptic Gregorian date.
    int64_t daysFromCivil(int64_t year, unsigned month, unsigned day) {
      year -= month <= 2;
      const int64_t era = (year >= 0 ? year : year - 399) / 400;
      const unsigned yoe = static_cast<unsigned>(year - era * 400);
      const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
      const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
      return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

    Clock::time_point farPast() {
      return Clock::time_point{};
    }

    // base + seconds, saturated to the clock range. Clock::duration counts
    // nanoseconds on common platforms, so dates past 2262 do not fit.
    Clock::time_point addSeconds(Clock::time_point base, int64_t seconds) {
      using std::chrono::duration_cast;
      using Seconds = std::chrono::seconds;

      const int64_t base_s = duration_cast<Seconds>(base.time_since_epoch()).count();
      const int64_t max_s = duration_cast<Seconds>(Clock::duration::max()).count();
      const int64_t min_s = duration_cast<Seconds>(Clock::duration::min()).count();

      if (seconds >= max_s - base_s) return Clock::time_point::max();
      if (seconds <= min_s - base_s) return Clock::time_point::min();
      return base + duration_cast<Clock::duration>(Seconds(seconds));
    }

  } // namespace

  namespace cookies {

    bool domainMatches(const std::string& host, const std::string& domain) {
      std::string lower_host = Buffer::toLower(host);
      std::string lower_domain = Buffer::toLower(domain);
      if (lower_host == lower_domain) return true;
      if (isIpAddress(lower_host)) return false;
      if (lower_host.size() <= lower_domain.size()) return false;

      size_t offset = lower_host.size() - lower_domain.size();
      return lower_host.compare(offset, lower_domain.size(), lower_domain) == 0 && lower_host[offset - 1] == '.';
    }

    std::string defaultPath(const std::string& uri_path) {
      if (uri_path.empty() || uri_path[0] != '/') return "/";
      size_t last = uri_path.rfind('/');
      if (last == 0) return "/";
      return uri_path.substr(0, last);
    }

    bool pathMatches(const std::string& request_path, const std::string& cookie_path) {
      if (request_path == cookie_path) return true;
      if (request_path.compare(0, cookie_path.size(), cookie_path) != 0) return false;
      if (!cookie_path.empty() && cookie_path.back() == '/') return true;
      return request_path.size() > cookie_path.size() && request_path[cookie_path.size()] == '/';
    }

    std::optional<Clock::time_point> parseCookieDate(const std::string& value) {
      bool found_time = false, found_day = false, found_month = false, found_year = false;
      int hour = 0, minute = 0, second = 0, day = 0, month = 0, year = 0;

      size_t pos = 0;
      while (pos < value.size()) {
        while (pos < value.size() && isDateDelimiter(static_cast<unsigned char>(value[pos]))) pos++;
        size_t start = pos;
        while (pos < value.size() && !isDateDelimiter(static_cast<unsigned char>(value[pos]))) pos++;
        if (start == pos) continue;
        std::string token = value.substr(start, pos - start);

        size_t consumed = 0;
        int number = 0;
        if (!found_time && parseTime(token, hour, minute, second)) {
          found_time = true;
        } else if (!found_day && leadingDigits(token, 1, 2, number, consumed)) {
          day = number;
          found_day = true;
        } else if (!found_month && parseMonth(token) != 0) {
          month = parseMonth(token);
          found_month = true;
        } else if (!found_year && leadingDigits(token, 2, 4, number, consumed)) {
          year = number;
          found_year = true;
        }
      }

      if (found_year && year >= 70 && year <= 99) year += 1900;
      if (found_year && year >= 0 && year <= 69) year += 2000;

      if (!found_time || !found_day || !found_month || !found_year) return std::nullopt;
      if (day < 1 || day > 31 || year < 1601 || hour > 23 || minute > 59 || second > 59) return std::nullopt;

      int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
      int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second;
      return addSeconds(Clock::time_point{}, seconds);
    }

  } // namespace cookies

  void CookieJar::store(const SetCookie& set_cookie, const Uri& uri, Clock::time_point now) {
    Cookie cookie;
    cookie.name = set_cookie.name;
    cookie.value = set_cookie.value;
    cookie.secure = set_cookie.secure;
    cookie.http_only = set_cookie.http_only;
    cookie.creation = now;

    if (set_cookie.max_age) {
      cookie.expiry = *set_cookie.max_age <= 0 ? farPast() : addSeconds(now, *set_cookie.max_age);
    } else if (set_cookie.expires) {
      cookie.expiry = cookies::parseCookieDate(*set_cookie.expires);
    }

    std::string host = uri.isIpLiteral() ? uri.ip : uri.domain();
    if (set_cookie.domain) {
      if (!cookies::domainMatches(host, *set_cookie.domain)) {
        relayhttp_log("[CookieJar] Ignoring cookie " << cookie.name << " for foreign domain " << *set_cookie.domain);
        return;
      }
      cookie.domain = *set_cookie.domain;
      cookie.host_only = false;
    } else {
      cookie.domain = Buffer::toLower(host);
      cookie.host_only = true;
    }

    cookie.path = set_cookie.path ? *set_cookie.path : cookies::defaultPath(uri.path);

    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = std::find_if(cookies_.begin(), cookies_.end(), [&cookie](const Cookie& other) {
      return other.name == cookie.name && other.domain == cookie.domain && other.path == cookie.path;
    });

    if (existing != cookies_.end()) {
      cookie.creation = existing->creation;
      cookie.sequence = existing->sequence;
      cookies_.erase(existing);
    } else {
      cookie.sequence = sequence_++;
    }

    if (cookie.expired(now)) {
      relayhttp_log("[CookieJar] Cookie " << cookie.name << " expired, removed");
      return;
    }

    cookies_.push_back(std::move(cookie));
  }

  void CookieJar::store(const std::string& set_cookie_value, const Uri& uri, Clock::time_point now) {
    std::optional<SetCookie> parsed = SetCookie::parse(set_cookie_value);
    if (!parsed) {
      relayhttp_log("[CookieJar] Ignoring malformed set-cookie value");
      return;
    }
    this->store(*parsed, uri, now);
  }

  std::string CookieJar::header(const Uri& uri, Clock::time_point now) const {
    std::string host = Buffer::toLower(uri.isIpLiteral() ? uri.ip : uri.domain());
    std::vector<const Cookie*> matching;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const Cookie& cookie : cookies_) {
      if (cookie.expired(now)) continue;
      if (cookie.host_only ? host != cookie.domain : !cookies::domainMatches(host, cookie.domain)) continue;
      if (!cookies::pathMatches(uri.path, cookie.path)) continue;
      if (cookie.secure && !uri.isSecure()) continue;
      matching.push_back(&cookie);
    }

    std::stable_sort(matching.begin(), matching.end(), [](const Cookie* a, const Cookie* b) {
      if (a->path.size() != b->path.size()) return a->path.size() > b->path.size();
      return a->sequence < b->sequence;
    });

    std::string out;
    for (const Cookie* cookie : matching) {
      if (!out.empty()) out += "; ";
      out += cookie->name + "=" + cookie->value;
    }
    return out;
  }

  std::vector<Cookie> CookieJar::cookies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cookies_;
  }

  void CookieJar::removeExpired(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    cookies_.erase(
      std::remove_if(cookies_.begin(), cookies_.end(), [now](const Cookie& cookie) { return cookie.expired(now); }),
      cookies_.end()
    );
  }

  void CookieJar::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cookies_.clear();
  }

  size_t CookieJar::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cookies_.size();
  }

} // namespace relayhttp
