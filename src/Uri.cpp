#include "relayhttp/Uri.hpp"
#include "relayhttp/Buffer.hpp"
#include "relayhttp/Errors.hpp"

#include <cctype>
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

    [[noreturn]] void invalidUrl(const std::string& url, const std::string& reason) {
      throw ConfigurationError(HttpResult::INVALID_URL, "Invalid URL '" + url + "': " + reason);
    }

    bool hasScheme(const std::string& reference) {
      if (reference.empty() || !std::isalpha(static_cast<unsigned char>(reference[0]))) return false;
      for (char c : reference) {
        if (c == ':') return true;
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') return false;
      }
      return false;
    }

    bool isIPv4(const std::string& host) {
      struct in_addr addr;
      return inet_pton(AF_INET, host.c_str(), &addr) == 1;
    }

    bool isIPv6(const std::string& host) {
      struct in6_addr addr;
      return inet_pton(AF_INET6, host.c_str(), &addr) == 1;
    }

    // RFC 3986 section 5.2.4.
    std::string removeDotSegments(const std::string& path) {
      std::vector<std::string> segments;
      size_t start = 0;
      bool absolute = !path.empty() && path[0] == '/';
      if (absolute) start = 1;

      std::string segment;
      bool trailing_slash = false;
      while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        segment = path.substr(start, end - start);
        trailing_slash = (end == path.size()) && (segment == "." || segment == "..");

        if (segment == "..") {
          if (!segments.empty()) segments.pop_back();
        } else if (segment != ".") {
          segments.push_back(segment);
        }
        start = end + 1;
      }

      std::string out = absolute ? "/" : "";
      for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += "/";
        out += segments[i];
      }
      if (trailing_slash && (out.empty() || out.back() != '/')) out += "/";
      return out.empty() ? "/" : out;
    }

    void splitTail(const std::string& tail, std::string& path, std::string& query, std::string& fragment) {
      size_t hash = tail.find('#');
      std::string rest = tail.substr(0, hash);
      fragment = hash == std::string::npos ? "" : tail.substr(hash + 1);

      size_t question = rest.find('?');
      path = rest.substr(0, question);
      query = question == std::string::npos ? "" : rest.substr(question + 1);
    }

  } // namespace

  Uri Uri::parse(const std::string& url) {
    Uri uri;

    if (url.empty()) invalidUrl(url, "empty");

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0 || !hasScheme(url.substr(0, scheme_end + 1))) {
      invalidUrl(url, "missing scheme");
    }
    uri.scheme = Buffer::toLower(url.substr(0, scheme_end));

    size_t authority_start = scheme_end + 3;
    size_t authority_end = url.find_first_of("/?#", authority_start);
    if (authority_end == std::string::npos) authority_end = url.size();
    std::string authority = url.substr(authority_start, authority_end - authority_start);

    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
      uri.userinfo = authority.substr(0, at);
      authority = authority.substr(at + 1);
    }

    std::string host;
    std::string port;
    if (!authority.empty() && authority[0] == '[') {
      size_t close = authority.find(']');
      if (close == std::string::npos) invalidUrl(url, "unterminated IPv6 literal");
      host = authority.substr(1, close - 1);
      if (!isIPv6(host)) invalidUrl(url, "bad IPv6 literal");
      uri.ip = host;
      std::string rest = authority.substr(close + 1);
      if (!rest.empty()) {
        if (rest[0] != ':') invalidUrl(url, "unexpected characters after host");
        port = rest.substr(1);
      }
    } else {
      size_t colon = authority.rfind(':');
      host = authority.substr(0, colon);
      if (colon != std::string::npos) port = authority.substr(colon + 1);
      host = Buffer::toLower(host);
      if (host.empty()) invalidUrl(url, "missing host");

      if (isIPv4(host)) {
        uri.ip = host;
      } else {
        size_t start = 0;
        while (start <= host.size()) {
          size_t dot = host.find('.', start);
          if (dot == std::string::npos) dot = host.size();
          std::string label = host.substr(start, dot - start);
          if (label.empty() && dot != host.size()) invalidUrl(url, "empty host label");
          if (!label.empty()) uri.host.push_back(label);
          start = dot + 1;
        }
        if (uri.host.empty()) invalidUrl(url, "missing host");
      }
    }

    if (!port.empty()) {
      if (port.size() > 5) invalidUrl(url, "port out of range");
      for (char c : port) {
        if (!std::isdigit(static_cast<unsigned char>(c))) invalidUrl(url, "port is not a number");
      }
      unsigned long value = std::stoul(port);
      if (value == 0 || value > 65535) invalidUrl(url, "port out of range");
      uri.port = static_cast<uint16_t>(value);
    }

    std::string path;
    std::string query;
    splitTail(url.substr(authority_end), path, query, uri.fragment);
    uri.path = path.empty() ? "/" : path;
    uri.query = utils::parseQuery(query);

    return uri;
  }

  std::string Uri::domain() const {
    if (!ip.empty()) {
      return ip.find(':') != std::string::npos ? "[" + ip + "]" : ip;
    }

    std::string out;
    for (size_t i = 0; i < host.size(); ++i) {
      if (i > 0) out += ".";
      out += host[i];
    }
    return out;
  }

  uint16_t Uri::effectivePort() const {
    if (port) return *port;
    return isSecure() ? 443 : 80;
  }

  bool Uri::isSecure() const {
    return scheme == "https";
  }

  bool Uri::isIpLiteral() const {
    return !ip.empty();
  }

  std::string Uri::pathAndQuery() const {
    std::string out = path.empty() ? "/" : path;
    if (!query.empty()) out += "?" + utils::encodeQuery(query);
    return out;
  }

  std::string Uri::toString() const {
    std::string out = scheme + "://";
    if (!userinfo.empty()) out += userinfo + "@";
    out += domain();
    if (port) out += ":" + std::to_string(*port);
    out += pathAndQuery();
    if (!fragment.empty()) out += "#" + fragment;
    return out;
  }

  Uri Uri::resolve(const std::string& reference) const {
    if (hasScheme(reference) && reference.find("://") != std::string::npos) {
      return Uri::parse(reference);
    }

    if (reference.rfind("//", 0) == 0) {
      return Uri::parse(scheme + ":" + reference);
    }

    Uri target = *this;
    target.fragment.clear();

    std::string path;
    std::string query;
    std::string fragment;
    splitTail(reference, path, query, fragment);
    target.fragment = fragment;

    if (path.empty()) {
      if (!query.empty()) target.query = utils::parseQuery(query);
      return target;
    }

    if (path[0] == '/') {
      target.path = removeDotSegments(path);
    } else {
      size_t slash = this->path.rfind('/');
      std::string base = slash == std::string::npos ? "/" : this->path.substr(0, slash + 1);
      target.path = removeDotSegments(base + path);
    }
    target.query = utils::parseQuery(query);
    return target;
  }

  namespace utils {

    std::string urlEncode(const std::string& decoded, const std::string& safe) {
      std::string out;
      const char hexChars[] = "0123456789ABCDEF";

      for (unsigned char c : decoded) {
        if (std::isalnum(c) || safe.find(static_cast<char>(c)) != std::string::npos) {
          out += static_cast<char>(c);
        } else if (c == ' ') {
          out += '+';
        } else {
          out += '%';
          out += hexChars[(c >> 4) & 0x0F];
          out += hexChars[c & 0x0F];
        }
      }

      return out;
    }

    std::string urlDecode(const std::string& encoded) {
      std::string out;

      for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '%' && i + 2 < encoded.size() &&
            std::isxdigit(static_cast<unsigned char>(encoded[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(encoded[i + 2]))) {
          out += static_cast<char>(std::stoi(encoded.substr(i + 1, 2), nullptr, 16));
          i += 2;
        } else if (encoded[i] == '+') {
          out += ' ';
        } else {
          out += encoded[i];
        }
      }

      return out;
    }

    std::string encodeQuery(const Query& query) {
      std::string out;
      for (const auto& pair : query) {
        if (!out.empty()) out += "&";
        out += urlEncode(pair.first) + "=" + urlEncode(pair.second);
      }
      return out;
    }

    Query parseQuery(const std::string& raw) {
      Query query;
      size_t start = 0;
      while (start < raw.size()) {
        size_t end = raw.find('&', start);
        if (end == std::string::npos) end = raw.size();
        std::string pair = raw.substr(start, end - start);
        start = end + 1;
        if (pair.empty()) continue;

        size_t equals = pair.find('=');
        if (equals == std::string::npos) {
          query.emplace_back(urlDecode(pair), "");
        } else {
          query.emplace_back(urlDecode(pair.substr(0, equals)), urlDecode(pair.substr(equals + 1)));
        }
      }
      return query;
    }

  } // namespace utils

} // namespace relayhttp
