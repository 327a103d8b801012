#include "relayhttp/HeaderValues.hpp"
#include "relayhttp/Buffer.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace relayhttp {

  namespace {

    bool isSpace(char c) {
      return c == ' ' || c == '\t';
    }

    void skipSpaces(const std::string& raw, size_t& pos) {
      while (pos < raw.size() && isSpace(raw[pos])) pos++;
    }

    std::string readToken(const std::string& raw, size_t& pos) {
      size_t start = pos;
      while (pos < raw.size() && !isSpace(raw[pos]) && raw[pos] != ',' && raw[pos] != '=') pos++;
      return raw.substr(start, pos - start);
    }

    std::string readValue(const std::string& raw, size_t& pos) {
      if (pos < raw.size() && raw[pos] == '"') {
        std::string out;
        pos++;
        while (pos < raw.size() && raw[pos] != '"') {
          if (raw[pos] == '\\' && pos + 1 < raw.size()) pos++;
          out += raw[pos++];
        }
        if (pos < raw.size()) pos++; // closing quote
        return out;
      }

      size_t start = pos;
      while (pos < raw.size() && raw[pos] != ',' && !isSpace(raw[pos])) pos++;
      return raw.substr(start, pos - start);
    }

  } // namespace

  ContentCodings ContentCodings::parse(const std::string& raw) {
    ContentCodings result;
    size_t start = 0;
    while (start <= raw.size()) {
      size_t comma = raw.find(',', start);
      if (comma == std::string::npos) comma = raw.size();
      std::string coding = Buffer::toLower(Buffer::trim(raw.substr(start, comma - start)));
      start = comma + 1;

      if (coding.empty() || coding == "chunked" || coding == "identity") continue;
      result.codings.push_back(coding);
    }

    std::reverse(result.codings.begin(), result.codings.end());
    return result;
  }

  WwwAuthenticate WwwAuthenticate::parse(const std::string& raw) {
    WwwAuthenticate result;
    size_t pos = 0;

    while (pos < raw.size()) {
      skipSpaces(raw, pos);
      if (pos < raw.size() && raw[pos] == ',') {
        pos++;
        continue;
      }

      std::string token = readToken(raw, pos);
      if (token.empty()) {
        pos++;
        continue;
      }
      skipSpaces(raw, pos);

      if (pos < raw.size() && raw[pos] == '=') {
        pos++;
        skipSpaces(raw, pos);
        std::string value = readValue(raw, pos);
        if (!result.challenges.empty()) {
          result.challenges.back().params[Buffer::toLower(token)] = value;
        }
      } else {
        AuthChallenge challenge;
        challenge.scheme = Buffer::toLower(token);
        result.challenges.push_back(challenge);
      }
    }

    return result;
  }

  WwwAuthenticate WwwAuthenticate::parse(const std::vector<std::string>& values) {
    WwwAuthenticate result;
    for (const std::string& value : values) {
      WwwAuthenticate parsed = WwwAuthenticate::parse(value);
      result.challenges.insert(result.challenges.end(), parsed.challenges.begin(), parsed.challenges.end());
    }
    return result;
  }

  std::optional<SetCookie> SetCookie::parse(const std::string& raw) {
    size_t semicolon = raw.find(';');
    std::string pair = raw.substr(0, semicolon);
    size_t equals = pair.find('=');
    if (equals == std::string::npos) return std::nullopt;

    SetCookie cookie;
    cookie.name = Buffer::trim(pair.substr(0, equals));
    cookie.value = Buffer::trim(pair.substr(equals + 1));
    if (cookie.name.empty()) return std::nullopt;

    size_t start = semicolon == std::string::npos ? raw.size() : semicolon + 1;
    while (start < raw.size()) {
      size_t end = raw.find(';', start);
      if (end == std::string::npos) end = raw.size();
      std::string attribute = raw.substr(start, end - start);
      start = end + 1;

      size_t eq = attribute.find('=');
      std::string key = Buffer::toLower(Buffer::trim(attribute.substr(0, eq)));
      std::string value = eq == std::string::npos ? "" : Buffer::trim(attribute.substr(eq + 1));

      if (key == "expires") {
        cookie.expires = value;
      } else if (key == "max-age") {
        bool valid = !value.empty();
        for (size_t i = 0; i < value.size(); ++i) {
          if (i == 0 && value[i] == '-') continue;
          if (!std::isdigit(static_cast<unsigned char>(value[i]))) valid = false;
        }
        if (valid && value != "-") {
          try {
            cookie.max_age = std::stoll(value);
          } catch (const std::out_of_range&) {
            cookie.max_age = value[0] == '-' ? -1 : 0x7fffffff;
          }
        }
      } else if (key == "domain") {
        if (!value.empty() && value[0] == '.') value.erase(0, 1);
        if (!value.empty()) cookie.domain = Buffer::toLower(value);
      } else if (key == "path") {
        if (!value.empty() && value[0] == '/') cookie.path = value;
      } else if (key == "secure") {
        cookie.secure = true;
      } else if (key == "httponly") {
        cookie.http_only = true;
      }
    }

    return cookie;
  }

  ContentType ContentType::parse(const std::string& raw) {
    ContentType result;
    size_t semicolon = raw.find(';');
    result.media_type = Buffer::toLower(Buffer::trim(raw.substr(0, semicolon)));

    size_t start = semicolon == std::string::npos ? raw.size() : semicolon + 1;
    while (start < raw.size()) {
      size_t end = raw.find(';', start);
      if (end == std::string::npos) end = raw.size();
      std::string param = raw.substr(start, end - start);
      start = end + 1;

      size_t eq = param.find('=');
      if (eq == std::string::npos) continue;
      if (Buffer::toLower(Buffer::trim(param.substr(0, eq))) != "charset") continue;

      std::string value = Buffer::trim(param.substr(eq + 1));
      if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
      }
      result.charset = Buffer::toLower(value);
    }

    return result;
  }

  HeaderValue parseHeaderValue(const std::string& name, const std::string& raw) {
    std::string key = Buffer::toLower(name);

    if (key == "content-encoding" || key == "transfer-encoding") {
      return ContentCodings::parse(raw);
    }
    if (key == "www-authenticate") {
      return WwwAuthenticate::parse(raw);
    }
    if (key == "set-cookie") {
      std::optional<SetCookie> cookie = SetCookie::parse(raw);
      if (cookie) return *cookie;
      return raw;
    }
    if (key == "content-type") {
      return ContentType::parse(raw);
    }

    return raw;
  }

  std::string acceptEncoding() {
    return "gzip, deflate";
  }

} // namespace relayhttp
