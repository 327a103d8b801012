#include "relayhttp/Headers.hpp"
#include "relayhttp/Buffer.hpp"
#include <map>
#include <string>
#include <vector>

namespace relayhttp {

  bool Headers::isMultiValued(const std::string& key) {
    std::string lowerKey = Buffer::toLower(key);
    return lowerKey == "set-cookie" || lowerKey == "www-authenticate";
  }

  Headers Headers::parse(const std::string& rawHeaders) {
    Headers headers;
    headers.load(rawHeaders);
    return headers;
  }

  Headers Headers::merge(const Headers& base, const Headers& overrides) {
    Headers merged = base;
    for (const auto& header : overrides.headers_) {
      if (!isMultiValued(header.first)) {
        merged.headers_.erase(header.first);
      }
      for (const std::string& value : header.second) {
        merged.set(header.first, value);
      }
    }
    return merged;
  }

  void Headers::load(const std::string& rawHeaders) {
    size_t start = 0;
    while (start < rawHeaders.size()) {
      size_t end = rawHeaders.find("\r\n", start);
      if (end == std::string::npos) end = rawHeaders.size();
      std::string line = rawHeaders.substr(start, end - start);
      start = end + 2;

      size_t colonPos = line.find(':');
      if (colonPos == std::string::npos || colonPos == 0) continue;

      std::string key = Buffer::trim(line.substr(0, colonPos));
      if (key.empty()) continue;
      this->set(key, Buffer::trim(line.substr(colonPos + 1)));
    }
  }

  void Headers::set(const std::string& key, const std::string& value) {
    std::string lowerKey = Buffer::toLower(key);
    auto& values = headers_[lowerKey];
    if (isMultiValued(lowerKey)) {
      values.push_back(value);
    } else {
      values.assign(1, value);
    }
    dumped_valid_ = false;
  }

  std::string Headers::get(const std::string& key) const {
    auto it = headers_.find(Buffer::toLower(key));
    if (it == headers_.end() || it->second.empty()) return "";
    return it->second.front();
  }

  std::vector<std::string> Headers::getAll(const std::string& key) const {
    auto it = headers_.find(Buffer::toLower(key));
    return (it != headers_.end()) ? it->second : std::vector<std::string>();
  }

  bool Headers::has(const std::string& key) const {
    return headers_.find(Buffer::toLower(key)) != headers_.end();
  }

  void Headers::remove(const std::string& key) {
    if (headers_.erase(Buffer::toLower(key)) > 0) {
      dumped_valid_ = false;
    }
  }

  void Headers::clear() {
    headers_.clear();
    dumped_valid_ = false;
  }

  size_t Headers::size() const {
    return headers_.size();
  }

  bool Headers::empty() const {
    return headers_.empty();
  }

  const std::string& Headers::dump() const {
    if (dumped_valid_) return dumped_;

    dumped_.clear();
    for (const auto& header : headers_) {
      for (const std::string& value : header.second) {
        dumped_ += header.first + ":  " + value + "\r\n";
      }
    }

    dumped_valid_ = true;
    return dumped_;
  }

  std::vector<std::string> Headers::keys() const {
    std::vector<std::string> keys;
    for (const auto& header : headers_) {
      keys.push_back(header.first);
    }
    return keys;
  }

  bool Headers::operator==(const Headers& other) const {
    return headers_ == other.headers_;
  }

  bool Headers::operator!=(const Headers& other) const {
    return !(*this == other);
  }

} // namespace relayhttp
