#include "relayhttp/Buffer.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstring>
#include <string>

namespace relayhttp {

  namespace Buffer {

    size_t find(const unsigned char* buffer, const size_t& size, const unsigned char* to_find, const size_t& to_find_size) {
      if (buffer == nullptr || size == 0 || to_find == nullptr || to_find_size == 0) {
        return relayhttp::Buffer::error; // No data to search
      }

      if (size < to_find_size) {
        return relayhttp::Buffer::error; // Not enough data to find the pattern
      }

      for (size_t i = 0; i <= size - to_find_size; ++i) {
        if (buffer[i] == to_find[0] && std::memcmp(buffer + i, to_find, to_find_size) == 0) {
          return i;
        }
      }

      return relayhttp::Buffer::error; // Not found
    }

    bool equal(const unsigned char* buffer, const unsigned char* to_find, const size_t& size) {
      if (buffer == nullptr || to_find == nullptr || size == 0) {
        return false; // Invalid input
      }
      return std::memcmp(buffer, to_find, size) == 0;
    }

    bool iequals(const std::string& a, const std::string& b) {
      if (a.size() != b.size()) return false;
      for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
          return false;
        }
      }
      return true;
    }

    std::string toLower(std::string value) {
      std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      return value;
    }

    std::string trim(const std::string& value) {
      const char* whitespace = " \t\r\n";
      size_t start = value.find_first_not_of(whitespace);
      if (start == std::string::npos) return "";
      size_t end = value.find_last_not_of(whitespace);
      return value.substr(start, end - start + 1);
    }

  } // namespace Buffer

} // namespace relayhttp
