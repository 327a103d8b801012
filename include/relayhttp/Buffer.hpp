#ifndef RELAY_HTTP_BUFFER_HPP
#define RELAY_HTTP_BUFFER_HPP

#include <cstddef>
#include <string>

namespace relayhttp {

  namespace Buffer {

    const size_t error = static_cast<size_t>(-1);

    size_t find(const unsigned char* buffer, const size_t& size, const unsigned char* to_find, const size_t& to_find_size);

    bool equal(const unsigned char* buffer, const unsigned char* to_find, const size_t& size);

    // Case-insensitive comparison for ASCII header tokens.
    bool iequals(const std::string& a, const std::string& b);

    std::string toLower(std::string value);
    std::string trim(const std::string& value);

  } // namespace Buffer

} // namespace relayhttp

#endif // RELAY_HTTP_BUFFER_HPP
