#ifndef RELAY_HTTP_RANDOM_HPP
#define RELAY_HTTP_RANDOM_HPP

#include <random>
#include <string>

namespace relayhttp {

  namespace random {

    inline std::string generateRandomString(size_t length = 16, const std::string& alphabet = "0123456789abcdef") {
      std::random_device rd;
      std::mt19937 generator(rd());
      std::uniform_int_distribution<size_t> distribution(0, alphabet.size() - 1);

      std::string out;
      out.reserve(length);
      for (size_t i = 0; i < length; ++i) {
        out += alphabet[distribution(generator)];
      }

      return out;
    }

  } // namespace random

} // namespace relayhttp

#endif // RELAY_HTTP_RANDOM_HPP
