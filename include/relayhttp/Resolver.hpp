#ifndef RELAY_HTTP_RESOLVER_HPP
#define RELAY_HTTP_RESOLVER_HPP

#include "relayhttp/Uri.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace relayhttp {

  // Hostname to address cache owned by a Client. The first lookup of a
  // hostname installs a shared future before resolving, later callers for
  // the same hostname wait on it instead of issuing their own lookup.
  class Resolver {
    public:
      // Returns one address literal, throws ConnectionError on failure.
      using LookupFunction = std::function<std::string(const std::string& hostname)>;

      Resolver();
      explicit Resolver(LookupFunction lookup);

      // (ip, port) for the URI. IP literals are returned as-is.
      // `deadline` is a steady timestamp in ms, 0 waits as long as the lookup
      // takes. Past the deadline a TimeoutError is thrown while the lookup
      // itself keeps running and still fills the cache.
      std::pair<std::string, uint16_t> resolve(const Uri& uri, int64_t deadline = 0);

      std::string lookup(const std::string& hostname, int64_t deadline = 0);

      bool cached(const std::string& hostname) const;
      void clear();

      static std::string systemLookup(const std::string& hostname);

    private:
      // Shared with lookups still running in the background.
      struct Cache {
        std::mutex mutex;
        std::map<std::string, std::shared_future<std::string>> entries;
      };

      static void runLookup(
        const std::shared_ptr<Cache>& cache,
        const LookupFunction& lookup,
        const std::string& hostname,
        std::promise<std::string>& promise
      );

      LookupFunction lookup_;
      std::shared_ptr<Cache> cache_;
  };

} // namespace relayhttp

#endif // RELAY_HTTP_RESOLVER_HPP
