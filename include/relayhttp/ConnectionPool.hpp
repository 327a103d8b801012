#ifndef RELAY_HTTP_CONNECTION_POOL_HPP
#define RELAY_HTTP_CONNECTION_POOL_HPP

#include "relayhttp/Resolver.hpp"
#include "relayhttp/Sockets/SocketWrapper.hpp"
#include "relayhttp/TlsOptions.hpp"
#include "relayhttp/Transport.hpp"
#include "relayhttp/Uri.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace relayhttp {

  using SocketCreator = std::function<std::shared_ptr<SocketWrapper>(const TlsOptions& options)>;

  class ConnectionPool {
    public:
      // `http` and `https` are registered by default.
      ConnectionPool(Resolver& resolver, bool persistent);
      ~ConnectionPool();

      ConnectionPool(const ConnectionPool&) = delete;
      ConnectionPool& operator=(const ConnectionPool&) = delete;

      // Reuses an idle live transport for the destination when persistence is
      // on, otherwise resolves and connects a new one. The returned transport
      // is reserved for the caller. Throws ConnectionError and
      // ConfigurationError (unknown scheme). A non-zero `deadline` (steady
      // ms) bounds lookup and connect with a TimeoutError.
      std::shared_ptr<Transport> acquire(const Uri& uri, const TlsOptions& options, int64_t deadline = 0);

      void registerProtocol(const std::string& scheme, SocketCreator creator);

      bool persistent() const { return persistent_; }
      size_t getPoolSize(const Uri& uri) const;
      size_t getPoolCount() const;
      void closeAll();

      static std::string buildPoolKey(const Uri& uri);

    private:
      std::shared_ptr<Transport> findAvailable(const std::string& key);

      Resolver& resolver_;
      bool persistent_;

      mutable std::mutex mutex_;
      std::map<std::string, std::vector<std::shared_ptr<Transport>>> pool_;
      std::map<std::string, SocketCreator> protocols_;
      std::vector<std::weak_ptr<Transport>> created_;
  };

} // namespace relayhttp

#endif // RELAY_HTTP_CONNECTION_POOL_HPP
