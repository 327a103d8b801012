#include "relayhttp/ConnectionPool.hpp"
#include "relayhttp/Errors.hpp"
#include "relayhttp/Logs.hpp"
#include "relayhttp/Sockets/MbedTLSSocket.hpp"
#include "relayhttp/Sockets/TCPSocket.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace relayhttp {

  ConnectionPool::ConnectionPool(Resolver& resolver, bool persistent)
    : resolver_(resolver), persistent_(persistent) {
    protocols_["http"] = [](const TlsOptions&) {
      return std::make_shared<relayhttp::TCPSocket>();
    };
    protocols_["https"] = [](const TlsOptions& options) {
      return std::make_shared<relayhttp::MbedTLSSocket>(options);
    };
  }

  ConnectionPool::~ConnectionPool() {
    this->closeAll();
  }

  std::string ConnectionPool::buildPoolKey(const Uri& uri) {
    return uri.scheme + "://" + uri.domain() + ":" + std::to_string(uri.effectivePort());
  }

  void ConnectionPool::registerProtocol(const std::string& scheme, SocketCreator creator) {
    relayhttp_log("[ConnectionPool] registerProtocol: " << scheme);
    std::lock_guard<std::mutex> lock(mutex_);
    protocols_[scheme] = std::move(creator);
  }

  // Caller holds mutex_.
  std::shared_ptr<Transport> ConnectionPool::findAvailable(const std::string& key) {
    auto found = pool_.find(key);
    if (found == pool_.end()) return nullptr;

    auto& connections = found->second;
    for (auto it = connections.begin(); it != connections.end();) {
      const std::shared_ptr<Transport>& transport = *it;
      if (transport->used() || transport->reserved()) {
        ++it;
        continue;
      }

      if (transport->isClosing()) {
        relayhttp_log("[ConnectionPool] Evicting closed transport for " << key);
        it = connections.erase(it);
        continue;
      }

      if (transport->reserve()) {
        relayhttp_log("[ConnectionPool] Reusing transport for " << key);
        return transport;
      }
      ++it;
    }

    return nullptr;
  }

  std::shared_ptr<Transport> ConnectionPool::acquire(const Uri& uri, const TlsOptions& options, int64_t deadline) {
    const std::string key = buildPoolKey(uri);
    SocketCreator creator;

    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (persistent_) {
        if (auto transport = this->findAvailable(key)) return transport;
      }

      auto protocol = protocols_.find(uri.scheme);
      if (protocol == protocols_.end()) {
        relayhttp_error("[ConnectionPool] Unsupported protocol: " << uri.scheme);
        throw ConfigurationError(HttpResult::UNSUPPORTED_PROTOCOL, "Unsupported protocol: " + uri.scheme);
      }
      creator = protocol->second;
    }

    // Lookup and connect run unlocked, other destinations are not held up.
    auto destination = resolver_.resolve(uri, deadline);

    TlsOptions connection_options = options;
    connection_options.server_name = uri.domain();
    if (uri.isIpLiteral()) connection_options.server_name = uri.ip;

    auto transport = std::make_shared<Transport>(creator(connection_options));
    transport->makeConnection(destination.first, destination.second, deadline);
    transport->reserve();

    std::lock_guard<std::mutex> lock(mutex_);
    created_.erase(
      std::remove_if(created_.begin(), created_.end(),
        [](const std::weak_ptr<Transport>& weak) { return weak.expired(); }),
      created_.end()
    );
    created_.push_back(transport);

    if (persistent_) {
      pool_[key].push_back(transport);
      relayhttp_log("[ConnectionPool] New transport for " << key << " (" << pool_[key].size() << " pooled)");
    }

    return transport;
  }

  size_t ConnectionPool::getPoolSize(const Uri& uri) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = pool_.find(buildPoolKey(uri));
    return found == pool_.end() ? 0 : found->second.size();
  }

  size_t ConnectionPool::getPoolCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& [key, connections] : pool_) {
      total += connections.size();
    }
    return total;
  }

  void ConnectionPool::closeAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    relayhttp_log("[ConnectionPool] Closing all transports");

    for (auto& weak : created_) {
      if (auto transport = weak.lock()) transport->close();
    }
    created_.clear();
    pool_.clear();
  }

} // namespace relayhttp
