#include "relayhttp/Resolver.hpp"
#include "relayhttp/Errors.hpp"
#include "relayhttp/Logs.hpp"
#include "relayhttp/Timestamp.hpp"

#include <chrono>
#include <cstring>
#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#ifdef _WIN32
  #include <winsock2.h>
  #include <ws2tcpip.h>
#else
  #include <sys/socket.h>
  #include <netinet/in.h>
  #include <arpa/inet.h>
  #include <netdb.h>
#endif

namespace relayhttp {

  Resolver::Resolver() : lookup_(&Resolver::systemLookup), cache_(std::make_shared<Cache>()) {}

  Resolver::Resolver(LookupFunction lookup)
    : lookup_(lookup ? std::move(lookup) : LookupFunction(&Resolver::systemLookup)),
      cache_(std::make_shared<Cache>()) {}

  std::string Resolver::systemLookup(const std::string& hostname) {
    struct addrinfo hints, *result;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    int status = getaddrinfo(hostname.c_str(), nullptr, &hints, &result);
    if (status != 0 || result == nullptr) {
      relayhttp_error("[Resolver] Failed to resolve hostname: " << hostname);
      throw ConnectionError(HttpResult::HOSTNAME_RESOLUTION_FAILED, "Cannot resolve hostname: " + hostname);
    }

    char addr_str[INET6_ADDRSTRLEN] = {0};
    const void* addr;
    if (result->ai_family == AF_INET) {
      addr = &reinterpret_cast<struct sockaddr_in*>(result->ai_addr)->sin_addr;
    } else {
      addr = &reinterpret_cast<struct sockaddr_in6*>(result->ai_addr)->sin6_addr;
    }
    inet_ntop(result->ai_family, addr, addr_str, INET6_ADDRSTRLEN);
    freeaddrinfo(result);

    return addr_str;
  }

  std::pair<std::string, uint16_t> Resolver::resolve(const Uri& uri, int64_t deadline) {
    uint16_t port = uri.effectivePort();
    if (uri.isIpLiteral()) {
      return {uri.ip, port};
    }
    return {this->lookup(uri.domain(), deadline), port};
  }

  void Resolver::runLookup(
    const std::shared_ptr<Cache>& cache,
    const LookupFunction& lookup,
    const std::string& hostname,
    std::promise<std::string>& promise
  ) {
    relayhttp_log("[Resolver] Resolving " << hostname);
    std::exception_ptr failure;
    try {
      promise.set_value(lookup(hostname));
      return;
    } catch (const HttpError&) {
      failure = std::current_exception();
    } catch (const std::exception& e) {
      failure = std::make_exception_ptr(
        ConnectionError(HttpResult::HOSTNAME_RESOLUTION_FAILED, "Cannot resolve " + hostname + ": " + e.what()));
    }

    // Waiters get the same error; the next caller tries again.
    {
      std::lock_guard<std::mutex> lock(cache->mutex);
      cache->entries.erase(hostname);
    }
    promise.set_exception(failure);
  }

  std::string Resolver::lookup(const std::string& hostname, int64_t deadline) {
    std::promise<std::string> promise;
    std::shared_future<std::string> future;
    bool owner = false;

    {
      std::lock_guard<std::mutex> lock(cache_->mutex);
      auto it = cache_->entries.find(hostname);
      if (it != cache_->entries.end()) {
        future = it->second;
      } else {
        future = promise.get_future().share();
        cache_->entries.emplace(hostname, future);
        owner = true;
      }
    }

    if (owner && deadline <= 0) {
      runLookup(cache_, lookup_, hostname, promise);
    } else if (owner) {
      std::thread([cache = cache_, lookup = lookup_, hostname, promise = std::move(promise)]() mutable {
        runLookup(cache, lookup, hostname, promise);
      }).detach();
    } else {
      relayhttp_log("[Resolver] Waiting on lookup of " << hostname);
    }

    if (deadline > 0) {
      int64_t remaining = deadline - Timestamp::getSteadyTimestamp();
      if (remaining <= 0 || future.wait_for(std::chrono::milliseconds(remaining)) != std::future_status::ready) {
        relayhttp_error("[Resolver] Lookup of " << hostname << " did not finish in time");
        throw TimeoutError(HttpResult::REQUEST_TIMEOUT, "Timed out resolving " + hostname);
      }
    }

    return future.get();
  }

  bool Resolver::cached(const std::string& hostname) const {
    std::lock_guard<std::mutex> lock(cache_->mutex);
    return cache_->entries.find(hostname) != cache_->entries.end();
  }

  void Resolver::clear() {
    std::lock_guard<std::mutex> lock(cache_->mutex);
    cache_->entries.clear();
  }

} // namespace relayhttp
