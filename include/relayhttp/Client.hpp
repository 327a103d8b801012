#ifndef RELAY_HTTP_CLIENT_HPP
#define RELAY_HTTP_CLIENT_HPP

#include "relayhttp/Auth.hpp"
#include "relayhttp/ConnectionPool.hpp"
#include "relayhttp/Cookies.hpp"
#include "relayhttp/Headers.hpp"
#include "relayhttp/Middleware.hpp"
#include "relayhttp/Request.hpp"
#include "relayhttp/Resolver.hpp"
#include "relayhttp/Response.hpp"

#include <boost/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#define RELAY_HTTP_DEFAULT_TIMEOUT 30000
#define RELAY_HTTP_DEFAULT_RETRY_COUNT 3
#define RELAY_HTTP_DEFAULT_REDIRECT_COUNT 3
#define RELAY_HTTP_USER_AGENT "relayhttp/1.0"

namespace relayhttp {

  struct ClientOptions {
    Headers headers;
    bool persistent_connections = false;
    int retry_count = RELAY_HTTP_DEFAULT_RETRY_COUNT;
    int redirect_count = RELAY_HTTP_DEFAULT_REDIRECT_COUNT;
    int64_t timeout = RELAY_HTTP_DEFAULT_TIMEOUT; // ms
    std::optional<Credentials> credentials;

    // Outermost first. Empty selects middlewares::defaults().
    std::vector<MiddlewareFactory> middlewares;
    bool use_default_middlewares = true;

    // Replaces the getaddrinfo lookup.
    Resolver::LookupFunction lookup;
  };

  struct RequestOptions {
    // At most one of content, json and urlencoded.
    std::optional<std::string> content;
    std::optional<boost::json::value> json;
    std::optional<Query> urlencoded;

    Headers headers;
    Query params;
    std::optional<Credentials> credentials;
    int64_t timeout = 0; // ms, 0 uses the client default

    bool check_hostname = true;
    bool verify_mode = true;
    std::string keylog_filename; // falls back to SSLKEYLOGFILE

    bool stream = false;
  };

  class Client {
    public:
      Client();
      explicit Client(ClientOptions options);
      ~Client();

      Client(const Client&) = delete;
      Client& operator=(const Client&) = delete;

      Response get(const std::string& url, const RequestOptions& options = {});
      Response post(const std::string& url, const RequestOptions& options = {});
      Response put(const std::string& url, const RequestOptions& options = {});
      Response patch(const std::string& url, const RequestOptions& options = {});
      Response del(const std::string& url, const RequestOptions& options = {});
      Response options(const std::string& url, const RequestOptions& options = {});
      Response head(const std::string& url, const RequestOptions& options = {});

      Response request(const std::string& method, const std::string& url, const RequestOptions& options = {});

      // Throws ConfigurationError.
      Request buildRequest(const std::string& method, const std::string& url, const RequestOptions& options) const;

      // Runs the request through the middleware chain.
      Response sendRequest(Request& request);

      // Sends on a pooled transport without any middleware.
      Response sendRequestDirectly(Request& request);

      void close();

      ConnectionPool& pool() { return *pool_; }
      Resolver& resolver() { return *resolver_; }
      CookieJar& cookies() { return cookies_; }
      const ClientOptions& settings() const { return options_; }

      // Permanent redirects seen so far, old URL to new URL.
      std::optional<std::string> permanentRedirect(const std::string& url) const;
      void rememberPermanentRedirect(const std::string& from, const std::string& to);

    private:
      ClientOptions options_;
      std::unique_ptr<Resolver> resolver_;
      std::unique_ptr<ConnectionPool> pool_;
      std::shared_ptr<Middleware> middleware_;
      CookieJar cookies_;

      mutable std::mutex redirects_mutex_;
      std::map<std::string, std::string> permanent_redirects_;
  };

} // namespace relayhttp

#endif // RELAY_HTTP_CLIENT_HPP
