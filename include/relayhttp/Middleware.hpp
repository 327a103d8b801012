#ifndef RELAY_HTTP_MIDDLEWARE_HPP
#define RELAY_HTTP_MIDDLEWARE_HPP

#include "relayhttp/Request.hpp"
#include "relayhttp/Response.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace relayhttp {

  class Client;

  // One stage of the request pipeline. Each stage owns the next one and
  // decides when and how often to call it.
  class Middleware {
    public:
      explicit Middleware(std::shared_ptr<Middleware> next) : next_(std::move(next)) {}
      virtual ~Middleware() = default;

      virtual Response process(Request& request, Client& client) = 0;

    protected:
      std::shared_ptr<Middleware> next_;
  };

  using MiddlewareFactory = std::function<std::shared_ptr<Middleware>(std::shared_ptr<Middleware> next)>;

  // Wraps `terminal` with the factories, the first factory being outermost.
  std::shared_ptr<Middleware> buildMiddlewares(
    const std::vector<MiddlewareFactory>& factories,
    std::shared_ptr<Middleware> terminal
  );

  // Terminal stage: hands the request to Client::sendRequestDirectly.
  class RequestMiddleware : public Middleware {
    public:
      RequestMiddleware() : Middleware(nullptr) {}
      Response process(Request& request, Client& client) override;
  };

  class RetryMiddleware : public Middleware {
    public:
      RetryMiddleware(std::shared_ptr<Middleware> next, int retry_count);
      Response process(Request& request, Client& client) override;

    private:
      int attempts_;
  };

  class RedirectMiddleware : public Middleware {
    public:
      RedirectMiddleware(std::shared_ptr<Middleware> next, int redirect_count);
      Response process(Request& request, Client& client) override;

    private:
      // Rewrites `request` for the next hop, false when the response ends
      // the redirect sequence.
      bool prepareNextHop(Request& request, const Response& response, Client& client);

      // Jumps straight to the target of a remembered 301/308.
      void applyPermanentRedirects(Request& request, Client& client);

      static void moveTo(Request& request, Uri next);

      int attempts_;
  };

  class CookiesMiddleware : public Middleware {
    public:
      using Middleware::Middleware;
      Response process(Request& request, Client& client) override;
  };

  class DecodeMiddleware : public Middleware {
    public:
      using Middleware::Middleware;
      Response process(Request& request, Client& client) override;
  };

  class AuthenticationMiddleware : public Middleware {
    public:
      using Middleware::Middleware;
      Response process(Request& request, Client& client) override;
  };

  namespace middlewares {

    MiddlewareFactory retry(int retry_count);
    MiddlewareFactory redirect(int redirect_count);
    MiddlewareFactory cookies();
    MiddlewareFactory decode();
    MiddlewareFactory authentication();

    // Retry, Redirect, Cookies, Decode, Authentication.
    std::vector<MiddlewareFactory> defaults(int retry_count, int redirect_count);

  } // namespace middlewares

} // namespace relayhttp

#endif // RELAY_HTTP_MIDDLEWARE_HPP
