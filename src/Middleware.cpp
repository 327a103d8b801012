#include "relayhttp/Middleware.hpp"
#include "relayhttp/Auth.hpp"
#include "relayhttp/Buffer.hpp"
#include "relayhttp/Client.hpp"
#include "relayhttp/Decompress.hpp"
#include "relayhttp/Errors.hpp"
#include "relayhttp/HeaderValues.hpp"
#include "relayhttp/Logs.hpp"

#include <algorithm>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace relayhttp {

  namespace {

    bool sameOrigin(const Uri& a, const Uri& b) {
      return Buffer::toLower(a.scheme) == Buffer::toLower(b.scheme) &&
             Buffer::toLower(a.domain()) == Buffer::toLower(b.domain()) &&
             a.effectivePort() == b.effectivePort();
    }

  } // namespace

  std::shared_ptr<Middleware> buildMiddlewares(
    const std::vector<MiddlewareFactory>& factories,
    std::shared_ptr<Middleware> terminal
  ) {
    std::shared_ptr<Middleware> current = std::move(terminal);
    for (auto it = factories.rbegin(); it != factories.rend(); ++it) {
      current = (*it)(current);
    }
    return current;
  }

  Response RequestMiddleware::process(Request& request, Client& client) {
    return client.sendRequestDirectly(request);
  }

  RetryMiddleware::RetryMiddleware(std::shared_ptr<Middleware> next, int retry_count)
    : Middleware(std::move(next)), attempts_(std::max(retry_count + 1, 1)) {}

  Response RetryMiddleware::process(Request& request, Client& client) {
    // Inner stages rewrite the request (redirects), every attempt starts over.
    const Request original = request;

    for (int attempt = 1;; ++attempt) {
      try {
        return next_->process(request, client);
      } catch (const UsageError&) {
        throw;
      } catch (const ConfigurationError&) {
        throw;
      } catch (const HttpError& e) {
        if (attempt >= attempts_) {
          relayhttp_error("[RetryMiddleware] Giving up after " << attempt << " attempts: " << e.what());
          throw;
        }
        relayhttp_log("[RetryMiddleware] Attempt " << attempt << "/" << attempts_ << " failed: " << e.what());
        request = original;
      }
    }
  }

  RedirectMiddleware::RedirectMiddleware(std::shared_ptr<Middleware> next, int redirect_count)
    : Middleware(std::move(next)), attempts_(std::max(redirect_count + 1, 1)) {}

  Response RedirectMiddleware::process(Request& request, Client& client) {
    std::vector<std::string> history;
    Response response;

    for (int attempt = 1;; ++attempt) {
      this->applyPermanentRedirects(request, client);
      response = next_->process(request, client);
      if (attempt >= attempts_ || !this->prepareNextHop(request, response, client)) break;
      history.push_back(request.uri().toString());
    }

    response.redirects = std::move(history);
    return response;
  }

  bool RedirectMiddleware::prepareNextHop(Request& request, const Response& response, Client& client) {
    const uint16_t status = response.status;
    if (status != 300 && status != 301 && status != 302 && status != 303 && status != 307 && status != 308) {
      return false;
    }

    const std::string location = response.headers.get("location");
    if (location.empty()) {
      relayhttp_log("[RedirectMiddleware] " << status << " without location, stopping");
      return false;
    }

    Uri next;
    try {
      next = request.uri().resolve(location);
    } catch (const ConfigurationError& e) {
      relayhttp_error("[RedirectMiddleware] Invalid location " << location << ": " << e.what());
      return false;
    }

    relayhttp_log("[RedirectMiddleware] " << status << " " << request.uri().toString() << " -> " << next.toString());

    if (status == 301 || status == 308) {
      client.rememberPermanentRedirect(request.uri().toString(), next.toString());
    }

    if (status == 303) {
      if (request.method() != "HEAD") request.setMethod("GET");
      request.setBody("");
      request.headers().remove("content-type");
      request.headers().remove("content-length");
    }

    moveTo(request, std::move(next));
    return true;
  }

  void RedirectMiddleware::applyPermanentRedirects(Request& request, Client& client) {
    std::set<std::string> visited;
    std::string current = request.uri().toString();

    while (visited.insert(current).second) {
      std::optional<std::string> target = client.permanentRedirect(current);
      if (!target) return;

      Uri next;
      try {
        next = Uri::parse(*target);
      } catch (const ConfigurationError& e) {
        relayhttp_error("[RedirectMiddleware] Remembered target " << *target << " is invalid: " << e.what());
        return;
      }

      relayhttp_log("[RedirectMiddleware] Remembered " << current << " -> " << *target);
      moveTo(request, std::move(next));
      current = request.uri().toString();
    }
  }

  void RedirectMiddleware::moveTo(Request& request, Uri next) {
    if (!sameOrigin(request.uri(), next)) {
      request.headers().remove("authorization");
      request.headers().remove("cookie");
    }
    request.setUri(std::move(next));
  }

  Response CookiesMiddleware::process(Request& request, Client& client) {
    std::string cookie = client.cookies().header(request.uri());
    if (!cookie.empty()) request.headers().set("cookie", cookie);

    Response response = next_->process(request, client);

    for (const std::string& value : response.headers.getAll("set-cookie")) {
      client.cookies().store(value, request.uri());
    }

    return response;
  }

  Response DecodeMiddleware::process(Request& request, Client& client) {
    const Request& view = request;
    if (!view.headers().has("accept-encoding")) {
      request.headers().set("accept-encoding", acceptEncoding());
    }

    Response response = next_->process(request, client);
    if (response.stream) return response;

    for (const char* key : {"transfer-encoding", "content-encoding"}) {
      if (!response.headers.has(key)) continue;

      ContentCodings codings = ContentCodings::parse(response.headers.get(key));
      for (const std::string& coding : codings.codings) {
        relayhttp_log("[DecodeMiddleware] Decoding " << key << ": " << coding);
        response.body = decompressBody(response.body, coding);
      }
    }

    return response;
  }

  Response AuthenticationMiddleware::process(Request& request, Client& client) {
    Response response = next_->process(request, client);
    if (response.status != 401 || !request.credentials()) return response;

    std::vector<std::string> values = response.headers.getAll("www-authenticate");
    if (values.empty()) {
      relayhttp_error("[AuthenticationMiddleware] 401 without www-authenticate");
      throw InvalidResponseData(HttpResult::MISSING_AUTH_CHALLENGE, "401 response without an authentication challenge");
    }

    const Credentials credentials = *request.credentials();
    for (const AuthChallenge& challenge : WwwAuthenticate::parse(values).challenges) {
      std::optional<std::string> authorization = auth::authorizationFor(
        challenge, credentials, request.method(), request.uri().pathAndQuery()
      );
      if (!authorization) continue;

      relayhttp_log("[AuthenticationMiddleware] Answering " << challenge.scheme << " challenge");
      request.headers().set("authorization", *authorization);
      response = next_->process(request, client);
      if (response.status != 401) break;
    }

    return response;
  }

  namespace middlewares {

    MiddlewareFactory retry(int retry_count) {
      return [retry_count](std::shared_ptr<Middleware> next) -> std::shared_ptr<Middleware> {
        return std::make_shared<RetryMiddleware>(std::move(next), retry_count);
      };
    }

    MiddlewareFactory redirect(int redirect_count) {
      return [redirect_count](std::shared_ptr<Middleware> next) -> std::shared_ptr<Middleware> {
        return std::make_shared<RedirectMiddleware>(std::move(next), redirect_count);
      };
    }

    MiddlewareFactory cookies() {
      return [](std::shared_ptr<Middleware> next) -> std::shared_ptr<Middleware> {
        return std::make_shared<CookiesMiddleware>(std::move(next));
      };
    }

    MiddlewareFactory decode() {
      return [](std::shared_ptr<Middleware> next) -> std::shared_ptr<Middleware> {
        return std::make_shared<DecodeMiddleware>(std::move(next));
      };
    }

    MiddlewareFactory authentication() {
      return [](std::shared_ptr<Middleware> next) -> std::shared_ptr<Middleware> {
        return std::make_shared<AuthenticationMiddleware>(std::move(next));
      };
    }

    std::vector<MiddlewareFactory> defaults(int retry_count, int redirect_count) {
      return {retry(retry_count), redirect(redirect_count), cookies(), decode(), authentication()};
    }

  } // namespace middlewares

} // namespace relayhttp
