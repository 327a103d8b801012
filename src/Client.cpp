#include "relayhttp/Client.hpp"
#include "relayhttp/Buffer.hpp"
#include "relayhttp/Errors.hpp"
#include "relayhttp/Logs.hpp"
#include "relayhttp/Timestamp.hpp"
#include "relayhttp/Transport.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace relayhttp {

  Client::Client() : Client(ClientOptions{}) {}

  Client::Client(ClientOptions options) : options_(std::move(options)) {
    resolver_ = options_.lookup ? std::make_unique<Resolver>(options_.lookup) : std::make_unique<Resolver>();
    pool_ = std::make_unique<ConnectionPool>(*resolver_, options_.persistent_connections);

    std::vector<MiddlewareFactory> factories = options_.middlewares;
    if (factories.empty() && options_.use_default_middlewares) {
      factories = middlewares::defaults(options_.retry_count, options_.redirect_count);
    }
    middleware_ = buildMiddlewares(factories, std::make_shared<RequestMiddleware>());

    relayhttp_log("[Client] Created (persistent connections: " << (options_.persistent_connections ? "on" : "off") << ")");
  }

  Client::~Client() {
    this->close();
  }

  Response Client::get(const std::string& url, const RequestOptions& options) {
    return this->request("GET", url, options);
  }

  Response Client::post(const std::string& url, const RequestOptions& options) {
    return this->request("POST", url, options);
  }

  Response Client::put(const std::string& url, const RequestOptions& options) {
    return this->request("PUT", url, options);
  }

  Response Client::patch(const std::string& url, const RequestOptions& options) {
    return this->request("PATCH", url, options);
  }

  Response Client::del(const std::string& url, const RequestOptions& options) {
    return this->request("DELETE", url, options);
  }

  Response Client::options(const std::string& url, const RequestOptions& options) {
    return this->request("OPTIONS", url, options);
  }

  Response Client::head(const std::string& url, const RequestOptions& options) {
    return this->request("HEAD", url, options);
  }

  Response Client::request(const std::string& method, const std::string& url, const RequestOptions& options) {
    Request request = this->buildRequest(method, url, options);
    return this->sendRequest(request);
  }

  Request Client::buildRequest(const std::string& method, const std::string& url, const RequestOptions& options) const {
    int bodies = (options.content ? 1 : 0) + (options.json ? 1 : 0) + (options.urlencoded ? 1 : 0);
    if (bodies > 1) {
      throw ConfigurationError(HttpResult::CONFLICTING_BODY_OPTIONS, "Only one of content, json and urlencoded can be set");
    }

    Uri uri = Uri::parse(url);
    if (!options.params.empty()) {
      if (!uri.query.empty()) {
        throw ConfigurationError(HttpResult::CONFLICTING_QUERY_OPTIONS, "Query given both in the URL and as parameters");
      }
      uri.query = options.params;
    }

    Headers defaults;
    defaults.set("accept", "*/*");
    defaults.set("user-agent", RELAY_HTTP_USER_AGENT);
    defaults.set("connection", options_.persistent_connections ? "keep-alive" : "close");

    Request request(method, std::move(uri));
    request.setHeaders(Headers::merge(Headers::merge(defaults, options_.headers), options.headers));

    if (options.content) {
      request.setBody(*options.content);
    } else if (options.json) {
      request.setBody(boost::json::serialize(*options.json));
      request.headers().set("content-type", "application/json");
    } else if (options.urlencoded) {
      request.setBody(utils::encodeQuery(*options.urlencoded));
      request.headers().set("content-type", "application/x-www-form-urlencoded");
    }

    request.setTimeout(options.timeout > 0 ? options.timeout : options_.timeout);

    if (options.credentials) {
      request.setCredentials(options.credentials);
    } else if (!request.uri().userinfo.empty()) {
      const std::string& userinfo = request.uri().userinfo;
      size_t colon = userinfo.find(':');
      Credentials credentials;
      credentials.username = utils::urlDecode(userinfo.substr(0, colon));
      if (colon != std::string::npos) credentials.password = utils::urlDecode(userinfo.substr(colon + 1));
      request.setCredentials(credentials);
    } else {
      request.setCredentials(options_.credentials);
    }

    TlsOptions tls;
    tls.check_hostname = options.check_hostname;
    tls.verify_mode = options.verify_mode;
    tls.keylog_filename = options.keylog_filename;
    if (tls.keylog_filename.empty()) {
      const char* keylog = std::getenv("SSLKEYLOGFILE");
      if (keylog != nullptr) tls.keylog_filename = keylog;
    }
    request.setTls(tls);
    request.setStream(options.stream);

    return request;
  }

  // Remembered 301/308 targets are applied by the redirect stage.
  Response Client::sendRequest(Request& request) {
    return middleware_->process(request, *this);
  }

  Response Client::sendRequestDirectly(Request& request) {
    const std::string& raw = request.serialize();
    const int64_t timeout = request.timeout() > 0 ? request.timeout() : options_.timeout;
    const bool expect_body = request.method() != "HEAD";

    relayhttp_log("[Client] " << request.method() << " " << request.uri().toString());
    // Lookup, connect and handshake share the request budget.
    const int64_t deadline = Timestamp::getSteadyTimestamp() + timeout;
    std::shared_ptr<Transport> transport = pool_->acquire(request.uri(), request.tls(), deadline);
    const int64_t remaining = std::max<int64_t>(deadline - Timestamp::getSteadyTimestamp(), 1);

    Response response;
    if (request.stream()) {
      StreamedResponse streamed = transport->sendHttpStreamRequest(raw, remaining, expect_body);
      response = Response::parse(streamed.head);
      response.stream = std::move(streamed.body);
    } else {
      RawResponse received = transport->sendHttpRequest(raw, remaining, expect_body);
      response = Response::parse(received.head, std::move(received.body));
      if (Buffer::iequals(response.headers.get("connection"), "close")) {
        transport->close();
      }
    }

    response.request = std::make_shared<const Request>(request);
    relayhttp_log("[Client] " << response.status << " " << response.statusText);
    return response;
  }

  void Client::close() {
    if (pool_) pool_->closeAll();
  }

  std::optional<std::string> Client::permanentRedirect(const std::string& url) const {
    std::lock_guard<std::mutex> lock(redirects_mutex_);
    auto found = permanent_redirects_.find(url);
    if (found == permanent_redirects_.end()) return std::nullopt;
    return found->second;
  }

  void Client::rememberPermanentRedirect(const std::string& from, const std::string& to) {
    std::lock_guard<std::mutex> lock(redirects_mutex_);
    permanent_redirects_[from] = to;
  }

} // namespace relayhttp
