#ifndef RELAY_HTTP_TESTS_FAKE_SOCKET_HPP
#define RELAY_HTTP_TESTS_FAKE_SOCKET_HPP

#include "relayhttp/Buffer.hpp"
#include "relayhttp/ConnectionPool.hpp"
#include "relayhttp/Sockets/SocketWrapper.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace relayhttp {
namespace fake {

  // In-memory peer shared by every FakeSocket it hands out. Each request
  // written to a socket pops the next scripted response, which is then
  // delivered `piece` bytes per receive call.
  class FakeServer {
    public:
      enum class WhenDrained {
        CLOSE,    // peer closes once the scripted bytes are consumed
        TIMEOUT,  // peer stays silent
        IDLE      // connection stays open, for keep-alive reuse
      };

      void push(const std::string& response) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back(response);
      }

      // Replaces the queue: the response is computed from the raw request.
      void respondWith(std::function<std::string(const std::string&)> handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
      }

      std::string next(const std::string& request) {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (handler_) return handler_(request);
        if (responses_.empty()) return "";
        std::string response = responses_.front();
        responses_.pop_front();
        return response;
      }

      bool acceptConnection() {
        std::lock_guard<std::mutex> lock(mutex_);
        connects_++;
        if (refuse_ > 0) {
          refuse_--;
          return false;
        }
        return true;
      }

      void refuseConnections(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        refuse_ = count;
      }

      std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
      }

      int connects() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connects_;
      }

      void recordConnectBudget(int64_t budget) {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_budget_ = budget;
      }

      int64_t lastConnectBudget() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connect_budget_;
      }

      // Time the handshake takes once the peer accepted, in ms.
      int64_t handshake_delay = 0;

      size_t piece = 7;
      WhenDrained when_drained = WhenDrained::IDLE;

    private:
      mutable std::mutex mutex_;
      std::deque<std::string> responses_;
      std::function<std::string(const std::string&)> handler_;
      std::vector<std::string> requests_;
      int connects_ = 0;
      int refuse_ = 0;
      int64_t connect_budget_ = 0;
  };

  class FakeSocket : public SocketWrapper {
    public:
      explicit FakeSocket(std::shared_ptr<FakeServer> server) : server_(std::move(server)) {}

      HttpResult connect(const std::string& host, int port) override {
        host_ = host;
        port_ = port;
        server_->recordConnectBudget(connect_timeout_);
        if (!server_->acceptConnection()) {
          last_result_ = HttpResult::OPEN_TCP_SOCKET_FAILED;
          return last_result_;
        }

        // A handshake that outlasts the budget gives up at the budget.
        if (server_->handshake_delay > 0) {
          int64_t wait = std::min(server_->handshake_delay, connect_timeout_);
          std::this_thread::sleep_for(std::chrono::milliseconds(wait));
          if (server_->handshake_delay > connect_timeout_) {
            last_result_ = HttpResult::TLS_HANDSHAKE_TIMEOUT;
            return last_result_;
          }
        }
        connected_ = true;
        return HttpResult::SUCCESS;
      }

      void disconnect() override {
        connected_ = false;
      }

      size_t send(const unsigned char* buffer, const size_t size) override {
        if (!connected_) {
          last_result_ = HttpResult::SOCKET_NOT_CONNECTED;
          return Buffer::error;
        }
        pending_ += server_->next(std::string(reinterpret_cast<const char*>(buffer), size));
        return size;
      }

      size_t receive(unsigned char* buffer, size_t size, const int64_t& /* timeout */) override {
        if (!connected_) {
          last_result_ = HttpResult::SOCKET_NOT_CONNECTED;
          return Buffer::error;
        }

        if (pending_.empty()) {
          if (server_->when_drained == FakeServer::WhenDrained::TIMEOUT) {
            last_result_ = HttpResult::RECEIVE_TIMEOUT;
          } else {
            last_result_ = HttpResult::CONNECTION_CLOSED;
            connected_ = false;
          }
          return Buffer::error;
        }

        size_t count = std::min({size, server_->piece, pending_.size()});
        std::memcpy(buffer, pending_.data(), count);
        pending_.erase(0, count);

        if (pending_.empty() && server_->when_drained == FakeServer::WhenDrained::CLOSE) {
          closing_ = true;
        }
        return count;
      }

      bool isConnected() override {
        return connected_ && !closing_;
      }

      const std::string& host() const { return host_; }
      int port() const { return port_; }

    private:
      std::shared_ptr<FakeServer> server_;
      std::string pending_;
      std::string host_;
      int port_ = 0;
      bool closing_ = false;
  };

  inline SocketCreator fakeSockets(std::shared_ptr<FakeServer> server) {
    return [server](const TlsOptions&) -> std::shared_ptr<SocketWrapper> {
      return std::make_shared<FakeSocket>(server);
    };
  }

  inline std::string chunked(const std::vector<std::string>& chunks) {
    static const char* const hex = "0123456789abcdef";
    std::string out;
    for (const std::string& chunk : chunks) {
      std::string size;
      size_t n = chunk.size();
      do {
        size.insert(size.begin(), hex[n % 16]);
        n /= 16;
      } while (n > 0);
      out += size + "\r\n" + chunk + "\r\n";
    }
    return out + "0\r\n\r\n";
  }

  inline std::string okResponse(const std::string& body, const std::string& extra_headers = "") {
    return "HTTP/1.1 200 OK\r\ncontent-length: " + std::to_string(body.size()) + "\r\n" + extra_headers + "\r\n" + body;
  }

} // namespace fake
} // namespace relayhttp

#endif // RELAY_HTTP_TESTS_FAKE_SOCKET_HPP
