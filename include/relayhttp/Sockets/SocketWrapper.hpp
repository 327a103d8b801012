#ifndef RELAY_HTTP_SOCKETWRAPPER_HPP
#define RELAY_HTTP_SOCKETWRAPPER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include "relayhttp/Results.hpp"

#define RELAY_HTTP_CONNECT_TIMEOUT 3000

#ifdef _WIN32
  #include <winsock2.h>
  #include <ws2tcpip.h>
  #pragma comment(lib, "ws2_32.lib")
  typedef int socklen_t;
#else
  #include <unistd.h>
  typedef int SOCKET;
  #define INVALID_SOCKET (-1)
  #define SOCKET_ERROR (-1)
  #define closesocket(s) close(s)
#endif

namespace relayhttp {

#ifdef _WIN32
  class WinSockManager {
    public:
      static WinSockManager& getInstance();
      bool isInitialized() const;

    private:
      WinSockManager();
      ~WinSockManager();
      WinSockManager(const WinSockManager&) = delete;
      WinSockManager& operator=(const WinSockManager&) = delete;
      bool initialized_ = false;
  };
#endif

  // Byte-level connection primitive. Failures are reported as HttpResult
  // codes or the Buffer::error size; lastResult() keeps the reason of the
  // latest failure so a receive timeout can be told apart from a closed peer.
  class SocketWrapper {
    public:
      virtual ~SocketWrapper() = default;

      // Conection
      virtual relayhttp::HttpResult connect(const std::string& host, int port) = 0;
      virtual void disconnect() = 0;

      // Sending and receiving data. `timeout` is in milliseconds. A receive
      // may return 0 when no application data was produced yet.
      virtual size_t send(const unsigned char* buffer, const size_t size) = 0;
      virtual size_t receive(unsigned char* buffer, size_t size, const int64_t& timeout) = 0;

      // Utility methods
      virtual bool isConnected() = 0;
      virtual int64_t getTimestamp() const { return last_used_timestamp_; }
      relayhttp::HttpResult lastResult() const { return last_result_; }

      // Budget in ms for the next connect(), handshake included. The TCP
      // connect alone never waits longer than RELAY_HTTP_CONNECT_TIMEOUT.
      void setConnectTimeout(int64_t timeout) { connect_timeout_ = timeout; }

    protected:
      SOCKET socket_fd_ = INVALID_SOCKET;
      int64_t last_used_timestamp_ = 0;
      bool connected_ = false;
      int64_t connect_timeout_ = RELAY_HTTP_CONNECT_TIMEOUT;
      relayhttp::HttpResult last_result_ = relayhttp::HttpResult::SUCCESS;

      relayhttp::HttpResult openTCPSocket(const std::string& host, int port);

      // select() on the descriptor; SUCCESS, RECEIVE_TIMEOUT or SOCKET_RECEIVE_FAILED.
      relayhttp::HttpResult waitReadable(const int64_t& timeout);

      // Non-blocking liveness probe shared by the TCP and TLS sockets.
      bool peerAlive();
  };

} // namespace relayhttp

#endif // RELAY_HTTP_SOCKETWRAPPER_HPP
