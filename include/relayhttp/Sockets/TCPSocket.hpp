#ifndef RELAY_HTTP_TCPSOCKET_HPP
#define RELAY_HTTP_TCPSOCKET_HPP

#include "relayhttp/Sockets/SocketWrapper.hpp"
#include <string>

namespace relayhttp {

  // Plain socket behind "http". Owns the descriptor; a send or receive
  // failure closes it so the pool drops the connection on its next check.
  class TCPSocket final : public relayhttp::SocketWrapper {
    public:
      TCPSocket();
      ~TCPSocket() override;

      TCPSocket(const TCPSocket&) = delete;
      TCPSocket& operator=(const TCPSocket&) = delete;

      relayhttp::HttpResult connect(const std::string& host, int port) override;
      void disconnect() override;

      size_t send(const unsigned char* buffer, const size_t size) override;

      // Waits up to `timeout` ms for the first byte. RECEIVE_TIMEOUT and
      // CONNECTION_CLOSED end up in lastResult().
      size_t receive(unsigned char* buffer, size_t size, const int64_t& timeout) override;

      bool isConnected() override;
  };

} // namespace relayhttp

#endif // RELAY_HTTP_TCPSOCKET_HPP
