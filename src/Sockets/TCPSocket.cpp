#include "relayhttp/Buffer.hpp"
#include "relayhttp/Sockets/TCPSocket.hpp"
#include "relayhttp/Sockets/SocketWrapper.hpp"
#include "relayhttp/Timestamp.hpp"
#include "relayhttp/Logs.hpp"

#include <string>
#include <cstring>
#include <stdexcept>

#ifdef _WIN32
  #include <winsock2.h>
  #include <ws2tcpip.h>
  typedef SSIZE_T ssize_t;
#else
  #include <sys/socket.h>
  #include <netinet/in.h>
  #include <unistd.h>
  #include <errno.h>
#endif

namespace relayhttp {

  TCPSocket::TCPSocket() {
    #ifdef _WIN32
      auto& manager = WinSockManager::getInstance();
      if (!manager.isInitialized()) {
        relayhttp_error("[TCPSocket] WinSock not initialized");
        throw std::runtime_error("WinSock initialization failed");
      }
    #endif
  }

  TCPSocket::~TCPSocket() {
    this->disconnect();
  }

  relayhttp::HttpResult TCPSocket::connect(const std::string& host, int port) {
    return this->openTCPSocket(host, port);
  }

  void TCPSocket::disconnect() {
    if (this->socket_fd_ != INVALID_SOCKET) {
      relayhttp_log("[TCPSocket] Disconnecting socket");
      closesocket(this->socket_fd_);
      this->socket_fd_ = INVALID_SOCKET;
    }
    this->connected_ = false;
  }

  size_t TCPSocket::send(const unsigned char* buffer, const size_t size) {
    if (!this->connected_ || this->socket_fd_ == INVALID_SOCKET) {
      relayhttp_error("[TCPSocket] Cannot send data: socket not connected");
      this->last_result_ = HttpResult::SOCKET_NOT_CONNECTED;
      return relayhttp::Buffer::error;
    }

    size_t total_sent = 0;
    while (total_sent < size) {
      #ifdef _WIN32
        ssize_t bytes_sent = ::send(this->socket_fd_, (const char *)(buffer + total_sent), static_cast<int>(size - total_sent), 0);
      #else
        ssize_t bytes_sent = ::send(this->socket_fd_, buffer + total_sent, size - total_sent, MSG_NOSIGNAL);
      #endif

      if (bytes_sent == SOCKET_ERROR || bytes_sent < 0) {
        #ifndef _WIN32
          if (errno == EINTR) continue;
        #endif
        relayhttp_error("[TCPSocket] Send failed with error: " << strerror(errno));
        this->disconnect();
        this->last_result_ = HttpResult::SOCKET_SEND_FAILED;
        return relayhttp::Buffer::error;
      }

      total_sent += static_cast<size_t>(bytes_sent);
      relayhttp_log("[TCPSocket] Sent " << bytes_sent << " bytes. (" << total_sent << "/" << size << ")");
    }

    this->last_used_timestamp_ = relayhttp::Timestamp::getCurrentTimestamp();
    return total_sent;
  }

  size_t TCPSocket::receive(unsigned char* buffer, size_t size, const int64_t& timeout) {
    if (!this->connected_ || this->socket_fd_ == INVALID_SOCKET) {
      relayhttp_error("[TCPSocket] Cannot receive data: socket not connected");
      this->last_result_ = HttpResult::SOCKET_NOT_CONNECTED;
      return relayhttp::Buffer::error;
    }

    HttpResult ready = this->waitReadable(timeout);
    if (ready != HttpResult::SUCCESS) {
      this->last_result_ = ready;
      return relayhttp::Buffer::error;
    }

    #ifdef _WIN32
      ssize_t bytes_received = ::recv(this->socket_fd_, (char *)buffer, static_cast<int>(size), 0);
    #else
      ssize_t bytes_received = ::recv(this->socket_fd_, buffer, size, 0);
    #endif

    if (bytes_received == SOCKET_ERROR || bytes_received < 0) {
      #ifndef _WIN32
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return 0;
      #endif
      relayhttp_error("[TCPSocket] Receive failed with error: " << strerror(errno));
      this->disconnect();
      this->last_result_ = HttpResult::SOCKET_RECEIVE_FAILED;
      return relayhttp::Buffer::error;
    }

    if (bytes_received == 0) {
      relayhttp_log("[TCPSocket] Server closed the connection");
      this->disconnect();
      this->last_result_ = HttpResult::CONNECTION_CLOSED;
      return relayhttp::Buffer::error;
    }

    this->last_used_timestamp_ = relayhttp::Timestamp::getCurrentTimestamp();
    return static_cast<size_t>(bytes_received);
  }

  bool TCPSocket::isConnected() {
    if (!this->peerAlive()) {
      this->disconnect();
      return false;
    }
    return true;
  }

} // namespace relayhttp
