#include "relayhttp/Sockets/SocketWrapper.hpp"
#include "relayhttp/Logs.hpp"
#include "relayhttp/Timestamp.hpp"

#include <algorithm>
#include <string>
#include <cstring>
#include <vector>

#ifdef _WIN32
  #include <winsock2.h>
  #include <ws2tcpip.h>
  #pragma comment(lib, "ws2_32.lib")
#else
  #include <sys/socket.h>
  #include <sys/select.h>
  #include <netinet/in.h>
  #include <arpa/inet.h>
  #include <netdb.h>
  #include <unistd.h>
  #include <fcntl.h>
  #include <errno.h>
#endif

namespace relayhttp {

  #ifdef _WIN32
    WinSockManager& WinSockManager::getInstance() {
      static WinSockManager instance;
      return instance;
    }

    bool WinSockManager::isInitialized() const {
      return initialized_;
    }

    WinSockManager::WinSockManager() {
      WSADATA wsaData;
      if (WSAStartup(MAKEWORD(2, 2), &wsaData) == 0) {
        initialized_ = true;
        relayhttp_log("[WinSockManager] WinSock initialized");
      } else {
        relayhttp_error("[WinSockManager] Failed to initialize WinSock");
      }
    }

    WinSockManager::~WinSockManager() {
      if (initialized_) WSACleanup();
    }
  #endif // _WIN32

  namespace {

    void setBlocking(SOCKET sock, bool blocking) {
      #ifdef _WIN32
        unsigned long mode = blocking ? 0 : 1;
        ioctlsocket(sock, FIONBIO, &mode);
      #else
        int flags = fcntl(sock, F_GETFL, 0);
        fcntl(sock, F_SETFL, blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK));
      #endif
    }

  } // namespace

  // `host` is normally an address literal handed over by the Resolver, names
  // still work. Every address returned is tried in batches of parallel
  // non-blocking connects, IPv4 and IPv6 interleaved.
  relayhttp::HttpResult SocketWrapper::openTCPSocket(const std::string& host, int port) {
    relayhttp_log("[SocketWrapper] Attempting to connect to " << host << ":" << port);

    if (connected_ || socket_fd_ != INVALID_SOCKET) {
      relayhttp_log("[SocketWrapper] Socket already connected, disconnecting first");
      disconnect();
    }

    struct addrinfo hints, *result;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string port_str = std::to_string(port);
    int status = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
    if (status != 0) {
      relayhttp_error("[SocketWrapper] Failed to resolve hostname: " << host);
      last_result_ = HttpResult::HOSTNAME_RESOLUTION_FAILED;
      return last_result_;
    }

    std::vector<struct addrinfo*> ipv4_addresses;
    std::vector<struct addrinfo*> ipv6_addresses;
    for (struct addrinfo* addr_ptr = result; addr_ptr != nullptr; addr_ptr = addr_ptr->ai_next) {
      if (addr_ptr->ai_family == AF_INET) {
        ipv4_addresses.push_back(addr_ptr);
      } else if (addr_ptr->ai_family == AF_INET6) {
        ipv6_addresses.push_back(addr_ptr);
      }
    }

    size_t ipv4_tried = 0;
    size_t ipv6_tried = 0;
    bool timed_out = false;

    const int64_t budget = std::min<int64_t>(connect_timeout_, RELAY_HTTP_CONNECT_TIMEOUT);
    const int64_t deadline = relayhttp::Timestamp::getSteadyTimestamp() + budget;

    while (!timed_out && (ipv4_tried < ipv4_addresses.size() || ipv6_tried < ipv6_addresses.size())) {
      std::vector<SOCKET> sockets;
      std::vector<struct addrinfo*> addresses;

      for (int i = 0; i < 2 && ipv4_tried < ipv4_addresses.size(); ++i, ++ipv4_tried) {
        addresses.push_back(ipv4_addresses[ipv4_tried]);
      }
      while (addresses.size() < 3 && ipv6_tried < ipv6_addresses.size()) {
        addresses.push_back(ipv6_addresses[ipv6_tried++]);
      }

      std::vector<struct addrinfo*> pending;
      for (auto addr_ptr : addresses) {
        SOCKET sock = socket(addr_ptr->ai_family, addr_ptr->ai_socktype, addr_ptr->ai_protocol);
        if (sock == INVALID_SOCKET) {
          relayhttp_error("[SocketWrapper] Failed to create socket");
          continue;
        }

        setBlocking(sock, false);

        int connect_result = ::connect(sock, addr_ptr->ai_addr, addr_ptr->ai_addrlen);
        if (connect_result == SOCKET_ERROR) {
          #ifdef _WIN32
            bool in_progress = WSAGetLastError() == WSAEWOULDBLOCK;
          #else
            bool in_progress = errno == EINPROGRESS;
          #endif
          if (!in_progress) {
            relayhttp_error("[SocketWrapper] Connect failed: " << strerror(errno));
            closesocket(sock);
            continue;
          }
        }

        sockets.push_back(sock);
        pending.push_back(addr_ptr);
      }

      if (sockets.empty()) continue;

      while (!sockets.empty()) {
        int64_t remaining = deadline - relayhttp::Timestamp::getSteadyTimestamp();
        if (remaining <= 0) {
          relayhttp_log("[SocketWrapper] Connection timeout");
          timed_out = true;
          break;
        }

        struct timeval timeout;
        timeout.tv_sec = static_cast<long>(remaining / 1000);
        timeout.tv_usec = static_cast<long>((remaining % 1000) * 1000);

        fd_set write_fds, error_fds;
        FD_ZERO(&write_fds);
        FD_ZERO(&error_fds);

        SOCKET max_fd = 0;
        for (SOCKET sock : sockets) {
          FD_SET(sock, &write_fds);
          FD_SET(sock, &error_fds);
          if (sock > max_fd) max_fd = sock;
        }

        int select_result = select(static_cast<int>(max_fd) + 1, nullptr, &write_fds, &error_fds, &timeout);
        if (select_result == SOCKET_ERROR) {
          relayhttp_error("[SocketWrapper] Select failed during connection");
          break;
        }
        if (select_result == 0) {
          relayhttp_log("[SocketWrapper] Connection timeout");
          timed_out = true;
          break;
        }

        for (size_t i = 0; i < sockets.size(); ++i) {
          SOCKET sock = sockets[i];
          if (!FD_ISSET(sock, &write_fds) && !FD_ISSET(sock, &error_fds)) continue;

          int error = 0;
          socklen_t error_len = sizeof(error);
          bool ok = getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&error), &error_len) == 0 && error == 0;

          if (!ok) {
            relayhttp_error("[SocketWrapper] Socket connection failed with error: " << error);
            closesocket(sock);
            sockets.erase(sockets.begin() + i);
            pending.erase(pending.begin() + i);
            --i;
            continue;
          }

          setBlocking(sock, true);
          for (size_t j = 0; j < sockets.size(); ++j) {
            if (j != i) closesocket(sockets[j]);
          }

          this->socket_fd_ = sock;
          this->connected_ = true;
          this->last_used_timestamp_ = relayhttp::Timestamp::getCurrentTimestamp();
          this->last_result_ = HttpResult::SUCCESS;

          relayhttp_log("[SocketWrapper] Connected to " << host << ":" << port);
          freeaddrinfo(result);
          return HttpResult::SUCCESS;
        }
      }

      for (SOCKET sock : sockets) {
        closesocket(sock);
      }
    }

    relayhttp_error("[SocketWrapper] Failed to connect to " << host << ":" << port);
    freeaddrinfo(result);
    last_result_ = timed_out ? HttpResult::CONNECT_TIMEOUT : HttpResult::OPEN_TCP_SOCKET_FAILED;
    return last_result_;
  }

  relayhttp::HttpResult SocketWrapper::waitReadable(const int64_t& timeout) {
    if (socket_fd_ == INVALID_SOCKET) return HttpResult::SOCKET_NOT_CONNECTED;

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(socket_fd_, &read_fds);

    int64_t wait = timeout < 0 ? 0 : timeout;
    struct timeval timeout_;
    timeout_.tv_sec = static_cast<long>(wait / 1000);
    timeout_.tv_usec = static_cast<long>((wait % 1000) * 1000);

    int select_result = select(static_cast<int>(socket_fd_) + 1, &read_fds, nullptr, nullptr, &timeout_);
    if (select_result == SOCKET_ERROR) {
      relayhttp_error("[SocketWrapper] Select failed: " << strerror(errno));
      return HttpResult::SOCKET_RECEIVE_FAILED;
    }

    if (select_result == 0 || !FD_ISSET(socket_fd_, &read_fds)) {
      relayhttp_log("[SocketWrapper] No data within " << timeout << " ms");
      return HttpResult::RECEIVE_TIMEOUT;
    }

    return HttpResult::SUCCESS;
  }

  bool SocketWrapper::peerAlive() {
    if (!connected_ || socket_fd_ == INVALID_SOCKET) return false;

    fd_set read_fds, error_fds;
    FD_ZERO(&read_fds);
    FD_ZERO(&error_fds);
    FD_SET(socket_fd_, &read_fds);
    FD_SET(socket_fd_, &error_fds);

    struct timeval timeout;
    timeout.tv_sec = 0;
    timeout.tv_usec = 0;

    int result = select(static_cast<int>(socket_fd_) + 1, &read_fds, nullptr, &error_fds, &timeout);
    if (result < 0 || FD_ISSET(socket_fd_, &error_fds)) {
      relayhttp_error("[SocketWrapper] Socket error detected in liveness check");
      return false;
    }

    if (FD_ISSET(socket_fd_, &read_fds)) {
      // Readable while idle: either the peer closed or sent unsolicited data.
      char test_buffer[1];
      #ifdef _WIN32
        int peek_result = ::recv(socket_fd_, test_buffer, 1, MSG_PEEK);
      #else
        int peek_result = static_cast<int>(::recv(socket_fd_, test_buffer, 1, MSG_PEEK | MSG_DONTWAIT));
      #endif

      if (peek_result == 0) {
        relayhttp_log("[SocketWrapper] Connection closed by peer");
        return false;
      }

      if (peek_result == SOCKET_ERROR) {
        #ifdef _WIN32
          return WSAGetLastError() == WSAEWOULDBLOCK;
        #else
          return errno == EAGAIN || errno == EWOULDBLOCK;
        #endif
      }
    }

    return true;
  }

} // namespace relayhttp
