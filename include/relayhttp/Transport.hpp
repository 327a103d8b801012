#ifndef RELAY_HTTP_TRANSPORT_HPP
#define RELAY_HTTP_TRANSPORT_HPP

#include "relayhttp/MessageBuffer.hpp"
#include "relayhttp/Sockets/SocketWrapper.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#define RELAY_HTTP_READ_CHUNK_SIZE 16384

namespace relayhttp {

  class BodyStream;

  struct RawResponse {
    std::string head; // status line and header block, blank line included
    std::string body;
  };

  struct StreamedResponse {
    std::string head;
    std::shared_ptr<BodyStream> body;
  };

  // One connection and its in-flight guard. A transport serves one request
  // at a time: a second send while the first is running is a UsageError.
  class Transport : public std::enable_shared_from_this<Transport> {
    public:
      explicit Transport(std::shared_ptr<SocketWrapper> socket);
      ~Transport();

      Transport(const Transport&) = delete;
      Transport& operator=(const Transport&) = delete;

      // Throws ConnectionError. One transport is one connection, a second
      // call is a UsageError. A non-zero `deadline` (steady ms) bounds the
      // connect and any handshake; running past it is a TimeoutError.
      void makeConnection(const std::string& ip, uint16_t port, int64_t deadline = 0);

      // `timeout` bounds the whole exchange in milliseconds.
      RawResponse sendHttpRequest(const std::string& raw, int64_t timeout, bool expect_body = true);

      // Returns once the headers are in. The transport stays in use until the
      // body stream is drained or destroyed. Only chunked bodies stream.
      StreamedResponse sendHttpStreamRequest(const std::string& raw, int64_t timeout, bool expect_body = true);

      // Throws UsageError when no connection was ever made.
      bool isClosing();

      bool used() const { return used_.load(); }

      // Claimed by the pool for one caller between acquisition and send.
      bool reserve();
      bool reserved() const { return reserved_.load(); }

      void close();

    private:
      friend class BodyStream;

      void claim();
      void release();
      void sendData(const std::string& raw);
      size_t receiveData(int64_t deadline);

      std::shared_ptr<SocketWrapper> socket_;
      std::atomic<bool> used_{false};
      std::atomic<bool> reserved_{false};
      bool connected_once_ = false;

      std::unique_ptr<MessageBuffer> buffer_;
      std::unique_ptr<StreamMessageBuffer> stream_buffer_;
      unsigned char read_buffer_[RELAY_HTTP_READ_CHUNK_SIZE];
  };

  // Lazy, finite, non-restartable sequence of body chunks.
  class BodyStream {
    public:
      BodyStream(std::shared_ptr<Transport> transport, std::string first, bool done, int64_t timeout);
      ~BodyStream();

      BodyStream(const BodyStream&) = delete;
      BodyStream& operator=(const BodyStream&) = delete;

      // False once the body is exhausted. `timeout` applies per read.
      bool next(std::string& chunk);
      std::string readAll();
      bool finished() const { return done_ && pending_.empty(); }

    private:
      void finish();

      std::shared_ptr<Transport> transport_;
      std::string pending_;
      bool done_;
      int64_t timeout_;
  };

} // namespace relayhttp

#endif // RELAY_HTTP_TRANSPORT_HPP
