#include "relayhttp/Transport.hpp"
#include "relayhttp/Buffer.hpp"
#include "relayhttp/Errors.hpp"
#include "relayhttp/Logs.hpp"
#include "relayhttp/Timestamp.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace relayhttp {

  namespace {

    // Clears the in-flight flag when the exchange ends, normally or not.
    class UseGuard {
      public:
        explicit UseGuard(std::atomic<bool>& used) : used_(used) {}
        ~UseGuard() {
          if (armed_) used_.store(false);
        }
        void keep() { armed_ = false; }

      private:
        std::atomic<bool>& used_;
        bool armed_ = true;
    };

  } // namespace

  Transport::Transport(std::shared_ptr<SocketWrapper> socket) : socket_(std::move(socket)) {}

  Transport::~Transport() {
    this->close();
  }

  void Transport::makeConnection(const std::string& ip, uint16_t port, int64_t deadline) {
    if (connected_once_) {
      throw UsageError(HttpResult::TRANSPORT_IN_USE, "Transport is already connected");
    }

    if (deadline > 0) {
      int64_t remaining = deadline - Timestamp::getSteadyTimestamp();
      if (remaining <= 0) {
        throw TimeoutError(HttpResult::REQUEST_TIMEOUT, "Request timed out before connecting");
      }
      socket_->setConnectTimeout(remaining);
    }

    HttpResult result = socket_->connect(ip, port);
    if (result != HttpResult::SUCCESS) {
      relayhttp_error("[Transport] Connection to " << ip << ":" << port << " failed: " << getErrorMessage(result));
      const bool out_of_time = deadline > 0 && Timestamp::getSteadyTimestamp() >= deadline;
      if (result == HttpResult::TLS_HANDSHAKE_TIMEOUT || (result == HttpResult::CONNECT_TIMEOUT && out_of_time)) {
        throw TimeoutError(HttpResult::REQUEST_TIMEOUT, "Request timed out connecting to " + ip + ":" + std::to_string(port));
      }
      throw ConnectionError(result, "Cannot connect to " + ip + ":" + std::to_string(port) + " (" + getErrorMessage(result) + ")");
    }

    connected_once_ = true;
    relayhttp_log("[Transport] Connected to " << ip << ":" << port);
  }

  bool Transport::reserve() {
    bool expected = false;
    return reserved_.compare_exchange_strong(expected, true);
  }

  void Transport::claim() {
    bool expected = false;
    if (!used_.compare_exchange_strong(expected, true)) {
      relayhttp_error("[Transport] Transport already has a request in flight");
      throw UsageError(HttpResult::TRANSPORT_IN_USE, "Using transport which is already in use");
    }
    reserved_.store(false);
  }

  void Transport::release() {
    used_.store(false);
  }

  bool Transport::isClosing() {
    if (!connected_once_) {
      throw UsageError(HttpResult::TRANSPORT_NOT_CONNECTED, "Transport was never connected");
    }
    return !socket_->isConnected();
  }

  void Transport::close() {
    if (socket_) socket_->disconnect();
  }

  void Transport::sendData(const std::string& raw) {
    if (!connected_once_) {
      throw UsageError(HttpResult::TRANSPORT_NOT_CONNECTED, "Transport was never connected");
    }

    size_t sent = socket_->send(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
    if (sent == Buffer::error || sent != raw.size()) {
      this->close();
      HttpResult reason = socket_->lastResult();
      throw ConnectionError(reason, "Failed to send request (" + getErrorMessage(reason) + ")");
    }
  }

  size_t Transport::receiveData(int64_t deadline) {
    int64_t remaining = deadline - Timestamp::getSteadyTimestamp();
    if (remaining <= 0) {
      this->close();
      throw TimeoutError(HttpResult::REQUEST_TIMEOUT, "Request timed out");
    }

    size_t received = socket_->receive(read_buffer_, sizeof(read_buffer_), remaining);
    if (received != Buffer::error) return received;

    HttpResult reason = socket_->lastResult();
    this->close();
    if (reason == HttpResult::RECEIVE_TIMEOUT) {
      throw TimeoutError(HttpResult::REQUEST_TIMEOUT, "Request timed out");
    }
    throw ConnectionError(reason, "Connection lost before the response was complete (" + getErrorMessage(reason) + ")");
  }

  RawResponse Transport::sendHttpRequest(const std::string& raw, int64_t timeout, bool expect_body) {
    this->claim();
    UseGuard guard(used_);

    int64_t deadline = Timestamp::getSteadyTimestamp() + timeout;
    buffer_ = std::make_unique<MessageBuffer>(expect_body);

    this->sendData(raw);

    while (true) {
      size_t received = this->receiveData(deadline);
      if (received == 0) continue;

      std::optional<MessageBuffer::Message> message;
      try {
        message = buffer_->addData(read_buffer_, received);
      } catch (const InvalidResponseData&) {
        this->close();
        throw;
      }
      if (!message) continue;

      RawResponse response;
      response.head = message->data.substr(0, message->header_length);
      response.body = message->data.substr(message->header_length);
      relayhttp_log("[Transport] Response complete: " << response.head.size() << " header bytes, " << response.body.size() << " body bytes");
      return response;
    }
  }

  StreamedResponse Transport::sendHttpStreamRequest(const std::string& raw, int64_t timeout, bool expect_body) {
    this->claim();
    UseGuard guard(used_);

    int64_t deadline = Timestamp::getSteadyTimestamp() + timeout;
    stream_buffer_ = std::make_unique<StreamMessageBuffer>(expect_body);

    this->sendData(raw);

    StreamMessageBuffer::Segment first;
    while (!stream_buffer_->headersComplete()) {
      size_t received = this->receiveData(deadline);
      if (received == 0) continue;
      try {
        first = stream_buffer_->addData(read_buffer_, received);
      } catch (const InvalidResponseData&) {
        this->close();
        throw;
      }
    }

    if (std::holds_alternative<MessageBuffer::FixedLength>(stream_buffer_->strategy())) {
      // The unread body would desynchronize the connection.
      this->close();
      throw UsageError(HttpResult::STREAM_REQUIRES_CHUNKED, "Stream request should use chunked transfer-encoding");
    }

    StreamedResponse response;
    response.head = stream_buffer_->head();
    response.body = std::make_shared<BodyStream>(shared_from_this(), std::move(first.body), first.done, timeout);
    guard.keep();
    return response;
  }

  BodyStream::BodyStream(std::shared_ptr<Transport> transport, std::string first, bool done, int64_t timeout)
    : transport_(std::move(transport)), pending_(std::move(first)), done_(done), timeout_(timeout) {
    if (done_) this->finish();
  }

  BodyStream::~BodyStream() {
    if (transport_ && !done_) {
      // Partially read body, the connection cannot serve another request.
      relayhttp_log("[BodyStream] Closing transport with an unread body");
      transport_->close();
    }
    this->finish();
  }

  void BodyStream::finish() {
    if (!transport_) return;
    transport_->stream_buffer_.reset();
    transport_->release();
    transport_.reset();
  }

  bool BodyStream::next(std::string& chunk) {
    while (pending_.empty() && !done_) {
      int64_t deadline = Timestamp::getSteadyTimestamp() + timeout_;
      StreamMessageBuffer::Segment segment;

      try {
        size_t received = transport_->receiveData(deadline);
        if (received == 0) continue;
        segment = transport_->stream_buffer_->addData(transport_->read_buffer_, received);
      } catch (const HttpError&) {
        done_ = true;
        transport_->close();
        this->finish();
        throw;
      }

      pending_ += segment.body;
      if (segment.done) {
        done_ = true;
        this->finish();
      }
    }

    if (pending_.empty()) return false;

    chunk.swap(pending_);
    pending_.clear();
    return true;
  }

  std::string BodyStream::readAll() {
    std::string body;
    std::string chunk;
    while (this->next(chunk)) {
      body += chunk;
    }
    return body;
  }

} // namespace relayhttp
