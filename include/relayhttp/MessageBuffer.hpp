#ifndef RELAY_HTTP_MESSAGE_BUFFER_HPP
#define RELAY_HTTP_MESSAGE_BUFFER_HPP

#include "relayhttp/Buffer.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace relayhttp {

  // Incremental HTTP/1.1 response framer. Bytes arrive in arbitrary pieces
  // through addData(); once the whole message is framed the call returns the
  // status line, header block and de-chunked body as one byte string plus
  // the offset where the body starts.
  //
  // Framing is chosen once per message: fixed length when a content-length
  // header parses, chunked otherwise (also when transfer-encoding was never
  // declared). Responses that cannot carry a body (HEAD, 1xx, 204, 304) are
  // complete at the end of their headers. Interim 1xx responses other than
  // 101 are dropped.
  class MessageBuffer {
    public:
      enum class State {
        ACCUMULATING_HEADERS,
        HEADERS_DONE_STRATEGY_UNKNOWN,
        HEADERS_DONE_CONTENT_LENGTH,
        HEADERS_DONE_CHUNKED,
        VERIFIED
      };

      struct FixedLength {
        size_t target = 0;
      };

      struct Chunked {
        size_t to_copy = 0;
        size_t to_discard = 0;
      };

      struct NoBody {};

      using Strategy = std::variant<std::monostate, FixedLength, Chunked, NoBody>;

      struct Message {
        std::string data;
        size_t header_length = 0;
      };

      // `expect_body` is false for responses to HEAD requests.
      explicit MessageBuffer(bool expect_body = true);

      // Throws InvalidResponseData on a malformed chunk-size line.
      std::optional<Message> addData(const unsigned char* data, size_t size);
      std::optional<Message> addData(const std::string& data);

      State state() const;
      bool verified() const { return verified_; }
      size_t headerLength() const { return header_length_; }
      const Strategy& strategy() const { return strategy_; }

    private:
      friend class StreamMessageBuffer;

      void feed(const unsigned char* data, size_t size);
      std::string takeValidated();

      bool findHeaders();
      void chooseStrategy();
      void applyFixedLength(FixedLength& fixed);
      void applyChunked(Chunked& chunked);

      size_t available() const { return unparsed_.size() - offset_; }
      void copy(size_t size);
      void discard(size_t size);
      void compact();

      std::string unparsed_;
      size_t offset_ = 0;
      size_t scan_from_ = 0;

      std::string validated_;
      size_t header_length_ = Buffer::error;
      Strategy strategy_;
      bool verified_ = false;
      bool expect_body_;
  };

  // Same framing, but body bytes are handed out as soon as they are
  // validated. The status line and header block are kept apart in head().
  class StreamMessageBuffer {
    public:
      struct Segment {
        std::string body;
        bool done = false;
      };

      explicit StreamMessageBuffer(bool expect_body = true);

      Segment addData(const unsigned char* data, size_t size);
      Segment addData(const std::string& data);

      bool headersComplete() const;
      const std::string& head() const { return head_; }
      MessageBuffer::State state() const { return buffer_.state(); }
      const MessageBuffer::Strategy& strategy() const { return buffer_.strategy(); }

    private:
      MessageBuffer buffer_;
      std::string head_;
      bool head_taken_ = false;
  };

} // namespace relayhttp

#endif // RELAY_HTTP_MESSAGE_BUFFER_HPP
