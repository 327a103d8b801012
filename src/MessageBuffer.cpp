#include "relayhttp/MessageBuffer.hpp"
#include "relayhttp/Buffer.hpp"
#include "relayhttp/Errors.hpp"
#include "relayhttp/Logs.hpp"

#include <cctype>
#include <optional>
#include <string>
#include <variant>

namespace relayhttp {

  namespace {

    const unsigned char HEADER_END[] = {'\r', '\n', '\r', '\n'};
    const size_t MAX_CHUNK_SIZE_DIGITS = 15;
    const size_t MAX_CONTENT_LENGTH_DIGITS = 18;

    // Status code of the status line starting at `offset`, 0 when unreadable.
    int parseStatusCode(const std::string& data, size_t offset, size_t end) {
      if (data.compare(offset, 5, "HTTP/") != 0) return 0;
      size_t space = data.find(' ', offset);
      if (space == std::string::npos || space + 4 > offset + end) return 0;

      int status = 0;
      for (size_t i = space + 1; i < space + 4; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(data[i]))) return 0;
        status = status * 10 + (data[i] - '0');
      }
      return status;
    }

    std::optional<size_t> findContentLength(const std::string& data, size_t header_length) {
      size_t start = data.find("\r\n");
      while (start != std::string::npos && start + 2 < header_length) {
        start += 2;
        size_t end = data.find("\r\n", start);
        if (end == std::string::npos || end > header_length) break;

        std::string line = data.substr(start, end - start);
        start = end;

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (!Buffer::iequals(Buffer::trim(line.substr(0, colon)), "content-length")) continue;

        std::string value = Buffer::trim(line.substr(colon + 1));
        if (value.empty() || value.size() > MAX_CONTENT_LENGTH_DIGITS) continue;

        bool digits = true;
        for (char c : value) {
          if (!std::isdigit(static_cast<unsigned char>(c))) digits = false;
        }
        if (!digits) continue;

        return static_cast<size_t>(std::stoull(value));
      }

      return std::nullopt;
    }

    bool parseChunkSize(const std::string& line, size_t& size) {
      std::string digits = Buffer::trim(line.substr(0, line.find(';')));
      if (digits.empty() || digits.size() > MAX_CHUNK_SIZE_DIGITS) return false;

      size = 0;
      for (char c : digits) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
        size = size * 16 + static_cast<size_t>(std::stoi(std::string(1, c), nullptr, 16));
      }
      return true;
    }

  } // namespace

  MessageBuffer::MessageBuffer(bool expect_body) : expect_body_(expect_body) {}

  std::optional<MessageBuffer::Message> MessageBuffer::addData(const unsigned char* data, size_t size) {
    if (verified_) return std::nullopt;

    this->feed(data, size);
    if (!verified_) return std::nullopt;

    Message message;
    message.data = std::move(validated_);
    message.header_length = header_length_;
    validated_.clear();
    return message;
  }

  std::optional<MessageBuffer::Message> MessageBuffer::addData(const std::string& data) {
    return this->addData(reinterpret_cast<const unsigned char*>(data.data()), data.size());
  }

  MessageBuffer::State MessageBuffer::state() const {
    if (verified_) return State::VERIFIED;
    if (header_length_ == Buffer::error) return State::ACCUMULATING_HEADERS;
    if (std::holds_alternative<FixedLength>(strategy_)) return State::HEADERS_DONE_CONTENT_LENGTH;
    if (std::holds_alternative<Chunked>(strategy_)) return State::HEADERS_DONE_CHUNKED;
    return State::HEADERS_DONE_STRATEGY_UNKNOWN;
  }

  void MessageBuffer::feed(const unsigned char* data, size_t size) {
    if (verified_) return;

    if (data != nullptr && size > 0) {
      unparsed_.append(reinterpret_cast<const char*>(data), size);
    }

    if (header_length_ == Buffer::error && !this->findHeaders()) {
      this->compact();
      return;
    }

    if (std::holds_alternative<std::monostate>(strategy_)) {
      this->chooseStrategy();
    }

    if (auto* fixed = std::get_if<FixedLength>(&strategy_)) {
      this->applyFixedLength(*fixed);
    } else if (auto* chunked = std::get_if<Chunked>(&strategy_)) {
      this->applyChunked(*chunked);
    }

    if (verified_) {
      // Anything past the message does not belong to this response.
      unparsed_.clear();
      offset_ = 0;
    } else {
      this->compact();
    }
  }

  std::string MessageBuffer::takeValidated() {
    std::string out;
    out.swap(validated_);
    return out;
  }

  bool MessageBuffer::findHeaders() {
    while (true) {
      if (available() < scan_from_ + sizeof(HEADER_END)) return false;

      const unsigned char* begin = reinterpret_cast<const unsigned char*>(unparsed_.data()) + offset_;
      size_t pos = Buffer::find(begin + scan_from_, available() - scan_from_, HEADER_END, sizeof(HEADER_END));
      if (pos == Buffer::error) {
        // Keep the last bytes, the terminator may straddle two reads.
        scan_from_ = available() - (sizeof(HEADER_END) - 1);
        return false;
      }

      size_t end = scan_from_ + pos + sizeof(HEADER_END);
      int status = parseStatusCode(unparsed_, offset_, end);
      scan_from_ = 0;

      if (status >= 100 && status < 200 && status != 101) {
        relayhttp_log("[MessageBuffer] Skipping interim " << status << " response");
        this->discard(end);
        continue;
      }

      validated_.append(unparsed_, offset_, end);
      this->discard(end);
      header_length_ = validated_.size();

      if (!expect_body_ || status == 101 || status == 204 || status == 304) {
        strategy_ = NoBody{};
        verified_ = true;
      }

      relayhttp_log("[MessageBuffer] Headers complete (" << header_length_ << " bytes)");
      return true;
    }
  }

  void MessageBuffer::chooseStrategy() {
    std::optional<size_t> length = findContentLength(validated_, header_length_);
    if (length) {
      relayhttp_log("[MessageBuffer] Fixed length body of " << *length << " bytes");
      strategy_ = FixedLength{*length};
    } else {
      relayhttp_log("[MessageBuffer] No content-length, reading chunked body");
      strategy_ = Chunked{};
    }
  }

  void MessageBuffer::applyFixedLength(FixedLength& fixed) {
    if (available() < fixed.target) return;

    this->copy(fixed.target);
    verified_ = true;
  }

  void MessageBuffer::applyChunked(Chunked& chunked) {
    while (!verified_) {
      if (chunked.to_copy > 0) {
        if (available() < chunked.to_copy) return;
        this->copy(chunked.to_copy);
        chunked.to_copy = 0;
        chunked.to_discard = 2; // CRLF closing the chunk data
        continue;
      }

      if (chunked.to_discard > 0) {
        if (available() < chunked.to_discard) return;
        this->discard(chunked.to_discard);
        chunked.to_discard = 0;
        continue;
      }

      size_t line_end = unparsed_.find("\r\n", offset_);
      if (line_end == std::string::npos) return;

      size_t size = 0;
      if (!parseChunkSize(unparsed_.substr(offset_, line_end - offset_), size)) {
        relayhttp_error("[MessageBuffer] Invalid chunk size line");
        throw InvalidResponseData(HttpResult::PARSE_CHUNKED_RES_FAILED, "Invalid chunk size in chunked response body");
      }

      if (size == 0) {
        // Last chunk, then optional trailer fields, then an empty line.
        size_t end = unparsed_.find("\r\n\r\n", line_end);
        if (end == std::string::npos) return;
        this->discard(end + 4 - offset_);
        verified_ = true;
        return;
      }

      this->discard(line_end + 2 - offset_);
      chunked.to_copy = size;
    }
  }

  void MessageBuffer::copy(size_t size) {
    validated_.append(unparsed_, offset_, size);
    offset_ += size;
  }

  void MessageBuffer::discard(size_t size) {
    offset_ += size;
  }

  void MessageBuffer::compact() {
    if (offset_ == 0) return;
    if (offset_ >= unparsed_.size() / 2) {
      unparsed_.erase(0, offset_);
      offset_ = 0;
    }
  }

  StreamMessageBuffer::StreamMessageBuffer(bool expect_body) : buffer_(expect_body) {}

  StreamMessageBuffer::Segment StreamMessageBuffer::addData(const unsigned char* data, size_t size) {
    Segment segment;
    buffer_.feed(data, size);
    if (buffer_.headerLength() == Buffer::error) return segment;

    std::string validated = buffer_.takeValidated();
    if (!head_taken_) {
      head_ = validated.substr(0, buffer_.headerLength());
      segment.body = validated.substr(buffer_.headerLength());
      head_taken_ = true;
    } else {
      segment.body = std::move(validated);
    }

    segment.done = buffer_.verified();
    return segment;
  }

  StreamMessageBuffer::Segment StreamMessageBuffer::addData(const std::string& data) {
    return this->addData(reinterpret_cast<const unsigned char*>(data.data()), data.size());
  }

  bool StreamMessageBuffer::headersComplete() const {
    return head_taken_;
  }

} // namespace relayhttp
