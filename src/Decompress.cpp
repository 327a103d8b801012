#include "relayhttp/Decompress.hpp"
#include "relayhttp/Buffer.hpp"
#include "relayhttp/Errors.hpp"
#include "relayhttp/Logs.hpp"

#include <miniz/miniz.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>

namespace relayhttp {

  Decompressor::Decompressor(DecompressionAlgorithm algorithm) : algorithm(algorithm) {
    memset(&this->stream, 0, sizeof(this->stream));
  }

  Decompressor::~Decompressor() {
    if (this->stream_initialized) {
      relayhttp_log("[Decompressor] Cleaning up decompressor");
      mz_inflateEnd(&this->stream);
    }
  }

  DecompressionState Decompressor::init() {
    if (this->algorithm == DecompressionAlgorithm::NONE) {
      this->state = DecompressionState::DECOMPRESS_ERROR;
      return this->state;
    }

    memset(&this->stream, 0, sizeof(this->stream));
    // gzip members carry their own header, parsed below, around a raw stream.
    int window_bits = this->algorithm == DecompressionAlgorithm::DEFLATE ? MZ_DEFAULT_WINDOW_BITS : -MZ_DEFAULT_WINDOW_BITS;

    int ret = mz_inflateInit2(&this->stream, window_bits);
    if (ret != MZ_OK) {
      relayhttp_error("[Decompressor] Failed to initialize decompressor: " << ret);
      this->state = DecompressionState::DECOMPRESS_ERROR;
      return this->state;
    }

    this->stream_initialized = true;
    this->header_processed = false;
    this->state = DecompressionState::INITIALIZED;
    return this->state;
  }

  size_t Decompressor::get_gzip_header_length(const uint8_t* data, size_t size) {
    // The minimum length of a GZIP header is 10 bytes.
    if (size < 10) return 0;

    // Magic numbers and the DEFLATE method (8).
    if (data[0] != 0x1f || data[1] != 0x8b || data[2] != 8) return 0;

    const uint8_t flags = data[3];
    size_t header_len = 10;

    // FEXTRA
    if (flags & 0x04) {
      if (header_len + 2 > size) return 0;
      uint16_t extra_len = data[header_len] | (data[header_len + 1] << 8);
      header_len += 2 + extra_len;
    }

    // FNAME, null-terminated
    if (flags & 0x08) {
      while (header_len < size && data[header_len] != 0) header_len++;
      header_len++;
    }

    // FCOMMENT, null-terminated
    if (flags & 0x10) {
      while (header_len < size && data[header_len] != 0) header_len++;
      header_len++;
    }

    // FHCRC
    if (flags & 0x02) header_len += 2;

    return (header_len <= size) ? header_len : 0;
  }

  DecompressionState Decompressor::decompress(
    const unsigned char* input,
    size_t input_size,
    std::function<void(const unsigned char* buffer, const size_t& size)> output_callback
  ) {
    if (!this->stream_initialized || this->state == DecompressionState::DECOMPRESS_ERROR) {
      this->state = DecompressionState::DECOMPRESS_ERROR;
      return this->state;
    }
    if (this->state == DecompressionState::FINISHED) return this->state;

    size_t header_length = 0;
    if (this->algorithm == DecompressionAlgorithm::GZIP && !this->header_processed) {
      header_length = this->get_gzip_header_length(input, input_size);
      if (header_length == 0) {
        relayhttp_error("[Decompressor] Invalid or incomplete gzip header");
        this->state = DecompressionState::DECOMPRESS_ERROR;
        return this->state;
      }
      this->header_processed = true;
    }

    this->stream.next_in = input + header_length;
    this->stream.avail_in = static_cast<unsigned int>(input_size - header_length);
    this->state = DecompressionState::DECOMPRESSING;

    unsigned char output[RELAY_HTTP_DECOMPRESS_OUTPUT_CHUNK_SIZE];
    bool done = false;

    while (!done) {
      this->stream.next_out = output;
      this->stream.avail_out = RELAY_HTTP_DECOMPRESS_OUTPUT_CHUNK_SIZE;

      int status = mz_inflate(&this->stream, MZ_NO_FLUSH);

      if ((status == MZ_OK || status == MZ_STREAM_END) &&
          this->stream.avail_out != RELAY_HTTP_DECOMPRESS_OUTPUT_CHUNK_SIZE) {
        size_t out_size = RELAY_HTTP_DECOMPRESS_OUTPUT_CHUNK_SIZE - this->stream.avail_out;
        output_callback(output, out_size);
      }

      switch (status) {
        case MZ_OK:
          done = this->stream.avail_in == 0 && this->stream.avail_out != 0;
          break;
        case MZ_BUF_ERROR:
          // Needs more input.
          done = true;
          break;
        case MZ_STREAM_END:
          done = true;
          this->state = DecompressionState::FINISHED;
          break;
        default:
          relayhttp_error("[Decompressor] Decompression error: " << status);
          done = true;
          this->state = DecompressionState::DECOMPRESS_ERROR;
          break;
      }
    }

    return this->state;
  }

  DecompressionAlgorithm algorithmFor(const std::string& coding) {
    std::string lower = Buffer::toLower(coding);
    if (lower == "gzip" || lower == "x-gzip") return DecompressionAlgorithm::GZIP;
    if (lower == "deflate") return DecompressionAlgorithm::DEFLATE;
    return DecompressionAlgorithm::NONE;
  }

  namespace {

    bool runDecompressor(DecompressionAlgorithm algorithm, const std::string& body, std::string& out) {
      Decompressor decompressor(algorithm);
      if (decompressor.init() == DecompressionState::DECOMPRESS_ERROR) return false;

      out.clear();
      DecompressionState state = decompressor.decompress(
        reinterpret_cast<const unsigned char*>(body.data()),
        body.size(),
        [&out](const unsigned char* buffer, const size_t& size) {
          out.append(reinterpret_cast<const char*>(buffer), size);
        }
      );

      return state == DecompressionState::FINISHED;
    }

  } // namespace

  std::string decompressBody(const std::string& body, const std::string& coding) {
    DecompressionAlgorithm algorithm = algorithmFor(coding);
    if (algorithm == DecompressionAlgorithm::NONE) {
      throw InvalidResponseData(HttpResult::UNSUPPORTED_ENCODING, "Unsupported content coding: " + coding);
    }

    if (body.empty()) return body;

    std::string out;
    if (runDecompressor(algorithm, body, out)) return out;

    // Some servers send raw deflate data labelled as deflate.
    if (algorithm == DecompressionAlgorithm::DEFLATE &&
        runDecompressor(DecompressionAlgorithm::RAW_DEFLATE, body, out)) {
      return out;
    }

    relayhttp_error("[Decompressor] Failed to decode " << coding << " body of " << body.size() << " bytes");
    throw InvalidResponseData(HttpResult::DECOMPRESS_RES_FAILED, "Failed to decode " + coding + " body");
  }

} // namespace relayhttp
