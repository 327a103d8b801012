#ifndef RELAY_HTTP_DECOMPRESS_HPP
#define RELAY_HTTP_DECOMPRESS_HPP

#include <miniz/miniz.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#define RELAY_HTTP_DECOMPRESS_OUTPUT_CHUNK_SIZE 16384 // 16 kb

namespace relayhttp {

  enum DecompressionAlgorithm {
    NONE,
    GZIP,
    DEFLATE,
    RAW_DEFLATE
  };

  enum DecompressionState {
    INITIALIZED,
    DECOMPRESSING,
    FINISHED,
    DECOMPRESS_ERROR
  };

  class Decompressor {
    private:
      mz_stream stream;
      DecompressionAlgorithm algorithm;

      bool stream_initialized = false;
      bool header_processed = false;
      size_t get_gzip_header_length(const uint8_t* data, size_t size);
      DecompressionState state = DecompressionState::INITIALIZED;

    public:
      explicit Decompressor(DecompressionAlgorithm algorithm);
      ~Decompressor();

      Decompressor(const Decompressor&) = delete;
      Decompressor& operator=(const Decompressor&) = delete;

      DecompressionState init();
      DecompressionState decompress(
        const unsigned char* input,
        size_t input_size,
        std::function<void(const unsigned char* buffer, const size_t& size)> output_callback
      );

      DecompressionState getState() const { return state; }
  };

  // Maps a content-coding token (`gzip`, `x-gzip`, `deflate`) to an algorithm,
  // NONE when unsupported.
  DecompressionAlgorithm algorithmFor(const std::string& coding);

  // Whole-body decoding. Throws InvalidResponseData on corrupt or truncated
  // input and on an unsupported coding.
  std::string decompressBody(const std::string& body, const std::string& coding);

} // namespace relayhttp

#endif // RELAY_HTTP_DECOMPRESS_HPP
