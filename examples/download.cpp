#include <relayhttp/relayhttp.hpp>
#include <iostream>
#include <fstream>
#include <string>

int main (int argc, char* argv[]) {
  // Check arguments
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <url> <output file>" << std::endl;
    return 1;
  }

  std::ofstream file(argv[2], std::ios::binary);
  if (!file) {
    std::cerr << "Cannot open " << argv[2] << std::endl;
    return 1;
  }

  // Chunked bodies are written as they arrive.
  relayhttp::RequestOptions options;
  options.stream = true;

  relayhttp::Client client;

  try {
    relayhttp::Response res = client.get(argv[1], options);
    std::cout << res.version << " " << res.status << " " << res.statusText << std::endl;

    size_t total = 0;
    std::string chunk;
    while (res.stream && res.stream->next(chunk)) {
      file.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
      total += chunk.size();
    }

    std::cout << "Saved " << total << " bytes to " << argv[2] << std::endl;
  } catch (const relayhttp::UsageError& e) {
    std::cerr << "Server did not send a chunked body: " << e.what() << std::endl;
    return 1;
  } catch (const relayhttp::HttpError& e) {
    std::cerr << "Request failed: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
