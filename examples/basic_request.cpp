#include <relayhttp/relayhttp.hpp>
#include <iostream>
#include <string>

int main (int argc, char* argv[]) {
  // Check arguments
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <url> <redirects (optional = 3)>" << std::endl;
    return 1;
  }

  relayhttp::ClientOptions options;
  if (argc >= 3) options.redirect_count = std::stoi(argv[2]);

  // Create HTTP client
  relayhttp::Client client(options);

  try {
    relayhttp::Response res = client.get(argv[1]);

    std::cout << res.version << " " << res.status << " " << res.statusText << std::endl;
    for (const std::string& redirect : res.redirects) {
      std::cout << "Redirected to: " << redirect << std::endl;
    }
    std::cout << res.headers.dump() << std::endl;
    std::cout << res.body << std::endl << std::endl;
  } catch (const relayhttp::HttpError& e) {
    std::cerr << "Request failed: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
