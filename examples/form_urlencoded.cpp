#include <relayhttp/relayhttp.hpp>
#include <iostream>
#include <string>

int main (int argc, char* argv[]) {
  // Check arguments
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <url>" << std::endl;
    return 1;
  }

  relayhttp::RequestOptions options;
  options.urlencoded = relayhttp::Query{
    {"username", "relay user"},
    {"password", "p@ss&word"},
    {"remember", "true"}
  };

  relayhttp::Client client;

  try {
    relayhttp::Response res = client.post(argv[1], options);

    std::cout << res.version << " " << res.status << " " << res.statusText << std::endl;
    std::cout << res.headers.dump() << std::endl;
    std::cout << res.body << std::endl;
  } catch (const relayhttp::HttpError& e) {
    std::cerr << "Request failed: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
