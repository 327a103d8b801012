#include <relayhttp/relayhttp.hpp>
#include <iostream>
#include <string>

int main (int argc, char* argv[]) {
  // Check arguments
  if (argc < 5) {
    std::cerr << "Usage: " << argv[0] << " <login url> <private url> <username> <password>" << std::endl;
    return 1;
  }

  relayhttp::ClientOptions options;
  options.persistent_connections = true;
  options.credentials = relayhttp::Credentials{argv[3], argv[4]};

  relayhttp::Client client(options);

  try {
    // Cookies set by the first response are replayed on the second request.
    relayhttp::Response login = client.get(argv[1]);
    std::cout << "Login: " << login.status << " " << login.statusText << std::endl;

    for (const relayhttp::Cookie& cookie : client.cookies().cookies()) {
      std::cout << "  cookie " << cookie.name << " for " << cookie.domain << cookie.path << std::endl;
    }

    relayhttp::Response res = client.get(argv[2]);
    std::cout << "Private: " << res.status << " " << res.statusText << std::endl;
    std::cout << res.body << std::endl;
  } catch (const relayhttp::HttpError& e) {
    std::cerr << "Request failed: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
