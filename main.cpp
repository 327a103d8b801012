#include <relayhttp/relayhttp.hpp>
#include <relayhttp/Buffer.hpp>
#include <iostream>
#include <string>
#include <utility>

namespace {

  void usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [-X METHOD] [-H 'key: value']... [-d body] [-j json] [-i] [--insecure] [--stream] <url>" << std::endl;
  }

} // namespace

int main (int argc, char* argv[]) {
  std::string method = "GET";
  std::string url;
  bool include_headers = false;
  relayhttp::RequestOptions options;

  // Parse arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;

    if (arg == "-X" && has_value) {
      method = argv[++i];
    } else if (arg == "-H" && has_value) {
      std::string header = argv[++i];
      size_t colon = header.find(':');
      if (colon == std::string::npos) {
        std::cerr << "Invalid header: " << header << std::endl;
        return 1;
      }
      options.headers.set(relayhttp::Buffer::trim(header.substr(0, colon)), relayhttp::Buffer::trim(header.substr(colon + 1)));
    } else if (arg == "-d" && has_value) {
      options.content = std::string(argv[++i]);
      if (method == "GET") method = "POST";
    } else if (arg == "-j" && has_value) {
      boost::system::error_code ec;
      boost::json::value json = boost::json::parse(argv[++i], ec);
      if (ec) {
        std::cerr << "Invalid JSON body: " << ec.message() << std::endl;
        return 1;
      }
      options.json = std::move(json);
      if (method == "GET") method = "POST";
    } else if (arg == "-i") {
      include_headers = true;
    } else if (arg == "--insecure") {
      options.check_hostname = false;
      options.verify_mode = false;
    } else if (arg == "--stream") {
      options.stream = true;
    } else if (!arg.empty() && arg[0] != '-' && url.empty()) {
      url = arg;
    } else {
      usage(argv[0]);
      return 1;
    }
  }

  if (url.empty()) {
    usage(argv[0]);
    return 1;
  }

  relayhttp::Client client;

  try {
    relayhttp::Response response = client.request(method, url, options);

    std::cout << response.version << " " << response.status << " " << response.statusText << std::endl;
    if (include_headers) {
      for (const std::string& redirect : response.redirects) {
        std::cout << "# redirected to " << redirect << std::endl;
      }
      for (const std::string& key : response.headers.keys()) {
        for (const std::string& value : response.headers.getAll(key)) {
          std::cout << key << ": " << value << std::endl;
        }
      }
      std::cout << std::endl;
    }

    if (response.stream) {
      std::string chunk;
      while (response.stream->next(chunk)) {
        std::cout << chunk << std::flush;
      }
      std::cout << std::endl;
    } else {
      std::cout << response.body << std::endl;
    }

    return response.ok() ? 0 : 2;
  } catch (const relayhttp::HttpError& e) {
    std::cerr << "Request failed: " << e.what() << " (" << relayhttp::getErrorMessage(e.code()) << ")" << std::endl;
    return 1;
  }
}
