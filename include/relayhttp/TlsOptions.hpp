#ifndef RELAY_HTTP_TLS_OPTIONS_HPP
#define RELAY_HTTP_TLS_OPTIONS_HPP

#include <string>

namespace relayhttp {

  struct TlsOptions {
    bool check_hostname = true;
    bool verify_mode = true;      // reject peers whose chain does not verify
    std::string keylog_filename;  // NSS key log, empty to disable
    std::string server_name;      // SNI and hostname check, set per connection
  };

} // namespace relayhttp

#endif // RELAY_HTTP_TLS_OPTIONS_HPP
