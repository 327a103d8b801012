#ifndef RELAY_HTTP_MBEDTLS_SOCKET_HPP
#define RELAY_HTTP_MBEDTLS_SOCKET_HPP

#include "relayhttp/Sockets/SocketWrapper.hpp"
#include "relayhttp/Results.hpp"
#include "relayhttp/TlsOptions.hpp"

#include <cstdint>
#include <fstream>
#include <string>

extern "C" {
  #include <mbedtls/ssl.h>
  #include <mbedtls/x509_crt.h>
  #include <mbedtls/net_sockets.h>
  #include <psa/crypto.h>
}

namespace relayhttp {

  class MbedTLSSocket : public SocketWrapper {
    private:
      mbedtls_ssl_context ssl;
      mbedtls_ssl_config conf;
      mbedtls_x509_crt cacert;
      mbedtls_net_context net_ctx;
      bool tls_initialized_ = false;

      TlsOptions options_;
      std::ofstream keylog_;

      // Helper methods
      bool loadCerts();
      relayhttp::HttpResult initializeTLS(const std::string& hostname);
      relayhttp::HttpResult performTLSHandshake(const std::string& hostname, int64_t deadline);
      void cleanupTLS();

      static int verifyCallback(void* ctx, mbedtls_x509_crt* crt, int depth, uint32_t* flags);
      static void exportKeys(
        void* ctx,
        mbedtls_ssl_key_export_type type,
        const unsigned char* secret,
        size_t secret_len,
        const unsigned char client_random[32],
        const unsigned char server_random[32],
        mbedtls_tls_prf_types tls_prf_type
      );

    public:
      explicit MbedTLSSocket(TlsOptions options);
      ~MbedTLSSocket() override;

      relayhttp::HttpResult connect(const std::string& host, int port) override;
      void disconnect() override;

      size_t send(const unsigned char* buffer, const size_t size) override;
      size_t receive(unsigned char* buffer, size_t size, const int64_t& timeout) override;

      bool isConnected() override;
  };

} // namespace relayhttp

#endif // RELAY_HTTP_MBEDTLS_SOCKET_HPP
