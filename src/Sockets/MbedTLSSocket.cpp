#include "relayhttp/Sockets/MbedTLSSocket.hpp"
#include "relayhttp/Buffer.hpp"
#include "relayhttp/Logs.hpp"
#include "relayhttp/SystemCerts.hpp"
#include "relayhttp/Timestamp.hpp"

extern "C" {
  #include <mbedtls/error.h>
}

#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <string>

#ifndef _WIN32
  #include <sys/socket.h>
#endif

namespace relayhttp {

  namespace {

    std::string toHex(const unsigned char* data, size_t size) {
      std::ostringstream oss;
      for (size_t i = 0; i < size; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
      }
      return oss.str();
    }

    std::string tlsError(int code) {
      char errbuf[256];
      mbedtls_strerror(code, errbuf, sizeof(errbuf));
      return std::string(errbuf) + " (" + std::to_string(code) + ")";
    }

  } // namespace

  // Private methods

  bool MbedTLSSocket::loadCerts() {
    auto der_list = relayhttp::certs::loadTrustAnchors();
    size_t loaded = 0;

    for (const auto& derCert : der_list) {
      if (derCert.empty()) continue;

      int ret = mbedtls_x509_crt_parse_der(&this->cacert, derCert.data(), derCert.size());
      if (ret != 0) {
        relayhttp_log("[MbedTLSSocket] Skipping unparsable CA certificate: " << tlsError(ret));
        continue;
      }
      loaded++;
    }

    relayhttp_log("[MbedTLSSocket] Loaded " << loaded << " CA certificates");
    return loaded > 0;
  }

  // Called for each certificate of the chain. Without hostname checking the
  // name mismatch flag of the leaf is dropped, every other flag stays.
  int MbedTLSSocket::verifyCallback(void* ctx, mbedtls_x509_crt* /*crt*/, int depth, uint32_t* flags) {
    MbedTLSSocket* self = static_cast<MbedTLSSocket*>(ctx);
    if (depth == 0 && !self->options_.check_hostname) {
      *flags &= ~static_cast<uint32_t>(MBEDTLS_X509_BADCERT_CN_MISMATCH);
    }
    return 0;
  }

  // NSS key log format, readable by Wireshark.
  void MbedTLSSocket::exportKeys(
    void* ctx,
    mbedtls_ssl_key_export_type type,
    const unsigned char* secret,
    size_t secret_len,
    const unsigned char client_random[32],
    const unsigned char /*server_random*/[32],
    mbedtls_tls_prf_types /*tls_prf_type*/
  ) {
    MbedTLSSocket* self = static_cast<MbedTLSSocket*>(ctx);
    if (!self->keylog_.is_open()) return;

    const char* label = nullptr;
    switch (type) {
      case MBEDTLS_SSL_KEY_EXPORT_TLS12_MASTER_SECRET:
        label = "CLIENT_RANDOM";
        break;
      #if defined(MBEDTLS_SSL_PROTO_TLS1_3)
      case MBEDTLS_SSL_KEY_EXPORT_TLS1_3_CLIENT_EARLY_SECRET:
        label = "CLIENT_EARLY_TRAFFIC_SECRET";
        break;
      case MBEDTLS_SSL_KEY_EXPORT_TLS1_3_CLIENT_HANDSHAKE_TRAFFIC_SECRET:
        label = "CLIENT_HANDSHAKE_TRAFFIC_SECRET";
        break;
      case MBEDTLS_SSL_KEY_EXPORT_TLS1_3_SERVER_HANDSHAKE_TRAFFIC_SECRET:
        label = "SERVER_HANDSHAKE_TRAFFIC_SECRET";
        break;
      case MBEDTLS_SSL_KEY_EXPORT_TLS1_3_CLIENT_APPLICATION_TRAFFIC_SECRET:
        label = "CLIENT_TRAFFIC_SECRET_0";
        break;
      case MBEDTLS_SSL_KEY_EXPORT_TLS1_3_SERVER_APPLICATION_TRAFFIC_SECRET:
        label = "SERVER_TRAFFIC_SECRET_0";
        break;
      #endif
      default:
        return;
    }

    self->keylog_ << label << " " << toHex(client_random, 32) << " " << toHex(secret, secret_len) << "\n";
    self->keylog_.flush();
  }

  relayhttp::HttpResult MbedTLSSocket::initializeTLS(const std::string& hostname) {
    relayhttp_log("[MbedTLSSocket] Initializing TLS for hostname: " << hostname);

    mbedtls_ssl_init(&this->ssl);
    mbedtls_ssl_config_init(&this->conf);
    mbedtls_x509_crt_init(&this->cacert);
    mbedtls_net_init(&this->net_ctx);
    this->net_ctx.fd = static_cast<int>(this->socket_fd_);
    this->tls_initialized_ = true;

    if (psa_crypto_init() != PSA_SUCCESS) {
      relayhttp_error("[MbedTLSSocket] psa_crypto_init failed");
      return relayhttp::HttpResult::FAILED_TO_INIT_TLS;
    }

    if (!this->loadCerts() && this->options_.verify_mode) {
      relayhttp_error("[MbedTLSSocket] No CA certificates available");
      return relayhttp::HttpResult::FAILED_TO_LOAD_CERTIFICATES;
    }

    int ret_code = mbedtls_ssl_config_defaults(
      &this->conf,
      MBEDTLS_SSL_IS_CLIENT,
      MBEDTLS_SSL_TRANSPORT_STREAM,
      MBEDTLS_SSL_PRESET_DEFAULT
    );
    if (ret_code != 0) {
      relayhttp_error("[MbedTLSSocket] mbedtls_ssl_config_defaults failed: " << tlsError(ret_code));
      return relayhttp::HttpResult::FAILED_TO_INIT_TLS;
    }

    mbedtls_ssl_conf_authmode(&this->conf, this->options_.verify_mode ? MBEDTLS_SSL_VERIFY_REQUIRED : MBEDTLS_SSL_VERIFY_NONE);
    mbedtls_ssl_conf_ca_chain(&this->conf, &this->cacert, nullptr);
    mbedtls_ssl_conf_verify(&this->conf, &MbedTLSSocket::verifyCallback, this);

    ret_code = mbedtls_ssl_setup(&this->ssl, &this->conf);
    if (ret_code != 0) {
      relayhttp_error("[MbedTLSSocket] mbedtls_ssl_setup failed: " << tlsError(ret_code));
      return relayhttp::HttpResult::FAILED_TO_INIT_TLS;
    }

    ret_code = mbedtls_ssl_set_hostname(&this->ssl, hostname.c_str()); /* SNI and verification */
    if (ret_code != 0) {
      relayhttp_error("[MbedTLSSocket] mbedtls_ssl_set_hostname failed: " << tlsError(ret_code));
      return relayhttp::HttpResult::FAILED_TO_INIT_TLS;
    }

    if (this->keylog_.is_open()) {
      mbedtls_ssl_set_export_keys_cb(&this->ssl, &MbedTLSSocket::exportKeys, this);
    }

    // Reads go through the timed receive so the handshake can be bounded;
    // a read timeout of 0 blocks as the plain receive would.
    mbedtls_ssl_set_bio(&this->ssl, &this->net_ctx, mbedtls_net_send, nullptr, mbedtls_net_recv_timeout);
    return relayhttp::HttpResult::SUCCESS;
  }

  relayhttp::HttpResult MbedTLSSocket::performTLSHandshake(const std::string& hostname, int64_t deadline) {
    relayhttp_log("[MbedTLSSocket] Starting TLS handshake for hostname: " << hostname);

    while (!mbedtls_ssl_is_handshake_over(&this->ssl)) {
      int64_t remaining = deadline - relayhttp::Timestamp::getSteadyTimestamp();
      if (remaining <= 0) {
        relayhttp_error("[MbedTLSSocket] TLS handshake timed out");
        return relayhttp::HttpResult::TLS_HANDSHAKE_TIMEOUT;
      }
      mbedtls_ssl_conf_read_timeout(&this->conf, static_cast<uint32_t>(remaining));

      int ret_code = mbedtls_ssl_handshake_step(&this->ssl);
      if (ret_code == 0 || ret_code == MBEDTLS_ERR_SSL_WANT_READ || ret_code == MBEDTLS_ERR_SSL_WANT_WRITE) {
        continue;
      }

      relayhttp_error("[MbedTLSSocket] TLS handshake error: " << tlsError(ret_code));
      if (ret_code == MBEDTLS_ERR_SSL_TIMEOUT) {
        return relayhttp::HttpResult::TLS_HANDSHAKE_TIMEOUT;
      }
      if (ret_code == MBEDTLS_ERR_X509_CERT_VERIFY_FAILED) {
        return relayhttp::HttpResult::INVALID_CERTIFICATE;
      }
      return relayhttp::HttpResult::TLS_HANDSHAKE_FAILED;
    }

    // Application reads are bounded by receive(), not by mbedTLS.
    mbedtls_ssl_conf_read_timeout(&this->conf, 0);

    if (this->options_.verify_mode) {
      uint32_t vrfy_flags = mbedtls_ssl_get_verify_result(&this->ssl);
      if (vrfy_flags != 0) {
        char vrfy_buf[512];
        mbedtls_x509_crt_verify_info(vrfy_buf, sizeof(vrfy_buf), "", vrfy_flags);
        relayhttp_error("[MbedTLSSocket] Certificate verification failed: " << vrfy_buf);
        return relayhttp::HttpResult::INVALID_CERTIFICATE;
      }
    }

    relayhttp_log("[MbedTLSSocket] TLS handshake completed with " << mbedtls_ssl_get_version(&this->ssl));
    return relayhttp::HttpResult::SUCCESS;
  }

  void MbedTLSSocket::cleanupTLS() {
    if (!this->tls_initialized_) return;

    if (this->connected_) {
      int ret_code = mbedtls_ssl_close_notify(&this->ssl);
      if (ret_code == MBEDTLS_ERR_SSL_WANT_READ || ret_code == MBEDTLS_ERR_SSL_WANT_WRITE) {
        ret_code = mbedtls_ssl_close_notify(&this->ssl);
      }
      if (ret_code != 0) {
        relayhttp_log("[MbedTLSSocket] close_notify failed: " << tlsError(ret_code));
      }
    }

    // The descriptor is closed by disconnect(), not by mbedtls_net_free.
    this->net_ctx.fd = -1;

    mbedtls_x509_crt_free(&this->cacert);
    mbedtls_ssl_free(&this->ssl);
    mbedtls_ssl_config_free(&this->conf);
    mbedtls_net_free(&this->net_ctx);
    this->tls_initialized_ = false;
  }

  // Public methods

  MbedTLSSocket::MbedTLSSocket(TlsOptions options) : options_(std::move(options)) {
    #ifdef _WIN32
      auto& manager = WinSockManager::getInstance();
      if (!manager.isInitialized()) {
        relayhttp_error("[MbedTLSSocket] WinSock not initialized");
        throw std::runtime_error("WinSock initialization failed");
      }
    #endif

    if (!this->options_.keylog_filename.empty()) {
      this->keylog_.open(this->options_.keylog_filename, std::ios::app);
      if (!this->keylog_.is_open()) {
        relayhttp_error("[MbedTLSSocket] Cannot open key log file: " << this->options_.keylog_filename);
      }
    }
  }

  MbedTLSSocket::~MbedTLSSocket() {
    this->disconnect();
  }

  relayhttp::HttpResult MbedTLSSocket::connect(const std::string& host, int port) {
    if (this->connected_ || this->socket_fd_ != INVALID_SOCKET) {
      this->disconnect();
    }

    const int64_t deadline = relayhttp::Timestamp::getSteadyTimestamp() + this->connect_timeout_;
    relayhttp::HttpResult open_state = this->openTCPSocket(host, port);
    if (open_state != relayhttp::HttpResult::SUCCESS) {
      relayhttp_error("[MbedTLSSocket] Failed to create TCP connection.");
      this->disconnect();
      this->last_result_ = open_state;
      return open_state;
    }

    // openTCPSocket marks the socket connected, TLS is not up yet.
    this->connected_ = false;
    const std::string& server_name = this->options_.server_name.empty() ? host : this->options_.server_name;

    open_state = this->initializeTLS(server_name);
    if (open_state == relayhttp::HttpResult::SUCCESS) {
      open_state = this->performTLSHandshake(server_name, deadline);
    }

    if (open_state != relayhttp::HttpResult::SUCCESS) {
      this->disconnect();
      this->last_result_ = open_state;
      return open_state;
    }

    this->connected_ = true;
    this->last_used_timestamp_ = relayhttp::Timestamp::getCurrentTimestamp();
    this->last_result_ = relayhttp::HttpResult::SUCCESS;

    relayhttp_log("[MbedTLSSocket] Successfully connected to " << server_name << " (" << host << ":" << port << ")");
    return relayhttp::HttpResult::SUCCESS;
  }

  void MbedTLSSocket::disconnect() {
    this->cleanupTLS();
    if (this->socket_fd_ != INVALID_SOCKET) {
      relayhttp_log("[MbedTLSSocket] Disconnecting socket");
      closesocket(this->socket_fd_);
      this->socket_fd_ = INVALID_SOCKET;
    }
    this->connected_ = false;
  }

  size_t MbedTLSSocket::send(const unsigned char* buffer, const size_t size) {
    if (!this->connected_ || this->socket_fd_ == INVALID_SOCKET) {
      relayhttp_error("[MbedTLSSocket] Cannot send data: socket not connected.");
      this->last_result_ = HttpResult::SOCKET_NOT_CONNECTED;
      return relayhttp::Buffer::error;
    }

    size_t total_sent = 0;
    while (total_sent < size) {
      int result = mbedtls_ssl_write(&this->ssl, buffer + total_sent, size - total_sent);
      if (result == MBEDTLS_ERR_SSL_WANT_READ || result == MBEDTLS_ERR_SSL_WANT_WRITE) {
        continue;
      }

      if (result < 0) {
        relayhttp_error("[MbedTLSSocket] SSL write failed: " << tlsError(result));
        this->disconnect();
        this->last_result_ = HttpResult::SOCKET_SEND_FAILED;
        return relayhttp::Buffer::error;
      }

      total_sent += static_cast<size_t>(result);
    }

    this->last_used_timestamp_ = relayhttp::Timestamp::getCurrentTimestamp();
    return total_sent;
  }

  size_t MbedTLSSocket::receive(unsigned char* buffer, size_t size, const int64_t& timeout) {
    if (!this->connected_ || this->socket_fd_ == INVALID_SOCKET) {
      relayhttp_error("[MbedTLSSocket] Cannot receive data: socket not connected.");
      this->last_result_ = HttpResult::SOCKET_NOT_CONNECTED;
      return relayhttp::Buffer::error;
    }

    // Records already decrypted by mbedTLS do not show up in select().
    if (mbedtls_ssl_get_bytes_avail(&this->ssl) == 0) {
      HttpResult ready = this->waitReadable(timeout);
      if (ready != HttpResult::SUCCESS) {
        this->last_result_ = ready;
        return relayhttp::Buffer::error;
      }
    }

    int bytes_received = mbedtls_ssl_read(&this->ssl, buffer, size);
    if (bytes_received == MBEDTLS_ERR_SSL_WANT_READ || bytes_received == MBEDTLS_ERR_SSL_WANT_WRITE) {
      return 0;
    }

    #if defined(MBEDTLS_ERR_SSL_RECEIVED_NEW_SESSION_TICKET)
    if (bytes_received == MBEDTLS_ERR_SSL_RECEIVED_NEW_SESSION_TICKET) {
      relayhttp_log("[MbedTLSSocket] Received new session ticket.");
      return 0;
    }
    #endif

    if (bytes_received == MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY || bytes_received == 0) {
      relayhttp_log("[MbedTLSSocket] SSL connection closed by peer");
      this->disconnect();
      this->last_result_ = HttpResult::CONNECTION_CLOSED;
      return relayhttp::Buffer::error;
    }

    if (bytes_received < 0) {
      relayhttp_error("[MbedTLSSocket] SSL read error: " << tlsError(bytes_received));
      this->disconnect();
      this->last_result_ = HttpResult::SOCKET_RECEIVE_FAILED;
      return relayhttp::Buffer::error;
    }

    this->last_used_timestamp_ = relayhttp::Timestamp::getCurrentTimestamp();
    return static_cast<size_t>(bytes_received);
  }

  bool MbedTLSSocket::isConnected() {
    if (!this->peerAlive()) {
      this->disconnect();
      return false;
    }
    return true;
  }

} // namespace relayhttp
