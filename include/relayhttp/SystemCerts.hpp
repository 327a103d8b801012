#ifndef RELAY_HTTP_SYSTEM_CERTS_HPP
#define RELAY_HTTP_SYSTEM_CERTS_HPP

#include <string>
#include <vector>

namespace relayhttp {

  namespace certs {

    using DerCertificate = std::vector<unsigned char>;
    using DerList = std::vector<DerCertificate>;

    // Trust anchors for TLS verification. SSL_CERT_FILE and SSL_CERT_DIR
    // are read first; the distribution bundles are only consulted when
    // neither yields a certificate.
    DerList loadTrustAnchors();

    // Every CERTIFICATE block of a PEM bundle. Malformed blocks are logged
    // and skipped.
    DerList decodePemBundle(const std::string& pem);

    // True when the buffer is exactly one DER encoded SEQUENCE.
    bool looksLikeDer(const DerCertificate& data);

  } // namespace certs

} // namespace relayhttp

#endif // RELAY_HTTP_SYSTEM_CERTS_HPP
