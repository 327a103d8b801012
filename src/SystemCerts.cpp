#include "relayhttp/SystemCerts.hpp"
#include "relayhttp/Logs.hpp"

#include <base64.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <string>
#include <vector>

namespace relayhttp {

  namespace {

    const char* const SYSTEM_CERT_FILES[] = {
      "/etc/ssl/certs/ca-certificates.crt",
      "/etc/pki/tls/certs/ca-bundle.crt",
      "/etc/ssl/ca-bundle.pem",
      "/etc/ssl/cert.pem"
    };

    const char* const SYSTEM_CERT_DIRS[] = {
      "/etc/ssl/certs",
      "/etc/pki/tls/certs",
      "/etc/pki/ca-trust/extracted/pem",
      "/usr/share/ca-certificates",
      "/usr/share/pki/ca-trust-source",
      "/usr/share/ca-certs"
    };

    const char PEM_BEGIN[] = "-----BEGIN CERTIFICATE-----";
    const char PEM_END[] = "-----END CERTIFICATE-----";

    // Appends the certificates of one file, DER or PEM bundle.
    void loadFile(const std::filesystem::path& path, certs::DerList& der_list) {
      std::ifstream file(path, std::ios::binary);
      if (file.fail()) return;

      std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
      if (content.empty()) return;

      certs::DerCertificate raw(content.begin(), content.end());
      if (certs::looksLikeDer(raw)) {
        der_list.push_back(std::move(raw));
        return;
      }

      for (auto& der : certs::decodePemBundle(content)) {
        der_list.push_back(std::move(der));
      }
    }

    void loadDirectory(const std::filesystem::path& directory, certs::DerList& der_list) {
      std::error_code ec;
      for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        loadFile(entry.path(), der_list);
      }
    }

  } // namespace

  namespace certs {

    DerList decodePemBundle(const std::string& pem) {
      DerList der_list;
      size_t pos = 0;

      while ((pos = pem.find(PEM_BEGIN, pos)) != std::string::npos) {
        size_t end = pem.find(PEM_END, pos);
        if (end == std::string::npos) break;

        size_t b64_start = pos + strlen(PEM_BEGIN);
        std::string b64_block = pem.substr(b64_start, end - b64_start);
        pos = end + strlen(PEM_END);

        b64_block.erase(
          std::remove_if(b64_block.begin(), b64_block.end(),
            [](char c) { return !std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '/' && c != '='; }),
          b64_block.end()
        );

        std::string decoded;
        try {
          decoded = base64::from_base64(b64_block);
        } catch (const std::exception& e) {
          relayhttp_error("[SystemCerts] Invalid base64 in PEM certificate: " << e.what());
          continue;
        }

        DerCertificate der(decoded.begin(), decoded.end());
        if (der.empty() || !looksLikeDer(der)) {
          relayhttp_error("[SystemCerts] Failed to decode PEM certificate.");
          continue;
        }

        der_list.push_back(std::move(der));
      }

      return der_list;
    }

    bool looksLikeDer(const DerCertificate& data) {
      const unsigned char* buf = data.data();
      size_t len = data.size();

      if (len < 2) return false;
      if (*buf++ != 0x30) return false;

      int fb = *buf++;
      len -= 2;
      if (fb < 0x80) {
        return static_cast<size_t>(fb) == len;
      } else if (fb == 0x80) {
        return false;
      }

      fb -= 0x80;
      if (len < static_cast<size_t>(fb) + 2) return false;

      len -= static_cast<size_t>(fb);
      size_t dlen = 0;
      while (fb-- > 0) {
        if (dlen > (len >> 8)) return false;
        dlen = (dlen << 8) + static_cast<size_t>(*buf++);
      }
      return dlen == len;
    }

    DerList loadTrustAnchors() {
      DerList der_list;

      const char* env_file = std::getenv("SSL_CERT_FILE");
      const char* env_dir = std::getenv("SSL_CERT_DIR");
      if (env_file != nullptr && *env_file != '\0') {
        loadFile(env_file, der_list);
      }
      if (env_dir != nullptr && *env_dir != '\0') {
        loadDirectory(env_dir, der_list);
      }
      if (!der_list.empty()) {
        relayhttp_log("[SystemCerts] Loaded " << der_list.size() << " CA certificates from the environment.");
        return der_list;
      }

      std::error_code ec;
      for (const char* file : SYSTEM_CERT_FILES) {
        if (!std::filesystem::is_regular_file(file, ec)) continue;
        loadFile(file, der_list);
        if (!der_list.empty()) break;
      }

      if (der_list.empty()) {
        for (const char* dir : SYSTEM_CERT_DIRS) {
          if (!std::filesystem::is_directory(dir, ec)) continue;
          loadDirectory(dir, der_list);
          if (!der_list.empty()) break;
        }
      }

      relayhttp_log("[SystemCerts] Loaded " << der_list.size() << " CA certificates from the system.");
      return der_list;
    }

  } // namespace certs

} // namespace relayhttp
