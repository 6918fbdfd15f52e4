#ifndef TLS_INSPECTOR_HPP
#define TLS_INSPECTOR_HPP

#include <optional>
#include <string>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include "scan_types.hpp"

/**
 * @struct TlsSession
 * @brief What a completed handshake revealed.
 */
struct TlsSession {
    std::string version;             ///< Negotiated protocol, e.g. "TLSv1.2".
    std::string cipher;
    std::optional<CertInfo> cert;    ///< Empty if the server sent none.
};

/**
 * @class TlsProber
 * @brief Attempts a TLS handshake against one port.
 */
class TlsProber {
public:
    virtual ~TlsProber() = default;

    /** @return The session on success; empty when the connect or handshake fails. */
    virtual std::optional<TlsSession> probe(const TargetDescriptor& target, int port, int timeout_ms) = 0;
};

/**
 * @class OpenSslProber
 * @brief TlsProber built on OpenSSL. Certificates are not verified, and legacy
 * protocol versions down to TLS 1.0 are allowed so that weak servers can be
 * reported.
 */
class OpenSslProber : public TlsProber {
public:
    std::optional<TlsSession> probe(const TargetDescriptor& target, int port, int timeout_ms) override;
};

/** @brief Summary of @p cert: RFC 2253 names, decimal serial, validity, signature algorithm. */
CertInfo certificateInfo(X509* cert);

/**
 * @brief Readable text for an SSL_get_error() result, followed by the oldest
 * entry of the OpenSSL error queue when one is pending.
 */
std::string sslErrorText(int ssl_error);

/** @brief OpenSSL names TLS 1.0 "TLSv1"; map it to "TLSv1.0", leave the rest untouched. */
std::string normalizeTlsVersion(const std::string& version);

#endif // TLS_INSPECTOR_HPP
