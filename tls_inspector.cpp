#include "tls_inspector.hpp"

#include <unistd.h>

#include <memory>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/objects.h>

#include "log_system.hpp"
#include "probe_engine.hpp"

namespace {

struct SslCtxDeleter { void operator()(SSL_CTX* ctx) const { SSL_CTX_free(ctx); } };
struct SslDeleter { void operator()(SSL* ssl) const { SSL_free(ssl); } };
struct X509Deleter { void operator()(X509* cert) const { X509_free(cert); } };
struct BioDeleter { void operator()(BIO* bio) const { BIO_free(bio); } };

using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;
using SslPtr = std::unique_ptr<SSL, SslDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

SslCtxPtr initializeSSLContext() {
    SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx) {
        logsys.Warning("Failed to create SSL context: ", ERR_error_string(ERR_get_error(), nullptr));
        return ctx;
    }
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
    // Allow legacy protocols and weak keys so they can be reported.
    SSL_CTX_set_security_level(ctx.get(), 0);
    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_VERSION);
    return ctx;
}

std::string bioToString(BIO* bio) {
    char* data = nullptr;
    long length = BIO_get_mem_data(bio, &data);
    if (length <= 0 || data == nullptr) return "";
    return std::string(data, static_cast<size_t>(length));
}

std::string nameToString(X509_NAME* name) {
    if (name == nullptr) return "";
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio) return "";
    X509_NAME_print_ex(bio.get(), name, 0, XN_FLAG_RFC2253);
    return bioToString(bio.get());
}

std::string timeToString(const ASN1_TIME* time) {
    if (time == nullptr) return "";
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio) return "";
    ASN1_TIME_print(bio.get(), time);
    return bioToString(bio.get());
}

std::string serialToString(X509* cert) {
    const ASN1_INTEGER* serial = X509_get0_serialNumber(cert);
    if (serial == nullptr) return "";
    BIGNUM* bn = ASN1_INTEGER_to_BN(serial, nullptr);
    if (bn == nullptr) return "";
    char* text = BN_bn2dec(bn);
    std::string result = text ? text : "";
    OPENSSL_free(text);
    BN_free(bn);
    return result;
}

} // namespace

std::string sslErrorText(int ssl_error) {
    std::string text;
    switch (ssl_error) {
        case SSL_ERROR_NONE: text = "SSL_ERROR_NONE"; break;
        case SSL_ERROR_SSL: text = "SSL_ERROR_SSL"; break;
        case SSL_ERROR_WANT_READ: text = "SSL_ERROR_WANT_READ"; break;
        case SSL_ERROR_WANT_WRITE: text = "SSL_ERROR_WANT_WRITE"; break;
        case SSL_ERROR_SYSCALL: text = "SSL_ERROR_SYSCALL"; break;
        case SSL_ERROR_ZERO_RETURN: text = "SSL_ERROR_ZERO_RETURN"; break;
        default: text = "SSL error " + std::to_string(ssl_error); break;
    }
    unsigned long queued = ERR_get_error();
    if (queued != 0) {
        char buffer[256];
        ERR_error_string_n(queued, buffer, sizeof(buffer));
        text += " (";
        text += buffer;
        text += ")";
    }
    return text;
}

std::string normalizeTlsVersion(const std::string& version) {
    if (version == "TLSv1") return "TLSv1.0";
    return version;
}

CertInfo certificateInfo(X509* cert) {
    CertInfo info;
    if (cert == nullptr) return info;
    info.subject = nameToString(X509_get_subject_name(cert));
    info.issuer = nameToString(X509_get_issuer_name(cert));
    info.version = "v" + std::to_string(X509_get_version(cert) + 1);
    info.serial = serialToString(cert);
    info.not_valid_before = timeToString(X509_get0_notBefore(cert));
    info.not_valid_after = timeToString(X509_get0_notAfter(cert));
    int nid = X509_get_signature_nid(cert);
    const char* algorithm = OBJ_nid2ln(nid);
    info.signature_algorithm = algorithm ? algorithm : "";
    return info;
}

std::optional<TlsSession> OpenSslProber::probe(const TargetDescriptor& target, int port, int timeout_ms) {
    SslCtxPtr ctx = initializeSSLContext();
    if (!ctx) return std::nullopt;

    int sock = openTcpConnection(target.ip, target.ipv6, port, timeout_ms);
    if (sock < 0) {
        logsys.Debug("TLS connect to ", target.ip, ":", port, " failed");
        return std::nullopt;
    }

    SslPtr ssl(SSL_new(ctx.get()));
    if (!ssl) {
        close(sock);
        return std::nullopt;
    }
    SSL_set_fd(ssl.get(), sock);
    int sslResult = SSL_connect(ssl.get());
    if (sslResult != 1) {
        int err = SSL_get_error(ssl.get(), sslResult);
        logsys.Debug("SSL handshake with ", target.ip, ":", port, " failed: ", sslErrorText(err));
        ERR_clear_error();
        ssl.reset();
        close(sock);
        return std::nullopt;
    }

    TlsSession session;
    session.version = normalizeTlsVersion(SSL_get_version(ssl.get()));
    const SSL_CIPHER* cipher = SSL_get_current_cipher(ssl.get());
    if (cipher) session.cipher = SSL_CIPHER_get_name(cipher);
    X509Ptr cert(SSL_get_peer_certificate(ssl.get()));
    if (cert) {
        session.cert = certificateInfo(cert.get());
    }

    SSL_shutdown(ssl.get());
    ssl.reset();
    close(sock);
    return session;
}
