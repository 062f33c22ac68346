/**
 * @file x509_certificate.h
 * @brief Immutable parsed X.509 certificate value
 *
 * Holds the fields reports need plus the DER encoding. OpenSSL handles are
 * materialised on demand with toX509(); the value itself owns no OpenSSL state
 * and can be copied freely between threads.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <openssl/x509.h>

namespace pdftrust::validation {

/// RAII wrapper for X509
struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
using X509Ptr = std::unique_ptr<X509, X509Deleter>;

struct X509Certificate {
    std::string subject;             ///< OpenSSL oneline DN ("/C=DE/O=Org/CN=Name")
    std::string issuer;
    std::string commonName;          ///< Subject CN, may be empty
    std::string issuerCommonName;
    std::string serialNumber;        ///< Lowercase hex
    std::chrono::system_clock::time_point notBefore;
    std::chrono::system_clock::time_point notAfter;
    std::string fingerprint;         ///< SHA-256 of DER, lowercase hex
    std::string signatureAlgorithm;  ///< OpenSSL short name (e.g., "RSA-SHA256")
    std::vector<uint8_t> der;

    /**
     * @brief Build from an OpenSSL certificate
     * @param cert Certificate (non-owning)
     * @throws common::CertificateException if cert is null or cannot be encoded
     */
    static X509Certificate fromX509(X509* cert);

    /**
     * @brief Parse DER bytes
     * @throws common::CertificateException on malformed input
     */
    static X509Certificate fromDer(const std::vector<uint8_t>& der);

    /**
     * @brief Decode der into a fresh OpenSSL handle
     * @throws common::CertificateException if der does not decode
     */
    X509Ptr toX509() const;

    /// Common name, or fingerprint when the subject has no CN
    std::string displayName() const;

    bool isValidAt(std::chrono::system_clock::time_point when) const {
        return when >= notBefore && when <= notAfter;
    }

    bool operator==(const X509Certificate& other) const { return fingerprint == other.fingerprint; }
    bool operator!=(const X509Certificate& other) const { return !(*this == other); }
};

} // namespace pdftrust::validation
