/**
 * @file providers.h
 * @brief Provider interfaces for certificate and revocation sources
 *
 * These interfaces decouple path building from where certificates and CRLs
 * come from. CertificatePool is the in-memory implementation used by
 * CertificateManager; callers may plug their own CRL or OCSP sources.
 */

#pragma once

#include <string>
#include <vector>
#include <openssl/x509.h>

#include "types.h"

namespace pdftrust::validation {

/**
 * @brief Issuer lookup and trust-anchor membership
 *
 * Memory ownership: returned X509* pointers are owned by the caller and must be freed.
 */
class ICertificateProvider {
public:
    virtual ~ICertificateProvider() = default;

    /**
     * @brief Find all certificates whose subject matches a DN
     *
     * Several certificates may share a subject after a CA key rollover.
     * TrustChainBuilder selects the right one by signature verification.
     *
     * @param subjectDn DN to search for (any format)
     * @return Vector of X509* certificates (caller must free each)
     */
    virtual std::vector<X509*> findIssuersBySubjectDn(const std::string& subjectDn) = 0;

    /**
     * @brief True if the fingerprint belongs to the trusted-root set
     */
    virtual bool isTrustAnchor(const std::string& fingerprint) const = 0;
};

/**
 * @brief CRL lookup interface
 *
 * Memory ownership: returned X509_CRL* pointers are owned by the caller and must be freed.
 */
class ICrlProvider {
public:
    virtual ~ICrlProvider() = default;

    /**
     * @brief Find the current CRL published by an issuer
     * @param issuerDn Issuer DN (OpenSSL oneline format)
     * @return X509_CRL* (caller must free), or nullptr if not found
     */
    virtual X509_CRL* findCrlByIssuerDn(const std::string& issuerDn) = 0;
};

/**
 * @brief Pluggable revocation check (CRL, OCSP, ...)
 *
 * One instance may be shared by concurrent validations, so implementations
 * must be safe to call from several threads.
 */
class IRevocationChecker {
public:
    virtual ~IRevocationChecker() = default;

    /**
     * @param cert Certificate to check (non-owning)
     * @param issuerCert Its issuer in the validated path (non-owning)
     */
    virtual RevocationCheckResult check(X509* cert, X509* issuerCert) = 0;
};

} // namespace pdftrust::validation
