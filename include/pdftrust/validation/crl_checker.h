/**
 * @file crl_checker.h
 * @brief CRL revocation checker (RFC 5280 Section 5.3.1)
 *
 * IRevocationChecker backed by an ICrlProvider. Checks the CRL signature with
 * the issuer's key, its freshness, then looks the serial number up.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <openssl/x509.h>
#include "types.h"
#include "providers.h"

namespace pdftrust::validation {

/**
 * @brief CRL-based certificate revocation checker
 *
 * Usage:
 * @code
 *   PemCrlProvider provider(crlBundle);
 *   CrlChecker checker(&provider);
 *   certificateManager.setRevocationChecker(&checker);
 * @endcode
 */
class CrlChecker : public IRevocationChecker {
public:
    /**
     * @brief Constructor
     * @param crlProvider CRL lookup provider (non-owning)
     * @throws std::invalid_argument if crlProvider is nullptr
     */
    explicit CrlChecker(ICrlProvider* crlProvider);

    /**
     * @brief Check certificate revocation status via CRL
     *
     * Algorithm:
     * 1. Fetch the CRL published by the issuer
     * 2. Verify the CRL signature with the issuer key (INVALID otherwise)
     * 3. Check CRL expiration (EXPIRED if nextUpdate < now)
     * 4. Look up certificate serial number in CRL
     * 5. Extract revocation reason code (RFC 5280 Section 5.3.1)
     *
     * @param cert Certificate to check (non-owning)
     * @param issuerCert Issuer of cert (non-owning)
     * @return RevocationCheckResult with revocation details
     */
    RevocationCheckResult check(X509* cert, X509* issuerCert) override;

private:
    ICrlProvider* crlProvider_;
};

/**
 * @brief ICrlProvider over a PEM bundle of CRLs loaded once
 *
 * Read-only after construction, so it can back a shared CrlChecker.
 */
class PemCrlProvider : public ICrlProvider {
public:
    /**
     * @param pemText One or more "-----BEGIN X509 CRL-----" blocks
     * @throws common::CertificateException if no CRL can be decoded
     */
    explicit PemCrlProvider(const std::string& pemText);

    X509_CRL* findCrlByIssuerDn(const std::string& issuerDn) override;

    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        std::string issuerDn;
        std::vector<uint8_t> der;
    };
    std::vector<Entry> entries_;
};

} // namespace pdftrust::validation
