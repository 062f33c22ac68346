/**
 * @file cert_ops.h
 * @brief Pure X.509 certificate operations, no I/O
 *
 * All functions in this module are idempotent and side-effect free apart from
 * clearing the OpenSSL error queue. They operate only on OpenSSL structures
 * passed as arguments.
 *
 * RFC 5280 Section 6.1 (Basic Path Validation) utilities.
 */

#pragma once

#include <ctime>
#include <string>
#include <openssl/x509.h>

namespace pdftrust::validation {

/// @name Signature Verification
/// @{

/**
 * @brief Verify certificate signature using issuer's public key
 * @param cert Certificate to verify (non-owning)
 * @param issuerCert Issuer certificate containing public key (non-owning)
 * @return true if signature is cryptographically valid
 */
bool verifyCertificateSignature(X509* cert, X509* issuerCert);

/// @}

/// @name Certificate Status Checks
/// @{

/**
 * @brief Check if certificate has expired (notAfter < at)
 * @param cert Certificate to check (non-owning)
 * @param at Reference time, defaults to now
 */
bool isCertificateExpired(X509* cert, std::time_t at = std::time(nullptr));

/**
 * @brief Check if certificate is not yet valid (notBefore > at)
 */
bool isCertificateNotYetValid(X509* cert, std::time_t at = std::time(nullptr));

/**
 * @brief Check if certificate is self-issued (subject DN == issuer DN)
 *
 * Uses format-independent, case-insensitive comparison.
 */
bool isSelfSigned(X509* cert);

/**
 * @brief Check BasicConstraints CA:TRUE
 */
bool isCaCertificate(X509* cert);

/**
 * @brief Check the extended key usage extension for a purpose
 * @param cert Certificate (non-owning)
 * @param nid Purpose NID (e.g., NID_time_stamp)
 * @return true if the extension is present and lists the purpose
 */
bool hasExtendedKeyUsage(X509* cert, int nid);

/// @}

/// @name DN Extraction
/// @{

/**
 * @brief Extract Subject DN from certificate
 * @return Subject DN in OpenSSL oneline format (e.g., "/C=DE/O=Org/CN=Signer")
 */
std::string getSubjectDn(X509* cert);

/**
 * @brief Extract Issuer DN from certificate
 */
std::string getIssuerDn(X509* cert);

/**
 * @brief First entry of a name for the given NID (UTF-8), or empty
 */
std::string getNameEntry(const X509_NAME* name, int nid);

/// @}

/// @name Identity
/// @{

/**
 * @brief Calculate SHA-256 fingerprint of certificate
 * @return 64-char lowercase hex string, or empty on error
 */
std::string getCertificateFingerprint(X509* cert);

/**
 * @brief Serial number as lowercase hex
 */
std::string getSerialNumberHex(X509* cert);

/// @}

/// @name DN Utilities
/// @{

/**
 * @brief Normalize DN for format-independent comparison
 *
 * Handles both OpenSSL slash format (/C=X/O=Y/CN=Z) and
 * RFC 2253 comma format (CN=Z,O=Y,C=X).
 * Normalizes by lowercasing, sorting components, and joining with pipe separator.
 */
std::string normalizeDnForComparison(const std::string& dn);

/**
 * @brief Compare two DNs after normalization
 */
bool dnEquals(const std::string& a, const std::string& b);

/// @}

/**
 * @brief Pop every queued OpenSSL error into one string and clear the queue
 */
std::string drainOpenSslErrors();

} // namespace pdftrust::validation
