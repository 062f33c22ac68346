/**
 * @file types.h
 * @brief Common types for certificate validation
 *
 * Shared enums and result structs used across the validation modules.
 * RFC 5280 Section 6 path validation vocabulary.
 */

#pragma once

#include <string>
#include <vector>
#include <json/json.h>

#include "x509_certificate.h"

namespace pdftrust::validation {

/// @brief Rule that broke a certification path
enum class ChainRule {
    ISSUER_MISMATCH,    ///< Child issuer DN matches no candidate subject DN
    SIGNATURE_INVALID,  ///< Parent public key does not verify child signature
    NOT_YET_VALID,      ///< notBefore is in the future
    EXPIRED,            ///< notAfter is in the past
    UNTRUSTED_ROOT,     ///< Path ends at a certificate outside the trusted-root set
    REVOKED,            ///< Revocation checker reported the certificate revoked
    CHAIN_TOO_LONG,     ///< Maximum path depth exceeded
    CIRCULAR_CHAIN      ///< Same certificate seen twice while walking issuers
};

/// @brief Revocation status (RFC 5280 Section 5.3.1)
enum class RevocationStatus {
    GOOD,             ///< Certificate not revoked, source valid
    REVOKED,          ///< Certificate is revoked
    UNAVAILABLE,      ///< No revocation source found for the issuer
    EXPIRED,          ///< CRL nextUpdate is in the past
    INVALID,          ///< CRL signature invalid
    NOT_CHECKED       ///< Check was not performed
};

/// @brief One broken rule on one certificate
struct ChainFailure {
    std::string certificateSubject;  ///< Common name, or fingerprint when there is none
    std::string fingerprint;
    ChainRule rule = ChainRule::ISSUER_MISMATCH;
    std::string detail;

    /// "Certificate 'X' failed EXPIRED: detail"
    std::string describe() const;
};

/// @brief Trust chain build + validation result
struct TrustChainResult {
    bool valid = false;                   ///< Path reaches a trust anchor and no rule failed
    bool reachedTrustAnchor = false;
    std::string path;                     ///< Human-readable path (e.g., "Signer -> CA -> Root")
    int depth = 0;                        ///< Number of certificates in path
    std::vector<X509Certificate> chain;   ///< Path, leaf first
    std::vector<ChainFailure> failures;
    std::string message;                  ///< First failure or info message
    std::string rootSubjectDn;
    std::string rootFingerprint;
};

/// @brief Revocation check result
struct RevocationCheckResult {
    RevocationStatus status = RevocationStatus::NOT_CHECKED;
    std::string thisUpdate;         ///< CRL issued date (ISO 8601)
    std::string nextUpdate;         ///< CRL next update date (ISO 8601)
    std::string revocationReason;   ///< RFC 5280 CRLReason (e.g., "keyCompromise")
    std::string message;
};

/// @brief Signature algorithm / key size check result
struct AlgorithmComplianceResult {
    bool compliant = true;
    std::string algorithm;  ///< Signature algorithm name
    std::string warning;    ///< Non-empty if deprecated algorithm or weak key
    int keyBits = 0;        ///< Public key size in bits
};

/// @brief Extension validation result (RFC 5280 Section 4.2)
struct ExtensionValidationResult {
    bool valid = true;
    std::vector<std::string> warnings;

    std::string warningsAsString() const {
        std::string result;
        for (size_t i = 0; i < warnings.size(); i++) {
            if (i > 0) result += "; ";
            result += warnings[i];
        }
        return result;
    }
};

/**
 * @brief Outcome of validateCertificate / validateCertificateChain
 *
 * isValid is true iff errors is empty.
 */
struct CertificateValidationResult {
    bool isValid = false;
    bool chainValid = false;      ///< Every hop: issuer match + signature
    bool notExpired = false;      ///< Every certificate within its validity window
    bool notRevoked = true;
    bool trustedRoot = false;     ///< Path terminates in the trusted-root set
    bool revocationChecked = false;

    std::string subject;          ///< Leaf subject DN
    std::string commonName;
    std::string fingerprint;      ///< Leaf fingerprint (dedup key)
    std::string chainPath;
    int depth = 0;
    std::vector<X509Certificate> chain;

    std::vector<ChainFailure> failures;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    Json::Value toJson() const;
};

/// @brief Display-oriented projection of one certificate
struct CertificateInfo {
    std::string subject;
    std::string issuer;
    std::string commonName;
    std::string organization;
    std::string country;
    std::string serialNumber;
    std::string notBefore;       ///< ISO 8601
    std::string notAfter;        ///< ISO 8601
    std::string fingerprint;
    std::string signatureAlgorithm;
    std::string publicKeyAlgorithm;
    int publicKeyBits = 0;
    std::vector<std::string> keyUsage;
    std::vector<std::string> extendedKeyUsage;
    bool isCa = false;
    bool isSelfSigned = false;
    bool isExpired = false;
    bool isNotYetValid = false;

    Json::Value toJson() const;
};

/// @brief Convert ChainRule to string
inline std::string chainRuleToString(ChainRule r) {
    switch (r) {
        case ChainRule::ISSUER_MISMATCH:   return "ISSUER_MISMATCH";
        case ChainRule::SIGNATURE_INVALID: return "SIGNATURE_INVALID";
        case ChainRule::NOT_YET_VALID:     return "NOT_YET_VALID";
        case ChainRule::EXPIRED:           return "EXPIRED";
        case ChainRule::UNTRUSTED_ROOT:    return "UNTRUSTED_ROOT";
        case ChainRule::REVOKED:           return "REVOKED";
        case ChainRule::CHAIN_TOO_LONG:    return "CHAIN_TOO_LONG";
        case ChainRule::CIRCULAR_CHAIN:    return "CIRCULAR_CHAIN";
    }
    return "UNKNOWN";
}

/// @brief Convert RevocationStatus to string
inline std::string revocationStatusToString(RevocationStatus s) {
    switch (s) {
        case RevocationStatus::GOOD:        return "GOOD";
        case RevocationStatus::REVOKED:     return "REVOKED";
        case RevocationStatus::UNAVAILABLE: return "UNAVAILABLE";
        case RevocationStatus::EXPIRED:     return "EXPIRED";
        case RevocationStatus::INVALID:     return "INVALID";
        case RevocationStatus::NOT_CHECKED: return "NOT_CHECKED";
    }
    return "UNKNOWN";
}

/// @brief Summary JSON of a certificate (no DER)
Json::Value certificateToJson(const X509Certificate& cert);

/// @brief JSON array from a string list
inline Json::Value toJsonArray(const std::vector<std::string>& items) {
    Json::Value arr(Json::arrayValue);
    for (const auto& item : items) {
        arr.append(item);
    }
    return arr;
}

} // namespace pdftrust::validation
