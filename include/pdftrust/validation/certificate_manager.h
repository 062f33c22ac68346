/**
 * @file certificate_manager.h
 * @brief Certificate loading, inspection and chain validation
 *
 * Chain validation builds the path from the leaf to a caller-supplied trusted
 * root with TrustChainBuilder over a CertificatePool, then layers revocation,
 * extension and algorithm checks on top.
 *
 * Besides its configuration a manager may hold a certificate store: a
 * size-bounded, expiring cache plus persistent trusted-root and intermediate
 * sets. Store operations are guarded by a mutex; validation against explicit
 * roots does not touch the store.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "providers.h"
#include "types.h"
#include "x509_certificate.h"

namespace pdftrust::validation {

/// @brief Content of a PKCS#12 container
struct Pkcs12Bundle {
    X509Certificate certificate;          ///< End-entity certificate
    std::vector<X509Certificate> chain;   ///< Additional CA certificates
    bool hasPrivateKey = false;
};

enum class CertificateSource {
    UPLOADED,
    CHAIN,
    TRUSTED_ROOT,
    INTERMEDIATE
};

std::string certificateSourceToString(CertificateSource source);

struct CertificateMetadata {
    CertificateSource source = CertificateSource::UPLOADED;
    std::string description;
};

struct CertificateStoreConfig {
    size_t maxCacheSize = 1000;
    std::chrono::milliseconds cacheExpiration{24 * 60 * 60 * 1000};
};

class CertificateManager {
public:
    CertificateManager() = default;

    /// @throws std::invalid_argument if maxCacheSize is 0
    explicit CertificateManager(CertificateStoreConfig config);

    CertificateManager(const CertificateManager&) = delete;
    CertificateManager& operator=(const CertificateManager&) = delete;

    /**
     * @brief Plug in a revocation source
     * @param checker Non-owning; nullptr disables revocation checks
     *
     * Without a checker every validation carries a "not checked" warning.
     */
    void setRevocationChecker(IRevocationChecker* checker) { revocationChecker_ = checker; }

    /**
     * @brief Evaluate validity windows at a fixed time instead of now
     */
    void setValidationTime(std::time_t at) { validationTime_ = at; }

    void setMaxChainDepth(int depth) { maxChainDepth_ = depth; }

    /// @name Loading
    /// @{

    /**
     * @brief Load every certificate of a PEM bundle
     * @throws common::CertificateException if none decodes
     */
    std::vector<X509Certificate> loadFromPem(const std::string& pemText) const;

    /**
     * @throws common::CertificateException on malformed DER
     */
    X509Certificate loadFromDer(const std::vector<uint8_t>& der) const;

    /**
     * @throws common::CertificateException on wrong password or corrupt container
     */
    Pkcs12Bundle loadFromPkcs12(const std::vector<uint8_t>& data, const std::string& password) const;

    /// @}

    CertificateInfo getCertificateInfo(const X509Certificate& cert) const;

    /// @name Validation
    /// @{

    /**
     * @brief Validate one certificate against the trusted roots
     *
     * Equivalent to validateCertificateChain({cert}, trustedRoots).
     *
     * @throws std::invalid_argument if trustedRoots is empty
     */
    CertificateValidationResult validateCertificate(
        const X509Certificate& cert,
        const std::vector<X509Certificate>& trustedRoots) const;

    /**
     * @brief Validate a chain, leaf first, against the trusted roots
     *
     * Certificates after the leaf serve as candidate intermediates in any order.
     * Expected failures are returned in the result, never thrown.
     *
     * @throws std::invalid_argument if chain or trustedRoots is empty
     */
    CertificateValidationResult validateCertificateChain(
        const std::vector<X509Certificate>& chain,
        const std::vector<X509Certificate>& trustedRoots) const;

    /**
     * @brief Result for the certificate at chain[index] of an already validated path
     *
     * Keeps the failures and warnings raised against that certificate and its
     * issuers, so a CA seen in a signer's path is not path-built again.
     *
     * @throws std::out_of_range if index is outside pathResult.chain
     */
    static CertificateValidationResult pathMemberResult(const CertificateValidationResult& pathResult,
                                                        size_t index);

    /**
     * @brief Validate against the stored trusted roots, stored intermediates as candidates
     * @throws std::invalid_argument if no trusted root is stored
     */
    CertificateValidationResult validateAgainstTrustedRoots(const X509Certificate& cert) const;

    /// @}

    /// @name Certificate store
    /// @{

    /**
     * @brief Cache a certificate; TRUSTED_ROOT and INTERMEDIATE sources also join those sets
     *
     * A full cache first evicts the oldest tenth of its entries.
     */
    void storeCertificate(const X509Certificate& cert, const CertificateMetadata& metadata);

    void addTrustedRoot(const X509Certificate& cert);

    /// Cached certificate by fingerprint; expired entries are dropped on lookup
    std::optional<X509Certificate> getCertificate(const std::string& fingerprint);

    /// Remove from the cache and from the trusted-root and intermediate sets
    void removeCertificate(const std::string& fingerprint);

    /// Empty the cache; trusted roots and intermediates persist
    void clearCache();

    std::vector<X509Certificate> trustedRoots() const;
    std::vector<X509Certificate> intermediates() const;
    size_t cacheSize() const;

    /// @}

private:
    struct CacheEntry {
        X509Certificate certificate;
        CertificateMetadata metadata;
        std::chrono::steady_clock::time_point expiresAt;
        uint64_t sequence = 0;
    };

    void evictOldestEntries();

    IRevocationChecker* revocationChecker_ = nullptr;
    std::time_t validationTime_ = 0;
    int maxChainDepth_ = 10;

    CertificateStoreConfig storeConfig_;
    mutable std::mutex storeMutex_;
    std::map<std::string, CacheEntry> cache_;
    std::map<std::string, X509Certificate> trustedRoots_;
    std::map<std::string, X509Certificate> intermediates_;
    uint64_t nextSequence_ = 0;
};

} // namespace pdftrust::validation
