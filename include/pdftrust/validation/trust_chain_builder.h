/**
 * @file trust_chain_builder.h
 * @brief Certification path builder (RFC 5280 Section 6.1, simplified)
 *
 * Builds and validates Signer -> (CA ...) -> trusted root paths using an
 * ICertificateProvider for issuer lookup.
 *
 * At every hop: the child's issuer DN equals the parent's subject DN and the
 * parent's public key verifies the child's signature. Every certificate in
 * the path must be inside its validity window at the validation time.
 */

#pragma once

#include <ctime>
#include <openssl/x509.h>
#include "types.h"
#include "providers.h"

namespace pdftrust::validation {

/**
 * @brief Trust chain builder
 *
 * Usage:
 * @code
 *   CertificatePool pool(intermediates, trustedRoots);
 *   TrustChainBuilder builder(&pool);
 *   TrustChainResult result = builder.build(signerCert);
 * @endcode
 */
class TrustChainBuilder {
public:
    /**
     * @brief Constructor
     * @param provider Issuer lookup provider (non-owning)
     * @throws std::invalid_argument if provider is nullptr
     */
    explicit TrustChainBuilder(ICertificateProvider* provider);

    /**
     * @brief Evaluate validity windows at a fixed time instead of now
     */
    void setValidationTime(std::time_t at) { validationTime_ = at; }

    /**
     * @brief Build and validate the path from a leaf certificate to a trust anchor
     *
     * Algorithm:
     * 1. Stop successfully when the current certificate is a trust anchor
     *    (a self-signed anchor must also verify its own signature)
     * 2. Find all candidates whose subject matches the current issuer DN
     * 3. Select the candidate whose key verifies the current signature (key rollover)
     * 4. Repeat until an anchor, an untrusted self-signed root, or maxDepth
     * 5. Check the validity window of every certificate in the path
     *
     * @param leafCert Leaf certificate, non-owning, not freed
     * @param maxDepth Maximum number of certificates in the path (default: 10)
     * @return TrustChainResult with one ChainFailure per broken rule
     */
    TrustChainResult build(X509* leafCert, int maxDepth = 10);

private:
    ICertificateProvider* provider_;
    std::time_t validationTime_ = 0;
};

} // namespace pdftrust::validation
