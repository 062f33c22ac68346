/**
 * @file digital_signature_engine.h
 * @brief Extraction and cryptographic validation of PDF signatures
 *
 * A signature is valid iff the covered bytes hash to the signed message
 * digest, the signer key verifies the signature, the certificate chain
 * reaches a trusted root and any embedded timestamp verifies.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "types.h"
#include "pdftrust/pdf/pdf_document.h"
#include "pdftrust/tsp/timestamp_server_manager.h"
#include "pdftrust/validation/certificate_manager.h"

namespace pdftrust::signature {

/// Sub-filters whose /Contents is a detached CMS SignedData
inline constexpr const char* SUBFILTER_PKCS7_DETACHED = "adbe.pkcs7.detached";
inline constexpr const char* SUBFILTER_CADES_DETACHED = "ETSI.CAdES.detached";
/// Sub-filter whose CMS encapsulates the SHA-1 digest of the byte range
inline constexpr const char* SUBFILTER_PKCS7_SHA1 = "adbe.pkcs7.sha1";

/**
 * @brief Signature extraction and validation for one validation pass
 *
 * Chain results are cached per signer fingerprint, so an instance must not
 * be shared between concurrent passes.
 */
class DigitalSignatureEngine {
public:
    /**
     * @param certificateManager Chain validation (non-owning)
     * @param timestampManager Timestamp extraction and verification (non-owning)
     * @throws std::invalid_argument if either is nullptr
     */
    DigitalSignatureEngine(validation::CertificateManager* certificateManager,
                           tsp::TimestampServerManager* timestampManager);

    /// Skip timestamp verification (tokens are still extracted and reported)
    void setVerifyTimestamps(bool verify) { verifyTimestamps_ = verify; }

    std::vector<ExtractedSignature> extractSignatures(const pdf::PdfDocument& document) const;

    /**
     * @brief Run digest, signature, chain and timestamp checks
     * @throws std::invalid_argument if trustedRoots is empty and a chain has to be validated
     */
    SignatureValidationResult validateSignature(const ExtractedSignature& extracted,
                                                const std::vector<validation::X509Certificate>& trustedRoots);

    /// Chain results for the most recent trusted-root set, keyed by signer certificate fingerprint
    const std::map<std::string, validation::CertificateValidationResult>& validatedCertificates() const {
        return chainCache_;
    }

private:
    ExtractedSignature extractOne(const pdf::PdfDocument& document,
                                  const pdf::SignatureFieldInfo& field) const;

    const validation::CertificateValidationResult& validateChain(
        const cms::CMSSignature& signature,
        const std::vector<validation::X509Certificate>& trustedRoots);

    validation::CertificateManager* certificateManager_;
    tsp::TimestampServerManager* timestampManager_;
    bool verifyTimestamps_ = true;
    std::map<std::string, validation::CertificateValidationResult> chainCache_;
    std::string chainCacheRoots_;
};

} // namespace pdftrust::signature
