/**
 * @file cms_signature.h
 * @brief CMS / PKCS#7 SignedData parsing for detached document signatures
 *
 * Decodes one SignedData with OpenSSL's CMS API into a plain value: signer
 * info with its attributes, the certificate set ordered signer first, and the
 * raw DER for later re-verification.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pdftrust/tsp/types.h"
#include "pdftrust/validation/x509_certificate.h"

namespace pdftrust::cms {

/// Attribute OIDs (RFC 5652 Section 11)
inline constexpr const char* CONTENT_TYPE_OID = "1.2.840.113549.1.9.3";
inline constexpr const char* MESSAGE_DIGEST_OID = "1.2.840.113549.1.9.4";
inline constexpr const char* SIGNING_TIME_OID = "1.2.840.113549.1.9.5";

struct CmsAttribute {
    std::string oid;
    std::vector<uint8_t> value;   ///< DER of the first AttributeValue
};

struct SignerInfo {
    std::vector<CmsAttribute> signedAttributes;
    std::vector<CmsAttribute> unsignedAttributes;
    std::string digestAlgorithm;      ///< Dotted OID
    std::string signatureAlgorithm;   ///< Dotted OID
    std::vector<uint8_t> signature;   ///< SignerInfo.signature value
    std::optional<std::vector<uint8_t>> messageDigest;
    std::optional<std::chrono::system_clock::time_point> signingTime;

    bool hasSignedAttributes() const { return !signedAttributes.empty(); }
};

/**
 * @brief Parsed SignedData
 *
 * Holds at most one RFC 3161 timestamp, located among the unsigned attributes.
 */
struct CMSSignature {
    SignerInfo signerInfo;
    std::vector<validation::X509Certificate> certificates;  ///< Signer first, then issuers
    bool signerCertificateFound = false;
    std::vector<uint8_t> content;                 ///< Bytes the signature covers
    std::optional<std::vector<uint8_t>> encapsulatedContent;
    std::string encapsulatedContentType;          ///< Dotted OID
    std::optional<tsp::Timestamp> timestamp;
    std::vector<uint8_t> raw;                     ///< ContentInfo DER

    const validation::X509Certificate* signerCertificate() const {
        return (signerCertificateFound && !certificates.empty()) ? &certificates.front() : nullptr;
    }

    bool isDetached() const { return !encapsulatedContent.has_value(); }
};

/// @brief Outcome of the signer signature check
struct SignerVerification {
    bool verified = false;
    std::string error;
};

/**
 * @brief Decode a ContentInfo holding SignedData
 *
 * @param der ContentInfo DER; trailing bytes after the outer TLV are ignored
 * @param content Detached content the signature covers (moved into the result)
 * @throws common::ParsingException when der is not a SignedData with a signer
 */
CMSSignature parseCmsSignature(const std::vector<uint8_t>& der,
                               std::vector<uint8_t> content = {});

/**
 * @brief Verify the signer's signature with the signer certificate's public key
 *
 * With signed attributes the signature covers their DER encoding (RFC 5652
 * Section 5.4). Without them it covers the content directly.
 */
SignerVerification verifySignerSignature(const CMSSignature& signature);

/**
 * @brief Append an unsigned attribute to the first signer and re-encode
 *
 * @param der ContentInfo DER
 * @param oid Attribute type
 * @param valueDer Complete DER encoding of a SEQUENCE attribute value
 * @return New ContentInfo DER
 * @throws common::ParsingException on decode or encode failure
 */
std::vector<uint8_t> addUnsignedAttribute(const std::vector<uint8_t>& der,
                                          const std::string& oid,
                                          const std::vector<uint8_t>& valueDer);

/**
 * @brief Total length of the DER TLV starting at data[0]
 * @return Header plus content length, or 0 for indefinite or malformed input
 */
size_t derEncodedLength(const uint8_t* data, size_t size);

/**
 * @brief Length of the ContentInfo at the start of a zero-padded buffer
 *
 * Definite lengths come from the TLV header. BER indefinite-length encodings
 * (streaming signers) are measured by parsing up to the end-of-contents octets.
 *
 * @return Encoded length, or 0 if no ContentInfo starts at data[0]
 */
size_t cmsEncodedLength(const std::vector<uint8_t>& data);

} // namespace pdftrust::cms
