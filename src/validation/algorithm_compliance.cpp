/**
 * @file algorithm_compliance.cpp
 * @brief Algorithm compliance check implementation
 */

#include "pdftrust/validation/algorithm_compliance.h"
#include <memory>
#include <string>
#include <openssl/evp.h>
#include <openssl/objects.h>

namespace pdftrust::validation {

namespace {

constexpr int MIN_RSA_BITS = 2048;
constexpr int MIN_EC_BITS = 256;

enum class AlgorithmStatus { ACCEPTED, DEPRECATED, REJECTED };

AlgorithmStatus classifySignatureNid(int nid) {
    switch (nid) {
        case NID_sha224WithRSAEncryption:
        case NID_sha256WithRSAEncryption:
        case NID_sha384WithRSAEncryption:
        case NID_sha512WithRSAEncryption:
        case NID_ecdsa_with_SHA224:
        case NID_ecdsa_with_SHA256:
        case NID_ecdsa_with_SHA384:
        case NID_ecdsa_with_SHA512:
        case NID_rsassaPss:
        case NID_ED25519:
        case NID_ED448:
            return AlgorithmStatus::ACCEPTED;
        case NID_sha1WithRSAEncryption:
        case NID_ecdsa_with_SHA1:
        case NID_dsaWithSHA1:
            return AlgorithmStatus::DEPRECATED;
        default:
            return AlgorithmStatus::REJECTED;
    }
}

void appendWarning(AlgorithmComplianceResult& result, const std::string& warning) {
    if (!result.warning.empty()) result.warning += "; ";
    result.warning += warning;
}

} // namespace

AlgorithmComplianceResult validateAlgorithmCompliance(X509* cert) {
    AlgorithmComplianceResult result;

    if (!cert) {
        result.compliant = false;
        result.warning = "Certificate is null";
        return result;
    }

    int sigNid = X509_get_signature_nid(cert);
    const char* sn = OBJ_nid2sn(sigNid);
    result.algorithm = sn ? sn : "UNKNOWN";

    switch (classifySignatureNid(sigNid)) {
        case AlgorithmStatus::ACCEPTED:
            result.compliant = true;
            break;
        case AlgorithmStatus::DEPRECATED:
            result.compliant = true;
            appendWarning(result, "SHA-1 signature algorithm " + result.algorithm + " is deprecated");
            break;
        case AlgorithmStatus::REJECTED:
            result.compliant = false;
            appendWarning(result, sigNid == NID_md5WithRSAEncryption
                                      ? "MD5 signature algorithm is insecure"
                                      : "Unknown or unsupported signature algorithm: " + result.algorithm);
            break;
    }

    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey(X509_get_pubkey(cert), EVP_PKEY_free);
    if (!pkey) {
        return result;
    }

    result.keyBits = EVP_PKEY_bits(pkey.get());
    switch (EVP_PKEY_base_id(pkey.get())) {
        case EVP_PKEY_RSA:
        case EVP_PKEY_RSA_PSS:
            if (result.keyBits < MIN_RSA_BITS) {
                appendWarning(result, "RSA key size " + std::to_string(result.keyBits) +
                                          " bits is below minimum of " + std::to_string(MIN_RSA_BITS) + " bits");
            }
            break;
        case EVP_PKEY_EC:
            if (result.keyBits < MIN_EC_BITS) {
                appendWarning(result, "EC key size " + std::to_string(result.keyBits) +
                                          " bits is below minimum of " + std::to_string(MIN_EC_BITS) + " bits");
            }
            break;
        default:
            break;
    }

    return result;
}

} // namespace pdftrust::validation
