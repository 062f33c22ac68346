/**
 * @file extension_validator.cpp
 * @brief X.509 extension validation implementation
 */

#include "pdftrust/validation/extension_validator.h"
#include "pdftrust/validation/cert_ops.h"

#include <openssl/objects.h>
#include <openssl/x509v3.h>

namespace pdftrust::validation {

ExtensionValidationResult validateExtensions(X509* cert, CertificateRole role) {
    ExtensionValidationResult result;

    if (!cert) {
        result.valid = false;
        result.warnings.push_back("Certificate is null");
        return result;
    }

    // RFC 5280 Section 4.2: Check for unknown critical extensions
    int extCount = X509_get_ext_count(cert);
    for (int i = 0; i < extCount; i++) {
        X509_EXTENSION* ext = X509_get_ext(cert, i);
        if (!ext || !X509_EXTENSION_get_critical(ext)) continue;

        ASN1_OBJECT* obj = X509_EXTENSION_get_object(ext);
        int nid = OBJ_obj2nid(obj);
        if (nid == NID_basic_constraints ||
            nid == NID_key_usage ||
            nid == NID_certificate_policies ||
            nid == NID_subject_key_identifier ||
            nid == NID_authority_key_identifier ||
            nid == NID_name_constraints ||
            nid == NID_policy_constraints ||
            nid == NID_inhibit_any_policy ||
            nid == NID_subject_alt_name ||
            nid == NID_issuer_alt_name ||
            nid == NID_crl_distribution_points ||
            nid == NID_ext_key_usage) {
            continue;  // Known extension
        }

        char oidBuf[80];
        OBJ_obj2txt(oidBuf, sizeof(oidBuf), obj, 1);
        result.warnings.push_back("Unknown critical extension: " + std::string(oidBuf));
    }

    ASN1_BIT_STRING* usage = static_cast<ASN1_BIT_STRING*>(
        X509_get_ext_d2i(cert, NID_key_usage, nullptr, nullptr));

    switch (role) {
        case CertificateRole::SIGNER:
            // digitalSignature (bit 0) or nonRepudiation (bit 1)
            if (usage && !ASN1_BIT_STRING_get_bit(usage, 0) && !ASN1_BIT_STRING_get_bit(usage, 1)) {
                result.warnings.push_back("Signer certificate lacks digitalSignature and nonRepudiation key usage");
            }
            break;

        case CertificateRole::CA:
            if (!isCaCertificate(cert)) {
                result.warnings.push_back("Issuing certificate lacks BasicConstraints CA:TRUE");
            }
            // keyCertSign (bit 5)
            if (usage && !ASN1_BIT_STRING_get_bit(usage, 5)) {
                result.warnings.push_back("Issuing certificate missing keyCertSign key usage");
            }
            break;

        case CertificateRole::TSA: {
            int critical = 0;
            EXTENDED_KEY_USAGE* eku = static_cast<EXTENDED_KEY_USAGE*>(
                X509_get_ext_d2i(cert, NID_ext_key_usage, &critical, nullptr));
            if (!eku) {
                result.warnings.push_back("TSA certificate has no extendedKeyUsage extension");
            } else {
                if (!hasExtendedKeyUsage(cert, NID_time_stamp)) {
                    result.warnings.push_back("TSA certificate extendedKeyUsage does not include timeStamping");
                } else if (sk_ASN1_OBJECT_num(eku) != 1) {
                    result.warnings.push_back("TSA certificate extendedKeyUsage lists purposes besides timeStamping");
                }
                if (critical != 1) {
                    result.warnings.push_back("TSA certificate extendedKeyUsage is not critical");
                }
                sk_ASN1_OBJECT_pop_free(eku, ASN1_OBJECT_free);
            }
            break;
        }
    }

    if (usage) ASN1_BIT_STRING_free(usage);

    result.valid = result.warnings.empty();
    return result;
}

} // namespace pdftrust::validation
