/**
 * @file certificate_pool.cpp
 * @brief CertificatePool implementation
 */

#include "pdftrust/validation/certificate_pool.h"
#include "pdftrust/validation/cert_ops.h"

namespace pdftrust::validation {

CertificatePool::CertificatePool(const std::vector<X509Certificate>& intermediates,
                                 const std::vector<X509Certificate>& trustAnchors)
{
    std::set<std::string> seen;
    for (const auto& anchor : trustAnchors) {
        anchorFingerprints_.insert(anchor.fingerprint);
        if (seen.insert(anchor.fingerprint).second) {
            certificates_.push_back(anchor);
        }
    }
    for (const auto& cert : intermediates) {
        if (seen.insert(cert.fingerprint).second) {
            certificates_.push_back(cert);
        }
    }
}

std::vector<X509*> CertificatePool::findIssuersBySubjectDn(const std::string& subjectDn) {
    std::vector<X509*> result;
    std::string wanted = normalizeDnForComparison(subjectDn);
    for (const auto& cert : certificates_) {
        if (normalizeDnForComparison(cert.subject) == wanted) {
            result.push_back(cert.toX509().release());
        }
    }
    return result;
}

bool CertificatePool::isTrustAnchor(const std::string& fingerprint) const {
    return anchorFingerprints_.count(fingerprint) > 0;
}

} // namespace pdftrust::validation
