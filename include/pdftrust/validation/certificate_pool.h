/**
 * @file certificate_pool.h
 * @brief In-memory ICertificateProvider over intermediates and trust anchors
 */

#pragma once

#include <set>
#include <string>
#include <vector>

#include "providers.h"
#include "x509_certificate.h"

namespace pdftrust::validation {

/**
 * @brief Candidate issuers for one path-building run
 *
 * Trust anchors are candidates as well as anchors, so a path may end at a
 * trusted intermediate without reaching a self-signed root.
 */
class CertificatePool : public ICertificateProvider {
public:
    CertificatePool(const std::vector<X509Certificate>& intermediates,
                    const std::vector<X509Certificate>& trustAnchors);

    std::vector<X509*> findIssuersBySubjectDn(const std::string& subjectDn) override;
    bool isTrustAnchor(const std::string& fingerprint) const override;

    size_t size() const { return certificates_.size(); }

private:
    std::vector<X509Certificate> certificates_;
    std::set<std::string> anchorFingerprints_;
};

} // namespace pdftrust::validation
