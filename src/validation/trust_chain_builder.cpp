/**
 * @file trust_chain_builder.cpp
 * @brief Trust chain builder implementation
 */

#include "pdftrust/validation/trust_chain_builder.h"
#include "pdftrust/validation/cert_ops.h"
#include "pdftrust/util/time_utils.h"

#include <set>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace pdftrust::validation {

namespace {

ChainFailure makeFailure(X509* cert, ChainRule rule, const std::string& detail) {
    ChainFailure f;
    std::string cn = getNameEntry(X509_get_subject_name(cert), NID_commonName);
    f.fingerprint = getCertificateFingerprint(cert);
    f.certificateSubject = cn.empty() ? f.fingerprint : cn;
    f.rule = rule;
    f.detail = detail;
    return f;
}

} // namespace

TrustChainBuilder::TrustChainBuilder(ICertificateProvider* provider)
    : provider_(provider)
{
    if (!provider_) {
        throw std::invalid_argument("TrustChainBuilder: provider cannot be nullptr");
    }
}

TrustChainResult TrustChainBuilder::build(X509* leafCert, int maxDepth) {
    TrustChainResult result;

    if (!leafCert) {
        result.message = "Leaf certificate is null";
        return result;
    }

    // Candidates fetched from the provider; freed when the result is assembled
    std::vector<X509Ptr> owned;
    std::vector<X509*> chain;
    chain.push_back(leafCert);

    X509* current = leafCert;
    std::set<std::string> visited;
    bool depthExceeded = true;

    while (static_cast<int>(chain.size()) <= maxDepth) {
        std::string fingerprint = getCertificateFingerprint(current);

        if (!visited.insert(fingerprint).second) {
            result.failures.push_back(makeFailure(current, ChainRule::CIRCULAR_CHAIN,
                "certificate appears twice in the path at depth " + std::to_string(chain.size())));
            chain.pop_back();
            depthExceeded = false;
            break;
        }

        if (provider_->isTrustAnchor(fingerprint)) {
            // A self-signed anchor must verify its own signature (RFC 5280 Section 6.1)
            if (isSelfSigned(current) && !verifyCertificateSignature(current, current)) {
                result.failures.push_back(makeFailure(current, ChainRule::SIGNATURE_INVALID,
                    "trusted root self-signature does not verify"));
            }
            result.reachedTrustAnchor = true;
            result.rootSubjectDn = getSubjectDn(current);
            result.rootFingerprint = fingerprint;
            depthExceeded = false;
            break;
        }

        if (isSelfSigned(current)) {
            result.failures.push_back(makeFailure(current, ChainRule::UNTRUSTED_ROOT,
                "self-signed certificate is not in the trusted-root set"));
            depthExceeded = false;
            break;
        }

        std::string issuerDn = getIssuerDn(current);
        std::vector<X509*> candidates = provider_->findIssuersBySubjectDn(issuerDn);

        X509* issuer = nullptr;
        X509* dnMatchOnly = nullptr;
        for (X509* candidate : candidates) {
            owned.emplace_back(candidate);
            if (issuer) continue;
            // Provider matching is advisory; re-check the DN here
            if (!dnEquals(issuerDn, getSubjectDn(candidate))) continue;
            if (verifyCertificateSignature(current, candidate)) {
                issuer = candidate;
            } else if (!dnMatchOnly) {
                dnMatchOnly = candidate;
            }
        }

        if (!issuer) {
            if (dnMatchOnly) {
                result.failures.push_back(makeFailure(current, ChainRule::SIGNATURE_INVALID,
                    "signature does not verify with the public key of issuer " + getSubjectDn(dnMatchOnly)));
            } else {
                result.failures.push_back(makeFailure(current, ChainRule::ISSUER_MISMATCH,
                    "issuer " + issuerDn.substr(0, 120) +
                    " matches the subject of no available certificate"));
            }
            depthExceeded = false;
            break;
        }

        chain.push_back(issuer);
        current = issuer;
    }

    if (depthExceeded) {
        result.failures.push_back(makeFailure(leafCert, ChainRule::CHAIN_TOO_LONG,
            "no trust anchor within " + std::to_string(maxDepth) + " certificates"));
        chain.resize(static_cast<size_t>(maxDepth));
    }

    // Validity window of every certificate in the path
    std::time_t at = validationTime_ != 0 ? validationTime_ : std::time(nullptr);
    for (X509* cert : chain) {
        if (isCertificateNotYetValid(cert, at)) {
            result.failures.push_back(makeFailure(cert, ChainRule::NOT_YET_VALID,
                "not valid before " + util::asn1TimeToIso8601(X509_get0_notBefore(cert))));
        } else if (isCertificateExpired(cert, at)) {
            result.failures.push_back(makeFailure(cert, ChainRule::EXPIRED,
                "expired at " + util::asn1TimeToIso8601(X509_get0_notAfter(cert))));
        }
    }

    // Human-readable path and value copies
    result.depth = static_cast<int>(chain.size());
    for (size_t i = 0; i < chain.size(); i++) {
        result.chain.push_back(X509Certificate::fromX509(chain[i]));
        if (i == 0) {
            result.path = "Signer";
        } else if (i + 1 == chain.size() && result.reachedTrustAnchor) {
            result.path += isSelfSigned(chain[i]) ? " -> Root" : " -> Trusted CA";
        } else {
            result.path += " -> CA";
        }
    }

    result.valid = result.reachedTrustAnchor && result.failures.empty();
    if (!result.failures.empty()) {
        result.message = result.failures.front().describe();
    }

    spdlog::debug("[TrustChainBuilder] path={} depth={} valid={} failures={}",
                  result.path, result.depth, result.valid, result.failures.size());
    return result;
}

} // namespace pdftrust::validation
