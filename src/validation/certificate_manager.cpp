/**
 * @file certificate_manager.cpp
 * @brief CertificateManager implementation
 */

#include "pdftrust/validation/certificate_manager.h"
#include "pdftrust/validation/algorithm_compliance.h"
#include "pdftrust/validation/cert_ops.h"
#include "pdftrust/validation/certificate_pool.h"
#include "pdftrust/validation/extension_validator.h"
#include "pdftrust/validation/trust_chain_builder.h"
#include "pdftrust/common/exceptions.h"
#include "pdftrust/util/time_utils.h"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/pkcs12.h>
#include <openssl/x509v3.h>
#include <spdlog/spdlog.h>

namespace pdftrust::validation {

namespace {

const char* const KEY_USAGE_NAMES[] = {
    "digitalSignature", "nonRepudiation", "keyEncipherment", "dataEncipherment",
    "keyAgreement", "keyCertSign", "cRLSign", "encipherOnly", "decipherOnly"
};

bool isPathRule(ChainRule rule) {
    return rule == ChainRule::ISSUER_MISMATCH || rule == ChainRule::SIGNATURE_INVALID ||
           rule == ChainRule::CHAIN_TOO_LONG || rule == ChainRule::CIRCULAR_CHAIN ||
           rule == ChainRule::UNTRUSTED_ROOT;
}

} // namespace

// --- Loading ---

std::vector<X509Certificate> CertificateManager::loadFromPem(const std::string& pemText) const {
    BIO* bio = BIO_new_mem_buf(pemText.data(), static_cast<int>(pemText.size()));
    if (!bio) {
        throw common::CertificateException("cannot allocate BIO for PEM input");
    }

    std::vector<X509Certificate> certs;
    X509* cert = nullptr;
    while ((cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr)) != nullptr) {
        X509Ptr holder(cert);
        certs.push_back(X509Certificate::fromX509(holder.get()));
    }
    // PEM reader signals end of input through the error queue
    ERR_clear_error();
    BIO_free(bio);

    if (certs.empty()) {
        throw common::CertificateException("no certificate found in PEM input");
    }
    spdlog::debug("[CertificateManager] Loaded {} certificate(s) from PEM", certs.size());
    return certs;
}

X509Certificate CertificateManager::loadFromDer(const std::vector<uint8_t>& der) const {
    return X509Certificate::fromDer(der);
}

Pkcs12Bundle CertificateManager::loadFromPkcs12(const std::vector<uint8_t>& data,
                                                const std::string& password) const {
    BIO* bio = BIO_new_mem_buf(data.data(), static_cast<int>(data.size()));
    if (!bio) {
        throw common::CertificateException("cannot allocate BIO for PKCS#12 input");
    }
    PKCS12* p12 = d2i_PKCS12_bio(bio, nullptr);
    BIO_free(bio);
    if (!p12) {
        throw common::CertificateException("malformed PKCS#12 container: " + drainOpenSslErrors());
    }

    EVP_PKEY* pkey = nullptr;
    X509* cert = nullptr;
    STACK_OF(X509)* ca = nullptr;
    int ok = PKCS12_parse(p12, password.c_str(), &pkey, &cert, &ca);
    PKCS12_free(p12);
    if (ok != 1) {
        throw common::CertificateException(
            "cannot open PKCS#12 container (wrong password or corrupt data): " + drainOpenSslErrors());
    }

    Pkcs12Bundle bundle;
    bundle.hasPrivateKey = (pkey != nullptr);
    EVP_PKEY_free(pkey);

    try {
        if (!cert) {
            throw common::CertificateException("PKCS#12 container holds no end-entity certificate");
        }
        bundle.certificate = X509Certificate::fromX509(cert);
        for (int i = 0; ca && i < sk_X509_num(ca); i++) {
            bundle.chain.push_back(X509Certificate::fromX509(sk_X509_value(ca, i)));
        }
    } catch (...) {
        X509_free(cert);
        sk_X509_pop_free(ca, X509_free);
        throw;
    }
    X509_free(cert);
    sk_X509_pop_free(ca, X509_free);

    spdlog::debug("[CertificateManager] Loaded PKCS#12: {} (+{} CA certificates)",
                  bundle.certificate.displayName(), bundle.chain.size());
    return bundle;
}

// --- Inspection ---

CertificateInfo CertificateManager::getCertificateInfo(const X509Certificate& cert) const {
    X509Ptr x509 = cert.toX509();
    X509* c = x509.get();

    CertificateInfo info;
    info.subject = cert.subject;
    info.issuer = cert.issuer;
    info.commonName = cert.commonName;
    info.organization = getNameEntry(X509_get_subject_name(c), NID_organizationName);
    info.country = getNameEntry(X509_get_subject_name(c), NID_countryName);
    info.serialNumber = cert.serialNumber;
    info.notBefore = util::formatIso8601(cert.notBefore);
    info.notAfter = util::formatIso8601(cert.notAfter);
    info.fingerprint = cert.fingerprint;
    info.signatureAlgorithm = cert.signatureAlgorithm;

    EVP_PKEY* pkey = X509_get_pubkey(c);
    if (pkey) {
        const char* keyName = OBJ_nid2sn(EVP_PKEY_base_id(pkey));
        info.publicKeyAlgorithm = keyName ? keyName : "UNKNOWN";
        info.publicKeyBits = EVP_PKEY_bits(pkey);
        EVP_PKEY_free(pkey);
    }

    ASN1_BIT_STRING* usage = static_cast<ASN1_BIT_STRING*>(
        X509_get_ext_d2i(c, NID_key_usage, nullptr, nullptr));
    if (usage) {
        for (int bit = 0; bit < 9; bit++) {
            if (ASN1_BIT_STRING_get_bit(usage, bit)) {
                info.keyUsage.push_back(KEY_USAGE_NAMES[bit]);
            }
        }
        ASN1_BIT_STRING_free(usage);
    }

    EXTENDED_KEY_USAGE* eku = static_cast<EXTENDED_KEY_USAGE*>(
        X509_get_ext_d2i(c, NID_ext_key_usage, nullptr, nullptr));
    if (eku) {
        for (int i = 0; i < sk_ASN1_OBJECT_num(eku); i++) {
            char buf[80];
            OBJ_obj2txt(buf, sizeof(buf), sk_ASN1_OBJECT_value(eku, i), 0);
            info.extendedKeyUsage.push_back(buf);
        }
        sk_ASN1_OBJECT_pop_free(eku, ASN1_OBJECT_free);
    }

    std::time_t at = validationTime_ != 0 ? validationTime_ : std::time(nullptr);
    info.isCa = isCaCertificate(c);
    info.isSelfSigned = isSelfSigned(c);
    info.isExpired = isCertificateExpired(c, at);
    info.isNotYetValid = isCertificateNotYetValid(c, at);
    return info;
}

// --- Validation ---

CertificateValidationResult CertificateManager::validateCertificate(
    const X509Certificate& cert,
    const std::vector<X509Certificate>& trustedRoots) const
{
    return validateCertificateChain({cert}, trustedRoots);
}

CertificateValidationResult CertificateManager::validateCertificateChain(
    const std::vector<X509Certificate>& chain,
    const std::vector<X509Certificate>& trustedRoots) const
{
    if (chain.empty()) {
        throw std::invalid_argument("CertificateManager: certificate chain cannot be empty");
    }
    if (trustedRoots.empty()) {
        throw std::invalid_argument("CertificateManager: trusted root set cannot be empty");
    }

    const X509Certificate& leaf = chain.front();

    CertificateValidationResult result;
    result.subject = leaf.subject;
    result.commonName = leaf.commonName;
    result.fingerprint = leaf.fingerprint;

    // Step 1: Path building
    CertificatePool pool(std::vector<X509Certificate>(chain.begin() + 1, chain.end()), trustedRoots);
    TrustChainBuilder builder(&pool);
    if (validationTime_ != 0) {
        builder.setValidationTime(validationTime_);
    }
    X509Ptr leafX509 = leaf.toX509();
    TrustChainResult path = builder.build(leafX509.get(), maxChainDepth_);

    result.chainPath = path.path;
    result.depth = path.depth;
    result.chain = path.chain;
    result.failures = path.failures;
    result.trustedRoot = path.reachedTrustAnchor;

    // Step 2: Decode the path once for the remaining checks
    std::vector<X509Ptr> pathX509;
    for (const auto& c : path.chain) {
        pathX509.push_back(c.toX509());
    }

    // Step 3: Revocation (pluggable)
    if (revocationChecker_) {
        result.revocationChecked = true;
        for (size_t i = 0; i + 1 < pathX509.size(); i++) {
            RevocationCheckResult rev = revocationChecker_->check(pathX509[i].get(), pathX509[i + 1].get());
            const std::string name = path.chain[i].displayName();
            switch (rev.status) {
                case RevocationStatus::GOOD:
                    break;
                case RevocationStatus::REVOKED: {
                    result.notRevoked = false;
                    ChainFailure f;
                    f.certificateSubject = name;
                    f.fingerprint = path.chain[i].fingerprint;
                    f.rule = ChainRule::REVOKED;
                    f.detail = rev.revocationReason.empty()
                        ? rev.message
                        : rev.message + " (reason: " + rev.revocationReason + ")";
                    result.failures.push_back(f);
                    break;
                }
                default:
                    result.warnings.push_back("Revocation status of '" + name + "' unknown: " +
                                              revocationStatusToString(rev.status) + " - " + rev.message);
                    break;
            }
        }
    } else {
        result.warnings.push_back("Revocation status not checked (no revocation checker configured)");
    }

    // Step 4: Extension and algorithm findings (warnings only)
    for (size_t i = 0; i < pathX509.size(); i++) {
        std::string prefix = (i == 0) ? "" : "issuer '" + path.chain[i].displayName() + "': ";
        CertificateRole role = (i == 0) ? CertificateRole::SIGNER : CertificateRole::CA;

        ExtensionValidationResult ext = validateExtensions(pathX509[i].get(), role);
        for (const auto& w : ext.warnings) {
            result.warnings.push_back(prefix + w);
        }
        AlgorithmComplianceResult alg = validateAlgorithmCompliance(pathX509[i].get());
        if (!alg.warning.empty()) {
            result.warnings.push_back(prefix + alg.warning);
        }
    }

    // Step 5: Summaries
    result.chainValid = path.reachedTrustAnchor;
    result.notExpired = true;
    for (const auto& f : result.failures) {
        if (isPathRule(f.rule)) result.chainValid = false;
        if (f.rule == ChainRule::EXPIRED || f.rule == ChainRule::NOT_YET_VALID) result.notExpired = false;
        result.errors.push_back(f.describe());
    }
    result.isValid = result.errors.empty();

    spdlog::info("[CertificateManager] Chain for '{}': valid={}, path={}, errors={}, warnings={}",
                 leaf.displayName(), result.isValid, result.chainPath,
                 result.errors.size(), result.warnings.size());
    return result;
}

CertificateValidationResult CertificateManager::validateAgainstTrustedRoots(const X509Certificate& cert) const {
    std::vector<X509Certificate> chain{cert};
    std::vector<X509Certificate> roots;
    {
        std::lock_guard<std::mutex> lock(storeMutex_);
        for (const auto& [fingerprint, intermediate] : intermediates_) {
            if (fingerprint != cert.fingerprint) chain.push_back(intermediate);
        }
        for (const auto& [fingerprint, root] : trustedRoots_) {
            roots.push_back(root);
        }
    }
    if (roots.empty()) {
        throw std::invalid_argument("CertificateManager: no trusted root in the certificate store");
    }
    return validateCertificateChain(chain, roots);
}

// --- Certificate store ---

std::string certificateSourceToString(CertificateSource source) {
    switch (source) {
        case CertificateSource::UPLOADED:     return "uploaded";
        case CertificateSource::CHAIN:        return "chain";
        case CertificateSource::TRUSTED_ROOT: return "trusted_root";
        case CertificateSource::INTERMEDIATE: return "intermediate";
    }
    return "unknown";
}

CertificateManager::CertificateManager(CertificateStoreConfig config)
    : storeConfig_(config)
{
    if (storeConfig_.maxCacheSize == 0) {
        throw std::invalid_argument("CertificateManager: maxCacheSize must be at least 1");
    }
}

void CertificateManager::storeCertificate(const X509Certificate& cert, const CertificateMetadata& metadata) {
    std::lock_guard<std::mutex> lock(storeMutex_);

    if (cache_.find(cert.fingerprint) == cache_.end() && cache_.size() >= storeConfig_.maxCacheSize) {
        evictOldestEntries();
    }

    CacheEntry entry;
    entry.certificate = cert;
    entry.metadata = metadata;
    entry.expiresAt = std::chrono::steady_clock::now() + storeConfig_.cacheExpiration;
    entry.sequence = nextSequence_++;
    cache_[cert.fingerprint] = std::move(entry);

    if (metadata.source == CertificateSource::TRUSTED_ROOT) {
        trustedRoots_[cert.fingerprint] = cert;
    } else if (metadata.source == CertificateSource::INTERMEDIATE) {
        intermediates_[cert.fingerprint] = cert;
    }
    spdlog::debug("[CertificateManager] Stored '{}' ({}), cache size {}",
                  cert.displayName(), certificateSourceToString(metadata.source), cache_.size());
}

void CertificateManager::addTrustedRoot(const X509Certificate& cert) {
    CertificateMetadata metadata;
    metadata.source = CertificateSource::TRUSTED_ROOT;
    metadata.description = "Trusted root CA certificate";
    storeCertificate(cert, metadata);
}

std::optional<X509Certificate> CertificateManager::getCertificate(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(storeMutex_);
    auto it = cache_.find(fingerprint);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    if (std::chrono::steady_clock::now() >= it->second.expiresAt) {
        cache_.erase(it);
        return std::nullopt;
    }
    return it->second.certificate;
}

void CertificateManager::removeCertificate(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(storeMutex_);
    cache_.erase(fingerprint);
    trustedRoots_.erase(fingerprint);
    intermediates_.erase(fingerprint);
}

void CertificateManager::clearCache() {
    std::lock_guard<std::mutex> lock(storeMutex_);
    cache_.clear();
}

std::vector<X509Certificate> CertificateManager::trustedRoots() const {
    std::lock_guard<std::mutex> lock(storeMutex_);
    std::vector<X509Certificate> out;
    for (const auto& [fingerprint, cert] : trustedRoots_) out.push_back(cert);
    return out;
}

std::vector<X509Certificate> CertificateManager::intermediates() const {
    std::lock_guard<std::mutex> lock(storeMutex_);
    std::vector<X509Certificate> out;
    for (const auto& [fingerprint, cert] : intermediates_) out.push_back(cert);
    return out;
}

size_t CertificateManager::cacheSize() const {
    std::lock_guard<std::mutex> lock(storeMutex_);
    return cache_.size();
}

// Caller holds storeMutex_
void CertificateManager::evictOldestEntries() {
    std::vector<std::pair<uint64_t, std::string>> bySequence;
    for (const auto& [fingerprint, entry] : cache_) {
        bySequence.emplace_back(entry.sequence, fingerprint);
    }
    std::sort(bySequence.begin(), bySequence.end());

    size_t toRemove = (bySequence.size() + 9) / 10;
    for (size_t i = 0; i < toRemove; i++) {
        cache_.erase(bySequence[i].second);
    }
    spdlog::debug("[CertificateManager] Evicted {} cache entries", toRemove);
}

CertificateValidationResult CertificateManager::pathMemberResult(const CertificateValidationResult& pathResult,
                                                                 size_t index)
{
    if (index >= pathResult.chain.size()) {
        throw std::out_of_range("CertificateManager: path index " + std::to_string(index) +
                                " outside a path of " + std::to_string(pathResult.chain.size()));
    }
    if (index == 0) {
        return pathResult;
    }

    const X509Certificate& member = pathResult.chain[index];

    CertificateValidationResult result;
    result.subject = member.subject;
    result.commonName = member.commonName;
    result.fingerprint = member.fingerprint;
    result.chain.assign(pathResult.chain.begin() + static_cast<long>(index), pathResult.chain.end());
    result.depth = static_cast<int>(result.chain.size());
    result.trustedRoot = pathResult.trustedRoot;
    result.revocationChecked = pathResult.revocationChecked;

    // "Signer -> CA -> Root" minus the hops below this member
    std::string path = pathResult.chainPath;
    for (size_t i = 0; i < index; i++) {
        size_t arrow = path.find(" -> ");
        path = arrow == std::string::npos ? "" : path.substr(arrow + 4);
    }
    result.chainPath = path;

    std::set<std::string> upper;
    std::vector<std::string> upperNames;
    for (const auto& c : result.chain) {
        upper.insert(c.fingerprint);
        upperNames.push_back(c.displayName());
    }

    // Only failures raised against this member or its issuers carry over
    for (const auto& f : pathResult.failures) {
        if (f.fingerprint.empty() || upper.count(f.fingerprint)) {
            result.failures.push_back(f);
        }
    }

    const std::string ownPrefix = "issuer '" + member.displayName() + "': ";
    for (const auto& w : pathResult.warnings) {
        if (w.rfind(ownPrefix, 0) == 0) {
            result.warnings.push_back(w.substr(ownPrefix.size()));
            continue;
        }
        bool keep = w.rfind("Revocation status not checked", 0) == 0;
        for (size_t i = 1; !keep && i < upperNames.size(); i++) {
            keep = w.rfind("issuer '" + upperNames[i] + "': ", 0) == 0;
        }
        for (size_t i = 0; !keep && i < upperNames.size(); i++) {
            keep = w.rfind("Revocation status of '" + upperNames[i] + "'", 0) == 0;
        }
        if (keep) {
            result.warnings.push_back(w);
        }
    }

    result.chainValid = result.trustedRoot;
    result.notExpired = true;
    for (const auto& f : result.failures) {
        if (isPathRule(f.rule)) result.chainValid = false;
        if (f.rule == ChainRule::EXPIRED || f.rule == ChainRule::NOT_YET_VALID) result.notExpired = false;
        if (f.rule == ChainRule::REVOKED) result.notRevoked = false;
        result.errors.push_back(f.describe());
    }
    result.isValid = result.errors.empty();
    return result;
}

} // namespace pdftrust::validation
