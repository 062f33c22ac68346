/**
 * @file crl_checker.cpp
 * @brief CRL revocation checker implementation
 */

#include "pdftrust/validation/crl_checker.h"
#include "pdftrust/validation/cert_ops.h"
#include "pdftrust/common/exceptions.h"
#include "pdftrust/util/time_utils.h"

#include <ctime>
#include <stdexcept>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>

namespace pdftrust::validation {

namespace {

std::string reasonCodeToString(long reasonCode) {
    switch (reasonCode) {
        case 0:  return "unspecified";
        case 1:  return "keyCompromise";
        case 2:  return "cACompromise";
        case 3:  return "affiliationChanged";
        case 4:  return "superseded";
        case 5:  return "cessationOfOperation";
        case 6:  return "certificateHold";
        case 8:  return "removeFromCRL";
        case 9:  return "privilegeWithdrawn";
        case 10: return "aACompromise";
        default: return "unknown(" + std::to_string(reasonCode) + ")";
    }
}

} // namespace

CrlChecker::CrlChecker(ICrlProvider* crlProvider)
    : crlProvider_(crlProvider)
{
    if (!crlProvider_) {
        throw std::invalid_argument("CrlChecker: crlProvider cannot be nullptr");
    }
}

RevocationCheckResult CrlChecker::check(X509* cert, X509* issuerCert) {
    RevocationCheckResult result;

    if (!cert || !issuerCert) {
        result.status = RevocationStatus::NOT_CHECKED;
        result.message = "Certificate or issuer is null";
        return result;
    }

    std::string issuerDn = getSubjectDn(issuerCert);

    // Step 1: Fetch CRL for the issuer
    X509_CRL* crl = crlProvider_->findCrlByIssuerDn(issuerDn);
    if (!crl) {
        result.status = RevocationStatus::UNAVAILABLE;
        result.message = "No CRL found for issuer " + issuerDn;
        return result;
    }

    result.thisUpdate = util::asn1TimeToIso8601(X509_CRL_get0_lastUpdate(crl));
    result.nextUpdate = util::asn1TimeToIso8601(X509_CRL_get0_nextUpdate(crl));

    // Step 2: CRL must be signed by the issuer
    EVP_PKEY* issuerKey = X509_get_pubkey(issuerCert);
    int verified = issuerKey ? X509_CRL_verify(crl, issuerKey) : 0;
    EVP_PKEY_free(issuerKey);
    if (verified != 1) {
        ERR_clear_error();
        X509_CRL_free(crl);
        result.status = RevocationStatus::INVALID;
        result.message = "CRL signature does not verify with key of " + issuerDn;
        return result;
    }

    // Step 3: Check CRL expiration
    const ASN1_TIME* nextUpdate = X509_CRL_get0_nextUpdate(crl);
    if (nextUpdate) {
        time_t now = time(nullptr);
        if (X509_cmp_time(nextUpdate, &now) < 0) {
            X509_CRL_free(crl);
            result.status = RevocationStatus::EXPIRED;
            result.message = "CRL expired for issuer " + issuerDn;
            return result;
        }
    }

    // Step 4: Check certificate serial number against CRL
    X509_REVOKED* revokedEntry = nullptr;
    int ret = X509_CRL_get0_by_serial(crl, &revokedEntry, X509_get_serialNumber(cert));

    if (ret == 1 && revokedEntry) {
        result.status = RevocationStatus::REVOKED;
        result.message = "Certificate is revoked (issuer: " + issuerDn + ")";

        // Step 5: Extract revocation reason (RFC 5280 Section 5.3.1)
        int reasonIdx = X509_REVOKED_get_ext_by_NID(revokedEntry, NID_crl_reason, -1);
        if (reasonIdx >= 0) {
            X509_EXTENSION* ext = X509_REVOKED_get_ext(revokedEntry, reasonIdx);
            if (ext) {
                ASN1_ENUMERATED* reasonEnum = static_cast<ASN1_ENUMERATED*>(X509V3_EXT_d2i(ext));
                if (reasonEnum) {
                    result.revocationReason = reasonCodeToString(ASN1_ENUMERATED_get(reasonEnum));
                    ASN1_ENUMERATED_free(reasonEnum);
                }
            }
        }
    } else {
        result.status = RevocationStatus::GOOD;
        result.message = "Certificate not revoked (issuer: " + issuerDn + ")";
    }

    X509_CRL_free(crl);
    return result;
}

// --- PemCrlProvider ---

PemCrlProvider::PemCrlProvider(const std::string& pemText) {
    BIO* bio = BIO_new_mem_buf(pemText.data(), static_cast<int>(pemText.size()));
    if (!bio) {
        throw common::CertificateException("cannot allocate BIO for CRL bundle");
    }

    X509_CRL* crl = nullptr;
    while ((crl = PEM_read_bio_X509_CRL(bio, nullptr, nullptr, nullptr)) != nullptr) {
        Entry entry;
        char* dn = X509_NAME_oneline(X509_CRL_get_issuer(crl), nullptr, 0);
        if (dn) {
            entry.issuerDn = dn;
            OPENSSL_free(dn);
        }
        int len = i2d_X509_CRL(crl, nullptr);
        if (len > 0) {
            entry.der.resize(static_cast<size_t>(len));
            unsigned char* p = entry.der.data();
            i2d_X509_CRL(crl, &p);
            entries_.push_back(std::move(entry));
        }
        X509_CRL_free(crl);
    }
    // PEM reader signals end of input through the error queue
    ERR_clear_error();
    BIO_free(bio);

    if (entries_.empty()) {
        throw common::CertificateException("no CRL found in PEM input");
    }
}

X509_CRL* PemCrlProvider::findCrlByIssuerDn(const std::string& issuerDn) {
    // Last matching entry wins so a bundle can be appended with newer CRLs
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (dnEquals(it->issuerDn, issuerDn)) {
            const unsigned char* p = it->der.data();
            return d2i_X509_CRL(nullptr, &p, static_cast<long>(it->der.size()));
        }
    }
    return nullptr;
}

} // namespace pdftrust::validation
