/**
 * @file x509_certificate.cpp
 * @brief X509Certificate value construction
 */

#include "pdftrust/validation/x509_certificate.h"
#include "pdftrust/validation/cert_ops.h"
#include "pdftrust/common/exceptions.h"
#include "pdftrust/util/time_utils.h"

#include <openssl/objects.h>

namespace pdftrust::validation {

X509Certificate X509Certificate::fromX509(X509* cert) {
    if (!cert) {
        throw common::CertificateException("certificate is null");
    }

    X509Certificate c;
    c.subject = getSubjectDn(cert);
    c.issuer = getIssuerDn(cert);
    c.commonName = getNameEntry(X509_get_subject_name(cert), NID_commonName);
    c.issuerCommonName = getNameEntry(X509_get_issuer_name(cert), NID_commonName);
    c.serialNumber = getSerialNumberHex(cert);
    c.fingerprint = getCertificateFingerprint(cert);

    auto notBefore = util::asn1TimeToTimePoint(X509_get0_notBefore(cert));
    auto notAfter = util::asn1TimeToTimePoint(X509_get0_notAfter(cert));
    if (!notBefore || !notAfter) {
        throw common::CertificateException("cannot decode validity period of " + c.subject);
    }
    c.notBefore = *notBefore;
    c.notAfter = *notAfter;

    int sigNid = X509_get_signature_nid(cert);
    const char* sn = OBJ_nid2sn(sigNid);
    c.signatureAlgorithm = sn ? sn : "UNKNOWN";

    int len = i2d_X509(cert, nullptr);
    if (len <= 0) {
        throw common::CertificateException("cannot DER-encode " + c.subject);
    }
    c.der.resize(static_cast<size_t>(len));
    unsigned char* p = c.der.data();
    i2d_X509(cert, &p);

    return c;
}

X509Certificate X509Certificate::fromDer(const std::vector<uint8_t>& der) {
    const unsigned char* p = der.data();
    X509Ptr cert(d2i_X509(nullptr, &p, static_cast<long>(der.size())));
    if (!cert) {
        throw common::CertificateException("malformed DER certificate: " + drainOpenSslErrors());
    }
    return fromX509(cert.get());
}

X509Ptr X509Certificate::toX509() const {
    const unsigned char* p = der.data();
    X509Ptr cert(d2i_X509(nullptr, &p, static_cast<long>(der.size())));
    if (!cert) {
        throw common::CertificateException("cannot decode certificate " + fingerprint);
    }
    return cert;
}

std::string X509Certificate::displayName() const {
    return commonName.empty() ? fingerprint : commonName;
}

} // namespace pdftrust::validation
