/**
 * @file cms_signature.cpp
 * @brief CMS SignedData parsing and signer verification
 */

#include "pdftrust/cms/cms_signature.h"
#include "pdftrust/validation/cert_ops.h"
#include "pdftrust/common/exceptions.h"
#include "pdftrust/util/time_utils.h"

#include <memory>
#include <openssl/bio.h>
#include <openssl/cms.h>
#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/x509.h>
#include <spdlog/spdlog.h>

namespace pdftrust::cms {

using validation::X509Certificate;

namespace {

struct CmsDeleter { void operator()(CMS_ContentInfo* p) const { CMS_ContentInfo_free(p); } };
using CmsPtr = std::unique_ptr<CMS_ContentInfo, CmsDeleter>;

struct BioDeleter { void operator()(BIO* p) const { BIO_free(p); } };
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

std::string objectToOid(const ASN1_OBJECT* obj) {
    if (!obj) return "";
    char buf[128];
    int len = OBJ_obj2txt(buf, sizeof(buf), obj, 1);
    return len > 0 ? std::string(buf) : "";
}

CmsPtr decodeCms(const std::vector<uint8_t>& der, size_t* consumed = nullptr) {
    if (der.empty()) {
        throw common::ParsingException("empty CMS input");
    }
    size_t len = derEncodedLength(der.data(), der.size());
    if (len == 0) len = der.size();  // BER indefinite length, let OpenSSL judge

    const unsigned char* p = der.data();
    CmsPtr cms(d2i_CMS_ContentInfo(nullptr, &p, static_cast<long>(len)));
    if (!cms) {
        throw common::ParsingException("malformed CMS ContentInfo: " + validation::drainOpenSslErrors());
    }
    if (OBJ_obj2nid(CMS_get0_type(cms.get())) != NID_pkcs7_signed) {
        throw common::ParsingException("CMS ContentInfo is not SignedData");
    }
    if (consumed) {
        *consumed = static_cast<size_t>(p - der.data());
    }
    return cms;
}

CMS_SignerInfo* firstSigner(CMS_ContentInfo* cms) {
    STACK_OF(CMS_SignerInfo)* infos = CMS_get0_SignerInfos(cms);
    if (!infos || sk_CMS_SignerInfo_num(infos) == 0) {
        throw common::ParsingException("SignedData has no SignerInfo");
    }
    if (sk_CMS_SignerInfo_num(infos) > 1) {
        spdlog::warn("[CmsSignature] SignedData has {} signers, only the first is evaluated",
                     sk_CMS_SignerInfo_num(infos));
    }
    return sk_CMS_SignerInfo_value(infos, 0);
}

CmsAttribute toAttribute(X509_ATTRIBUTE* attr) {
    CmsAttribute out;
    out.oid = objectToOid(X509_ATTRIBUTE_get0_object(attr));
    if (X509_ATTRIBUTE_count(attr) > 0) {
        ASN1_TYPE* value = X509_ATTRIBUTE_get0_type(attr, 0);
        int len = i2d_ASN1_TYPE(value, nullptr);
        if (len > 0) {
            out.value.resize(static_cast<size_t>(len));
            unsigned char* p = out.value.data();
            i2d_ASN1_TYPE(value, &p);
        }
    }
    return out;
}

void readSignedAttributes(CMS_SignerInfo* si, SignerInfo& info) {
    int count = CMS_signed_get_attr_count(si);
    for (int i = 0; i < count; i++) {
        X509_ATTRIBUTE* attr = CMS_signed_get_attr(si, i);
        if (!attr) continue;
        info.signedAttributes.push_back(toAttribute(attr));

        int nid = OBJ_obj2nid(X509_ATTRIBUTE_get0_object(attr));
        ASN1_TYPE* value = X509_ATTRIBUTE_count(attr) > 0 ? X509_ATTRIBUTE_get0_type(attr, 0) : nullptr;
        if (!value) continue;

        if (nid == NID_pkcs9_messageDigest && value->type == V_ASN1_OCTET_STRING) {
            const ASN1_OCTET_STRING* os = value->value.octet_string;
            const unsigned char* d = ASN1_STRING_get0_data(os);
            info.messageDigest = std::vector<uint8_t>(d, d + ASN1_STRING_length(os));
        } else if (nid == NID_pkcs9_signingTime) {
            const ASN1_TIME* t = nullptr;
            if (value->type == V_ASN1_UTCTIME) t = value->value.utctime;
            if (value->type == V_ASN1_GENERALIZEDTIME) t = value->value.generalizedtime;
            if (t) info.signingTime = util::asn1TimeToTimePoint(t);
        }
    }

    count = CMS_unsigned_get_attr_count(si);
    for (int i = 0; i < count; i++) {
        X509_ATTRIBUTE* attr = CMS_unsigned_get_attr(si, i);
        if (attr) info.unsignedAttributes.push_back(toAttribute(attr));
    }
}

/// Signer first, then follow issuer DNs, then whatever is left
std::vector<X509Certificate> orderCertificates(CMS_SignerInfo* si, STACK_OF(X509)* certs, bool& signerFound) {
    std::vector<X509*> remaining;
    X509* signer = nullptr;
    for (int i = 0; certs && i < sk_X509_num(certs); i++) {
        X509* c = sk_X509_value(certs, i);
        if (!signer && CMS_SignerInfo_cert_cmp(si, c) == 0) {
            signer = c;
        } else {
            remaining.push_back(c);
        }
    }

    std::vector<X509Certificate> ordered;
    signerFound = (signer != nullptr);
    if (!signer) {
        for (X509* c : remaining) ordered.push_back(X509Certificate::fromX509(c));
        return ordered;
    }

    ordered.push_back(X509Certificate::fromX509(signer));
    X509* current = signer;
    while (!remaining.empty() && !validation::isSelfSigned(current)) {
        std::string issuerDn = validation::getIssuerDn(current);
        auto it = remaining.begin();
        for (; it != remaining.end(); ++it) {
            if (validation::dnEquals(issuerDn, validation::getSubjectDn(*it))) break;
        }
        if (it == remaining.end()) break;
        current = *it;
        ordered.push_back(X509Certificate::fromX509(current));
        remaining.erase(it);
    }
    for (X509* c : remaining) ordered.push_back(X509Certificate::fromX509(c));
    return ordered;
}

} // namespace

size_t derEncodedLength(const uint8_t* data, size_t size) {
    if (!data || size < 2) return 0;

    size_t lengthByte = data[1];
    if (lengthByte < 0x80) {
        size_t total = 2 + lengthByte;
        return total <= size ? total : 0;
    }
    size_t numBytes = lengthByte & 0x7F;
    if (numBytes == 0 || numBytes > 4 || 2 + numBytes > size) {
        return 0;  // indefinite or unreasonable
    }
    size_t len = 0;
    for (size_t i = 0; i < numBytes; i++) {
        len = (len << 8) | data[2 + i];
    }
    size_t total = 2 + numBytes + len;
    return total <= size ? total : 0;
}

size_t cmsEncodedLength(const std::vector<uint8_t>& data) {
    size_t len = derEncodedLength(data.data(), data.size());
    if (len > 0 || data.size() < 2 || data[0] != 0x30 || data[1] != 0x80) {
        return len;
    }
    // Indefinite length: the parser finds the end-of-contents octets
    const unsigned char* p = data.data();
    CmsPtr cms(d2i_CMS_ContentInfo(nullptr, &p, static_cast<long>(data.size())));
    if (!cms) {
        validation::drainOpenSslErrors();
        return 0;
    }
    return static_cast<size_t>(p - data.data());
}

CMSSignature parseCmsSignature(const std::vector<uint8_t>& der, std::vector<uint8_t> content) {
    size_t consumed = 0;
    CmsPtr cms = decodeCms(der, &consumed);
    CMS_SignerInfo* si = firstSigner(cms.get());

    CMSSignature sig;
    sig.raw.assign(der.begin(), der.begin() + static_cast<long>(consumed));
    sig.content = std::move(content);

    // Algorithms and signature value
    X509_ALGOR* digestAlg = nullptr;
    X509_ALGOR* sigAlg = nullptr;
    CMS_SignerInfo_get0_algs(si, nullptr, nullptr, &digestAlg, &sigAlg);
    if (digestAlg) {
        const ASN1_OBJECT* obj = nullptr;
        X509_ALGOR_get0(&obj, nullptr, nullptr, digestAlg);
        sig.signerInfo.digestAlgorithm = objectToOid(obj);
    }
    if (sigAlg) {
        const ASN1_OBJECT* obj = nullptr;
        X509_ALGOR_get0(&obj, nullptr, nullptr, sigAlg);
        sig.signerInfo.signatureAlgorithm = objectToOid(obj);
    }
    ASN1_OCTET_STRING* sigValue = CMS_SignerInfo_get0_signature(si);
    if (sigValue) {
        const unsigned char* d = ASN1_STRING_get0_data(sigValue);
        sig.signerInfo.signature.assign(d, d + ASN1_STRING_length(sigValue));
    }

    readSignedAttributes(si, sig.signerInfo);

    // Encapsulated content (adbe.pkcs7.sha1 style)
    sig.encapsulatedContentType = objectToOid(CMS_get0_eContentType(cms.get()));
    ASN1_OCTET_STRING** econtent = CMS_get0_content(cms.get());
    if (econtent && *econtent) {
        const unsigned char* d = ASN1_STRING_get0_data(*econtent);
        sig.encapsulatedContent = std::vector<uint8_t>(d, d + ASN1_STRING_length(*econtent));
    }

    // Certificates
    STACK_OF(X509)* certs = CMS_get1_certs(cms.get());
    sig.certificates = orderCertificates(si, certs, sig.signerCertificateFound);
    if (certs) sk_X509_pop_free(certs, X509_free);

    spdlog::debug("[CmsSignature] Parsed SignedData: digest={}, {} certificate(s), {} signed / {} unsigned attribute(s)",
                  sig.signerInfo.digestAlgorithm, sig.certificates.size(),
                  sig.signerInfo.signedAttributes.size(), sig.signerInfo.unsignedAttributes.size());
    return sig;
}

SignerVerification verifySignerSignature(const CMSSignature& signature) {
    SignerVerification out;

    CmsPtr cms;
    try {
        cms = decodeCms(signature.raw);
    } catch (const common::ParsingException& e) {
        out.error = e.what();
        return out;
    }
    CMS_SignerInfo* si = nullptr;
    try {
        si = firstSigner(cms.get());
    } catch (const common::ParsingException& e) {
        out.error = e.what();
        return out;
    }

    // Attach the signer certificate from the embedded set
    if (CMS_set1_signers_certs(cms.get(), nullptr, 0) < 1) {
        ERR_clear_error();
        out.error = "signer certificate not found in CMS certificate set";
        return out;
    }

    if (CMS_signed_get_attr_count(si) > 0) {
        if (CMS_SignerInfo_verify(si) == 1) {
            out.verified = true;
        } else {
            out.error = "signature over signed attributes does not verify: " + validation::drainOpenSslErrors();
        }
        return out;
    }

    // No signed attributes: the signature covers the content itself
    unsigned int flags = CMS_NO_SIGNER_CERT_VERIFY | CMS_BINARY;
    BioPtr contentBio;
    if (signature.isDetached()) {
        contentBio.reset(BIO_new_mem_buf(signature.content.data(), static_cast<int>(signature.content.size())));
    }
    if (CMS_verify(cms.get(), nullptr, nullptr, contentBio.get(), nullptr, flags) == 1) {
        out.verified = true;
    } else {
        out.error = "signature over content does not verify: " + validation::drainOpenSslErrors();
    }
    return out;
}

std::vector<uint8_t> addUnsignedAttribute(const std::vector<uint8_t>& der,
                                          const std::string& oid,
                                          const std::vector<uint8_t>& valueDer) {
    CmsPtr cms = decodeCms(der);
    CMS_SignerInfo* si = firstSigner(cms.get());

    ASN1_OBJECT* obj = OBJ_txt2obj(oid.c_str(), 1);
    if (!obj) {
        throw common::ParsingException("invalid attribute OID " + oid);
    }
    // V_ASN1_SEQUENCE keeps the value bytes as a complete encoding
    int ok = CMS_unsigned_add1_attr_by_OBJ(si, obj, V_ASN1_SEQUENCE,
                                           valueDer.data(), static_cast<int>(valueDer.size()));
    ASN1_OBJECT_free(obj);
    if (ok != 1) {
        throw common::ParsingException("cannot add unsigned attribute: " + validation::drainOpenSslErrors());
    }

    int len = i2d_CMS_ContentInfo(cms.get(), nullptr);
    if (len <= 0) {
        throw common::ParsingException("cannot re-encode CMS: " + validation::drainOpenSslErrors());
    }
    std::vector<uint8_t> out(static_cast<size_t>(len));
    unsigned char* p = out.data();
    i2d_CMS_ContentInfo(cms.get(), &p);
    return out;
}

} // namespace pdftrust::cms
