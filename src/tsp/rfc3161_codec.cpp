/**
 * @file rfc3161_codec.cpp
 * @brief RFC 3161 codec implementation
 */

#include "pdftrust/tsp/rfc3161_codec.h"
#include "pdftrust/common/exceptions.h"
#include "pdftrust/validation/cert_ops.h"
#include "pdftrust/util/time_utils.h"

#include <cctype>
#include <memory>
#include <stdexcept>
#include <openssl/bn.h>
#include <openssl/cms.h>
#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/rand.h>
#include <openssl/ts.h>
#include <openssl/x509v3.h>

namespace pdftrust::tsp {

using validation::MessageImprintBuilder;
using validation::X509Certificate;

namespace {

struct TsReqDeleter { void operator()(TS_REQ* p) const { TS_REQ_free(p); } };
struct TsRespDeleter { void operator()(TS_RESP* p) const { TS_RESP_free(p); } };
struct TstInfoDeleter { void operator()(TS_TST_INFO* p) const { TS_TST_INFO_free(p); } };
struct CmsDeleter { void operator()(CMS_ContentInfo* p) const { CMS_ContentInfo_free(p); } };

std::string objectToOid(const ASN1_OBJECT* obj) {
    if (!obj) return "";
    char buf[128];
    int len = OBJ_obj2txt(buf, sizeof(buf), obj, 1);
    return len > 0 ? std::string(buf) : "";
}

std::vector<uint8_t> integerToBytes(const ASN1_INTEGER* value) {
    std::vector<uint8_t> out;
    if (!value) return out;
    BIGNUM* bn = ASN1_INTEGER_to_BN(value, nullptr);
    if (!bn) return out;
    out.resize(static_cast<size_t>(BN_num_bytes(bn)));
    BN_bn2bin(bn, out.data());
    BN_free(bn);
    return out;
}

std::string integerToHex(const ASN1_INTEGER* value) {
    if (!value) return "";
    BIGNUM* bn = ASN1_INTEGER_to_BN(value, nullptr);
    if (!bn) return "";
    char* hex = BN_bn2hex(bn);
    BN_free(bn);
    if (!hex) return "";
    std::string out(hex);
    OPENSSL_free(hex);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

int integerToInt(const ASN1_INTEGER* value) {
    return value ? static_cast<int>(ASN1_INTEGER_get(value)) : 0;
}

TSTInfo convertTstInfo(TS_TST_INFO* tst) {
    TSTInfo info;
    info.version = TS_TST_INFO_get_version(tst);
    info.policy = objectToOid(TS_TST_INFO_get_policy_id(tst));

    TS_MSG_IMPRINT* mi = TS_TST_INFO_get_msg_imprint(tst);
    if (mi) {
        const ASN1_OBJECT* algObj = nullptr;
        X509_ALGOR_get0(&algObj, nullptr, nullptr, TS_MSG_IMPRINT_get_algo(mi));
        std::string oid = objectToOid(algObj);
        info.messageImprint.hashAlgorithm =
            MessageImprintBuilder::isSupported(oid) ? MessageImprintBuilder::canonicalOid(oid) : oid;
        ASN1_OCTET_STRING* msg = TS_MSG_IMPRINT_get_msg(mi);
        if (msg) {
            const unsigned char* d = ASN1_STRING_get0_data(msg);
            info.messageImprint.hashedMessage.assign(d, d + ASN1_STRING_length(msg));
        }
    }

    info.serialNumber = integerToHex(TS_TST_INFO_get_serial(tst));

    auto genTime = util::asn1TimeToTimePoint(TS_TST_INFO_get_time(tst));
    if (!genTime) {
        throw common::ParsingException("TSTInfo genTime cannot be decoded");
    }
    info.genTime = *genTime;

    TS_ACCURACY* acc = TS_TST_INFO_get_accuracy(tst);
    if (acc) {
        Accuracy a;
        a.seconds = integerToInt(TS_ACCURACY_get_seconds(acc));
        a.millis = integerToInt(TS_ACCURACY_get_millis(acc));
        a.micros = integerToInt(TS_ACCURACY_get_micros(acc));
        info.accuracy = a;
    }

    info.ordering = TS_TST_INFO_get_ordering(tst) != 0;

    const ASN1_INTEGER* nonce = TS_TST_INFO_get_nonce(tst);
    if (nonce) {
        info.nonce = integerToBytes(nonce);
    }

    GENERAL_NAME* tsa = TS_TST_INFO_get_tsa(tst);
    if (tsa && tsa->type == GEN_DIRNAME) {
        char* dn = X509_NAME_oneline(tsa->d.directoryName, nullptr, 0);
        if (dn) {
            info.tsaName = dn;
            OPENSSL_free(dn);
        }
    }
    return info;
}

} // namespace

std::vector<uint8_t> generateNonce(size_t length) {
    std::vector<uint8_t> nonce(length == 0 ? 16 : length);
    if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
        throw std::runtime_error("generateNonce: RAND_bytes failed");
    }
    // Keep the byte length stable through INTEGER encoding
    nonce[0] = static_cast<uint8_t>(nonce[0] | 0x01);
    return nonce;
}

bool nonceEquals(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
    size_t ia = 0, ib = 0;
    while (ia < a.size() && a[ia] == 0) ++ia;
    while (ib < b.size() && b[ib] == 0) ++ib;
    return std::vector<uint8_t>(a.begin() + static_cast<long>(ia), a.end()) ==
           std::vector<uint8_t>(b.begin() + static_cast<long>(ib), b.end());
}

std::vector<uint8_t> encodeTimestampRequest(const TimestampRequest& request) {
    if (!MessageImprintBuilder::isConsistent(request.messageImprint)) {
        throw std::invalid_argument("encodeTimestampRequest: message imprint length does not match its algorithm");
    }

    std::unique_ptr<TS_REQ, TsReqDeleter> req(TS_REQ_new());
    bool ok = req && TS_REQ_set_version(req.get(), 1) == 1;

    // MessageImprint: AlgorithmIdentifier with NULL parameters + digest
    if (ok) {
        TS_MSG_IMPRINT* mi = TS_MSG_IMPRINT_new();
        X509_ALGOR* algo = X509_ALGOR_new();
        ASN1_OBJECT* algObj = OBJ_txt2obj(request.messageImprint.hashAlgorithm.c_str(), 1);
        ok = mi && algo && algObj &&
             X509_ALGOR_set0(algo, algObj, V_ASN1_NULL, nullptr) == 1;
        if (!ok && algObj) ASN1_OBJECT_free(algObj);
        ok = ok && TS_MSG_IMPRINT_set_algo(mi, algo) == 1 &&
             TS_MSG_IMPRINT_set_msg(mi,
                 const_cast<unsigned char*>(request.messageImprint.hashedMessage.data()),
                 static_cast<int>(request.messageImprint.hashedMessage.size())) == 1 &&
             TS_REQ_set_msg_imprint(req.get(), mi) == 1;
        X509_ALGOR_free(algo);
        TS_MSG_IMPRINT_free(mi);
    }

    if (ok && !request.reqPolicy.empty()) {
        ASN1_OBJECT* policy = OBJ_txt2obj(request.reqPolicy.c_str(), 1);
        ok = policy && TS_REQ_set_policy_id(req.get(), policy) == 1;
        ASN1_OBJECT_free(policy);
    }

    if (ok && request.nonce) {
        BIGNUM* bn = BN_bin2bn(request.nonce->data(), static_cast<int>(request.nonce->size()), nullptr);
        ASN1_INTEGER* nonce = bn ? BN_to_ASN1_INTEGER(bn, nullptr) : nullptr;
        ok = nonce && TS_REQ_set_nonce(req.get(), nonce) == 1;
        ASN1_INTEGER_free(nonce);
        BN_free(bn);
    }

    ok = ok && TS_REQ_set_cert_req(req.get(), request.certReq ? 1 : 0) == 1;

    int len = ok ? i2d_TS_REQ(req.get(), nullptr) : -1;
    if (len <= 0) {
        throw common::ParsingException("cannot encode TimeStampReq: " + validation::drainOpenSslErrors());
    }
    std::vector<uint8_t> der(static_cast<size_t>(len));
    unsigned char* p = der.data();
    i2d_TS_REQ(req.get(), &p);
    return der;
}

TimestampResponse decodeTimestampResponse(const std::vector<uint8_t>& der) {
    const unsigned char* p = der.data();
    std::unique_ptr<TS_RESP, TsRespDeleter> resp(d2i_TS_RESP(nullptr, &p, static_cast<long>(der.size())));
    if (!resp) {
        throw common::ParsingException("malformed TimeStampResp: " + validation::drainOpenSslErrors());
    }

    TimestampResponse out;
    out.der = der;

    TS_STATUS_INFO* statusInfo = TS_RESP_get_status_info(resp.get());
    long status = ASN1_INTEGER_get(TS_STATUS_INFO_get0_status(statusInfo));
    if (status < 0 || status > 5) {
        throw common::ParsingException("TimeStampResp carries unknown PKIStatus " + std::to_string(status));
    }
    out.status.status = static_cast<PkiStatus>(status);

    const STACK_OF(ASN1_UTF8STRING)* texts = TS_STATUS_INFO_get0_text(statusInfo);
    for (int i = 0; texts && i < sk_ASN1_UTF8STRING_num(texts); i++) {
        const ASN1_UTF8STRING* s = sk_ASN1_UTF8STRING_value(texts, i);
        out.status.statusStrings.emplace_back(
            reinterpret_cast<const char*>(ASN1_STRING_get0_data(s)),
            static_cast<size_t>(ASN1_STRING_length(s)));
    }

    const ASN1_BIT_STRING* failInfo = TS_STATUS_INFO_get0_failure_info(statusInfo);
    if (failInfo) {
        for (PkiFailureInfo f : {PkiFailureInfo::BAD_ALG, PkiFailureInfo::BAD_REQUEST,
                                 PkiFailureInfo::BAD_DATA_FORMAT, PkiFailureInfo::TIME_NOT_AVAILABLE,
                                 PkiFailureInfo::UNACCEPTED_POLICY, PkiFailureInfo::UNACCEPTED_EXTENSION,
                                 PkiFailureInfo::ADD_INFO_NOT_AVAILABLE, PkiFailureInfo::SYSTEM_FAILURE}) {
            if (ASN1_BIT_STRING_get_bit(failInfo, static_cast<int>(f))) {
                out.status.failInfo.push_back(f);
            }
        }
    }

    PKCS7* token = TS_RESP_get_token(resp.get());
    if (token) {
        int len = i2d_PKCS7(token, nullptr);
        if (len <= 0) {
            throw common::ParsingException("cannot re-encode TimeStampToken: " + validation::drainOpenSslErrors());
        }
        std::vector<uint8_t> tokenDer(static_cast<size_t>(len));
        unsigned char* tp = tokenDer.data();
        i2d_PKCS7(token, &tp);
        out.token = decodeTimeStampToken(tokenDer);
    }
    return out;
}

TimeStampToken decodeTimeStampToken(const std::vector<uint8_t>& der) {
    const unsigned char* p = der.data();
    std::unique_ptr<CMS_ContentInfo, CmsDeleter> cms(
        d2i_CMS_ContentInfo(nullptr, &p, static_cast<long>(der.size())));
    if (!cms) {
        throw common::ParsingException("malformed TimeStampToken: " + validation::drainOpenSslErrors());
    }
    if (OBJ_obj2nid(CMS_get0_type(cms.get())) != NID_pkcs7_signed) {
        throw common::ParsingException("TimeStampToken is not SignedData");
    }
    if (OBJ_obj2nid(CMS_get0_eContentType(cms.get())) != NID_id_smime_ct_TSTInfo) {
        throw common::ParsingException("TimeStampToken content type is not id-ct-TSTInfo");
    }

    ASN1_OCTET_STRING** content = CMS_get0_content(cms.get());
    if (!content || !*content) {
        throw common::ParsingException("TimeStampToken has no encapsulated TSTInfo");
    }
    const unsigned char* tp = ASN1_STRING_get0_data(*content);
    std::unique_ptr<TS_TST_INFO, TstInfoDeleter> tst(
        d2i_TS_TST_INFO(nullptr, &tp, ASN1_STRING_length(*content)));
    if (!tst) {
        throw common::ParsingException("malformed TSTInfo: " + validation::drainOpenSslErrors());
    }

    TimeStampToken token;
    token.der.assign(der.begin(), der.begin() + (p - der.data()));
    token.tstInfo = convertTstInfo(tst.get());

    // TSA signer first
    STACK_OF(CMS_SignerInfo)* infos = CMS_get0_SignerInfos(cms.get());
    CMS_SignerInfo* si = (infos && sk_CMS_SignerInfo_num(infos) > 0) ? sk_CMS_SignerInfo_value(infos, 0) : nullptr;
    STACK_OF(X509)* certs = CMS_get1_certs(cms.get());
    std::vector<X509Certificate> others;
    for (int i = 0; certs && i < sk_X509_num(certs); i++) {
        X509* c = sk_X509_value(certs, i);
        if (si && token.certificates.empty() && CMS_SignerInfo_cert_cmp(si, c) == 0) {
            token.certificates.insert(token.certificates.begin(), X509Certificate::fromX509(c));
        } else {
            others.push_back(X509Certificate::fromX509(c));
        }
    }
    if (certs) sk_X509_pop_free(certs, X509_free);
    token.certificates.insert(token.certificates.end(), others.begin(), others.end());

    return token;
}

} // namespace pdftrust::tsp
