/**
 * @file cert_ops.cpp
 * @brief Pure X.509 certificate operations implementation
 *
 * All functions are idempotent. No logging side effects.
 */

#include "pdftrust/validation/cert_ops.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/x509v3.h>

#include "pdftrust/util/encoding_util.h"

namespace pdftrust::validation {

namespace {

std::string lowerTrimmed(const std::string& s) {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    size_t start = lower.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = lower.find_last_not_of(" \t");
    return lower.substr(start, end - start + 1);
}

} // namespace

// --- Signature Verification ---

bool verifyCertificateSignature(X509* cert, X509* issuerCert) {
    if (!cert || !issuerCert) return false;

    EVP_PKEY* issuerPubKey = X509_get_pubkey(issuerCert);
    if (!issuerPubKey) {
        ERR_clear_error();
        return false;
    }

    int result = X509_verify(cert, issuerPubKey);
    EVP_PKEY_free(issuerPubKey);

    // Clear OpenSSL error queue to prevent stale errors from leaking
    if (result != 1) {
        ERR_clear_error();
    }

    return (result == 1);
}

// --- Certificate Status Checks ---

bool isCertificateExpired(X509* cert, std::time_t at) {
    if (!cert) return true;
    return (X509_cmp_time(X509_get0_notAfter(cert), &at) < 0);
}

bool isCertificateNotYetValid(X509* cert, std::time_t at) {
    if (!cert) return true;
    return (X509_cmp_time(X509_get0_notBefore(cert), &at) > 0);
}

bool isSelfSigned(X509* cert) {
    if (!cert) return false;
    return dnEquals(getSubjectDn(cert), getIssuerDn(cert));
}

bool isCaCertificate(X509* cert) {
    if (!cert) return false;

    BASIC_CONSTRAINTS* bc = static_cast<BASIC_CONSTRAINTS*>(
        X509_get_ext_d2i(cert, NID_basic_constraints, nullptr, nullptr));
    if (!bc) return false;
    bool ca = bc->ca != 0;
    BASIC_CONSTRAINTS_free(bc);
    return ca;
}

bool hasExtendedKeyUsage(X509* cert, int nid) {
    if (!cert) return false;

    EXTENDED_KEY_USAGE* eku = static_cast<EXTENDED_KEY_USAGE*>(
        X509_get_ext_d2i(cert, NID_ext_key_usage, nullptr, nullptr));
    if (!eku) return false;

    bool found = false;
    for (int i = 0; i < sk_ASN1_OBJECT_num(eku); i++) {
        if (OBJ_obj2nid(sk_ASN1_OBJECT_value(eku, i)) == nid) {
            found = true;
            break;
        }
    }
    sk_ASN1_OBJECT_pop_free(eku, ASN1_OBJECT_free);
    return found;
}

// --- DN Extraction ---

std::string getSubjectDn(X509* cert) {
    if (!cert) return "";

    char* dn = X509_NAME_oneline(X509_get_subject_name(cert), nullptr, 0);
    if (!dn) return "";
    std::string result(dn);
    OPENSSL_free(dn);
    return result;
}

std::string getIssuerDn(X509* cert) {
    if (!cert) return "";

    char* dn = X509_NAME_oneline(X509_get_issuer_name(cert), nullptr, 0);
    if (!dn) return "";
    std::string result(dn);
    OPENSSL_free(dn);
    return result;
}

std::string getNameEntry(const X509_NAME* name, int nid) {
    if (!name) return "";

    int idx = X509_NAME_get_index_by_NID(name, nid, -1);
    if (idx < 0) return "";

    X509_NAME_ENTRY* entry = X509_NAME_get_entry(name, idx);
    ASN1_STRING* data = X509_NAME_ENTRY_get_data(entry);
    unsigned char* utf8 = nullptr;
    int len = ASN1_STRING_to_UTF8(&utf8, data);
    if (len < 0) {
        ERR_clear_error();
        return "";
    }
    std::string result(reinterpret_cast<char*>(utf8), static_cast<size_t>(len));
    OPENSSL_free(utf8);
    return result;
}

// --- Identity ---

std::string getCertificateFingerprint(X509* cert) {
    if (!cert) return "";

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;

    if (X509_digest(cert, EVP_sha256(), md, &mdLen) != 1) {
        ERR_clear_error();
        return "";
    }
    return util::toHex(md, mdLen);
}

std::string getSerialNumberHex(X509* cert) {
    if (!cert) return "";

    BIGNUM* bn = ASN1_INTEGER_to_BN(X509_get0_serialNumber(cert), nullptr);
    if (!bn) return "";
    char* hex = BN_bn2hex(bn);
    BN_free(bn);
    if (!hex) return "";

    std::string result(hex);
    OPENSSL_free(hex);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

// --- DN Utilities ---

std::string normalizeDnForComparison(const std::string& dn) {
    if (dn.empty()) return dn;

    std::vector<std::string> parts;

    if (dn[0] == '/') {
        // OpenSSL slash-separated format: /C=Z/O=Y/CN=X
        std::istringstream stream(dn);
        std::string segment;
        while (std::getline(stream, segment, '/')) {
            std::string part = lowerTrimmed(segment);
            if (!part.empty()) parts.push_back(part);
        }
    } else {
        // RFC 2253 comma-separated format: CN=X,O=Y,C=Z
        std::string current;
        bool inQuotes = false;
        for (size_t i = 0; i < dn.size(); i++) {
            char c = dn[i];
            if (c == '"') {
                inQuotes = !inQuotes;
                current += c;
            } else if (c == ',' && !inQuotes) {
                std::string part = lowerTrimmed(current);
                if (!part.empty()) parts.push_back(part);
                current.clear();
            } else if (c == '\\' && i + 1 < dn.size()) {
                current += c;
                current += dn[++i];
            } else {
                current += c;
            }
        }
        std::string part = lowerTrimmed(current);
        if (!part.empty()) parts.push_back(part);
    }

    // Sort components for order-independent comparison
    std::sort(parts.begin(), parts.end());

    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) result += "|";
        result += parts[i];
    }
    return result;
}

bool dnEquals(const std::string& a, const std::string& b) {
    return normalizeDnForComparison(a) == normalizeDnForComparison(b);
}

std::string drainOpenSslErrors() {
    std::string result;
    unsigned long code = 0;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!result.empty()) result += "; ";
        result += buf;
    }
    return result.empty() ? "unknown OpenSSL error" : result;
}

} // namespace pdftrust::validation
