/**
 * @file message_imprint.cpp
 * @brief MessageImprintBuilder implementation
 */

#include "pdftrust/validation/message_imprint.h"

#include <array>
#include <cctype>
#include <stdexcept>
#include <openssl/err.h>

namespace pdftrust::validation {

namespace {

struct DigestAlgorithm {
    const char* name;
    const char* oid;
    size_t size;
    const EVP_MD* (*md)();
};

const std::array<DigestAlgorithm, 5>& algorithms() {
    static const std::array<DigestAlgorithm, 5> table = {{
        {"SHA-1",   oid::SHA1,   20, EVP_sha1},
        {"SHA-224", oid::SHA224, 28, EVP_sha224},
        {"SHA-256", oid::SHA256, 32, EVP_sha256},
        {"SHA-384", oid::SHA384, 48, EVP_sha384},
        {"SHA-512", oid::SHA512, 64, EVP_sha512},
    }};
    return table;
}

/// Uppercase, drop '-', '_' and blanks: "sha-256" and "SHA256" compare equal
std::string compactName(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '-' || c == '_' || c == ' ') continue;
        out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

const DigestAlgorithm* lookup(const std::string& algorithm) {
    std::string compact = compactName(algorithm);
    for (const auto& a : algorithms()) {
        if (algorithm == a.oid || compact == compactName(a.name)) {
            return &a;
        }
    }
    return nullptr;
}

const DigestAlgorithm& require(const std::string& algorithm) {
    const DigestAlgorithm* a = lookup(algorithm);
    if (!a) {
        throw std::invalid_argument("MessageImprintBuilder: unsupported hash algorithm '" + algorithm + "'");
    }
    return *a;
}

} // namespace

MessageImprint MessageImprintBuilder::build(const std::vector<uint8_t>& data,
                                            const std::string& algorithm) {
    MessageImprint imprint;
    imprint.hashAlgorithm = require(algorithm).oid;
    imprint.hashedMessage = digest(data, algorithm);
    return imprint;
}

MessageImprint MessageImprintBuilder::build(const std::vector<ByteSegment>& segments,
                                            const std::string& algorithm) {
    MessageImprint imprint;
    imprint.hashAlgorithm = require(algorithm).oid;
    imprint.hashedMessage = digest(segments, algorithm);
    return imprint;
}

std::vector<uint8_t> MessageImprintBuilder::digest(const std::vector<uint8_t>& data,
                                                   const std::string& algorithm) {
    return digest(std::vector<ByteSegment>{{data.data(), data.size()}}, algorithm);
}

std::vector<uint8_t> MessageImprintBuilder::digest(const std::vector<ByteSegment>& segments,
                                                   const std::string& algorithm) {
    const DigestAlgorithm& alg = require(algorithm);

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("MessageImprintBuilder: EVP_MD_CTX_new failed");
    }

    bool ok = EVP_DigestInit_ex(ctx, alg.md(), nullptr) == 1;
    for (const auto& seg : segments) {
        if (!ok) break;
        if (seg.size > 0) {
            ok = EVP_DigestUpdate(ctx, seg.data, seg.size) == 1;
        }
    }

    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int outLen = 0;
    if (ok) {
        ok = EVP_DigestFinal_ex(ctx, out.data(), &outLen) == 1;
    }
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        ERR_clear_error();
        throw std::runtime_error("MessageImprintBuilder: digest computation failed for " + std::string(alg.name));
    }
    out.resize(outLen);
    return out;
}

std::string MessageImprintBuilder::canonicalOid(const std::string& algorithm) {
    return require(algorithm).oid;
}

std::string MessageImprintBuilder::algorithmName(const std::string& algorithm) {
    return require(algorithm).name;
}

size_t MessageImprintBuilder::digestSize(const std::string& algorithm) {
    return require(algorithm).size;
}

const EVP_MD* MessageImprintBuilder::evpMd(const std::string& algorithm) {
    return require(algorithm).md();
}

bool MessageImprintBuilder::isSupported(const std::string& algorithm) {
    return lookup(algorithm) != nullptr;
}

bool MessageImprintBuilder::isConsistent(const MessageImprint& imprint) {
    const DigestAlgorithm* a = lookup(imprint.hashAlgorithm);
    return a && imprint.hashedMessage.size() == a->size;
}

} // namespace pdftrust::validation
