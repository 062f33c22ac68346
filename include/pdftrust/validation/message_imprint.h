/**
 * @file message_imprint.h
 * @brief Digest of a byte buffer under a named hash algorithm
 *
 * Canonicalizes algorithm names ("SHA-256", "sha256", "SHA256") and dotted
 * OIDs to one form. The hashAlgorithm carried by a MessageImprint is always
 * the dotted OID.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <openssl/evp.h>

namespace pdftrust::validation {

/// OIDs of the supported digest algorithms
namespace oid {
inline constexpr const char* SHA1 = "1.3.14.3.2.26";
inline constexpr const char* SHA224 = "2.16.840.1.101.3.4.2.4";
inline constexpr const char* SHA256 = "2.16.840.1.101.3.4.2.1";
inline constexpr const char* SHA384 = "2.16.840.1.101.3.4.2.2";
inline constexpr const char* SHA512 = "2.16.840.1.101.3.4.2.3";
} // namespace oid

struct MessageImprint {
    std::string hashAlgorithm;           ///< Dotted OID
    std::vector<uint8_t> hashedMessage;

    bool operator==(const MessageImprint& o) const {
        return hashAlgorithm == o.hashAlgorithm && hashedMessage == o.hashedMessage;
    }
    bool operator!=(const MessageImprint& o) const { return !(*this == o); }
};

/// Non-owning view of one contiguous piece of input
struct ByteSegment {
    const uint8_t* data = nullptr;
    size_t size = 0;
};

/**
 * @brief Stateless digest builder
 *
 * Every function throws std::invalid_argument for an algorithm outside
 * SHA-1, SHA-224, SHA-256, SHA-384 and SHA-512.
 */
class MessageImprintBuilder {
public:
    static MessageImprint build(const std::vector<uint8_t>& data,
                                const std::string& algorithm = "SHA-256");

    static MessageImprint build(const std::vector<ByteSegment>& segments,
                                const std::string& algorithm = "SHA-256");

    static std::vector<uint8_t> digest(const std::vector<uint8_t>& data,
                                       const std::string& algorithm);

    /**
     * @brief Digest several segments as if they were concatenated
     *
     * Used for PDF byte ranges so the signed region is never copied.
     */
    static std::vector<uint8_t> digest(const std::vector<ByteSegment>& segments,
                                       const std::string& algorithm);

    /// "SHA-256" -> "2.16.840.1.101.3.4.2.1"; an OID maps to itself
    static std::string canonicalOid(const std::string& algorithm);

    /// OID or alias -> "SHA-256"
    static std::string algorithmName(const std::string& algorithm);

    static size_t digestSize(const std::string& algorithm);

    static const EVP_MD* evpMd(const std::string& algorithm);

    static bool isSupported(const std::string& algorithm);

    /// hashedMessage length equals the digest size of hashAlgorithm
    static bool isConsistent(const MessageImprint& imprint);
};

} // namespace pdftrust::validation
