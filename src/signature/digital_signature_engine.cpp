/**
 * @file digital_signature_engine.cpp
 * @brief DigitalSignatureEngine implementation
 */

#include "pdftrust/signature/digital_signature_engine.h"
#include "pdftrust/common/exceptions.h"
#include "pdftrust/util/encoding_util.h"
#include "pdftrust/util/time_utils.h"
#include "pdftrust/validation/message_imprint.h"

#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace pdftrust::signature {

using validation::MessageImprintBuilder;

namespace {

void appendUtf8(std::string& out, unsigned int cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

/// PDF text string (UTF-16BE with BOM, else PDFDocEncoding treated as Latin-1) to UTF-8
std::string textString(const pdf::PdfValue* value) {
    if (!value || !value->isString()) return "";
    std::string raw = value->stringBytes();
    std::string out;

    if (raw.size() >= 2 && static_cast<uint8_t>(raw[0]) == 0xFE && static_cast<uint8_t>(raw[1]) == 0xFF) {
        for (size_t i = 2; i + 1 < raw.size(); i += 2) {
            unsigned int unit = (static_cast<uint8_t>(raw[i]) << 8) | static_cast<uint8_t>(raw[i + 1]);
            if (unit >= 0xD800 && unit < 0xDC00 && i + 3 < raw.size()) {
                unsigned int low = (static_cast<uint8_t>(raw[i + 2]) << 8) | static_cast<uint8_t>(raw[i + 3]);
                if (low >= 0xDC00 && low < 0xE000) {
                    appendUtf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
                    i += 2;
                    continue;
                }
            }
            appendUtf8(out, unit);
        }
        return out;
    }

    for (char c : raw) {
        appendUtf8(out, static_cast<uint8_t>(c));
    }
    return out;
}

std::string nameValue(const pdf::PdfValue* value) {
    return (value && value->type == pdf::PdfValueType::NAME) ? value->text : "";
}

/// Parse and check /ByteRange; returns an error text or "" when well formed
std::string readByteRange(const pdf::PdfDocument& document, const pdf::PdfValue* value,
                          std::vector<ByteRangeSegment>& segments) {
    const pdf::PdfValue* array = value ? document.resolve(*value) : nullptr;
    if (!array || !array->isArray()) {
        return "missing /ByteRange array";
    }
    if (array->array.empty() || array->array.size() % 2 != 0) {
        return "/ByteRange must contain offset/length pairs";
    }

    std::vector<long long> numbers;
    for (const auto& item : array->array) {
        const pdf::PdfValue* n = document.resolve(item);
        if (!n || n->type != pdf::PdfValueType::INTEGER || n->integer < 0) {
            return "/ByteRange entries must be non-negative integers";
        }
        numbers.push_back(n->integer);
    }

    size_t fileSize = document.size();
    for (size_t i = 0; i < numbers.size(); i += 2) {
        ByteRangeSegment seg;
        seg.offset = static_cast<size_t>(numbers[i]);
        seg.length = static_cast<size_t>(numbers[i + 1]);
        if (seg.offset > fileSize || seg.length > fileSize - seg.offset) {
            return "/ByteRange segment " + std::to_string(seg.offset) + "+" + std::to_string(seg.length) +
                   " exceeds file size " + std::to_string(fileSize);
        }
        if (!segments.empty() && seg.offset < segments.back().end()) {
            return "/ByteRange segments overlap or are not ascending";
        }
        segments.push_back(seg);
    }
    return "";
}

} // namespace

DigitalSignatureEngine::DigitalSignatureEngine(validation::CertificateManager* certificateManager,
                                               tsp::TimestampServerManager* timestampManager)
    : certificateManager_(certificateManager), timestampManager_(timestampManager) {
    if (!certificateManager_) {
        throw std::invalid_argument("DigitalSignatureEngine: certificateManager cannot be nullptr");
    }
    if (!timestampManager_) {
        throw std::invalid_argument("DigitalSignatureEngine: timestampManager cannot be nullptr");
    }
}

// =============================================================================
// Extraction
// =============================================================================

std::vector<ExtractedSignature> DigitalSignatureEngine::extractSignatures(const pdf::PdfDocument& document) const {
    std::vector<ExtractedSignature> signatures;
    for (const auto& field : document.signatureFields()) {
        signatures.push_back(extractOne(document, field));
    }
    spdlog::debug("[DigitalSignatureEngine] Extracted {} signature(s)", signatures.size());
    return signatures;
}

ExtractedSignature DigitalSignatureEngine::extractOne(const pdf::PdfDocument& document,
                                                      const pdf::SignatureFieldInfo& field) const {
    const pdf::PdfValue& dict = field.signatureDictionary;
    ExtractedSignature ex;
    ex.fieldName = field.fieldName;
    ex.subFilter = nameValue(dict.get("SubFilter"));
    ex.signerName = textString(dict.get("Name"));
    ex.reason = textString(dict.get("Reason"));
    ex.location = textString(dict.get("Location"));
    ex.contactInfo = textString(dict.get("ContactInfo"));
    if (const pdf::PdfValue* m = dict.get("M")) {
        if (m->isString()) ex.signingTimeM = util::parsePdfDate(m->stringBytes());
    }

    // 1. Covered byte range
    ex.byteRangeError = readByteRange(document, dict.get("ByteRange"), ex.byteRange);

    // 2. Signature contents
    std::vector<uint8_t> der;
    const pdf::PdfValue* contentsRef = dict.get("Contents");
    const pdf::PdfValue* contents = contentsRef ? document.resolve(*contentsRef) : nullptr;
    if (!contents || !contents->isString()) {
        ex.extractionError = "unsupported signature format: missing /Contents string";
    } else {
        ex.contentsOffset = contents->offset;
        ex.contentsEnd = contents->endOffset;
        try {
            if (contents->type == pdf::PdfValueType::HEX_STRING) {
                der = util::fromHex(contents->text);
            } else {
                std::string bytes = contents->stringBytes();
                der.assign(bytes.begin(), bytes.end());
            }
        } catch (const std::invalid_argument& e) {
            ex.extractionError = std::string("unsupported signature format: ") + e.what();
        }
        if (ex.extractionError.empty()) {
            // Drop the zero padding of the reserved placeholder
            size_t derLength = cms::cmsEncodedLength(der);
            if (derLength == 0) {
                ex.extractionError = "unsupported signature format: /Contents is not a CMS structure";
            } else {
                der.resize(derLength);
            }
        }
    }

    // 3. Byte range observations
    if (ex.byteRangeError.empty()) {
        const auto& first = ex.byteRange.front();
        const auto& last = ex.byteRange.back();
        bool gapIsContents = false;
        size_t gaps = 0;
        for (size_t i = 1; i < ex.byteRange.size(); i++) {
            size_t gapStart = ex.byteRange[i - 1].end();
            size_t gapEnd = ex.byteRange[i].offset;
            if (gapEnd == gapStart) continue;
            gaps++;
            if (gapStart == ex.contentsOffset && gapEnd == ex.contentsEnd) gapIsContents = true;
        }

        if (first.offset != 0) {
            ex.warnings.push_back("Byte range does not start at the beginning of the file");
        }
        if (!gapIsContents || gaps != 1) {
            ex.warnings.push_back("Byte range gap does not exactly cover the signature contents");
        }
        if (last.end() != document.size()) {
            ex.warnings.push_back("Byte range does not reach the end of the file "
                                  "(document was modified after signing)");
        }
        ex.coversWholeDocument = first.offset == 0 && gaps == 1 && gapIsContents &&
                                 last.end() == document.size();
    }

    // 4. CMS object
    if (ex.extractionError.empty()) {
        std::vector<uint8_t> content;
        if (ex.byteRangeError.empty()) {
            const auto& bytes = document.bytes();
            for (const auto& seg : ex.byteRange) {
                content.insert(content.end(),
                               bytes.begin() + static_cast<long>(seg.offset),
                               bytes.begin() + static_cast<long>(seg.end()));
            }
        }
        try {
            ex.signature = cms::parseCmsSignature(der, std::move(content));
            ex.signature->timestamp = timestampManager_->extractTimestamp(*ex.signature);
        } catch (const common::ParsingException& e) {
            ex.signature.reset();
            ex.extractionError = std::string("unsupported signature format: ") + e.what();
        }
    }

    if (!ex.extractionError.empty()) {
        spdlog::warn("[DigitalSignatureEngine] Signature '{}': {}", ex.fieldName, ex.extractionError);
    }
    return ex;
}

// =============================================================================
// Validation
// =============================================================================

const validation::CertificateValidationResult& DigitalSignatureEngine::validateChain(
    const cms::CMSSignature& signature,
    const std::vector<validation::X509Certificate>& trustedRoots) {
    // Cached verdicts only hold for the trust set they were computed against
    std::vector<std::string> rootFingerprints;
    for (const auto& root : trustedRoots) {
        rootFingerprints.push_back(root.fingerprint);
    }
    std::sort(rootFingerprints.begin(), rootFingerprints.end());
    std::string rootsKey;
    for (const auto& fp : rootFingerprints) {
        rootsKey += fp + ";";
    }
    if (rootsKey != chainCacheRoots_) {
        chainCache_.clear();
        chainCacheRoots_ = rootsKey;
    }

    const std::string& key = signature.certificates.front().fingerprint;
    auto it = chainCache_.find(key);
    if (it != chainCache_.end()) {
        return it->second;
    }
    auto result = certificateManager_->validateCertificateChain(signature.certificates, trustedRoots);
    return chainCache_.emplace(key, std::move(result)).first->second;
}

SignatureValidationResult DigitalSignatureEngine::validateSignature(
    const ExtractedSignature& extracted,
    const std::vector<validation::X509Certificate>& trustedRoots) {
    SignatureValidationResult result;
    result.subFilter = extracted.subFilter;
    result.coversWholeDocument = extracted.coversWholeDocument;
    result.warnings = extracted.warnings;

    auto finish = [&]() -> SignatureValidationResult {
        result.isValid = result.errors.empty();
        if (result.isValid) {
            spdlog::info("[DigitalSignatureEngine] Signature '{}' valid", extracted.fieldName);
        } else {
            spdlog::warn("[DigitalSignatureEngine] Signature '{}' invalid: {}",
                         extracted.fieldName, result.errors.front());
        }
        return result;
    };

    bool sha1SubFilter = extracted.subFilter == SUBFILTER_PKCS7_SHA1;
    if (extracted.subFilter.empty()) {
        result.warnings.push_back("Signature dictionary has no /SubFilter; treated as adbe.pkcs7.detached");
    } else if (extracted.subFilter != SUBFILTER_PKCS7_DETACHED &&
               extracted.subFilter != SUBFILTER_CADES_DETACHED && !sha1SubFilter) {
        result.errors.push_back("unsupported signature format: " + extracted.subFilter);
        return finish();
    }

    if (!extracted.byteRangeError.empty()) {
        result.errors.push_back("byte range invalid: " + extracted.byteRangeError);
    }
    if (!extracted.signature) {
        result.errors.push_back(extracted.extractionError.empty()
                                ? "unsupported signature format" : extracted.extractionError);
        return finish();
    }

    const cms::CMSSignature& sig = *extracted.signature;
    const cms::SignerInfo& signer = sig.signerInfo;
    result.digestAlgorithm = signer.digestAlgorithm;
    const validation::X509Certificate* signerCert = sig.signerCertificate();
    if (signerCert) {
        result.signerCertificate = *signerCert;
    }

    // 1-2. Document digest against the signed message digest
    bool integrityChecked = false;
    if (extracted.byteRangeError.empty()) {
        if (!MessageImprintBuilder::isSupported(signer.digestAlgorithm)) {
            result.errors.push_back("unsupported digest algorithm " + signer.digestAlgorithm);
        } else {
            if (MessageImprintBuilder::algorithmName(signer.digestAlgorithm) == "SHA-1") {
                result.warnings.push_back("SHA-1 digest algorithm is deprecated");
            }
            if (sha1SubFilter) {
                auto documentDigest = MessageImprintBuilder::digest(sig.content, validation::oid::SHA1);
                bool ok = sig.encapsulatedContent && *sig.encapsulatedContent == documentDigest;
                if (ok && signer.hasSignedAttributes()) {
                    ok = signer.messageDigest &&
                         *signer.messageDigest == MessageImprintBuilder::digest(*sig.encapsulatedContent,
                                                                                signer.digestAlgorithm);
                }
                result.documentIntegrityValid = ok;
                integrityChecked = true;
            } else if (signer.hasSignedAttributes()) {
                auto documentDigest = MessageImprintBuilder::digest(sig.content, signer.digestAlgorithm);
                result.documentIntegrityValid = signer.messageDigest && *signer.messageDigest == documentDigest;
                integrityChecked = true;
            }
        }
    }

    // 3. Signer signature
    std::string signatureError;
    if (!signerCert) {
        signatureError = "signer certificate not found in signature";
    } else {
        cms::SignerVerification verification = cms::verifySignerSignature(sig);
        result.signatureValid = verification.verified;
        if (!verification.verified) {
            spdlog::debug("[DigitalSignatureEngine] Signature '{}': {}", extracted.fieldName, verification.error);
            signatureError = "signature mismatch";
        }
    }

    // Without signed attributes the signature itself covers the document bytes
    if (!integrityChecked && extracted.byteRangeError.empty() && !signer.hasSignedAttributes() &&
        MessageImprintBuilder::isSupported(signer.digestAlgorithm)) {
        result.documentIntegrityValid = result.signatureValid;
        integrityChecked = signerCert != nullptr;
    }

    if (integrityChecked && !result.documentIntegrityValid) {
        result.errors.push_back("digest mismatch");
    }
    if (!signatureError.empty()) {
        result.errors.push_back(signatureError);
    }

    // 4. Certificate chain
    if (signerCert) {
        const auto& chain = validateChain(sig, trustedRoots);
        result.certificateChainValid = chain.isValid;
        if (!chain.isValid) {
            result.errors.push_back("certificate chain invalid: " +
                                    (chain.errors.empty() ? std::string("unknown failure") : chain.errors.front()));
        }
        result.warnings.insert(result.warnings.end(), chain.warnings.begin(), chain.warnings.end());
    }

    // 5. Timestamp over the signature value
    result.timestampValid = true;
    if (sig.timestamp) {
        result.hasTimestamp = true;
        if (verifyTimestamps_) {
            auto verification = timestampManager_->verifyTimestamp(*sig.timestamp, signer.signature);
            result.timestampValid = verification.isValid;
            if (!verification.isValid) {
                result.errors.push_back("timestamp invalid: " + verification.errors.front());
            }
            result.timestampVerification = std::move(verification);
        } else {
            result.warnings.push_back("Timestamp present but not verified");
        }
    }

    if (sig.timestamp) {
        result.signingTime = sig.timestamp->genTime;
    } else if (signer.signingTime) {
        result.signingTime = signer.signingTime;
    } else {
        result.signingTime = extracted.signingTimeM;
    }

    return finish();
}

} // namespace pdftrust::signature
