/**
 * @file collaborators.h
 * @brief Storage seams owned by the embedding application
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <json/json.h>

namespace pdftrust::engine {

/// Reads a stored document by id
class IDocumentBytesProvider {
public:
    virtual ~IDocumentBytesProvider() = default;

    /// @throws common::PdfTrustException (or a subclass) when the document cannot be read
    virtual std::vector<uint8_t> readDocument(const std::string& documentId) = 0;
};

/// Persists a validation result
class IValidationResultSink {
public:
    virtual ~IValidationResultSink() = default;

    virtual void storeValidationResult(const std::string& documentId, const Json::Value& result) = 0;
};

} // namespace pdftrust::engine
