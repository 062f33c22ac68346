/**
 * @file pdf_document.h
 * @brief Scanned object index of a PDF file
 *
 * Objects are located by scanning for "N G obj" headers rather than by
 * following the cross-reference table, so damaged or hybrid files still
 * yield their signature dictionaries. Later definitions of the same object
 * (incremental updates) replace earlier ones. Objects packed in object
 * streams are not visible.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "pdf_lexer.h"

namespace pdftrust::pdf {

struct IndirectObject {
    PdfObjectRef ref;
    size_t offset = 0;      ///< Offset of the "N G obj" header
    PdfValue value;
};

/// @brief A signature dictionary and the field that references it
struct SignatureFieldInfo {
    std::string fieldName;
    PdfValue signatureDictionary;
    std::optional<PdfObjectRef> signatureRef;   ///< Absent for a direct /V dictionary
    bool orphan = false;                         ///< Not referenced by any signature field
};

class PdfDocument {
public:
    /**
     * @brief Index the objects of a PDF
     * @param data File bytes; must outlive the document
     * @param maxObjects Upper bound on indexed object headers
     */
    static PdfDocument parse(const std::vector<uint8_t>& data, size_t maxObjects = 1000000);

    const std::vector<uint8_t>& bytes() const { return *data_; }
    size_t size() const { return data_->size(); }

    const std::map<PdfObjectRef, IndirectObject>& objects() const { return objects_; }
    const IndirectObject* object(const PdfObjectRef& ref) const;

    /// Follow a reference (up to 16 hops); returns the value itself when it is direct
    const PdfValue* resolve(const PdfValue& value) const;

    /// Latest trailer dictionary (classic trailer or cross-reference stream dictionary)
    const PdfValue* trailer() const { return trailer_ ? &*trailer_ : nullptr; }
    const PdfValue* catalog() const;

    bool isEncrypted() const;
    /// /Count of the root page tree, 0 when it cannot be resolved
    int pageCount() const;
    bool hasFormFields() const;

    /// Signature dictionaries in file order, field-referenced ones named by their full field name
    const std::vector<SignatureFieldInfo>& signatureFields() const { return signatureFields_; }

    /// Non-fatal findings from parsing and signature discovery
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    explicit PdfDocument(const std::vector<uint8_t>& data) : data_(&data) {}

    void indexObjects(size_t maxObjects);
    void locateTrailer();
    void discoverSignatureFields();
    std::string fullFieldName(const PdfValue& field) const;
    bool isSignatureField(const PdfValue& field) const;

    const std::vector<uint8_t>* data_;
    std::map<PdfObjectRef, IndirectObject> objects_;
    std::optional<PdfValue> trailer_;
    std::vector<SignatureFieldInfo> signatureFields_;
    std::vector<std::string> warnings_;
};

} // namespace pdftrust::pdf
