/**
 * @file pdf_document.cpp
 * @brief PDF object index and signature field discovery
 */

#include "pdftrust/pdf/pdf_document.h"
#include "pdftrust/common/exceptions.h"

#include <algorithm>
#include <cstring>
#include <set>
#include <spdlog/spdlog.h>

namespace pdftrust::pdf {

namespace {

constexpr int MAX_REFERENCE_HOPS = 16;
constexpr int MAX_FIELD_DEPTH = 32;

bool isBoundary(uint8_t c) {
    return PdfParser::isWhitespace(c) || PdfParser::isDelimiter(c);
}

/// Start of "N G" preceding the "obj" keyword at objPos, or npos
size_t objectHeaderStart(const uint8_t* data, size_t objPos) {
    size_t i = objPos;
    auto skipSpaces = [&]() {
        size_t before = i;
        while (i > 0 && PdfParser::isWhitespace(data[i - 1])) i--;
        return i != before;
    };
    auto skipDigits = [&]() {
        size_t before = i;
        while (i > 0 && data[i - 1] >= '0' && data[i - 1] <= '9') i--;
        return i != before;
    };
    if (!skipSpaces() || !skipDigits() || !skipSpaces() || !skipDigits()) {
        return std::string::npos;
    }
    if (i > 0 && !isBoundary(data[i - 1])) {
        return std::string::npos;
    }
    return i;
}

size_t findToken(const std::vector<uint8_t>& data, const char* token, size_t from) {
    size_t len = std::strlen(token);
    auto it = std::search(data.begin() + static_cast<long>(std::min(from, data.size())), data.end(),
                          token, token + len);
    return it == data.end() ? std::string::npos : static_cast<size_t>(it - data.begin());
}

size_t findLastKeyword(const std::vector<uint8_t>& data, const std::string& keyword) {
    if (data.size() < keyword.size()) return std::string::npos;
    for (size_t i = data.size() - keyword.size() + 1; i-- > 0;) {
        if (std::memcmp(data.data() + i, keyword.data(), keyword.size()) != 0) continue;
        bool startOk = (i == 0) || isBoundary(data[i - 1]);
        size_t end = i + keyword.size();
        bool endOk = (end == data.size()) || isBoundary(data[end]);
        if (startOk && endOk) return i;
    }
    return std::string::npos;
}

} // namespace

PdfDocument PdfDocument::parse(const std::vector<uint8_t>& data, size_t maxObjects) {
    PdfDocument doc(data);
    doc.indexObjects(maxObjects);
    doc.locateTrailer();
    doc.discoverSignatureFields();
    spdlog::debug("[PdfDocument] Indexed {} objects, {} signature dictionaries",
                  doc.objects_.size(), doc.signatureFields_.size());
    return doc;
}

// =============================================================================
// Object index
// =============================================================================

void PdfDocument::indexObjects(size_t maxObjects) {
    const std::vector<uint8_t>& data = *data_;
    PdfParser parser(data.data(), data.size());
    size_t scanned = 0;
    size_t cursor = 0;

    while (true) {
        size_t objPos = findToken(data, "obj", cursor);
        if (objPos == std::string::npos) break;
        cursor = objPos + 3;

        if (cursor < data.size() && !isBoundary(data[cursor])) continue;
        size_t headerStart = objectHeaderStart(data.data(), objPos);
        if (headerStart == std::string::npos) continue;

        if (++scanned > maxObjects) {
            warnings_.push_back("Object index truncated after " + std::to_string(maxObjects) + " objects");
            break;
        }

        parser.seek(headerStart);
        IndirectObject obj;
        if (!parser.parseObjectHeader(obj.ref)) continue;
        obj.offset = headerStart;

        try {
            obj.value = parser.parseValue();
        } catch (const common::ParsingException& e) {
            warnings_.push_back("Object " + obj.ref.toString() + " could not be parsed: " + e.what());
            continue;
        }
        cursor = std::max(cursor, parser.position());

        // Skip stream data so binary content is not scanned for headers
        parser.skipWhitespaceAndComments();
        if (parser.readKeyword() == "stream") {
            size_t dataStart = parser.position();
            if (dataStart < data.size() && data[dataStart] == '\r') dataStart++;
            if (dataStart < data.size() && data[dataStart] == '\n') dataStart++;

            size_t resume = std::string::npos;
            const PdfValue* length = obj.value.get("Length");
            if (length && length->type == PdfValueType::INTEGER && length->integer >= 0 &&
                dataStart + static_cast<size_t>(length->integer) <= data.size()) {
                size_t end = dataStart + static_cast<size_t>(length->integer);
                size_t marker = findToken(data, "endstream", end);
                if (marker != std::string::npos && marker - end <= 4) resume = marker;
            }
            if (resume == std::string::npos) {
                resume = findToken(data, "endstream", dataStart);
            }
            cursor = (resume == std::string::npos) ? data.size() : resume + 9;
        }

        PdfObjectRef key = obj.ref;
        objects_[key] = std::move(obj);
    }
}

const IndirectObject* PdfDocument::object(const PdfObjectRef& ref) const {
    auto it = objects_.find(ref);
    return it == objects_.end() ? nullptr : &it->second;
}

const PdfValue* PdfDocument::resolve(const PdfValue& value) const {
    const PdfValue* current = &value;
    for (int hop = 0; hop < MAX_REFERENCE_HOPS && current->isRef(); hop++) {
        const IndirectObject* obj = object(current->ref);
        if (!obj) return nullptr;
        current = &obj->value;
    }
    return current->isRef() ? nullptr : current;
}

// =============================================================================
// Trailer and catalog
// =============================================================================

void PdfDocument::locateTrailer() {
    const std::vector<uint8_t>& data = *data_;
    size_t classicOffset = findLastKeyword(data, "trailer");
    std::optional<PdfValue> classic;
    if (classicOffset != std::string::npos) {
        PdfParser parser(data.data(), data.size());
        parser.seek(classicOffset + 7);
        try {
            PdfValue value = parser.parseValue();
            if (value.isDict()) classic = std::move(value);
        } catch (const common::ParsingException& e) {
            warnings_.push_back(std::string("Trailer dictionary could not be parsed: ") + e.what());
        }
    }

    // Cross-reference stream dictionaries carry the trailer keys
    const IndirectObject* xrefStream = nullptr;
    for (const auto& [ref, obj] : objects_) {
        const PdfValue* type = obj.value.get("Type");
        if (type && type->isName("XRef") && (!xrefStream || obj.offset > xrefStream->offset)) {
            xrefStream = &obj;
        }
    }

    if (xrefStream && (!classic || xrefStream->offset > classicOffset)) {
        trailer_ = xrefStream->value;
    } else if (classic) {
        trailer_ = std::move(classic);
    }
}

const PdfValue* PdfDocument::catalog() const {
    if (trailer_) {
        if (const PdfValue* root = trailer_->get("Root")) {
            const PdfValue* resolved = resolve(*root);
            if (resolved && resolved->isDict()) return resolved;
        }
    }
    const PdfValue* found = nullptr;
    size_t foundOffset = 0;
    for (const auto& [ref, obj] : objects_) {
        const PdfValue* type = obj.value.get("Type");
        if (type && type->isName("Catalog") && (!found || obj.offset > foundOffset)) {
            found = &obj.value;
            foundOffset = obj.offset;
        }
    }
    return found;
}

bool PdfDocument::isEncrypted() const {
    return trailer_ && trailer_->get("Encrypt") != nullptr;
}

int PdfDocument::pageCount() const {
    const PdfValue* root = catalog();
    if (!root) return 0;
    const PdfValue* pagesRef = root->get("Pages");
    const PdfValue* pages = pagesRef ? resolve(*pagesRef) : nullptr;
    if (!pages || !pages->isDict()) return 0;
    const PdfValue* count = pages->get("Count");
    const PdfValue* resolved = count ? resolve(*count) : nullptr;
    return (resolved && resolved->type == PdfValueType::INTEGER && resolved->integer > 0)
        ? static_cast<int>(resolved->integer) : 0;
}

bool PdfDocument::hasFormFields() const {
    const PdfValue* root = catalog();
    if (!root) return false;
    const PdfValue* formRef = root->get("AcroForm");
    const PdfValue* form = formRef ? resolve(*formRef) : nullptr;
    if (!form || !form->isDict()) return false;
    const PdfValue* fieldsRef = form->get("Fields");
    const PdfValue* fields = fieldsRef ? resolve(*fieldsRef) : nullptr;
    return fields && fields->isArray() && !fields->array.empty();
}

// =============================================================================
// Signature fields
// =============================================================================

bool PdfDocument::isSignatureField(const PdfValue& field) const {
    const PdfValue* current = &field;
    for (int depth = 0; current && current->isDict() && depth < MAX_FIELD_DEPTH; depth++) {
        if (const PdfValue* ft = current->get("FT")) {
            return ft->isName("Sig");
        }
        const PdfValue* parent = current->get("Parent");
        current = parent ? resolve(*parent) : nullptr;
    }
    return false;
}

std::string PdfDocument::fullFieldName(const PdfValue& field) const {
    std::vector<std::string> parts;
    const PdfValue* current = &field;
    for (int depth = 0; current && current->isDict() && depth < MAX_FIELD_DEPTH; depth++) {
        const PdfValue* t = current->get("T");
        if (t && t->isString()) {
            parts.push_back(t->stringBytes());
        }
        const PdfValue* parent = current->get("Parent");
        current = parent ? resolve(*parent) : nullptr;
    }

    std::string name;
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        if (!name.empty()) name += ".";
        name += *it;
    }
    return name;
}

void PdfDocument::discoverSignatureFields() {
    struct Found {
        size_t offset;
        SignatureFieldInfo info;
    };
    std::vector<Found> found;
    std::set<PdfObjectRef> referenced;

    // 1. Signature fields with a value
    for (const auto& [ref, obj] : objects_) {
        const PdfValue& field = obj.value;
        if (!field.isDict() || !field.get("V") || !isSignatureField(field)) continue;

        const PdfValue* v = field.get("V");
        const PdfValue* sig = resolve(*v);
        std::string name = fullFieldName(field);
        if (!sig || !sig->isDict()) {
            warnings_.push_back("Signature field '" + name + "' has no signature dictionary");
            continue;
        }

        Found entry;
        entry.info.fieldName = name;
        entry.info.signatureDictionary = *sig;
        entry.offset = obj.offset;
        if (v->isRef()) {
            if (!referenced.insert(v->ref).second) continue;
            entry.info.signatureRef = v->ref;
            if (const IndirectObject* sigObj = object(v->ref)) entry.offset = sigObj->offset;
        }
        found.push_back(std::move(entry));
    }

    // 2. Signature dictionaries no field points at
    for (const auto& [ref, obj] : objects_) {
        const PdfValue& dict = obj.value;
        if (!dict.isDict() || referenced.count(ref)) continue;
        const PdfValue* type = dict.get("Type");
        bool sigType = type && type->isName("Sig");
        bool looksLikeSig = !type && dict.get("ByteRange") && dict.get("Contents") && !dict.get("FT");
        if (!sigType && !looksLikeSig) continue;

        Found entry;
        entry.offset = obj.offset;
        entry.info.signatureDictionary = dict;
        entry.info.signatureRef = ref;
        entry.info.orphan = true;
        found.push_back(std::move(entry));
    }

    std::stable_sort(found.begin(), found.end(),
                     [](const Found& a, const Found& b) { return a.offset < b.offset; });

    for (size_t i = 0; i < found.size(); i++) {
        SignatureFieldInfo& info = found[i].info;
        if (info.fieldName.empty()) {
            info.fieldName = "Signature" + std::to_string(i + 1);
            if (info.orphan) {
                warnings_.push_back("Signature dictionary " + info.signatureRef->toString() +
                                    " is not referenced by a signature field; reported as '" +
                                    info.fieldName + "'");
            }
        }
        signatureFields_.push_back(std::move(info));
    }
}

} // namespace pdftrust::pdf
