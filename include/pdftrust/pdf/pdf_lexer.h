/**
 * @file pdf_lexer.h
 * @brief Minimal PDF object syntax reader (ISO 32000-1 Section 7.3)
 *
 * Parses the direct-object grammar (numbers, names, strings, arrays,
 * dictionaries, indirect references) over a byte buffer it does not own.
 * Stream contents are never decoded. Byte offsets are kept on every value
 * so signature /Contents placeholders can be located exactly.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace pdftrust::pdf {

enum class PdfValueType {
    NULL_VALUE,
    BOOLEAN,
    INTEGER,
    REAL,
    NAME,
    STRING,
    HEX_STRING,
    ARRAY,
    DICTIONARY,
    REFERENCE
};

struct PdfObjectRef {
    int number = 0;
    int generation = 0;

    bool operator==(const PdfObjectRef& o) const { return number == o.number && generation == o.generation; }
    bool operator<(const PdfObjectRef& o) const {
        return number != o.number ? number < o.number : generation < o.generation;
    }
    std::string toString() const {
        return std::to_string(number) + " " + std::to_string(generation) + " R";
    }
};

struct PdfValue {
    PdfValueType type = PdfValueType::NULL_VALUE;
    bool boolean = false;
    long long integer = 0;
    double real = 0.0;
    std::string text;          ///< Name without '/', decoded literal string, or hex digits
    std::vector<PdfValue> array;
    std::vector<std::pair<std::string, PdfValue>> dict;
    PdfObjectRef ref;
    size_t offset = 0;         ///< First byte of the token
    size_t endOffset = 0;      ///< One past the last byte

    bool isNull() const { return type == PdfValueType::NULL_VALUE; }
    bool isDict() const { return type == PdfValueType::DICTIONARY; }
    bool isArray() const { return type == PdfValueType::ARRAY; }
    bool isRef() const { return type == PdfValueType::REFERENCE; }
    bool isNumber() const { return type == PdfValueType::INTEGER || type == PdfValueType::REAL; }
    bool isString() const { return type == PdfValueType::STRING || type == PdfValueType::HEX_STRING; }
    bool isName(const std::string& name) const { return type == PdfValueType::NAME && text == name; }

    /// Dictionary lookup; nullptr when absent or not a dictionary
    const PdfValue* get(const std::string& key) const;

    /// Decoded bytes of a literal or hex string
    std::string stringBytes() const;
};

/**
 * @brief Cursor over a PDF byte buffer
 *
 * The buffer must outlive the parser.
 */
class PdfParser {
public:
    PdfParser(const uint8_t* data, size_t size);

    size_t position() const { return pos_; }
    void seek(size_t pos) { pos_ = pos < size_ ? pos : size_; }
    bool atEnd() const { return pos_ >= size_; }

    void skipWhitespaceAndComments();

    /**
     * @brief Parse one direct object (or "n g R" reference) at the cursor
     * @throws common::ParsingException on malformed syntax or nesting deeper than 64
     */
    PdfValue parseValue();

    /// Read a bare keyword (e.g. "stream", "endobj"); empty if the cursor is not on one
    std::string readKeyword();

    /// Parse "N G obj" at the cursor; on failure the cursor is restored
    bool parseObjectHeader(PdfObjectRef& ref);

    static bool isWhitespace(uint8_t c);
    static bool isDelimiter(uint8_t c);

private:
    PdfValue parseValueAt(int depth);
    PdfValue parseNumberOrReference();
    PdfValue parseName();
    PdfValue parseLiteralString();
    PdfValue parseHexString();
    bool readUnsigned(long long& value);

    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

} // namespace pdftrust::pdf
