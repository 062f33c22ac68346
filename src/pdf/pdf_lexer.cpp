/**
 * @file pdf_lexer.cpp
 * @brief PDF object syntax reader implementation
 */

#include "pdftrust/pdf/pdf_lexer.h"
#include "pdftrust/common/exceptions.h"

#include <cstdlib>
#include <stdexcept>

namespace pdftrust::pdf {

namespace {

constexpr int MAX_NESTING_DEPTH = 64;
constexpr size_t MAX_INTEGER_DIGITS = 18;

int hexValue(uint8_t c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool isDigit(uint8_t c) { return c >= '0' && c <= '9'; }

} // namespace

// --- PdfValue ---

const PdfValue* PdfValue::get(const std::string& key) const {
    if (type != PdfValueType::DICTIONARY) return nullptr;
    for (const auto& entry : dict) {
        if (entry.first == key) return &entry.second;
    }
    return nullptr;
}

std::string PdfValue::stringBytes() const {
    if (type == PdfValueType::STRING) return text;
    if (type != PdfValueType::HEX_STRING) return "";

    std::string out;
    out.reserve(text.size() / 2 + 1);
    for (size_t i = 0; i < text.size(); i += 2) {
        int hi = hexValue(static_cast<uint8_t>(text[i]));
        int lo = (i + 1 < text.size()) ? hexValue(static_cast<uint8_t>(text[i + 1])) : 0;
        out += static_cast<char>((hi << 4) | lo);
    }
    return out;
}

// --- PdfParser ---

PdfParser::PdfParser(const uint8_t* data, size_t size) : data_(data), size_(size) {
    if (!data && size > 0) {
        throw std::invalid_argument("PdfParser: data cannot be nullptr");
    }
}

bool PdfParser::isWhitespace(uint8_t c) {
    return c == 0x00 || c == 0x09 || c == 0x0A || c == 0x0C || c == 0x0D || c == 0x20;
}

bool PdfParser::isDelimiter(uint8_t c) {
    switch (c) {
        case '(': case ')': case '<': case '>': case '[': case ']':
        case '{': case '}': case '/': case '%':
            return true;
        default:
            return false;
    }
}

void PdfParser::skipWhitespaceAndComments() {
    while (pos_ < size_) {
        uint8_t c = data_[pos_];
        if (isWhitespace(c)) {
            pos_++;
        } else if (c == '%') {
            while (pos_ < size_ && data_[pos_] != '\n' && data_[pos_] != '\r') pos_++;
        } else {
            break;
        }
    }
}

std::string PdfParser::readKeyword() {
    size_t start = pos_;
    while (pos_ < size_ && !isWhitespace(data_[pos_]) && !isDelimiter(data_[pos_])) pos_++;
    return std::string(reinterpret_cast<const char*>(data_ + start), pos_ - start);
}

bool PdfParser::readUnsigned(long long& value) {
    size_t start = pos_;
    while (pos_ < size_ && isDigit(data_[pos_])) pos_++;
    size_t digits = pos_ - start;
    if (digits == 0 || digits > MAX_INTEGER_DIGITS) {
        pos_ = start;
        return false;
    }
    if (pos_ < size_ && !isWhitespace(data_[pos_]) && !isDelimiter(data_[pos_])) {
        pos_ = start;
        return false;
    }
    value = std::strtoll(std::string(reinterpret_cast<const char*>(data_ + start), digits).c_str(), nullptr, 10);
    return true;
}

bool PdfParser::parseObjectHeader(PdfObjectRef& ref) {
    size_t save = pos_;
    long long num = 0;
    long long gen = 0;
    if (readUnsigned(num)) {
        skipWhitespaceAndComments();
        if (readUnsigned(gen)) {
            skipWhitespaceAndComments();
            if (readKeyword() == "obj") {
                ref.number = static_cast<int>(num);
                ref.generation = static_cast<int>(gen);
                return true;
            }
        }
    }
    pos_ = save;
    return false;
}

PdfValue PdfParser::parseValue() {
    return parseValueAt(0);
}

PdfValue PdfParser::parseValueAt(int depth) {
    if (depth > MAX_NESTING_DEPTH) {
        throw common::ParsingException("PDF object nesting deeper than " + std::to_string(MAX_NESTING_DEPTH));
    }
    skipWhitespaceAndComments();
    if (atEnd()) {
        throw common::ParsingException("unexpected end of PDF data");
    }

    size_t start = pos_;
    uint8_t c = data_[pos_];
    PdfValue value;

    if (c == '/') {
        value = parseName();
    } else if (c == '(') {
        value = parseLiteralString();
    } else if (c == '<' && pos_ + 1 < size_ && data_[pos_ + 1] == '<') {
        pos_ += 2;
        value.type = PdfValueType::DICTIONARY;
        while (true) {
            skipWhitespaceAndComments();
            if (atEnd()) {
                throw common::ParsingException("unterminated dictionary at offset " + std::to_string(start));
            }
            if (data_[pos_] == '>' && pos_ + 1 < size_ && data_[pos_ + 1] == '>') {
                pos_ += 2;
                break;
            }
            if (data_[pos_] != '/') {
                throw common::ParsingException("dictionary key is not a name at offset " + std::to_string(pos_));
            }
            std::string key = parseName().text;
            value.dict.emplace_back(std::move(key), parseValueAt(depth + 1));
        }
    } else if (c == '<') {
        value = parseHexString();
    } else if (c == '[') {
        pos_++;
        value.type = PdfValueType::ARRAY;
        while (true) {
            skipWhitespaceAndComments();
            if (atEnd()) {
                throw common::ParsingException("unterminated array at offset " + std::to_string(start));
            }
            if (data_[pos_] == ']') {
                pos_++;
                break;
            }
            value.array.push_back(parseValueAt(depth + 1));
        }
    } else if (isDigit(c) || c == '+' || c == '-' || c == '.') {
        value = parseNumberOrReference();
    } else {
        std::string keyword = readKeyword();
        if (keyword == "true" || keyword == "false") {
            value.type = PdfValueType::BOOLEAN;
            value.boolean = (keyword == "true");
        } else if (keyword == "null") {
            value.type = PdfValueType::NULL_VALUE;
        } else {
            pos_ = start;
            throw common::ParsingException("unexpected token '" + (keyword.empty() ? std::string(1, static_cast<char>(c)) : keyword) +
                                           "' at offset " + std::to_string(start));
        }
    }

    value.offset = start;
    value.endOffset = pos_;
    return value;
}

PdfValue PdfParser::parseNumberOrReference() {
    size_t start = pos_;
    if (data_[pos_] == '+' || data_[pos_] == '-') pos_++;
    bool sawDot = false;
    size_t digits = 0;
    while (pos_ < size_ && (isDigit(data_[pos_]) || (data_[pos_] == '.' && !sawDot))) {
        if (data_[pos_] == '.') sawDot = true; else digits++;
        pos_++;
    }
    if (digits == 0) {
        throw common::ParsingException("malformed number at offset " + std::to_string(start));
    }

    std::string literal(reinterpret_cast<const char*>(data_ + start), pos_ - start);
    PdfValue value;
    if (sawDot || digits > MAX_INTEGER_DIGITS) {
        value.type = PdfValueType::REAL;
        value.real = std::strtod(literal.c_str(), nullptr);
        return value;
    }

    value.type = PdfValueType::INTEGER;
    value.integer = std::strtoll(literal.c_str(), nullptr, 10);

    // "n g R" lookahead
    if (isDigit(data_[start])) {
        size_t save = pos_;
        skipWhitespaceAndComments();
        long long generation = 0;
        if (readUnsigned(generation)) {
            skipWhitespaceAndComments();
            if (pos_ < size_ && data_[pos_] == 'R' &&
                (pos_ + 1 == size_ || isWhitespace(data_[pos_ + 1]) || isDelimiter(data_[pos_ + 1]))) {
                pos_++;
                value.type = PdfValueType::REFERENCE;
                value.ref.number = static_cast<int>(value.integer);
                value.ref.generation = static_cast<int>(generation);
                return value;
            }
        }
        pos_ = save;
    }
    return value;
}

PdfValue PdfParser::parseName() {
    pos_++;  // '/'
    PdfValue value;
    value.type = PdfValueType::NAME;
    while (pos_ < size_ && !isWhitespace(data_[pos_]) && !isDelimiter(data_[pos_])) {
        uint8_t c = data_[pos_];
        if (c == '#' && pos_ + 2 < size_ && hexValue(data_[pos_ + 1]) >= 0 && hexValue(data_[pos_ + 2]) >= 0) {
            value.text += static_cast<char>((hexValue(data_[pos_ + 1]) << 4) | hexValue(data_[pos_ + 2]));
            pos_ += 3;
        } else {
            value.text += static_cast<char>(c);
            pos_++;
        }
    }
    return value;
}

PdfValue PdfParser::parseLiteralString() {
    size_t start = pos_;
    pos_++;  // '('
    PdfValue value;
    value.type = PdfValueType::STRING;
    int nesting = 1;

    while (pos_ < size_) {
        uint8_t c = data_[pos_++];
        if (c == '\\') {
            if (pos_ >= size_) break;
            uint8_t e = data_[pos_++];
            switch (e) {
                case 'n': value.text += '\n'; break;
                case 'r': value.text += '\r'; break;
                case 't': value.text += '\t'; break;
                case 'b': value.text += '\b'; break;
                case 'f': value.text += '\f'; break;
                case '\r':
                    if (pos_ < size_ && data_[pos_] == '\n') pos_++;
                    break;
                case '\n':
                    break;
                default:
                    if (e >= '0' && e <= '7') {
                        int octal = e - '0';
                        for (int i = 0; i < 2 && pos_ < size_ && data_[pos_] >= '0' && data_[pos_] <= '7'; i++) {
                            octal = octal * 8 + (data_[pos_++] - '0');
                        }
                        value.text += static_cast<char>(octal & 0xFF);
                    } else {
                        value.text += static_cast<char>(e);
                    }
            }
        } else if (c == '(') {
            nesting++;
            value.text += '(';
        } else if (c == ')') {
            if (--nesting == 0) return value;
            value.text += ')';
        } else {
            value.text += static_cast<char>(c);
        }
    }
    throw common::ParsingException("unterminated string at offset " + std::to_string(start));
}

PdfValue PdfParser::parseHexString() {
    size_t start = pos_;
    pos_++;  // '<'
    PdfValue value;
    value.type = PdfValueType::HEX_STRING;

    while (pos_ < size_) {
        uint8_t c = data_[pos_++];
        if (c == '>') return value;
        if (isWhitespace(c)) continue;
        if (hexValue(c) < 0) {
            throw common::ParsingException("invalid hex string character at offset " + std::to_string(pos_ - 1));
        }
        value.text += static_cast<char>(c);
    }
    throw common::ParsingException("unterminated hex string at offset " + std::to_string(start));
}

} // namespace pdftrust::pdf
