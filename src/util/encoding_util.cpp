/**
 * @file encoding_util.cpp
 * @brief Hex and Base64 codec implementation
 */

#include "pdftrust/util/encoding_util.h"

#include <stdexcept>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>

namespace pdftrust::util {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool isPdfWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\0';
}

} // namespace

std::string toHex(const uint8_t* data, size_t length) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (size_t i = 0; i < length; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

std::string toHex(const std::vector<uint8_t>& data) {
    return toHex(data.data(), data.size());
}

std::vector<uint8_t> fromHex(const std::string& hex) {
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);

    int high = -1;
    for (char c : hex) {
        if (isPdfWhitespace(c)) continue;
        int v = hexValue(c);
        if (v < 0) {
            throw std::invalid_argument(std::string("fromHex: invalid hex character '") + c + "'");
        }
        if (high < 0) {
            high = v;
        } else {
            out.push_back(static_cast<uint8_t>((high << 4) | v));
            high = -1;
        }
    }
    if (high >= 0) {
        out.push_back(static_cast<uint8_t>(high << 4));
    }
    return out;
}

std::string base64Encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new(BIO_s_mem());
    b64 = BIO_push(b64, mem);

    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(b64, data.data(), static_cast<int>(data.size()));
    (void)BIO_flush(b64);

    BUF_MEM* bufferPtr = nullptr;
    BIO_get_mem_ptr(b64, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(b64);
    return result;
}

std::vector<uint8_t> base64Decode(const std::string& encoded) {
    if (encoded.empty()) {
        return {};
    }

    std::vector<uint8_t> result((encoded.length() * 3) / 4 + 3);

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new_mem_buf(encoded.c_str(), static_cast<int>(encoded.length()));
    mem = BIO_push(b64, mem);

    BIO_set_flags(mem, BIO_FLAGS_BASE64_NO_NL);
    int actualLength = BIO_read(mem, result.data(), static_cast<int>(result.size()));
    BIO_free_all(mem);

    if (actualLength < 0) {
        throw std::runtime_error("Base64 decoding failed");
    }

    result.resize(static_cast<size_t>(actualLength));
    return result;
}

} // namespace pdftrust::util
