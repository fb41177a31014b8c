/**
 * @file encoding.cpp
 * @brief Text encodings used by the token format
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "ssotok/utils/encoding.h"
#include "ssotok/core/security.h"
#include <cstring>

// ============================================================================
// Internal Constants
// ============================================================================

static const char HEX_LOWER[] = "0123456789abcdef";
static const char HEX_UPPER[] = "0123456789ABCDEF";

static const char BASE64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// Lookup table for Base64 decoding (-1 = invalid, -2 = padding '=')
// Standard alphabet only: '-' and '_' are invalid here.
static const int8_t BASE64_DECODE[256] = {
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,  // 0x00-0x0F
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,  // 0x10-0x1F
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,62,-1,-1,-1,63,  // 0x20-0x2F (+,/)
    52,53,54,55,56,57,58,59,60,61,-1,-1,-1,-2,-1,-1,  // 0x30-0x3F (0-9,=)
    -1, 0, 1, 2, 3, 4, 5, 6, 7, 8, 9,10,11,12,13,14,  // 0x40-0x4F (A-O)
    15,16,17,18,19,20,21,22,23,24,25,-1,-1,-1,-1,-1,  // 0x50-0x5F (P-Z)
    -1,26,27,28,29,30,31,32,33,34,35,36,37,38,39,40,  // 0x60-0x6F (a-o)
    41,42,43,44,45,46,47,48,49,50,51,-1,-1,-1,-1,-1,  // 0x70-0x7F (p-z)
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,  // 0x80-0x8F
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,  // 0x90-0x9F
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,  // 0xA0-0xAF
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,  // 0xB0-0xBF
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,  // 0xC0-0xCF
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,  // 0xD0-0xDF
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,  // 0xE0-0xEF
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1   // 0xF0-0xFF
};

// ============================================================================
// C API: Hex Encoding/Decoding
// ============================================================================

extern "C" {

size_t ssotok_hex_encode(const uint8_t* data, size_t len, char* hex, size_t hex_size) {
    if (data == nullptr || hex == nullptr || hex_size < len * 2 + 1) {
        return 0;
    }

    for (size_t i = 0; i < len; i++) {
        hex[i * 2] = HEX_LOWER[data[i] >> 4];
        hex[i * 2 + 1] = HEX_LOWER[data[i] & 0x0F];
    }
    hex[len * 2] = '\0';

    return len * 2;
}

int ssotok_hex_char_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

size_t ssotok_hex_decode(const char* hex, size_t hex_len, uint8_t* data, size_t data_size) {
    if (hex == nullptr || data == nullptr) {
        return 0;
    }

    if (hex_len == 0) {
        hex_len = strlen(hex);
    }

    if (hex_len % 2 != 0) {
        return 0;
    }

    size_t out_len = hex_len / 2;
    if (data_size < out_len) {
        return 0;
    }

    for (size_t i = 0; i < out_len; i++) {
        int hi = ssotok_hex_char_value(hex[i * 2]);
        int lo = ssotok_hex_char_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return 0;
        }
        data[i] = static_cast<uint8_t>((hi << 4) | lo);
    }

    return out_len;
}

// ============================================================================
// C API: Base64 Encoding/Decoding
// ============================================================================

size_t ssotok_base64_encoded_len(size_t input_len) {
    return ((input_len + 2) / 3) * 4;
}

size_t ssotok_base64_decoded_len(const char* b64, size_t b64_len) {
    if (b64 == nullptr || b64_len == 0) {
        return 0;
    }

    size_t len = (b64_len / 4) * 3;

    if (b64_len >= 1 && b64[b64_len - 1] == '=') len--;
    if (b64_len >= 2 && b64[b64_len - 2] == '=') len--;

    return len;
}

size_t ssotok_base64_encode(const uint8_t* data, size_t len, char* b64, size_t b64_size) {
    if (data == nullptr || b64 == nullptr) {
        return 0;
    }

    size_t out_len = ssotok_base64_encoded_len(len);
    if (b64_size < out_len + 1) {
        return 0;
    }

    size_t i = 0, j = 0;
    uint8_t buf[3];
    size_t buf_len = 0;

    while (i < len) {
        buf[buf_len++] = data[i++];

        if (buf_len == 3) {
            b64[j++] = BASE64_CHARS[(buf[0] >> 2) & 0x3F];
            b64[j++] = BASE64_CHARS[((buf[0] << 4) | (buf[1] >> 4)) & 0x3F];
            b64[j++] = BASE64_CHARS[((buf[1] << 2) | (buf[2] >> 6)) & 0x3F];
            b64[j++] = BASE64_CHARS[buf[2] & 0x3F];
            buf_len = 0;
        }
    }

    if (buf_len == 1) {
        b64[j++] = BASE64_CHARS[(buf[0] >> 2) & 0x3F];
        b64[j++] = BASE64_CHARS[(buf[0] << 4) & 0x3F];
        b64[j++] = '=';
        b64[j++] = '=';
    } else if (buf_len == 2) {
        b64[j++] = BASE64_CHARS[(buf[0] >> 2) & 0x3F];
        b64[j++] = BASE64_CHARS[((buf[0] << 4) | (buf[1] >> 4)) & 0x3F];
        b64[j++] = BASE64_CHARS[(buf[1] << 2) & 0x3F];
        b64[j++] = '=';
    }

    b64[j] = '\0';
    return j;
}

ssotok_error_t ssotok_base64_decode(const char* b64, size_t b64_len,
                                    uint8_t* data, size_t data_size,
                                    size_t* out_len) {
    if (out_len == nullptr || (b64 == nullptr && b64_len != 0)) {
        return SSOTOK_ERROR_INVALID_PARAM;
    }
    *out_len = 0;

    if (b64_len == 0) {
        return SSOTOK_SUCCESS;
    }
    if (b64_len % 4 != 0) {
        return SSOTOK_ERROR_INVALID_TOKEN_FORMAT;
    }

    size_t padding = 0;
    if (b64[b64_len - 1] == '=') padding++;
    if (b64[b64_len - 2] == '=') {
        if (padding == 0) return SSOTOK_ERROR_INVALID_TOKEN_FORMAT;  // "x=y" style
        padding++;
    }

    size_t needed = (b64_len / 4) * 3 - padding;
    if (data == nullptr || data_size < needed) {
        return SSOTOK_ERROR_BUFFER_TOO_SMALL;
    }

    size_t body_len = b64_len - padding;
    size_t j = 0;
    uint32_t buf = 0;
    int bits = 0;

    for (size_t i = 0; i < body_len; i++) {
        int8_t val = BASE64_DECODE[static_cast<uint8_t>(b64[i])];
        if (val < 0) { // invalid character, or '=' before the tail
            return SSOTOK_ERROR_INVALID_TOKEN_FORMAT;
        }

        buf = (buf << 6) | static_cast<uint32_t>(val);
        bits += 6;

        if (bits >= 8) {
            bits -= 8;
            data[j++] = static_cast<uint8_t>(buf >> bits);
        }
    }

    // Unused low bits of the last group must be zero
    if (bits > 0 && (buf & ((1u << bits) - 1)) != 0) {
        return SSOTOK_ERROR_INVALID_TOKEN_FORMAT;
    }

    *out_len = j;
    return SSOTOK_SUCCESS;
}

} // extern "C"

// ============================================================================
// C++ API
// ============================================================================

namespace ssotok {
namespace encoding {

std::string hexEncode(const ByteVec& data) {
    return hexEncode(data.data(), data.size());
}

std::string hexEncode(const uint8_t* data, size_t len) {
    std::string result(len * 2, '\0');
    if (len > 0) {
        ssotok_hex_encode(data, len, &result[0], result.size() + 1);
    }
    return result;
}

ByteVec hexDecode(const std::string& hex) {
    if (!isValidHex(hex)) {
        throw EncodingError("Invalid hex string: " + hex.substr(0, 20));
    }
    ByteVec result(hex.size() / 2);
    if (result.empty()) {
        return result;
    }
    size_t decoded = ssotok_hex_decode(hex.c_str(), hex.size(), result.data(), result.size());
    result.resize(decoded);
    return result;
}

bool isValidHex(const std::string& str) noexcept {
    if (str.size() % 2 != 0) {
        return false;
    }

    for (size_t i = 0; i < str.size(); i++) {
        if (ssotok_hex_char_value(str[i]) < 0) {
            return false;
        }
    }
    return true;
}

std::string base64Encode(const ByteVec& data) {
    return base64Encode(data.data(), data.size());
}

std::string base64Encode(const uint8_t* data, size_t len) {
    size_t out_len = ssotok_base64_encoded_len(len);
    std::string result(out_len, '\0');
    if (len > 0) {
        ssotok_base64_encode(data, len, &result[0], result.size() + 1);
    }
    return result;
}

ByteVec base64Decode(const std::string& b64) {
    ByteVec result(ssotok_base64_decoded_len(b64.c_str(), b64.size()));
    size_t decoded = 0;
    ssotok_error_t err = ssotok_base64_decode(b64.c_str(), b64.size(),
                                              result.data(), result.size(), &decoded);
    if (err != SSOTOK_SUCCESS) {
        throw EncodingError("Invalid Base64 string");
    }
    result.resize(decoded);
    return result;
}

static bool is_unreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '~';
}

std::string percentEncode(const std::string& raw) {
    std::string out;
    out.reserve(raw.size() * 3);
    for (unsigned char c : raw) {
        if (is_unreserved(c)) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX_UPPER[c >> 4];
            out += HEX_UPPER[c & 0x0F];
        }
    }
    return out;
}

std::string percentDecode(const std::string& escaped) {
    std::string out;
    out.reserve(escaped.size());
    for (size_t i = 0; i < escaped.size(); i++) {
        char c = escaped[i];
        if (c != '%') {
            out += c;
            continue;
        }
        if (i + 2 >= escaped.size()) {
            throw EncodingError("Truncated percent escape");
        }
        int hi = ssotok_hex_char_value(escaped[i + 1]);
        int lo = ssotok_hex_char_value(escaped[i + 2]);
        if (hi < 0 || lo < 0) {
            throw EncodingError("Invalid percent escape: " + escaped.substr(i, 3));
        }
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return out;
}

ByteVec padPKCS7(const ByteVec& data, size_t block_size) {
    if (block_size == 0 || block_size > 255) {
        throw EncodingError("Invalid block size for PKCS#7: " + std::to_string(block_size));
    }

    size_t pad_len = block_size - (data.size() % block_size);
    ByteVec result = data;
    result.resize(data.size() + pad_len, static_cast<uint8_t>(pad_len));
    return result;
}

ByteVec unpadPKCS7(const ByteVec& data, size_t block_size) {
    if (data.empty() || block_size == 0 || data.size() % block_size != 0) {
        throw EncodingError("Padded data is not a whole number of blocks");
    }

    uint8_t pad_len = data.back();
    if (pad_len == 0 || pad_len > block_size) {
        throw EncodingError("Invalid PKCS#7 padding");
    }

    // Check the whole last block so timing does not depend on pad_len
    uint8_t diff = 0;
    for (size_t i = data.size() - block_size; i < data.size(); i++) {
        uint8_t in_pad = static_cast<uint8_t>(i >= data.size() - pad_len);
        diff |= static_cast<uint8_t>((data[i] ^ pad_len) & static_cast<uint8_t>(-in_pad));
    }
    if (diff != 0) {
        throw EncodingError("Invalid PKCS#7 padding");
    }

    return ByteVec(data.begin(), data.end() - pad_len);
}

} // namespace encoding
} // namespace ssotok
