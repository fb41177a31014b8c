/**
 * @file encoding.h
 * @brief Text encodings used by the token format
 *
 * - Hexadecimal (signatures, keys on the command line)
 * - Base64, standard alphabet with '=' padding (the wire token)
 * - Percent-encoding (field names and values of the canonical string)
 * - PKCS#7 block padding
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SSOTOK_UTILS_ENCODING_H
#define SSOTOK_UTILS_ENCODING_H

#include "ssotok/core/common.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Hexadecimal Encoding/Decoding (C API)
// ============================================================================

/**
 * @brief Encode binary data to hexadecimal string (lowercase)
 *
 * @param data Input binary data
 * @param len Length of input data
 * @param hex Output buffer (must be at least len*2+1 bytes)
 * @param hex_size Size of output buffer
 * @return Number of characters written (excluding null terminator), 0 on error
 */
SSOTOK_API size_t ssotok_hex_encode(const uint8_t* data, size_t len, char* hex, size_t hex_size);

/**
 * @brief Decode hexadecimal string to binary data
 *
 * @param hex Input hex string, no 0x prefix
 * @param hex_len Length of hex string (0 for null-terminated)
 * @param data Output buffer
 * @param data_size Size of output buffer
 * @return Number of bytes written, 0 on error
 */
SSOTOK_API size_t ssotok_hex_decode(const char* hex, size_t hex_len, uint8_t* data, size_t data_size);

/**
 * @brief Get hex character value (0-15), returns -1 for invalid
 */
SSOTOK_API int ssotok_hex_char_value(char c);

// ============================================================================
// Base64 Encoding/Decoding (C API)
// ============================================================================

/**
 * @brief Encode binary data to Base64 string (standard alphabet, padded)
 *
 * @param data Input binary data
 * @param len Length of input data
 * @param b64 Output buffer (must be at least ((len+2)/3)*4+1 bytes)
 * @param b64_size Size of output buffer
 * @return Number of characters written (excluding null terminator), 0 on error
 */
SSOTOK_API size_t ssotok_base64_encode(const uint8_t* data, size_t len, char* b64, size_t b64_size);

/**
 * @brief Decode a strict standard Base64 string
 *
 * Rejects the URL-safe alphabet, embedded whitespace, lengths that are not a
 * multiple of 4 and '=' anywhere but the last two positions.
 *
 * @param b64 Input Base64 string
 * @param b64_len Length of Base64 string
 * @param data Output buffer
 * @param data_size Size of output buffer
 * @param out_len Number of bytes written
 * @return SSOTOK_SUCCESS, SSOTOK_ERROR_INVALID_TOKEN_FORMAT or SSOTOK_ERROR_BUFFER_TOO_SMALL
 */
SSOTOK_API ssotok_error_t ssotok_base64_decode(const char* b64, size_t b64_len,
                                               uint8_t* data, size_t data_size,
                                               size_t* out_len);

/**
 * @brief Calculate Base64 encoded length
 */
SSOTOK_API size_t ssotok_base64_encoded_len(size_t input_len);

/**
 * @brief Calculate maximum decoded length from Base64
 */
SSOTOK_API size_t ssotok_base64_decoded_len(const char* b64, size_t b64_len);

#ifdef __cplusplus
}
#endif

// ============================================================================
// C++ API
// ============================================================================
#ifdef __cplusplus

#include "ssotok/core/types.h"
#include <string>
#include <stdexcept>

namespace ssotok {
namespace encoding {

/**
 * @brief Encoding exception for invalid input
 */
class EncodingError : public std::runtime_error {
public:
    explicit EncodingError(const std::string& msg) : std::runtime_error(msg) {}
};

// Hex

std::string hexEncode(const ByteVec& data);
std::string hexEncode(const uint8_t* data, size_t len);

/**
 * @brief Decode hex string to bytes
 * @throws EncodingError on odd length or non-hex characters
 */
ByteVec hexDecode(const std::string& hex);

bool isValidHex(const std::string& str) noexcept;

// Base64

std::string base64Encode(const ByteVec& data);
std::string base64Encode(const uint8_t* data, size_t len);

/**
 * @brief Decode strict standard Base64
 * @throws EncodingError on any deviation from the padded standard alphabet
 */
ByteVec base64Decode(const std::string& b64);

// Percent-encoding

/**
 * @brief Escape every byte outside A-Z a-z 0-9 - _ . ~ as %XX (uppercase hex)
 *
 * Space becomes %20. Matches PHP rawurlencode() and RFC 3986.
 */
std::string percentEncode(const std::string& raw);

/**
 * @brief Reverse percentEncode; '+' is kept literally
 * @throws EncodingError when '%' is not followed by two hex digits
 */
std::string percentDecode(const std::string& escaped);

// Block padding

/**
 * @brief Pad bytes to a multiple of block_size (PKCS#7); always adds 1..block_size bytes
 */
ByteVec padPKCS7(const ByteVec& data, size_t block_size);

/**
 * @brief Remove PKCS#7 padding
 * @throws EncodingError on invalid padding
 */
ByteVec unpadPKCS7(const ByteVec& data, size_t block_size);

// String/Bytes

inline ByteVec stringToBytes(const std::string& str) {
    return ByteVec(str.begin(), str.end());
}

inline std::string bytesToString(const ByteVec& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace encoding

using encoding::hexEncode;
using encoding::hexDecode;
using encoding::base64Encode;
using encoding::base64Decode;

} // namespace ssotok

#endif // __cplusplus

#endif // SSOTOK_UTILS_ENCODING_H
