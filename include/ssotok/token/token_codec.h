/**
 * @file token_codec.h
 * @brief SSO token encoding and decoding
 *
 * Token = Base64( IV(16) ‖ AES-256-CBC(DerivedKey, IV, PKCS7(canonical ‖ sig)) )
 *
 * encode():
 *   attributes -> sign -> render with "sig" -> PKCS#7 -> AES-256-CBC -> Base64
 * decode():
 *   Base64 -> split IV -> AES-256-CBC -> strip PKCS#7 -> parse -> verify "sig"
 *
 * Every encode draws a fresh IV from the OS CSPRNG, so identical input never
 * yields the same token twice. Codec objects hold only immutable options and
 * may be shared between threads.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SSOTOK_TOKEN_TOKEN_CODEC_H
#define SSOTOK_TOKEN_TOKEN_CODEC_H

#include "ssotok/core/common.h"
#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Build a token from a canonical attribute string
 *
 * The input is parsed (field order is free), signed and encrypted.
 *
 * @param canonical Unsigned canonical string, e.g. "email=a%40example.com&uid=42"
 * @param canonical_len Its length
 * @param secret Shared secret
 * @param secret_len Secret length
 * @param token Output buffer for the null-terminated Base64 token
 * @param token_size Size of the output buffer
 * @param token_len Token length without terminator
 * @return SSOTOK_SUCCESS or an ssotok_error_t failure code
 */
SSOTOK_API ssotok_error_t ssotok_token_encode(const char* canonical, size_t canonical_len,
                                              const uint8_t* secret, size_t secret_len,
                                              char* token, size_t token_size,
                                              size_t* token_len);

/**
 * @brief Verify a token and return its attributes as a canonical string
 *
 * The returned string excludes the signature field.
 *
 * @param token Base64 token
 * @param token_len Its length
 * @param secret Shared secret
 * @param secret_len Secret length
 * @param canonical Output buffer for the null-terminated canonical string
 * @param canonical_size Size of the output buffer
 * @param canonical_len Length written without terminator
 * @return SSOTOK_SUCCESS or an ssotok_error_t failure code
 */
SSOTOK_API ssotok_error_t ssotok_token_decode(const char* token, size_t token_len,
                                              const uint8_t* secret, size_t secret_len,
                                              char* canonical, size_t canonical_size,
                                              size_t* canonical_len);

#ifdef __cplusplus
}
#endif

#ifdef __cplusplus

#include "ssotok/core/types.h"
#include "ssotok/core/errors.h"
#include "ssotok/token/key_deriver.h"
#include <set>
#include <string>

namespace ssotok {

using Token = std::string;

class TokenCodec {
public:
    TokenCodec() = default;

    /**
     * @param required_fields Fields every encoded and decoded map must carry
     * @throws InvalidAttributesError if the set names the signature field
     */
    explicit TokenCodec(std::set<std::string> required_fields);

    /**
     * @brief Sign and encrypt an attribute map
     * @throws InvalidKeyError for an empty key
     * @throws InvalidAttributesError for an empty map, an empty field name,
     *         a caller-supplied "sig" field or a missing required field
     * @throws CryptoError if the CSPRNG or cipher fails
     */
    Token encode(const AttributeMap& attributes, const SecretKey& key) const;
    Token encode(const AttributeMap& attributes, const std::string& key) const;

    /**
     * @brief Decrypt and verify a token
     * @return The attributes without the signature field
     * @throws InvalidKeyError, InvalidTokenFormatError, PaddingError,
     *         MalformedCanonicalStringError, MissingSignatureFieldError,
     *         SignatureMismatchError, InvalidAttributesError (required field missing)
     */
    AttributeMap decode(const Token& token, const SecretKey& key) const;
    AttributeMap decode(const Token& token, const std::string& key) const;

    const std::set<std::string>& requiredFields() const noexcept { return required_fields_; }

    /**
     * @brief Encrypt an already signed canonical string under a given IV
     *
     * Low-level step of encode(); exposed for reproducing reference vectors.
     * Production callers go through encode(), which never reuses an IV.
     */
    static Token encryptCanonical(const std::string& signed_canonical,
                                  const SecretKey& key, const AESBlock& iv);

    /**
     * @brief Base64-decode, decrypt and unpad a token (no parsing, no verification)
     * @throws InvalidKeyError, InvalidTokenFormatError, PaddingError
     */
    static std::string decryptCanonical(const Token& token, const SecretKey& key);

private:
    void checkAttributes(const AttributeMap& attributes) const;
    void checkRequired(const AttributeMap& attributes) const;

    std::set<std::string> required_fields_;
};

/**
 * @brief encode() with a default codec
 */
Token encode(const AttributeMap& attributes, const SecretKey& key);
Token encode(const AttributeMap& attributes, const std::string& key);

/**
 * @brief decode() with a default codec
 */
AttributeMap decode(const Token& token, const SecretKey& key);
AttributeMap decode(const Token& token, const std::string& key);

} // namespace ssotok

#endif // __cplusplus

#endif // SSOTOK_TOKEN_TOKEN_CODEC_H
