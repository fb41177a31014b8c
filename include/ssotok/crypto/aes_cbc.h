/**
 * @file aes_cbc.h
 * @brief AES-256 in CBC mode, no built-in padding
 *
 * Padding belongs to the token layer (PKCS#7 in utils/encoding.h) so that
 * padding failures can be reported separately from cipher failures.
 * Backed by OpenSSL libcrypto.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SSOTOK_CRYPTO_AES_CBC_H
#define SSOTOK_CRYPTO_AES_CBC_H

#include "ssotok/core/common.h"
#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief AES-256-CBC encryption of whole blocks
 * @param key 32-byte key
 * @param iv 16-byte initialization vector
 * @param input Plaintext, length a positive multiple of 16
 * @param input_len Input length
 * @param output Ciphertext buffer, at least input_len bytes
 * @return SSOTOK_SUCCESS, SSOTOK_ERROR_INVALID_PARAM or SSOTOK_ERROR_CRYPTO_FAILED
 */
SSOTOK_API ssotok_error_t ssotok_aes256_cbc_encrypt(
    const uint8_t key[32],
    const uint8_t iv[16],
    const uint8_t* input,
    size_t input_len,
    uint8_t* output
);

/**
 * @brief AES-256-CBC decryption of whole blocks
 * @param key 32-byte key
 * @param iv 16-byte initialization vector
 * @param input Ciphertext, length a positive multiple of 16
 * @param input_len Input length
 * @param output Plaintext buffer, at least input_len bytes
 * @return SSOTOK_SUCCESS, SSOTOK_ERROR_INVALID_PARAM or SSOTOK_ERROR_CRYPTO_FAILED
 */
SSOTOK_API ssotok_error_t ssotok_aes256_cbc_decrypt(
    const uint8_t key[32],
    const uint8_t iv[16],
    const uint8_t* input,
    size_t input_len,
    uint8_t* output
);

#ifdef __cplusplus
}
#endif

#ifdef __cplusplus

#include "ssotok/core/types.h"

namespace ssotok {

/**
 * @brief AES-256-CBC bound to one key
 *
 * The key copy is wiped on destruction.
 */
class AES256CBC {
public:
    explicit AES256CBC(const AES256Key& key);
    ~AES256CBC();

    AES256CBC(const AES256CBC&) = delete;
    AES256CBC& operator=(const AES256CBC&) = delete;

    /**
     * @brief Encrypt block-aligned plaintext
     * @throws std::invalid_argument if the length is not a positive multiple of 16
     * @throws CryptoError on OpenSSL failure
     */
    ByteVec encrypt(const ByteVec& plaintext, const AESBlock& iv) const;

    /**
     * @brief Decrypt block-aligned ciphertext (padding left in place)
     * @throws std::invalid_argument if the length is not a positive multiple of 16
     * @throws CryptoError on OpenSSL failure
     */
    ByteVec decrypt(const ByteVec& ciphertext, const AESBlock& iv) const;

private:
    AES256Key key_;
};

} // namespace ssotok

#endif // __cplusplus

#endif // SSOTOK_CRYPTO_AES_CBC_H
