/**
 * @file aes_cbc.cpp
 * @brief AES-256-CBC through OpenSSL EVP with padding disabled
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "ssotok/crypto/aes_cbc.h"
#include "ssotok/core/errors.h"
#include "ssotok/core/security.h"
#include "openssl_raii.h"

#include <climits>
#include <stdexcept>

#include <openssl/evp.h>

namespace ssotok {
namespace internal {

static bool valid_length(size_t len) {
    return len > 0 && len % SSOTOK_AES_BLOCK_SIZE == 0 && len <= static_cast<size_t>(INT_MAX);
}

// Shared body of encrypt/decrypt: OpenSSL only differs in the enc flag
static ssotok_error_t cbc_crypt(int enc, const uint8_t key[32], const uint8_t iv[16],
                                const uint8_t* input, size_t input_len, uint8_t* output) {
    cipher_ctx_ptr ctx = make_cipher_ctx();

    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key, iv, enc) != 1) {
        return SSOTOK_ERROR_CRYPTO_FAILED;
    }
    if (EVP_CIPHER_CTX_set_padding(ctx.get(), 0) != 1) {
        return SSOTOK_ERROR_CRYPTO_FAILED;
    }

    int out_len = 0;
    if (EVP_CipherUpdate(ctx.get(), output, &out_len, input, static_cast<int>(input_len)) != 1) {
        return SSOTOK_ERROR_CRYPTO_FAILED;
    }
    int final_len = 0;
    if (EVP_CipherFinal_ex(ctx.get(), output + out_len, &final_len) != 1) {
        return SSOTOK_ERROR_CRYPTO_FAILED;
    }
    if (static_cast<size_t>(out_len + final_len) != input_len) {
        return SSOTOK_ERROR_CRYPTO_FAILED;
    }
    return SSOTOK_SUCCESS;
}

static ssotok_error_t checked_crypt(int enc, const uint8_t* key, const uint8_t* iv,
                                    const uint8_t* input, size_t input_len, uint8_t* output) {
    if (key == nullptr || iv == nullptr || input == nullptr || output == nullptr) {
        return SSOTOK_ERROR_INVALID_PARAM;
    }
    if (!valid_length(input_len)) {
        return SSOTOK_ERROR_INVALID_PARAM;
    }
    try {
        return cbc_crypt(enc, key, iv, input, input_len, output);
    } catch (const CryptoError& e) {
        return e.code();
    }
}

} // namespace internal

AES256CBC::AES256CBC(const AES256Key& key) : key_(key) {}

AES256CBC::~AES256CBC() {
    ssotok_secure_zero(key_.data(), key_.size());
}

ByteVec AES256CBC::encrypt(const ByteVec& plaintext, const AESBlock& iv) const {
    if (!internal::valid_length(plaintext.size())) {
        throw std::invalid_argument("AES-CBC input must be a positive multiple of 16 bytes");
    }
    ByteVec out(plaintext.size());
    if (internal::cbc_crypt(1, key_.data(), iv.data(), plaintext.data(), plaintext.size(),
                            out.data()) != SSOTOK_SUCCESS) {
        throw CryptoError("AES-256-CBC encryption failed");
    }
    return out;
}

ByteVec AES256CBC::decrypt(const ByteVec& ciphertext, const AESBlock& iv) const {
    if (!internal::valid_length(ciphertext.size())) {
        throw std::invalid_argument("AES-CBC input must be a positive multiple of 16 bytes");
    }
    ByteVec out(ciphertext.size());
    if (internal::cbc_crypt(0, key_.data(), iv.data(), ciphertext.data(), ciphertext.size(),
                            out.data()) != SSOTOK_SUCCESS) {
        secure_wipe(out);
        throw CryptoError("AES-256-CBC decryption failed");
    }
    return out;
}

} // namespace ssotok

extern "C" {

ssotok_error_t ssotok_aes256_cbc_encrypt(const uint8_t key[32], const uint8_t iv[16],
                                         const uint8_t* input, size_t input_len,
                                         uint8_t* output) {
    return ssotok::internal::checked_crypt(1, key, iv, input, input_len, output);
}

ssotok_error_t ssotok_aes256_cbc_decrypt(const uint8_t key[32], const uint8_t iv[16],
                                         const uint8_t* input, size_t input_len,
                                         uint8_t* output) {
    return ssotok::internal::checked_crypt(0, key, iv, input, input_len, output);
}

} // extern "C"
