/**
 * @file openssl_raii.h
 * @brief unique_ptr owners for OpenSSL EVP contexts (internal)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SSOTOK_CRYPTO_OPENSSL_RAII_H
#define SSOTOK_CRYPTO_OPENSSL_RAII_H

#include "ssotok/core/errors.h"

#include <memory>
#include <openssl/evp.h>

namespace ssotok {
namespace internal {

using cipher_ctx_ptr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

inline cipher_ctx_ptr make_cipher_ctx() {
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw CryptoError("EVP_CIPHER_CTX_new failed");
    }
    return cipher_ctx_ptr(ctx, &EVP_CIPHER_CTX_free);
}

inline md_ctx_ptr make_md_ctx() {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw CryptoError("EVP_MD_CTX_new failed");
    }
    return md_ctx_ptr(ctx, &EVP_MD_CTX_free);
}

} // namespace internal
} // namespace ssotok

#endif // SSOTOK_CRYPTO_OPENSSL_RAII_H
