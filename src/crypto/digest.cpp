/**
 * @file digest.cpp
 * @brief MD5 through OpenSSL EVP
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "ssotok/crypto/digest.h"
#include "ssotok/core/errors.h"
#include "openssl_raii.h"

#include <openssl/evp.h>

#include <memory>

namespace ssotok {

struct MD5::Impl {
    internal::md_ctx_ptr ctx = internal::make_md_ctx();
    bool finalized = false;
};

MD5::MD5() : impl_(std::make_unique<Impl>()) {
    if (EVP_DigestInit_ex(impl_->ctx.get(), EVP_md5(), nullptr) != 1) {
        throw CryptoError("MD5 digest initialisation failed");
    }
}

MD5::~MD5() = default;

MD5::MD5(MD5&& other) noexcept = default;
MD5& MD5::operator=(MD5&& other) noexcept = default;

MD5& MD5::update(const uint8_t* data, size_t len) {
    if (impl_->finalized) {
        throw CryptoError("MD5 update after finalize");
    }
    if (len == 0) {
        return *this;
    }
    if (EVP_DigestUpdate(impl_->ctx.get(), data, len) != 1) {
        throw CryptoError("MD5 digest update failed");
    }
    return *this;
}

MD5Digest MD5::finalize() {
    if (impl_->finalized) {
        throw CryptoError("MD5 finalized twice");
    }
    MD5Digest out{};
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), out.data(), &out_len) != 1 ||
        out_len != out.size()) {
        throw CryptoError("MD5 digest finalisation failed");
    }
    impl_->finalized = true;
    return out;
}

MD5Digest MD5::hash(const ByteVec& data) {
    return MD5().update(data).finalize();
}

MD5Digest MD5::hash(const std::string& data) {
    return MD5().update(data).finalize();
}

} // namespace ssotok

extern "C" {

ssotok_error_t ssotok_md5(const uint8_t* data, size_t len, uint8_t digest[16]) {
    if ((data == nullptr && len != 0) || digest == nullptr) {
        return SSOTOK_ERROR_INVALID_PARAM;
    }
    unsigned int out_len = 0;
    if (EVP_Digest(data, len, digest, &out_len, EVP_md5(), nullptr) != 1 ||
        out_len != SSOTOK_MD5_DIGEST_SIZE) {
        return SSOTOK_ERROR_CRYPTO_FAILED;
    }
    return SSOTOK_SUCCESS;
}

} // extern "C"
