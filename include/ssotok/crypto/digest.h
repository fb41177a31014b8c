/**
 * @file digest.h
 * @brief MD5 digest used by key derivation and token signatures
 *
 * MD5 is fixed by the token format (16-byte key halves, 32-char hex
 * signatures). It is not used for anything collision-sensitive beyond that.
 * Backed by OpenSSL libcrypto.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SSOTOK_CRYPTO_DIGEST_H
#define SSOTOK_CRYPTO_DIGEST_H

#include "ssotok/core/common.h"
#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief One-shot MD5
 * @param data Input (may be null when len is 0)
 * @param len Input length
 * @param digest 16-byte output
 * @return SSOTOK_SUCCESS or SSOTOK_ERROR_CRYPTO_FAILED
 */
SSOTOK_API ssotok_error_t ssotok_md5(const uint8_t* data, size_t len, uint8_t digest[16]);

#ifdef __cplusplus
}
#endif

#ifdef __cplusplus

#include "ssotok/core/types.h"
#include <memory>
#include <string>

namespace ssotok {

/**
 * @brief Incremental MD5
 *
 * Lets callers hash `a ‖ b` without building the concatenation.
 */
class MD5 {
public:
    MD5();
    ~MD5();

    MD5(const MD5&) = delete;
    MD5& operator=(const MD5&) = delete;

    MD5(MD5&& other) noexcept;
    MD5& operator=(MD5&& other) noexcept;

    MD5& update(const uint8_t* data, size_t len);
    MD5& update(const ByteVec& data) { return update(data.data(), data.size()); }
    MD5& update(const std::string& data) {
        return update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    }

    /**
     * @brief Finish the digest; the object must not be updated afterwards
     */
    MD5Digest finalize();

    static MD5Digest hash(const ByteVec& data);
    static MD5Digest hash(const std::string& data);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ssotok

#endif // __cplusplus

#endif // SSOTOK_CRYPTO_DIGEST_H
