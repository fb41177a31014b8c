/**
 * @file key_deriver.h
 * @brief Expansion of the shared secret into the AES-256 token key
 *
 * DerivedKey = MD5(secret) ‖ MD5(MD5(secret) ‖ secret)
 *
 * The two-round expansion is part of the wire format: any other expansion
 * yields a key that cannot read tokens produced by partner implementations.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SSOTOK_TOKEN_KEY_DERIVER_H
#define SSOTOK_TOKEN_KEY_DERIVER_H

#include "ssotok/core/common.h"
#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Derive the 32-byte token key
 * @param secret Shared secret bytes (non-empty)
 * @param secret_len Secret length
 * @param out 32-byte output
 * @return SSOTOK_SUCCESS, SSOTOK_ERROR_INVALID_KEY, SSOTOK_ERROR_INVALID_PARAM
 *         or SSOTOK_ERROR_CRYPTO_FAILED
 */
SSOTOK_API ssotok_error_t ssotok_derive_key(const uint8_t* secret, size_t secret_len,
                                            uint8_t out[32]);

#ifdef __cplusplus
}
#endif

#ifdef __cplusplus

#include "ssotok/core/types.h"
#include <string>

namespace ssotok {

using SecretKey = ByteVec;

class KeyDeriver {
public:
    /**
     * @brief Derive the token key from a shared secret
     * @throws InvalidKeyError if the secret is empty
     */
    static DerivedKey derive(const SecretKey& secret);
    static DerivedKey derive(const std::string& secret);

    /**
     * @brief Reject keys that must not reach any cryptographic step
     * @throws InvalidKeyError if the secret is empty
     */
    static void validate(const SecretKey& secret);
};

} // namespace ssotok

#endif // __cplusplus

#endif // SSOTOK_TOKEN_KEY_DERIVER_H
