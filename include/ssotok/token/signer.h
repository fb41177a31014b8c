/**
 * @file signer.h
 * @brief Keyed signature over the canonical attribute string
 *
 * signature = lowercase_hex(MD5(secret ‖ canonical(map without "sig")))
 *
 * This is a plain keyed hash, not HMAC; the construction is fixed by the
 * partner format.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SSOTOK_TOKEN_SIGNER_H
#define SSOTOK_TOKEN_SIGNER_H

#include "ssotok/core/common.h"
#include <stdint.h>
#include <stddef.h>

/** Reserved field name that carries the signature inside a token */
#define SSOTOK_SIGNATURE_FIELD "sig"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Sign a canonical string
 *
 * The string is parsed first, so fields may come in any order; an existing
 * "sig" field is ignored.
 *
 * @param canonical Canonical string (not necessarily null-terminated)
 * @param canonical_len Its length
 * @param secret Shared secret
 * @param secret_len Secret length
 * @param sig 33-byte output (32 hex characters plus terminator)
 * @return SSOTOK_SUCCESS or an ssotok_error_t failure code
 */
SSOTOK_API ssotok_error_t ssotok_sign_canonical(const char* canonical, size_t canonical_len,
                                                const uint8_t* secret, size_t secret_len,
                                                char sig[33]);

#ifdef __cplusplus
}
#endif

#ifdef __cplusplus

#include "ssotok/core/types.h"
#include "ssotok/token/key_deriver.h"
#include <string>

namespace ssotok {

using Signature = std::string;

class Signer {
public:
    static constexpr const char* FIELD = SSOTOK_SIGNATURE_FIELD;

    /**
     * @brief Compute the signature of a map (its "sig" field, if any, is skipped)
     * @throws InvalidKeyError if the key is empty
     */
    static Signature sign(const AttributeMap& map, const SecretKey& key);

    /**
     * @brief Signature of an already rendered canonical string
     * @throws InvalidKeyError if the key is empty
     */
    static Signature signCanonical(const std::string& canonical, const SecretKey& key);

    /**
     * @brief Constant-time check of a signature
     * @return false on any mismatch, including a length mismatch
     * @throws InvalidKeyError if the key is empty
     */
    static bool verify(const AttributeMap& map, const Signature& signature, const SecretKey& key);
};

} // namespace ssotok

#endif // __cplusplus

#endif // SSOTOK_TOKEN_SIGNER_H
