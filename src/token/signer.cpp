/**
 * @file signer.cpp
 * @brief Keyed MD5 signature of the canonical string
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "ssotok/token/signer.h"
#include "ssotok/token/param_canonicalizer.h"
#include "ssotok/crypto/digest.h"
#include "ssotok/core/errors.h"
#include "ssotok/core/security.h"
#include "ssotok/utils/encoding.h"

#include <cstring>
#include <exception>

namespace ssotok {

Signature Signer::signCanonical(const std::string& canonical, const SecretKey& key) {
    KeyDeriver::validate(key);
    MD5Digest digest = MD5().update(key).update(canonical).finalize();
    return encoding::hexEncode(digest.data(), digest.size());
}

Signature Signer::sign(const AttributeMap& map, const SecretKey& key) {
    return signCanonical(ParamCanonicalizer::renderWithout(map, FIELD), key);
}

bool Signer::verify(const AttributeMap& map, const Signature& signature, const SecretKey& key) {
    Signature expected = sign(map, key);
    return secure_compare(expected, signature);
}

} // namespace ssotok

extern "C" {

ssotok_error_t ssotok_sign_canonical(const char* canonical, size_t canonical_len,
                                     const uint8_t* secret, size_t secret_len,
                                     char sig[33]) {
    if (sig == nullptr || (canonical == nullptr && canonical_len != 0) ||
        (secret == nullptr && secret_len != 0)) {
        return SSOTOK_ERROR_INVALID_PARAM;
    }
    try {
        std::string text = canonical_len ? std::string(canonical, canonical_len) : std::string();
        ssotok::ScopedWipe<ssotok::SecretKey> key(ssotok::SecretKey(secret, secret + secret_len));
        ssotok::Signature s =
            ssotok::Signer::sign(ssotok::ParamCanonicalizer::parse(text), key.get());
        std::memcpy(sig, s.c_str(), s.size() + 1);
        return SSOTOK_SUCCESS;
    } catch (const ssotok::TokenError& e) {
        return e.code();
    } catch (const std::exception&) {
        return SSOTOK_ERROR_INTERNAL;
    }
}

} // extern "C"
