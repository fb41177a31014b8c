/**
 * @file key_deriver.cpp
 * @brief Two-round MD5 key expansion
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "ssotok/token/key_deriver.h"
#include "ssotok/crypto/digest.h"
#include "ssotok/core/errors.h"
#include "ssotok/core/security.h"

#include <algorithm>
#include <exception>

namespace ssotok {

void KeyDeriver::validate(const SecretKey& secret) {
    if (secret.empty()) {
        throw InvalidKeyError("Secret key must not be empty");
    }
}

DerivedKey KeyDeriver::derive(const SecretKey& secret) {
    validate(secret);

    MD5Digest h1 = MD5::hash(secret);
    MD5Digest h2 = MD5().update(h1.data(), h1.size()).update(secret).finalize();

    DerivedKey key{};
    std::copy(h1.begin(), h1.end(), key.begin());
    std::copy(h2.begin(), h2.end(), key.begin() + h1.size());

    secure_wipe(h1);
    secure_wipe(h2);
    return key;
}

DerivedKey KeyDeriver::derive(const std::string& secret) {
    ScopedWipe<SecretKey> bytes(SecretKey(secret.begin(), secret.end()));
    return derive(bytes.get());
}

} // namespace ssotok

extern "C" {

ssotok_error_t ssotok_derive_key(const uint8_t* secret, size_t secret_len, uint8_t out[32]) {
    if (out == nullptr || (secret == nullptr && secret_len != 0)) {
        return SSOTOK_ERROR_INVALID_PARAM;
    }
    if (secret_len == 0) {
        return SSOTOK_ERROR_INVALID_KEY;
    }
    try {
        ssotok::ScopedWipe<ssotok::SecretKey> bytes(ssotok::SecretKey(secret, secret + secret_len));
        ssotok::ScopedWipe<ssotok::DerivedKey> key(ssotok::KeyDeriver::derive(bytes.get()));
        std::copy(key.get().begin(), key.get().end(), out);
        return SSOTOK_SUCCESS;
    } catch (const ssotok::TokenError& e) {
        return e.code();
    } catch (const std::exception&) {
        return SSOTOK_ERROR_INTERNAL;
    }
}

} // extern "C"
