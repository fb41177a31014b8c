/**
 * @file token_c_api.cpp
 * @brief C ABI over TokenCodec
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "ssotok/token/token_codec.h"
#include "ssotok/token/param_canonicalizer.h"
#include "ssotok/core/security.h"

#include <cstring>
#include <exception>
#include <string>

namespace {

// Copy a string into a caller buffer with a terminator
ssotok_error_t copy_out(const std::string& s, char* out, size_t out_size, size_t* out_len) {
    if (out_len) {
        *out_len = s.size();
    }
    if (out_size < s.size() + 1) {
        return SSOTOK_ERROR_BUFFER_TOO_SMALL;
    }
    std::memcpy(out, s.data(), s.size());
    out[s.size()] = '\0';
    return SSOTOK_SUCCESS;
}

bool bad_input(const void* data, size_t len) {
    return data == nullptr && len != 0;
}

} // anonymous namespace

extern "C" {

ssotok_error_t ssotok_token_encode(const char* canonical, size_t canonical_len,
                                   const uint8_t* secret, size_t secret_len,
                                   char* token, size_t token_size,
                                   size_t* token_len) {
    if (token == nullptr || bad_input(canonical, canonical_len) || bad_input(secret, secret_len)) {
        return SSOTOK_ERROR_INVALID_PARAM;
    }
    try {
        ssotok::ScopedWipe<ssotok::SecretKey> key(ssotok::SecretKey(secret, secret + secret_len));
        ssotok::AttributeMap fields =
            ssotok::ParamCanonicalizer::parse(std::string(canonical, canonical_len));
        ssotok::Token t = ssotok::encode(fields, key.get());
        return copy_out(t, token, token_size, token_len);
    } catch (const ssotok::TokenError& e) {
        return e.code();
    } catch (const std::exception&) {
        return SSOTOK_ERROR_INTERNAL;
    }
}

ssotok_error_t ssotok_token_decode(const char* token, size_t token_len,
                                   const uint8_t* secret, size_t secret_len,
                                   char* canonical, size_t canonical_size,
                                   size_t* canonical_len) {
    if (canonical == nullptr || bad_input(token, token_len) || bad_input(secret, secret_len)) {
        return SSOTOK_ERROR_INVALID_PARAM;
    }
    try {
        ssotok::ScopedWipe<ssotok::SecretKey> key(ssotok::SecretKey(secret, secret + secret_len));
        ssotok::AttributeMap fields = ssotok::decode(std::string(token, token_len), key.get());
        ssotok::ScopedWipe<std::string> rendered(ssotok::ParamCanonicalizer::render(fields));
        return copy_out(rendered.get(), canonical, canonical_size, canonical_len);
    } catch (const ssotok::TokenError& e) {
        return e.code();
    } catch (const std::exception&) {
        return SSOTOK_ERROR_INTERNAL;
    }
}

} // extern "C"
