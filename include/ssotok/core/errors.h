/**
 * @file errors.h
 * @brief Exception taxonomy of the token codec
 *
 * Every failure the codec can report is a distinct type deriving from
 * TokenError. Each carries the matching ssotok_error_t so the C ABI can
 * translate exceptions into return codes without string matching.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SSOTOK_CORE_ERRORS_H
#define SSOTOK_CORE_ERRORS_H

#include "ssotok/core/common.h"

#include <stdexcept>
#include <string>

namespace ssotok {

/**
 * @brief Base class of all codec failures
 */
class TokenError : public std::runtime_error {
public:
    TokenError(ssotok_error_t code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ssotok_error_t code() const noexcept { return code_; }

private:
    ssotok_error_t code_;
};

/// Base64 decoding failed, or the decoded token is shorter than IV + one block
class InvalidTokenFormatError : public TokenError {
public:
    explicit InvalidTokenFormatError(const std::string& msg)
        : TokenError(SSOTOK_ERROR_INVALID_TOKEN_FORMAT, msg) {}
};

/// PKCS#7 padding could not be removed after decryption (wrong key or corrupt data)
class PaddingError : public TokenError {
public:
    explicit PaddingError(const std::string& msg)
        : TokenError(SSOTOK_ERROR_PADDING, msg) {}
};

/// Text could not be parsed into key/value fields
class MalformedCanonicalStringError : public TokenError {
public:
    explicit MalformedCanonicalStringError(const std::string& msg)
        : TokenError(SSOTOK_ERROR_MALFORMED_CANONICAL, msg) {}
};

using MalformedInputError = MalformedCanonicalStringError;

/// Decrypted fields do not contain the signature field
class MissingSignatureFieldError : public TokenError {
public:
    explicit MissingSignatureFieldError(const std::string& msg)
        : TokenError(SSOTOK_ERROR_MISSING_SIGNATURE, msg) {}
};

/// Recomputed signature differs from the one carried by the token
class SignatureMismatchError : public TokenError {
public:
    explicit SignatureMismatchError(const std::string& msg)
        : TokenError(SSOTOK_ERROR_SIGNATURE_MISMATCH, msg) {}
};

/// Secret key rejected before any cryptographic work (e.g. empty)
class InvalidKeyError : public TokenError {
public:
    explicit InvalidKeyError(const std::string& msg)
        : TokenError(SSOTOK_ERROR_INVALID_KEY, msg) {}
};

/// Caller-supplied attributes violate the field rules (reserved name, empty name, missing required field)
class InvalidAttributesError : public TokenError {
public:
    explicit InvalidAttributesError(const std::string& msg)
        : TokenError(SSOTOK_ERROR_INVALID_ATTRIBUTES, msg) {}
};

/// An underlying primitive (OpenSSL, CSPRNG) failed
class CryptoError : public TokenError {
public:
    explicit CryptoError(const std::string& msg,
                         ssotok_error_t code = SSOTOK_ERROR_CRYPTO_FAILED)
        : TokenError(code, msg) {}
};

} // namespace ssotok

#endif // SSOTOK_CORE_ERRORS_H
