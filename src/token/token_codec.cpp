/**
 * @file token_codec.cpp
 * @brief SSO token encoding and decoding
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "ssotok/token/token_codec.h"
#include "ssotok/token/param_canonicalizer.h"
#include "ssotok/token/signer.h"
#include "ssotok/crypto/aes_cbc.h"
#include "ssotok/core/security.h"
#include "ssotok/utils/encoding.h"

#include <algorithm>
#include <utility>

namespace ssotok {

namespace {

SecretKey to_key(const std::string& key) {
    return SecretKey(key.begin(), key.end());
}

} // anonymous namespace

TokenCodec::TokenCodec(std::set<std::string> required_fields)
    : required_fields_(std::move(required_fields)) {
    if (required_fields_.count(Signer::FIELD) != 0) {
        throw InvalidAttributesError("The signature field cannot be a required field");
    }
}

void TokenCodec::checkAttributes(const AttributeMap& attributes) const {
    if (attributes.empty()) {
        throw InvalidAttributesError("At least one attribute is required");
    }
    if (attributes.count(Signer::FIELD) != 0) {
        throw InvalidAttributesError(std::string("Field name '") + Signer::FIELD + "' is reserved");
    }
    // std::map orders keys, so an empty name can only be first
    if (attributes.begin()->first.empty()) {
        throw InvalidAttributesError("Field names must not be empty");
    }
    checkRequired(attributes);
}

void TokenCodec::checkRequired(const AttributeMap& attributes) const {
    for (const auto& name : required_fields_) {
        if (attributes.count(name) == 0) {
            throw InvalidAttributesError("Required field missing: " + name);
        }
    }
}

Token TokenCodec::encryptCanonical(const std::string& signed_canonical,
                                   const SecretKey& key, const AESBlock& iv) {
    ScopedWipe<DerivedKey> derived(KeyDeriver::derive(key));

    ScopedWipe<ByteVec> padded(encoding::padPKCS7(encoding::stringToBytes(signed_canonical),
                                                  SSOTOK_AES_BLOCK_SIZE));
    ByteVec ciphertext = AES256CBC(derived.get()).encrypt(padded.get(), iv);

    ByteVec wire;
    wire.reserve(iv.size() + ciphertext.size());
    wire.insert(wire.end(), iv.begin(), iv.end());
    wire.insert(wire.end(), ciphertext.begin(), ciphertext.end());

    return encoding::base64Encode(wire);
}

std::string TokenCodec::decryptCanonical(const Token& token, const SecretKey& key) {
    KeyDeriver::validate(key);

    ByteVec wire;
    try {
        wire = encoding::base64Decode(token);
    } catch (const encoding::EncodingError& e) {
        throw InvalidTokenFormatError(std::string("Token is not valid Base64: ") + e.what());
    }

    if (wire.size() < SSOTOK_MIN_TOKEN_BYTES) {
        throw InvalidTokenFormatError("Token is shorter than an IV plus one cipher block");
    }
    if ((wire.size() - SSOTOK_IV_SIZE) % SSOTOK_AES_BLOCK_SIZE != 0) {
        throw InvalidTokenFormatError("Token ciphertext is not a whole number of blocks");
    }

    AESBlock iv{};
    std::copy(wire.begin(), wire.begin() + SSOTOK_IV_SIZE, iv.begin());
    ByteVec ciphertext(wire.begin() + SSOTOK_IV_SIZE, wire.end());

    ScopedWipe<DerivedKey> derived(KeyDeriver::derive(key));
    ScopedWipe<ByteVec> padded(AES256CBC(derived.get()).decrypt(ciphertext, iv));

    ScopedWipe<ByteVec> plain;
    try {
        plain.get() = encoding::unpadPKCS7(padded.get(), SSOTOK_AES_BLOCK_SIZE);
    } catch (const encoding::EncodingError& e) {
        throw PaddingError(std::string("Token padding is invalid: ") + e.what());
    }

    return encoding::bytesToString(plain.get());
}

Token TokenCodec::encode(const AttributeMap& attributes, const SecretKey& key) const {
    KeyDeriver::validate(key);
    checkAttributes(attributes);

    Signature sig = Signer::sign(attributes, key);
    ScopedWipe<std::string> signed_canonical(
        ParamCanonicalizer::renderWith(attributes, Signer::FIELD, sig));

    AESBlock iv{};
    ByteVec random = randomBytes(iv.size());
    std::copy(random.begin(), random.end(), iv.begin());

    return encryptCanonical(signed_canonical.get(), key, iv);
}

Token TokenCodec::encode(const AttributeMap& attributes, const std::string& key) const {
    ScopedWipe<SecretKey> bytes(to_key(key));
    return encode(attributes, bytes.get());
}

AttributeMap TokenCodec::decode(const Token& token, const SecretKey& key) const {
    ScopedWipe<std::string> canonical(decryptCanonical(token, key));
    AttributeMap fields = ParamCanonicalizer::parse(canonical.get());

    auto sig = fields.find(Signer::FIELD);
    if (sig == fields.end()) {
        throw MissingSignatureFieldError("Token does not carry a signature field");
    }
    Signature signature = std::move(sig->second);
    fields.erase(sig);

    if (!Signer::verify(fields, signature, key)) {
        throw SignatureMismatchError("Token signature does not match its contents");
    }

    checkRequired(fields);
    return fields;
}

AttributeMap TokenCodec::decode(const Token& token, const std::string& key) const {
    ScopedWipe<SecretKey> bytes(to_key(key));
    return decode(token, bytes.get());
}

Token encode(const AttributeMap& attributes, const SecretKey& key) {
    return TokenCodec().encode(attributes, key);
}

Token encode(const AttributeMap& attributes, const std::string& key) {
    return TokenCodec().encode(attributes, key);
}

AttributeMap decode(const Token& token, const SecretKey& key) {
    return TokenCodec().decode(token, key);
}

AttributeMap decode(const Token& token, const std::string& key) {
    return TokenCodec().decode(token, key);
}

} // namespace ssotok
