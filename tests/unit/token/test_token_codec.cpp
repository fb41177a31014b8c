/**
 * @file test_token_codec.cpp
 * @brief Token encode/decode tests
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <string>

#include "ssotok/ssotok.h"

using namespace ssotok;

namespace {

const char* const SECRET = "shared-secret";

// Base64(IV 00..0f || AES-256-CBC(derive("shared-secret"), IV,
//        PKCS7("email=a%40example.com&sig=5bdeaf8b1c0660685d100b12116f6dc9&uid=42")))
const char* const REFERENCE_TOKEN =
    "AAECAwQFBgcICQoLDA0OD+uYphx6Ba6ljzPvWG0ZjJ1VKHwcA+a86/wBDvnxXnVdpgRqD2sC"
    "brCyGtTN4oBDbHFFJws4D13oiy/ZevYT0hvcujqtM2YV+vhy2Z9FX0ya";

AESBlock counting_iv() {
    AESBlock iv{};
    for (size_t i = 0; i < iv.size(); i++) {
        iv[i] = static_cast<uint8_t>(i);
    }
    return iv;
}

} // namespace

class TokenCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(ssotok_init(), SSOTOK_SUCCESS);
        key = encoding::stringToBytes(SECRET);
    }

    void TearDown() override {
        ssotok_cleanup();
    }

    // Encrypt arbitrary plaintext the way a token is encrypted, bypassing signing
    Token forge(const std::string& canonical) const {
        return TokenCodec::encryptCanonical(canonical, key, counting_iv());
    }

    SecretKey key;
    AttributeMap attrs = {{"uid", "42"}, {"email", "a@example.com"}};
};

// ============================================================================
// Reference vectors
// ============================================================================

TEST_F(TokenCodecTest, ReferenceTokenEncryption) {
    std::string signed_canonical =
        "email=a%40example.com&sig=5bdeaf8b1c0660685d100b12116f6dc9&uid=42";
    EXPECT_EQ(TokenCodec::encryptCanonical(signed_canonical, key, counting_iv()), REFERENCE_TOKEN);
}

TEST_F(TokenCodecTest, ReferenceTokenDecodes) {
    AttributeMap decoded = decode(REFERENCE_TOKEN, SECRET);
    EXPECT_EQ(decoded, attrs);
    EXPECT_EQ(decoded.count(Signer::FIELD), 0u);
}

TEST_F(TokenCodecTest, ReferenceTokenPlaintext) {
    EXPECT_EQ(TokenCodec::decryptCanonical(REFERENCE_TOKEN, key),
              "email=a%40example.com&sig=5bdeaf8b1c0660685d100b12116f6dc9&uid=42");
}

// ============================================================================
// Encode
// ============================================================================

TEST_F(TokenCodecTest, EncodeDecode) {
    Token token = encode(attrs, key);
    EXPECT_EQ(decode(token, key), attrs);
}

TEST_F(TokenCodecTest, TokenLayout) {
    Token token = encode(attrs, key);
    ByteVec wire = base64Decode(token);
    // 65 bytes of signed canonical text pad to 80
    EXPECT_EQ(wire.size(), 16u + 80u);
    EXPECT_EQ((wire.size() - 16) % 16, 0u);
}

TEST_F(TokenCodecTest, FreshIvPerToken) {
    Token a = encode(attrs, key);
    Token b = encode(attrs, key);
    EXPECT_NE(a, b);
    EXPECT_EQ(decode(a, key), decode(b, key));
}

TEST_F(TokenCodecTest, SpecialCharactersSurvive) {
    AttributeMap tricky = {
        {"a&b", "c=d"},
        {"blank", ""},
        {"space", " "},
        {"plus", "1+1"},
        {"percent", "100%"},
        {"utf8", "Jos\xC3\xA9"},
        {"binary", std::string("\x00\x01\xFF", 3)},
    };
    EXPECT_EQ(decode(encode(tricky, key), key), tricky);
}

TEST_F(TokenCodecTest, LargeAttributeValues) {
    AttributeMap big = {{"blob", std::string(10000, 'x')}};
    EXPECT_EQ(decode(encode(big, key), key), big);
}

TEST_F(TokenCodecTest, EncodeRejectsEmptyKey) {
    EXPECT_THROW(encode(attrs, SecretKey{}), InvalidKeyError);
    EXPECT_THROW(encode(attrs, std::string()), InvalidKeyError);
}

TEST_F(TokenCodecTest, EncodeRejectsInvalidAttributes) {
    EXPECT_THROW(encode(AttributeMap{}, key), InvalidAttributesError);
    EXPECT_THROW(encode(AttributeMap{{"", "v"}}, key), InvalidAttributesError);
    EXPECT_THROW(encode(AttributeMap{{"sig", "x"}, {"uid", "1"}}, key), InvalidAttributesError);
}

// ============================================================================
// Decode failures
// ============================================================================

TEST_F(TokenCodecTest, DecodeRejectsEmptyKey) {
    EXPECT_THROW(decode(REFERENCE_TOKEN, SecretKey{}), InvalidKeyError);
}

TEST_F(TokenCodecTest, DecodeRejectsBadBase64) {
    EXPECT_THROW(decode("", key), InvalidTokenFormatError);
    EXPECT_THROW(decode("not base64!", key), InvalidTokenFormatError);

    std::string url_safe = REFERENCE_TOKEN;
    std::replace(url_safe.begin(), url_safe.end(), '+', '-');
    std::replace(url_safe.begin(), url_safe.end(), '/', '_');
    EXPECT_THROW(decode(url_safe, key), InvalidTokenFormatError);

    EXPECT_THROW(decode(std::string(REFERENCE_TOKEN) + "\n", key), InvalidTokenFormatError);

    // IV plus one block is 32 bytes, so the text ends in a single '='
    // and the last data character carries two unused bits.
    Token padded = forge("a=b");
    ASSERT_EQ(padded.back(), '=');
    ASSERT_NE(padded[padded.size() - 2], '=');
    EXPECT_NO_THROW(base64Decode(padded));

    const std::string alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    Token altered = padded;
    char& last = altered[altered.size() - 2];
    last = alphabet[alphabet.find(last) + 1];
    EXPECT_EQ(altered.size(), padded.size());
    EXPECT_THROW(decode(altered, key), InvalidTokenFormatError);
}

TEST_F(TokenCodecTest, DecodeRejectsShortTokens) {
    // IV only
    EXPECT_THROW(decode(base64Encode(ByteVec(16, 0)), key), InvalidTokenFormatError);
    // IV plus a partial block
    EXPECT_THROW(decode(base64Encode(ByteVec(31, 0)), key), InvalidTokenFormatError);
    // IV plus one and a half blocks
    EXPECT_THROW(decode(base64Encode(ByteVec(40, 0)), key), InvalidTokenFormatError);
}

TEST_F(TokenCodecTest, DecodeDetectsBadPadding) {
    // A block whose last byte is 0 can never carry valid PKCS#7 padding
    AES256CBC aes(KeyDeriver::derive(key));
    AESBlock iv = counting_iv();
    ByteVec ciphertext = aes.encrypt(ByteVec(16, 0x00), iv);

    ByteVec wire(iv.begin(), iv.end());
    wire.insert(wire.end(), ciphertext.begin(), ciphertext.end());

    EXPECT_THROW(decode(base64Encode(wire), key), PaddingError);
}

TEST_F(TokenCodecTest, DecodeDetectsMalformedPlaintext) {
    EXPECT_THROW(decode(forge("no delimiters here"), key), MalformedCanonicalStringError);
    EXPECT_THROW(decode(forge("a=1&&b=2"), key), MalformedCanonicalStringError);
}

TEST_F(TokenCodecTest, DecodeDetectsMissingSignature) {
    EXPECT_THROW(decode(forge("email=a%40example.com&uid=42"), key), MissingSignatureFieldError);
}

TEST_F(TokenCodecTest, DecodeDetectsForgedSignature) {
    EXPECT_THROW(decode(forge("email=a%40example.com&sig=00000000000000000000000000000000&uid=42"),
                        key),
                 SignatureMismatchError);
    // Valid signature for different content
    EXPECT_THROW(decode(forge("email=a%40example.com&sig=5bdeaf8b1c0660685d100b12116f6dc9&uid=43"),
                        key),
                 SignatureMismatchError);
}

TEST_F(TokenCodecTest, DecodeWithWrongKeyFails) {
    Token token = encode(attrs, key);
    // Either the padding check or the signature check rejects it
    EXPECT_THROW(decode(token, std::string("wrong-secret")), TokenError);
}

TEST_F(TokenCodecTest, TamperedCiphertextFails) {
    ByteVec wire = base64Decode(encode(attrs, key));
    for (size_t pos : {size_t(0), size_t(20), wire.size() - 1}) {
        ByteVec tampered = wire;
        tampered[pos] ^= 0x01;
        EXPECT_THROW(decode(base64Encode(tampered), key), TokenError) << "byte " << pos;
    }
}

// ============================================================================
// Required fields
// ============================================================================

TEST_F(TokenCodecTest, RequiredFields) {
    TokenCodec codec(std::set<std::string>{"uid"});
    EXPECT_EQ(codec.requiredFields().count("uid"), 1u);

    Token token = codec.encode(attrs, key);
    EXPECT_EQ(codec.decode(token, key), attrs);

    EXPECT_THROW(codec.encode(AttributeMap{{"email", "x"}}, key), InvalidAttributesError);

    Token without_uid = encode(AttributeMap{{"email", "x"}}, key);
    EXPECT_THROW(codec.decode(without_uid, key), InvalidAttributesError);
}

TEST_F(TokenCodecTest, SignatureCannotBeRequired) {
    EXPECT_THROW(TokenCodec(std::set<std::string>{"sig"}), InvalidAttributesError);
}
