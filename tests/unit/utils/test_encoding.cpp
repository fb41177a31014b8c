/**
 * @file test_encoding.cpp
 * @brief Hex, Base64, percent-encoding and PKCS#7 tests
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <string>

#include "ssotok/utils/encoding.h"

using namespace ssotok;
using ssotok::encoding::EncodingError;

// ============================================================================
// Hex
// ============================================================================

TEST(EncodingTest, HexEncodeLowercase) {
    ByteVec data = {0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0x0A};
    EXPECT_EQ(hexEncode(data), "deadbeef000a");
    EXPECT_EQ(hexEncode(ByteVec{}), "");
}

TEST(EncodingTest, HexDecodeAcceptsMixedCase) {
    EXPECT_EQ(hexDecode("DEADbeef"), (ByteVec{0xDE, 0xAD, 0xBE, 0xEF}));
    EXPECT_TRUE(hexDecode("").empty());
}

TEST(EncodingTest, HexDecodeRejectsInvalid) {
    EXPECT_THROW(hexDecode("abc"), EncodingError);
    EXPECT_THROW(hexDecode("zz"), EncodingError);
    EXPECT_THROW(hexDecode("0xDEADbeef"), EncodingError);
    EXPECT_FALSE(encoding::isValidHex("0x00"));

    uint8_t out[4];
    EXPECT_EQ(ssotok_hex_decode("0x0011", 6, out, sizeof(out)), 0u);
    EXPECT_FALSE(encoding::isValidHex("12 34"));
}

// ============================================================================
// Base64
// ============================================================================

TEST(EncodingTest, Base64Rfc4648Vectors) {
    EXPECT_EQ(base64Encode(encoding::stringToBytes("")), "");
    EXPECT_EQ(base64Encode(encoding::stringToBytes("f")), "Zg==");
    EXPECT_EQ(base64Encode(encoding::stringToBytes("fo")), "Zm8=");
    EXPECT_EQ(base64Encode(encoding::stringToBytes("foo")), "Zm9v");
    EXPECT_EQ(base64Encode(encoding::stringToBytes("foobar")), "Zm9vYmFy");

    EXPECT_EQ(encoding::bytesToString(base64Decode("Zm9vYg==")), "foob");
    EXPECT_EQ(encoding::bytesToString(base64Decode("Zm9vYmE=")), "fooba");
}

TEST(EncodingTest, Base64UsesStandardAlphabet) {
    ByteVec data = {0xFB, 0xFF, 0xBF};
    EXPECT_EQ(base64Encode(data), "+/+/");
    EXPECT_EQ(base64Decode("+/+/"), data);
}

TEST(EncodingTest, Base64DecodeIsStrict) {
    EXPECT_THROW(base64Decode("Zm9"), EncodingError);       // length not a multiple of 4
    EXPECT_THROW(base64Decode("Zm9v\n"), EncodingError);    // whitespace
    EXPECT_THROW(base64Decode("Zm 9v"), EncodingError);
    EXPECT_THROW(base64Decode("-_-_"), EncodingError);      // URL-safe alphabet
    EXPECT_THROW(base64Decode("Z=9v"), EncodingError);      // '=' inside the body
    EXPECT_THROW(base64Decode("Zm=v"), EncodingError);
    EXPECT_THROW(base64Decode("Zm9v!A=="), EncodingError);
}

TEST(EncodingTest, Base64DecodeRejectsNonZeroTrailingBits) {
    EXPECT_EQ(base64Decode("QQ=="), (ByteVec{0x41}));
    EXPECT_THROW(base64Decode("QR=="), EncodingError);
    EXPECT_THROW(base64Decode("QX=="), EncodingError);

    EXPECT_EQ(base64Decode("QUI="), (ByteVec{0x41, 0x42}));
    EXPECT_THROW(base64Decode("QUJ="), EncodingError);

    uint8_t out[4];
    size_t out_len = 0;
    EXPECT_EQ(ssotok_base64_decode("QR==", 4, out, sizeof(out), &out_len),
              SSOTOK_ERROR_INVALID_TOKEN_FORMAT);
}

TEST(EncodingTest, Base64CApiReportsErrors) {
    uint8_t out[8];
    size_t out_len = 0;
    EXPECT_EQ(ssotok_base64_decode("Zm9vYmFy", 8, out, sizeof(out), &out_len), SSOTOK_SUCCESS);
    EXPECT_EQ(out_len, 6u);
    EXPECT_EQ(ssotok_base64_decode("Zm9vYmFy", 8, out, 4, &out_len), SSOTOK_ERROR_BUFFER_TOO_SMALL);
    EXPECT_EQ(ssotok_base64_decode("Zm9vYmF", 7, out, sizeof(out), &out_len),
              SSOTOK_ERROR_INVALID_TOKEN_FORMAT);
    EXPECT_EQ(ssotok_base64_decode("Zm9v", 4, out, sizeof(out), nullptr), SSOTOK_ERROR_INVALID_PARAM);
}

// ============================================================================
// Percent-encoding
// ============================================================================

TEST(EncodingTest, PercentEncodeUnreservedPassThrough) {
    EXPECT_EQ(encoding::percentEncode("AZaz09-_.~"), "AZaz09-_.~");
}

TEST(EncodingTest, PercentEncodeEscapesEverythingElse) {
    EXPECT_EQ(encoding::percentEncode(" "), "%20");
    EXPECT_EQ(encoding::percentEncode("a&b=c"), "a%26b%3Dc");
    EXPECT_EQ(encoding::percentEncode("a+b"), "a%2Bb");
    EXPECT_EQ(encoding::percentEncode("100%"), "100%25");
    EXPECT_EQ(encoding::percentEncode("caf\xC3\xA9"), "caf%C3%A9");
    EXPECT_EQ(encoding::percentEncode(std::string("\0", 1)), "%00");
}

TEST(EncodingTest, PercentDecode) {
    EXPECT_EQ(encoding::percentDecode("a%26b%3dc"), "a&b=c");
    EXPECT_EQ(encoding::percentDecode("caf%C3%A9"), "caf\xC3\xA9");
    EXPECT_EQ(encoding::percentDecode("a+b"), "a+b");
    EXPECT_EQ(encoding::percentDecode(""), "");
}

TEST(EncodingTest, PercentDecodeRejectsBadEscapes) {
    EXPECT_THROW(encoding::percentDecode("%"), EncodingError);
    EXPECT_THROW(encoding::percentDecode("%4"), EncodingError);
    EXPECT_THROW(encoding::percentDecode("%G0"), EncodingError);
    EXPECT_THROW(encoding::percentDecode("abc%2"), EncodingError);
}

// ============================================================================
// PKCS#7
// ============================================================================

TEST(EncodingTest, PadPKCS7AlwaysAddsPadding) {
    ByteVec padded = encoding::padPKCS7(ByteVec(16, 0x41), 16);
    ASSERT_EQ(padded.size(), 32u);
    EXPECT_EQ(padded.back(), 16);

    padded = encoding::padPKCS7(ByteVec(13, 0x41), 16);
    ASSERT_EQ(padded.size(), 16u);
    EXPECT_EQ(padded[13], 3);
    EXPECT_EQ(padded[15], 3);

    padded = encoding::padPKCS7(ByteVec{}, 16);
    EXPECT_EQ(padded, ByteVec(16, 16));
}

TEST(EncodingTest, UnpadPKCS7) {
    ByteVec data = {'h', 'i'};
    EXPECT_EQ(encoding::unpadPKCS7(encoding::padPKCS7(data, 16), 16), data);
}

TEST(EncodingTest, UnpadPKCS7RejectsInvalidPadding) {
    ByteVec block(16, 0x41);

    block[15] = 0x00;
    EXPECT_THROW(encoding::unpadPKCS7(block, 16), EncodingError);

    block[15] = 17;
    EXPECT_THROW(encoding::unpadPKCS7(block, 16), EncodingError);

    block[15] = 0x03;
    block[14] = 0x03;
    block[13] = 0x02;
    EXPECT_THROW(encoding::unpadPKCS7(block, 16), EncodingError);

    EXPECT_THROW(encoding::unpadPKCS7(ByteVec{}, 16), EncodingError);
    EXPECT_THROW(encoding::unpadPKCS7(ByteVec(15, 1), 16), EncodingError);
}
