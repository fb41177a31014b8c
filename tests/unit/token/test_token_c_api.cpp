/**
 * @file test_token_c_api.cpp
 * @brief C ABI token encode/decode tests
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <gtest/gtest.h>
#include <cstring>
#include <string>

#include "ssotok/ssotok.h"

class TokenCApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(ssotok_init(), SSOTOK_SUCCESS);
    }

    void TearDown() override {
        ssotok_cleanup();
    }

    const uint8_t secret[13] = {'s', 'h', 'a', 'r', 'e', 'd', '-', 's', 'e', 'c', 'r', 'e', 't'};
};

TEST_F(TokenCApiTest, EncodeThenDecode) {
    const char* canonical = "uid=42&email=a%40example.com";
    char token[256];
    size_t token_len = 0;
    ASSERT_EQ(ssotok_token_encode(canonical, std::strlen(canonical), secret, sizeof(secret),
                                  token, sizeof(token), &token_len), SSOTOK_SUCCESS);
    EXPECT_EQ(token_len, std::strlen(token));
    EXPECT_EQ(token_len, 128u);  // Base64 of 96 bytes

    char decoded[256];
    size_t decoded_len = 0;
    ASSERT_EQ(ssotok_token_decode(token, token_len, secret, sizeof(secret),
                                  decoded, sizeof(decoded), &decoded_len), SSOTOK_SUCCESS);
    // Returned in canonical order, without the signature
    EXPECT_STREQ(decoded, "email=a%40example.com&uid=42");
    EXPECT_EQ(decoded_len, std::strlen(decoded));
}

TEST_F(TokenCApiTest, BufferTooSmallReportsNeededLength) {
    const char* canonical = "uid=42";
    char token[8];
    size_t token_len = 0;
    EXPECT_EQ(ssotok_token_encode(canonical, std::strlen(canonical), secret, sizeof(secret),
                                  token, sizeof(token), &token_len), SSOTOK_ERROR_BUFFER_TOO_SMALL);
    EXPECT_GT(token_len, sizeof(token));
}

TEST_F(TokenCApiTest, ErrorCodes) {
    char out[256];
    size_t out_len = 0;

    EXPECT_EQ(ssotok_token_encode("", 0, secret, sizeof(secret), out, sizeof(out), &out_len),
              SSOTOK_ERROR_INVALID_ATTRIBUTES);
    EXPECT_EQ(ssotok_token_encode("sig=1", 5, secret, sizeof(secret), out, sizeof(out), &out_len),
              SSOTOK_ERROR_INVALID_ATTRIBUTES);
    EXPECT_EQ(ssotok_token_encode("a=1&&", 5, secret, sizeof(secret), out, sizeof(out), &out_len),
              SSOTOK_ERROR_MALFORMED_CANONICAL);
    EXPECT_EQ(ssotok_token_encode("a=1", 3, secret, 0, out, sizeof(out), &out_len),
              SSOTOK_ERROR_INVALID_KEY);

    EXPECT_EQ(ssotok_token_decode("!!!!", 4, secret, sizeof(secret), out, sizeof(out), &out_len),
              SSOTOK_ERROR_INVALID_TOKEN_FORMAT);

    std::string iv_only(24, 'A');  // 18 zero bytes
    EXPECT_EQ(ssotok_token_decode(iv_only.c_str(), iv_only.size(), secret, sizeof(secret),
                                  out, sizeof(out), &out_len),
              SSOTOK_ERROR_INVALID_TOKEN_FORMAT);
}

TEST_F(TokenCApiTest, WrongSecretIsRejected) {
    const char* canonical = "uid=42";
    char token[256];
    size_t token_len = 0;
    ASSERT_EQ(ssotok_token_encode(canonical, std::strlen(canonical), secret, sizeof(secret),
                                  token, sizeof(token), &token_len), SSOTOK_SUCCESS);

    const uint8_t other[] = {'o', 't', 'h', 'e', 'r'};
    char out[256];
    size_t out_len = 0;
    ssotok_error_t rc = ssotok_token_decode(token, token_len, other, sizeof(other),
                                            out, sizeof(out), &out_len);
    EXPECT_NE(rc, SSOTOK_SUCCESS);
    EXPECT_TRUE(rc == SSOTOK_ERROR_PADDING || rc == SSOTOK_ERROR_MALFORMED_CANONICAL ||
                rc == SSOTOK_ERROR_MISSING_SIGNATURE || rc == SSOTOK_ERROR_SIGNATURE_MISMATCH)
        << ssotok_error_string(rc);
}
