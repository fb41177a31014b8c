/**
 * @file test_key_deriver.cpp
 * @brief Token key derivation tests
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <string>

#include "ssotok/token/key_deriver.h"
#include "ssotok/crypto/digest.h"
#include "ssotok/core/errors.h"
#include "ssotok/utils/encoding.h"

using namespace ssotok;

TEST(KeyDeriverTest, KnownAnswer) {
    DerivedKey key = KeyDeriver::derive(std::string("shared-secret"));
    EXPECT_EQ(hexEncode(key.data(), key.size()),
              "b2641cf7665080f8f5487b3c5d32e6f0b191c39c3e2e9681cbd19864ffda35a1");

    key = KeyDeriver::derive(std::string("secret"));
    EXPECT_EQ(hexEncode(key.data(), key.size()),
              "5ebe2294ecd0e0f08eab7690d2a6ee6926ae5cc854e36b6bdfca366848dea6bb");
}

TEST(KeyDeriverTest, HalvesFollowTwoRoundExpansion) {
    SecretKey secret = {0x00, 0x01, 0xFE, 0xFF};
    DerivedKey key = KeyDeriver::derive(secret);

    MD5Digest first = MD5::hash(secret);
    MD5Digest second = MD5().update(first.data(), first.size()).update(secret).finalize();

    EXPECT_TRUE(std::equal(first.begin(), first.end(), key.begin()));
    EXPECT_TRUE(std::equal(second.begin(), second.end(), key.begin() + 16));
}

TEST(KeyDeriverTest, DeterministicAndKeySensitive) {
    EXPECT_EQ(KeyDeriver::derive(std::string("k1")), KeyDeriver::derive(std::string("k1")));
    EXPECT_NE(KeyDeriver::derive(std::string("k1")), KeyDeriver::derive(std::string("k2")));
}

TEST(KeyDeriverTest, EmptySecretRejected) {
    EXPECT_THROW(KeyDeriver::derive(SecretKey{}), InvalidKeyError);
    EXPECT_THROW(KeyDeriver::derive(std::string()), InvalidKeyError);
    EXPECT_THROW(KeyDeriver::validate(SecretKey{}), InvalidKeyError);
    EXPECT_NO_THROW(KeyDeriver::validate(SecretKey{0x00}));
}

TEST(KeyDeriverTest, CApi) {
    const uint8_t secret[] = {'s', 'e', 'c', 'r', 'e', 't'};
    uint8_t out[32];
    ASSERT_EQ(ssotok_derive_key(secret, sizeof(secret), out), SSOTOK_SUCCESS);
    EXPECT_EQ(hexEncode(out, sizeof(out)),
              "5ebe2294ecd0e0f08eab7690d2a6ee6926ae5cc854e36b6bdfca366848dea6bb");

    EXPECT_EQ(ssotok_derive_key(secret, 0, out), SSOTOK_ERROR_INVALID_KEY);
}
