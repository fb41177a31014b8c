/**
 * @file test_digest.cpp
 * @brief MD5 unit tests (RFC 1321 test suite)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <gtest/gtest.h>
#include <string>

#include "ssotok/crypto/digest.h"
#include "ssotok/core/errors.h"
#include "ssotok/utils/encoding.h"

using ssotok::MD5;
using ssotok::MD5Digest;

namespace {

std::string md5_hex(const std::string& input) {
    MD5Digest d = MD5::hash(input);
    return ssotok::hexEncode(d.data(), d.size());
}

} // namespace

TEST(MD5Test, Rfc1321Vectors) {
    EXPECT_EQ(md5_hex(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(md5_hex("a"), "0cc175b9c0f1b6a831c399e269772661");
    EXPECT_EQ(md5_hex("abc"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(md5_hex("message digest"), "f96b697d7cb7938d525a2f31aaf161d0");
    EXPECT_EQ(md5_hex("abcdefghijklmnopqrstuvwxyz"), "c3fcd3d76192e4007dfb496cca67e13b");
}

TEST(MD5Test, IncrementalMatchesOneShot) {
    MD5Digest whole = MD5::hash(std::string("message digest"));

    MD5 ctx;
    ctx.update(std::string("mess")).update(std::string("age ")).update(std::string("digest"));
    EXPECT_EQ(ctx.finalize(), whole);
}

TEST(MD5Test, UpdateAfterFinalizeThrows) {
    MD5 ctx;
    ctx.update(std::string("abc"));
    ctx.finalize();
    EXPECT_THROW(ctx.update(std::string("more")), ssotok::CryptoError);
}

TEST(MD5Test, CApi) {
    uint8_t digest[16];
    const uint8_t abc[] = {'a', 'b', 'c'};
    ASSERT_EQ(ssotok_md5(abc, sizeof(abc), digest), SSOTOK_SUCCESS);
    EXPECT_EQ(ssotok::hexEncode(digest, sizeof(digest)), "900150983cd24fb0d6963f7d28e17f72");

    ASSERT_EQ(ssotok_md5(nullptr, 0, digest), SSOTOK_SUCCESS);
    EXPECT_EQ(ssotok::hexEncode(digest, sizeof(digest)), "d41d8cd98f00b204e9800998ecf8427e");

    EXPECT_EQ(ssotok_md5(abc, sizeof(abc), nullptr), SSOTOK_ERROR_INVALID_PARAM);
}
