/**
 * @file types.h
 * @brief Type definitions for the ssotok library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef SSOTOK_CORE_TYPES_H
#define SSOTOK_CORE_TYPES_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Byte type
typedef uint8_t ssotok_byte;

#ifdef __cplusplus
}
#endif

// C++ types
#ifdef __cplusplus

#include <vector>
#include <string>
#include <array>
#include <map>

namespace ssotok {

// Byte vector
using ByteVec = std::vector<uint8_t>;

// Byte array templates
template<size_t N>
using ByteArray = std::array<uint8_t, N>;

// Cipher material
using AESBlock = ByteArray<16>;
using AES256Key = ByteArray<32>;
using DerivedKey = AES256Key;

// Hash digests
using MD5Digest = ByteArray<16>;

// Field name -> field value. std::map keeps keys in byte-wise order,
// which is the canonical ordering of the token format.
using AttributeMap = std::map<std::string, std::string>;

} // namespace ssotok

#endif // __cplusplus

#endif // SSOTOK_CORE_TYPES_H
