/**
 * @file common.h
 * @brief Common definitions and utility macros for the ssotok library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef SSOTOK_CORE_COMMON_H
#define SSOTOK_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define SSOTOK_PLATFORM_WINDOWS 1
    #define SSOTOK_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define SSOTOK_PLATFORM_LINUX 1
    #define SSOTOK_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define SSOTOK_PLATFORM_MACOS 1
    #define SSOTOK_PLATFORM_NAME "macOS"
#else
    #define SSOTOK_PLATFORM_UNKNOWN 1
    #define SSOTOK_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef SSOTOK_PLATFORM_WINDOWS
    #ifdef SSOTOK_SHARED_LIBRARY
        #ifdef SSOTOK_BUILDING
            #define SSOTOK_API __declspec(dllexport)
        #else
            #define SSOTOK_API __declspec(dllimport)
        #endif
    #else
        #define SSOTOK_API
    #endif
#else
    #ifdef SSOTOK_SHARED_LIBRARY
        #define SSOTOK_API __attribute__((visibility("default")))
    #else
        #define SSOTOK_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    SSOTOK_SUCCESS = 0,
    SSOTOK_ERROR_INVALID_PARAM = -1,
    SSOTOK_ERROR_BUFFER_TOO_SMALL = -2,
    SSOTOK_ERROR_INVALID_KEY = -3,
    SSOTOK_ERROR_INVALID_ATTRIBUTES = -4,
    SSOTOK_ERROR_INVALID_TOKEN_FORMAT = -5,   // bad Base64 or too short
    SSOTOK_ERROR_PADDING = -6,                // PKCS#7 strip failed after decrypt
    SSOTOK_ERROR_MALFORMED_CANONICAL = -7,    // plaintext is not k=v&k=v
    SSOTOK_ERROR_MISSING_SIGNATURE = -8,
    SSOTOK_ERROR_SIGNATURE_MISMATCH = -9,
    SSOTOK_ERROR_CRYPTO_FAILED = -10,         // OpenSSL primitive failure
    SSOTOK_ERROR_RANDOM_FAILED = -11,         // CSPRNG failure
    SSOTOK_ERROR_INTERNAL = -12
} ssotok_error_t;

// Sizes fixed by the token wire format
#define SSOTOK_AES_BLOCK_SIZE       16
#define SSOTOK_IV_SIZE              16
#define SSOTOK_DERIVED_KEY_SIZE     32
#define SSOTOK_MD5_DIGEST_SIZE      16
#define SSOTOK_SIGNATURE_HEX_SIZE   32

// Smallest decoded token: IV plus one cipher block
#define SSOTOK_MIN_TOKEN_BYTES (SSOTOK_IV_SIZE + SSOTOK_AES_BLOCK_SIZE)

// Utility macros
#define SSOTOK_ARRAY_SIZE(arr) (sizeof(arr) / sizeof((arr)[0]))
#define SSOTOK_MIN(a, b) ((a) < (b) ? (a) : (b))
#define SSOTOK_MAX(a, b) ((a) > (b) ? (a) : (b))

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
SSOTOK_API const char* ssotok_error_string(ssotok_error_t error);

#ifdef __cplusplus
}
#endif

#endif // SSOTOK_CORE_COMMON_H
