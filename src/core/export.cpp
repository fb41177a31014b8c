/**
 * @file export.cpp
 * @brief Library export and initialization functions
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "ssotok/ssotok.h"

#include <atomic>

// Global initialization state
static std::atomic<int> g_ssotok_initialized{0};

extern "C" {

const char* ssotok_version(void) {
    return SSOTOK_VERSION_STRING;
}

const char* ssotok_platform(void) {
    return SSOTOK_PLATFORM_NAME;
}

ssotok_error_t ssotok_init(void) {
    if (g_ssotok_initialized.load()) {
        return SSOTOK_SUCCESS;
    }

    // Every token needs a fresh IV, so fail early if the CSPRNG is unusable
    uint8_t probe[SSOTOK_IV_SIZE];
    ssotok_error_t rc = ssotok_random_bytes(probe, sizeof(probe));
    ssotok_secure_zero(probe, sizeof(probe));
    if (rc != SSOTOK_SUCCESS) {
        return SSOTOK_ERROR_RANDOM_FAILED;
    }

    g_ssotok_initialized.store(1);
    return SSOTOK_SUCCESS;
}

void ssotok_cleanup(void) {
    g_ssotok_initialized.store(0);
}

const char* ssotok_error_string(ssotok_error_t error) {
    switch (error) {
        case SSOTOK_SUCCESS:
            return "Success";
        case SSOTOK_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case SSOTOK_ERROR_BUFFER_TOO_SMALL:
            return "Buffer too small";
        case SSOTOK_ERROR_INVALID_KEY:
            return "Invalid key";
        case SSOTOK_ERROR_INVALID_ATTRIBUTES:
            return "Invalid attributes";
        case SSOTOK_ERROR_INVALID_TOKEN_FORMAT:
            return "Invalid token format";
        case SSOTOK_ERROR_PADDING:
            return "Invalid padding";
        case SSOTOK_ERROR_MALFORMED_CANONICAL:
            return "Malformed canonical string";
        case SSOTOK_ERROR_MISSING_SIGNATURE:
            return "Missing signature field";
        case SSOTOK_ERROR_SIGNATURE_MISMATCH:
            return "Signature mismatch";
        case SSOTOK_ERROR_CRYPTO_FAILED:
            return "Cryptographic operation failed";
        case SSOTOK_ERROR_RANDOM_FAILED:
            return "Random number generation failed";
        case SSOTOK_ERROR_INTERNAL:
            return "Internal error";
        default:
            return "Unknown error";
    }
}

} // extern "C"
