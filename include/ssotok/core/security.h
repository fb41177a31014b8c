/**
 * @file security.h
 * @brief Side-channel resistant helpers used by the token codec
 *
 * - Constant-time comparison for signature checks
 * - Secure memory zeroing for derived keys and plaintext buffers
 * - OS-backed cryptographically secure random bytes for IVs
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SSOTOK_CORE_SECURITY_H
#define SSOTOK_CORE_SECURITY_H

#include "ssotok/core/common.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Constant-time memory comparison
 *
 * Execution time depends only on len, never on the content.
 *
 * @param a First memory region
 * @param b Second memory region
 * @param len Number of bytes to compare
 * @return 1 if equal, 0 if different or if either pointer is null
 */
SSOTOK_API int ssotok_secure_compare(const void* a, const void* b, size_t len);

/**
 * @brief Secure memory zeroing, not optimized away by the compiler
 * @param ptr Pointer to memory to zero (null is ignored)
 * @param len Number of bytes to zero
 */
SSOTOK_API void ssotok_secure_zero(void* ptr, size_t len);

/**
 * @brief Cryptographically secure random bytes
 *
 * Uses the platform CSPRNG:
 * - Windows: BCryptGenRandom
 * - Linux: getrandom() syscall, falling back to /dev/urandom
 * - macOS: SecRandomCopyBytes
 *
 * Safe to call concurrently from several threads.
 *
 * @param buf Buffer to fill
 * @param len Number of bytes
 * @return SSOTOK_SUCCESS, SSOTOK_ERROR_INVALID_PARAM or SSOTOK_ERROR_RANDOM_FAILED
 */
SSOTOK_API ssotok_error_t ssotok_random_bytes(void* buf, size_t len);

#ifdef __cplusplus
} // extern "C"

#include "ssotok/core/types.h"

#include <utility>

namespace ssotok {

/**
 * @brief Constant-time comparison for C++ containers
 */
template<typename Container>
bool secure_compare(const Container& a, const Container& b) {
    if (a.size() != b.size()) return false;
    return ssotok_secure_compare(a.data(), b.data(),
                                 a.size() * sizeof(typename Container::value_type)) == 1;
}

/**
 * @brief Wipe a container's bytes in place
 */
template<typename Container>
void secure_wipe(Container& c) {
    if (c.empty()) return;
    ssotok_secure_zero(&c[0], c.size() * sizeof(typename Container::value_type));
}

/**
 * @brief Owns a container of secret bytes and wipes it on destruction
 *
 * Covers every exit path, including exceptions thrown while the
 * secret is in use.
 */
template<typename Container>
class ScopedWipe {
public:
    ScopedWipe() = default;
    explicit ScopedWipe(Container value) : value_(std::move(value)) {}
    ~ScopedWipe() { secure_wipe(value_); }

    // Non-copyable
    ScopedWipe(const ScopedWipe&) = delete;
    ScopedWipe& operator=(const ScopedWipe&) = delete;

    Container& get() noexcept { return value_; }
    const Container& get() const noexcept { return value_; }

private:
    Container value_;
};

/**
 * @brief Random bytes as a vector
 * @throws CryptoError if the CSPRNG fails
 */
ByteVec randomBytes(size_t len);

} // namespace ssotok

#endif // __cplusplus

#endif // SSOTOK_CORE_SECURITY_H
