/**
 * @file security.cpp
 * @brief Security Primitives Implementation
 *
 * Constant-time comparison, secure zeroing and the platform CSPRNG that
 * supplies token IVs.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "ssotok/core/security.h"
#include "ssotok/core/errors.h"
#include <cstring>
#include <cstdint>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#include <bcrypt.h>
#include <intrin.h>
#ifndef STATUS_SUCCESS
constexpr NTSTATUS SSOTOK_STATUS_SUCCESS = 0x00000000L;
#define STATUS_SUCCESS SSOTOK_STATUS_SUCCESS
#endif
#else
#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#if defined(__linux__)
// sys/random.h requires glibc 2.25+, go through syscall() instead
#include <sys/syscall.h>
#ifdef SYS_getrandom
#define SSOTOK_HAS_GETRANDOM_SYSCALL 1
static inline ssize_t ssotok_getrandom(void* buf, size_t len, unsigned int flags) {
    return syscall(SYS_getrandom, buf, len, flags);
}
#endif
#elif defined(__APPLE__)
#include <Security/SecRandom.h>
#endif
#endif

namespace ssotok {
namespace internal {

#if defined(__GNUC__) || defined(__clang__)
#define COMPILER_BARRIER() __asm__ __volatile__("" ::: "memory")
#elif defined(_MSC_VER)
#define COMPILER_BARRIER() _ReadWriteBarrier()
#else
#define COMPILER_BARRIER()
#endif

// ============================================================================
// Secure Memory Operations
// ============================================================================

// Volatile function pointer to prevent optimization
using SecureZeroFn = void (*volatile)(void*, size_t);

static void secure_zero_impl(void* ptr, size_t len) {
    volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
    while (len--) {
        *p++ = 0;
    }
}

static SecureZeroFn secure_zero_ptr = secure_zero_impl;

void secure_zero(void* ptr, size_t len) {
    if (!ptr || len == 0) return;

#ifdef _WIN32
    SecureZeroMemory(ptr, len);
#else
    secure_zero_ptr(ptr, len);
#endif

    COMPILER_BARRIER();
}

bool secure_compare(const void* a, const void* b, size_t len) {
    if (!a || !b) return false;

    const volatile unsigned char* pa = static_cast<const volatile unsigned char*>(a);
    const volatile unsigned char* pb = static_cast<const volatile unsigned char*>(b);

    volatile unsigned char diff = 0;

    for (size_t i = 0; i < len; i++) {
        diff |= static_cast<unsigned char>(pa[i] ^ pb[i]);
    }

    COMPILER_BARRIER();

    return diff == 0;
}

// ============================================================================
// CSPRNG
// ============================================================================

#ifdef _WIN32

ssotok_error_t random_bytes(void* buf, size_t len) {
    if (!buf) return SSOTOK_ERROR_INVALID_PARAM;
    if (len == 0) return SSOTOK_SUCCESS;

    NTSTATUS status = BCryptGenRandom(
        nullptr,
        static_cast<PUCHAR>(buf),
        static_cast<ULONG>(len),
        BCRYPT_USE_SYSTEM_PREFERRED_RNG
    );

    return (status == STATUS_SUCCESS) ? SSOTOK_SUCCESS : SSOTOK_ERROR_RANDOM_FAILED;
}

#elif defined(__APPLE__)

ssotok_error_t random_bytes(void* buf, size_t len) {
    if (!buf) return SSOTOK_ERROR_INVALID_PARAM;
    if (len == 0) return SSOTOK_SUCCESS;

    if (SecRandomCopyBytes(kSecRandomDefault, len, buf) == errSecSuccess) {
        return SSOTOK_SUCCESS;
    }
    return SSOTOK_ERROR_RANDOM_FAILED;
}

#else

static ssotok_error_t read_urandom(unsigned char* p, size_t remaining) {
    int fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
    if (fd < 0) return SSOTOK_ERROR_RANDOM_FAILED;

    while (remaining > 0) {
        ssize_t ret = read(fd, p, remaining);
        if (ret < 0) {
            if (errno == EINTR) continue;
            close(fd);
            return SSOTOK_ERROR_RANDOM_FAILED;
        }
        if (ret == 0) {
            close(fd);
            return SSOTOK_ERROR_RANDOM_FAILED;
        }
        p += ret;
        remaining -= static_cast<size_t>(ret);
    }
    close(fd);
    return SSOTOK_SUCCESS;
}

ssotok_error_t random_bytes(void* buf, size_t len) {
    if (!buf) return SSOTOK_ERROR_INVALID_PARAM;
    if (len == 0) return SSOTOK_SUCCESS;

    unsigned char* p = static_cast<unsigned char*>(buf);
    size_t remaining = len;

#ifdef SSOTOK_HAS_GETRANDOM_SYSCALL
    while (remaining > 0) {
        ssize_t ret = ssotok_getrandom(p, remaining, 0);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;  // ENOSYS or similar, use /dev/urandom
        }
        p += ret;
        remaining -= static_cast<size_t>(ret);
    }

    if (remaining == 0) return SSOTOK_SUCCESS;

    p = static_cast<unsigned char*>(buf);
    remaining = len;
#endif

    return read_urandom(p, remaining);
}

#endif

}  // namespace internal

ByteVec randomBytes(size_t len) {
    ByteVec out(len);
    if (len == 0) return out;
    ssotok_error_t err = internal::random_bytes(out.data(), out.size());
    if (err != SSOTOK_SUCCESS) {
        throw CryptoError("Failed to read from the system CSPRNG", SSOTOK_ERROR_RANDOM_FAILED);
    }
    return out;
}

}  // namespace ssotok

// ============================================================================
// C ABI Exports
// ============================================================================

extern "C" {

void ssotok_secure_zero(void* ptr, size_t len) {
    ssotok::internal::secure_zero(ptr, len);
}

int ssotok_secure_compare(const void* a, const void* b, size_t len) {
    return ssotok::internal::secure_compare(a, b, len) ? 1 : 0;
}

ssotok_error_t ssotok_random_bytes(void* buf, size_t len) {
    return ssotok::internal::random_bytes(buf, len);
}

}  // extern "C"
