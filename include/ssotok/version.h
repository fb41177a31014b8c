/**
 * @file version.h
 * @brief Unified Version Information for ssotok Library
 *
 * This is the SINGLE SOURCE OF TRUTH for all version information.
 * All other files should include this header and use these macros.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SSOTOK_VERSION_H
#define SSOTOK_VERSION_H

/**
 * @defgroup Version Library Version Information
 * @{
 */

/** Major version number (API breaking changes) */
#define SSOTOK_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define SSOTOK_VERSION_MINOR 0

/** Patch version number (bug fixes) */
#define SSOTOK_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define SSOTOK_VERSION_STRING "1.0.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define SSOTOK_VERSION_NUMBER ((SSOTOK_VERSION_MAJOR * 10000) + \
                               (SSOTOK_VERSION_MINOR * 100) + \
                               SSOTOK_VERSION_PATCH)

/** Release date in YYYY-MM-DD format */
#define SSOTOK_RELEASE_DATE "2026-10-18"

/** Library name */
#define SSOTOK_LIBRARY_NAME "ssotok"

/** Full library description */
#define SSOTOK_DESCRIPTION "Signed and encrypted SSO attribute tokens"

/** Protocol version stamped into SSO tokens */
#define SSOTOK_SSO_PROTOCOL_VERSION "SSOv1.5"

/** Build type identifier */
#ifdef NDEBUG
#define SSOTOK_BUILD_TYPE "Release"
#else
#define SSOTOK_BUILD_TYPE "Debug"
#endif

/**
 * @brief Check if library version is at least the specified version
 */
#define SSOTOK_VERSION_AT_LEAST(major, minor, patch) \
    (SSOTOK_VERSION_NUMBER >= ((major) * 10000 + (minor) * 100 + (patch)))

/** @} */

#endif /* SSOTOK_VERSION_H */
