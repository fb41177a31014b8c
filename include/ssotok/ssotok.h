/**
 * @file ssotok.h
 * @brief ssotok - signed and encrypted single sign-on tokens
 *
 * Unified header for the token library.
 *
 * Modules:
 * - Token: KeyDeriver, ParamCanonicalizer, Signer, TokenCodec
 * - SSO: SsoClient (partner-side token issuing and PrivacyGuard fields)
 * - Crypto: MD5, AES256CBC (OpenSSL EVP)
 * - Utils: hex, Base64, percent-encoding, PKCS#7
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SSOTOK_H
#define SSOTOK_H

#include "ssotok/version.h"
#include "ssotok/core/common.h"
#include "ssotok/core/types.h"
#include "ssotok/core/security.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Initialize the library (checks the CSPRNG is usable)
 * @return SSOTOK_SUCCESS or SSOTOK_ERROR_RANDOM_FAILED
 */
SSOTOK_API ssotok_error_t ssotok_init(void);

/**
 * @brief Release library state
 */
SSOTOK_API void ssotok_cleanup(void);

/**
 * @brief Library version string
 */
SSOTOK_API const char* ssotok_version(void);

/**
 * @brief Platform name
 */
SSOTOK_API const char* ssotok_platform(void);

#ifdef __cplusplus
}
#endif

#include "ssotok/utils/encoding.h"
#include "ssotok/crypto/digest.h"
#include "ssotok/crypto/aes_cbc.h"
#include "ssotok/token/key_deriver.h"
#include "ssotok/token/param_canonicalizer.h"
#include "ssotok/token/signer.h"
#include "ssotok/token/token_codec.h"

#ifdef __cplusplus
#include "ssotok/core/errors.h"
#include "ssotok/sso/sso_client.h"
#endif

/**
 * @example token_example.cpp
 * @code
 * #include "ssotok/ssotok.h"
 *
 * ssotok::AttributeMap attrs{{"uid", "42"}, {"email", "a@example.com"}};
 * ssotok::Token token = ssotok::encode(attrs, "shared-secret");
 *
 * ssotok::AttributeMap back = ssotok::decode(token, "shared-secret");
 * @endcode
 */

#endif // SSOTOK_H
