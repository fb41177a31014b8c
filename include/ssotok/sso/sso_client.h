/**
 * @file sso_client.h
 * @brief Partner-side issuing of SSO authentication tokens
 *
 * An SsoClient holds the community identity and the shared SSO key, and turns
 * a user identity into a token understood by the SSO endpoint. The optional
 * PrivacyGuard key encrypts single values (typically the email address) with
 * a key that is never shared with the endpoint.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SSOTOK_SSO_SSO_CLIENT_H
#define SSOTOK_SSO_SSO_CLIENT_H

#include "ssotok/core/types.h"
#include "ssotok/token/token_codec.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace ssotok {
namespace sso {

/**
 * @brief Static client configuration
 */
struct SsoConfig {
    std::string client_id;       ///< Community id
    std::string client_domain;   ///< Cookie domain, e.g. ".example.com"
    ByteVec sso_key;             ///< 128-bit or 256-bit shared key
    std::string server_id;       ///< Optional; "34" when blank
};

/**
 * @brief One user login to turn into a token
 */
struct AuthRequest {
    std::string unique_id;
    std::string login;
    std::string email;
    std::map<std::string, std::string> settings;  ///< Profile settings, e.g. roles.grant
    std::string user_agent;
    std::string referer;
    std::string remote_addr;
};

/**
 * @brief Decoded contents of an SSO authentication token
 */
struct AuthToken {
    std::string version;
    std::string server_id;
    std::string tsid;
    std::string timestamp;
    std::string req_user_agent;
    std::string req_referer;
    std::string req_remote_addr;
    std::string client_domain;
    std::string client_id;
    std::string unique_id;
    std::string login;
    std::string email;
    std::map<std::string, std::string> settings;
};

class SsoClient {
public:
    /// Milliseconds since the Unix epoch
    using Clock = std::function<int64_t()>;

    static constexpr const char* DEFAULT_SERVER_ID = "34";
    static constexpr const char* PROTOCOL_VERSION = "SSOv1.5";
    static constexpr const char* EMPTY_REQUEST_VALUE = " ";

    /**
     * @throws std::invalid_argument on an empty client id, an empty client
     *         domain or a key that is not 16 or 32 bytes long
     */
    explicit SsoClient(SsoConfig config, Clock clock = systemClock());
    ~SsoClient();

    SsoClient(const SsoClient&) = delete;
    SsoClient& operator=(const SsoClient&) = delete;

    /**
     * @brief Build an authentication token for one login
     * @throws std::invalid_argument on a missing unique id, login or email, or a
     *         setting that collides with a standard field
     */
    Token authToken(const AuthRequest& request);

    /**
     * @brief Decrypt and verify an authentication token issued under this key
     * @throws TokenError subclasses on any decoding failure
     */
    AuthToken decodeAuthToken(const Token& token) const;

    /**
     * @brief Set the PrivacyGuard key from hex
     * @throws std::invalid_argument if the key is missing or of the wrong length
     */
    void initPrivacyGuard(const std::string& hex_key);

    bool hasPrivacyGuard() const noexcept { return !pg_key_.empty(); }

    /**
     * @brief Encrypt one value under the PrivacyGuard key
     * @return The encrypted token, or an empty string when no PrivacyGuard key is set
     */
    Token privacyGuardField(const std::string& value) const;

    /**
     * @brief Recover a value produced by privacyGuardField()
     * @throws std::logic_error when no PrivacyGuard key is set
     */
    std::string revealPrivacyGuardField(const Token& token) const;

    const std::string& clientId() const noexcept { return client_id_; }
    const std::string& clientDomain() const noexcept { return client_domain_; }
    const std::string& serverId() const noexcept { return server_id_; }
    int64_t lastTsid() const noexcept { return tsid_.load(); }

    /**
     * @brief Decode a hex key and check it is 128-bit or 256-bit
     *
     * Plain hex digits only; a 0x prefix is rejected.
     * @param label Prefix of the error message, e.g. "SSO" or "PG"
     * @throws std::invalid_argument
     */
    static ByteVec parseHexKey(const std::string& hex, const std::string& label);

    static Clock systemClock();

private:
    static std::string makeServerId(const std::string& configured);
    static void checkKeyLength(const ByteVec& key, const std::string& label);

    std::string client_id_;
    std::string client_domain_;
    std::string server_id_;
    ByteVec sso_key_;
    ByteVec pg_key_;
    Clock clock_;
    std::atomic<int64_t> tsid_;
    TokenCodec auth_codec_;
    TokenCodec pg_codec_;
};

} // namespace sso

using sso::SsoClient;
using sso::SsoConfig;

} // namespace ssotok

#endif // SSOTOK_SSO_SSO_CLIENT_H
