/**
 * @file sso_client.cpp
 * @brief SSO authentication tokens and PrivacyGuard fields
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "ssotok/sso/sso_client.h"
#include "ssotok/token/signer.h"
#include "ssotok/core/security.h"
#include "ssotok/utils/encoding.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <set>
#include <stdexcept>
#include <utility>

namespace ssotok {
namespace sso {

namespace {

const char* const FIELD_VERSION = "version";
const char* const FIELD_SERVER_ID = "server_id";
const char* const FIELD_TSID = "tsid";
const char* const FIELD_TIMESTAMP = "timestamp";
const char* const FIELD_USER_AGENT = "req_user_agent";
const char* const FIELD_REFERER = "req_referer";
const char* const FIELD_REMOTE_ADDR = "req_remote_addr";
const char* const FIELD_CLIENT_DOMAIN = "client_domain";
const char* const FIELD_CLIENT_ID = "client_id";
const char* const FIELD_UNIQUE_ID = "unique_id";
const char* const FIELD_LOGIN = "login";
const char* const FIELD_EMAIL = "email";

const char* const PG_FIELD_VALUE = "value";

const char* const STANDARD_FIELDS[] = {
    FIELD_VERSION, FIELD_SERVER_ID, FIELD_TSID, FIELD_TIMESTAMP,
    FIELD_USER_AGENT, FIELD_REFERER, FIELD_REMOTE_ADDR,
    FIELD_CLIENT_DOMAIN, FIELD_CLIENT_ID,
    FIELD_UNIQUE_ID, FIELD_LOGIN, FIELD_EMAIL,
};

constexpr size_t SERVER_ID_RANDOM_BYTES = 16;

bool is_standard_field(const std::string& name) {
    for (const char* field : STANDARD_FIELDS) {
        if (name == field) return true;
    }
    return name == Signer::FIELD;
}

std::string trim(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(s.begin(), s.end(), not_space);
    auto last = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return first < last ? std::string(first, last) : std::string();
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// Whole seconds, expressed in milliseconds
int64_t whole_seconds_ms(int64_t ms) {
    return (ms / 1000) * 1000;
}

const std::string& request_value(const std::string& value) {
    static const std::string empty_value(SsoClient::EMPTY_REQUEST_VALUE);
    return value.empty() ? empty_value : value;
}

std::string take(AttributeMap& fields, const char* name) {
    auto it = fields.find(name);
    if (it == fields.end()) {
        return std::string();
    }
    std::string value = std::move(it->second);
    fields.erase(it);
    return value;
}

std::string take_request_value(AttributeMap& fields, const char* name) {
    std::string value = take(fields, name);
    return value == SsoClient::EMPTY_REQUEST_VALUE ? std::string() : value;
}

} // anonymous namespace

SsoClient::SsoClient(SsoConfig config, Clock clock)
    : client_id_(std::move(config.client_id)),
      client_domain_(std::move(config.client_domain)),
      sso_key_(std::move(config.sso_key)),
      clock_(std::move(clock)),
      tsid_(0),
      auth_codec_(std::set<std::string>{FIELD_UNIQUE_ID, FIELD_LOGIN, FIELD_EMAIL}),
      pg_codec_(std::set<std::string>{PG_FIELD_VALUE}) {
    if (client_id_.empty()) {
        throw std::invalid_argument("Could not initialize SSO client: Client id required");
    }
    if (client_domain_.empty()) {
        throw std::invalid_argument("Could not initialize SSO client: Client domain required");
    }
    if (!clock_) {
        throw std::invalid_argument("Could not initialize SSO client: Clock required");
    }
    checkKeyLength(sso_key_, "SSO");

    server_id_ = makeServerId(config.server_id);
    tsid_.store(whole_seconds_ms(clock_()));
}

SsoClient::~SsoClient() {
    secure_wipe(sso_key_);
    secure_wipe(pg_key_);
}

SsoClient::Clock SsoClient::systemClock() {
    return []() -> int64_t {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    };
}

void SsoClient::checkKeyLength(const ByteVec& key, const std::string& label) {
    if (key.empty()) {
        throw std::invalid_argument(label + " hex key required");
    }
    if (key.size() != 16 && key.size() != 32) {
        throw std::invalid_argument(label + " key must be 128-bit or 256-bit in length");
    }
}

ByteVec SsoClient::parseHexKey(const std::string& hex, const std::string& label) {
    if (hex.empty()) {
        throw std::invalid_argument(label + " hex key required");
    }
    ByteVec key;
    try {
        key = encoding::hexDecode(hex);
    } catch (const encoding::EncodingError& e) {
        throw std::invalid_argument(label + " key is not valid hex: " + e.what());
    }
    checkKeyLength(key, label);
    return key;
}

std::string SsoClient::makeServerId(const std::string& configured) {
    std::string prefix = trim(configured);
    if (prefix.empty()) {
        prefix = DEFAULT_SERVER_ID;
    }
    ByteVec random = randomBytes(SERVER_ID_RANDOM_BYTES);
    return prefix + "-" + to_upper(encoding::hexEncode(random));
}

Token SsoClient::authToken(const AuthRequest& request) {
    if (request.unique_id.empty()) {
        throw std::invalid_argument("Could not create SSO token: Unique id required");
    }
    if (request.login.empty()) {
        throw std::invalid_argument("Could not create SSO token: Login name required");
    }
    if (request.email.empty()) {
        throw std::invalid_argument("Could not create SSO token: Email address required");
    }
    for (const auto& setting : request.settings) {
        if (setting.first.empty()) {
            throw std::invalid_argument("Could not create SSO token: Setting name required");
        }
        if (is_standard_field(setting.first)) {
            throw std::invalid_argument("Could not create SSO token: Setting '" +
                                        setting.first + "' collides with a standard field");
        }
    }

    int64_t tsid = ++tsid_;
    int64_t timestamp = whole_seconds_ms(clock_());

    AttributeMap fields(request.settings.begin(), request.settings.end());
    fields[FIELD_VERSION] = PROTOCOL_VERSION;
    fields[FIELD_SERVER_ID] = server_id_;
    fields[FIELD_TSID] = std::to_string(tsid);
    fields[FIELD_TIMESTAMP] = std::to_string(timestamp);
    fields[FIELD_USER_AGENT] = request_value(request.user_agent);
    fields[FIELD_REFERER] = request_value(request.referer);
    fields[FIELD_REMOTE_ADDR] = request_value(request.remote_addr);
    fields[FIELD_CLIENT_DOMAIN] = client_domain_;
    fields[FIELD_CLIENT_ID] = client_id_;
    fields[FIELD_UNIQUE_ID] = request.unique_id;
    fields[FIELD_LOGIN] = request.login;
    fields[FIELD_EMAIL] = request.email;

    return auth_codec_.encode(fields, sso_key_);
}

AuthToken SsoClient::decodeAuthToken(const Token& token) const {
    AttributeMap fields = auth_codec_.decode(token, sso_key_);

    AuthToken auth;
    auth.version = take(fields, FIELD_VERSION);
    auth.server_id = take(fields, FIELD_SERVER_ID);
    auth.tsid = take(fields, FIELD_TSID);
    auth.timestamp = take(fields, FIELD_TIMESTAMP);
    auth.req_user_agent = take_request_value(fields, FIELD_USER_AGENT);
    auth.req_referer = take_request_value(fields, FIELD_REFERER);
    auth.req_remote_addr = take_request_value(fields, FIELD_REMOTE_ADDR);
    auth.client_domain = take(fields, FIELD_CLIENT_DOMAIN);
    auth.client_id = take(fields, FIELD_CLIENT_ID);
    auth.unique_id = take(fields, FIELD_UNIQUE_ID);
    auth.login = take(fields, FIELD_LOGIN);
    auth.email = take(fields, FIELD_EMAIL);
    auth.settings = std::move(fields);
    return auth;
}

void SsoClient::initPrivacyGuard(const std::string& hex_key) {
    ByteVec key = parseHexKey(hex_key, "PG");
    secure_wipe(pg_key_);
    pg_key_ = std::move(key);
}

Token SsoClient::privacyGuardField(const std::string& value) const {
    if (pg_key_.empty()) {
        return Token();
    }
    return pg_codec_.encode(AttributeMap{{PG_FIELD_VALUE, value}}, pg_key_);
}

std::string SsoClient::revealPrivacyGuardField(const Token& token) const {
    if (pg_key_.empty()) {
        throw std::logic_error("PrivacyGuard key not initialized");
    }
    AttributeMap fields = pg_codec_.decode(token, pg_key_);
    return fields[PG_FIELD_VALUE];
}

} // namespace sso
} // namespace ssotok
