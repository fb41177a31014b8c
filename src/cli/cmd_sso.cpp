/**
 * @file cmd_sso.cpp
 * @brief sso subcommand implementation for ssotok CLI
 *
 * Usage:
 *   ssotok sso -client-id example -client-domain .example.com -hexkey <32 or 64 hex>
 *              -uid 1000 -login alice -email alice@example.com
 *              [-setting roles.grant=Moderator] [-pg-hexkey <hex>]
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "ssotok/sso/sso_client.h"
#include "ssotok/core/errors.h"
#include "cli_utils.h"

using ssotok::cli::split_assignment;

/**
 * @brief Print sso subcommand help
 */
void print_sso_help() {
    std::cout << "\nUsage: ssotok sso [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -client-id <id>        Community id (required)\n";
    std::cout << "  -client-domain <d>     Cookie domain, e.g. .example.com (required)\n";
    std::cout << "  -hexkey <hex>          128-bit or 256-bit SSO key in hex (required)\n";
    std::cout << "  -server-id <id>        Server id prefix (default: 34)\n";
    std::cout << "  -uid <id>              Unique user id (required)\n";
    std::cout << "  -login <name>          Login / screen name (required)\n";
    std::cout << "  -email <addr>          Email address (required)\n";
    std::cout << "  -setting <n=v>         Profile setting (repeatable)\n";
    std::cout << "  -user-agent <ua>       Request user agent\n";
    std::cout << "  -referer <url>         Request referer\n";
    std::cout << "  -remote-addr <ip>      Request remote address\n";
    std::cout << "  -pg-hexkey <hex>       PrivacyGuard key; encrypts the email field\n";
    std::cout << "  --help                 Show this help message\n\n";
}

/**
 * @brief sso subcommand handler
 */
int cmd_sso(int argc, char* argv[]) {
    ssotok::SsoConfig config;
    ssotok::sso::AuthRequest request;
    std::string hexkey, pg_hexkey;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);

            if (arg == "-client-id" && i + 1 < argc) {
                config.client_id = argv[++i];
            } else if (arg == "-client-domain" && i + 1 < argc) {
                config.client_domain = argv[++i];
            } else if (arg == "-hexkey" && i + 1 < argc) {
                hexkey = argv[++i];
            } else if (arg == "-server-id" && i + 1 < argc) {
                config.server_id = argv[++i];
            } else if (arg == "-uid" && i + 1 < argc) {
                request.unique_id = argv[++i];
            } else if (arg == "-login" && i + 1 < argc) {
                request.login = argv[++i];
            } else if (arg == "-email" && i + 1 < argc) {
                request.email = argv[++i];
            } else if (arg == "-setting" && i + 1 < argc) {
                auto setting = split_assignment(argv[++i]);
                request.settings[setting.first] = setting.second;
            } else if (arg == "-user-agent" && i + 1 < argc) {
                request.user_agent = argv[++i];
            } else if (arg == "-referer" && i + 1 < argc) {
                request.referer = argv[++i];
            } else if (arg == "-remote-addr" && i + 1 < argc) {
                request.remote_addr = argv[++i];
            } else if (arg == "-pg-hexkey" && i + 1 < argc) {
                pg_hexkey = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                print_sso_help();
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_sso_help();
                return 1;
            }
        }

        config.sso_key = ssotok::SsoClient::parseHexKey(hexkey, "SSO");
        ssotok::SsoClient client(std::move(config));

        if (!pg_hexkey.empty()) {
            client.initPrivacyGuard(pg_hexkey);
            request.email = client.privacyGuardField(request.email);
        }

        std::cout << client.authToken(request) << "\n";
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_sso_help();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
