/**
 * @file cmd_encode.cpp
 * @brief encode subcommand implementation for ssotok CLI
 *
 * Usage:
 *   ssotok encode -attr uid=42 -attr email=a@example.com -key shared-secret
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <iostream>
#include <string>

#include "ssotok/token/token_codec.h"
#include "ssotok/core/security.h"
#include "cli_utils.h"

using ssotok::cli::KeyOptions;
using ssotok::cli::split_assignment;

/**
 * @brief Print encode subcommand help
 */
void print_encode_help() {
    std::cout << "\nUsage: ssotok encode -attr <name=value> [-attr ...] [key option]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -attr <n=v>       Attribute to carry in the token (repeatable)\n";
    std::cout << ssotok::cli::key_options_help();
    std::cout << "  --help            Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  ssotok encode -attr uid=42 -attr role=admin -key shared-secret\n\n";
}

/**
 * @brief encode subcommand handler
 */
int cmd_encode(int argc, char* argv[]) {
    ssotok::AttributeMap attributes;
    KeyOptions key_options;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);

            if (arg == "-attr" && i + 1 < argc) {
                auto field = split_assignment(argv[++i]);
                if (!attributes.emplace(field.first, field.second).second) {
                    std::cerr << "Error: Duplicate attribute '" << field.first << "'\n";
                    return 1;
                }
            } else if (key_options.parse(argc, argv, i)) {
                continue;
            } else if (arg == "--help" || arg == "-h") {
                print_encode_help();
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_encode_help();
                return 1;
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (attributes.empty()) {
        std::cerr << "Error: At least one -attr is required\n";
        print_encode_help();
        return 1;
    }

    try {
        ssotok::SecretKey key = key_options.resolve();
        ssotok::Token token = ssotok::encode(attributes, key);
        ssotok::secure_wipe(key);
        std::cout << token << "\n";
    } catch (const ssotok::TokenError& e) {
        std::cerr << "Error: " << e.what() << " (" << ssotok_error_string(e.code()) << ")\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
