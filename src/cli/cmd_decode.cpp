/**
 * @file cmd_decode.cpp
 * @brief decode subcommand implementation for ssotok CLI
 *
 * Usage:
 *   ssotok decode -token <base64> -key shared-secret
 *   ssotok decode -in token.txt -hexkey 736563726574
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <iostream>
#include <string>

#include "ssotok/token/token_codec.h"
#include "ssotok/core/security.h"
#include "ssotok/utils/encoding.h"
#include "cli_utils.h"

using ssotok::cli::KeyOptions;
using ssotok::cli::read_file;

/**
 * @brief Print decode subcommand help
 */
void print_decode_help() {
    std::cout << "\nUsage: ssotok decode (-token <token> | -in <file>) [key option]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -token <token>    Token text\n";
    std::cout << "  -in <file>        Read the token from a file\n";
    std::cout << ssotok::cli::key_options_help();
    std::cout << "  --help            Show this help message\n\n";
    std::cout << "Prints one name=value line per verified attribute.\n\n";
}

/**
 * @brief decode subcommand handler
 */
int cmd_decode(int argc, char* argv[]) {
    std::string token, input_file;
    KeyOptions key_options;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-token" && i + 1 < argc) {
            token = argv[++i];
        } else if (arg == "-in" && i + 1 < argc) {
            input_file = argv[++i];
        } else if (key_options.parse(argc, argv, i)) {
            continue;
        } else if (arg == "--help" || arg == "-h") {
            print_decode_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_decode_help();
            return 1;
        }
    }

    if (token.empty() == input_file.empty()) {
        std::cerr << "Error: Specify exactly one of -token or -in\n";
        print_decode_help();
        return 1;
    }

    try {
        if (!input_file.empty()) {
            token = ssotok::cli::chomp(ssotok::encoding::bytesToString(read_file(input_file)));
        }

        ssotok::SecretKey key = key_options.resolve();
        ssotok::AttributeMap attributes = ssotok::decode(token, key);
        ssotok::secure_wipe(key);

        for (const auto& field : attributes) {
            std::cout << field.first << "=" << field.second << "\n";
        }
    } catch (const ssotok::TokenError& e) {
        std::cerr << "Error: " << e.what() << " (" << ssotok_error_string(e.code()) << ")\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
