/**
 * @file cmd_derive.cpp
 * @brief derive subcommand implementation for ssotok CLI
 *
 * Prints the AES-256 key a shared secret expands to, for comparing
 * configurations across deployments.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <iostream>
#include <string>

#include "ssotok/token/key_deriver.h"
#include "ssotok/core/errors.h"
#include "ssotok/core/security.h"
#include "ssotok/utils/encoding.h"
#include "cli_utils.h"

void print_derive_help() {
    std::cout << "\nUsage: ssotok derive [key option]\n\n";
    std::cout << "Options:\n";
    std::cout << ssotok::cli::key_options_help();
    std::cout << "  --help            Show this help message\n\n";
}

int cmd_derive(int argc, char* argv[]) {
    ssotok::cli::KeyOptions key_options;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (key_options.parse(argc, argv, i)) {
            continue;
        } else if (arg == "--help" || arg == "-h") {
            print_derive_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_derive_help();
            return 1;
        }
    }

    try {
        ssotok::SecretKey secret = key_options.resolve();
        ssotok::DerivedKey key = ssotok::KeyDeriver::derive(secret);
        std::cout << ssotok::encoding::hexEncode(key.data(), key.size()) << "\n";
        ssotok::secure_wipe(key);
        ssotok::secure_wipe(secret);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
