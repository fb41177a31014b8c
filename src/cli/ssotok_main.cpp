/**
 * @file ssotok_main.cpp
 * @brief ssotok Command-Line Interface - Main Entry Point
 *
 * Usage:
 *   ssotok <command> [options]
 *
 * Commands:
 *   encode       Sign and encrypt attributes into a token
 *   decode       Decrypt and verify a token
 *   sso          Issue an SSO authentication token
 *   derive       Show the AES key derived from a shared secret
 *   version      Display version information
 *   help         Show help message
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <iostream>
#include <string>
#include <algorithm>
#include <cctype>

#include "ssotok/ssotok.h"

// Subcommand handlers (forward declarations)
int cmd_encode(int argc, char* argv[]);
int cmd_decode(int argc, char* argv[]);
int cmd_sso(int argc, char* argv[]);
int cmd_derive(int argc, char* argv[]);
void cmd_version();
void cmd_help();

/**
 * @brief Print general usage information
 */
void print_usage() {
    std::cout << "\nUsage: ssotok <command> [options]\n\n";
    std::cout << "Available Commands:\n";
    std::cout << "  encode       Sign and encrypt name=value attributes into a token\n";
    std::cout << "  decode       Decrypt a token and verify its signature\n";
    std::cout << "  sso          Issue an SSO authentication token\n";
    std::cout << "  derive       Print the AES-256 key derived from a shared secret\n";
    std::cout << "  version      Display version and build information\n";
    std::cout << "  help         Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  ssotok encode -attr uid=42 -key shared-secret\n";
    std::cout << "  ssotok decode -token <token> -key shared-secret\n";
    std::cout << "  SSOTOK_SECRET_KEY=shared-secret ssotok derive\n\n";
    std::cout << "For command-specific help, use: ssotok <command> --help\n\n";
}

/**
 * @brief Display version information
 */
void cmd_version() {
    std::cout << "\n";
    std::cout << SSOTOK_LIBRARY_NAME << " - " << SSOTOK_DESCRIPTION << "\n";
    std::cout << "\n";
    std::cout << "Version:      " << ssotok_version() << "\n";
    std::cout << "Release Date: " << SSOTOK_RELEASE_DATE << "\n";
    std::cout << "Build Type:   " << SSOTOK_BUILD_TYPE << "\n";
    std::cout << "Platform:     " << ssotok_platform() << "\n";
    std::cout << "SSO Protocol: " << SSOTOK_SSO_PROTOCOL_VERSION << "\n";
    std::cout << "License:      Apache License 2.0\n";
    std::cout << "\n";
    std::cout << "Token Format:\n";
    std::cout << "  - Base64(IV || AES-256-CBC(PKCS#7(canonical string)))\n";
    std::cout << "  - MD5 keyed signature in the \"" << SSOTOK_SIGNATURE_FIELD << "\" field\n";
    std::cout << "\n";
    std::cout << "Dependencies:\n";
    std::cout << "  - OpenSSL libcrypto (MD5, AES-256-CBC)\n";
    std::cout << "\n";
}

/**
 * @brief Display help message (alias for print_usage)
 */
void cmd_help() {
    print_usage();
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    // No arguments - print help
    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command(argv[1]);
    std::transform(command.begin(), command.end(), command.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (command == "version" || command == "-v" || command == "--version") {
        cmd_version();
        return 0;
    }
    if (command == "help" || command == "-h" || command == "--help") {
        cmd_help();
        return 0;
    }

    if (ssotok_init() != SSOTOK_SUCCESS) {
        std::cerr << "Error: " << ssotok_error_string(SSOTOK_ERROR_RANDOM_FAILED) << "\n";
        return 1;
    }

    int rc;
    if (command == "encode") {
        rc = cmd_encode(argc - 1, argv + 1);
    }
    else if (command == "decode") {
        rc = cmd_decode(argc - 1, argv + 1);
    }
    else if (command == "sso") {
        rc = cmd_sso(argc - 1, argv + 1);
    }
    else if (command == "derive") {
        rc = cmd_derive(argc - 1, argv + 1);
    }
    else {
        std::cerr << "\nError: Unknown command '" << command << "'\n";
        print_usage();
        rc = 1;
    }

    ssotok_cleanup();
    return rc;
}
