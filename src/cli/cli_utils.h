/**
 * @file cli_utils.h
 * @brief Common utility functions for ssotok CLI commands
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef SSOTOK_CLI_UTILS_H
#define SSOTOK_CLI_UTILS_H

#include "ssotok/core/types.h"
#include "ssotok/utils/encoding.h"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace ssotok {
namespace cli {

/** Environment variable consulted when no key option is given */
constexpr const char* SECRET_KEY_ENV = "SSOTOK_SECRET_KEY";

/**
 * @brief Read file into byte vector
 */
inline ByteVec read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open input file: " + filename);
    }
    return ByteVec(
        std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>()
    );
}

/**
 * @brief Drop trailing CR/LF, as left by editors and `echo`
 */
inline std::string chomp(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

/**
 * @brief Split "name=value" at the first '='
 */
inline std::pair<std::string, std::string> split_assignment(const std::string& arg) {
    size_t eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw std::invalid_argument("Expected name=value, got '" + arg + "'");
    }
    return {arg.substr(0, eq), arg.substr(eq + 1)};
}

/**
 * @brief Secret key sources, in order of precedence
 */
struct KeyOptions {
    std::string key;       // -key <text>
    std::string hexkey;    // -hexkey <hex>
    std::string keyfile;   // -keyfile <path>

    /**
     * @brief Consume a key option at argv[i]
     * @return true if argv[i] was a key option (i then points at its value)
     */
    bool parse(int argc, char* argv[], int& i) {
        std::string arg(argv[i]);
        if (i + 1 >= argc) {
            return false;
        }
        if (arg == "-key") {
            key = argv[++i];
        } else if (arg == "-hexkey") {
            hexkey = argv[++i];
        } else if (arg == "-keyfile") {
            keyfile = argv[++i];
        } else {
            return false;
        }
        return true;
    }

    /**
     * @brief Resolve the secret key
     * @throws std::runtime_error when no source yields a key
     */
    ByteVec resolve() const {
        if (!key.empty()) {
            return encoding::stringToBytes(key);
        }
        if (!hexkey.empty()) {
            return encoding::hexDecode(hexkey);
        }
        if (!keyfile.empty()) {
            ByteVec bytes = read_file(keyfile);
            while (!bytes.empty() && (bytes.back() == '\n' || bytes.back() == '\r')) {
                bytes.pop_back();
            }
            return bytes;
        }
        const char* env = std::getenv(SECRET_KEY_ENV);
        if (env != nullptr && *env != '\0') {
            return encoding::stringToBytes(env);
        }
        throw std::runtime_error(std::string("Missing secret key (-key, -hexkey, -keyfile or ") +
                                 SECRET_KEY_ENV + ")");
    }
};

inline const char* key_options_help() {
    return "  -key <text>       Shared secret as text\n"
           "  -hexkey <hex>     Shared secret as hex\n"
           "  -keyfile <file>   Read the shared secret from a file\n"
           "                    (default: $SSOTOK_SECRET_KEY)\n";
}

} // namespace cli
} // namespace ssotok

#endif // SSOTOK_CLI_UTILS_H
