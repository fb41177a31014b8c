/**
 * @file param_canonicalizer.h
 * @brief Deterministic query-string form of an attribute map
 *
 * Format: key1=value1&key2=value2, keys in byte-wise order, keys and values
 * percent-encoded (RFC 3986 unreserved set kept, space as %20).
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SSOTOK_TOKEN_PARAM_CANONICALIZER_H
#define SSOTOK_TOKEN_PARAM_CANONICALIZER_H

#include "ssotok/core/types.h"
#include <string>

namespace ssotok {

class ParamCanonicalizer {
public:
    static constexpr char FIELD_DELIMITER = '&';
    static constexpr char VALUE_DELIMITER = '=';

    /**
     * @brief Render a map; equal maps always render to identical strings
     */
    static std::string render(const AttributeMap& map);

    /**
     * @brief Render a map plus one extra field, leaving the map untouched
     *
     * The extra field replaces an existing field of the same name.
     */
    static std::string renderWith(const AttributeMap& map,
                                  const std::string& name,
                                  const std::string& value);

    /**
     * @brief Render a map without one field
     */
    static std::string renderWithout(const AttributeMap& map, const std::string& name);

    /**
     * @brief Parse a canonical string back into a map
     *
     * An empty string parses to an empty map.
     *
     * @throws MalformedCanonicalStringError on an empty segment, a segment
     *         without '=', an empty key, a duplicate key or a bad escape
     */
    static AttributeMap parse(const std::string& canonical);
};

} // namespace ssotok

#endif // SSOTOK_TOKEN_PARAM_CANONICALIZER_H
