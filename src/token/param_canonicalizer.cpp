/**
 * @file param_canonicalizer.cpp
 * @brief Canonical query-string rendering and parsing
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "ssotok/token/param_canonicalizer.h"
#include "ssotok/core/errors.h"
#include "ssotok/utils/encoding.h"

namespace ssotok {

namespace {

void append_field(std::string& out, const std::string& name, const std::string& value) {
    if (!out.empty()) {
        out += ParamCanonicalizer::FIELD_DELIMITER;
    }
    out += encoding::percentEncode(name);
    out += ParamCanonicalizer::VALUE_DELIMITER;
    out += encoding::percentEncode(value);
}

std::string decode_component(const std::string& text) {
    try {
        return encoding::percentDecode(text);
    } catch (const encoding::EncodingError& e) {
        throw MalformedCanonicalStringError(e.what());
    }
}

} // anonymous namespace

std::string ParamCanonicalizer::render(const AttributeMap& map) {
    std::string out;
    for (const auto& field : map) {
        append_field(out, field.first, field.second);
    }
    return out;
}

std::string ParamCanonicalizer::renderWith(const AttributeMap& map,
                                           const std::string& name,
                                           const std::string& value) {
    std::string out;
    bool inserted = false;
    for (const auto& field : map) {
        if (!inserted && name <= field.first) {
            append_field(out, name, value);
            inserted = true;
            if (name == field.first) {
                continue;
            }
        }
        append_field(out, field.first, field.second);
    }
    if (!inserted) {
        append_field(out, name, value);
    }
    return out;
}

std::string ParamCanonicalizer::renderWithout(const AttributeMap& map, const std::string& name) {
    std::string out;
    for (const auto& field : map) {
        if (field.first != name) {
            append_field(out, field.first, field.second);
        }
    }
    return out;
}

AttributeMap ParamCanonicalizer::parse(const std::string& canonical) {
    AttributeMap map;
    if (canonical.empty()) {
        return map;
    }

    size_t start = 0;
    while (start <= canonical.size()) {
        size_t end = canonical.find(FIELD_DELIMITER, start);
        if (end == std::string::npos) {
            end = canonical.size();
        }

        std::string segment = canonical.substr(start, end - start);
        if (segment.empty()) {
            throw MalformedCanonicalStringError("Empty field in canonical string");
        }

        size_t eq = segment.find(VALUE_DELIMITER);
        if (eq == std::string::npos) {
            throw MalformedCanonicalStringError("Field without '=' in canonical string");
        }

        std::string name = decode_component(segment.substr(0, eq));
        if (name.empty()) {
            throw MalformedCanonicalStringError("Empty field name in canonical string");
        }
        std::string value = decode_component(segment.substr(eq + 1));

        if (!map.emplace(std::move(name), std::move(value)).second) {
            throw MalformedCanonicalStringError("Duplicate field in canonical string");
        }

        start = end + 1;
    }
    return map;
}

} // namespace ssotok
