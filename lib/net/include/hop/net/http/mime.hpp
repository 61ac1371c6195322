/*
Module Name:
- mime.hpp

Abstract:
- Structured media type values (type, subtype, parameters) as found in
  Content-Type headers and used to build Accept headers.
- parse() is tolerant of spacing and quoting; type, subtype and parameter
  names are lower-cased, parameter values keep their case (charset aside).
- from_extension() resolves short file-name extensions ("json", "ttl") to
  their registered media type.
*/
#pragma once

// C++ Standard Library
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

// Project
#include <hop/net/http/error.hpp>

namespace hop::net::mime {

struct media_type {
    std::string type;    // e.g. "application"
    std::string subtype; // e.g. "json"
    std::vector<std::pair<std::string, std::string>> params; // in header order

    // "type/subtype" without parameters.
    [[nodiscard]] std::string essence() const {
        std::string out = type;
        out.push_back('/');
        out += subtype;
        return out;
    }

    // "type/subtype;k=v;..." (compact form used inside Accept).
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] std::optional<std::string_view> param(std::string_view name) const noexcept;

    // Lower-cased charset parameter, empty when absent.
    [[nodiscard]] std::string charset() const;

    [[nodiscard]] bool is_json_like() const {
        // application/json, application/*+json
        if (type == "application") {
            if (subtype == "json") return true;
            auto plus = subtype.rfind("+json");
            if (plus != std::string::npos && plus + 5 == subtype.size()) return true;
        }
        return false;
    }

    friend bool operator==(const media_type&, const media_type&) = default;
};

// Parse a Content-Type header (case-insensitive keys, tolerant spaces).
// Returns the media type on success; sets ec and returns nullopt on invalid input.
[[nodiscard]] std::optional<media_type> parse(std::string_view content_type,
                                              std::error_code& ec);

// Throwing variant for values supplied by callers (config, command line).
[[nodiscard]] media_type parse_or_throw(std::string_view content_type);

// Registered media type for a file-name extension (without the dot).
[[nodiscard]] std::optional<media_type> from_extension(std::string_view ext);

// Simple helpers
[[nodiscard]] inline bool is_json(std::string_view ct) {
    std::error_code ec;
    if (auto mt = parse(ct, ec)) return mt->is_json_like();
    return false;
}

} // namespace hop::net::mime
