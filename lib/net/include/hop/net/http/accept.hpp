/*
Module Name:
- accept.hpp

Abstract:
- Builds Accept header values from ranked media types.
- The i-th of N types (most preferred first, 1-indexed) is weighted q = i/N
  with three decimals, so weights are evenly spaced and strictly increasing.
- AcceptOption is what callers configure: nothing (send the any-type
  wildcard, k_accept_any), a file-name extension, one media type, or a
  ranked list.
*/
#pragma once

// C++ Standard Library
#include <span>
#include <string>
#include <variant>
#include <vector>

// Project
#include <hop/net/http/mime.hpp>

namespace hop::net {

struct Extension {
    std::string name; // e.g. "json"
};

using AcceptOption =
    std::variant<std::monostate, Extension, mime::media_type, std::vector<mime::media_type>>;

inline constexpr std::string_view k_accept_any = "*/*";

// Throws HttpError(empty_accept) for an empty list.
[[nodiscard]] std::string accept_value(std::span<const mime::media_type> ranked);

// Throws HttpError(unknown_extension) for an unregistered extension.
[[nodiscard]] std::string accept_value(const AcceptOption& option);

} // namespace hop::net
