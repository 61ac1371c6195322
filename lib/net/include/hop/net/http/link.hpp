/*
Module Name:
- link.hpp

Abstract:
- Lookup of link relations in Link header values and of the file name in a
  Content-Disposition header.
- Repeated Link headers are joined with ';' before splitting on ',' into
  link-values; the first link-value whose rel parameter names the relation wins.
*/
#pragma once

// C++ Standard Library
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace hop::net {

// URI of the first link-value carrying rel=relation, as written in the header.
[[nodiscard]] std::optional<std::string> find_link(std::span<const std::string> link_values,
                                                   std::string_view relation);

// X of `attachment; filename="X"`.
[[nodiscard]] std::optional<std::string> disposition_filename(std::string_view content_disposition);

} // namespace hop::net
