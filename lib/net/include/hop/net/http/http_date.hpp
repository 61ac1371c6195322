#pragma once

// C++ Standard Library
#include <chrono>
#include <optional>
#include <string_view>

namespace hop::net {

// Parse an HTTP-date (IMF-fixdate, RFC 850 or asctime form) as UTC.
[[nodiscard]] std::optional<std::chrono::system_clock::time_point> parse_http_date(std::string_view value);

} // namespace hop::net
