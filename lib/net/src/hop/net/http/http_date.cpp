// C++ Standard Library
#include <array>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <string>

// Project
#include <hop/net/http/http_date.hpp>

namespace hop::net {

namespace {
    std::time_t utc_to_time_t(std::tm& tm)
    {
#if defined(_WIN32)
        return ::_mkgmtime(&tm);
#else
        return ::timegm(&tm);
#endif
    }

    // Preferred form first.
    constexpr std::array<const char*, 3> k_formats{
        "%a, %d %b %Y %H:%M:%S", // Sun, 06 Nov 1994 08:49:37 GMT
        "%A, %d-%b-%y %H:%M:%S", // Sunday, 06-Nov-94 08:49:37 GMT
        "%a %b %d %H:%M:%S %Y",  // Sun Nov  6 08:49:37 1994
    };
} // namespace

std::optional<std::chrono::system_clock::time_point> parse_http_date(std::string_view value)
{
    for (const char* fmt : k_formats) {
        std::tm tm{};
        std::istringstream in{std::string{value}};
        in.imbue(std::locale::classic());
        in >> std::get_time(&tm, fmt);
        if (in.fail()) continue;

        const auto t = utc_to_time_t(tm);
        if (t == static_cast<std::time_t>(-1)) continue;
        return std::chrono::system_clock::from_time_t(t);
    }
    return std::nullopt;
}

} // namespace hop::net
