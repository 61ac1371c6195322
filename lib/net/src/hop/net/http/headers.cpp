// C++ Standard Library
#include <algorithm>
#include <cctype>

// Project
#include <hop/net/http/headers.hpp>
#include <hop/utils/attributes.hpp>

namespace hop::net
{

    namespace
    {
        constexpr bool is_ows(char c) noexcept
        {
            return c == ' ' || c == '\t';
        }

        // RFC 7230 tchar
        bool is_tchar(char c) noexcept
        {
            static constexpr std::string_view extra = "!#$%&'*+-.^_`|~";
            return std::isalnum(static_cast<unsigned char>(c)) || extra.find(c) != std::string_view::npos;
        }
    } // namespace

    std::optional<std::pair<std::string, std::string>> HeaderMap::parse_line(std::string_view line)
    {
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        const auto colon = line.find(':');
        if (HOP_UNLIKELY(colon == std::string_view::npos || colon == 0))
            return std::nullopt;

        const auto name = line.substr(0, colon);
        if (!std::all_of(name.begin(), name.end(), is_tchar))
            return std::nullopt;

        auto value = line.substr(colon + 1);
        while (!value.empty() && is_ows(value.front()))
            value.remove_prefix(1);
        while (!value.empty() && is_ows(value.back()))
            value.remove_suffix(1);

        std::string key;
        key.reserve(name.size());
        for (char c : name)
            key.push_back(utils::ascii_lower(c));
        return std::pair{ std::move(key), std::string{ value } };
    }

    HeaderMap HeaderMap::from_lines(std::span<const std::string> lines)
    {
        HeaderMap out;
        for (const auto& line : lines)
        {
            if (auto kv = parse_line(line))
                out.add(kv->first, std::move(kv->second));
        }
        return out;
    }

    void HeaderMap::add(std::string_view name, std::string value)
    {
        auto it = fields_.find(name);
        if (it == fields_.end())
        {
            std::string key;
            key.reserve(name.size());
            for (char c : name)
                key.push_back(utils::ascii_lower(c));
            it = fields_.emplace(std::move(key), values_type{}).first;
        }
        it->second.push_back(std::move(value));
    }

    const HeaderMap::values_type* HeaderMap::find(std::string_view name) const
    {
        const auto it = fields_.find(name);
        return it == fields_.end() ? nullptr : &it->second;
    }

    std::optional<std::string_view> HeaderMap::first(std::string_view name) const
    {
        const auto* values = find(name);
        if (!values || values->empty())
            return std::nullopt;
        return std::string_view{ values->front() };
    }

} // namespace hop::net
