/*
Module Name:
- headers.hpp

Abstract:
- Case-insensitive, multi-valued view of a reply's header section.
- from_lines() normalises raw "Name: value" lines: names lower-cased, values
  stripped of surrounding SP/HTAB, values of a repeated header kept in arrival
  order. Lines that do not parse (obsolete folding, missing colon, bad name)
  are dropped so one broken line never fails a request.
*/
#pragma once

// C++ Standard Library
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Project
#include <hop/utils/case_insensitive.hpp>

namespace hop::net
{

    class HeaderMap
    {
    public:
        using values_type = std::vector<std::string>;
        using map_type = std::map<std::string, values_type, utils::CaseInsensitiveLess>;
        using const_iterator = map_type::const_iterator;

        HeaderMap() = default;

        [[nodiscard]] static HeaderMap from_lines(std::span<const std::string> lines);

        // Split one raw line into (lower-cased name, stripped value).
        [[nodiscard]] static std::optional<std::pair<std::string, std::string>>
        parse_line(std::string_view line);

        void add(std::string_view name, std::string value);

        // All values for name, or nullptr.
        [[nodiscard]] const values_type* find(std::string_view name) const;

        [[nodiscard]] std::optional<std::string_view> first(std::string_view name) const;

        [[nodiscard]] bool contains(std::string_view name) const
        {
            return find(name) != nullptr;
        }

        [[nodiscard]] std::size_t size() const noexcept
        {
            return fields_.size();
        }
        [[nodiscard]] bool empty() const noexcept
        {
            return fields_.empty();
        }

        [[nodiscard]] const_iterator begin() const noexcept
        {
            return fields_.begin();
        }
        [[nodiscard]] const_iterator end() const noexcept
        {
            return fields_.end();
        }

    private:
        map_type fields_;
    };

} // namespace hop::net
