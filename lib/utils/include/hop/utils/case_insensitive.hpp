/*
Module Name:
- case_insensitive.hpp

Abstract:
- ASCII case-insensitive equality and ordering for string-like keys.
- Transparent comparators so maps keyed by std::string accept string_view and
  literal lookups without temporary allocations.
- Uses GSL Expects to guard against null char* which would be UB.
*/
#pragma once

// C++ Standard Library
#include <algorithm>
#include <concepts>
#include <string_view>
#include <type_traits>

// GSL
#include <gsl/gsl>

namespace hop::utils
{
    namespace detail
    {
        // Gates the null check only for char* inputs.
        template<class T>
        inline constexpr bool is_char_ptr_v =
            std::is_pointer_v<std::remove_cvref_t<T>> &&
            std::same_as<std::remove_cv_t<std::remove_pointer_t<std::remove_cvref_t<T>>>, char>;

        template<class S>
        std::string_view as_view(const S& s) noexcept
        {
            if constexpr (is_char_ptr_v<S>)
            {
                Expects(s != nullptr); // contract: char* must not be null
            }
            return std::string_view{ s };
        }
    } // namespace detail

    constexpr char ascii_lower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    constexpr bool iequals(std::string_view a, std::string_view b) noexcept
    {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return ascii_lower(x) == ascii_lower(y);
               });
    }

    struct CaseInsensitiveEq
    {
        using is_transparent = void;

        template<std::convertible_to<std::string_view> A, std::convertible_to<std::string_view> B>
        bool operator()(const A& a, const B& b) const noexcept
        {
            return iequals(detail::as_view(a), detail::as_view(b));
        }
    };

    struct CaseInsensitiveLess
    {
        using is_transparent = void; // opts in to heterogeneous lookup

        template<std::convertible_to<std::string_view> A, std::convertible_to<std::string_view> B>
        bool operator()(const A& a, const B& b) const noexcept
        {
            const auto x = detail::as_view(a);
            const auto y = detail::as_view(b);
            return std::lexicographical_compare(x.begin(), x.end(), y.begin(), y.end(), [](char l, char r) {
                return ascii_lower(l) < ascii_lower(r);
            });
        }
    };

} // namespace hop::utils
