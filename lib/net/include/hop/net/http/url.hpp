/*
Module Name:
- url.hpp

Abstract:
- URL parse, serialise and reference-resolution helpers for the request engine.
- resolve_url follows RFC 3986 section 5.2: absolute, scheme-relative,
  absolute-path, query-only, fragment-only and relative-path references, with
  dot-segment removal on the merged path.
- Query is stored with a leading '?' and fragment with a leading '#' so
  target() and to_string() can concatenate cheaply.
*/
#pragma once

// C++ Standard Library
#include <string>
#include <string_view>
#include <utility>

// Project
#include <hop/net/http/error.hpp>
#include <hop/utils/case_insensitive.hpp>

namespace hop::net
{

    struct Url
    {
        std::string scheme; // lower-cased
        std::string host;
        std::string port; // empty when the URL carries none
        std::string path;
        std::string query; // includes leading '?' when present
        std::string fragment; // includes leading '#' when present

        [[nodiscard]] bool is_absolute() const noexcept
        {
            return !scheme.empty();
        }

        [[nodiscard]] bool is_https() const noexcept
        {
            return scheme == "https";
        }

        [[nodiscard]] std::string authority() const
        {
            std::string out = host;
            if (!port.empty())
            {
                out.push_back(':');
                out += port;
            }
            return out;
        }

        // Request target: path plus query, never empty.
        [[nodiscard]] std::string target() const
        {
            std::string out = path.empty() ? std::string{ "/" } : path;
            out += query;
            return out;
        }

        [[nodiscard]] std::string to_string() const
        {
            std::string out;
            if (!scheme.empty())
            {
                out += scheme;
                out += "://";
                out += authority();
            }
            out += path;
            out += query;
            out += fragment;
            return out;
        }

        // Port to connect to: explicit port or the scheme default.
        [[nodiscard]] std::string effective_port() const
        {
            if (!port.empty())
                return port;
            if (scheme == "https")
                return "443";
            if (scheme == "http")
                return "80";
            return {};
        }
    };

    namespace detail
    {
        // RFC 3986 5.2.4.
        inline std::string remove_dot_segments(std::string_view in)
        {
            std::string out;
            out.reserve(in.size());
            while (!in.empty())
            {
                if (in.starts_with("../"))
                {
                    in.remove_prefix(3);
                }
                else if (in.starts_with("./"))
                {
                    in.remove_prefix(2);
                }
                else if (in.starts_with("/./"))
                {
                    in.remove_prefix(2);
                }
                else if (in == "/.")
                {
                    in = "/";
                }
                else if (in.starts_with("/../") || in == "/..")
                {
                    in = in.size() == 3 ? std::string_view{ "/" } : in.substr(3);
                    const auto slash = out.rfind('/');
                    out.resize(slash == std::string::npos ? 0 : slash);
                }
                else if (in == "." || in == "..")
                {
                    in = {};
                }
                else
                {
                    const auto next = in.find('/', 1);
                    const auto seg = in.substr(0, next);
                    out.append(seg);
                    in.remove_prefix(seg.size());
                }
            }
            return out;
        }

        // Split path / query / fragment off the tail of a reference.
        inline void split_tail(std::string_view s, Url& u)
        {
            if (const auto hash = s.find('#'); hash != std::string_view::npos)
            {
                u.fragment.assign(s.substr(hash));
                s = s.substr(0, hash);
            }
            if (const auto q = s.find('?'); q != std::string_view::npos)
            {
                u.query.assign(s.substr(q));
                s = s.substr(0, q);
            }
            u.path.assign(s);
        }
    } // namespace detail

    // Parse an absolute URL or a reference. Throws HttpError(invalid_uri) when a
    // scheme is present without an authority.
    inline Url parse_url(std::string_view s)
    {
        Url u;

        // scheme "://"
        const auto pos = s.find("://");
        if (pos != std::string_view::npos && s.find_first_of("/?#") > pos)
        {
            u.scheme.reserve(pos);
            for (char c : s.substr(0, pos))
                u.scheme.push_back(utils::ascii_lower(c));
            s.remove_prefix(pos + 3);

            const auto end = s.find_first_of("/?#");
            const std::string_view auth = s.substr(0, end);
            s = (end == std::string_view::npos) ? std::string_view{} : s.substr(end);

            // split host[:port] using last ':', leaving IPv6 literals intact
            const auto colon = auth.rfind(':');
            if (colon != std::string_view::npos && auth.find(']', colon) == std::string_view::npos)
            {
                u.host.assign(auth.substr(0, colon));
                u.port.assign(auth.substr(colon + 1));
            }
            else
            {
                u.host.assign(auth);
            }
            if (u.host.empty())
                throw HttpError{ errc::invalid_uri, "missing host in URI" };

            detail::split_tail(s, u);
            if (u.path.empty())
                u.path = "/";
            return u;
        }

        detail::split_tail(s, u);
        return u;
    }

    inline Url resolve_url(const Url& base, std::string_view location)
    {
        const Url ref = parse_url(location);

        // absolute
        if (ref.is_absolute())
        {
            Url out = ref;
            out.path = detail::remove_dot_segments(out.path);
            return out;
        }

        // scheme-relative: "//host/..."
        if (location.starts_with("//"))
        {
            return parse_url(base.scheme + ":" + std::string{ location });
        }

        Url out = base;
        out.fragment = ref.fragment;

        if (ref.path.empty())
        {
            // query-only or fragment-only reference keeps the base path
            if (!ref.query.empty())
                out.query = ref.query;
            return out;
        }

        out.query = ref.query;

        // absolute-path
        if (ref.path.front() == '/')
        {
            out.path = detail::remove_dot_segments(ref.path);
            return out;
        }

        // relative-path: merge with everything up to the last '/' of the base
        std::string merged;
        const auto last_slash = base.path.rfind('/');
        if (last_slash == std::string::npos)
            merged = "/";
        else
            merged = base.path.substr(0, last_slash + 1);
        merged += ref.path;
        out.path = detail::remove_dot_segments(merged);
        if (out.path.empty() || out.path.front() != '/')
            out.path.insert(out.path.begin(), '/');
        return out;
    }

    // Resolve a reference against a base URI given as text.
    inline std::string resolve_uri(std::string_view base, std::string_view location)
    {
        return resolve_url(parse_url(base), location).to_string();
    }

} // namespace hop::net
