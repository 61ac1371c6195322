/*
Module Name:
- error.hpp

Abstract:
- Defines hop::net error codes and a std::error_category so callers can use
  std::error_code with the request engine. Provides make_error_code and enables
  implicit conversion via is_error_code_enum.
- Fatal engine conditions are thrown as HttpError (a std::system_error). The
  subclasses carry the context needed to log or display the failure without
  re-deriving it: the visited chain, the failing status and body, or the URI.
*/
#pragma once

// C++ Standard Library
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace hop::net
{

    enum class errc
    {
        redirect_loop = 1,
        max_redirects,
        cyclic_link_header,
        invalid_status,
        status_failure,
        missing_location,
        unknown_extension,
        empty_accept,
        unexpected_status,
        decompression_failure,
        invalid_content_type,
        invalid_uri,
        unsupported_scheme,
    };

    // Category for hop::net errors.
    struct error_category_impl final : std::error_category
    {
        const char* name() const noexcept override
        {
            return "hop.net";
        }
        std::string message(int ev) const override
        {
            switch (static_cast<errc>(ev))
            {
            case errc::redirect_loop:
                return "redirect loop";
            case errc::max_redirects:
                return "maximum number of redirects exceeded";
            case errc::cyclic_link_header:
                return "cyclic link header";
            case errc::invalid_status:
                return "invalid HTTP status code";
            case errc::status_failure:
                return "HTTP failure status";
            case errc::missing_location:
                return "redirect response missing Location header";
            case errc::unknown_extension:
                return "no media type registered for extension";
            case errc::empty_accept:
                return "empty list of acceptable media types";
            case errc::unexpected_status:
                return "status code not resolved before status policy";
            case errc::decompression_failure:
                return "decompression failure";
            case errc::invalid_content_type:
                return "invalid content-type";
            case errc::invalid_uri:
                return "invalid URI";
            case errc::unsupported_scheme:
                return "unsupported URI scheme";
            }
            return "unknown hop.net error";
        }
    };

    inline const std::error_category& error_category()
    {
        static error_category_impl cat;
        return cat;
    }

    inline std::error_code make_error_code(errc e) noexcept
    {
        return { static_cast<int>(e), error_category() };
    }

    /// Base of every fatal engine condition.
    class HttpError : public std::system_error
    {
    public:
        HttpError(errc e, const std::string& what_arg) :
            std::system_error{ make_error_code(e), what_arg }
        {
        }
    };

    /// Redirect loop or hop cap reached. chain() is oldest first and ends with
    /// the target that tripped the check.
    class RedirectError final : public HttpError
    {
    public:
        RedirectError(errc e, std::vector<std::string> chain);

        [[nodiscard]] const std::vector<std::string>& chain() const noexcept
        {
            return chain_;
        }

    private:
        std::vector<std::string> chain_;
    };

    /// Failure status (400-599) that was not the caller's designated failure code.
    class StatusError final : public HttpError
    {
    public:
        StatusError(int status, std::string content, std::string final_uri);

        [[nodiscard]] int status() const noexcept
        {
            return status_;
        }
        /// First bytes of the reply body (bounded).
        [[nodiscard]] const std::string& content() const noexcept
        {
            return content_;
        }
        [[nodiscard]] const std::string& final_uri() const noexcept
        {
            return final_uri_;
        }

    private:
        int status_;
        std::string content_;
        std::string final_uri_;
    };

    /// A page's Link header advertised itself as the next page.
    class LinkCycleError final : public HttpError
    {
    public:
        explicit LinkCycleError(std::string uri) :
            HttpError{ errc::cyclic_link_header, "cyclic link header: " + uri }, uri_{ std::move(uri) }
        {
        }

        [[nodiscard]] const std::string& uri() const noexcept
        {
            return uri_;
        }

    private:
        std::string uri_;
    };

    namespace detail
    {
        inline std::string join_chain(const std::vector<std::string>& chain)
        {
            std::string out;
            for (const auto& uri : chain)
            {
                if (!out.empty())
                    out += " -> ";
                out += uri;
            }
            return out;
        }
    } // namespace detail

    inline RedirectError::RedirectError(errc e, std::vector<std::string> chain) :
        HttpError{ e, make_error_code(e).message() + ": " + detail::join_chain(chain) }, chain_{ std::move(chain) }
    {
    }

    inline StatusError::StatusError(int status, std::string content, std::string final_uri) :
        HttpError{ errc::status_failure, final_uri + " returned " + std::to_string(status) },
        status_{ status },
        content_{ std::move(content) },
        final_uri_{ std::move(final_uri) }
    {
    }

} // namespace hop::net

// Enable implicit conversion to std::error_code for hop::net::errc.
namespace std
{
    template<>
    struct is_error_code_enum<hop::net::errc> : true_type
    {
    };
} // namespace std
