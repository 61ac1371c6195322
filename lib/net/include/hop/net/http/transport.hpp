/*
Module Name:
- transport.hpp

Abstract:
- Boundary between the request engine and the code that talks to sockets.
- A transport performs exactly one exchange per open(): it never follows
  redirects, and it reports the raw status, raw header lines and version so
  the engine can make every decision itself.
- The returned body is left unread; the engine decides whether to hand it
  out or close it.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <string>
#include <utility>
#include <vector>

// Boost.Beast
#include <boost/beast/http/verb.hpp>

// Project
#include <hop/net/http/body_stream.hpp>
#include <hop/net/http/metadata.hpp>

namespace hop::net
{

    inline constexpr auto k_default_timeout = std::chrono::seconds{ 60 };

    using header_list = std::vector<std::pair<std::string, std::string>>;

    struct TransportRequest
    {
        std::string uri;
        boost::beast::http::verb method{ boost::beast::http::verb::get };
        header_list headers; // sent as given, Accept included
        std::string body; // sent when non-empty
        std::string content_type; // for body
        std::chrono::steady_clock::duration timeout{ k_default_timeout };
    };

    struct TransportResponse
    {
        BodyStreamPtr body;
        int status{ 0 };
        std::vector<std::string> header_lines; // "Name: value"
        HttpVersion version;
    };

    class Transport
    {
    public:
        virtual ~Transport() = default;

        [[nodiscard]] virtual TransportResponse open(const TransportRequest& request) = 0;
    };

} // namespace hop::net
