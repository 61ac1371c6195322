/*
Module Name:
- beast_transport.hpp

Abstract:
- Transport over Boost.Beast for http and https URIs, one connection per
  exchange.
- Each connection drives its own io_context: the request is written and the
  reply headers read before open() returns; the body is pulled lazily through
  the returned stream, and closing the stream closes the socket.
- Redirects are never followed here. gzip, x-gzip and deflate bodies are inflated on read.
- TLS uses SNI; make_permissive_ssl_context() disables peer verification.
*/
#pragma once

// C++ Standard Library
#include <string>

// Boost.Asio
#include <boost/asio/ssl/context.hpp>

// Boost.Beast
#include <boost/beast/version.hpp>

// Project
#include <hop/net/http/transport.hpp>

namespace hop::net
{

    [[nodiscard]] boost::asio::ssl::context make_permissive_ssl_context();

    class BeastTransport final : public Transport
    {
    public:
        explicit BeastTransport(boost::asio::ssl::context& ssl_context,
                                std::string user_agent = BOOST_BEAST_VERSION_STRING);

        [[nodiscard]] TransportResponse open(const TransportRequest& request) override;

    private:
        boost::asio::ssl::context* ssl_context_; // non-null
        std::string user_agent_;
    };

} // namespace hop::net
