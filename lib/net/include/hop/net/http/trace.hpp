/*
Module Name:
- trace.hpp

Abstract:
- cURL-like protocol tracing owned by each client instead of process-wide
  debug flags.
- send_request prints the outgoing request line, request headers and body;
  receive_reply prints the status line and every reply header value.
- warn() is always on and goes to std::cerr.
*/
#pragma once

// C++ Standard Library
#include <iostream>
#include <string_view>

// Project
#include <hop/net/http/metadata.hpp>
#include <hop/net/http/transport.hpp>

namespace hop::net
{

    struct TraceOptions
    {
        bool send_request{ false };
        bool receive_reply{ false };
    };

    class Tracer
    {
    public:
        explicit Tracer(TraceOptions opts = {}, std::ostream& out = std::clog) noexcept :
            opts_{ opts }, out_{ &out }
        {
        }

        [[nodiscard]] const TraceOptions& options() const noexcept
        {
            return opts_;
        }
        void set_options(TraceOptions opts) noexcept
        {
            opts_ = opts;
        }

        // Both categories on / off.
        void curl() noexcept
        {
            opts_ = { true, true };
        }
        void nocurl() noexcept
        {
            opts_ = { false, false };
        }

        void request(const TransportRequest& req) const;
        void reply(const Metadata& meta) const;
        void warn(std::string_view msg) const;

    private:
        TraceOptions opts_;
        std::ostream* out_; // non-null
    };

} // namespace hop::net
