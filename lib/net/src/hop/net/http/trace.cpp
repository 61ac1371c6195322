// Boost.Beast
#include <boost/beast/http/status.hpp>

// Project
#include <hop/net/http/trace.hpp>

namespace hop::net
{

    void Tracer::request(const TransportRequest& req) const
    {
        if (!opts_.send_request)
            return;

        auto& out = *out_;
        out << "> " << boost::beast::http::to_string(req.method) << ' ' << req.uri << '\n';
        for (const auto& [name, value] : req.headers)
            out << "> " << name << ": " << value << '\n';
        if (!req.body.empty())
            out << "REQUEST BODY\n" << req.body << '\n';
    }

    void Tracer::reply(const Metadata& meta) const
    {
        if (!opts_.receive_reply)
            return;

        namespace http = boost::beast::http;
        auto& out = *out_;
        out << '\n';
        out << "< " << meta.status << " (" << http::obsolete_reason(http::int_to_status(static_cast<unsigned>(meta.status)))
            << ")\n";
        for (const auto& [name, values] : meta.headers)
        {
            for (const auto& value : values)
                out << "< " << name << ": " << value << '\n';
        }
        out << '\n';
    }

    void Tracer::warn(std::string_view msg) const
    {
        std::cerr << "[http] warning: " << msg << '\n';
    }

} // namespace hop::net
