// C++ standard library
#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <exception>
#include <limits>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>

// Boost.Asio
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

// Boost.Beast
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

// OpenSSL
#include <openssl/err.h>
#include <openssl/ssl.h>

// GSL
#include <gsl/gsl>

// Project
#include <hop/net/http/beast_transport.hpp>
#include <hop/net/http/encoding.hpp>
#include <hop/net/http/error.hpp>
#include <hop/net/http/url.hpp>
#include <hop/utils/attributes.hpp>

namespace hop::net
{

    namespace
    {
        namespace asio = boost::asio;
        namespace beast = boost::beast;
        namespace http = beast::http;
        using tcp = asio::ip::tcp;

        inline constexpr int k_http_version = 11;
        inline constexpr std::size_t k_peek_size = 4096;

        // Run one coroutine to completion on ioc and rethrow its failure.
        void run_blocking(asio::io_context& ioc, asio::awaitable<void> op)
        {
            std::exception_ptr failure;
            asio::co_spawn(ioc, std::move(op), [&failure](std::exception_ptr e) { failure = e; });
            ioc.restart();
            ioc.run();
            if (failure)
                std::rethrow_exception(failure);
        }

        struct connection
        {
            using tcp_stream = beast::tcp_stream;
            using ssl_stream = beast::ssl_stream<tcp_stream>;

            asio::io_context ioc;
            std::unique_ptr<tcp_stream> plain;
            std::unique_ptr<ssl_stream> tls;
            beast::flat_buffer buffer;
            http::response_parser<http::buffer_body> parser;
            std::chrono::steady_clock::duration timeout{};

            tcp_stream& lowest() noexcept
            {
                return tls ? beast::get_lowest_layer(*tls) : *plain;
            }

            template<class F>
            asio::awaitable<void> with_stream(F&& f)
            {
                if (tls)
                    return f(*tls);
                return f(*plain);
            }

            // Abandon the connection without reading what is left.
            void shutdown() noexcept
            {
                beast::error_code ec;
                auto& sock = lowest().socket();
                sock.shutdown(tcp::socket::shutdown_both, ec);
                sock.close(ec);
            }
        };

        asio::awaitable<void> open_connection(connection& c, const Url& url)
        {
            tcp::resolver resolver{ c.ioc };
            const auto endpoints = co_await resolver.async_resolve(url.host, url.effective_port(), asio::use_awaitable);

            c.lowest().expires_after(c.timeout);
            co_await c.lowest().async_connect(endpoints, asio::use_awaitable);

            // Disable Nagle's algorithm
            c.lowest().socket().set_option(tcp::no_delay{ true });

            if (c.tls)
            {
                // SNI requires NUL-terminated host
                if (!::SSL_set_tlsext_host_name(c.tls->native_handle(), url.host.c_str()))
                {
                    throw boost::system::system_error{
                        beast::error_code{ static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category() },
                        "SNI failure"
                    };
                }
                c.lowest().expires_after(c.timeout);
                co_await c.tls->async_handshake(asio::ssl::stream_base::client, asio::use_awaitable);
            }
        }

        template<class Stream>
        asio::awaitable<void> write_request(Stream& stream, connection& c, http::request<http::string_body>& req)
        {
            c.lowest().expires_after(c.timeout);
            co_await http::async_write(stream, req, asio::use_awaitable);

            c.lowest().expires_after(c.timeout);
            co_await http::async_read_header(stream, c.buffer, c.parser, asio::use_awaitable);
        }

        template<class Stream>
        asio::awaitable<void> read_chunk(Stream& stream, connection& c, std::span<char> out, std::size_t& produced)
        {
            auto& body = c.parser.get().body();
            body.data = out.data();
            body.size = out.size();

            c.lowest().expires_after(c.timeout);
            beast::error_code ec;
            co_await http::async_read(stream, c.buffer, c.parser, asio::redirect_error(asio::use_awaitable, ec));
            if (ec == http::error::need_buffer)
                ec = {};
            if (ec)
                throw boost::system::system_error{ ec };

            produced = out.size() - body.size;
        }

        class BeastBodyStream final : public BodyStream
        {
        public:
            explicit BeastBodyStream(std::unique_ptr<connection> conn) noexcept :
                conn_{ std::move(conn) }
            {
            }
            ~BeastBodyStream() override
            {
                close();
            }

            std::size_t read_some(std::span<char> out) override
            {
                if (HOP_UNLIKELY(!conn_))
                    throw std::logic_error("read from closed body stream");
                if (out.empty())
                    return 0;

                if (HOP_UNLIKELY(!pending_.empty()))
                {
                    const auto n = std::min(out.size(), pending_.size());
                    std::memcpy(out.data(), pending_.data(), n);
                    pending_.erase(0, n);
                    return n;
                }

                std::size_t n = 0;
                while (HOP_LIKELY(n == 0 && !conn_->parser.is_done()))
                {
                    run_blocking(conn_->ioc, conn_->with_stream([&](auto& s) { return read_chunk(s, *conn_, out, n); }));
                }
                return n;
            }

            bool at_end() override
            {
                if (!conn_)
                    return true;
                if (!pending_.empty())
                    return false;
                if (conn_->parser.is_done())
                    return true;

                std::array<char, k_peek_size> buf{};
                const auto n = read_some(buf);
                pending_.assign(buf.data(), n);
                return n == 0;
            }

            void close() noexcept override
            {
                if (conn_)
                {
                    conn_->shutdown();
                    conn_.reset();
                }
                pending_.clear();
            }

            bool is_open() const noexcept override
            {
                return conn_ != nullptr;
            }

        private:
            std::unique_ptr<connection> conn_;
            std::string pending_; // bytes read ahead by at_end()
        };

        std::string to_std(beast::string_view sv)
        {
            return { sv.data(), sv.size() };
        }
    } // namespace

    asio::ssl::context make_permissive_ssl_context()
    {
        asio::ssl::context ctx{ asio::ssl::context::tls_client };
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(asio::ssl::verify_none);
        return ctx;
    }

    BeastTransport::BeastTransport(asio::ssl::context& ssl_context, std::string user_agent) :
        ssl_context_{ &ssl_context }, user_agent_{ std::move(user_agent) }
    {
        Expects(ssl_context_ != nullptr);
    }

    TransportResponse BeastTransport::open(const TransportRequest& request)
    {
        const Url url = parse_url(request.uri);
        if (url.scheme != "http" && url.scheme != "https")
        {
            throw HttpError{ errc::unsupported_scheme, "cannot open '" + request.uri + "'" };
        }

        auto conn = std::make_unique<connection>();
        conn->timeout = request.timeout;
        if (url.is_https())
            conn->tls = std::make_unique<connection::ssl_stream>(conn->ioc, *ssl_context_);
        else
            conn->plain = std::make_unique<connection::tcp_stream>(conn->ioc);

        conn->parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
        const bool head_only = request.method == http::verb::head;
        if (head_only)
            conn->parser.skip(true);

        http::request<http::string_body> req{ request.method, url.target(), k_http_version };
        req.set(http::field::host, url.authority());
        req.set(http::field::user_agent, user_agent_);
        for (const auto& [name, value] : request.headers)
            req.set(name, value);
        if (!request.body.empty())
        {
            if (!request.content_type.empty())
                req.set(http::field::content_type, request.content_type);
            req.body() = request.body;
            req.prepare_payload();
        }

        run_blocking(conn->ioc, open_connection(*conn, url));
        run_blocking(conn->ioc, conn->with_stream([&](auto& s) { return write_request(s, *conn, req); }));

        const auto& reply = conn->parser.get();
        TransportResponse res;
        res.status = static_cast<int>(reply.result_int());
        res.version = { static_cast<int>(reply.version() / 10), static_cast<int>(reply.version() % 10) };

        auto which = encoding::enc::none;
        for (const auto& field : reply.base())
        {
            std::string line = to_std(field.name_string());
            line += ": ";
            line += to_std(field.value());
            res.header_lines.push_back(std::move(line));
            if (field.name() == http::field::content_encoding)
                which = which | encoding::parse_content_encoding(to_std(field.value()));
        }

        if (head_only)
        {
            conn->shutdown();
            res.body = std::make_unique<StringBodyStream>();
        }
        else
        {
            res.body = encoding::decode(std::make_unique<BeastBodyStream>(std::move(conn)), which);
        }
        return res;
    }

} // namespace hop::net
