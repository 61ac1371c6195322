// C++ standard library
#include <string>
#include <utility>

// GSL
#include <gsl/gsl>

// Project
#include <hop/net/http/error.hpp>
#include <hop/net/http/http_client.hpp>
#include <hop/net/http/http_date.hpp>
#include <hop/net/http/status_policy.hpp>
#include <hop/net/http/url.hpp>
#include <hop/utils/attributes.hpp>
#include <hop/utils/timer.hpp>

namespace hop::http_client {

namespace {
    std::string status_message(std::string_view uri, int status, std::string_view what)
    {
        std::string msg;
        msg.reserve(uri.size() + what.size() + 24);
        msg.append(uri).append(" returned ").append(std::to_string(status));
        if (!what.empty()) msg.append(" ").append(what);
        return msg;
    }
} // namespace

// ------------------- client -------------------

client::client(net::Transport& transport, net::Tracer tracer) noexcept
    : transport_{&transport}
    , tracer_{tracer}
{
    Expects(transport_ != nullptr);
}

auto client::attempt(net::RequestState& state, const net::TransportRequest& req) -> attempt_result
{
    tracer_.request(req);

    const utils::Timer timer;
    auto res = transport_->open(req);
    const auto interval = timer.stop();
    Ensures(res.body != nullptr);

    net::Metadata meta{
        .uri       = req.uri,
        .status    = res.status,
        .headers   = net::HeaderMap::from_lines(res.header_lines),
        .timestamp = interval,
        .version   = res.version,
    };
    tracer_.reply(meta);
    state.record(std::move(meta));

    return {std::move(res.body), res.status};
}

net::BodyStreamPtr client::accept_success(const net::RequestState& state, net::BodyStreamPtr body)
{
    const auto& meta = state.last_meta();

    // Decoding by content type would hook in here; the body is passed through.
    if (net::metadata_content_type(meta)) return body;

    // Without a Content-Type there must be no content either.
    if (!body->at_end()) {
        tracer_.warn("no Content-Type for non-empty reply from " + meta.uri);
    }
    return body;
}

net::BodyStreamPtr client::run(net::RequestState& state, net::TransportRequest& req)
{
    for (;;) {
        req.uri = state.current_uri();
        auto [body, status] = attempt(state, req);

        switch (net::classify_status(status)) {
        case net::StatusClass::success:
            return accept_success(state, std::move(body));

        case net::StatusClass::redirect: {
            body->close();
            const auto location = state.last_meta().headers.first("location");
            if (HOP_UNLIKELY(!location)) {
                throw net::HttpError{net::errc::missing_location,
                                     status_message(req.uri, status, "without Location header")};
            }
            state.push_hop(net::resolve_uri(req.uri, *location));
            break;
        }

        case net::StatusClass::auth_failure:
            // Caller adds credentials and tries again on its own.
            return std::move(body);

        case net::StatusClass::retryable_failure:
            if (!state.consume_retry()) return std::move(body);
            body->close();
            break;

        case net::StatusClass::unrecognized:
            body->close();
            throw net::HttpError{net::errc::invalid_status, status_message(req.uri, status, "(invalid status)")};
        }
    }
}

net::BodyStreamPtr client::open(std::string_view uri, const RequestOptions& opts)
{
    net::TransportRequest req;
    req.method       = opts.method;
    req.body         = opts.body;
    req.content_type = opts.content_type;
    req.timeout      = opts.timeout;
    req.headers.reserve(opts.headers.size() + 1);
    req.headers.emplace_back("Accept", net::accept_value(opts.accept));
    for (const auto& h : opts.headers) req.headers.push_back(h);

    net::RequestState state{std::string{uri}, opts.number_of_hops, opts.number_of_retries};
    auto body = run(state, req);

    auto metas = std::move(state).take_metadata();
    const std::string final_uri = net::metadata_final_uri(metas);
    const int status = net::metadata_status(metas);

    if (opts.next) {
        *opts.next = std::nullopt;
        if (auto link = net::metadata_link(metas, "next")) {
            *opts.next = net::resolve_uri(final_uri, *link);
        }
    }
    if (opts.metadata) *opts.metadata = std::move(metas);
    if (opts.final_uri) *opts.final_uri = final_uri;

    if (opts.status) {
        *opts.status = status;
        return body;
    }

    const net::StatusPolicy policy{opts.success, opts.failure};
    if (policy.applies() && !policy.apply(*body, status, final_uri)) {
        return nullptr;
    }
    return body;
}

std::size_t client::call(std::string_view uri, const Consumer& consumer, const RequestOptions& opts)
{
    std::size_t consumed = 0;
    auto seq = pages(uri, opts);
    while (auto body = seq.next()) {
        auto close_page = gsl::finally([&body] { body->close(); });
        consumer(*body);
        ++consumed;
    }
    return consumed;
}

pager client::pages(std::string_view uri, RequestOptions opts)
{
    return pager{*this, std::string{uri}, std::move(opts)};
}

bool client::head(std::string_view uri, RequestOptions opts)
{
    opts.method = boost::beast::http::verb::head;
    auto body = open(uri, opts);
    if (!body) return false;
    body->close();
    return true;
}

std::optional<std::chrono::system_clock::time_point> client::last_modified(std::string_view uri)
{
    int status = 0;
    net::MetadataList metas;

    RequestOptions opts;
    opts.method   = boost::beast::http::verb::head;
    opts.status   = &status;
    opts.metadata = &metas;

    auto body = open(uri, opts);
    body->close();

    if (status != 200) return std::nullopt;
    const auto value = metas.front().headers.first("last-modified");
    if (!value) return std::nullopt;
    return net::parse_http_date(*value);
}

// ------------------- pager -------------------

pager::pager(client& c, std::string first_uri, RequestOptions opts)
    : client_{&c}
    , current_{std::move(first_uri)}
    , opts_{std::move(opts)}
{
}

net::BodyStreamPtr pager::next()
{
    if (!current_) return nullptr;

    std::optional<std::string> next_uri;
    RequestOptions opts = opts_;
    opts.next = &next_uri;

    auto body = client_->open(*current_, opts);
    if (!body) {
        current_.reset();
        return nullptr;
    }

    if (next_uri) {
        // A page pointing at itself would never end.
        if (*next_uri == *current_) {
            body->close();
            current_.reset();
            throw net::LinkCycleError{std::move(*next_uri)};
        }
        current_ = std::move(next_uri);
    } else {
        current_.reset();
    }
    return body;
}

} // namespace hop::http_client
