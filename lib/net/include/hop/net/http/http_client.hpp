/*
Module Name:
- http_client.hpp

Abstract:
- Policy-driven entry point over a Transport.
- open() runs one logical request: it follows redirects itself (hop cap and
  loop detection), re-issues failing requests up to the retry cap, records one
  Metadata per physical attempt and finally maps the status onto the outcome.
- call() / pager walk a result set page by page through rel="next" links,
  with at most one page stream open at a time.
- head() and last_modified() are metadata-only requests.

Notes:
- The client holds no per-request state; RequestState lives inside open().
  One client may serve consecutive requests, but it is not meant to be used
  from several threads at once (the tracer and transport are shared).
*/
#pragma once

// C++ standard library
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

// Boost.Beast
#include <boost/beast/http/verb.hpp>

// Project
#include <hop/net/http/accept.hpp>
#include <hop/net/http/body_stream.hpp>
#include <hop/net/http/metadata.hpp>
#include <hop/net/http/request_state.hpp>
#include <hop/net/http/trace.hpp>
#include <hop/net/http/transport.hpp>

namespace hop::http_client {

struct RequestOptions {
    net::AcceptOption accept{};                      // "*/*" when unset
    std::size_t number_of_hops{net::k_default_number_of_hops};
    int number_of_retries{net::k_default_number_of_retries};

    // Setting either enables the status policy; the other takes its default.
    std::optional<int> success{};
    std::optional<int> failure{};

    boost::beast::http::verb method{boost::beast::http::verb::get};
    net::header_list headers{};                      // extra request headers
    std::string body{};                              // request body (POST/PUT)
    std::string content_type{};                      // of body
    std::chrono::steady_clock::duration timeout{net::k_default_timeout};

    // Output slots, written when non-null.
    int* status{nullptr};                            // raw status; disables the status policy
    std::string* final_uri{nullptr};
    net::MetadataList* metadata{nullptr};            // newest first
    std::optional<std::string>* next{nullptr};       // rel="next" target, resolved
};

class client;

// Lazy page sequence for one result set. Each next() issues one logical
// request; the returned stream belongs to the caller.
class pager {
public:
    pager(client& c, std::string first_uri, RequestOptions opts);

    // Stream of the next page, or nullptr once the sequence is exhausted (or a
    // page hit the designated failure code). Throws LinkCycleError when a page
    // names itself as its successor.
    [[nodiscard]] net::BodyStreamPtr next();

    [[nodiscard]] bool done() const noexcept { return !current_.has_value(); }

    // URI the following next() will request.
    [[nodiscard]] const std::optional<std::string>& upcoming() const noexcept { return current_; }

private:
    client* client_; // non-null
    std::optional<std::string> current_;
    RequestOptions opts_;
};

class client {
public:
    using Consumer = std::function<void(net::BodyStream&)>;

    explicit client(net::Transport& transport, net::Tracer tracer = net::Tracer{}) noexcept;

    [[nodiscard]] net::Tracer& tracer() noexcept { return tracer_; }

    // Enable / disable both trace categories.
    void curl() noexcept { tracer_.curl(); }
    void nocurl() noexcept { tracer_.nocurl(); }

    // One logical request. Returns the body stream, or nullptr when the status
    // policy maps the final status onto the designated failure code.
    [[nodiscard]] net::BodyStreamPtr open(std::string_view uri, const RequestOptions& opts = {});

    // Invoke consumer once per page, closing each page's stream afterwards.
    // Returns the number of pages consumed.
    std::size_t call(std::string_view uri, const Consumer& consumer, const RequestOptions& opts = {});

    [[nodiscard]] pager pages(std::string_view uri, RequestOptions opts = {});

    // HEAD request; false on the designated failure code.
    bool head(std::string_view uri, RequestOptions opts = {});

    // Last-Modified of uri when a HEAD request answers 200.
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> last_modified(std::string_view uri);

private:
    struct attempt_result {
        net::BodyStreamPtr body;
        int status{0};
    };

    // Drive the redirect/retry loop to a terminal stream.
    net::BodyStreamPtr run(net::RequestState& state, net::TransportRequest& req);

    // One physical attempt; records its metadata in state.
    attempt_result attempt(net::RequestState& state, const net::TransportRequest& req);

    net::BodyStreamPtr accept_success(const net::RequestState& state, net::BodyStreamPtr body);

    net::Transport* transport_; // non-null
    net::Tracer     tracer_;
};

} // namespace hop::http_client
