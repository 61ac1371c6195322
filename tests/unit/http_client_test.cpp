// C++ Standard Library
#include <algorithm>
#include <chrono>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

// GoogleTest
#include <gtest/gtest.h>

// Project
#include "fake_transport.hpp"
#include <hop/net/http/error.hpp>
#include <hop/net/http/http_client.hpp>

using namespace hop;
using hop::test::FakeTransport;
using hop::test::Reply;

namespace {
std::string uri(int i)
{
    return "http://h/" + std::to_string(i);
}

std::ptrdiff_t position(const test::EventLog& events, const std::string& event)
{
    return std::find(events.begin(), events.end(), event) - events.begin();
}
} // namespace

TEST(Client, PlainGetSendsAcceptFirst)
{
    FakeTransport t;
    t.on("http://h/x", Reply{.status = 200, .headers = {"Content-Type: text/plain"}, .body = "hello"});
    http_client::client c{t};

    http_client::RequestOptions opts;
    opts.headers = {{"X-Trace", "1"}};
    auto body = c.open("http://h/x", opts);
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(net::read_string(*body), "hello");

    ASSERT_EQ(t.requests().size(), 1u);
    const auto& headers = t.requests()[0].headers;
    ASSERT_EQ(headers.size(), 2u);
    EXPECT_EQ(headers[0].first, "Accept");
    EXPECT_EQ(headers[0].second, "*/*");
    EXPECT_EQ(headers[1].first, "X-Trace");
}

TEST(Client, PostCarriesBodyAndMethod)
{
    FakeTransport t;
    t.on("http://h/form", Reply{});
    http_client::client c{t};

    http_client::RequestOptions opts;
    opts.method = boost::beast::http::verb::post;
    opts.body = "a=1";
    opts.content_type = "application/x-www-form-urlencoded";
    opts.timeout = std::chrono::seconds{5};
    auto body = c.open("http://h/form", opts);
    ASSERT_NE(body, nullptr);

    const auto& req = t.requests().at(0);
    EXPECT_EQ(req.method, boost::beast::http::verb::post);
    EXPECT_EQ(req.body, "a=1");
    EXPECT_EQ(req.content_type, "application/x-www-form-urlencoded");
    EXPECT_EQ(req.timeout, std::chrono::seconds{5});
}

TEST(Client, FollowsRedirectChainBelowCap)
{
    FakeTransport t;
    for (int i = 0; i < 4; ++i) t.redirect(uri(i), uri(i + 1));
    t.on(uri(4), Reply{.status = 200, .headers = {"Content-Type: text/plain"}, .body = "end"});
    http_client::client c{t};

    net::MetadataList metas;
    std::string final_uri;
    http_client::RequestOptions opts;
    opts.metadata = &metas;
    opts.final_uri = &final_uri;

    auto body = c.open(uri(0), opts);
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(net::read_string(*body), "end");
    EXPECT_EQ(final_uri, uri(4));

    ASSERT_EQ(metas.size(), 5u);
    EXPECT_EQ(metas.front().uri, uri(4));
    EXPECT_EQ(metas.front().status, 200);
    EXPECT_EQ(metas.back().uri, uri(0));
    EXPECT_EQ(metas.back().status, 302);
}

TEST(Client, RedirectBodiesCloseBeforeNextAttempt)
{
    FakeTransport t;
    t.redirect(uri(0), uri(1));
    t.on(uri(1), Reply{});
    http_client::client c{t};

    auto body = c.open(uri(0));
    ASSERT_NE(body, nullptr);
    const auto& ev = t.events();
    EXPECT_LT(position(ev, "close " + uri(0)), position(ev, "open " + uri(1)));
    EXPECT_TRUE(body->is_open());
}

TEST(Client, ExactlyHopCapRedirectsFails)
{
    FakeTransport t;
    for (int i = 0; i < 5; ++i) t.redirect(uri(i), uri(i + 1));
    t.on(uri(5), Reply{});
    http_client::client c{t};

    try {
        (void)c.open(uri(0));
        FAIL() << "expected RedirectError";
    } catch (const net::RedirectError& e) {
        EXPECT_EQ(e.code(), net::errc::max_redirects);
        EXPECT_EQ(e.chain().size(), 6u);
        EXPECT_EQ(e.chain().front(), uri(0));
        EXPECT_EQ(e.chain().back(), uri(5));
    }
    EXPECT_EQ(t.opens(uri(5)), 0u);
}

TEST(Client, HopCapIsConfigurable)
{
    FakeTransport t;
    t.redirect(uri(0), uri(1));
    t.on(uri(1), Reply{});
    http_client::client c{t};

    http_client::RequestOptions opts;
    opts.number_of_hops = 1;
    EXPECT_THROW((void)c.open(uri(0), opts), net::RedirectError);
}

TEST(Client, SelfRedirectIsALoop)
{
    FakeTransport t;
    t.redirect("http://h/self", "/self", 301);
    http_client::client c{t};

    try {
        (void)c.open("http://h/self");
        FAIL() << "expected RedirectError";
    } catch (const net::RedirectError& e) {
        EXPECT_EQ(e.code(), net::errc::redirect_loop);
    }
}

TEST(Client, RelativeLocationIsResolved)
{
    FakeTransport t;
    t.redirect("http://h/a/b", "../c?x=1", 303);
    t.on("http://h/c?x=1", Reply{});
    http_client::client c{t};

    std::string final_uri;
    http_client::RequestOptions opts;
    opts.final_uri = &final_uri;
    auto body = c.open("http://h/a/b", opts);
    EXPECT_NE(body, nullptr);
    EXPECT_EQ(final_uri, "http://h/c?x=1");
}

TEST(Client, RedirectWithoutLocation)
{
    FakeTransport t;
    t.on("http://h/x", Reply{.status = 302, .headers = {}, .body = {}});
    http_client::client c{t};

    try {
        (void)c.open("http://h/x");
        FAIL() << "expected HttpError";
    } catch (const net::HttpError& e) {
        EXPECT_EQ(e.code(), net::errc::missing_location);
    }
}

TEST(Client, UnauthorisedReturnsStreamToCaller)
{
    FakeTransport t;
    t.on("http://h/secret", Reply{.status = 401, .headers = {"WWW-Authenticate: Basic"}, .body = "login"});
    http_client::client c{t};

    int status = 0;
    http_client::RequestOptions opts;
    opts.status = &status;
    auto body = c.open("http://h/secret", opts);
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(status, 401);
    EXPECT_EQ(net::read_string(*body), "login");
    EXPECT_EQ(t.opens("http://h/secret"), 1u);
}

TEST(Client, DesignatedFailureIsSilentAfterOneAttempt)
{
    FakeTransport t;
    t.on("http://h/missing", Reply{.status = 404, .headers = {}, .body = "nope"});
    http_client::client c{t};

    http_client::RequestOptions opts;
    opts.failure = 404;
    EXPECT_EQ(c.open("http://h/missing", opts), nullptr);
    EXPECT_EQ(t.opens("http://h/missing"), 1u);
    EXPECT_EQ(t.events().back(), "close http://h/missing");
}

TEST(Client, OtherFailureRetriesThenRaises)
{
    FakeTransport t;
    t.on("http://h/broken", Reply{.status = 500, .headers = {"Content-Type: text/plain"}, .body = "boom"});
    http_client::client c{t};

    http_client::RequestOptions opts;
    opts.success = 200;
    opts.number_of_retries = 3;
    try {
        (void)c.open("http://h/broken", opts);
        FAIL() << "expected StatusError";
    } catch (const net::StatusError& e) {
        EXPECT_EQ(e.status(), 500);
        EXPECT_EQ(e.final_uri(), "http://h/broken");
        EXPECT_EQ(e.content(), "boom");
    }
    EXPECT_EQ(t.opens("http://h/broken"), 2u);

    const auto& ev = t.events();
    EXPECT_EQ(std::count(ev.begin(), ev.end(), "close http://h/broken"), 2);
}

TEST(Client, RetryRecoversWhenServerDoes)
{
    FakeTransport t;
    t.on("http://h/flaky", Reply{.status = 503, .headers = {}, .body = {}});
    t.on("http://h/flaky", Reply{.status = 200, .headers = {"Content-Type: text/plain"}, .body = "ok"});
    http_client::client c{t};

    net::MetadataList metas;
    http_client::RequestOptions opts;
    opts.number_of_retries = 3;
    opts.metadata = &metas;
    auto body = c.open("http://h/flaky", opts);
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(net::read_string(*body), "ok");
    ASSERT_EQ(metas.size(), 2u);
    EXPECT_EQ(metas[0].status, 200);
    EXPECT_EQ(metas[1].status, 503);
}

TEST(Client, StatusSlotBypassesPolicy)
{
    FakeTransport t;
    t.on("http://h/gone", Reply{.status = 410, .headers = {}, .body = "gone"});
    http_client::client c{t};

    int status = 0;
    http_client::RequestOptions opts;
    opts.status = &status;
    opts.success = 200;
    auto body = c.open("http://h/gone", opts);
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(status, 410);
}

TEST(Client, WithoutPolicyFailureStreamIsReturned)
{
    FakeTransport t;
    t.on("http://h/missing", Reply{.status = 404, .headers = {}, .body = "nope"});
    http_client::client c{t};

    auto body = c.open("http://h/missing");
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(net::read_string(*body), "nope");
}

TEST(Client, InvalidStatus)
{
    FakeTransport t;
    t.on("http://h/odd", Reply{.status = 99, .headers = {}, .body = {}});
    http_client::client c{t};

    try {
        (void)c.open("http://h/odd");
        FAIL() << "expected HttpError";
    } catch (const net::HttpError& e) {
        EXPECT_EQ(e.code(), net::errc::invalid_status);
    }
    EXPECT_EQ(t.events().back(), "close http://h/odd");
}

TEST(Client, MissingContentTypeOnNonEmptyBodyWarns)
{
    FakeTransport t;
    t.on("http://h/untyped", Reply{.status = 200, .headers = {}, .body = "data"});
    t.on("http://h/empty", Reply{.status = 204, .headers = {}, .body = {}});
    http_client::client c{t};

    testing::internal::CaptureStderr();
    auto body = c.open("http://h/untyped");
    auto empty = c.open("http://h/empty");
    const auto err = testing::internal::GetCapturedStderr();

    EXPECT_NE(err.find("[http] warning: no Content-Type"), std::string::npos);
    EXPECT_NE(err.find("http://h/untyped"), std::string::npos);
    EXPECT_EQ(err.find("http://h/empty"), std::string::npos);

    ASSERT_NE(body, nullptr);
    EXPECT_EQ(net::read_string(*body), "data");
    EXPECT_NE(empty, nullptr);
}

TEST(Client, EmptyEncodedReplyWithoutContentTypeSucceeds)
{
    FakeTransport t;
    t.on("http://h/nothing", Reply{.status = 204, .headers = {"Content-Encoding: gzip"}, .body = {}});
    http_client::client c{t};

    http_client::RequestOptions opts;
    opts.success = 204;
    testing::internal::CaptureStderr();
    auto body = c.open("http://h/nothing", opts);
    const auto err = testing::internal::GetCapturedStderr();

    ASSERT_NE(body, nullptr);
    EXPECT_TRUE(body->at_end());
    EXPECT_EQ(net::read_string(*body), "");
    EXPECT_EQ(err.find("warning"), std::string::npos);
}

TEST(Client, NextLinkIsResolvedAgainstFinalUri)
{
    FakeTransport t;
    t.redirect("http://h/start", "http://h/list/page1");
    t.on("http://h/list/page1",
         Reply{.status = 200, .headers = {"Content-Type: text/csv", R"(Link: <page2>; rel="next")"}, .body = "a"});
    http_client::client c{t};

    std::optional<std::string> next;
    http_client::RequestOptions opts;
    opts.next = &next;
    auto body = c.open("http://h/start", opts);
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(next, "http://h/list/page2");
}

TEST(Client, UnknownAcceptExtensionFailsBeforeSending)
{
    FakeTransport t;
    http_client::client c{t};

    http_client::RequestOptions opts;
    opts.accept = net::Extension{"unknown"};
    EXPECT_THROW((void)c.open("http://h/x", opts), net::HttpError);
    EXPECT_TRUE(t.requests().empty());
}

TEST(Client, RankedAcceptHeader)
{
    FakeTransport t;
    t.on("http://h/x", Reply{});
    http_client::client c{t};

    http_client::RequestOptions opts;
    opts.accept = std::vector<net::mime::media_type>{{"text", "turtle", {}}, {"application", "json", {}}};
    (void)c.open("http://h/x", opts);
    EXPECT_EQ(t.requests().at(0).headers.at(0).second, "text/turtle;q=0.500, application/json;q=1.000");
}

TEST(Client, TraceWritesRequestAndReply)
{
    FakeTransport t;
    t.on("http://h/x", Reply{.status = 200, .headers = {"Content-Type: text/plain"}, .body = "x"});
    std::ostringstream trace;
    http_client::client c{t, net::Tracer{{}, trace}};

    (void)c.open("http://h/x");
    EXPECT_TRUE(trace.str().empty());

    c.curl();
    (void)c.open("http://h/x");
    const auto out = trace.str();
    EXPECT_NE(out.find("> GET http://h/x\n"), std::string::npos);
    EXPECT_NE(out.find("> Accept: */*\n"), std::string::npos);
    EXPECT_NE(out.find("< 200 (OK)\n"), std::string::npos);
    EXPECT_NE(out.find("< content-type: text/plain\n"), std::string::npos);

    c.nocurl();
    const auto before = trace.str().size();
    (void)c.open("http://h/x");
    EXPECT_EQ(trace.str().size(), before);
}

TEST(Client, HeadReportsPresence)
{
    FakeTransport t;
    t.on("http://h/here", Reply{});
    t.on("http://h/gone", Reply{.status = 404, .headers = {}, .body = {}});
    http_client::client c{t};

    http_client::RequestOptions opts;
    opts.failure = 404;
    EXPECT_TRUE(c.head("http://h/here", opts));
    EXPECT_FALSE(c.head("http://h/gone", opts));
    EXPECT_EQ(t.requests().at(0).method, boost::beast::http::verb::head);
}

TEST(Client, LastModified)
{
    FakeTransport t;
    t.on("http://h/doc", Reply{.status = 200, .headers = {"Last-Modified: Sun, 06 Nov 1994 08:49:37 GMT"}, .body = {}});
    t.on("http://h/undated", Reply{.status = 200, .headers = {}, .body = {}});
    t.on("http://h/missing", Reply{.status = 404, .headers = {}, .body = {}});
    http_client::client c{t};

    EXPECT_EQ(c.last_modified("http://h/doc"), std::chrono::system_clock::from_time_t(784111777));
    EXPECT_FALSE(c.last_modified("http://h/undated").has_value());
    EXPECT_FALSE(c.last_modified("http://h/missing").has_value());
}
