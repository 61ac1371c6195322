// C++ Standard Library
#include <span>
#include <string>
#include <vector>

// GoogleTest
#include <gtest/gtest.h>

// Project
#include <hop/net/http/accept.hpp>
#include <hop/net/http/error.hpp>

using namespace hop::net;

namespace {
mime::media_type mt(std::string type, std::string subtype)
{
    return mime::media_type{std::move(type), std::move(subtype), {}};
}
} // namespace

TEST(Accept, WeightsAreEvenlySpacedByRank)
{
    const std::vector<mime::media_type> ranked{mt("text", "turtle"), mt("application", "json"), mt("text", "plain")};
    EXPECT_EQ(accept_value(std::span<const mime::media_type>{ranked}), "text/turtle;q=0.333, application/json;q=0.667, text/plain;q=1.000");
}

TEST(Accept, SingleTypeHasFullWeight)
{
    EXPECT_EQ(accept_value(AcceptOption{mt("application", "json")}), "application/json;q=1.000");
}

TEST(Accept, ParametersAreKept)
{
    auto html = mt("text", "html");
    html.params.emplace_back("charset", "utf-8");
    EXPECT_EQ(accept_value(AcceptOption{html}), "text/html;charset=utf-8;q=1.000");
}

TEST(Accept, UnsetMeansAnything)
{
    EXPECT_EQ(accept_value(AcceptOption{}), "*/*");
}

TEST(Accept, ExtensionResolvesToMediaType)
{
    EXPECT_EQ(accept_value(AcceptOption{Extension{"ttl"}}), "text/turtle;q=1.000");
}

TEST(Accept, UnknownExtensionThrows)
{
    try {
        (void)accept_value(AcceptOption{Extension{"nope"}});
        FAIL() << "expected HttpError";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.code(), errc::unknown_extension);
    }
}

TEST(Accept, EmptyListThrows)
{
    try {
        (void)accept_value(AcceptOption{std::vector<mime::media_type>{}});
        FAIL() << "expected HttpError";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.code(), errc::empty_accept);
    }
}
