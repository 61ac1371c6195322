// GoogleTest
#include <gtest/gtest.h>

// Project
#include <hop/net/http/headers.hpp>

using hop::net::HeaderMap;

TEST(HeaderMap, ParseLineLowercasesNameAndTrimsValue)
{
    const auto kv = HeaderMap::parse_line("Content-Type: \t text/html \r");
    ASSERT_TRUE(kv.has_value());
    EXPECT_EQ(kv->first, "content-type");
    EXPECT_EQ(kv->second, "text/html");
}

TEST(HeaderMap, EmptyValueIsKept)
{
    const auto kv = HeaderMap::parse_line("X-Empty:");
    ASSERT_TRUE(kv.has_value());
    EXPECT_EQ(kv->first, "x-empty");
    EXPECT_EQ(kv->second, "");
}

TEST(HeaderMap, MalformedLinesAreRejected)
{
    EXPECT_FALSE(HeaderMap::parse_line("no colon here"));
    EXPECT_FALSE(HeaderMap::parse_line(": value"));
    EXPECT_FALSE(HeaderMap::parse_line("Bad Name: value"));
    EXPECT_FALSE(HeaderMap::parse_line(""));
}

TEST(HeaderMap, FromLinesGroupsRepeatedFieldsAndDropsJunk)
{
    const std::vector<std::string> lines{
        "Link: <a>; rel=prev",
        "garbage",
        "LINK: <b>; rel=next",
        "Server: test",
    };
    const auto headers = HeaderMap::from_lines(lines);

    EXPECT_EQ(headers.size(), 2u);
    const auto* links = headers.find("Link");
    ASSERT_NE(links, nullptr);
    ASSERT_EQ(links->size(), 2u);
    EXPECT_EQ((*links)[0], "<a>; rel=prev");
    EXPECT_EQ((*links)[1], "<b>; rel=next");
    EXPECT_EQ(headers.first("server"), "test");
    EXPECT_FALSE(headers.contains("garbage"));
    EXPECT_FALSE(headers.first("location").has_value());
}

TEST(HeaderMap, IterationUsesLowercaseNames)
{
    HeaderMap headers;
    headers.add("ETag", "\"x\"");
    ASSERT_FALSE(headers.empty());
    EXPECT_EQ(headers.begin()->first, "etag");
}
