// C++ Standard Library
#include <string>
#include <vector>

// GoogleTest
#include <gtest/gtest.h>

// Project
#include <hop/net/http/metadata.hpp>

using namespace hop::net;

namespace {
Metadata record(std::string uri, int status, std::vector<std::string> lines)
{
    Metadata m;
    m.uri = std::move(uri);
    m.status = status;
    m.headers = HeaderMap::from_lines(lines);
    return m;
}
} // namespace

TEST(MetadataLog, ReleaseIsNewestFirst)
{
    MetadataLog log;
    EXPECT_TRUE(log.empty());
    log.append(record("http://h/a", 302, {"Location: /b"}));
    log.append(record("http://h/b", 200, {}));
    EXPECT_EQ(log.size(), 2u);
    EXPECT_EQ(log.last().uri, "http://h/b");

    const auto metas = std::move(log).release();
    ASSERT_EQ(metas.size(), 2u);
    EXPECT_EQ(metas[0].uri, "http://h/b");
    EXPECT_EQ(metas[1].uri, "http://h/a");
}

TEST(MetadataAccessors, ReadTheFinalRecord)
{
    const MetadataList metas{
        record("http://h/final",
               200,
               {"Content-Type: text/csv; charset=utf-8",
                R"(Content-Disposition: attachment; filename="rows.csv")",
                R"(Link: <http://h/final?page=2>; rel="next")"}),
        record("http://h/start", 301, {"Location: /final", "Content-Type: text/html"}),
    };

    EXPECT_EQ(metadata_final_uri(metas), "http://h/final");
    EXPECT_EQ(metadata_status(metas), 200);
    ASSERT_TRUE(metadata_content_type(metas).has_value());
    EXPECT_EQ(metadata_content_type(metas)->essence(), "text/csv");
    EXPECT_EQ(metadata_file_name(metas), "rows.csv");
    EXPECT_EQ(metadata_link(metas, "next"), "http://h/final?page=2");
    EXPECT_FALSE(metadata_link(metas, "prev").has_value());
}

TEST(MetadataAccessors, AbsentFields)
{
    const MetadataList metas{record("http://h/x", 204, {"Content-Type: ???"})};
    EXPECT_FALSE(metadata_content_type(metas).has_value());
    EXPECT_FALSE(metadata_file_name(metas).has_value());
    EXPECT_FALSE(metadata_link(metas, "next").has_value());
}

TEST(MetadataJson, RendersEveryRecord)
{
    const MetadataList metas{
        record("http://h/b", 200, {"Content-Type: application/json"}),
        record("http://h/a", 302, {"Location: http://h/b"}),
    };
    const auto json = to_json(metas);

    EXPECT_NE(json.find("\"http://h/b\""), std::string::npos);
    EXPECT_NE(json.find("\"http://h/a\""), std::string::npos);
    EXPECT_NE(json.find("\"content-type\""), std::string::npos);
    EXPECT_NE(json.find("\"location\""), std::string::npos);
    EXPECT_NE(json.find("302"), std::string::npos);
    EXPECT_LT(json.find("http://h/b"), json.find("http://h/a"));
}
