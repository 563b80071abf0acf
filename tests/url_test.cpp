#include <gtest/gtest.h>

#include "adapters/http/url.hpp"
#include "core/path_mapper/path_mapper.hpp"

using namespace nxup::adapters::http;

TEST(UrlTest, ParsesArtifactsUrl)
{
    auto url = parse_https_url("https://artifacts.unidata.ucar.edu/repository/docs-tds/tds/5.0/a/b.txt");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "artifacts.unidata.ucar.edu");
    EXPECT_EQ(url->port, "443");
    EXPECT_EQ(url->target, "/repository/docs-tds/tds/5.0/a/b.txt");
}

TEST(UrlTest, ParsesExplicitPort)
{
    auto url = parse_https_url("https://localhost:8443/x");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "localhost");
    EXPECT_EQ(url->port, "8443");
    EXPECT_EQ(url->target, "/x");
}

TEST(UrlTest, HostWithoutPathTargetsRoot)
{
    auto url = parse_https_url("https://example.org");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->target, "/");
}

TEST(UrlTest, RejectsOtherSchemesAndMalformedAuthority)
{
    for (const auto* bad : {"http://example.org/x", "ftp://example.org/x", "example.org/x",
                            "https:///x", "https://host:/x", "https://host:abc/x"}) {
        auto url = parse_https_url(bad);
        ASSERT_FALSE(url.has_value()) << bad;
        EXPECT_EQ(url.error().code, nxup::infra::ErrorCode::InvalidUrl);
    }
}

TEST(UrlTest, RejectsUnencodedSpaces)
{
    EXPECT_FALSE(parse_https_url("https://example.org/a b.txt").has_value());
}

TEST(UrlTest, KeepsEncodedTargetAsIs)
{
    auto url = parse_https_url("https://example.org/a%20b/c%23d.txt");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->target, "/a%20b/c%23d.txt");
}

TEST(UrlTest, AcceptsUploadUrlsFromPathMapper)
{
    const auto upload = nxup::core::build_upload_url(nxup::core::UploadType::Docs, "tds", "5.0", "my docs/index #1.html");
    auto url = parse_https_url(upload);
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "artifacts.unidata.ucar.edu");
    EXPECT_EQ(url->target, "/repository/docs-tds/tds/5.0/my%20docs/index%20%231.html");
}
