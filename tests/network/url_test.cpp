#include "dfm/network/url.hpp"

#include <gtest/gtest.h>

using namespace dfm::network;

TEST(UrlTest, ParsesHostPortAndTarget) {
    auto url = Url::parse("http://127.0.0.1:8080/files/a%20b?x=1");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().host, "127.0.0.1");
    EXPECT_EQ(url.value().port, 8080);
    EXPECT_EQ(url.value().target, "/files/a%20b?x=1");
    EXPECT_EQ(url.value().origin(), "http://127.0.0.1:8080");
}

TEST(UrlTest, DefaultsPortAndTarget) {
    auto url = Url::parse("http://example.com");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().port, 80);
    EXPECT_EQ(url.value().target, "/");
    EXPECT_EQ(url.value().to_string(), "http://example.com/");
}

TEST(UrlTest, RejectsUnsupportedOrMalformed) {
    EXPECT_TRUE(Url::parse("https://example.com/").is_error());
    EXPECT_TRUE(Url::parse("http:///path").is_error());
    EXPECT_TRUE(Url::parse("http://host:port/").is_error());
    EXPECT_TRUE(Url::parse("http://host:70000/").is_error());
}

TEST(UrlTest, PercentEncoding) {
    EXPECT_EQ(percent_encode("dir/my file.bin"), "dir/my%20file.bin");
    EXPECT_EQ(percent_encode("dir/my file.bin", false), "dir%2Fmy%20file.bin");
    EXPECT_EQ(percent_decode("dir%2Fmy%20file.bin"), "dir/my file.bin");
    EXPECT_EQ(percent_decode("100%"), "100%");
    EXPECT_EQ(percent_decode("%zz"), "%zz");
}

TEST(UrlTest, ResolveRelativeTargets) {
    EXPECT_EQ(resolve_url("http://h:1/", "/files/a"), "http://h:1/files/a");
    EXPECT_EQ(resolve_url("http://h:1", "files/a"), "http://h:1/files/a");
    EXPECT_EQ(resolve_url("http://h:1", "http://other/x"), "http://other/x");
}
