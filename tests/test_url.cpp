#include <gtest/gtest.h>

#include "utils/url.hpp"

namespace scriptbox::test {

using utils::ParseUrl;

TEST(ParseUrlTest, HttpsWithDefaultPort) {
    const auto url = ParseUrl("https://scripts.example.org/api/execute");
    ASSERT_TRUE(url.valid);
    EXPECT_TRUE(url.https);
    EXPECT_EQ(url.host, "scripts.example.org");
    EXPECT_EQ(url.port, 443);
    EXPECT_EQ(url.path, "/api/execute");
    EXPECT_EQ(url.SchemeHostPort(), "https://scripts.example.org:443");
}

TEST(ParseUrlTest, HttpWithExplicitPort) {
    const auto url = ParseUrl("http://127.0.0.1:8088/execute");
    ASSERT_TRUE(url.valid);
    EXPECT_FALSE(url.https);
    EXPECT_EQ(url.port, 8088);
    EXPECT_EQ(url.SchemeHostPort(), "http://127.0.0.1:8088");
}

TEST(ParseUrlTest, MissingPathBecomesRoot) {
    const auto url = ParseUrl("http://localhost");
    ASSERT_TRUE(url.valid);
    EXPECT_EQ(url.port, 80);
    EXPECT_EQ(url.path, "/");
}

TEST(ParseUrlTest, NoSchemeMeansHttps) {
    const auto url = ParseUrl("example.org/run");
    ASSERT_TRUE(url.valid);
    EXPECT_TRUE(url.https);
    EXPECT_EQ(url.host, "example.org");
}

TEST(ParseUrlTest, RejectsUnusableHostOrPort) {
    EXPECT_FALSE(ParseUrl("").valid);
    EXPECT_FALSE(ParseUrl("http://:80/x").valid);
    EXPECT_FALSE(ParseUrl("http://host:abc/").valid);
    EXPECT_FALSE(ParseUrl("http://host:/").valid);
    EXPECT_FALSE(ParseUrl("http://host:99999/").valid);
    EXPECT_FALSE(ParseUrl("http://host:1234567/").valid);
}

}  // namespace scriptbox::test
