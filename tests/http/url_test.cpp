#include <gtest/gtest.h>
#include <fleetcam/http/client.hpp>

namespace fleetcam::http::test {

TEST(UrlTest, ParseHostPortAndTarget) {
    auto url = Url::parse("http://printfarm.local:8000/api/cameras/3/webrtc");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().scheme, "http");
    EXPECT_EQ(url.value().host, "printfarm.local");
    EXPECT_EQ(url.value().port, "8000");
    EXPECT_EQ(url.value().target, "/api/cameras/3/webrtc");
}

TEST(UrlTest, DefaultsPortAndTarget) {
    auto url = Url::parse("http://10.0.0.5");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().port, "80");
    EXPECT_EQ(url.value().target, "/");
}

TEST(UrlTest, QueryWithoutPath) {
    auto url = Url::parse("http://10.0.0.5?token=abc");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().target, "/?token=abc");
}

TEST(UrlTest, Ipv6Host) {
    auto url = Url::parse("http://[::1]:8080/cameras");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().host, "::1");
    EXPECT_EQ(url.value().port, "8080");
}

TEST(UrlTest, SchemeIsCaseInsensitive) {
    auto url = Url::parse("HTTP://camera-1/");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().scheme, "http");
}

TEST(UrlTest, Rejections) {
    auto no_scheme = Url::parse("/cameras/1/webrtc");
    ASSERT_TRUE(no_scheme.is_error());
    EXPECT_EQ(no_scheme.error().code(), core::ErrorCode::InvalidAddress);

    auto https = Url::parse("https://printfarm.local/api");
    ASSERT_TRUE(https.is_error());
    EXPECT_EQ(https.error().code(), core::ErrorCode::NotSupported);

    EXPECT_TRUE(Url::parse("http:///cameras").is_error());
    EXPECT_TRUE(Url::parse("http://host:80a/").is_error());
    EXPECT_TRUE(Url::parse("http://[::1/").is_error());
}

TEST(ResolveUrlTest, RelativeEndpointJoinsBase) {
    EXPECT_EQ(resolveUrl("http://printfarm.local/api", "/cameras/7/webrtc"),
              "http://printfarm.local/api/cameras/7/webrtc");
    EXPECT_EQ(resolveUrl("http://printfarm.local/api/", "/cameras"),
              "http://printfarm.local/api/cameras");
    EXPECT_EQ(resolveUrl("http://printfarm.local/api", "cameras"),
              "http://printfarm.local/api/cameras");
}

TEST(ResolveUrlTest, AbsoluteEndpointPassesThrough) {
    EXPECT_EQ(resolveUrl("http://printfarm.local/api", "http://10.0.0.9:1984/api/webrtc?src=cam"),
              "http://10.0.0.9:1984/api/webrtc?src=cam");
}

TEST(HttpMethodTest, Names) {
    EXPECT_EQ(methodToString(HttpMethod::GET), "GET");
    EXPECT_EQ(methodToString(HttpMethod::POST), "POST");
}

} // namespace fleetcam::http::test
