/**
 * @file test_url.cpp
 * @brief Unit tests for URL parsing and query manipulation
 */

#include <gtest/gtest.h>
#include <saml/utils/url.h>

using namespace saml::utils;

TEST(UrlTest, ParseUrl_Components) {
    auto url = parseUrl("https://user@idp.example:8443/sso/redirect?a=1&b=2#top");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "https");
    EXPECT_EQ(url->userinfo, "user");
    EXPECT_EQ(url->host, "idp.example");
    EXPECT_EQ(url->port, "8443");
    EXPECT_EQ(url->path, "/sso/redirect");
    EXPECT_EQ(url->query, "a=1&b=2");
    EXPECT_EQ(url->fragment, "top");
}

TEST(UrlTest, ParseUrl_Minimal) {
    auto url = parseUrl("https://idp.example");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "idp.example");
    EXPECT_TRUE(url->port.empty());
    EXPECT_TRUE(url->path.empty());
    EXPECT_FALSE(url->hasQuery);
    EXPECT_FALSE(url->hasFragment);
}

TEST(UrlTest, ParseUrl_Ipv6Host) {
    auto url = parseUrl("http://[::1]:8080/acs");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "[::1]");
    EXPECT_EQ(url->port, "8080");
}

TEST(UrlTest, ParseUrl_NonHierarchical) {
    auto url = parseUrl("urn:oasis:names:tc:SAML:2.0:bindings:HTTP-Redirect");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "urn");
    EXPECT_FALSE(url->hasAuthority);
}

TEST(UrlTest, ParseUrl_Rejected) {
    EXPECT_FALSE(parseUrl("").has_value());
    EXPECT_FALSE(parseUrl("/relative/path").has_value());
    EXPECT_FALSE(parseUrl("idp.example/sso").has_value());
    EXPECT_FALSE(parseUrl("1http://idp.example").has_value());
    EXPECT_FALSE(parseUrl("ht_tp://idp.example").has_value());
    EXPECT_FALSE(parseUrl("https://idp.example/a b").has_value());
    EXPECT_FALSE(parseUrl("https://idp.example/\x01").has_value());
    EXPECT_FALSE(parseUrl("https://idp.example/%zz").has_value());
    EXPECT_FALSE(parseUrl("https://idp.example/%4").has_value());
    EXPECT_FALSE(parseUrl("https://idp.example:port/").has_value());
    EXPECT_FALSE(parseUrl("https://idp.example:99999/").has_value());
    EXPECT_FALSE(parseUrl("https://[::1/").has_value());
}

TEST(UrlTest, ParseUrl_VeryLongComponents) {
    std::string longPath = "https://idp.example/" + std::string(200000, 'a') + "?q=" +
                           std::string(50000, 'b') + "#" + std::string(50000, 'c');
    auto url = parseUrl(longPath);
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "idp.example");
    EXPECT_EQ(url->path.size(), 200001u);
    EXPECT_EQ(url->query.size(), 50002u);
    EXPECT_EQ(url->fragment.size(), 50000u);

    EXPECT_FALSE(parseUrl(std::string(50000, 'a')).has_value());
    EXPECT_FALSE(parseUrl("https://idp.example/" + std::string(50000, 'a') + " ").has_value());
}

TEST(UrlTest, ParseUrl_EmptyAuthorityAndFragmentOnly) {
    auto url = parseUrl("file:///etc/saml#anchor");
    ASSERT_TRUE(url.has_value());
    EXPECT_TRUE(url->hasAuthority);
    EXPECT_TRUE(url->host.empty());
    EXPECT_EQ(url->path, "/etc/saml");
    EXPECT_FALSE(url->hasQuery);
    EXPECT_EQ(url->fragment, "anchor");
}

TEST(UrlTest, ToString_ReproducesInput) {
    const std::string inputs[] = {
        "https://idp.example/sso",
        "https://user@idp.example:8443/sso?SAMLRequest=abc%2B#frag",
        "http://[::1]:8080/",
        "https://idp.example?x",
        "mailto:admin@idp.example",
    };
    for (const auto& input : inputs) {
        auto url = parseUrl(input);
        ASSERT_TRUE(url.has_value()) << input;
        EXPECT_EQ(url->toString(), input);
    }
}

TEST(UrlTest, SetQueryParameter_AppendsToEmptyQuery) {
    auto url = parseUrl("https://idp.example/sso");
    ASSERT_TRUE(url.has_value());
    setQueryParameter(*url, "RelayState", "/todos?id=1");
    EXPECT_EQ(url->toString(), "https://idp.example/sso?RelayState=%2Ftodos%3Fid%3D1");
}

TEST(UrlTest, SetQueryParameter_PreservesOthers) {
    auto url = parseUrl("https://idp.example/sso?tenant=acme&lang=en#x");
    ASSERT_TRUE(url.has_value());
    setQueryParameter(*url, "RelayState", "abc");
    EXPECT_EQ(url->toString(), "https://idp.example/sso?tenant=acme&lang=en&RelayState=abc#x");
}

TEST(UrlTest, SetQueryParameter_ReplacesExisting) {
    auto url = parseUrl("https://idp.example/sso?RelayState=old&tenant=acme&RelayState=older");
    ASSERT_TRUE(url.has_value());
    setQueryParameter(*url, "RelayState", "new");
    EXPECT_EQ(url->query, "tenant=acme&RelayState=new");
}
