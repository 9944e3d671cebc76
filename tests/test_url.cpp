/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <string>

#include "sf/internal/url.hpp"

using sf::internal::Url;
using sf::internal::parse_url;
using sf::internal::resolve_reference;

namespace {

Url must_parse(const std::string& text) {
    Url u;
    std::string err;
    EXPECT_TRUE(parse_url(text, u, err)) << text << ": " << err;
    return u;
}

std::string resolve(const std::string& base, const std::string& ref) {
    Url out;
    std::string err;
    EXPECT_TRUE(resolve_reference(must_parse(base), ref, out, err)) << ref << ": " << err;
    return out.to_string();
}

} // namespace

TEST(UrlTest, HttpsDefaults) {
    Url u = must_parse("https://google.com");
    EXPECT_EQ("https", u.scheme);
    EXPECT_EQ("google.com", u.host);
    EXPECT_EQ(443, u.port);
    EXPECT_EQ("/", u.target);
    EXPECT_TRUE(u.tls());
    EXPECT_EQ("google.com", u.host_header());
}

TEST(UrlTest, ExplicitPortPathAndQuery) {
    Url u = must_parse("HTTP://Example.COM:8080/a/b?x=1&y=2#frag");
    EXPECT_EQ("http", u.scheme);
    EXPECT_EQ("example.com", u.host);
    EXPECT_EQ(8080, u.port);
    EXPECT_EQ("/a/b?x=1&y=2", u.target);
    EXPECT_FALSE(u.tls());
    EXPECT_EQ("example.com:8080", u.host_header());
    EXPECT_EQ("http://example.com:8080/a/b?x=1&y=2", u.to_string());
}

TEST(UrlTest, QueryWithoutPath) {
    EXPECT_EQ("/?q=1", must_parse("http://h?q=1").target);
}

TEST(UrlTest, DefaultPortIsNotRepeatedInHostHeader) {
    EXPECT_EQ("h", must_parse("https://h:443/").host_header());
    EXPECT_EQ("h:443", must_parse("http://h:443/").host_header());
}

TEST(UrlTest, Ipv6Literal) {
    Url u = must_parse("https://[::1]:8443/x");
    EXPECT_EQ("::1", u.host);
    EXPECT_EQ(8443, u.port);
    EXPECT_EQ("[::1]:8443", u.host_header());
}

TEST(UrlTest, DotSegmentsAreRemoved) {
    EXPECT_EQ("/b/", must_parse("http://h/a/../b/./").target);
    EXPECT_EQ("/", must_parse("http://h/a/..").target);
}

TEST(UrlTest, Rejects) {
    const char* bad[] = {
        "",
        "google.com",
        "ftp://host/",
        "https://",
        "https:///path",
        "https://host:0/",
        "https://host:65536/",
        "https://host:12ab/",
        "https://user@host/",
        "https://[::1/",
        "https://[nothex]/",
        "https://ho st/",
    };
    for (const char* text : bad) {
        Url u;
        std::string err;
        EXPECT_FALSE(parse_url(text, u, err)) << text;
        EXPECT_FALSE(err.empty()) << text;
    }
}

TEST(UrlTest, UnsupportedSchemeMessage) {
    Url u;
    std::string err;
    ASSERT_FALSE(parse_url("gopher://h/", u, err));
    EXPECT_EQ("unsupported protocol scheme \"gopher\"", err);
}

TEST(UrlTest, ResolveAbsolute) {
    EXPECT_EQ("https://www.google.com/", resolve("https://google.com/", "https://www.google.com/"));
}

TEST(UrlTest, ResolveSchemeRelative) {
    EXPECT_EQ("https://cdn.example/x", resolve("https://a.example/p/q", "//cdn.example/x"));
}

TEST(UrlTest, ResolveAbsolutePath) {
    EXPECT_EQ("http://h:8080/new?x=1", resolve("http://h:8080/old/path?q", "/new?x=1"));
}

TEST(UrlTest, ResolveRelativePath) {
    EXPECT_EQ("http://h/a/c", resolve("http://h/a/b", "c"));
    EXPECT_EQ("http://h/c", resolve("http://h/a/b", "../c"));
    EXPECT_EQ("http://h/a/b?z", resolve("http://h/a/b?q", "?z"));
}

TEST(UrlTest, ResolveEmptyKeepsBase) {
    EXPECT_EQ("http://h/a", resolve("http://h/a", "  "));
}

TEST(UrlTest, ResolveRejectsOtherSchemes) {
    Url out;
    std::string err;
    EXPECT_FALSE(resolve_reference(must_parse("https://h/"), "mailto:x@y", out, err));
    EXPECT_FALSE(err.empty());
}
