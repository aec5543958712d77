// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#include "sigv4/url.h"

#include <gtest/gtest.h>

#include "sigv4/errors.h"

namespace sigv4 {

class UrlTest : public ::testing::Test {};

TEST_F(UrlTest, Scheme) {
  EXPECT_EQ("http", ToString(Scheme::HTTP));
  EXPECT_EQ("https", ToString(Scheme::HTTPS));
  EXPECT_EQ(Scheme::HTTP, FromString("http"));
  EXPECT_EQ(Scheme::HTTP, FromString("HTTP"));
  EXPECT_EQ(Scheme::HTTPS, FromString("https"));
}

TEST_F(UrlTest, UrlEncode) {
  EXPECT_EQ("AZaz09-_.~", UrlEncode("AZaz09-_.~"));
  EXPECT_EQ("a%20b%2Fc%3D%26%2C%25", UrlEncode("a b/c=&,%"));
  EXPECT_EQ("%C3%A9", UrlEncode("\xC3\xA9"));
  EXPECT_EQ("", UrlEncode(""));
}

TEST_F(UrlTest, UrlDecode) {
  absl::StatusOr<std::string> decoded = UrlDecode("a%20b%2fc+d");
  ASSERT_TRUE(decoded.ok());
  EXPECT_EQ("a b/c+d", *decoded);

  EXPECT_TRUE(IsMalformedRequest(UrlDecode("a%2").status()));
  EXPECT_TRUE(IsMalformedRequest(UrlDecode("%").status()));
  EXPECT_TRUE(IsMalformedRequest(UrlDecode("%zz").status()));
}

TEST_F(UrlTest, SetScheme) {
  Url url;

  // HTTP.
  url.SetScheme(Scheme::HTTP);
  EXPECT_EQ(Scheme::HTTP, url.scheme());
  EXPECT_EQ(kHttpPort, url.port());

  // HTTPS.
  url.SetScheme(Scheme::HTTPS);
  EXPECT_EQ(Scheme::HTTPS, url.scheme());
  EXPECT_EQ(kHttpsPort, url.port());

  // Don't override custom port.
  ASSERT_TRUE(url.SetHost("localhost:9000").ok());
  url.SetScheme(Scheme::HTTP);
  EXPECT_EQ(Scheme::HTTP, url.scheme());
  EXPECT_EQ(9000, url.port());
}

TEST_F(UrlTest, SetHost) {
  Url url;

  // Default port.
  ASSERT_TRUE(url.SetHost("localhost").ok());
  EXPECT_EQ("localhost", url.host());
  EXPECT_EQ(kHttpsPort, url.port());
  EXPECT_EQ("localhost", url.HostHeader());

  // Custom port.
  ASSERT_TRUE(url.SetHost("localhost:9000").ok());
  EXPECT_EQ("localhost", url.host());
  EXPECT_EQ(9000, url.port());
  EXPECT_EQ("localhost:9000", url.HostHeader());

  // IPv6.
  ASSERT_TRUE(url.SetHost("[::1]:8080").ok());
  EXPECT_EQ("[::1]", url.host());
  EXPECT_EQ(8080, url.port());

  EXPECT_TRUE(IsMalformedRequest(url.SetHost("")));
  EXPECT_TRUE(IsMalformedRequest(url.SetHost(":80")));
  EXPECT_TRUE(IsMalformedRequest(url.SetHost("localhost:abc")));
  EXPECT_TRUE(IsMalformedRequest(url.SetHost("localhost:70000")));
  EXPECT_TRUE(IsMalformedRequest(url.SetHost("user@localhost")));
  EXPECT_TRUE(IsMalformedRequest(url.SetHost("[::1")));

  // Failed updates leave the url unchanged.
  EXPECT_EQ("[::1]", url.host());
  EXPECT_EQ(8080, url.port());
}

TEST_F(UrlTest, QueryString) {
  Url url;
  EXPECT_EQ("", url.QueryString());

  absl::StatusOr<Url> parsed =
      Url::ParseTarget("/?foo=bar&marker=dump-2023-10-26T08%3A37%3A15-0001.dfs&a=%25b%25");
  ASSERT_TRUE(parsed.ok()) << parsed.status();

  // Re-encoded in insertion order.
  EXPECT_EQ("foo=bar&marker=dump-2023-10-26T08%3A37%3A15-0001.dfs&a=%25b%25",
            parsed->QueryString());

  // Characters outside the unreserved set are encoded.
  parsed = Url::ParseTarget("/?a=b!&c=x+y");
  ASSERT_TRUE(parsed.ok()) << parsed.status();
  EXPECT_EQ("a=b%21&c=x%20y", parsed->QueryString());
}

TEST_F(UrlTest, ToString) {
  absl::StatusOr<Url> url = Url::Parse("http://s3.amazonaws.com/foo%3Abar%21?a=b!");
  ASSERT_TRUE(url.ok()) << url.status();
  EXPECT_EQ("http://s3.amazonaws.com/foo%3Abar%21?a=b%21", url->ToString());
  EXPECT_EQ("/foo%3Abar%21?a=b%21", url->Target());

  url->SetScheme(Scheme::HTTPS);
  ASSERT_TRUE(url->SetHost("localhost:9000").ok());
  EXPECT_EQ("https://localhost:9000/foo%3Abar%21?a=b%21", url->ToString());

  // The path keeps its wire form.
  url = Url::Parse("https://host/foo//bar/");
  ASSERT_TRUE(url.ok()) << url.status();
  EXPECT_EQ("https://host/foo//bar/", url->ToString());
}

TEST_F(UrlTest, Parse) {
  absl::StatusOr<Url> url = Url::Parse("https://example.amazonaws.com");
  ASSERT_TRUE(url.ok()) << url.status();
  EXPECT_EQ(Scheme::HTTPS, url->scheme());
  EXPECT_EQ("example.amazonaws.com", url->host());
  EXPECT_EQ(kHttpsPort, url->port());
  EXPECT_EQ("", url->path());
  EXPECT_TRUE(url->params().empty());
  EXPECT_EQ("/", url->Target());

  url = Url::Parse("HTTP://localhost:9000/a%20b/c?x=1&y=a+b&flag&x=%2C#fragment");
  ASSERT_TRUE(url.ok()) << url.status();
  EXPECT_EQ(Scheme::HTTP, url->scheme());
  EXPECT_EQ("localhost", url->host());
  EXPECT_EQ(9000, url->port());
  EXPECT_EQ("/a%20b/c", url->path());
  const std::vector<Url::Param> expected_params{
      {"x", "1"}, {"y", "a b"}, {"flag", ""}, {"x", ","}};
  EXPECT_EQ(expected_params, url->params());

  url = Url::Parse("http://localhost:80?a=b");
  ASSERT_TRUE(url.ok()) << url.status();
  EXPECT_EQ("localhost", url->HostHeader());
  EXPECT_EQ("/?a=b", url->Target());
}

TEST_F(UrlTest, ParseErrors) {
  EXPECT_TRUE(IsMalformedRequest(Url::Parse("example.amazonaws.com/").status()));
  EXPECT_TRUE(IsMalformedRequest(Url::Parse("ftp://example.amazonaws.com/").status()));
  EXPECT_TRUE(IsMalformedRequest(Url::Parse("https:///path").status()));
  EXPECT_TRUE(IsMalformedRequest(Url::Parse("https://host:port/").status()));
  EXPECT_TRUE(IsMalformedRequest(Url::Parse("https://host/a%zz").status()));
  EXPECT_TRUE(IsMalformedRequest(Url::Parse("https://host/a b").status()));
  EXPECT_TRUE(IsMalformedRequest(Url::Parse("https://host/?a=%").status()));
}

TEST_F(UrlTest, ParseTarget) {
  absl::StatusOr<Url> url = Url::ParseTarget("/-/vaults/examplevault?b=2&a=1");
  ASSERT_TRUE(url.ok()) << url.status();
  EXPECT_EQ("", url->host());
  EXPECT_EQ("/-/vaults/examplevault", url->path());
  EXPECT_EQ(2u, url->params().size());

  url = Url::ParseTarget("");
  ASSERT_TRUE(url.ok()) << url.status();
  EXPECT_EQ("", url->path());

  EXPECT_TRUE(IsMalformedRequest(Url::ParseTarget("http://host/").status()));
  EXPECT_TRUE(IsMalformedRequest(Url::ParseTarget("*").status()));
}

}  // namespace sigv4
