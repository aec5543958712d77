// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#include "sigv4/beast_request.h"

#include <absl/time/civil_time.h>
#include <gtest/gtest.h>

#include "sigv4/errors.h"
#include "sigv4/signer.h"

namespace sigv4 {

namespace {

constexpr unsigned kHttpVersion = 11;

absl::Time TestTime() {
  return absl::FromCivil(absl::CivilSecond(2015, 8, 30, 12, 36, 0), absl::UTCTimeZone());
}

Signer TestSigner() {
  absl::StatusOr<Signer> signer =
      Signer::Create(Credentials{"AKIDEXAMPLE", "wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY"});
  EXPECT_TRUE(signer.ok()) << signer.status();
  return *std::move(signer);
}

std::string Field(const BeastRequest::Message& req, absl::string_view name) {
  const auto it = req.find(boost::beast::string_view(name.data(), name.size()));
  if (it == req.end()) {
    return "";
  }
  return std::string(it->value().data(), it->value().size());
}

}  // namespace

class BeastRequestTest : public ::testing::Test {};

TEST_F(BeastRequestTest, View) {
  BeastRequest::Message msg{h2::verb::put, "/foo%20bar?a=b", kHttpVersion};
  msg.set(h2::field::content_type, "text/plain");
  msg.insert("X-Custom", "1");
  msg.insert("x-custom", "2");
  msg.body() = "hello";

  BeastRequest req{&msg, "example.amazonaws.com"};
  EXPECT_EQ("PUT", req.method());
  EXPECT_EQ("/foo%20bar?a=b", req.target());
  EXPECT_EQ("example.amazonaws.com", req.host());
  EXPECT_EQ("hello", req.body());

  const std::vector<Header> expected{
      {"Content-Type", "text/plain"}, {"X-Custom", "1"}, {"x-custom", "2"}};
  EXPECT_EQ(expected, req.headers());

  EXPECT_TRUE(req.HasHeader("content-type"));
  EXPECT_TRUE(req.HasHeader("X-CUSTOM"));
  EXPECT_FALSE(req.HasHeader("host"));

  // Replaces all values.
  req.SetHeader("X-Custom", "3");
  EXPECT_EQ(1u, msg.count("x-custom"));
  EXPECT_EQ(2u, req.headers().size());
}

// get-vanilla from the AWS SigV4 test suite.
TEST_F(BeastRequestTest, GetVanilla) {
  BeastRequest::Message msg{h2::verb::get, "/", kHttpVersion};
  BeastRequest req{&msg, "example.amazonaws.com"};

  const absl::Status status = TestSigner().Sign(&req, "service", "us-east-1", TestTime());
  ASSERT_TRUE(status.ok()) << status;

  EXPECT_EQ("example.amazonaws.com", Field(msg, "Host"));
  EXPECT_EQ("20150830T123600Z", Field(msg, "x-amz-date"));
  EXPECT_EQ(
      "AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/20150830/us-east-1/service/aws4_request, "
      "SignedHeaders=host;x-amz-date, "
      "Signature=5fa00fa31553b73ebf1942676e86291e8372ff2a2260956d9b8aae1d763fbf31",
      Field(msg, "Authorization"));
}

TEST_F(BeastRequestTest, MatchesRequest) {
  const Signer signer = TestSigner();
  const std::string body = "{\"sampleKey\":\"sampleValue\"}";

  BeastRequest::Message msg{h2::verb::post, "/prod/items?b=2&a=1", kHttpVersion};
  msg.set(h2::field::host, "example.amazonaws.com:8443");
  msg.set(h2::field::content_type, "application/json");
  msg.body() = body;
  BeastRequest beast_req{&msg, "ignored.example.com"};
  ASSERT_TRUE(signer.Sign(&beast_req, "execute-api", "eu-west-1", TestTime()).ok());

  absl::StatusOr<Url> url = Url::Parse("https://example.amazonaws.com:8443/prod/items?b=2&a=1");
  ASSERT_TRUE(url.ok()) << url.status();
  Request req{h2::verb::post, *std::move(url)};
  req.AddHeader("Content-Type", "application/json");
  req.set_body(body);
  ASSERT_TRUE(signer.Sign(&req, "execute-api", "eu-west-1", TestTime()).ok());

  EXPECT_EQ(req.GetHeader("authorization"), Field(msg, "Authorization"));
  EXPECT_EQ("example.amazonaws.com:8443", Field(msg, "Host"));
}

TEST_F(BeastRequestTest, AlreadySigned) {
  BeastRequest::Message msg{h2::verb::get, "/", kHttpVersion};
  msg.set(h2::field::authorization, "AWS4-HMAC-SHA256 Credential=other");
  BeastRequest req{&msg, "example.amazonaws.com"};

  const absl::Status status = TestSigner().Sign(&req, "service", "us-east-1", TestTime());
  EXPECT_TRUE(IsMalformedRequest(status));
  EXPECT_EQ("AWS4-HMAC-SHA256 Credential=other", Field(msg, "Authorization"));
  EXPECT_EQ(1u, req.headers().size());
}

}  // namespace sigv4
