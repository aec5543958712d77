// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sigv4 {

constexpr uint16_t kHttpPort = 80;
constexpr uint16_t kHttpsPort = 443;

enum class Scheme { HTTP, HTTPS };

std::string ToString(Scheme s);

Scheme FromString(absl::string_view s);

// Encodes the given string using the AWS URL encoding scheme: every byte
// outside the RFC 3986 unreserved set is written as %XX with uppercase hex.
std::string UrlEncode(absl::string_view s);

// Decodes %XX escapes. Returns an error if an escape is truncated or not
// hex. '+' is left as is.
absl::StatusOr<std::string> UrlDecode(absl::string_view s);

// Url is the target of a request to sign.
//
// The path is kept in its on-the-wire (already encoded) form, exactly as it
// appears in the request line. Query parameters are kept decoded and in the
// order they were added.
class Url {
 public:
  using Param = std::pair<std::string, std::string>;

  Url();

  // Parses an absolute URL such as "https://host:8443/a/b?x=1".
  static absl::StatusOr<Url> Parse(absl::string_view url);

  // Parses an origin-form request target such as "/a/b?x=1". The host is left
  // empty.
  static absl::StatusOr<Url> ParseTarget(absl::string_view target);

  Scheme scheme() const {
    return scheme_;
  }

  std::string host() const {
    return host_;
  }

  uint16_t port() const {
    return port_;
  }

  // Returns the URL encoded path.
  std::string path() const {
    return path_;
  }

  const std::vector<Param>& params() const {
    return params_;
  }

  // Returns the value for a Host header: the host, followed by the port when
  // it is not the default port of the scheme.
  std::string HostHeader() const;

  std::string QueryString() const;

  // Returns the request target: the encoded path and query string.
  std::string Target() const;

  void SetScheme(Scheme s);

  // Sets the host, optionally followed by ":port".
  absl::Status SetHost(absl::string_view host);

  std::string ToString() const;

 private:
  uint16_t DefaultPort() const;

  Scheme scheme_ = Scheme::HTTPS;

  std::string host_;

  uint16_t port_ = kHttpsPort;

  // URL encoded path.
  std::string path_;

  // Decoded query string parameters, in insertion order.
  std::vector<Param> params_;
};

}  // namespace sigv4
