// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#pragma once

#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>
#include <absl/time/time.h>

#include <string>
#include <vector>

#include "sigv4/request.h"
#include "sigv4/url.h"

namespace sigv4 {

constexpr char kAmzDateHeader[] = "x-amz-date";

constexpr char kHostHeader[] = "host";

struct CanonicalRequest {
  std::string canonical_request;

  // Value of the x-amz-date header to set on the request.
  std::string amz_date;

  // Semicolon separated list of the signed header names.
  std::string signed_headers;

  // Value of the Host header to add, or empty if the request already has one.
  std::string host;
};

struct CanonicalHeaders {
  // One "name:values" line per header, each followed by a newline.
  std::string canonical_headers;

  std::string signed_headers;
};

// Builds the canonical request of req as signed at the given time.
//
// req is not modified. The headers the signer must add (x-amz-date and, if
// missing, Host) are included in the canonical form and returned so they can
// be set once signing has succeeded. An x-amz-date header already on the
// request is replaced by the signing time.
//
// Returns a MALFORMED_REQUEST error if the request target cannot be parsed or
// there is no host to sign.
absl::StatusOr<CanonicalRequest> BuildCanonicalRequest(const SignableRequest& req,
                                                       absl::Time time);

// Encodes each '/' separated segment of the encoded path. An empty path is
// "/".
std::string CanonicalUri(absl::string_view path);

// Sorts the parameters by encoded key, then by value. Values containing commas
// are split into separate values.
std::string CanonicalQueryString(const std::vector<Url::Param>& params);

// Lowercases header names, trims values and merges headers with the same
// name into one comma separated line, sorted by name.
CanonicalHeaders BuildCanonicalHeaders(const std::vector<Header>& headers);

}  // namespace sigv4
