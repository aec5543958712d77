// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#include "sigv4/canonical_request.h"

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>

#include <algorithm>
#include <map>

#include "sigv4/errors.h"
#include "sigv4/hash.h"
#include "sigv4/signing_key.h"

namespace sigv4 {

std::string CanonicalUri(absl::string_view path) {
  if (path.empty()) {
    return "/";
  }

  std::vector<std::string> segments;
  for (absl::string_view segment : absl::StrSplit(path, '/')) {
    segments.push_back(UrlEncode(segment));
  }
  return absl::StrJoin(segments, "/");
}

std::string CanonicalQueryString(const std::vector<Url::Param>& params) {
  // Encoded key to its decoded values. The map keeps keys sorted.
  std::map<std::string, std::vector<std::string>> values;
  for (const Url::Param& param : params) {
    std::vector<std::string>& key_values = values[UrlEncode(param.first)];
    for (absl::string_view value : absl::StrSplit(param.second, ',')) {
      key_values.emplace_back(value);
    }
  }

  std::vector<std::string> entries;
  for (auto& [key, key_values] : values) {
    std::sort(key_values.begin(), key_values.end());
    for (const std::string& value : key_values) {
      entries.push_back(absl::StrCat(key, "=", UrlEncode(value)));
    }
  }
  return absl::StrJoin(entries, "&");
}

CanonicalHeaders BuildCanonicalHeaders(const std::vector<Header>& headers) {
  // Lowercased name to trimmed values, in insertion order. The map keeps
  // names sorted.
  std::map<std::string, std::vector<absl::string_view>> merged;
  for (const Header& header : headers) {
    merged[absl::AsciiStrToLower(header.first)].push_back(
        absl::StripAsciiWhitespace(header.second));
  }

  CanonicalHeaders result;
  std::vector<absl::string_view> names;
  for (const auto& [name, values] : merged) {
    absl::StrAppend(&result.canonical_headers, name, ":", absl::StrJoin(values, ","), "\n");
    names.push_back(name);
  }
  result.signed_headers = absl::StrJoin(names, ";");
  return result;
}

absl::StatusOr<CanonicalRequest> BuildCanonicalRequest(const SignableRequest& req,
                                                       absl::Time time) {
  const std::string target = req.target();
  absl::StatusOr<Url> url = Url::ParseTarget(target);
  if (!url.ok()) {
    return url.status();
  }

  CanonicalRequest result;
  result.amz_date = FormatAmzDate(time);

  std::vector<Header> headers;
  for (Header& header : req.headers()) {
    if (absl::EqualsIgnoreCase(header.first, kAmzDateHeader)) {
      continue;
    }
    headers.push_back(std::move(header));
  }

  if (!req.HasHeader(kHostHeader)) {
    result.host = req.host();
    if (result.host.empty()) {
      return SignError(SignErrorType::MALFORMED_REQUEST,
                       absl::StrCat("no host to sign for target \"", target, "\""));
    }
    headers.emplace_back(kHostHeader, result.host);
  }
  headers.emplace_back(kAmzDateHeader, result.amz_date);

  CanonicalHeaders canonical_headers = BuildCanonicalHeaders(headers);
  result.signed_headers = canonical_headers.signed_headers;

  result.canonical_request = absl::StrJoin(
      {req.method(), CanonicalUri(url->path()), CanonicalQueryString(url->params()),
       canonical_headers.canonical_headers, canonical_headers.signed_headers,
       Sha256Hex(req.body())},
      "\n");
  return result;
}

}  // namespace sigv4
